#include "noise_handshake.h"

#include <algorithm>
#include <cctype>
#include <cstring>

#include "monocypher.h"
#include "platform_random.h"

namespace cm::client {

namespace {
constexpr std::size_t kDhLen = 32;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kBlockLen = 128;

using Hash = std::array<std::uint8_t, NoiseHandshake::kHashLen>;

void StoreLe64(std::uint64_t v, std::uint8_t out[8]) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>((v >> (i * 8)) & 0xFF);
  }
}

void BuildNonce(std::uint64_t n, std::uint8_t out[12]) {
  std::memset(out, 0, 4);
  StoreLe64(n, out + 4);
}

void HmacBlake2b(const std::uint8_t* key, std::size_t key_len,
                 const std::uint8_t* data, std::size_t data_len,
                 Hash& out) {
  std::uint8_t block[kBlockLen] = {};
  std::memcpy(block, key, std::min(key_len, kBlockLen));

  std::uint8_t pad[kBlockLen];
  for (std::size_t i = 0; i < kBlockLen; ++i) {
    pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x36);
  }
  Hash inner{};
  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, inner.size());
  crypto_blake2b_update(&ctx, pad, sizeof(pad));
  crypto_blake2b_update(&ctx, data, data_len);
  crypto_blake2b_final(&ctx, inner.data());

  for (std::size_t i = 0; i < kBlockLen; ++i) {
    pad[i] = static_cast<std::uint8_t>(block[i] ^ 0x5c);
  }
  crypto_blake2b_init(&ctx, out.size());
  crypto_blake2b_update(&ctx, pad, sizeof(pad));
  crypto_blake2b_update(&ctx, inner.data(), inner.size());
  crypto_blake2b_final(&ctx, out.data());

  crypto_wipe(block, sizeof(block));
  crypto_wipe(pad, sizeof(pad));
  crypto_wipe(inner.data(), inner.size());
}

// HKDF with two outputs, as used by MixKey and Split.
void Hkdf2(const Hash& chaining_key, const std::uint8_t* ikm,
           std::size_t ikm_len, Hash& out1, Hash& out2) {
  Hash temp_key{};
  HmacBlake2b(chaining_key.data(), chaining_key.size(), ikm, ikm_len,
              temp_key);
  const std::uint8_t one = 0x01;
  HmacBlake2b(temp_key.data(), temp_key.size(), &one, 1, out1);
  std::uint8_t second[NoiseHandshake::kHashLen + 1];
  std::memcpy(second, out1.data(), out1.size());
  second[out1.size()] = 0x02;
  HmacBlake2b(temp_key.data(), temp_key.size(), second, sizeof(second), out2);
  crypto_wipe(second, sizeof(second));
  crypto_wipe(temp_key.data(), temp_key.size());
}

std::string ProtocolName(NoisePattern pattern) {
  std::string name = "Noise_";
  name += NoisePatternLabel(pattern);
  name += "_25519_ChaChaPoly_BLAKE2b";
  return name;
}
}  // namespace

bool ParseNoisePattern(std::string_view label, NoisePattern& out) {
  std::string lower;
  lower.reserve(label.size());
  for (const char c : label) {
    lower.push_back(static_cast<char>(
        std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower == "xk") {
    out = NoisePattern::kXK;
    return true;
  }
  if (lower == "ik") {
    out = NoisePattern::kIK;
    return true;
  }
  return false;
}

const char* NoisePatternLabel(NoisePattern pattern) {
  switch (pattern) {
    case NoisePattern::kXK:
      return "XK";
    case NoisePattern::kIK:
      return "IK";
  }
  return "XK";
}

bool PatternRequiresRemoteStatic(NoisePattern pattern) {
  switch (pattern) {
    case NoisePattern::kXK:
    case NoisePattern::kIK:
      return true;
  }
  return true;
}

bool GenerateNoiseKeyPair(NoiseKeyPair& out, std::string& error) {
  error.clear();
  if (!platform::RandomBytes(out.private_key.data(), out.private_key.size())) {
    error = "rng failed";
    return false;
  }
  DeriveNoisePublicKey(out.private_key, out.public_key);
  return true;
}

void DeriveNoisePublicKey(const Key32& private_key, Key32& out_public) {
  crypto_x25519_public_key(out_public.data(), private_key.data());
}

NoiseHandshake::~NoiseHandshake() {
  crypto_wipe(ck_.data(), ck_.size());
  crypto_wipe(cs_.k.data(), cs_.k.size());
  crypto_wipe(s_.private_key.data(), s_.private_key.size());
  crypto_wipe(e_.private_key.data(), e_.private_key.size());
  crypto_wipe(send_.k.data(), send_.k.size());
  crypto_wipe(recv_.k.data(), recv_.k.size());
}

bool NoiseHandshake::Initialize(const NoiseConfig& config, std::string& error) {
  error.clear();
  initialized_ = false;
  complete_ = false;
  message_index_ = 0;
  has_e_ = false;
  has_re_ = false;
  cs_ = CipherState{};
  send_ = CipherState{};
  recv_ = CipherState{};

  pattern_ = config.pattern;
  role_ = config.role;
  s_ = config.local_static;
  has_rs_ = config.has_remote_static;
  rs_ = config.remote_static;

  // The responder's static key is known to both sides up front.
  if (role_ == NoiseRole::kInitiator && !has_rs_) {
    error = "remote static key required";
    return false;
  }

  const std::string name = ProtocolName(pattern_);
  h_.fill(0);
  if (name.size() <= h_.size()) {
    std::memcpy(h_.data(), name.data(), name.size());
  } else {
    crypto_blake2b(h_.data(), h_.size(),
                   reinterpret_cast<const std::uint8_t*>(name.data()),
                   name.size());
  }
  ck_ = h_;
  MixHash(config.prologue.data(), config.prologue.size());

  if (role_ == NoiseRole::kInitiator) {
    MixHash(rs_.data(), rs_.size());
  } else {
    // The initiator's static arrives inside the handshake.
    MixHash(s_.public_key.data(), s_.public_key.size());
    has_rs_ = false;
  }
  initialized_ = true;
  return true;
}

std::size_t NoiseHandshake::MessageCount() const {
  switch (pattern_) {
    case NoisePattern::kXK:
      return 3;
    case NoisePattern::kIK:
      return 2;
  }
  return 3;
}

const std::vector<NoiseHandshake::Token>& NoiseHandshake::CurrentMessage()
    const {
  static const std::vector<std::vector<Token>> kXk = {
      {Token::kE, Token::kES},
      {Token::kE, Token::kEE},
      {Token::kS, Token::kSE},
  };
  static const std::vector<std::vector<Token>> kIk = {
      {Token::kE, Token::kES, Token::kS, Token::kSS},
      {Token::kE, Token::kEE, Token::kSE},
  };
  const auto& table = pattern_ == NoisePattern::kIK ? kIk : kXk;
  return table[message_index_];
}

bool NoiseHandshake::IsMyTurnToWrite() const {
  if (!initialized_) {
    return false;
  }
  if (complete_) {
    return true;
  }
  const bool initiator_turn = (message_index_ % 2) == 0;
  return initiator_turn == (role_ == NoiseRole::kInitiator);
}

bool NoiseHandshake::RemoteStatic(Key32& out) const {
  if (!has_rs_) {
    return false;
  }
  out = rs_;
  return true;
}

void NoiseHandshake::MixHash(const std::uint8_t* data, std::size_t len) {
  crypto_blake2b_ctx ctx;
  crypto_blake2b_init(&ctx, h_.size());
  crypto_blake2b_update(&ctx, h_.data(), h_.size());
  crypto_blake2b_update(&ctx, data, len);
  crypto_blake2b_final(&ctx, h_.data());
}

void NoiseHandshake::MixKey(const Key32& input_key_material) {
  Hash next_ck{};
  Hash temp_k{};
  Hkdf2(ck_, input_key_material.data(), input_key_material.size(), next_ck,
        temp_k);
  ck_ = next_ck;
  std::memcpy(cs_.k.data(), temp_k.data(), cs_.k.size());
  cs_.has_key = true;
  cs_.n = 0;
  crypto_wipe(next_ck.data(), next_ck.size());
  crypto_wipe(temp_k.data(), temp_k.size());
}

bool NoiseHandshake::Encrypt(CipherState& cs, const std::uint8_t* ad,
                             std::size_t ad_len,
                             const std::vector<std::uint8_t>& plain,
                             std::vector<std::uint8_t>& out,
                             std::string& error) {
  if (!cs.has_key) {
    out.insert(out.end(), plain.begin(), plain.end());
    return true;
  }
  if (cs.n == UINT64_MAX) {
    error = "nonce exhausted";
    return false;
  }
  std::uint8_t nonce[12];
  BuildNonce(cs.n, nonce);
  crypto_aead_ctx ctx;
  crypto_aead_init_ietf(&ctx, cs.k.data(), nonce);
  const std::size_t offset = out.size();
  out.resize(offset + plain.size() + kTagSize);
  crypto_aead_write(&ctx, out.data() + offset,
                    out.data() + offset + plain.size(), ad, ad_len,
                    plain.data(), plain.size());
  crypto_wipe(&ctx, sizeof(ctx));
  ++cs.n;
  return true;
}

bool NoiseHandshake::Decrypt(CipherState& cs, const std::uint8_t* ad,
                             std::size_t ad_len, const std::uint8_t* cipher,
                             std::size_t cipher_len,
                             std::vector<std::uint8_t>& out,
                             std::string& error) {
  if (!cs.has_key) {
    out.insert(out.end(), cipher, cipher + cipher_len);
    return true;
  }
  if (cipher_len < kTagSize) {
    error = "ciphertext too short";
    return false;
  }
  if (cs.n == UINT64_MAX) {
    error = "nonce exhausted";
    return false;
  }
  const std::size_t text_len = cipher_len - kTagSize;
  std::uint8_t nonce[12];
  BuildNonce(cs.n, nonce);
  crypto_aead_ctx ctx;
  crypto_aead_init_ietf(&ctx, cs.k.data(), nonce);
  const std::size_t offset = out.size();
  out.resize(offset + text_len);
  const int rc = crypto_aead_read(&ctx, out.data() + offset,
                                  cipher + text_len, ad, ad_len, cipher,
                                  text_len);
  crypto_wipe(&ctx, sizeof(ctx));
  if (rc != 0) {
    out.resize(offset);
    error = "decrypt failed";
    return false;
  }
  ++cs.n;
  return true;
}

bool NoiseHandshake::EncryptAndHash(const std::vector<std::uint8_t>& plain,
                                    std::vector<std::uint8_t>& out,
                                    std::string& error) {
  const std::size_t offset = out.size();
  if (!Encrypt(cs_, h_.data(), h_.size(), plain, out, error)) {
    return false;
  }
  MixHash(out.data() + offset, out.size() - offset);
  return true;
}

bool NoiseHandshake::DecryptAndHash(const std::uint8_t* cipher,
                                    std::size_t len,
                                    std::vector<std::uint8_t>& out,
                                    std::string& error) {
  if (!Decrypt(cs_, h_.data(), h_.size(), cipher, len, out, error)) {
    return false;
  }
  MixHash(cipher, len);
  return true;
}

bool NoiseHandshake::MixDh(Token token, std::string& error) {
  const bool initiator = role_ == NoiseRole::kInitiator;
  const Key32* priv = nullptr;
  const Key32* pub = nullptr;
  switch (token) {
    case Token::kEE:
      priv = has_e_ ? &e_.private_key : nullptr;
      pub = has_re_ ? &re_ : nullptr;
      break;
    case Token::kES:
      if (initiator) {
        priv = has_e_ ? &e_.private_key : nullptr;
        pub = has_rs_ ? &rs_ : nullptr;
      } else {
        priv = &s_.private_key;
        pub = has_re_ ? &re_ : nullptr;
      }
      break;
    case Token::kSE:
      if (initiator) {
        priv = &s_.private_key;
        pub = has_re_ ? &re_ : nullptr;
      } else {
        priv = has_e_ ? &e_.private_key : nullptr;
        pub = has_rs_ ? &rs_ : nullptr;
      }
      break;
    case Token::kSS:
      priv = &s_.private_key;
      pub = has_rs_ ? &rs_ : nullptr;
      break;
    case Token::kE:
    case Token::kS:
      break;
  }
  if (priv == nullptr || pub == nullptr) {
    error = "missing key for dh";
    return false;
  }
  Key32 shared{};
  crypto_x25519(shared.data(), priv->data(), pub->data());
  MixKey(shared);
  crypto_wipe(shared.data(), shared.size());
  return true;
}

void NoiseHandshake::Split() {
  Hash k1{};
  Hash k2{};
  Hkdf2(ck_, nullptr, 0, k1, k2);
  CipherState c1;
  CipherState c2;
  std::memcpy(c1.k.data(), k1.data(), c1.k.size());
  std::memcpy(c2.k.data(), k2.data(), c2.k.size());
  c1.has_key = true;
  c2.has_key = true;
  if (role_ == NoiseRole::kInitiator) {
    send_ = c1;
    recv_ = c2;
  } else {
    send_ = c2;
    recv_ = c1;
  }
  crypto_wipe(k1.data(), k1.size());
  crypto_wipe(k2.data(), k2.size());
  crypto_wipe(c1.k.data(), c1.k.size());
  crypto_wipe(c2.k.data(), c2.k.size());
  crypto_wipe(e_.private_key.data(), e_.private_key.size());
  complete_ = true;
}

bool NoiseHandshake::WriteMessage(const std::vector<std::uint8_t>& payload,
                                  std::vector<std::uint8_t>& out,
                                  std::string& error) {
  error.clear();
  out.clear();
  if (!initialized_) {
    error = "handshake not initialized";
    return false;
  }
  if (complete_) {
    if (payload.size() + kTagSize > kMaxMessageLen) {
      error = "message too large";
      return false;
    }
    return Encrypt(send_, nullptr, 0, payload, out, error);
  }
  if (!IsMyTurnToWrite()) {
    error = "not our turn to write";
    return false;
  }

  for (const Token token : CurrentMessage()) {
    switch (token) {
      case Token::kE: {
        if (!GenerateNoiseKeyPair(e_, error)) {
          return false;
        }
        has_e_ = true;
        out.insert(out.end(), e_.public_key.begin(), e_.public_key.end());
        MixHash(e_.public_key.data(), e_.public_key.size());
        break;
      }
      case Token::kS: {
        const std::vector<std::uint8_t> pub(s_.public_key.begin(),
                                            s_.public_key.end());
        if (!EncryptAndHash(pub, out, error)) {
          return false;
        }
        break;
      }
      case Token::kEE:
      case Token::kES:
      case Token::kSE:
      case Token::kSS:
        if (!MixDh(token, error)) {
          return false;
        }
        break;
    }
  }
  if (!EncryptAndHash(payload, out, error)) {
    return false;
  }
  if (out.size() > kMaxMessageLen) {
    error = "message too large";
    return false;
  }
  ++message_index_;
  if (message_index_ == MessageCount()) {
    Split();
  }
  return true;
}

bool NoiseHandshake::ReadMessage(const std::vector<std::uint8_t>& message,
                                 std::vector<std::uint8_t>& out_payload,
                                 std::string& error) {
  error.clear();
  out_payload.clear();
  if (!initialized_) {
    error = "handshake not initialized";
    return false;
  }
  if (message.size() > kMaxMessageLen) {
    error = "message too large";
    return false;
  }
  if (complete_) {
    return Decrypt(recv_, nullptr, 0, message.data(), message.size(),
                   out_payload, error);
  }
  if (IsMyTurnToWrite()) {
    error = "not our turn to read";
    return false;
  }

  std::size_t off = 0;
  for (const Token token : CurrentMessage()) {
    switch (token) {
      case Token::kE: {
        if (message.size() - off < kDhLen) {
          error = "handshake message truncated";
          return false;
        }
        std::memcpy(re_.data(), message.data() + off, kDhLen);
        has_re_ = true;
        MixHash(re_.data(), re_.size());
        off += kDhLen;
        break;
      }
      case Token::kS: {
        const std::size_t len = cs_.has_key ? kDhLen + kTagSize : kDhLen;
        if (message.size() - off < len) {
          error = "handshake message truncated";
          return false;
        }
        std::vector<std::uint8_t> key;
        if (!DecryptAndHash(message.data() + off, len, key, error)) {
          return false;
        }
        std::memcpy(rs_.data(), key.data(), rs_.size());
        has_rs_ = true;
        off += len;
        break;
      }
      case Token::kEE:
      case Token::kES:
      case Token::kSE:
      case Token::kSS:
        if (!MixDh(token, error)) {
          return false;
        }
        break;
    }
  }
  if (!DecryptAndHash(message.data() + off, message.size() - off, out_payload,
                      error)) {
    return false;
  }
  ++message_index_;
  if (message_index_ == MessageCount()) {
    Split();
  }
  return true;
}

}  // namespace cm::client
