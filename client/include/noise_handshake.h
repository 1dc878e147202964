#ifndef CM_CLIENT_NOISE_HANDSHAKE_H
#define CM_CLIENT_NOISE_HANDSHAKE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cm::client {

using Key32 = std::array<std::uint8_t, 32>;

// Noise_<pattern>_25519_ChaChaPoly_BLAKE2b. Both patterns carry the
// responder's static key as a pre-message.
enum class NoisePattern : std::uint8_t { kXK = 0, kIK = 1 };

enum class NoiseRole : std::uint8_t { kInitiator = 0, kResponder = 1 };

// Case-insensitive ("xk", "XK", "ik", "IK").
bool ParseNoisePattern(std::string_view label, NoisePattern& out);
const char* NoisePatternLabel(NoisePattern pattern);
bool PatternRequiresRemoteStatic(NoisePattern pattern);

struct NoiseKeyPair {
  Key32 private_key{};
  Key32 public_key{};
};

bool GenerateNoiseKeyPair(NoiseKeyPair& out, std::string& error);
void DeriveNoisePublicKey(const Key32& private_key, Key32& out_public);

struct NoiseConfig {
  NoisePattern pattern{NoisePattern::kXK};
  NoiseRole role{NoiseRole::kInitiator};
  std::vector<std::uint8_t> prologue;
  NoiseKeyPair local_static;
  bool has_remote_static{false};
  Key32 remote_static{};
};

class NoiseHandshake {
 public:
  static constexpr std::size_t kHashLen = 64;
  static constexpr std::size_t kMaxMessageLen = 65535;

  NoiseHandshake() = default;
  ~NoiseHandshake();

  NoiseHandshake(const NoiseHandshake&) = delete;
  NoiseHandshake& operator=(const NoiseHandshake&) = delete;
  NoiseHandshake(NoiseHandshake&&) = default;
  NoiseHandshake& operator=(NoiseHandshake&&) = default;

  bool Initialize(const NoiseConfig& config, std::string& error);

  // Handshake messages while the pattern has messages left, transport
  // messages afterwards.
  bool WriteMessage(const std::vector<std::uint8_t>& payload,
                    std::vector<std::uint8_t>& out,
                    std::string& error);
  bool ReadMessage(const std::vector<std::uint8_t>& message,
                   std::vector<std::uint8_t>& out_payload,
                   std::string& error);

  bool initialized() const { return initialized_; }
  bool IsHandshakeComplete() const { return complete_; }
  bool IsMyTurnToWrite() const;
  const std::array<std::uint8_t, kHashLen>& HandshakeHash() const { return h_; }
  bool RemoteStatic(Key32& out) const;

 private:
  enum class Token : std::uint8_t { kE, kS, kEE, kES, kSE, kSS };

  struct CipherState {
    Key32 k{};
    bool has_key{false};
    std::uint64_t n{0};
  };

  static bool Encrypt(CipherState& cs, const std::uint8_t* ad,
                      std::size_t ad_len,
                      const std::vector<std::uint8_t>& plain,
                      std::vector<std::uint8_t>& out, std::string& error);
  static bool Decrypt(CipherState& cs, const std::uint8_t* ad,
                      std::size_t ad_len, const std::uint8_t* cipher,
                      std::size_t cipher_len,
                      std::vector<std::uint8_t>& out, std::string& error);

  void MixHash(const std::uint8_t* data, std::size_t len);
  void MixKey(const Key32& input_key_material);
  bool EncryptAndHash(const std::vector<std::uint8_t>& plain,
                      std::vector<std::uint8_t>& out, std::string& error);
  bool DecryptAndHash(const std::uint8_t* cipher, std::size_t len,
                      std::vector<std::uint8_t>& out, std::string& error);
  bool MixDh(Token token, std::string& error);
  void Split();
  const std::vector<Token>& CurrentMessage() const;
  std::size_t MessageCount() const;

  bool initialized_{false};
  bool complete_{false};
  NoisePattern pattern_{NoisePattern::kXK};
  NoiseRole role_{NoiseRole::kInitiator};
  std::size_t message_index_{0};

  std::array<std::uint8_t, kHashLen> h_{};
  std::array<std::uint8_t, kHashLen> ck_{};
  CipherState cs_;

  NoiseKeyPair s_;
  NoiseKeyPair e_;
  bool has_e_{false};
  Key32 rs_{};
  bool has_rs_{false};
  Key32 re_{};
  bool has_re_{false};

  CipherState send_;
  CipherState recv_;
};

}  // namespace cm::client

#endif  // CM_CLIENT_NOISE_HANDSHAKE_H
