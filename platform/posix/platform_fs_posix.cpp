#include "platform_fs.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace {
void SetErrno(std::error_code& ec) {
  ec = std::error_code(errno, std::generic_category());
}

bool WriteAllFd(int fd, const std::uint8_t* data, std::size_t len,
                std::error_code& ec) {
  std::size_t offset = 0;
  while (offset < len) {
    const ssize_t rc = ::write(fd, data + offset, len - offset);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      return false;
    }
    offset += static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path BuildTempPath(const std::filesystem::path& target,
                                    int attempt) {
  std::filesystem::path dir =
      target.has_parent_path() ? target.parent_path() : std::filesystem::path{};
  std::string base = target.filename().string();
  if (base.empty()) {
    base = "tmp";
  }
  const int pid = static_cast<int>(::getpid());
  std::string name = "." + base + ".tmp." + std::to_string(pid) + "." +
                     std::to_string(attempt);
  return dir.empty() ? std::filesystem::path{name} : (dir / name);
}

void DiscardTemp(const std::filesystem::path& tmp) {
  std::error_code ignore_ec;
  std::filesystem::remove(tmp, ignore_ec);
}
}  // namespace

namespace cm::platform::fs {

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    return true;
  }
  std::filesystem::create_directories(path, ec);
  return !ec;
}

bool ReadTextFile(const std::filesystem::path& path, std::string& out,
                  std::error_code& ec) {
  ec.clear();
  out.clear();
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    SetErrno(ec);
    return false;
  }
  char buf[4096];
  for (;;) {
    const ssize_t rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetErrno(ec);
      ::close(fd);
      return false;
    }
    if (rc == 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(rc));
  }
  ::close(fd);
  return true;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty()) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  if (len > 0 && !data) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }

  for (int attempt = 0; attempt < 16; ++attempt) {
    const std::filesystem::path tmp = BuildTempPath(path, attempt);
    const int fd =
        ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_TRUNC, 0600);
    if (fd < 0) {
      if (errno == EEXIST) {
        continue;
      }
      SetErrno(ec);
      return false;
    }

    if (len > 0 && !WriteAllFd(fd, data, len, ec)) {
      ::close(fd);
      DiscardTemp(tmp);
      return false;
    }
    if (::fsync(fd) != 0) {
      SetErrno(ec);
      ::close(fd);
      DiscardTemp(tmp);
      return false;
    }
    if (::close(fd) != 0) {
      SetErrno(ec);
      DiscardTemp(tmp);
      return false;
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
      SetErrno(ec);
      DiscardTemp(tmp);
      return false;
    }

    std::filesystem::path dir =
        path.has_parent_path() ? path.parent_path() : std::filesystem::path(".");
    const int dfd = ::open(dir.c_str(), O_RDONLY);
    if (dfd >= 0) {
      (void)::fsync(dfd);
      (void)::close(dfd);
    }
    return true;
  }

  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

}  // namespace cm::platform::fs
