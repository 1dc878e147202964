#ifndef CM_PLATFORM_FS_H
#define CM_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace cm::platform::fs {

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
bool ReadTextFile(const std::filesystem::path& path, std::string& out,
                  std::error_code& ec);

// Writes to a sibling temp file, fsyncs it and renames it over `path`.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

}  // namespace cm::platform::fs

#endif  // CM_PLATFORM_FS_H
