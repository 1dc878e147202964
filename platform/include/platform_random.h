#ifndef CM_PLATFORM_RANDOM_H
#define CM_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace cm::platform {

bool RandomBytes(std::uint8_t* out, std::size_t len);

}  // namespace cm::platform

#endif  // CM_PLATFORM_RANDOM_H
