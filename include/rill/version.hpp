#pragma once

#define RILL_VERSION_MAJOR 0
#define RILL_VERSION_MINOR 2
#define RILL_VERSION_PATCH 0

#define RILL_VERSION_CODE \
  ((RILL_VERSION_MAJOR << 16) | (RILL_VERSION_MINOR << 8) | (RILL_VERSION_PATCH))

#define RILL_VERSION_STRING "0.2.0"

namespace rill {
struct version {
  static constexpr int major = RILL_VERSION_MAJOR;
  static constexpr int minor = RILL_VERSION_MINOR;
  static constexpr int patch = RILL_VERSION_PATCH;
  static constexpr const char* string = RILL_VERSION_STRING;
};
}
