#pragma once

#include <cstdint>

#define VERITY_VERSION_MAJOR 0
#define VERITY_VERSION_MINOR 3
#define VERITY_VERSION_PATCH 0

#define VERITY_VERSION_STRING "0.3.0"

// For compile-time version checks
#define VERITY_VERSION \
  (VERITY_VERSION_MAJOR * 10000 + VERITY_VERSION_MINOR * 100 + VERITY_VERSION_PATCH)

namespace verity {

inline const char* Version() { return VERITY_VERSION_STRING; }

// Binary layout version of persisted fingerprints (see fingerprint_store.hpp).
constexpr uint8_t kFingerprintFormatVersion = 1;

}  // namespace verity
