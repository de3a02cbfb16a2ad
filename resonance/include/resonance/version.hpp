#pragma once

#include <cstdint>

#define RESONANCE_VERSION "0.4.0"
#define RESONANCE_SNAPSHOT_FORMAT_MAJOR 1
#define RESONANCE_SNAPSHOT_FORMAT_MINOR 0

namespace resonance {
namespace version {

inline bool snapshot_compatible(uint16_t major, uint16_t minor) {
    // Major must match exactly (layout changes)
    // Minor: reader must be >= writer (trailing additions only)
    return major == RESONANCE_SNAPSHOT_FORMAT_MAJOR &&
           minor <= RESONANCE_SNAPSHOT_FORMAT_MINOR;
}

} // namespace version
} // namespace resonance
