#pragma once

#define EVOMEMORY_VERSION "1.3.0"
#define EVOMEMORY_SCHEMA_VERSION 1

namespace evomemory {
namespace version {

// A database written by a newer library may carry columns we do not know.
// Older schemas are upgraded in place by CREATE ... IF NOT EXISTS.
inline bool schema_compatible(int stored) {
    return stored <= EVOMEMORY_SCHEMA_VERSION;
}

} // namespace version
} // namespace evomemory
