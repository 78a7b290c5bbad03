#pragma once

#define ANIMA_VERSION "0.1.0"
#define ANIMA_PROTOCOL_VERSION_MAJOR 1
#define ANIMA_PROTOCOL_VERSION_MINOR 0

// Snapshot file layout. Bump when StateSnapshot gains or renames fields.
#define ANIMA_SNAPSHOT_SCHEMA_VERSION 2

namespace anima {
namespace version {

inline bool protocol_compatible(int major, int minor) {
    // Major version must match exactly (breaking changes)
    // Minor version: daemon must be >= client (backward compatible additions)
    return major == ANIMA_PROTOCOL_VERSION_MAJOR &&
           minor >= ANIMA_PROTOCOL_VERSION_MINOR;
}

// Snapshots written by an older schema are still readable; newer ones are not.
inline bool snapshot_readable(int schema_version) {
    return schema_version >= 1 && schema_version <= ANIMA_SNAPSHOT_SCHEMA_VERSION;
}

} // namespace version
} // namespace anima
