#pragma once

#define ARBOR_VERSION "0.4.0"
#define ARBOR_PROTOCOL_VERSION "2024-11-05"

namespace arbor {
namespace version {

inline const char* string() {
    return ARBOR_VERSION;
}

} // namespace version
} // namespace arbor
