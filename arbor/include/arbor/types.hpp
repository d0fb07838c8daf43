#pragma once
// Core types: attribute values, indices, time
//
// Attribute values are a closed union. Comparison is type-aware:
// the string "5" never equals the number 5.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace arbor {

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Position of an element in its graph's pre-order sequence
using ElementIdx = uint32_t;
// Position of an association in its graph's declaration order
using AssocIdx = uint32_t;

constexpr ElementIdx NO_ELEMENT = std::numeric_limits<ElementIdx>::max();

// string | number | boolean
using AttributeValue = std::variant<std::string, double, bool>;
using Attributes = std::map<std::string, AttributeValue>;

// Model identifiers: 24 chars over a URL-safe alphabet. The first 8 chars
// encode a caller-supplied sequence (48 bits), the rest are random, so ids
// from one sequence never repeat.
constexpr size_t MODEL_ID_LENGTH = 24;
constexpr size_t MODEL_ID_SEQUENCE_CHARS = 8;

inline std::string generate_model_id(uint64_t sequence) {
    static const char alphabet[] =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz_-";
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dis(0, 63);

    std::string id(MODEL_ID_LENGTH, '0');
    for (size_t i = MODEL_ID_SEQUENCE_CHARS; i-- > 0;) {
        id[i] = alphabet[sequence & 63];
        sequence >>= 6;
    }
    for (size_t i = MODEL_ID_SEQUENCE_CHARS; i < MODEL_ID_LENGTH; ++i) {
        id[i] = alphabet[dis(gen)];
    }
    return id;
}

inline bool is_valid_model_id(const std::string& id) {
    if (id.size() != MODEL_ID_LENGTH) return false;
    for (char c : id) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                  (c >= 'A' && c <= 'Z') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace arbor
