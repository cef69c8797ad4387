#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace powchain::serialize {

// Little-endian fixed width integers, Bitcoin-style varints and
// varint-prefixed byte strings.

inline void write_uint32_le(std::vector<uint8_t>& data, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        data.push_back((value >> (i * 8)) & 0xFF);
    }
}

inline void write_uint64_le(std::vector<uint8_t>& data, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        data.push_back((value >> (i * 8)) & 0xFF);
    }
}

inline std::optional<uint32_t> read_uint32_le(const std::vector<uint8_t>& data, size_t& offset) {
    if (offset + 4 > data.size()) return std::nullopt;
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= (static_cast<uint32_t>(data[offset + i]) << (i * 8));
    }
    offset += 4;
    return value;
}

inline std::optional<uint64_t> read_uint64_le(const std::vector<uint8_t>& data, size_t& offset) {
    if (offset + 8 > data.size()) return std::nullopt;
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= (static_cast<uint64_t>(data[offset + i]) << (i * 8));
    }
    offset += 8;
    return value;
}

inline void write_varint(std::vector<uint8_t>& data, uint64_t value) {
    if (value < 0xFD) {
        data.push_back(static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        data.push_back(0xFD);
        data.push_back(value & 0xFF);
        data.push_back((value >> 8) & 0xFF);
    } else if (value <= 0xFFFFFFFF) {
        data.push_back(0xFE);
        write_uint32_le(data, static_cast<uint32_t>(value));
    } else {
        data.push_back(0xFF);
        write_uint64_le(data, value);
    }
}

inline std::optional<uint64_t> read_varint(const std::vector<uint8_t>& data, size_t& offset) {
    if (offset >= data.size()) return std::nullopt;

    uint8_t first = data[offset++];
    if (first < 0xFD) {
        return first;
    } else if (first == 0xFD) {
        if (offset + 2 > data.size()) return std::nullopt;
        uint64_t value = data[offset] | (data[offset + 1] << 8);
        offset += 2;
        return value;
    } else if (first == 0xFE) {
        auto value = read_uint32_le(data, offset);
        if (!value) return std::nullopt;
        return *value;
    } else { // 0xFF
        return read_uint64_le(data, offset);
    }
}

inline void write_string(std::vector<uint8_t>& data, const std::string& str) {
    write_varint(data, str.size());
    data.insert(data.end(), str.begin(), str.end());
}

inline std::optional<std::string> read_string(const std::vector<uint8_t>& data, size_t& offset) {
    auto size = read_varint(data, offset);
    if (!size || *size > data.size() - offset) return std::nullopt;

    std::string str(data.begin() + offset, data.begin() + offset + *size);
    offset += *size;
    return str;
}

template<size_t N>
void write_bytes(std::vector<uint8_t>& data, const std::array<uint8_t, N>& bytes) {
    data.insert(data.end(), bytes.begin(), bytes.end());
}

template<size_t N>
bool read_bytes(const std::vector<uint8_t>& data, size_t& offset, std::array<uint8_t, N>& bytes) {
    if (offset + N > data.size()) return false;
    std::copy(data.begin() + offset, data.begin() + offset + N, bytes.begin());
    offset += N;
    return true;
}

} // namespace powchain::serialize
