/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <zlib.h>

// Record container format, version 1:
//
//   header := magic, varint n_meta, n_meta * (varint klen, key, varint vlen, value), sync_marker
//   block  := varint record_count, varint payload_size, payload, crc32(payload) (big endian), sync_marker
//   file   := header block*
//
// where payload is record_count * (varint len, bytes). Varints are unsigned LEB128.
namespace filesinks::rcf {

inline constexpr std::string_view magic{"RCF\x01", 4};
inline constexpr size_t sync_marker_size = 16;
inline constexpr std::string_view schema_key = "rcf.schema";
inline constexpr std::string_view codec_key = "rcf.codec";
inline constexpr std::string_view null_codec = "null";
inline constexpr std::string_view file_extension = ".rcf";

using sync_marker = std::array<char, sync_marker_size>;

// CRC-32 of data continuing from prev, which is 0 for an empty prefix
inline uint32_t checksum(uint32_t prev, std::string_view data) {
    return ::crc32(prev, reinterpret_cast<const Bytef*>(data.data()), uInt(data.size()));
}

inline void append_varint(std::string& out, uint64_t value) {
    while (value >= 0x80) {
        out.push_back(char((value & 0x7f) | 0x80));
        value >>= 7;
    }
    out.push_back(char(value));
}

inline void append_be32(std::string& out, uint32_t value) {
    out.push_back(char(value >> 24));
    out.push_back(char(value >> 16));
    out.push_back(char(value >> 8));
    out.push_back(char(value));
}

// Returns nullopt on truncated input or on a varint longer than 64 bits.
// `pos` is advanced past the varint on success.
inline std::optional<uint64_t> read_varint(std::string_view in, size_t& pos) {
    uint64_t value = 0;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        if (pos >= in.size()) {
            return std::nullopt;
        }
        auto byte = uint8_t(in[pos++]);
        value |= uint64_t(byte & 0x7f) << shift;
        if (!(byte & 0x80)) {
            return value;
        }
    }
    return std::nullopt;
}

inline std::optional<uint32_t> read_be32(std::string_view in, size_t& pos) {
    if (in.size() - pos < 4) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | uint8_t(in[pos++]);
    }
    return value;
}

} // namespace filesinks::rcf
