/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <iterator>
#include <fmt/core.h>
#include "record_decoder.hh"

namespace filesinks {

uint64_t record_decoder::read_varint(const char* what) {
    auto value = rcf::read_varint(_data, _pos);
    if (!value) {
        throw malformed_container_error(fmt::format("truncated or invalid {} at offset {}", what, _pos));
    }
    return *value;
}

std::string_view record_decoder::read_bytes(uint64_t len, const char* what) {
    if (len > _data.size() - _pos) {
        throw malformed_container_error(fmt::format("{} of {} bytes at offset {} runs past the end ({} bytes)", what, len, _pos, _data.size()));
    }
    auto ret = _data.substr(_pos, len);
    _pos += len;
    return ret;
}

record_decoder::record_decoder(std::string_view data)
    : _data(data) {
    if (read_bytes(rcf::magic.size(), "magic") != rcf::magic) {
        throw malformed_container_error("not an RCF1 container");
    }
    auto n_meta = read_varint("metadata count");
    for (uint64_t i = 0; i < n_meta; ++i) {
        auto key = read_bytes(read_varint("metadata key length"), "metadata key");
        auto value = read_bytes(read_varint("metadata value length"), "metadata value");
        if (!_metadata.emplace(key, value).second) {
            throw malformed_container_error(fmt::format("duplicate metadata key {}", key));
        }
    }
    auto codec = _metadata.find(std::string(rcf::codec_key));
    if (codec != _metadata.end() && codec->second != rcf::null_codec) {
        throw malformed_container_error(fmt::format("unsupported codec {}", codec->second));
    }
    auto marker = read_bytes(rcf::sync_marker_size, "sync marker");
    std::copy(marker.begin(), marker.end(), _sync_marker.begin());
}

std::string record_decoder::schema() const {
    auto it = _metadata.find(std::string(rcf::schema_key));
    return it != _metadata.end() ? it->second : std::string();
}

std::optional<std::vector<record>> record_decoder::next_block() {
    if (_pos == _data.size()) {
        return std::nullopt;
    }
    auto count = read_varint("block record count");
    auto payload = read_bytes(read_varint("block size"), "block payload");
    auto crc = rcf::read_be32(_data, _pos);
    if (!crc) {
        throw malformed_container_error(fmt::format("truncated checksum of block {}", _blocks));
    }
    auto actual = rcf::checksum(0, payload);
    if (actual != *crc) {
        throw malformed_container_error(fmt::format("checksum mismatch in block {}: expected {:08x}, got {:08x}", _blocks, *crc, actual));
    }
    auto marker = read_bytes(rcf::sync_marker_size, "block sync marker");
    if (!std::equal(marker.begin(), marker.end(), _sync_marker.begin())) {
        throw malformed_container_error(fmt::format("sync marker mismatch after block {}", _blocks));
    }

    std::vector<record> records;
    records.reserve(std::min<uint64_t>(count, payload.size()));
    size_t pos = 0;
    for (uint64_t i = 0; i < count; ++i) {
        auto len = rcf::read_varint(payload, pos);
        if (!len || *len > payload.size() - pos) {
            throw malformed_container_error(fmt::format("record {} of block {} is truncated", i, _blocks));
        }
        records.emplace_back(payload.substr(pos, *len));
        pos += *len;
    }
    if (pos != payload.size()) {
        throw malformed_container_error(fmt::format("{} trailing bytes in block {}", payload.size() - pos, _blocks));
    }
    ++_blocks;
    return records;
}

std::vector<record> record_decoder::read_all() {
    std::vector<record> ret;
    while (auto block = next_block()) {
        std::move(block->begin(), block->end(), std::back_inserter(ret));
    }
    return ret;
}

} // namespace filesinks
