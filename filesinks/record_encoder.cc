/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <random>
#include <stdexcept>
#include <seastar/core/coroutine.hh>
#include <seastar/core/temporary_buffer.hh>
#include "record_encoder.hh"

using namespace seastar;

namespace filesinks {

static rcf::sync_marker random_sync_marker() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    rcf::sync_marker marker;
    for (size_t i = 0; i < marker.size(); i += 8) {
        auto word = rng();
        for (size_t j = 0; j < 8; ++j) {
            marker[i + j] = char(word >> (j * 8));
        }
    }
    return marker;
}

record_encoder::record_encoder(data_sink sink, std::string schema, std::optional<rcf::sync_marker> marker)
    : _sink(std::move(sink))
    , _sync_marker(marker.value_or(random_sync_marker())) {
    _metadata.emplace(rcf::schema_key, std::move(schema));
    _metadata.emplace(rcf::codec_key, rcf::null_codec);
}

future<> record_encoder::emit(std::string data) {
    _pos.checksum = rcf::checksum(_pos.checksum, data);
    _pos.bytes += data.size();
    co_await _sink.put(temporary_buffer<char>(data.data(), data.size()));
    co_await _sink.flush();
}

future<> record_encoder::write_header() {
    if (_pos.header_written) {
        throw std::logic_error("container header already written");
    }
    std::string header(rcf::magic);
    rcf::append_varint(header, _metadata.size());
    for (const auto& [key, value] : _metadata) {
        rcf::append_varint(header, key.size());
        header.append(key);
        rcf::append_varint(header, value.size());
        header.append(value);
    }
    header.append(_sync_marker.data(), _sync_marker.size());
    _pos.header_written = true;
    co_await emit(std::move(header));
}

future<> record_encoder::write_block(const std::vector<record>& records) {
    if (!_pos.header_written) {
        throw std::logic_error("block written before the container header");
    }
    if (records.empty()) {
        co_return;
    }

    std::string payload;
    for (const auto& r : records) {
        rcf::append_varint(payload, r.size());
        payload.append(r);
    }
    std::string block;
    block.reserve(payload.size() + 2 * 10 + 4 + rcf::sync_marker_size);
    rcf::append_varint(block, records.size());
    rcf::append_varint(block, payload.size());
    block.append(payload);
    rcf::append_be32(block, rcf::checksum(0, payload));
    block.append(_sync_marker.data(), _sync_marker.size());

    _pos.blocks++;
    _pos.records += records.size();
    co_await emit(std::move(block));
}

void record_encoder::rewind(const position& pos) noexcept {
    _pos = pos;
}

future<> record_encoder::close() {
    return _sink.close();
}

} // namespace filesinks
