/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include "filesinks/rcf_format.hh"
#include "filesinks/record.hh"

namespace filesinks {

// Writes an RCF1 container into a data sink: the header once, then one block
// per write_block() call. The sink may be pointed somewhere else between
// calls; the encoder only keeps track of what it has emitted so far.
class record_encoder {
public:
    struct position {
        bool header_written = false;
        uint64_t bytes = 0;
        uint64_t blocks = 0;
        uint64_t records = 0;
        uint32_t checksum = 0;
    };

private:
    seastar::data_sink _sink;
    std::map<std::string, std::string> _metadata;
    rcf::sync_marker _sync_marker;
    // checksum covers every byte emitted so far, header included
    position _pos;

    seastar::future<> emit(std::string data);

public:
    record_encoder(seastar::data_sink sink, std::string schema, std::optional<rcf::sync_marker> marker = std::nullopt);

    seastar::future<> write_header();
    // Writes all of `records` as one block. An empty block is not written.
    seastar::future<> write_block(const std::vector<record>& records);

    // Snapshot and restore of the encoder state. Restoring a snapshot makes
    // the next write emit exactly what it emitted after the snapshot was taken.
    position tell() const noexcept { return _pos; }
    void rewind(const position& pos) noexcept;

    uint32_t running_checksum() const noexcept { return _pos.checksum; }
    const rcf::sync_marker& get_sync_marker() const noexcept { return _sync_marker; }
    const std::map<std::string, std::string>& metadata() const noexcept { return _metadata; }

    seastar::future<> close();
};

} // namespace filesinks
