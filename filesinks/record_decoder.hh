/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include "filesinks/rcf_format.hh"
#include "filesinks/record.hh"

namespace filesinks {

class malformed_container_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reads an RCF1 container held in memory. The header is parsed on
// construction, blocks one at a time afterwards.
class record_decoder {
    std::string_view _data;
    size_t _pos = 0;
    std::map<std::string, std::string> _metadata;
    rcf::sync_marker _sync_marker;
    uint64_t _blocks = 0;

    uint64_t read_varint(const char* what);
    std::string_view read_bytes(uint64_t len, const char* what);

public:
    explicit record_decoder(std::string_view data);

    const std::map<std::string, std::string>& metadata() const noexcept { return _metadata; }
    const rcf::sync_marker& get_sync_marker() const noexcept { return _sync_marker; }
    std::string schema() const;
    uint64_t blocks_read() const noexcept { return _blocks; }

    // nullopt at the end of the container
    std::optional<std::vector<record>> next_block();
    // All remaining records, in order
    std::vector<record> read_all();
};

} // namespace filesinks
