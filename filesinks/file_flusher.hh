/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <seastar/core/lowres_clock.hh>
#include "filesinks/gcs_file_manager.hh"

namespace filesinks {

// Feeds records into one file at a time, syncing it by record count or by
// age of the unsynced records, and rolling it over to a new file
// periodically. A file that fails is discarded together with the records it
// held; the next record opens a new one.
class file_flusher {
public:
    using clock_type = seastar::lowres_clock;

    struct stats {
        uint64_t files_published = 0;
        uint64_t files_discarded = 0;
        uint64_t records_written = 0;
        uint64_t records_dropped = 0;
        uint64_t cleanup_failures = 0;
    };

private:
    gcs_file_manager& _manager;
    std::string _hostname;
    uint64_t _sequence = 0;
    std::unique_ptr<sink_file> _current;
    clock_type::time_point _opened_at;
    clock_type::time_point _last_sync;
    stats _stats;

    seastar::future<bool> open_file();
    seastar::future<> sync_current(clock_type::time_point now);
    seastar::future<> finish_current();
    seastar::future<> drop_current(std::exception_ptr ex);

public:
    explicit file_flusher(gcs_file_manager& manager, std::string hostname = local_hostname());

    seastar::future<> process(record r);
    seastar::future<> heartbeat(clock_type::time_point now = clock_type::now());
    // Publishes the current file, or discards it if it never got a record
    seastar::future<> close();

    const sink_file* current() const noexcept { return _current.get(); }
    const stats& get_stats() const noexcept { return _stats; }

    // <UTC yyyyMMdd-HHmmss>-<hostname>-<sequence>.rcf
    std::string make_file_name(std::chrono::system_clock::time_point now);

    static std::string local_hostname();
};

} // namespace filesinks
