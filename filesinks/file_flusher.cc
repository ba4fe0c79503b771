/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <algorithm>
#include <ctime>
#include <unistd.h>
#include <fmt/chrono.h>
#include <seastar/core/coroutine.hh>
#include "file_flusher.hh"
#include "utils/log.hh"

using namespace seastar;

namespace filesinks {

extern logging::logger fsl;

std::string file_flusher::local_hostname() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || !buf[0]) {
        return "localhost";
    }
    std::string host(buf);
    std::replace(host.begin(), host.end(), '/', '_');
    return host;
}

file_flusher::file_flusher(gcs_file_manager& manager, std::string hostname)
    : _manager(manager)
    , _hostname(std::move(hostname)) {
}

std::string file_flusher::make_file_name(std::chrono::system_clock::time_point now) {
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    ::gmtime_r(&t, &tm);
    return fmt::format("{:%Y%m%d-%H%M%S}-{}-{}{}", tm, _hostname, _sequence++, rcf::file_extension);
}

future<bool> file_flusher::open_file() {
    auto name = make_file_name(std::chrono::system_clock::now());
    std::exception_ptr ex;
    try {
        _current = co_await _manager.create_file(name);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        fsl.error("Cannot open {}: {}", name, ex);
        co_return false;
    }
    _opened_at = _last_sync = clock_type::now();
    fsl.debug("Opened {}", name);
    co_return true;
}

future<> file_flusher::drop_current(std::exception_ptr ex) {
    auto file = std::move(_current);
    auto lost = file->records_synced() + file->buffered();
    fsl.error("Discarding {} and the {} records it held: {}", file->name(), lost, ex);
    _stats.records_dropped += lost;
    ++_stats.files_discarded;
    co_await file->discard();
}

future<> file_flusher::sync_current(clock_type::time_point now) {
    std::exception_ptr ex;
    try {
        co_await _current->sync();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await drop_current(std::move(ex));
        co_return;
    }
    _last_sync = now;
}

future<> file_flusher::finish_current() {
    if (!_current) {
        co_return;
    }
    if (_current->records_synced() + _current->buffered() == 0) {
        auto file = std::move(_current);
        ++_stats.files_discarded;
        co_await file->discard();
        co_return;
    }

    std::exception_ptr ex;
    try {
        auto res = co_await _current->close_and_publish();
        _stats.records_written += _current->records_synced();
        _stats.cleanup_failures += res.cleanup_failures.size();
        ++_stats.files_published;
        _current.reset();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await drop_current(std::move(ex));
    }
}

future<> file_flusher::process(record r) {
    if (!_current && !co_await open_file()) {
        ++_stats.records_dropped;
        co_return;
    }
    _current->append(std::move(r));
    if (_current->buffered() >= _manager.strategy().sync_file_after_records) {
        co_await sync_current(clock_type::now());
    }
}

future<> file_flusher::heartbeat(clock_type::time_point now) {
    if (!_current) {
        co_return;
    }
    const auto& strategy = _manager.strategy();
    if (now - _opened_at >= strategy.roll_every) {
        fsl.debug("Rolling {}", _current->name());
        co_await finish_current();
        co_return;
    }
    if (_current->buffered() > 0 && now - _last_sync >= strategy.sync_file_after_duration) {
        co_await sync_current(now);
    }
}

future<> file_flusher::close() {
    return finish_current();
}

} // namespace filesinks
