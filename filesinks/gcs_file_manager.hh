/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>
#include <seastar/core/shared_ptr.hh>
#include "filesinks/record_buffer.hh"
#include "filesinks/record_encoder.hh"
#include "filesinks/sink_config.hh"
#include "utils/gcs/client.hh"
#include "utils/gcs/client_helpers/retargeting_sink.hh"

namespace filesinks {

inline constexpr std::string_view part_suffix = ".part";
// GCS limit on the UTF-8 encoded object name
inline constexpr size_t max_object_name_size = 1024;

class invalid_state_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Throws std::invalid_argument naming `what` unless `name` is usable as (a
// prefix of) an object name: valid UTF-8, no CR or LF, at most `max_size` bytes.
void validate_object_name(std::string_view name, std::string_view what, size_t max_size = max_object_name_size);

struct object_paths {
    std::string inflight;
    std::string part;
    std::string publish;
};

struct publish_result {
    std::string object_name;
    uint64_t size = 0;
    // One message per transient object that could not be deleted
    std::vector<std::string> cleanup_failures;

    bool clean() const noexcept { return cleanup_failures.empty(); }
};

// One file being written. The inflight object always holds the container
// header and every record synced so far; publishing composes it, together
// with the last part, into the publish path.
//
// Only one operation may be in progress at a time. Once an operation fails
// the file is failed and can only be discarded.
class sink_file {
public:
    enum class state { open, published, discarded, failed };

private:
    seastar::shared_ptr<gcs::client> _client;
    std::string _bucket;
    std::string _name;
    object_paths _paths;
    // Owned by the encoder's data_sink
    gcs::retargeting_sink* _adapter;
    record_encoder _encoder;
    record_buffer _buffer;
    state _state = state::open;
    // Set once a part upload has been attempted; the part may exist from then on
    bool _part_written = false;
    uint64_t _records_synced = 0;
    // What the inflight object looked like after the last successful compose
    std::string _inflight_generation;
    uint64_t _inflight_size;
    unsigned _inflight_components;

    void check_open(std::string_view op) const;
    seastar::future<gcs::object_metadata> flush_into(const std::string& destination);
    seastar::future<gcs::object_metadata> compose_into(const std::string& destination, gcs::compose_request req, uint64_t expected_size, unsigned expected_components);
    seastar::future<std::optional<std::string>> try_delete(const std::string& object_name);

public:
    sink_file(seastar::shared_ptr<gcs::client> client,
              std::string bucket,
              std::string name,
              object_paths paths,
              gcs::retargeting_sink& adapter,
              record_encoder encoder,
              size_t capacity,
              const gcs::object_metadata& inflight);

    // Buffers the record, no I/O. Throws buffer_overflow_error when the
    // buffer is full; the record is left untouched then.
    void append(record&& r);

    // Uploads the buffered records as the part object and composes
    // [inflight, part] into the inflight object. With nothing buffered only
    // the inflight object is recomposed.
    seastar::future<> sync();

    // Final sync into the publish path, then removal of the transient
    // objects. Failures of the latter are reported in the result only.
    seastar::future<publish_result> close_and_publish();

    // Best effort removal of the transient objects. Never throws on remote
    // errors; a no-op on a discarded file.
    seastar::future<> discard();

    const std::string& name() const noexcept { return _name; }
    const object_paths& paths() const noexcept { return _paths; }
    state get_state() const noexcept { return _state; }
    size_t buffered() const noexcept { return _buffer.size(); }
    size_t capacity() const noexcept { return _buffer.capacity(); }
    uint64_t records_synced() const noexcept { return _records_synced; }
    bool part_written() const noexcept { return _part_written; }
};

class gcs_file_manager {
    seastar::shared_ptr<gcs::client> _client;
    std::string _bucket;
    std::string _schema;
    file_strategy_config _strategy;

public:
    gcs_file_manager(seastar::shared_ptr<gcs::client> client, const gcs_sink_config& cfg);

    object_paths paths_for(std::string_view name) const;

    // Writes the container header into a fresh inflight object and returns
    // the open file. On failure whatever got stored is deleted again.
    seastar::future<std::unique_ptr<sink_file>> create_file(std::string name);

    const file_strategy_config& strategy() const noexcept { return _strategy; }
    const std::string& bucket() const noexcept { return _bucket; }
    const seastar::shared_ptr<gcs::client>& client() const noexcept { return _client; }
};

} // namespace filesinks

template <>
struct fmt::formatter<filesinks::sink_file::state> : fmt::formatter<string_view> {
    auto format(filesinks::sink_file::state s, fmt::format_context& ctx) const -> decltype(ctx.out());
};
