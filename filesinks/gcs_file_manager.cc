/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include "gcs_file_manager.hh"
#include "utils/log.hh"

using namespace seastar;

namespace filesinks {

logging::logger fsl("filesinks");

static bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        auto c = uint8_t(s[i]);
        size_t len;
        uint32_t cp;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xe0) == 0xc0) {
            len = 2;
            cp = c & 0x1f;
        } else if ((c & 0xf0) == 0xe0) {
            len = 3;
            cp = c & 0x0f;
        } else if ((c & 0xf8) == 0xf0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (s.size() - i < len) {
            return false;
        }
        for (size_t j = 1; j < len; ++j) {
            auto cc = uint8_t(s[i + j]);
            if ((cc & 0xc0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3f);
        }
        // overlong forms, surrogates, beyond the last plane
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
                || (cp >= 0xd800 && cp <= 0xdfff) || cp > 0x10ffff) {
            return false;
        }
        i += len;
    }
    return true;
}

void validate_object_name(std::string_view name, std::string_view what, size_t max_size) {
    if (name.empty()) {
        throw std::invalid_argument(fmt::format("{} is empty", what));
    }
    if (name.size() > max_size) {
        throw std::invalid_argument(fmt::format("{} is {} bytes long, at most {} fit", what, name.size(), max_size));
    }
    if (name.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument(fmt::format("{} contains a line break", what));
    }
    if (!is_valid_utf8(name)) {
        throw std::invalid_argument(fmt::format("{} is not valid UTF-8", what));
    }
}

// A retried delete may find the object already gone, so 404 counts as done.
// Returns the failure message, if any.
static future<std::optional<std::string>> delete_transient_object(gcs::client& client, const std::string& bucket, const std::string& object_name) {
    std::exception_ptr ex;
    try {
        co_await client.delete_object(bucket, object_name);
    } catch (const gcs::gcs_exception& e) {
        if (e.error().get_status() != http::reply::status_type::not_found) {
            ex = std::current_exception();
        } else {
            fsl.debug("{}/{} is already gone", bucket, object_name);
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (!ex) {
        co_return std::nullopt;
    }
    auto msg = seastar::format("cannot delete {}/{}: {}", bucket, object_name, ex);
    fsl.error("{}, leaving it behind", msg);
    co_return msg;
}

sink_file::sink_file(shared_ptr<gcs::client> client,
                     std::string bucket,
                     std::string name,
                     object_paths paths,
                     gcs::retargeting_sink& adapter,
                     record_encoder encoder,
                     size_t capacity,
                     const gcs::object_metadata& inflight)
    : _client(std::move(client))
    , _bucket(std::move(bucket))
    , _name(std::move(name))
    , _paths(std::move(paths))
    , _adapter(&adapter)
    , _encoder(std::move(encoder))
    , _buffer(capacity)
    , _inflight_generation(inflight.generation)
    , _inflight_size(inflight.size)
    , _inflight_components(inflight.component_count) {
}

void sink_file::check_open(std::string_view op) const {
    if (_state != state::open) {
        throw invalid_state_error(fmt::format("cannot {} {}: file is {}", op, _name, _state));
    }
}

void sink_file::append(record&& r) {
    check_open("append to");
    _buffer.push(std::move(r));
}

// Composes are not idempotent: repeating one whose reply got lost would
// append the part twice. So every compose is conditional on the destination
// generation, and a failed precondition is resolved by checking whether the
// destination already holds exactly what this compose would have produced.
future<gcs::object_metadata> sink_file::compose_into(const std::string& destination, gcs::compose_request req, uint64_t expected_size, unsigned expected_components) {
    auto generation = destination == _paths.inflight ? _inflight_generation : std::string("0");
    std::optional<gcs::object_metadata> md;
    try {
        md = co_await _client->compose_object(_bucket, destination, std::move(req), generation);
    } catch (const gcs::gcs_exception& e) {
        if (e.error().get_status() != gcs::precondition_failed) {
            throw;
        }
    }
    if (!md) {
        md = co_await _client->get_object_metadata(_bucket, destination);
        if (md->size != expected_size || md->component_count != expected_components) {
            co_await coroutine::return_exception(std::runtime_error(fmt::format(
                    "{} changed underneath {}: expected {} bytes in {} components, found {} bytes in {} at generation {}",
                    destination, _name, expected_size, expected_components, md->size, md->component_count, md->generation)));
        }
        fsl.info("Compose into {} had already been applied (generation {})", destination, md->generation);
    }
    co_return std::move(*md);
}

future<gcs::object_metadata> sink_file::flush_into(const std::string& destination) {
    gcs::compose_request req{std::string(gcs::octet_stream_content_type), {_paths.inflight}};
    auto expected_size = _inflight_size;
    auto expected_components = _inflight_components;
    if (!_buffer.empty()) {
        auto checkpoint = _encoder.tell();
        // A failed upload may still have stored the part
        _part_written = true;
        auto part = co_await _client->upload_object(_bucket, _paths.part, gcs::retargeted_writer(*_adapter, [this, checkpoint] {
            // every attempt starts from the same encoder state
            _encoder.rewind(checkpoint);
            return _encoder.write_block(_buffer.records());
        }));
        req.source_objects.push_back(_paths.part);
        expected_size += part.size;
        expected_components += part.component_count;
    }
    auto md = co_await compose_into(destination, std::move(req), expected_size, expected_components);
    _records_synced += _buffer.size();
    _buffer.clear();
    if (destination == _paths.inflight) {
        _inflight_generation = md.generation;
        _inflight_size = md.size;
        _inflight_components = md.component_count;
    }
    co_return md;
}

future<> sink_file::sync() {
    check_open("sync");
    fsl.debug("Syncing {} records of {}", _buffer.size(), _name);
    std::exception_ptr ex;
    try {
        co_await flush_into(_paths.inflight);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        _state = state::failed;
        fsl.error("Sync of {} failed, the file can only be discarded now: {}", _name, ex);
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

future<std::optional<std::string>> sink_file::try_delete(const std::string& object_name) {
    return delete_transient_object(*_client, _bucket, object_name);
}

future<publish_result> sink_file::close_and_publish() {
    check_open("publish");
    fsl.debug("Publishing {} with {} buffered records to {}", _name, _buffer.size(), _paths.publish);
    std::optional<gcs::object_metadata> md;
    std::exception_ptr ex;
    try {
        md = co_await flush_into(_paths.publish);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        _state = state::failed;
        fsl.error("Publish of {} failed, the file can only be discarded now: {}", _name, ex);
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    _state = state::published;

    publish_result res{_paths.publish, md->size, {}};
    if (_part_written) {
        if (auto failure = co_await try_delete(_paths.part)) {
            res.cleanup_failures.push_back(std::move(*failure));
        }
    }
    if (auto failure = co_await try_delete(_paths.inflight)) {
        res.cleanup_failures.push_back(std::move(*failure));
    }
    co_await _encoder.close();
    fsl.info("Published {} ({} records, {} bytes)", res.object_name, _records_synced, res.size);
    co_return res;
}

future<> sink_file::discard() {
    if (_state == state::discarded) {
        co_return;
    }
    if (_state == state::published) {
        co_await coroutine::return_exception(invalid_state_error(fmt::format("cannot discard {}: already published", _name)));
    }
    fsl.debug("Discarding {} ({}) with {} buffered records", _name, _state, _buffer.size());
    _state = state::discarded;
    _buffer.clear();
    if (_part_written) {
        co_await try_delete(_paths.part);
    }
    co_await try_delete(_paths.inflight);
    co_await _encoder.close();
}

gcs_file_manager::gcs_file_manager(shared_ptr<gcs::client> client, const gcs_sink_config& cfg)
    : _client(std::move(client))
    , _bucket(cfg.bucket)
    , _schema(cfg.schema)
    , _strategy(cfg.file_strategy) {
}

object_paths gcs_file_manager::paths_for(std::string_view name) const {
    object_paths paths;
    paths.inflight = fmt::format("{}/{}", _strategy.working_dir, name);
    paths.part = paths.inflight + std::string(part_suffix);
    paths.publish = fmt::format("{}/{}", _strategy.publish_dir, name);
    return paths;
}

future<std::unique_ptr<sink_file>> gcs_file_manager::create_file(std::string name) {
    if (name.find('/') != std::string::npos) {
        throw std::invalid_argument(fmt::format("file name {} contains '/'", name));
    }
    validate_object_name(name, "file name");
    auto paths = paths_for(name);
    validate_object_name(paths.part, "part object name");
    validate_object_name(paths.publish, "publish object name");

    auto adapter = std::make_unique<gcs::retargeting_sink>();
    auto& adapter_ref = *adapter;
    record_encoder encoder(data_sink(std::move(adapter)), _schema);

    fsl.debug("Creating {} at {}", name, paths.inflight);
    auto checkpoint = encoder.tell();
    gcs::object_metadata inflight;
    std::exception_ptr ex;
    try {
        inflight = co_await _client->upload_object(_bucket, paths.inflight, gcs::retargeted_writer(adapter_ref, [&encoder, checkpoint] {
            encoder.rewind(checkpoint);
            return encoder.write_header();
        }));
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        fsl.error("Cannot create {}: {}", paths.inflight, ex);
        // the header may have been stored even though the upload failed
        co_await delete_transient_object(*_client, _bucket, paths.inflight);
        co_await encoder.close();
        co_await coroutine::return_exception_ptr(std::move(ex));
    }

    co_return std::make_unique<sink_file>(_client, _bucket, std::move(name), std::move(paths), adapter_ref, std::move(encoder), _strategy.sync_file_after_records, inflight);
}

} // namespace filesinks

auto fmt::formatter<filesinks::sink_file::state>::format(filesinks::sink_file::state s, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    std::string_view name = "unknown";
    switch (s) {
    case filesinks::sink_file::state::open: name = "open"; break;
    case filesinks::sink_file::state::published: name = "published"; break;
    case filesinks::sink_file::state::discarded: name = "discarded"; break;
    case filesinks::sink_file::state::failed: name = "failed"; break;
    }
    return fmt::formatter<string_view>::format(name, ctx);
}
