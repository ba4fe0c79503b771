/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include "gcs_file_manager_factory.hh"
#include "utils/log.hh"

using namespace seastar;

namespace filesinks {

extern logging::logger fsl;

gcs_file_manager_factory::gcs_file_manager_factory(gcs_sink_config cfg, shared_ptr<gcs::client> client)
    : _cfg(std::move(cfg))
    , _client(std::move(client)) {
}

gcs_file_manager_factory gcs_file_manager_factory::make(gcs_sink_config cfg, shared_ptr<gcs::credentials_provider> creds_provider) {
    auto client = gcs::client::make(cfg.endpoint, std::move(creds_provider), cfg.retry.make_retry_strategy(), cfg.max_connections);
    return gcs_file_manager_factory(std::move(cfg), std::move(client));
}

void gcs_file_manager_factory::validate_directory(const std::string& dir, std::string_view key) const {
    if (dir.ends_with('/')) {
        throw configuration_error(fmt::format("{} {} must not end with '/'", key, dir));
    }
    try {
        // the shortest object ever put there is "<dir>/x.part"
        validate_object_name(dir, key, max_object_name_size - 2 - part_suffix.size());
    } catch (const std::invalid_argument& e) {
        throw configuration_error(e.what());
    }
}

future<> gcs_file_manager_factory::verify_file_system_configuration() {
    fsl.info("Verifying {}", _cfg);

    validate_directory(_cfg.file_strategy.working_dir, "file_strategy.working_dir");
    validate_directory(_cfg.file_strategy.publish_dir, "file_strategy.publish_dir");
    if (_cfg.file_strategy.working_dir == _cfg.file_strategy.publish_dir) {
        throw configuration_error("file_strategy.working_dir and file_strategy.publish_dir must differ");
    }

    std::exception_ptr ex;
    try {
        co_await _client->get_credentials();
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await coroutine::return_exception(configuration_error(
                seastar::format("cannot obtain credentials from {}: {}", _client->get_credentials_provider().get_name(), ex)));
    }

    gcs::bucket_metadata md;
    try {
        md = co_await _client->get_bucket(_cfg.bucket);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_await coroutine::return_exception(configuration_error(seastar::format("bucket {} is not reachable: {}", _cfg.bucket, ex)));
    }

    fsl.info("Bucket {} is reachable: {}", _cfg.bucket, md);
    _verified = true;
}

std::unique_ptr<gcs_file_manager> gcs_file_manager_factory::create() const {
    if (!_verified) {
        fsl.warn("Creating a file manager for bucket {} without verifying the configuration first", _cfg.bucket);
    }
    return std::make_unique<gcs_file_manager>(_client, _cfg);
}

future<> gcs_file_manager_factory::close() {
    return _client->close();
}

} // namespace filesinks
