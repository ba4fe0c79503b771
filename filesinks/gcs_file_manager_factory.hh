/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <seastar/core/shared_ptr.hh>
#include "filesinks/gcs_file_manager.hh"
#include "filesinks/sink_config.hh"
#include "utils/gcs/client.hh"

namespace filesinks {

// Checks the configuration against the real bucket once, at startup, and
// hands out file managers afterwards.
class gcs_file_manager_factory {
    gcs_sink_config _cfg;
    seastar::shared_ptr<gcs::client> _client;
    bool _verified = false;

    void validate_directory(const std::string& dir, std::string_view key) const;

public:
    gcs_file_manager_factory(gcs_sink_config cfg, seastar::shared_ptr<gcs::client> client);

    // Builds the client from the configuration
    static gcs_file_manager_factory make(gcs_sink_config cfg, seastar::shared_ptr<gcs::credentials_provider> creds_provider);

    // Throws configuration_error describing the first problem found
    seastar::future<> verify_file_system_configuration();

    std::unique_ptr<gcs_file_manager> create() const;

    const gcs_sink_config& config() const noexcept { return _cfg; }
    const seastar::shared_ptr<gcs::client>& client() const noexcept { return _client; }

    seastar::future<> close();
};

} // namespace filesinks
