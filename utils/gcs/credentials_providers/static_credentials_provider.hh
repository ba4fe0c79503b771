/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "credentials_provider.hh"

namespace gcs {

class static_credentials_provider final : public credentials_provider {
    credentials _creds;

public:
    explicit static_credentials_provider(credentials creds)
        : _creds(std::move(creds)) {
    }

    seastar::future<credentials> get_credentials() override {
        return seastar::make_ready_future<credentials>(_creds);
    }

    const char* get_name() const override { return "static_credentials_provider"; }
};

} // namespace gcs
