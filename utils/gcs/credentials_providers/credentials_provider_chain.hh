/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>
#include <vector>
#include "credentials_provider.hh"

namespace gcs {

// Asks each provider in turn and returns the first non-empty credentials
class credentials_provider_chain final : public credentials_provider {
    std::vector<std::unique_ptr<credentials_provider>> _providers;

public:
    credentials_provider_chain& add_credentials_provider(std::unique_ptr<credentials_provider>&& provider);

    seastar::future<credentials> get_credentials() override;
    const char* get_name() const override { return "credentials_provider_chain"; }
};

} // namespace gcs
