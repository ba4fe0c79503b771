/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include "credentials_provider.hh"

namespace gcs {

// GCS_OAUTH_ACCESS_TOKEN holds the bearer token, GCS_USER_PROJECT optionally
// names the project billed for requester-pays buckets. Both are re-read on
// every call so a token refreshed by an external agent is picked up.
class environment_credentials_provider final : public credentials_provider {
public:
    static constexpr const char* token_variable = "GCS_OAUTH_ACCESS_TOKEN";
    static constexpr const char* user_project_variable = "GCS_USER_PROJECT";

    seastar::future<credentials> get_credentials() override;
    const char* get_name() const override { return "environment_credentials_provider"; }
};

} // namespace gcs
