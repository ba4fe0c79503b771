/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "environment_credentials_provider.hh"
#include <cstdlib>

namespace gcs {

seastar::future<credentials> environment_credentials_provider::get_credentials() {
    credentials creds;
    if (const char* token = std::getenv(token_variable)) {
        creds.access_token = token;
    }
    if (const char* project = std::getenv(user_project_variable); project && creds) {
        creds.headers.emplace("x-goog-user-project", project);
    }
    return seastar::make_ready_future<credentials>(std::move(creds));
}

} // namespace gcs
