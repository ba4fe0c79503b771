/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "credentials_provider_chain.hh"
#include <seastar/core/coroutine.hh>
#include "utils/log.hh"

namespace gcs {

static logging::logger credlog("gcs_credentials");

credentials_provider_chain& credentials_provider_chain::add_credentials_provider(std::unique_ptr<credentials_provider>&& provider) {
    _providers.emplace_back(std::move(provider));
    return *this;
}

seastar::future<credentials> credentials_provider_chain::get_credentials() {
    for (auto& provider : _providers) {
        auto creds = co_await provider->get_credentials();
        if (creds) {
            credlog.trace("Using credentials from {}", provider->get_name());
            co_return creds;
        }
        credlog.trace("{} has no credentials to offer", provider->get_name());
    }
    co_return credentials{};
}

} // namespace gcs
