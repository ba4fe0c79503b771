/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include "utils/log.hh"

namespace utils::http {

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

url_info parse_simple_url(std::string_view uri);

// Percent-encodes a whole object name so it can be used as one path segment,
// '/' included.
std::string encode_path_segment(std::string_view segment);

seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> system_trust_credentials();

// Resolves the host on demand, honouring the TTL of the answer, and hands out
// the resolved addresses round-robin. TLS is used when requested, with the
// system trust store unless credentials are supplied.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    logging::logger& _logger;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;
    std::vector<seastar::net::inet_address> _addresses;
    size_t _next_address = 0;
    seastar::lowres_clock::time_point _addresses_expire_at;
    seastar::semaphore _resolve_sem{1};

    seastar::future<> resolve();
    seastar::future<seastar::net::inet_address> get_address();

public:
    dns_connection_factory(std::string host,
                           uint16_t port,
                           bool use_https,
                           logging::logger& logger,
                           seastar::shared_ptr<seastar::tls::certificate_credentials> creds = {});
    dns_connection_factory(const url_info& url, logging::logger& logger, seastar::shared_ptr<seastar::tls::certificate_credentials> creds = {});

    const std::string& host() const noexcept { return _host; }

    virtual seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
};

} // namespace utils::http
