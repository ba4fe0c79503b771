/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http.hh"

#include <algorithm>
#include <ranges>
#include <strings.h>
#include <boost/regex.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>
#include <seastar/http/url.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

namespace utils::http {

static const char HTTPS[] = "https";

future<shared_ptr<tls::certificate_credentials>> system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        // can race, and overwrite the object. that is fine.
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

dns_connection_factory::dns_connection_factory(std::string host,
                                               uint16_t port,
                                               bool use_https,
                                               logging::logger& logger,
                                               shared_ptr<tls::certificate_credentials> creds)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
    , _creds(std::move(creds)) {
}

dns_connection_factory::dns_connection_factory(const url_info& url, logging::logger& logger, shared_ptr<tls::certificate_credentials> creds)
    : dns_connection_factory(url.host, url.port, url.is_https(), logger, std::move(creds)) {
    if (!url.path.empty() && url.path != "/") {
        throw std::invalid_argument(fmt::format("Cannot handle path in endpoint URI: {}://{}{}", url.scheme, url.host, url.path));
    }
}

future<> dns_connection_factory::resolve() {
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    if (hent.addr_entries.empty()) {
        throw std::runtime_error(fmt::format("Host {} resolved to no addresses", _host));
    }
    auto ttl = std::ranges::min_element(hent.addr_entries, {}, &net::hostent::address_entry::ttl)->ttl;
    _addresses = hent.addr_entries | std::views::transform(&net::hostent::address_entry::addr) | std::ranges::to<std::vector>();
    // A zero TTL means the answer is good for this transaction only
    _addresses_expire_at = lowres_clock::now() + ttl;
    _logger.debug("Resolved {} to {} (ttl {}s)", _host, _addresses, ttl.count());
}

future<net::inet_address> dns_connection_factory::get_address() {
    if (_addresses.empty() || lowres_clock::now() >= _addresses_expire_at) [[unlikely]] {
        auto units = co_await get_units(_resolve_sem, 1);
        if (_addresses.empty() || lowres_clock::now() >= _addresses_expire_at) {
            co_await resolve();
        }
    }
    co_return _addresses[_next_address++ % _addresses.size()];
}

future<connected_socket> dns_connection_factory::make(abort_source*) {
    auto addr = socket_address(co_await get_address(), _port);
    if (_use_https) {
        if (!_creds) {
            _creds = co_await system_trust_credentials();
        }
        _logger.debug("Making new HTTPS connection addr={} host={}", addr, _host);
        co_return co_await tls::connect(_creds, addr, tls::tls_options{.server_name = _host});
    }
    _logger.debug("Making new HTTP connection addr={} host={}", addr, _host);
    co_return co_await seastar::connect(addr, {}, transport::TCP);
}

url_info parse_simple_url(std::string_view uri) {
    // IPv6 literals come wrapped in brackets when followed by a port,
    // e.g. http://[2001:db8:4006:812::200e]:8080
    static const boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:]+)(:\d+)?(\/.*)?)foo");

    boost::smatch m;
    std::string tmp(uri);
    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    url_info ret{
        .scheme = m[1].str(),
        .host = m[2].str(),
        .path = m[4].str(),
        .port = 0,
    };
    if (ret.host.size() > 2 && ret.host.front() == '[' && ret.host.back() == ']') {
        ret.host = ret.host.substr(1, ret.host.size() - 2);
    }
    auto port = m[3].str();
    ret.port = port.empty() ? (ret.is_https() ? 443 : 80) : uint16_t(std::stoi(port.substr(1)));
    return ret;
}

bool url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}

std::string encode_path_segment(std::string_view segment) {
    // seastar keeps only the RFC 3986 unreserved characters, so '/' is escaped too
    return seastar::http::internal::url_encode(segment);
}

} // namespace utils::http
