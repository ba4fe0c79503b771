/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "gcs_error.hh"
#include "utils/gcs/utils/client_utils.hh"
#include <seastar/core/timed_out_error.hh>
#include <seastar/http/exception.hh>

namespace gcs {

gcs_error::gcs_error(gcs_error_type type, std::string message, retryable is_retryable, std::optional<seastar::http::reply::status_type> status)
    : _type(type)
    , _status(status)
    , _message(std::move(message))
    , _is_retryable(is_retryable) {
}

gcs_error gcs_error::from_http_code(seastar::http::reply::status_type status, std::string_view body) {
    auto message = parse_error_message(body).value_or(std::string(body));
    if (message.empty()) {
        message = fmt::format("HTTP status {}", int(status));
    }
    return gcs_error(gcs_error_type::HTTP_STATUS, std::move(message), utils::http::from_http_code(status), status);
}

gcs_error gcs_error::from_system_error(const std::system_error& e) {
    return gcs_error(gcs_error_type::NETWORK_CONNECTION, e.what(), utils::http::from_system_error(e));
}

gcs_error gcs_error::from_exception_ptr(std::exception_ptr ex) {
    return utils::http::dispatch_exception<gcs_error>(
        std::move(ex),
        [] (std::exception_ptr, std::string&& original_message) {
            if (original_message.empty()) {
                original_message = "unknown exception";
            }
            return gcs_error(gcs_error_type::UNKNOWN, std::move(original_message), retryable::no);
        },
        utils::http::make_handler<gcs_exception>([] (const gcs_exception& e) {
            return e.error();
        }),
        utils::http::make_handler<seastar::httpd::unexpected_status_error>([] (const seastar::httpd::unexpected_status_error& e) {
            return gcs_error(gcs_error_type::UNEXPECTED_STATUS, e.what(), utils::http::from_http_code(e.status()), e.status());
        }),
        utils::http::make_handler<std::system_error>([] (const std::system_error& e) {
            return gcs_error::from_system_error(e);
        }),
        utils::http::make_handler<seastar::timed_out_error>([] (const seastar::timed_out_error& e) {
            return gcs_error(gcs_error_type::NETWORK_CONNECTION, e.what(), retryable::yes);
        }));
}

gcs_exception::gcs_exception(gcs_error error)
    : std::runtime_error(fmt::format("{}", error))
    , _error(std::move(error)) {
}

} // namespace gcs

auto fmt::formatter<gcs::gcs_error_type>::format(gcs::gcs_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    std::string_view name = "UNKNOWN";
    switch (type) {
    case gcs::gcs_error_type::HTTP_STATUS: name = "HTTP_STATUS"; break;
    case gcs::gcs_error_type::UNEXPECTED_STATUS: name = "UNEXPECTED_STATUS"; break;
    case gcs::gcs_error_type::NETWORK_CONNECTION: name = "NETWORK_CONNECTION"; break;
    case gcs::gcs_error_type::CREDENTIALS: name = "CREDENTIALS"; break;
    case gcs::gcs_error_type::MALFORMED_RESPONSE: name = "MALFORMED_RESPONSE"; break;
    case gcs::gcs_error_type::REQUEST_BODY: name = "REQUEST_BODY"; break;
    case gcs::gcs_error_type::TIMEOUT: name = "TIMEOUT"; break;
    case gcs::gcs_error_type::UNKNOWN: break;
    }
    return fmt::formatter<string_view>::format(name, ctx);
}

auto fmt::formatter<gcs::gcs_error>::format(const gcs::gcs_error& e, fmt::format_context& ctx) const -> decltype(ctx.out()) {
    if (auto status = e.get_status()) {
        return fmt::format_to(ctx.out(), "{} ({}, status {}): {}", e.get_error_type(), e.is_retryable() ? "retriable" : "fatal", int(*status), e.get_message());
    }
    return fmt::format_to(ctx.out(), "{} ({}): {}", e.get_error_type(), e.is_retryable() ? "retriable" : "fatal", e.get_message());
}
