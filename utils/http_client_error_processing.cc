/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "http_client_error_processing.hh"
#include <cerrno>

namespace utils::http {

retryable from_http_code(seastar::http::reply::status_type http_code) {
    using status = seastar::http::reply::status_type;
    switch (http_code) {
    case status::internal_server_error:
    case status::bad_gateway:
    case status::service_unavailable:
    case status::gateway_timeout:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() != std::system_category()) {
        return retryable::no;
    }
    switch (system_error.code().value()) {
    case ECONNREFUSED:
    case ECONNRESET:
    case ECONNABORTED:
    case EPIPE:
    case ETIMEDOUT:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

} // namespace utils::http
