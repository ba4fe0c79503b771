/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <fmt/core.h>
#include <seastar/http/reply.hh>
#include "utils/http_client_error_processing.hh"

namespace gcs {

using retryable = utils::http::retryable;

enum class gcs_error_type : uint8_t {
    HTTP_STATUS,          // the server answered with a non-2xx status
    UNEXPECTED_STATUS,    // 2xx, but not the one the operation expects
    NETWORK_CONNECTION,   // the exchange never completed
    CREDENTIALS,          // the credentials provider failed
    MALFORMED_RESPONSE,   // a 2xx body that could not be parsed
    REQUEST_BODY,         // the body writer failed, e.g. the encoder threw
    TIMEOUT,              // the retry budget's total timeout ran out
    UNKNOWN,
};

// The outcome of one failed attempt of a remote call. It is either retriable
// or fatal; the retry executor decides what to do based on that alone.
class gcs_error {
    gcs_error_type _type;
    std::optional<seastar::http::reply::status_type> _status;
    std::string _message;
    retryable _is_retryable;

public:
    gcs_error(gcs_error_type type, std::string message, retryable is_retryable, std::optional<seastar::http::reply::status_type> status = std::nullopt);

    [[nodiscard]] gcs_error_type get_error_type() const noexcept { return _type; }
    [[nodiscard]] std::optional<seastar::http::reply::status_type> get_status() const noexcept { return _status; }
    [[nodiscard]] const std::string& get_message() const noexcept { return _message; }
    [[nodiscard]] retryable is_retryable() const noexcept { return _is_retryable; }

    // `body` is the raw error response; the message of the JSON error
    // envelope is used when there is one, the body itself otherwise.
    static gcs_error from_http_code(seastar::http::reply::status_type status, std::string_view body);
    static gcs_error from_system_error(const std::system_error& e);
    static gcs_error from_exception_ptr(std::exception_ptr ex);
};

// Thrown to the caller once the retry executor gave up on an operation
class gcs_exception : public std::runtime_error {
    gcs_error _error;

public:
    explicit gcs_exception(gcs_error error);

    const gcs_error& error() const noexcept { return _error; }
};

} // namespace gcs

template <>
struct fmt::formatter<gcs::gcs_error_type> : fmt::formatter<string_view> {
    auto format(gcs::gcs_error_type type, fmt::format_context& ctx) const -> decltype(ctx.out());
};

template <>
struct fmt::formatter<gcs::gcs_error> : fmt::formatter<string_view> {
    auto format(const gcs::gcs_error& e, fmt::format_context& ctx) const -> decltype(ctx.out());
};
