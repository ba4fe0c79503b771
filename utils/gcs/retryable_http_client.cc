/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retryable_http_client.hh"
#include <seastar/core/coroutine.hh>
#include <seastar/core/lowres_clock.hh>
#include <seastar/core/sleep.hh>
#include <seastar/http/request.hh>
#include <seastar/util/short_streams.hh>
#include "utils/log.hh"

using namespace seastar;
namespace gcs {

extern logging::logger gcsl;

retryable_http_client::retryable_http_client(std::unique_ptr<http::experimental::connection_factory>&& factory,
                                             unsigned max_conn,
                                             authorizer authorize,
                                             const retry_strategy& retry_strategy)
    : _http(std::move(factory), max_conn, http::experimental::client::retry_requests::no)
    , _authorize(std::move(authorize))
    , _retry_strategy(retry_strategy) {
}

future<std::optional<gcs_error>> retryable_http_client::do_attempt(http::request& req,
                                                                    http::experimental::client::reply_handler& handler,
                                                                    std::optional<gcs_error>& reply_error) {
    reply_error.reset();
    std::exception_ptr ex;
    try {
        co_await _authorize(req);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_return gcs_error(gcs_error_type::CREDENTIALS, seastar::format("cannot obtain credentials: {}", ex), retryable::no);
    }

    try {
        co_await _http.make_request(req, handler, std::nullopt);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        co_return gcs_error::from_exception_ptr(std::move(ex));
    }
    co_return std::move(reply_error);
}

future<> retryable_http_client::make_request(std::string operation,
                                             http::request req,
                                             http::experimental::client::reply_handler handle,
                                             std::optional<http::reply::status_type> expected) {
    return make_request(std::move(operation), std::move(req), std::move(handle), expected, _retry_strategy);
}

future<> retryable_http_client::make_request(std::string operation,
                                             http::request req,
                                             http::experimental::client::reply_handler handle,
                                             std::optional<http::reply::status_type> expected,
                                             const retry_strategy& strategy) {
    // The wrapped handler never throws on a bad reply, it leaves the verdict
    // in reply_error for the loop below.
    std::optional<gcs_error> reply_error;
    http::experimental::client::reply_handler handler = [&reply_error, &handle, expected] (const http::reply& rep, input_stream<char>&& in) -> future<> {
        auto payload = std::move(in);
        if (http::reply::classify_status(rep._status) != http::reply::status_class::success) {
            auto body = co_await util::read_entire_stream_contiguous(payload);
            gcsl.debug("Error response {}: {}", int(rep._status), body);
            reply_error.emplace(gcs_error::from_http_code(rep._status, body));
            co_return;
        }
        if (expected && rep._status != *expected) {
            co_await util::skip_entire_stream(payload);
            reply_error.emplace(gcs_error_type::UNEXPECTED_STATUS,
                                seastar::format("expected status {}, got {}", int(*expected), int(rep._status)),
                                retryable::no,
                                rep._status);
            co_return;
        }

        std::exception_ptr ex;
        try {
            co_await handle(rep, std::move(payload));
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            reply_error.emplace(gcs_error_type::MALFORMED_RESPONSE, seastar::format("cannot process response: {}", ex), retryable::no, rep._status);
        }
    };

    std::optional<lowres_clock::time_point> deadline;
    if (auto total = strategy.get_total_timeout()) {
        deadline = lowres_clock::now() + *total;
    }

    unsigned attempts = 0;
    while (true) {
        auto error = co_await do_attempt(req, handler, reply_error);
        ++attempts;
        if (!error) {
            if (attempts > 1) {
                gcsl.info("{} succeeded after {} attempts", operation, attempts);
            }
            co_return;
        }

        if (!strategy.should_retry(*error, attempts)) {
            gcsl.error("{} failed after {} attempt(s): {}", operation, attempts, *error);
            co_await coroutine::return_exception(gcs_exception(std::move(*error)));
        }

        auto delay = strategy.delay_before_retry(*error, attempts);
        if (deadline && lowres_clock::now() + delay > *deadline) {
            gcsl.error("{} ran out of time after {} attempt(s): {}", operation, attempts, *error);
            auto status = error->get_status();
            co_await coroutine::return_exception(gcs_exception(gcs_error(gcs_error_type::TIMEOUT,
                    seastar::format("total timeout exceeded after {} attempts, last error: {}", attempts, *error),
                    retryable::no,
                    status)));
        }

        gcsl.warn("{} attempt {}/{} failed, retrying in {}ms: {}", operation, attempts, strategy.get_max_attempts(), delay.count(), *error);
        co_await seastar::sleep(delay);
    }
}

future<> retryable_http_client::close() {
    return _http.close();
}

} // namespace gcs
