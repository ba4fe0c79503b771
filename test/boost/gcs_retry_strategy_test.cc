/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE gcs_retry_strategy

#include <boost/test/unit_test.hpp>
#include <seastar/core/timed_out_error.hh>
#include <seastar/http/exception.hh>
#include "utils/gcs/gcs_error.hh"
#include "utils/gcs/retry_strategy.hh"
#include "utils/http.hh"

using namespace std::chrono_literals;
using status = seastar::http::reply::status_type;

static gcs::gcs_error retriable_error() {
    return gcs::gcs_error::from_http_code(status::service_unavailable, "");
}

static gcs::gcs_error fatal_error() {
    return gcs::gcs_error::from_http_code(status::not_found, "");
}

BOOST_AUTO_TEST_CASE(test_status_classification) {
    for (auto s : {status::internal_server_error, status::bad_gateway, status::service_unavailable, status::gateway_timeout}) {
        BOOST_REQUIRE(utils::http::from_http_code(s));
    }
    for (auto s : {status::bad_request, status::unauthorized, status::forbidden, status::not_found, status::not_implemented,
                   status::conflict, status::method_not_allowed}) {
        BOOST_REQUIRE(!utils::http::from_http_code(s));
    }
}

BOOST_AUTO_TEST_CASE(test_system_error_classification) {
    BOOST_REQUIRE(utils::http::from_system_error(std::system_error(ECONNREFUSED, std::system_category())));
    BOOST_REQUIRE(utils::http::from_system_error(std::system_error(ECONNRESET, std::system_category())));
    BOOST_REQUIRE(utils::http::from_system_error(std::system_error(EPIPE, std::system_category())));
    BOOST_REQUIRE(!utils::http::from_system_error(std::system_error(EACCES, std::system_category())));
    BOOST_REQUIRE(!utils::http::from_system_error(std::system_error(ECONNREFUSED, std::generic_category())));
}

BOOST_AUTO_TEST_CASE(test_error_from_http_code) {
    auto e = gcs::gcs_error::from_http_code(status::not_found, R"({"error":{"code":404,"message":"No such object: b/o"}})");
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::HTTP_STATUS);
    BOOST_REQUIRE(!e.is_retryable());
    BOOST_REQUIRE(e.get_status() == status::not_found);
    BOOST_REQUIRE_EQUAL(e.get_message(), "No such object: b/o");

    auto plain = gcs::gcs_error::from_http_code(status::bad_gateway, "upstream went away");
    BOOST_REQUIRE(plain.is_retryable());
    BOOST_REQUIRE_EQUAL(plain.get_message(), "upstream went away");

    auto empty = gcs::gcs_error::from_http_code(status::service_unavailable, "");
    BOOST_REQUIRE_EQUAL(empty.get_message(), "HTTP status 503");
}

BOOST_AUTO_TEST_CASE(test_error_from_exception_ptr) {
    auto e = gcs::gcs_error::from_exception_ptr(std::make_exception_ptr(std::system_error(ECONNRESET, std::system_category())));
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::NETWORK_CONNECTION);
    BOOST_REQUIRE(e.is_retryable());

    e = gcs::gcs_error::from_exception_ptr(std::make_exception_ptr(seastar::timed_out_error()));
    BOOST_REQUIRE(e.is_retryable());

    e = gcs::gcs_error::from_exception_ptr(std::make_exception_ptr(seastar::httpd::unexpected_status_error(status::forbidden)));
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::UNEXPECTED_STATUS);
    BOOST_REQUIRE(!e.is_retryable());

    e = gcs::gcs_error::from_exception_ptr(std::make_exception_ptr(gcs::gcs_exception(retriable_error())));
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::HTTP_STATUS);
    BOOST_REQUIRE(e.is_retryable());

    e = gcs::gcs_error::from_exception_ptr(std::make_exception_ptr(std::runtime_error("boom")));
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::UNKNOWN);
    BOOST_REQUIRE(!e.is_retryable());
    BOOST_REQUIRE_EQUAL(e.get_message(), "boom");
}

BOOST_AUTO_TEST_CASE(test_nested_exception_is_unwrapped) {
    std::exception_ptr ex;
    try {
        try {
            throw std::system_error(ETIMEDOUT, std::system_category());
        } catch (...) {
            std::throw_with_nested(std::runtime_error("upload failed"));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    auto e = gcs::gcs_error::from_exception_ptr(ex);
    BOOST_REQUIRE(e.get_error_type() == gcs::gcs_error_type::NETWORK_CONNECTION);
    BOOST_REQUIRE(e.is_retryable());
}

BOOST_AUTO_TEST_CASE(test_exponential_backoff) {
    gcs::exponential_retry_strategy rs(5, 100ms, 2.0, 500ms);
    BOOST_REQUIRE_EQUAL(rs.get_max_attempts(), 5u);
    BOOST_REQUIRE(rs.delay_before_retry(retriable_error(), 1) == 100ms);
    BOOST_REQUIRE(rs.delay_before_retry(retriable_error(), 2) == 200ms);
    BOOST_REQUIRE(rs.delay_before_retry(retriable_error(), 3) == 400ms);
    // capped
    BOOST_REQUIRE(rs.delay_before_retry(retriable_error(), 4) == 500ms);
    BOOST_REQUIRE(rs.delay_before_retry(retriable_error(), 30) == 500ms);
}

BOOST_AUTO_TEST_CASE(test_retry_decision) {
    gcs::exponential_retry_strategy rs(3);
    BOOST_REQUIRE(rs.should_retry(retriable_error(), 1));
    BOOST_REQUIRE(rs.should_retry(retriable_error(), 2));
    BOOST_REQUIRE(!rs.should_retry(retriable_error(), 3));
    BOOST_REQUIRE(!rs.should_retry(fatal_error(), 1));
    BOOST_REQUIRE(!rs.get_total_timeout());

    gcs::no_retry_strategy none;
    BOOST_REQUIRE(!none.should_retry(retriable_error(), 1));
    BOOST_REQUIRE_EQUAL(none.get_max_attempts(), 1u);
}

BOOST_AUTO_TEST_CASE(test_invalid_strategy_parameters) {
    BOOST_REQUIRE_THROW(gcs::exponential_retry_strategy(0), std::invalid_argument);
    BOOST_REQUIRE_THROW(gcs::exponential_retry_strategy(3, 1s, 0.5), std::invalid_argument);
}
