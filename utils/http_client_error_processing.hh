/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// 500, 502, 503 and 504 mean the server is temporarily unable to serve the
// request. Everything else that is not 2xx is final.
retryable from_http_code(seastar::http::reply::status_type http_code);

// Connection level failures (refused, reset, broken pipe, timeouts) are
// transient, everything else is not.
retryable from_system_error(const std::system_error& system_error);

// Handles one exception type and produces R from it
template <typename Exc, typename F>
struct typed_handler {
    static_assert(std::is_base_of_v<std::exception, Exc>, "typed_handler can only handle std::exception types");
    using return_type = std::invoke_result_t<F, const Exc&>;

    F func;

    [[nodiscard]] const Exc* match(const std::exception& e) const noexcept { return dynamic_cast<const Exc*>(&e); }
};

template <typename Exc, typename F>
auto make_handler(F&& f) {
    return typed_handler<Exc, std::decay_t<F>>{std::forward<F>(f)};
}

// Walks the chain of nested exceptions held by eptr and returns the result of
// the first handler whose type matches. The default handler receives the
// innermost exception together with the message of the outermost one.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    static_assert(std::is_same_v<R, std::invoke_result_t<DefaultHandler, std::exception_ptr, std::string&&>>,
                  "Default handler must return R");
    static_assert((std::is_same_v<R, typename std::decay_t<Handlers>::return_type> && ...), "All handlers must return R");

    std::string outer_message;
    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            if (outer_message.empty()) {
                outer_message = e.what();
            }

            std::optional<R> result;
            auto try_one = [&] (auto& handler) {
                if (auto* matched = handler.match(e)) {
                    result.emplace(handler.func(*matched));
                    return true;
                }
                return false;
            };
            if ((try_one(handlers) || ...)) {
                return std::move(*result);
            }

            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                eptr = std::current_exception();
                continue;
            }
            return default_handler(eptr, std::move(outer_message));
        } catch (...) {
            return default_handler(eptr, std::move(outer_message));
        }
    }
    return default_handler(eptr, std::move(outer_message));
}

} // namespace utils::http
