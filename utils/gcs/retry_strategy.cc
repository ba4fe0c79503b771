/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "retry_strategy.hh"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std::chrono_literals;

namespace gcs {

exponential_retry_strategy::exponential_retry_strategy(unsigned max_attempts,
                                                       std::chrono::milliseconds initial_delay,
                                                       double multiplier,
                                                       std::chrono::milliseconds max_delay,
                                                       std::optional<std::chrono::milliseconds> total_timeout)
    : _max_attempts(max_attempts)
    , _initial_delay(initial_delay)
    , _multiplier(multiplier)
    , _max_delay(max_delay)
    , _total_timeout(total_timeout) {
    if (_max_attempts == 0) {
        throw std::invalid_argument("max_attempts must be at least 1");
    }
    if (_multiplier < 1.0) {
        throw std::invalid_argument("retry delay multiplier must not be below 1");
    }
}

retryable exponential_retry_strategy::should_retry(const gcs_error& error, unsigned attempts_made) const {
    if (attempts_made >= _max_attempts) {
        return retryable::no;
    }

    return error.is_retryable();
}

std::chrono::milliseconds exponential_retry_strategy::delay_before_retry(const gcs_error&, unsigned attempts_made) const {
    if (attempts_made == 0) {
        return 0ms;
    }

    auto delay = double(_initial_delay.count()) * std::pow(_multiplier, double(attempts_made - 1));
    if (delay >= double(_max_delay.count())) {
        return _max_delay;
    }
    return std::chrono::milliseconds(int64_t(delay));
}

} // namespace gcs
