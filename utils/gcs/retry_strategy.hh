/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <optional>
#include "utils/gcs/gcs_error.hh"

namespace gcs {

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns yes if another attempt should be made given the error of the
    // last one and the number of attempts made so far (the failed one included).
    [[nodiscard]] virtual retryable should_retry(const gcs_error& error, unsigned attempts_made) const = 0;

    // How long to wait before the next attempt
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(const gcs_error& error, unsigned attempts_made) const = 0;

    [[nodiscard]] virtual unsigned get_max_attempts() const = 0;

    // Wall time budget of one operation, retries and backoff included
    [[nodiscard]] virtual std::optional<std::chrono::milliseconds> get_total_timeout() const { return std::nullopt; }
};

// Retries retriable errors up to max_attempts, waiting
// initial_delay * multiplier^(attempt - 1), capped at max_delay, in between.
class exponential_retry_strategy : public retry_strategy {
    unsigned _max_attempts;
    std::chrono::milliseconds _initial_delay;
    double _multiplier;
    std::chrono::milliseconds _max_delay;
    std::optional<std::chrono::milliseconds> _total_timeout;

public:
    explicit exponential_retry_strategy(unsigned max_attempts = 10,
                                        std::chrono::milliseconds initial_delay = std::chrono::seconds(1),
                                        double multiplier = 2.0,
                                        std::chrono::milliseconds max_delay = std::chrono::seconds(64),
                                        std::optional<std::chrono::milliseconds> total_timeout = std::nullopt);

    [[nodiscard]] retryable should_retry(const gcs_error& error, unsigned attempts_made) const override;

    [[nodiscard]] std::chrono::milliseconds delay_before_retry(const gcs_error& error, unsigned attempts_made) const override;

    [[nodiscard]] unsigned get_max_attempts() const override { return _max_attempts; }

    [[nodiscard]] std::optional<std::chrono::milliseconds> get_total_timeout() const override { return _total_timeout; }
};

// One attempt, whatever happens. Used for the startup bucket check.
class no_retry_strategy final : public retry_strategy {
public:
    [[nodiscard]] retryable should_retry(const gcs_error&, unsigned) const override { return retryable::no; }
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(const gcs_error&, unsigned) const override { return std::chrono::milliseconds(0); }
    [[nodiscard]] unsigned get_max_attempts() const override { return 1; }
};

} // namespace gcs
