/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <stdexcept>
#include <vector>
#include <fmt/core.h>
#include "filesinks/record.hh"

namespace filesinks {

class buffer_overflow_error : public std::length_error {
public:
    explicit buffer_overflow_error(size_t capacity)
        : std::length_error(fmt::format("record buffer is full ({} records), sync before appending more", capacity)) {
    }
};

// Fixed capacity, insertion ordered
class record_buffer {
    std::vector<record> _records;
    size_t _capacity;

public:
    explicit record_buffer(size_t capacity)
        : _capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("record buffer capacity must be positive");
        }
        _records.reserve(capacity);
    }

    // Throws buffer_overflow_error when full, leaving r untouched
    void push(record&& r) {
        if (full()) {
            throw buffer_overflow_error(_capacity);
        }
        _records.push_back(std::move(r));
    }

    const std::vector<record>& records() const noexcept { return _records; }
    size_t size() const noexcept { return _records.size(); }
    size_t capacity() const noexcept { return _capacity; }
    bool empty() const noexcept { return _records.empty(); }
    bool full() const noexcept { return _records.size() >= _capacity; }

    void clear() noexcept { _records.clear(); }
};

} // namespace filesinks
