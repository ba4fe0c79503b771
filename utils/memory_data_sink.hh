/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <vector>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/util/backtrace.hh>

class memory_data_sink_buffers {
    std::vector<seastar::temporary_buffer<char>> _bufs;
    size_t _size = 0;

public:
    size_t size() const { return _size; }
    std::vector<seastar::temporary_buffer<char>>& buffers() { return _bufs; }

    void put(seastar::temporary_buffer<char>&& buf) {
        _size += buf.size();
        _bufs.emplace_back(std::move(buf));
    }

    void clear() {
        _bufs.clear();
        _size = 0;
    }

    std::string linearize() const {
        std::string ret;
        ret.reserve(_size);
        for (const auto& buf : _bufs) {
            ret.append(buf.get(), buf.size());
        }
        return ret;
    }
};

class memory_data_sink : public seastar::data_sink_impl {
    memory_data_sink_buffers& _bufs;

public:
    explicit memory_data_sink(memory_data_sink_buffers& b) : _bufs(b) {}

    virtual seastar::future<> put(seastar::net::packet data) override {
        seastar::throw_with_backtrace<std::runtime_error>("memory_data_sink put(net::packet) unsupported");
    }
    virtual seastar::future<> put(seastar::temporary_buffer<char> buf) override {
        _bufs.put(std::move(buf));
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> flush() override {
        return seastar::make_ready_future<>();
    }
    virtual seastar::future<> close() override {
        return seastar::make_ready_future<>();
    }
};
