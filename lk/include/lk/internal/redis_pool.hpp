/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#pragma once
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

namespace lk::internal {

struct ReplyDeleter {
    void operator()(redisReply* r) const { if (r) freeReplyObject(r); }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

/**
 * Fixed-size pool of blocking hiredis connections.
 * Each command borrows one connection for its duration; a broken connection
 * is closed and re-dialled on its next use. Thread-safe.
 */
class RedisPool {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional
        int         pool_size  = 8;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
    };

    explicit RedisPool(const Options& opt);
    ~RedisPool();

    RedisPool(const RedisPool&) = delete;
    RedisPool& operator=(const RedisPool&) = delete;

    // Run one command, arguments passed binary-safe (never interpolated).
    // Returns nullptr and fills err when no reply could be obtained.
    // Error replies (REDIS_REPLY_ERROR) are returned to the caller as-is.
    ReplyPtr command(const std::vector<std::string>& argv, std::string& err);

private:
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };

    Options                 _opt{};
    std::vector<RedisConn>  _pool;
    std::deque<std::size_t> _free;
    std::mutex              _pool_mtx;
    std::condition_variable _pool_cv;

    bool connect_one(std::size_t idx, std::string& err);
    void close_one(std::size_t idx);
    bool auth_and_select(::redisContext* ctx, std::string& err);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(RedisPool& p) : pool(p) {}
        ~Slot() { release(); }
        void acquire();
        void release();
        ::redisContext* ctx(std::string& err);   // ensure connected and return pointer
        void invalidate();
    private:
        RedisPool& pool;
        std::size_t idx = (std::size_t)-1;
        bool have = false;
    };
};

} // namespace lk::internal
