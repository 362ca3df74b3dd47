/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/redis_pool.hpp"
#include "lk/log.hpp"

#include <sys/time.h>

namespace lk::internal {

RedisPool::RedisPool(const Options& opt)
    : _opt(opt)
{
    if (_opt.pool_size <= 0) _opt.pool_size = 1;
    _pool.resize(static_cast<std::size_t>(_opt.pool_size));

    // Pre-connect all slots (best effort); failed slots are re-dialled on use.
    std::size_t up = 0;
    for (std::size_t i = 0; i < _pool.size(); ++i) {
        std::string err;
        if (connect_one(i, err)) ++up;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        for (std::size_t i = 0; i < _pool.size(); ++i) _free.push_back(i);
    }
    lk::log_line("[REDIS] pool ready: " + std::to_string(up) + "/" + std::to_string(_pool.size()) +
                 " connected host=" + _opt.host + ":" + std::to_string(_opt.port) +
                 " db=" + std::to_string(_opt.db));
}

RedisPool::~RedisPool() {
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
}

bool RedisPool::connect_one(std::size_t idx, std::string& err) {
    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            err = std::string("connect error: ") + ctx->errstr;
            redisFree(ctx);
        } else {
            err = "connect error: NULL context";
        }
        lk::log_line("[REDIS] " + err);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    if (redisSetTimeout(ctx, tv) != REDIS_OK) {
        lk::log_line("[REDIS] failed to set command timeout");
    }

    if (!auth_and_select(ctx, err)) {
        lk::log_line("[REDIS] " + err);
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool RedisPool::auth_and_select(::redisContext* ctx, std::string& err) {
    if (!_opt.password.empty()) {
        ReplyPtr r(static_cast<redisReply*>(redisCommand(ctx, "AUTH %s", _opt.password.c_str())));
        if (!r) {
            err = "AUTH failed: no reply";
            return false;
        }
        if (r->type == REDIS_REPLY_ERROR) {
            err = std::string("AUTH error: ") + (r->str ? r->str : "");
            return false;
        }
    }
    if (_opt.db != 0) {
        ReplyPtr r(static_cast<redisReply*>(redisCommand(ctx, "SELECT %d", _opt.db)));
        if (!r) {
            err = "SELECT failed: no reply";
            return false;
        }
        if (r->type == REDIS_REPLY_ERROR) {
            err = std::string("SELECT error: ") + (r->str ? r->str : "");
            return false;
        }
    }
    return true;
}

void RedisPool::close_one(std::size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

void RedisPool::Slot::acquire() {
    if (have) return;
    std::unique_lock<std::mutex> lk(pool._pool_mtx);
    pool._pool_cv.wait(lk, [&]{ return !pool._free.empty(); });
    idx = pool._free.front();
    pool._free.pop_front();
    have = true;
}

void RedisPool::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(pool._pool_mtx);
        pool._free.push_back(idx);
    }
    pool._pool_cv.notify_one();
    idx = (std::size_t)-1;
    have = false;
}

::redisContext* RedisPool::Slot::ctx(std::string& err) {
    // The slot is exclusively owned by this thread until release().
    auto& c = pool._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        pool.close_one(idx);
        if (!pool.connect_one(idx, err)) return nullptr;
    }
    return pool._pool[idx].ctx;
}

void RedisPool::Slot::invalidate() {
    if (have) pool.close_one(idx);
}

ReplyPtr RedisPool::command(const std::vector<std::string>& argv, std::string& err) {
    std::vector<const char*> args;
    std::vector<size_t> lens;
    args.reserve(argv.size());
    lens.reserve(argv.size());
    for (const auto& a : argv) {
        args.push_back(a.data());
        lens.push_back(a.size());
    }

    Slot slot(*this);
    slot.acquire();
    ::redisContext* c = slot.ctx(err);
    if (!c) return nullptr;

    ReplyPtr r(static_cast<redisReply*>(
        redisCommandArgv(c, static_cast<int>(args.size()), args.data(), lens.data())));
    if (!r) {
        err = std::string("command failed: ") + (c->errstr[0] ? c->errstr : "no reply");
        // Connection is unusable after an I/O error; next borrower re-dials.
        slot.invalidate();
        return nullptr;
    }
    return r;
}

} // namespace lk::internal
