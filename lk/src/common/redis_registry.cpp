/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/redis_registry.hpp"
#include "lk/errors.hpp"

#include <unordered_set>
#include <vector>

namespace lk::internal {

namespace {

ReplyPtr run(RedisPool& pool, const std::vector<std::string>& argv) {
    std::string err;
    ReplyPtr r = pool.command(argv, err);
    if (!r) {
        throw RegistryError(argv[0] + " " + err);
    }
    if (r->type == REDIS_REPLY_ERROR) {
        throw RegistryError(argv[0] + " error: " + std::string(r->str ? r->str : ""));
    }
    return r;
}

std::string element_str(const redisReply* e) {
    if (e && (e->type == REDIS_REPLY_STRING || e->type == REDIS_REPLY_STATUS) && e->str) {
        return std::string(e->str, e->len);
    }
    return {};
}

// SSCAN cursor walk over one address index set.
class ScanQuery : public DeviceQuery {
public:
    ScanQuery(std::shared_ptr<RedisPool> pool, std::string set_key, int page_size)
        : _pool(std::move(pool)), _key(std::move(set_key)), _count(std::to_string(page_size)) {}

    bool has_more() const override { return !_done; }

    std::vector<std::string> next_page() override {
        std::vector<std::string> out;
        if (_done) return out;

        ReplyPtr r = run(*_pool, {"SSCAN", _key, _cursor, "COUNT", _count});
        if (r->type != REDIS_REPLY_ARRAY || r->elements != 2 ||
            r->element[1]->type != REDIS_REPLY_ARRAY) {
            throw RegistryError("SSCAN unexpected reply shape");
        }
        _cursor = element_str(r->element[0]);
        const redisReply* members = r->element[1];
        for (std::size_t i = 0; i < members->elements; ++i) {
            std::string id = element_str(members->element[i]);
            // SSCAN may hand out a member more than once
            if (!id.empty() && _seen.insert(id).second) out.push_back(std::move(id));
        }
        if (_cursor.empty() || _cursor == "0") _done = true;
        return out;
    }

private:
    std::shared_ptr<RedisPool> _pool;
    std::string _key;
    std::string _count;
    std::string _cursor = "0";
    bool _done = false;
    std::unordered_set<std::string> _seen;
};

} // namespace

RedisRegistry::RedisRegistry(std::shared_ptr<RedisPool> pool, std::string key_prefix,
                             int page_size)
    : _pool(std::move(pool)), _prefix(std::move(key_prefix)),
      _page_size(page_size > 0 ? page_size : 100)
{
    if (!_pool) throw RegistryError("redis pool is required");
}

std::optional<DeviceRecord> RedisRegistry::get_by_id(const std::string& dev_eui) {
    ReplyPtr r = run(*_pool, {"HMGET", device_key(dev_eui),
                              "primary_key", "desired_addr", "reported_addr"});
    if (r->type != REDIS_REPLY_ARRAY || r->elements != 3) {
        throw RegistryError("HMGET unexpected reply shape");
    }
    if (r->element[0]->type == REDIS_REPLY_NIL) {
        return std::nullopt; // unknown device
    }
    DeviceRecord rec;
    rec.dev_eui           = dev_eui;
    rec.primary_key       = element_str(r->element[0]);
    rec.desired_dev_addr  = element_str(r->element[1]);
    rec.reported_dev_addr = element_str(r->element[2]);
    return rec;
}

std::unique_ptr<DeviceQuery> RedisRegistry::query_by_address(const std::string& dev_addr) {
    return std::make_unique<ScanQuery>(_pool, address_key(dev_addr), _page_size);
}

} // namespace lk::internal
