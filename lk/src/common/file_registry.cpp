/*
 * Part of the LoRaKeys (LK) project.
 *
 * SPDX-FileCopyrightText: 2025 LoRaKeys contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of LoRaKeys (LK). See LICENSE for details.
 */

#include "lk/internal/file_registry.hpp"
#include "lk/internal/utils.hpp"
#include "lk/log.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace lk::internal {

namespace {

// Pages over a snapshot of matching ids taken when the query was issued.
class SnapshotQuery : public DeviceQuery {
public:
    SnapshotQuery(std::vector<std::string> ids, std::size_t page_size)
        : _ids(std::move(ids)), _page(page_size == 0 ? 1 : page_size) {}

    bool has_more() const override { return _pos < _ids.size(); }

    std::vector<std::string> next_page() override {
        std::vector<std::string> out;
        const std::size_t end = std::min(_ids.size(), _pos + _page);
        for (; _pos < end; ++_pos) out.push_back(_ids[_pos]);
        return out;
    }

private:
    std::vector<std::string> _ids;
    std::size_t _page;
    std::size_t _pos = 0;
};

} // namespace

FileRegistry::FileRegistry(std::size_t page_size)
    : _page_size(page_size)
{}

bool FileRegistry::init_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        log_line("[REGISTRY] failed to open devices file: " + path);
        return false;
    }
    return init_stream(in, path);
}

bool FileRegistry::init_stream(std::istream& in, const std::string& source) {
    std::map<std::string, DeviceRecord> tmp;
    std::size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        DeviceRecord rec;
        if (!(iss >> rec.dev_eui >> rec.primary_key)) {
            log_line("[REGISTRY] " + source + ": bad line " + std::to_string(line_no));
            return false;
        }
        for (std::string attr; iss >> attr; ) {
            const std::size_t eq = attr.find('=');
            const std::string name = eq == std::string::npos ? attr : attr.substr(0, eq);
            const std::string value = eq == std::string::npos ? std::string() : attr.substr(eq + 1);
            if (name == "desired" && is_hex_string(value)) {
                rec.desired_dev_addr = value;
            } else if (name == "reported" && is_hex_string(value)) {
                rec.reported_dev_addr = value;
            } else {
                log_line("[REGISTRY] " + source + ": bad attribute '" + name +
                         "' at line " + std::to_string(line_no));
                return false;
            }
        }
        if (tmp.count(rec.dev_eui)) {
            log_line("[REGISTRY] " + source + ": duplicate DevEUI at line " + std::to_string(line_no));
            return false;
        }
        std::string eui = rec.dev_eui;
        tmp.emplace(std::move(eui), std::move(rec));
    }

    std::size_t n = 0;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        _devices.swap(tmp);
        n = _devices.size();
    }
    log_line("[REGISTRY] file backend initialized: " + std::to_string(n) + " devices");
    return true;
}

std::optional<DeviceRecord> FileRegistry::get_by_id(const std::string& dev_eui) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _devices.find(dev_eui);
    if (it == _devices.end()) return std::nullopt;
    return it->second;
}

std::unique_ptr<DeviceQuery> FileRegistry::query_by_address(const std::string& dev_addr) {
    std::vector<std::string> ids;
    if (!dev_addr.empty()) {
        std::lock_guard<std::mutex> lk(_mtx);
        for (const auto& kv : _devices) {
            const DeviceRecord& d = kv.second;
            if (d.desired_dev_addr == dev_addr || d.reported_dev_addr == dev_addr) {
                ids.push_back(kv.first);
            }
        }
    }
    return std::make_unique<SnapshotQuery>(std::move(ids), _page_size);
}

std::size_t FileRegistry::size() {
    std::lock_guard<std::mutex> lk(_mtx);
    return _devices.size();
}

} // namespace lk::internal
