/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include "store_config.h"
#include "errors.h"
#include "persistence/platform_fs.h"
#include "util/log.h"
#include "util/logmanager.h"
#include <cstdlib>
#include <stdexcept>

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"

namespace dfstate {

uint64_t parse_byte_size(const std::string& text) {
    uint64_t multiplier = 1;
    std::string num = text;

    if (text.size() >= 2) {
        std::string suffix = text.substr(text.size() - 2);
        if (suffix == "KB" || suffix == "kb") {
            multiplier = 1024ULL;
            num = text.substr(0, text.size() - 2);
        } else if (suffix == "MB" || suffix == "mb") {
            multiplier = 1024ULL * 1024;
            num = text.substr(0, text.size() - 2);
        } else if (suffix == "GB" || suffix == "gb") {
            multiplier = 1024ULL * 1024 * 1024;
            num = text.substr(0, text.size() - 2);
        }
    }

    if (num.empty() || num.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("bad byte size '" + text + "'");
    }
    return std::stoull(num) * multiplier;
}

StoreConfig StoreConfig::defaults() {
    StoreConfig cfg;
    cfg.apply_env();
    return cfg;
}

StoreConfig StoreConfig::load_file(const std::string& path) {
    std::string json;
    persist::FSResult r = persist::PlatformFS::read_file(path, &json);
    if (!r.ok) {
        throw StorageIOError("failed to read store config", path, r.err);
    }
    StoreConfig cfg;
    cfg.merge_json(json);
    cfg.apply_env();
    cfg.validate();
    return cfg;
}

void StoreConfig::merge_json(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
        throw std::invalid_argument(std::string("store config is not valid JSON at offset ") +
                                    std::to_string(doc.GetErrorOffset()) + ": " +
                                    rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw std::invalid_argument("store config is not a JSON object");
    }

    if (doc.HasMember("memory_limit_bytes")) {
        const auto& v = doc["memory_limit_bytes"];
        if (v.IsUint64()) {
            memory_limit_bytes = v.GetUint64();
        } else if (v.IsString()) {
            memory_limit_bytes = parse_byte_size(v.GetString());
        } else {
            throw std::invalid_argument("memory_limit_bytes must be a number or a size string");
        }
    }
    if (doc.HasMember("eviction_interval_ms")) {
        if (!doc["eviction_interval_ms"].IsUint64()) {
            throw std::invalid_argument("eviction_interval_ms must be a non-negative integer");
        }
        eviction_interval_ms = doc["eviction_interval_ms"].GetUint64();
    }
    if (doc.HasMember("eviction_batch_keys")) {
        if (!doc["eviction_batch_keys"].IsUint64()) {
            throw std::invalid_argument("eviction_batch_keys must be a non-negative integer");
        }
        eviction_batch_keys = doc["eviction_batch_keys"].GetUint64();
    }
    if (doc.HasMember("eviction_policy")) {
        if (!doc["eviction_policy"].IsString()) {
            throw std::invalid_argument("eviction_policy must be a string");
        }
        eviction_policy = doc["eviction_policy"].GetString();
    }
    if (doc.HasMember("log_level")) {
        if (!doc["log_level"].IsString()) {
            throw std::invalid_argument("log_level must be a string");
        }
        log_level = doc["log_level"].GetString();
    }
    if (doc.HasMember("log_dir")) {
        if (!doc["log_dir"].IsString()) {
            throw std::invalid_argument("log_dir must be a string");
        }
        log_dir = doc["log_dir"].GetString();
    }
    if (doc.HasMember("sync_on_commit")) {
        if (!doc["sync_on_commit"].IsBool()) {
            throw std::invalid_argument("sync_on_commit must be a boolean");
        }
        sync_on_commit = doc["sync_on_commit"].GetBool();
    }
    if (doc.HasMember("wal_rotate_bytes")) {
        const auto& v = doc["wal_rotate_bytes"];
        if (v.IsUint64()) {
            wal_rotate_bytes = v.GetUint64();
        } else if (v.IsString()) {
            wal_rotate_bytes = parse_byte_size(v.GetString());
        } else {
            throw std::invalid_argument("wal_rotate_bytes must be a number or a size string");
        }
    }
    if (doc.HasMember("verify_on_open")) {
        if (!doc["verify_on_open"].IsBool()) {
            throw std::invalid_argument("verify_on_open must be a boolean");
        }
        verify_on_open = doc["verify_on_open"].GetBool();
    }
}

void StoreConfig::apply_env() {
    if (const char* env = std::getenv("DFSTATE_MEMORY_BUDGET")) {
        try {
            memory_limit_bytes = parse_byte_size(env);
        } catch (const std::invalid_argument& e) {
            warning() << "ignoring DFSTATE_MEMORY_BUDGET: " << e.what();
        }
    }

    if (const char* env = std::getenv("DFSTATE_EVICTION_INTERVAL_MS")) {
        std::string s(env);
        if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos) {
            eviction_interval_ms = std::stoull(s);
        } else {
            warning() << "ignoring DFSTATE_EVICTION_INTERVAL_MS '" << s << "'";
        }
    }

    if (const char* env = std::getenv("DFSTATE_LOG_LEVEL")) {
        log_level = env;
    }
}

void StoreConfig::validate() const {
    if (eviction_policy != "largest_node" && eviction_policy != "oldest_key") {
        throw std::invalid_argument("unknown eviction_policy '" + eviction_policy + "'");
    }
    if (eviction_interval_ms == 0) {
        throw std::invalid_argument("eviction_interval_ms must be positive");
    }
    if (eviction_batch_keys == 0) {
        throw std::invalid_argument("eviction_batch_keys must be positive");
    }
    if (wal_rotate_bytes < persist::batch_log::kFrameHeaderSize) {
        throw std::invalid_argument("wal_rotate_bytes is smaller than one frame header");
    }
}

void StoreConfig::apply_logging() const {
    if (log_level.empty()) {
        return;
    }
    if (!setLogLevelFromString(log_level)) {
        warning() << "unknown log level '" << log_level
                  << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE";
    }
}

std::unique_ptr<LogManager> StoreConfig::start_logging() const {
    apply_logging();
    if (log_dir.empty()) {
        return nullptr;
    }
    auto manager = std::make_unique<LogManager>(log_dir);
    info() << "logging to " << manager->path();
    return manager;
}

persist::PersistenceParameters StoreConfig::persistence(const std::string& db_dir,
                                                        const std::string& db_name,
                                                        persist::DurabilityMode mode) const {
    persist::PersistenceParameters p;
    p.mode = mode;
    p.db_dir = db_dir;
    p.db_name = db_name;
    p.sync_on_commit = sync_on_commit;
    p.wal_rotate_bytes = wal_rotate_bytes;
    p.verify_on_open = verify_on_open;
    return p;
}

bool StoreConfig::operator==(const StoreConfig& o) const {
    return memory_limit_bytes == o.memory_limit_bytes &&
           eviction_interval_ms == o.eviction_interval_ms &&
           eviction_batch_keys == o.eviction_batch_keys &&
           eviction_policy == o.eviction_policy &&
           log_level == o.log_level &&
           log_dir == o.log_dir &&
           sync_on_commit == o.sync_on_commit &&
           wal_rotate_bytes == o.wal_rotate_bytes &&
           verify_on_open == o.verify_on_open;
}

} // namespace dfstate
