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

#include "manifest.h"
#include "config.h"
#include "platform_fs.h"
#include "../errors.h"
#include "../util/log.h"
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/error/en.h"
#include <filesystem>
#include <cstdio>
#include <cstdlib>

namespace dfstate {
namespace persist {

Manifest::Manifest(const std::string& data_dir)
    : data_dir_(data_dir), version_(manifest::kVersion) {
    created_unix_ = std::time(nullptr);
}

std::string Manifest::get_manifest_path() const {
    std::filesystem::path p(data_dir_);
    p /= files::kManifestFile;
    return p.string();
}

bool Manifest::load() {
    std::string manifest_path = get_manifest_path();
    if (!PlatformFS::exists(manifest_path)) {
        return false;
    }

    std::string json_str;
    FSResult r = PlatformFS::read_file(manifest_path, &json_str);
    if (!r.ok) {
        throw StorageIOError("failed to read manifest", manifest_path, r.err);
    }
    if (json_str.empty()) {
        throw RecoveryInconsistency("manifest is empty", manifest_path);
    }

    from_json(json_str);
    return true;
}

void Manifest::store() {
    FSResult r = PlatformFS::ensure_directory(data_dir_);
    if (!r.ok) {
        throw StorageIOError("failed to create node directory", data_dir_, r.err);
    }

    std::string manifest_path = get_manifest_path();
    r = PlatformFS::write_file_durable(manifest_path, to_json());
    if (!r.ok) {
        throw StorageIOError("failed to store manifest", manifest_path, r.err);
    }
}

std::string Manifest::to_json() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();

    writer.Key("version");
    writer.Uint(version_);

    writer.Key("created_unix");
    writer.Int64(created_unix_);

    writer.Key("arity");
    writer.Uint64(arity_);

    writer.Key("indices");
    writer.StartArray();
    for (const auto& idx : indices_) {
        writer.StartObject();
        writer.Key("id");
        writer.Uint(idx.id);
        writer.Key("columns");
        writer.StartArray();
        for (size_t c : idx.columns) {
            writer.Uint64(c);
        }
        writer.EndArray();
        writer.Key("unique");
        writer.Bool(idx.unique);
        writer.Key("mode");
        writer.String(to_string(idx.mode));
        writer.Key("type");
        writer.String(to_string(idx.type));
        writer.Key("primary");
        writer.Bool(idx.primary);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("snapshot");
    writer.StartObject();
    if (has_snapshot()) {
        writer.Key("path");
        writer.String(snapshot_.path.c_str());
        writer.Key("covered_seq");
        writer.Uint64(snapshot_.covered_seq);
        writer.Key("records");
        writer.Uint64(snapshot_.records);
        writer.Key("size");
        writer.Uint64(snapshot_.size);
        writer.Key("crc32c");
        char hex_buf[16];
        snprintf(hex_buf, sizeof(hex_buf), "0x%08x", snapshot_.crc32c);
        writer.String(hex_buf);
    }
    writer.EndObject();

    writer.Key("logs");
    writer.StartArray();
    for (const auto& log : logs_) {
        writer.StartObject();
        writer.Key("path");
        writer.String(log.path.c_str());
        writer.Key("seq");
        writer.Uint64(log.seq);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

void Manifest::from_json(const std::string& json_str) {
    const std::string path = get_manifest_path();

    rapidjson::Document doc;
    doc.Parse(json_str.c_str());

    if (doc.HasParseError()) {
        error() << "JSON parse error at offset " << doc.GetErrorOffset()
                << ": " << rapidjson::GetParseError_En(doc.GetParseError());
        throw RecoveryInconsistency("manifest is not valid JSON", path);
    }
    if (!doc.IsObject()) {
        throw RecoveryInconsistency("manifest is not a JSON object", path);
    }

    if (doc.HasMember("version") && doc["version"].IsUint()) {
        version_ = doc["version"].GetUint();
    }
    if (version_ != manifest::kVersion) {
        throw RecoveryInconsistency("unsupported manifest version " + std::to_string(version_), path);
    }

    if (doc.HasMember("created_unix") && doc["created_unix"].IsInt64()) {
        created_unix_ = doc["created_unix"].GetInt64();
    }

    if (!doc.HasMember("arity") || !doc["arity"].IsUint64()) {
        throw RecoveryInconsistency("manifest has no arity", path);
    }
    arity_ = doc["arity"].GetUint64();

    indices_.clear();
    if (!doc.HasMember("indices") || !doc["indices"].IsArray()) {
        throw RecoveryInconsistency("manifest has no index schema", path);
    }
    const auto& indices = doc["indices"];
    for (rapidjson::SizeType i = 0; i < indices.Size(); i++) {
        const auto& obj = indices[i];
        if (!obj.IsObject() || !obj.HasMember("id") || !obj["id"].IsUint() ||
            !obj.HasMember("columns") || !obj["columns"].IsArray()) {
            throw RecoveryInconsistency("manifest index entry is malformed", path);
        }
        Index idx;
        idx.id = obj["id"].GetUint();
        const auto& cols = obj["columns"];
        for (rapidjson::SizeType j = 0; j < cols.Size(); j++) {
            if (!cols[j].IsUint64()) {
                throw RecoveryInconsistency("manifest index column is malformed", path);
            }
            idx.columns.push_back(cols[j].GetUint64());
        }
        if (obj.HasMember("unique") && obj["unique"].IsBool()) {
            idx.unique = obj["unique"].GetBool();
        }
        if (obj.HasMember("mode") && obj["mode"].IsString()) {
            idx.mode = std::string(obj["mode"].GetString()) == "partial"
                           ? Materialization::Partial : Materialization::Full;
        }
        if (obj.HasMember("type") && obj["type"].IsString()) {
            idx.type = std::string(obj["type"].GetString()) == "btree"
                           ? IndexType::BTree : IndexType::Hash;
        }
        if (obj.HasMember("primary") && obj["primary"].IsBool()) {
            idx.primary = obj["primary"].GetBool();
        }
        indices_.push_back(idx);
    }

    snapshot_ = {};
    if (doc.HasMember("snapshot") && doc["snapshot"].IsObject()) {
        const auto& snap = doc["snapshot"];
        if (snap.HasMember("path") && snap["path"].IsString()) {
            snapshot_.path = snap["path"].GetString();
        }
        if (snap.HasMember("covered_seq") && snap["covered_seq"].IsUint64()) {
            snapshot_.covered_seq = snap["covered_seq"].GetUint64();
        }
        if (snap.HasMember("records") && snap["records"].IsUint64()) {
            snapshot_.records = snap["records"].GetUint64();
        }
        if (snap.HasMember("size") && snap["size"].IsUint64()) {
            snapshot_.size = snap["size"].GetUint64();
        }
        if (snap.HasMember("crc32c") && snap["crc32c"].IsString()) {
            snapshot_.crc32c = static_cast<uint32_t>(
                std::strtoul(snap["crc32c"].GetString(), nullptr, 16));
        }
    }

    logs_.clear();
    if (doc.HasMember("logs") && doc["logs"].IsArray()) {
        const auto& logs = doc["logs"];
        for (rapidjson::SizeType i = 0; i < logs.Size(); i++) {
            if (!logs[i].IsObject()) continue;

            const auto& log_obj = logs[i];
            LogInfo log;
            if (log_obj.HasMember("path") && log_obj["path"].IsString()) {
                log.path = log_obj["path"].GetString();
            }
            if (log_obj.HasMember("seq") && log_obj["seq"].IsUint64()) {
                log.seq = log_obj["seq"].GetUint64();
            }
            if (log.path.empty()) {
                throw RecoveryInconsistency("manifest log entry has no path", path);
            }
            logs_.push_back(log);
        }
    }
}

} // namespace persist
} // namespace dfstate
