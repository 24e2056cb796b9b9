#pragma once

#include "../logging/async_logger.hpp"

#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace rolldesk {
namespace account {

using json = nlohmann::json;

/**
 * AliasStore - account id -> alias, persisted as one JSON object
 *
 *   { "U1234567": "Main", "U7654321": "IRA" }
 *
 * save() merges with what is already on disk so aliases of accounts missing
 * from the current batch survive. Read and write failures are logged and
 * never thrown; a missing file reads as empty.
 */
class AliasStore {
public:
    AliasStore(std::string path, logging::AsyncLogger& logger) : path_(std::move(path)), logger_(logger) {}

    std::map<std::string, std::string> load() const {
        std::map<std::string, std::string> aliases;
        std::ifstream in(path_);
        if (!in) return aliases;

        std::stringstream buffer;
        buffer << in.rdbuf();
        try {
            json data = json::parse(buffer.str());
            if (!data.is_object()) {
                LOGF_ERROR(logger_, Accounts, "alias store %s is not a JSON object", path_.c_str());
                return aliases;
            }
            for (auto it = data.begin(); it != data.end(); ++it) {
                if (it.value().is_string()) {
                    aliases[it.key()] = it.value().get<std::string>();
                }
            }
            LOGF_INFO(logger_, Accounts, "loaded %zu cached aliases", aliases.size());
        } catch (const json::exception& e) {
            LOGF_ERROR(logger_, Accounts, "error reading alias store %s: %s", path_.c_str(), e.what());
        }
        return aliases;
    }

    bool save(const std::map<std::string, std::string>& aliases) const {
        auto merged = load();
        for (const auto& [id, alias] : aliases) {
            merged[id] = alias;
        }

        json data = json::object();
        for (const auto& [id, alias] : merged) {
            data[id] = alias;
        }

        std::ofstream out(path_, std::ios::trunc);
        if (!out) {
            LOGF_ERROR(logger_, Accounts, "error writing alias store %s", path_.c_str());
            return false;
        }
        out << data.dump(2);
        if (!out) {
            LOGF_ERROR(logger_, Accounts, "error writing alias store %s", path_.c_str());
            return false;
        }
        LOGF_INFO(logger_, Accounts, "saved aliases: %zu accounts", merged.size());
        return true;
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
    logging::AsyncLogger& logger_;
};

/**
 * AccountAliasCache - in-memory alias map for the current gateway session
 *
 * Identity-scoped: cleared on gateway disconnect, because the next session
 * may be logged into a different set of accounts. Market-data caches are
 * deliberately not cleared there.
 */
class AccountAliasCache {
public:
    std::optional<std::string> get(const std::string& account_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = aliases_.find(account_id);
        if (it == aliases_.end()) return std::nullopt;
        return it->second;
    }

    /// Known aliases for the given ids; unknown ids are left out
    std::map<std::string, std::string> get_many(const std::vector<std::string>& account_ids) const {
        std::map<std::string, std::string> out;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& id : account_ids) {
            auto it = aliases_.find(id);
            if (it != aliases_.end()) out.emplace(id, it->second);
        }
        return out;
    }

    std::map<std::string, std::string> get_all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aliases_;
    }

    /// Empty aliases are ignored
    void set(const std::string& account_id, const std::string& alias) {
        if (alias.empty()) return;
        std::lock_guard<std::mutex> lock(mutex_);
        aliases_[account_id] = alias;
    }

    void set_many(const std::map<std::string, std::string>& aliases) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, alias] : aliases) {
            if (!alias.empty()) aliases_[id] = alias;
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        aliases_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return aliases_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> aliases_;
};

}  // namespace account
}  // namespace rolldesk
