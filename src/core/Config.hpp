#pragma once

/**
 * Config.hpp
 *
 * JSON settings for Tether, addressed with dot keys ("downloads.workers").
 * A file only needs the keys it overrides; everything else keeps the
 * built-in default.
 */

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace tether::core {

using json = nlohmann::json;

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Overlay a file onto the current values.
     * @return false if the file is absent, unreadable or not a JSON object;
     *         the current values are left untouched in that case
     */
    bool load(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        json overrides = json::parse(file, nullptr, false);
        if (overrides.is_discarded() || !overrides.is_object()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.merge_patch(overrides);
        m_path = path;
        return true;
    }

    /**
     * First-run helper: load the file if there is one, otherwise write
     * the current values there so the user has something to edit.
     */
    bool loadOrCreate(const std::filesystem::path& path) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            return load(path);
        }
        return save(path);
    }

    /**
     * Write all values, pretty-printed.
     * @param path Target file; empty means the file last loaded or saved
     */
    bool save(const std::filesystem::path& path = {}) {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto target = path.empty() ? m_path : path;
        if (target.empty()) {
            return false;
        }

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }

        std::ofstream file(target, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << m_values.dump(4) << '\n';
        if (!file.good()) {
            return false;
        }

        m_path = target;
        return true;
    }

    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_values = {
            {"version", "1.0.0"},
            {"downloads", {
                {"defaultDirectory", ""},
                {"workers", 4},
                {"connectTimeout", 10000},
                {"timeout", 0},
                {"userAgent", "Tether/1.0"},
                {"stateFile", ""}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""},
                {"maxFileSize", 10 * 1024 * 1024},
                {"maxFiles", 5}
            }}
        };
    }

    /**
     * @return The value at key, or fallback if it is missing or has
     *         another type
     */
    template<typename T>
    T get(const std::string& key, const T& fallback = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        const json* node = find(key);
        if (node == nullptr) {
            return fallback;
        }

        try {
            return node->get<T>();
        } catch (const json::exception&) {
            return fallback;
        }
    }

    /**
     * Intermediate objects are created as needed. A key that would pass
     * through a non-object value is ignored.
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        json* node = &m_values;
        size_t start = 0;
        while (true) {
            auto dot = key.find('.', start);
            auto part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

            if (!node->is_object() && !node->is_null()) {
                return;
            }
            node = &(*node)[part];

            if (dot == std::string::npos) break;
            start = dot + 1;
        }
        *node = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return find(key) != nullptr;
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values;
    }

    void merge(const json& overrides) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values.merge_patch(overrides);
    }

    /**
     * File last loaded or saved; empty before either happened
     */
    std::filesystem::path path() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_path;
    }

private:
    Config() { setDefaults(); }
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Caller holds m_mutex
    const json* find(const std::string& key) const {
        const json* node = &m_values;
        size_t start = 0;
        while (true) {
            auto dot = key.find('.', start);
            auto part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

            if (!node->is_object()) return nullptr;
            auto it = node->find(part);
            if (it == node->end()) return nullptr;
            node = &*it;

            if (dot == std::string::npos) return node;
            start = dot + 1;
        }
    }

private:
    mutable std::mutex m_mutex;
    json m_values;
    std::filesystem::path m_path;
};

} // namespace tether::core
