#pragma once

#include "Result.h"

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace PeerDrop {

    /**
     * @brief key=value configuration store
     *
     * Lines are "key = value"; blank lines and lines starting with '#' are
     * ignored. Later files in loadLayered() override earlier ones.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        void loadFromString(const std::string& text, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;

        /// Runs each validator against its key (absent keys pass)
        Result<void> validate(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        static std::vector<std::pair<std::string, std::string>> parse(std::istream& in);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
