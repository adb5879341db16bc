#pragma once

#include <string>
#include <string_view>
#include <filesystem>

#include <nlohmann/json.hpp>

#include <peerlink/core/error.hpp>

namespace peerlink::core {

// JSON backed configuration document. Keys may address nested objects with
// dots, e.g. "video.codec".
class Config {
public:
    Config() : root_(nlohmann::json::object()) {}
    explicit Config(nlohmann::json root);

    // Load dari file atau string
    static Result<Config> fromFile(const std::filesystem::path& path);
    static Result<Config> fromString(std::string_view data);

    Result<void> saveToFile(const std::filesystem::path& path) const;
    std::string dump(int indent = 2) const;

    template<typename T>
    Result<T> get(const std::string& key) const {
        const nlohmann::json* node = find(key);
        if (!node) {
            return {ErrorCode::InvalidArgument, "Configuration key not found: " + key};
        }

        try {
            return node->get<T>();
        }
        catch (const nlohmann::json::exception&) {
            return {ErrorCode::InvalidData, "Invalid type for key: " + key};
        }
    }

    template<typename T>
    T getOr(const std::string& key, T fallback) const {
        auto result = get<T>(key);
        return result ? std::move(result).value() : std::move(fallback);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        slot(key) = std::forward<T>(value);
    }

    bool has(const std::string& key) const { return find(key) != nullptr; }
    void remove(const std::string& key);

    const nlohmann::json& root() const { return root_; }

private:
    const nlohmann::json* find(const std::string& key) const;
    nlohmann::json& slot(const std::string& key);

    nlohmann::json root_;
};

} // namespace peerlink::core
