#include <peerlink/core/config.hpp>
#include <fstream>
#include <vector>

namespace peerlink::core {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto dot = key.find('.', start);
        parts.push_back(key.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

} // namespace

Config::Config(nlohmann::json root) : root_(std::move(root)) {}

Result<Config> Config::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return {ErrorCode::FileNotFound, "Failed to open config file: " + path.string()};
    }

    try {
        nlohmann::json json;
        file >> json;

        if (!json.is_object()) {
            return {ErrorCode::InvalidData, "Root configuration must be an object"};
        }
        return Config(std::move(json));
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config file: " + std::string(e.what())};
    }
}

Result<Config> Config::fromString(std::string_view data) {
    try {
        auto json = nlohmann::json::parse(data);

        if (!json.is_object()) {
            return {ErrorCode::InvalidData, "Root configuration must be an object"};
        }
        return Config(std::move(json));
    }
    catch (const nlohmann::json::exception& e) {
        return {ErrorCode::InvalidData, "Failed to parse config string: " + std::string(e.what())};
    }
}

Result<void> Config::saveToFile(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        return {ErrorCode::FileAccessDenied, "Failed to create config file: " + path.string()};
    }

    file << root_.dump(2);
    return {};
}

std::string Config::dump(int indent) const {
    return root_.dump(indent);
}

void Config::remove(const std::string& key) {
    auto parts = splitKey(key);
    nlohmann::json* node = &root_;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!node->is_object() || !node->contains(parts[i])) return;
        node = &(*node)[parts[i]];
    }
    if (node->is_object()) {
        node->erase(parts.back());
    }
}

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* node = &root_;
    for (const auto& part : splitKey(key)) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

nlohmann::json& Config::slot(const std::string& key) {
    nlohmann::json* node = &root_;
    for (const auto& part : splitKey(key)) {
        if (!node->is_object()) {
            *node = nlohmann::json::object();
        }
        node = &(*node)[part];
    }
    return *node;
}

} // namespace peerlink::core
