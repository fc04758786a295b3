#include "settings/Environment.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace accounts::settings {

namespace {

std::vector<std::string> splitKey(const std::string& key)
{
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

std::shared_ptr<Environment> Environment::fromCommandLine(int argc, char* argv[])
{
    auto env = std::make_shared<Environment>();

    if (argc > 1) {
        env->loadFile(argv[1]);
    } else if (std::filesystem::exists("config.json")) {
        env->loadFile("config.json");
    } else {
        std::cout << "[Environment] config.json not found, using defaults and env vars" << std::endl;
    }

    return env;
}

void Environment::loadFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json parsed = nlohmann::json::parse(file, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path);
    }

    config_ = std::move(parsed);
    std::cout << "[Environment] Loaded " << path << std::endl;
}

void Environment::set(const std::string& key, const nlohmann::json& value)
{
    nlohmann::json* node = &config_;
    for (const auto& part : splitKey(key)) {
        if (!node->is_object()) {
            *node = nlohmann::json::object();
        }
        node = &(*node)[part];
    }
    *node = value;
}

const nlohmann::json* Environment::lookup(const std::string& key) const
{
    const nlohmann::json* node = &config_;
    for (const auto& part : splitKey(key)) {
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
    }
    return node;
}

std::string Environment::getString(const std::string& key, const std::string& envVar,
                                   const std::string& defaultValue) const
{
    if (const char* value = std::getenv(envVar.c_str())) {
        return value;
    }

    const nlohmann::json* node = lookup(key);
    if (node == nullptr || node->is_null()) {
        return defaultValue;
    }
    if (node->is_string()) {
        return node->get<std::string>();
    }
    return node->dump();
}

int Environment::getInt(const std::string& key, const std::string& envVar, int defaultValue) const
{
    if (const char* value = std::getenv(envVar.c_str())) {
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == std::string(value).size()) {
                return parsed;
            }
        } catch (const std::exception&) {
            // ниже общий throw
        }
        throw std::runtime_error("Invalid integer in " + envVar + ": " + value);
    }

    const nlohmann::json* node = lookup(key);
    if (node == nullptr || node->is_null()) {
        return defaultValue;
    }
    if (!node->is_number_integer()) {
        throw std::runtime_error("Invalid integer in config key " + key + ": " + node->dump());
    }
    return node->get<int>();
}

} // namespace accounts::settings
