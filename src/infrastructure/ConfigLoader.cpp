/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace storagerouter::infrastructure {

namespace {

template <typename T>
void Overlay(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j[key].get<T>();
    }
}

} // namespace

RouterConfig ConfigLoader::LoadFile(const std::string& path) {
    RouterConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;

        RouterConfig loaded;
        Overlay(j, "rules_root", loaded.rulesRoot);
        Overlay(j, "rule_set", loaded.ruleSet);
        Overlay(j, "scope", loaded.scope);
        Overlay(j, "accuracy_threshold", loaded.accuracyThreshold);
        Overlay(j, "consistency_runs", loaded.consistencyRuns);
        Overlay(j, "workers", loaded.workers);
        Overlay(j, "strict_shadowing", loaded.strictShadowing);
        Overlay(j, "match_mode", loaded.matchMode);
        Overlay(j, "report_dir", loaded.reportDir);
        if (j.contains("ollama") && j["ollama"].is_object()) {
            const auto& ollama = j["ollama"];
            Overlay(ollama, "host", loaded.ollama.host);
            Overlay(ollama, "port", loaded.ollama.port);
            Overlay(ollama, "model", loaded.ollama.model);
        }
        config = loaded;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ", using defaults: " << e.what() << std::endl;
    }

    return config;
}

RouterConfig ConfigLoader::Load(const std::string& projectRoot) {
    std::filesystem::path configPath = std::filesystem::path(projectRoot) / "settings.json";
    return LoadFile(configPath.string());
}

} // namespace storagerouter::infrastructure
