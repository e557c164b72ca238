/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading router configuration (settings.json).
 *
 * Provides a unified way to access rule-set location, harness parameters and
 * extractor endpoints without scattering JSON parsing throughout the codebase.
 */

#pragma once

#include <string>

namespace storagerouter::infrastructure {

struct OllamaSettings {
    std::string host = "localhost";
    int port = 11434;
    std::string model = "qwen2.5:7b";
};

/**
 * @struct RouterConfig
 * @brief Every configurable knob with its default.
 */
struct RouterConfig {
    std::string rulesRoot = "data";
    std::string ruleSet = "storage-selection";
    std::string scope;                 ///< Per-user override scope; empty for the shared artifact.
    double accuracyThreshold = 0.95;
    int consistencyRuns = 3;
    int workers = 1;
    bool strictShadowing = false;
    std::string matchMode = "exact";
    std::string reportDir;             ///< When set, validate writes its JSON report here.
    OllamaSettings ollama;
};

class ConfigLoader {
public:
    /**
     * @brief Reads a settings file.
     * @param path Path to settings.json.
     * @return Defaults overlaid with the keys present in the file. A missing
     *         or malformed file yields the defaults.
     */
    static RouterConfig LoadFile(const std::string& path);

    /** @brief Reads settings.json from @p projectRoot. */
    static RouterConfig Load(const std::string& projectRoot);
};

} // namespace storagerouter::infrastructure
