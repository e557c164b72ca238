/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace storagerouter::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/generate with deterministic sampling.
     * @return The model's response text, or nullopt on transport/HTTP/JSON failure.
     */
    std::optional<std::string> generate(const std::string& model,
                                        const std::string& system,
                                        const std::string& prompt,
                                        bool forceJson = false) const;

    /** @brief Fetches available models from /api/tags. */
    std::vector<std::string> getAvailableModels() const;

    const std::string& host() const { return m_host; }
    int port() const { return m_port; }

private:
    std::string m_host;
    int m_port;
};

} // namespace storagerouter::infrastructure
