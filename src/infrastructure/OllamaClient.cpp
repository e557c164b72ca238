/**
 * @file OllamaClient.cpp
 * @brief Implementation of OllamaClient.
 */

#include "infrastructure/OllamaClient.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>

namespace storagerouter::infrastructure {

using json = nlohmann::json;

namespace {

// Sampling pinned so that identical prompts yield identical classifications.
constexpr double kTemperature = 0.0;
constexpr double kTopP = 1.0;
constexpr int kSeed = 42;

constexpr int kGenerateReadTimeoutSeconds = 120;
constexpr int kTagsReadTimeoutSeconds = 5;
constexpr int kConnectTimeoutSeconds = 3;

/** @brief Parses a 200 response body; logs and returns nullopt for anything else. */
std::optional<json> JsonBody(const httplib::Result& res, const char* endpoint) {
    if (!res) {
        std::cerr << "[OllamaClient] " << endpoint << ": connection failed (httplib error "
                  << static_cast<int>(res.error()) << ")" << std::endl;
        return std::nullopt;
    }
    if (res->status != 200) {
        std::cerr << "[OllamaClient] " << endpoint << ": HTTP " << res->status << ": " << res->body << std::endl;
        return std::nullopt;
    }
    try {
        return json::parse(res->body);
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] " << endpoint << ": malformed body: " << e.what() << std::endl;
        return std::nullopt;
    }
}

} // namespace

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::string> OllamaClient::generate(const std::string& model,
                                                  const std::string& system,
                                                  const std::string& prompt,
                                                  bool forceJson) const {
    httplib::Client http(m_host, m_port);
    http.set_connection_timeout(kConnectTimeoutSeconds);
    http.set_read_timeout(kGenerateReadTimeoutSeconds);

    json payload;
    payload["model"] = model;
    payload["prompt"] = system + "\n\nRequest: \"" + prompt + "\"";
    payload["stream"] = false;
    payload["options"] = {{"temperature", kTemperature}, {"top_p", kTopP}, {"seed", kSeed}};
    if (forceJson) payload["format"] = "json";

    auto body = JsonBody(http.Post("/api/generate", payload.dump(), "application/json"), "/api/generate");
    if (!body) return std::nullopt;

    auto response = body->find("response");
    if (response == body->end() || !response->is_string()) {
        std::cerr << "[OllamaClient] /api/generate: reply carries no 'response' text." << std::endl;
        return std::nullopt;
    }
    return response->get<std::string>();
}

std::vector<std::string> OllamaClient::getAvailableModels() const {
    httplib::Client http(m_host, m_port);
    http.set_connection_timeout(kConnectTimeoutSeconds);
    http.set_read_timeout(kTagsReadTimeoutSeconds);

    std::vector<std::string> names;
    auto body = JsonBody(http.Get("/api/tags"), "/api/tags");
    if (!body || !body->contains("models") || !(*body)["models"].is_array()) {
        return names;
    }
    for (const auto& entry : (*body)["models"]) {
        if (entry.contains("name") && entry["name"].is_string()) {
            names.push_back(entry["name"].get<std::string>());
        }
    }
    return names;
}

} // namespace storagerouter::infrastructure
