/**
 * @file OllamaCriteriaExtractor.cpp
 * @brief Implementation of OllamaCriteriaExtractor.
 */

#include "infrastructure/OllamaCriteriaExtractor.hpp"
#include "domain/DecisionErrors.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace storagerouter::infrastructure {

using json = nlohmann::json;
using namespace storagerouter::domain;

namespace {

const std::string kSystemPrompt = R"PROMPT(You are a storage classification expert. Extract storage decision metrics from the request.

METRICS (5 total):

1. storage_intent: Where should this data be stored long-term?
   - "memory": user preferences, personal facts, settings (key-value, fast access)
   - "database": structured data requiring CRUD operations
   - "file": static content, reports, exports, archives
   - "vector": content needing semantic/similarity search

2. access_pattern: How will the data be used?
   - "crud": create, read, update, delete
   - "query": joins, aggregations, window functions, pivots
   - "search": find content by keywords or similarity
   - "filter": filter, sort, limit (top N, greater than X)

3. analytic_intent: Will the data be aggregated or analysed? true or false.

4. data_type: "structured" (records with a schema), "numeric" (measurements, counts),
   "text" (documents, notes, logs) or "binary" (images, media, attachments).

5. search_intensity: How often will the content be searched?
   - "none": never (archives, backups, logs)
   - "low": occasionally
   - "high": it is the primary way to find the data

EXAMPLES:

"Track my daily expenses"
{"storage_intent": "database", "access_pattern": "crud", "analytic_intent": false, "data_type": "structured", "search_intensity": "none"}

"Analyze monthly spending trends"
{"storage_intent": "database", "access_pattern": "query", "analytic_intent": true, "data_type": "structured", "search_intensity": "none"}

"Find documentation about APIs"
{"storage_intent": "vector", "access_pattern": "search", "analytic_intent": false, "data_type": "text", "search_intensity": "high"}

"Save my meeting notes"
{"storage_intent": "file", "access_pattern": "crud", "analytic_intent": false, "data_type": "text", "search_intensity": "low"}

"Archive old chat logs"
{"storage_intent": "file", "access_pattern": "crud", "analytic_intent": false, "data_type": "text", "search_intensity": "none"}

"Join sales and expenses"
{"storage_intent": "database", "access_pattern": "query", "analytic_intent": true, "data_type": "structured", "search_intensity": "none"}

"Track expenses and analyze trends"
{"storage_intent": "database", "access_pattern": "crud", "analytic_intent": true, "data_type": "structured", "search_intensity": "none"}

Return ONLY a JSON object with exactly these five keys, no markdown and no explanation.)PROMPT";

std::string StripCodeFence(const std::string& raw) {
    const std::string fence = "```";
    const auto open = raw.find(fence);
    if (open == std::string::npos) return raw;

    auto bodyStart = raw.find('\n', open);
    if (bodyStart == std::string::npos) return raw;
    ++bodyStart;
    const auto close = raw.find(fence, bodyStart);
    return raw.substr(bodyStart, close == std::string::npos ? std::string::npos : close - bodyStart);
}

} // namespace

OllamaCriteriaExtractor::OllamaCriteriaExtractor(OllamaClient client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

const std::string& OllamaCriteriaExtractor::SystemPrompt() {
    return kSystemPrompt;
}

std::string OllamaCriteriaExtractor::name() const {
    return "ollama:" + m_model;
}

bool OllamaCriteriaExtractor::modelAvailable() const {
    const auto models = m_client.getAvailableModels();
    return std::find(models.begin(), models.end(), m_model) != models.end();
}

Criteria OllamaCriteriaExtractor::ParseResponse(const std::string& request, const std::string& raw) {
    json document;
    try {
        document = json::parse(StripCodeFence(raw));
    } catch (const json::exception& e) {
        throw ParseError(request, std::string("model output is not JSON: ") + e.what());
    }
    try {
        return ParseCriteria(document);
    } catch (const SchemaError& e) {
        throw ParseError(request, std::string("model output violates the criteria schema: ") + e.what());
    }
}

Criteria OllamaCriteriaExtractor::extract(const std::string& request) {
    if (request.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ParseError(request, "empty request");
    }

    auto response = m_client.generate(m_model, kSystemPrompt, request, true);
    if (!response) {
        throw ParseError(request, "no response from Ollama at " + m_client.host() + ":" +
                                  std::to_string(m_client.port()));
    }
    return ParseResponse(request, *response);
}

} // namespace storagerouter::infrastructure
