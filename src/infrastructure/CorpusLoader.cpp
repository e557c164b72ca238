/**
 * @file CorpusLoader.cpp
 * @brief Implementation of CorpusLoader.
 */

#include "infrastructure/CorpusLoader.hpp"
#include "domain/DecisionErrors.hpp"

#include <fstream>
#include <iostream>

namespace storagerouter::infrastructure {

using json = nlohmann::json;
using namespace storagerouter::domain;
namespace fs = std::filesystem;

namespace {

ValidationCase ParseCase(const json& node, std::size_t index) {
    const std::string where = "case " + std::to_string(index);
    if (!node.is_object()) {
        throw CorpusError(where + " must be an object");
    }

    ValidationCase vc;
    vc.name = node.value("name", where);
    vc.category = node.value("category", std::string("uncategorized"));
    if (node.contains("notes") && node["notes"].is_string()) {
        vc.notes = node["notes"].get<std::string>();
    }
    if (node.contains("criteria")) {
        vc.criteriaInput = node["criteria"];
    }
    if (node.contains("request")) {
        if (!node["request"].is_string()) throw CorpusError(where + ": 'request' must be a string");
        vc.requestText = node["request"].get<std::string>();
    }

    if (!node.contains("expected_storage") || !node["expected_storage"].is_array()) {
        throw CorpusError(where + " (" + vc.name + ") has no 'expected_storage' array");
    }
    for (const auto& item : node["expected_storage"]) {
        auto target = item.is_string() ? TargetFromString(item.get<std::string>()) : std::nullopt;
        if (!target) {
            throw CorpusError(where + " (" + vc.name + "): unknown storage target " + item.dump());
        }
        vc.expectedTargets.insert(*target);
    }

    if (node.contains("expected_criteria")) {
        try {
            vc.expectedCriteria = ParseCriteria(node["expected_criteria"]);
        } catch (const SchemaError& e) {
            throw CorpusError(where + " (" + vc.name + "): bad expected_criteria: " + e.what());
        }
    }
    return vc;
}

} // namespace

Corpus CorpusLoader::Parse(const json& document) {
    if (!document.is_object() || !document.contains("cases") || !document["cases"].is_array()) {
        throw CorpusError("corpus must be an object with a 'cases' array");
    }

    Corpus corpus;
    try {
        corpus.name = document.value("name", std::string{});
        corpus.phase = document.value("phase", std::string{});
        const json& cases = document["cases"];
        for (std::size_t i = 0; i < cases.size(); ++i) {
            corpus.cases.push_back(ParseCase(cases[i], i));
        }
    } catch (const json::exception& e) {
        throw CorpusError(std::string("malformed corpus: ") + e.what());
    }
    return corpus;
}

Corpus CorpusLoader::LoadFile(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw CorpusError("cannot open corpus file: " + path.string());
    }

    json document;
    try {
        f >> document;
    } catch (const json::exception& e) {
        throw CorpusError("malformed corpus file " + path.string() + ": " + e.what());
    }

    Corpus corpus = Parse(document);
    if (corpus.name.empty()) corpus.name = path.stem().string();
    std::cout << "[CorpusLoader] Loaded " << corpus.cases.size() << " cases from " << path.string() << std::endl;
    return corpus;
}

} // namespace storagerouter::infrastructure
