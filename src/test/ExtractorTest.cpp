#include <cassert>
#include <iostream>
#include <string>

#include "domain/DecisionErrors.hpp"
#include "infrastructure/KeywordCriteriaExtractor.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaCriteriaExtractor.hpp"

using namespace storagerouter::domain;
using namespace storagerouter::infrastructure;

namespace {

void ExpectCriteria(CriteriaExtractor& extractor, const std::string& request, const Criteria& expected) {
    Criteria actual = extractor.extract(request);
    if (actual != expected) {
        std::cerr << "[FAIL] '" << request << "' -> " << FormatCriteria(actual)
                  << ", expected " << FormatCriteria(expected) << std::endl;
    }
    assert(actual == expected);
}

template <typename Fn>
bool RaisesParseError(Fn&& fn) {
    try {
        fn();
    } catch (const ParseError&) {
        return true;
    }
    return false;
}

void TestKeywordIntents() {
    std::cout << "[Test] Keyword extractor intents..." << std::endl;

    KeywordCriteriaExtractor extractor;
    assert(extractor.isThreadSafe());

    ExpectCriteria(extractor, "Remember that I prefer dark mode",
                   {StorageIntent::Memory, AccessPattern::Crud, false, DataType::Structured, SearchIntensity::None});
    ExpectCriteria(extractor, "Track my daily expenses",
                   {StorageIntent::Database, AccessPattern::Crud, false, DataType::Structured, SearchIntensity::None});
    ExpectCriteria(extractor, "Analyze monthly spending trends",
                   {StorageIntent::Database, AccessPattern::Query, true, DataType::Structured, SearchIntensity::None});
    ExpectCriteria(extractor, "Track expenses and analyze trends",
                   {StorageIntent::Database, AccessPattern::Crud, true, DataType::Structured, SearchIntensity::None});
    ExpectCriteria(extractor, "Find documentation about APIs",
                   {StorageIntent::Vector, AccessPattern::Search, false, DataType::Text, SearchIntensity::High});
    ExpectCriteria(extractor, "Generate a PDF report",
                   {StorageIntent::File, AccessPattern::Crud, false, DataType::Binary, SearchIntensity::None});
    ExpectCriteria(extractor, "Save my meeting notes",
                   {StorageIntent::File, AccessPattern::Crud, false, DataType::Text, SearchIntensity::None});
    ExpectCriteria(extractor, "Search frequently through scanned contract images",
                   {StorageIntent::File, AccessPattern::Search, false, DataType::Binary, SearchIntensity::High});

    std::cout << "[PASS] Reference requests classified" << std::endl;
}

void TestKeywordDataTypes() {
    std::cout << "[Test] Keyword extractor data types..." << std::endl;

    KeywordCriteriaExtractor extractor;
    Criteria sensors = extractor.extract("Find sensor readings by similarity");
    assert(sensors.storageIntent == StorageIntent::Vector);
    assert(sensors.dataType == DataType::Numeric);

    Criteria products = extractor.extract("Find similar products in my inventory table");
    assert(products.storageIntent == StorageIntent::Vector);
    assert(products.dataType == DataType::Structured);

    Criteria export_ = extractor.extract("Export sales report with trend analysis");
    assert(export_.storageIntent == StorageIntent::File);
    assert(export_.analyticIntent);

    std::cout << "[PASS] Numeric, structured and analytic cues" << std::endl;
}

void TestKeywordRefusals() {
    std::cout << "[Test] Keyword extractor refusals..." << std::endl;

    KeywordCriteriaExtractor extractor;
    assert(RaisesParseError([&] { extractor.extract(""); }));
    assert(RaisesParseError([&] { extractor.extract("   \n"); }));
    assert(RaisesParseError([&] { extractor.extract("Hello there"); }));

    std::cout << "[PASS] ParseError instead of a guess" << std::endl;
}

void TestOllamaResponseParsing() {
    std::cout << "[Test] Ollama response parsing..." << std::endl;

    const std::string body =
        R"({"storage_intent": "vector", "access_pattern": "search", "analytic_intent": false, )"
        R"("data_type": "text", "search_intensity": "high"})";
    const Criteria expected{StorageIntent::Vector, AccessPattern::Search, false, DataType::Text, SearchIntensity::High};

    assert(OllamaCriteriaExtractor::ParseResponse("q", body) == expected);
    assert(OllamaCriteriaExtractor::ParseResponse("q", "```json\n" + body + "\n```") == expected);

    assert(RaisesParseError([] { OllamaCriteriaExtractor::ParseResponse("q", "I think it is a database."); }));
    assert(RaisesParseError([] {
        OllamaCriteriaExtractor::ParseResponse("q", R"({"storage_intent": "cloud", "access_pattern": "crud", )"
                                                    R"("analytic_intent": false, "data_type": "text", )"
                                                    R"("search_intensity": "none"})");
    }));
    assert(RaisesParseError([] { OllamaCriteriaExtractor::ParseResponse("q", R"({"storage_intent": "file"})"); }));

    assert(OllamaCriteriaExtractor::SystemPrompt().find("search_intensity") != std::string::npos);

    std::cout << "[PASS] Fenced and bare JSON accepted, schema violations refused" << std::endl;
}

void TestOllamaUnreachable() {
    std::cout << "[Test] Ollama server unreachable..." << std::endl;

    // Nothing listens on port 1; the client fails fast and logs the connection error.
    OllamaCriteriaExtractor extractor(OllamaClient("127.0.0.1", 1), "qwen2.5:7b");
    assert(extractor.name() == "ollama:qwen2.5:7b");
    assert(!extractor.isThreadSafe());
    assert(!extractor.modelAvailable());
    assert(RaisesParseError([&] { extractor.extract("Track my daily expenses"); }));
    assert(RaisesParseError([&] { extractor.extract(""); }));

    std::cout << "[PASS] Transport failure reported as ParseError" << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Extractor Test..." << std::endl;

    TestKeywordIntents();
    TestKeywordDataTypes();
    TestKeywordRefusals();
    TestOllamaResponseParsing();
    TestOllamaUnreachable();

    std::cout << "[PASS] Extractor Test completed." << std::endl;
    return 0;
}
