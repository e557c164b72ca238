/**
 * @file KeywordCriteriaExtractor.cpp
 * @brief Implementation of KeywordCriteriaExtractor.
 */

#include "infrastructure/KeywordCriteriaExtractor.hpp"
#include "domain/DecisionErrors.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace storagerouter::infrastructure {

using namespace storagerouter::domain;

namespace {

using CueList = std::initializer_list<const char*>;

const CueList kMemoryCues = {
    "remember", "prefer", "preference", "i live in", "timezone", "my email", "my name",
    "my birthday", "vegetarian", "allerg", "my phone", "my address"
};
const CueList kSearchCues = {"search", "find", "look for", "look up", "retrieve", "locate"};
const CueList kMeaningCues = {
    "meaning", "semantic", "similar", "related", "relevant", "context", "about", "knowledge base"
};
const CueList kFileCues = {
    "file", "export", "pdf", "csv", "markdown", "excel", "json", "snippet", "chart", "image",
    "report", "archive", "backup", "document", "output"
};
const CueList kDatabaseCues = {
    "track", "table", "list", "todo", "task", "inventory", "customer", "milestone", "habit",
    "timesheet", "record", "expense", "sales", "project", "contact", "data"
};
const CueList kAnalyticsCues = {
    "analy", "trend", "aggregate", "average", "compare", "rank", "running total", "pivot",
    "calculate", "group by", "year-over-year", "statistic", "join", "window function"
};
const CueList kQueryCues = {
    "analy", "trend", "aggregate", "average", "compare", "running total", "pivot",
    "calculate", "group by", "year-over-year", "join", "window function"
};
const CueList kFilterCues = {"rank", "top ", "sort", "filter", "greater than", "less than", "highest", "lowest"};
const CueList kCrudVerbCues = {"track", "add ", "maintain", "keep", "record", "monitor", "update"};
const CueList kBinaryCues = {
    "image", "pdf", "chart", "excel", "photo", "video", "audio", "media", "attachment", "screenshot"
};
const CueList kTextCues = {
    "note", "document", "article", "discussion", "knowledge", "content", "markdown", "text",
    "snippet", "code", "log", "transcript"
};
const CueList kNumericCues = {"measurement", "metric", "sensor", "reading", "temperature", "score", "numbers"};
const CueList kStructuredCues = {
    "table", "list", "todo", "task", "inventory", "customer", "record", "expense", "product", "contact"
};
const CueList kFrequentCues = {"frequent", "often", "always", "constantly", "all the time"};
const CueList kOccasionalCues = {"occasional", "sometimes", "rarely", "now and then"};

bool Any(const std::string& text, const CueList& cues) {
    return std::any_of(cues.begin(), cues.end(),
                       [&text](const char* cue) { return text.find(cue) != std::string::npos; });
}

std::string ToLower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Criteria KeywordCriteriaExtractor::extract(const std::string& request) {
    if (request.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ParseError(request, "empty request");
    }
    const std::string text = ToLower(request);

    const bool search = Any(text, kSearchCues);
    const bool meaning = Any(text, kMeaningCues);

    Criteria criteria;

    if (Any(text, kMemoryCues)) {
        criteria.storageIntent = StorageIntent::Memory;
    } else if (text.find("semantic") != std::string::npos || (search && (meaning || Any(text, kTextCues)))) {
        criteria.storageIntent = StorageIntent::Vector;
    } else if (Any(text, kFileCues)) {
        criteria.storageIntent = StorageIntent::File;
    } else if (Any(text, kDatabaseCues) || Any(text, kAnalyticsCues) || Any(text, kFilterCues)) {
        criteria.storageIntent = StorageIntent::Database;
    } else if (Any(text, kTextCues)) {
        criteria.storageIntent = StorageIntent::File;
    } else {
        throw ParseError(request, "no storage cue in request");
    }

    criteria.analyticIntent = Any(text, kAnalyticsCues);

    if (search) {
        criteria.accessPattern = AccessPattern::Search;
    } else if (criteria.analyticIntent && Any(text, kCrudVerbCues)) {
        criteria.accessPattern = AccessPattern::Crud;
    } else if (Any(text, kQueryCues)) {
        criteria.accessPattern = AccessPattern::Query;
    } else if (Any(text, kFilterCues)) {
        criteria.accessPattern = AccessPattern::Filter;
    } else {
        criteria.accessPattern = AccessPattern::Crud;
    }

    if (Any(text, kBinaryCues)) {
        criteria.dataType = DataType::Binary;
    } else if (Any(text, kTextCues)) {
        criteria.dataType = DataType::Text;
    } else if (Any(text, kNumericCues)) {
        criteria.dataType = DataType::Numeric;
    } else if (Any(text, kStructuredCues)) {
        criteria.dataType = DataType::Structured;
    } else {
        const bool textual = criteria.storageIntent == StorageIntent::File ||
                             criteria.storageIntent == StorageIntent::Vector;
        criteria.dataType = textual ? DataType::Text : DataType::Structured;
    }

    if (criteria.storageIntent == StorageIntent::Vector) {
        criteria.searchIntensity = SearchIntensity::High;
    } else if (search) {
        criteria.searchIntensity = (meaning || Any(text, kFrequentCues)) ? SearchIntensity::High : SearchIntensity::Low;
    } else if (Any(text, kOccasionalCues)) {
        criteria.searchIntensity = SearchIntensity::Low;
    } else {
        criteria.searchIntensity = SearchIntensity::None;
    }

    return criteria;
}

} // namespace storagerouter::infrastructure
