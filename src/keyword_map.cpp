#include "keyword_map.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace {

std::vector<std::string> stringList(const json& value) {
    std::vector<std::string> result;
    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                std::string s = TextUtils::trim(item.get<std::string>());
                if (!s.empty()) {
                    result.push_back(s);
                }
            }
        }
    } else if (value.is_string()) {
        result = TextUtils::split(value.get<std::string>(), ',');
    }
    return result;
}

std::string stringField(const json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        if (it->is_number()) {
            return it->dump();
        }
    }
    return "";
}

}

KeywordMapEntry KeywordMapEntry::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Keyword map entry must be a JSON object");
    }
    KeywordMapEntry entry;
    entry.documentId = stringField(j, {"document_id", "id", "post_id"});
    entry.title = stringField(j, {"title"});
    entry.url = stringField(j, {"url"});
    entry.postType = stringField(j, {"post_type", "type"});
    entry.primaryKeyword = stringField(j, {"primary_keyword"});
    if (j.contains("secondary_keywords")) {
        entry.secondaryKeywords = stringList(j["secondary_keywords"]);
    }
    if (j.contains("categories")) {
        entry.categories = stringList(j["categories"]);
    }
    return entry;
}

json KeywordMapEntry::toJson() const {
    return json{
        {"document_id", documentId},
        {"title", title},
        {"url", url},
        {"post_type", postType},
        {"primary_keyword", primaryKeyword},
        {"secondary_keywords", secondaryKeywords},
        {"categories", categories}
    };
}

std::string CannibalizationIssue::typeName() const {
    switch (type) {
        case Type::PrimaryKeywordConflict: return "primary_keyword_conflict";
        case Type::KeywordOveruse: return "keyword_overuse";
        case Type::SemanticSimilarity: return "semantic_similarity";
    }
    return "unknown";
}

json CannibalizationIssue::toJson() const {
    json pagesJson = json::array();
    for (const auto& page : pages) {
        pagesJson.push_back({
            {"document_id", page.documentId},
            {"title", page.title},
            {"url", page.url},
            {"type", page.type}
        });
    }
    json j = {
        {"type", typeName()},
        {"severity", severity},
        {"pages", pagesJson},
        {"recommendation", recommendation}
    };
    if (type == Type::SemanticSimilarity) {
        j["keywords"] = {keyword, relatedKeyword};
        j["similarity"] = similarity;
    } else {
        j["keyword"] = keyword;
    }
    return j;
}

KeywordMapAnalyzer::KeywordMapAnalyzer(const KeywordMapConfig& config)
    : config_(config) {
    if (config_.numThreads == 0) {
        config_.numThreads = 1;
    }
}

KeywordMapAnalyzer::~KeywordMapAnalyzer() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool KeywordMapAnalyzer::isStopWord(const std::string& word) const {
    return std::find(config_.stopWords.begin(), config_.stopWords.end(), word) != config_.stopWords.end();
}

std::string KeywordMapAnalyzer::normalizeKeyword(const std::string& keyword) const {
    std::vector<std::string> kept;
    for (const auto& word : TextUtils::splitWhitespace(TextUtils::toLower(keyword))) {
        if (!isStopWord(word)) {
            kept.push_back(word);
        }
    }
    return TextUtils::join(kept, " ");
}

double KeywordMapAnalyzer::similarity(const std::string& a, const std::string& b) const {
    std::string first = normalizeKeyword(a);
    std::string second = normalizeKeyword(b);
    // Keywords made only of stop words are compared as typed
    if (first.empty()) {
        first = TextUtils::collapseWhitespace(TextUtils::toLower(TextUtils::trim(a)));
    }
    if (second.empty()) {
        second = TextUtils::collapseWhitespace(TextUtils::toLower(TextUtils::trim(b)));
    }

    if (!first.empty() && first == second) {
        return 100.0;
    }
    if (!first.empty() && !second.empty() &&
        (first.find(second) != std::string::npos || second.find(first) != std::string::npos)) {
        return 90.0;
    }

    size_t maxLength = std::max(first.size(), second.size());
    if (maxLength == 0) {
        return 0.0;
    }
    double levenshteinScore = (1.0 - static_cast<double>(TextUtils::levenshtein(first, second)) / maxLength) * 100.0;

    std::vector<std::string> firstWords = TextUtils::splitWhitespace(first);
    std::vector<std::string> secondWords = TextUtils::splitWhitespace(second);
    std::set<std::string> firstSet(firstWords.begin(), firstWords.end());
    std::set<std::string> secondSet(secondWords.begin(), secondWords.end());
    std::set<std::string> unionSet(firstSet);
    unionSet.insert(secondSet.begin(), secondSet.end());
    size_t common = 0;
    for (const auto& word : firstSet) {
        if (secondSet.count(word)) {
            ++common;
        }
    }
    double overlapScore = unionSet.empty() ? 0.0 : static_cast<double>(common) / unionSet.size() * 100.0;

    return TextUtils::roundTo(std::max(levenshteinScore, overlapScore), 2);
}

void KeywordMapAnalyzer::workerThread() {
    while (true) {
        PairTask task;

        // Try to get a pair from the queue
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (taskQueue_.empty()) {
                return;
            }
            task = taskQueue_.front();
            taskQueue_.pop();
        }

        // Compare outside the lock
        double score = similarity((*pairKeywords_)[task.first], (*pairKeywords_)[task.second]);

        std::lock_guard<std::mutex> lock(resultsMutex_);
        results_.push_back({task.first, task.second, score});
    }
}

std::vector<KeywordMapAnalyzer::PairResult> KeywordMapAnalyzer::computePairSimilarities(
    const std::vector<std::string>& keywords) {

    taskQueue_ = std::queue<PairTask>();
    results_.clear();
    pairKeywords_ = &keywords;

    for (size_t i = 0; i < keywords.size(); ++i) {
        for (size_t j = i + 1; j < keywords.size(); ++j) {
            taskQueue_.push({i, j});
        }
    }

    if (!taskQueue_.empty()) {
        unsigned int actualThreads = static_cast<unsigned int>(
            std::min<size_t>(config_.numThreads, taskQueue_.size()));
        workers_.clear();

        try {
            for (unsigned int i = 0; i < actualThreads; ++i) {
                try {
                    workers_.emplace_back(&KeywordMapAnalyzer::workerThread, this);
                } catch (const std::system_error& e) {
                    if (workers_.empty()) {
                        throw;
                    }
                    std::cerr << "Warning: Could not create additional thread: " << e.what() << std::endl;
                    break;
                }
            }
        } catch (const std::system_error& e) {
            std::cerr << "Warning: Thread creation failed: " << e.what() << std::endl;
            std::cerr << "Falling back to single-threaded comparison" << std::endl;
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        // Anything left (no thread could start) is compared on this thread
        workerThread();
    }

    pairKeywords_ = nullptr;
    std::vector<PairResult> sorted = std::move(results_);
    results_.clear();
    std::sort(sorted.begin(), sorted.end(), [](const PairResult& a, const PairResult& b) {
        return a.first != b.first ? a.first < b.first : a.second < b.second;
    });
    return sorted;
}

std::vector<CannibalizationIssue> KeywordMapAnalyzer::detectCannibalizationIssues(
    const std::vector<KeywordMapEntry>& entries) {

    std::vector<CannibalizationIssue> issues;

    auto pageFor = [](const KeywordMapEntry& entry, const std::string& type) {
        return CannibalizationIssue::Page{entry.documentId, entry.title, entry.url, type};
    };

    // Documents per normalized primary keyword, in first-seen order
    std::vector<std::string> primaries;
    std::unordered_map<std::string, std::vector<size_t>> primaryDocuments;
    for (size_t i = 0; i < entries.size(); ++i) {
        std::string primary = normalizeKeyword(entries[i].primaryKeyword);
        if (primary.empty()) {
            continue;
        }
        auto& documents = primaryDocuments[primary];
        if (documents.empty()) {
            primaries.push_back(primary);
        }
        bool duplicate = std::any_of(documents.begin(), documents.end(), [&](size_t k) {
            return entries[k].documentId == entries[i].documentId;
        });
        if (!duplicate) {
            documents.push_back(i);
        }
    }

    for (const auto& primary : primaries) {
        const auto& documents = primaryDocuments[primary];
        if (documents.size() < 2) {
            continue;
        }
        CannibalizationIssue issue;
        issue.type = CannibalizationIssue::Type::PrimaryKeywordConflict;
        issue.severity = "high";
        issue.keyword = primary;
        for (size_t index : documents) {
            issue.pages.push_back(pageFor(entries[index], "primary"));
        }
        issue.recommendation = "Consolidate content or reassign primary keywords to prevent cannibalization";
        issues.push_back(std::move(issue));
    }

    // Any keyword used by too many documents
    std::vector<std::string> usedKeywords;
    std::unordered_map<std::string, std::vector<std::pair<size_t, std::string>>> keywordDocuments;
    for (size_t i = 0; i < entries.size(); ++i) {
        std::string primary = normalizeKeyword(entries[i].primaryKeyword);
        std::vector<std::pair<std::string, std::string>> keywords;
        if (!primary.empty()) {
            keywords.emplace_back(primary, "primary");
        }
        for (const auto& secondary : entries[i].secondaryKeywords) {
            std::string normalized = normalizeKeyword(secondary);
            if (!normalized.empty() && normalized != primary) {
                keywords.emplace_back(normalized, "secondary");
            }
        }
        for (const auto& keyword : keywords) {
            auto& documents = keywordDocuments[keyword.first];
            if (documents.empty()) {
                usedKeywords.push_back(keyword.first);
            }
            bool duplicate = std::any_of(documents.begin(), documents.end(), [&](const auto& d) {
                return entries[d.first].documentId == entries[i].documentId;
            });
            if (!duplicate) {
                documents.emplace_back(i, keyword.second);
            }
        }
    }

    for (const auto& keyword : usedKeywords) {
        const auto& documents = keywordDocuments[keyword];
        if (documents.size() <= config_.overuseDocumentLimit) {
            continue;
        }
        CannibalizationIssue issue;
        issue.type = CannibalizationIssue::Type::KeywordOveruse;
        issue.severity = "medium";
        issue.keyword = keyword;
        for (const auto& document : documents) {
            issue.pages.push_back(pageFor(entries[document.first], document.second));
        }
        issue.recommendation = "Consider consolidating content or creating a more focused topic cluster";
        issues.push_back(std::move(issue));
    }

    // Distinct primaries that are too similar
    for (const auto& pair : computePairSimilarities(primaries)) {
        if (pair.similarity < config_.cannibalizationThreshold) {
            continue;
        }
        CannibalizationIssue issue;
        issue.type = CannibalizationIssue::Type::SemanticSimilarity;
        issue.severity = "medium";
        issue.keyword = primaries[pair.first];
        issue.relatedKeyword = primaries[pair.second];
        issue.similarity = pair.similarity;
        for (const auto& keyword : {issue.keyword, issue.relatedKeyword}) {
            for (size_t index : primaryDocuments[keyword]) {
                issue.pages.push_back(pageFor(entries[index], "primary"));
            }
        }
        issue.recommendation = "Differentiate content focus or combine into a single comprehensive page";
        issues.push_back(std::move(issue));
    }

    return issues;
}

std::vector<CannibalizationIssue> KeywordMapAnalyzer::conflictsForDocument(
    const std::vector<KeywordMapEntry>& entries, const std::string& documentId) {

    std::vector<CannibalizationIssue> conflicts;
    for (const auto& issue : detectCannibalizationIssues(entries)) {
        bool involved = std::any_of(issue.pages.begin(), issue.pages.end(),
            [&documentId](const CannibalizationIssue::Page& page) { return page.documentId == documentId; });
        if (!involved) {
            continue;
        }
        CannibalizationIssue conflict = issue;
        conflict.pages.clear();
        for (const auto& page : issue.pages) {
            if (page.documentId != documentId) {
                conflict.pages.push_back(page);
            }
        }
        conflicts.push_back(std::move(conflict));
    }
    return conflicts;
}

std::vector<std::string> KeywordMapAnalyzer::allKeywords(const std::vector<KeywordMapEntry>& entries) const {
    std::vector<std::string> keywords;
    for (const auto& entry : entries) {
        std::string primary = normalizeKeyword(entry.primaryKeyword);
        if (!primary.empty()) {
            keywords.push_back(primary);
        }
        for (const auto& secondary : entry.secondaryKeywords) {
            std::string normalized = normalizeKeyword(secondary);
            if (!normalized.empty()) {
                keywords.push_back(normalized);
            }
        }
    }
    return keywords;
}

json KeywordMapAnalyzer::analyzeCoverage(const std::vector<KeywordMapEntry>& entries) const {
    std::vector<std::string> keywords = allKeywords(entries);

    std::vector<std::pair<std::string, size_t>> counts;
    std::unordered_map<std::string, size_t> index;
    for (const auto& keyword : keywords) {
        auto it = index.find(keyword);
        if (it == index.end()) {
            index.emplace(keyword, counts.size());
            counts.emplace_back(keyword, 1);
        } else {
            counts[it->second].second++;
        }
    }

    json overused = json::array();
    json underused = json::array();
    for (const auto& entry : counts) {
        if (entry.second > config_.overusedKeywordCount) {
            overused.push_back({{"keyword", entry.first}, {"count", entry.second}});
        } else if (entry.second == 1) {
            underused.push_back(entry.first);
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked = counts;
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    json mostUsed = json::array();
    for (size_t i = 0; i < ranked.size() && i < config_.maxMostUsed; ++i) {
        mostUsed.push_back({{"keyword", ranked[i].first}, {"count", ranked[i].second}});
    }

    double diversity = counts.empty() ? 0.0
        : TextUtils::roundTo(static_cast<double>(keywords.size()) / counts.size(), 2);

    return json{
        {"total_keywords", keywords.size()},
        {"unique_keywords", counts.size()},
        {"keyword_diversity", diversity},
        {"most_used", mostUsed},
        {"overused", overused},
        {"underused", underused},
        {"gaps", identifyKeywordGaps(entries)}
    };
}

json KeywordMapAnalyzer::identifyKeywordGaps(const std::vector<KeywordMapEntry>& entries) const {
    std::vector<std::string> keywords = allKeywords(entries);
    std::unordered_set<std::string> existing(keywords.begin(), keywords.end());
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> suggested;

    json gaps = json::array();
    for (const auto& keyword : keywords) {
        if (!seen.insert(keyword).second) {
            continue;
        }
        std::vector<std::string> words = TextUtils::splitWhitespace(keyword);
        if (words.size() < 2) {
            continue;
        }
        for (size_t skip = 0; skip < words.size(); ++skip) {
            if (gaps.size() >= config_.maxGaps) {
                return gaps;
            }
            std::vector<std::string> remaining;
            for (size_t k = 0; k < words.size(); ++k) {
                if (k != skip) {
                    remaining.push_back(words[k]);
                }
            }
            std::string candidate = TextUtils::join(remaining, " ");
            if (candidate.size() < config_.minGapLength || existing.count(candidate) || suggested.count(candidate)) {
                continue;
            }
            suggested.insert(candidate);
            gaps.push_back({{"keyword", candidate}, {"derived_from", keyword}, {"type", "variation"}});
        }
    }
    return gaps;
}

json KeywordMapAnalyzer::generateTopicClusters(const std::vector<KeywordMapEntry>& entries) const {
    json clusters = json::array();
    std::unordered_set<std::string> processed;

    auto secondarySet = [this](const KeywordMapEntry& entry) {
        std::set<std::string> result;
        for (const auto& keyword : entry.secondaryKeywords) {
            std::string normalized = normalizeKeyword(keyword);
            if (!normalized.empty()) {
                result.insert(normalized);
            }
        }
        return result;
    };

    for (size_t i = 0; i < entries.size(); ++i) {
        std::string primary = normalizeKeyword(entries[i].primaryKeyword);
        if (primary.empty() || processed.count(primary)) {
            continue;
        }
        processed.insert(primary);

        std::set<std::string> pillarSecondaries = secondarySet(entries[i]);
        std::vector<std::string> relatedKeywords(pillarSecondaries.begin(), pillarSecondaries.end());

        json supporting = json::array();
        for (size_t j = 0; j < entries.size(); ++j) {
            if (j == i) {
                continue;
            }
            std::string other = normalizeKeyword(entries[j].primaryKeyword);
            if (other.empty() || other == primary || processed.count(other)) {
                continue;
            }
            double score = similarity(primary, other);
            std::set<std::string> otherSecondaries = secondarySet(entries[j]);
            bool sharesSecondary = std::any_of(otherSecondaries.begin(), otherSecondaries.end(),
                [&pillarSecondaries](const std::string& k) { return pillarSecondaries.count(k) > 0; });
            if (score < config_.clusterSimilarityThreshold && !sharesSecondary) {
                continue;
            }
            supporting.push_back({
                {"document_id", entries[j].documentId},
                {"title", entries[j].title},
                {"url", entries[j].url},
                {"primary_keyword", other},
                {"similarity", score}
            });
            for (const auto& keyword : otherSecondaries) {
                if (std::find(relatedKeywords.begin(), relatedKeywords.end(), keyword) == relatedKeywords.end()) {
                    relatedKeywords.push_back(keyword);
                }
            }
        }
        // Supporting primaries join this cluster only
        for (const auto& page : supporting) {
            processed.insert(page["primary_keyword"].get<std::string>());
        }

        if (supporting.empty()) {
            continue;
        }
        clusters.push_back({
            {"main_topic", primary},
            {"pillar_page", {
                {"document_id", entries[i].documentId},
                {"title", entries[i].title},
                {"url", entries[i].url}
            }},
            {"supporting_pages", supporting},
            {"related_keywords", relatedKeywords}
        });
    }
    return clusters;
}
