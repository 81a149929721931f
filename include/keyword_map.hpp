#pragma once

#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>

// One document's keyword assignment, built by the caller from every document of a site
struct KeywordMapEntry {
    std::string documentId;
    std::string title;
    std::string url;
    std::string postType;
    std::string primaryKeyword;
    std::vector<std::string> secondaryKeywords;
    std::vector<std::string> categories;

    // Throws std::invalid_argument when the value is not an object
    static KeywordMapEntry fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;
};

// Thresholds for site-wide keyword analysis
struct KeywordMapConfig {
    double cannibalizationThreshold = 70.0;    // Similarity that flags two primaries
    double clusterSimilarityThreshold = 40.0;  // Similarity that joins a topic cluster
    size_t overuseDocumentLimit = 2;           // More documents than this is overuse
    size_t overusedKeywordCount = 3;           // Coverage: used more often than this
    size_t maxMostUsed = 10;
    size_t maxGaps = 10;
    size_t minGapLength = 6;                   // Characters

    std::vector<std::string> stopWords = {
        "the", "and", "or", "a", "an", "in", "on", "at", "to", "for", "with", "by", "of", "that", "this"
    };

    unsigned int numThreads = std::thread::hardware_concurrency();
};

// One detected keyword collision
struct CannibalizationIssue {
    enum class Type { PrimaryKeywordConflict, KeywordOveruse, SemanticSimilarity };

    struct Page {
        std::string documentId;
        std::string title;
        std::string url;
        std::string type;        // primary or secondary
    };

    Type type = Type::PrimaryKeywordConflict;
    std::string severity;
    std::string keyword;
    std::string relatedKeyword;  // second keyword of a semantic pair
    double similarity = 0.0;
    std::vector<Page> pages;
    std::string recommendation;

    std::string typeName() const;
    nlohmann::json toJson() const;
};

class KeywordMapAnalyzer {
public:
    explicit KeywordMapAnalyzer(const KeywordMapConfig& config = KeywordMapConfig());
    ~KeywordMapAnalyzer();

    // Lowercase, collapse whitespace and drop stop words
    std::string normalizeKeyword(const std::string& keyword) const;

    // Symmetric similarity 0-100 between two keywords
    double similarity(const std::string& a, const std::string& b) const;

    // Collisions across the whole map
    std::vector<CannibalizationIssue> detectCannibalizationIssues(const std::vector<KeywordMapEntry>& entries);

    // Collisions involving one document, listing only the other documents
    std::vector<CannibalizationIssue> conflictsForDocument(const std::vector<KeywordMapEntry>& entries,
                                                           const std::string& documentId);

    nlohmann::json analyzeCoverage(const std::vector<KeywordMapEntry>& entries) const;
    nlohmann::json identifyKeywordGaps(const std::vector<KeywordMapEntry>& entries) const;
    nlohmann::json generateTopicClusters(const std::vector<KeywordMapEntry>& entries) const;

    const KeywordMapConfig& getConfig() const { return config_; }

private:
    struct PairTask {
        size_t first;
        size_t second;
    };

    struct PairResult {
        size_t first;
        size_t second;
        double similarity;
    };

    KeywordMapConfig config_;
    std::vector<std::thread> workers_;
    std::queue<PairTask> taskQueue_;
    std::vector<PairResult> results_;
    std::mutex queueMutex_;
    std::mutex resultsMutex_;
    const std::vector<std::string>* pairKeywords_ = nullptr;

    // Thread worker function
    void workerThread();

    // Similarity of every keyword pair (i < j), sorted by (i, j)
    std::vector<PairResult> computePairSimilarities(const std::vector<std::string>& keywords);

    // Helper methods
    std::vector<std::string> allKeywords(const std::vector<KeywordMapEntry>& entries) const;
    bool isStopWord(const std::string& word) const;
};
