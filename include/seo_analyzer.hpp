#pragma once

#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
#include "content_extractor.hpp"
#include "readability_scorer.hpp"
#include "keyword_analyzer.hpp"
#include "keyword_map.hpp"
#include "schema_extractor.hpp"
#include "schema_validator.hpp"
#include "schema_advisor.hpp"
#include "intent_classifier.hpp"

// Configuration of every analyzer plus the batch thread count
struct SeoAnalyzerConfig {
    ExtractionRules extraction;
    ReadabilityConfig readability;
    KeywordAnalysisConfig keywords;
    KeywordMapConfig keywordMap;
    SchemaExtractorConfig schemaExtraction;
    SchemaRules schemaRules;
    SchemaAdvisorConfig schemaAdvice;
    IntentConfig intent;
    unsigned int numThreads = std::thread::hardware_concurrency();

    // Overlay values from a JSON object onto the defaults. Unknown keys and
    // values of the wrong type are skipped with a warning.
    static SeoAnalyzerConfig fromJson(const nlohmann::json& j);

    // Throws std::runtime_error when the file cannot be read or parsed
    static SeoAnalyzerConfig fromJsonFile(const std::string& path);
};

// Caller-supplied metadata of one document
struct AnalysisRequest {
    std::string language = "en";
    std::string postType = "post";
    std::string primaryKeyword;
    std::vector<std::string> secondaryKeywords;
    std::vector<std::string> localKeywords;     // Place names and services used for schema suggestions
    std::string url;
};

struct BatchDocument {
    std::string id;
    std::string html;
    AnalysisRequest request;
};

class SeoAnalyzer {
public:
    explicit SeoAnalyzer(const SeoAnalyzerConfig& config = SeoAnalyzerConfig());
    ~SeoAnalyzer();

    // Full report of one document
    nlohmann::json analyze(const std::string& html, const AnalysisRequest& request) const;

    // Reports in input order; a document that fails carries {"id", "error"} instead
    std::vector<nlohmann::json> analyzeBatch(const std::vector<BatchDocument>& documents);

    // Site-wide keyword map report (cannibalization, coverage, gaps, clusters)
    nlohmann::json analyzeSite(const std::vector<KeywordMapEntry>& entries);

    // Primary keyword conflicts of one document against the rest of the site
    nlohmann::json analyzeDocumentConflicts(const std::vector<KeywordMapEntry>& entries,
                                            const std::string& documentId);

    const SeoAnalyzerConfig& getConfig() const { return config_; }

private:
    SeoAnalyzerConfig config_;
    ContentExtractor extractor_;
    ReadabilityScorer readability_;
    KeywordAnalyzer keywords_;
    KeywordMapAnalyzer keywordMap_;
    SchemaExtractor schemaExtractor_;
    SchemaValidator schemaValidator_;
    SchemaAdvisor schemaAdvisor_;
    IntentClassifier intent_;

    // Batch state
    std::vector<std::thread> workers_;
    std::queue<size_t> batchQueue_;
    std::vector<nlohmann::json> batchResults_;
    const std::vector<BatchDocument>* batchDocuments_ = nullptr;
    std::mutex queueMutex_;
    std::mutex resultsMutex_;

    // Thread worker function
    void workerThread();

    // Helper methods
    nlohmann::json analyzeBatchDocument(const BatchDocument& document) const;
    nlohmann::json keywordSection(const std::string& primary,
                                  const std::vector<std::string>& secondaries,
                                  const ExtractedContent& content,
                                  const HtmlDocument* document,
                                  const std::string& url) const;
    nlohmann::json schemaSection(const HtmlDocument* document, const std::string& html,
                                 const AnalysisRequest& request) const;
    std::vector<std::string> normalizeSecondaries(const std::string& primary,
                                                  const std::vector<std::string>& keywords) const;
};
