#include "seo_analyzer.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;

namespace {

using Setter = std::function<void(const json&)>;

template <typename T>
Setter assign(T& target) {
    return [&target](const json& value) { target = value.get<T>(); };
}

void overlaySection(const json& config, const std::string& section, const std::map<std::string, Setter>& setters) {
    auto it = config.find(section);
    if (it == config.end()) {
        return;
    }
    if (!it->is_object()) {
        std::cerr << "Warning: Config section '" << section << "' is not an object, ignoring" << std::endl;
        return;
    }
    for (auto item = it->begin(); item != it->end(); ++item) {
        auto setter = setters.find(item.key());
        if (setter == setters.end()) {
            std::cerr << "Warning: Unknown config key '" << section << "." << item.key() << "'" << std::endl;
            continue;
        }
        try {
            setter->second(item.value());
        } catch (const json::exception& e) {
            std::cerr << "Warning: Ignoring config key '" << section << "." << item.key() << "': " << e.what() << std::endl;
        }
    }
}

// Run a task on its own thread, or lazily on the caller's when no thread can be created
template <typename F>
auto launchTask(F task) -> std::future<decltype(task())> {
    try {
        return std::async(std::launch::async, task);
    } catch (const std::system_error& e) {
        std::cerr << "Warning: Thread creation failed: " << e.what() << std::endl;
        return std::async(std::launch::deferred, task);
    }
}

}

SeoAnalyzerConfig SeoAnalyzerConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    SeoAnalyzerConfig config;
    static const std::vector<std::string> sections = {
        "threads", "extraction", "readability", "keywords", "keyword_map", "schema", "schema_advice", "intent"
    };
    for (auto item = j.begin(); item != j.end(); ++item) {
        if (std::find(sections.begin(), sections.end(), item.key()) == sections.end()) {
            std::cerr << "Warning: Unknown config key '" << item.key() << "'" << std::endl;
        }
    }

    auto threads = j.find("threads");
    if (threads != j.end()) {
        if (!threads->is_number_integer()) {
            std::cerr << "Warning: Ignoring config key 'threads': expected an integer" << std::endl;
        } else if (threads->get<long long>() < 0) {
            throw std::invalid_argument("Thread count must not be negative");
        } else {
            config.numThreads = threads->get<unsigned int>();
            config.keywordMap.numThreads = config.numThreads;
        }
    }

    ExtractionRules& extraction = config.extraction;
    overlaySection(j, "extraction", {
        {"max_ancestor_depth", assign(extraction.maxAncestorDepth)},
        {"excluded_tags", assign(extraction.excludedTags)},
        {"excluded_roles", assign(extraction.excludedRoles)},
        {"excluded_class_fragments", assign(extraction.excludedClassFragments)},
        {"excluded_id_fragments", assign(extraction.excludedIdFragments)},
        {"excluded_label_fragments", assign(extraction.excludedLabelFragments)},
        {"paragraph_selectors", assign(extraction.paragraphSelectors)},
        {"main_region_selectors", assign(extraction.mainRegionSelectors)}
    });

    ReadabilityConfig& readability = config.readability;
    overlaySection(j, "readability", {
        {"default_language", assign(readability.defaultLanguage)},
        {"complex_word_exceptions", assign(readability.complexWordExceptions)},
        {"passive_voice_threshold", assign(readability.passiveVoiceThreshold)},
        {"transition_word_threshold", assign(readability.transitionWordThreshold)},
        {"complex_word_threshold", assign(readability.complexWordThreshold)},
        {"long_paragraph_words", assign(readability.longParagraphWords)},
        {"ideal_keyword_sentence_length", assign(readability.idealKeywordSentenceLength)}
    });
    bool knownLanguage = readability.transitionWords.count(readability.defaultLanguage) > 0 ||
        std::find(readability.cjkLanguages.begin(), readability.cjkLanguages.end(),
                  readability.defaultLanguage) != readability.cjkLanguages.end();
    if (!knownLanguage) {
        throw std::invalid_argument("Unknown language code: " + readability.defaultLanguage);
    }

    KeywordAnalysisConfig& keywords = config.keywords;
    overlaySection(j, "keywords", {
        {"min_optimal_density", assign(keywords.minOptimalDensity)},
        {"max_optimal_density", assign(keywords.maxOptimalDensity)},
        {"severely_underused_density", assign(keywords.severelyUnderusedDensity)},
        {"severely_overused_density", assign(keywords.severelyOverusedDensity)},
        {"short_content_words", assign(keywords.shortContentWords)},
        {"secondary_keyword_factor", assign(keywords.secondaryKeywordFactor)},
        {"natural_usage_threshold", assign(keywords.naturalUsageThreshold)},
        {"max_contexts", assign(keywords.maxContexts)},
        {"max_lsi_keywords", assign(keywords.maxLsiKeywords)},
        {"stop_words", assign(keywords.stopWords)},
        {"signal_words", assign(keywords.signalWords)}
    });

    KeywordMapConfig& keywordMap = config.keywordMap;
    overlaySection(j, "keyword_map", {
        {"cannibalization_threshold", assign(keywordMap.cannibalizationThreshold)},
        {"cluster_similarity_threshold", assign(keywordMap.clusterSimilarityThreshold)},
        {"overuse_document_limit", assign(keywordMap.overuseDocumentLimit)},
        {"overused_keyword_count", assign(keywordMap.overusedKeywordCount)},
        {"max_gaps", assign(keywordMap.maxGaps)},
        {"stop_words", assign(keywordMap.stopWords)}
    });

    SchemaExtractorConfig& schema = config.schemaExtraction;
    overlaySection(j, "schema", {
        {"extract_json_ld", assign(schema.extractJsonLd)},
        {"extract_microdata", assign(schema.extractMicrodata)},
        {"extract_rdfa", assign(schema.extractRdfa)},
        {"skip_nested_items", assign(schema.skipNestedItems)}
    });

    SchemaAdvisorConfig& advice = config.schemaAdvice;
    overlaySection(j, "schema_advice", {
        {"local_post_types", assign(advice.localPostTypes)},
        {"local_page_patterns", assign(advice.localPagePatterns)},
        {"article_post_types", assign(advice.articlePostTypes)},
        {"news_keywords", assign(advice.newsKeywords)},
        {"organization_signal_threshold", assign(advice.organizationSignalThreshold)}
    });

    IntentConfig& intent = config.intent;
    overlaySection(j, "intent", {
        {"brand_pattern", assign(intent.brandPattern)},
        {"brand_boost", assign(intent.brandBoost)},
        {"product_terms", assign(intent.productTerms)},
        {"min_paragraph_length", assign(intent.minParagraphLength)}
    });

    return config;
}

SeoAnalyzerConfig SeoAnalyzerConfig::fromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("Failed to parse config file: " + path);
    }
    return fromJson(j);
}

SeoAnalyzer::SeoAnalyzer(const SeoAnalyzerConfig& config)
    : config_(config),
      extractor_(config.extraction),
      readability_(config.readability),
      keywords_(config.keywords),
      keywordMap_(config.keywordMap),
      schemaExtractor_(config.schemaExtraction),
      schemaValidator_(config.schemaRules),
      schemaAdvisor_(config.schemaAdvice, config.schemaRules),
      intent_(config.intent) {
}

SeoAnalyzer::~SeoAnalyzer() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

json SeoAnalyzer::analyze(const std::string& html, const AnalysisRequest& request) const {
    std::unique_ptr<HtmlDocument> parsed = HtmlDocument::parse(html, request.url);
    const HtmlDocument* document = parsed.get();

    ExtractedContent content = extractor_.extract(document, html);
    std::string text = content.plainText();
    std::vector<std::string> paragraphs = content.paragraphs();
    std::vector<ContentBlock> headings = content.headings();
    DomNode region = document ? extractor_.findMainContentRegion(*document) : DomNode();

    std::string primary = KeywordAnalyzer::normalizeKeyword(request.primaryKeyword);
    std::vector<std::string> secondaries = normalizeSecondaries(primary, request.secondaryKeywords);

    // The four analyses only read the document and the extracted content
    auto readabilityTask = launchTask([&]() {
        return readability_.analyze(text, paragraphs, request.language);
    });
    auto keywordTask = launchTask([&]() {
        return keywordSection(primary, secondaries, content, document, request.url);
    });
    auto intentTask = launchTask([&]() {
        return intent_.analyze(primary, request.postType, document, region, text);
    });
    auto schemaTask = launchTask([&]() {
        return schemaSection(document, html, request);
    });

    AnalysisResult<ReadabilityScorer::Report> readability = readabilityTask.get();
    json keywords = keywordTask.get();
    AnalysisResult<IntentProfile> intent = intentTask.get();
    json schema = schemaTask.get();

    json headingsJson = json::array();
    for (const auto& heading : headings) {
        headingsJson.push_back({{"level", heading.level}, {"text", heading.text}});
    }

    json readabilityJson = readability.data.toJson();
    readabilityJson["outcome"] = outcomeToString(readability.outcome);
    json intentJson = intent.data.toJson();
    intentJson["outcome"] = outcomeToString(intent.outcome);

    return json{
        {"document", {
            {"title", document ? document->title() : ""},
            {"meta_description", document ? document->metaDescription() : ""},
            {"url", request.url},
            {"language", request.language},
            {"post_type", request.postType},
            {"word_count", TextUtils::countWords(text)},
            {"outcome", outcomeToString(content.outcome)},
            {"fallback_used", content.fallbackUsed}
        }},
        {"content", {
            {"paragraph_count", paragraphs.size()},
            {"heading_count", headings.size()},
            {"headings", headingsJson}
        }},
        {"keywords", keywords},
        {"readability", readabilityJson},
        {"schema", schema},
        {"intent", intentJson}
    };
}

json SeoAnalyzer::keywordSection(const std::string& primary,
                                 const std::vector<std::string>& secondaries,
                                 const ExtractedContent& content,
                                 const HtmlDocument* document,
                                 const std::string& url) const {
    AnalysisResult<KeywordAnalysis> primaryResult = keywords_.analyze(primary, content, document, url);
    std::string text = content.plainText();

    json secondaryJson = json::array();
    json relatedJson = json::array();
    std::vector<double> densities;
    for (const auto& secondary : secondaries) {
        AnalysisResult<KeywordAnalysis> result = keywords_.analyze(secondary, content, document, url);
        secondaryJson.push_back(keywords_.analyzeDensity(result.data, true).toJson());
        densities.push_back(result.data.density);
        if (!primary.empty()) {
            relatedJson.push_back(keywords_.analyzeRelated(primary, secondary, content).toJson());
        }
    }

    std::vector<std::string> allKeywords;
    if (!primary.empty()) {
        allKeywords.push_back(primary);
    }
    allKeywords.insert(allKeywords.end(), secondaries.begin(), secondaries.end());

    return json{
        {"outcome", outcomeToString(primaryResult.outcome)},
        {"primary_keyword", primary},
        {"analysis", primaryResult.data.toJson()},
        {"density", keywords_.analyzeDensity(primaryResult.data, false).toJson()},
        {"secondary", secondaryJson},
        {"related", relatedJson},
        {"balance", keywords_.analyzeBalance(primaryResult.data.density, densities).toJson()},
        {"keyword_readability", readability_.analyzeKeywordReadability(text, primary).toJson()},
        {"presence", keywords_.checkKeywordPresence(text, allKeywords)},
        {"heading_coverage", keywords_.checkKeywordCoverageInHeadings(content.headings(), allKeywords)}
    };
}

json SeoAnalyzer::schemaSection(const HtmlDocument* document, const std::string& html,
                                const AnalysisRequest& request) const {
    AnalysisResult<std::vector<SchemaEntity>> extracted = schemaExtractor_.extract(document, html);

    json entities = json::array();
    std::vector<json> schemas;
    for (const auto& entity : extracted.data) {
        entities.push_back(entity.toJson());
        schemas.push_back(entity.data);
    }

    json localBusiness = nullptr;
    std::optional<LocalBusinessValidation> businessValidation;
    std::optional<json> business = schemaValidator_.findLocalBusinessSchema(schemas);
    if (business) {
        businessValidation = schemaValidator_.validateLocalBusiness(*business);
        localBusiness = businessValidation->toJson();
    }

    // Signals come from the whole page, boilerplate included, since addresses and hours often sit in the footer
    SchemaAdviceInput input;
    input.document = document;
    input.html = html;
    input.text = document ? document->plainText() : TextUtils::cleanHtml(html);
    input.title = document ? document->title() : "";
    input.url = request.url;
    input.postType = request.postType;
    input.localKeywords = request.localKeywords;
    SchemaSuggestion advice = schemaAdvisor_.advise(input, extracted.data, businessValidation);

    return json{
        {"outcome", outcomeToString(extracted.outcome)},
        {"entities", entities},
        {"types", SchemaExtractor::extractSchemaTypes(extracted.data)},
        {"validation", schemaValidator_.validateSchemas(schemas)},
        {"local_business", localBusiness},
        {"advice", advice.toJson()}
    };
}

std::vector<std::string> SeoAnalyzer::normalizeSecondaries(const std::string& primary,
                                                           const std::vector<std::string>& keywords) const {
    std::vector<std::string> result;
    for (const auto& keyword : keywords) {
        std::string normalized = KeywordAnalyzer::normalizeKeyword(keyword);
        if (normalized.empty() || normalized == primary) {
            continue;
        }
        if (std::find(result.begin(), result.end(), normalized) == result.end()) {
            result.push_back(normalized);
        }
    }
    return result;
}

json SeoAnalyzer::analyzeBatchDocument(const BatchDocument& document) const {
    try {
        json report = analyze(document.html, document.request);
        report["id"] = document.id;
        return report;
    } catch (const std::exception& e) {
        std::cerr << "Error analyzing document " << document.id << ": " << e.what() << std::endl;
        return json{{"id", document.id}, {"error", e.what()}};
    }
}

std::vector<json> SeoAnalyzer::analyzeBatch(const std::vector<BatchDocument>& documents) {
    batchDocuments_ = &documents;
    batchQueue_ = std::queue<size_t>();
    batchResults_.assign(documents.size(), json());
    for (size_t i = 0; i < documents.size(); ++i) {
        batchQueue_.push(i);
    }

    if (!documents.empty()) {
        unsigned int numThreads = config_.numThreads == 0 ? 1 : config_.numThreads;
        unsigned int actualThreads = std::min(numThreads, static_cast<unsigned int>(documents.size()));
        workers_.clear();

        try {
            workers_.emplace_back(&SeoAnalyzer::workerThread, this);
            for (unsigned int i = 1; i < actualThreads; ++i) {
                try {
                    workers_.emplace_back(&SeoAnalyzer::workerThread, this);
                } catch (const std::system_error& e) {
                    std::cerr << "Warning: Could not create additional thread: " << e.what() << std::endl;
                    break;
                }
            }
        } catch (const std::system_error& e) {
            std::cerr << "Warning: Thread creation failed: " << e.what() << std::endl;
            std::cerr << "Falling back to single-threaded processing" << std::endl;
        }

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();

        // Whatever no worker picked up is processed here
        while (!batchQueue_.empty()) {
            size_t index = batchQueue_.front();
            batchQueue_.pop();
            batchResults_[index] = analyzeBatchDocument(documents[index]);
        }
    }

    batchDocuments_ = nullptr;
    std::vector<json> results;
    results.swap(batchResults_);
    return results;
}

void SeoAnalyzer::workerThread() {
    while (true) {
        size_t index = 0;

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (batchQueue_.empty()) {
                return;
            }
            index = batchQueue_.front();
            batchQueue_.pop();
        }

        json report = analyzeBatchDocument((*batchDocuments_)[index]);

        std::lock_guard<std::mutex> lock(resultsMutex_);
        batchResults_[index] = std::move(report);
    }
}

json SeoAnalyzer::analyzeSite(const std::vector<KeywordMapEntry>& entries) {
    std::vector<CannibalizationIssue> issues = keywordMap_.detectCannibalizationIssues(entries);

    json issuesJson = json::array();
    size_t highSeverity = 0;
    for (const auto& issue : issues) {
        if (issue.severity == "high") {
            highSeverity++;
        }
        issuesJson.push_back(issue.toJson());
    }

    return json{
        {"total_documents", entries.size()},
        {"cannibalization", {
            {"issue_count", issues.size()},
            {"high_severity_count", highSeverity},
            {"issues", issuesJson}
        }},
        {"coverage", keywordMap_.analyzeCoverage(entries)},
        {"gaps", keywordMap_.identifyKeywordGaps(entries)},
        {"clusters", keywordMap_.generateTopicClusters(entries)}
    };
}

json SeoAnalyzer::analyzeDocumentConflicts(const std::vector<KeywordMapEntry>& entries,
                                           const std::string& documentId) {
    json conflicts = json::array();
    for (const auto& issue : keywordMap_.conflictsForDocument(entries, documentId)) {
        conflicts.push_back(issue.toJson());
    }
    return json{
        {"document_id", documentId},
        {"has_conflicts", !conflicts.empty()},
        {"conflicts", conflicts}
    };
}
