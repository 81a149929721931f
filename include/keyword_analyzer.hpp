#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>
#include "analysis_result.hpp"
#include "content_extractor.hpp"
#include "html_document.hpp"

// Thresholds and word lists for single-document keyword analysis
struct KeywordAnalysisConfig {
    // Density band (percent)
    double minOptimalDensity = 0.5;
    double maxOptimalDensity = 3.0;
    double severelyUnderusedDensity = 0.1;
    double severelyOverusedDensity = 5.0;

    // Band adjustments
    size_t shortContentWords = 300;           // Content below this is short
    double shortContentMinFactor = 0.8;
    double shortContentMaxFactor = 1.2;
    double secondaryKeywordFactor = 0.7;

    // Competitive assessment
    double idealDensityLow = 0.5;
    double idealDensityHigh = 2.5;
    size_t wordsPerRecommendedOccurrence = 100;
    double insufficientCountRatio = 0.7;
    double excessiveCountRatio = 1.5;

    // Sufficiency flag
    double maxFirstPositionPercent = 30.0;
    double minSpread = 0.1;

    // Naturalness: usage is natural below this forced-usage percentage
    double naturalUsageThreshold = 30.0;

    size_t maxContexts = 5;
    size_t maxLsiKeywords = 10;
    size_t maxCompetingKeywords = 5;
    size_t minCompetingWordLength = 4;
    size_t contextWindow = 50;                // Characters around an occurrence

    // Regex alternatives that mark optimisation-oriented context after a keyword
    std::string contextualPattern = "improve|ranking|optimi[sz]e|visibility";

    std::vector<std::string> stopWords = {
        "the", "and", "or", "a", "an", "in", "on", "at", "to", "for", "with", "by", "of", "that", "this"
    };

    // Words that make a keyword occurrence contextually meaningful
    std::vector<std::string> signalWords = {
        "relevant", "important", "significant", "key", "essential", "crucial", "related",
        "similar", "also", "additionally", "furthermore", "moreover", "example", "instance",
        "such as", "like", "including", "includes", "because", "therefore", "thus", "hence",
        "accordingly", "consequently"
    };
};

// Full per-keyword analysis of one document
struct KeywordAnalysis {
    struct HeadingLevel {
        size_t count = 0;
        size_t keywordMatches = 0;
        std::vector<std::string> texts;
    };

    struct Structure {
        std::map<int, HeadingLevel> headings;     // levels 1-6; empty on fallback
        size_t paragraphsTotal = 0;
        size_t paragraphsWithKeyword = 0;
        double paragraphDistributionPercentage = 0.0;
        bool firstParagraphHasKeyword = false;
        bool titleHasKeyword = false;
        bool descriptionHasKeyword = false;
        bool urlHasKeyword = false;
    };

    struct HeadingPresence {
        size_t count = 0;
        std::vector<int> levels;
        size_t totalHeadings = 0;
    };

    struct SemanticUsage {
        std::vector<std::pair<std::string, size_t>> variations;
        std::vector<std::string> contexts;
        size_t stuffingPatterns = 0;
        double forcedUsagePercentage = 0.0;
        bool appearsNatural = true;
        size_t occurrences = 0;
        double averageDistance = 0.0;
        double distributionScore = 0.0;
    };

    struct Competitive {
        std::string densityStatus = "underdensity";     // underdensity, optimal, overdensity
        std::string countStatus = "insufficient";       // insufficient, optimal, excessive
        size_t recommendedCount = 0;
        double countRatio = 0.0;
    };

    struct Cannibalization {
        size_t primaryKeywordCount = 0;
        std::vector<std::pair<std::string, size_t>> competingKeywords;
        bool hasRisk = false;
    };

    std::string keyword;
    bool fallbackUsed = false;
    size_t count = 0;
    size_t wordCount = 0;
    size_t textLength = 0;
    double density = 0.0;
    std::optional<double> positionPercent;
    double distributionScore = 0.0;      // 0-10, 10 = evenly spaced
    double spread = 0.0;                 // (last - first) / length
    size_t contextualScore = 0;
    bool hasSufficientUsage = false;
    std::vector<size_t> positions;

    Structure structure;
    HeadingPresence inHeadings;
    SemanticUsage semantic;
    Competitive competitive;
    std::vector<std::pair<std::string, size_t>> lsiKeywords;
    Cannibalization cannibalization;

    nlohmann::json toJson() const;
};

// Density status against the (adjusted) optimal band
struct DensityAnalysis {
    std::string keyword;
    bool secondary = false;
    size_t count = 0;
    size_t wordCount = 0;
    double density = 0.0;
    double minOptimal = 0.0;
    double maxOptimal = 0.0;
    std::string status;                  // severely_underused, underused, optimal, overused, severely_overused
    size_t expectedMin = 0;
    size_t expectedMax = 0;
    size_t adjustmentNeeded = 0;
    double score = 0.0;                  // 0-1

    bool inTitle = false;
    bool inMetaDescription = false;
    bool inUrl = false;
    bool inHeadings = false;
    bool inFirstParagraph = false;

    nlohmann::json toJson() const;
};

// Secondary keyword measured against the primary one
struct RelatedKeywordAnalysis {
    std::string keyword;
    bool present = false;
    size_t count = 0;
    double density = 0.0;
    double distributionScore = 0.0;
    double contextScore = 0.0;
    double proximityScore = 0.0;
    bool inHeadings = false;
    bool inFirstParagraph = false;
    bool inLastParagraph = false;

    nlohmann::json toJson() const;
};

// Primary versus secondary usage balance
struct KeywordBalance {
    double primaryDensity = 0.0;
    double averageSecondaryDensity = 0.0;
    double ratio = 0.0;
    std::string status;
    double score = 0.0;
    std::string message;

    nlohmann::json toJson() const;
};

class KeywordAnalyzer {
public:
    explicit KeywordAnalyzer(const KeywordAnalysisConfig& config = KeywordAnalysisConfig());

    // Analyze one keyword against extracted content; a null document selects the degraded path
    AnalysisResult<KeywordAnalysis> analyze(const std::string& keyword,
                                            const ExtractedContent& content,
                                            const HtmlDocument* document,
                                            const std::string& url = "") const;

    // Density status derived from a finished analysis
    DensityAnalysis analyzeDensity(const KeywordAnalysis& analysis, bool secondary) const;

    // Secondary keyword against the primary keyword
    RelatedKeywordAnalysis analyzeRelated(const std::string& primary,
                                          const std::string& secondary,
                                          const ExtractedContent& content) const;

    KeywordBalance analyzeBalance(double primaryDensity, const std::vector<double>& secondaryDensities) const;

    // Which keywords occur in a text
    nlohmann::json checkKeywordPresence(const std::string& text, const std::vector<std::string>& keywords) const;

    // Heading levels each keyword appears in
    nlohmann::json checkKeywordCoverageInHeadings(const std::vector<ContentBlock>& headings,
                                                  const std::vector<std::string>& keywords) const;

    // Lowercase and collapse whitespace
    static std::string normalizeKeyword(const std::string& keyword);

    static double calculateDensity(size_t count, size_t wordCount);

    // Ladder score 0-10 comparing offsets to evenly spaced ones
    static double distributionScore(const std::vector<size_t>& positions, size_t length);

    // Gap-regularity score 0-1; 0.5 for fewer than two occurrences
    static double gapRegularityScore(const std::vector<size_t>& positions, size_t length);

    // Naive plural/singular form
    static std::string keywordVariation(const std::string& keyword);

    const KeywordAnalysisConfig& getConfig() const { return config_; }

private:
    KeywordAnalysisConfig config_;

    // Helper methods
    void analyzeStructure(KeywordAnalysis& analysis, const ExtractedContent& content,
                          const HtmlDocument* document, const std::string& url) const;
    void analyzeSemanticUsage(KeywordAnalysis& analysis, const std::string& text) const;
    void analyzeCompetitive(KeywordAnalysis& analysis) const;
    void analyzeTermFrequencies(KeywordAnalysis& analysis, const std::string& lowerText) const;
    size_t countContextualSignals(const std::string& keyword, const std::string& text) const;
    bool isStopWord(const std::string& word) const;
    static bool urlContainsKeyword(const std::string& url, const std::string& keyword);
};
