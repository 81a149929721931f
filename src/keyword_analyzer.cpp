#include "keyword_analyzer.hpp"
#include "term_matcher.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>
#include <unordered_map>

using json = nlohmann::json;

namespace {

// Word frequencies in first-seen order, then stable-sorted by count descending
std::vector<std::pair<std::string, size_t>> rankWordFrequencies(const std::vector<std::string>& words) {
    std::vector<std::pair<std::string, size_t>> ranked;
    std::unordered_map<std::string, size_t> index;
    for (const auto& word : words) {
        auto it = index.find(word);
        if (it == index.end()) {
            index.emplace(word, ranked.size());
            ranked.emplace_back(word, 1);
        } else {
            ranked[it->second].second++;
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });
    return ranked;
}

json pairsToJson(const std::vector<std::pair<std::string, size_t>>& pairs) {
    json j = json::object();
    for (const auto& entry : pairs) {
        j[entry.first] = entry.second;
    }
    return j;
}

}

KeywordAnalyzer::KeywordAnalyzer(const KeywordAnalysisConfig& config)
    : config_(config) {
}

std::string KeywordAnalyzer::normalizeKeyword(const std::string& keyword) {
    return TextUtils::collapseWhitespace(TextUtils::toLower(TextUtils::trim(keyword)));
}

double KeywordAnalyzer::calculateDensity(size_t count, size_t wordCount) {
    if (count == 0 || wordCount == 0) {
        return 0.0;
    }
    return TextUtils::roundTo(static_cast<double>(count) / wordCount * 100.0, 2);
}

double KeywordAnalyzer::distributionScore(const std::vector<size_t>& positions, size_t length) {
    if (positions.empty() || length == 0) {
        return 0.0;
    }
    double idealGap = static_cast<double>(length) / (positions.size() + 1);
    double totalDeviation = 0.0;
    for (size_t i = 0; i < positions.size(); ++i) {
        double ideal = idealGap * (i + 1);
        totalDeviation += std::fabs(static_cast<double>(positions[i]) - ideal);
    }
    double averageDeviation = totalDeviation / positions.size();
    double normalized = averageDeviation / (static_cast<double>(length) / 2.0);
    double score = 10.0 - normalized * 10.0;
    return TextUtils::roundTo(std::max(0.0, std::min(10.0, score)), 1);
}

double KeywordAnalyzer::gapRegularityScore(const std::vector<size_t>& positions, size_t length) {
    if (positions.size() < 2 || length == 0) {
        return 0.5;
    }
    double idealSpacing = static_cast<double>(length) / (positions.size() + 1);
    double totalDeviation = 0.0;
    for (size_t i = 1; i < positions.size(); ++i) {
        double gap = static_cast<double>(positions[i] - positions[i - 1]);
        totalDeviation += std::fabs(gap - idealSpacing) / idealSpacing;
    }
    double average = totalDeviation / (positions.size() - 1);
    return std::max(0.0, 1.0 - std::min(1.0, average));
}

std::string KeywordAnalyzer::keywordVariation(const std::string& keyword) {
    if (keyword.empty()) {
        return keyword;
    }
    if (keyword.back() == 's') {
        return keyword.substr(0, keyword.size() - 1);
    }
    return keyword + "s";
}

bool KeywordAnalyzer::isStopWord(const std::string& word) const {
    return std::find(config_.stopWords.begin(), config_.stopWords.end(), word) != config_.stopWords.end();
}

bool KeywordAnalyzer::urlContainsKeyword(const std::string& url, const std::string& keyword) {
    if (url.empty() || keyword.empty()) {
        return false;
    }
    std::string lowerUrl = TextUtils::toLower(url);
    std::string slug = keyword;
    std::replace(slug.begin(), slug.end(), ' ', '-');
    return TextUtils::contains(lowerUrl, keyword) || TextUtils::contains(lowerUrl, slug);
}

AnalysisResult<KeywordAnalysis> KeywordAnalyzer::analyze(const std::string& keyword,
                                                         const ExtractedContent& content,
                                                         const HtmlDocument* document,
                                                         const std::string& url) const {
    KeywordAnalysis analysis;
    analysis.keyword = normalizeKeyword(keyword);
    analysis.fallbackUsed = document == nullptr || content.fallbackUsed;

    std::string text = content.plainText();
    if (analysis.keyword.empty() || TextUtils::trim(text).empty()) {
        return AnalysisResult<KeywordAnalysis>(Outcome::Empty, analysis);
    }

    std::string lower = TextUtils::toLower(text);
    analysis.positions = TextUtils::findAll(lower, analysis.keyword);
    analysis.count = analysis.positions.size();
    analysis.wordCount = TextUtils::countWords(text);
    analysis.textLength = lower.size();
    analysis.density = calculateDensity(analysis.count, analysis.wordCount);

    if (!analysis.positions.empty()) {
        analysis.positionPercent = TextUtils::roundTo(
            static_cast<double>(analysis.positions.front()) / std::max<size_t>(analysis.textLength, 1) * 100.0, 2);
    }
    analysis.distributionScore = distributionScore(analysis.positions, analysis.textLength);
    if (analysis.count > 1) {
        analysis.spread = TextUtils::roundTo(
            static_cast<double>(analysis.positions.back() - analysis.positions.front()) / analysis.textLength, 2);
    }
    analysis.contextualScore = countContextualSignals(analysis.keyword, text);

    analyzeStructure(analysis, content, document, url);
    analyzeSemanticUsage(analysis, text);
    analyzeCompetitive(analysis);
    analyzeTermFrequencies(analysis, lower);

    analysis.hasSufficientUsage = analysis.count > 0 &&
        analysis.density >= config_.minOptimalDensity &&
        analysis.density <= config_.maxOptimalDensity &&
        analysis.positionPercent.value_or(100.0) < config_.maxFirstPositionPercent &&
        analysis.spread > config_.minSpread;

    Outcome outcome = analysis.fallbackUsed ? Outcome::ParseFailure : Outcome::Ok;
    return AnalysisResult<KeywordAnalysis>(outcome, analysis);
}

void KeywordAnalyzer::analyzeStructure(KeywordAnalysis& analysis, const ExtractedContent& content,
                                       const HtmlDocument* document, const std::string& url) const {
    const std::string& keyword = analysis.keyword;
    auto hasKeyword = [&keyword](const std::string& text) {
        return TextUtils::contains(TextUtils::toLower(text), keyword);
    };

    std::vector<std::string> paragraphs = content.paragraphs();
    analysis.structure.firstParagraphHasKeyword = !paragraphs.empty() && hasKeyword(paragraphs.front());

    if (!document) {
        // Degraded path: only scanner paragraphs and headings are available
        for (const auto& heading : content.headings()) {
            analysis.inHeadings.totalHeadings++;
            if (hasKeyword(heading.text)) {
                analysis.inHeadings.count++;
                if (std::find(analysis.inHeadings.levels.begin(), analysis.inHeadings.levels.end(), heading.level) ==
                    analysis.inHeadings.levels.end()) {
                    analysis.inHeadings.levels.push_back(heading.level);
                }
            }
        }
        std::sort(analysis.inHeadings.levels.begin(), analysis.inHeadings.levels.end());
        return;
    }

    for (int level = 1; level <= 6; ++level) {
        analysis.structure.headings[level] = KeywordAnalysis::HeadingLevel();
    }
    for (const auto& heading : content.headings()) {
        auto& stats = analysis.structure.headings[heading.level];
        stats.count++;
        stats.texts.push_back(heading.text);
        if (hasKeyword(heading.text)) {
            stats.keywordMatches++;
        }
    }

    analysis.structure.paragraphsTotal = paragraphs.size();
    for (const auto& paragraph : paragraphs) {
        if (hasKeyword(paragraph)) {
            analysis.structure.paragraphsWithKeyword++;
        }
    }
    analysis.structure.paragraphDistributionPercentage = paragraphs.empty() ? 0.0 :
        TextUtils::roundTo(static_cast<double>(analysis.structure.paragraphsWithKeyword) / paragraphs.size() * 100.0, 2);

    analysis.structure.titleHasKeyword = hasKeyword(document->title());
    analysis.structure.descriptionHasKeyword = hasKeyword(document->metaDescription());
    analysis.structure.urlHasKeyword = urlContainsKeyword(url.empty() ? document->baseUrl() : url, keyword);

    // Heading presence counts every heading on the page, chrome included
    for (const auto& node : document->query("//h1|//h2|//h3|//h4|//h5|//h6")) {
        analysis.inHeadings.totalHeadings++;
        if (hasKeyword(HtmlDocument::visibleText(node))) {
            analysis.inHeadings.count++;
            int level = node.tagName()[1] - '0';
            if (std::find(analysis.inHeadings.levels.begin(), analysis.inHeadings.levels.end(), level) ==
                analysis.inHeadings.levels.end()) {
                analysis.inHeadings.levels.push_back(level);
            }
        }
    }
    std::sort(analysis.inHeadings.levels.begin(), analysis.inHeadings.levels.end());
}

void KeywordAnalyzer::analyzeSemanticUsage(KeywordAnalysis& analysis, const std::string& text) const {
    const std::string& keyword = analysis.keyword;
    std::string lower = TextUtils::toLower(text);
    KeywordAnalysis::SemanticUsage& semantic = analysis.semantic;

    std::string variation = keywordVariation(keyword);
    semantic.variations.emplace_back(variation, TextUtils::countOccurrences(lower, variation));

    std::string escaped = TextUtils::regexEscape(keyword);
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    std::vector<std::regex> stuffing = {
        std::regex(escaped + ".{0,10}" + escaped, flags),
        std::regex("^" + escaped, flags),
        std::regex(escaped + "\\s*,\\s*" + escaped, flags)
    };

    size_t keywordSentences = 0;
    for (const auto& sentence : TextUtils::splitSentences(text)) {
        if (!TextUtils::contains(TextUtils::toLower(sentence), keyword)) {
            continue;
        }
        keywordSentences++;
        if (semantic.contexts.size() < config_.maxContexts) {
            semantic.contexts.push_back(sentence);
        }
        for (const auto& pattern : stuffing) {
            if (std::regex_search(sentence, pattern)) {
                semantic.stuffingPatterns++;
                break;
            }
        }
    }

    double forced = keywordSentences > 0
        ? static_cast<double>(semantic.stuffingPatterns) / keywordSentences * 100.0
        : 0.0;
    semantic.forcedUsagePercentage = TextUtils::roundTo(forced, 2);
    semantic.appearsNatural = forced < config_.naturalUsageThreshold;

    semantic.occurrences = analysis.count;
    if (analysis.positions.size() > 1) {
        double totalGap = 0.0;
        for (size_t i = 1; i < analysis.positions.size(); ++i) {
            totalGap += static_cast<double>(analysis.positions[i] - analysis.positions[i - 1]);
        }
        semantic.averageDistance = TextUtils::roundTo(totalGap / (analysis.positions.size() - 1), 2);
    }
    semantic.distributionScore = analysis.distributionScore;
}

void KeywordAnalyzer::analyzeCompetitive(KeywordAnalysis& analysis) const {
    KeywordAnalysis::Competitive& competitive = analysis.competitive;
    if (analysis.density < config_.idealDensityLow) {
        competitive.densityStatus = "underdensity";
    } else if (analysis.density > config_.idealDensityHigh) {
        competitive.densityStatus = "overdensity";
    } else {
        competitive.densityStatus = "optimal";
    }

    competitive.recommendedCount = static_cast<size_t>(
        std::ceil(static_cast<double>(analysis.wordCount) / config_.wordsPerRecommendedOccurrence));
    double ratio = competitive.recommendedCount > 0
        ? static_cast<double>(analysis.count) / competitive.recommendedCount
        : 0.0;
    competitive.countRatio = TextUtils::roundTo(ratio, 2);
    if (ratio < config_.insufficientCountRatio) {
        competitive.countStatus = "insufficient";
    } else if (ratio > config_.excessiveCountRatio) {
        competitive.countStatus = "excessive";
    } else {
        competitive.countStatus = "optimal";
    }
}

void KeywordAnalyzer::analyzeTermFrequencies(KeywordAnalysis& analysis, const std::string& lowerText) const {
    std::vector<std::string> keywordParts = TextUtils::splitWhitespace(analysis.keyword);
    auto isKeywordPart = [&keywordParts](const std::string& word) {
        return std::find(keywordParts.begin(), keywordParts.end(), word) != keywordParts.end();
    };

    std::vector<std::pair<std::string, size_t>> ranked = rankWordFrequencies(TextUtils::wordTokens(lowerText));

    for (const auto& entry : ranked) {
        if (analysis.lsiKeywords.size() >= config_.maxLsiKeywords) {
            break;
        }
        if (isStopWord(entry.first) || isKeywordPart(entry.first)) {
            continue;
        }
        analysis.lsiKeywords.push_back(entry);
    }

    analysis.cannibalization.primaryKeywordCount = analysis.count;
    for (const auto& entry : ranked) {
        if (analysis.cannibalization.competingKeywords.size() >= config_.maxCompetingKeywords) {
            break;
        }
        if (entry.second <= analysis.count) {
            break;
        }
        if (TextUtils::utf8Length(entry.first) < config_.minCompetingWordLength ||
            isStopWord(entry.first) || isKeywordPart(entry.first)) {
            continue;
        }
        analysis.cannibalization.competingKeywords.push_back(entry);
    }
    analysis.cannibalization.hasRisk = !analysis.cannibalization.competingKeywords.empty();
}

size_t KeywordAnalyzer::countContextualSignals(const std::string& keyword, const std::string& text) const {
    std::regex pattern("\\b" + TextUtils::regexEscape(keyword) + "\\b.{0," +
                       std::to_string(config_.contextWindow) + "}(" + config_.contextualPattern + ")",
                       std::regex::ECMAScript | std::regex::icase);
    auto begin = std::sregex_iterator(text.begin(), text.end(), pattern);
    return static_cast<size_t>(std::distance(begin, std::sregex_iterator()));
}

DensityAnalysis KeywordAnalyzer::analyzeDensity(const KeywordAnalysis& analysis, bool secondary) const {
    DensityAnalysis result;
    result.keyword = analysis.keyword;
    result.secondary = secondary;
    result.count = analysis.count;
    result.wordCount = analysis.wordCount;
    result.density = analysis.density;

    double minDensity = config_.minOptimalDensity;
    double maxDensity = config_.maxOptimalDensity;
    if (analysis.wordCount < config_.shortContentWords) {
        minDensity *= config_.shortContentMinFactor;
        maxDensity *= config_.shortContentMaxFactor;
    }
    if (secondary) {
        minDensity *= config_.secondaryKeywordFactor;
        maxDensity *= config_.secondaryKeywordFactor;
    }
    result.minOptimal = TextUtils::roundTo(minDensity, 2);
    result.maxOptimal = TextUtils::roundTo(maxDensity, 2);

    if (result.density < minDensity) {
        result.status = result.density < config_.severelyUnderusedDensity ? "severely_underused" : "underused";
    } else if (result.density > maxDensity) {
        result.status = result.density > config_.severelyOverusedDensity ? "severely_overused" : "overused";
    } else {
        result.status = "optimal";
    }

    result.expectedMin = static_cast<size_t>(std::ceil(analysis.wordCount * minDensity / 100.0));
    result.expectedMax = static_cast<size_t>(std::floor(analysis.wordCount * maxDensity / 100.0));
    if (result.density < minDensity && result.expectedMin > result.count) {
        result.adjustmentNeeded = result.expectedMin - result.count;
    } else if (result.density > maxDensity && result.count > result.expectedMax) {
        result.adjustmentNeeded = result.count - result.expectedMax;
    }

    double score;
    if (result.density <= 0.0) {
        score = 0.0;
    } else if (result.density < minDensity) {
        score = result.density / minDensity;
    } else if (result.density > maxDensity) {
        score = 1.0 - std::min(1.0, ((result.density - maxDensity) / maxDensity) * 1.5);
    } else {
        score = 1.0;
    }
    result.score = TextUtils::roundTo(score, 2);

    result.inTitle = analysis.structure.titleHasKeyword;
    result.inMetaDescription = analysis.structure.descriptionHasKeyword;
    result.inUrl = analysis.structure.urlHasKeyword;
    result.inHeadings = analysis.inHeadings.count > 0;
    result.inFirstParagraph = analysis.structure.firstParagraphHasKeyword;
    return result;
}

RelatedKeywordAnalysis KeywordAnalyzer::analyzeRelated(const std::string& primary,
                                                       const std::string& secondary,
                                                       const ExtractedContent& content) const {
    RelatedKeywordAnalysis result;
    result.keyword = normalizeKeyword(secondary);
    std::string primaryKeyword = normalizeKeyword(primary);

    std::string text = TextUtils::toLower(content.plainText());
    std::vector<size_t> positions = TextUtils::findAll(text, result.keyword);
    if (result.keyword.empty() || positions.empty()) {
        return result;
    }

    result.present = true;
    result.count = positions.size();
    result.density = calculateDensity(result.count, TextUtils::countWords(text));
    result.distributionScore = TextUtils::roundTo(gapRegularityScore(positions, text.size()), 2);

    // Context: co-occurrence with the primary keyword and signal words near each occurrence
    TermMatcher signals(config_.signalWords);
    size_t withPrimary = 0;
    size_t meaningful = 0;
    for (size_t pos : positions) {
        size_t start = pos > config_.contextWindow ? pos - config_.contextWindow : 0;
        size_t end = std::min(text.size(), pos + result.keyword.size() + config_.contextWindow);
        std::string window = text.substr(start, end - start);
        if (TextUtils::contains(window, primaryKeyword)) {
            withPrimary++;
        }
        if (signals.matchesAny(window)) {
            meaningful++;
        }
    }
    double n = static_cast<double>(positions.size());
    result.contextScore = TextUtils::roundTo(0.6 * (withPrimary / n) + 0.4 * (meaningful / n), 2);

    // Proximity: average distance to the nearest primary occurrence
    std::vector<size_t> primaryPositions = TextUtils::findAll(text, primaryKeyword);
    if (!primaryPositions.empty() && !text.empty()) {
        double totalDistance = 0.0;
        for (size_t pos : positions) {
            size_t nearest = std::numeric_limits<size_t>::max();
            for (size_t primaryPos : primaryPositions) {
                size_t distance = pos > primaryPos ? pos - primaryPos : primaryPos - pos;
                nearest = std::min(nearest, distance);
            }
            totalDistance += static_cast<double>(nearest);
        }
        double average = totalDistance / n;
        double quarter = static_cast<double>(text.size()) / 4.0;
        result.proximityScore = TextUtils::roundTo(1.0 - std::min(1.0, average / quarter), 2);
    }

    for (const auto& heading : content.headings()) {
        if (TextUtils::contains(TextUtils::toLower(heading.text), result.keyword)) {
            result.inHeadings = true;
            break;
        }
    }
    std::vector<std::string> paragraphs = content.paragraphs();
    if (!paragraphs.empty()) {
        result.inFirstParagraph = TextUtils::contains(TextUtils::toLower(paragraphs.front()), result.keyword);
        result.inLastParagraph = TextUtils::contains(TextUtils::toLower(paragraphs.back()), result.keyword);
    }
    return result;
}

KeywordBalance KeywordAnalyzer::analyzeBalance(double primaryDensity,
                                               const std::vector<double>& secondaryDensities) const {
    KeywordBalance balance;
    balance.primaryDensity = primaryDensity;

    if (primaryDensity <= 0.0 || secondaryDensities.empty()) {
        balance.status = "incomplete";
        balance.score = 0.5;
        balance.message = "Cannot calculate balance without both primary and secondary keywords";
        return balance;
    }

    double total = 0.0;
    for (double density : secondaryDensities) {
        total += density;
    }
    double average = total / secondaryDensities.size();
    balance.averageSecondaryDensity = TextUtils::roundTo(average, 2);

    double ratio = average > 0.0 ? primaryDensity / average : std::numeric_limits<double>::max();
    balance.ratio = TextUtils::roundTo(std::min(ratio, 100.0), 2);

    if (ratio < 1.0) {
        balance.status = "secondary_dominant";
        balance.score = 0.6;
        balance.message = "Secondary keywords are more prominent than your primary keyword. Consider rebalancing.";
    } else if (ratio <= 3.0) {
        balance.status = "well_balanced";
        balance.score = 1.0;
        balance.message = "Good balance between primary and secondary keywords.";
    } else if (ratio <= 5.0) {
        balance.status = "primary_heavy";
        balance.score = 0.7;
        balance.message = "Primary keyword is significantly more used than secondary keywords. Consider more topic diversity.";
    } else {
        balance.status = "primary_dominant";
        balance.score = 0.4;
        balance.message = "Content focuses too heavily on primary keyword at the expense of topic diversity.";
    }
    return balance;
}

json KeywordAnalyzer::checkKeywordPresence(const std::string& text, const std::vector<std::string>& keywords) const {
    json found = json::array();
    json missing = json::array();
    json details = json::object();
    std::string lower = TextUtils::toLower(text);

    for (const auto& raw : keywords) {
        std::string keyword = normalizeKeyword(raw);
        if (keyword.empty()) {
            continue;
        }
        size_t count = lower.empty() ? 0 : TextUtils::countOccurrences(lower, keyword);
        details[keyword] = {{"found", count > 0}, {"count", count}};
        if (count > 0) {
            found.push_back(keyword);
        } else {
            missing.push_back(keyword);
        }
    }

    return json{
        {"has_any_keyword", !found.empty()},
        {"keywords_found", found},
        {"keywords_missing", missing},
        {"details", details}
    };
}

json KeywordAnalyzer::checkKeywordCoverageInHeadings(const std::vector<ContentBlock>& headings,
                                                     const std::vector<std::string>& keywords) const {
    json coverage = json::object();
    size_t covered = 0;
    size_t total = 0;
    for (const auto& raw : keywords) {
        std::string keyword = normalizeKeyword(raw);
        if (keyword.empty()) {
            continue;
        }
        total++;
        std::vector<int> levels;
        size_t matches = 0;
        for (const auto& heading : headings) {
            if (TextUtils::contains(TextUtils::toLower(heading.text), keyword)) {
                matches++;
                if (std::find(levels.begin(), levels.end(), heading.level) == levels.end()) {
                    levels.push_back(heading.level);
                }
            }
        }
        std::sort(levels.begin(), levels.end());
        if (matches > 0) {
            covered++;
        }
        coverage[keyword] = {{"in_headings", matches > 0}, {"matches", matches}, {"levels", levels}};
    }
    return json{
        {"keywords", coverage},
        {"covered", covered},
        {"total", total},
        {"coverage_percentage", total > 0 ? TextUtils::roundTo(static_cast<double>(covered) / total * 100.0, 2) : 0.0}
    };
}

json KeywordAnalysis::toJson() const {
    json j;
    j["keyword"] = keyword;
    j["count"] = count;
    j["word_count"] = wordCount;
    j["density"] = density;
    j["position_percent"] = positionPercent ? json(*positionPercent) : json(nullptr);
    j["distribution_score"] = distributionScore;
    j["spread"] = spread;
    j["contextual_score"] = contextualScore;
    j["has_sufficient_usage"] = hasSufficientUsage;
    j["fallback_used"] = fallbackUsed;

    json headingsJson = json::object();
    for (const auto& entry : structure.headings) {
        headingsJson["h" + std::to_string(entry.first)] = {
            {"count", entry.second.count},
            {"keyword_matches", entry.second.keywordMatches},
            {"texts", entry.second.texts}
        };
    }
    j["structure"] = {
        {"headings", headingsJson},
        {"paragraphs", {
            {"total", structure.paragraphsTotal},
            {"with_keyword", structure.paragraphsWithKeyword},
            {"distribution_percentage", structure.paragraphDistributionPercentage}
        }},
        {"first_paragraph", {{"has_keyword", structure.firstParagraphHasKeyword}}},
        {"meta", {
            {"title_has_keyword", structure.titleHasKeyword},
            {"description_has_keyword", structure.descriptionHasKeyword},
            {"url_has_keyword", structure.urlHasKeyword}
        }}
    };

    j["in_headings"] = {
        {"count", inHeadings.count},
        {"levels", inHeadings.levels},
        {"total_headings", inHeadings.totalHeadings}
    };

    j["semantic_usage"] = {
        {"variations", pairsToJson(semantic.variations)},
        {"contexts", semantic.contexts},
        {"natural_usage", {
            {"stuffing_patterns", semantic.stuffingPatterns},
            {"forced_usage_percentage", semantic.forcedUsagePercentage},
            {"appears_natural", semantic.appearsNatural}
        }},
        {"keyword_proximity", {
            {"occurrences", semantic.occurrences},
            {"average_distance", semantic.averageDistance},
            {"distribution_score", semantic.distributionScore}
        }}
    };

    j["competitive"] = {
        {"density_status", competitive.densityStatus},
        {"count_status", competitive.countStatus},
        {"recommended_count", competitive.recommendedCount},
        {"count_ratio", competitive.countRatio}
    };

    json lsi = json::array();
    for (const auto& entry : lsiKeywords) {
        lsi.push_back({{"term", entry.first}, {"frequency", entry.second}});
    }
    j["lsi_keywords"] = lsi;

    json competing = json::array();
    for (const auto& entry : cannibalization.competingKeywords) {
        competing.push_back({{"term", entry.first}, {"count", entry.second}});
    }
    j["cannibalization"] = {
        {"primary_keyword_count", cannibalization.primaryKeywordCount},
        {"potential_competing_keywords", competing},
        {"has_cannibalization_risk", cannibalization.hasRisk}
    };
    return j;
}

json DensityAnalysis::toJson() const {
    return json{
        {"keyword", keyword},
        {"is_secondary", secondary},
        {"count", count},
        {"word_count", wordCount},
        {"density", density},
        {"optimal_range", {{"min", minOptimal}, {"max", maxOptimal}}},
        {"status", status},
        {"expected_count", {{"min", expectedMin}, {"max", expectedMax}}},
        {"adjustment_needed", adjustmentNeeded},
        {"score", score},
        {"structural_usage", {
            {"in_title", inTitle},
            {"in_meta_description", inMetaDescription},
            {"in_url", inUrl},
            {"in_headings", inHeadings},
            {"in_first_paragraph", inFirstParagraph}
        }}
    };
}

json RelatedKeywordAnalysis::toJson() const {
    return json{
        {"keyword", keyword},
        {"present", present},
        {"count", count},
        {"density", density},
        {"distribution_score", distributionScore},
        {"context_score", contextScore},
        {"proximity_score", proximityScore},
        {"important_elements", {
            {"headings", inHeadings},
            {"first_paragraph", inFirstParagraph},
            {"last_paragraph", inLastParagraph}
        }}
    };
}

json KeywordBalance::toJson() const {
    return json{
        {"primary_density", primaryDensity},
        {"average_secondary_density", averageSecondaryDensity},
        {"ratio", ratio},
        {"status", status},
        {"score", score},
        {"message", message}
    };
}
