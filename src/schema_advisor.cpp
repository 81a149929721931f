#include "schema_advisor.hpp"
#include "term_matcher.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace {

bool containsValue(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void addUnique(std::vector<std::string>& values, const std::string& value) {
    if (!containsValue(values, value)) {
        values.push_back(value);
    }
}

// Path part of a URL, used in place of a page slug
std::string urlPath(const std::string& url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : url.find('/', start + 3);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = url.find_first_of("?#", start);
    return url.substr(start, end == std::string::npos ? std::string::npos : end - start);
}

}

json LocalSignals::toJson() const {
    json matches = json::object();
    for (const auto& match : keywordMatches) {
        matches[match.first] = match.second;
    }
    return json{
        {"has_address", hasAddress},
        {"has_phone", hasPhone},
        {"has_business_hours", hasBusinessHours},
        {"has_map", hasMap},
        {"has_reviews", hasReviews},
        {"local_keyword_matches", matches},
        {"local_keyword_match_count", keywordMatchCount},
        {"signal_strength", TextUtils::roundTo(signalStrength, 2)}
    };
}

json SchemaSuggestion::toJson() const {
    return json{
        {"has_schema", hasSchema},
        {"has_appropriate_schema", hasAppropriateSchema},
        {"is_relevant_for_local", relevantForLocal},
        {"primary_suggestion", primarySuggestion},
        {"content_schema_types", contentTypes},
        {"suggested_schema_types", suggestedTypes},
        {"local_signals", localSignals.toJson()},
        {"score", TextUtils::roundTo(score, 2)},
        {"suggestions", suggestions}
    };
}

SchemaAdvisor::SchemaAdvisor(const SchemaAdvisorConfig& config, const SchemaRules& rules)
    : config_(config), validator_(rules) {
    for (const auto& pattern : config_.localPagePatterns) {
        try {
            localPagePatterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("Invalid local page pattern '" + pattern + "': " + e.what());
        }
    }
}

SchemaSuggestion SchemaAdvisor::advise(const SchemaAdviceInput& input, const std::vector<SchemaEntity>& entities,
                                       const std::optional<LocalBusinessValidation>& businessValidation) const {
    SchemaSuggestion suggestion;
    suggestion.hasSchema = !entities.empty();
    suggestion.relevantForLocal = isRelevantPageType(input.postType, input.title, input.url, input.text);
    suggestion.localSignals = analyzeLocalSignals(input.text, input.html, input.localKeywords);
    suggestion.primarySuggestion = suggestSchemaType(suggestion.relevantForLocal, suggestion.localSignals,
                                                     input.localKeywords);
    suggestion.hasAppropriateSchema = suggestion.hasSchema &&
                                      hasAppropriateSchema(entities, suggestion.primarySuggestion);

    // Structural detection needs the DOM
    if (input.document) {
        suggestion.contentTypes = identifyContentSchemas(*input.document, input.postType);
    }

    suggestion.suggestedTypes.push_back(suggestion.primarySuggestion);
    for (const auto& type : suggestion.contentTypes) {
        addUnique(suggestion.suggestedTypes, type);
    }

    suggestion.score = scoreSuggestion(suggestion, businessValidation);
    suggestion.suggestions = suggestionCodes(suggestion, businessValidation);
    return suggestion;
}

std::vector<std::string> SchemaAdvisor::identifyContentSchemas(const HtmlDocument& document,
                                                               const std::string& postType) const {
    std::vector<std::string> types;

    if (containsValue(config_.articlePostTypes, postType) || hasArticleStructure(document)) {
        types.push_back("Article");
        if (hasNewsArticleCharacteristics(document)) {
            types.push_back("NewsArticle");
        }
        if (postType == "post" || hasBlogPostCharacteristics(document)) {
            types.push_back("BlogPosting");
        }
    }
    if (hasFaqStructure(document)) {
        types.push_back("FAQPage");
    }
    if (hasBreadcrumbNavigation(document)) {
        types.push_back("BreadcrumbList");
    }
    if (postType == "product" || hasProductStructure(document)) {
        types.push_back("Product");
    }
    if (postType == "recipe" || hasRecipeStructure(document)) {
        types.push_back("Recipe");
    }
    if (postType == "event" || hasEventStructure(document)) {
        types.push_back("Event");
    }
    if (hasHowToStructure(document)) {
        types.push_back("HowTo");
    }
    if (hasVideoContent(document)) {
        types.push_back("VideoObject");
    }
    if (postType == "review" || hasReviewStructure(document)) {
        types.push_back("Review");
    }
    return types;
}

bool SchemaAdvisor::hasArticleStructure(const HtmlDocument& document) const {
    if (!document.query("//article").empty()) {
        return true;
    }
    // A main heading followed by a few paragraphs
    return !document.query("//h1").empty() && document.query("//p").size() >= 3;
}

bool SchemaAdvisor::hasNewsArticleCharacteristics(const HtmlDocument& document) const {
    if (anyMatch(document, {
            "//time",
            "//*[contains(@class, 'date')]",
            "//*[contains(@class, 'published')]",
            "//*[contains(@class, 'time')]"})) {
        return true;
    }
    DomNode body = document.body();
    return body.valid() && TermMatcher(config_.newsKeywords).matchesAny(body.text());
}

bool SchemaAdvisor::hasBlogPostCharacteristics(const HtmlDocument& document) const {
    return anyMatch(document, {
        "//*[contains(@class, 'blog')]",
        "//*[contains(@class, 'post')]",
        "//*[contains(@class, 'author')]",
        "//*[contains(@class, 'comments')]",
        "//*[contains(@class, 'author-bio')]",
        "//*[contains(@class, 'about-author')]",
        "//div[contains(@class, 'author')]//img"});
}

bool SchemaAdvisor::hasFaqStructure(const HtmlDocument& document) const {
    if (anyMatch(document, {
            "//*[contains(@class, 'faq')]",
            "//*[@id='faq']",
            "//*[contains(@class, 'question')]",
            "//*[contains(@class, 'answer')]",
            "//dt[..//dd]"})) {
        return true;
    }

    size_t questions = 0;
    for (const auto& node : document.query("//h3[../p] | //h4[../p] | //strong[../p]")) {
        if (node.text().find('?') != std::string::npos) {
            ++questions;
        }
    }
    return questions >= 3;
}

bool SchemaAdvisor::hasBreadcrumbNavigation(const HtmlDocument& document) const {
    return anyMatch(document, {
        "//*[contains(@class, 'breadcrumb')]",
        "//*[@id='breadcrumbs']",
        "//nav//ol/li/a",
        "//nav//ul[count(./li/a) > 1]"});
}

bool SchemaAdvisor::hasProductStructure(const HtmlDocument& document) const {
    if (anyMatch(document, {
            "//*[contains(@class, 'product')]",
            "//*[contains(@class, 'price')]",
            "//*[contains(@class, 'add-to-cart')]",
            "//*[contains(@class, 'buy-now')]",
            "//*[contains(@class, 'shop')]",
            "//*[contains(@class, 'item')]//img"})) {
        return true;
    }
    // Prices such as "$19.99", "€1.299,00" or "£ 5"
    return visibleTextMatches(document, "//text()", R"((?:\$|€|£)\s*\d{1,3}(?:[.,]\d{3})*(?:[.,]\d{2})?)");
}

bool SchemaAdvisor::hasRecipeStructure(const HtmlDocument& document) const {
    const std::string lower = "translate(., 'ABCDEFGHIJKLMNOPQRSTUVWXYZ', 'abcdefghijklmnopqrstuvwxyz')";
    std::string unitItem = "./li[";
    const char* units[] = {"cup", "tbsp", "tsp", "gram", "oz"};
    for (size_t i = 0; i < 5; ++i) {
        unitItem += (i ? " or " : "") + std::string("contains(") + lower + ", '" + units[i] + "')";
    }
    unitItem += "]";

    return anyMatch(document, {
        "//*[contains(@class, 'recipe')]",
        "//*[contains(@class, 'ingredients')]",
        "//*[contains(@class, 'instructions')]",
        "//*[contains(@class, 'cooking-time')]",
        "//*[contains(@class, 'prep-time')]",
        "//h2[contains(" + lower + ", 'ingredients')]",
        "//h3[contains(" + lower + ", 'ingredients')]",
        "//ul[" + unitItem + "]",
        "//ol[preceding::*[contains(" + lower + ", 'ingredients')]]"});
}

bool SchemaAdvisor::hasEventStructure(const HtmlDocument& document) const {
    if (anyMatch(document, {
            "//*[contains(@class, 'event')]",
            "//*[contains(@class, 'calendar')]",
            "//*[contains(@class, 'schedule')]",
            "//*[contains(@class, 'venue')]",
            "//*[contains(@class, 'location')]",
            "//*[contains(@class, 'date')]",
            "//*[contains(@class, 'time')]"})) {
        return true;
    }
    return visibleTextMatches(document,
                              "//text()[contains(., 'Date:') or contains(., 'Time:') or contains(., 'Location:')]", "");
}

bool SchemaAdvisor::hasHowToStructure(const HtmlDocument& document) const {
    const std::string howTo = "contains(translate(., 'HOWT', 'howt'), 'how to')";
    return anyMatch(document, {
        "//title[" + howTo + "]",
        "//h1[" + howTo + "] | //h2[" + howTo + "]",
        "//*[contains(@class, 'step')]",
        "//*[contains(@class, 'how-to')]",
        "//*[contains(@class, 'instructions')]",
        "//ol[count(./li) >= 3]",
        "//h3[contains(., 'Step 1') or contains(., 'Step 2')] | //h4[contains(., 'Step 1') or contains(., 'Step 2')]"});
}

bool SchemaAdvisor::hasReviewStructure(const HtmlDocument& document) const {
    return anyMatch(document, {
        "//*[contains(@class, 'review')]",
        "//*[contains(@class, 'rating')]",
        "//*[contains(@class, 'stars')]",
        "//*[contains(@class, 'testimonial')]",
        "//span[contains(@class, 'star')]",
        "//text()[contains(., '/5') or contains(., '/10')]"});
}

bool SchemaAdvisor::hasVideoContent(const HtmlDocument& document) const {
    return anyMatch(document, {
        "//video",
        "//iframe[contains(@src, 'youtube.com')]",
        "//iframe[contains(@src, 'vimeo.com')]",
        "//iframe[contains(@src, 'wistia.com')]",
        "//object[contains(@data, '.mp4') or contains(@data, '.webm')]",
        "//*[contains(@class, 'video')]",
        "//*[contains(@class, 'player')]"});
}

LocalSignals SchemaAdvisor::analyzeLocalSignals(const std::string& text, const std::string& html,
                                                const std::vector<std::string>& localKeywords) const {
    static const std::regex address(
        R"(\b\d+\s+[A-Za-z]+\s+(?:Street|St|Avenue|Ave|Road|Rd|Boulevard|Blvd|Drive|Dr|Lane|Ln|Court|Ct)\b)",
        std::regex::icase);
    static const std::regex phone(R"((?:\+\d{1,2}\s)?\(?\d{3}\)?[\s.-]?\d{3}[\s.-]?\d{4})");
    static const std::regex timeOrDay(
        R"(\d{1,2}(?::\d{2})?\s*(?:am|pm|a\.m\.|p\.m\.)|monday|tuesday|wednesday|thursday|friday|saturday|sunday)");

    LocalSignals signals;
    std::string lower = TextUtils::toLower(text);

    signals.hasAddress = std::regex_search(text, address);
    signals.hasPhone = std::regex_search(text, phone);

    // Opening hours: a time or weekday somewhere after the first "open" or "hours"
    size_t trigger = std::min(lower.find("open"), lower.find("hours"));
    if (trigger != std::string::npos) {
        std::string rest = lower.substr(trigger);
        signals.hasBusinessHours = std::regex_search(rest, timeOrDay);
    }

    for (const auto& keyword : localKeywords) {
        std::string needle = TextUtils::toLower(TextUtils::trim(keyword));
        if (needle.empty()) {
            continue;
        }
        size_t count = TextUtils::countOccurrences(lower, needle);
        if (count > 0) {
            signals.keywordMatches.emplace_back(keyword, count);
            signals.keywordMatchCount += count;
        }
    }

    // Raw markup counts here so embedded map widgets are seen
    signals.hasMap = TextUtils::contains(html, "map");
    signals.hasReviews = TextUtils::contains(lower, "review") || TextUtils::contains(lower, "rating") ||
                         TextUtils::contains(lower, "star") || TextUtils::contains(lower, "testimonial");

    double count = (signals.hasAddress ? 1.0 : 0.0) + (signals.hasPhone ? 1.0 : 0.0) +
                   (signals.hasBusinessHours ? 1.0 : 0.0) + (signals.hasMap ? 1.0 : 0.0) +
                   (signals.hasReviews ? 1.0 : 0.0) +
                   std::min(1.0, static_cast<double>(signals.keywordMatchCount) / 3.0);
    signals.signalStrength = std::min(1.0, count / 5.0);
    return signals;
}

bool SchemaAdvisor::isRelevantPageType(const std::string& postType, const std::string& title,
                                       const std::string& url, const std::string& text) const {
    std::string type = TextUtils::toLower(postType);
    if (containsValue(config_.localPostTypes, type)) {
        return true;
    }

    std::string path = urlPath(url);
    for (const auto& regex : localPagePatterns_) {
        if (std::regex_search(title, regex) || std::regex_search(path, regex)) {
            return true;
        }
    }

    return type == "page" && hasStreetAddress(text);
}

std::string SchemaAdvisor::suggestSchemaType(bool relevantPage, const LocalSignals& signals,
                                             const std::vector<std::string>& localKeywords) const {
    if (signals.hasAddress && !signals.hasBusinessHours && relevantPage) {
        return "Place";
    }
    if (!(signals.hasBusinessHours && signals.hasAddress)) {
        if (relevantPage && (signals.hasPhone || signals.hasMap)) {
            return "ProfessionalService";
        }
        if (!relevantPage && signals.signalStrength < config_.organizationSignalThreshold) {
            return "Organization";
        }
    }

    std::vector<std::string> parts = localKeywords;
    for (const auto& match : signals.keywordMatches) {
        parts.push_back(match.first);
    }
    std::string combined = TextUtils::toLower(TextUtils::join(parts, " "));

    std::string best = "LocalBusiness";
    int bestCount = 0;
    for (const auto& entry : config_.businessTypeKeywords) {
        const std::string& type = entry.first;
        int count = 0;
        for (const auto& keyword : entry.second) {
            if (TextUtils::contains(combined, keyword)) {
                ++count;
            }
        }
        if (signals.hasReviews && (type == "Restaurant" || type == "Hotel" || type == "Store")) {
            count += 2;
        }
        if (signals.hasBusinessHours && (type == "Store" || type == "Restaurant" || type == "AutomotiveBusiness")) {
            count += 1;
        }
        if (count > bestCount) {
            best = type;
            bestCount = count;
        }
    }
    return best;
}

bool SchemaAdvisor::hasAppropriateSchema(const std::vector<SchemaEntity>& entities,
                                         const std::string& suggestedType) const {
    for (const auto& entity : entities) {
        auto type = entity.data.find("@type");
        if (type == entity.data.end()) {
            continue;
        }
        if (type->is_array()) {
            if (containsValue(entity.types(), suggestedType)) {
                return true;
            }
            continue;
        }
        std::string name = type->is_string() ? type->get<std::string>() : "";
        if (name == suggestedType || validator_.belongsToSchemaType(name, suggestedType)) {
            return true;
        }
    }
    return false;
}

bool SchemaAdvisor::hasStreetAddress(const std::string& text) {
    // Number, street name and street type, then optional direction, unit and "City, ST 12345"
    static const std::regex street(
        R"(\b\d{1,6}\s*(?:N|S|E|W|NE|NW|SE|SW)?\.?\s*)"
        R"((?:[A-Za-z0-9]+(?:['-][A-Za-z0-9]+)?(?:\s+[A-Za-z0-9]+(?:['-][A-Za-z0-9]+)?){0,4})\s+)"
        R"((?:Street|St\.?|Avenue|Ave\.?|Road|Rd\.?|Boulevard|Blvd\.?|Drive|Dr\.?|Lane|Ln\.?|Court|Ct\.?|)"
        R"(Circle|Cir\.?|Place|Pl\.?|Terrace|Ter\.?|Way|Parkway|Pkwy|Square|Sq\.?|Trail|Trl\.?|Highway|Hwy|)"
        R"(Route|Rte\.?|Crescent|Cres\.?|Close|Cl\.?|Grove|Grv\.?|Alley|Aly|Mews|Row|Gardens|Gdns\.?))"
        R"(\s*(?:N|S|E|W|NE|NW|SE|SW)?\.?)"
        R"(\s*(?:,?-?\s*(?:Apt|Apartment|Unit|Suite|Ste|Floor|Fl|Bldg|Building|#)\s*[\w-]+)?)"
        R"((?:\s*,\s*[A-Za-z .-]{2,}(?:\s*,\s*[A-Z]{2})?\s*\d{5}(?:-\d{4})?)?\b)",
        std::regex::icase);
    return std::regex_search(text, street);
}

bool SchemaAdvisor::anyMatch(const HtmlDocument& document, const std::vector<std::string>& xpaths) const {
    for (const auto& xpath : xpaths) {
        if (!document.query(xpath).empty()) {
            return true;
        }
    }
    return false;
}

bool SchemaAdvisor::visibleTextMatches(const HtmlDocument& document, const std::string& xpath,
                                       const std::string& pattern) const {
    std::regex regex;
    if (!pattern.empty()) {
        regex = std::regex(pattern);
    }
    for (const auto& node : document.query(xpath)) {
        std::string parent = node.parent().tagName();
        if (parent.empty() || parent == "script" || parent == "style" || parent == "noscript") {
            continue;
        }
        if (pattern.empty() || std::regex_search(node.text(), regex)) {
            return true;
        }
    }
    return false;
}

double SchemaAdvisor::scoreSuggestion(const SchemaSuggestion& suggestion,
                                      const std::optional<LocalBusinessValidation>& businessValidation) {
    double score = 0.0;
    if (suggestion.hasSchema) {
        score += 0.4;
    }
    if (suggestion.hasAppropriateSchema) {
        score += 0.4;
    }
    if (businessValidation) {
        if (businessValidation->valid) {
            score += 0.1;
        }
        score += std::min(0.1, businessValidation->completeness / 1000.0);
    } else if (suggestion.hasAppropriateSchema) {
        score += 0.2;
    }
    return score;
}

std::vector<std::string> SchemaAdvisor::suggestionCodes(const SchemaSuggestion& suggestion,
                                                        const std::optional<LocalBusinessValidation>& businessValidation) {
    if (!suggestion.hasSchema) {
        return {"missing_schema_markup"};
    }
    std::vector<std::string> codes;
    if (!suggestion.hasAppropriateSchema && !suggestion.primarySuggestion.empty()) {
        codes.push_back("improper_schema_type_used");
    }
    if (businessValidation && !businessValidation->valid && !businessValidation->missingRequired.empty()) {
        codes.push_back("invalid_localbusiness_schema");
    }
    return codes;
}
