#include "intent_classifier.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::regex compilePattern(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid intent pattern '" + pattern + "': " + e.what());
    }
}

bool containsAny(const std::string& lowerText, const std::vector<std::string>& fragments) {
    return std::any_of(fragments.begin(), fragments.end(),
        [&lowerText](const std::string& fragment) { return TextUtils::contains(lowerText, fragment); });
}

}

json IntentProfile::toJson() const {
    json markersJson = json::object();
    for (const auto& marker : markers) {
        markersJson[marker.first] = marker.second;
    }
    json scoresJson = json::object();
    for (const auto& score : scores) {
        scoresJson[score.first] = score.second;
    }
    return json{
        {"detected_intent", detectedIntent},
        {"intent_scores", scoresJson},
        {"intent_markers", markersJson},
        {"intent_satisfaction_score", TextUtils::roundTo(satisfactionScore, 4)}
    };
}

IntentClassifier::IntentClassifier(const IntentConfig& config)
    : config_(config),
      brandRegex_(compilePattern(config.brandPattern)) {

    for (const auto& entry : config_.patterns) {
        auto& compiled = compiledPatterns_[entry.first];
        for (const auto& pattern : entry.second) {
            compiled.emplace_back(compilePattern(pattern.pattern), pattern.weight);
        }
    }

    for (const auto& entry : config_.markerRules) {
        auto& compiled = compiledRules_[entry.first];
        for (const auto& rule : entry.second) {
            CompiledRule compiledRule{rule, !rule.textPattern.empty(), std::regex()};
            if (compiledRule.hasText) {
                compiledRule.text = compilePattern(rule.textPattern);
            }
            compiled.push_back(std::move(compiledRule));
        }
    }
}

IntentClassification IntentClassifier::classify(const std::string& keyword, const std::string& postType) const {
    IntentClassification result;
    std::string normalized = TextUtils::toLower(TextUtils::trim(keyword));

    for (const auto& intent : config_.intents) {
        result.scores[intent] = 0.0;
    }

    for (const auto& entry : compiledPatterns_) {
        for (const auto& pattern : entry.second) {
            if (std::regex_search(normalized, pattern.first)) {
                result.scores[entry.first] += pattern.second;
            }
        }
    }

    for (const auto& prior : config_.postTypePriors) {
        if (prior.postType == postType) {
            result.scores[prior.intent] += prior.boost;
        }
    }

    if (std::regex_search(normalized, brandRegex_)) {
        result.scores["navigational"] += config_.brandBoost;
    }

    for (const auto& term : config_.productTerms) {
        if (TextUtils::contains(normalized, term)) {
            result.scores["commercial"] += config_.productCommercialBoost;
            result.scores["transactional"] += config_.productTransactionalBoost;
        }
    }

    // Highest score wins; equal scores keep the configured order
    auto winner = [&result, this]() {
        std::string best;
        double bestScore = 0.0;
        for (const auto& intent : config_.intents) {
            double score = result.scores[intent];
            if (best.empty() || score > bestScore) {
                best = intent;
                bestScore = score;
            }
        }
        return std::make_pair(best, bestScore);
    };

    auto top = winner();
    if (top.first == "commercial" && TextUtils::contains(normalized, config_.purchaseTerm)) {
        result.scores["transactional"] = top.second;
        top = winner();
    }

    if (top.second == 0.0) {
        result.intent = "informational";
    } else if (top.first == "commercial") {
        // Commercial investigation is reported as transactional
        result.intent = "transactional";
    } else {
        result.intent = top.first;
    }
    return result;
}

bool IntentClassifier::matchesRule(const CompiledRule& compiled, const HtmlDocument* document,
                                   const DomNode& region, const std::string& cleanText) const {
    if (compiled.hasText && std::regex_search(cleanText, compiled.text)) {
        return true;
    }
    if (!document || !region.valid()) {
        return false;
    }

    const IntentConfig::MarkerRule& rule = compiled.rule;
    for (const auto& tag : rule.elements) {
        for (const auto& node : document->query(".//" + tag, region)) {
            bool attributeMatch = rule.attributeFragments.empty();
            if (!attributeMatch) {
                for (const auto& attribute : node.attributes()) {
                    if (containsAny(TextUtils::toLower(attribute.second), rule.attributeFragments)) {
                        attributeMatch = true;
                        break;
                    }
                }
            }
            bool textMatch = rule.elementTextFragments.empty() ||
                             containsAny(TextUtils::toLower(HtmlDocument::visibleText(node)), rule.elementTextFragments);
            if (attributeMatch && textMatch) {
                return true;
            }
        }
    }
    return false;
}

bool IntentClassifier::hasStructuredContent(const HtmlDocument& document, const DomNode& region) const {
    if (document.query(".//h1 | .//h2 | .//h3 | .//h4 | .//h5 | .//h6", region).empty()) {
        return false;
    }
    if (!document.query(".//ul | .//ol", region).empty()) {
        return true;
    }
    for (const auto& paragraph : document.query(".//p", region)) {
        if (TextUtils::utf8Length(HtmlDocument::visibleText(paragraph)) >= config_.minParagraphLength) {
            return true;
        }
    }
    for (const auto& container : document.query(".//section | .//div", region)) {
        std::string classAndId = TextUtils::toLower(container.attribute("class") + " " + container.attribute("id"));
        if (containsAny(classAndId, config_.sectionFragments)) {
            return true;
        }
    }
    return false;
}

bool IntentClassifier::hasMultimedia(const HtmlDocument& document, const DomNode& region) const {
    for (const auto& image : document.query(".//img", region)) {
        if (!TextUtils::trim(image.attribute("src")).empty()) {
            return true;
        }
    }
    for (const auto& tag : config_.multimediaTags) {
        if (!document.query(".//" + tag, region).empty()) {
            return true;
        }
    }
    return false;
}

bool IntentClassifier::hasSemanticMarkup(const HtmlDocument& document) const {
    if (!document.query("//*[@itemscope] | //script[@type='application/ld+json']").empty()) {
        return true;
    }
    for (const auto& tag : config_.semanticTags) {
        if (document.queryFirst("//" + tag).valid()) {
            return true;
        }
    }
    if (document.queryFirst("//*[@*[starts-with(name(), 'aria-')]]").valid()) {
        return true;
    }
    return document.queryFirst("//meta[starts-with(@property, 'og:') or starts-with(@name, 'og:') or "
                               "starts-with(@property, 'twitter:') or starts-with(@name, 'twitter:')]").valid();
}

IntentMarkers IntentClassifier::detectMarkers(const HtmlDocument* document, const DomNode& region,
                                              const std::string& cleanText, const std::string& intent) const {
    IntentMarkers markers;
    bool dom = document && region.valid();
    markers.emplace_back("has_structured_content", dom && hasStructuredContent(*document, region));
    markers.emplace_back("has_multimedia", dom && hasMultimedia(*document, region));
    markers.emplace_back("has_semantic_markup", document && hasSemanticMarkup(*document));

    auto rules = compiledRules_.find(intent);
    if (rules == compiledRules_.end()) {
        return markers;
    }
    for (const auto& compiled : rules->second) {
        auto existing = std::find_if(markers.begin(), markers.end(),
            [&compiled](const std::pair<std::string, bool>& m) { return m.first == compiled.rule.name; });
        if (existing == markers.end()) {
            markers.emplace_back(compiled.rule.name, matchesRule(compiled, document, region, cleanText));
        } else if (!existing->second) {
            existing->second = matchesRule(compiled, document, region, cleanText);
        }
    }
    return markers;
}

bool IntentClassifier::markerSet(const IntentMarkers& markers, const std::string& name) {
    for (const auto& marker : markers) {
        if (marker.first == name) {
            return marker.second;
        }
    }
    return false;
}

bool IntentClassifier::markerMissing(const IntentMarkers& markers, const std::string& name) {
    for (const auto& marker : markers) {
        if (marker.first == name) {
            return !marker.second;
        }
    }
    return false;
}

double IntentClassifier::qualityMultiplier(const IntentMarkers& markers) {
    bool structured = markerSet(markers, "has_structured_content");
    bool multimedia = markerSet(markers, "has_multimedia");
    bool semantic = markerSet(markers, "has_semantic_markup");

    if (structured && multimedia && semantic) {
        return 1.2;
    }
    if (structured && multimedia) {
        return 1.1;
    }
    if (structured) {
        return 1.05;
    }
    if (!multimedia && !semantic) {
        return 0.8;
    }
    return 1.0;
}

double IntentClassifier::satisfactionScore(const IntentMarkers& markers, const std::string& intent) const {
    if (markers.empty()) {
        return 0.0;
    }

    auto intentWeights = config_.markerWeights.find(intent);
    double satisfied = 0.0;
    double total = 0.0;
    for (const auto& marker : markers) {
        double weight = 1.0;
        auto universal = config_.universalMarkerWeights.find(marker.first);
        if (universal != config_.universalMarkerWeights.end()) {
            weight = universal->second;
        } else if (intentWeights != config_.markerWeights.end()) {
            auto specific = intentWeights->second.find(marker.first);
            if (specific != intentWeights->second.end()) {
                weight = specific->second;
            }
        }
        if (marker.second) {
            satisfied += weight;
        }
        total += weight;
    }

    double score = total > 0.0 ? satisfied / total : 0.0;
    score *= qualityMultiplier(markers);

    auto set = [&markers](const char* name) { return markerSet(markers, name); };

    if (intent == "informational") {
        if (set("has_definition") && set("has_examples")) {
            score = std::min(1.0, score * 1.15);
        }
        if (set("has_definition") && set("has_examples") && set("has_step_by_step") && set("has_explanations")) {
            score = std::min(1.0, score * 1.1);
        }
    } else if (intent == "transactional") {
        if (set("has_call_to_action") && set("has_pricing")) {
            score = std::min(1.0, score * 1.15);
        }
        if (markerMissing(markers, "has_call_to_action")) {
            score *= 0.6;
        }
        if (set("has_call_to_action") && set("has_pricing") && set("has_product_details") && set("has_trust_signals")) {
            score = std::min(1.0, score * 1.1);
        }
    } else if (intent == "navigational") {
        if (set("has_direct_links")) {
            score = std::min(1.0, score * 1.15);
        }
        if (markerMissing(markers, "has_direct_links")) {
            score *= 0.5;
        }
        if (set("has_direct_links") && set("has_navigation_menu") && set("has_search_functionality")) {
            score = std::min(1.0, score * 1.1);
        }
    } else if (intent == "commercial") {
        if (set("has_comparison") && set("has_reviews")) {
            score = std::min(1.0, score * 1.15);
        }
        if (markerMissing(markers, "has_comparison")) {
            score *= 0.7;
        }
        if (set("has_comparison") && set("has_reviews") && set("has_pros_cons") && set("has_recommendations")) {
            score = std::min(1.0, score * 1.1);
        }
    }

    return std::max(0.0, std::min(1.0, score));
}

AnalysisResult<IntentProfile> IntentClassifier::analyze(const std::string& keyword, const std::string& postType,
                                                        const HtmlDocument* document, const DomNode& region,
                                                        const std::string& cleanText) const {
    IntentProfile profile;
    IntentClassification classification = classify(keyword, postType);
    profile.detectedIntent = classification.intent;
    profile.scores = classification.scores;
    profile.markers = detectMarkers(document, region, cleanText, profile.detectedIntent);
    profile.satisfactionScore = satisfactionScore(profile.markers, profile.detectedIntent);

    Outcome outcome = Outcome::Ok;
    if (TextUtils::trim(keyword).empty() || TextUtils::trim(cleanText).empty()) {
        outcome = Outcome::Empty;
    } else if (!document) {
        outcome = Outcome::ParseFailure;
    }
    return {outcome, std::move(profile)};
}
