#include "term_matcher.hpp"
#include "text_utils.hpp"
#include <algorithm>

TermMatcher::TermMatcher(const std::vector<std::string>& terms) {
    for (const auto& term : terms) {
        addTerm(term);
    }
}

void TermMatcher::addTerm(const std::string& term) {
    std::string normalized = TextUtils::collapseWhitespace(TextUtils::toLower(TextUtils::trim(term)));
    if (normalized.empty()) {
        return;
    }
    if (std::find(terms_.begin(), terms_.end(), normalized) == terms_.end()) {
        terms_.push_back(normalized);
    }
}

void TermMatcher::setTerms(const std::string& termsStr) {
    terms_.clear();
    for (const auto& term : splitTermString(termsStr)) {
        addTerm(term);
    }
}

std::vector<std::string> TermMatcher::splitTermString(const std::string& termsStr) const {
    return TextUtils::split(termsStr, ',');
}

bool TermMatcher::matchesAny(const std::string& text) const {
    if (terms_.empty() || text.empty()) {
        return false;
    }
    std::string lower = TextUtils::toLower(text);
    for (const auto& term : terms_) {
        if (TextUtils::containsWord(lower, term)) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> TermMatcher::matchedTerms(const std::string& text) const {
    std::vector<std::string> matched;
    if (text.empty()) {
        return matched;
    }
    std::string lower = TextUtils::toLower(text);
    for (const auto& term : terms_) {
        if (TextUtils::containsWord(lower, term)) {
            matched.push_back(term);
        }
    }
    return matched;
}
