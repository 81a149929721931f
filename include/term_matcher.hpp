#pragma once

#include <string>
#include <vector>

// Case-insensitive whole-word matching of a list of terms (single words or phrases).
// Word boundaries treat any non-ASCII byte as a word character, so terms such as
// "überdies" or "également" match as whole words in UTF-8 text.
class TermMatcher {
public:
    TermMatcher() = default;

    // Constructor with an initial term list
    explicit TermMatcher(const std::vector<std::string>& terms);

    // Add a single term
    void addTerm(const std::string& term);

    // Replace the term list from a comma-separated string (e.g., "however,in fact")
    void setTerms(const std::string& termsStr);

    // Check if any term occurs in the text
    bool matchesAny(const std::string& text) const;

    // Terms that occur in the text, in term-list order
    std::vector<std::string> matchedTerms(const std::string& text) const;

    bool empty() const { return terms_.empty(); }
    const std::vector<std::string>& terms() const { return terms_; }

private:
    std::vector<std::string> terms_;

    // Helper methods
    std::vector<std::string> splitTermString(const std::string& termsStr) const;
};
