#pragma once

#include <string>
#include <vector>
#include <cstddef>

// String helpers shared by the analyzers. All functions operate on UTF-8 input.
class TextUtils {
public:
    // Case folding (ASCII plus the Latin-1 supplement)
    static std::string toLower(const std::string& text);

    // Whitespace handling
    static std::string trim(const std::string& text);
    static std::string collapseWhitespace(const std::string& text);
    static std::vector<std::string> splitWhitespace(const std::string& text);
    static std::vector<std::string> split(const std::string& text, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Words are runs of letters, apostrophes and hyphens (digits do not count)
    static std::vector<std::string> wordTokens(const std::string& text);
    static size_t countWords(const std::string& text);

    // Sentences end at '.', '!' or '?' followed by whitespace; fragments without words are dropped
    static std::vector<std::string> splitSentences(const std::string& text);

    // HTML to text
    static std::string decodeEntities(const std::string& text);
    static std::string stripTags(const std::string& html);
    static std::string cleanHtml(const std::string& html);

    // Inner HTML of every <tag ...>...</tag> element, found by scanning (no DOM).
    // When positions is given it receives the byte offset of each opening tag.
    static std::vector<std::string> extractTagContents(const std::string& html, const std::string& tag,
                                                       std::vector<size_t>* positions = nullptr);

    // Unicode helpers
    static std::vector<char32_t> decodeUtf8(const std::string& text);
    static std::string encodeUtf8(char32_t codePoint);
    static size_t utf8Length(const std::string& text);
    static bool isLetterOrDigit(char32_t codePoint);
    static bool isPunctuationOrSpace(char32_t codePoint);
    static bool containsLetterOrDigit(const std::string& text);

    // Searching (case-sensitive; callers lowercase both sides for case-insensitive matching)
    static std::vector<size_t> findAll(const std::string& haystack, const std::string& needle);
    static size_t countOccurrences(const std::string& haystack, const std::string& needle);
    static bool contains(const std::string& haystack, const std::string& needle);
    static bool containsWord(const std::string& haystack, const std::string& word);
    static bool startsWith(const std::string& text, const std::string& prefix);
    static bool endsWith(const std::string& text, const std::string& suffix);

    static std::string regexEscape(const std::string& text);
    static size_t levenshtein(const std::string& a, const std::string& b);
    static double roundTo(double value, int decimals);

private:
    static bool isWordByte(unsigned char c);
};
