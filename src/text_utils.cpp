#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>

std::string TextUtils::toLower(const std::string& text) {
    std::string result(text);
    for (size_t i = 0; i < result.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(result[i]);
        if (c >= 'A' && c <= 'Z') {
            result[i] = static_cast<char>(c + 32);
        } else if (c == 0xC3 && i + 1 < result.size()) {
            // U+00C0..U+00DE map to U+00E0..U+00FE, except the multiplication sign
            unsigned char next = static_cast<unsigned char>(result[i + 1]);
            if (next >= 0x80 && next <= 0x9E && next != 0x97) {
                result[i + 1] = static_cast<char>(next + 0x20);
            }
            ++i;
        }
    }
    return result;
}

std::string TextUtils::trim(const std::string& text) {
    const char* ws = " \t\n\r\f\v";
    size_t start = text.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(ws);
    return text.substr(start, end - start + 1);
}

std::string TextUtils::collapseWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool pendingSpace = false;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // Non-breaking space (C2 A0) counts as whitespace
        bool nbsp = (c == 0xC2 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0xA0);
        if (std::isspace(c) || nbsp) {
            pendingSpace = true;
            if (nbsp) {
                ++i;
            }
            continue;
        }
        if (pendingSpace && !result.empty()) {
            result += ' ';
        }
        pendingSpace = false;
        result += static_cast<char>(c);
    }
    return result;
}

std::vector<std::string> TextUtils::splitWhitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> TextUtils::split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, delimiter)) {
        part = trim(part);
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string TextUtils::join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::vector<std::string> TextUtils::wordTokens(const std::string& text) {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        // Hyphens may not start or end a word
        size_t start = current.find_first_not_of('-');
        size_t end = current.find_last_not_of('-');
        if (start != std::string::npos) {
            words.push_back(current.substr(start, end - start + 1));
        }
        current.clear();
    };

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (std::isalpha(c) || c == '\'' || c == '-') {
                current += static_cast<char>(c);
            } else {
                flush();
            }
            ++i;
            continue;
        }

        size_t length = (c >= 0xF0) ? 4 : (c >= 0xE0) ? 3 : (c >= 0xC0) ? 2 : 1;
        std::string sequence = text.substr(i, length);
        std::vector<char32_t> decoded = decodeUtf8(sequence);
        if (!decoded.empty() && isLetterOrDigit(decoded.front())) {
            current += sequence;
        } else {
            flush();
        }
        i += length;
    }
    flush();
    return words;
}

size_t TextUtils::countWords(const std::string& text) {
    return wordTokens(text).size();
}

std::vector<std::string> TextUtils::splitSentences(const std::string& text) {
    std::vector<std::string> sentences;
    size_t start = 0;

    auto emit = [&](size_t end) {
        std::string sentence = trim(text.substr(start, end - start));
        if (!sentence.empty() && countWords(sentence) >= 1) {
            sentences.push_back(sentence);
        }
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if ((c == '.' || c == '!' || c == '?') && i + 1 < text.size() &&
            std::isspace(static_cast<unsigned char>(text[i + 1]))) {
            emit(i + 1);
            start = i + 1;
        }
    }
    if (start < text.size()) {
        emit(text.size());
    }
    return sentences;
}

std::string TextUtils::decodeEntities(const std::string& text) {
    static const std::unordered_map<std::string, std::string> named = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", " "}, {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"hellip", "\xE2\x80\xA6"}, {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"ldquo", "\xE2\x80\x9C"}, {"rdquo", "\xE2\x80\x9D"}, {"copy", "\xC2\xA9"},
        {"reg", "\xC2\xAE"}, {"trade", "\xE2\x84\xA2"}, {"euro", "\xE2\x82\xAC"},
        {"laquo", "\xC2\xAB"}, {"raquo", "\xC2\xBB"}, {"middot", "\xC2\xB7"}
    };

    std::string result;
    result.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            result += text[i++];
            continue;
        }
        size_t semicolon = text.find(';', i + 1);
        if (semicolon == std::string::npos || semicolon - i > 10) {
            result += text[i++];
            continue;
        }
        std::string entity = text.substr(i + 1, semicolon - i - 1);
        if (!entity.empty() && entity[0] == '#') {
            char32_t codePoint = 0;
            bool valid = entity.size() > 1;
            bool hex = valid && (entity[1] == 'x' || entity[1] == 'X');
            for (size_t k = hex ? 2 : 1; valid && k < entity.size(); ++k) {
                unsigned char d = static_cast<unsigned char>(entity[k]);
                if (hex && std::isxdigit(d)) {
                    codePoint = codePoint * 16 + static_cast<char32_t>(std::isdigit(d) ? d - '0' : std::tolower(d) - 'a' + 10);
                } else if (!hex && std::isdigit(d)) {
                    codePoint = codePoint * 10 + static_cast<char32_t>(d - '0');
                } else {
                    valid = false;
                }
                if (codePoint > 0x10FFFF) {
                    valid = false;
                }
            }
            if (valid && (!hex || entity.size() > 2)) {
                result += encodeUtf8(codePoint);
                i = semicolon + 1;
                continue;
            }
        } else {
            auto it = named.find(entity);
            if (it != named.end()) {
                result += it->second;
                i = semicolon + 1;
                continue;
            }
        }
        result += text[i++];
    }
    return result;
}

std::string TextUtils::stripTags(const std::string& html) {
    std::string lower = toLower(html);
    std::string result;
    result.reserve(html.size());

    size_t i = 0;
    while (i < html.size()) {
        if (html[i] != '<') {
            result += html[i++];
            continue;
        }
        if (lower.compare(i, 4, "<!--") == 0) {
            size_t end = lower.find("-->", i + 4);
            i = (end == std::string::npos) ? html.size() : end + 3;
            result += ' ';
            continue;
        }
        bool skipped = false;
        for (const char* raw : {"script", "style"}) {
            std::string name(raw);
            if (lower.compare(i + 1, name.size(), name) == 0) {
                size_t after = i + 1 + name.size();
                if (after < lower.size() && std::isalnum(static_cast<unsigned char>(lower[after]))) {
                    continue;
                }
                size_t close = lower.find("</" + name, after);
                if (close == std::string::npos) {
                    i = html.size();
                } else {
                    size_t end = lower.find('>', close);
                    i = (end == std::string::npos) ? html.size() : end + 1;
                }
                result += ' ';
                skipped = true;
                break;
            }
        }
        if (skipped) {
            continue;
        }
        unsigned char next = (i + 1 < html.size()) ? static_cast<unsigned char>(html[i + 1]) : 0;
        if (std::isalpha(next) || next == '/' || next == '!' || next == '?') {
            size_t end = html.find('>', i + 1);
            i = (end == std::string::npos) ? html.size() : end + 1;
            result += ' ';
            continue;
        }
        result += html[i++];
    }
    return result;
}

std::string TextUtils::cleanHtml(const std::string& html) {
    return trim(collapseWhitespace(decodeEntities(stripTags(html))));
}

std::vector<std::string> TextUtils::extractTagContents(const std::string& html, const std::string& tag,
                                                      std::vector<size_t>* positions) {
    std::vector<std::string> contents;
    std::string lower = toLower(html);
    std::string open = "<" + toLower(tag);
    std::string close = "</" + toLower(tag);

    size_t pos = 0;
    while ((pos = lower.find(open, pos)) != std::string::npos) {
        size_t after = pos + open.size();
        if (after >= lower.size()) {
            break;
        }
        unsigned char boundary = static_cast<unsigned char>(lower[after]);
        if (boundary != '>' && boundary != '/' && !std::isspace(boundary)) {
            pos = after;
            continue;
        }
        size_t openEnd = lower.find('>', after);
        if (openEnd == std::string::npos) {
            break;
        }
        size_t closeStart = lower.find(close, openEnd + 1);
        if (closeStart == std::string::npos) {
            break;
        }
        contents.push_back(html.substr(openEnd + 1, closeStart - openEnd - 1));
        if (positions) {
            positions->push_back(pos);
        }
        pos = closeStart + close.size();
    }
    return contents;
}

std::vector<char32_t> TextUtils::decodeUtf8(const std::string& text) {
    std::vector<char32_t> codePoints;
    codePoints.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            // Stray continuation byte
            ++i;
            codePoints.push_back(0xFFFD);
            continue;
        }
        if (i + extra >= text.size()) {
            // Truncated sequence
            codePoints.push_back(0xFFFD);
            break;
        }
        for (size_t k = 1; k <= extra; ++k) {
            cp = (cp << 6) | (static_cast<unsigned char>(text[i + k]) & 0x3F);
        }
        codePoints.push_back(cp);
        i += extra + 1;
    }
    return codePoints;
}

std::string TextUtils::encodeUtf8(char32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

size_t TextUtils::utf8Length(const std::string& text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++length;
        }
    }
    return length;
}

bool TextUtils::isLetterOrDigit(char32_t cp) {
    if (cp < 0x80) {
        return std::isalnum(static_cast<unsigned char>(cp)) != 0;
    }
    if (cp < 0xC0) {
        return cp == 0xAA || cp == 0xB5 || cp == 0xBA;
    }
    if (cp == 0xD7 || cp == 0xF7) {
        return false;
    }
    // General punctuation, symbols, arrows, box drawing, dingbats
    if (cp >= 0x2000 && cp <= 0x2BFF) {
        return false;
    }
    // CJK symbols and punctuation
    if (cp >= 0x3000 && cp <= 0x303F) {
        return false;
    }
    // Fullwidth ASCII punctuation and halfwidth CJK punctuation
    if ((cp >= 0xFF01 && cp <= 0xFF0F) || (cp >= 0xFF1A && cp <= 0xFF20) ||
        (cp >= 0xFF3B && cp <= 0xFF40) || (cp >= 0xFF5B && cp <= 0xFF65)) {
        return false;
    }
    if ((cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xE000 && cp <= 0xF8FF) || cp == 0xFFFD) {
        return false;
    }
    // Emoji and pictographs
    if (cp >= 0x1F000 && cp <= 0x1FAFF) {
        return false;
    }
    return true;
}

bool TextUtils::isPunctuationOrSpace(char32_t cp) {
    return !isLetterOrDigit(cp);
}

bool TextUtils::containsLetterOrDigit(const std::string& text) {
    for (char32_t cp : decodeUtf8(text)) {
        if (isLetterOrDigit(cp)) {
            return true;
        }
    }
    return false;
}

std::vector<size_t> TextUtils::findAll(const std::string& haystack, const std::string& needle) {
    std::vector<size_t> positions;
    if (needle.empty()) {
        return positions;
    }
    size_t pos = 0;
    while ((pos = haystack.find(needle, pos)) != std::string::npos) {
        positions.push_back(pos);
        pos += needle.size();
    }
    return positions;
}

size_t TextUtils::countOccurrences(const std::string& haystack, const std::string& needle) {
    return findAll(haystack, needle).size();
}

bool TextUtils::contains(const std::string& haystack, const std::string& needle) {
    return !needle.empty() && haystack.find(needle) != std::string::npos;
}

bool TextUtils::isWordByte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool TextUtils::containsWord(const std::string& haystack, const std::string& word) {
    for (size_t pos : findAll(haystack, word)) {
        bool startOk = pos == 0 || !isWordByte(static_cast<unsigned char>(haystack[pos - 1]));
        size_t end = pos + word.size();
        bool endOk = end >= haystack.size() || !isWordByte(static_cast<unsigned char>(haystack[end]));
        if (startOk && endOk) {
            return true;
        }
    }
    return false;
}

bool TextUtils::startsWith(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool TextUtils::endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string TextUtils::regexEscape(const std::string& text) {
    static const std::string special = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

size_t TextUtils::levenshtein(const std::string& a, const std::string& b) {
    std::vector<size_t> previous(b.size() + 1);
    std::vector<size_t> current(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        previous[j] = j;
    }
    for (size_t i = 1; i <= a.size(); ++i) {
        current[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            current[j] = std::min({previous[j] + 1, current[j - 1] + 1, previous[j - 1] + cost});
        }
        std::swap(previous, current);
    }
    return previous[b.size()];
}

double TextUtils::roundTo(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}
