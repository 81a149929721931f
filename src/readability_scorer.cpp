#include "readability_scorer.hpp"
#include "term_matcher.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

using json = nlohmann::json;

namespace {

const char* NOT_APPLICABLE_LANGUAGE = "Analysis not applicable for this language";
const char* NOT_APPLICABLE_CJK = "N/A for CJK languages";

bool isCjkTerminator(char32_t cp) {
    return cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F || cp == 0xFF0E;
}

json distributionToJson(const std::vector<std::pair<std::string, size_t>>& distribution, size_t total) {
    json counts = json::object();
    json percentages = json::object();
    for (const auto& entry : distribution) {
        counts[entry.first] = entry.second;
        percentages[entry.first] = total > 0
            ? TextUtils::roundTo(static_cast<double>(entry.second) / total * 100.0, 2)
            : 0.0;
    }
    return json{{"counts", counts}, {"percentages", percentages}};
}

}

ReadabilityScorer::ReadabilityScorer(const ReadabilityConfig& config)
    : config_(config) {
}

std::string ReadabilityScorer::normalizeLanguage(const std::string& language) const {
    std::string normalized = TextUtils::toLower(TextUtils::trim(language));
    std::replace(normalized.begin(), normalized.end(), '_', '-');
    return normalized.empty() ? config_.defaultLanguage : normalized;
}

bool ReadabilityScorer::isCjkLanguage(const std::string& language) const {
    std::string normalized = normalizeLanguage(language);
    std::string primary = normalized.substr(0, normalized.find('-'));
    for (const auto& cjk : config_.cjkLanguages) {
        if (normalized == cjk || primary == cjk) {
            return true;
        }
    }
    return false;
}

size_t ReadabilityScorer::countSyllables(const std::string& word, const std::string& language) const {
    std::string lower = TextUtils::toLower(word);
    std::string primary = normalizeLanguage(language);
    primary = primary.substr(0, primary.find('-'));

    if (primary == "en") {
        std::string letters;
        for (char c : lower) {
            if (c >= 'a' && c <= 'z') {
                letters += c;
            }
        }
        if (letters.empty()) {
            return 0;
        }
        if (letters.size() <= 3) {
            return 1;
        }

        // Silent endings
        if (TextUtils::endsWith(letters, "e")) {
            letters.pop_back();
        }
        if (TextUtils::endsWith(letters, "es") || TextUtils::endsWith(letters, "ed")) {
            letters.erase(letters.size() - 2);
        }

        // Vowel groups of up to three letters each count once
        size_t count = 0;
        size_t run = 0;
        auto closeRun = [&]() {
            count += (run + 2) / 3;
            run = 0;
        };
        for (char c : letters) {
            if (std::string("aeiouy").find(c) != std::string::npos) {
                ++run;
            } else if (run > 0) {
                closeRun();
            }
        }
        if (run > 0) {
            closeRun();
        }
        return std::max<size_t>(count, 1);
    }

    // Other languages: every vowel letter, accented Latin vowels included
    static const std::u32string vowels =
        U"aeiouyàáâäãåèéêëìíîï"
        U"òóôöõùúûüæœ";
    size_t count = 0;
    for (char32_t cp : TextUtils::decodeUtf8(lower)) {
        if (vowels.find(cp) != std::u32string::npos) {
            ++count;
        }
    }
    return count;
}

bool ReadabilityScorer::isComplexWord(const std::string& word, const std::string& language) const {
    if (countSyllables(word, language) < 3) {
        return false;
    }
    std::string lower = TextUtils::toLower(word);
    std::string letters;
    for (char c : lower) {
        if (std::isalpha(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) >= 0x80) {
            letters += c;
        }
    }
    return std::find(config_.complexWordExceptions.begin(), config_.complexWordExceptions.end(), letters) ==
           config_.complexWordExceptions.end();
}

size_t ReadabilityScorer::countWordsForLanguage(const std::string& text, bool cjk) const {
    if (!cjk) {
        return TextUtils::splitWhitespace(text).size();
    }
    size_t count = 0;
    for (char32_t cp : TextUtils::decodeUtf8(text)) {
        if (!TextUtils::isPunctuationOrSpace(cp)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> ReadabilityScorer::splitSentences(const std::string& text, bool cjk) const {
    if (!cjk) {
        return TextUtils::splitSentences(text);
    }

    // CJK full stops end a sentence without trailing whitespace
    std::string marked;
    for (char32_t cp : TextUtils::decodeUtf8(text)) {
        marked += TextUtils::encodeUtf8(cp);
        if (isCjkTerminator(cp)) {
            marked += ". ";
        }
    }
    std::vector<std::string> sentences;
    for (auto& sentence : TextUtils::splitSentences(marked)) {
        if (TextUtils::endsWith(sentence, ".")) {
            std::string withoutMarker = sentence.substr(0, sentence.size() - 1);
            std::vector<char32_t> cps = TextUtils::decodeUtf8(withoutMarker);
            if (!cps.empty() && isCjkTerminator(cps.back())) {
                sentence = withoutMarker;
            }
        }
        sentences.push_back(sentence);
    }
    return sentences;
}

double ReadabilityScorer::fleschKincaid(size_t words, size_t sentences, size_t syllables) {
    if (words == 0 || sentences == 0) {
        return 0.0;
    }
    double score = 206.835
        - 1.015 * (static_cast<double>(words) / sentences)
        - 84.6 * (static_cast<double>(syllables) / words);
    return std::max(0.0, std::min(100.0, score));
}

double ReadabilityScorer::smogIndex(size_t complexWords, size_t sentences) {
    double sentenceCount = static_cast<double>(sentences);
    double complex = static_cast<double>(complexWords);
    if (sentenceCount < 30) {
        sentenceCount = std::max(1.0, sentenceCount);
        complex *= 30.0 / sentenceCount;
    }
    return 1.043 * std::sqrt(complex * (30.0 / sentenceCount)) + 3.1291;
}

double ReadabilityScorer::colemanLiau(size_t characters, size_t words, size_t sentences) {
    if (words == 0 || sentences == 0) {
        return 0.0;
    }
    double l = static_cast<double>(characters) / words * 100.0;
    double s = static_cast<double>(sentences) / words * 100.0;
    return 0.0588 * l - 0.296 * s - 15.8;
}

std::string ReadabilityScorer::gradeLevel(double score) {
    if (score >= 90) return "5th grade (Very easy to read)";
    if (score >= 80) return "6th grade (Easy to read)";
    if (score >= 70) return "7th grade (Fairly easy to read)";
    if (score >= 60) return "8th-9th grade (Plain English)";
    if (score >= 50) return "10th-12th grade (Fairly difficult)";
    if (score >= 30) return "College (Difficult)";
    return "College graduate (Very difficult)";
}

AnalysisResult<ReadabilityScorer::Report> ReadabilityScorer::analyze(
    const std::string& text,
    const std::vector<std::string>& paragraphs,
    const std::string& language) const {

    Report report;
    report.language = normalizeLanguage(language);
    report.cjk = isCjkLanguage(language);

    if (TextUtils::trim(text).empty()) {
        report.gradeLevel = report.cjk ? NOT_APPLICABLE_CJK : NOT_APPLICABLE_LANGUAGE;
        return AnalysisResult<Report>(Outcome::Empty, report);
    }

    std::vector<std::string> sentences = splitSentences(text, report.cjk);
    report.wordCount = countWordsForLanguage(text, report.cjk);
    report.sentenceCount = sentences.size();
    for (char32_t cp : TextUtils::decodeUtf8(text)) {
        if (!(cp < 0x80 && std::isspace(static_cast<int>(cp))) && cp != 0xA0 && cp != 0x3000) {
            ++report.characterCount;
        }
    }
    report.avgWordsPerSentence = report.sentenceCount > 0
        ? TextUtils::roundTo(static_cast<double>(report.wordCount) / report.sentenceCount, 2)
        : 0.0;

    if (!report.cjk) {
        size_t syllables = 0;
        size_t complex = 0;
        for (const auto& word : TextUtils::splitWhitespace(text)) {
            syllables += countSyllables(word, report.language);
            if (isComplexWord(word, report.language)) {
                ++complex;
            }
        }
        report.syllableCount = syllables;
        report.avgSyllablesPerWord = report.wordCount > 0
            ? TextUtils::roundTo(static_cast<double>(syllables) / report.wordCount, 2)
            : 0.0;
        report.complexWordCount = complex;
        double complexPercentage = report.wordCount > 0
            ? static_cast<double>(complex) / report.wordCount * 100.0
            : 0.0;
        report.complexWordPercentage = TextUtils::roundTo(complexPercentage, 2);
        report.complexWordsExceedThreshold = complexPercentage > config_.complexWordThreshold;

        double fk = fleschKincaid(report.wordCount, report.sentenceCount, syllables);
        report.fleschKincaid = TextUtils::roundTo(fk, 2);
        report.gradeLevel = syllables == 0 ? NOT_APPLICABLE_LANGUAGE : gradeLevel(fk);
        report.smog = TextUtils::roundTo(smogIndex(complex, report.sentenceCount), 2);
        report.passiveVoice = passiveVoiceStats(sentences);
        report.transitionWords = transitionStats(sentences, report.language);
    } else {
        report.gradeLevel = NOT_APPLICABLE_CJK;
    }

    report.colemanLiau = TextUtils::roundTo(
        colemanLiau(report.characterCount, report.wordCount, report.sentenceCount), 2);
    report.sentenceLengths = sentenceLengthStats(sentences, report.cjk);
    report.paragraphs = paragraphStats(paragraphs.empty() ? std::vector<std::string>{text} : paragraphs,
                                       report.cjk);

    return AnalysisResult<Report>(Outcome::Ok, report);
}

ReadabilityScorer::SentenceLengthStats ReadabilityScorer::sentenceLengthStats(
    const std::vector<std::string>& sentences, bool cjk) const {

    SentenceLengthStats stats;
    stats.distribution = {
        {"very_short", 0}, {"short", 0}, {"medium", 0},
        {"long", 0}, {"very_long", 0}, {"extremely_long", 0}
    };

    for (const auto& sentence : sentences) {
        size_t words = countWordsForLanguage(sentence, cjk);
        size_t bucket;
        if (words <= 5) bucket = 0;
        else if (words <= 10) bucket = 1;
        else if (words <= 15) bucket = 2;
        else if (words <= 20) bucket = 3;
        else if (words <= 25) bucket = 4;
        else bucket = 5;

        stats.distribution[bucket].second++;
        if (bucket >= 4 && stats.longSentences.size() < config_.maxLongSentenceExamples) {
            stats.longSentences.push_back(sentence);
        }
    }
    stats.total = sentences.size();
    return stats;
}

ReadabilityScorer::ParagraphStats ReadabilityScorer::paragraphStats(
    const std::vector<std::string>& paragraphs, bool cjk) const {

    ParagraphStats stats;
    size_t lower = 0;
    for (size_t bound : config_.paragraphLengthBands) {
        stats.distribution.emplace_back(std::to_string(lower) + "-" + std::to_string(bound), 0);
        lower = bound;
    }
    stats.distribution.emplace_back(std::to_string(lower) + "+", 0);

    size_t totalWords = 0;
    for (const auto& paragraph : paragraphs) {
        std::string trimmed = TextUtils::trim(paragraph);
        if (trimmed.empty()) {
            continue;
        }
        size_t words = countWordsForLanguage(trimmed, cjk);
        totalWords += words;
        stats.total++;

        size_t band = config_.paragraphLengthBands.size();
        for (size_t i = 0; i < config_.paragraphLengthBands.size(); ++i) {
            if (words <= config_.paragraphLengthBands[i]) {
                band = i;
                break;
            }
        }
        stats.distribution[band].second++;

        if (words > config_.longParagraphWords) {
            stats.longCount++;
            if (stats.longExamples.size() < config_.maxLongParagraphExamples) {
                std::string snippet = trimmed.substr(0, config_.paragraphSnippetLength);
                // Do not cut a UTF-8 sequence in half
                while (!snippet.empty() && snippet.size() < trimmed.size() &&
                       (static_cast<unsigned char>(trimmed[snippet.size()]) & 0xC0) == 0x80) {
                    snippet.pop_back();
                }
                stats.longExamples.push_back(snippet + "...");
            }
        }
    }
    stats.averageWords = stats.total > 0
        ? TextUtils::roundTo(static_cast<double>(totalWords) / stats.total, 2)
        : 0.0;
    return stats;
}

ReadabilityScorer::PassiveVoiceStats ReadabilityScorer::passiveVoiceStats(
    const std::vector<std::string>& sentences) const {

    static const std::regex passive(R"(\b(is|are|was|were|be|been|being)\s+(\w+ed|\w+en|\w+t)\b)",
                                    std::regex::ECMAScript | std::regex::icase);
    PassiveVoiceStats stats;
    for (const auto& sentence : sentences) {
        if (std::regex_search(sentence, passive)) {
            stats.count++;
            if (stats.examples.size() < config_.maxPassiveExamples) {
                stats.examples.push_back(sentence);
            }
        }
    }
    double percentage = sentences.empty() ? 0.0 : static_cast<double>(stats.count) / sentences.size() * 100.0;
    stats.percentage = TextUtils::roundTo(percentage, 2);
    stats.exceedsThreshold = percentage > config_.passiveVoiceThreshold;
    return stats;
}

ReadabilityScorer::TransitionStats ReadabilityScorer::transitionStats(
    const std::vector<std::string>& sentences, const std::string& language) const {

    std::string primary = language.substr(0, language.find('-'));
    auto it = config_.transitionWords.find(primary);
    if (it == config_.transitionWords.end()) {
        it = config_.transitionWords.find(config_.defaultLanguage);
    }
    TermMatcher matcher(it != config_.transitionWords.end() ? it->second : std::vector<std::string>{});

    TransitionStats stats;
    for (const auto& sentence : sentences) {
        if (matcher.matchesAny(sentence)) {
            stats.count++;
        }
    }
    double percentage = sentences.empty() ? 0.0 : static_cast<double>(stats.count) / sentences.size() * 100.0;
    stats.percentage = TextUtils::roundTo(percentage, 2);
    stats.meetsThreshold = percentage >= config_.transitionWordThreshold;
    return stats;
}

ReadabilityScorer::KeywordReadability ReadabilityScorer::analyzeKeywordReadability(
    const std::string& text, const std::string& keyword) const {

    KeywordReadability result;
    std::string needle = TextUtils::collapseWhitespace(TextUtils::toLower(TextUtils::trim(keyword)));
    size_t totalWords = 0;
    if (!needle.empty()) {
        for (const auto& sentence : TextUtils::splitSentences(text)) {
            if (TextUtils::contains(TextUtils::toLower(sentence), needle)) {
                result.sentencesWithKeyword++;
                totalWords += TextUtils::countWords(sentence);
            }
        }
    }
    double average = result.sentencesWithKeyword > 0
        ? static_cast<double>(totalWords) / result.sentencesWithKeyword
        : 0.0;
    result.averageSentenceLength = TextUtils::roundTo(average, 1);
    result.score = TextUtils::roundTo(
        10.0 - std::min(10.0, std::fabs(result.averageSentenceLength - config_.idealKeywordSentenceLength)), 1);
    if (result.score < 4) {
        result.status = "poor";
    } else if (result.score < 7) {
        result.status = "average";
    } else {
        result.status = "good";
    }
    return result;
}

json ReadabilityScorer::Report::toJson() const {
    json j;
    j["language"] = language;
    j["is_cjk"] = cjk;
    j["word_count"] = wordCount;
    j["sentence_count"] = sentenceCount;
    j["character_count"] = characterCount;
    j["avg_words_per_sentence"] = avgWordsPerSentence;
    j["grade_level"] = gradeLevel;
    j["coleman_liau_index"] = colemanLiau;

    if (cjk) {
        j["syllable_count"] = NOT_APPLICABLE_CJK;
        j["flesch_kincaid_score"] = NOT_APPLICABLE_CJK;
        j["smog_index"] = NOT_APPLICABLE_CJK;
        j["complex_words"] = NOT_APPLICABLE_CJK;
        j["passive_voice"] = NOT_APPLICABLE_CJK;
        j["transition_words"] = NOT_APPLICABLE_CJK;
    } else {
        j["syllable_count"] = syllableCount.value_or(0);
        j["avg_syllables_per_word"] = avgSyllablesPerWord.value_or(0.0);
        j["flesch_kincaid_score"] = fleschKincaid.value_or(0.0);
        j["smog_index"] = smog.value_or(0.0);
        j["complex_words"] = {
            {"count", complexWordCount.value_or(0)},
            {"percentage", complexWordPercentage.value_or(0.0)},
            {"exceeds_threshold", complexWordsExceedThreshold.value_or(false)}
        };
        PassiveVoiceStats passive = passiveVoice.value_or(PassiveVoiceStats());
        j["passive_voice"] = {
            {"count", passive.count},
            {"percentage", passive.percentage},
            {"exceeds_threshold", passive.exceedsThreshold},
            {"examples", passive.examples}
        };
        TransitionStats transitions = transitionWords.value_or(TransitionStats());
        j["transition_words"] = {
            {"count", transitions.count},
            {"percentage", transitions.percentage},
            {"meets_threshold", transitions.meetsThreshold}
        };
    }

    json sentencesJson = distributionToJson(sentenceLengths.distribution, sentenceLengths.total);
    sentencesJson["total"] = sentenceLengths.total;
    sentencesJson["long_sentences"] = sentenceLengths.longSentences;
    j["sentence_length"] = sentencesJson;

    json paragraphsJson = distributionToJson(paragraphs.distribution, paragraphs.total);
    paragraphsJson["total"] = paragraphs.total;
    paragraphsJson["average_words"] = paragraphs.averageWords;
    paragraphsJson["long_paragraphs"] = paragraphs.longCount;
    paragraphsJson["long_paragraph_examples"] = paragraphs.longExamples;
    j["paragraph_length"] = paragraphsJson;
    return j;
}

json ReadabilityScorer::KeywordReadability::toJson() const {
    return json{
        {"sentences_with_keyword", sentencesWithKeyword},
        {"avg_sentence_length", averageSentenceLength},
        {"score", score},
        {"status", status}
    };
}
