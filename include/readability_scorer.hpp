#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <utility>
#include <nlohmann/json.hpp>
#include "analysis_result.hpp"

// Language tables and thresholds for readability scoring
struct ReadabilityConfig {
    // Languages counted per character instead of per whitespace-delimited word
    std::vector<std::string> cjkLanguages = {"zh", "ja", "ko", "zh-hans", "zh-hant"};

    // Language used when no transition-word list exists for the requested one
    std::string defaultLanguage = "en";

    // Words with three or more syllables that still read as simple
    std::vector<std::string> complexWordExceptions = {
        "basically", "actually", "specifically", "probably", "generally", "usually",
        "finally", "eventually", "especially", "completely", "definitely", "naturally",
        "university", "understanding", "interesting", "education", "experience",
        "information", "technology", "development", "everything", "environment",
        "organization", "constitutional", "unfortunately"
    };

    // Transition words per language
    std::map<std::string, std::vector<std::string>> transitionWords = {
        {"en", {
            "additionally", "also", "besides", "furthermore", "in addition", "likewise",
            "moreover", "similarly", "accordingly", "as a result", "consequently", "hence",
            "therefore", "thus", "in contrast", "conversely", "however", "nevertheless",
            "nonetheless", "on the contrary", "still", "yet", "for example", "for instance",
            "indeed", "in fact", "namely", "specifically", "such as", "to illustrate",
            "afterward", "before", "currently", "during", "eventually", "finally", "first",
            "second", "third", "lastly", "meanwhile", "next", "since", "soon", "subsequently",
            "then", "ultimately", "while"
        }},
        {"de", {
            "außerdem", "auch", "zusätzlich", "ferner", "weiterhin", "überdies", "folglich",
            "daher", "deshalb", "somit", "demnach", "infolgedessen", "im Gegensatz dazu",
            "andererseits", "jedoch", "trotzdem", "dennoch", "zum Beispiel", "beispielsweise",
            "nämlich", "insbesondere", "zuerst", "zunächst", "dann", "danach", "schließlich",
            "letztlich"
        }},
        {"fr", {
            "de plus", "en outre", "par ailleurs", "aussi", "également", "par conséquent",
            "donc", "ainsi", "alors", "c'est pourquoi", "en revanche", "au contraire",
            "cependant", "néanmoins", "toutefois", "par exemple", "notamment",
            "en particulier", "c'est-à-dire", "d'abord", "ensuite", "puis", "enfin",
            "finalement", "en conclusion"
        }}
    };

    double passiveVoiceThreshold = 10.0;      // Max % of passive sentences
    double transitionWordThreshold = 30.0;    // Min % of sentences with a transition word
    double complexWordThreshold = 10.0;       // Max % of complex words

    size_t longParagraphWords = 100;          // Paragraphs above this are long
    size_t paragraphSnippetLength = 150;      // Bytes kept from a long paragraph example
    size_t maxLongSentenceExamples = 5;
    size_t maxLongParagraphExamples = 3;
    size_t maxPassiveExamples = 3;

    // Upper bounds of the paragraph length bands; the last band is open
    std::vector<size_t> paragraphLengthBands = {20, 40, 60, 100};

    // Ideal words per sentence for keyword readability
    double idealKeywordSentenceLength = 15.0;
};

class ReadabilityScorer {
public:
    struct SentenceLengthStats {
        std::vector<std::pair<std::string, size_t>> distribution;   // bucket -> count
        size_t total = 0;
        std::vector<std::string> longSentences;
    };

    struct ParagraphStats {
        size_t total = 0;
        double averageWords = 0.0;
        size_t longCount = 0;
        std::vector<std::string> longExamples;
        std::vector<std::pair<std::string, size_t>> distribution;   // band -> count
    };

    struct PassiveVoiceStats {
        size_t count = 0;
        double percentage = 0.0;
        bool exceedsThreshold = false;
        std::vector<std::string> examples;
    };

    struct TransitionStats {
        size_t count = 0;
        double percentage = 0.0;
        bool meetsThreshold = false;
    };

    struct Report {
        std::string language;
        bool cjk = false;
        size_t wordCount = 0;
        size_t sentenceCount = 0;
        size_t characterCount = 0;
        double avgWordsPerSentence = 0.0;

        // Absent for CJK content
        std::optional<size_t> syllableCount;
        std::optional<double> avgSyllablesPerWord;
        std::optional<size_t> complexWordCount;
        std::optional<double> complexWordPercentage;
        std::optional<bool> complexWordsExceedThreshold;
        std::optional<double> fleschKincaid;
        std::optional<double> smog;
        std::optional<PassiveVoiceStats> passiveVoice;
        std::optional<TransitionStats> transitionWords;

        std::string gradeLevel;
        double colemanLiau = 0.0;
        SentenceLengthStats sentenceLengths;
        ParagraphStats paragraphs;

        nlohmann::json toJson() const;
    };

    struct KeywordReadability {
        size_t sentencesWithKeyword = 0;
        double averageSentenceLength = 0.0;
        double score = 0.0;          // 0-10
        std::string status;          // poor, average, good

        nlohmann::json toJson() const;
    };

    explicit ReadabilityScorer(const ReadabilityConfig& config = ReadabilityConfig());

    // Score a text; paragraphs feed the paragraph length distribution
    AnalysisResult<Report> analyze(const std::string& text,
                                   const std::vector<std::string>& paragraphs,
                                   const std::string& language) const;

    // Readability of the sentences that carry a keyword
    KeywordReadability analyzeKeywordReadability(const std::string& text, const std::string& keyword) const;

    bool isCjkLanguage(const std::string& language) const;
    size_t countSyllables(const std::string& word, const std::string& language) const;
    bool isComplexWord(const std::string& word, const std::string& language) const;
    size_t countWordsForLanguage(const std::string& text, bool cjk) const;

    // Sentences, CJK terminators included when cjk is set
    std::vector<std::string> splitSentences(const std::string& text, bool cjk) const;

    // Formulas
    static double fleschKincaid(size_t words, size_t sentences, size_t syllables);
    static double smogIndex(size_t complexWords, size_t sentences);
    static double colemanLiau(size_t characters, size_t words, size_t sentences);
    static std::string gradeLevel(double fleschScore);

    const ReadabilityConfig& getConfig() const { return config_; }

private:
    ReadabilityConfig config_;

    // Helper methods
    SentenceLengthStats sentenceLengthStats(const std::vector<std::string>& sentences, bool cjk) const;
    ParagraphStats paragraphStats(const std::vector<std::string>& paragraphs, bool cjk) const;
    PassiveVoiceStats passiveVoiceStats(const std::vector<std::string>& sentences) const;
    TransitionStats transitionStats(const std::vector<std::string>& sentences, const std::string& language) const;
    std::string normalizeLanguage(const std::string& language) const;
};
