#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "readability_scorer.hpp"
#include "text_utils.hpp"

TEST_CASE("ReadabilityScorer counts syllables", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;

    SECTION("English heuristics") {
        REQUIRE(scorer.countSyllables("cat", "en") == 1);
        REQUIRE(scorer.countSyllables("reading", "en") == 2);
        REQUIRE(scorer.countSyllables("beautiful", "en") == 3);
        REQUIRE(scorer.countSyllables("Reading,", "en") == 2);
        REQUIRE(scorer.countSyllables("123", "en") == 0);
    }

    SECTION("Other languages count vowel letters") {
        REQUIRE(scorer.countSyllables("maison", "fr") == 3);
        REQUIRE(scorer.countSyllables("caf\xC3\xA9", "fr") == 2);
    }

    SECTION("Complex words honour the exception list") {
        REQUIRE(scorer.isComplexWord("beautiful", "en"));
        REQUIRE_FALSE(scorer.isComplexWord("generally", "en"));
        REQUIRE_FALSE(scorer.isComplexWord("cat", "en"));
    }
}

TEST_CASE("ReadabilityScorer formulas", "[ReadabilityScorer]") {
    SECTION("Flesch-Kincaid is clamped to 0-100") {
        REQUIRE(ReadabilityScorer::fleschKincaid(0, 1, 0) == 0.0);
        REQUIRE(ReadabilityScorer::fleschKincaid(1, 1, 1) == 100.0);
        REQUIRE(ReadabilityScorer::fleschKincaid(10, 1, 40) == 0.0);
    }

    SECTION("More syllables per word lowers the score") {
        double simple = ReadabilityScorer::fleschKincaid(100, 10, 120);
        double dense = ReadabilityScorer::fleschKincaid(100, 10, 160);
        REQUIRE(simple > dense);
    }

    SECTION("SMOG and Coleman-Liau") {
        REQUIRE(ReadabilityScorer::smogIndex(0, 10) == Catch::Approx(3.1291));
        REQUIRE(ReadabilityScorer::colemanLiau(0, 0, 0) == 0.0);
        REQUIRE(ReadabilityScorer::colemanLiau(500, 100, 5) == Catch::Approx(0.0588 * 500 - 0.296 * 5 - 15.8));
    }

    SECTION("Grade level bands") {
        REQUIRE(ReadabilityScorer::gradeLevel(95) == "5th grade (Very easy to read)");
        REQUIRE(ReadabilityScorer::gradeLevel(65) == "8th-9th grade (Plain English)");
        REQUIRE(ReadabilityScorer::gradeLevel(10) == "College graduate (Very difficult)");
    }
}

TEST_CASE("ReadabilityScorer analyzes English text", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;
    std::string text = "The cat sat on the mat. However, the dog was tired. It was called by the owner.";

    auto result = scorer.analyze(text, {}, "en");
    REQUIRE(result.succeeded());
    const auto& report = result.data;

    REQUIRE_FALSE(report.cjk);
    REQUIRE(report.sentenceCount == 3);
    REQUIRE(report.wordCount == 17);
    REQUIRE(report.fleschKincaid.has_value());
    REQUIRE(*report.fleschKincaid >= 0.0);
    REQUIRE(*report.fleschKincaid <= 100.0);

    SECTION("Passive voice and transitions") {
        REQUIRE(report.passiveVoice->count == 2);
        REQUIRE(report.passiveVoice->exceedsThreshold);
        REQUIRE(report.transitionWords->count == 1);
        REQUIRE(report.transitionWords->percentage == Catch::Approx(33.33));
        REQUIRE(report.transitionWords->meetsThreshold);
    }

    SECTION("Report JSON carries the scores") {
        auto j = report.toJson();
        REQUIRE(j["sentence_count"] == 3);
        REQUIRE(j["flesch_kincaid_score"].is_number());
        REQUIRE(j["sentence_length"]["total"] == 3);
        REQUIRE(j["sentence_length"]["counts"]["short"] == 2);
    }
}

TEST_CASE("ReadabilityScorer handles empty text", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;
    auto result = scorer.analyze("   ", {}, "en");
    REQUIRE(result.empty());
    REQUIRE(result.data.wordCount == 0);
    REQUIRE(result.data.gradeLevel == "Analysis not applicable for this language");
}

TEST_CASE("ReadabilityScorer CJK content", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;

    SECTION("Language detection") {
        REQUIRE(scorer.isCjkLanguage("zh"));
        REQUIRE(scorer.isCjkLanguage("zh-hans"));
        REQUIRE(scorer.isCjkLanguage("ja_JP"));
        REQUIRE_FALSE(scorer.isCjkLanguage("en"));
    }

    SECTION("Full-width terminators split sentences and formulas are skipped") {
        std::string text = "\xE8\xBF\x99\xE6\x98\xAF\xE7\xAC\xAC\xE4\xB8\x80\xE5\x8F\xA5\xE3\x80\x82"
                           "\xE8\xBF\x99\xE6\x98\xAF\xE7\xAC\xAC\xE4\xBA\x8C\xE5\x8F\xA5\xEF\xBC\x81";
        auto result = scorer.analyze(text, {}, "zh");
        REQUIRE(result.succeeded());
        REQUIRE(result.data.cjk);
        REQUIRE(result.data.sentenceCount == 2);
        REQUIRE(result.data.wordCount == 10);
        REQUIRE_FALSE(result.data.fleschKincaid.has_value());
        REQUIRE(result.data.gradeLevel == "N/A for CJK languages");

        auto j = result.data.toJson();
        REQUIRE(j["flesch_kincaid_score"] == "N/A for CJK languages");
        REQUIRE(j["passive_voice"] == "N/A for CJK languages");
    }
}

TEST_CASE("ReadabilityScorer paragraph statistics", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;
    std::string longParagraph;
    for (int i = 0; i < 120; ++i) {
        longParagraph += "word ";
    }
    std::vector<std::string> paragraphs = {"one two three.", longParagraph};

    auto result = scorer.analyze("one two three. " + longParagraph, paragraphs, "en");
    const auto& stats = result.data.paragraphs;
    REQUIRE(stats.total == 2);
    REQUIRE(stats.longCount == 1);
    REQUIRE(stats.distribution.front().first == "0-20");
    REQUIRE(stats.distribution.front().second == 1);
    REQUIRE(stats.distribution.back().first == "100+");
    REQUIRE(stats.distribution.back().second == 1);
    REQUIRE(stats.longExamples.size() == 1);
    REQUIRE(TextUtils::endsWith(stats.longExamples[0], "..."));
}

TEST_CASE("ReadabilityScorer keyword sentences", "[ReadabilityScorer]") {
    ReadabilityScorer scorer;

    SECTION("Short keyword sentences score poorly") {
        auto result = scorer.analyzeKeywordReadability(
            "Coffee is great. I like coffee in the morning with milk.", "coffee");
        REQUIRE(result.sentencesWithKeyword == 2);
        REQUIRE(result.averageSentenceLength == Catch::Approx(5.5));
        REQUIRE(result.score == Catch::Approx(0.5));
        REQUIRE(result.status == "poor");
    }

    SECTION("No keyword gives no sentences") {
        auto result = scorer.analyzeKeywordReadability("Some text here.", "");
        REQUIRE(result.sentencesWithKeyword == 0);
        REQUIRE(result.averageSentenceLength == 0.0);
    }
}
