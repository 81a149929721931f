#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include "keyword_map.hpp"

namespace {

KeywordMapEntry entry(const std::string& id, const std::string& primary,
                      const std::vector<std::string>& secondaries = {}) {
    KeywordMapEntry e;
    e.documentId = id;
    e.title = "Page " + id;
    e.url = "https://example.com/" + id;
    e.postType = "post";
    e.primaryKeyword = primary;
    e.secondaryKeywords = secondaries;
    return e;
}

KeywordMapConfig twoThreads() {
    KeywordMapConfig config;
    config.numThreads = 2;
    return config;
}

}

TEST_CASE("KeywordMapAnalyzer keyword similarity", "[KeywordMap]") {
    KeywordMapAnalyzer analyzer(twoThreads());

    SECTION("Normalization drops stop words") {
        REQUIRE(analyzer.normalizeKeyword("The Best  of Coffee") == "best coffee");
    }

    SECTION("Identical and contained keywords") {
        REQUIRE(analyzer.similarity("Coffee Maker", "coffee maker") == 100.0);
        REQUIRE(analyzer.similarity("coffee maker", "best coffee maker") == 90.0);
        REQUIRE(analyzer.similarity("the", "the") == 100.0);
    }

    SECTION("Similarity is symmetric") {
        REQUIRE(analyzer.similarity("espresso machine", "coffee grinder") ==
                analyzer.similarity("coffee grinder", "espresso machine"));
        REQUIRE(analyzer.similarity("garden hose", "mountain bike") < 70.0);
    }

    SECTION("Empty keywords are not similar") {
        REQUIRE(analyzer.similarity("", "") == 0.0);
    }
}

TEST_CASE("KeywordMapAnalyzer detects cannibalization", "[KeywordMap]") {
    KeywordMapAnalyzer analyzer(twoThreads());

    SECTION("Shared primary keyword") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "Best Coffee Maker"),
            entry("2", "best coffee maker")
        };
        auto issues = analyzer.detectCannibalizationIssues(entries);
        REQUIRE(issues.size() == 1);
        REQUIRE(issues[0].typeName() == "primary_keyword_conflict");
        REQUIRE(issues[0].severity == "high");
        REQUIRE(issues[0].keyword == "best coffee maker");
        REQUIRE(issues[0].pages.size() == 2);
        REQUIRE(issues[0].pages[0].type == "primary");
        REQUIRE(issues[0].toJson()["keyword"] == "best coffee maker");
    }

    SECTION("The same document listed twice is not a conflict") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "coffee maker"),
            entry("1", "coffee maker")
        };
        REQUIRE(analyzer.detectCannibalizationIssues(entries).empty());
    }

    SECTION("Keyword used by too many documents") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "coffee maker", {"espresso"}),
            entry("2", "tea kettle", {"Espresso"}),
            entry("3", "water filter", {"espresso"})
        };
        auto issues = analyzer.detectCannibalizationIssues(entries);
        auto overuse = std::find_if(issues.begin(), issues.end(), [](const CannibalizationIssue& issue) {
            return issue.type == CannibalizationIssue::Type::KeywordOveruse;
        });
        REQUIRE(overuse != issues.end());
        REQUIRE(overuse->keyword == "espresso");
        REQUIRE(overuse->severity == "medium");
        REQUIRE(overuse->pages.size() == 3);
        REQUIRE(overuse->pages[2].type == "secondary");
    }

    SECTION("Similar primaries") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "coffee maker"),
            entry("2", "coffee makers")
        };
        auto issues = analyzer.detectCannibalizationIssues(entries);
        REQUIRE(issues.size() == 1);
        REQUIRE(issues[0].typeName() == "semantic_similarity");
        REQUIRE(issues[0].similarity == 90.0);
        REQUIRE(issues[0].pages.size() == 2);

        auto j = issues[0].toJson();
        REQUIRE(j["keywords"][0] == "coffee maker");
        REQUIRE(j["keywords"][1] == "coffee makers");
        REQUIRE_FALSE(j.contains("keyword"));
    }

    SECTION("Conflicts for one document list only the others") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "coffee maker"),
            entry("2", "coffee maker"),
            entry("3", "garden hose")
        };
        auto conflicts = analyzer.conflictsForDocument(entries, "1");
        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].pages.size() == 1);
        REQUIRE(conflicts[0].pages[0].documentId == "2");
        REQUIRE(analyzer.conflictsForDocument(entries, "3").empty());
    }
}

TEST_CASE("KeywordMapAnalyzer coverage and gaps", "[KeywordMap]") {
    KeywordMapAnalyzer analyzer(twoThreads());

    SECTION("Coverage counts") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "coffee maker", {"espresso"}),
            entry("2", "espresso")
        };
        auto coverage = analyzer.analyzeCoverage(entries);
        REQUIRE(coverage["total_keywords"] == 3);
        REQUIRE(coverage["unique_keywords"] == 2);
        REQUIRE(coverage["keyword_diversity"].get<double>() == Catch::Approx(1.5));
        REQUIRE(coverage["most_used"][0]["keyword"] == "espresso");
        REQUIRE(coverage["most_used"][0]["count"] == 2);
        REQUIRE(coverage["underused"].size() == 1);
        REQUIRE(coverage["underused"][0] == "coffee maker");
        REQUIRE(coverage["overused"].empty());
    }

    SECTION("Gaps drop one word at a time") {
        std::vector<KeywordMapEntry> entries = {entry("1", "best coffee maker")};
        auto gaps = analyzer.identifyKeywordGaps(entries);
        REQUIRE(gaps.size() == 3);
        REQUIRE(gaps[0]["keyword"] == "coffee maker");
        REQUIRE(gaps[0]["derived_from"] == "best coffee maker");
        REQUIRE(gaps[0]["type"] == "variation");
    }

    SECTION("Existing keywords are not gaps") {
        std::vector<KeywordMapEntry> entries = {
            entry("1", "best coffee maker"),
            entry("2", "coffee maker")
        };
        auto gaps = analyzer.identifyKeywordGaps(entries);
        REQUIRE(gaps.size() == 3);
        REQUIRE(gaps[2]["keyword"] == "coffee");
        for (const auto& gap : gaps) {
            REQUIRE(gap["keyword"] != "coffee maker");
        }
    }

    SECTION("Empty map") {
        auto coverage = analyzer.analyzeCoverage({});
        REQUIRE(coverage["total_keywords"] == 0);
        REQUIRE(coverage["keyword_diversity"] == 0.0);
    }
}

TEST_CASE("KeywordMapAnalyzer topic clusters", "[KeywordMap]") {
    KeywordMapAnalyzer analyzer(twoThreads());
    std::vector<KeywordMapEntry> entries = {
        entry("1", "coffee maker", {"espresso"}),
        entry("2", "coffee maker reviews"),
        entry("3", "garden hose", {"espresso", "watering"}),
        entry("4", "mountain bike")
    };

    auto clusters = analyzer.generateTopicClusters(entries);
    REQUIRE(clusters.size() == 1);
    const auto& cluster = clusters[0];
    REQUIRE(cluster["main_topic"] == "coffee maker");
    REQUIRE(cluster["pillar_page"]["document_id"] == "1");
    REQUIRE(cluster["supporting_pages"].size() == 2);
    REQUIRE(cluster["supporting_pages"][0]["document_id"] == "2");
    REQUIRE(cluster["supporting_pages"][0]["similarity"] == 90.0);
    REQUIRE(cluster["supporting_pages"][1]["document_id"] == "3");
    REQUIRE(cluster["related_keywords"].size() == 2);
    REQUIRE(cluster["related_keywords"][0] == "espresso");
    REQUIRE(cluster["related_keywords"][1] == "watering");
}

TEST_CASE("KeywordMapEntry reads JSON", "[KeywordMap]") {
    SECTION("Alternative field names") {
        auto e = KeywordMapEntry::fromJson(nlohmann::json{
            {"id", 42},
            {"title", "Coffee"},
            {"type", "page"},
            {"primary_keyword", "coffee"},
            {"secondary_keywords", "beans, grinder"}
        });
        REQUIRE(e.documentId == "42");
        REQUIRE(e.postType == "page");
        REQUIRE(e.secondaryKeywords == std::vector<std::string>{"beans", "grinder"});
        REQUIRE(e.toJson()["document_id"] == "42");
    }

    SECTION("Non-objects are rejected") {
        REQUIRE_THROWS_AS(KeywordMapEntry::fromJson(nlohmann::json::array()), std::invalid_argument);
    }
}
