#include <catch2/catch_test_macros.hpp>
#include "seo_analyzer.hpp"

using json = nlohmann::json;

namespace {

const char* coffeePage = R"(<html><head>
<title>Coffee Brewing Guide</title>
<meta name="description" content="How to brew better coffee at home">
<script type="application/ld+json">
{"@context": "https://schema.org", "@type": "Article", "headline": "Coffee Brewing Guide",
 "author": {"@type": "Person", "name": "Sam"}, "datePublished": "2024-01-01",
 "publisher": {"@type": "Organization", "name": "Brew Co"}}
</script>
</head><body>
<nav><p>Home and shop links</p></nav>
<main>
  <h1>Brewing coffee at home</h1>
  <p>Coffee is a drink made from roasted beans. Good coffee starts with fresh beans.</p>
  <h2>Grinding</h2>
  <p>Grind the beans right before brewing. A burr grinder gives an even grind for coffee.</p>
</main>
</body></html>)";

AnalysisRequest coffeeRequest() {
    AnalysisRequest request;
    request.primaryKeyword = "Coffee";
    request.secondaryKeywords = {"beans", "coffee", "Beans", "grinder"};
    request.url = "https://example.com/coffee-guide";
    return request;
}

SeoAnalyzerConfig twoThreads() {
    SeoAnalyzerConfig config;
    config.numThreads = 2;
    config.keywordMap.numThreads = 2;
    return config;
}

KeywordMapEntry mapEntry(const std::string& id, const std::string& primary) {
    KeywordMapEntry entry;
    entry.documentId = id;
    entry.title = "Page " + id;
    entry.url = "https://example.com/" + id;
    entry.primaryKeyword = primary;
    return entry;
}

}

TEST_CASE("SeoAnalyzer builds a full report", "[SeoAnalyzer]") {
    SeoAnalyzer analyzer(twoThreads());
    json report = analyzer.analyze(coffeePage, coffeeRequest());

    SECTION("Document and content") {
        REQUIRE(report["document"]["title"] == "Coffee Brewing Guide");
        REQUIRE(report["document"]["meta_description"] == "How to brew better coffee at home");
        REQUIRE(report["document"]["outcome"] == "ok");
        REQUIRE(report["document"]["fallback_used"] == false);
        REQUIRE(report["content"]["heading_count"] == 2);
        REQUIRE(report["content"]["paragraph_count"] == 2);
        REQUIRE(report["content"]["headings"][0]["level"] == 1);
    }

    SECTION("Keywords") {
        const json& keywords = report["keywords"];
        REQUIRE(keywords["outcome"] == "ok");
        REQUIRE(keywords["primary_keyword"] == "coffee");
        REQUIRE(keywords["secondary"].size() == 2);
        REQUIRE(keywords["related"].size() == 2);
        REQUIRE(keywords["presence"]["has_any_keyword"] == true);
        REQUIRE(keywords["heading_coverage"]["total"] == 3);
    }

    SECTION("Schema") {
        const json& schema = report["schema"];
        REQUIRE(schema["outcome"] == "ok");
        REQUIRE(schema["types"][0] == "Article");
        REQUIRE(schema["validation"]["valid_schemas"] == 1);
        REQUIRE(schema["local_business"].is_null());
    }

    SECTION("Schema advice") {
        const json& advice = report["schema"]["advice"];
        REQUIRE(advice["has_schema"] == true);
        REQUIRE(advice["is_relevant_for_local"] == false);
        REQUIRE(advice["primary_suggestion"] == "Organization");
        REQUIRE(advice["content_schema_types"] == json::array({"Article", "BlogPosting"}));
        REQUIRE(advice["suggested_schema_types"][0] == "Organization");
        REQUIRE(advice["suggestions"] == json::array({"improper_schema_type_used"}));
    }

    SECTION("Readability and intent") {
        REQUIRE(report["readability"]["outcome"] == "ok");
        REQUIRE(report["readability"]["flesch_kincaid_score"].is_number());
        REQUIRE(report["intent"]["outcome"] == "ok");
        REQUIRE(report["intent"].contains("detected_intent"));
        double satisfaction = report["intent"]["intent_satisfaction_score"];
        REQUIRE(satisfaction >= 0.0);
        REQUIRE(satisfaction <= 1.0);
    }

    SECTION("Boilerplate is not counted") {
        REQUIRE(report["document"]["word_count"].get<size_t>() > 0);
        REQUIRE(report["keywords"]["analysis"].dump().find("shop links") == std::string::npos);
    }
}

TEST_CASE("SeoAnalyzer reports are repeatable", "[SeoAnalyzer]") {
    SeoAnalyzer analyzer(twoThreads());
    std::string first = analyzer.analyze(coffeePage, coffeeRequest()).dump();
    std::string second = analyzer.analyze(coffeePage, coffeeRequest()).dump();
    REQUIRE(first == second);
}

TEST_CASE("SeoAnalyzer handles empty input", "[SeoAnalyzer]") {
    SeoAnalyzer analyzer(twoThreads());
    AnalysisRequest request;
    json report = analyzer.analyze("", request);
    REQUIRE(report["document"]["outcome"] == "empty");
    REQUIRE(report["document"]["word_count"] == 0);
    REQUIRE(report["keywords"]["outcome"] == "empty");
    REQUIRE(report["readability"]["outcome"] == "empty");
    REQUIRE(report["intent"]["detected_intent"] == "informational");
}

TEST_CASE("SeoAnalyzer batch keeps input order", "[SeoAnalyzer]") {
    SeoAnalyzer analyzer(twoThreads());
    std::vector<BatchDocument> documents;
    for (const char* id : {"a", "b", "c"}) {
        BatchDocument document;
        document.id = id;
        document.html = coffeePage;
        document.request = coffeeRequest();
        documents.push_back(document);
    }
    documents[1].html = "<html><body><h1>Tea</h1><p>Green tea is calm.</p></body></html>";

    auto results = analyzer.analyzeBatch(documents);
    REQUIRE(results.size() == 3);
    REQUIRE(results[0]["id"] == "a");
    REQUIRE(results[1]["id"] == "b");
    REQUIRE(results[2]["id"] == "c");
    REQUIRE(results[1]["content"]["headings"][0]["text"] == "Tea");
    REQUIRE(results[0].dump() != results[1].dump());

    REQUIRE(analyzer.analyzeBatch({}).empty());
}

TEST_CASE("SeoAnalyzer site reports", "[SeoAnalyzer]") {
    SeoAnalyzer analyzer(twoThreads());
    std::vector<KeywordMapEntry> entries = {
        mapEntry("1", "coffee maker"),
        mapEntry("2", "Coffee Maker"),
        mapEntry("3", "garden hose")
    };

    SECTION("Site overview") {
        json site = analyzer.analyzeSite(entries);
        REQUIRE(site["total_documents"] == 3);
        REQUIRE(site["cannibalization"]["issue_count"] == 1);
        REQUIRE(site["cannibalization"]["high_severity_count"] == 1);
        REQUIRE(site["cannibalization"]["issues"][0]["type"] == "primary_keyword_conflict");
        REQUIRE(site["coverage"]["total_keywords"] == 3);
        REQUIRE(site["gaps"].is_array());
        REQUIRE(site["clusters"].is_array());
    }

    SECTION("Conflicts of one document") {
        json conflicts = analyzer.analyzeDocumentConflicts(entries, "2");
        REQUIRE(conflicts["document_id"] == "2");
        REQUIRE(conflicts["has_conflicts"] == true);
        REQUIRE(conflicts["conflicts"][0]["pages"].size() == 1);
        REQUIRE(conflicts["conflicts"][0]["pages"][0]["document_id"] == "1");

        REQUIRE(analyzer.analyzeDocumentConflicts(entries, "3")["has_conflicts"] == false);
    }
}

TEST_CASE("SeoAnalyzerConfig overlays JSON", "[SeoAnalyzer]") {
    SECTION("Known keys are applied") {
        auto config = SeoAnalyzerConfig::fromJson(json{
            {"threads", 3},
            {"keyword_map", {{"max_gaps", 4}}},
            {"schema", {{"extract_rdfa", false}}},
            {"schema_advice", {{"organization_signal_threshold", 0.5}}},
            {"readability", {{"default_language", "de"}}}
        });
        REQUIRE(config.numThreads == 3);
        REQUIRE(config.keywordMap.numThreads == 3);
        REQUIRE(config.keywordMap.maxGaps == 4);
        REQUIRE_FALSE(config.schemaExtraction.extractRdfa);
        REQUIRE(config.schemaAdvice.organizationSignalThreshold == 0.5);
        REQUIRE(config.readability.defaultLanguage == "de");
    }

    SECTION("Unknown and mistyped keys are skipped") {
        auto config = SeoAnalyzerConfig::fromJson(json{
            {"colour", "blue"},
            {"keywords", {{"max_contexts", "many"}, {"unknown_key", 1}}}
        });
        REQUIRE(config.keywords.maxContexts == 5);
    }

    SECTION("Invalid values are rejected") {
        REQUIRE_THROWS_AS(SeoAnalyzerConfig::fromJson(json::array()), std::invalid_argument);
        REQUIRE_THROWS_AS(SeoAnalyzerConfig::fromJson(json{{"threads", -1}}), std::invalid_argument);
        REQUIRE_THROWS_AS(SeoAnalyzerConfig::fromJson(json{{"readability", {{"default_language", "xx"}}}}),
                          std::invalid_argument);
    }

    SECTION("Missing files are reported") {
        REQUIRE_THROWS_AS(SeoAnalyzerConfig::fromJsonFile("/nonexistent/seosignal.json"), std::runtime_error);
    }
}
