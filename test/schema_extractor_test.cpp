#include <catch2/catch_test_macros.hpp>
#include "schema_extractor.hpp"

namespace {

const char* jsonLdPage = R"(<html><head>
<script type="application/ld+json">
{"@context": "https://schema.org", "@graph": [
  {"@type": "Organization", "name": "Brew Co"},
  {"@type": "WebSite", "url": "https://example.com"}
]}
</script>
<script type="application/ld+json">{"@type": "Article", "headline": </script>
<script type="application/ld+json">[{"@type": "Article", "headline": "Brewing"}, {}]</script>
</head><body><p>Text</p></body></html>)";

const char* microdataPage = R"(<html><body>
<div itemscope itemtype="https://schema.org/Product">
  <span itemprop="name">Coffee Maker</span>
  <div itemprop="offers" itemscope itemtype="https://schema.org/Offer">
    <span itemprop="price" content="49.99">$49.99</span>
    <span itemprop="priceCurrency">USD</span>
  </div>
  <a itemprop="url" href="https://example.com/maker">Details</a>
</div>
</body></html>)";

const char* brandPage = R"(<html><body>
<div itemscope itemtype="https://schema.org/Product">
  <span itemprop="name">Widget</span>
  <div itemprop="brand" itemscope itemtype="https://schema.org/Brand">
    <span itemprop="name">Acme</span>
  </div>
</div>
</body></html>)";

const char* sharedIdPage = R"(<html><head>
<script type="application/ld+json">
{"@context": "https://schema.org", "@id": "#shop", "@type": "Store", "name": "Bean There"}
</script>
<script type="Application/LD+JSON; charset=utf-8">
{"@context": "https://schema.org", "@id": "#shop", "@type": "Store", "name": "Bean There Cafe",
 "telephone": "+1-555-0100"}
</script>
</head><body></body></html>)";

const char* rdfaPage = R"(<html><body>
<div vocab="https://schema.org/" typeof="Person">
  <span property="name">Jane Doe</span>
  <span property="jobTitle">Editor</span>
  <div property="worksFor" typeof="Organization"><span property="name">Brew Co</span></div>
</div>
<div typeof="foaf:Person"><span property="name">Ignored</span></div>
</body></html>)";

}

TEST_CASE("SchemaExtractor reads JSON-LD", "[SchemaExtractor]") {
    SchemaExtractor extractor;
    auto document = HtmlDocument::parse(jsonLdPage);
    REQUIRE(document != nullptr);

    auto result = extractor.extract(document.get());
    REQUIRE(result.succeeded());

    SECTION("Graphs are flattened and malformed blocks skipped") {
        REQUIRE(result.data.size() == 3);
        REQUIRE(result.data[0].types() == std::vector<std::string>{"Organization"});
        REQUIRE(result.data[1].data["url"] == "https://example.com");
        REQUIRE(result.data[2].data["headline"] == "Brewing");
        REQUIRE(result.data[2].formatName() == "json-ld");
    }

    SECTION("Types are unique in first-seen order") {
        auto types = SchemaExtractor::extractSchemaTypes(result.data);
        REQUIRE(types == std::vector<std::string>{"Organization", "WebSite", "Article"});
    }
}

TEST_CASE("SchemaExtractor reads microdata", "[SchemaExtractor]") {
    SchemaExtractor extractor;
    auto document = HtmlDocument::parse(microdataPage);
    REQUIRE(document != nullptr);

    auto entities = extractor.extractMicrodata(*document);
    REQUIRE(entities.size() == 2);
    const auto& product = entities[0].data;
    REQUIRE(entities[0].formatName() == "microdata");
    REQUIRE(product["@type"] == "Product");
    REQUIRE(product["name"] == "Coffee Maker");
    REQUIRE(product["url"] == "https://example.com/maker");

    SECTION("Nested items are kept as objects and their values are collected too") {
        REQUIRE(product["offers"]["@type"] == "Offer");
        REQUIRE(product["offers"]["price"] == "49.99");
        REQUIRE(product["offers"]["priceCurrency"] == "USD");
        REQUIRE(product["price"] == "49.99");
        REQUIRE(product["priceCurrency"] == "USD");
    }

    SECTION("Every scoped item is listed") {
        REQUIRE(entities[1].data["@type"] == "Offer");
        REQUIRE(entities[1].data["price"] == "49.99");
    }

    SECTION("Nested items can be left inside their parent") {
        SchemaExtractorConfig config;
        config.skipNestedItems = true;
        SchemaExtractor topLevel(config);
        auto items = topLevel.extractMicrodata(*document);
        REQUIRE(items.size() == 1);
        REQUIRE(items[0].data["@type"] == "Product");
    }
}

TEST_CASE("SchemaExtractor collects colliding names into a list", "[SchemaExtractor]") {
    SchemaExtractor extractor;

    SECTION("Microdata") {
        auto document = HtmlDocument::parse(brandPage);
        REQUIRE(document != nullptr);
        auto entities = extractor.extractMicrodata(*document);
        REQUIRE(entities.size() == 2);

        const auto& product = entities[0].data;
        REQUIRE(product["name"] == nlohmann::json::array({"Widget", "Acme"}));
        REQUIRE(product["brand"]["@type"] == "Brand");
        REQUIRE(product["brand"]["name"] == "Acme");
        REQUIRE(entities[1].data["name"] == "Acme");
    }

    SECTION("RDFa") {
        auto document = HtmlDocument::parse(rdfaPage);
        REQUIRE(document != nullptr);
        auto entities = extractor.extractRdfa(*document);
        REQUIRE(entities.size() == 2);
        REQUIRE(entities[0].data["name"] == nlohmann::json::array({"Jane Doe", "Brew Co"}));
        REQUIRE(entities[0].data["worksFor"]["@type"] == "Organization");
        REQUIRE(entities[1].data["@type"] == "Organization");
    }

    SECTION("JSON-LD nodes sharing an id") {
        auto document = HtmlDocument::parse(sharedIdPage);
        REQUIRE(document != nullptr);
        auto entities = extractor.extractJsonLd(*document);
        REQUIRE(entities.size() == 1);

        const auto& store = entities[0].data;
        REQUIRE(store["@type"] == "Store");
        REQUIRE(store["@id"] == "#shop");
        REQUIRE(store["name"] == nlohmann::json::array({"Bean There", "Bean There Cafe"}));
        REQUIRE(store["telephone"] == "+1-555-0100");
    }

    SECTION("Repeated values keep their order") {
        nlohmann::json properties = nlohmann::json::object();
        SchemaExtractor::addProperty(properties, "image", "a.jpg");
        SchemaExtractor::addProperty(properties, "image", "b.jpg");
        SchemaExtractor::addProperty(properties, "image", "c.jpg");
        REQUIRE(properties["image"] == nlohmann::json::array({"a.jpg", "b.jpg", "c.jpg"}));
    }
}

TEST_CASE("SchemaExtractor reads RDFa", "[SchemaExtractor]") {
    SchemaExtractor extractor;
    auto document = HtmlDocument::parse(rdfaPage);
    REQUIRE(document != nullptr);

    auto entities = extractor.extractRdfa(*document);
    REQUIRE(entities.size() == 2);
    REQUIRE(entities[0].data["@type"] == "Person");
    REQUIRE(entities[0].data["jobTitle"] == "Editor");
    REQUIRE(entities[1].data["name"] == "Brew Co");
}

TEST_CASE("SchemaExtractor outcomes", "[SchemaExtractor]") {
    SchemaExtractor extractor;

    SECTION("A page without markup is empty") {
        auto document = HtmlDocument::parse("<html><body><p>Nothing here</p></body></html>");
        REQUIRE(document != nullptr);
        auto result = extractor.extract(document.get());
        REQUIRE(result.empty());
        REQUIRE(result.data.empty());
    }

    SECTION("Script types are matched without regard to case or parameters") {
        auto document = HtmlDocument::parse(sharedIdPage);
        REQUIRE(document != nullptr);
        SchemaExtractorConfig config;
        config.extractMicrodata = false;
        config.extractRdfa = false;
        auto result = SchemaExtractor(config).extract(document.get());
        REQUIRE(result.succeeded());
        REQUIRE(result.data.size() == 1);
        REQUIRE(result.data[0].data.contains("telephone"));
    }

    SECTION("Without a document script blocks are still scanned") {
        std::string html = "<SCRIPT type=\"application/ld+json\">{\"@type\": \"Recipe\"}</SCRIPT>"
                           "<script>var x = 1;</script>";
        auto result = extractor.extract(nullptr, html);
        REQUIRE(result.degraded());
        REQUIRE(result.data.size() == 1);
        REQUIRE(result.data[0].types() == std::vector<std::string>{"Recipe"});
    }

    SECTION("Schema prefixes are stripped") {
        REQUIRE(SchemaExtractor::stripSchemaPrefix("https://schema.org/Product") == "Product");
        REQUIRE(SchemaExtractor::stripSchemaPrefix("schema:name") == "name");
        REQUIRE(SchemaExtractor::stripSchemaPrefix("Thing") == "Thing");
    }
}
