#include <catch2/catch_test_macros.hpp>
#include <limits>
#include "html_document.hpp"

namespace {

const char* samplePage = R"(<!DOCTYPE html>
<html>
<head>
  <title>  Best Coffee   Makers </title>
  <meta name="description" content=" Our guide to coffee makers. ">
  <script>var tracking = "ignored";</script>
</head>
<body>
  <nav><a href="/">Home</a></nav>
  <main id="main" class="content Main">
    <h1>Coffee Makers</h1>
    <p>First paragraph about coffee.</p>
    <p data-Role="note">Second &amp; last.</p>
  </main>
</body>
</html>)";

}

TEST_CASE("HtmlDocument parses metadata and text", "[HtmlDocument]") {
    auto document = HtmlDocument::parse(samplePage, "https://example.com/coffee");
    REQUIRE(document != nullptr);

    SECTION("Title and description are trimmed") {
        REQUIRE(document->title() == "Best Coffee Makers");
        REQUIRE(document->metaDescription() == "Our guide to coffee makers.");
        REQUIRE(document->baseUrl() == "https://example.com/coffee");
    }

    SECTION("Plain text skips scripts and separates blocks") {
        const std::string& text = document->plainText();
        REQUIRE(text.find("tracking") == std::string::npos);
        REQUIRE(text.find("Coffee Makers First paragraph about coffee.") != std::string::npos);
        REQUIRE(text.find("Second & last.") != std::string::npos);
    }

    SECTION("Raw HTML is kept") {
        REQUIRE(document->rawHtml() == samplePage);
    }
}

TEST_CASE("HtmlDocument rejects empty input", "[HtmlDocument]") {
    REQUIRE(HtmlDocument::parse("") == nullptr);
    REQUIRE(HtmlDocument::parse("   \n\t ") == nullptr);
}

TEST_CASE("HtmlDocument rejects input above the size limit", "[HtmlDocument]") {
    std::string html = "<html><body><p>Twelve bytes</p></body></html>";
    REQUIRE(HtmlDocument::parse(html, "", html.size() - 1) == nullptr);
    REQUIRE(HtmlDocument::parse(html, "", html.size()) != nullptr);
    REQUIRE(HtmlDocument::MAX_HTML_SIZE < static_cast<size_t>(std::numeric_limits<int>::max()));
}

TEST_CASE("HtmlDocument recovers from malformed markup", "[HtmlDocument]") {
    auto document = HtmlDocument::parse("<div><p>Unclosed paragraph<p>Another <b>bold</div>");
    REQUIRE(document != nullptr);
    REQUIRE(document->query("//p").size() == 2);
    REQUIRE(document->plainText().find("Unclosed paragraph") != std::string::npos);
}

TEST_CASE("HtmlDocument XPath queries", "[HtmlDocument]") {
    auto document = HtmlDocument::parse(samplePage);
    REQUIRE(document != nullptr);

    SECTION("Document-wide queries keep document order") {
        auto paragraphs = document->query("//p");
        REQUIRE(paragraphs.size() == 2);
        REQUIRE(document->documentOrder(paragraphs[0]) < document->documentOrder(paragraphs[1]));
    }

    SECTION("Relative queries are scoped to the context node") {
        DomNode main = document->queryFirst("//main");
        REQUIRE(main.valid());
        REQUIRE(document->query(".//a", main).empty());
        REQUIRE(document->query(".//p", main).size() == 2);
        REQUIRE(document->query(".//p", DomNode()).empty());
    }

    SECTION("Missing matches give an invalid node") {
        REQUIRE_FALSE(document->queryFirst("//table").valid());
    }

    SECTION("Body and root") {
        REQUIRE(document->body().tagName() == "body");
        REQUIRE(document->root().tagName() == "html");
    }
}

TEST_CASE("DomNode navigation and attributes", "[HtmlDocument]") {
    auto document = HtmlDocument::parse(samplePage);
    REQUIRE(document != nullptr);
    DomNode main = document->queryFirst("//main");

    SECTION("Attribute lookup") {
        REQUIRE(main.attribute("class") == "content Main");
        REQUIRE(main.hasAttribute("id"));
        REQUIRE_FALSE(main.hasAttribute("role"));
        REQUIRE(main.attribute("role").empty());
    }

    SECTION("Attribute names are listed in lowercase") {
        DomNode note = document->queryFirst("//p[2]");
        auto attributes = note.attributes();
        REQUIRE(attributes.size() == 1);
        REQUIRE(attributes[0].first == "data-role");
        REQUIRE(attributes[0].second == "note");
    }

    SECTION("Children and parent") {
        auto elements = main.elementChildren();
        REQUIRE(elements.size() == 3);
        REQUIRE(elements[0].tagName() == "h1");
        REQUIRE(elements[0].parent() == main);
        REQUIRE(main.children().size() >= elements.size());
        REQUIRE(HtmlDocument::visibleText(elements[2]) == "Second & last.");
    }
}
