#include <catch2/catch_test_macros.hpp>
#include "content_extractor.hpp"

namespace {

const char* articlePage = R"(<html><body>
<header class="site-header"><p>Site tagline here</p></header>
<nav><p>Navigation paragraph</p></nav>
<main>
  <h1>Main Title</h1>
  <p>Intro paragraph with real words.</p>
  <p><img src="a.jpg"></p>
  <div class="sidebar"><p>Sidebar text</p></div>
  <h2>Details</h2>
  <p>Detail paragraph.</p>
  <p><a href="/more" aria-label="Read more"><img src="b.jpg"></a></p>
</main>
<footer><p>Copyright 2024</p></footer>
</body></html>)";

}

TEST_CASE("ContentExtractor keeps main content in document order", "[ContentExtractor]") {
    ContentExtractor extractor;
    auto document = HtmlDocument::parse(articlePage);
    REQUIRE(document != nullptr);

    ExtractedContent content = extractor.extract(document.get(), articlePage);
    REQUIRE(content.outcome == Outcome::Ok);
    REQUIRE_FALSE(content.fallbackUsed);

    SECTION("Blocks interleave headings and paragraphs") {
        REQUIRE(content.blocks.size() == 4);
        REQUIRE(content.blocks[0].type == ContentBlock::Type::Heading);
        REQUIRE(content.blocks[0].level == 1);
        REQUIRE(content.blocks[0].text == "Main Title");
        REQUIRE(content.blocks[1].text == "Intro paragraph with real words.");
        REQUIRE(content.blocks[2].level == 2);
        REQUIRE(content.blocks[3].text == "Detail paragraph.");
    }

    SECTION("Boilerplate never reaches the text") {
        std::string text = content.plainText();
        REQUIRE(text.find("Sidebar") == std::string::npos);
        REQUIRE(text.find("Navigation") == std::string::npos);
        REQUIRE(text.find("Copyright") == std::string::npos);
        REQUIRE(text == "Main Title\nIntro paragraph with real words.\nDetails\nDetail paragraph.");
    }

    SECTION("Paragraph and heading views") {
        REQUIRE(content.paragraphs().size() == 2);
        REQUIRE(content.headings().size() == 2);
        REQUIRE(extractor.extractHeadings(*document).size() == 2);
    }
}

TEST_CASE("ContentExtractor boilerplate rules", "[ContentExtractor]") {
    ContentExtractor extractor;
    auto document = HtmlDocument::parse(articlePage);
    REQUIRE(document != nullptr);

    SECTION("Structural chrome and class fragments are excluded") {
        REQUIRE(extractor.isExcluded(document->queryFirst("//nav/p")));
        REQUIRE(extractor.isExcluded(document->queryFirst("//header/p")));
        REQUIRE(extractor.isExcluded(document->queryFirst("//div[@class='sidebar']/p")));
        REQUIRE_FALSE(extractor.isExcluded(document->queryFirst("//main/p")));
    }

    SECTION("Classes on body are checked like any other ancestor") {
        auto themed = HtmlDocument::parse("<html><body class=\"has-sidebar nav-open\"><p>Text</p></body></html>");
        REQUIRE(themed != nullptr);
        REQUIRE(extractor.isExcluded(themed->queryFirst("//p")));

        auto plain = HtmlDocument::parse("<html><body class=\"home\"><p>Text</p></body></html>");
        REQUIRE(plain != nullptr);
        REQUIRE_FALSE(extractor.isExcluded(plain->queryFirst("//p")));
    }

    SECTION("Roles and labels mark chrome") {
        auto page = HtmlDocument::parse(
            "<body><div role=\"navigation\"><p>Links</p></div>"
            "<div aria-label=\"Footer menu\"><p>More links</p></div><p>Body</p></body>");
        REQUIRE(page != nullptr);
        auto paragraphs = page->query("//p");
        REQUIRE(paragraphs.size() == 3);
        REQUIRE(extractor.isExcluded(paragraphs[0]));
        REQUIRE(extractor.isExcluded(paragraphs[1]));
        REQUIRE_FALSE(extractor.isExcluded(paragraphs[2]));
    }
}

TEST_CASE("ContentExtractor meaningful paragraphs", "[ContentExtractor]") {
    ContentExtractor extractor;
    auto document = HtmlDocument::parse(articlePage);
    REQUIRE(document != nullptr);
    auto paragraphs = document->query("//main/p");
    REQUIRE(paragraphs.size() == 4);

    SECTION("Image-only paragraphs are rejected") {
        REQUIRE_FALSE(extractor.isMeaningfulParagraph(paragraphs[1]));
    }

    SECTION("Text and labelled anchors are meaningful") {
        REQUIRE(extractor.isMeaningfulParagraph(paragraphs[0]));
        REQUIRE(extractor.isMeaningfulParagraph(paragraphs[3]));
    }

    SECTION("Punctuation alone is not meaningful") {
        auto page = HtmlDocument::parse("<body><p> ... &nbsp; </p></body>");
        REQUIRE(page != nullptr);
        REQUIRE_FALSE(extractor.isMeaningfulParagraph(page->queryFirst("//p")));
    }
}

TEST_CASE("ContentExtractor paragraph selection falls back to all paragraphs", "[ContentExtractor]") {
    ContentExtractor extractor;
    auto document = HtmlDocument::parse(
        "<html><body><div class=\"widget\"><p>Widget text</p></div><p>Body text here.</p></body></html>");
    REQUIRE(document != nullptr);

    auto selected = extractor.selectParagraphNodes(*document);
    REQUIRE(selected.size() == 1);
    REQUIRE(HtmlDocument::visibleText(selected[0]) == "Body text here.");
}

TEST_CASE("ContentExtractor main content region", "[ContentExtractor]") {
    ContentExtractor extractor;

    SECTION("Main element wins") {
        auto document = HtmlDocument::parse(articlePage);
        REQUIRE(extractor.findMainContentRegion(*document).tagName() == "main");
    }

    SECTION("Regions without text are skipped in favour of body") {
        auto document = HtmlDocument::parse("<html><body><main> </main><p>Loose text</p></body></html>");
        REQUIRE(document != nullptr);
        REQUIRE(extractor.findMainContentRegion(*document).tagName() == "body");
    }
}

TEST_CASE("ContentExtractor scanner fallback", "[ContentExtractor]") {
    ContentExtractor extractor;
    std::string html = "<h1>Title</h1><p>One <b>two</b></p><p></p><h2>Sub</h2>";

    ExtractedContent content = extractor.extract(nullptr, html);
    REQUIRE(content.outcome == Outcome::ParseFailure);
    REQUIRE(content.fallbackUsed);
    REQUIRE(content.blocks.size() == 3);
    REQUIRE(content.blocks[0].text == "Title");
    REQUIRE(content.blocks[1].text == "One two");
    REQUIRE(content.blocks[2].level == 2);

    SECTION("Empty input is reported as empty") {
        ExtractedContent empty = extractor.extract(nullptr, "   ");
        REQUIRE(empty.outcome == Outcome::Empty);
        REQUIRE(empty.blocks.empty());
    }
}
