#pragma once

#include <string>
#include <vector>
#include <utility>
#include "analysis_result.hpp"
#include "html_document.hpp"

// Boilerplate rules and region selectors used by content extraction
struct ExtractionRules {
    // Ancestor walk limit when checking exclusion
    int maxAncestorDepth = 50;

    // Structural chrome tags
    std::vector<std::string> excludedTags = {"aside", "nav", "header", "footer", "form"};

    // ARIA roles that mark chrome
    std::vector<std::string> excludedRoles = {
        "navigation", "complementary", "contentinfo", "banner", "search"
    };

    // Fragments matched against the lowercased class attribute
    std::vector<std::string> excludedClassFragments = {
        "site-header", "header", "top-bar", "masthead", "navbar", "menu", "navigation", "nav",
        "breadcrumbs", "breadcrumb", "sidebar", "widget", "widgets", "footer", "site-footer",
        "bottom-bar", "copyright", "comments", "comment", "reply", "related", "sharing", "share",
        "social", "pagination", "pager", "author-box", "modal", "popup", "notice", "alert",
        "announcement", "newsletter", "subscribe", "cookie", "gdpr", "consent", "promo", "ads",
        "ad-", "advert", "sponsor"
    };

    // Fragments matched against the lowercased id attribute
    std::vector<std::string> excludedIdFragments = {
        "header", "masthead", "top", "nav", "menu", "footer", "bottom", "copyright",
        "breadcrumbs", "cookie", "gdpr", "notice", "modal", "popup"
    };

    // Label-like attributes and the fragments that mark chrome in them
    std::vector<std::string> labelAttributes = {"aria-label", "data-label", "data-component"};
    std::vector<std::string> excludedLabelFragments = {
        "menu", "navigation", "header", "footer", "breadcrumbs"
    };

    // Children that do not make a paragraph meaningful on their own
    std::vector<std::string> mediaTags = {
        "img", "svg", "figure", "iframe", "video", "audio", "canvas", "br"
    };

    // Paragraph regions, queried in priority order
    std::vector<std::string> paragraphSelectors = {
        "//main//p",
        "//article//p",
        "//div[contains(@class, 'entry-content')]//p",
        "//div[contains(@class, 'post-content')]//p",
        "//div[contains(@class, 'content')]//p",
        "//section[contains(@class, 'content')]//p",
        "//div[@id='content']//p",
        "//div[@id='primary']//p",
        "//main//*[not(self::aside or self::nav or self::header or self::footer)]//p",
        "//article//*[not(self::aside or self::nav or self::header or self::footer)]//p",
        "//*[contains(concat(' ', normalize-space(@class), ' '), ' entry-content ')]//p",
        "//*[contains(concat(' ', normalize-space(@class), ' '), ' post-content ')]//p",
        "//*[contains(concat(' ', normalize-space(@class), ' '), ' content ')]//p"
    };

    // Used only when no priority region yields a paragraph node
    std::string fallbackParagraphSelector = "//p";

    // Main content region candidates; the first with text wins, otherwise body
    std::vector<std::string> mainRegionSelectors = {
        "//main[@role='main']",
        "//main",
        "//*[contains(@class, 'entry-content')]",
        "//*[contains(@class, 'post-content')]",
        "//*[contains(@class, 'content')]",
        "//article",
        "//*[contains(@class, 'single-content')]",
        "//*[contains(@class, 'page-content')]",
        "//*[@id='content']",
        "//*[@id='main-content']"
    };
};

// One extracted text block
struct ContentBlock {
    enum class Type { Heading, Paragraph };

    Type type = Type::Paragraph;
    int level = 0;           // 1-6 for headings, 0 for paragraphs
    std::string text;
};

// Result of one extraction run, blocks in document order
struct ExtractedContent {
    Outcome outcome = Outcome::Empty;
    bool fallbackUsed = false;
    std::vector<ContentBlock> blocks;

    std::vector<std::string> paragraphs() const;
    std::vector<ContentBlock> headings() const;

    // Block texts joined by newlines
    std::string plainText() const;
};

class ContentExtractor {
public:
    explicit ContentExtractor(const ExtractionRules& rules = ExtractionRules());

    // Extract content from a parsed document; a null document selects the scanner fallback
    ExtractedContent extract(const HtmlDocument* document, const std::string& rawHtml) const;

    // Scanner-only extraction over raw HTML (no exclusion filtering)
    ExtractedContent extractFallback(const std::string& rawHtml) const;

    // Check a node and its ancestors against the boilerplate rules
    bool isExcluded(const DomNode& node) const;

    // Check that a paragraph carries letters or digits outside of media tags
    bool isMeaningfulParagraph(const DomNode& paragraph) const;

    // Main content region (first selector with text, else body)
    DomNode findMainContentRegion(const HtmlDocument& document) const;

    // Headings of the document, excluding boilerplate
    std::vector<ContentBlock> extractHeadings(const HtmlDocument& document) const;

    // Meaningful non-boilerplate paragraphs
    std::vector<DomNode> selectParagraphNodes(const HtmlDocument& document) const;

    const ExtractionRules& getRules() const { return rules_; }

private:
    ExtractionRules rules_;

    // Helper methods
    bool matchesBoilerplate(const DomNode& node) const;
    bool isMediaTag(const std::string& tag) const;
    std::vector<std::pair<DomNode, ContentBlock>> collectHeadings(const HtmlDocument& document) const;
    static std::string nodeText(const DomNode& node);
};
