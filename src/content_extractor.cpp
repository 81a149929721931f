#include "content_extractor.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <functional>
#include <unordered_set>
#include <utility>
#include <libxml/tree.h>

std::vector<std::string> ExtractedContent::paragraphs() const {
    std::vector<std::string> result;
    for (const auto& block : blocks) {
        if (block.type == ContentBlock::Type::Paragraph) {
            result.push_back(block.text);
        }
    }
    return result;
}

std::vector<ContentBlock> ExtractedContent::headings() const {
    std::vector<ContentBlock> result;
    for (const auto& block : blocks) {
        if (block.type == ContentBlock::Type::Heading) {
            result.push_back(block);
        }
    }
    return result;
}

std::string ExtractedContent::plainText() const {
    std::vector<std::string> texts;
    texts.reserve(blocks.size());
    for (const auto& block : blocks) {
        texts.push_back(block.text);
    }
    return TextUtils::join(texts, "\n");
}

ContentExtractor::ContentExtractor(const ExtractionRules& rules)
    : rules_(rules) {
}

ExtractedContent ContentExtractor::extract(const HtmlDocument* document, const std::string& rawHtml) const {
    if (!document) {
        return extractFallback(rawHtml);
    }

    std::vector<std::pair<size_t, ContentBlock>> ordered;

    for (auto& heading : collectHeadings(*document)) {
        ordered.emplace_back(document->documentOrder(heading.first), std::move(heading.second));
    }

    for (const auto& node : selectParagraphNodes(*document)) {
        ContentBlock block;
        block.type = ContentBlock::Type::Paragraph;
        block.text = nodeText(node);
        if (block.text.empty()) {
            continue;
        }
        ordered.emplace_back(document->documentOrder(node), std::move(block));
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    ExtractedContent content;
    for (auto& entry : ordered) {
        content.blocks.push_back(std::move(entry.second));
    }
    content.outcome = content.blocks.empty() ? Outcome::Empty : Outcome::Ok;
    return content;
}

ExtractedContent ContentExtractor::extractFallback(const std::string& rawHtml) const {
    ExtractedContent content;
    content.fallbackUsed = true;
    if (TextUtils::trim(rawHtml).empty()) {
        content.outcome = Outcome::Empty;
        return content;
    }

    std::vector<std::pair<size_t, ContentBlock>> ordered;

    std::vector<size_t> positions;
    std::vector<std::string> paragraphs = TextUtils::extractTagContents(rawHtml, "p", &positions);
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        std::string text = TextUtils::cleanHtml(paragraphs[i]);
        if (!text.empty()) {
            ContentBlock block;
            block.type = ContentBlock::Type::Paragraph;
            block.text = text;
            ordered.emplace_back(positions[i], std::move(block));
        }
    }

    for (int level = 1; level <= 6; ++level) {
        positions.clear();
        std::vector<std::string> headings =
            TextUtils::extractTagContents(rawHtml, "h" + std::to_string(level), &positions);
        for (size_t i = 0; i < headings.size(); ++i) {
            std::string text = TextUtils::cleanHtml(headings[i]);
            if (!text.empty()) {
                ContentBlock block;
                block.type = ContentBlock::Type::Heading;
                block.level = level;
                block.text = text;
                ordered.emplace_back(positions[i], std::move(block));
            }
        }
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });
    for (auto& entry : ordered) {
        content.blocks.push_back(std::move(entry.second));
    }
    content.outcome = Outcome::ParseFailure;
    return content;
}

bool ContentExtractor::matchesBoilerplate(const DomNode& node) const {
    std::string tag = node.tagName();
    if (std::find(rules_.excludedTags.begin(), rules_.excludedTags.end(), tag) != rules_.excludedTags.end()) {
        return true;
    }

    std::string role = TextUtils::toLower(node.attribute("role"));
    if (!role.empty()) {
        for (const auto& token : TextUtils::splitWhitespace(role)) {
            if (std::find(rules_.excludedRoles.begin(), rules_.excludedRoles.end(), token) != rules_.excludedRoles.end()) {
                return true;
            }
        }
    }

    std::string classAttr = TextUtils::toLower(node.attribute("class"));
    if (!classAttr.empty()) {
        std::string padded = " " + classAttr + " ";
        for (const auto& fragment : rules_.excludedClassFragments) {
            if (padded.find(fragment) != std::string::npos) {
                return true;
            }
        }
    }

    std::string id = TextUtils::toLower(node.attribute("id"));
    if (!id.empty()) {
        for (const auto& fragment : rules_.excludedIdFragments) {
            if (id.find(fragment) != std::string::npos) {
                return true;
            }
        }
    }

    for (const auto& attr : rules_.labelAttributes) {
        std::string label = TextUtils::toLower(node.attribute(attr));
        if (label.empty()) {
            continue;
        }
        for (const auto& fragment : rules_.excludedLabelFragments) {
            if (label.find(fragment) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

bool ContentExtractor::isExcluded(const DomNode& node) const {
    DomNode current = node;
    int depth = 0;
    while (current.valid() && depth <= rules_.maxAncestorDepth) {
        // Every ancestor counts, body and html included
        if (current.isElement() && matchesBoilerplate(current)) {
            return true;
        }
        current = current.parent();
        ++depth;
    }
    return false;
}

bool ContentExtractor::isMediaTag(const std::string& tag) const {
    return std::find(rules_.mediaTags.begin(), rules_.mediaTags.end(), tag) != rules_.mediaTags.end();
}

bool ContentExtractor::isMeaningfulParagraph(const DomNode& paragraph) const {
    if (!paragraph.valid()) {
        return false;
    }

    // Direct text children
    for (const auto& child : paragraph.children()) {
        if (child.isText() && TextUtils::containsLetterOrDigit(child.text())) {
            return true;
        }
    }

    // Anchor labels, including accessible names
    for (const auto& child : paragraph.elementChildren()) {
        std::function<bool(const DomNode&)> anchorHasLabel = [&](const DomNode& node) {
            if (node.tagName() == "a") {
                if (TextUtils::containsLetterOrDigit(node.text()) ||
                    TextUtils::containsLetterOrDigit(node.attribute("aria-label")) ||
                    TextUtils::containsLetterOrDigit(node.attribute("title"))) {
                    return true;
                }
            }
            for (const auto& grandChild : node.elementChildren()) {
                if (anchorHasLabel(grandChild)) {
                    return true;
                }
            }
            return false;
        };
        if (anchorHasLabel(child)) {
            return true;
        }
    }

    // Non-media child elements with text
    for (const auto& child : paragraph.elementChildren()) {
        if (isMediaTag(child.tagName())) {
            continue;
        }
        if (TextUtils::containsLetterOrDigit(HtmlDocument::visibleText(child))) {
            return true;
        }
    }
    return false;
}

std::vector<DomNode> ContentExtractor::selectParagraphNodes(const HtmlDocument& document) const {
    std::vector<DomNode> candidates;
    std::unordered_set<const xmlNode*> seen;

    for (const auto& selector : rules_.paragraphSelectors) {
        for (const auto& node : document.query(selector)) {
            if (seen.insert(node.raw()).second) {
                candidates.push_back(node);
            }
        }
    }

    if (candidates.empty()) {
        for (const auto& node : document.query(rules_.fallbackParagraphSelector)) {
            if (seen.insert(node.raw()).second) {
                candidates.push_back(node);
            }
        }
    }

    std::vector<DomNode> selected;
    for (const auto& node : candidates) {
        if (!isExcluded(node) && isMeaningfulParagraph(node)) {
            selected.push_back(node);
        }
    }

    std::stable_sort(selected.begin(), selected.end(), [&document](const DomNode& a, const DomNode& b) {
        return document.documentOrder(a) < document.documentOrder(b);
    });
    return selected;
}

std::vector<std::pair<DomNode, ContentBlock>> ContentExtractor::collectHeadings(const HtmlDocument& document) const {
    std::vector<std::pair<DomNode, ContentBlock>> headings;
    for (const auto& node : document.query("//h1|//h2|//h3|//h4|//h5|//h6")) {
        if (isExcluded(node)) {
            continue;
        }
        std::string text = nodeText(node);
        if (text.empty()) {
            continue;
        }
        ContentBlock block;
        block.type = ContentBlock::Type::Heading;
        block.level = node.tagName()[1] - '0';
        block.text = text;
        headings.emplace_back(node, std::move(block));
    }
    return headings;
}

std::vector<ContentBlock> ContentExtractor::extractHeadings(const HtmlDocument& document) const {
    std::vector<ContentBlock> headings;
    for (auto& entry : collectHeadings(document)) {
        headings.push_back(std::move(entry.second));
    }
    return headings;
}

DomNode ContentExtractor::findMainContentRegion(const HtmlDocument& document) const {
    for (const auto& selector : rules_.mainRegionSelectors) {
        for (const auto& node : document.query(selector)) {
            if (!HtmlDocument::visibleText(node).empty()) {
                return node;
            }
        }
    }
    DomNode body = document.body();
    return body.valid() ? body : document.root();
}

std::string ContentExtractor::nodeText(const DomNode& node) {
    return HtmlDocument::visibleText(node);
}
