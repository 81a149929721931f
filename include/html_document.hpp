#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <utility>
#include <libxml/tree.h>

// Non-owning view of one node in an HtmlDocument. Valid only while the document lives.
class DomNode {
public:
    DomNode() = default;
    explicit DomNode(xmlNodePtr node) : node_(node) {}

    bool valid() const { return node_ != nullptr; }
    bool isElement() const;
    bool isText() const;

    // Lowercase tag name ("" for non-elements)
    std::string tagName() const;

    // Attribute value ("" when absent)
    std::string attribute(const std::string& name) const;
    bool hasAttribute(const std::string& name) const;

    // All attributes as (lowercase name, value) pairs
    std::vector<std::pair<std::string, std::string>> attributes() const;

    // Concatenated text of the node and its descendants (entities decoded)
    std::string text() const;

    DomNode parent() const;
    std::vector<DomNode> children() const;
    std::vector<DomNode> elementChildren() const;

    xmlNodePtr raw() const { return node_; }

    bool operator==(const DomNode& other) const { return node_ == other.node_; }
    bool operator!=(const DomNode& other) const { return node_ != other.node_; }

private:
    xmlNodePtr node_ = nullptr;
};

// Parsed HTML document backed by libxml2. Immutable once built.
class HtmlDocument {
public:
    static constexpr size_t MAX_HTML_SIZE = 100 * 1024 * 1024;

    // Parse HTML; returns nullptr when the input is empty, larger than maxSize or cannot be parsed
    static std::unique_ptr<HtmlDocument> parse(const std::string& html, const std::string& baseUrl = "",
                                               size_t maxSize = MAX_HTML_SIZE);

    // Evaluate an XPath expression against the whole document (results in document order)
    std::vector<DomNode> query(const std::string& xpath) const;

    // Evaluate a relative XPath expression with the given context node
    std::vector<DomNode> query(const std::string& xpath, const DomNode& context) const;

    // First match of an XPath expression (invalid node when nothing matches)
    DomNode queryFirst(const std::string& xpath) const;

    DomNode root() const;
    DomNode body() const;

    // Position of a node in a depth-first walk, used to merge query results
    size_t documentOrder(const DomNode& node) const;

    const std::string& rawHtml() const { return rawHtml_; }
    const std::string& baseUrl() const { return baseUrl_; }
    const std::string& title() const { return title_; }
    const std::string& metaDescription() const { return metaDescription_; }

    // Visible text of the body, scripts and styles excluded, whitespace collapsed
    const std::string& plainText() const { return plainText_; }

    // Visible text of any subtree, same rules as plainText()
    static std::string visibleText(const DomNode& node);

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

private:
    struct XmlDocDeleter {
        void operator()(xmlDoc* doc) const;
    };

    HtmlDocument(xmlDoc* doc, const std::string& html, const std::string& baseUrl);

    std::unique_ptr<xmlDoc, XmlDocDeleter> doc_;
    std::string rawHtml_;
    std::string baseUrl_;
    std::string title_;
    std::string metaDescription_;
    std::string plainText_;
    std::unordered_map<const xmlNode*, size_t> order_;

    // Helper methods
    void indexNodes();
    std::vector<DomNode> evaluate(const std::string& xpath, xmlNodePtr context) const;
};
