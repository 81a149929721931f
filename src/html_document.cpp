#include "html_document.hpp"
#include "text_utils.hpp"
#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/xpath.h>
#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>
#include <mutex>

namespace {

std::once_flag parserInitFlag;

// Copy an xmlChar buffer into a string and release it
std::string takeXmlString(xmlChar* value) {
    if (!value) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

bool isBlockLevel(const std::string& tag) {
    static const char* blocks[] = {
        "p", "div", "section", "article", "main", "header", "footer", "nav", "aside",
        "h1", "h2", "h3", "h4", "h5", "h6", "li", "ul", "ol", "table", "tr", "td", "th",
        "br", "blockquote", "pre", "figure", "figcaption", "form", "dd", "dt", "dl"
    };
    for (const char* block : blocks) {
        if (tag == block) {
            return true;
        }
    }
    return false;
}

}

bool DomNode::isElement() const {
    return node_ && node_->type == XML_ELEMENT_NODE;
}

bool DomNode::isText() const {
    return node_ && (node_->type == XML_TEXT_NODE || node_->type == XML_CDATA_SECTION_NODE);
}

std::string DomNode::tagName() const {
    if (!isElement() || !node_->name) {
        return "";
    }
    return TextUtils::toLower(reinterpret_cast<const char*>(node_->name));
}

std::string DomNode::attribute(const std::string& name) const {
    if (!isElement()) {
        return "";
    }
    return takeXmlString(xmlGetProp(node_, BAD_CAST name.c_str()));
}

bool DomNode::hasAttribute(const std::string& name) const {
    return isElement() && xmlHasProp(node_, BAD_CAST name.c_str()) != nullptr;
}

std::vector<std::pair<std::string, std::string>> DomNode::attributes() const {
    std::vector<std::pair<std::string, std::string>> result;
    if (!isElement()) {
        return result;
    }
    for (xmlAttrPtr attr = node_->properties; attr; attr = attr->next) {
        if (!attr->name) {
            continue;
        }
        std::string name = TextUtils::toLower(reinterpret_cast<const char*>(attr->name));
        result.emplace_back(name, takeXmlString(xmlNodeListGetString(node_->doc, attr->children, 1)));
    }
    return result;
}

std::string DomNode::text() const {
    if (!node_) {
        return "";
    }
    return takeXmlString(xmlNodeGetContent(node_));
}

DomNode DomNode::parent() const {
    if (!node_ || !node_->parent || node_->parent->type != XML_ELEMENT_NODE) {
        return DomNode();
    }
    return DomNode(node_->parent);
}

std::vector<DomNode> DomNode::children() const {
    std::vector<DomNode> result;
    if (!node_) {
        return result;
    }
    for (xmlNodePtr child = node_->children; child; child = child->next) {
        result.emplace_back(child);
    }
    return result;
}

std::vector<DomNode> DomNode::elementChildren() const {
    std::vector<DomNode> result;
    if (!node_) {
        return result;
    }
    for (xmlNodePtr child = node_->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            result.emplace_back(child);
        }
    }
    return result;
}

void HtmlDocument::XmlDocDeleter::operator()(xmlDoc* doc) const {
    if (doc) {
        xmlFreeDoc(doc);
    }
}

std::unique_ptr<HtmlDocument> HtmlDocument::parse(const std::string& html, const std::string& baseUrl,
                                                  size_t maxSize) {
    if (TextUtils::trim(html).empty()) {
        return nullptr;
    }
    // libxml2 takes the buffer length as an int
    size_t limit = std::min(maxSize, static_cast<size_t>(std::numeric_limits<int>::max()));
    if (html.size() > limit) {
        std::cerr << "Warning: HTML input of " << html.size() << " bytes exceeds the limit of "
                  << limit << " bytes, not parsing" << std::endl;
        return nullptr;
    }

    // libxml2 must be initialised once before documents are used from several threads
    std::call_once(parserInitFlag, []() { xmlInitParser(); });

    xmlDoc* doc = htmlReadMemory(html.c_str(), static_cast<int>(html.size()),
                                 baseUrl.empty() ? nullptr : baseUrl.c_str(), "UTF-8",
                                 HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                 HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
    if (!doc) {
        return nullptr;
    }
    if (!xmlDocGetRootElement(doc)) {
        xmlFreeDoc(doc);
        return nullptr;
    }
    return std::unique_ptr<HtmlDocument>(new HtmlDocument(doc, html, baseUrl));
}

HtmlDocument::HtmlDocument(xmlDoc* doc, const std::string& html, const std::string& baseUrl)
    : doc_(doc), rawHtml_(html), baseUrl_(baseUrl) {
    indexNodes();

    DomNode titleNode = queryFirst("//title");
    if (titleNode.valid()) {
        title_ = TextUtils::trim(TextUtils::collapseWhitespace(titleNode.text()));
    }

    DomNode description = queryFirst("//meta[@name='description' or @name='Description']");
    if (description.valid()) {
        metaDescription_ = TextUtils::trim(description.attribute("content"));
    }

    DomNode bodyNode = body();
    plainText_ = visibleText(bodyNode.valid() ? bodyNode : root());
}

void HtmlDocument::indexNodes() {
    size_t counter = 0;
    std::function<void(xmlNodePtr)> walk = [&](xmlNodePtr node) {
        for (xmlNodePtr cur = node; cur; cur = cur->next) {
            order_[cur] = counter++;
            if (cur->children) {
                walk(cur->children);
            }
        }
    };
    walk(xmlDocGetRootElement(doc_.get()));
}

std::vector<DomNode> HtmlDocument::evaluate(const std::string& xpath, xmlNodePtr context) const {
    std::vector<DomNode> nodes;

    xmlXPathContextPtr ctx = xmlXPathNewContext(doc_.get());
    if (!ctx) {
        return nodes;
    }
    if (context) {
        ctx->node = context;
    }

    xmlXPathObjectPtr result = xmlXPathEvalExpression(BAD_CAST xpath.c_str(), ctx);
    if (!result) {
        std::cerr << "Warning: Invalid XPath expression: " << xpath << std::endl;
        xmlXPathFreeContext(ctx);
        return nodes;
    }

    if (result->type == XPATH_NODESET && result->nodesetval) {
        xmlNodeSetPtr set = result->nodesetval;
        nodes.reserve(static_cast<size_t>(set->nodeNr));
        for (int i = 0; i < set->nodeNr; ++i) {
            nodes.emplace_back(set->nodeTab[i]);
        }
    }

    xmlXPathFreeObject(result);
    xmlXPathFreeContext(ctx);
    return nodes;
}

std::vector<DomNode> HtmlDocument::query(const std::string& xpath) const {
    return evaluate(xpath, nullptr);
}

std::vector<DomNode> HtmlDocument::query(const std::string& xpath, const DomNode& context) const {
    if (!context.valid()) {
        return {};
    }
    return evaluate(xpath, context.raw());
}

DomNode HtmlDocument::queryFirst(const std::string& xpath) const {
    std::vector<DomNode> nodes = query(xpath);
    return nodes.empty() ? DomNode() : nodes.front();
}

DomNode HtmlDocument::root() const {
    return DomNode(xmlDocGetRootElement(doc_.get()));
}

DomNode HtmlDocument::body() const {
    return queryFirst("//body");
}

size_t HtmlDocument::documentOrder(const DomNode& node) const {
    auto it = order_.find(node.raw());
    return it == order_.end() ? order_.size() : it->second;
}

std::string HtmlDocument::visibleText(const DomNode& node) {
    if (!node.valid()) {
        return "";
    }
    std::string text;
    std::function<void(xmlNodePtr)> walk = [&](xmlNodePtr cur) {
        for (; cur; cur = cur->next) {
            if (cur->type == XML_TEXT_NODE || cur->type == XML_CDATA_SECTION_NODE) {
                if (cur->content) {
                    text += reinterpret_cast<const char*>(cur->content);
                }
            } else if (cur->type == XML_ELEMENT_NODE) {
                std::string tag = DomNode(cur).tagName();
                if (tag == "script" || tag == "style" || tag == "noscript" || tag == "template") {
                    continue;
                }
                bool block = isBlockLevel(tag);
                if (block) {
                    text += ' ';
                }
                walk(cur->children);
                if (block) {
                    text += ' ';
                }
            }
        }
    };
    if (node.isText()) {
        return TextUtils::trim(TextUtils::collapseWhitespace(node.text()));
    }
    walk(node.raw()->children);
    return TextUtils::trim(TextUtils::collapseWhitespace(text));
}
