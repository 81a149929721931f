#include "schema_extractor.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

using json = nlohmann::json;

namespace {

struct FormatAttributes {
    const char* scope;
    const char* type;
    const char* property;
};

FormatAttributes attributesFor(SchemaEntity::Format format) {
    if (format == SchemaEntity::Format::Rdfa) {
        return {"typeof", "typeof", "property"};
    }
    return {"itemscope", "itemtype", "itemprop"};
}

}

std::string SchemaEntity::formatName() const {
    switch (format) {
        case Format::JsonLd: return "json-ld";
        case Format::Microdata: return "microdata";
        case Format::Rdfa: return "rdfa";
    }
    return "unknown";
}

std::vector<std::string> SchemaEntity::types() const {
    std::vector<std::string> result;
    auto it = data.find("@type");
    if (it == data.end()) {
        return result;
    }
    if (it->is_string()) {
        result.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& type : *it) {
            if (type.is_string()) {
                result.push_back(type.get<std::string>());
            }
        }
    }
    return result;
}

json SchemaEntity::toJson() const {
    return json{{"format", formatName()}, {"schema", data}};
}

SchemaExtractor::SchemaExtractor(const SchemaExtractorConfig& config)
    : config_(config) {
}

AnalysisResult<std::vector<SchemaEntity>> SchemaExtractor::extract(const HtmlDocument* document,
                                                                    const std::string& rawHtml) const {
    std::vector<SchemaEntity> entities;

    if (!document) {
        // Without a DOM only script blocks can be recovered
        if (config_.extractJsonLd) {
            for (const auto& block : scanJsonLdBlocks(rawHtml)) {
                auto parsed = parseJsonLdBlock(block);
                entities.insert(entities.end(), parsed.begin(), parsed.end());
            }
            entities = mergeById(std::move(entities));
        }
        return {Outcome::ParseFailure, std::move(entities)};
    }

    if (config_.extractJsonLd) {
        auto found = extractJsonLd(*document);
        entities.insert(entities.end(), found.begin(), found.end());
    }
    if (config_.extractMicrodata) {
        auto found = extractMicrodata(*document);
        entities.insert(entities.end(), found.begin(), found.end());
    }
    if (config_.extractRdfa) {
        auto found = extractRdfa(*document);
        entities.insert(entities.end(), found.begin(), found.end());
    }

    Outcome outcome = entities.empty() ? Outcome::Empty : Outcome::Ok;
    return {outcome, std::move(entities)};
}

std::vector<SchemaEntity> SchemaExtractor::extractJsonLd(const HtmlDocument& document) const {
    std::vector<SchemaEntity> entities;
    // Type values may differ in case or carry parameters such as a charset
    const char* xpath =
        "//script[starts-with(translate(normalize-space(@type), "
        "'ABCDEFGHIJKLMNOPQRSTUVWXYZ', 'abcdefghijklmnopqrstuvwxyz'), 'application/ld+json')]";
    for (const auto& script : document.query(xpath)) {
        auto parsed = parseJsonLdBlock(script.text());
        entities.insert(entities.end(), parsed.begin(), parsed.end());
    }
    return mergeById(std::move(entities));
}

std::vector<SchemaEntity> SchemaExtractor::parseJsonLdBlock(const std::string& text) const {
    std::vector<SchemaEntity> entities;
    std::string body = TextUtils::trim(text);
    if (body.empty()) {
        return entities;
    }

    json data = json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        std::cerr << "Warning: Skipping malformed JSON-LD block" << std::endl;
        return entities;
    }

    auto addObject = [&entities](const json& value) {
        if (value.is_object() && !value.empty()) {
            SchemaEntity entity;
            entity.format = SchemaEntity::Format::JsonLd;
            entity.data = value;
            entities.push_back(std::move(entity));
        }
    };

    if (data.is_object()) {
        auto graph = data.find("@graph");
        if (graph != data.end() && graph->is_array()) {
            for (const auto& item : *graph) {
                addObject(item);
            }
        } else {
            addObject(data);
        }
    } else if (data.is_array()) {
        for (const auto& item : data) {
            addObject(item);
        }
    }
    return entities;
}

std::vector<SchemaEntity> SchemaExtractor::extractMicrodata(const HtmlDocument& document) const {
    return extractItems(document, SchemaEntity::Format::Microdata);
}

std::vector<SchemaEntity> SchemaExtractor::extractRdfa(const HtmlDocument& document) const {
    return extractItems(document, SchemaEntity::Format::Rdfa);
}

std::vector<SchemaEntity> SchemaExtractor::extractItems(const HtmlDocument& document,
                                                        SchemaEntity::Format format) const {
    FormatAttributes attributes = attributesFor(format);
    std::vector<SchemaEntity> entities;

    for (const auto& node : document.query(std::string("//*[@") + attributes.scope + "]")) {
        std::string type = node.attribute(attributes.type);
        bool schemaOrg = TextUtils::contains(type, "schema.org") ||
                         (format == SchemaEntity::Format::Rdfa &&
                          (TextUtils::contains(type, "schema:") || inSchemaVocabulary(node)));
        if (!schemaOrg) {
            continue;
        }
        if (config_.skipNestedItems && node.hasAttribute(attributes.property) && hasScopedAncestor(node, format)) {
            continue;
        }

        SchemaEntity entity;
        entity.format = format;
        entity.data = extractProperties(document, node, format);
        entity.data["@type"] = typeValue(node, format);
        entities.push_back(std::move(entity));
    }
    return entities;
}

json SchemaExtractor::extractProperties(const HtmlDocument& document, const DomNode& node,
                                        SchemaEntity::Format format) const {
    FormatAttributes attributes = attributesFor(format);
    json properties = json::object();

    for (const auto& prop : document.query(std::string(".//*[@") + attributes.property + "]", node)) {
        std::string name = TextUtils::trim(prop.attribute(attributes.property));
        if (format == SchemaEntity::Format::Rdfa) {
            name = stripSchemaPrefix(name);
        }
        if (name.empty()) {
            continue;
        }

        json value;
        if (prop.hasAttribute(attributes.scope)) {
            value = extractProperties(document, prop, format);
            json nestedType = typeValue(prop, format);
            if (!nestedType.is_null()) {
                value["@type"] = nestedType;
            }
            if (value.empty()) {
                continue;
            }
        } else {
            std::string text = propertyValue(prop);
            if (text.empty()) {
                continue;
            }
            value = text;
        }

        // Descendants of nested items count too, so their names can collide with the parent's
        addProperty(properties, name, std::move(value));
    }
    return properties;
}

void SchemaExtractor::addProperty(json& properties, const std::string& name, json value) {
    auto existing = properties.find(name);
    if (existing == properties.end()) {
        properties[name] = std::move(value);
        return;
    }
    // The first occurrence stays in front, repeats accumulate after it
    if (!existing->is_array()) {
        json first = *existing;
        *existing = json::array({first});
    }
    existing->push_back(std::move(value));
}

std::vector<SchemaEntity> SchemaExtractor::mergeById(std::vector<SchemaEntity> entities) {
    std::vector<SchemaEntity> merged;
    std::unordered_map<std::string, size_t> byId;

    for (auto& entity : entities) {
        auto id = entity.data.find("@id");
        if (id == entity.data.end() || !id->is_string() || id->get<std::string>().empty()) {
            merged.push_back(std::move(entity));
            continue;
        }

        auto known = byId.find(id->get<std::string>());
        if (known == byId.end()) {
            byId.emplace(id->get<std::string>(), merged.size());
            merged.push_back(std::move(entity));
            continue;
        }

        json& target = merged[known->second].data;
        for (auto it = entity.data.begin(); it != entity.data.end(); ++it) {
            auto current = target.find(it.key());
            if (current != target.end() &&
                (*current == it.value() ||
                 (current->is_array() && std::find(current->begin(), current->end(), it.value()) != current->end()))) {
                continue;
            }
            addProperty(target, it.key(), it.value());
        }
    }
    return merged;
}

json SchemaExtractor::typeValue(const DomNode& node, SchemaEntity::Format format) {
    std::vector<std::string> types;
    for (const auto& part : TextUtils::splitWhitespace(node.attribute(attributesFor(format).type))) {
        std::string stripped = stripSchemaPrefix(part);
        if (!stripped.empty()) {
            types.push_back(stripped);
        }
    }
    if (types.empty()) {
        return nullptr;
    }
    if (types.size() == 1) {
        return types.front();
    }
    return types;
}

bool SchemaExtractor::hasScopedAncestor(const DomNode& node, SchemaEntity::Format format) {
    const char* scope = attributesFor(format).scope;
    for (DomNode current = node.parent(); current.valid(); current = current.parent()) {
        if (current.hasAttribute(scope)) {
            return true;
        }
    }
    return false;
}

bool SchemaExtractor::inSchemaVocabulary(const DomNode& node) {
    for (DomNode current = node; current.valid(); current = current.parent()) {
        if (current.hasAttribute("vocab")) {
            return TextUtils::contains(current.attribute("vocab"), "schema.org");
        }
    }
    return false;
}

std::string SchemaExtractor::propertyValue(const DomNode& node) {
    std::string tag = node.tagName();
    if (tag == "meta") {
        return TextUtils::trim(node.attribute("content"));
    }
    if (tag == "img" || tag == "link") {
        std::string href = TextUtils::trim(node.attribute("href"));
        return href.empty() ? TextUtils::trim(node.attribute("src")) : href;
    }
    if (tag == "time") {
        std::string datetime = TextUtils::trim(node.attribute("datetime"));
        return datetime.empty() ? TextUtils::collapseWhitespace(TextUtils::trim(node.text())) : datetime;
    }
    if (tag == "a") {
        return TextUtils::trim(node.attribute("href"));
    }
    if (node.hasAttribute("content")) {
        return TextUtils::trim(node.attribute("content"));
    }
    return TextUtils::collapseWhitespace(TextUtils::trim(node.text()));
}

std::string SchemaExtractor::stripSchemaPrefix(const std::string& value) {
    static const std::vector<std::string> prefixes = {
        "https://schema.org/", "http://schema.org/", "https://www.schema.org/", "http://www.schema.org/", "schema:"
    };
    std::string result = TextUtils::trim(value);
    for (const auto& prefix : prefixes) {
        if (TextUtils::startsWith(result, prefix)) {
            return result.substr(prefix.size());
        }
    }
    return result;
}

std::vector<std::string> SchemaExtractor::extractSchemaTypes(const std::vector<SchemaEntity>& entities) {
    std::vector<std::string> types;
    std::unordered_set<std::string> seen;
    for (const auto& entity : entities) {
        for (const auto& type : entity.types()) {
            if (seen.insert(type).second) {
                types.push_back(type);
            }
        }
    }
    return types;
}

std::vector<std::string> SchemaExtractor::scanJsonLdBlocks(const std::string& html) {
    std::vector<std::string> blocks;
    std::string lower = TextUtils::toLower(html);
    size_t pos = 0;

    while ((pos = lower.find("<script", pos)) != std::string::npos) {
        size_t openEnd = lower.find('>', pos);
        if (openEnd == std::string::npos) {
            break;
        }
        size_t close = lower.find("</script", openEnd);
        if (close == std::string::npos) {
            break;
        }
        if (lower.substr(pos, openEnd - pos).find("application/ld+json") != std::string::npos) {
            blocks.push_back(html.substr(openEnd + 1, close - openEnd - 1));
        }
        pos = close + 8;
    }
    return blocks;
}
