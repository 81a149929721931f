#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "analysis_result.hpp"
#include "html_document.hpp"

// One schema.org entity in canonical shape: a JSON object with "@type" and its properties
struct SchemaEntity {
    enum class Format { JsonLd, Microdata, Rdfa };

    Format format = Format::JsonLd;
    nlohmann::json data = nlohmann::json::object();

    std::string formatName() const;

    // "@type" as a list (a single type becomes a one-element list)
    std::vector<std::string> types() const;

    nlohmann::json toJson() const;
};

// Which encodings to scan
struct SchemaExtractorConfig {
    bool extractJsonLd = true;
    bool extractMicrodata = true;
    bool extractRdfa = true;
    bool skipNestedItems = false;      // When set, nested items only appear inside their parent
};

class SchemaExtractor {
public:
    explicit SchemaExtractor(const SchemaExtractorConfig& config = SchemaExtractorConfig());

    // Scan a parsed document. A null document falls back to scanning the raw HTML for JSON-LD blocks.
    AnalysisResult<std::vector<SchemaEntity>> extract(const HtmlDocument* document,
                                                      const std::string& rawHtml = "") const;

    std::vector<SchemaEntity> extractJsonLd(const HtmlDocument& document) const;
    std::vector<SchemaEntity> extractMicrodata(const HtmlDocument& document) const;
    std::vector<SchemaEntity> extractRdfa(const HtmlDocument& document) const;

    // Parse one JSON-LD script body; malformed input yields no entities
    std::vector<SchemaEntity> parseJsonLdBlock(const std::string& text) const;

    // Unique types in first-seen order
    static std::vector<std::string> extractSchemaTypes(const std::vector<SchemaEntity>& entities);

    // Add a property keeping the first value; later values turn it into a list
    static void addProperty(nlohmann::json& properties, const std::string& name, nlohmann::json value);

    // JSON-LD nodes sharing an "@id" describe one entity; merge them in first-seen order
    static std::vector<SchemaEntity> mergeById(std::vector<SchemaEntity> entities);

    // Remove schema.org URL and "schema:" prefixes
    static std::string stripSchemaPrefix(const std::string& value);

    const SchemaExtractorConfig& getConfig() const { return config_; }

private:
    SchemaExtractorConfig config_;

    // Helper methods
    std::vector<SchemaEntity> extractItems(const HtmlDocument& document, SchemaEntity::Format format) const;
    nlohmann::json extractProperties(const HtmlDocument& document, const DomNode& node,
                                     SchemaEntity::Format format) const;
    static nlohmann::json typeValue(const DomNode& node, SchemaEntity::Format format);
    static bool hasScopedAncestor(const DomNode& node, SchemaEntity::Format format);
    static bool inSchemaVocabulary(const DomNode& node);
    static std::string propertyValue(const DomNode& node);
    static std::vector<std::string> scanJsonLdBlocks(const std::string& html);
};
