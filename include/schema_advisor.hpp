#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <regex>
#include <nlohmann/json.hpp>
#include "html_document.hpp"
#include "schema_extractor.hpp"
#include "schema_validator.hpp"

// Keyword tables and page patterns used to suggest schema types
struct SchemaAdvisorConfig {
    // Business type -> keywords; ties between types go to the earlier entry
    std::vector<std::pair<std::string, std::vector<std::string>>> businessTypeKeywords = {
        {"Restaurant", {"restaurant", "cafe", "dining", "eatery", "food", "bistro", "menu", "lunch", "dinner", "breakfast"}},
        {"Hotel", {"hotel", "motel", "inn", "lodge", "lodging", "accommodation", "stay", "room", "booking"}},
        {"Store", {"store", "shop", "retail", "market", "mart", "boutique", "buy", "purchase"}},
        {"MedicalBusiness", {"medical", "doctor", "physician", "clinic", "hospital", "healthcare", "health", "patient"}},
        {"ProfessionalService", {"lawyer", "attorney", "accountant", "consultant", "professional", "service", "advisor"}},
        {"AutomotiveBusiness", {"auto", "car", "vehicle", "repair", "mechanic", "automotive", "garage", "dealership"}},
        {"FoodEstablishment", {"food", "restaurant", "cafe", "bar", "pub", "diner", "cuisine", "menu"}},
        {"HealthAndBeautyBusiness", {"salon", "spa", "beauty", "hair", "nail", "barber", "stylist", "massage"}},
        {"HomeAndConstructionBusiness", {"contractor", "construction", "builder", "remodel", "renovation", "home improvement"}},
        {"RealEstateAgent", {"real estate", "realtor", "property", "home", "apartment", "house", "listing"}}
    };

    std::vector<std::string> localPostTypes = {
        "location", "store", "branch", "local", "office",
        "locations", "stores", "branches", "offices",
        "place", "places", "shop", "shops", "showroom", "showrooms", "venue", "venues",
        "dealer", "dealership", "clinic", "clinics", "hospital", "hospitals", "pharmacy", "pharmacies",
        "practice", "practices", "studio", "studios", "gym", "gyms", "salon", "salons", "spa", "spas",
        "restaurant", "restaurants", "cafe", "cafes", "bar", "bars", "pub", "pubs",
        "hotel", "hotels", "motel", "motels", "lodging", "lodgings", "center", "centre", "service_center",
        "wpseo_locations", "wpsl_stores", "tribe_venue", "gd_place", "gd_location"
    };

    // Case-insensitive patterns matched against the title and the URL path
    std::vector<std::string> localPagePatterns = {
        "contact", "about", "locations?", "our-locations?", "stores?", "store-?locator",
        "find", "find-us", "find-?a-?store", "where-?to-?buy", "visit", "visit-us", "directions", "map",
        "parking", "hours", "opening-?hours", "business-?hours", "office", "branch", "branches",
        "showrooms?", "appointments?", "book-?appointment", "schedule-?appointment", "reservation",
        "reserve-?table", "near-?me", "store-?pickup"
    };

    std::vector<std::string> articlePostTypes = {"post", "article", "blog"};
    std::vector<std::string> newsKeywords = {"news", "breaking", "report", "announced", "latest"};

    // Signals needed before a page that is not local still gets a business type
    double organizationSignalThreshold = 0.4;
};

// Local business evidence found in page text
struct LocalSignals {
    bool hasAddress = false;
    bool hasPhone = false;
    bool hasBusinessHours = false;
    bool hasMap = false;
    bool hasReviews = false;
    std::vector<std::pair<std::string, size_t>> keywordMatches;
    size_t keywordMatchCount = 0;
    double signalStrength = 0.0;    // 0-1

    nlohmann::json toJson() const;
};

struct SchemaSuggestion {
    bool hasSchema = false;
    bool hasAppropriateSchema = false;
    bool relevantForLocal = false;
    std::string primarySuggestion;
    std::vector<std::string> contentTypes;      // Types implied by the page structure
    std::vector<std::string> suggestedTypes;    // Primary suggestion first, then content types
    LocalSignals localSignals;
    double score = 0.0;                         // 0-1
    std::vector<std::string> suggestions;

    nlohmann::json toJson() const;
};

// Page facts the suggestion depends on
struct SchemaAdviceInput {
    const HtmlDocument* document = nullptr;
    std::string html;
    std::string text;
    std::string title;
    std::string url;
    std::string postType;
    std::vector<std::string> localKeywords;
};

// Suggests schema.org types for a page from its structure and its local business signals
class SchemaAdvisor {
public:
    // Throws std::invalid_argument when a local page pattern is not a valid regex
    explicit SchemaAdvisor(const SchemaAdvisorConfig& config = SchemaAdvisorConfig(),
                           const SchemaRules& rules = SchemaRules());

    // Full suggestion, compared against the entities already on the page
    SchemaSuggestion advise(const SchemaAdviceInput& input, const std::vector<SchemaEntity>& entities,
                            const std::optional<LocalBusinessValidation>& businessValidation) const;

    // Schema types the page structure calls for, in a fixed order
    std::vector<std::string> identifyContentSchemas(const HtmlDocument& document, const std::string& postType) const;

    // Structure detectors
    bool hasArticleStructure(const HtmlDocument& document) const;
    bool hasNewsArticleCharacteristics(const HtmlDocument& document) const;
    bool hasBlogPostCharacteristics(const HtmlDocument& document) const;
    bool hasFaqStructure(const HtmlDocument& document) const;
    bool hasBreadcrumbNavigation(const HtmlDocument& document) const;
    bool hasProductStructure(const HtmlDocument& document) const;
    bool hasRecipeStructure(const HtmlDocument& document) const;
    bool hasEventStructure(const HtmlDocument& document) const;
    bool hasHowToStructure(const HtmlDocument& document) const;
    bool hasReviewStructure(const HtmlDocument& document) const;
    bool hasVideoContent(const HtmlDocument& document) const;

    LocalSignals analyzeLocalSignals(const std::string& text, const std::string& html,
                                     const std::vector<std::string>& localKeywords) const;

    // Local post types, local title or URL patterns, or a street address on a plain page
    bool isRelevantPageType(const std::string& postType, const std::string& title,
                            const std::string& url, const std::string& text) const;

    // LocalBusiness subtype, Place, ProfessionalService or Organization
    std::string suggestSchemaType(bool relevantPage, const LocalSignals& signals,
                                  const std::vector<std::string>& localKeywords) const;

    // An existing entity has the suggested type or one of its subtypes
    bool hasAppropriateSchema(const std::vector<SchemaEntity>& entities, const std::string& suggestedType) const;

    static bool hasStreetAddress(const std::string& text);

    const SchemaAdvisorConfig& getConfig() const { return config_; }

private:
    SchemaAdvisorConfig config_;
    SchemaValidator validator_;
    std::vector<std::regex> localPagePatterns_;

    // Helper methods
    bool anyMatch(const HtmlDocument& document, const std::vector<std::string>& xpaths) const;
    bool visibleTextMatches(const HtmlDocument& document, const std::string& xpath, const std::string& pattern) const;
    static double scoreSuggestion(const SchemaSuggestion& suggestion,
                                  const std::optional<LocalBusinessValidation>& businessValidation);
    static std::vector<std::string> suggestionCodes(const SchemaSuggestion& suggestion,
                                                    const std::optional<LocalBusinessValidation>& businessValidation);
};
