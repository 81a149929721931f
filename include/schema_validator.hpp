#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <nlohmann/json.hpp>

// Property tables and type hierarchy used by SchemaValidator
struct SchemaRules {
    struct PropertyRule {
        std::vector<std::string> required;
        std::vector<std::string> recommended;
    };

    std::map<std::string, PropertyRule> typeRules = {
        {"Article", {{"headline", "author", "datePublished", "publisher"}, {"image", "dateModified", "mainEntityOfPage"}}},
        {"BlogPosting", {{"headline", "author", "datePublished", "publisher"}, {"image", "dateModified", "mainEntityOfPage"}}},
        {"NewsArticle", {{"headline", "author", "datePublished", "publisher"}, {"image", "dateModified", "mainEntityOfPage"}}},
        {"Product", {{"name", "offers"}, {"image", "description", "brand", "aggregateRating", "review"}}},
        {"Organization", {{"name", "url"}, {"logo", "contactPoint", "sameAs", "address"}}},
        {"LocalBusiness", {{"name", "address", "telephone", "openingHours", "geo", "priceRange"},
                           {"description", "image", "url", "sameAs", "review", "aggregateRating", "hasMap"}}},
        {"Person", {{"name"}, {"image", "jobTitle", "worksFor", "sameAs"}}},
        {"Event", {{"name", "startDate", "location"}, {"image", "description", "endDate", "offers", "performer"}}},
        {"FAQPage", {{"mainEntity"}, {}}},
        {"HowTo", {{"name", "step"}, {"image", "description", "totalTime", "supply", "tool"}}},
        {"BreadcrumbList", {{"itemListElement"}, {}}},
        {"VideoObject", {{"name", "description", "thumbnailUrl", "uploadDate"},
                         {"contentUrl", "embedUrl", "duration", "interactionCount"}}}
    };

    PropertyRule defaultRule = {{"name"}, {"description"}};

    // Types that fall back to the default rule without a warning
    std::vector<std::string> genericTypes = {
        "Thing", "CreativeWork", "Place", "Event", "Organization", "Person", "Product"
    };

    std::vector<std::string> localBusinessSubtypes = {
        "AnimalShelter", "AutomotiveBusiness", "ChildCare", "Dentist",
        "DryCleaningOrLaundry", "EmergencyService", "EmploymentAgency",
        "EntertainmentBusiness", "FinancialService", "FoodEstablishment",
        "GovernmentOffice", "HealthAndBeautyBusiness", "HomeAndConstructionBusiness",
        "InternetCafe", "LegalService", "Library", "LodgingBusiness",
        "MedicalBusiness", "ProfessionalService", "RadioStation",
        "RealEstateAgent", "RecyclingCenter", "SelfStorage", "ShoppingCenter",
        "SportsActivityLocation", "Store", "TelevisionStation",
        "TouristInformationCenter", "TravelAgency", "Restaurant",
        "Cafe", "Bar", "Hotel", "Motel", "Resort"
    };

    // Parent type -> direct subtypes (LocalBusiness uses localBusinessSubtypes)
    std::map<std::string, std::vector<std::string>> typeHierarchy = {
        {"CreativeWork", {"Article", "BlogPosting", "NewsArticle", "WebPage", "Book", "Recipe", "Movie",
                          "TVSeries", "SoftwareApplication", "FAQPage", "HowTo", "Course", "Review"}},
        {"Organization", {"Corporation", "EducationalOrganization", "GovernmentOrganization", "MedicalOrganization",
                          "NGO", "School", "SportsOrganization", "LocalBusiness"}},
        {"WebPage", {"AboutPage", "CheckoutPage", "ContactPage", "CollectionPage", "FAQPage",
                     "ItemPage", "ProfilePage", "SearchResultsPage"}},
        {"Product", {"IndividualProduct", "ProductGroup", "Vehicle", "Offer"}}
    };

    // Accepted bare or behind a schema.org URL
    std::vector<std::string> availabilityValues = {
        "InStock", "OutOfStock", "PreOrder", "SoldOut", "Discontinued"
    };

    std::vector<std::string> addressFields = {"streetAddress", "addressLocality", "addressRegion", "postalCode"};
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> issues;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

struct LocalBusinessValidation {
    bool valid = false;
    double completeness = 0.0;           // percent
    std::vector<std::string> missingRequired;
    std::vector<std::string> missingRecommended;
    std::vector<std::string> incompleteProperties;
    nlohmann::json schemaType = "Unknown";

    nlohmann::json toJson() const;
};

class SchemaValidator {
public:
    explicit SchemaValidator(const SchemaRules& rules = SchemaRules());

    // Type-dispatched validation of one entity
    ValidationResult validateSchema(const nlohmann::json& schema) const;

    // Aggregate validation with per-entity issue and warning lists
    nlohmann::json validateSchemas(const std::vector<nlohmann::json>& schemas) const;

    // First LocalBusiness-like entity (subtypes, Organization or Place with an address)
    std::optional<nlohmann::json> findLocalBusinessSchema(const std::vector<nlohmann::json>& schemas) const;

    LocalBusinessValidation validateLocalBusiness(const nlohmann::json& schema) const;

    bool belongsToSchemaType(const std::string& type, const std::string& parentType) const;
    bool isLocalBusinessType(const std::string& type) const;

    // Nested structure checks returning their problems as messages
    std::vector<std::string> validateAddress(const nlohmann::json& address) const;
    std::vector<std::string> validateGeo(const nlohmann::json& geo) const;

    // Properties that are absent or strictly empty
    std::vector<std::string> findMissingProperties(const nlohmann::json& schema,
                                                   const std::vector<std::string>& properties) const;

    // Null, false, blank strings and containers whose members are all empty
    static bool isEmptyValue(const nlohmann::json& value);

    // Numbers and numeric strings
    static bool isNumeric(const nlohmann::json& value);

    // First "@type" entry ("" when absent)
    static std::string primaryType(const nlohmann::json& schema);

    const SchemaRules& getRules() const { return rules_; }

private:
    SchemaRules rules_;

    // Helper methods
    const SchemaRules::PropertyRule& ruleFor(const std::string& type, bool& generic) const;
    void validateFaqPage(const nlohmann::json& schema, std::vector<std::string>& issues,
                         std::vector<std::string>& warnings) const;
    void validateHowTo(const nlohmann::json& schema, std::vector<std::string>& issues,
                       std::vector<std::string>& warnings) const;
    void validateBreadcrumbList(const nlohmann::json& schema, std::vector<std::string>& issues,
                                std::vector<std::string>& warnings) const;
    void validateProduct(const nlohmann::json& schema, std::vector<std::string>& issues,
                         std::vector<std::string>& warnings) const;
    void validateOffer(const nlohmann::json& offer, size_t index, std::vector<std::string>& issues,
                       std::vector<std::string>& warnings) const;
    void validateAggregateOffer(const nlohmann::json& offer, std::vector<std::string>& issues,
                                std::vector<std::string>& warnings) const;
    void validateReview(const nlohmann::json& review, std::vector<std::string>& issues,
                        std::vector<std::string>& warnings) const;
    void validateAggregateRating(const nlohmann::json& rating, std::vector<std::string>& issues,
                                 std::vector<std::string>& warnings) const;
    bool isAllowedAvailability(const std::string& value) const;
};
