#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include "schema_validator.hpp"

using json = nlohmann::json;

namespace {

bool containsText(const std::vector<std::string>& messages, const std::string& text) {
    return std::any_of(messages.begin(), messages.end(),
        [&text](const std::string& message) { return message.find(text) != std::string::npos; });
}

json validAddress() {
    return json{
        {"@type", "PostalAddress"},
        {"streetAddress", "1 Main Street"},
        {"addressLocality", "Springfield"},
        {"addressRegion", "IL"},
        {"postalCode", "62701"}
    };
}

json validGeo() {
    return json{{"@type", "GeoCoordinates"}, {"latitude", 39.7817}, {"longitude", "-89.6501"}};
}

}

TEST_CASE("SchemaValidator required properties", "[SchemaValidator]") {
    SchemaValidator validator;

    SECTION("Missing type") {
        auto result = validator.validateSchema(json{{"name", "No type"}});
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.issues == std::vector<std::string>{"Missing @type property"});
    }

    SECTION("Missing required properties are listed together") {
        auto result = validator.validateSchema(json{{"@type", "Article"}, {"headline", "Brewing"}, {"author", ""}});
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0] == "Missing required properties: author, datePublished, publisher");
        REQUIRE(containsText(result.warnings, "Missing recommended properties: image"));
    }

    SECTION("Unknown types use the generic rule") {
        auto result = validator.validateSchema(json{{"@type", "Recipe"}, {"name", "Cold brew"}});
        REQUIRE(result.valid);
        REQUIRE(containsText(result.warnings, "Schema type 'Recipe' is not specifically validated"));
    }

    SECTION("Generic types do not warn about their rule") {
        auto result = validator.validateSchema(json{{"@type", "Thing"}, {"name", "Mug"}, {"description", "A mug"}});
        REQUIRE(result.valid);
        REQUIRE(result.warnings.empty());
    }
}

TEST_CASE("SchemaValidator nested structures", "[SchemaValidator]") {
    SchemaValidator validator;

    SECTION("Breadcrumb positions out of sequence only warn") {
        json breadcrumbs = {
            {"@type", "BreadcrumbList"},
            {"itemListElement", {
                {{"@type", "ListItem"}, {"position", 1}, {"item", "https://example.com/"}},
                {{"@type", "ListItem"}, {"position", "2"}, {"item", "https://example.com/a"}},
                {{"@type", "ListItem"}, {"position", 4}, {"item", "https://example.com/a/b"}}
            }}
        };
        auto result = validator.validateSchema(breadcrumbs);
        REQUIRE(result.valid);
        REQUIRE(result.issues.empty());
        REQUIRE(result.warnings.size() == 1);
        REQUIRE(containsText(result.warnings, "Expected position 3 but found 4"));
    }

    SECTION("Breadcrumb positions beyond the double range only warn") {
        json breadcrumbs = {
            {"@type", "BreadcrumbList"},
            {"itemListElement", {
                {{"@type", "ListItem"}, {"position", "1e400"}, {"item", "https://example.com/"}},
                {{"@type", "ListItem"}, {"position", "-1e300"}, {"item", "https://example.com/a"}}
            }}
        };
        json report;
        REQUIRE_NOTHROW(report = validator.validateSchemas({breadcrumbs}));
        REQUIRE(report["valid_schemas"] == 1);

        auto result = validator.validateSchema(breadcrumbs);
        REQUIRE(result.warnings.size() == 2);
        REQUIRE(containsText(result.warnings, "Expected position 1 but found 1e400"));
        REQUIRE(containsText(result.warnings, "Expected position 2 but found -1e300"));
    }

    SECTION("Huge offer counts are compared without overflow") {
        json product = {
            {"@type", "Product"},
            {"name", "Coffee Maker"},
            {"offers", {{"@type", "AggregateOffer"}, {"lowPrice", "1e400"}, {"priceCurrency", "USD"},
                        {"offerCount", "-1e300"}}}
        };
        ValidationResult result;
        REQUIRE_NOTHROW(result = validator.validateSchema(product));
        REQUIRE_FALSE(result.valid);
        REQUIRE(containsText(result.warnings, "AggregateOffer offerCount ('-1e300') must be a positive integer."));

        product["offers"]["offerCount"] = 1e300;
        product["offers"]["lowPrice"] = "10";
        result = validator.validateSchema(product);
        REQUIRE(result.valid);
        REQUIRE_FALSE(containsText(result.warnings, "offerCount"));
    }

    SECTION("FAQ questions need answers") {
        json faq = {
            {"@type", "FAQPage"},
            {"mainEntity", {
                {{"@type", "Question"}, {"name", "Why?"},
                 {"acceptedAnswer", {{"@type", "Answer"}, {"text", "Because."}}}},
                {{"@type", "Question"}, {"name", "How?"}}
            }}
        };
        auto result = validator.validateSchema(faq);
        REQUIRE_FALSE(result.valid);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(containsText(result.issues, "Question 1 is missing the 'acceptedAnswer'"));
    }

    SECTION("HowTo steps") {
        json howTo = {
            {"@type", "HowTo"},
            {"name", "Brew coffee"},
            {"step", {{"@type", "HowToStep"}, {"text", "Boil water"}}}
        };
        auto result = validator.validateSchema(howTo);
        REQUIRE(result.valid);
        REQUIRE(containsText(result.warnings, "HowToStep 0 is missing the recommended 'name'"));
    }

    SECTION("Aggregate offer with inverted prices") {
        json product = {
            {"@type", "Product"},
            {"name", "Coffee Maker"},
            {"offers", {{"@type", "AggregateOffer"}, {"lowPrice", 10}, {"highPrice", 5},
                        {"priceCurrency", "USD"}, {"offerCount", 3}}}
        };
        auto result = validator.validateSchema(product);
        REQUIRE(result.valid);
        REQUIRE(containsText(result.warnings, "AggregateOffer highPrice (5) is less than lowPrice (10)"));
    }

    SECTION("Offer prices must be numeric") {
        json product = {
            {"@type", "Product"},
            {"name", "Coffee Maker"},
            {"offers", {{"@type", "Offer"}, {"price", "cheap"}, {"priceCurrency", "USD"},
                        {"availability", "https://schema.org/InStock"}}}
        };
        auto result = validator.validateSchema(product);
        REQUIRE_FALSE(result.valid);
        REQUIRE(containsText(result.issues, "Offer 0 price ('cheap') must be a numeric value."));
    }

    SECTION("Aggregate rating needs a count") {
        json product = {
            {"@type", "Product"},
            {"name", "Coffee Maker"},
            {"aggregateRating", {{"@type", "AggregateRating"}, {"ratingValue", "4.5"}}}
        };
        auto result = validator.validateSchema(product);
        REQUIRE_FALSE(result.valid);
        REQUIRE(containsText(result.issues, "either a numeric reviewCount or a numeric ratingCount"));
    }

    SECTION("Reviewed item details are a warning") {
        json product = {
            {"@type", "Product"},
            {"name", "Coffee Maker"},
            {"review", {{"@type", "Review"},
                        {"reviewRating", {{"@type", "Rating"}, {"ratingValue", 5}}},
                        {"author", {{"@type", "Person"}, {"name", "Sam"}}},
                        {"itemReviewed", {{"name", "Coffee Maker"}}}}}
        };
        auto result = validator.validateSchema(product);
        REQUIRE(result.valid);
        REQUIRE(containsText(result.warnings, "'itemReviewed' property is present but invalid"));
    }
}

TEST_CASE("SchemaValidator address and geo", "[SchemaValidator]") {
    SchemaValidator validator;

    SECTION("Complete structures have no problems") {
        REQUIRE(validator.validateAddress(validAddress()).empty());
        REQUIRE(validator.validateGeo(validGeo()).empty());
    }

    SECTION("Missing address fields") {
        auto problems = validator.validateAddress(json{{"@type", "PostalAddress"}, {"streetAddress", "1 Main"}});
        REQUIRE(problems.size() == 3);
        REQUIRE(problems[0] == "Address is missing required field: addressLocality");
        REQUIRE(validator.validateAddress(json()) == std::vector<std::string>{"Address data is empty or missing."});
    }

    SECTION("Coordinates out of range") {
        auto problems = validator.validateGeo(json{{"@type", "GeoCoordinates"}, {"latitude", 95}, {"longitude", -74.006}});
        REQUIRE(problems == std::vector<std::string>{"Invalid latitude value: must be between -90 and 90."});
    }

    SECTION("Coordinates must be decimal numbers") {
        auto problems = validator.validateGeo(json{{"@type", "GeoCoordinates"}, {"latitude", "north"}, {"longitude", "1e2"}});
        REQUIRE(containsText(problems, "Latitude must be a numeric value."));
        REQUIRE(containsText(problems, "Longitude must be in decimal format"));
    }
}

TEST_CASE("SchemaValidator local business", "[SchemaValidator]") {
    SchemaValidator validator;
    json restaurant = {
        {"@type", json::array({"Restaurant", "Thing"})},
        {"name", "Bean There"},
        {"address", validAddress()},
        {"telephone", "+1-555-0100"},
        {"openingHours", "Mo-Fr 08:00-18:00"},
        {"geo", validGeo()},
        {"priceRange", "$$"}
    };

    SECTION("Detection across types") {
        auto found = validator.findLocalBusinessSchema({json{{"@type", "Article"}}, restaurant});
        REQUIRE(found.has_value());
        REQUIRE((*found)["@type"] == "Restaurant");

        auto organization = validator.findLocalBusinessSchema({json{{"@type", "Organization"}, {"address", "Main St"}}});
        REQUIRE(organization.has_value());
        REQUIRE_FALSE(validator.findLocalBusinessSchema({json{{"@type", "Organization"}}}).has_value());
    }

    SECTION("Completeness") {
        auto validation = validator.validateLocalBusiness(restaurant);
        REQUIRE(validation.valid);
        REQUIRE(validation.missingRequired.empty());
        REQUIRE(validation.missingRecommended.size() == 7);
        REQUIRE(validation.completeness == Catch::Approx(46.15));
    }

    SECTION("Missing everything clamps at zero") {
        auto validation = validator.validateLocalBusiness(json{{"@type", "LocalBusiness"}});
        REQUIRE_FALSE(validation.valid);
        REQUIRE(validation.completeness == 0.0);
        REQUIRE(validation.toJson()["schema_type"] == "LocalBusiness");
    }

    SECTION("Subtypes use the local business rule") {
        auto result = validator.validateSchema(restaurant);
        REQUIRE(result.valid);
        REQUIRE_FALSE(containsText(result.warnings, "not specifically validated"));
    }
}

TEST_CASE("SchemaValidator aggregate report", "[SchemaValidator]") {
    SchemaValidator validator;
    auto report = validator.validateSchemas({json{{"@type", "Person"}, {"name", "Sam"}}, json{{"name", "Untyped"}}});
    REQUIRE(report["total_schemas"] == 2);
    REQUIRE(report["valid_schemas"] == 1);
    REQUIRE(report["invalid_schemas"] == 1);
    REQUIRE(report["overall_score"] == 50.0);
    REQUIRE(report["issues"][0]["schema_index"] == 1);
    REQUIRE(report["issues"][0]["schema_type"] == "Unknown");

    auto empty = validator.validateSchemas({});
    REQUIRE(empty["overall_score"] == 0.0);
}

TEST_CASE("SchemaValidator value helpers", "[SchemaValidator]") {
    SECTION("Strict emptiness") {
        REQUIRE(SchemaValidator::isEmptyValue(json()));
        REQUIRE(SchemaValidator::isEmptyValue(json(false)));
        REQUIRE(SchemaValidator::isEmptyValue(json("  ")));
        REQUIRE(SchemaValidator::isEmptyValue(json::array()));
        REQUIRE(SchemaValidator::isEmptyValue(json{{"a", ""}}));
        REQUIRE_FALSE(SchemaValidator::isEmptyValue(json(0)));
        REQUIRE_FALSE(SchemaValidator::isEmptyValue(json("x")));
    }

    SECTION("Numeric values") {
        REQUIRE(SchemaValidator::isNumeric(json(7)));
        REQUIRE(SchemaValidator::isNumeric(json("12.5")));
        REQUIRE(SchemaValidator::isNumeric(json(" 3 ")));
        REQUIRE_FALSE(SchemaValidator::isNumeric(json("abc")));
        REQUIRE_FALSE(SchemaValidator::isNumeric(json("")));
        REQUIRE_FALSE(SchemaValidator::isNumeric(json(true)));
        REQUIRE(SchemaValidator::isNumeric(json("1e300")));
        REQUIRE_FALSE(SchemaValidator::isNumeric(json("1e400")));
        REQUIRE_FALSE(SchemaValidator::isNumeric(json("-1e400")));
    }

    SECTION("Type hierarchy") {
        SchemaValidator validator;
        REQUIRE(validator.belongsToSchemaType("BlogPosting", "CreativeWork"));
        REQUIRE(validator.belongsToSchemaType("Restaurant", "LocalBusiness"));
        REQUIRE_FALSE(validator.belongsToSchemaType("Dog", "Thing"));
        REQUIRE(SchemaValidator::primaryType(json{{"@type", json::array({"Store", "Thing"})}}) == "Store");
    }
}
