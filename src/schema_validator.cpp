#include "schema_validator.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

using json = nlohmann::json;

namespace {

const json& field(const json& object, const std::string& key) {
    static const json missing;
    if (!object.is_object()) {
        return missing;
    }
    auto it = object.find(key);
    return it == object.end() ? missing : *it;
}

// Present and not null
bool has(const json& object, const std::string& key) {
    return !field(object, key).is_null();
}

// A collection property given either as a list or as one typed object
std::vector<json> itemList(const json& value) {
    std::vector<json> items;
    if (value.is_array()) {
        items.assign(value.begin(), value.end());
    } else if (value.is_object() && value.contains("@type")) {
        items.push_back(value);
    }
    return items;
}

std::string display(const json& value) {
    if (value.is_null()) {
        return "N/A";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

// Values that do not fit a finite double come back as NaN
double toNumber(const json& value) {
    if (value.is_number()) {
        double number = value.get<double>();
        return std::isfinite(number) ? number : std::nan("");
    }
    if (!value.is_string()) {
        return std::nan("");
    }
    std::string text = TextUtils::trim(value.get<std::string>());
    // Overflow yields HUGE_VAL instead of throwing
    double number = std::strtod(text.c_str(), nullptr);
    if (!std::isfinite(number)) {
        return std::nan("");
    }
    return number;
}

bool isDecimalFormat(const json& value) {
    static const std::regex decimal(R"(^-?\d+(\.\d+)?$)");
    return std::regex_match(display(value), decimal);
}

}

json ValidationResult::toJson() const {
    return json{{"valid", valid}, {"issues", issues}, {"warnings", warnings}};
}

json LocalBusinessValidation::toJson() const {
    return json{
        {"valid", valid},
        {"completeness", completeness},
        {"missing_required", missingRequired},
        {"missing_recommended", missingRecommended},
        {"incomplete_properties", incompleteProperties},
        {"schema_type", schemaType}
    };
}

SchemaValidator::SchemaValidator(const SchemaRules& rules)
    : rules_(rules) {
}

bool SchemaValidator::isEmptyValue(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return true;
        case json::value_t::boolean:
            return !value.get<bool>();
        case json::value_t::string:
            return TextUtils::trim(value.get<std::string>()).empty();
        case json::value_t::array:
            return std::all_of(value.begin(), value.end(), [](const json& item) { return isEmptyValue(item); });
        case json::value_t::object:
            for (const auto& item : value.items()) {
                if (!isEmptyValue(item.value())) {
                    return false;
                }
            }
            return true;
        default:
            return false;
    }
}

bool SchemaValidator::isNumeric(const json& value) {
    if (value.is_number()) {
        return !std::isnan(toNumber(value));
    }
    if (!value.is_string()) {
        return false;
    }
    static const std::regex numeric(R"(^\s*[+-]?(\d+(\.\d*)?|\.\d+)([eE][+-]?\d+)?\s*$)");
    // Out of range values such as "1e400" are not usable numbers
    return std::regex_match(value.get<std::string>(), numeric) && !std::isnan(toNumber(value));
}

std::string SchemaValidator::primaryType(const json& schema) {
    const json& type = field(schema, "@type");
    if (type.is_string()) {
        return type.get<std::string>();
    }
    if (type.is_array() && !type.empty() && type.front().is_string()) {
        return type.front().get<std::string>();
    }
    return "";
}

std::vector<std::string> SchemaValidator::findMissingProperties(const json& schema,
                                                                const std::vector<std::string>& properties) const {
    std::vector<std::string> missing;
    for (const auto& property : properties) {
        if (isEmptyValue(field(schema, property))) {
            missing.push_back(property);
        }
    }
    return missing;
}

bool SchemaValidator::isLocalBusinessType(const std::string& type) const {
    return type == "LocalBusiness" ||
           std::find(rules_.localBusinessSubtypes.begin(), rules_.localBusinessSubtypes.end(), type) !=
               rules_.localBusinessSubtypes.end();
}

bool SchemaValidator::belongsToSchemaType(const std::string& type, const std::string& parentType) const {
    if (parentType == "LocalBusiness") {
        return std::find(rules_.localBusinessSubtypes.begin(), rules_.localBusinessSubtypes.end(), type) !=
               rules_.localBusinessSubtypes.end();
    }
    auto it = rules_.typeHierarchy.find(parentType);
    if (it == rules_.typeHierarchy.end()) {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), type) != it->second.end();
}

const SchemaRules::PropertyRule& SchemaValidator::ruleFor(const std::string& type, bool& generic) const {
    generic = false;
    auto it = rules_.typeRules.find(type);
    if (it != rules_.typeRules.end()) {
        return it->second;
    }
    if (isLocalBusinessType(type)) {
        auto local = rules_.typeRules.find("LocalBusiness");
        if (local != rules_.typeRules.end()) {
            return local->second;
        }
    }
    generic = true;
    return rules_.defaultRule;
}

ValidationResult SchemaValidator::validateSchema(const json& schema) const {
    ValidationResult result;

    if (!has(schema, "@type")) {
        result.valid = false;
        result.issues.push_back("Missing @type property");
        return result;
    }

    std::string type = primaryType(schema);
    bool generic = false;
    const SchemaRules::PropertyRule& rule = ruleFor(type, generic);
    if (generic && std::find(rules_.genericTypes.begin(), rules_.genericTypes.end(), type) == rules_.genericTypes.end()) {
        result.warnings.push_back("Schema type '" + type + "' is not specifically validated. Using generic validation rules.");
    }

    auto missingRequired = findMissingProperties(schema, rule.required);
    if (!missingRequired.empty()) {
        result.issues.push_back("Missing required properties: " + TextUtils::join(missingRequired, ", "));
    }
    auto missingRecommended = findMissingProperties(schema, rule.recommended);
    if (!missingRecommended.empty()) {
        result.warnings.push_back("Missing recommended properties: " + TextUtils::join(missingRecommended, ", "));
    }

    // Nested structures
    if (type == "FAQPage" && has(schema, "mainEntity")) {
        validateFaqPage(schema, result.issues, result.warnings);
    } else if (type == "HowTo" && has(schema, "step")) {
        validateHowTo(schema, result.issues, result.warnings);
    } else if (type == "BreadcrumbList" && has(schema, "itemListElement")) {
        validateBreadcrumbList(schema, result.issues, result.warnings);
    } else if (type == "Product" && (has(schema, "offers") || has(schema, "review") || has(schema, "aggregateRating"))) {
        validateProduct(schema, result.issues, result.warnings);
    } else if (isLocalBusinessType(type)) {
        if (has(schema, "address")) {
            auto problems = validateAddress(schema["address"]);
            result.issues.insert(result.issues.end(), problems.begin(), problems.end());
        }
        if (has(schema, "geo")) {
            auto problems = validateGeo(schema["geo"]);
            result.issues.insert(result.issues.end(), problems.begin(), problems.end());
        }
    }

    result.valid = result.issues.empty();
    return result;
}

json SchemaValidator::validateSchemas(const std::vector<json>& schemas) const {
    size_t validCount = 0;
    size_t invalidCount = 0;
    json issues = json::array();
    json warnings = json::array();

    for (size_t index = 0; index < schemas.size(); ++index) {
        const json& schema = schemas[index];
        ValidationResult validation = validateSchema(schema);
        json type = has(schema, "@type") ? schema["@type"] : json("Unknown");

        if (validation.valid) {
            validCount++;
        } else {
            invalidCount++;
            for (const auto& issue : validation.issues) {
                issues.push_back({{"schema_index", index}, {"schema_type", type}, {"issue", issue}});
            }
        }
        for (const auto& warning : validation.warnings) {
            warnings.push_back({{"schema_index", index}, {"schema_type", type}, {"warning", warning}});
        }
    }

    double score = schemas.empty() ? 0.0
        : TextUtils::roundTo(static_cast<double>(validCount) / schemas.size() * 100.0, 2);

    return json{
        {"total_schemas", schemas.size()},
        {"valid_schemas", validCount},
        {"invalid_schemas", invalidCount},
        {"issues", issues},
        {"warnings", warnings},
        {"overall_score", score}
    };
}

void SchemaValidator::validateFaqPage(const json& schema, std::vector<std::string>& issues,
                                      std::vector<std::string>& /*warnings*/) const {
    std::vector<json> questions = itemList(schema["mainEntity"]);
    if (questions.empty()) {
        issues.push_back("mainEntity must be an array of Question items or a single Question object.");
        return;
    }

    for (size_t index = 0; index < questions.size(); ++index) {
        const json& question = questions[index];
        std::string i = std::to_string(index);
        if (!question.is_object() || question.empty()) {
            issues.push_back("Item " + i + " in mainEntity is not a valid object structure.");
            continue;
        }
        if (primaryType(question) != "Question") {
            issues.push_back("Item " + i + " in mainEntity should have @type: Question (found '" +
                             display(field(question, "@type")) + "').");
            continue;
        }
        for (const auto& property : findMissingProperties(question, {"name"})) {
            issues.push_back("Question " + i + " is missing the required '" + property + "' property.");
        }

        const json& answer = field(question, "acceptedAnswer");
        if (isEmptyValue(answer)) {
            issues.push_back("Question " + i + " is missing the 'acceptedAnswer' property or it is empty.");
            continue;
        }
        if (!answer.is_object()) {
            issues.push_back("AcceptedAnswer for question " + i + " is not a valid object structure.");
            continue;
        }
        if (primaryType(answer) != "Answer") {
            issues.push_back("AcceptedAnswer for question " + i + " should have @type: Answer (found '" +
                             display(field(answer, "@type")) + "').");
        }
        for (const auto& property : findMissingProperties(answer, {"text"})) {
            issues.push_back("Answer for question " + i + " is missing the required '" + property + "' property.");
        }
    }
}

void SchemaValidator::validateHowTo(const json& schema, std::vector<std::string>& issues,
                                    std::vector<std::string>& warnings) const {
    std::vector<json> steps = itemList(schema["step"]);
    if (steps.empty()) {
        issues.push_back("step must be an array of HowToStep items or a single HowToStep object.");
        return;
    }

    for (size_t index = 0; index < steps.size(); ++index) {
        const json& step = steps[index];
        std::string i = std::to_string(index);
        if (!step.is_object() || step.empty()) {
            issues.push_back("Item " + i + " in step list is not a valid object structure.");
            continue;
        }
        if (primaryType(step) != "HowToStep") {
            issues.push_back("Item " + i + " in step list should have @type: HowToStep (found '" +
                             display(field(step, "@type")) + "').");
            continue;
        }
        for (const auto& property : findMissingProperties(step, {"text"})) {
            issues.push_back("HowToStep " + i + " is missing the required '" + property + "' property.");
        }
        for (const auto& property : findMissingProperties(step, {"name"})) {
            warnings.push_back("HowToStep " + i + " is missing the recommended '" + property + "' property.");
        }
    }
}

void SchemaValidator::validateBreadcrumbList(const json& schema, std::vector<std::string>& issues,
                                             std::vector<std::string>& warnings) const {
    std::vector<json> items = itemList(schema["itemListElement"]);
    if (items.empty()) {
        issues.push_back("itemListElement must be an array of ListItem objects or a single ListItem object.");
        return;
    }

    // Advances on every item, valid or not
    long long expectedPosition = 1;
    for (size_t index = 0; index < items.size(); ++index, ++expectedPosition) {
        const json& item = items[index];
        std::string i = std::to_string(index);
        if (!item.is_object() || item.empty()) {
            issues.push_back("Item " + i + " in itemListElement list is not a valid object structure.");
            continue;
        }
        if (primaryType(item) != "ListItem") {
            issues.push_back("Item " + i + " in itemListElement list should have @type: ListItem (found '" +
                             display(field(item, "@type")) + "').");
            continue;
        }
        for (const auto& property : findMissingProperties(item, {"position", "item"})) {
            issues.push_back("ListItem " + i + " is missing the required '" + property + "' property.");
        }

        const json& position = field(item, "position");
        if (!position.is_null()) {
            if (!isNumeric(position) || std::trunc(toNumber(position)) != static_cast<double>(expectedPosition)) {
                warnings.push_back("ListItem " + i + " has incorrect position. Expected position " +
                                   std::to_string(expectedPosition) + " but found " + display(position) +
                                   ". Positions should be sequential starting from 1.");
            }
        }
    }
}

void SchemaValidator::validateProduct(const json& schema, std::vector<std::string>& issues,
                                      std::vector<std::string>& warnings) const {
    if (has(schema, "offers")) {
        const json& offers = schema["offers"];
        if (isEmptyValue(offers)) {
            warnings.push_back("Product schema has an empty \"offers\" property.");
        } else if (offers.is_array()) {
            for (size_t index = 0; index < offers.size(); ++index) {
                const json& offer = offers[index];
                std::string i = std::to_string(index);
                if (!offer.is_object() || offer.empty() || !has(offer, "@type")) {
                    issues.push_back("Product schema \"offers\" list item " + i +
                                     " is invalid (not array, empty, or missing @type).");
                    continue;
                }
                std::string type = primaryType(offer);
                if (type == "Offer") {
                    validateOffer(offer, index, issues, warnings);
                } else {
                    issues.push_back("Product schema \"offers\" list item " + i + " has an unexpected @type: " +
                                     type + ". Expected Offer.");
                }
            }
        } else if (offers.is_object() && has(offers, "@type")) {
            std::string type = primaryType(offers);
            if (type == "AggregateOffer") {
                validateAggregateOffer(offers, issues, warnings);
            } else if (type == "Offer") {
                validateOffer(offers, 0, issues, warnings);
            } else {
                issues.push_back("Product schema \"offers\" single object has an unexpected @type: " + type +
                                 ". Expected Offer or AggregateOffer.");
            }
        } else {
            issues.push_back("Product schema \"offers\" property has an invalid structure. "
                             "Expected Offer, AggregateOffer, or array of Offers.");
        }
    }

    if (!isEmptyValue(field(schema, "review"))) {
        validateReview(schema["review"], issues, warnings);
    }

    const json& aggregateRating = field(schema, "aggregateRating");
    if (!isEmptyValue(aggregateRating)) {
        if (!aggregateRating.is_object()) {
            issues.push_back("Product schema \"aggregateRating\" property is present but not a valid object structure.");
        } else {
            validateAggregateRating(aggregateRating, issues, warnings);
        }
    }
}

bool SchemaValidator::isAllowedAvailability(const std::string& value) const {
    for (const auto& allowed : rules_.availabilityValues) {
        if (value == allowed || value == "http://schema.org/" + allowed || value == "https://schema.org/" + allowed) {
            return true;
        }
    }
    return false;
}

void SchemaValidator::validateOffer(const json& offer, size_t index, std::vector<std::string>& issues,
                                    std::vector<std::string>& warnings) const {
    std::string i = std::to_string(index);
    if (primaryType(offer) != "Offer") {
        issues.push_back("Offer " + i + " should have @type: Offer (found '" + display(field(offer, "@type")) + "').");
    }
    for (const auto& property : findMissingProperties(offer, {"price", "priceCurrency"})) {
        issues.push_back("Offer " + i + " is missing the required '" + property + "' property.");
    }
    for (const auto& property : findMissingProperties(offer, {"availability"})) {
        warnings.push_back("Offer " + i + " is missing the recommended '" + property + "' property.");
    }

    const json& price = field(offer, "price");
    if (!isEmptyValue(price) && !isNumeric(price)) {
        issues.push_back("Offer " + i + " price ('" + display(price) + "') must be a numeric value.");
    }

    const json& availability = field(offer, "availability");
    if (!isEmptyValue(availability)) {
        if (availability.is_string()) {
            if (!isAllowedAvailability(availability.get<std::string>())) {
                warnings.push_back("Offer " + i + " has an invalid availability value: '" + display(availability) +
                                   "'. Recommended to use standard schema.org values.");
            }
        } else {
            warnings.push_back("Offer " + i + " 'availability' property has an unexpected format (expected string).");
        }
    }
}

void SchemaValidator::validateAggregateOffer(const json& offer, std::vector<std::string>& issues,
                                             std::vector<std::string>& warnings) const {
    if (primaryType(offer) != "AggregateOffer") {
        issues.push_back("AggregateOffer should have @type: AggregateOffer (found \"" +
                         display(field(offer, "@type")) + "\").");
    }
    for (const auto& property : findMissingProperties(offer, {"lowPrice", "priceCurrency"})) {
        issues.push_back("AggregateOffer is missing the required '" + property + "' property.");
    }
    for (const auto& property : findMissingProperties(offer, {"highPrice", "offerCount"})) {
        warnings.push_back("AggregateOffer is missing the recommended '" + property + "' property.");
    }

    const json& lowPrice = field(offer, "lowPrice");
    if (!isEmptyValue(lowPrice) && !isNumeric(lowPrice)) {
        issues.push_back("AggregateOffer lowPrice ('" + display(lowPrice) + "') must be a numeric value.");
    }

    const json& highPrice = field(offer, "highPrice");
    if (!isEmptyValue(highPrice)) {
        if (!isNumeric(highPrice)) {
            issues.push_back("AggregateOffer highPrice ('" + display(highPrice) + "') must be a numeric value.");
        } else if (isNumeric(lowPrice) && toNumber(highPrice) < toNumber(lowPrice)) {
            warnings.push_back("AggregateOffer highPrice (" + display(highPrice) + ") is less than lowPrice (" +
                               display(lowPrice) + ").");
        }
    }

    const json& offerCount = field(offer, "offerCount");
    if (!isEmptyValue(offerCount)) {
        if (!isNumeric(offerCount) || std::trunc(toNumber(offerCount)) <= 0.0) {
            warnings.push_back("AggregateOffer offerCount ('" + display(offerCount) + "') must be a positive integer.");
        }
    }
}

void SchemaValidator::validateReview(const json& review, std::vector<std::string>& issues,
                                     std::vector<std::string>& warnings) const {
    std::vector<json> reviews = itemList(review);
    if (reviews.empty()) {
        warnings.push_back("The \"review\" property is present but empty or has an invalid structure. "
                           "Expected Review object(s).");
        return;
    }

    for (size_t index = 0; index < reviews.size(); ++index) {
        const json& item = reviews[index];
        std::string i = std::to_string(index);
        if (!item.is_object() || item.empty()) {
            issues.push_back("Review item " + i + " is not a valid object structure.");
            continue;
        }
        if (primaryType(item) != "Review") {
            issues.push_back("Review item " + i + " should have @type: Review (found '" +
                             display(field(item, "@type")) + "').");
        }
        for (const auto& property : findMissingProperties(item, {"reviewRating", "author"})) {
            issues.push_back("Review item " + i + " is missing the required '" + property + "' property.");
        }

        const json& rating = field(item, "reviewRating");
        if (!isEmptyValue(rating)) {
            if (!rating.is_object()) {
                issues.push_back("Review item " + i + " 'reviewRating' property is present but not a valid object structure.");
            } else {
                if (primaryType(rating) != "Rating") {
                    issues.push_back("Review item " + i + " 'reviewRating' should have @type: Rating (found '" +
                                     display(field(rating, "@type")) + "').");
                }
                for (const auto& property : findMissingProperties(rating, {"ratingValue"})) {
                    issues.push_back("Review item " + i + " 'reviewRating' is missing the required '" + property +
                                     "' property or it is empty/non-numeric.");
                }
                const json& value = field(rating, "ratingValue");
                if (!isEmptyValue(value) && !isNumeric(value)) {
                    issues.push_back("Review item " + i + " 'reviewRating' 'ratingValue' property ('" + display(value) +
                                     "') must be a numeric value.");
                }
            }
        }

        const json& author = field(item, "author");
        if (!isEmptyValue(author)) {
            if (!author.is_object()) {
                issues.push_back("Review item " + i + " 'author' property is present but not a valid object structure.");
            } else {
                std::string authorType = primaryType(author);
                if (authorType != "Person" && authorType != "Organization") {
                    issues.push_back("Review item " + i + " 'author' should have @type: Person or Organization (found '" +
                                     display(field(author, "@type")) + "').");
                }
                for (const auto& property : findMissingProperties(author, {"name"})) {
                    issues.push_back("Review item " + i + " 'author' is missing the required '" + property + "' property.");
                }
            }
        }

        const json& reviewed = field(item, "itemReviewed");
        if (!isEmptyValue(reviewed)) {
            bool incomplete = !reviewed.is_object() || isEmptyValue(field(reviewed, "name")) ||
                              (isEmptyValue(field(reviewed, "id")) && isEmptyValue(field(reviewed, "@id")));
            if (incomplete) {
                warnings.push_back("Review item " + i + " 'itemReviewed' property is present but invalid or "
                                   "missing recommended details (name, id/@id).");
            }
        }
    }
}

void SchemaValidator::validateAggregateRating(const json& rating, std::vector<std::string>& issues,
                                              std::vector<std::string>& warnings) const {
    if (primaryType(rating) != "AggregateRating") {
        issues.push_back("AggregateRating should have @type: AggregateRating (found \"" +
                         display(field(rating, "@type")) + "\").");
    }
    for (const auto& property : findMissingProperties(rating, {"ratingValue"})) {
        issues.push_back("AggregateRating is missing the required '" + property + "' property or it is empty/non-numeric.");
    }
    const json& value = field(rating, "ratingValue");
    if (!isEmptyValue(value) && !isNumeric(value)) {
        issues.push_back("AggregateRating 'ratingValue' ('" + display(value) + "') must be a numeric value.");
    }

    const json& reviewCount = field(rating, "reviewCount");
    const json& ratingCount = field(rating, "ratingCount");
    bool hasReviewCount = isNumeric(reviewCount);
    bool hasRatingCount = isNumeric(ratingCount);

    if (!hasReviewCount && !hasRatingCount) {
        issues.push_back("AggregateRating must include either a numeric reviewCount or a numeric ratingCount property.");
        return;
    }
    if (!reviewCount.is_null() && !hasReviewCount) {
        issues.push_back("AggregateRating 'reviewCount' ('" + display(reviewCount) + "') must be a numeric value.");
    }
    if (!ratingCount.is_null() && !hasRatingCount) {
        issues.push_back("AggregateRating 'ratingCount' ('" + display(ratingCount) + "') must be a numeric value.");
    }
    if (hasReviewCount && hasRatingCount) {
        warnings.push_back("AggregateRating includes both reviewCount and ratingCount. "
                           "Google typically prefers reviewCount if both are present.");
    }
}

std::vector<std::string> SchemaValidator::validateAddress(const json& address) const {
    std::vector<std::string> problems;
    if (isEmptyValue(address)) {
        problems.push_back("Address data is empty or missing.");
        return problems;
    }
    if (primaryType(address) != "PostalAddress") {
        problems.push_back("Address is missing @type: PostalAddress or type is incorrect.");
    }
    for (const auto& name : rules_.addressFields) {
        if (isEmptyValue(field(address, name))) {
            problems.push_back("Address is missing required field: " + name);
        }
    }
    return problems;
}

std::vector<std::string> SchemaValidator::validateGeo(const json& geo) const {
    std::vector<std::string> problems;
    if (isEmptyValue(geo)) {
        problems.push_back("Geo data is empty or missing.");
        return problems;
    }
    if (primaryType(geo) != "GeoCoordinates") {
        problems.push_back("Geo is missing @type: GeoCoordinates or type is incorrect.");
    }
    for (const char* name : {"latitude", "longitude"}) {
        const json& value = field(geo, name);
        if (isEmptyValue(value) && !isNumeric(value)) {
            problems.push_back(std::string("Geo is missing required field or value is not numeric: ") + name);
        }
    }

    struct Axis {
        const char* key;
        const char* label;
        double limit;
        const char* example;
    };
    for (const Axis& axis : {Axis{"latitude", "Latitude", 90.0, "40.7128"},
                             Axis{"longitude", "Longitude", 180.0, "-74.0060"}}) {
        const json& value = field(geo, axis.key);
        if (isEmptyValue(value)) {
            continue;
        }
        if (!isNumeric(value)) {
            problems.push_back(std::string(axis.label) + " must be a numeric value.");
            continue;
        }
        double number = toNumber(value);
        if (number < -axis.limit || number > axis.limit) {
            problems.push_back(std::string("Invalid ") + axis.key + " value: must be between -" +
                               std::to_string(static_cast<int>(axis.limit)) + " and " +
                               std::to_string(static_cast<int>(axis.limit)) + ".");
        }
        if (!isDecimalFormat(value)) {
            problems.push_back(std::string(axis.label) + " must be in decimal format (e.g., " + axis.example + ").");
        }
    }
    return problems;
}

std::optional<json> SchemaValidator::findLocalBusinessSchema(const std::vector<json>& schemas) const {
    for (const auto& schema : schemas) {
        std::string type = primaryType(schema);
        if (type.empty()) {
            continue;
        }
        bool localBusiness = isLocalBusinessType(type) ||
                             (type == "Organization" && (has(schema, "location") || has(schema, "address"))) ||
                             (type == "Place" && has(schema, "address"));
        if (localBusiness) {
            json found = schema;
            found["@type"] = type;
            return found;
        }
    }
    return std::nullopt;
}

LocalBusinessValidation SchemaValidator::validateLocalBusiness(const json& schema) const {
    LocalBusinessValidation result;

    SchemaRules::PropertyRule rule;
    auto it = rules_.typeRules.find("LocalBusiness");
    if (it != rules_.typeRules.end()) {
        rule = it->second;
    }

    result.missingRequired = findMissingProperties(schema, rule.required);
    result.missingRecommended = findMissingProperties(schema, rule.recommended);

    auto addressProblems = validateAddress(field(schema, "address"));
    auto geoProblems = validateGeo(field(schema, "geo"));
    result.incompleteProperties = addressProblems;
    result.incompleteProperties.insert(result.incompleteProperties.end(), geoProblems.begin(), geoProblems.end());

    size_t total = rule.required.size() + rule.recommended.size();
    size_t missing = result.missingRequired.size() + result.missingRecommended.size() +
                     result.incompleteProperties.size();
    if (total > 0) {
        double completeness = (static_cast<double>(total) - static_cast<double>(missing)) / total * 100.0;
        result.completeness = std::max(0.0, TextUtils::roundTo(completeness, 2));
    }

    result.valid = result.missingRequired.empty() && result.incompleteProperties.empty();
    if (has(schema, "@type")) {
        result.schemaType = schema["@type"];
    }
    return result;
}
