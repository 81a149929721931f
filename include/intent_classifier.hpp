#pragma once

#include <string>
#include <vector>
#include <map>
#include <regex>
#include <utility>
#include <nlohmann/json.hpp>
#include "analysis_result.hpp"
#include "html_document.hpp"

// Pattern tables, priors and marker rules for searcher-intent classification
struct IntentConfig {
    struct WeightedPattern {
        std::string pattern;     // case-insensitive regex searched in the keyword
        double weight;
    };

    struct PostTypePrior {
        std::string postType;
        std::string intent;
        double boost;
    };

    // A marker is set when any of its rules matches. A rule matches when its text pattern
    // is found in the clean text, or when one of its elements inside the content region
    // carries an attribute fragment / text fragment (or simply exists when neither is given).
    struct MarkerRule {
        std::string name;
        std::string textPattern;
        std::vector<std::string> elements;
        std::vector<std::string> attributeFragments;
        std::vector<std::string> elementTextFragments;
    };

    // Resolution order for equal scores
    std::vector<std::string> intents = {"informational", "transactional", "navigational", "commercial"};

    std::map<std::string, std::vector<WeightedPattern>> patterns = {
        {"informational", {
            {"^(?:what|who|when|where|why|how|which|is|are|can|does|do|did|was|were|will|should|could|would|may|might)", 3.0},
            {"(?:how to|what is|why do|how do|why is|what are|who is|where is|when is)", 2.5},
            {"(?:guide|tutorial|learn|explanation|examples?|tips|advice|ideas|ways to|steps|strategy|benefits of)", 2.0},
            {"(?:meaning|definition|concept|difference between|vs|versus|compare|comparison|review|history of)", 2.0},
            {"(?:list of|top|best|facts about|overview|complete|ultimate|beginners?|introduction)", 1.5},
            {"(?:research|study|analysis|statistics|data|report|survey|results|findings|theory|methodology)", 2.0}
        }},
        {"transactional", {
            {"(?:buy|purchase|order|shop|get|subscribe|book|reserve|apply for|hire|rent|lease)", 3.0},
            {"(?:price|cost|pricing|cheap|affordable|discount|deal|coupon|sale|free shipping|budget)", 2.5},
            {"(?:download|free download|get free|sign up|register|join|activate|install)", 2.0},
            {"(?:service|provider|supplier|agency|company for|professional|near me|online)", 1.5}
        }},
        {"commercial", {
            {"(?:best|top|vs|versus|compared to|cheapest|review|rating|worth it|recommended)", 3.0},
            {"(?:features|specs|specifications|comparison|alternatives|options|models|brands)", 2.5},
            {"(?:pros and cons|advantages|disadvantages|benefits|drawbacks|problems with)", 2.0},
            {"(?:before buying|should i buy|should i get|is it worth|which to choose|choose|select)", 2.5}
        }},
        {"navigational", {
            {"(?:login|sign in|account|dashboard|website|official site|homepage)", 3.0},
            {"(?:directions to|location of|address|map|store locator|near me|hours)", 2.5},
            {"(?:contact|support|help center|customer service|download page|careers)", 2.0}
        }}
    };

    std::vector<PostTypePrior> postTypePriors = {
        {"product", "transactional", 2.0},
        {"product", "commercial", 1.0},
        {"page", "navigational", 1.0},
        {"post", "informational", 1.0},
        {"location", "navigational", 2.0},
        {"store", "navigational", 2.0},
        {"review", "commercial", 2.0}
    };

    std::string brandPattern = "(?:facebook|twitter|instagram|linkedin|youtube|amazon|google|reddit)";
    double brandBoost = 2.0;

    std::vector<std::string> productTerms = {
        "iphone", "samsung", "tv", "laptop", "camera", "shoes", "dress", "furniture",
        "car", "bike", "smartphone", "monitor", "headphones", "watch", "tablet"
    };
    double productCommercialBoost = 1.0;
    double productTransactionalBoost = 0.5;

    // Keyword substring that turns a commercial win into a transactional one
    std::string purchaseTerm = "buy";

    // Universal content-quality markers
    size_t minParagraphLength = 40;           // Characters
    std::vector<std::string> sectionFragments = {"section", "container", "wrapper", "block"};
    std::vector<std::string> multimediaTags = {"video", "iframe", "audio", "canvas", "svg", "object", "embed"};
    std::vector<std::string> semanticTags = {
        "article", "section", "nav", "aside", "header", "footer", "main", "figure", "figcaption", "time", "mark"
    };

    std::map<std::string, double> universalMarkerWeights = {
        {"has_structured_content", 1.5},
        {"has_multimedia", 1.2},
        {"has_semantic_markup", 1.0}
    };

    std::map<std::string, std::map<std::string, double>> markerWeights = {
        {"informational", {
            {"has_definition", 2.5}, {"has_examples", 2.0}, {"has_step_by_step", 1.8}, {"has_faq", 1.5},
            {"has_data_tables", 1.3}, {"has_statistics", 1.5}, {"has_explanations", 2.0},
            {"has_comparisons", 1.5}, {"has_diagrams", 1.3}
        }},
        {"transactional", {
            {"has_pricing", 2.5}, {"has_call_to_action", 3.0}, {"has_product_details", 2.0},
            {"has_purchase_options", 1.8}, {"has_trust_signals", 1.5}, {"has_urgency", 1.2},
            {"has_shopping_cart", 1.5}
        }},
        {"navigational", {
            {"has_direct_links", 3.0}, {"has_contact_info", 2.0}, {"has_location_details", 2.0},
            {"has_navigation_menu", 1.8}, {"has_search_functionality", 1.5}, {"has_hours_info", 1.5}
        }},
        {"commercial", {
            {"has_comparison", 2.5}, {"has_reviews", 2.5}, {"has_pros_cons", 2.0}, {"has_recommendations", 2.0},
            {"has_decision_aids", 1.8}, {"has_expert_opinions", 1.5}, {"has_value_assessment", 1.5}
        }}
    };

    std::map<std::string, std::vector<MarkerRule>> markerRules = {
        {"informational", {
            {"has_definition", "is a|refers to|defined as|means|describes|represents|constitutes|signifies|denotes|stands for|indicates", {}, {}, {}},
            {"has_examples", "example|for instance|such as|e\\.g\\.|to illustrate|case in point|specifically|in particular|notably|for example|like", {}, {}, {}},
            {"has_step_by_step", "", {"ol"}, {}, {}},
            {"has_step_by_step", "step \\d|first|second|third|fourth|fifth|next|finally|lastly|initially|begin by|start with|follow with", {}, {}, {}},
            {"has_faq", "faq|frequently asked questions|common questions|questions and answers", {}, {}, {}},
            {"has_faq", "", {"div", "section"}, {"faq", "accordion"}, {}},
            {"has_data_tables", "", {"table"}, {}, {}},
            {"has_statistics", "\\d+%|\\d+\\s*percent|statistics|data shows|research indicates|according to|study found|survey|poll results", {}, {}, {}},
            {"has_explanations", "because|therefore|thus|hence|as a result|consequently|due to|since|explains why|reason for|cause of", {}, {}, {}},
            {"has_comparisons", "compared to|in contrast|on the other hand|whereas|while|unlike|similarly|likewise|however|although|despite", {}, {}, {}},
            {"has_diagrams", "", {"img"}, {"diagram", "chart", "graph", "infographic"}, {}}
        }},
        {"transactional", {
            {"has_pricing", "\\$\\d+|\\d+\\s*(?:dollars|usd|eur|gbp)|(?:price|cost|pricing|fee|charge|payment|subscription|plan)(?:\\s+(?:is|of|at))?\\s+\\$?\\d+", {}, {}, {}},
            {"has_call_to_action", "", {"button"}, {}, {}},
            {"has_call_to_action", "", {"a"}, {"btn", "button", "cta"}, {}},
            {"has_call_to_action", "", {"a"}, {}, {"buy", "shop", "order", "get", "purchase", "add to cart", "checkout",
                                                  "subscribe", "sign up", "register", "join now", "start", "try",
                                                  "download", "book", "reserve"}},
            {"has_product_details", "specifications|features|details|dimensions|weight|size|measurements|materials?|ingredients|components|technical specs", {}, {}, {}},
            {"has_purchase_options", "options|variations|models|packages|bundles|plans|tiers|editions|versions|colors|sizes|styles|configurations", {}, {}, {}},
            {"has_trust_signals", "guarantee|warranty|secure checkout|money back|return policy|free returns|satisfaction|trusted|certified|official|authorized", {}, {}, {}},
            {"has_urgency", "limited time|offer ends|sale ends|expires|only \\d+ left|while supplies last|act now|don't miss|hurry|today only", {}, {}, {}},
            {"has_shopping_cart", "", {"form", "div", "button", "a"}, {"cart", "checkout", "basket"}, {}}
        }},
        {"navigational", {
            {"has_direct_links", "", {"a"}, {}, {"official", "website", "login", "sign in", "portal", "dashboard",
                                                "account", "homepage", "main page"}},
            {"has_contact_info", "contact|email|phone|call us|reach us|get in touch|support team|help desk|customer service", {}, {}, {}},
            {"has_contact_info", "\\b[a-z0-9._%+-]+@[a-z0-9.-]+\\.[a-z]{2,}\\b", {}, {}, {}},
            {"has_contact_info", "\\b(?:\\+\\d{1,3}[-\\s]?)?\\(?\\d{3}\\)?[-\\s]?\\d{3}[-\\s]?\\d{4}\\b", {}, {}, {}},
            {"has_location_details", "address|location|map|directions|where to find|how to get to|visit us|our office|headquarters|branch|store location", {}, {}, {}},
            {"has_location_details", "", {"iframe"}, {"maps.google", "google.com/maps", "maps.apple", "openstreetmap"}, {}},
            {"has_navigation_menu", "", {"nav", "ul", "ol", "div"}, {"menu", "navigation", "navbar", "nav-bar"}, {}},
            {"has_search_functionality", "", {"form", "input", "div"}, {"search", "find"}, {}},
            {"has_hours_info", "hours|open from|available from|schedule|availability|opening times|business hours|working hours", {}, {}, {}}
        }},
        {"commercial", {
            {"has_comparison", "compare|vs\\.|versus|alternative|differences?|similarities|better than|worse than|compared to|in contrast to", {}, {}, {}},
            {"has_reviews", "review|rating|stars?\\b|score|feedback|testimonials?|opinions?|experiences?|what others say|customer reviews", {}, {}, {}},
            {"has_reviews", "", {"div", "span"}, {"rating", "stars", "reviews"}, {}},
            {"has_pros_cons", "pros?\\b|cons?\\b|advantages?|disadvantages?|benefits?|drawbacks?|strengths?|weaknesses?|positives?|negatives?|good points|bad points", {}, {}, {}},
            {"has_recommendations", "recommend|best|top|suggested|ideal for|perfect for|suited for|designed for|made for|great for|excellent for|suitable for", {}, {}, {}},
            {"has_decision_aids", "buying guide|comparison chart|decision matrix|feature comparison|side by side|head to head|face off|showdown", {}, {}, {}},
            {"has_expert_opinions", "expert|specialist|professional opinion|according to|authority|industry leader|thought leader", {}, {}, {}},
            {"has_value_assessment", "value for money|worth the price|investment|cost-effective|budget-friendly|premium|luxury|affordable|expensive|overpriced|underpriced", {}, {}, {}}
        }}
    };
};

// Ordered marker name -> satisfied
using IntentMarkers = std::vector<std::pair<std::string, bool>>;

struct IntentClassification {
    std::string intent = "informational";
    std::map<std::string, double> scores;
};

struct IntentProfile {
    std::string detectedIntent = "informational";
    std::map<std::string, double> scores;
    IntentMarkers markers;
    double satisfactionScore = 0.0;      // 0-1

    nlohmann::json toJson() const;
};

class IntentClassifier {
public:
    // Throws std::invalid_argument when a configured pattern is not a valid regex
    explicit IntentClassifier(const IntentConfig& config = IntentConfig());

    // Score a keyword against every intent and resolve the winner
    IntentClassification classify(const std::string& keyword, const std::string& postType) const;

    // Universal markers plus the markers of one intent. A null document checks the clean text only.
    IntentMarkers detectMarkers(const HtmlDocument* document, const DomNode& region,
                                const std::string& cleanText, const std::string& intent) const;

    double satisfactionScore(const IntentMarkers& markers, const std::string& intent) const;

    // Classification, markers and satisfaction in one profile
    AnalysisResult<IntentProfile> analyze(const std::string& keyword, const std::string& postType,
                                          const HtmlDocument* document, const DomNode& region,
                                          const std::string& cleanText) const;

    static double qualityMultiplier(const IntentMarkers& markers);

    const IntentConfig& getConfig() const { return config_; }

private:
    struct CompiledRule {
        IntentConfig::MarkerRule rule;
        bool hasText;
        std::regex text;
    };

    IntentConfig config_;
    std::map<std::string, std::vector<std::pair<std::regex, double>>> compiledPatterns_;
    std::map<std::string, std::vector<CompiledRule>> compiledRules_;
    std::regex brandRegex_;

    // Helper methods
    bool matchesRule(const CompiledRule& rule, const HtmlDocument* document, const DomNode& region,
                     const std::string& cleanText) const;
    bool hasStructuredContent(const HtmlDocument& document, const DomNode& region) const;
    bool hasMultimedia(const HtmlDocument& document, const DomNode& region) const;
    bool hasSemanticMarkup(const HtmlDocument& document) const;
    static bool markerSet(const IntentMarkers& markers, const std::string& name);
    static bool markerMissing(const IntentMarkers& markers, const std::string& name);
};
