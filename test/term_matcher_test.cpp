#include <catch2/catch_test_macros.hpp>
#include "term_matcher.hpp"

TEST_CASE("TermMatcher normalizes its terms", "[TermMatcher]") {
    TermMatcher matcher;

    SECTION("Terms are lowercased, collapsed and deduplicated") {
        matcher.addTerm("  In   Fact ");
        matcher.addTerm("in fact");
        matcher.addTerm("   ");
        REQUIRE(matcher.terms().size() == 1);
        REQUIRE(matcher.terms()[0] == "in fact");
    }

    SECTION("Comma-separated term lists replace the current list") {
        matcher.addTerm("old");
        matcher.setTerms("however, in fact,,therefore");
        REQUIRE(matcher.terms().size() == 3);
        REQUIRE_FALSE(matcher.matchesAny("old news"));
    }

    SECTION("An empty matcher matches nothing") {
        REQUIRE(matcher.empty());
        REQUIRE_FALSE(matcher.matchesAny("however"));
    }
}

TEST_CASE("TermMatcher matches whole words case-insensitively", "[TermMatcher]") {
    TermMatcher matcher({"however", "for example", "thus"});

    SECTION("Single words and phrases") {
        REQUIRE(matcher.matchesAny("However, the results differ."));
        REQUIRE(matcher.matchesAny("Take, FOR EXAMPLE, this case."));
        REQUIRE_FALSE(matcher.matchesAny("Thusly we proceed."));
    }

    SECTION("Matched terms keep list order") {
        auto matched = matcher.matchedTerms("Thus it works. However it is slow.");
        REQUIRE(matched.size() == 2);
        REQUIRE(matched[0] == "however");
        REQUIRE(matched[1] == "thus");
    }

    SECTION("Non-ASCII letters are word characters") {
        TermMatcher german({"auch"});
        REQUIRE(german.matchesAny("Das ist auch gut."));
        REQUIRE_FALSE(german.matchesAny("Das ist auch\xC3\xA4 gut."));
    }
}
