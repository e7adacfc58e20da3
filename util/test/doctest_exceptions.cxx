#include <doctest/doctest.h>
#include "MatchaUtil/Exceptions.h"

#include <string>

using namespace Matcha;

TEST_CASE("util exceptions")
{
    SUBCASE("message is formatted") {
        try {
            raise<ValueError>("bad value %d for %s", 42, "answer");
            FAIL("no throw");
        }
        catch (const ValueError& err) {
            CHECK(std::string(err.what()) == "bad value 42 for answer");
            CHECK(errmsg(err) == "bad value 42 for answer");
        }
    }
    SUBCASE("plain message may hold percent") {
        try {
            raise<IOError>("100% broken");
            FAIL("no throw");
        }
        catch (const IOError& err) {
            CHECK(std::string(err.what()) == "100% broken");
        }
    }
    SUBCASE("hierarchy") {
        CHECK_THROWS_AS(raise<ConfigurationError>("unset"), ValueError);
        CHECK_THROWS_AS(raise<ConfigurationError>("unset"), Exception);
        CHECK_THROWS_AS(raise<KeyError>("nope"), std::exception);
    }
}
