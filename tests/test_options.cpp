// tests/test_options.cpp (doctest)

#include <doctest/doctest.h>

#include "App/Options.hpp"

namespace mazesearch_options_test {

AppOptions Parse(std::vector<std::string> args, const AppOptions& defaults = AppOptions{})
{
    args.insert(args.begin(), "mazesearch");

    std::vector<const char*> argv;
    argv.reserve(args.size());
    for (const std::string& a : args) argv.push_back(a.c_str());

    return ParseOptions(static_cast<int>(argv.size()), argv.data(), defaults);
}

} // namespace mazesearch_options_test

using mazesearch_options_test::Parse;

TEST_CASE("Options/Defaults")
{
    const AppOptions opt = Parse({});

    CHECK(opt.width == 10);
    CHECK(opt.height == 10);
    CHECK_FALSE(opt.seed.has_value());
    CHECK(opt.StartOrDefault() == Cell{ 0, 0 });
    CHECK(opt.EndOrDefault() == Cell{ 9, 9 });
    CHECK_FALSE(opt.showExplored);
    CHECK_FALSE(opt.trace);
    CHECK_FALSE(opt.help);
    CHECK_NOTHROW(opt.Validate());
}

TEST_CASE("Options/CallerDefaults")
{
    AppOptions defaults;
    defaults.width = 15;
    defaults.height = 15;

    const AppOptions opt = Parse({ "--height", "4" }, defaults);
    CHECK(opt.width == 15);
    CHECK(opt.height == 4);
    CHECK(opt.EndOrDefault() == Cell{ 14, 3 });
}

TEST_CASE("Options/SeparateAndInlineValues")
{
    const AppOptions opt = Parse({ "--width", "7", "--height=5", "--seed=-12",
                                   "--start", "1,2", "--end=6,4", "--show-explored", "--trace" });

    CHECK(opt.width == 7);
    CHECK(opt.height == 5);
    REQUIRE(opt.seed.has_value());
    CHECK(*opt.seed == -12);
    CHECK(opt.StartOrDefault() == Cell{ 1, 2 });
    CHECK(opt.EndOrDefault() == Cell{ 6, 4 });
    CHECK(opt.showExplored);
    CHECK(opt.trace);
    CHECK_NOTHROW(opt.Validate());
}

TEST_CASE("Options/Help")
{
    CHECK(Parse({ "-h" }).help);
    CHECK(Parse({ "--help" }).help);

    AppOptions defaults;
    defaults.width = 15;
    const std::string usage = Usage("mazeviewer", defaults);
    CHECK(usage.find("Usage: mazeviewer") == 0);
    CHECK(usage.find("default: 15") != std::string::npos);
    CHECK(usage.find("--show-explored") != std::string::npos);
}

TEST_CASE("Options/Errors")
{
    CHECK_THROWS_AS(Parse({ "--bogus" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--width" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--width", "abc" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--width", "12abc" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--seed", "99999999999" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--start", "3" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--end", "1,x" }), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--trace=yes" }), std::invalid_argument);
}

TEST_CASE("Options/HelpWinsOverBadDimensions")
{
    // dimensions are checked by Validate, so --help still prints usage
    const AppOptions opt = Parse({ "--width", "0", "--help" });
    CHECK(opt.help);
    CHECK(opt.width == 0);

    CHECK_THROWS_AS(Parse({ "--width", "0" }).Validate(), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--height=-3" }).Validate(), std::invalid_argument);
}

TEST_CASE("Options/EndpointValidation")
{
    CHECK_THROWS_AS(Parse({ "--width", "5", "--end", "5,0" }).Validate(), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--start", "-1,0" }).Validate(), std::invalid_argument);
    CHECK_THROWS_AS(Parse({ "--height", "3", "--start", "0,3" }).Validate(), std::invalid_argument);
    CHECK_NOTHROW(Parse({ "--width", "5", "--height", "3", "--end", "4,2" }).Validate());
}

TEST_CASE("Options/ParseHelpers")
{
    CHECK(ParseInt32("42", "n") == 42);
    CHECK(ParseInt32("-7", "n") == -7);
    CHECK(ParseInt32("2147483647", "n") == 2147483647);
    CHECK_THROWS_AS(ParseInt32("2147483648", "n"), std::invalid_argument);
    CHECK_THROWS_AS(ParseInt32("", "n"), std::invalid_argument);

    CHECK(ParseCell("3,4", "cell") == Cell{ 3, 4 });
    CHECK_THROWS_AS(ParseCell("3;4", "cell"), std::invalid_argument);
}
