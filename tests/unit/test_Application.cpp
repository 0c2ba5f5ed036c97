#include <catch2/catch_test_macros.hpp>

#include "app/Application.hpp"

using namespace openfing::app;

TEST_CASE("Application::parseArguments", "[Application]") {
    SECTION("No arguments") {
        auto options = Application::parseArguments({});
        REQUIRE(options.has_value());
        REQUIRE(options->interfaceName.empty());
        REQUIRE_FALSE(options->deep);
        REQUIRE_FALSE(options->json);
        REQUIRE_FALSE(options->csv);
        REQUIRE_FALSE(options->verbose);
        REQUIRE_FALSE(options->help);
    }

    SECTION("Interface and flags in any order") {
        auto options = Application::parseArguments({"--deep", "wlan0", "--json", "-v"});
        REQUIRE(options.has_value());
        REQUIRE(options->interfaceName == "wlan0");
        REQUIRE(options->deep);
        REQUIRE(options->json);
        REQUIRE(options->verbose);
    }

    SECTION("Short flags") {
        auto options = Application::parseArguments({"-d", "-h"});
        REQUIRE(options.has_value());
        REQUIRE(options->deep);
        REQUIRE(options->help);
    }

    SECTION("CSV output") {
        auto options = Application::parseArguments({"--csv"});
        REQUIRE(options.has_value());
        REQUIRE(options->csv);
    }

    SECTION("Unknown flag") {
        REQUIRE_FALSE(Application::parseArguments({"--fast"}).has_value());
    }

    SECTION("Second positional argument") {
        REQUIRE_FALSE(Application::parseArguments({"eth0", "eth1"}).has_value());
    }

    SECTION("Grouped short flags") {
        auto options = Application::parseArguments({"-dv", "eth0"});
        REQUIRE(options.has_value());
        REQUIRE(options->deep);
        REQUIRE(options->verbose);
        REQUIRE(options->interfaceName == "eth0");
    }

    SECTION("Switches take no value") {
        REQUIRE_FALSE(Application::parseArguments({"--deep=yes"}).has_value());
    }

    SECTION("Conflicting output formats") {
        REQUIRE_FALSE(Application::parseArguments({"--json", "--csv"}).has_value());
    }
}

TEST_CASE("Application::usage", "[Application]") {
    auto text = Application::usage();
    REQUIRE(text.find("openfing [interface]") != std::string::npos);
    REQUIRE(text.find("--deep") != std::string::npos);
    REQUIRE(text.find("--json") != std::string::npos);
    REQUIRE(text.find("--csv") != std::string::npos);
    REQUIRE(text.find("-v [ --verbose ]") != std::string::npos);
}
