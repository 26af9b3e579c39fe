#include <catch2/catch_all.hpp>

#include "libpheno/core/errors.hpp"
#include "libpheno/data/parameter_ranges.hpp"

#include <sstream>
#include <string>

using Catch::Approx;

namespace {

pheno::data::ParameterRangeTable parse(const std::string& text) {
    std::istringstream in(text);
    return pheno::data::load_parameter_ranges(in);
}

} // namespace

TEST_CASE("Parameter ranges load with NA padding", "[ranges]") {
    const auto table = parse(
        "# comment\n"
        "model,bound,par1,par2,par3,par4\n"
        "TT,lower,1,-5,0,NA\n"
        "TT,upper,200,10,2000,NA\n"
        "LIN,lower,-20,0,,\n"
        "LIN,upper,20,250,,\n");

    REQUIRE(table.size() == 2);
    REQUIRE(table.contains("TT"));
    const auto& tt = table.at("TT");
    REQUIRE(tt.size() == 3);
    CHECK(tt[0].name == "t0");
    CHECK(tt[1].name == "T_base");
    CHECK(tt[2].name == "F_crit");
    CHECK(tt[1].lower == Approx(-5.0));
    CHECK(tt[2].upper == Approx(2000.0));

    const auto& lin = table.at("LIN");
    REQUIRE(lin.size() == 2);
    CHECK(lin[0].name == "a");
}

TEST_CASE("Parameter ranges accept swapped bound labels", "[ranges]") {
    const auto table = parse(
        "model,bound,par1,par2,par3\n"
        "TT,upper,200,10,2000\n"
        "TT,lower,1,-5,0\n");
    const auto& tt = table.at("TT");
    CHECK(tt[0].lower == Approx(1.0));
    CHECK(tt[0].upper == Approx(200.0));
}

TEST_CASE("Unknown models take names from the header", "[ranges]") {
    const auto table = parse(
        "model,bound,alpha,beta\n"
        "CUSTOM,lower,0,1\n"
        "CUSTOM,upper,1,2\n");
    const auto& row = table.at("CUSTOM");
    REQUIRE(row.size() == 2);
    CHECK(row[0].name == "alpha");
    CHECK(row[1].name == "beta");
}

TEST_CASE("Malformed parameter range files are rejected", "[ranges][edge]") {
    using pheno::ConfigurationError;

    SECTION("missing header") {
        CHECK_THROWS_AS(parse("TT,lower,1,-5,0\nTT,upper,200,10,2000\n"), ConfigurationError);
    }
    SECTION("single row") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,lower,1,-5,0\n"), ConfigurationError);
    }
    SECTION("three rows") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,,1,-5,0\nTT,,200,10,2000\nTT,,1,1,1\n"),
                        ConfigurationError);
    }
    SECTION("value after NA") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,lower,1,NA,0\nTT,upper,200,NA,2000\n"),
                        ConfigurationError);
    }
    SECTION("arity differs between rows") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,lower,1,-5,0\nTT,upper,200,10,NA\n"),
                        ConfigurationError);
    }
    SECTION("lower above upper") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,lower,1,20,0\nTT,upper,200,10,2000\n"),
                        ConfigurationError);
    }
    SECTION("not a number") {
        CHECK_THROWS_AS(parse("model,bound,p1,p2,p3\nTT,lower,1,-5x,0\nTT,upper,200,10,2000\n"),
                        ConfigurationError);
    }
    SECTION("too many cells") {
        CHECK_THROWS_AS(parse("model,bound,p1\nLIN,lower,1,2\nLIN,upper,3,4\n"), ConfigurationError);
    }
}

TEST_CASE("Lookup of a model without ranges throws", "[ranges]") {
    const auto table = parse(
        "model,bound,p1,p2\n"
        "LIN,lower,-20,0\n"
        "LIN,upper,20,250\n");
    CHECK_FALSE(table.contains("TT"));
    CHECK_THROWS_AS(table.at("TT"), pheno::ConfigurationError);
}

TEST_CASE("Table rejects duplicate and inverted rows", "[ranges]") {
    pheno::data::ParameterRangeTable table;
    table.add("X", {{"a", 0.0, 1.0}});
    CHECK_THROWS_AS(table.add("X", {{"a", 0.0, 1.0}}), pheno::ConfigurationError);
    CHECK_THROWS_AS(table.add("Y", {{"a", 2.0, 1.0}}), pheno::ConfigurationError);
    CHECK_THROWS_AS(table.add("Z", {}), pheno::ConfigurationError);
    // degenerate range is allowed
    CHECK_NOTHROW(table.add("W", {{"a", 1.0, 1.0}}));
}

TEST_CASE("Bundled parameter range file covers every fitted model", "[ranges]") {
    const auto table = pheno::data::load_parameter_ranges(std::string(LIBPHENO_DATA_DIR) + "/parameter_ranges.csv");
    const auto& registry = pheno::models::ModelRegistry::builtin();
    for (const auto& name : registry.names()) {
        if (name == "NULL") continue;
        INFO(name);
        REQUIRE(table.contains(name));
        CHECK(table.at(name).size() == registry.find(name).parameters.size());
    }
}
