/**
 * @file test_case_discoverer.cpp
 * @brief Tests for lazy test case discovery under a data root.
 *
 * Covers:
 * - Deterministic (sorted) walk, primary-input filtering and index assignment
 * - Command resolution from the primary header; unmapped inputs are skipped
 * - Selector filtering, depth limit and unreadable inputs
 * - A missing root is reported as DiscoveryError
 */

#include <catch2/catch_test_macros.hpp>

#include "calregress/case_discoverer.hpp"
#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace calregress;
using calregress::testing::TempDir;
using calregress::testing::quoted;
using calregress::testing::write_header_only;

namespace {

void populate(const TempDir& root) {
    write_header_only(root / "acs/j8cw03g0q_raw.fits", {{"INSTRUME", quoted("ACS")}});
    write_header_only(root / "acs/j8cw03g0q_flt.fits", {{"INSTRUME", quoted("ACS")}});
    write_header_only(root / "nicmos/n4hk12010_raw.fits", {{"INSTRUME", quoted("NICMOS")}});
    write_header_only(root / "top_raw.fits", {{"INSTRUME", quoted("STIS")}});
    write_header_only(root / "wfc3/ib1f23qbq_raw.fits",
                      {{"INSTRUME", quoted("WFC3")}, {"PCTECORR", quoted("PERFORM")}});

    std::string broken = calregress::testing::card("SIMPLE", "T");
    broken.resize(2880, ' ');
    calregress::testing::write_file(root / "broken_raw.fits", broken);
}

std::vector<std::string> ids(const std::vector<TestCase>& cases) {
    std::vector<std::string> result;
    for (const auto& test : cases) {
        result.push_back(test.id);
    }
    return result;
}

} // namespace

TEST_CASE("Discovery walks the root in sorted order", "[discovery]")
{
    TempDir root;
    populate(root);
    std::ostringstream out;
    std::ostringstream err;
    ConsoleLog log(out, err);

    const CaseDiscoverer discoverer(root.path(), DiscoveryOptions{}, log);
    const auto cases = discoverer.collect();

    REQUIRE(ids(cases) ==
            std::vector<std::string>{"acs/j8cw03g0q_raw.fits", "top_raw.fits", "wfc3/ib1f23qbq_raw.fits"});
    for (std::size_t i = 0; i < cases.size(); ++i) {
        CHECK(cases[i].index == i);
    }

    const auto& acs = cases.front();
    CHECK(acs.primary_input.is_absolute());
    CHECK(acs.primary_input.filename() == "j8cw03g0q_raw.fits");
    CHECK(acs.input_directory == acs.primary_input.parent_path());
    REQUIRE(acs.command.size() == 4);
    CHECK(acs.command[0] == "calacs.e");
    CHECK(acs.command[1] == "-v");
    CHECK(acs.command[2] == "-1");
    CHECK(acs.command[3] == acs.primary_input.string());
    CHECK(std::get<std::string>(acs.tags.at("INSTRUME")) == "ACS");

    CHECK(err.str().find("No executable mapped") != std::string::npos);
    CHECK(err.str().find("Skipping unreadable input") != std::string::npos);
}

TEST_CASE("Discovery is lazy and restartable", "[discovery]")
{
    TempDir root;
    populate(root);
    std::ostringstream sink;
    ConsoleLog log(sink, sink);
    const CaseDiscoverer discoverer(root.path(), DiscoveryOptions{}, log);

    auto it = discoverer.begin();
    REQUIRE(it != discoverer.end());
    CHECK(it->id == "acs/j8cw03g0q_raw.fits");
    ++it;
    REQUIRE(it != discoverer.end());
    CHECK((*it).id == "top_raw.fits");

    const auto again = discoverer.collect();
    CHECK(again.size() == 3);
    CHECK(again.front().index == 0);
}

TEST_CASE("Discovery options narrow the case set", "[discovery][options]")
{
    TempDir root;
    populate(root);
    std::ostringstream sink;
    ConsoleLog log(sink, sink);

    SECTION("Selector") {
        DiscoveryOptions options;
        options.selector.and_where("PCTECORR", "PERFORM");
        const auto cases = CaseDiscoverer(root.path(), options, log).collect();
        REQUIRE(cases.size() == 1);
        CHECK(cases.front().id == "wfc3/ib1f23qbq_raw.fits");
        CHECK(cases.front().index == 0);
        CHECK(cases.front().tags.count("PCTECORR") == 1);
    }

    SECTION("Depth limit") {
        DiscoveryOptions options;
        options.max_depth = 0;
        const auto cases = CaseDiscoverer(root.path(), options, log).collect();
        CHECK(ids(cases) == std::vector<std::string>{"top_raw.fits"});
    }

    SECTION("Primary input predicate") {
        DiscoveryOptions options;
        options.is_primary = suffix_predicate("flt.fits");
        const auto cases = CaseDiscoverer(root.path(), options, log).collect();
        CHECK(ids(cases) == std::vector<std::string>{"acs/j8cw03g0q_flt.fits"});
    }

    SECTION("Command table") {
        DiscoveryOptions options;
        options.commands.executables["NICMOS"] = "calnica.e";
        options.commands.exec_dir = "/opt/bin";
        const auto cases = CaseDiscoverer(root.path(), options, log).collect();
        REQUIRE(cases.size() == 4);
        CHECK(cases[1].id == "nicmos/n4hk12010_raw.fits");
        CHECK(cases[1].command.front() == "/opt/bin/calnica.e");
    }
}

TEST_CASE("A missing root is a discovery error", "[discovery][errors]")
{
    TempDir root;
    std::ostringstream sink;
    ConsoleLog log(sink, sink);

    CHECK_THROWS_AS(CaseDiscoverer(root / "absent", DiscoveryOptions{}, log), DiscoveryError);

    calregress::testing::write_file(root / "file.txt", "x");
    CHECK_THROWS_AS(CaseDiscoverer(root / "file.txt", DiscoveryOptions{}, log), DiscoveryError);

    const auto empty = CaseDiscoverer(root.path(), DiscoveryOptions{}, log).collect();
    CHECK(empty.empty());
}
