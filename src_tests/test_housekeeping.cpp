/**
 * @file test_housekeeping.cpp
 * @brief Tests for cleaning a data tree, moving products aside and searching inputs by header.
 */

#include <catch2/catch_test_macros.hpp>

#include "calregress/housekeeping.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace calregress;
using calregress::testing::TempDir;
using calregress::testing::quoted;
using calregress::testing::write_file;
using calregress::testing::write_header_only;

namespace fs = std::filesystem;

namespace {

void populate(const TempDir& root) {
    write_header_only(root / "acs/j8cw03g0q_raw.fits", {{"INSTRUME", quoted("ACS")}});
    write_file(root / "acs/j8cw03g0q_flt.fits", "product");
    write_file(root / "acs/j8cw03g0q.tra", "trailer");
    write_header_only(root / "wfc3/ib1f23qbq_raw.fits",
                      {{"INSTRUME", quoted("WFC3")}, {"DETECTOR", quoted("UVIS")}});
    write_header_only(root / "wfc3/ib1f23qcq_raw.fits",
                      {{"INSTRUME", quoted("WFC3")}, {"DETECTOR", quoted("IR")}});
    write_file(root / "wfc3/ib1f23qbq_flc.fits", "product");
}

} // namespace

TEST_CASE("clean_tree removes everything but the primary inputs", "[housekeeping][clean]")
{
    TempDir root;
    populate(root);

    const auto removed = clean_tree(root.path(), suffix_predicate("raw.fits"));
    CHECK(removed == 3);
    CHECK(fs::exists(root / "acs/j8cw03g0q_raw.fits"));
    CHECK_FALSE(fs::exists(root / "acs/j8cw03g0q_flt.fits"));
    CHECK_FALSE(fs::exists(root / "acs/j8cw03g0q.tra"));
    CHECK_FALSE(fs::exists(root / "wfc3/ib1f23qbq_flc.fits"));
    CHECK(fs::is_directory(root / "acs"));

    CHECK(clean_tree(root.path(), suffix_predicate("raw.fits")) == 0);
}

TEST_CASE("move_tree relocates products under results", "[housekeeping][move]")
{
    TempDir root;
    populate(root);
    TempDir destination;

    const auto moved = move_tree(root.path(), destination.path(), suffix_predicate("raw.fits"));
    CHECK(moved == 3);
    CHECK(fs::exists(root / "acs/j8cw03g0q_raw.fits"));
    CHECK_FALSE(fs::exists(root / "acs/j8cw03g0q_flt.fits"));
    CHECK(calregress::testing::read_file(destination / "results/acs/j8cw03g0q_flt.fits") == "product");
    CHECK(fs::exists(destination / "results/acs/j8cw03g0q.tra"));
    CHECK(fs::exists(destination / "results/wfc3/ib1f23qbq_flc.fits"));
}

TEST_CASE("Housekeeping on a missing tree fails with the path", "[housekeeping][errors]")
{
    TempDir root;
    try {
        (void)clean_tree(root / "absent", suffix_predicate("raw.fits"));
        FAIL("expected HousekeepingError");
    } catch (const HousekeepingError& ex) {
        REQUIRE(ex.failures().size() == 1);
        CHECK(ex.failures().front().first == root / "absent");
        CHECK(ex.failures().front().second == "not a directory");
    }
    CHECK_THROWS_AS(move_tree(root / "absent", root.path(), suffix_predicate("raw.fits")), HousekeepingError);
}

TEST_CASE("find_inputs matches primary headers against a selector", "[housekeeping][find]")
{
    TempDir root;
    populate(root);
    std::ostringstream sink;
    ConsoleLog log(sink, sink);
    const auto is_raw = suffix_predicate("raw.fits");

    SECTION("Single clause") {
        const auto found = find_inputs(root.path(), is_raw, Selector::parse("INSTRUME=WFC3"), log);
        REQUIRE(found.size() == 2);
        CHECK(found[0].filename() == "ib1f23qbq_raw.fits");
        CHECK(found[1].filename() == "ib1f23qcq_raw.fits");
    }

    SECTION("Argument triples") {
        const auto selector = Selector::from_arguments({"INSTRUME", "WFC3", "and", "DETECTOR", "IR"});
        const auto found = find_inputs(root.path(), is_raw, selector, log);
        REQUIRE(found.size() == 1);
        CHECK(found.front().filename() == "ib1f23qcq_raw.fits");
    }

    SECTION("Or clause") {
        const auto found = find_inputs(root.path(), is_raw, Selector::parse("INSTRUME=ACS or DETECTOR=IR"), log);
        CHECK(found.size() == 2);
    }

    SECTION("Missing root") {
        CHECK_THROWS_AS(find_inputs(root / "absent", is_raw, Selector{}, log), HousekeepingError);
    }
}
