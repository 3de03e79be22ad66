/**
 * @file test_live_comparator.cpp
 * @brief Tests for comparing one case's produced artifacts against its reference directory.
 */

#include <catch2/catch_test_macros.hpp>

#include "calregress/live_comparator.hpp"
#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace calregress;
using calregress::testing::FitsBuilder;
using calregress::testing::TempDir;
using calregress::testing::quoted;

namespace {

const std::string kCase = "wfc3/ib1f23qbq_raw.fits";

struct Fixture {
    TempDir dir;
    std::ostringstream out;
    std::ostringstream err;
    RunContext context{out, err};
    ArtifactComparator comparator{CompareOptions{{}, {"DATE"}}};

    [[nodiscard]] std::filesystem::path reference() const { return dir / "reference"; }
    [[nodiscard]] std::filesystem::path produced() const { return dir / "output" / kCase; }

    void write_reference(const std::string& name, double value) const {
        FitsBuilder{}.primary({{"DATE", quoted("2020-01-01")}}).image("SCI", -64, {2}, {1.0, value}).write(
            reference() / kCase / name);
    }

    void write_produced(const std::string& name, double value) const {
        FitsBuilder{}.primary({{"DATE", quoted("2026-10-19")}}).image("SCI", -64, {2}, {1.0, value}).write(
            produced() / name);
    }

    [[nodiscard]] ExecutionOutcome outcome(std::vector<std::filesystem::path> artifacts) const {
        ExecutionOutcome result;
        result.case_id = kCase;
        result.index = 5;
        result.status = ExecutionStatus::Success;
        result.exit_code = 0;
        result.output_directory = produced();
        result.artifacts = std::move(artifacts);
        return result;
    }
};

} // namespace

TEST_CASE("Matching artifacts pass", "[live]")
{
    Fixture f;
    f.write_reference("ib1f23qbq_flt.fits", 2.0);
    f.write_produced("ib1f23qbq_flt.fits", 2.0);
    calregress::testing::write_file(f.produced() / "ib1f23qbq.tra", "trailer\n");

    const LiveComparator live(f.context, f.comparator, f.reference());
    const auto result = live.compare(f.outcome({"ib1f23qbq.tra", "ib1f23qbq_flt.fits"}));

    CHECK(result.verdict == CaseVerdict::Pass);
    CHECK(result.index == 5);
    CHECK(result.case_id == kCase);
    REQUIRE(result.diffs.size() == 1);
    CHECK(result.diffs.front().identical());
    CHECK(result.issues.empty());
    REQUIRE(result.outcome.has_value());
    CHECK(result.outcome->succeeded());
}

TEST_CASE("Differing artifacts fail", "[live]")
{
    Fixture f;
    f.write_reference("ib1f23qbq_flt.fits", 2.0);
    f.write_produced("ib1f23qbq_flt.fits", 2.5);

    const LiveComparator live(f.context, f.comparator, f.reference());
    const auto result = live.compare(f.outcome({"ib1f23qbq_flt.fits"}));

    CHECK(result.verdict == CaseVerdict::Fail);
    REQUIRE(result.diffs.size() == 1);
    CHECK(result.diffs.front().verdict == DiffVerdict::Differing);
    CHECK(f.err.str().find("differ") != std::string::npos);
}

TEST_CASE("Artifact set mismatches are errors", "[live][issues]")
{
    Fixture f;

    SECTION("Reference artifact not produced") {
        f.write_reference("ib1f23qbq_flt.fits", 2.0);
        f.write_reference("ib1f23qbq_flc.fits", 2.0);
        f.write_produced("ib1f23qbq_flt.fits", 2.0);
        const LiveComparator live(f.context, f.comparator, f.reference());
        const auto result = live.compare(f.outcome({"ib1f23qbq_flt.fits"}));

        CHECK(result.verdict == CaseVerdict::Error);
        REQUIRE(result.issues.size() == 1);
        CHECK(result.issues.front().path == "ib1f23qbq_flc.fits");
        CHECK(result.issues.front().message == "reference artifact not produced");
        CHECK(result.diffs.size() == 1);
    }

    SECTION("Produced artifact unknown to the reference") {
        f.write_reference("ib1f23qbq_flt.fits", 2.0);
        f.write_produced("ib1f23qbq_flt.fits", 2.0);
        f.write_produced("ib1f23qbq_extra.fits", 2.0);
        const LiveComparator live(f.context, f.comparator, f.reference());
        const auto result = live.compare(f.outcome({"ib1f23qbq_extra.fits", "ib1f23qbq_flt.fits"}));

        CHECK(result.verdict == CaseVerdict::Error);
        CHECK(result.issues.empty());
        REQUIRE(result.unexpected.size() == 1);
        CHECK(result.unexpected.front() == "ib1f23qbq_extra.fits");
    }

    SECTION("No reference directory for the case") {
        f.write_produced("ib1f23qbq_flt.fits", 2.0);
        const LiveComparator live(f.context, f.comparator, f.reference());
        const auto result = live.compare(f.outcome({"ib1f23qbq_flt.fits"}));

        CHECK(result.verdict == CaseVerdict::Error);
        REQUIRE_FALSE(result.issues.empty());
        CHECK(result.issues.front().message == "reference directory missing");
    }

    SECTION("Unreadable artifact") {
        f.write_reference("ib1f23qbq_flt.fits", 2.0);
        std::string truncated = calregress::testing::card("SIMPLE", "T");
        truncated.resize(2880, ' ');
        calregress::testing::write_file(f.produced() / "ib1f23qbq_flt.fits", truncated);
        const LiveComparator live(f.context, f.comparator, f.reference());
        const auto result = live.compare(f.outcome({"ib1f23qbq_flt.fits"}));

        CHECK(result.verdict == CaseVerdict::Error);
        REQUIRE(result.issues.size() == 1);
        CHECK(result.issues.front().path == "ib1f23qbq_flt.fits");
        CHECK(result.diffs.empty());
    }
}

TEST_CASE("Failed executions are not compared", "[live][execution]")
{
    Fixture f;
    f.write_reference("ib1f23qbq_flt.fits", 2.0);

    auto failed = f.outcome({});
    failed.status = ExecutionStatus::NonZeroExit;
    failed.exit_code = 2;
    failed.message = "calwf3.e returned 2";

    const LiveComparator live(f.context, f.comparator, f.reference());
    const auto result = live.compare(failed);

    CHECK(result.verdict == CaseVerdict::Error);
    CHECK(result.diffs.empty());
    CHECK(result.message == "calwf3.e returned 2");
    REQUIRE(result.outcome.has_value());
    CHECK(result.outcome->exit_code == 2);
}

TEST_CASE("Comparable files are filtered by suffix", "[live][suffix]")
{
    TempDir dir;
    calregress::testing::write_file(dir / "a_flt.fits", "x");
    calregress::testing::write_file(dir / "a.tra", "x");
    calregress::testing::write_file(dir / "nested/b_crj.fits", "x");

    CHECK(comparable_files(dir.path(), {".fits"}) ==
          std::vector<std::filesystem::path>{"a_flt.fits", std::filesystem::path{"nested"} / "b_crj.fits"});
    CHECK(comparable_files(dir.path(), {".tra", "_flt.fits"}) ==
          std::vector<std::filesystem::path>{"a.tra", "a_flt.fits"});
    CHECK(comparable_files(dir / "absent", {".fits"}).empty());
    CHECK(has_suffix("x/y/z.fits", {".fits"}));
    CHECK_FALSE(has_suffix("x/y/z.fits.gz", {".fits"}));
}
