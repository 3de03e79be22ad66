/**
 * @file test_report_writer.cpp
 * @brief Tests for JSON summary, HTML report and console summary output.
 */

#include <catch2/catch_test_macros.hpp>

#include "calregress/report_writer.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <sstream>
#include <string>

using namespace calregress;
using nlohmann::json;

namespace {

RunReport sample_report() {
    RunReport report;
    report.duration = std::chrono::milliseconds{3725000};

    CaseResult pass;
    pass.index = 0;
    pass.case_id = "acs/j8cw03g0q_raw.fits";
    pass.verdict = CaseVerdict::Pass;

    CaseResult fail;
    fail.index = 1;
    fail.case_id = "wfc3/ib1f23qbq_raw.fits";
    fail.verdict = CaseVerdict::Fail;
    ArtifactDiff diff;
    diff.reference = "/ref/ib1f23qbq_flt.fits";
    diff.candidate = "/out/ib1f23qbq_flt.fits";
    diff.verdict = DiffVerdict::Differing;
    diff.units_compared = 2;
    UnitDiff unit;
    unit.unit_id = "SCI,1";
    unit.metadata.push_back(FieldChange{"EXPTIME", ChangeKind::Changed, FieldValue{300.0}, FieldValue{301.0}});
    DataDiff data;
    data.compared_elements = 4;
    data.differing_elements = 1;
    data.max_absolute = 0.5;
    data.differing_arrays = {"DATA"};
    unit.data = data;
    diff.units.push_back(unit);
    fail.diffs.push_back(diff);

    CaseResult error;
    error.index = 2;
    error.case_id = "stis/o4d2<x>_raw.fits";
    error.verdict = CaseVerdict::Error;
    ExecutionOutcome outcome;
    outcome.case_id = error.case_id;
    outcome.index = 2;
    outcome.status = ExecutionStatus::Timeout;
    outcome.message = "timed out after 100 ms";
    error.outcome = outcome;
    error.message = outcome.message;

    report.results = {pass, fail, error};
    report.passed = 1;
    report.failed = 1;
    report.errored = 1;
    return report;
}

} // namespace

TEST_CASE("format_duration renders hours, minutes and seconds", "[report][duration]")
{
    CHECK(format_duration(std::chrono::milliseconds{0}) == "0hrs:0mins:0secs");
    CHECK(format_duration(std::chrono::milliseconds{3725999}) == "1hrs:2mins:5secs");
}

TEST_CASE("The JSON summary carries counts and per-case detail", "[report][json]")
{
    const auto report = sample_report();
    const auto summary = json::parse(ReportWriter{}.summary_json(report));

    CHECK(summary["total"] == 3);
    CHECK(summary["by_verdict"]["PASS"] == 1);
    CHECK(summary["by_verdict"]["FAIL"] == 1);
    CHECK(summary["by_verdict"]["ERROR"] == 1);
    CHECK(summary["cancelled"] == false);
    CHECK(summary["duration_ms"] == 3725000);
    CHECK_FALSE(summary.contains("tree"));

    const auto& cases = summary["cases"];
    REQUIRE(cases.size() == 3);
    CHECK(cases[0]["id"] == "acs/j8cw03g0q_raw.fits");
    CHECK(cases[0]["execution"].is_null());

    const auto& diff = cases[1]["diffs"][0];
    CHECK(diff["verdict"] == "differing");
    CHECK(diff["units"][0]["unit"] == "SCI,1");
    CHECK(diff["units"][0]["metadata"][0]["key"] == "EXPTIME");
    CHECK(diff["units"][0]["metadata"][0]["reference"] == 300.0);
    CHECK(diff["units"][0]["data"]["differing_elements"] == 1);

    CHECK(cases[2]["verdict"] == "ERROR");
    CHECK(cases[2]["execution"]["status"] == "timeout");
    CHECK(cases[2]["message"] == "timed out after 100 ms");
}

TEST_CASE("Tree counts appear in the summary and on the console", "[report][tree]")
{
    auto report = sample_report();
    TreeSummary tree;
    tree.differing.count("a.log");
    tree.candidate_only.count("new_flt.fits");
    tree.candidate_only.count("new.tra");
    report.tree = tree;

    const auto summary = json::parse(ReportWriter{}.summary_json(report));
    CHECK(summary["tree"]["differing"]["log"] == 1);
    CHECK(summary["tree"]["candidate_only"]["total"] == 2);
    CHECK(summary["tree"]["loosely_passed"] == true);

    std::ostringstream out;
    ReportWriter{}.print_console(out, report);
    const auto text = out.str();
    CHECK(text.find("1 file(s) differ between paths:") != std::string::npos);
    CHECK(text.find("\t1 of them \".log\" files") != std::string::npos);
    CHECK(text.find("2 newly generated file(s) found:") != std::string::npos);
    CHECK(text.find("Regression LOOSELY PASSED! Only log files differ") != std::string::npos);
}

TEST_CASE("Console summary lists non-passing cases", "[report][console]")
{
    auto report = sample_report();
    report.cancelled = true;

    std::ostringstream out;
    ReportWriter{}.print_console(out, report);
    const auto text = out.str();

    CHECK(text.find("1/3 tests passed") != std::string::npos);
    CHECK(text.find("PASS: 1  FAIL: 1  ERROR: 1") != std::string::npos);
    CHECK(text.find("[FAIL] wfc3/ib1f23qbq_raw.fits: 1 artifact(s) differ") != std::string::npos);
    CHECK(text.find("[ERROR] stis/o4d2<x>_raw.fits (timeout)") != std::string::npos);
    CHECK(text.find("acs/j8cw03g0q_raw.fits") == std::string::npos);
    CHECK(text.find("Run cancelled: report is partial") != std::string::npos);
    CHECK(text.find("Total time taken: 1hrs:2mins:5secs") != std::string::npos);
}

TEST_CASE("Reports are written to disk", "[report][files]")
{
    calregress::testing::TempDir dir;
    const auto report = sample_report();
    const ReportWriter writer;

    writer.write_summary(dir / "nested/summary.json", report);
    writer.write_detailed(dir / "report.html", report);

    const auto summary = json::parse(calregress::testing::read_file(dir / "nested/summary.json"));
    CHECK(summary["total"] == 3);

    const auto html = calregress::testing::read_file(dir / "report.html");
    CHECK(html.find("<h1>Regression Report</h1>") != std::string::npos);
    CHECK(html.find("status-FAIL") != std::string::npos);
    CHECK(html.find("stis/o4d2&lt;x&gt;_raw.fits") != std::string::npos);
    CHECK(html.find("o4d2<x>") == std::string::npos);
}
