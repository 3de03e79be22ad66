#include "calregress/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json field_to_json(const calregress::FieldValue& value) {
    return std::visit([](const auto& v) { return json(v); }, value);
}

json data_to_json(const calregress::DataDiff& data) {
    json out = {
        {"shape_mismatch", data.shape_mismatch},
        {"compared_elements", data.compared_elements},
        {"differing_elements", data.differing_elements},
        {"tolerated_elements", data.tolerated_elements},
        {"max_absolute", data.max_absolute},
        {"max_relative", data.max_relative},
        {"differing_arrays", data.differing_arrays},
    };
    if (data.shape_mismatch) {
        out["shape_detail"] = data.shape_detail;
    }
    return out;
}

json unit_to_json(const calregress::UnitDiff& unit) {
    json metadata = json::array();
    for (const auto& change : unit.metadata) {
        json entry = {{"key", change.key}, {"kind", calregress::to_string(change.kind)}};
        entry["reference"] = change.reference ? field_to_json(*change.reference) : json(nullptr);
        entry["candidate"] = change.candidate ? field_to_json(*change.candidate) : json(nullptr);
        metadata.push_back(std::move(entry));
    }
    json out = {
        {"unit", unit.unit_id},
        {"presence", calregress::to_string(unit.presence)},
        {"metadata", std::move(metadata)},
    };
    out["data"] = unit.data ? data_to_json(*unit.data) : json(nullptr);
    return out;
}

json diff_to_json(const calregress::ArtifactDiff& diff) {
    json units = json::array();
    for (const auto& unit : diff.units) {
        units.push_back(unit_to_json(unit));
    }
    return json{
        {"reference", diff.reference.string()},
        {"candidate", diff.candidate.string()},
        {"verdict", calregress::to_string(diff.verdict)},
        {"units_compared", diff.units_compared},
        {"detail", diff.detail},
        {"units", std::move(units)},
    };
}

json outcome_to_json(const calregress::ExecutionOutcome& outcome) {
    json artifacts = json::array();
    for (const auto& artifact : outcome.artifacts) {
        artifacts.push_back(artifact.generic_string());
    }
    return json{
        {"status", calregress::to_string(outcome.status)},
        {"exit_code", outcome.exit_code},
        {"duration_ms", outcome.duration.count()},
        {"stderr_tail", outcome.stderr_tail},
        {"output_directory", outcome.output_directory.string()},
        {"log_file", outcome.log_file.string()},
        {"artifacts", std::move(artifacts)},
    };
}

json result_to_json(const calregress::CaseResult& result) {
    json diffs = json::array();
    for (const auto& diff : result.diffs) {
        diffs.push_back(diff_to_json(diff));
    }
    json issues = json::array();
    for (const auto& issue : result.issues) {
        issues.push_back({{"path", issue.path.generic_string()}, {"message", issue.message}});
    }
    json unexpected = json::array();
    for (const auto& path : result.unexpected) {
        unexpected.push_back(path.generic_string());
    }
    json out = {
        {"index", result.index},
        {"id", result.case_id},
        {"verdict", calregress::to_string(result.verdict)},
        {"message", result.message},
        {"diffs", std::move(diffs)},
        {"issues", std::move(issues)},
        {"unexpected", std::move(unexpected)},
    };
    out["execution"] = result.outcome ? outcome_to_json(*result.outcome) : json(nullptr);
    return out;
}

json counts_to_json(const calregress::SuffixCounts& counts) {
    return json{{"total", counts.total}, {"log", counts.logs}, {"tra", counts.trailers}, {"fits", counts.fits}};
}

json build_summary(const calregress::RunReport& report) {
    json summary = {
        {"total", report.total()},
        {"by_verdict", {{"PASS", report.passed}, {"FAIL", report.failed}, {"ERROR", report.errored}}},
        {"cancelled", report.cancelled},
        {"duration_ms", report.duration.count()},
        {"cases", json::array()},
    };
    for (const auto& result : report.results) {
        summary["cases"].push_back(result_to_json(result));
    }
    if (report.tree) {
        summary["tree"] = {
            {"differing", counts_to_json(report.tree->differing)},
            {"reference_only", counts_to_json(report.tree->reference_only)},
            {"candidate_only", counts_to_json(report.tree->candidate_only)},
            {"loosely_passed", report.tree->loosely_passed()},
        };
    }
    return summary;
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string diffs_to_html(const calregress::CaseResult& result) {
    if (result.diffs.empty() && result.issues.empty() && result.unexpected.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "<ul>";
    for (const auto& diff : result.diffs) {
        oss << "<li>" << escape_html(diff.candidate.filename().string()) << ": "
            << calregress::to_string(diff.verdict);
        for (const auto& unit : diff.units) {
            oss << "<br/>&nbsp;&nbsp;" << escape_html(unit.unit_id) << " ("
                << calregress::to_string(unit.presence) << ")";
            for (const auto& change : unit.metadata) {
                oss << " " << escape_html(change.key) << ":" << calregress::to_string(change.kind);
            }
            if (unit.data && !unit.data->identical()) {
                if (unit.data->shape_mismatch) {
                    oss << " shape mismatch: " << escape_html(unit.data->shape_detail);
                } else {
                    oss << " " << unit.data->differing_elements << " differing element(s), max abs "
                        << unit.data->max_absolute;
                }
            }
        }
        oss << "</li>";
    }
    for (const auto& issue : result.issues) {
        oss << "<li class=\"issue\">" << escape_html(issue.path.generic_string()) << ": "
            << escape_html(issue.message) << "</li>";
    }
    for (const auto& path : result.unexpected) {
        oss << "<li>unexpected: " << escape_html(path.generic_string()) << "</li>";
    }
    oss << "</ul>";
    return oss.str();
}

std::string render_html(const calregress::RunReport& report) {
    std::ostringstream oss;
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>Regression Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-ERROR{color:#b000b5;font-weight:bold;}"
        << ".issue{color:#b000b5;}"
        << "</style></head><body>";

    oss << "<h1>Regression Report</h1>";

    oss << "<section><h2>Summary</h2><ul>";
    oss << "<li>Total cases: " << report.total() << "</li>";
    oss << "<li>PASS: " << report.passed << "</li>";
    oss << "<li>FAIL: " << report.failed << "</li>";
    oss << "<li>ERROR: " << report.errored << "</li>";
    oss << "<li>Duration: " << escape_html(calregress::format_duration(report.duration)) << "</li>";
    if (report.cancelled) {
        oss << "<li><strong>Run cancelled: report is partial</strong></li>";
    }
    oss << "</ul></section>";

    oss << "<section><h2>Cases</h2><table>";
    oss << "<thead><tr>"
        << "<th>#</th>"
        << "<th>Case</th>"
        << "<th>Verdict</th>"
        << "<th>Execution</th>"
        << "<th>Message</th>"
        << "<th>Artifacts</th>"
        << "</tr></thead><tbody>";

    for (const auto& result : report.results) {
        const std::string verdict = calregress::to_string(result.verdict);
        oss << "<tr>";
        oss << "<td>" << (result.index + 1) << "</td>";
        oss << "<td>" << escape_html(result.case_id) << "</td>";
        oss << "<td class=\"status-" << verdict << "\">" << verdict << "</td>";
        oss << "<td>";
        if (result.outcome) {
            oss << calregress::to_string(result.outcome->status) << " (" << result.outcome->exit_code << ", "
                << result.outcome->duration.count() << " ms)";
        }
        oss << "</td>";
        oss << "<td>" << escape_html(result.message) << "</td>";
        oss << "<td>" << diffs_to_html(result) << "</td>";
        oss << "</tr>";
    }

    oss << "</tbody></table></section>";
    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

void print_counts(std::ostream& out, std::size_t total, const char* what, const calregress::SuffixCounts& counts) {
    out << total << " " << what << "\n"
        << "\t" << counts.logs << " of them \".log\" files\n"
        << "\t" << counts.trailers << " of them \".tra\" files\n"
        << "\t" << counts.fits << " of them \".fits\" files\n";
}

}  // namespace

namespace calregress {

std::string format_duration(std::chrono::milliseconds duration) {
    const auto total = duration.count() / 1000;
    const auto hours = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    return std::to_string(hours) + "hrs:" + std::to_string(minutes) + "mins:" + std::to_string(seconds) + "secs";
}

std::string ReportWriter::summary_json(const RunReport& report) const {
    return build_summary(report).dump(2);
}

void ReportWriter::write_summary(const std::filesystem::path& destination, const RunReport& report) const {
    write_file(destination, summary_json(report));
}

void ReportWriter::write_detailed(const std::filesystem::path& destination, const RunReport& report) const {
    const auto html = render_html(report);
    write_file(destination, html);
}

void ReportWriter::print_console(std::ostream& out, const RunReport& report) const {
    if (report.tree) {
        const auto& tree = *report.tree;
        out << "\n";
        print_counts(out, tree.differing.total, "file(s) differ between paths:", tree.differing);
        print_counts(out, tree.reference_only.total, "orphaned file(s) found:", tree.reference_only);
        print_counts(out, tree.candidate_only.total, "newly generated file(s) found:", tree.candidate_only);
        out << "\n";
        if (tree.differing.total == 0) {
            out << "Regression PASSED! All files identical\n";
        } else if (tree.loosely_passed()) {
            out << "Regression LOOSELY PASSED! Only log files differ\n";
        }
    }

    out << "\n" << report.passed << "/" << report.total() << " tests passed\n"
        << "  PASS: " << report.passed << "  FAIL: " << report.failed << "  ERROR: " << report.errored << "\n";

    for (const auto& result : report.results) {
        if (result.verdict == CaseVerdict::Pass) {
            continue;
        }
        out << "  [" << to_string(result.verdict) << "] " << result.case_id;
        if (result.outcome && !result.outcome->succeeded()) {
            out << " (" << to_string(result.outcome->status) << ")";
        }
        std::size_t differing = 0;
        for (const auto& diff : result.diffs) {
            if (!diff.identical()) {
                ++differing;
            }
        }
        if (differing > 0) {
            out << ": " << differing << " artifact(s) differ";
        }
        if (!result.issues.empty()) {
            out << ": " << result.issues.front().path.generic_string() << ": " << result.issues.front().message;
        }
        out << "\n";
    }

    if (report.cancelled) {
        out << "Run cancelled: report is partial\n";
    }
    out << "Total time taken: " << format_duration(report.duration) << "\n";
}

}  // namespace calregress
