#pragma once

#include "case_discoverer.hpp"
#include "comparator.hpp"
#include "dispatcher.hpp"
#include "selector.hpp"
#include "test_case.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace calregress {

/// Malformed config file or option value.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Every tunable of a harness run.
 *
 * Holds built-in defaults until a ConfigLoader or the CLI overrides them.
 */
struct HarnessConfig {
    std::size_t threads{0};  ///< zero: hardware concurrency
    std::chrono::seconds timeout{3600};
    std::chrono::seconds grace{2};
    std::size_t max_depth{32};
    std::string primary_suffix{"raw.fits"};
    CommandTable commands{CommandTable::defaults()};

    bool cte_only{false};
    std::string cte_keyword{"PCTECORR"};
    std::string cte_value{"PERFORM"};
    std::string cte_executable{"wf3cte.e"};
    std::vector<std::string> cte_instruments{"WFC3", "ACS"};

    Selector select{};
    CompareOptions compare{{}, {"DATE"}};
    std::vector<std::string> suffixes{".fits"};
    bool probe_versions{true};

    /// Worker count with zero resolved to the hardware concurrency (at least 1).
    [[nodiscard]] std::size_t effective_threads() const noexcept;

    /// Discovery settings; in CTE-only mode the CTE selector and executable apply.
    [[nodiscard]] DiscoveryOptions discovery_options() const;

    [[nodiscard]] DispatchOptions dispatch_options() const;
};

/**
 * \brief Loads harness settings from a line-oriented config file.
 *
 * Entries take the form `key=value` with leading/trailing whitespace
 * ignored; lines starting with `#` and empty lines are skipped.
 *
 * Recognised keys:
 *   - `threads`, `timeout`, `grace`, `max_depth`: integers (seconds for the durations).
 *   - `primary_suffix`: file name suffix of primary inputs.
 *   - `command.keyword`, `command.args`, `command.map.<VALUE>`: executable resolution.
 *   - `cte.keyword`, `cte.value`, `cte.executable`, `cte.instruments`: CTE-only mode.
 *   - `select`: selector expression, e.g. `DETECTOR=UVIS and PCTECORR=PERFORM`.
 *   - `compare.atol`, `compare.rtol`, `compare.ignore_keywords`, `compare.suffixes`.
 *   - `probe_versions`: boolean (`true/false`, `yes/no`, `1/0`).
 *
 * Example:
 * \code{.txt}
 * threads=8
 * timeout=600
 * command.map.COS=calcos.e
 * compare.ignore_keywords=DATE,IRAF-TLM
 * \endcode
 *
 * Unknown keys are rejected.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /// Defaults overlaid with `file`.
    [[nodiscard]] HarnessConfig load(const std::filesystem::path& file) const;

    /// Overlays `file` onto `config`. Throws ConfigError.
    void apply_file(HarnessConfig& config, const std::filesystem::path& file) const;

    /// Applies one setting. `where` names its origin in error messages.
    void apply(HarnessConfig& config, const std::string& key, const std::string& value,
               const std::string& where) const;
};

}  // namespace calregress
