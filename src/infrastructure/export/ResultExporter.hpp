#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/ScanProgress.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace devsweep::infra {

/**
 * @brief Writes sweep results as JSON and CSV reports.
 *
 * The caller chooses which results to export (typically only open ones).
 */
class ResultExporter {
public:
    /**
     * @brief Builds the JSON report.
     * @param results Results to list under "devices".
     * @param progress Final progress of the sweep, used for "stats".
     * @param finishedAt Time reported in "stats.timestamp".
     * @return Indented JSON document.
     */
    static std::string exportToJson(const std::vector<core::ProbeResult>& results,
                                    const core::ScanProgress& progress,
                                    std::chrono::system_clock::time_point finishedAt);

    /**
     * @brief Builds the CSV report, one line per result after the header.
     */
    static std::string exportToCsv(const std::vector<core::ProbeResult>& results);

    /**
     * @brief Writes the JSON report to a file.
     * @return True if written successfully, false otherwise.
     */
    static bool writeJson(const std::filesystem::path& path,
                          const std::vector<core::ProbeResult>& results,
                          const core::ScanProgress& progress,
                          std::chrono::system_clock::time_point finishedAt);

    /**
     * @brief Writes the CSV report to a file.
     * @return True if written successfully, false otherwise.
     */
    static bool writeCsv(const std::filesystem::path& path,
                         const std::vector<core::ProbeResult>& results);

    /**
     * @brief Report file name for a sweep finished at the given time.
     * @param finishedAt Finish time, formatted in local time.
     * @param extension Extension without the dot ("json" or "csv").
     * @return e.g. "scan_result_20240131_142500.json".
     */
    static std::string defaultFileName(std::chrono::system_clock::time_point finishedAt,
                                       const std::string& extension);

    /**
     * @brief Quotes a CSV field if it contains a comma, quote or line break.
     */
    static std::string escapeCsv(const std::string& field);

private:
    static bool writeFile(const std::filesystem::path& path, const std::string& content);
};

} // namespace devsweep::infra
