#include "infrastructure/export/ResultExporter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <sstream>

namespace devsweep::infra {

namespace {

std::string timePointToString(const std::chrono::system_clock::time_point& tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

nlohmann::json resultToJson(const core::ProbeResult& result) {
    nlohmann::json j;
    j["ip"] = result.target.ip();
    j["port"] = result.target.port;
    j["device_type"] = result.deviceTypeToString();
    j["open"] = result.open;
    j["elapsed_ms"] = result.elapsedMs();
    if (result.banner) {
        j["banner"] = *result.banner;
    }
    if (result.error) {
        j["error"] = core::ProbeResult::errorToString(*result.error);
    }
    return j;
}

} // namespace

std::string ResultExporter::exportToJson(const std::vector<core::ProbeResult>& results,
                                         const core::ScanProgress& progress,
                                         std::chrono::system_clock::time_point finishedAt) {
    nlohmann::json j;

    j["devices"] = nlohmann::json::array();
    for (const auto& r : results) {
        j["devices"].push_back(resultToJson(r));
    }

    j["stats"]["found"] = progress.openTargets;
    j["stats"]["scanned"] = progress.scannedTargets;
    j["stats"]["total"] = progress.totalTargets;
    j["stats"]["time"] = static_cast<double>(progress.elapsed.count()) / 1000.0;
    j["stats"]["timestamp"] = timePointToString(finishedAt);

    return j.dump(2);
}

std::string ResultExporter::exportToCsv(const std::vector<core::ProbeResult>& results) {
    std::ostringstream oss;
    oss << "ip,port,device_type,open,elapsed_ms,banner\n";

    for (const auto& r : results) {
        oss << r.target.ip() << "," << r.target.port << "," << r.deviceTypeToString() << ","
            << (r.open ? "true" : "false") << "," << r.elapsedMs() << ",";
        if (r.banner) {
            oss << escapeCsv(*r.banner);
        }
        oss << "\n";
    }

    return oss.str();
}

bool ResultExporter::writeJson(const std::filesystem::path& path,
                               const std::vector<core::ProbeResult>& results,
                               const core::ScanProgress& progress,
                               std::chrono::system_clock::time_point finishedAt) {
    try {
        if (!writeFile(path, exportToJson(results, progress, finishedAt))) {
            return false;
        }
        spdlog::info("Exported {} results to {}", results.size(), path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("JSON export failed: {}", e.what());
        return false;
    }
}

bool ResultExporter::writeCsv(const std::filesystem::path& path,
                              const std::vector<core::ProbeResult>& results) {
    try {
        if (!writeFile(path, exportToCsv(results))) {
            return false;
        }
        spdlog::info("Exported {} results to {}", results.size(), path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("CSV export failed: {}", e.what());
        return false;
    }
}

std::string ResultExporter::defaultFileName(std::chrono::system_clock::time_point finishedAt,
                                            const std::string& extension) {
    auto time = std::chrono::system_clock::to_time_t(finishedAt);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return "scan_result_" + std::string(buffer) + "." + extension;
}

std::string ResultExporter::escapeCsv(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

bool ResultExporter::writeFile(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        spdlog::error("Failed to open export file for writing: {}", path.string());
        return false;
    }

    file << content;
    if (!file) {
        spdlog::error("Failed to write export file: {}", path.string());
        return false;
    }
    return true;
}

} // namespace devsweep::infra
