#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/ScanProgress.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/scan/ScanSession.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>
#include <filesystem>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace devsweep::app {

class Application {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_INVALID_CONFIG = 1;
    static constexpr int EXIT_SCAN_FAILED = 2;

    Application(int& argc, char** argv);
    ~Application();

    int run();

    infra::ConfigManager& config() { return *config_; }

    /**
     * @brief Process exit code for a finished sweep.
     */
    static int exitCodeFor(core::ScanState state);

private:
    void setupOptions();
    void initializeLogging(const std::filesystem::path& configDir);
    bool applyOptions(infra::AppConfig& config) const;
    void printProfiles() const;
    void reportResult(const core::ProbeResult& result) const;
    void onTick();
    void exportResults() const;

    std::unique_ptr<QCoreApplication> qtApp_;
    QCommandLineParser parser_;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> consoleSink_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::ScanSession> session_;
    std::unique_ptr<QTimer> progressTimer_;
    bool exportEnabled_{true};
};

} // namespace devsweep::app
