#include "app/Application.hpp"

#include "core/scan/ConfigValidator.hpp"
#include "core/types/ScanProfile.hpp"
#include "infrastructure/export/ResultExporter.hpp"

#include <QStandardPaths>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>

namespace devsweep::app {

namespace {

std::atomic<bool> interruptRequested{false};

void handleInterrupt(int) {
    interruptRequested.store(true);
}

constexpr int PROGRESS_INTERVAL_MS = 1000;

} // namespace

Application::Application(int& argc, char** argv) {
    qtApp_ = std::make_unique<QCoreApplication>(argc, argv);
    qtApp_->setApplicationName("DevSweep");
    qtApp_->setApplicationVersion("1.0.0");
    qtApp_->setOrganizationName("DevSweep");

    setupOptions();
    parser_.process(*qtApp_);

    std::filesystem::path configDir =
        parser_.isSet("config-dir")
            ? parser_.value("config-dir").toStdString()
            : QStandardPaths::writableLocation(QStandardPaths::AppDataLocation).toStdString();

    initializeLogging(configDir);

    config_ = std::make_unique<infra::ConfigManager>(configDir);
    config_->load();

    auto level = spdlog::level::from_str(config_->config().logLevel);
    if (level == spdlog::level::off && config_->config().logLevel != "off") {
        spdlog::warn("Unknown log level '{}', using info", config_->config().logLevel);
        level = spdlog::level::info;
    }
    consoleSink_->set_level(parser_.isSet("verbose") ? spdlog::level::debug : level);
}

Application::~Application() {
    // Drains in-flight probes before the logger goes away
    session_.reset();
    spdlog::info("Application shutting down...");
}

void Application::setupOptions() {
    parser_.setApplicationDescription(
        "Sweeps an IPv4 range for ADB, SSH and Telnet services on selected TCP ports.");
    parser_.addHelpOption();
    parser_.addVersionOption();

    parser_.addOptions({
        {{"s", "start"}, "First address of the range.", "ip"},
        {{"e", "end"}, "Last address of the range.", "ip"},
        {{"p", "ports"}, "Ports: \"p\", \"a-b\" or a comma list of both.", "spec"},
        {{"t", "threads"}, "Concurrent probes (1-200).", "count"},
        {"timeout", "Per-step timeout in seconds (0.1-10).", "seconds"},
        {"profile", "Preset: lightning, quick, balanced, deep or paranoid.", "name"},
        {"no-adb", "Do not attempt ADB handshakes."},
        {"no-ssh", "Do not classify SSH banners."},
        {"no-telnet", "Do not classify Telnet."},
        {"skip-ping", "Connect without a reachability check first."},
        {"max-targets", "Refuse sweeps larger than this many targets.", "count"},
        {"export-dir", "Directory for the JSON and CSV reports.", "dir"},
        {"no-export", "Do not write reports."},
        {"export-all", "Include closed and failed targets in reports."},
        {"config-dir", "Directory holding config.json and the log file.", "dir"},
        {"save-config", "Store the effective settings as the new defaults."},
        {"list-profiles", "Print the scan profiles and exit."},
        {{"v", "verbose"}, "Log per-target outcomes."},
    });
}

void Application::initializeLogging(const std::filesystem::path& configDir) {
    std::filesystem::create_directories(configDir);

    auto logPath = configDir / "devsweep.log";

    consoleSink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink_->set_level(spdlog::level::info);

    auto fileSink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logPath.string(), 5 * 1024 * 1024, 3);
    fileSink->set_level(spdlog::level::debug);

    auto logger =
        std::make_shared<spdlog::logger>("devsweep", spdlog::sinks_init_list{consoleSink_, fileSink});
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    spdlog::info("DevSweep {} starting...", qtApp_->applicationVersion().toStdString());
    spdlog::debug("Log file: {}", logPath.string());
}

bool Application::applyOptions(infra::AppConfig& config) const {
    auto& scan = config.scan;

    if (parser_.isSet("start")) {
        scan.startIp = parser_.value("start").toStdString();
    }
    if (parser_.isSet("end")) {
        scan.endIp = parser_.value("end").toStdString();
    }
    if (parser_.isSet("ports")) {
        scan.portSpec = parser_.value("ports").toStdString();
    }
    if (parser_.isSet("threads")) {
        bool ok = false;
        scan.threads = parser_.value("threads").toInt(&ok);
        if (!ok) {
            spdlog::error("Invalid thread count: {}", parser_.value("threads").toStdString());
            return false;
        }
    }
    if (parser_.isSet("timeout")) {
        bool ok = false;
        scan.timeoutSeconds = parser_.value("timeout").toDouble(&ok);
        if (!ok) {
            spdlog::error("Invalid timeout: {}", parser_.value("timeout").toStdString());
            return false;
        }
    }
    if (parser_.isSet("profile")) {
        scan.profile = parser_.value("profile").toStdString();
    }
    if (parser_.isSet("max-targets")) {
        bool ok = false;
        scan.maxTargets = parser_.value("max-targets").toULongLong(&ok);
        if (!ok) {
            spdlog::error("Invalid target limit: {}", parser_.value("max-targets").toStdString());
            return false;
        }
    }

    if (parser_.isSet("no-adb")) {
        scan.flags.scanAdb = false;
    }
    if (parser_.isSet("no-ssh")) {
        scan.flags.scanSsh = false;
    }
    if (parser_.isSet("no-telnet")) {
        scan.flags.scanTelnet = false;
    }
    if (parser_.isSet("skip-ping")) {
        scan.flags.skipPing = true;
    }

    if (parser_.isSet("export-dir")) {
        config.exportDirectory = parser_.value("export-dir").toStdString();
    }
    if (parser_.isSet("export-all")) {
        config.exportAll = true;
    }

    return true;
}

void Application::printProfiles() const {
    for (auto profile : core::ProfileResolver::allProfiles()) {
        auto settings = core::ProfileResolver::settings(profile);
        std::cout << core::ProfileResolver::toString(profile) << ": " << settings.threads
                  << " threads, " << settings.timeoutSeconds << "s timeout\n";
    }
}

void Application::reportResult(const core::ProbeResult& result) const {
    if (!result.open) {
        spdlog::debug("{} {}{}", result.target.toString(), result.deviceTypeToString(),
                      result.error ? " (" + core::ProbeResult::errorToString(*result.error) + ")"
                                   : std::string{});
        return;
    }

    spdlog::info("[FOUND] {} {}{}", result.target.toString(), result.deviceTypeToString(),
                 result.banner ? " \"" + *result.banner + "\"" : std::string{});
}

void Application::onTick() {
    if (interruptRequested.load()) {
        session_->cancel();
    }

    auto progress = session_->progress();
    spdlog::info("Progress: {}/{} ({:.1f}%), {} open", progress.scannedTargets,
                 progress.totalTargets, progress.percentComplete(), progress.openTargets);

    if (session_->isDone()) {
        progressTimer_->stop();
        qtApp_->quit();
    }
}

void Application::exportResults() const {
    const auto& config = config_->config();
    auto results = config.exportAll ? session_->results() : session_->openResults();
    auto progress = session_->progress();
    auto finishedAt = std::chrono::system_clock::now();
    std::filesystem::path dir = config.exportDirectory;

    if (config.exportJson) {
        infra::ResultExporter::writeJson(
            dir / infra::ResultExporter::defaultFileName(finishedAt, "json"), results, progress,
            finishedAt);
    }
    if (config.exportCsv) {
        infra::ResultExporter::writeCsv(
            dir / infra::ResultExporter::defaultFileName(finishedAt, "csv"), results);
    }
}

int Application::exitCodeFor(core::ScanState state) {
    return state == core::ScanState::Failed ? EXIT_SCAN_FAILED : EXIT_OK;
}

int Application::run() {
    if (parser_.isSet("list-profiles")) {
        printProfiles();
        return EXIT_OK;
    }

    auto& appConfig = config_->config();
    if (!applyOptions(appConfig)) {
        return EXIT_INVALID_CONFIG;
    }
    exportEnabled_ = !parser_.isSet("no-export");

    auto validation = core::ConfigValidator::validate(appConfig.scan);
    if (auto* error = std::get_if<core::ValidationError>(&validation)) {
        spdlog::error("Invalid configuration ({}): {}", error->kindToString(), error->message);
        return EXIT_INVALID_CONFIG;
    }

    if (parser_.isSet("save-config")) {
        config_->save();
    }

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    session_ = std::make_unique<infra::ScanSession>(std::get<core::ValidatedConfig>(validation));

    progressTimer_ = std::make_unique<QTimer>();
    progressTimer_->setInterval(PROGRESS_INTERVAL_MS);
    QObject::connect(progressTimer_.get(), &QTimer::timeout, [this]() { onTick(); });

    session_->start([this](const core::ProbeResult& result) { reportResult(result); });
    progressTimer_->start();

    qtApp_->exec();

    auto state = session_->state();
    auto progress = session_->progress();
    spdlog::info("Scan {}: {} of {} targets, {} open in {:.1f}s", core::scanStateToString(state),
                 progress.scannedTargets, progress.totalTargets, progress.openTargets,
                 static_cast<double>(progress.elapsed.count()) / 1000.0);

    if (exportEnabled_ && state != core::ScanState::Failed) {
        exportResults();
    }

    return exitCodeFor(state);
}

} // namespace devsweep::app
