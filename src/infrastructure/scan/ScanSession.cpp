#include "infrastructure/scan/ScanSession.hpp"

#include "infrastructure/network/PingService.hpp"
#include "infrastructure/network/ProbeExecutor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace devsweep::infra {

namespace {

std::shared_ptr<core::IProbeExecutor> requireExecutor(std::shared_ptr<core::IProbeExecutor> executor) {
    if (!executor) {
        throw std::invalid_argument("ScanSession requires a probe executor");
    }
    return executor;
}

} // namespace

ScanSession::ScanSession(core::ValidatedConfig config)
    : config_(std::move(config)), pingService_(std::make_unique<PingService>()),
      executor_(std::make_shared<ProbeExecutor>(*pingService_)),
      aggregator_(config_.totalTargets(), config_.ports),
      scheduler_(*executor_, aggregator_, token_) {}

ScanSession::ScanSession(core::ValidatedConfig config,
                         std::shared_ptr<core::IProbeExecutor> executor)
    : config_(std::move(config)), executor_(requireExecutor(std::move(executor))),
      aggregator_(config_.totalTargets(), config_.ports),
      scheduler_(*executor_, aggregator_, token_) {}

ScanSession::~ScanSession() {
    if (!scheduler_.isDone() && scheduler_.state() != core::ScanState::Idle) {
        spdlog::debug("Session destroyed while running, cancelling");
    }
    cancel();
    scheduler_.wait();
}

void ScanSession::start(ResultCallback onResult, ProgressCallback onProgress) {
    if (scheduler_.state() != core::ScanState::Idle) {
        throw std::logic_error("ScanSession can only be started once");
    }
    aggregator_.setResultCallback(std::move(onResult));
    aggregator_.setProgressCallback(std::move(onProgress));
    scheduler_.start(config_);
}

void ScanSession::cancel() {
    if (!token_.isCancelled() && !scheduler_.isDone()) {
        spdlog::info("Cancelling scan");
    }
    token_.cancel();
}

std::unique_ptr<ScanSession> startScan(const core::ValidatedConfig& config,
                                       ScanSession::ResultCallback onResult,
                                       ScanSession::ProgressCallback onProgress) {
    auto session = std::make_unique<ScanSession>(config);
    session->start(std::move(onResult), std::move(onProgress));
    return session;
}

} // namespace devsweep::infra
