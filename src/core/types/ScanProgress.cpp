#include "core/types/ScanProgress.hpp"

namespace devsweep::core {

std::string scanStateToString(ScanState state) {
    switch (state) {
    case ScanState::Idle:
        return "Idle";
    case ScanState::Running:
        return "Running";
    case ScanState::Completed:
        return "Completed";
    case ScanState::Cancelled:
        return "Cancelled";
    case ScanState::Failed:
        return "Failed";
    }
    return "Idle";
}

} // namespace devsweep::core
