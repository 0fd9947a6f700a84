#include "core/types/ValidationError.hpp"

namespace devsweep::core {

std::string ValidationError::kindToString(ValidationErrorKind kind) {
    switch (kind) {
    case ValidationErrorKind::InvalidIP:
        return "InvalidIP";
    case ValidationErrorKind::InvalidRange:
        return "InvalidRange";
    case ValidationErrorKind::InvalidPort:
        return "InvalidPort";
    case ValidationErrorKind::InvalidPortSpec:
        return "InvalidPortSpec";
    case ValidationErrorKind::InvalidThreadCount:
        return "InvalidThreadCount";
    case ValidationErrorKind::InvalidTimeout:
        return "InvalidTimeout";
    case ValidationErrorKind::UnknownProfile:
        return "UnknownProfile";
    }
    return "InvalidIP";
}

} // namespace devsweep::core
