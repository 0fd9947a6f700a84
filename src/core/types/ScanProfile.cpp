#include "core/types/ScanProfile.hpp"

#include <algorithm>
#include <cctype>

namespace devsweep::core {

namespace {

struct ProfileEntry {
    ScanProfile profile;
    const char* name;
    ProfileSettings settings;
};

constexpr std::array<ProfileEntry, 5> PROFILE_TABLE{{
    {ScanProfile::Lightning, "Lightning", {200, 0.5}},
    {ScanProfile::Quick, "Quick", {100, 1.0}},
    {ScanProfile::Balanced, "Balanced", {50, 2.0}},
    {ScanProfile::Deep, "Deep", {30, 3.0}},
    {ScanProfile::Paranoid, "Paranoid", {10, 5.0}},
}};

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

const std::array<ScanProfile, 5>& ProfileResolver::allProfiles() {
    static const std::array<ScanProfile, 5> profiles = {ScanProfile::Lightning, ScanProfile::Quick,
                                                        ScanProfile::Balanced, ScanProfile::Deep,
                                                        ScanProfile::Paranoid};
    return profiles;
}

ProfileSettings ProfileResolver::settings(ScanProfile profile) {
    return PROFILE_TABLE[static_cast<size_t>(profile)].settings;
}

std::string ProfileResolver::toString(ScanProfile profile) {
    return PROFILE_TABLE[static_cast<size_t>(profile)].name;
}

std::optional<ScanProfile> ProfileResolver::fromString(const std::string& name) {
    auto lowered = toLower(name);
    for (const auto& entry : PROFILE_TABLE) {
        if (toLower(entry.name) == lowered) {
            return entry.profile;
        }
    }
    return std::nullopt;
}

std::variant<ProfileSettings, ValidationError> ProfileResolver::resolve(const std::string& name) {
    auto profile = fromString(name);
    if (!profile) {
        return ValidationError{ValidationErrorKind::UnknownProfile,
                               "Unknown scan profile: '" + name + "'"};
    }
    return settings(*profile);
}

} // namespace devsweep::core
