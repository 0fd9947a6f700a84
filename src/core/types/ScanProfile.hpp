/**
 * @file ScanProfile.hpp
 * @brief Named presets bundling a thread count and a timeout.
 */

#pragma once

#include "core/types/ValidationError.hpp"

#include <array>
#include <optional>
#include <string>
#include <variant>

namespace devsweep::core {

/**
 * @brief The closed set of scan profiles, fastest first.
 */
enum class ScanProfile : int {
    Lightning = 0,
    Quick = 1,
    Balanced = 2,
    Deep = 3,
    Paranoid = 4
};

/**
 * @brief Thread count and timeout a profile stands for.
 */
struct ProfileSettings {
    int threads{0};
    double timeoutSeconds{0.0};

    bool operator==(const ProfileSettings& other) const = default;
};

/**
 * @brief Maps profile names to their fixed settings.
 *
 * Resolved values are not trusted blindly: the validator still applies the
 * thread and timeout bounds to them.
 */
class ProfileResolver {
public:
    /**
     * @brief Returns all profiles in table order.
     */
    static const std::array<ScanProfile, 5>& allProfiles();

    /**
     * @brief Returns the settings of a profile.
     */
    static ProfileSettings settings(ScanProfile profile);

    static std::string toString(ScanProfile profile);

    /**
     * @brief Parses a profile name, ignoring case.
     * @param name Profile name (e.g., "balanced" or "Balanced").
     * @return The profile, or nullopt if the name is not in the table.
     */
    static std::optional<ScanProfile> fromString(const std::string& name);

    /**
     * @brief Resolves a profile name to its settings.
     * @param name Profile name.
     * @return Settings, or a ValidationError of kind UnknownProfile.
     */
    static std::variant<ProfileSettings, ValidationError> resolve(const std::string& name);
};

} // namespace devsweep::core
