/*
 * path_sanitizer.hpp
 *
 * normalizes a raw wordlist line into the canonical path form of one
 * target OS: separator direction, collapsed separators, drive prefix.
 * runs on every line in both modes.
 */

#ifndef LFICHEF_PATH_SANITIZER_HPP
#define LFICHEF_PATH_SANITIZER_HPP

#include "../../core/mutation_base.hpp"
#include "../../common/logging.hpp"

#include <optional>
#include <string>

namespace lfichef {
namespace sanitize {

struct SanitizeConfig {
    TargetOS os = TargetOS::Linux;
    std::optional<char> drive;       // windows only, validated letter
    bool lowercase_windows = false;  // windows paths are case-insensitive
};

/**
 * Check a user supplied drive letter, returns it as a char
 *
 * @throws LfiChefError(InvalidDriveLetter) unless it is one ASCII letter
 */
char validateDriveLetter(const std::string& letter);

/**
 * True if the path starts with <Letter>:
 */
bool hasDrivePrefix(const std::string& path);

class PathSanitizer {
public:
    PathSanitizer() : logger_("PathSanitizer") {}
    explicit PathSanitizer(const SanitizeConfig& config)
        : config_(config), logger_("PathSanitizer") {}

    void configure(const SanitizeConfig& config) {
        config_ = config;
    }

    const SanitizeConfig& getConfig() const { return config_; }

    /**
     * Sanitize with the configured OS and drive.
     * Returns an empty string for blank input.
     */
    std::string sanitize(const std::string& raw) const;

    static std::string sanitize(const std::string& raw,
                                TargetOS os,
                                std::optional<char> drive = std::nullopt,
                                bool lowercase_windows = false);

    static std::string trim(const std::string& s);

private:
    SanitizeConfig config_;
    Logger logger_;

    // replace `from` with `to` and collapse runs of `to`
    static std::string normalizeSeparators(const std::string& path, char from, char to);
};

} // namespace sanitize
} // namespace lfichef

#endif // LFICHEF_PATH_SANITIZER_HPP
