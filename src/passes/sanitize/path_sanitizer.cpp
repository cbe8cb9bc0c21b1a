/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * path_sanitizer.cpp - OS path normalization
 *
 * linux/mac:  \ -> /, collapse //, drop any C: prefix
 * windows:    / -> \, collapse \\, add/keep/drop the drive prefix
 *             depending on whether a drive letter was configured
 */

#include "path_sanitizer.hpp"
#include "../../common/errors.hpp"

#include <algorithm>
#include <cctype>

namespace lfichef {
namespace sanitize {

char validateDriveLetter(const std::string& letter) {
    if (letter.size() != 1 || !std::isalpha(static_cast<unsigned char>(letter[0]))) {
        throw LfiChefError(ErrorKind::InvalidDriveLetter,
                           "Specified Windows drive letter \"" + letter +
                           "\" is not of proper format (expected a single letter A-Z)");
    }
    return letter[0];
}

bool hasDrivePrefix(const std::string& path) {
    return path.size() >= 2 &&
           std::isalpha(static_cast<unsigned char>(path[0])) &&
           path[1] == ':';
}

std::string PathSanitizer::trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n\v\f");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n\v\f");
    return s.substr(begin, end - begin + 1);
}

std::string PathSanitizer::normalizeSeparators(const std::string& path, char from, char to) {
    std::string result;
    result.reserve(path.size());

    for (char c : path) {
        char out = (c == from) ? to : c;
        if (out == to && !result.empty() && result.back() == to) {
            continue;
        }
        result += out;
    }

    return result;
}

std::string PathSanitizer::sanitize(const std::string& raw) const {
    std::string result = sanitize(raw, config_.os, config_.drive, config_.lowercase_windows);
    logger_.trace("'{}' -> '{}'", raw, result);
    return result;
}

std::string PathSanitizer::sanitize(const std::string& raw,
                                    TargetOS os,
                                    std::optional<char> drive,
                                    bool lowercase_windows) {
    std::string path = trim(raw);
    if (path.empty()) {
        return path;
    }

    if (os != TargetOS::Windows) {
        path = normalizeSeparators(path, '\\', '/');
        while (hasDrivePrefix(path)) {
            path.erase(0, 2);
        }
        return path;
    }

    if (lowercase_windows) {
        std::transform(path.begin(), path.end(), path.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (drive) {
            drive = static_cast<char>(std::tolower(static_cast<unsigned char>(*drive)));
        }
    }

    path = normalizeSeparators(path, '/', '\\');

    if (drive) {
        // an existing drive wins, even a different one
        if (!hasDrivePrefix(path)) {
            path = std::string{*drive, ':'} + path;
        }
    } else {
        while (hasDrivePrefix(path)) {
            path.erase(0, 2);
        }
    }

    return path;
}

} // namespace sanitize
} // namespace lfichef
