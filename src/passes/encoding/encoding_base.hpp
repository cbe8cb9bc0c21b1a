/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * encoding_base.hpp - Encoding techniques and the parsed technique set
 *
 * Techniques (option letter in brackets):
 *   - URL encoding           [u]  /  -> %2f
 *   - Double URL encoding    [d]  /  -> %252f
 *   - 16-bit unicode         [b]  /  -> %u002f
 *   - Overlong UTF-8         [o]  /  -> %c0%af
 *
 * With alternate forms enabled, b and o also emit their other renderings:
 *   b  lookalike              /  -> %u2215   \ -> %u2216
 *   o  three byte overlong    /  -> %e0%80%af
 *   o  invalid continuation   /  -> %c0%2f   .  -> %c0%2e
 */

#ifndef LFICHEF_ENCODING_BASE_HPP
#define LFICHEF_ENCODING_BASE_HPP

#include "../../core/mutation_base.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lfichef {
namespace encoding {

enum class Encoding {
    Url,
    DoubleUrl,
    Unicode16,
    OverlongUtf8
};

inline char encodingToToken(Encoding e) {
    switch (e) {
        case Encoding::Url:          return 'u';
        case Encoding::DoubleUrl:    return 'd';
        case Encoding::Unicode16:    return 'b';
        case Encoding::OverlongUtf8: return 'o';
        default: return '?';
    }
}

inline const char* encodingToString(Encoding e) {
    switch (e) {
        case Encoding::Url:          return "url";
        case Encoding::DoubleUrl:    return "double-url";
        case Encoding::Unicode16:    return "unicode16";
        case Encoding::OverlongUtf8: return "overlong-utf8";
        default: return "unknown";
    }
}

/**
 * Number of renderings a technique has when alternate forms are enabled.
 * Form 0 is always the standard one.
 */
inline int encodingFormCount(Encoding e) {
    switch (e) {
        case Encoding::Unicode16:    return 2;
        case Encoding::OverlongUtf8: return 3;
        default: return 1;
    }
}

inline const char* encodingFormToString(Encoding e, int form) {
    if (form == 0) return "standard";
    switch (e) {
        case Encoding::Unicode16:
            return "lookalike";
        case Encoding::OverlongUtf8:
            return form == 1 ? "three-byte" : "invalid-continuation";
        default:
            return "unknown";
    }
}

/**
 * Which characters a technique rewrites
 */
enum class EncodeScope {
    Special,   // separators, dots, and ':' on windows
    All        // every byte
};

inline std::optional<EncodeScope> parseEncodeScope(const std::string& name) {
    if (name == "special") return EncodeScope::Special;
    if (name == "all") return EncodeScope::All;
    return std::nullopt;
}

/**
 * Selected techniques in the order they were given on the command line
 */
struct EncodingSet {
    std::vector<Encoding> techniques;

    bool empty() const { return techniques.empty(); }
    size_t size() const { return techniques.size(); }

    bool contains(Encoding e) const {
        for (auto t : techniques) {
            if (t == e) return true;
        }
        return false;
    }

    // back to option letters, e.g. "ud"
    std::string toString() const {
        std::string s;
        for (auto t : techniques) {
            s += encodingToToken(t);
        }
        return s;
    }
};

/**
 * Parse an option string such as "udbo" or "ou". Repeated letters
 * are ignored, first occurrence fixes the order.
 *
 * @throws LfiChefError(UnknownEncodingToken)
 */
EncodingSet parseEncodingSet(const std::string& input);

} // namespace encoding
} // namespace lfichef

#endif // LFICHEF_ENCODING_BASE_HPP
