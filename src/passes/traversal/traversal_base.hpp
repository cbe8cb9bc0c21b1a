/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * traversal_base.hpp - Traversal token pairs, depth ranges and their parsers
 *
 * A traversal unit is traversal-token + separator-token, e.g. ".." + "/".
 * The expander repeats the unit once per depth in front of the path.
 */

#ifndef LFICHEF_TRAVERSAL_BASE_HPP
#define LFICHEF_TRAVERSAL_BASE_HPP

#include "../../core/mutation_base.hpp"

#include <string>
#include <vector>

namespace lfichef {
namespace traversal {

struct TraversalToken {
    std::string traversal;   // "..", "....", "%2e%2e"
    std::string separator;   // "/", "//", "\\"

    TraversalToken() = default;
    TraversalToken(const std::string& t, const std::string& s)
        : traversal(t), separator(s) {}

    std::string unit() const { return traversal + separator; }

    bool operator==(const TraversalToken& other) const {
        return traversal == other.traversal && separator == other.separator;
    }
};

// deepest traversal accepted; a range emits (high - low + 1) variants
// per token pair for every payload
constexpr int kMaxTraversalDepth = 256;

/**
 * Inclusive depth range
 */
struct TraversalRange {
    int low = 0;
    int high = 0;

    size_t depthCount() const {
        if (high < low) return 0;
        return static_cast<size_t>(static_cast<long long>(high) - low + 1);
    }
};

struct TraversalSpec {
    TraversalRange range;
    std::vector<TraversalToken> tokens;
};

/**
 * Parse "N" (single depth) or "low:high" (inclusive range)
 *
 * @throws LfiChefError(InvalidTraversalDepth) for non-numeric or negative
 *         depths, or depths above kMaxTraversalDepth
 * @throws LfiChefError(InvalidRangeOrder) when low > high
 */
TraversalRange parseTraversalRange(const std::string& input);

/**
 * Parse a comma separated "traversal:separator" list, split on the
 * first colon of each entry. Blank entries are skipped.
 *
 * @throws LfiChefError(InvalidTraversalFormat)
 */
std::vector<TraversalToken> parseTraversalTokens(const std::string& input);

/**
 * Default pairs for an OS:
 *   linux/mac  ../      ....//
 *   windows    ..\      ....\\
 */
std::vector<TraversalToken> defaultTraversalTokens(TargetOS os);

} // namespace traversal
} // namespace lfichef

#endif // LFICHEF_TRAVERSAL_BASE_HPP
