/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * traversal_expander.cpp - Traversal range/token parsing and expansion
 */

#include "traversal_expander.hpp"
#include "../../common/errors.hpp"

#include <cctype>
#include <sstream>

namespace lfichef {
namespace traversal {

namespace {

std::string trimCopy(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

int parseDepth(const std::string& text, const std::string& whole) {
    std::string value = trimCopy(text);
    bool digits = !value.empty();
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            digits = false;
            break;
        }
    }

    if (!digits) {
        throw LfiChefError(ErrorKind::InvalidTraversalDepth,
                           "Improper traversal input \"" + whole +
                           "\", depths must be non-negative integers (N or low:high)");
    }

    size_t first = value.find_first_not_of('0');
    value = first == std::string::npos ? "0" : value.substr(first);

    // more than three digits is past the cap and may overflow stoi
    if (value.size() > 3 || std::stoi(value) > kMaxTraversalDepth) {
        throw LfiChefError(ErrorKind::InvalidTraversalDepth,
                           "Traversal depth \"" + value + "\" is out of range (maximum " +
                           std::to_string(kMaxTraversalDepth) + ")");
    }

    return std::stoi(value);
}

} // namespace

TraversalRange parseTraversalRange(const std::string& input) {
    TraversalRange range;

    size_t colon = input.find(':');
    if (colon == std::string::npos) {
        range.low = range.high = parseDepth(input, input);
        return range;
    }

    range.low = parseDepth(input.substr(0, colon), input);
    range.high = parseDepth(input.substr(colon + 1), input);

    if (range.low > range.high) {
        throw LfiChefError(ErrorKind::InvalidRangeOrder,
                           "Improper traversal range \"" + input +
                           "\", range start is greater than its end");
    }

    return range;
}

std::vector<TraversalToken> parseTraversalTokens(const std::string& input) {
    std::vector<TraversalToken> tokens;
    std::stringstream ss(input);
    std::string entry;

    while (std::getline(ss, entry, ',')) {
        entry = trimCopy(entry);
        if (entry.empty()) {
            continue;
        }

        size_t colon = entry.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
            throw LfiChefError(ErrorKind::InvalidTraversalFormat,
                               "Malformed traversal token \"" + entry +
                               "\", expected traversal:separator (e.g. ../:/ or ..:\\)");
        }

        TraversalToken token(entry.substr(0, colon), entry.substr(colon + 1));
        bool duplicate = false;
        for (const auto& t : tokens) {
            if (t == token) { duplicate = true; break; }
        }
        if (!duplicate) {
            tokens.push_back(token);
        }
    }

    if (tokens.empty()) {
        throw LfiChefError(ErrorKind::InvalidTraversalFormat,
                           "Traversal token list \"" + input + "\" contains no entries");
    }

    return tokens;
}

std::vector<TraversalToken> defaultTraversalTokens(TargetOS os) {
    if (os == TargetOS::Windows) {
        return {
            TraversalToken("..", "\\"),
            TraversalToken("....", "\\\\")
        };
    }
    return {
        TraversalToken("..", "/"),
        TraversalToken("....", "//")
    };
}

void TraversalExpander::configure(TargetOS os, std::optional<TraversalSpec> spec) {
    os_ = os;
    spec_ = std::move(spec);

    if (spec_) {
        const auto& range = spec_->range;
        if (range.low < 0 || range.high > kMaxTraversalDepth) {
            throw LfiChefError(ErrorKind::InvalidTraversalDepth,
                               "Traversal depths " + std::to_string(range.low) + ":" +
                               std::to_string(range.high) + " outside 0:" +
                               std::to_string(kMaxTraversalDepth));
        }
        if (range.low > range.high) {
            throw LfiChefError(ErrorKind::InvalidRangeOrder,
                               "Traversal range start " + std::to_string(range.low) +
                               " is greater than its end " + std::to_string(range.high));
        }
    }

    if (spec_ && spec_->tokens.empty()) {
        spec_->tokens = defaultTraversalTokens(os_);
    }

    if (spec_) {
        logger_.debug("depths {}..{} with {} token pair(s)",
                      spec_->range.low, spec_->range.high, spec_->tokens.size());
    }
}

std::string TraversalExpander::buildPrefix(const TraversalToken& token, int depth) {
    std::string unit = token.unit();
    std::string prefix;
    prefix.reserve(unit.size() * static_cast<size_t>(depth > 0 ? depth : 0));
    for (int i = 0; i < depth; i++) {
        prefix += unit;
    }
    return prefix;
}

std::string TraversalExpander::join(const std::string& prefix,
                                    const TraversalToken& token,
                                    const std::string& path) const {
    const char sep = osSeparator(os_);

    std::string result = prefix;
    for (char c : path) {
        if (c == sep) {
            result += token.separator;
        } else {
            result += c;
        }
    }
    return result;
}

VariantList TraversalExpander::expand(const std::string& path) const {
    VariantList variants;
    if (!spec_) {
        return variants;
    }

    const auto& range = spec_->range;
    variants.reserve(range.depthCount() * spec_->tokens.size());

    for (int depth = range.low; depth <= range.high; depth++) {
        for (const auto& token : spec_->tokens) {
            if (depth == 0) {
                variants.push_back(path);
                continue;
            }
            variants.push_back(join(buildPrefix(token, depth), token, path));
        }
    }

    return variants;
}

VariantList TraversalExpander::mutate(const std::string& payload) {
    VariantList variants = expand(payload);
    incrementStat("payloads_in");
    incrementStat("variants", static_cast<long long>(variants.size()));
    return variants;
}

} // namespace traversal
} // namespace lfichef
