/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * null_byte_injector.cpp - Null byte injection variants
 */

#include "null_byte_injector.hpp"
#include "../../common/errors.hpp"

namespace lfichef {
namespace nullbyte {

NullByteMode parseNullByteMode(const std::string& input) {
    if (input == "p" || input == "prepend") return NullByteMode::Prepend;
    if (input == "a" || input == "append") return NullByteMode::Append;
    if (input == "b" || input == "both") return NullByteMode::Both;
    if (input == "n" || input == "none" || input.empty()) return NullByteMode::None;

    throw LfiChefError(ErrorKind::InvalidNullByteMode,
                       "Unknown null byte mode \"" + input +
                       "\" (available: p/prepend, a/append, b/both)");
}

void NullByteInjector::configure(NullByteMode mode, const std::string& sequence) {
    if (sequence.empty()) {
        throw LfiChefError(ErrorKind::InvalidConfig, "Null byte sequence must not be empty");
    }
    mode_ = mode;
    sequence_ = sequence;
    logger_.debug("mode {} with '{}'", nullByteModeToString(mode_), sequence_);
}

VariantList NullByteInjector::inject(const std::string& path) const {
    switch (mode_) {
        case NullByteMode::Prepend:
            return {sequence_ + path};
        case NullByteMode::Append:
            return {path + sequence_};
        case NullByteMode::Both:
            return {sequence_ + path, path + sequence_};
        case NullByteMode::None:
        default:
            return {path};
    }
}

VariantList NullByteInjector::mutate(const std::string& payload) {
    if (!isActive()) {
        return {};
    }

    VariantList variants = inject(payload);
    incrementStat("payloads_in");
    incrementStat("variants", static_cast<long long>(variants.size()));
    return variants;
}

} // namespace nullbyte
} // namespace lfichef
