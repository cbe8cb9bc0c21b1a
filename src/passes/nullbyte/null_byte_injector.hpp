/*
 * null_byte_injector.hpp - null byte placement
 *
 *   prepend  %00path
 *   append   path%00
 *   both     %00path, path%00   (two records, never one with both ends)
 */

#ifndef LFICHEF_NULL_BYTE_INJECTOR_HPP
#define LFICHEF_NULL_BYTE_INJECTOR_HPP

#include "../../core/mutation_base.hpp"
#include "../../common/logging.hpp"

#include <string>

namespace lfichef {
namespace nullbyte {

enum class NullByteMode {
    None,
    Prepend,
    Append,
    Both
};

inline const char* nullByteModeToString(NullByteMode mode) {
    switch (mode) {
        case NullByteMode::None:    return "none";
        case NullByteMode::Prepend: return "prepend";
        case NullByteMode::Append:  return "append";
        case NullByteMode::Both:    return "both";
        default: return "unknown";
    }
}

constexpr const char* kDefaultNullByte = "%00";

/**
 * Accepts p|a|b|n and prepend|append|both|none
 *
 * @throws LfiChefError(InvalidNullByteMode)
 */
NullByteMode parseNullByteMode(const std::string& input);

class NullByteInjector : public MutationPass {
public:
    NullByteInjector() : logger_("NullByteInjector") {}

    NullByteInjector(NullByteMode mode, const std::string& sequence = kDefaultNullByte)
        : logger_("NullByteInjector") {
        configure(mode, sequence);
    }

    /**
     * @throws LfiChefError(InvalidConfig) for an empty sequence
     */
    void configure(NullByteMode mode, const std::string& sequence = kDefaultNullByte);

    std::string getName() const override { return "null_byte"; }
    std::string getDescription() const override {
        return "Places a null byte sequence before and/or after the payload";
    }
    PassPriority getPriority() const override { return PassPriority::NullByte; }
    bool isActive() const override { return mode_ != NullByteMode::None; }

    /**
     * Variants for one payload; mode none yields the payload unchanged
     */
    VariantList inject(const std::string& path) const;

    VariantList mutate(const std::string& payload) override;

    NullByteMode getMode() const { return mode_; }
    const std::string& getSequence() const { return sequence_; }

private:
    NullByteMode mode_ = NullByteMode::None;
    std::string sequence_ = kDefaultNullByte;
    Logger logger_;
};

} // namespace nullbyte
} // namespace lfichef

#endif // LFICHEF_NULL_BYTE_INJECTOR_HPP
