/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * mutation_base.hpp - Shared vocabulary and the base class for mutation stages
 *
 * Every fan-out stage (traversal, encoding, null byte) derives from
 * MutationPass. The pipeline asks each active stage for the mutations of
 * one payload and keeps the payload itself alongside them.
 */

#ifndef LFICHEF_MUTATION_BASE_HPP
#define LFICHEF_MUTATION_BASE_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>

namespace lfichef {

/**
 * Operating system family a wordlist targets
 */
enum class TargetOS {
    Linux,
    Mac,
    Windows
};

inline const char* targetOSToString(TargetOS os) {
    switch (os) {
        case TargetOS::Linux:   return "linux";
        case TargetOS::Mac:     return "mac";
        case TargetOS::Windows: return "windows";
        default: return "unknown";
    }
}

inline std::optional<TargetOS> parseTargetOS(const std::string& name) {
    if (name == "linux") return TargetOS::Linux;
    if (name == "mac") return TargetOS::Mac;
    if (name == "windows") return TargetOS::Windows;
    return std::nullopt;
}

/**
 * Path separator of the target OS
 */
inline char osSeparator(TargetOS os) {
    return os == TargetOS::Windows ? '\\' : '/';
}

enum class RunMode {
    Generate,
    Sanitize
};

inline const char* runModeToString(RunMode mode) {
    return mode == RunMode::Generate ? "generate" : "sanitize";
}

inline std::optional<RunMode> parseRunMode(const std::string& name) {
    if (name == "generate") return RunMode::Generate;
    if (name == "sanitize") return RunMode::Sanitize;
    return std::nullopt;
}

/**
 * Stage ordering inside the pipeline. Lower runs first.
 */
enum class PassPriority {
    Traversal = 200,
    Encoding  = 400,
    NullByte  = 600
};

using VariantList = std::vector<std::string>;

/**
 * Abstract base class for all fan-out stages
 *
 * Lifecycle:
 *   1. Constructor / configure() - parsed, validated options
 *   2. mutate(payload) - called for every payload reaching the stage
 *   3. getStatistics() - counters for the run report
 */
class MutationPass {
public:
    virtual ~MutationPass() = default;

    /**
     * Unique name, used as the statistics prefix
     */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    virtual PassPriority getPriority() const = 0;

    /**
     * An inactive stage is identity and the pipeline skips it
     */
    virtual bool isActive() const = 0;

    /**
     * Produce the mutations of one payload, not including the payload
     * itself. Order of the result is the emission order.
     */
    virtual VariantList mutate(const std::string& payload) = 0;

    virtual std::map<std::string, long long> getStatistics() const {
        return statistics_;
    }

    virtual void resetStatistics() {
        statistics_.clear();
    }

protected:
    std::map<std::string, long long> statistics_;

    void incrementStat(const std::string& name, long long amount = 1) {
        statistics_[name] += amount;
    }
};

} // namespace lfichef

#endif // LFICHEF_MUTATION_BASE_HPP
