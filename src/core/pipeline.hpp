/*
 * pipeline.hpp
 *
 * sanitizer -> traversal -> encoding -> null byte, streamed to a sink.
 * owns the stages, keeps them in priority order and collects their
 * statistics.
 */

#ifndef LFICHEF_PIPELINE_HPP
#define LFICHEF_PIPELINE_HPP

#include "mutation_base.hpp"
#include "output_sink.hpp"
#include "statistics.hpp"
#include "../common/logging.hpp"
#include "../passes/passes.hpp"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

namespace lfichef {

/**
 * Validated, strongly typed run configuration.
 * Built once from user options; nothing is re-parsed per path.
 */
struct MutationConfig {
    RunMode mode = RunMode::Generate;
    TargetOS os = TargetOS::Linux;
    std::optional<char> drive;
    bool lowercase_windows = false;

    std::optional<traversal::TraversalSpec> traversal;

    encoding::EncodingSet encodings;
    encoding::EncodeScope encode_scope = encoding::EncodeScope::Special;
    bool alternate_forms = false;

    nullbyte::NullByteMode null_byte = nullbyte::NullByteMode::None;
    std::string null_byte_sequence = nullbyte::kDefaultNullByte;

    sanitize::SanitizeConfig sanitizeConfig() const {
        sanitize::SanitizeConfig sc;
        sc.os = os;
        sc.drive = drive;
        sc.lowercase_windows = lowercase_windows;
        return sc;
    }
};

struct PassEntry {
    std::unique_ptr<MutationPass> pass;
    bool enabled = true;
};

class MutationPipeline {
public:
    /**
     * Builds the sanitizer and the three standard stages from the config
     */
    explicit MutationPipeline(const MutationConfig& config);

    // takes ownership; a pass with the same name is replaced
    template<typename T>
    void registerPass(std::unique_ptr<T> pass) {
        static_assert(
            std::is_base_of<MutationPass, T>::value,
            "Pass must inherit from MutationPass"
        );

        std::string name = pass->getName();
        for (auto& entry : passes_) {
            if (entry.pass->getName() == name) {
                logger_.debug("Pass '{}' already registered, replacing", name);
                entry.pass = std::move(pass);
                sortPasses();
                return;
            }
        }

        PassEntry entry;
        entry.pass = std::move(pass);
        passes_.push_back(std::move(entry));
        sortPasses();

        logger_.debug("Registered pass: {}", name);
    }

    MutationPass* getPass(const std::string& name);

    bool setPassEnabled(const std::string& name, bool enabled);

    std::vector<std::string> getPassOrder() const;

    const MutationConfig& getConfig() const { return config_; }

    const sanitize::PathSanitizer& sanitizer() const { return sanitizer_; }

    /**
     * Process one raw line. Returns the number of records written;
     * blank lines write nothing.
     */
    size_t processLine(const std::string& raw, OutputSink& sink);

    /**
     * Run over a materialized wordlist
     *
     * @throws LfiChefError(EmptyInput) before writing anything if every
     *         line sanitizes to nothing
     */
    void run(const std::vector<std::string>& lines, OutputSink& sink);

    /**
     * Run over a stream, one payload per line
     *
     * @throws LfiChefError(EmptyInput) if no payload was found
     */
    void run(std::istream& in, OutputSink& sink);

    /**
     * @throws LfiChefError(EmptyInput) if no line survives sanitizing
     */
    void requirePayloads(const std::vector<std::string>& lines) const;

    Statistics getStatistics() const;

    void printStatistics() const;

    void resetStatistics();

private:
    MutationConfig config_;
    sanitize::PathSanitizer sanitizer_;
    std::vector<PassEntry> passes_;
    Statistics run_stats_;
    Logger logger_;

    void sortPasses();

    std::vector<MutationPass*> activePasses() const;

    void fanOut(const std::vector<MutationPass*>& stages, size_t stage,
                const std::string& payload,
                std::unordered_set<std::string>& seen,
                OutputSink& sink, size_t& written);
};

} // namespace lfichef

#endif // LFICHEF_PIPELINE_HPP
