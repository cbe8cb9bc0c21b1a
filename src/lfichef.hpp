/*
 * lfichef.hpp - main include file
 *
 * just include this and you get everything
 */

#ifndef LFICHEF_HPP
#define LFICHEF_HPP

#define LFICHEF_VERSION_MAJOR 1
#define LFICHEF_VERSION_MINOR 0
#define LFICHEF_VERSION_PATCH 0
#define LFICHEF_VERSION_STRING "1.0.0"

// Core components
#include "core/mutation_base.hpp"
#include "core/output_sink.hpp"
#include "core/pipeline.hpp"
#include "core/statistics.hpp"

// Common utilities
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/json_parser.hpp"

// Sanitizer and mutation stages
#include "passes/passes.hpp"

#include <iostream>
#include <string>

namespace lfichef {

inline const char* getVersion() {
    return LFICHEF_VERSION_STRING;
}

inline const char* getBanner() {
    return R"(
  _    ___ ___    ___ _         __
 | |  | __|_ _|  / __| |_  ___ / _|
 | |__| _| | |  | (__| ' \/ -_)  _|
 |____|_| |___|  \___|_||_\___|_|
  LFI wordlist generation & sanitization v)" LFICHEF_VERSION_STRING R"(
)";
}

// stderr: stdout may be the wordlist
inline void printBanner() {
    std::cerr << getBanner() << std::endl;
}

// user-facing options, as typed - toMutationConfig() validates them
struct LfiChefConfig {
    std::string mode;     // generate | sanitize
    std::string os;       // mac | linux | windows

    std::string encoding;           // any combination of u, d, b, o
    std::string encode_scope = "special";
    bool alternate_forms = false;   // extra b/o renderings
    std::string traversal;          // N or low:high
    std::string traversal_chars;    // "trav:sep,trav:sep"
    std::string null_byte;          // p | a | b
    std::string null_byte_sequence = nullbyte::kDefaultNullByte;
    std::string drive;              // single letter, sanitize mode
    bool lowercase_windows = false;

    int verbosity = 1;  // 0=quiet, 1=normal, 2=verbose, 3=trace
    bool print_statistics = false;
    std::string log_file;

    bool loadFromFile(const std::string& path) {
        try {
            auto json = JsonParser::parseFile(path);
            loadFromJson(json);
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load config {}: {}", path, e.what());
            return false;
        }
    }

    void loadFromJson(const JsonValue& json) {
        if (json.has("mode")) mode = json["mode"].asString(mode);
        if (json.has("os")) os = json["os"].asString(os);
        if (json.has("encoding")) encoding = json["encoding"].asString(encoding);
        if (json.has("encode_scope")) encode_scope = json["encode_scope"].asString(encode_scope);
        if (json.has("alternate_forms")) {
            alternate_forms = json["alternate_forms"].asBool(alternate_forms);
        }
        if (json.has("null_byte")) null_byte = json["null_byte"].asString(null_byte);
        if (json.has("null_byte_sequence")) {
            null_byte_sequence = json["null_byte_sequence"].asString(null_byte_sequence);
        }
        if (json.has("drive")) drive = json["drive"].asString(drive);
        if (json.has("lowercase_windows")) {
            lowercase_windows = json["lowercase_windows"].asBool(lowercase_windows);
        }
        if (json.has("verbosity")) verbosity = json["verbosity"].asInt(verbosity);
        if (json.has("print_statistics")) {
            print_statistics = json["print_statistics"].asBool(print_statistics);
        }
        if (json.has("log_file")) log_file = json["log_file"].asString(log_file);

        // "traversal": 3 | "2:4"
        if (json.has("traversal")) {
            const auto& t = json["traversal"];
            traversal = t.isNumber() ? std::to_string(t.asInt()) : t.asString(traversal);
        }

        // "traversal_chars": "../:/,..;/:/" | ["../:/", "..;/:/"]
        if (json.has("traversal_chars")) {
            const auto& tc = json["traversal_chars"];
            if (tc.isArray()) {
                std::string joined;
                for (const auto& entry : tc.asStringArray()) {
                    if (!joined.empty()) joined += ',';
                    joined += entry;
                }
                traversal_chars = joined;
            } else {
                traversal_chars = tc.asString(traversal_chars);
            }
        }
    }

    /**
     * Validate everything and build the typed run configuration.
     * Options that do not apply to the chosen mode/OS are dropped
     * with a warning.
     *
     * @throws LfiChefError on the first invalid value
     */
    MutationConfig toMutationConfig() const {
        MutationConfig mc;

        auto parsed_mode = parseRunMode(mode);
        if (!parsed_mode) {
            throw LfiChefError(ErrorKind::InvalidConfig,
                               "Unknown mode \"" + mode + "\" (expected generate or sanitize)");
        }
        mc.mode = *parsed_mode;

        auto parsed_os = parseTargetOS(os);
        if (!parsed_os) {
            throw LfiChefError(ErrorKind::InvalidConfig,
                               "Unknown OS \"" + os + "\" (expected mac, linux or windows)");
        }
        mc.os = *parsed_os;
        mc.lowercase_windows = lowercase_windows;

        if (!drive.empty()) {
            char letter = sanitize::validateDriveLetter(drive);
            if (mc.mode != RunMode::Sanitize) {
                LOG_WARN("--drive only applies to sanitize mode, ignoring \"{}\"", drive);
            } else if (mc.os != TargetOS::Windows) {
                LOG_WARN("--drive only applies to windows wordlists, ignoring \"{}\"", drive);
            } else {
                mc.drive = letter;
            }
        }

        auto scope = encoding::parseEncodeScope(encode_scope);
        if (!scope) {
            throw LfiChefError(ErrorKind::InvalidConfig,
                               "Unknown encode scope \"" + encode_scope + "\" (expected special or all)");
        }
        mc.encode_scope = *scope;
        mc.encodings = encoding::parseEncodingSet(encoding);
        mc.alternate_forms = alternate_forms;

        if (!traversal.empty()) {
            traversal::TraversalSpec spec;
            spec.range = traversal::parseTraversalRange(traversal);
            spec.tokens = traversal_chars.empty()
                ? traversal::defaultTraversalTokens(mc.os)
                : traversal::parseTraversalTokens(traversal_chars);
            mc.traversal = spec;
        } else if (!traversal_chars.empty()) {
            LOG_WARN("--traversal_chars given without --traversal, ignoring");
        }

        mc.null_byte = nullbyte::parseNullByteMode(null_byte);
        if (null_byte_sequence.empty()) {
            throw LfiChefError(ErrorKind::InvalidConfig, "Null byte sequence must not be empty");
        }
        mc.null_byte_sequence = null_byte_sequence;

        if (mc.mode == RunMode::Sanitize &&
            (!mc.encodings.empty() || mc.traversal || mc.null_byte != nullbyte::NullByteMode::None)) {
            LOG_WARN("mutation options have no effect in sanitize mode");
        }

        return mc;
    }
};

inline void initialize(const LfiChefConfig& config) {
    LogConfig::get().setVerbosity(config.verbosity);

    if (!config.log_file.empty() && !LogConfig::get().setOutputFile(config.log_file)) {
        LOG_WARN("Cannot open log file {}, logging to stderr", config.log_file);
    }

    LOG_DEBUG("initialized with mode={}, os={}, verbosity={}",
              config.mode, config.os, config.verbosity);
}

} // namespace lfichef

#endif // LFICHEF_HPP
