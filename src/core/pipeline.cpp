/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * pipeline.cpp - Sanitize and generate runs
 *
 * Generate order for one line, outermost first:
 *   traversal  [path, depth low.., depth high..]
 *   encoding   [plain, subsets by size]
 *   null byte  [plain, prepend, append]
 * Each record is written the first time it is seen for the line.
 */

#include "pipeline.hpp"

#include <algorithm>

namespace lfichef {

MutationPipeline::MutationPipeline(const MutationConfig& config)
    : config_(config),
      sanitizer_(config.sanitizeConfig()),
      logger_("Pipeline") {

    registerPass(std::make_unique<traversal::TraversalExpander>(config_.os, config_.traversal));

    encoding::EncodingConfig ec;
    ec.set = config_.encodings;
    ec.os = config_.os;
    ec.scope = config_.encode_scope;
    ec.alternate_forms = config_.alternate_forms;
    registerPass(std::make_unique<encoding::EncodingTransformer>(ec));

    registerPass(std::make_unique<nullbyte::NullByteInjector>(config_.null_byte,
                                                              config_.null_byte_sequence));
}

void MutationPipeline::sortPasses() {
    std::stable_sort(passes_.begin(), passes_.end(),
        [](const PassEntry& a, const PassEntry& b) {
            return static_cast<int>(a.pass->getPriority()) <
                   static_cast<int>(b.pass->getPriority());
        });
}

MutationPass* MutationPipeline::getPass(const std::string& name) {
    for (auto& entry : passes_) {
        if (entry.pass->getName() == name) {
            return entry.pass.get();
        }
    }
    return nullptr;
}

bool MutationPipeline::setPassEnabled(const std::string& name, bool enabled) {
    for (auto& entry : passes_) {
        if (entry.pass->getName() == name) {
            entry.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<std::string> MutationPipeline::getPassOrder() const {
    std::vector<std::string> names;
    for (const auto& entry : passes_) {
        names.push_back(entry.pass->getName());
    }
    return names;
}

std::vector<MutationPass*> MutationPipeline::activePasses() const {
    std::vector<MutationPass*> active;
    for (const auto& entry : passes_) {
        if (entry.enabled && entry.pass->isActive()) {
            active.push_back(entry.pass.get());
        }
    }
    return active;
}

void MutationPipeline::fanOut(const std::vector<MutationPass*>& stages, size_t stage,
                              const std::string& payload,
                              std::unordered_set<std::string>& seen,
                              OutputSink& sink, size_t& written) {
    if (stage == stages.size()) {
        if (seen.insert(payload).second) {
            sink.write(payload);
            written++;
        } else {
            run_stats_.increment("duplicates_suppressed");
        }
        return;
    }

    // the unmutated payload always travels on next to its mutations
    fanOut(stages, stage + 1, payload, seen, sink, written);

    for (const auto& variant : stages[stage]->mutate(payload)) {
        fanOut(stages, stage + 1, variant, seen, sink, written);
    }
}

size_t MutationPipeline::processLine(const std::string& raw, OutputSink& sink) {
    run_stats_.increment("lines_read");

    std::string canonical = sanitizer_.sanitize(raw);
    if (canonical.empty()) {
        run_stats_.increment("lines_skipped");
        return 0;
    }

    size_t written = 0;

    if (config_.mode == RunMode::Sanitize) {
        sink.write(canonical);
        written = 1;
    } else {
        std::unordered_set<std::string> seen;
        fanOut(activePasses(), 0, canonical, seen, sink, written);
    }

    run_stats_.increment("payloads");
    run_stats_.increment("records_emitted", static_cast<long long>(written));
    logger_.trace("'{}' -> {} record(s)", canonical, written);

    return written;
}

void MutationPipeline::requirePayloads(const std::vector<std::string>& lines) const {
    bool any = std::any_of(lines.begin(), lines.end(), [this](const std::string& line) {
        return !sanitizer_.sanitize(line).empty();
    });

    if (!any) {
        throw LfiChefError(ErrorKind::EmptyInput, "Input wordlist contains no payloads");
    }
}

void MutationPipeline::run(const std::vector<std::string>& lines, OutputSink& sink) {
    requirePayloads(lines);

    double elapsed = 0.0;
    {
        ScopedTimer timer(elapsed);
        for (const auto& line : lines) {
            processLine(line, sink);
        }
        sink.flush();
    }
    run_stats_.add("run_time_ms", elapsed);

    logger_.info("{} line(s) -> {} record(s)",
                 run_stats_.getInt("lines_read"), run_stats_.getInt("records_emitted"));
}

void MutationPipeline::run(std::istream& in, OutputSink& sink) {
    long long payloads_before = run_stats_.getInt("payloads");

    double elapsed = 0.0;
    {
        ScopedTimer timer(elapsed);
        std::string line;
        while (std::getline(in, line)) {
            processLine(line, sink);
        }
        sink.flush();
    }
    run_stats_.add("run_time_ms", elapsed);

    if (in.bad()) {
        throw LfiChefError(ErrorKind::IoError, "Error occurred reading the input wordlist");
    }

    if (run_stats_.getInt("payloads") == payloads_before) {
        throw LfiChefError(ErrorKind::EmptyInput, "Input wordlist contains no payloads");
    }

    logger_.info("{} line(s) -> {} record(s)",
                 run_stats_.getInt("lines_read"), run_stats_.getInt("records_emitted"));
}

Statistics MutationPipeline::getStatistics() const {
    Statistics stats;
    stats.merge(run_stats_);
    stats.set("passes_registered", static_cast<int>(passes_.size()));

    for (const auto& entry : passes_) {
        for (const auto& [name, value] : entry.pass->getStatistics()) {
            stats.set(entry.pass->getName() + "." + name, value);
        }
    }

    return stats;
}

void MutationPipeline::printStatistics() const {
    Statistics stats = getStatistics();

    logger_.info("=== LFI Chef Run Statistics ===");
    logger_.info("Mode: {} / {}", runModeToString(config_.mode), targetOSToString(config_.os));
    for (const auto& [name, value] : stats.getIntStats()) {
        logger_.info("  {}: {}", name, value);
    }
    logger_.info("  run_time_ms: {}", stats.getDouble("run_time_ms"));
    logger_.info("===============================");
}

void MutationPipeline::resetStatistics() {
    run_stats_.clear();
    for (auto& entry : passes_) {
        entry.pass->resetStatistics();
    }
}

} // namespace lfichef
