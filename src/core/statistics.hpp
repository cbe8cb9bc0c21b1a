/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * statistics.hpp - Run counters and reporting
 *
 * Tracks:
 *   - Lines read / skipped
 *   - Records emitted and duplicates suppressed
 *   - Variants produced per stage
 *   - Time spent in the run
 */

#ifndef LFICHEF_STATISTICS_HPP
#define LFICHEF_STATISTICS_HPP

#include "../common/json_parser.hpp"

#include <string>
#include <map>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace lfichef {

/**
 * Wall clock timer
 */
class Timer {
public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        running_ = true;
    }

    void stop() {
        if (running_) {
            end_time_ = std::chrono::steady_clock::now();
            running_ = false;
        }
    }

    double elapsedMs() const {
        auto end = running_ ? std::chrono::steady_clock::now() : end_time_;
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_time_);
        return duration.count() / 1000.0;
    }

private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;
    bool running_ = false;
};

/**
 * RAII timer that adds its duration to a counter on scope exit
 */
class ScopedTimer {
public:
    explicit ScopedTimer(double& target) : target_(target) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
        target_ += timer_.elapsedMs();
    }

private:
    Timer timer_;
    double& target_;
};

/**
 * Named counters. Names use "stage.counter" for per-stage values,
 * plain names for run-wide values.
 */
class Statistics {
public:
    void set(const std::string& name, int value) {
        int_stats_[name] = value;
    }

    void set(const std::string& name, long long value) {
        int_stats_[name] = value;
    }

    void set(const std::string& name, double value) {
        double_stats_[name] = value;
    }

    void increment(const std::string& name, long long amount = 1) {
        int_stats_[name] += amount;
    }

    void add(const std::string& name, double amount) {
        double_stats_[name] += amount;
    }

    long long getInt(const std::string& name) const {
        auto it = int_stats_.find(name);
        return it != int_stats_.end() ? it->second : 0;
    }

    double getDouble(const std::string& name) const {
        auto it = double_stats_.find(name);
        return it != double_stats_.end() ? it->second : 0.0;
    }

    bool has(const std::string& name) const {
        return int_stats_.count(name) != 0 || double_stats_.count(name) != 0;
    }

    const std::map<std::string, long long>& getIntStats() const {
        return int_stats_;
    }

    void merge(const Statistics& other) {
        for (const auto& [name, value] : other.int_stats_) {
            int_stats_[name] += value;
        }
        for (const auto& [name, value] : other.double_stats_) {
            double_stats_[name] += value;
        }
    }

    void clear() {
        int_stats_.clear();
        double_stats_.clear();
    }

    /**
     * Human readable report, run-wide counters first, then one
     * section per stage
     */
    std::string format() const {
        std::ostringstream oss;

        oss << "=== LFI Chef Run Statistics ===" << std::endl;
        oss << std::endl << "[General]" << std::endl;
        for (const auto& [name, value] : int_stats_) {
            if (name.find('.') == std::string::npos) {
                oss << "  " << std::setw(30) << std::left << name << ": " << value << std::endl;
            }
        }

        std::string current;
        for (const auto& [name, value] : int_stats_) {
            size_t dot = name.find('.');
            if (dot == std::string::npos) continue;

            std::string prefix = name.substr(0, dot);
            if (prefix != current) {
                oss << std::endl << "[" << prefix << "]" << std::endl;
                current = prefix;
            }
            oss << "  " << std::setw(30) << std::left << name.substr(dot + 1)
                << ": " << value << std::endl;
        }

        if (!double_stats_.empty()) {
            oss << std::endl << "[Timing]" << std::endl;
            for (const auto& [name, value] : double_stats_) {
                oss << "  " << std::setw(30) << std::left << name
                    << ": " << std::fixed << std::setprecision(2) << value << " ms" << std::endl;
            }
        }

        oss << "===============================" << std::endl;
        return oss.str();
    }

    std::string toJson() const {
        JsonValue root = JsonValue::object();
        for (const auto& [name, value] : int_stats_) {
            root.set(name, JsonValue(static_cast<double>(value)));
        }
        for (const auto& [name, value] : double_stats_) {
            root.set(name, JsonValue(value));
        }
        return JsonSerializer::serialize(root);
    }

private:
    std::map<std::string, long long> int_stats_;
    std::map<std::string, double> double_stats_;
};

} // namespace lfichef

#endif // LFICHEF_STATISTICS_HPP
