/*
 * output_sink.hpp
 *
 * where the pipeline pushes records. the pipeline never buffers the
 * result set, each record goes straight to the sink.
 */

#ifndef LFICHEF_OUTPUT_SINK_HPP
#define LFICHEF_OUTPUT_SINK_HPP

#include "../common/errors.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace lfichef {

class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void write(const std::string& record) = 0;

    virtual void flush() {}
};

/**
 * One record per line on a stream (stdout or an opened file)
 */
class StreamSink : public OutputSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}

    void write(const std::string& record) override {
        out_ << record << '\n';
        if (!out_) {
            throw LfiChefError(ErrorKind::IoError, "Error occurred writing output record");
        }
        written_++;
    }

    void flush() override {
        out_.flush();
    }

    size_t written() const { return written_; }

private:
    std::ostream& out_;
    size_t written_ = 0;
};

/**
 * Keeps records in memory, for tests and small embeddings
 */
class CollectingSink : public OutputSink {
public:
    void write(const std::string& record) override {
        records_.push_back(record);
    }

    const std::vector<std::string>& records() const { return records_; }

    void clear() { records_.clear(); }

private:
    std::vector<std::string> records_;
};

class CallbackSink : public OutputSink {
public:
    explicit CallbackSink(std::function<void(const std::string&)> fn)
        : fn_(std::move(fn)) {}

    void write(const std::string& record) override {
        fn_(record);
    }

private:
    std::function<void(const std::string&)> fn_;
};

} // namespace lfichef

#endif // LFICHEF_OUTPUT_SINK_HPP
