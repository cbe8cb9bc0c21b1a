/*
 * wordlist_io.hpp
 *
 * reading the input wordlist and opening the output destination
 */

#ifndef LFICHEF_WORDLIST_IO_HPP
#define LFICHEF_WORDLIST_IO_HPP

#include "../../common/errors.hpp"
#include "../../core/output_sink.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace lfichef {
namespace cli {

/**
 * Read every line of a wordlist file
 *
 * @throws LfiChefError(IoError) if the file cannot be opened or read
 */
inline std::vector<std::string> readWordlist(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw LfiChefError(ErrorKind::IoError, "The file " + path + " does not exist or cannot be read");
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    if (in.bad()) {
        throw LfiChefError(ErrorKind::IoError, "Error occurred reading " + path);
    }

    return lines;
}

/**
 * Output destination: a file when a path is given, stdout otherwise
 */
class WordlistWriter {
public:
    /**
     * @throws LfiChefError(IoError) if the file cannot be created
     */
    explicit WordlistWriter(const std::string& path) : path_(path) {
        if (path_.empty()) {
            sink_ = std::make_unique<StreamSink>(std::cout);
            return;
        }

        file_ = std::make_unique<std::ofstream>(path_, std::ios::binary | std::ios::trunc);
        if (!file_->is_open()) {
            throw LfiChefError(ErrorKind::IoError, "Cannot create output file: " + path_);
        }
        sink_ = std::make_unique<StreamSink>(*file_);
    }

    OutputSink& sink() { return *sink_; }

    size_t written() const { return sink_->written(); }

    std::string describe() const { return path_.empty() ? "<stdout>" : path_; }

    /**
     * @throws LfiChefError(IoError) if buffered records fail to reach disk
     */
    void close() {
        sink_->flush();
        if (file_) {
            file_->close();
            if (file_->fail()) {
                throw LfiChefError(ErrorKind::IoError, "Error occurred closing " + path_);
            }
        }
    }

private:
    std::string path_;
    std::unique_ptr<std::ofstream> file_;
    std::unique_ptr<StreamSink> sink_;
};

} // namespace cli
} // namespace lfichef

#endif // LFICHEF_WORDLIST_IO_HPP
