/**
 * LFI Chef - LFI wordlist mutation toolkit
 *
 * lfichef_cli.cpp - Command line front end
 *
 * Reads a wordlist of file paths and writes either the sanitized
 * wordlist or every evasion mutation of it.
 *
 * Usage:
 *   lfichef wordlist.txt generate linux --encoding ud --traversal 1:3 --null_byte a
 *   lfichef wordlist.txt sanitize windows --drive C --out_file clean.txt
 *
 * Exit codes:
 *   0  success
 *   1  unexpected failure
 *   2  invalid arguments or configuration (nothing written)
 *   3  file I/O error
 */

#include "lfichef.hpp"
#include "wordlist_io.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace lfichef;

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <in_file> <generate|sanitize> <mac|linux|windows> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --encoding <udbo>        Encodings to combine, in any order/combo:\n"
              << "                             u url, d double url, b 16-bit unicode, o overlong utf-8\n"
              << "  --encode-all             Encode every character, not only separators/dots\n"
              << "  --alt-forms              Also emit alternate b/o forms (%u2215, %e0%80%af, %c0%2f)\n"
              << "  --traversal <N|lo:hi>    Traversal depth N, or every depth from lo to hi\n"
              << "  --traversal_chars <list> Custom traversal pairs, comma separated trav:sep\n"
              << "                             e.g. \"../:/,....//://,..\\\\:\\\\\"\n"
              << "  --null_byte <p|a|b>      Null byte: prepend, append or both\n"
              << "  --null_byte_seq <str>    Null byte sequence (default %00)\n"
              << "  --drive <letter>         Windows drive for sanitize mode; strips drives when omitted\n"
              << "  --lowercase              Lowercase windows paths\n"
              << "  --out_file <path>        Output wordlist (default: stdout)\n"
              << "  --config <file.json>     Load options from a JSON file\n"
              << "  --stats                  Print run statistics\n"
              << "  --log-file <path>        Write log records to a file\n"
              << "  --verbose, -v            Verbose logging (repeat for trace)\n"
              << "  --quiet, -q              Errors only\n"
              << "  --version                Print version\n"
              << "  --help, -h               Show this help\n";
}

// command line values; unset ones leave config file values alone
struct CliOptions {
    std::vector<std::string> positional;
    std::optional<std::string> encoding;
    std::optional<std::string> traversal;
    std::optional<std::string> traversal_chars;
    std::optional<std::string> null_byte;
    std::optional<std::string> null_byte_sequence;
    std::optional<std::string> drive;
    std::optional<std::string> log_file;
    std::string out_file;
    std::string config_file;
    bool encode_all = false;
    bool alt_forms = false;
    bool lowercase = false;
    bool stats = false;
    int verbosity = -1;
};

int runCli(int argc, char* argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        auto next = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw LfiChefError(ErrorKind::InvalidConfig, "Option " + name + " expects a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "lfichef " << getVersion() << std::endl;
            return 0;
        } else if (arg == "--encoding") {
            opts.encoding = next(arg);
        } else if (arg == "--encode-all") {
            opts.encode_all = true;
        } else if (arg == "--alt-forms") {
            opts.alt_forms = true;
        } else if (arg == "--traversal") {
            opts.traversal = next(arg);
        } else if (arg == "--traversal_chars") {
            opts.traversal_chars = next(arg);
        } else if (arg == "--null_byte") {
            opts.null_byte = next(arg);
        } else if (arg == "--null_byte_seq") {
            opts.null_byte_sequence = next(arg);
        } else if (arg == "--drive") {
            opts.drive = next(arg);
        } else if (arg == "--lowercase") {
            opts.lowercase = true;
        } else if (arg == "--out_file") {
            opts.out_file = next(arg);
        } else if (arg == "--config") {
            opts.config_file = next(arg);
        } else if (arg == "--stats") {
            opts.stats = true;
        } else if (arg == "--log-file") {
            opts.log_file = next(arg);
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbosity = opts.verbosity < 1 ? 2 : opts.verbosity + 1;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.verbosity = 0;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        } else {
            opts.positional.push_back(arg);
        }
    }

    if (opts.positional.size() != 3) {
        printUsage(argv[0]);
        return 2;
    }

    LfiChefConfig config;
    if (!opts.config_file.empty() && !config.loadFromFile(opts.config_file)) {
        return 2;
    }

    const std::string& in_file = opts.positional[0];
    config.mode = opts.positional[1];
    config.os = opts.positional[2];
    if (opts.encoding) config.encoding = *opts.encoding;
    if (opts.encode_all) config.encode_scope = "all";
    if (opts.alt_forms) config.alternate_forms = true;
    if (opts.traversal) config.traversal = *opts.traversal;
    if (opts.traversal_chars) config.traversal_chars = *opts.traversal_chars;
    if (opts.null_byte) config.null_byte = *opts.null_byte;
    if (opts.null_byte_sequence) config.null_byte_sequence = *opts.null_byte_sequence;
    if (opts.drive) config.drive = *opts.drive;
    if (opts.lowercase) config.lowercase_windows = true;
    if (opts.log_file) config.log_file = *opts.log_file;
    if (opts.stats) config.print_statistics = true;
    if (opts.verbosity >= 0) config.verbosity = opts.verbosity;

    initialize(config);

    // validate everything before touching the output
    MutationConfig mutation_config = config.toMutationConfig();

    if (config.verbosity >= 1 && !opts.out_file.empty()) {
        printBanner();
    }

    std::vector<std::string> lines = cli::readWordlist(in_file);
    MutationPipeline pipeline(mutation_config);
    pipeline.requirePayloads(lines);

    LOG_INFO("{} {} wordlist from {} ({} line(s))",
             mutation_config.mode == RunMode::Generate ? "Generating" : "Sanitizing",
             targetOSToString(mutation_config.os), in_file, lines.size());
    if (mutation_config.mode == RunMode::Generate) {
        LOG_DEBUG("encodings='{}'{} traversal={} null_byte={}",
                  mutation_config.encodings.toString(),
                  mutation_config.alternate_forms ? " (alternate forms)" : "",
                  mutation_config.traversal
                      ? std::to_string(mutation_config.traversal->range.low) + ":" +
                        std::to_string(mutation_config.traversal->range.high)
                      : std::string("off"),
                  nullbyte::nullByteModeToString(mutation_config.null_byte));
    }

    cli::WordlistWriter writer(opts.out_file);

    pipeline.run(lines, writer.sink());
    writer.close();

    LOG_INFO("LFI {} wordlist {} complete, {} record(s) stored at {}",
             targetOSToString(mutation_config.os),
             mutation_config.mode == RunMode::Generate ? "generation" : "sanitization",
             writer.written(), writer.describe());

    if (config.print_statistics) {
        std::cerr << pipeline.getStatistics().format();
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        return runCli(argc, argv);
    } catch (const LfiChefError& e) {
        LOG_ERROR("{}: {}", errorKindToString(e.kind()), e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected exception occurred: {}", e.what());
        return 1;
    }
}
