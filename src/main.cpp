/**
 * mnemo - Pattern-based Memorable Password Generator
 *
 * Generates strong, memorable passwords from templates such as
 * "{word+propercase}{number(99)}{symbol}".
 *
 * Usage:
 *   mnemo [options]
 *
 * Options:
 *   --count, -n        Number of passwords to generate (default: 12)
 *   --pattern, -p      Pattern to use instead of random ones
 *   --show-pattern     Show the pattern used for each password
 *   --quiet, -q        Print passwords only, one per line
 *   --wordlists, -w    Word-list directory
 *   --config, -c       Config file (default: ./mnemo.yml)
 *   --check            Validate a pattern and exit
 *   --debug            Show debug output
 *   --version, -v      Show version
 *   --help, -h         Show this help message
 *
 * Example:
 *   mnemo -n 5 -p "{word(animal)+propercase}.{number(99)}"
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <optional>
#include <chrono>
#include <exception>

#include "core/version.hpp"
#include "core/types.hpp"
#include "core/logger.hpp"
#include "core/yaml_config.hpp"
#include "core/text_utils.hpp"
#include "pattern/placeholder_parser.hpp"
#include "generators/password_generator.hpp"
#include "wordlists/wordlist_store.hpp"

using namespace mnemo;

namespace {

constexpr size_t PATTERN_DISPLAY_WIDTH = 40;

/**
 * Command-line arguments.
 */
struct Arguments {
    size_t count = 12;
    std::string pattern;                  // Empty = random pattern per password
    bool show_pattern = false;
    bool quiet = false;
    std::string wordlist_dir = version::default_wordlist_dir();
    std::string config_file;              // Custom config file path (default: ./mnemo.yml)
    std::optional<std::string> check;     // Pattern to validate
    bool debug = false;
    bool show_version = false;
    bool help = false;

    // Set from the config file only
    int max_attempts = 10;
    size_t max_depth = DEFAULT_MAX_DEPTH;
    std::string log_dir;

    // Explicitly set on the command line
    bool cli_has_count = false;
    bool cli_has_pattern = false;
    bool cli_has_wordlists = false;

    std::string error;
};

/**
 * Parse command-line arguments.
 */
Arguments parse_args(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else if (arg == "--version" || arg == "-v") {
            args.show_version = true;
        } else if ((arg == "--count" || arg == "-n") && i + 1 < argc) {
            auto count = parse_int(argv[++i]);
            if (!count || *count < 0) {
                args.error = "Invalid count: " + std::string(argv[i]);
                return args;
            }
            args.count = static_cast<size_t>(*count);
            args.cli_has_count = true;
        } else if ((arg == "--pattern" || arg == "-p") && i + 1 < argc) {
            args.pattern = argv[++i];
            args.cli_has_pattern = true;
        } else if (arg == "--show-pattern") {
            args.show_pattern = true;
        } else if (arg == "--quiet" || arg == "-q") {
            args.quiet = true;
        } else if ((arg == "--wordlists" || arg == "-w") && i + 1 < argc) {
            args.wordlist_dir = argv[++i];
            args.cli_has_wordlists = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (arg == "--check" && i + 1 < argc) {
            args.check = argv[++i];
        } else if (arg == "--debug") {
            args.debug = true;
        } else {
            args.error = "Unknown or incomplete option: " + arg;
            return args;
        }
    }

    return args;
}

/**
 * Print usage information.
 */
void print_usage() {
    std::cout << "\n";
    std::cout << "mnemo " << version::string() << "\n";
    std::cout << "===========\n\n";
    std::cout << "Generate strong, memorable passwords using patterns.\n\n";

    std::cout << "Usage:\n";
    std::cout << "  mnemo [options]\n\n";

    std::cout << R"(Generation Options:
  --count, -n <n>         Number of passwords to generate (default: 12)
  --pattern, -p <pattern> Use a specific pattern instead of random ones
  --wordlists, -w <dir>   Word-list directory (default: bundled lists)

Output Options:
  --show-pattern          Show the pattern used for each password
  --quiet, -q             Just output passwords, one per line

Other:
  --check <pattern>       Validate a pattern and exit
  --config, -c <file>     Config file (default: ./mnemo.yml)
  --debug                 Show debug output
  --version, -v           Show version
  --help, -h              Show this help message

Pattern syntax:
  {word}                  Random word from the default list
  {word(animal)}          Random word from a specific list
  {number(99)}            Random number (0-99)
  {symbol} {letter}       Random symbol or letter
  {pronounceable}         Fake pronounceable word
  {sequence(5)}           Keyboard sequence
  {red|green|blue}        One of the alternatives
  {symbol}[50]            Kept half of the time
  {word}{$W1}             Repeat the first value

Modifiers:
  {word+uppercase}        Convert to uppercase
  {word+obscure}          Leet-speak substitutions
  {word+reverse}          Reverse the text
  {word+piglatin}         Convert to pig latin

Examples:
  mnemo
  mnemo -n 5
  mnemo -p "{word}.{word}"
  mnemo --show-pattern
)";
}

void print_header() {
    std::cout << "\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "  Mnemo - Pattern-based Password Generator\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void print_footer(const Arguments& args) {
    std::cout << "\n";
    std::cout << std::string(60, '-') << "\n";
    if (!args.pattern.empty()) {
        std::cout << "  Pattern: " << args.pattern << "\n";
    } else {
        std::cout << "  Tip: Use -p to specify a custom pattern\n";
        std::cout << "       Use --show-pattern to see patterns used\n";
    }
    std::cout << "\n";
}

std::string display_pattern(const std::string& pattern) {
    if (pattern.size() > PATTERN_DISPLAY_WIDTH) {
        return pattern.substr(0, PATTERN_DISPLAY_WIDTH - 3) + "...";
    }
    return pattern;
}

int run_check(const std::string& pattern) {
    auto error = check_pattern(pattern);
    if (error) {
        std::cerr << "[!] " << *error << "\n";
        return 1;
    }
    std::cout << "[+] Pattern OK\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Arguments args = parse_args(argc, argv);
    if (!args.error.empty()) {
        std::cerr << "[!] " << args.error << "\n";
        std::cerr << "    Run 'mnemo --help' for usage.\n";
        return 1;
    }

    // Load config file (mnemo.yml in current directory or ~/.mnemo/config.yml)
    // Command-line arguments take precedence over config file
    AppConfig app_config;
    if (app_config.load(args.config_file)) {
        apply_config_to_args(args, app_config, args.cli_has_count, args.cli_has_pattern,
                             args.cli_has_wordlists);
    } else if (!args.config_file.empty()) {
        return 1;
    }

    if (args.help) {
        print_usage();
        return 0;
    }

    if (args.show_version) {
        std::cout << version::name() << " " << version::string() << "\n";
        return 0;
    }

    if (args.check) {
        return run_check(*args.check);
    }

    auto& logger = Logger::instance();
    if (logger.init(args.log_dir, args.debug)) {
        LOG_INFO(std::string("Starting mnemo v") + version::string());
        if (!app_config.loaded_path.empty()) {
            logger.log_config_loaded(app_config.loaded_path);
        }
        logger.log_startup(version::string(), args.count, args.pattern, args.wordlist_dir);
    } else if (args.debug) {
        std::cerr << "[DEBUG] Logger init failed, continuing without a log file\n";
    }
    if (args.debug) std::cerr << "[DEBUG] Log file: " << logger.get_log_path() << "\n";

    // Reject malformed patterns before generating anything
    if (!args.pattern.empty()) {
        auto error = check_pattern(args.pattern);
        if (error) {
            std::cerr << "[!] " << *error << "\n";
            logger.log_error(*error);
            return 1;
        }
    }

    WordlistStore store(args.wordlist_dir);
    if (args.debug) std::cerr << "[DEBUG] Word lists: " << store.directory().string() << "\n";

    PasswordGenerator generator(
        Collaborators{.words = &store, .patterns = &store},
        GeneratorOptions{.max_attempts = args.max_attempts, .max_depth = args.max_depth});

    auto start_time = std::chrono::steady_clock::now();

    if (!args.quiet) print_header();

    std::optional<std::string> pattern;
    if (!args.pattern.empty()) pattern = args.pattern;

    for (size_t i = 0; i < args.count; ++i) {
        std::string password;
        try {
            password = generator.generate(pattern);
        } catch (const std::exception& e) {
            logger.log_error(e.what());
            if (args.quiet) {
                std::cerr << "ERROR: " << e.what() << "\n";
            } else {
                std::cout << "  " << std::setw(2) << (i + 1) << ". (error: " << e.what() << ")\n";
            }
            continue;
        }

        if (args.debug && generator.last_was_failsafe()) {
            std::cerr << "[DEBUG] Failsafe used after " << generator.last_attempts() << " attempts\n";
        }

        if (args.quiet) {
            std::cout << password << "\n";
        } else if (args.show_pattern) {
            std::cout << "  " << std::setw(2) << (i + 1) << ". "
                      << std::left << std::setw(static_cast<int>(PATTERN_DISPLAY_WIDTH)) << password
                      << std::right << "  [" << display_pattern(generator.last_pattern()) << "]\n";
        } else {
            std::cout << "  " << std::setw(2) << (i + 1) << ". " << password << "\n";
        }
    }

    if (!args.quiet) print_footer(args);

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
    logger.log_shutdown(args.count, elapsed);

    return 0;
}
