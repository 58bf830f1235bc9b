#include <iostream>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <string>
#include <vector>
#include <optional>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/ingest.hpp"
#include "engine/result.hpp"
#include "engine/tokenizer.hpp"
#include "ctxpack/errors.hpp"
#include <nlohmann/json.hpp>

// Raised by SIGINT/SIGTERM, polled by the packager between files
std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

namespace {

    void print_usage() {
        std::cerr << "Usage: ctxpack <input> -o <output> [options]\n";
        std::cerr << "Options:\n";
        std::cerr << "  -o, --output FILE      Output artifact path (required)\n";
        std::cerr << "  -i, --include PATTERN  Include pattern, repeatable (default: *)\n";
        std::cerr << "  -e, --exclude PATTERN  Exclude pattern, repeatable\n";
        std::cerr << "  --no-ignore-files      Do not read .gitignore files\n";
        std::cerr << "  --max-size BYTES       Skip files larger than BYTES (default: 1048576)\n";
        std::cerr << "  --no-size-limit        Keep files of any size\n";
        std::cerr << "  --include-binary       Keep files that look binary\n";
        std::cerr << "  --config FILE          JSON config (default: <config dir>/config.json)\n";
        std::cerr << "  --vocab FILE           WordPiece vocab.txt for token estimates\n";
        std::cerr << "  --json                 Print the result as JSON\n";
        std::cerr << "  --verbose              Log every skipped path\n";
    }

    int exit_code_for(ctxpack::engine::IngestError::Kind kind) {
        using Kind = ctxpack::engine::IngestError::Kind;
        switch (kind) {
            case Kind::NotFound:
            case Kind::InvalidPath: return 2;
            case Kind::EmptySelection: return 3;
            case Kind::OutputFailure: return 4;
            case Kind::Cancelled: return 130;
            case Kind::InvalidConfig: return 1;
        }
        return 1;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::optional<std::string> input;
    std::optional<std::string> output;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> vocab_path;
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
    std::optional<std::uintmax_t> max_size;
    bool no_ignore_files = false;
    bool no_size_limit = false;
    bool include_binary = false;
    bool as_json = false;
    bool verbose = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= args.size()) {
                std::cerr << "Error: " << flag << " expects a value.\n";
                return std::nullopt;
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-o" || arg == "--output") {
            output = next_value(arg);
            if (!output) return 1;
        } else if (arg == "-i" || arg == "--include") {
            auto v = next_value(arg);
            if (!v) return 1;
            includes.push_back(*v);
        } else if (arg == "-e" || arg == "--exclude") {
            auto v = next_value(arg);
            if (!v) return 1;
            excludes.push_back(*v);
        } else if (arg == "--config") {
            auto v = next_value(arg);
            if (!v) return 1;
            config_path = *v;
        } else if (arg == "--vocab") {
            auto v = next_value(arg);
            if (!v) return 1;
            vocab_path = *v;
        } else if (arg == "--max-size") {
            auto v = next_value(arg);
            if (!v) return 1;
            max_size = ctxpack::engine::parse_byte_count(*v);
            if (!max_size) {
                std::cerr << "Error: --max-size expects a byte count, got '" << *v << "'.\n";
                return 1;
            }
        } else if (arg == "--no-size-limit") {
            no_size_limit = true;
        } else if (arg == "--no-ignore-files") {
            no_ignore_files = true;
        } else if (arg == "--include-binary") {
            include_binary = true;
        } else if (arg == "--json") {
            as_json = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown option " << arg << "\n";
            print_usage();
            return 1;
        } else if (!input) {
            input = arg;
        } else {
            std::cerr << "Error: Unexpected argument " << arg << "\n";
            return 1;
        }
    }

    auto config_dir = ctxpack::platform::system::get_config_dir();

    ctxpack::engine::IngestConfig config;
    try {
        if (config_path) {
            if (!std::filesystem::exists(*config_path)) {
                std::cerr << "Error: Config file not found: " << config_path->string() << "\n";
                return 1;
            }
            config = ctxpack::engine::IngestConfig::load(*config_path);
        } else if (!config_dir.empty()) {
            config = ctxpack::engine::IngestConfig::load(config_dir / "config.json");
        }
    } catch (const ctxpack::engine::IngestError& e) {
        std::cerr << "[ctxpack] " << e.what() << "\n";
        return exit_code_for(e.kind());
    }

    if (input) config.input_path = *input;
    if (output) config.output_path = *output;
    if (!includes.empty()) config.include_patterns = includes;
    if (!excludes.empty()) config.exclude_patterns = excludes;
    if (no_ignore_files) config.respect_ignore_files = false;
    if (include_binary) config.skip_binary_files = false;
    if (max_size) config.max_file_size_bytes = max_size;
    if (no_size_limit) config.max_file_size_bytes.reset();
    if (vocab_path) config.vocab_path = vocab_path;

    if (config.input_path.empty() || config.output_path.empty()) {
        std::cerr << "Error: Both <input> and --output are required.\n";
        print_usage();
        return 1;
    }

    if (!config.vocab_path && !config_dir.empty() && std::filesystem::exists(config_dir / "vocab.txt")) {
        config.vocab_path = config_dir / "vocab.txt";
    }
    auto counter = ctxpack::engine::create_token_counter(config.vocab_path);
    if (verbose) {
        std::cout << "[ctxpack] Token estimate: " << counter->name() << "\n";
    }

    ctxpack::engine::TreeWalker::SkipCallback on_skip;
    if (verbose) {
        on_skip = [](const std::filesystem::path& path, bool is_dir, ctxpack::engine::SkipReason reason) {
            std::cout << "[TreeWalker] Skip " << (is_dir ? "directory" : "file") << " ("
                      << ctxpack::engine::to_string(reason) << "): " << path.string() << "\n";
        };
    }

    try {
        auto result = ctxpack::engine::run_ingest(config, *counter, &g_stop, on_skip);
        if (as_json) {
            std::cout << ctxpack::engine::to_json(result).dump(2) << "\n";
        } else {
            std::cout << ctxpack::engine::summary_text(result, config.input_path) << "\n";
        }
    } catch (const ctxpack::engine::IngestError& e) {
        std::cerr << "[ctxpack] " << e.what() << "\n";
        if (e.kind() == ctxpack::engine::IngestError::Kind::EmptySelection) {
            std::cerr << "[ctxpack] Try loosening --include/--exclude or pass --no-ignore-files.\n";
        }
        return exit_code_for(e.kind());
    }

    return 0;
}
