#include "oncourt/config.hpp"
#include "oncourt/display.hpp"
#include "oncourt/game_store.hpp"
#include "oncourt/pipeline.hpp"
#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

struct CliArgs {
    std::vector<oncourt::GameId> game_ids;
    oncourt::AppConfig config;
    std::unordered_set<std::string> reports;
    bool save = false;
    bool interactive = false;
    bool verbose = false;
};

void print_usage() {
    std::cerr << R"(Usage: oncourt <game_id>... [options]
  --data-dir <path>         Stored game data (default: $ONCOURT_DATA_DIR or data)
  --format <table|csv|json> Output format (default: $ONCOURT_FORMAT or table)
  --report <type>           lineups|stints|minutes|all (default: lineups)
  --save                    Write lineups to <data-dir>/lineups/<game_id>.json
  --interactive             Browse the result in a full screen viewer
  --verbose                 Log every substitution to stderr
)";
}

std::optional<oncourt::GameId> parse_game_id(const std::string& s) {
    oncourt::GameId id = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), id);
    if (ec != std::errc{} || end != s.data() + s.size()) return std::nullopt;
    return id;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    args.config = oncourt::config_from_env();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--save") { args.save = true; continue; }
        if (arg == "--interactive") { args.interactive = true; continue; }
        if (arg == "--verbose") { args.verbose = true; continue; }

        if (arg.starts_with("--")) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            std::string val = argv[++i];

            if (arg == "--data-dir") args.config.data_dir = val;
            else if (arg == "--format") {
                auto format = oncourt::parse_format(val);
                if (!format) {
                    std::cerr << "Unknown format: " << val << "\n";
                    return std::nullopt;
                }
                args.config.format = *format;
            }
            else if (arg == "--report") {
                if (val != "lineups" && val != "stints" && val != "minutes" && val != "all") {
                    std::cerr << "Unknown report: " << val << "\n";
                    return std::nullopt;
                }
                args.reports.insert(val);
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                return std::nullopt;
            }
            continue;
        }

        auto id = parse_game_id(arg);
        if (!id) {
            std::cerr << "Not a game id: " << arg << "\n";
            return std::nullopt;
        }
        args.game_ids.push_back(*id);
    }

    if (args.game_ids.empty()) return std::nullopt;
    if (args.reports.empty()) args.reports.insert("lineups");

    return args;
}

bool should_report(const std::unordered_set<std::string>& reports, const std::string& name) {
    return reports.contains("all") || reports.contains(name);
}

void print_error(oncourt::GameId game_id, const oncourt::PipelineError& err) {
    std::cerr << "Game " << game_id << ": " << oncourt::to_string(err.kind)
              << ": " << err.message << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    oncourt::load_env();

    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 1;
    }

    oncourt::GameStore store(args->config.data_dir);
    oncourt::LogCallback log;
    if (args->verbose) {
        log = [](const std::string& line) { std::cerr << line << "\n"; };
    }

    int failures = 0;
    for (auto game_id : args->game_ids) {
        std::cerr << "Reconstructing game " << game_id << "...\n";

        auto input = store.load_input(game_id);
        if (!input) {
            print_error(game_id, input.error());
            ++failures;
            continue;
        }

        auto result = oncourt::reconstruct_game(*input, log);
        if (!result) {
            print_error(game_id, result.error());
            ++failures;
            continue;
        }

        if (args->save) {
            if (auto saved = store.store_lineups(*result); !saved) {
                print_error(game_id, saved.error());
                ++failures;
                continue;
            }
        }

        if (args->interactive) {
            oncourt::run_viewer(*result);
            continue;
        }

        auto format = args->config.format;
        if (should_report(args->reports, "lineups")) {
            oncourt::display_lineups(*result, format, std::cout);
        }
        if (should_report(args->reports, "stints")) {
            oncourt::display_stints(*result, format, std::cout);
        }
        if (should_report(args->reports, "minutes")) {
            oncourt::display_minutes(*result, format, std::cout);
        }
    }

    return failures == 0 ? 0 : 1;
}
