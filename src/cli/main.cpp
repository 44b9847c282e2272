#include <charconv>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "beacon/core/config/configuration.hpp"
#include "beacon/core/logging/logger.hpp"
#include "beacon/core/observability/span_store.hpp"
#include "beacon/core/observability/tracing_options.hpp"
#include "beacon/core/utils/terminal.hpp"

namespace {

namespace obs = beacon::core::observability;
using beacon::core::utils::Color;
using beacon::core::utils::Terminal;

struct CliOptions {
    std::filesystem::path config_path{"config/beacon.toml"};
    std::string command;
    std::optional<std::filesystem::path> db_path;
    obs::SpanQuery query;
    bool json{false};
};

void print_usage() {
    std::cerr << "usage: beacon-cli [-c config] init-db [--db path]\n"
              << "       beacon-cli [-c config] query [--db path] [--trace-id id] [--project-id id]\n"
              << "                  [--name name] [--limit n] [--json]\n";
}

std::optional<std::size_t> parse_limit(std::string_view text) {
    std::size_t value = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

// Returns false on malformed arguments.
bool parse_arguments(int argc, char** argv, CliOptions& options) {
    if (const char* env = std::getenv("BEACON_CONFIG_PATH")) {
        options.config_path = env;
    }

    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        const bool has_value = i + 1 < argc;

        if ((arg == "--config" || arg == "-c") && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--db" && has_value) {
            options.db_path = argv[++i];
        } else if (arg == "--trace-id" && has_value) {
            options.query.trace_id = argv[++i];
        } else if (arg == "--project-id" && has_value) {
            options.query.project_id = argv[++i];
        } else if (arg == "--name" && has_value) {
            options.query.name = argv[++i];
        } else if (arg == "--limit" && has_value) {
            auto limit = parse_limit(argv[++i]);
            if (!limit) {
                std::cerr << "invalid --limit value: " << argv[i] << "\n";
                return false;
            }
            options.query.limit = *limit;
        } else if (arg == "--json") {
            options.json = true;
        } else if (options.command.empty() && !arg.empty() && arg.front() != '-') {
            options.command = std::string{arg};
        } else {
            std::cerr << "unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return options.command == "init-db" || options.command == "query";
}

obs::TracingOptions load_tracing_options(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return {};
    }
    auto config = beacon::core::config::Configuration::load_from_file(config_path);
    beacon::core::logging::initialize_logging(config);
    return obs::TracingOptions::from_config(config);
}

int init_db(const std::filesystem::path& db_path) {
    if (db_path.has_parent_path()) {
        std::filesystem::create_directories(db_path.parent_path());
    }
    obs::SqliteSpanStore store(db_path);
    store.ensure_schema();
    Terminal::println("Span table ready in " + db_path.string(), Color::Green);
    return 0;
}

Color status_color(const std::string& status) {
    if (status == "ERROR") {
        return Color::Red;
    }
    if (status == "OK") {
        return Color::Green;
    }
    return Color::BrightBlack;
}

void print_table(const std::vector<obs::SpanRecord>& records) {
    Terminal::println(Terminal::column("START", 28) + Terminal::column("NAME", 32) + Terminal::column("STATUS", 8) +
                          Terminal::column("MS", 8) + Terminal::column("TRACE", 34) + "SPAN",
                      Color::BrightWhite);
    for (const auto& r : records) {
        Terminal::print(Terminal::column(r.start_time, 28));
        Terminal::print(Terminal::column(r.name, 32), Color::Cyan);
        Terminal::print(Terminal::column(r.status_code, 8), status_color(r.status_code));
        Terminal::print(Terminal::column(std::to_string(r.duration_ms), 8));
        Terminal::print(Terminal::column(r.trace_id, 34));
        Terminal::println(r.id);
    }
    Terminal::println(std::to_string(records.size()) + " span(s)", Color::BrightBlack);
}

int query(const std::filesystem::path& db_path, const CliOptions& options) {
    obs::SqliteSpanStore store(db_path);
    const auto records = store.query(options.query);

    if (options.json) {
        nlohmann::ordered_json out = nlohmann::ordered_json::array();
        for (const auto& r : records) {
            out.push_back(r.to_json());
        }
        std::cout << out.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << std::endl;
        return 0;
    }
    print_table(records);
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!parse_arguments(argc, argv, options)) {
        print_usage();
        return 2;
    }

    try {
        const auto tracing = load_tracing_options(options.config_path);
        const auto db_path = options.db_path.value_or(tracing.db_path);

        if (options.command == "init-db") {
            return init_db(db_path);
        }
        return query(db_path, options);
    } catch (const std::exception& ex) {
        std::cerr << "beacon-cli failed: " << ex.what() << std::endl;
        return 1;
    }
}
