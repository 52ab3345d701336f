#include "rowq/config.hpp"
#include "rowq/database.hpp"
#include "rowq/errors.hpp"
#include "rowq/pg_item_store.hpp"
#include "rowq/schema.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_USAGE = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n"
              << "Options:\n"
              << "  --table NAME       Item table (default: rowq_items, env ROWQ_TABLE)\n"
              << "  --dev              Enable debug logging\n"
              << "  --help             Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  init                                        Create table and indexes\n"
              << "  enqueue <routing_key> [--content TEXT] [--metadata TEXT]\n"
              << "  claim [routing_key]                         Claim the oldest new item\n"
              << "  complete <id>...                            Mark items completed\n"
              << "  fail <id>... --error TEXT                   Mark items failed\n"
              << "  reset <id>...                               Return items to new\n"
              << "  list [--routing-key RK] [--status STATUS]   List items as JSON\n"
              << "  requeue-failed [--routing-key RK] [--older-than SECONDS]\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST            PostgreSQL host (default: localhost)\n"
              << "  PG_PORT            PostgreSQL port (default: 5432)\n"
              << "  PG_DB              PostgreSQL database (default: postgres)\n"
              << "  PG_USER            PostgreSQL user (default: postgres)\n"
              << "  PG_PASSWORD        PostgreSQL password (default: postgres)\n"
              << "  DB_POOL_SIZE       Database pool size (default: 4)\n"
              << "  LOG_LEVEL          spdlog level (default: info)\n"
              << std::endl;
}

struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

int64_t parse_int64(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::logic_error&) {
        throw rowq::InvalidArgument("Invalid " + what + ": " + text);
    }
    if (consumed != text.size()) {
        throw rowq::InvalidArgument("Invalid " + what + ": " + text);
    }
    return value;
}

// Collects positional arguments and "--flag value" pairs after the command name
struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;

    static CommandArgs parse(const std::vector<std::string>& args) {
        CommandArgs parsed;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg.rfind("--", 0) == 0) {
                if (i + 1 >= args.size()) {
                    throw UsageError("Missing value for " + arg);
                }
                parsed.flags[arg] = args[++i];
            } else {
                parsed.positional.push_back(arg);
            }
        }
        return parsed;
    }

    std::optional<std::string> flag(const std::string& name) const {
        auto it = flags.find(name);
        if (it == flags.end()) return std::nullopt;
        return it->second;
    }

    std::vector<int64_t> ids() const {
        if (positional.empty()) {
            throw UsageError("At least one item id is required");
        }
        std::vector<int64_t> result;
        for (const auto& p : positional) {
            result.push_back(parse_int64(p, "item id"));
        }
        return result;
    }
};

bool is_known_command(const std::string& command) {
    static const std::vector<std::string> commands = {
        "init", "enqueue", "claim", "complete", "fail", "reset", "list", "requeue-failed"
    };
    return std::find(commands.begin(), commands.end(), command) != commands.end();
}

std::optional<rowq::Bytes> text_payload(const std::optional<std::string>& text) {
    if (!text) return std::nullopt;
    return rowq::Bytes(text->begin(), text->end());
}

int run_command(const std::string& command, const CommandArgs& args,
                const rowq::Config& config) {
    // Usage errors must not depend on the database being reachable
    if (!is_known_command(command)) {
        throw UsageError("Unknown command: " + command);
    }

    auto pool = std::make_shared<rowq::DatabasePool>(
        config.database.connection_string(),
        static_cast<size_t>(config.database.pool_size),
        config.database.pool_acquisition_timeout,
        config.database.statement_timeout,
        config.database.lock_timeout,
        config.database.idle_timeout);

    if (command == "init") {
        rowq::initialize_schema(*pool, config.queue.table_name);
        return 0;
    }

    rowq::PgItemStore store(pool, config.queue.table_name);

    if (command == "enqueue") {
        if (args.positional.size() != 1) {
            throw UsageError("enqueue takes exactly one routing key");
        }
        int64_t id = store.enqueue(args.positional[0],
                                   text_payload(args.flag("--content")),
                                   text_payload(args.flag("--metadata")));
        std::cout << nlohmann::json{{"id", id}}.dump() << std::endl;
        return 0;
    }

    if (command == "claim") {
        if (args.positional.size() > 1) {
            throw UsageError("claim takes at most one routing key");
        }
        std::optional<std::string> routing_key;
        if (!args.positional.empty()) routing_key = args.positional[0];

        auto item = store.claim(routing_key);
        std::cout << (item ? item->to_json().dump(2) : std::string("null")) << std::endl;
        return 0;
    }

    if (command == "complete") {
        store.set_status(args.ids(), rowq::ItemStatus::Completed, std::nullopt);
        return 0;
    }

    if (command == "fail") {
        auto error = args.flag("--error");
        if (!error) {
            throw UsageError("fail requires --error TEXT");
        }
        store.set_status(args.ids(), rowq::ItemStatus::Failed, error);
        return 0;
    }

    if (command == "reset") {
        store.set_status(args.ids(), rowq::ItemStatus::New, std::nullopt);
        return 0;
    }

    if (command == "list") {
        rowq::ItemFilter filter;
        filter.routing_key = args.flag("--routing-key");
        if (auto status = args.flag("--status")) {
            filter.status = rowq::parse_status(*status);
        }

        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : store.query(filter)) {
            out.push_back(item.to_json());
        }
        std::cout << out.dump(2) << std::endl;
        return 0;
    }

    if (command == "requeue-failed") {
        rowq::ItemFilter filter;
        filter.routing_key = args.flag("--routing-key");
        filter.status = rowq::ItemStatus::Failed;
        if (auto older_than = args.flag("--older-than")) {
            filter.created_before = std::chrono::system_clock::now() -
                                    std::chrono::seconds(parse_int64(*older_than, "age in seconds"));
        }

        std::vector<int64_t> ids;
        for (const auto& item : store.query(filter)) {
            ids.push_back(item.id);
        }
        store.set_status(ids, rowq::ItemStatus::New, std::nullopt);

        spdlog::info("Requeued {} failed items", ids.size());
        std::cout << nlohmann::json{{"requeued", ids}}.dump() << std::endl;
        return 0;
    }

    throw UsageError("Unknown command: " + command);
}

} // namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr so command output on stdout stays machine-readable
    spdlog::set_default_logger(spdlog::stderr_color_mt("rowq"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    rowq::Config config = rowq::Config::load();
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::string command;
    std::vector<std::string> rest;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!command.empty()) {
            rest.push_back(arg);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--table" && i + 1 < argc) {
            config.queue.table_name = argv[++i];
        } else if (arg == "--dev") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_USAGE;
        } else {
            command = arg;
        }
    }

    if (command.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    try {
        return run_command(command, CommandArgs::parse(rest), config);
    } catch (const UsageError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_USAGE;
    } catch (const rowq::InvalidArgument& e) {
        spdlog::error("Invalid argument: {}", e.what());
        return 1;
    } catch (const rowq::StoreUnavailable& e) {
        spdlog::error("Store unavailable: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }
}
