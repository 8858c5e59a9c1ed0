#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "core/envelope.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "db/iconnection_pool.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <format>
#include <future>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

using namespace sqlguard;

namespace {

std::atomic<bool> g_busy{false};
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    // Idle: behave like the default handler. Busy: cancel the running statement.
    if (!g_busy.load()) {
        std::_Exit(128 + signal);
    }
    g_interrupted.store(true);
}

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--dry-run] [config.toml] [SQL...]\n"
        "\n"
        "Validates each SQL statement, enforces the row ceiling and (unless\n"
        "--dry-run) executes it read-only, printing one JSON envelope per line.\n"
        "Without SQL arguments, statements are read from stdin one per line\n"
        "until EOF, 'quit' or 'exit'. Ctrl-C cancels the running statement.\n"
        "\n"
        "Environment: ROW_LIMIT_CEILING, SCHEMA_WHITELIST, FORBIDDEN_KEYWORDS,\n"
        "             DB_CONNECTION_STRING, DB_TYPE\n", prog);
}

struct CliOptions {
    bool dry_run = false;
    std::string config_file;
    std::vector<std::string> statements;
};

bool is_config_path(const std::string& arg) {
    return arg.size() > 5 && arg.ends_with(".toml");
}

/**
 * @brief Run one statement on a worker so that SIGINT can cancel it
 */
GuardResponse run_interruptible(GuardPipeline& pipeline, const std::string& sql) {
    std::stop_source stop;
    ExecutionOptions options;
    options.stop_token = stop.get_token();

    g_interrupted.store(false);
    g_busy.store(true);
    auto pending = std::async(std::launch::async,
        [&pipeline, &sql, &options] { return pipeline.run(sql, options); });

    while (pending.wait_for(std::chrono::milliseconds{50}) != std::future_status::ready) {
        if (g_interrupted.exchange(false)) {
            utils::log::info("Interrupt received, cancelling statement");
            stop.request_stop();
        }
    }
    g_busy.store(false);
    return pending.get();
}

bool handle_statement(GuardPipeline& pipeline, const std::string& sql, bool dry_run) {
    const auto response = dry_run ? pipeline.evaluate(sql) : run_interruptible(pipeline, sql);
    std::cout << envelope::to_json_string(response) << std::endl;
    return response.accepted && !response.error;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        CliOptions cli;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (arg == "--dry-run") {
                cli.dry_run = true;
            } else if (cli.config_file.empty() && cli.statements.empty() && is_config_path(arg)) {
                cli.config_file = arg;
            } else {
                cli.statements.push_back(arg);
            }
        }

        // Configuration
        auto config_result = cli.config_file.empty()
            ? ConfigLoader::load_from_env()
            : ConfigLoader::load_from_file(cli.config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        auto config = std::make_shared<const GuardConfig>(std::move(config_result.config));

        if (const auto level = utils::log::parse_level(config->logging.level)) {
            utils::log::set_level(*level);
        }

        utils::log::info(std::format("sqlguard starting: ceiling={} whitelist={} denylist={}{}",
            config->row_limit_ceiling, config->schema_whitelist.size(),
            config->forbidden_keywords.size(), cli.dry_run ? " (dry run)" : ""));

        PipelineBuilder builder;
        builder.with_config(config);
        if (cli.dry_run) {
            builder.with_dialect_from_config();
        } else {
            builder.with_database_from_config();
        }
        auto pipeline = builder.build();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        int exit_code = 0;
        if (!cli.statements.empty()) {
            for (const auto& sql : cli.statements) {
                if (!handle_statement(*pipeline, sql, cli.dry_run)) {
                    exit_code = 2;
                }
            }
        } else {
            std::string line;
            while (std::getline(std::cin, line)) {
                const auto sql = utils::trim(line);
                if (sql.empty()) continue;
                if (utils::iequals(sql, "quit") || utils::iequals(sql, "exit")) break;
                (void)handle_statement(*pipeline, sql, cli.dry_run);
            }
        }

        const auto stats = pipeline->get_stats();
        utils::log::info(std::format("sqlguard done: {} requests, {} rejected, {} failed, {} executed",
            stats.total_requests, stats.requests_rejected, stats.requests_failed, stats.requests_executed));

        if (const auto pool = pipeline->get_connection_pool()) {
            const auto ps = pool->get_stats();
            utils::log::info(std::format(
                "pool '{}': {} acquires, {} failed, {} discarded, {} recycled, {} health check failures",
                pool->name(), ps.total_acquires, ps.failed_acquires, ps.connections_discarded,
                ps.connections_recycled, ps.health_check_failures));
            pool->drain();
        }
        return exit_code;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }
}
