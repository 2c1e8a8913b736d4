/**
 * @file main.cpp
 * @brief ragctl: command line front end for the ragd backend
 */

#include "ragd/common.h"
#include "ragd/config.h"
#include "ragd/ipc/client.h"
#include "ragd/logger.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

using namespace ragd;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_STATUS = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_UNAVAILABLE = 3;

constexpr int QUERY_TIMEOUT_MS = 120000;
constexpr int ADMIN_TIMEOUT_MS = 60000;

struct Options {
    std::string config_path;
    std::string socket_path;
    std::string command;
    std::vector<std::string> args;
    bool json_output = false;
    bool stream = false;
    bool verbose = false;
    std::string trigger = "manual";
    std::string conversation_id;
    int max_tokens = DEFAULT_MAX_CONTEXT_TOKENS;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  query <question>     Ask a question against the local index\n"
              << "  sources              List knowledge sources\n"
              << "  reindex [--stream]   Rebuild the index, optionally following progress\n"
              << "  health               Run backend health checks\n"
              << "  init                 Prepare directories and seed default sources\n\n"
              << "Options:\n"
              << "  -c, --config PATH        Configuration file\n"
              << "  -s, --socket PATH        Backend socket path\n"
              << "  --json                   Print raw JSON responses\n"
              << "  --trigger NAME           Reindex trigger label (default: manual)\n"
              << "  --conversation ID        Conversation identifier for query\n"
              << "  --max-context-tokens N   Retrieval budget for query\n"
              << "  -v, --verbose            Log transport activity to stderr\n"
              << "  -h, --help               Show this help\n";
}

// Returns EXIT_OK, or EXIT_USAGE after printing a diagnostic
int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "ragctl: " << arg << " requires a value" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(EXIT_OK);
        } else if (arg == "-c" || arg == "--config") {
            if (!next(opts.config_path)) return EXIT_USAGE;
        } else if (arg == "-s" || arg == "--socket") {
            if (!next(opts.socket_path)) return EXIT_USAGE;
        } else if (arg == "--json") {
            opts.json_output = true;
        } else if (arg == "--stream") {
            opts.stream = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--trigger") {
            if (!next(opts.trigger)) return EXIT_USAGE;
        } else if (arg == "--conversation") {
            if (!next(opts.conversation_id)) return EXIT_USAGE;
        } else if (arg == "--max-context-tokens") {
            std::string value;
            if (!next(value)) return EXIT_USAGE;
            try {
                opts.max_tokens = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "ragctl: invalid token count: " << value << std::endl;
                return EXIT_USAGE;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "ragctl: unknown option " << arg << std::endl;
            return EXIT_USAGE;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

int fail(const std::string& what, const Error& err) {
    std::cerr << "ragctl: " << what << ": " << err.to_string() << std::endl;
    switch (err.kind) {
        case ErrorKind::IO:
        case ErrorKind::CONNECTION_CLOSED:
        case ErrorKind::DEADLINE_EXCEEDED:
        case ErrorKind::TIMEOUT:
        case ErrorKind::CLIENT_CLOSED:
            return EXIT_UNAVAILABLE;
        case ErrorKind::INVALID_ARGUMENT:
            return EXIT_USAGE;
        default:
            return EXIT_FAILURE_STATUS;
    }
}

std::string percent_text(const JobSnapshot& snap) {
    if (!snap.percent_complete) {
        return "  -";
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%3.0f%%", *snap.percent_complete);
    return buf;
}

void print_snapshot(const JobSnapshot& snap) {
    std::cout << "[" << percent_text(snap) << "] " << to_string(snap.status)
              << " " << snap.stage
              << " (" << snap.documents_processed << " documents)";
    if (snap.error_message) {
        std::cout << ": " << *snap.error_message;
    }
    std::cout << std::endl;
}

int run_query(IPCClient& client, const Options& opts) {
    std::string question;
    for (const auto& word : opts.args) {
        question += (question.empty() ? "" : " ") + word;
    }

    QueryRequest request;
    request.question = question;
    request.conversation_id = opts.conversation_id;
    request.max_context_tokens = opts.max_tokens;

    auto result = client.query(CallContext::with_timeout(Duration(QUERY_TIMEOUT_MS)), request);
    if (!result.ok()) {
        return fail("query failed", result.error);
    }

    const QueryResponse& resp = result.value;
    if (opts.json_output) {
        std::cout << resp.to_json().dump(2) << std::endl;
        return EXIT_OK;
    }

    std::cout << resp.summary << "\n";
    for (size_t i = 0; i < resp.steps.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << resp.steps[i] << "\n";
    }
    if (!resp.references.empty()) {
        std::cout << "\nReferences:\n";
        for (const auto& ref : resp.references) {
            std::cout << "  - " << ref.label;
            if (!ref.notes.empty()) {
                std::cout << ": " << ref.notes;
            }
            std::cout << "\n";
        }
    }
    char confidence[16];
    std::snprintf(confidence, sizeof(confidence), "%.2f", resp.confidence);
    std::cout << "\nconfidence " << confidence << "  trace " << resp.trace_id
              << "  " << resp.latency_ms << " ms" << std::endl;
    return resp.no_answer ? EXIT_FAILURE_STATUS : EXIT_OK;
}

int run_sources(IPCClient& client, const Options& opts) {
    auto result = client.list_sources(CallContext::with_timeout(Duration(ADMIN_TIMEOUT_MS)));
    if (!result.ok()) {
        return fail("listing sources failed", result.error);
    }
    if (opts.json_output) {
        std::cout << result.value.to_json().dump(2) << std::endl;
        return EXIT_OK;
    }
    if (result.value.sources.empty()) {
        std::cout << "No sources registered." << std::endl;
        return EXIT_OK;
    }
    for (const auto& src : result.value.sources) {
        std::cout << src.alias << "\t" << src.status << "\t" << src.size_bytes << " bytes\t"
                  << src.location << "\n";
    }
    std::cout << std::flush;
    return EXIT_OK;
}

int run_reindex(IPCClient& client, const Options& opts) {
    ReindexRequest request;
    request.trigger = opts.trigger;

    if (!opts.stream) {
        auto result = client.start_reindex(CallContext::with_timeout(Duration(ADMIN_TIMEOUT_MS)), request);
        if (!result.ok()) {
            return fail("reindex failed", result.error);
        }
        if (opts.json_output) {
            std::cout << result.value.to_json().dump(2) << std::endl;
        } else {
            std::cout << "Reindex job " << result.value.job_id << " started" << std::endl;
        }
        return EXIT_OK;
    }

    auto result = client.start_reindex_stream(CallContext::background(), request,
        [&opts](const JobSnapshot& snap) {
            if (opts.json_output) {
                std::cout << snap.to_json().dump() << std::endl;
            } else {
                print_snapshot(snap);
            }
        });
    if (!result.ok()) {
        return fail("reindex failed", result.error);
    }
    return EXIT_OK;
}

int run_health(IPCClient& client, const Options& opts) {
    auto result = client.health_check(CallContext::with_timeout(Duration(ADMIN_TIMEOUT_MS)));
    if (!result.ok()) {
        return fail("health check failed", result.error);
    }
    const HealthSummary& summary = result.value;
    if (opts.json_output) {
        std::cout << summary.to_json().dump(2) << std::endl;
    } else {
        std::cout << "overall: " << summary.overall_status << "\n";
        for (const auto& check : summary.results) {
            std::cout << "  " << check.status << "\t" << check.component << "\t" << check.message << "\n";
            if (!check.remediation.empty()) {
                std::cout << "      -> " << check.remediation << "\n";
            }
        }
        std::cout << std::flush;
    }
    return summary.overall_status == "fail" ? EXIT_FAILURE_STATUS : EXIT_OK;
}

int run_init(IPCClient& client, const Options& opts) {
    auto result = client.init_system(CallContext::with_timeout(Duration(ADMIN_TIMEOUT_MS)));
    if (!result.ok()) {
        return fail("init failed", result.error);
    }
    const InitResponse& resp = result.value;
    if (opts.json_output) {
        std::cout << resp.to_json().dump(2) << std::endl;
        return EXIT_OK;
    }
    std::cout << "catalog version " << resp.catalog_version << "\n";
    for (const auto& dir : resp.created_directories) {
        std::cout << "created " << dir << "\n";
    }
    for (const auto& src : resp.seeded_sources) {
        std::cout << "seeded " << src.alias << " -> " << src.location << "\n";
    }
    for (const auto& check : resp.dependency_checks) {
        std::cout << check.status << "\t" << check.component << "\t" << check.message << "\n";
    }
    std::cout << std::flush;
    return EXIT_OK;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int rc = parse_args(argc, argv, opts);
    if (rc != EXIT_OK) {
        return rc;
    }

    Logger::init(opts.verbose ? LogLevel::DEBUG : LogLevel::ERROR, false);

    std::string config_path = opts.config_path.empty() ? Config::default_path() : opts.config_path;
    auto config = Config::load(config_path);
    if (!config) {
        std::cerr << "ragctl: invalid configuration: " << config_path << std::endl;
        Logger::shutdown();
        return EXIT_USAGE;
    }

    ClientConfig client_config;
    client_config.socket_path = opts.socket_path.empty() ? config->socket_path : opts.socket_path;
    client_config.client_id = "ragctl";
    client_config.dial_timeout = Duration(config->dial_timeout_ms);
    // Unary commands carry their own deadline; a followed reindex waits for
    // its terminal snapshot however long the job takes
    client_config.read_timeout = Duration::zero();
    client_config.retry_schedule = RetrySchedule::from_millis(config->retry_schedule_ms);

    using Command = int (*)(IPCClient&, const Options&);
    Command command = nullptr;
    if (opts.command == "query") {
        if (opts.args.empty()) {
            std::cerr << "ragctl: query requires a question" << std::endl;
            Logger::shutdown();
            return EXIT_USAGE;
        }
        command = run_query;
    } else if (opts.command == "sources") {
        command = run_sources;
    } else if (opts.command == "reindex") {
        command = run_reindex;
    } else if (opts.command == "health") {
        command = run_health;
    } else if (opts.command == "init") {
        command = run_init;
    } else {
        std::cerr << "ragctl: unknown command " << opts.command << std::endl;
        Logger::shutdown();
        return EXIT_USAGE;
    }

    auto client = IPCClient::connect(client_config);
    if (!client.ok()) {
        rc = fail("cannot reach backend", client.error);
    } else {
        rc = command(*client.value, opts);
        client.value->close();
    }

    Logger::shutdown();
    return rc;
}
