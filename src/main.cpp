#include "config.hpp"
#include "http.hpp"
#include "event_bus.hpp"
#include "activity_log.hpp"
#include "system_stats.hpp"
#include "llm_service.hpp"
#include "admission_gate.hpp"
#include "completion_pipeline.hpp"
#include "control_api.hpp"
#include "http_server.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: costgate [options]\n"
              << "\n"
              << "Options:\n"
              << "  --listen HOST:PORT   Control API address (default: 127.0.0.1:5000)\n"
              << "  --provider NAME      Default upstream provider (groq, phidata)\n"
              << "  --config PATH        Config file (default: ~/.costgate/config.json)\n"
              << "  -m, --message PROMPT Run a single completion and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  GROQ_API_KEY         API key for Groq\n"
              << "  PHIDATA_API_KEY      API key for Phidata\n"
              << "  LLM_PROVIDER         Default provider\n"
              << "  MAX_THREADS          Concurrent upstream calls (default: 8)\n"
              << "  CACHE_TTL            Cache entry lifetime in seconds (default: 300)\n"
              << "  CACHE_MAX_SIZE       Maximum cached responses (default: 100)\n"
              << "  COSTGATE_LISTEN      Control API address\n"
              << "  COSTGATE_DEBUG       Enable debug logging\n";
}

static int run_once(costgate::CompletionPipeline& pipeline, const std::string& prompt) {
    costgate::CompletionRequest request;
    request.prompt = prompt;
    request.description = "CLI completion";
    try {
        auto res = pipeline.complete(request);
        std::cout << res.completion.text << '\n';
        std::cerr << "[llm] tokens: " << res.completion.usage.input_tokens << " in, "
                  << res.completion.usage.output_tokens << " out\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

static int run_server(const costgate::Config& config, costgate::ControlApi& api) {
    costgate::ControlServer server(config.server.listen, config.server.max_body,
                                   api.handler());
    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] Shutting down.\n";
    server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string listen_addr;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen_addr = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? costgate::Config::load()
                                      : costgate::Config::load_from(config_path);

    // CLI args beat file and environment
    if (!provider_name.empty()) config.provider = provider_name;
    if (!listen_addr.empty()) config.server.listen = listen_addr;

    costgate::EventBus bus;
    costgate::ActivityLog activities(config.server.activity_history);
    costgate::SystemStats stats(config.gate.max_threads);
    activities.attach(bus);
    stats.attach(bus);

    costgate::SocketHttpClient http_client;
    costgate::LlmService llm(config, http_client, &bus);
    costgate::AdmissionGate gate(config.gate.max_threads, &bus);

    costgate::CacheSettings cache_settings;
    cache_settings.ttl = std::chrono::seconds(config.cache.ttl_seconds);
    cache_settings.max_size = config.cache.max_size;
    costgate::CompletionPipeline pipeline(llm, gate, cache_settings, &bus);

    if (!message.empty()) {
        return run_once(pipeline, message);
    }

    pipeline.cache().start_pruner(std::chrono::seconds(config.cache.prune_interval));
    costgate::ControlApi api(pipeline, gate, llm, activities, stats);
    int rc = run_server(config, api);
    pipeline.cache().stop_pruner();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
