#include "io/ActionLog.h"
#include "io/ConfigLoader.h"
#include "io/Snapshot.h"
#include "kernel/SimEngine.h"
#include "net/ChatBackends.h"
#include "net/GatewayError.h"
#include "net/HttpContentService.h"
#include "net/HttpRecommender.h"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRuntime = 1;
constexpr int kExitConfig = 2;

void printHelp() {
    std::cerr << "Usage: agora --config=<file> [options]\n"
              << "  --config=<file>          simulation configuration (or SIM_CONFIG env var)\n"
              << "  --population=<file>      start from a saved population\n"
              << "  --save=<file>            population output (default agents.json)\n"
              << "  --reset                  clear the content service before the run\n"
              << "  --content-recsys=<name>  content recommender, e.g. ReverseChronoFollowersPopularity\n"
              << "  --follow-recsys=<name>   follow recommender, e.g. PreferentialAttachment\n"
              << "  --offline                template text instead of a language model\n"
              << "  --sequential             run every action in order on one thread\n"
              << "  --log-file=<file>        action telemetry (default agent_execution.log)\n"
              << "  --metrics=<file>         per-day CSV metrics\n"
              << "  --seed=<n>               override the configured seed\n"
              << "  --verbose                debug logging\n"
              << "  --help                   this message\n";
}

struct CliOptions {
    std::string configPath;
    std::string populationPath;
    std::string savePath = "agents.json";
    std::string logFile = "agent_execution.log";
    std::string metricsPath;
    std::string contentRecsys;
    std::string followRecsys;
    std::string seed;
    bool reset = false;
    bool offline = false;
    bool sequential = false;
    bool verbose = false;
};

bool valueOf(const std::string& arg, const char* flag, std::string& out) {
    const std::string prefix = std::string(flag) + "=";
    if (arg.rfind(prefix, 0) != 0) return false;
    out = arg.substr(prefix.size());
    return true;
}

// Applies command-line overrides; bad values are configuration errors.
void applyOverrides(const CliOptions& opts, SimConfig& cfg) {
    if (!opts.seed.empty()) {
        std::size_t used = 0;
        unsigned long long seed = 0;
        try {
            seed = std::stoull(opts.seed, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != opts.seed.size()) {
            throw ConfigError("--seed must be a non-negative integer (got " + opts.seed + ")");
        }
        cfg.seed = seed;
        cfg.dispatch.seed = seed;
    }
    if (opts.sequential) cfg.dispatch.parallel = false;
    if (!opts.contentRecsys.empty()) {
        const auto s = parseContentStrategy(opts.contentRecsys);
        if (!s) throw ConfigError("unknown content recommender '" + opts.contentRecsys + "'");
        cfg.contentStrategy = *s;
    }
    if (!opts.followRecsys.empty()) {
        const auto s = parseFollowStrategy(opts.followRecsys);
        if (!s) throw ConfigError("unknown follow recommender '" + opts.followRecsys + "'");
        cfg.followStrategy = *s;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (const char* envConfig = std::getenv("SIM_CONFIG")) {
        opts.configPath = envConfig;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (valueOf(arg, "--config", opts.configPath) ||
            valueOf(arg, "--population", opts.populationPath) ||
            valueOf(arg, "--save", opts.savePath) ||
            valueOf(arg, "--log-file", opts.logFile) ||
            valueOf(arg, "--metrics", opts.metricsPath) ||
            valueOf(arg, "--content-recsys", opts.contentRecsys) ||
            valueOf(arg, "--follow-recsys", opts.followRecsys) ||
            valueOf(arg, "--seed", opts.seed)) {
            continue;
        } else if (arg == "--reset") {
            opts.reset = true;
        } else if (arg == "--offline") {
            opts.offline = true;
        } else if (arg == "--sequential") {
            opts.sequential = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printHelp();
            return kExitOk;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printHelp();
            return kExitRuntime;
        }
    }
    if (opts.configPath.empty()) {
        std::cerr << "Error: no configuration given (--config or SIM_CONFIG)\n";
        printHelp();
        return kExitRuntime;
    }

    auto console = spdlog::stderr_color_mt("agora");
    spdlog::set_default_logger(console);
    spdlog::set_pattern("[%H:%M:%S.%e][%l] %v");
    spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::info);

    SimConfig cfg;
    try {
        cfg = loadConfig(opts.configPath);
        applyOverrides(opts, cfg);
    } catch (const ConfigError& e) {
        spdlog::error("configuration: {}", e.what());
        return kExitConfig;
    }

    try {
        const std::chrono::milliseconds timeout(cfg.servers.actionTimeoutMs);
        HttpClient api(cfg.servers.apiUrl, timeout);
        HttpContentService content(api);
        HttpRecommender recommender(api, cfg.contentStrategy, cfg.followStrategy,
                                    cfg.visibilityRounds);

        std::unique_ptr<LanguageBackend> language;
        if (opts.offline) {
            language = std::make_unique<TemplateBackend>(cfg.handlers.castOptions,
                                                         cfg.handlers.emotions);
        } else {
            std::vector<std::string> headers;
            if (!cfg.servers.llmApiKey.empty()) {
                headers.push_back("Authorization: Bearer " + cfg.servers.llmApiKey);
            }
            HttpClient llm(cfg.servers.llmUrl, timeout, headers);
            language = std::make_unique<OpenAiChatBackend>(llm, cfg.servers.llmModel);
        }
        spdlog::info("simulation '{}': content {} / follow {}, language backend {}", cfg.name,
                     contentModeName(cfg.contentStrategy), followModeName(cfg.followStrategy),
                     language->name());

        if (opts.reset) {
            std::cerr << "Resetting content service state...\n";
            content.reset();
        }

        ActionServices services{&content, language.get(), &recommender};
        SimEngine engine(cfg, services);

        if (!opts.populationPath.empty()) {
            ActorPopulation population;
            FollowGraph graph;
            loadPopulation(opts.populationPath, population, graph);
            engine.adoptPopulation(std::move(population), std::move(graph));
        } else {
            engine.initPopulation();
            savePopulation(opts.savePath, engine.population(), engine.graph());
        }

        ActionLog actionLog(opts.logFile);
        engine.onAction([&](const ActionResult& r, const ActorRecord& a, const SlotInfo& s) {
            actionLog.record(r, a, s);
        });

        std::ofstream metrics;
        if (!opts.metricsPath.empty()) {
            metrics.open(opts.metricsPath, std::ios::app | std::ios::ate);
            if (!metrics.is_open()) {
                std::cerr << "Error: Could not open metrics file '" << opts.metricsPath << "'\n";
                return kExitRuntime;
            }
            if (metrics.tellp() == 0) logDayMetricsHeader(metrics);
        }

        const bool populationChanges =
            cfg.population.churn.value > 0.0 || cfg.population.recruitment.value > 0.0;
        engine.onDayEnd([&](const DaySummary& day) {
            if (metrics.is_open()) {
                logDayMetrics(day, engine.population(), engine.graph(), metrics);
                metrics.flush();
            }
            if (populationChanges) {
                savePopulation(opts.savePath, engine.population(), engine.graph());
            }
            const ActionTally t = day.totals();
            std::cerr << "Day " << (day.day + 1) << "/" << cfg.days << ": " << t.succeeded
                      << " ok, " << t.failed << " failed, " << t.skipped << " skipped, "
                      << engine.population().liveCount() << " live actors\n";
        });

        engine.run();
        actionLog.flush();

        std::cout << summaryToJson(engine.summary()).toStyledString();
        std::cout.flush();
        return kExitOk;
    } catch (const ConfigError& e) {
        spdlog::error("configuration: {}", e.what());
        return kExitConfig;
    } catch (const GatewayError& e) {
        spdlog::error("service unavailable: {}", e.what());
        return kExitRuntime;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return kExitRuntime;
    }
}
