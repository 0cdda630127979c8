#include "io/ConfigLoader.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <sstream>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

std::string keyPath(const std::string& where, const char* key) {
    return where.empty() ? std::string(key) : where + "." + key;
}

const Json::Value& section(const Json::Value& root, const char* name) {
    static const Json::Value kEmpty(Json::objectValue);
    if (!root.isMember(name)) return kEmpty;
    const Json::Value& v = root[name];
    if (!v.isObject()) throw ConfigError(std::string(name) + " must be an object");
    return v;
}

double getDouble(const Json::Value& obj, const char* key, const std::string& where, double def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isNumeric()) throw ConfigError(keyPath(where, key) + " must be a number");
    return v.asDouble();
}

std::uint32_t getUInt(const Json::Value& obj, const char* key, const std::string& where,
                      std::uint32_t def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isUInt()) throw ConfigError(keyPath(where, key) + " must be a non-negative integer");
    return v.asUInt();
}

int getInt(const Json::Value& obj, const char* key, const std::string& where, int def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isInt()) throw ConfigError(keyPath(where, key) + " must be an integer");
    return v.asInt();
}

bool getBool(const Json::Value& obj, const char* key, const std::string& where, bool def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isBool()) throw ConfigError(keyPath(where, key) + " must be true or false");
    return v.asBool();
}

std::string getString(const Json::Value& obj, const char* key, const std::string& where,
                      const std::string& def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isString()) throw ConfigError(keyPath(where, key) + " must be a string");
    return v.asString();
}

std::vector<std::string> getStrings(const Json::Value& obj, const char* key,
                                    const std::string& where,
                                    const std::vector<std::string>& def) {
    if (!obj.isMember(key)) return def;
    const Json::Value& v = obj[key];
    if (!v.isArray()) throw ConfigError(keyPath(where, key) + " must be a list of strings");
    std::vector<std::string> out;
    for (const auto& item : v) {
        if (!item.isString()) throw ConfigError(keyPath(where, key) + " must be a list of strings");
        out.push_back(item.asString());
    }
    return out;
}

// {"min": a, "max": b}
template <typename T, typename Get>
void getRange(const Json::Value& obj, const char* key, const std::string& where, T& lo, T& hi,
              Get get) {
    if (!obj.isMember(key)) return;
    const Json::Value& v = obj[key];
    const std::string path = keyPath(where, key);
    if (!v.isObject()) throw ConfigError(path + " must be an object with min and max");
    lo = get(v, "min", path, lo);
    hi = get(v, "max", path, hi);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

HourlyActivityTable parseHourly(const Json::Value& sim, std::uint32_t slots) {
    if (!sim.isMember("hourly_activity")) {
        throw ConfigError("simulation.hourly_activity is required");
    }
    const Json::Value& table = sim["hourly_activity"];
    if (!table.isObject()) {
        throw ConfigError("simulation.hourly_activity must map hours to fractions");
    }

    HourlyActivityTable out;
    for (const auto& key : table.getMemberNames()) {
        std::size_t used = 0;
        unsigned long hour = 0;
        try {
            hour = std::stoul(key, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used == 0 || used != key.size() || hour >= slots) {
            throw ConfigError("simulation.hourly_activity key '" + key +
                              "' is not an hour in [0, " + std::to_string(slots) + ")");
        }
        const Json::Value& v = table[key];
        if (!v.isNumeric()) {
            throw ConfigError("simulation.hourly_activity[" + key + "] must be a number");
        }
        try {
            out.set(static_cast<std::uint32_t>(hour), v.asDouble());
        } catch (const std::invalid_argument& e) {
            throw ConfigError("simulation.hourly_activity[" + key + "]: " + e.what());
        }
    }
    return out;
}

void parseWeights(const Json::Value& sim, SimConfig& cfg) {
    if (!sim.isMember("actions_likelihood")) return;
    const Json::Value& table = sim["actions_likelihood"];
    if (!table.isObject()) {
        throw ConfigError("simulation.actions_likelihood must map action names to weights");
    }
    for (const auto& name : table.getMemberNames()) {
        const Json::Value& v = table[name];
        if (!v.isNumeric()) {
            throw ConfigError("simulation.actions_likelihood[" + name + "] must be a number");
        }
        const double w = v.asDouble();
        if (w < 0.0) {
            throw ConfigError("simulation.actions_likelihood[" + name + "] must be >= 0 (got " +
                              std::to_string(w) + ")");
        }
        if (lower(name) == "none") {
            cfg.noopWeight = w;
            continue;
        }
        // Image posts need an image generator; the weight is accepted and dropped
        if (lower(name) == "image") {
            if (w > 0.0) {
                spdlog::warn("simulation.actions_likelihood[{}] = {} ignored: "
                             "image actions are not supported", name, w);
            }
            continue;
        }
        const auto kind = parseActionKind(name);
        if (!kind) throw ConfigError("simulation.actions_likelihood: unknown action '" + name + "'");
        cfg.actionWeights[actionIndex(*kind)] = w;
    }
}

// Exactly one of the percentage or the fixed-count key may be non-zero.
RateSpec parseRate(const Json::Value& sim, const char* pctKey, const char* fixedKey) {
    const double pct = getDouble(sim, pctKey, "simulation", 0.0);
    const std::uint32_t fixed = getUInt(sim, fixedKey, "simulation", 0);
    if (pct != 0.0 && fixed != 0) {
        throw ConfigError(std::string("simulation.") + pctKey + " and simulation." + fixedKey +
                          " are both set");
    }
    if (fixed != 0) return RateSpec::fixed(fixed);
    return RateSpec::percentage(pct);
}

std::vector<PageSpec> parsePages(const Json::Value& sim) {
    std::vector<PageSpec> pages;
    if (!sim.isMember("pages")) return pages;
    const Json::Value& list = sim["pages"];
    if (!list.isArray()) throw ConfigError("simulation.pages must be a list");
    for (const auto& p : list) {
        if (!p.isObject()) throw ConfigError("simulation.pages entries must be objects");
        PageSpec spec;
        spec.name = getString(p, "name", "simulation.pages", "");
        spec.feedUrl = getString(p, "feed_url", "simulation.pages", "");
        spec.leaning = getString(p, "leaning", "simulation.pages", "");
        if (spec.name.empty()) throw ConfigError("simulation.pages entry without a name");
        pages.push_back(std::move(spec));
    }
    return pages;
}

void checkFraction(double v, const std::string& what) {
    if (!(v >= 0.0 && v <= 1.0)) {
        throw ConfigError(what + " must be in [0, 1] (got " + std::to_string(v) + ")");
    }
}

}  // namespace

SimConfig parseConfig(const Json::Value& root) {
    if (!root.isObject()) throw ConfigError("configuration must be a JSON object");
    SimConfig cfg;

    // ---------- servers ----------
    const Json::Value& servers = section(root, "servers");
    cfg.servers.apiUrl = getString(servers, "api", "servers", cfg.servers.apiUrl);
    cfg.servers.llmUrl = getString(servers, "llm", "servers", cfg.servers.llmUrl);
    cfg.servers.llmModel = getString(servers, "llm_model", "servers", cfg.servers.llmModel);
    cfg.servers.llmApiKey = getString(servers, "llm_api_key", "servers", cfg.servers.llmApiKey);
    cfg.handlers.generation.temperature =
        getDouble(servers, "llm_temperature", "servers", cfg.handlers.generation.temperature);
    cfg.handlers.generation.maxTokens =
        getInt(servers, "llm_max_tokens", "servers", cfg.handlers.generation.maxTokens);

    // ---------- simulation ----------
    const Json::Value& sim = section(root, "simulation");
    cfg.name = getString(sim, "name", "simulation", cfg.name);
    cfg.days = getUInt(sim, "days", "simulation", cfg.days);
    cfg.slotsPerDay = getUInt(sim, "slots", "simulation", cfg.slotsPerDay);
    if (cfg.slotsPerDay == 0) throw ConfigError("simulation.slots must be > 0");
    cfg.startingAgents = getUInt(sim, "starting_agents", "simulation", cfg.startingAgents);
    cfg.startingPages = getUInt(sim, "starting_pages", "simulation", cfg.startingPages);
    cfg.pages = parsePages(sim);
    cfg.hourlyActivity = parseHourly(sim, cfg.slotsPerDay);
    parseWeights(sim, cfg);
    cfg.population.recruitment =
        parseRate(sim, "percentage_new_agents_iteration", "new_agents_iteration");
    cfg.population.churn =
        parseRate(sim, "percentage_removed_agents_iteration", "removed_agents_iteration");
    cfg.pagePublishProbability =
        getDouble(sim, "page_publish_probability", "simulation", cfg.pagePublishProbability);
    cfg.limitDailyActions = getBool(sim, "limit_daily_actions", "simulation", cfg.limitDailyActions);
    cfg.handlers.annotateEmotions =
        getBool(sim, "emotion_annotation", "simulation", cfg.handlers.annotateEmotions);
    if (sim.isMember("seed")) {
        const Json::Value& v = sim["seed"];
        if (!v.isUInt64()) throw ConfigError("simulation.seed must be a non-negative integer");
        cfg.seed = v.asUInt64();
    }

    const std::string contentName = getString(sim, "content_recsys", "simulation", "");
    if (!contentName.empty()) {
        const auto s = parseContentStrategy(contentName);
        if (!s) throw ConfigError("simulation.content_recsys: unknown strategy '" + contentName + "'");
        cfg.contentStrategy = *s;
    }
    const std::string followName = getString(sim, "follow_recsys", "simulation", "");
    if (!followName.empty()) {
        const auto s = parseFollowStrategy(followName);
        if (!s) throw ConfigError("simulation.follow_recsys: unknown strategy '" + followName + "'");
        cfg.followStrategy = *s;
    }

    // ---------- agents ----------
    const Json::Value& agents = section(root, "agents");
    PopulationConfig& pop = cfg.population;
    pop.dailyFollowProbability =
        getDouble(agents, "probability_of_daily_follow", "agents", pop.dailyFollowProbability);
    pop.followOnlyDailyActive =
        getBool(agents, "follow_only_daily_active", "agents", pop.followOnlyDailyActive);
    pop.maxDailyFollows = getUInt(agents, "max_daily_follows", "agents",
                                  static_cast<std::uint32_t>(pop.maxDailyFollows));
    pop.followCandidates = getUInt(agents, "n_follow_candidates", "agents",
                                   static_cast<std::uint32_t>(pop.followCandidates));
    cfg.handlers.followCandidates = pop.followCandidates;
    cfg.handlers.maxThreadLength = getUInt(agents, "max_length_thread_reading", "agents",
                                           static_cast<std::uint32_t>(cfg.handlers.maxThreadLength));

    ProfileConfig& prof = cfg.profiles;
    prof.activityVariance = getDouble(agents, "activity_variance", "agents", prof.activityVariance);
    getRange(agents, "round_actions", "agents", prof.minRoundActions, prof.maxRoundActions, getUInt);
    getRange(agents, "age", "agents", prof.minAge, prof.maxAge, getInt);
    getRange(agents, "n_interests", "agents", prof.minInterests, prof.maxInterests, getUInt);
    prof.interests = getStrings(agents, "interests", "agents", prof.interests);
    prof.nationalities = getStrings(agents, "nationalities", "agents", prof.nationalities);
    prof.leanings = getStrings(agents, "political_leanings", "agents", prof.leanings);
    prof.toxicityLevels = getStrings(agents, "toxicity_levels", "agents", prof.toxicityLevels);
    prof.languages = getStrings(agents, "languages", "agents", prof.languages);
    prof.educationLevels = getStrings(agents, "education_levels", "agents", prof.educationLevels);
    prof.genders = getStrings(agents, "genders", "agents", prof.genders);
    cfg.handlers.castOptions = getStrings(agents, "cast_options", "agents", prof.leanings);

    // {"enabled": bool, "epsilon": e, "mu": m, "theta": t, "cold_start": "neutral"|"inherited"}
    const Json::Value& od = section(agents, "opinion_dynamics");
    OpinionConfig& op = cfg.handlers.opinions;
    const std::string odPath = "agents.opinion_dynamics";
    op.enabled = getBool(od, "enabled", odPath, op.enabled);
    op.epsilon = getDouble(od, "epsilon", odPath, op.epsilon);
    op.mu = getDouble(od, "mu", odPath, op.mu);
    op.theta = getDouble(od, "theta", odPath, op.theta);
    const std::string coldStart = getString(od, "cold_start", odPath, "neutral");
    const auto cs = parseColdStart(lower(coldStart));
    if (!cs) throw ConfigError(odPath + ".cold_start must be neutral or inherited (got " + coldStart + ")");
    op.coldStart = *cs;

    // ---------- posts ----------
    const Json::Value& posts = section(root, "posts");
    cfg.handlers.emotions = getStrings(posts, "emotions", "posts", cfg.handlers.emotions);
    cfg.handlers.feedSize = getUInt(posts, "feed_size", "posts",
                                    static_cast<std::uint32_t>(cfg.handlers.feedSize));
    cfg.visibilityRounds = getInt(posts, "visibility_rounds", "posts", cfg.visibilityRounds);

    // ---------- resources ----------
    const Json::Value& res = section(root, "resources");
    DispatcherConfig& d = cfg.dispatch;
    d.parallel = getBool(res, "parallel", "resources", d.parallel);
    d.cpuWorkers = getUInt(res, "cpu_workers", "resources", static_cast<std::uint32_t>(d.cpuWorkers));
    d.heavyCapacity = getDouble(res, "heavy_capacity", "resources", d.heavyCapacity);
    d.heavyUnit = getDouble(res, "heavy_unit", "resources", d.heavyUnit);
    d.heavyQueueDepth = getUInt(res, "heavy_queue_depth", "resources",
                                static_cast<std::uint32_t>(d.heavyQueueDepth));
    d.lightRetries = getInt(res, "light_retries", "resources", d.lightRetries);
    cfg.servers.actionTimeoutMs =
        getInt(res, "action_timeout_ms", "resources", cfg.servers.actionTimeoutMs);
    d.seed = cfg.seed;

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const SimConfig& cfg) {
    if (cfg.days == 0) throw ConfigError("simulation.days must be > 0");
    if (cfg.slotsPerDay == 0) throw ConfigError("simulation.slots must be > 0");

    if (cfg.hourlyActivity.empty()) throw ConfigError("simulation.hourly_activity is required");
    const std::uint32_t lastHour = cfg.hourlyActivity.entries().rbegin()->first;
    if (lastHour >= cfg.slotsPerDay) {
        throw ConfigError("simulation.hourly_activity has hour " + std::to_string(lastHour) +
                          " but a day has " + std::to_string(cfg.slotsPerDay) + " slots");
    }

    for (std::size_t k = 0; k < kActionKindCount; ++k) {
        if (cfg.actionWeights[k] < 0.0) {
            throw ConfigError(std::string("negative weight for action ") +
                              kActionTraits[k].name);
        }
    }
    if (cfg.noopWeight < 0.0) throw ConfigError("negative weight for action none");

    if (cfg.population.churn.mode == RateMode::Percentage) {
        checkFraction(cfg.population.churn.value, "simulation.percentage_removed_agents_iteration");
    }
    if (cfg.population.recruitment.mode == RateMode::Percentage) {
        checkFraction(cfg.population.recruitment.value, "simulation.percentage_new_agents_iteration");
    }
    checkFraction(cfg.pagePublishProbability, "simulation.page_publish_probability");
    checkFraction(cfg.population.dailyFollowProbability, "agents.probability_of_daily_follow");

    const ProfileConfig& prof = cfg.profiles;
    if (prof.minRoundActions > prof.maxRoundActions) {
        throw ConfigError("agents.round_actions.min must be <= max (got " +
                          std::to_string(prof.minRoundActions) + " > " +
                          std::to_string(prof.maxRoundActions) + ")");
    }
    if (prof.minAge > prof.maxAge) throw ConfigError("agents.age.min must be <= max");
    if (prof.minInterests > prof.maxInterests) throw ConfigError("agents.n_interests.min must be <= max");
    if (prof.activityVariance < 0.0) throw ConfigError("agents.activity_variance must be >= 0");

    const OpinionConfig& op = cfg.handlers.opinions;
    if (!(op.epsilon >= 0.0 && op.epsilon <= 2.0)) {
        throw ConfigError("agents.opinion_dynamics.epsilon must be in [0,2] (got " +
                          std::to_string(op.epsilon) + ")");
    }
    checkFraction(op.mu, "agents.opinion_dynamics.mu");
    if (!(op.theta >= 0.0 && op.theta <= 2.0)) {
        throw ConfigError("agents.opinion_dynamics.theta must be in [0,2] (got " +
                          std::to_string(op.theta) + ")");
    }

    try {
        heavyConcurrency(cfg.dispatch);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("resources: ") + e.what());
    }
    if (cfg.dispatch.lightRetries < 0) throw ConfigError("resources.light_retries must be >= 0");
    if (cfg.servers.actionTimeoutMs <= 0) throw ConfigError("resources.action_timeout_ms must be > 0");
    if (cfg.handlers.generation.maxTokens <= 0) throw ConfigError("servers.llm_max_tokens must be > 0");
}

SimConfig parseConfigText(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errs)) {
        throw ConfigError("configuration is not valid JSON: " + errs);
    }
    return parseConfig(root);
}

SimConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("cannot open configuration file '" + path + "'");
    std::ostringstream buf;
    buf << in.rdbuf();
    try {
        return parseConfigText(buf.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}
