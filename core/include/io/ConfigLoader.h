#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include <stdexcept>
#include <string>
#include <json/json.h>
#include "kernel/SimConfig.h"

// Invalid or inconsistent configuration; fatal at startup.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Reads, parses and validates a JSON configuration file.
SimConfig loadConfig(const std::string& path);

// Same, from a document already in memory.
SimConfig parseConfigText(const std::string& text);

/**
 * Maps the document sections (servers, simulation, agents, posts,
 * resources) onto SimConfig. Absent optional keys keep their defaults;
 * wrongly typed values throw ConfigError naming the key.
 */
SimConfig parseConfig(const Json::Value& root);

// Cross-field checks; throws ConfigError on the first violation.
void validateConfig(const SimConfig& cfg);

#endif
