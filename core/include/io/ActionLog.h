#ifndef ACTION_LOG_H
#define ACTION_LOG_H

#include <cstddef>
#include <memory>
#include <string>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "kernel/Actor.h"
#include "kernel/SimClock.h"

/**
 * Per-action telemetry, one JSON object per line:
 *   {"time", "agent_name", "method_name", "execution_time_seconds", "success",
 *    "status", "tid", "day", "hour", "attempts", "error"}
 * Lines go through a rotating file sink (maxBytes per file, maxFiles backups).
 */
class ActionLog {
public:
    static constexpr std::size_t kDefaultMaxBytes = 10 * 1024 * 1024;
    static constexpr std::size_t kDefaultMaxFiles = 5;

    explicit ActionLog(const std::string& path, std::size_t maxBytes = kDefaultMaxBytes,
                       std::size_t maxFiles = kDefaultMaxFiles);
    // Writes to an existing sink (tests use an ostream sink).
    explicit ActionLog(spdlog::sink_ptr sink);
    ~ActionLog();

    ActionLog(const ActionLog&) = delete;
    ActionLog& operator=(const ActionLog&) = delete;

    void record(const ActionResult& result, const ActorRecord& actor, const SlotInfo& slot);
    void flush();

    std::size_t recorded() const { return recorded_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t recorded_ = 0;
};

Json::Value actionRecordJson(const ActionResult& result, const ActorRecord& actor,
                             const SlotInfo& slot);

#endif
