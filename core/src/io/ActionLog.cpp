#include "io/ActionLog.h"
#include "net/HttpClient.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/rotating_file_sink.h>

namespace {

std::string timestampNow() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

std::shared_ptr<spdlog::logger> makeLogger(spdlog::sink_ptr sink) {
    auto logger = std::make_shared<spdlog::logger>("actions", std::move(sink));
    logger->set_pattern("%v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

Json::Value actionRecordJson(const ActionResult& result, const ActorRecord& actor,
                             const SlotInfo& slot) {
    Json::Value j(Json::objectValue);
    j["time"] = timestampNow();
    j["agent_name"] = actor.profile.name;
    j["method_name"] = actionName(result.kind);
    j["execution_time_seconds"] = result.durationMs / 1000.0;
    j["success"] = result.ok();
    j["status"] = statusName(result.status);
    j["tid"] = static_cast<Json::UInt64>(slot.slot);
    j["day"] = slot.day;
    j["hour"] = slot.hour;
    j["attempts"] = result.attempts;
    if (!result.ok()) {
        j["cause"] = causeName(result.cause);
        j["error"] = result.error;
    } else {
        j["error"] = Json::Value(Json::nullValue);
    }
    return j;
}

ActionLog::ActionLog(const std::string& path, std::size_t maxBytes, std::size_t maxFiles)
    : logger_(makeLogger(
          std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, maxBytes, maxFiles))) {}

ActionLog::ActionLog(spdlog::sink_ptr sink) : logger_(makeLogger(std::move(sink))) {}

ActionLog::~ActionLog() {
    logger_->flush();
}

void ActionLog::record(const ActionResult& result, const ActorRecord& actor, const SlotInfo& slot) {
    const std::string line = writeJson(actionRecordJson(result, actor, slot));
    if (result.ok()) {
        logger_->info(line);
    } else {
        logger_->warn(line);
    }
    ++recorded_;
}

void ActionLog::flush() {
    logger_->flush();
}
