#include <score-history/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace score_history {

namespace {

constexpr auto logger_name = "score-history";

}  // anonymous namespace

auto logger() -> std::shared_ptr<spdlog::logger> {
    static std::mutex mutex;
    auto lock = std::scoped_lock{mutex};
    if (auto existing = spdlog::get(logger_name)) return existing;
    return spdlog::stderr_color_mt(logger_name);
}

auto set_log_level(std::string_view level) -> bool {
    auto parsed = spdlog::level::from_str(std::string{level});
    if (parsed == spdlog::level::off && level != "off") return false;
    logger()->set_level(parsed);
    return true;
}

}  // namespace score_history
