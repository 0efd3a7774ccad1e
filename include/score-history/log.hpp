/// @file log.hpp
/// @brief Library logger.

#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace score_history {

/// The shared "score-history" logger, created on first use with a
/// stderr sink. Applications may replace it via spdlog::register_logger
/// before first use.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Set the logger level from a spdlog level name ("debug", "info", ...).
/// Unknown names leave the level unchanged and return false.
auto set_log_level(std::string_view level) -> bool;

}  // namespace score_history
