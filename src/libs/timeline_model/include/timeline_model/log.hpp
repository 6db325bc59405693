#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace timeline_model {

constexpr const char* logger_name = "timelinefx";

// Shared logger for the libraries. Resolves to the registered "timelinefx"
// logger when an application installed one, otherwise spdlog's default.
std::shared_ptr<spdlog::logger> logger();

} // namespace timeline_model
