#include <timeline_model/log.hpp>

namespace timeline_model {

std::shared_ptr<spdlog::logger> logger() {
    if (auto registered = spdlog::get(logger_name))
        return registered;
    return spdlog::default_logger();
}

} // namespace timeline_model
