#include <timeline_loaders/config_loader.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

namespace timeline_loaders {

namespace {

using timeline_model::ValidationError;

std::optional<ValidationError> read_number(const nlohmann::json& j, const char* key,
    const std::string& prefix, double& out)
{
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number()) return ValidationError{ prefix + key, "expected a number" };
    out = j[key].get<double>();
    return std::nullopt;
}

std::optional<ValidationError> read_int(const nlohmann::json& j, const char* key,
    const std::string& prefix, int& out)
{
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_number_integer()) return ValidationError{ prefix + key, "expected an integer" };
    const bool in_range = j[key].is_number_unsigned()
        ? j[key].get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : j[key].get<std::int64_t>() >= std::numeric_limits<int>::min()
            && j[key].get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) return ValidationError{ prefix + key, "integer out of range" };
    out = j[key].get<int>();
    return std::nullopt;
}

std::optional<ValidationError> read_section(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && !j[key].is_object())
        return ValidationError{ key, "expected an object" };
    return std::nullopt;
}

timeline_model::Result<CompilerConfig> parse_config(const nlohmann::json& j) {
    if (!j.is_object()) return ValidationError{ "", "expected a JSON object" };
    CompilerConfig c;

    if (auto e = read_section(j, "cluster")) return *e;
    if (j.contains("cluster")) {
        const auto& cl = j["cluster"];
        if (auto e = read_number(cl, "timeEpsilon", "cluster.", c.time_epsilon)) return *e;
        if (auto e = read_number(cl, "distEpsilon", "cluster.", c.dist_epsilon)) return *e;
    }
    if (auto e = read_number(j, "zoomFactor", "", c.zoom_factor)) return *e;
    if (auto e = read_number(j, "zoomTime", "", c.zoom_time)) return *e;
    if (auto e = read_number(j, "idleTime", "", c.idle_time)) return *e;
    if (auto e = read_number(j, "fps", "", c.fps)) return *e;
    if (auto e = read_number(j, "transitionSeconds", "", c.transition_seconds)) return *e;

    if (auto e = read_section(j, "defaultZoom")) return *e;
    if (j.contains("defaultZoom")) {
        const auto& d = j["defaultZoom"];
        if (auto e = read_number(d, "x", "defaultZoom.", c.default_zoom.focal_x_percent)) return *e;
        if (auto e = read_number(d, "y", "defaultZoom.", c.default_zoom.focal_y_percent)) return *e;
        if (auto e = read_number(d, "scale", "defaultZoom.", c.default_zoom.scale)) return *e;
    }

    if (auto e = read_section(j, "output")) return *e;
    if (j.contains("output")) {
        const auto& o = j["output"];
        if (auto e = read_int(o, "width", "output.", c.output_width)) return *e;
        if (auto e = read_int(o, "height", "output.", c.output_height)) return *e;
    }

    if (j.contains("logLevel")) {
        if (!j["logLevel"].is_string()) return ValidationError{ "logLevel", "expected a string" };
        c.log_level = j["logLevel"].get<std::string>();
    }
    return c;
}

} // namespace

timeline_model::Result<CompilerConfig> load_config(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return ValidationError{ "json", e.what() };
    }
    return parse_config(j);
}

timeline_model::Result<CompilerConfig> load_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return ValidationError{ "file", "cannot open " + path };
    return load_config(f);
}

timeline_model::Result<CompilerConfig> find_config(const std::vector<std::string>& candidates) {
    for (const auto& path : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec))
            return load_config_file(path);
    }
    return CompilerConfig{};
}

} // namespace timeline_loaders
