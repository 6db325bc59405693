#include <timeline_loaders/json_loader.hpp>
#include <fstream>

namespace timeline_loaders {

namespace {

using timeline_model::ValidationError;

ValidationError missing(const std::string& path, const char* key, const char* what) {
    return ValidationError{ path.empty() ? key : path + "." + key, std::string("expected ") + what };
}

double number_or(const nlohmann::json& j, const char* key, double def) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : def;
}

std::string string_or(const nlohmann::json& j, const char* key, const std::string& def) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : def;
}

// Present but of the wrong type is an error; absent is not.
std::optional<ValidationError> check_type(const nlohmann::json& j, const char* key,
    bool (nlohmann::json::*is)() const noexcept, const char* what, const std::string& path)
{
    if (j.contains(key) && !j[key].is_null() && !(j[key].*is)())
        return missing(path, key, what);
    return std::nullopt;
}

std::optional<ValidationError> require_number(const nlohmann::json& j, const char* key,
    const std::string& path, double& out)
{
    if (!j.contains(key) || !j[key].is_number()) return missing(path, key, "a number");
    out = j[key].get<double>();
    return std::nullopt;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty())
        return j[key].get<std::string>();
    return std::nullopt;
}

std::string indexed(const char* name, std::size_t i) {
    return std::string(name) + "[" + std::to_string(i) + "]";
}

template <typename T, typename Parse>
timeline_model::Result<T> parse_stream(std::istream& in, Parse parse) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        return ValidationError{ "json", e.what() };
    }
    return parse(j);
}

template <typename T, typename Load>
timeline_model::Result<T> load_file(const std::string& path, Load load) {
    std::ifstream f(path);
    if (!f) return ValidationError{ "file", "cannot open " + path };
    return load(f);
}

timeline_model::Result<timeline_model::Project> parse_project(const nlohmann::json& j,
    const timeline_model::ZoomEffect& default_zoom)
{
    if (!j.is_object()) return ValidationError{ "", "expected a JSON object" };
    timeline_model::Project out;
    out.default_zoom = default_zoom;
    if (auto e = require_number(j, "duration", "", out.duration)) return *e;

    if (auto e = check_type(j, "zoomEffects", &nlohmann::json::is_array, "an array", "")) return *e;
    if (auto e = check_type(j, "textOverlays", &nlohmann::json::is_array, "an array", "")) return *e;

    if (j.contains("zoomEffects") && j["zoomEffects"].is_array()) {
        const auto& arr = j["zoomEffects"];
        for (std::size_t i = 0; i < arr.size(); ++i) {
            auto z = parse_zoom_effect(arr[i], indexed("zoomEffects", i));
            if (!z) return z.error();
            out.zoom_effects.push_back(std::move(z).value());
        }
    }
    if (j.contains("textOverlays") && j["textOverlays"].is_array()) {
        const auto& arr = j["textOverlays"];
        for (std::size_t i = 0; i < arr.size(); ++i) {
            auto o = parse_text_overlay(arr[i], indexed("textOverlays", i));
            if (!o) return o.error();
            out.text_overlays.push_back(std::move(o).value());
        }
    }
    if (j.contains("defaultZoom") && j["defaultZoom"].is_object()) {
        const auto& d = j["defaultZoom"];
        out.default_zoom.focal_x_percent = number_or(d, "x", default_zoom.focal_x_percent);
        out.default_zoom.focal_y_percent = number_or(d, "y", default_zoom.focal_y_percent);
        out.default_zoom.scale = number_or(d, "scale", default_zoom.scale);
    }
    return out;
}

timeline_model::Result<std::vector<timeline_model::ClickEvent>> parse_clicks(const nlohmann::json& j) {
    // Either a bare array or the recorder's {"clicks": [...]} wrapper.
    const nlohmann::json* arr = &j;
    if (j.is_object() && j.contains("clicks")) arr = &j["clicks"];
    if (!arr->is_array()) return ValidationError{ "clicks", "expected an array" };

    std::vector<timeline_model::ClickEvent> out;
    out.reserve(arr->size());
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const auto& c = (*arr)[i];
        const std::string path = indexed("clicks", i);
        timeline_model::ClickEvent ev;
        if (c.is_array()) {
            if (c.size() < 3 || !c[0].is_number() || !c[1].is_number() || !c[2].is_number())
                return ValidationError{ path, "expected [time, x, y]" };
            ev.time = c[0].get<double>();
            ev.x = c[1].get<double>();
            ev.y = c[2].get<double>();
        } else if (c.is_object()) {
            if (auto e = require_number(c, "time", path, ev.time)) return *e;
            if (auto e = require_number(c, "x", path, ev.x)) return *e;
            if (auto e = require_number(c, "y", path, ev.y)) return *e;
        } else {
            return ValidationError{ path, "expected an object or [time, x, y]" };
        }
        out.push_back(ev);
    }
    return out;
}

timeline_model::Result<KeyframeExport> parse_keyframe_export(const nlohmann::json& j) {
    if (!j.is_object()) return ValidationError{ "", "expected a JSON object" };
    if (!j.contains("clicks") || !j["clicks"].is_array())
        return ValidationError{ "clicks", "expected an array" };

    KeyframeExport out;
    out.width = number_or(j, "width", 0);
    out.height = number_or(j, "height", 0);
    out.duration = number_or(j, "duration", 0);
    out.fps = number_or(j, "fps", out.fps);
    out.zoom_factor = number_or(j, "zoomFactor", out.zoom_factor);
    out.zoom_time = number_or(j, "zoomTime", out.zoom_time);
    out.idle_time = number_or(j, "idleTime", out.idle_time);
    out.exported_at = number_or(j, "exportedAt", 0);

    const auto& arr = j["clicks"];
    for (std::size_t i = 0; i < arr.size(); ++i) {
        const auto& c = arr[i];
        const std::string path = indexed("clicks", i);
        if (!c.is_object()) return ValidationError{ path, "expected an object" };
        timeline_model::ZoomKeyframe kf;
        kf.id = string_or(c, "id", "autozoom-" + std::to_string(i));
        if (auto e = require_number(c, "time", path, kf.time)) return *e;
        if (auto e = require_number(c, "x", path, kf.x)) return *e;
        if (auto e = require_number(c, "y", path, kf.y)) return *e;
        kf.frame_width = number_or(c, "width", out.width);
        kf.frame_height = number_or(c, "height", out.height);
        kf.zoom_level = number_or(c, "zoomLevel", out.zoom_factor);
        kf.active_duration = number_or(c, "duration", 2.0);
        out.clicks.push_back(std::move(kf));
    }
    return out;
}

const char* transition_name(timeline_model::ZoomEffect::Transition t) {
    return t == timeline_model::ZoomEffect::Transition::Instant ? "instant" : "smooth";
}

const char* kind_name(timeline_model::ZoomEffect::Kind k) {
    return k == timeline_model::ZoomEffect::Kind::AutoZoom ? "autozoom" : "manual";
}

} // namespace

timeline_model::Result<timeline_model::ZoomEffect> parse_zoom_effect(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) return ValidationError{ path, "expected an object" };
    timeline_model::ZoomEffect z;
    z.id = string_or(j, "id", "");
    if (auto e = require_number(j, "startTime", path, z.start_time)) return *e;
    if (auto e = require_number(j, "endTime", path, z.end_time)) return *e;
    if (auto e = require_number(j, "x", path, z.focal_x_percent)) return *e;
    if (auto e = require_number(j, "y", path, z.focal_y_percent)) return *e;
    if (auto e = require_number(j, "scale", path, z.scale)) return *e;

    const std::string transition = string_or(j, "transition", "smooth");
    if (transition == "instant")
        z.transition = timeline_model::ZoomEffect::Transition::Instant;
    else if (transition != "smooth")
        return ValidationError{ path + ".transition", "expected \"smooth\" or \"instant\"" };

    const std::string type = string_or(j, "type", "manual");
    if (type == "autozoom")
        z.kind = timeline_model::ZoomEffect::Kind::AutoZoom;
    else if (type != "manual")
        return ValidationError{ path + ".type", "expected \"manual\" or \"autozoom\"" };
    return z;
}

timeline_model::Result<timeline_model::TextOverlay> parse_text_overlay(const nlohmann::json& j, const std::string& path) {
    if (!j.is_object()) return ValidationError{ path, "expected an object" };
    timeline_model::TextOverlay o;
    o.id = string_or(j, "id", "");
    if (auto e = require_number(j, "startTime", path, o.start_time)) return *e;
    if (auto e = require_number(j, "endTime", path, o.end_time)) return *e;
    if (auto e = require_number(j, "x", path, o.x_percent)) return *e;
    if (auto e = require_number(j, "y", path, o.y_percent)) return *e;
    if (!j.contains("text") || !j["text"].is_string()) return missing(path, "text", "a string");
    o.text = j["text"].get<std::string>();

    if (auto e = check_type(j, "fontSize", &nlohmann::json::is_number, "a number", path)) return *e;
    if (auto e = check_type(j, "color", &nlohmann::json::is_string, "a string", path)) return *e;
    if (auto e = check_type(j, "fontFamily", &nlohmann::json::is_string, "a string", path)) return *e;
    if (auto e = check_type(j, "backgroundColor", &nlohmann::json::is_string, "a string", path)) return *e;
    if (auto e = check_type(j, "padding", &nlohmann::json::is_number, "a number", path)) return *e;
    o.font_size_pt = number_or(j, "fontSize", o.font_size_pt);
    o.color = string_or(j, "color", o.color);
    o.font_family = optional_string(j, "fontFamily");
    o.background_color = optional_string(j, "backgroundColor");
    o.padding = number_or(j, "padding", 0);
    return o;
}

timeline_model::Result<timeline_model::Project> load_project_from_json(std::istream& in,
    const timeline_model::ZoomEffect& default_zoom)
{
    return parse_stream<timeline_model::Project>(in,
        [&](const nlohmann::json& j) { return parse_project(j, default_zoom); });
}

timeline_model::Result<timeline_model::Project> load_project_from_json_file(const std::string& path,
    const timeline_model::ZoomEffect& default_zoom)
{
    return load_file<timeline_model::Project>(path,
        [&](std::istream& in) { return load_project_from_json(in, default_zoom); });
}

timeline_model::Result<std::vector<timeline_model::ClickEvent>> load_clicks_from_json(std::istream& in) {
    return parse_stream<std::vector<timeline_model::ClickEvent>>(in, parse_clicks);
}

timeline_model::Result<std::vector<timeline_model::ClickEvent>> load_clicks_from_json_file(const std::string& path) {
    return load_file<std::vector<timeline_model::ClickEvent>>(path,
        [](std::istream& in) { return load_clicks_from_json(in); });
}

timeline_model::Result<KeyframeExport> load_keyframe_export(std::istream& in) {
    return parse_stream<KeyframeExport>(in, parse_keyframe_export);
}

timeline_model::Result<KeyframeExport> load_keyframe_export_file(const std::string& path) {
    return load_file<KeyframeExport>(path,
        [](std::istream& in) { return load_keyframe_export(in); });
}

nlohmann::json keyframe_export_to_json(const KeyframeExport& data) {
    nlohmann::json clicks = nlohmann::json::array();
    for (const auto& kf : data.clicks) {
        clicks.push_back({
            { "id", kf.id },
            { "time", kf.time },
            { "x", kf.x },
            { "y", kf.y },
            { "width", kf.frame_width },
            { "height", kf.frame_height },
            { "zoomLevel", kf.zoom_level },
            { "duration", kf.active_duration },
            { "type", "autozoom" },
        });
    }
    return {
        { "clicks", std::move(clicks) },
        { "width", data.width },
        { "height", data.height },
        { "duration", data.duration },
        { "fps", data.fps },
        { "zoomFactor", data.zoom_factor },
        { "zoomTime", data.zoom_time },
        { "idleTime", data.idle_time },
        { "totalClicks", data.clicks.size() },
        { "exportedAt", data.exported_at },
    };
}

nlohmann::json zoom_effects_to_json(const std::vector<timeline_model::ZoomEffect>& zooms) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& z : zooms) {
        arr.push_back({
            { "id", z.id },
            { "startTime", z.start_time },
            { "endTime", z.end_time },
            { "x", z.focal_x_percent },
            { "y", z.focal_y_percent },
            { "scale", z.scale },
            { "transition", transition_name(z.transition) },
            { "type", kind_name(z.kind) },
        });
    }
    return { { "zoomEffects", std::move(arr) } };
}

nlohmann::json render_plan_to_json(const timeline_model::RenderPlan& plan) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& ins : plan.instructions) {
        nlohmann::json text = nlohmann::json::array();
        for (const auto& op : ins.text_ops) {
            nlohmann::json t = {
                { "id", op.overlay_id },
                { "text", op.text },
                { "escaped", op.escaped_text },
                { "x", op.x_percent },
                { "y", op.y_percent },
                { "fontSize", op.font_size_pt },
                { "color", op.color },
                { "padding", op.padding },
                { "localStart", op.local_start },
                { "localEnd", op.local_end },
            };
            if (op.font_family) t["fontFamily"] = *op.font_family;
            if (op.background_color) t["backgroundColor"] = *op.background_color;
            text.push_back(std::move(t));
        }
        segments.push_back({
            { "index", ins.segment_index },
            { "start", ins.time_window.start },
            { "end", ins.time_window.end },
            { "crop", { { "x", ins.crop.x }, { "y", ins.crop.y },
                        { "width", ins.crop.width }, { "height", ins.crop.height } } },
            { "text", std::move(text) },
        });
    }
    return {
        { "segments", std::move(segments) },
        { "concat", { { "count", plan.concat.segment_count },
                      { "totalDuration", plan.concat.expected_total_duration } } },
    };
}

bool write_json_file(const nlohmann::json& j, const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;
    f << j.dump(2) << '\n';
    return static_cast<bool>(f);
}

} // namespace timeline_loaders
