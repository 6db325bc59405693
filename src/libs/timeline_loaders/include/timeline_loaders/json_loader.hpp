#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <string>
#include <vector>

namespace timeline_loaders {

// Keyframe file written after a recording: clustered clicks plus capture settings.
struct KeyframeExport {
    std::vector<timeline_model::ZoomKeyframe> clicks;
    double width = 0;
    double height = 0;
    double duration = 0;
    double fps = 30;
    double zoom_factor = 2.0;
    double zoom_time = 1.0;
    double idle_time = 1.0;
    double exported_at = 0; // seconds since the Unix epoch
};

// Field parsers. Errors name the offending field, e.g. "zoomEffects[1].scale".
timeline_model::Result<timeline_model::ZoomEffect> parse_zoom_effect(const nlohmann::json& j, const std::string& path);
timeline_model::Result<timeline_model::TextOverlay> parse_text_overlay(const nlohmann::json& j, const std::string& path);

// `default_zoom` is used when the document carries no "defaultZoom" object.
timeline_model::Result<timeline_model::Project> load_project_from_json(std::istream& in,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom());
timeline_model::Result<timeline_model::Project> load_project_from_json_file(const std::string& path,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom());

// Raw click log: [{"time", "x", "y"}, ...] or [[time, x, y], ...].
timeline_model::Result<std::vector<timeline_model::ClickEvent>> load_clicks_from_json(std::istream& in);
timeline_model::Result<std::vector<timeline_model::ClickEvent>> load_clicks_from_json_file(const std::string& path);

timeline_model::Result<KeyframeExport> load_keyframe_export(std::istream& in);
timeline_model::Result<KeyframeExport> load_keyframe_export_file(const std::string& path);

nlohmann::json keyframe_export_to_json(const KeyframeExport& data);
nlohmann::json zoom_effects_to_json(const std::vector<timeline_model::ZoomEffect>& zooms);
nlohmann::json render_plan_to_json(const timeline_model::RenderPlan& plan);

// Pretty-printed with a two-space indent. Returns false if the file cannot be written.
bool write_json_file(const nlohmann::json& j, const std::string& path);

} // namespace timeline_loaders
