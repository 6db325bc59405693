#include <timeline_model/validation.hpp>
#include <cmath>

namespace timeline_model {

namespace {

std::string indexed(const char* name, std::size_t i) {
    return std::string(name) + "[" + std::to_string(i) + "]";
}

std::optional<ValidationError> check_interval(double start, double end, const std::string& path) {
    if (!std::isfinite(start))
        return ValidationError{ path + ".startTime", "must be a finite number" };
    if (!std::isfinite(end))
        return ValidationError{ path + ".endTime", "must be a finite number" };
    if (start >= end)
        return ValidationError{ path, "startTime must be before endTime" };
    return std::nullopt;
}

std::optional<ValidationError> check_percent(double v, const std::string& field) {
    if (!std::isfinite(v) || v < 0 || v > 100)
        return ValidationError{ field, "must be a percentage in [0, 100]" };
    return std::nullopt;
}

std::optional<ValidationError> check_zoom_geometry(const ZoomEffect& zoom, const std::string& path) {
    if (auto e = check_percent(zoom.focal_x_percent, path + ".x")) return e;
    if (auto e = check_percent(zoom.focal_y_percent, path + ".y")) return e;
    if (!std::isfinite(zoom.scale) || zoom.scale < 1.0)
        return ValidationError{ path + ".scale", "must be at least 1" };
    return std::nullopt;
}

} // namespace

std::optional<ValidationError> validate_duration(double duration) {
    if (!std::isfinite(duration) || duration <= 0)
        return ValidationError{ "duration", "must be a positive number" };
    return std::nullopt;
}

std::optional<ValidationError> validate_click(const ClickEvent& click, const std::string& path) {
    if (!std::isfinite(click.time) || click.time < 0)
        return ValidationError{ path + ".time", "must be a non-negative number" };
    if (!std::isfinite(click.x) || click.x < 0)
        return ValidationError{ path + ".x", "must be a non-negative number" };
    if (!std::isfinite(click.y) || click.y < 0)
        return ValidationError{ path + ".y", "must be a non-negative number" };
    return std::nullopt;
}

std::optional<ValidationError> validate_zoom(const ZoomEffect& zoom, const std::string& path) {
    if (auto e = check_interval(zoom.start_time, zoom.end_time, path)) return e;
    return check_zoom_geometry(zoom, path);
}

std::optional<ValidationError> validate_default_zoom(const ZoomEffect& zoom) {
    return check_zoom_geometry(zoom, "defaultZoom");
}

std::optional<ValidationError> validate_overlay(const TextOverlay& overlay, const std::string& path) {
    if (auto e = check_interval(overlay.start_time, overlay.end_time, path)) return e;
    if (!std::isfinite(overlay.x_percent) || overlay.x_percent < 0)
        return ValidationError{ path + ".x", "must be a non-negative number" };
    if (!std::isfinite(overlay.y_percent) || overlay.y_percent < 0)
        return ValidationError{ path + ".y", "must be a non-negative number" };
    if (!std::isfinite(overlay.font_size_pt) || overlay.font_size_pt <= 0)
        return ValidationError{ path + ".fontSize", "must be positive" };
    if (!std::isfinite(overlay.padding) || overlay.padding < 0)
        return ValidationError{ path + ".padding", "must not be negative" };
    return std::nullopt;
}

std::optional<ValidationError> validate_zooms(const std::vector<ZoomEffect>& zooms) {
    for (std::size_t i = 0; i < zooms.size(); ++i)
        if (auto e = validate_zoom(zooms[i], indexed("zoomEffects", i))) return e;
    return std::nullopt;
}

std::optional<ValidationError> validate_overlays(const std::vector<TextOverlay>& overlays) {
    for (std::size_t i = 0; i < overlays.size(); ++i)
        if (auto e = validate_overlay(overlays[i], indexed("textOverlays", i))) return e;
    return std::nullopt;
}

} // namespace timeline_model
