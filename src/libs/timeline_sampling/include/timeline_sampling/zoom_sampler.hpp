#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <vector>

namespace timeline_sampling {

struct FrameZoom {
    double time = 0;
    double focal_x_percent = 50;
    double focal_y_percent = 50;
    double scale = 1.0;
};

// Export output keeps the zoomed frame readable: scale is capped here.
constexpr double max_export_scale = 3.0;

double lerp(double a, double b, double t);
// 1 - (1 - t)^5 with t clamped to [0, 1].
double ease_out_quint(double t);

// Zoom shown at `time` in preview: the first zoom (by start time) whose
// closed interval contains `time`, else `default_zoom`.
timeline_model::ZoomEffect sample_zoom(double time,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom());

// Like sample_zoom, with the scale clamped to [1, max_export_scale]. Smooth
// zooms ease in from and out to the default view with a quintic ease-out over
// min(max_transition, span / 2) seconds at each end.
timeline_model::ZoomEffect sample_export_zoom(double time,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom(),
    double max_transition = 2.0);

// Export zoom state for every frame time min(i / fps, duration).
timeline_model::Result<std::vector<FrameZoom>> sample_frames(double duration, double fps,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom(),
    double max_transition = 2.0);

} // namespace timeline_sampling
