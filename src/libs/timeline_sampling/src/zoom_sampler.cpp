#include <timeline_sampling/zoom_sampler.hpp>
#include <timeline_model/validation.hpp>
#include <algorithm>
#include <cmath>

namespace timeline_sampling {

namespace {

std::vector<const timeline_model::ZoomEffect*> by_start(const std::vector<timeline_model::ZoomEffect>& zooms) {
    std::vector<const timeline_model::ZoomEffect*> sorted;
    sorted.reserve(zooms.size());
    for (const auto& z : zooms) sorted.push_back(&z);
    std::stable_sort(sorted.begin(), sorted.end(),
        [](const timeline_model::ZoomEffect* a, const timeline_model::ZoomEffect* b) {
            return a->start_time < b->start_time;
        });
    return sorted;
}

const timeline_model::ZoomEffect* find_containing(double time,
    const std::vector<const timeline_model::ZoomEffect*>& sorted)
{
    if (sorted.empty()) return nullptr;
    if (time < sorted.front()->start_time || time > sorted.back()->end_time) return nullptr;
    for (const auto* z : sorted) {
        if (time >= z->start_time && time <= z->end_time) return z;
    }
    return nullptr;
}

timeline_model::ZoomEffect blend(const timeline_model::ZoomEffect& from,
    const timeline_model::ZoomEffect& to, double t)
{
    timeline_model::ZoomEffect out = to;
    out.focal_x_percent = lerp(from.focal_x_percent, to.focal_x_percent, t);
    out.focal_y_percent = lerp(from.focal_y_percent, to.focal_y_percent, t);
    out.scale = lerp(from.scale, to.scale, t);
    return out;
}

} // namespace

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

double ease_out_quint(double t) {
    t = std::clamp(t, 0.0, 1.0);
    return 1.0 - std::pow(1.0 - t, 5);
}

timeline_model::ZoomEffect sample_zoom(double time,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom)
{
    const auto sorted = by_start(zooms);
    if (const auto* z = find_containing(time, sorted)) return *z;
    return default_zoom;
}

timeline_model::ZoomEffect sample_export_zoom(double time,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom,
    double max_transition)
{
    const auto sorted = by_start(zooms);
    const auto* found = find_containing(time, sorted);
    if (!found) return default_zoom;

    timeline_model::ZoomEffect z = *found;
    z.scale = std::clamp(z.scale, 1.0, max_export_scale);
    if (z.transition == timeline_model::ZoomEffect::Transition::Instant) return z;

    const double transition = std::min(max_transition, (z.end_time - z.start_time) / 2);
    if (transition <= 0) return z;

    if (time < z.start_time + transition)
        return blend(default_zoom, z, ease_out_quint((time - z.start_time) / transition));
    if (time > z.end_time - transition)
        return blend(default_zoom, z, ease_out_quint((z.end_time - time) / transition));
    return z;
}

timeline_model::Result<std::vector<FrameZoom>> sample_frames(double duration, double fps,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const timeline_model::ZoomEffect& default_zoom,
    double max_transition)
{
    if (auto e = timeline_model::validate_duration(duration)) return *e;
    if (!std::isfinite(fps) || fps <= 0)
        return timeline_model::ValidationError{ "fps", "must be a positive number" };
    if (auto e = timeline_model::validate_zooms(zooms)) return *e;

    const auto frame_count = static_cast<std::size_t>(std::ceil(duration * fps));
    std::vector<FrameZoom> frames;
    frames.reserve(frame_count);
    for (std::size_t i = 0; i < frame_count; ++i) {
        const double t = std::min(static_cast<double>(i) / fps, duration);
        const auto z = sample_export_zoom(t, zooms, default_zoom, max_transition);
        frames.push_back({ t, z.focal_x_percent, z.focal_y_percent, z.scale });
    }
    return frames;
}

} // namespace timeline_sampling
