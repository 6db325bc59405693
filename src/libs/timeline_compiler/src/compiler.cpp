#include <timeline_compiler/compiler.hpp>
#include <timeline_model/log.hpp>
#include <timeline_model/validation.hpp>
#include <algorithm>

namespace timeline_compiler {

namespace {

void add_if_inside(std::vector<double>& points, double t, double duration) {
    if (t >= 0 && t <= duration) points.push_back(t);
}

} // namespace

std::vector<double> collect_breakpoints(double duration,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const std::vector<timeline_model::TextOverlay>& overlays)
{
    std::vector<double> points = { 0.0, duration };
    points.reserve(2 + 2 * (zooms.size() + overlays.size()));
    for (const auto& z : zooms) {
        add_if_inside(points, z.start_time, duration);
        add_if_inside(points, z.end_time, duration);
    }
    for (const auto& o : overlays) {
        add_if_inside(points, o.start_time, duration);
        add_if_inside(points, o.end_time, duration);
    }
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());
    return points;
}

double overlap_length(double a, double b, double start, double end) {
    return std::max(0.0, std::min(b, end) - std::max(a, start));
}

std::optional<std::size_t> resolve_active_zoom(double a, double b,
    const std::vector<timeline_model::ZoomEffect>& zooms)
{
    std::optional<std::size_t> best;
    double best_overlap = 0.0;
    for (std::size_t i = 0; i < zooms.size(); ++i) {
        const double o = overlap_length(a, b, zooms[i].start_time, zooms[i].end_time);
        // Strict comparison keeps the first of equal candidates.
        if (o > best_overlap) {
            best_overlap = o;
            best = i;
        }
    }
    return best;
}

std::vector<timeline_model::TextOverlay> resolve_active_overlays(double a, double b,
    const std::vector<timeline_model::TextOverlay>& overlays)
{
    std::vector<timeline_model::TextOverlay> active;
    for (const auto& o : overlays) {
        if (o.start_time <= b && o.end_time >= a)
            active.push_back(o);
    }
    return active;
}

timeline_model::Result<std::vector<timeline_model::Segment>> compile_timeline(double duration,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const std::vector<timeline_model::TextOverlay>& overlays,
    const timeline_model::ZoomEffect& default_zoom)
{
    if (auto e = timeline_model::validate_duration(duration)) return *e;
    if (auto e = timeline_model::validate_zooms(zooms)) return *e;
    if (auto e = timeline_model::validate_overlays(overlays)) return *e;
    if (auto e = timeline_model::validate_default_zoom(default_zoom)) return *e;

    const std::vector<double> points = collect_breakpoints(duration, zooms, overlays);

    std::vector<timeline_model::Segment> segments;
    segments.reserve(points.size() - 1);
    for (std::size_t i = 0; i + 1 < points.size(); ++i) {
        timeline_model::Segment seg;
        seg.start_time = points[i];
        seg.end_time = points[i + 1];
        if (auto idx = resolve_active_zoom(seg.start_time, seg.end_time, zooms)) {
            seg.active_zoom = zooms[*idx];
            seg.uses_default_zoom = false;
        } else {
            seg.active_zoom = default_zoom;
            seg.uses_default_zoom = true;
        }
        seg.active_overlays = resolve_active_overlays(seg.start_time, seg.end_time, overlays);
        segments.push_back(std::move(seg));
    }

    timeline_model::logger()->debug("compiled {}s timeline: {} zooms, {} overlays -> {} segments",
        duration, zooms.size(), overlays.size(), segments.size());
    return segments;
}

} // namespace timeline_compiler
