#include <timeline_cluster/cluster.hpp>
#include <timeline_model/log.hpp>
#include <timeline_model/validation.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace timeline_cluster {

namespace {

using timeline_model::ValidationError;

// Anything past this is a wall-clock timestamp rather than a recording offset.
const double epoch_threshold = 1e6;

struct OpenCluster {
    double first_time = 0;
    double last_time = 0;
    double sum_x = 0;
    double sum_y = 0;
    std::size_t count = 0;

    double cx() const { return sum_x / static_cast<double>(count); }
    double cy() const { return sum_y / static_cast<double>(count); }

    void add(const timeline_model::ClickEvent& e) {
        if (count == 0) first_time = e.time;
        last_time = e.time;
        sum_x += e.x;
        sum_y += e.y;
        ++count;
    }
};

std::optional<ValidationError> check_params(const ClusterParams& p) {
    if (!std::isfinite(p.time_epsilon) || p.time_epsilon < 0)
        return ValidationError{ "timeEpsilon", "must be a non-negative number" };
    if (!std::isfinite(p.dist_epsilon) || p.dist_epsilon < 0)
        return ValidationError{ "distEpsilon", "must be a non-negative number" };
    if (!std::isfinite(p.zoom_level) || p.zoom_level <= 1.0)
        return ValidationError{ "zoomLevel", "must be greater than 1" };
    if (!std::isfinite(p.active_duration) || p.active_duration <= 0)
        return ValidationError{ "activeDuration", "must be positive" };
    if (!std::isfinite(p.frame_width) || p.frame_width < 0)
        return ValidationError{ "width", "must not be negative" };
    if (!std::isfinite(p.frame_height) || p.frame_height < 0)
        return ValidationError{ "height", "must not be negative" };
    return std::nullopt;
}

bool joins(const OpenCluster& cl, const timeline_model::ClickEvent& e, const ClusterParams& p) {
    if (e.time - cl.last_time > p.time_epsilon) return false;
    const double dx = e.x - cl.cx();
    const double dy = e.y - cl.cy();
    return std::sqrt(dx * dx + dy * dy) <= p.dist_epsilon;
}

} // namespace

timeline_model::Result<std::vector<timeline_model::ZoomKeyframe>> cluster_clicks(
    std::vector<timeline_model::ClickEvent> events,
    const ClusterParams& params)
{
    if (auto e = check_params(params)) return *e;
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (auto e = timeline_model::validate_click(events[i], "clicks[" + std::to_string(i) + "]"))
            return *e;
    }

    std::stable_sort(events.begin(), events.end(),
        [](const timeline_model::ClickEvent& a, const timeline_model::ClickEvent& b) {
            return a.time < b.time;
        });

    std::vector<OpenCluster> clusters;
    for (const auto& e : events) {
        if (clusters.empty() || !joins(clusters.back(), e, params))
            clusters.emplace_back();
        clusters.back().add(e);
    }

    std::vector<timeline_model::ZoomKeyframe> out;
    out.reserve(clusters.size());
    for (std::size_t i = 0; i < clusters.size(); ++i) {
        const auto& cl = clusters[i];
        timeline_model::ZoomKeyframe kf;
        kf.id = "autozoom-" + std::to_string(i);
        kf.time = cl.first_time; // sorted, so the first member is the earliest
        kf.x = cl.cx();
        kf.y = cl.cy();
        kf.frame_width = params.frame_width;
        kf.frame_height = params.frame_height;
        kf.zoom_level = params.zoom_level;
        kf.active_duration = params.active_duration;
        out.push_back(std::move(kf));
    }

    timeline_model::logger()->debug("clustered {} clicks into {} keyframes", events.size(), out.size());
    return out;
}

timeline_model::Result<std::vector<timeline_model::ZoomEffect>> seed_zoom_effects(
    const std::vector<timeline_model::ZoomKeyframe>& keyframes,
    double duration)
{
    if (auto e = timeline_model::validate_duration(duration)) return *e;

    double min_time = 0;
    for (std::size_t i = 0; i < keyframes.size(); ++i) {
        const auto& kf = keyframes[i];
        const std::string path = "clicks[" + std::to_string(i) + "]";
        if (!std::isfinite(kf.time))
            return ValidationError{ path + ".time", "must be a finite number" };
        if (!std::isfinite(kf.x) || !std::isfinite(kf.y))
            return ValidationError{ path, "position must be finite" };
        if (!(kf.frame_width > 0) || !(kf.frame_height > 0))
            return ValidationError{ path, "frame width and height must be positive" };
        if (!std::isfinite(kf.zoom_level) || kf.zoom_level <= 1.0)
            return ValidationError{ path + ".zoomLevel", "must be greater than 1" };
        if (!std::isfinite(kf.active_duration) || kf.active_duration <= 0)
            return ValidationError{ path + ".duration", "must be positive" };
        min_time = i == 0 ? kf.time : std::min(min_time, kf.time);
    }
    const double base = min_time > epoch_threshold ? min_time : 0.0;

    std::vector<timeline_model::ZoomEffect> out;
    for (const auto& kf : keyframes) {
        timeline_model::ZoomEffect z;
        z.id = kf.id;
        z.start_time = std::clamp(kf.time - base, 0.0, duration);
        z.end_time = std::clamp(z.start_time + kf.active_duration, 0.0, duration);
        z.focal_x_percent = std::clamp(kf.x / kf.frame_width * 100.0, 0.0, 100.0);
        z.focal_y_percent = std::clamp(kf.y / kf.frame_height * 100.0, 0.0, 100.0);
        z.scale = kf.zoom_level;
        z.transition = timeline_model::ZoomEffect::Transition::Smooth;
        z.kind = timeline_model::ZoomEffect::Kind::AutoZoom;
        if (z.start_time >= z.end_time) {
            timeline_model::logger()->warn("dropping keyframe {} at t={}: outside timeline of {}s",
                kf.id, kf.time, duration);
            continue;
        }
        out.push_back(std::move(z));
    }
    return out;
}

} // namespace timeline_cluster
