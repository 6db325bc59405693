#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <vector>

namespace timeline_cluster {

struct ClusterParams {
    double time_epsilon = 0.6;  // seconds since the cluster's latest click
    double dist_epsilon = 40.0; // pixels from the cluster's running centroid
    double zoom_level = 2.0;
    double active_duration = 2.0;
    double frame_width = 0;
    double frame_height = 0;
};

// Greedy single-lookback clustering. Events are stably sorted by time, then
// each one is compared only against the last open cluster: it joins when it
// is within time_epsilon of that cluster's latest click and within
// dist_epsilon of its running centroid, otherwise it opens a new cluster.
// Earlier clusters are never revisited or merged, so a slow drift can chain
// points whose endpoints are further apart than dist_epsilon.
//
// Events are taken by value: the caller hands over a finished capture.
timeline_model::Result<std::vector<timeline_model::ZoomKeyframe>> cluster_clicks(
    std::vector<timeline_model::ClickEvent> events,
    const ClusterParams& params = {});

// Keyframes -> AutoZoom effects on a timeline of `duration` seconds.
// Epoch timestamps (smallest time > 1e6) are rebased to the earliest one.
// Seeds whose clamped interval is empty are dropped.
timeline_model::Result<std::vector<timeline_model::ZoomEffect>> seed_zoom_effects(
    const std::vector<timeline_model::ZoomKeyframe>& keyframes,
    double duration);

} // namespace timeline_cluster
