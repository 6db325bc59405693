#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <istream>
#include <string>
#include <vector>

namespace timeline_loaders {

// Defaults match the recorder: 0.6s / 40px clustering, 2x zoom held for
// zoomTime + idleTime seconds, 30 fps.
struct CompilerConfig {
    double time_epsilon = 0.6;
    double dist_epsilon = 40.0;
    double zoom_factor = 2.0;
    double zoom_time = 1.0;
    double idle_time = 1.0;
    double fps = 30.0;
    double transition_seconds = 2.0;
    timeline_model::ZoomEffect default_zoom = timeline_model::make_default_zoom();
    int output_width = 1920;
    int output_height = 1080;
    std::string log_level = "info";

    double keyframe_duration() const { return zoom_time + idle_time; }
};

// Missing keys keep their defaults; keys of the wrong type are errors.
timeline_model::Result<CompilerConfig> load_config(std::istream& in);
timeline_model::Result<CompilerConfig> load_config_file(const std::string& path);

// First readable file of `candidates`, or defaults when none exists.
// A file that exists but does not parse is still an error.
timeline_model::Result<CompilerConfig> find_config(const std::vector<std::string>& candidates);

} // namespace timeline_loaders
