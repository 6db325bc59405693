#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace timeline_model {

// Raw pointer click, frame-relative pixels. Seconds since recording start.
struct ClickEvent {
    double time = 0;
    double x = 0;
    double y = 0;
};

// Seed for an automatic zoom, one per click cluster.
struct ZoomKeyframe {
    std::string id;
    double time = 0;
    double x = 0;
    double y = 0;
    double frame_width = 0;
    double frame_height = 0;
    double zoom_level = 2.0;
    double active_duration = 2.0;
};

struct ZoomEffect {
    enum class Transition { Smooth, Instant };
    enum class Kind { Manual, AutoZoom };

    std::string id;
    double start_time = 0;
    double end_time = 0;
    double focal_x_percent = 50;
    double focal_y_percent = 50;
    double scale = 1.0;
    Transition transition = Transition::Smooth;
    Kind kind = Kind::Manual;
};

struct TextOverlay {
    std::string id;
    double start_time = 0;
    double end_time = 0;
    double x_percent = 50;
    double y_percent = 50;
    std::string text;
    double font_size_pt = 24;
    std::string color = "white";
    std::optional<std::string> font_family;
    std::optional<std::string> background_color;
    double padding = 0;
};

// Full-frame view used wherever no zoom effect is active.
inline ZoomEffect make_default_zoom() {
    ZoomEffect z;
    z.id = "default";
    return z;
}

struct Segment {
    double start_time = 0;
    double end_time = 0;
    ZoomEffect active_zoom;
    bool uses_default_zoom = true;
    std::vector<TextOverlay> active_overlays; // input order

    double span() const { return end_time - start_time; }
};

// Fractional frame coordinates, origin top-left.
struct CropRect {
    double x = 0;
    double y = 0;
    double width = 1;
    double height = 1;
};

struct TextDrawOp {
    std::string overlay_id;
    std::string text;
    std::string escaped_text;
    double x_percent = 50;
    double y_percent = 50;
    double font_size_pt = 24;
    std::string color;
    std::optional<std::string> font_family;
    std::optional<std::string> background_color;
    double padding = 0;
    double local_start = 0; // relative to segment start
    double local_end = 0;

    bool visible() const { return local_end > local_start; }
};

struct TimeWindow {
    double start = 0;
    double end = 0;
};

struct RenderInstruction {
    std::size_t segment_index = 0;
    CropRect crop;
    std::vector<TextDrawOp> text_ops;
    TimeWindow time_window;
};

struct ConcatDirective {
    std::size_t segment_count = 0;
    double expected_total_duration = 0;
};

struct RenderPlan {
    std::vector<RenderInstruction> instructions;
    ConcatDirective concat;
};

// Everything the editor hands over for one export.
struct Project {
    double duration = 0;
    std::vector<ZoomEffect> zoom_effects;
    std::vector<TextOverlay> text_overlays;
    ZoomEffect default_zoom = make_default_zoom();
};

} // namespace timeline_model
