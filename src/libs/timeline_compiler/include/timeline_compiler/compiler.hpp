#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace timeline_compiler {

// Sorted, deduplicated segment boundaries: 0, duration and every effect or
// overlay start/end that falls inside [0, duration].
std::vector<double> collect_breakpoints(double duration,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const std::vector<timeline_model::TextOverlay>& overlays);

// Length of [start, end) shared with [a, b), never negative.
double overlap_length(double a, double b, double start, double end);

// Index of the zoom with the strictly greatest overlap with [a, b).
// Equal overlaps keep the earliest in input order. nullopt when nothing overlaps.
std::optional<std::size_t> resolve_active_zoom(double a, double b,
    const std::vector<timeline_model::ZoomEffect>& zooms);

// Overlays touching [a, b] with inclusive bounds, in input order. An overlay
// that ends exactly at `a` or starts exactly at `b` is included.
std::vector<timeline_model::TextOverlay> resolve_active_overlays(double a, double b,
    const std::vector<timeline_model::TextOverlay>& overlays);

// Partition [0, duration) into consecutive segments with one resolved zoom
// and an ordered overlay set each. All inputs are validated first; on error
// nothing is computed.
timeline_model::Result<std::vector<timeline_model::Segment>> compile_timeline(double duration,
    const std::vector<timeline_model::ZoomEffect>& zooms,
    const std::vector<timeline_model::TextOverlay>& overlays,
    const timeline_model::ZoomEffect& default_zoom = timeline_model::make_default_zoom());

} // namespace timeline_compiler
