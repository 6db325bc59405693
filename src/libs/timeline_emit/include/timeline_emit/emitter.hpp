#pragma once

#include <timeline_model/types.hpp>
#include <string>
#include <vector>

namespace timeline_emit {

// Crop window for a zoom in fractional frame coordinates, centered on the
// focal point and pushed back inside the frame.
timeline_model::CropRect crop_for_zoom(const timeline_model::ZoomEffect& zoom);

// Overlay lifetime clamped to the segment and shifted to the segment's own
// clock. Overlays that only touch the segment boundary get an empty window.
timeline_model::TimeWindow local_window(const timeline_model::Segment& segment,
    const timeline_model::TextOverlay& overlay);

// Escape text for an unquoted drawtext option value inside -filter_complex.
// \ ' : % are escaped for both the graph and the option level, , ; [ ] for
// the graph level only. Newlines pass through, carriage returns are dropped.
std::string escape_filter_text(const std::string& text);

timeline_model::TextDrawOp make_text_op(const timeline_model::Segment& segment,
    const timeline_model::TextOverlay& overlay);

// One instruction per segment, in segment order, plus the concat directive.
timeline_model::RenderPlan emit_instructions(const std::vector<timeline_model::Segment>& segments);

} // namespace timeline_emit
