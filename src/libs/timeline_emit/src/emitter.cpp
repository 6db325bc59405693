#include <timeline_emit/emitter.hpp>
#include <algorithm>

namespace timeline_emit {

timeline_model::CropRect crop_for_zoom(const timeline_model::ZoomEffect& zoom) {
    timeline_model::CropRect r;
    r.width = 1.0 / zoom.scale;
    r.height = 1.0 / zoom.scale;
    r.x = zoom.focal_x_percent / 100.0 - r.width / 2;
    r.y = zoom.focal_y_percent / 100.0 - r.height / 2;
    r.x = std::max(0.0, std::min(r.x, 1.0 - r.width));
    r.y = std::max(0.0, std::min(r.y, 1.0 - r.height));
    return r;
}

timeline_model::TimeWindow local_window(const timeline_model::Segment& segment,
    const timeline_model::TextOverlay& overlay)
{
    timeline_model::TimeWindow w;
    w.start = std::max(segment.start_time, overlay.start_time) - segment.start_time;
    w.end = std::min(segment.end_time, overlay.end_time) - segment.start_time;
    w.end = std::max(w.end, w.start);
    return w;
}

std::string escape_filter_text(const std::string& text) {
    // Two unescape passes run before drawtext sees the value: the graph parser
    // (terminators [ ] , ;) and then the option parser (separator :, quotes).
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        switch (c) {
        case '\\':
            out += "\\\\\\\\";
            break;
        case '\'':
            out += "\\\\\\'";
            break;
        case ':':
            out += "\\\\:";
            break;
        case '%':
            out += "\\\\\\%";
            break;
        case ',':
        case ';':
        case '[':
        case ']':
            out.push_back('\\');
            out.push_back(c);
            break;
        case '\r':
            break;
        default:
            out.push_back(c);
        }
    }
    return out;
}

timeline_model::TextDrawOp make_text_op(const timeline_model::Segment& segment,
    const timeline_model::TextOverlay& overlay)
{
    timeline_model::TextDrawOp op;
    op.overlay_id = overlay.id;
    op.text = overlay.text;
    op.escaped_text = escape_filter_text(overlay.text);
    op.x_percent = overlay.x_percent;
    op.y_percent = overlay.y_percent;
    op.font_size_pt = overlay.font_size_pt;
    op.color = overlay.color;
    op.font_family = overlay.font_family;
    op.background_color = overlay.background_color;
    op.padding = overlay.padding;
    const auto w = local_window(segment, overlay);
    op.local_start = w.start;
    op.local_end = w.end;
    return op;
}

timeline_model::RenderPlan emit_instructions(const std::vector<timeline_model::Segment>& segments) {
    timeline_model::RenderPlan plan;
    plan.instructions.reserve(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        timeline_model::RenderInstruction ins;
        ins.segment_index = i;
        ins.crop = crop_for_zoom(seg.active_zoom);
        ins.time_window = { seg.start_time, seg.end_time };
        for (const auto& o : seg.active_overlays)
            ins.text_ops.push_back(make_text_op(seg, o));
        plan.concat.expected_total_duration += seg.span();
        plan.instructions.push_back(std::move(ins));
    }
    plan.concat.segment_count = plan.instructions.size();
    return plan;
}

} // namespace timeline_emit
