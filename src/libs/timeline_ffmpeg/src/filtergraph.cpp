#include <timeline_ffmpeg/filtergraph.hpp>
#include <timeline_emit/emitter.hpp>
#include <spdlog/fmt/fmt.h>

namespace timeline_ffmpeg {

namespace {

std::string num(double v) {
    return fmt::format("{:.6f}", v);
}

std::string input_label(const timeline_model::RenderPlan& plan, std::size_t i) {
    return plan.instructions.size() > 1 ? fmt::format("[s{}]", i) : std::string("[0:v]");
}

} // namespace

std::string drawtext_filter(const timeline_model::TextDrawOp& op) {
    std::string f = fmt::format("drawtext=text={}:x=w*{}-text_w/2:y=h*{}-text_h/2:fontsize={}:fontcolor={}",
        op.escaped_text, num(op.x_percent / 100.0), num(op.y_percent / 100.0),
        num(op.font_size_pt), timeline_emit::escape_filter_text(op.color));
    if (op.font_family)
        f += ":font=" + timeline_emit::escape_filter_text(*op.font_family);
    if (op.background_color) {
        f += fmt::format(":box=1:boxcolor={}@0.8:boxborderw={}",
            timeline_emit::escape_filter_text(*op.background_color), static_cast<int>(op.padding));
    } else {
        f += ":shadowcolor=black@0.8:shadowx=2:shadowy=2";
    }
    f += fmt::format(":enable='between(t,{},{})'", num(op.local_start), num(op.local_end));
    return f;
}

std::string segment_chain(const timeline_model::RenderInstruction& ins, const OutputSize& size) {
    std::string chain = fmt::format("trim=start={}:end={},setpts=PTS-STARTPTS",
        num(ins.time_window.start), num(ins.time_window.end));
    chain += fmt::format(",crop=w=iw*{}:h=ih*{}:x=iw*{}:y=ih*{}",
        num(ins.crop.width), num(ins.crop.height), num(ins.crop.x), num(ins.crop.y));
    chain += fmt::format(",scale={}:{}", size.width, size.height);
    for (const auto& op : ins.text_ops) {
        if (!op.visible()) continue;
        chain += "," + drawtext_filter(op);
    }
    return chain;
}

timeline_model::Result<std::string> build_filtergraph(const timeline_model::RenderPlan& plan,
    const OutputSize& size)
{
    if (size.width <= 0 || size.height <= 0)
        return timeline_model::ValidationError{ "output", "width and height must be positive" };
    if (plan.instructions.empty())
        return timeline_model::ValidationError{ "segments", "render plan has no segments" };
    if (plan.concat.segment_count != plan.instructions.size())
        return timeline_model::ValidationError{ "concat.count", "does not match the number of segments" };

    const std::size_t n = plan.instructions.size();
    std::string graph;
    if (n > 1) {
        graph += fmt::format("[0:v]split={}", n);
        for (std::size_t i = 0; i < n; ++i) graph += fmt::format("[s{}]", i);
        graph += ";";
    }
    for (std::size_t i = 0; i < n; ++i) {
        const auto& ins = plan.instructions[i];
        graph += input_label(plan, i) + segment_chain(ins, size) + fmt::format("[v{}];", ins.segment_index);
    }
    for (const auto& ins : plan.instructions) graph += fmt::format("[v{}]", ins.segment_index);
    graph += fmt::format("concat=n={}:v=1:a=0[outv]", n);
    return graph;
}

} // namespace timeline_ffmpeg
