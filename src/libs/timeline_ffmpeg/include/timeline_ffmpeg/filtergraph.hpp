#pragma once

#include <timeline_model/result.hpp>
#include <timeline_model/types.hpp>
#include <string>

namespace timeline_ffmpeg {

struct OutputSize {
    int width = 1920;
    int height = 1080;
};

// Filter chain for one instruction: trim, rebase timestamps, crop, scale back
// to the output size, then one drawtext per visible text op. Reads [0:v] and
// writes the label [v<segment_index>].
std::string segment_chain(const timeline_model::RenderInstruction& ins, const OutputSize& size);

std::string drawtext_filter(const timeline_model::TextDrawOp& op);

// Complete -filter_complex description ending in [outv].
timeline_model::Result<std::string> build_filtergraph(const timeline_model::RenderPlan& plan,
    const OutputSize& size);

} // namespace timeline_ffmpeg
