// timelinec: click clustering, keyframe seeding and timeline compilation (C++20)

#include <timeline_cluster/cluster.hpp>
#include <timeline_compiler/compiler.hpp>
#include <timeline_emit/emitter.hpp>
#include <timeline_ffmpeg/filtergraph.hpp>
#include <timeline_loaders/config_loader.hpp>
#include <timeline_loaders/json_loader.hpp>
#include <timeline_model/log.hpp>
#include <timeline_sampling/zoom_sampler.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum ExitCode {
    exit_ok = 0,
    exit_usage = 1,
    exit_load = 2,
    exit_validation = 3,
};

const char* usage_text =
    "usage:\n"
    "  timelinec cluster --clicks <raw.json> --width W --height H --duration D [--out clicks.json]\n"
    "  timelinec seed --keyframes <clicks.json> [--out effects.json]\n"
    "  timelinec compile --project <project.json> [--out plan.json] [--filtergraph <file>]\n"
    "  timelinec frames --project <project.json>\n"
    "options: --config <path> --verbose\n";

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> init_logger(const std::string& level) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "timelinec_latest.log";
        logger = spdlog::basic_logger_mt(timeline_model::logger_name, log_file.string(), true);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    return logger;
}

struct Args {
    std::string command;
    std::map<std::string, std::string> options;
    bool verbose = false;

    bool has(const std::string& key) const { return options.count(key) != 0; }
    std::string get(const std::string& key) const {
        auto it = options.find(key);
        return it == options.end() ? std::string() : it->second;
    }
};

bool parse_args(int argc, char* argv[], Args& out) {
    if (argc < 2) return false;
    out.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            out.verbose = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) return false;
        out.options[arg.substr(2)] = argv[++i];
    }
    return true;
}

bool parse_number(const std::string& text, double& out) {
    try {
        std::size_t used = 0;
        out = std::stod(text, &used);
        return used == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

int report(const timeline_model::ValidationError& e, int code) {
    timeline_model::logger()->error("{}", e.to_string());
    (void)fprintf(stderr, "error: %s\n", e.to_string().c_str());
    return code;
}

int write_output(const nlohmann::json& j, const Args& args) {
    if (!args.has("out")) {
        std::cout << j.dump(2) << '\n';
        return exit_ok;
    }
    if (!timeline_loaders::write_json_file(j, args.get("out"))) {
        (void)fprintf(stderr, "error: cannot write %s\n", args.get("out").c_str());
        return exit_load;
    }
    timeline_model::logger()->info("wrote {}", args.get("out"));
    return exit_ok;
}

int run_cluster(const Args& args, const timeline_loaders::CompilerConfig& config) {
    double width = 0, height = 0, duration = 0;
    if (!args.has("clicks") || !parse_number(args.get("width"), width)
        || !parse_number(args.get("height"), height) || !parse_number(args.get("duration"), duration)) {
        (void)fprintf(stderr, "%s", usage_text);
        return exit_usage;
    }
    auto clicks = timeline_loaders::load_clicks_from_json_file(args.get("clicks"));
    if (!clicks) return report(clicks.error(), exit_load);

    timeline_cluster::ClusterParams params;
    params.time_epsilon = config.time_epsilon;
    params.dist_epsilon = config.dist_epsilon;
    params.zoom_level = config.zoom_factor;
    params.active_duration = config.keyframe_duration();
    params.frame_width = width;
    params.frame_height = height;
    const std::size_t click_count = clicks->size();
    auto keyframes = timeline_cluster::cluster_clicks(std::move(clicks).value(), params);
    if (!keyframes) return report(keyframes.error(), exit_validation);

    timeline_loaders::KeyframeExport data;
    data.clicks = std::move(keyframes).value();
    data.width = width;
    data.height = height;
    data.duration = duration;
    data.fps = config.fps;
    data.zoom_factor = config.zoom_factor;
    data.zoom_time = config.zoom_time;
    data.idle_time = config.idle_time;
    data.exported_at = std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    timeline_model::logger()->info("{} clicks -> {} auto-zoom keyframes", click_count, data.clicks.size());
    return write_output(timeline_loaders::keyframe_export_to_json(data), args);
}

int run_seed(const Args& args) {
    if (!args.has("keyframes")) {
        (void)fprintf(stderr, "%s", usage_text);
        return exit_usage;
    }
    auto data = timeline_loaders::load_keyframe_export_file(args.get("keyframes"));
    if (!data) return report(data.error(), exit_load);

    auto zooms = timeline_cluster::seed_zoom_effects(data->clicks, data->duration);
    if (!zooms) return report(zooms.error(), exit_validation);
    timeline_model::logger()->info("seeded {} of {} keyframes", zooms->size(), data->clicks.size());
    return write_output(timeline_loaders::zoom_effects_to_json(*zooms), args);
}

int run_compile(const Args& args, const timeline_loaders::CompilerConfig& config) {
    if (!args.has("project")) {
        (void)fprintf(stderr, "%s", usage_text);
        return exit_usage;
    }
    auto project = timeline_loaders::load_project_from_json_file(args.get("project"), config.default_zoom);
    if (!project) return report(project.error(), exit_load);

    auto segments = timeline_compiler::compile_timeline(project->duration,
        project->zoom_effects, project->text_overlays, project->default_zoom);
    if (!segments) return report(segments.error(), exit_validation);

    const auto plan = timeline_emit::emit_instructions(*segments);
    timeline_model::logger()->info("{} segments, total {}s", plan.concat.segment_count,
        plan.concat.expected_total_duration);

    if (args.has("filtergraph")) {
        auto graph = timeline_ffmpeg::build_filtergraph(plan,
            { config.output_width, config.output_height });
        if (!graph) return report(graph.error(), exit_validation);
        std::ofstream f(args.get("filtergraph"));
        if (!f || !(f << *graph << '\n')) {
            (void)fprintf(stderr, "error: cannot write %s\n", args.get("filtergraph").c_str());
            return exit_load;
        }
    }
    return write_output(timeline_loaders::render_plan_to_json(plan), args);
}

int run_frames(const Args& args, const timeline_loaders::CompilerConfig& config) {
    if (!args.has("project")) {
        (void)fprintf(stderr, "%s", usage_text);
        return exit_usage;
    }
    auto project = timeline_loaders::load_project_from_json_file(args.get("project"), config.default_zoom);
    if (!project) return report(project.error(), exit_load);

    auto frames = timeline_sampling::sample_frames(project->duration, config.fps,
        project->zoom_effects, project->default_zoom, config.transition_seconds);
    if (!frames) return report(frames.error(), exit_validation);
    for (const auto& f : *frames)
        std::cout << f.time << ' ' << f.focal_x_percent << ' ' << f.focal_y_percent << ' ' << f.scale << '\n';
    return exit_ok;
}

} // namespace

int main(int argc, char* argv[])
{
    Args args;
    if (!parse_args(argc, argv, args)) {
        (void)fprintf(stderr, "%s", usage_text);
        return exit_usage;
    }

    auto config = args.has("config")
        ? timeline_loaders::load_config_file(args.get("config"))
        : timeline_loaders::find_config({ "config/timelinefx.json", "timelinefx.json" });
    if (!config) {
        (void)fprintf(stderr, "config error: %s\n", config.error().to_string().c_str());
        return exit_load;
    }

    init_logger(args.verbose ? "debug" : config->log_level);

    if (args.command == "cluster") return run_cluster(args, *config);
    if (args.command == "seed") return run_seed(args);
    if (args.command == "compile") return run_compile(args, *config);
    if (args.command == "frames") return run_frames(args, *config);

    (void)fprintf(stderr, "unknown command: %s\n%s", args.command.c_str(), usage_text);
    return exit_usage;
}
