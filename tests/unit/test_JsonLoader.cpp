// =============================================================================
// Unit tests for JSON records: project documents, click logs, keyframe
// exports and render plans.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <timeline_loaders/json_loader.hpp>
#include <sstream>

using namespace timeline_loaders;
using timeline_model::ZoomEffect;
using Catch::Approx;

TEST_CASE("Project document loads zooms and overlays", "[JsonLoader]")
{
    std::istringstream in(R"({
        "duration": 12.5,
        "zoomEffects": [
            { "id": "z1", "startTime": 1, "endTime": 3, "x": 40, "y": 60, "scale": 2.5,
              "transition": "instant", "type": "autozoom" },
            { "startTime": 4, "endTime": 6, "x": 50, "y": 50, "scale": 1.5 }
        ],
        "textOverlays": [
            { "id": "t1", "startTime": 0, "endTime": 2, "x": 10, "y": 90, "text": "Intro",
              "fontSize": 30, "color": "#ffffff", "fontFamily": "Inter",
              "backgroundColor": "black", "padding": 6 },
            { "startTime": 2, "endTime": 5, "x": 50, "y": 50, "text": "Bare" }
        ]
    })");
    auto project = load_project_from_json(in);
    REQUIRE(project.ok());
    REQUIRE(project->duration == Approx(12.5));
    REQUIRE(project->zoom_effects.size() == 2);
    REQUIRE(project->text_overlays.size() == 2);

    const auto& z = project->zoom_effects[0];
    REQUIRE(z.id == "z1");
    REQUIRE(z.focal_x_percent == Approx(40));
    REQUIRE(z.scale == Approx(2.5));
    REQUIRE(z.transition == ZoomEffect::Transition::Instant);
    REQUIRE(z.kind == ZoomEffect::Kind::AutoZoom);
    REQUIRE(project->zoom_effects[1].transition == ZoomEffect::Transition::Smooth);
    REQUIRE(project->zoom_effects[1].kind == ZoomEffect::Kind::Manual);

    const auto& styled = project->text_overlays[0];
    REQUIRE(styled.font_size_pt == Approx(30));
    REQUIRE(styled.font_family.has_value());
    REQUIRE(*styled.font_family == "Inter");
    REQUIRE(*styled.background_color == "black");
    REQUIRE(styled.padding == Approx(6));

    const auto& bare = project->text_overlays[1];
    REQUIRE(bare.font_size_pt == Approx(24));
    REQUIRE(bare.color == "white");
    REQUIRE_FALSE(bare.font_family.has_value());
    REQUIRE_FALSE(bare.background_color.has_value());
    REQUIRE(bare.padding == Approx(0));

    REQUIRE(project->default_zoom.scale == Approx(1.0));
}

TEST_CASE("Project default zoom can be overridden by document and caller", "[JsonLoader]")
{
    ZoomEffect fallback = timeline_model::make_default_zoom();
    fallback.scale = 1.2;

    std::istringstream without(R"({ "duration": 5 })");
    auto a = load_project_from_json(without, fallback);
    REQUIRE(a.ok());
    REQUIRE(a->default_zoom.scale == Approx(1.2));

    std::istringstream with(R"({ "duration": 5, "defaultZoom": { "x": 20, "scale": 1.1 } })");
    auto b = load_project_from_json(with, fallback);
    REQUIRE(b.ok());
    REQUIRE(b->default_zoom.scale == Approx(1.1));
    REQUIRE(b->default_zoom.focal_x_percent == Approx(20));
    REQUIRE(b->default_zoom.focal_y_percent == Approx(50));
}

TEST_CASE("Missing and mistyped fields name the offending field", "[JsonLoader]")
{
    std::istringstream no_duration(R"({ "zoomEffects": [] })");
    auto a = load_project_from_json(no_duration);
    REQUIRE_FALSE(a.ok());
    REQUIRE(a.error().field == "duration");

    std::istringstream bad_scale(R"({ "duration": 5, "zoomEffects": [
        { "startTime": 0, "endTime": 1, "x": 50, "y": 50, "scale": "big" } ] })");
    auto b = load_project_from_json(bad_scale);
    REQUIRE_FALSE(b.ok());
    REQUIRE(b.error().field == "zoomEffects[0].scale");

    std::istringstream bad_padding(R"({ "duration": 5, "textOverlays": [
        { "startTime": 0, "endTime": 1, "x": 50, "y": 50, "text": "a", "padding": "wide" } ] })");
    auto c = load_project_from_json(bad_padding);
    REQUIRE_FALSE(c.ok());
    REQUIRE(c.error().field == "textOverlays[0].padding");

    std::istringstream bad_transition(R"({ "duration": 5, "zoomEffects": [
        { "startTime": 0, "endTime": 1, "x": 50, "y": 50, "scale": 2, "transition": "wobble" } ] })");
    REQUIRE_FALSE(load_project_from_json(bad_transition).ok());

    std::istringstream not_array(R"({ "duration": 5, "textOverlays": {} })");
    REQUIRE_FALSE(load_project_from_json(not_array).ok());
}

TEST_CASE("Malformed JSON reports the parser error", "[JsonLoader]")
{
    std::istringstream in("{ \"duration\": ");
    auto project = load_project_from_json(in);
    REQUIRE_FALSE(project.ok());
    REQUIRE(project.error().field == "json");
    REQUIRE_FALSE(project.error().message.empty());
}

TEST_CASE("Missing project file is reported", "[JsonLoader]")
{
    auto project = load_project_from_json_file("/nonexistent/timelinefx/project.json");
    REQUIRE_FALSE(project.ok());
    REQUIRE(project.error().field == "file");
}

TEST_CASE("Click logs load from objects or triples", "[JsonLoader]")
{
    std::istringstream objects(R"([ { "time": 0.5, "x": 10, "y": 20 }, { "time": 1.0, "x": 30, "y": 40 } ])");
    auto a = load_clicks_from_json(objects);
    REQUIRE(a.ok());
    REQUIRE(a->size() == 2);
    REQUIRE((*a)[1].x == Approx(30));

    std::istringstream triples(R"({ "clicks": [ [0.25, 5, 6], [0.75, 7, 8] ] })");
    auto b = load_clicks_from_json(triples);
    REQUIRE(b.ok());
    REQUIRE(b->size() == 2);
    REQUIRE((*b)[0].time == Approx(0.25));
    REQUIRE((*b)[1].y == Approx(8));

    std::istringstream bad(R"([ [0.25, 5] ])");
    auto c = load_clicks_from_json(bad);
    REQUIRE_FALSE(c.ok());
    REQUIRE(c.error().field == "clicks[0]");
}

TEST_CASE("Keyframe export is written in the recorder's layout and reads back", "[JsonLoader]")
{
    KeyframeExport data;
    timeline_model::ZoomKeyframe kf;
    kf.id = "autozoom-0";
    kf.time = 1.5;
    kf.x = 640;
    kf.y = 360;
    kf.frame_width = 1280;
    kf.frame_height = 720;
    kf.zoom_level = 2.0;
    kf.active_duration = 2.0;
    data.clicks.push_back(kf);
    data.width = 1280;
    data.height = 720;
    data.duration = 30;
    data.exported_at = 1700000000;

    const auto j = keyframe_export_to_json(data);
    REQUIRE(j["totalClicks"] == 1);
    REQUIRE(j["clicks"][0]["type"] == "autozoom");
    REQUIRE(j["clicks"][0]["zoomLevel"] == 2.0);
    REQUIRE(j["clicks"][0]["width"] == 1280.0);
    REQUIRE(j["zoomFactor"] == 2.0);
    REQUIRE(j["fps"] == 30.0);

    std::istringstream in(j.dump());
    auto back = load_keyframe_export(in);
    REQUIRE(back.ok());
    REQUIRE(back->clicks.size() == 1);
    REQUIRE(back->clicks[0].id == "autozoom-0");
    REQUIRE(back->clicks[0].x == Approx(640));
    REQUIRE(back->duration == Approx(30));
}

TEST_CASE("Keyframes without their own size use the envelope size", "[JsonLoader]")
{
    std::istringstream in(R"({ "width": 800, "height": 600, "duration": 9, "zoomFactor": 3,
        "clicks": [ { "time": 2, "x": 400, "y": 300 } ] })");
    auto data = load_keyframe_export(in);
    REQUIRE(data.ok());
    REQUIRE(data->clicks[0].id == "autozoom-0");
    REQUIRE(data->clicks[0].frame_width == Approx(800));
    REQUIRE(data->clicks[0].frame_height == Approx(600));
    REQUIRE(data->clicks[0].zoom_level == Approx(3));
    REQUIRE(data->clicks[0].active_duration == Approx(2.0));
}

TEST_CASE("Render plan serializes segments, text and concat", "[JsonLoader]")
{
    timeline_model::RenderPlan plan;
    timeline_model::RenderInstruction ins;
    ins.segment_index = 0;
    ins.crop = { 0.25, 0.25, 0.5, 0.5 };
    ins.time_window = { 0, 4 };
    timeline_model::TextDrawOp op;
    op.overlay_id = "t";
    op.text = "a:b";
    op.escaped_text = "a\\:b";
    op.local_start = 1;
    op.local_end = 2;
    op.background_color = "black";
    ins.text_ops.push_back(op);
    plan.instructions.push_back(ins);
    plan.concat = { 1, 4.0 };

    const auto j = render_plan_to_json(plan);
    REQUIRE(j["segments"].size() == 1);
    REQUIRE(j["segments"][0]["crop"]["width"] == 0.5);
    REQUIRE(j["segments"][0]["text"][0]["escaped"] == "a\\:b");
    REQUIRE(j["segments"][0]["text"][0]["backgroundColor"] == "black");
    REQUIRE_FALSE(j["segments"][0]["text"][0].contains("fontFamily"));
    REQUIRE(j["concat"]["count"] == 1);
    REQUIRE(j["concat"]["totalDuration"] == 4.0);
}

TEST_CASE("Zoom effects serialize back to editor records", "[JsonLoader]")
{
    ZoomEffect z;
    z.id = "autozoom-3";
    z.start_time = 1;
    z.end_time = 3;
    z.scale = 2;
    z.kind = ZoomEffect::Kind::AutoZoom;
    const auto j = zoom_effects_to_json({ z });
    REQUIRE(j["zoomEffects"][0]["type"] == "autozoom");
    REQUIRE(j["zoomEffects"][0]["transition"] == "smooth");

    auto parsed = parse_zoom_effect(j["zoomEffects"][0], "zoomEffects[0]");
    REQUIRE(parsed.ok());
    REQUIRE(parsed->id == "autozoom-3");
    REQUIRE(parsed->end_time == Approx(3));
}
