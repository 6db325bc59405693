// =============================================================================
// Unit tests for the compiler configuration file.
// =============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <timeline_loaders/config_loader.hpp>
#include <sstream>

using namespace timeline_loaders;
using Catch::Approx;

TEST_CASE("Empty config keeps recorder defaults", "[ConfigLoader]")
{
    std::istringstream in("{}");
    auto config = load_config(in);
    REQUIRE(config.ok());
    REQUIRE(config->time_epsilon == Approx(0.6));
    REQUIRE(config->dist_epsilon == Approx(40.0));
    REQUIRE(config->zoom_factor == Approx(2.0));
    REQUIRE(config->keyframe_duration() == Approx(2.0));
    REQUIRE(config->fps == Approx(30.0));
    REQUIRE(config->default_zoom.scale == Approx(1.0));
    REQUIRE(config->output_width == 1920);
    REQUIRE(config->output_height == 1080);
    REQUIRE(config->log_level == "info");
}

TEST_CASE("Config values override defaults", "[ConfigLoader]")
{
    std::istringstream in(R"({
        "cluster": { "timeEpsilon": 0.8, "distEpsilon": 25 },
        "zoomFactor": 2.5,
        "zoomTime": 1.5,
        "idleTime": 0.5,
        "fps": 60,
        "defaultZoom": { "x": 40, "y": 45, "scale": 1.1 },
        "output": { "width": 1280, "height": 720 },
        "logLevel": "debug"
    })");
    auto config = load_config(in);
    REQUIRE(config.ok());
    REQUIRE(config->time_epsilon == Approx(0.8));
    REQUIRE(config->dist_epsilon == Approx(25));
    REQUIRE(config->zoom_factor == Approx(2.5));
    REQUIRE(config->keyframe_duration() == Approx(2.0));
    REQUIRE(config->fps == Approx(60));
    REQUIRE(config->default_zoom.focal_x_percent == Approx(40));
    REQUIRE(config->default_zoom.focal_y_percent == Approx(45));
    REQUIRE(config->default_zoom.scale == Approx(1.1));
    REQUIRE(config->output_width == 1280);
    REQUIRE(config->output_height == 720);
    REQUIRE(config->log_level == "debug");
}

TEST_CASE("Partial sections leave other keys alone", "[ConfigLoader]")
{
    std::istringstream in(R"({ "cluster": { "distEpsilon": 10 } })");
    auto config = load_config(in);
    REQUIRE(config.ok());
    REQUIRE(config->dist_epsilon == Approx(10));
    REQUIRE(config->time_epsilon == Approx(0.6));
}

TEST_CASE("Wrongly typed config keys are errors", "[ConfigLoader]")
{
    std::istringstream eps(R"({ "cluster": { "timeEpsilon": "fast" } })");
    auto a = load_config(eps);
    REQUIRE_FALSE(a.ok());
    REQUIRE(a.error().field == "cluster.timeEpsilon");

    std::istringstream width(R"({ "output": { "width": 1280.5 } })");
    auto b = load_config(width);
    REQUIRE_FALSE(b.ok());
    REQUIRE(b.error().field == "output.width");

    std::istringstream section(R"({ "defaultZoom": 2 })");
    auto c = load_config(section);
    REQUIRE_FALSE(c.ok());
    REQUIRE(c.error().field == "defaultZoom");

    std::istringstream level(R"({ "logLevel": 3 })");
    REQUIRE_FALSE(load_config(level).ok());
}

TEST_CASE("Output size must fit in an int", "[ConfigLoader]")
{
    std::istringstream wide(R"({ "output": { "width": 4294969216 } })");
    auto a = load_config(wide);
    REQUIRE_FALSE(a.ok());
    REQUIRE(a.error().field == "output.width");

    std::istringstream negative(R"({ "output": { "height": -5000000000 } })");
    auto b = load_config(negative);
    REQUIRE_FALSE(b.ok());
    REQUIRE(b.error().field == "output.height");

    std::istringstream largest(R"({ "output": { "width": 2147483647 } })");
    auto c = load_config(largest);
    REQUIRE(c.ok());
    REQUIRE(c->output_width == 2147483647);
}

TEST_CASE("Default export transition matches the editor", "[ConfigLoader]")
{
    std::istringstream defaults("{}");
    auto a = load_config(defaults);
    REQUIRE(a.ok());
    REQUIRE(a->transition_seconds == Approx(2.0));

    std::istringstream custom(R"({ "transitionSeconds": 0.75 })");
    auto b = load_config(custom);
    REQUIRE(b.ok());
    REQUIRE(b->transition_seconds == Approx(0.75));
}

TEST_CASE("Malformed config reports the parser error", "[ConfigLoader]")
{
    std::istringstream in("{ cluster: }");
    auto config = load_config(in);
    REQUIRE_FALSE(config.ok());
    REQUIRE(config.error().field == "json");
}

TEST_CASE("No config file on the search path means defaults", "[ConfigLoader]")
{
    auto config = find_config({ "/nonexistent/timelinefx.json", "/nonexistent/config/timelinefx.json" });
    REQUIRE(config.ok());
    REQUIRE(config->time_epsilon == Approx(0.6));

    auto none = find_config({});
    REQUIRE(none.ok());
}

TEST_CASE("Explicit config file that is missing is an error", "[ConfigLoader]")
{
    auto config = load_config_file("/nonexistent/timelinefx.json");
    REQUIRE_FALSE(config.ok());
    REQUIRE(config.error().field == "file");
}
