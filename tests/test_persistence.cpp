#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "persistence/config_serializer.hpp"
#include "persistence/json.hpp"
#include "persistence/registry_serializer.hpp"
#include "persistence/timeline_serializer.hpp"
#include "registry/sound_registry.hpp"
#include "timeline/schedule.hpp"
#include "core/log.hpp"
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;
using namespace sk;

namespace {

const char* kRegistryDoc = R"({
  "clips": [
    {"name": "step_01.wav", "length": 0.4},
    {"name": "step_02.wav", "length": 0.5},
    {"name": "theme_intro.ogg", "length": 4.0},
    {"name": "theme_loop.ogg", "length": 8.0},
    {"name": "line_a.ogg", "length": 2.0}
  ],
  "buses": [
    {"name": "sfx", "params": {"lowpass": 22000}}
  ],
  "entries": [
    {"type": "folder", "name": "Footsteps", "children": [
      {"type": "sfx_variant_group", "name": "Grass", "pitch": [0.9, 1.1], "bus": "sfx", "variants": [
        {"type": "sfx_variant", "name": "A", "clip": "step_01.wav", "probability": 2},
        {"type": "sfx_variant", "name": "B", "clip": "step_02.wav"}
      ]}
    ]},
    {"type": "music", "name": "Theme", "intro_clip": "theme_intro.ogg", "loop_clip": "theme_loop.ogg", "volume": 0.7},
    {"type": "narration_group", "name": "Intro", "entries": [
      {"type": "narration_clip", "name": "Hello", "clip": "line_a.ogg", "pre_delay": 0.25}
    ]}
  ]
})";

std::string write_temp(const std::string& name, const std::string& text) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path, std::ios::binary) << text;
    return path.string();
}

} // namespace

TEST_CASE("json parser reports offsets", "[persistence]") {
    auto ok = persistence::json::parse(R"({"a": [1, 2.5e1, true, null], "s": "xé\n"})");
    REQUIRE(ok);
    const auto& root = ok.value();
    REQUIRE(root.find("a")->as_array().size() == 4);
    REQUIRE(root.find("a")->as_array()[1].as_number() == 25.0);
    REQUIRE(root.find("s")->as_string() == "x\xc3\xa9\n");

    auto bad = persistence::json::parse("{\"a\": 1,}");
    REQUIRE(bad.is_error());
    REQUIRE(bad.error().rfind("offset 8:", 0) == 0);

    REQUIRE(persistence::json::parse("[1] 2").is_error());
    REQUIRE(persistence::json::parse("").is_error());
}

TEST_CASE("registry documents load into a registry", "[persistence]") {
    audio::AssetCatalog catalog;
    auto roots = persistence::load_registry_json(kRegistryDoc, catalog);
    REQUIRE(roots);
    REQUIRE(roots.value().size() == 3);
    REQUIRE(catalog.clip_count() == 5);
    REQUIRE(catalog.bus_count() == 1);

    registry::SoundRegistry registry(1);
    persistence::populate_registry(registry, roots.value());

    auto grass = registry.get_entry_as<registry::SfxVariantGroup>("grass");
    REQUIRE(grass);
    const auto* group = grass->as<registry::SfxVariantGroup>();
    REQUIRE(group->variants.size() == 2);
    REQUIRE_THAT(group->pitch.min, WithinAbs(0.9, 1e-6));
    REQUIRE(group->bus == catalog.find_bus("sfx"));
    REQUIRE(group->variants[0]->as<registry::SfxVariant>()->probability == 2.0f);

    auto theme = registry.get_entry_as<registry::MusicDefinition>("Theme");
    REQUIRE(theme);
    REQUIRE(theme->as<registry::MusicDefinition>()->loop_clip->length_seconds == 8.0);
    REQUIRE_THAT(theme->as<registry::MusicDefinition>()->volume, WithinAbs(0.7, 1e-6));

    auto hello = registry.get_entry("Hello");
    REQUIRE(hello);
    REQUIRE(registry::as_narration_playable(*hello)->pre_delay == 0.25f);
}

TEST_CASE("registry loads fail on bad references", "[persistence]") {
    audio::AssetCatalog catalog;

    auto unknown_clip = persistence::load_registry_json(
        R"({"entries": [{"type": "sfx", "name": "Boom", "clip": "nope.wav"}]})", catalog);
    REQUIRE(unknown_clip.is_error());
    REQUIRE(unknown_clip.error().find("registry: ") == 0);
    REQUIRE(unknown_clip.error().find("unknown clip 'nope.wav'") != std::string::npos);

    auto wrong_child = persistence::load_registry_json(
        R"({"clips": [{"name": "a.wav", "length": 1}],
            "entries": [{"type": "sfx_variant_group", "name": "G", "variants": [
              {"type": "sfx", "name": "S", "clip": "a.wav"}]}]})", catalog);
    REQUIRE(wrong_child.is_error());

    auto wrong_type = persistence::load_registry_json(R"({"entries": [{"type": "sfx", "name": 3}]})", catalog);
    REQUIRE(wrong_type.is_error());
    REQUIRE(wrong_type.error().find("'name' must be a string") != std::string::npos);

    auto syntax = persistence::load_registry_json("{", catalog);
    REQUIRE(syntax.is_error());
    REQUIRE(syntax.error().find("offset") != std::string::npos);
}

TEST_CASE("a failed registry load leaves the catalog untouched", "[persistence]") {
    audio::AssetCatalog catalog;
    auto kept = catalog.add_clip("kept.wav", 1.0);

    auto failed = persistence::load_registry_json(
        R"({"clips": [{"name": "new.wav", "length": 2}, {"name": "kept.wav", "length": 9}],
            "buses": [{"name": "fx"}],
            "entries": [{"type": "sfx", "name": "Boom", "clip": "missing.wav"}]})", catalog);
    REQUIRE(failed.is_error());
    REQUIRE(catalog.clip_count() == 1);
    REQUIRE(catalog.bus_count() == 0);
    REQUIRE(catalog.find_clip("kept.wav") == kept);
    REQUIRE_FALSE(catalog.find_clip("new.wav"));

    auto ok = persistence::load_registry_json(
        R"({"clips": [{"name": "new.wav", "length": 2}],
            "entries": [{"type": "sfx", "name": "Boom", "clip": "kept.wav"}]})", catalog);
    REQUIRE(ok);
    REQUIRE(catalog.clip_count() == 2);
    REQUIRE(ok.value()[0]->as<registry::SfxDefinition>()->clip == kept);
}

TEST_CASE("timeline documents load with nested children", "[persistence]") {
    audio::AssetCatalog catalog;
    catalog.add_bus("music");
    const char* doc = R"({
      "name": "Level1",
      "tempo": {"bpm": 100, "beats_per_bar": 3},
      "playback": {"loop": true, "loop_length_beats": 12},
      "events": [
        {"id": "theme", "type": "play_music", "music": "Theme", "layer_index": 1, "align_to_beat": false},
        {"id": "swell", "type": "automation", "target_event_id": "theme", "time_mode": "seconds",
         "duration": 2, "curve": "ease_in_out", "min_value": 0.2, "max_value": 0.9},
        {"id": "filter", "type": "automation", "target": "bus_parameter", "bus": "music", "bus_param": "cutoff",
         "curve": {"keys": [{"time": 0, "value": 0}, {"time": 1, "value": 1, "in_tangent": 1}]}},
        {"id": "verse", "type": "nested", "start": 4, "time_scale": 2,
         "timeline": {"events": [{"type": "beat_marker", "label": "drop", "start": 1}]}},
        {"type": "play_effect", "sound": "Boom", "enabled": false, "position_offset": [1, 2, 3]}
      ]
    })";
    auto loaded = persistence::load_timeline_json(doc, catalog);
    REQUIRE(loaded);
    const auto& tl = *loaded.value();
    REQUIRE(tl.name == "Level1");
    REQUIRE(tl.tempo.bpm == 100.0f);
    REQUIRE(tl.tempo.beats_per_bar == 3);
    REQUIRE(tl.playback.loop);
    REQUIRE(tl.events.size() == 5);

    const auto* music = tl.events[0].as<timeline::PlayMusicEvent>();
    REQUIRE(music);
    REQUIRE(music->music.name == "Theme");
    REQUIRE(music->layer_index == 1);
    REQUIRE_FALSE(music->align_to_beat);
    REQUIRE(music->loop);

    const auto* swell = tl.events[1].as<timeline::AutomationEvent>();
    REQUIRE(swell);
    REQUIRE(tl.events[1].time_mode == timeline::TimeMode::Seconds);
    REQUIRE_THAT(swell->curve.evaluate(0.5f), WithinAbs(0.5, 1e-6));

    const auto* filter = tl.events[2].as<timeline::AutomationEvent>();
    REQUIRE(filter->target == timeline::AutomationTarget::BusParameter);
    REQUIRE(filter->bus == catalog.find_bus("music"));
    REQUIRE(filter->curve.keys().size() == 2);

    const auto* verse = tl.events[3].as<timeline::NestedTimelineEvent>();
    REQUIRE(verse);
    REQUIRE(verse->timeline);
    REQUIRE(verse->time_scale == 2.0f);

    const auto* boom = tl.events[4].as<timeline::PlayEffectEvent>();
    REQUIRE_FALSE(tl.events[4].enabled);
    REQUIRE(boom->position_offset == core::Vec3(1.0f, 2.0f, 3.0f));

    const auto schedule = timeline::build_schedule(loaded.value(), nullptr);
    REQUIRE(schedule.events.size() == 4);
    // 4 beats at 100 bpm, then 1 beat scaled by 2
    const auto& drop = schedule.events.back();
    REQUIRE(drop.id == "verse/@0");
    REQUIRE_THAT(drop.start_seconds, WithinAbs(3.6, 1e-6));
}

TEST_CASE("timeline loads reject unknown names", "[persistence]") {
    audio::AssetCatalog catalog;
    REQUIRE(persistence::load_timeline_json(R"({"events": [{"type": "explode"}]})", catalog).is_error());
    REQUIRE(persistence::load_timeline_json(R"({"events": [{"type": "beat_marker", "time_mode": "bars"}]})", catalog).is_error());
    auto bus = persistence::load_timeline_json(
        R"({"events": [{"type": "automation", "target": "bus_parameter", "bus": "ghost"}]})", catalog);
    REQUIRE(bus.is_error());
    REQUIRE(bus.error().find("timeline: ") == 0);
    REQUIRE(persistence::load_timeline_json(R"({"events": [{"type": "play_effect", "position_offset": [1, 2]}]})", catalog).is_error());
}

TEST_CASE("config documents fill engine and mixer settings", "[persistence]") {
    audio::AssetCatalog catalog;
    catalog.add_bus("sfx");
    const char* doc = R"({
      "engine": {"effect_pool_size": 0, "narration_pool_size": 3, "default_effect_bus": "sfx", "random_seed": 42},
      "mixer": {
        "music_volume": 0.8, "fade_seconds": 0.5,
        "layers": [{"layer": "drums", "music": "Drums"}, {"layer": "pads", "music": "Pads"}],
        "variables": [{"name": "Intensity", "is_int": false, "float_max": 10, "priority": 2,
                       "entries": [{"name": "calm", "rules": [{"layer": "pads"}]},
                                   {"name": "fight", "rules": [{"layer": "drums"}, {"layer": "pads", "play": false}]}]}]
      }
    })";

    std::vector<std::string> warnings;
    sk::log::set_sink([&](sk::log::Level lvl, const std::string& msg) {
        if(lvl == sk::log::Level::Warn) warnings.push_back(msg);
    });
    auto loaded = persistence::load_config_json(doc, catalog);
    sk::log::set_sink(nullptr);

    REQUIRE(loaded);
    const auto& cfg = loaded.value();
    REQUIRE(cfg.engine.effect_pool_size == 1);
    REQUIRE(warnings == std::vector<std::string>{"persistence: 'effect_pool_size' = 0 raised to 1."});
    REQUIRE(cfg.engine.music_layer_count == 3);
    REQUIRE(cfg.engine.narration_pool_size == 3);
    REQUIRE(cfg.engine.default_effect_bus == catalog.find_bus("sfx"));
    REQUIRE(cfg.engine.random_seed == 42u);

    REQUIRE(cfg.has_mixer);
    REQUIRE_THAT(cfg.mixer.music_volume, WithinAbs(0.8, 1e-6));
    REQUIRE(cfg.mixer.layers.size() == 2);
    REQUIRE(cfg.mixer.layers[1].music_name == "Pads");
    REQUIRE(cfg.mixer.variables.size() == 1);
    const auto& var = cfg.mixer.variables[0];
    REQUIRE_FALSE(var.is_int);
    REQUIRE(var.priority == 2);
    REQUIRE(var.entries[1].rules.size() == 2);
    REQUIRE_FALSE(var.entries[1].rules[1].play);
    REQUIRE(var.entries[0].rules[0].play);

    auto engine_only = persistence::load_engine_config(R"({"engine": {"random_seed": 7}})", catalog);
    REQUIRE(engine_only);
    REQUIRE(engine_only.value().effect_pool_size == 24);

    auto no_mixer = persistence::load_mixer_config(R"({"engine": {}})");
    REQUIRE(no_mixer.is_error());
    REQUIRE(no_mixer.error() == "config: no 'mixer' section");

    REQUIRE(persistence::load_config_json(R"({"engine": {"random_seed": -1}})", catalog).is_error());
    REQUIRE(persistence::load_config_json(R"({"engine": {"effect_pool_size": 2.5}})", catalog).is_error());
}

TEST_CASE("file loaders read from disk and report missing files", "[persistence]") {
    audio::AssetCatalog catalog;
    const std::string path = write_temp("soundkit_registry_test.json", kRegistryDoc);
    auto roots = persistence::load_registry_file(path, catalog);
    REQUIRE(roots);
    REQUIRE(roots.value().size() == 3);
    std::filesystem::remove(path);

    sk::log::set_level(sk::log::Level::Error);
    auto missing = persistence::load_timeline_file("/nonexistent/soundkit/timeline.json", catalog);
    auto missing_config = persistence::load_config_file("/nonexistent/soundkit/config.json", catalog);
    sk::log::set_level(sk::log::Level::Info);

    REQUIRE(missing.is_error());
    REQUIRE(missing.error().find("Failed to open file") != std::string::npos);
    REQUIRE(missing_config.is_error());
}
