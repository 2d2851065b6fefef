#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "playback/playback_engine.hpp"
#include "audio/simulated_output.hpp"
#include "core/clock.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;
using namespace sk;

namespace {

audio::ClipRef make_clip(const std::string& name, double length) {
    auto clip = std::make_shared<audio::AudioClip>();
    clip->name = name;
    clip->length_seconds = length;
    return clip;
}

std::shared_ptr<registry::SoundEntry> make_sfx(const std::string& name, double length, float volume,
                                               bool loop = false) {
    registry::SfxDefinition sfx;
    sfx.clip = make_clip(name + ".wav", length);
    sfx.volume = volume;
    sfx.loop = loop;
    return registry::make_entry(name, sfx);
}

playback::EngineConfig small_config(int effects) {
    playback::EngineConfig cfg;
    cfg.effect_pool_size = effects;
    cfg.random_seed = 11;
    return cfg;
}

struct Rig {
    core::ManualClock clock;
    audio::SimulatedOutput output{clock};
    registry::SoundRegistry registry{5};
    playback::PlaybackEngine engine;

    explicit Rig(playback::EngineConfig cfg = small_config(4)) : engine(std::move(cfg), output, clock) {
        engine.set_registry(&registry);
    }

    void step_to(double t, double dt = 0.05) {
        while(clock.now() < t) {
            clock.set(std::min(clock.now() + dt, t));
            engine.update();
        }
    }
};

} // namespace

TEST_CASE("pool sizes are floored at one", "[playback]") {
    core::ManualClock clock;
    audio::SimulatedOutput output(clock);
    playback::EngineConfig cfg;
    cfg.effect_pool_size = 0;
    cfg.music_layer_count = -3;
    cfg.narration_pool_size = 0;
    playback::PlaybackEngine engine(cfg, output, clock);
    REQUIRE(engine.effect_pool_size() == 1);
    REQUIRE(engine.music_layer_count() == 1);
    REQUIRE(engine.narration_pool_size() == 1);
}

TEST_CASE("play_effect without registry or name fails softly", "[playback]") {
    core::ManualClock clock;
    audio::SimulatedOutput output(clock);
    playback::PlaybackEngine engine(small_config(2), output, clock);

    std::vector<std::string> warnings;
    sk::log::set_sink([&](sk::log::Level lvl, const std::string& msg) {
        if(lvl == sk::log::Level::Warn) warnings.push_back(msg);
    });
    REQUIRE(engine.play_effect("Anything", core::Vec3{}) == nullptr);

    registry::SoundRegistry reg(1);
    engine.set_registry(&reg);
    REQUIRE(engine.play_effect("Missing", core::Vec3{}) == nullptr);
    sk::log::set_sink(nullptr);

    REQUIRE(warnings.size() == 2);
    REQUIRE(warnings[0] == "PlaybackEngine: No sound registry assigned.");
    REQUIRE(warnings[1] == "PlaybackEngine: Missing effect 'Missing'.");
    REQUIRE(output.start_count() == 0);
}

TEST_CASE("effect parameters come from the definition", "[playback]") {
    Rig rig;
    auto bus = std::make_shared<audio::Bus>("sfx");
    registry::SfxDefinition body;
    body.clip = make_clip("hit.wav", 0.5);
    body.volume = 0.8f;
    body.pitch = {1.5f, 1.5f};
    body.bus = bus;
    body.spatial = {0.7f, 2.0f, 40.0f};
    rig.registry.add_root(registry::make_entry("Hit", body));

    const auto* ch = rig.engine.play_effect("Hit", core::Vec3{1.0f, 2.0f, 3.0f}, nullptr, 0.5f);
    REQUIRE(ch);
    REQUIRE_THAT(ch->volume(), WithinAbs(0.4, 1e-6));
    REQUIRE(ch->pitch() == 1.5f);
    REQUIRE(ch->bus() == bus);
    REQUIRE(ch->params().spatial_blend == 0.7f);
    REQUIRE(ch->params().max_distance == 40.0f);
    REQUIRE(ch->position() == core::Vec3{1.0f, 2.0f, 3.0f});
    REQUIRE(rig.engine.is_playing(ch));

    // 0.5s clip at pitch 1.5 finishes after 1/3 s.
    rig.step_to(0.4);
    REQUIRE_FALSE(rig.engine.is_playing(ch));
}

TEST_CASE("weighted selection never picks a zero-probability variant", "[playback]") {
    registry::SfxVariant never;
    never.clip = make_clip("never.wav", 1.0);
    never.probability = 0.0f;
    registry::SfxVariant always;
    always.clip = make_clip("always.wav", 1.0);
    always.probability = 1.0f;

    registry::SfxVariantGroup group;
    group.variants = {registry::make_entry("Never", never), registry::make_entry("Always", always)};

    core::Random random(99);
    for(int i = 0; i < 1000; ++i) {
        auto picked = playback::pick_weighted_variant(group, random);
        REQUIRE(picked);
        REQUIRE(picked->name == "Always");
    }

    registry::SfxVariantGroup empty;
    empty.variants = {registry::make_entry("Never", never)};
    REQUIRE(playback::pick_weighted_variant(empty, random) == nullptr);
}

TEST_CASE("variant path uses the variant's pitch, group entry the group's", "[playback]") {
    Rig rig;
    registry::SfxVariant variant;
    variant.clip = make_clip("v.wav", 1.0);
    variant.pitch = {0.5f, 0.5f};
    variant.volume = 0.5f;
    registry::SfxVariantGroup group;
    group.pitch = {2.0f, 2.0f};
    group.volume = 0.8f;
    group.variants = {registry::make_entry("Soft", variant)};
    auto group_entry = registry::make_entry("Steps", group);
    rig.registry.add_root(group_entry);

    const auto* by_path = rig.engine.play_effect("Steps.soft", core::Vec3{});
    REQUIRE(by_path);
    REQUIRE(by_path->pitch() == 0.5f);
    REQUIRE_THAT(by_path->volume(), WithinAbs(0.4, 1e-6));

    const auto* by_entry = rig.engine.play_effect(group_entry, core::Vec3{});
    REQUIRE(by_entry);
    REQUIRE(by_entry != by_path);
    REQUIRE(by_entry->pitch() == 2.0f);
}

TEST_CASE("bare variant entry without a known group uses stand-alone defaults", "[playback]") {
    auto default_bus = std::make_shared<audio::Bus>("default");
    auto cfg = small_config(2);
    cfg.default_effect_bus = default_bus;
    Rig rig(cfg);

    registry::SfxVariant variant;
    variant.clip = make_clip("lone.wav", 1.0);
    variant.volume = 0.6f;
    auto entry = registry::make_entry("Lone", variant);

    const auto* ch = rig.engine.play_effect(entry, core::Vec3{}, nullptr, 1.0f, true);
    REQUIRE(ch);
    REQUIRE(ch->params().spatial_blend == 1.0f);
    REQUIRE(ch->params().min_distance == 1.0f);
    REQUIRE(ch->params().max_distance == 25.0f);
    REQUIRE(ch->bus() == default_bus);
    REQUIRE(ch->loop());
    REQUIRE_THAT(ch->volume(), WithinAbs(0.6, 1e-6));
}

TEST_CASE("saturated effect pool reuses the least recently assigned channel", "[playback]") {
    Rig rig(small_config(2));
    rig.registry.add_root(make_sfx("Loop", 1.0, 1.0f, true));

    const auto* a = rig.engine.play_effect("Loop", core::Vec3{});
    const auto* b = rig.engine.play_effect("Loop", core::Vec3{});
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(a != b);

    const auto* c = rig.engine.play_effect("Loop", core::Vec3{});
    REQUIRE(c == a);
    const auto* d = rig.engine.play_effect("Loop", core::Vec3{});
    REQUIRE(d == b);
}

TEST_CASE("finished channels are free again", "[playback]") {
    Rig rig(small_config(2));
    rig.registry.add_root(make_sfx("Short", 0.2, 1.0f));
    rig.registry.add_root(make_sfx("Loop", 1.0, 1.0f, true));

    const auto* first = rig.engine.play_effect("Short", core::Vec3{});
    const auto* looping = rig.engine.play_effect("Loop", core::Vec3{});
    rig.step_to(0.5);
    REQUIRE_FALSE(rig.engine.is_playing(first));
    REQUIRE(rig.engine.play_effect("Short", core::Vec3{}) == first);
    REQUIRE(rig.engine.is_playing(looping));
}

TEST_CASE("a new play cancels a pending fade-out on the same channel", "[playback]") {
    Rig rig(small_config(1));
    rig.registry.add_root(make_sfx("Old", 5.0, 0.5f));
    rig.registry.add_root(make_sfx("New", 5.0, 0.8f));

    const auto* old_ch = rig.engine.play_effect("Old", core::Vec3{});
    REQUIRE(old_ch);
    rig.engine.stop_effect(old_ch, 1.0f);
    const auto* new_ch = rig.engine.play_effect("New", core::Vec3{});
    REQUIRE(new_ch == old_ch);

    rig.step_to(1.0);
    REQUIRE_THAT(new_ch->volume(), WithinAbs(0.8, 1e-6));
    REQUIRE(rig.engine.is_playing(new_ch));
    REQUIRE(new_ch->clip()->name == "New.wav");
    REQUIRE(rig.engine.pending_tasks() == 0);
}

TEST_CASE("stop with fade ramps to silence and then stops", "[playback]") {
    Rig rig;
    rig.registry.add_root(make_sfx("Pad", 10.0, 1.0f));
    const auto* ch = rig.engine.play_effect("Pad", core::Vec3{});
    rig.engine.stop_effect(ch, 2.0f);

    rig.step_to(1.0);
    REQUIRE_THAT(ch->volume(), WithinAbs(0.5, 1e-5));
    REQUIRE(rig.engine.is_playing(ch));

    rig.step_to(2.0);
    REQUIRE(ch->volume() == 0.0f);
    REQUIRE_FALSE(rig.engine.is_playing(ch));
}

TEST_CASE("stop without fade is immediate and ignores foreign handles", "[playback]") {
    Rig rig;
    rig.registry.add_root(make_sfx("Pad", 10.0, 1.0f));
    const auto* ch = rig.engine.play_effect("Pad", core::Vec3{});
    rig.engine.stop_effect(ch);
    REQUIRE_FALSE(rig.engine.is_playing(ch));

    playback::Channel stranger(playback::ChannelKind::Effect, 0, 99);
    rig.engine.stop_effect(&stranger);
    rig.engine.stop_effect(nullptr);
}

TEST_CASE("intro swaps to the loop clip once the intro has played", "[playback][music]") {
    Rig rig;
    registry::MusicDefinition music;
    music.clip = make_clip("full.ogg", 8.0);
    music.intro_clip = make_clip("intro.ogg", 2.0);
    music.loop_clip = make_clip("loop.ogg", 4.0);
    music.volume = 0.7f;
    rig.registry.add_root(registry::make_entry("Theme", music));

    const auto* ch = rig.engine.play_music("Theme");
    REQUIRE(ch);
    REQUIRE(ch->clip()->name == "intro.ogg");
    REQUIRE_FALSE(ch->loop());

    rig.step_to(1.99, 0.01);
    REQUIRE(ch->clip()->name == "intro.ogg");

    rig.step_to(2.0, 0.01);
    REQUIRE(ch->clip()->name == "loop.ogg");
    REQUIRE(ch->loop());
    REQUIRE_THAT(ch->volume(), WithinAbs(0.7, 1e-6));
    REQUIRE(rig.output.start_count() == 2);
}

TEST_CASE("stopping music cancels the intro swap", "[playback][music]") {
    Rig rig;
    registry::MusicDefinition music;
    music.clip = make_clip("full.ogg", 8.0);
    music.intro_clip = make_clip("intro.ogg", 2.0);
    music.loop_clip = make_clip("loop.ogg", 4.0);
    rig.registry.add_root(registry::make_entry("Theme", music));

    const auto* ch = rig.engine.play_music("Theme");
    rig.step_to(1.0);
    rig.engine.stop_music();
    rig.step_to(3.0);
    REQUIRE(ch->clip()->name == "intro.ogg");
    REQUIRE_FALSE(rig.engine.is_playing(ch));
    REQUIRE(rig.output.start_count() == 1);
}

TEST_CASE("a volume fade during the intro owns the volume after the swap", "[playback][music]") {
    Rig rig;
    registry::MusicDefinition music;
    music.clip = make_clip("full.ogg", 8.0);
    music.intro_clip = make_clip("intro.ogg", 1.0);
    music.loop_clip = make_clip("loop.ogg", 4.0);
    rig.registry.add_root(registry::make_entry("Theme", music));

    const auto* ch = rig.engine.play_music("Theme");
    REQUIRE(rig.engine.fade_music_layer_volume(0, 0.0f, 0.0f));
    rig.step_to(1.5);
    REQUIRE(ch->clip()->name == "loop.ogg");
    REQUIRE(ch->volume() == 0.0f);
}

TEST_CASE("music layers are independent and bounds-checked", "[playback][music]") {
    auto cfg = small_config(2);
    cfg.music_layer_count = 2;
    Rig rig(cfg);
    registry::MusicDefinition music;
    music.clip = make_clip("bed.ogg", 4.0);
    music.loop = true;
    auto entry = registry::make_entry("Bed", music);
    rig.registry.add_root(entry);

    const auto* l0 = rig.engine.play_music_layer(0, "Bed");
    const auto* l1 = rig.engine.play_music_layer(1, entry, 0.5f);
    REQUIRE(l0);
    REQUIRE(l1);
    REQUIRE(l0 != l1);
    REQUIRE(l0 == rig.engine.music_layer(0));
    REQUIRE(rig.engine.play_music_layer(2, "Bed") == nullptr);
    REQUIRE(rig.engine.play_music_layer(-1, "Bed") == nullptr);
    REQUIRE_FALSE(rig.engine.fade_music_layer_volume(5, 1.0f, 1.0f));

    rig.engine.stop_music_layer(1);
    REQUIRE(rig.engine.is_playing(l0));
    REQUIRE_FALSE(rig.engine.is_playing(l1));

    auto alt = make_clip("alt.ogg", 3.0);
    const auto* explicit_clip = rig.engine.play_music_layer_clip(1, entry, alt);
    REQUIRE(explicit_clip == l1);
    REQUIRE(l1->clip() == alt);
    REQUIRE(l1->loop());
}

TEST_CASE("layer volume fade is superseded by a newer fade", "[playback][music]") {
    Rig rig;
    registry::MusicDefinition music;
    music.clip = make_clip("bed.ogg", 20.0);
    music.loop = true;
    rig.registry.add_root(registry::make_entry("Bed", music));
    const auto* ch = rig.engine.play_music("Bed");

    REQUIRE(rig.engine.fade_music_layer_volume(0, 0.0f, 2.0f));
    rig.step_to(1.0);
    REQUIRE_THAT(ch->volume(), WithinAbs(0.5, 1e-5));

    REQUIRE(rig.engine.fade_music_layer_volume(0, 1.0f, 1.0f));
    rig.step_to(3.0);
    REQUIRE_THAT(ch->volume(), WithinAbs(1.0, 1e-6));
}

TEST_CASE("bus parameter fades interpolate and supersede", "[playback]") {
    Rig rig;
    auto bus = std::make_shared<audio::Bus>("master");
    bus->set_param("volume", 0.0f);

    REQUIRE(rig.engine.fade_bus_parameter(bus, "volume", 1.0f, 2.0f));
    rig.step_to(1.0);
    float v = -1.0f;
    REQUIRE(bus->try_get_param("volume", v));
    REQUIRE_THAT(v, WithinAbs(0.5, 1e-5));

    // A second fade on the same parameter takes over from the current value.
    REQUIRE(rig.engine.fade_bus_parameter(bus, "volume", 0.0f, 1.0f));
    rig.step_to(3.0);
    REQUIRE(bus->try_get_param("volume", v));
    REQUIRE(v == 0.0f);

    REQUIRE(rig.engine.fade_bus_parameter(bus, "lowpass", 800.0f, 0.0f));
    REQUIRE(bus->try_get_param("lowpass", v));
    REQUIRE(v == 800.0f);

    REQUIRE_FALSE(rig.engine.fade_bus_parameter(nullptr, "volume", 1.0f, 1.0f));
    REQUIRE_FALSE(rig.engine.fade_bus_parameter(bus, " ", 1.0f, 1.0f));
}

TEST_CASE("following effects copy the target position on update", "[playback]") {
    Rig rig;
    rig.registry.add_root(make_sfx("Engine", 1.0, 1.0f, true));
    auto target = std::make_shared<core::Transform>();
    target->position = core::Vec3{1.0f, 0.0f, 0.0f};

    const auto* ch = rig.engine.play_effect("Engine", target->position, target);
    REQUIRE(ch->following());

    target->position = core::Vec3{5.0f, 0.0f, 0.0f};
    rig.step_to(0.1);
    REQUIRE(ch->position() == core::Vec3{5.0f, 0.0f, 0.0f});
    REQUIRE(rig.output.params(ch->voice())->position == core::Vec3{5.0f, 0.0f, 0.0f});

    target.reset();
    REQUIRE_FALSE(ch->following());
    rig.step_to(0.2);
}

TEST_CASE("direct volume and pitch writes reach the output", "[playback]") {
    Rig rig;
    rig.registry.add_root(make_sfx("Tone", 5.0, 1.0f));
    const auto* ch = rig.engine.play_effect("Tone", core::Vec3{});
    rig.engine.set_channel_volume(ch, 2.0f);
    REQUIRE(ch->volume() == 1.0f);
    rig.engine.set_channel_volume(ch, 0.25f);
    rig.engine.set_channel_pitch(ch, 1.25f);
    const auto* params = rig.output.params(ch->voice());
    REQUIRE(params->volume == 0.25f);
    REQUIRE(params->pitch == 1.25f);
}
