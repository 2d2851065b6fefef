#include <catch2/catch_test_macros.hpp>
#include "registry/sound_registry.hpp"
#include "core/log.hpp"
#include <string>
#include <vector>

using namespace sk;
using namespace sk::registry;

static audio::ClipRef make_clip(const std::string& name, double length = 1.0) {
    auto clip = std::make_shared<audio::AudioClip>();
    clip->name = name;
    clip->length_seconds = length;
    return clip;
}

static std::shared_ptr<SoundEntry> make_sfx(const std::string& name, float volume = 1.0f) {
    SfxDefinition sfx;
    sfx.clip = make_clip(name + ".wav");
    sfx.volume = volume;
    return make_entry(name, sfx);
}

TEST_CASE("duplicate names keep the first occurrence", "[registry]") {
    SoundRegistry reg(1);
    auto first = make_sfx("Click", 0.3f);
    auto second = make_sfx("Click", 0.9f);

    Folder folder;
    folder.children = {first, second};
    reg.add_root(make_entry("UI", folder));

    std::vector<std::string> reported;
    reg.set_duplicate_callback([&](const SoundEntry& kept, const SoundEntry& dropped) {
        REQUIRE(&kept == first.get());
        REQUIRE(&dropped == second.get());
        reported.push_back(dropped.name);
    });

    std::vector<std::string> warnings;
    sk::log::set_sink([&](sk::log::Level lvl, const std::string& msg) {
        if(lvl == sk::log::Level::Warn) warnings.push_back(msg);
    });
    reg.build_lookup();
    sk::log::set_sink(nullptr);

    REQUIRE(reg.get_entry("Click") == first);
    REQUIRE(reg.duplicate_names() == std::vector<std::string>{"Click"});
    REQUIRE(reported.size() == 1);
    REQUIRE(warnings.size() == 1);
    REQUIRE(warnings[0] == "SoundRegistry: Duplicate name 'Click'. Keeping first occurrence.");
}

TEST_CASE("build_lookup assigns ids to entries without one", "[registry]") {
    SoundRegistry reg(1);
    auto sfx = make_sfx("Boom");
    sfx->id = "";
    auto keep = make_sfx("Bang");
    keep->id = "fixed";
    reg.add_root(sfx);
    reg.add_root(keep);
    reg.build_lookup();
    REQUIRE(sfx->id.size() == 32);
    REQUIRE(keep->id == "fixed");
}

TEST_CASE("variant path resolves case-insensitively", "[registry]") {
    SfxVariant grass_body;
    grass_body.clip = make_clip("grass.wav");
    auto grass = make_entry("grass", grass_body);
    SfxVariant gravel_body;
    gravel_body.clip = make_clip("gravel.wav");
    auto gravel = make_entry("Gravel", gravel_body);

    SfxVariantGroup group;
    group.variants = {gravel, grass};
    auto footsteps = make_entry("Footsteps", group);

    SoundRegistry reg(1);
    reg.add_root(footsteps);
    reg.build_lookup();

    auto path = reg.try_resolve_variant_path("Footsteps.Grass");
    REQUIRE(path.has_value());
    REQUIRE(path->group == footsteps);
    REQUIRE(path->variant == grass);

    // Variants are not in the flat table but get_entry falls back to the path.
    REQUIRE(reg.get_entry("grass") == nullptr);
    REQUIRE(reg.get_entry("Footsteps.GRAVEL") == gravel);
    REQUIRE(reg.owning_variant_group(*grass) == footsteps);

    REQUIRE_FALSE(reg.try_resolve_variant_path("Footsteps.Mud").has_value());
    REQUIRE_FALSE(reg.try_resolve_variant_path("Footsteps.").has_value());
    REQUIRE_FALSE(reg.try_resolve_variant_path(".Grass").has_value());
    REQUIRE_FALSE(reg.try_resolve_variant_path("Footsteps").has_value());
}

TEST_CASE("typed lookups reject other kinds", "[registry]") {
    SoundRegistry reg(1);
    reg.add_root(make_sfx("Hit"));
    MusicDefinition music;
    music.clip = make_clip("theme.ogg");
    reg.add_root(make_entry("Theme", music));

    REQUIRE(reg.get_sfx("Hit"));
    REQUIRE(reg.get_music("Hit") == nullptr);
    REQUIRE(reg.get_music("Theme"));
    REQUIRE(reg.get_sfx("Theme") == nullptr);
    REQUIRE(reg.get_entry("") == nullptr);
    REQUIRE(reg.get_entry("   ") == nullptr);
    REQUIRE(reg.get_entry("Nope") == nullptr);
}

TEST_CASE("narration path picks items and nested variants", "[registry]") {
    NarrationClip intro_body;
    intro_body.clip = make_clip("intro.wav");
    auto intro = make_entry("Intro", intro_body);

    NarrationVariant a_body;
    a_body.clip = make_clip("a.wav");
    auto a = make_entry("TakeA", a_body);
    NarrationVariant b_body;
    b_body.clip = make_clip("b.wav");
    auto b = make_entry("TakeB", b_body);
    NarrationVariantGroup takes;
    takes.variants = {a, b};
    auto takes_entry = make_entry("Takes", takes);

    NarrationGroup group;
    group.entries = {intro, takes_entry};
    auto guide = make_entry("Guide", group);

    SoundRegistry reg(3);
    reg.add_root(guide);
    reg.build_lookup();

    auto item = reg.try_resolve_narration_path("Guide.intro");
    REQUIRE(item.has_value());
    REQUIRE(item->group == guide);
    REQUIRE(item->entry == intro);

    auto nested = reg.try_resolve_narration_path("Guide.takeb");
    REQUIRE(nested.has_value());
    REQUIRE(nested->entry == b);

    auto picked = reg.try_resolve_narration_path("Guide.Takes");
    REQUIRE(picked.has_value());
    REQUIRE((picked->entry == a || picked->entry == b));

    // Narration entries are also registered by name.
    REQUIRE(reg.get_entry("Intro") == intro);
    REQUIRE(reg.get_narration_group("Guide") == guide);
}

TEST_CASE("split_group_item trims halves", "[registry]") {
    std::string group, item;
    REQUIRE(split_group_item(" Footsteps . Grass ", group, item));
    REQUIRE(group == "Footsteps");
    REQUIRE(item == "Grass");
    REQUIRE(split_group_item("A.B.C", group, item));
    REQUIRE(group == "A");
    REQUIRE(item == "B.C");
    REQUIRE_FALSE(split_group_item("NoDot", group, item));
    REQUIRE_FALSE(split_group_item(" .x", group, item));
}
