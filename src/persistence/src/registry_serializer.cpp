#include "persistence/registry_serializer.hpp"
#include "persistence/json.hpp"
#include "core/log.hpp"
#include <utility>

namespace sk::persistence {

using json::Value;

namespace {

constexpr int kMaxEntryDepth = 64;

class EntryReader {
public:
    explicit EntryReader(const audio::AssetCatalog& catalog) : catalog_(catalog) {}

    std::shared_ptr<registry::SoundEntry> entry(const Value& v, int depth) {
        json::expect_object(v, "entry");
        if(depth > kMaxEntryDepth) throw json::FieldError(v, "entry tree deeper than " + std::to_string(kMaxEntryDepth));

        const std::string type = json::get_string(v, "type");
        std::shared_ptr<registry::SoundEntry> out;

        if(type == "folder") {
            registry::Folder folder;
            folder.children = list(v, "children", depth);
            out = registry::make_entry(json::get_string(v, "name"), std::move(folder));
        } else if(type == "sfx") {
            registry::SfxDefinition sfx;
            sfx.clip = clip(v, "clip");
            sfx.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
            sfx.pitch = pitch(v);
            sfx.loop = json::get_bool(v, "loop", false);
            sfx.spatial = spatial(v, registry::SpatialSettings{});
            sfx.bus = bus(v);
            out = registry::make_entry(json::get_string(v, "name"), std::move(sfx));
        } else if(type == "sfx_variant_group") {
            registry::SfxVariantGroup group;
            group.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
            group.pitch = pitch(v);
            group.spatial = spatial(v, registry::SpatialSettings{});
            group.bus = bus(v);
            group.loop = json::get_bool(v, "loop", false);
            group.variants = list(v, "variants", depth);
            require_kind<registry::SfxVariant>(v, group.variants, "sfx_variant");
            out = registry::make_entry(json::get_string(v, "name"), std::move(group));
        } else if(type == "sfx_variant") {
            registry::SfxVariant variant;
            variant.clip = clip(v, "clip");
            variant.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
            variant.pitch = pitch(v);
            variant.probability = static_cast<float>(json::get_number(v, "probability", 1.0));
            out = registry::make_entry(json::get_string(v, "name"), std::move(variant));
        } else if(type == "music") {
            registry::MusicDefinition music;
            music.clip = clip(v, "clip");
            music.intro_clip = clip(v, "intro_clip");
            music.loop_clip = clip(v, "loop_clip");
            music.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
            music.loop = json::get_bool(v, "loop", false);
            music.pitch = pitch(v);
            music.bus = bus(v);
            out = registry::make_entry(json::get_string(v, "name"), std::move(music));
        } else if(type == "narration_group") {
            registry::NarrationGroup group;
            group.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
            group.pitch = pitch(v);
            group.spatial = spatial(v, group.spatial);
            group.bus = bus(v);
            group.entries = list(v, "entries", depth);
            for(const auto& child : group.entries) {
                if(!child->is<registry::NarrationClip>() && !child->is<registry::NarrationVariantGroup>()) {
                    throw json::FieldError(v, "narration group '" + json::get_string(v, "name") +
                                              "' may only hold narration_clip or narration_variant_group");
                }
            }
            out = registry::make_entry(json::get_string(v, "name"), std::move(group));
        } else if(type == "narration_clip") {
            registry::NarrationClip clip_entry;
            narration_playable(v, clip_entry);
            out = registry::make_entry(json::get_string(v, "name"), std::move(clip_entry));
        } else if(type == "narration_variant_group") {
            registry::NarrationVariantGroup group;
            group.variants = list(v, "variants", depth);
            require_kind<registry::NarrationVariant>(v, group.variants, "narration_variant");
            out = registry::make_entry(json::get_string(v, "name"), std::move(group));
        } else if(type == "narration_variant") {
            registry::NarrationVariant variant;
            narration_playable(v, variant);
            out = registry::make_entry(json::get_string(v, "name"), std::move(variant));
        } else {
            throw json::FieldError(v, "unknown entry type '" + type + "'");
        }

        out->id = json::get_string(v, "id");
        return out;
    }

    registry::SoundEntryList list(const Value& v, const std::string& key, int depth) {
        registry::SoundEntryList out;
        if(const auto* items = json::get_array(v, key)) {
            out.reserve(items->size());
            for(const auto& item : *items) out.push_back(entry(item, depth + 1));
        }
        return out;
    }

private:
    template<typename Kind>
    static void require_kind(const Value& at, const registry::SoundEntryList& list, const char* wanted) {
        for(const auto& child : list) {
            if(!child->is<Kind>()) {
                throw json::FieldError(at, "'" + child->name + "' must be of type " + wanted);
            }
        }
    }

    audio::ClipRef clip(const Value& v, const std::string& key) const {
        const std::string name = json::get_string(v, key);
        if(name.empty()) return nullptr;
        auto found = catalog_.find_clip(name);
        if(!found) throw json::FieldError(*v.find(key), "unknown clip '" + name + "'");
        return found;
    }

    audio::BusRef bus(const Value& v) const {
        const std::string name = json::get_string(v, "bus");
        if(name.empty()) return nullptr;
        auto found = catalog_.find_bus(name);
        if(!found) throw json::FieldError(*v.find("bus"), "unknown bus '" + name + "'");
        return found;
    }

    static registry::PitchRange pitch(const Value& v) {
        registry::PitchRange range;
        const auto* items = json::get_array(v, "pitch");
        if(!items) return range;
        if(items->size() != 2 || !(*items)[0].is_number() || !(*items)[1].is_number()) {
            throw json::FieldError(*v.find("pitch"), "'pitch' must be [min, max]");
        }
        range.min = static_cast<float>((*items)[0].as_number());
        range.max = static_cast<float>((*items)[1].as_number());
        return range;
    }

    static registry::SpatialSettings spatial(const Value& v, registry::SpatialSettings defaults) {
        defaults.spatial_blend = static_cast<float>(json::get_number(v, "spatial_blend", defaults.spatial_blend));
        defaults.min_distance = static_cast<float>(json::get_number(v, "min_distance", defaults.min_distance));
        defaults.max_distance = static_cast<float>(json::get_number(v, "max_distance", defaults.max_distance));
        return defaults;
    }

    void narration_playable(const Value& v, registry::NarrationPlayable& out) const {
        out.clip = clip(v, "clip");
        out.volume = static_cast<float>(json::get_number(v, "volume", 1.0));
        out.pre_delay = static_cast<float>(json::get_number(v, "pre_delay", 0.0));
    }

    const audio::AssetCatalog& catalog_;
};

void read_assets(const Value& root, audio::AssetCatalog& catalog) {
    if(const auto* clips = json::get_array(root, "clips")) {
        for(const auto& c : *clips) {
            json::expect_object(c, "clip");
            const std::string name = json::get_string(c, "name");
            if(name.empty()) throw json::FieldError(c, "clip without a name");
            const double length = json::get_number(c, "length", 0.0);
            if(length < 0.0) throw json::FieldError(c, "clip '" + name + "' has a negative length");
            catalog.add_clip(name, length);
        }
    }

    if(const auto* buses = json::get_array(root, "buses")) {
        for(const auto& b : *buses) {
            json::expect_object(b, "bus");
            const std::string name = json::get_string(b, "name");
            if(name.empty()) throw json::FieldError(b, "bus without a name");
            auto bus = catalog.add_bus(name);
            if(const auto* params = json::get_object(b, "params")) {
                for(const auto& member : params->as_object()) {
                    if(!member.value.is_number()) {
                        throw json::FieldError(member.value, "bus parameter '" + member.key + "' must be a number");
                    }
                    bus->set_param(member.key, static_cast<float>(member.value.as_number()));
                }
            }
        }
    }
}

} // namespace

core::Result<registry::SoundEntryList> load_registry_json(const std::string& text,
                                                          audio::AssetCatalog& catalog) noexcept {
    auto parsed = json::parse(text);
    if(!parsed) return core::Error<registry::SoundEntryList>("registry: " + parsed.error());

    try {
        const Value& root = parsed.value();
        json::expect_object(root, "registry document");

        // Staged so a failed load leaves the caller's catalog untouched.
        audio::AssetCatalog staged = catalog;
        read_assets(root, staged);

        EntryReader reader(staged);
        registry::SoundEntryList roots;
        if(const auto* entries = json::get_array(root, "entries")) {
            for(const auto& item : *entries) roots.push_back(reader.entry(item, 0));
        }
        catalog = std::move(staged);
        return roots;
    } catch(const std::exception& e) {
        return core::Error<registry::SoundEntryList>(std::string("registry: ") + e.what());
    }
}

core::Result<registry::SoundEntryList> load_registry_file(const std::string& path,
                                                          audio::AssetCatalog& catalog) noexcept {
    auto text = json::read_file(path);
    if(!text) {
        sk::log::warn("persistence: " + text.error());
        return core::Error<registry::SoundEntryList>(text.error());
    }
    auto result = load_registry_json(text.value(), catalog);
    if(!result) sk::log::warn("persistence: " + path + ": " + result.error());
    return result;
}

void populate_registry(registry::SoundRegistry& registry, const registry::SoundEntryList& roots) {
    for(const auto& root : roots) registry.add_root(root);
    registry.build_lookup();
}

} // namespace sk::persistence
