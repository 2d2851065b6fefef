#include "persistence/config_serializer.hpp"
#include "persistence/json.hpp"
#include "core/log.hpp"

namespace sk::persistence {

using json::Value;

namespace {

int pool_size(const Value& v, const std::string& key, int fallback) {
    const int n = json::get_int(v, key, fallback);
    if(n < 1) {
        sk::log::warn("persistence: '" + key + "' = " + std::to_string(n) + " raised to 1.");
        return 1;
    }
    return n;
}

audio::BusRef bus(const Value& v, const std::string& key, const audio::AssetCatalog& catalog) {
    const std::string name = json::get_string(v, key);
    if(name.empty()) return nullptr;
    auto found = catalog.find_bus(name);
    if(!found) throw json::FieldError(*v.find(key), "unknown bus '" + name + "'");
    return found;
}

playback::EngineConfig read_engine(const Value& root, const audio::AssetCatalog& catalog) {
    playback::EngineConfig config;
    const Value* v = json::get_object(root, "engine");
    if(!v) return config;

    config.effect_pool_size = pool_size(*v, "effect_pool_size", config.effect_pool_size);
    config.music_layer_count = pool_size(*v, "music_layer_count", config.music_layer_count);
    config.narration_pool_size = pool_size(*v, "narration_pool_size", config.narration_pool_size);
    config.default_effect_bus = bus(*v, "default_effect_bus", catalog);
    config.default_music_bus = bus(*v, "default_music_bus", catalog);
    config.default_narration_bus = bus(*v, "default_narration_bus", catalog);

    const double seed = json::get_number(*v, "random_seed", 0.0);
    if(seed < 0.0 || seed > 4294967295.0) {
        throw json::FieldError(*v->find("random_seed"), "'random_seed' out of range");
    }
    config.random_seed = static_cast<uint32_t>(seed);
    return config;
}

music::MixVariable read_variable(const Value& v) {
    json::expect_object(v, "variable");
    music::MixVariable var;
    var.name = json::get_string(v, "name");
    if(var.name.empty()) throw json::FieldError(v, "variable without a name");
    var.value = static_cast<float>(json::get_number(v, "value", 0.0));
    var.play_all_ahead = json::get_bool(v, "play_all_ahead", false);
    var.float_min = static_cast<float>(json::get_number(v, "float_min", var.float_min));
    var.float_max = static_cast<float>(json::get_number(v, "float_max", var.float_max));
    var.is_int = json::get_bool(v, "is_int", true);
    var.priority = json::get_int(v, "priority", 0);

    if(const auto* entries = json::get_array(v, "entries")) {
        for(const auto& e : *entries) {
            json::expect_object(e, "variable entry");
            music::VariableEntry entry;
            entry.entry_name = json::get_string(e, "name");
            if(const auto* rules = json::get_array(e, "rules")) {
                for(const auto& r : *rules) {
                    json::expect_object(r, "layer rule");
                    entry.rules.push_back(music::LayerRule{json::get_string(r, "layer"), json::get_bool(r, "play", true)});
                }
            }
            var.entries.push_back(std::move(entry));
        }
    }
    return var;
}

music::MixerConfig read_mixer(const Value& v) {
    music::MixerConfig config;
    config.music_volume = static_cast<float>(json::get_number(v, "music_volume", config.music_volume));
    config.fade_seconds = static_cast<float>(json::get_number(v, "fade_seconds", config.fade_seconds));
    config.start_delay_seconds = static_cast<float>(json::get_number(v, "start_delay_seconds", config.start_delay_seconds));
    config.restart_delay_seconds = static_cast<float>(json::get_number(v, "restart_delay_seconds", config.restart_delay_seconds));

    if(const auto* layers = json::get_array(v, "layers")) {
        for(const auto& l : *layers) {
            json::expect_object(l, "layer");
            config.layers.push_back(music::MusicLayer{json::get_string(l, "layer"), json::get_string(l, "music")});
        }
    }
    if(const auto* variables = json::get_array(v, "variables")) {
        for(const auto& var : *variables) config.variables.push_back(read_variable(var));
    }
    return config;
}

} // namespace

core::Result<ConfigDocument> load_config_json(const std::string& text, const audio::AssetCatalog& catalog) noexcept {
    auto parsed = json::parse(text);
    if(!parsed) return core::Error<ConfigDocument>("config: " + parsed.error());

    try {
        const Value& root = parsed.value();
        json::expect_object(root, "config document");
        ConfigDocument doc;
        doc.engine = read_engine(root, catalog);
        if(const Value* mixer = json::get_object(root, "mixer")) {
            doc.has_mixer = true;
            doc.mixer = read_mixer(*mixer);
        }
        return doc;
    } catch(const std::exception& e) {
        return core::Error<ConfigDocument>(std::string("config: ") + e.what());
    }
}

core::Result<ConfigDocument> load_config_file(const std::string& path, const audio::AssetCatalog& catalog) noexcept {
    auto text = json::read_file(path);
    if(!text) {
        sk::log::warn("persistence: " + text.error());
        return core::Error<ConfigDocument>(text.error());
    }
    auto result = load_config_json(text.value(), catalog);
    if(!result) sk::log::warn("persistence: " + path + ": " + result.error());
    return result;
}

core::Result<playback::EngineConfig> load_engine_config(const std::string& text,
                                                        const audio::AssetCatalog& catalog) noexcept {
    auto doc = load_config_json(text, catalog);
    if(!doc) return core::Error<playback::EngineConfig>(doc.error());
    return doc.value().engine;
}

core::Result<music::MixerConfig> load_mixer_config(const std::string& text) noexcept {
    auto parsed = json::parse(text);
    if(!parsed) return core::Error<music::MixerConfig>("config: " + parsed.error());

    try {
        const Value& root = parsed.value();
        json::expect_object(root, "config document");
        const Value* mixer = json::get_object(root, "mixer");
        if(!mixer) return core::Error<music::MixerConfig>("config: no 'mixer' section");
        return read_mixer(*mixer);
    } catch(const std::exception& e) {
        return core::Error<music::MixerConfig>(std::string("config: ") + e.what());
    }
}

} // namespace sk::persistence
