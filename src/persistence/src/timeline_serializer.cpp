#include "persistence/timeline_serializer.hpp"
#include "persistence/json.hpp"
#include "timeline/schedule.hpp"
#include "core/log.hpp"

namespace sk::persistence {

using json::Value;

namespace {

float get_float(const Value& v, const std::string& key, float fallback) {
    return static_cast<float>(json::get_number(v, key, fallback));
}

core::Vec3 get_vec3(const Value& v, const std::string& key) {
    core::Vec3 out;
    const auto* items = json::get_array(v, key);
    if(!items) return out;
    if(items->size() != 3) throw json::FieldError(*v.find(key), "'" + key + "' must be [x, y, z]");
    for(const auto& item : *items) {
        if(!item.is_number()) throw json::FieldError(item, "'" + key + "' must hold numbers");
    }
    out.x = static_cast<float>((*items)[0].as_number());
    out.y = static_cast<float>((*items)[1].as_number());
    out.z = static_cast<float>((*items)[2].as_number());
    return out;
}

timeline::Curve read_curve(const Value& v) {
    const Value* c = v.find("curve");
    if(!c || c->is_null()) return timeline::Curve::linear(0.0f, 0.0f, 1.0f, 1.0f);

    if(c->is_string()) {
        if(c->as_string() == "linear") return timeline::Curve::linear(0.0f, 0.0f, 1.0f, 1.0f);
        if(c->as_string() == "ease_in_out") return timeline::Curve::ease_in_out(0.0f, 0.0f, 1.0f, 1.0f);
        throw json::FieldError(*c, "unknown curve preset '" + c->as_string() + "'");
    }

    json::expect_object(*c, "'curve'");
    std::vector<timeline::Keyframe> keys;
    if(const auto* items = json::get_array(*c, "keys")) {
        for(const auto& k : *items) {
            json::expect_object(k, "curve key");
            timeline::Keyframe key;
            key.time = get_float(k, "time", 0.0f);
            key.value = get_float(k, "value", 0.0f);
            key.in_tangent = get_float(k, "in_tangent", 0.0f);
            key.out_tangent = get_float(k, "out_tangent", 0.0f);
            keys.push_back(key);
        }
    }
    return timeline::Curve(std::move(keys));
}

class TimelineReader {
public:
    explicit TimelineReader(const audio::AssetCatalog& catalog) : catalog_(catalog) {}

    timeline::TimelinePtr document(const Value& v, int depth) {
        json::expect_object(v, "timeline document");
        if(depth > timeline::kMaxNestingDepth) {
            throw json::FieldError(v, "nested timelines deeper than " + std::to_string(timeline::kMaxNestingDepth));
        }

        auto tl = std::make_shared<timeline::Timeline>();
        tl->name = json::get_string(v, "name");

        if(const Value* tempo = json::get_object(v, "tempo")) {
            tl->tempo.bpm = get_float(*tempo, "bpm", tl->tempo.bpm);
            tl->tempo.auto_detect_bpm = json::get_bool(*tempo, "auto_detect_bpm", tl->tempo.auto_detect_bpm);
            tl->tempo.beats_per_bar = json::get_int(*tempo, "beats_per_bar", tl->tempo.beats_per_bar);
            tl->tempo.bars_for_bpm_fallback = json::get_int(*tempo, "bars_for_bpm_fallback", tl->tempo.bars_for_bpm_fallback);
        }

        if(const Value* playback = json::get_object(v, "playback")) {
            tl->playback.start_offset_seconds = get_float(*playback, "start_offset_seconds", 0.0f);
            tl->playback.loop = json::get_bool(*playback, "loop", false);
            tl->playback.loop_length_beats = get_float(*playback, "loop_length_beats", 0.0f);
        }

        if(const auto* events = json::get_array(v, "events")) {
            tl->events.reserve(events->size());
            for(const auto& e : *events) tl->events.push_back(event(e, depth));
        }
        return tl;
    }

private:
    timeline::TimelineEvent event(const Value& v, int depth) {
        json::expect_object(v, "event");
        timeline::TimelineEvent out;
        out.id = json::get_string(v, "id");
        out.enabled = json::get_bool(v, "enabled", true);

        const std::string mode = json::get_string(v, "time_mode", "beats");
        if(mode == "beats") out.time_mode = timeline::TimeMode::Beats;
        else if(mode == "seconds") out.time_mode = timeline::TimeMode::Seconds;
        else throw json::FieldError(*v.find("time_mode"), "unknown time_mode '" + mode + "'");

        out.start = get_float(v, "start", 0.0f);
        out.duration = get_float(v, "duration", 0.0f);

        const std::string type = json::get_string(v, "type");
        if(type == "play_effect") {
            timeline::PlayEffectEvent e;
            e.sound.name = json::get_string(v, "sound");
            e.volume_multiplier = get_float(v, "volume_multiplier", 1.0f);
            e.override_loop = json::get_bool(v, "override_loop", false);
            e.loop = json::get_bool(v, "loop", false);
            e.follow_emitter = json::get_bool(v, "follow_emitter", false);
            e.use_emitter_position = json::get_bool(v, "use_emitter_position", true);
            e.position_offset = get_vec3(v, "position_offset");
            out.payload = std::move(e);
        } else if(type == "play_music") {
            timeline::PlayMusicEvent e;
            e.music.name = json::get_string(v, "music");
            e.layer_index = json::get_int(v, "layer_index", 0);
            e.volume_multiplier = get_float(v, "volume_multiplier", 1.0f);
            e.override_loop = json::get_bool(v, "override_loop", true);
            e.loop = json::get_bool(v, "loop", true);
            e.align_to_beat = json::get_bool(v, "align_to_beat", true);
            out.payload = std::move(e);
        } else if(type == "play_narration") {
            timeline::PlayNarrationEvent e;
            e.narration.name = json::get_string(v, "narration");
            e.volume_multiplier = get_float(v, "volume_multiplier", 1.0f);
            e.follow_emitter = json::get_bool(v, "follow_emitter", false);
            e.use_emitter_position = json::get_bool(v, "use_emitter_position", true);
            e.position_offset = get_vec3(v, "position_offset");
            out.payload = std::move(e);
        } else if(type == "automation") {
            out.payload = automation(v);
        } else if(type == "beat_marker") {
            out.payload = timeline::BeatMarkerEvent{json::get_string(v, "label")};
        } else if(type == "nested") {
            timeline::NestedTimelineEvent e;
            if(const Value* child = json::get_object(v, "timeline")) e.timeline = document(*child, depth + 1);
            e.time_scale = get_float(v, "time_scale", 1.0f);
            e.id_prefix = json::get_string(v, "id_prefix");
            e.include_child_start_offset = json::get_bool(v, "include_child_start_offset", true);
            out.payload = std::move(e);
        } else {
            throw json::FieldError(v, "unknown event type '" + type + "'");
        }
        return out;
    }

    timeline::AutomationEvent automation(const Value& v) const {
        timeline::AutomationEvent e;
        e.target_event_id = json::get_string(v, "target_event_id");

        const std::string target = json::get_string(v, "target", "source_volume");
        if(target == "source_volume") e.target = timeline::AutomationTarget::SourceVolume;
        else if(target == "source_pitch") e.target = timeline::AutomationTarget::SourcePitch;
        else if(target == "bus_parameter") e.target = timeline::AutomationTarget::BusParameter;
        else throw json::FieldError(*v.find("target"), "unknown automation target '" + target + "'");

        e.curve = read_curve(v);
        e.min_value = get_float(v, "min_value", 0.0f);
        e.max_value = get_float(v, "max_value", 1.0f);
        e.bus_param = json::get_string(v, "bus_param");

        const std::string bus = json::get_string(v, "bus");
        if(!bus.empty()) {
            e.bus = catalog_.find_bus(bus);
            if(!e.bus) throw json::FieldError(*v.find("bus"), "unknown bus '" + bus + "'");
        }
        return e;
    }

    const audio::AssetCatalog& catalog_;
};

} // namespace

core::Result<timeline::TimelinePtr> load_timeline_json(const std::string& text,
                                                       const audio::AssetCatalog& catalog) noexcept {
    auto parsed = json::parse(text);
    if(!parsed) return core::Error<timeline::TimelinePtr>("timeline: " + parsed.error());

    try {
        TimelineReader reader(catalog);
        return reader.document(parsed.value(), 0);
    } catch(const std::exception& e) {
        return core::Error<timeline::TimelinePtr>(std::string("timeline: ") + e.what());
    }
}

core::Result<timeline::TimelinePtr> load_timeline_file(const std::string& path,
                                                       const audio::AssetCatalog& catalog) noexcept {
    auto text = json::read_file(path);
    if(!text) {
        sk::log::warn("persistence: " + text.error());
        return core::Error<timeline::TimelinePtr>(text.error());
    }
    auto result = load_timeline_json(text.value(), catalog);
    if(!result) sk::log::warn("persistence: " + path + ": " + result.error());
    return result;
}

} // namespace sk::persistence
