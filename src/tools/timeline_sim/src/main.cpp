#include "persistence/registry_serializer.hpp"
#include "persistence/timeline_serializer.hpp"
#include "persistence/config_serializer.hpp"
#include "timeline/timeline_player.hpp"
#include "music/layer_mixer.hpp"
#include "playback/playback_engine.hpp"
#include "audio/simulated_output.hpp"
#include "audio/asset_catalog.hpp"
#include "core/clock.hpp"
#include "core/log.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

void usage() {
    std::cout << "Usage: sk_timeline_sim --registry <file> --timeline <file> [--config <file>]\n"
              << "                       [--seconds N] [--dt S] [--json-log] [--verbose]\n";
}

bool parse_positive(const char* text, double& out) {
    char* end = nullptr;
    const double v = std::strtod(text, &end);
    if(end == text || *end != '\0' || !(v > 0.0)) return false;
    out = v;
    return true;
}

std::string stamp(double t) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(3);
    oss << '[' << t << "s] ";
    return oss.str();
}

} // namespace

int main(int argc, char** argv) {
    std::string registry_path, timeline_path, config_path;
    double seconds = 10.0;
    double dt = 1.0 / 60.0;
    bool json_log = false;
    bool verbose = false;

    for(int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        const bool has_value = i + 1 < argc;
        if(a == "--registry" && has_value) { registry_path = argv[++i]; continue; }
        if(a == "--timeline" && has_value) { timeline_path = argv[++i]; continue; }
        if(a == "--config" && has_value) { config_path = argv[++i]; continue; }
        if(a == "--seconds" && has_value) {
            if(!parse_positive(argv[++i], seconds)) { std::cerr << "Invalid --seconds value.\n"; return 1; }
            continue;
        }
        if(a == "--dt" && has_value) {
            if(!parse_positive(argv[++i], dt)) { std::cerr << "Invalid --dt value.\n"; return 1; }
            continue;
        }
        if(a == "--json-log") { json_log = true; continue; }
        if(a == "--verbose") { verbose = true; continue; }
        if(a == "--help" || a == "-h") { usage(); return 0; }
        std::cerr << "Unknown or incomplete argument: " << a << "\n";
        usage();
        return 1;
    }
    if(registry_path.empty() || timeline_path.empty()) { usage(); return 1; }

    sk::log::set_json_mode(json_log);
    sk::log::set_level(verbose ? sk::log::Level::Debug : sk::log::Level::Info);

    sk::audio::AssetCatalog catalog;
    auto roots = sk::persistence::load_registry_file(registry_path, catalog);
    if(!roots) { sk::log::error("Registry load failed: " + roots.error()); return 2; }

    sk::persistence::ConfigDocument config;
    if(!config_path.empty()) {
        auto loaded = sk::persistence::load_config_file(config_path, catalog);
        if(!loaded) { sk::log::error("Config load failed: " + loaded.error()); return 2; }
        config = loaded.value();
    }

    auto timeline = sk::persistence::load_timeline_file(timeline_path, catalog);
    if(!timeline) { sk::log::error("Timeline load failed: " + timeline.error()); return 2; }

    sk::registry::SoundRegistry registry(config.engine.random_seed);
    sk::persistence::populate_registry(registry, roots.value());
    sk::log::info("Loaded " + std::to_string(registry.lookup_size()) + " sounds, " +
                  std::to_string(catalog.clip_count()) + " clips, " + std::to_string(catalog.bus_count()) + " buses.");

    sk::core::ManualClock clock;
    sk::audio::SimulatedOutput output(clock);
    output.set_event_callback([](const sk::audio::SimulatedOutput::Event& ev) {
        if(ev.kind == sk::audio::SimulatedOutput::EventKind::Start) {
            sk::log::info(stamp(ev.time) + "voice " + std::to_string(ev.voice) + " start '" + ev.clip +
                          "' vol " + std::to_string(ev.volume));
        } else {
            sk::log::info(stamp(ev.time) + "voice " + std::to_string(ev.voice) + " stop");
        }
    });

    sk::playback::PlaybackEngine engine(config.engine, output, clock);
    engine.set_registry(&registry);

    std::unique_ptr<sk::music::LayerMixer> mixer;
    if(config.has_mixer) {
        mixer = std::make_unique<sk::music::LayerMixer>(config.mixer, engine, clock);
        mixer->start_music();
    }

    sk::timeline::TimelinePlayer player(engine, clock);
    player.set_timeline(timeline.value());
    player.set_log_beats(verbose);
    player.add_beat_listener([&clock](int beat, int bar, int beat_in_bar) {
        sk::log::info(stamp(clock.now()) + "beat " + std::to_string(beat) + " (bar " + std::to_string(bar) +
                      ", beat " + std::to_string(beat_in_bar) + ")");
    });
    player.add_marker_listener([&clock](const std::string& label) {
        sk::log::info(stamp(clock.now()) + "marker '" + label + "'");
    });
    if(!player.play()) return 2;

    const auto steps = static_cast<long long>(seconds / dt);
    for(long long i = 0; i < steps; ++i) {
        clock.advance(dt);
        player.update();
        if(mixer) mixer->update();
        engine.update();
    }

    sk::log::info("Simulated " + std::to_string(seconds) + "s: " + std::to_string(output.start_count()) +
                  " voice starts, " + std::to_string(engine.pending_tasks()) + " pending tasks.");
    return 0;
}
