#pragma once

#include "playback/playback_engine.hpp"
#include "music/layer_mixer.hpp"
#include "audio/asset_catalog.hpp"
#include "core/result.hpp"
#include <string>

namespace sk::persistence {

struct ConfigDocument {
    playback::EngineConfig engine;
    bool has_mixer = false;         ///< true when the document carries a "mixer" section
    music::MixerConfig mixer;
};

/**
 * @brief Load the "engine" and "mixer" sections of a configuration document
 *
 * Missing keys keep their defaults. Bus names resolve against `catalog`; an unknown name fails
 * the load. Pool sizes below 1 are raised to 1 with a warning.
 */
core::Result<ConfigDocument> load_config_json(const std::string& text, const audio::AssetCatalog& catalog) noexcept;
core::Result<ConfigDocument> load_config_file(const std::string& path, const audio::AssetCatalog& catalog) noexcept;

// Single-section variants. A document without a "mixer" section is an error for load_mixer_config.
core::Result<playback::EngineConfig> load_engine_config(const std::string& text,
                                                        const audio::AssetCatalog& catalog) noexcept;
core::Result<music::MixerConfig> load_mixer_config(const std::string& text) noexcept;

} // namespace sk::persistence
