#pragma once

#include "timeline/timeline.hpp"
#include "audio/asset_catalog.hpp"
#include "core/result.hpp"
#include <string>

namespace sk::persistence {

/**
 * @brief Load a timeline document
 *
 * Sound references stay as names and resolve against a registry when the timeline plays.
 * Automation buses resolve against `catalog` at load time. Nested events embed their child
 * document under "timeline".
 */
core::Result<timeline::TimelinePtr> load_timeline_json(const std::string& text,
                                                       const audio::AssetCatalog& catalog) noexcept;
core::Result<timeline::TimelinePtr> load_timeline_file(const std::string& path,
                                                       const audio::AssetCatalog& catalog) noexcept;

} // namespace sk::persistence
