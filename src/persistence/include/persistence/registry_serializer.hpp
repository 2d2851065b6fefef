#pragma once

#include "registry/sound_registry.hpp"
#include "audio/asset_catalog.hpp"
#include "core/result.hpp"
#include <string>

namespace sk::persistence {

/**
 * @brief Load a registry document
 *
 * Clips and buses declared by the document are added to `catalog` first; entries then
 * reference them by name. An unknown clip or bus name fails the whole load, and a failed load
 * leaves `catalog` as it was.
 * @return The root entries, ready for SoundRegistry::add_root
 */
core::Result<registry::SoundEntryList> load_registry_json(const std::string& text,
                                                          audio::AssetCatalog& catalog) noexcept;
core::Result<registry::SoundEntryList> load_registry_file(const std::string& path,
                                                          audio::AssetCatalog& catalog) noexcept;

// Adds `roots` to `registry` and rebuilds its lookup table.
void populate_registry(registry::SoundRegistry& registry, const registry::SoundEntryList& roots);

} // namespace sk::persistence
