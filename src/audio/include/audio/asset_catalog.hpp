#pragma once

#include "audio/audio_types.hpp"
#include <string>
#include <unordered_map>

namespace sk::audio {

/**
 * @brief Name tables for clips and buses referenced by serialized assets
 */
class AssetCatalog {
public:
    // Re-adding a name replaces the earlier clip/bus.
    ClipRef add_clip(const std::string& name, double length_seconds);
    BusRef add_bus(const std::string& name);

    ClipRef find_clip(const std::string& name) const;
    BusRef find_bus(const std::string& name) const;

    size_t clip_count() const { return clips_.size(); }
    size_t bus_count() const { return buses_.size(); }

private:
    std::unordered_map<std::string, ClipRef> clips_;
    std::unordered_map<std::string, BusRef> buses_;
};

} // namespace sk::audio
