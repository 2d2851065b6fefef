#include "audio/asset_catalog.hpp"

namespace sk::audio {

ClipRef AssetCatalog::add_clip(const std::string& name, double length_seconds) {
    auto clip = std::make_shared<AudioClip>();
    clip->name = name;
    clip->length_seconds = length_seconds;
    clips_[name] = clip;
    return clip;
}

BusRef AssetCatalog::add_bus(const std::string& name) {
    auto bus = std::make_shared<Bus>(name);
    buses_[name] = bus;
    return bus;
}

ClipRef AssetCatalog::find_clip(const std::string& name) const {
    auto it = clips_.find(name);
    return it == clips_.end() ? nullptr : it->second;
}

BusRef AssetCatalog::find_bus(const std::string& name) const {
    auto it = buses_.find(name);
    return it == buses_.end() ? nullptr : it->second;
}

} // namespace sk::audio
