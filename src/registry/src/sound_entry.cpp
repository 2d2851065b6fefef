#include "registry/sound_entry.hpp"
#include "core/random.hpp"
#include <iomanip>
#include <sstream>

namespace sk::registry {

namespace {

template<typename Self, typename List>
List* children_of(Self& entry) {
    if(auto* folder = entry.template as<Folder>()) return &folder->children;
    if(auto* group = entry.template as<SfxVariantGroup>()) return &group->variants;
    if(auto* narration = entry.template as<NarrationGroup>()) return &narration->entries;
    if(auto* variants = entry.template as<NarrationVariantGroup>()) return &variants->variants;
    return nullptr;
}

} // namespace

const SoundEntryList* SoundEntry::children() const {
    return children_of<const SoundEntry, const SoundEntryList>(*this);
}

SoundEntryList* SoundEntry::children() {
    return children_of<SoundEntry, SoundEntryList>(*this);
}

const NarrationPlayable* as_narration_playable(const SoundEntry& entry) {
    if(auto* clip = entry.as<NarrationClip>()) return clip;
    if(auto* variant = entry.as<NarrationVariant>()) return variant;
    return nullptr;
}

const char* kind_name(EntryKind kind) {
    switch(kind) {
        case EntryKind::Folder: return "folder";
        case EntryKind::Sfx: return "sfx";
        case EntryKind::SfxVariantGroup: return "sfx_variant_group";
        case EntryKind::SfxVariant: return "sfx_variant";
        case EntryKind::Music: return "music";
        case EntryKind::NarrationGroup: return "narration_group";
        case EntryKind::NarrationClip: return "narration_clip";
        case EntryKind::NarrationVariantGroup: return "narration_variant_group";
        case EntryKind::NarrationVariant: return "narration_variant";
    }
    return "unknown";
}

std::string generate_entry_id() {
    static core::Random rng;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(16) << rng.next_u64()
        << std::setw(16) << rng.next_u64();
    return oss.str();
}

} // namespace sk::registry
