#pragma once

#include "audio/audio_types.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sk::registry {

struct SoundEntry;
using SoundEntryPtr = std::shared_ptr<const SoundEntry>;
using SoundEntryList = std::vector<std::shared_ptr<SoundEntry>>;

struct PitchRange {
    float min = 1.0f;
    float max = 1.0f;
};

struct SpatialSettings {
    float spatial_blend = 1.0f;
    float min_distance = 1.0f;
    float max_distance = 25.0f;
};

// Pure grouping node; not playable.
struct Folder {
    SoundEntryList children;
};

struct SfxDefinition {
    audio::ClipRef clip;
    float volume = 1.0f;
    PitchRange pitch;
    bool loop = false;
    SpatialSettings spatial;
    audio::BusRef bus;      ///< null routes to the engine's default effect bus
};

struct SfxVariant {
    audio::ClipRef clip;
    float volume = 1.0f;
    PitchRange pitch;
    float probability = 1.0f;
};

// Members are addressed only as "Group.Variant"; they are not in the flat name table.
struct SfxVariantGroup {
    float volume = 1.0f;
    PitchRange pitch;
    SpatialSettings spatial;
    audio::BusRef bus;
    bool loop = false;
    SoundEntryList variants;  ///< each holds an SfxVariant
};

struct MusicDefinition {
    audio::ClipRef clip;
    audio::ClipRef intro_clip;  ///< played once before loop_clip when both are set
    audio::ClipRef loop_clip;
    float volume = 1.0f;
    bool loop = false;
    PitchRange pitch;
    audio::BusRef bus;
};

struct NarrationPlayable {
    audio::ClipRef clip;
    float volume = 1.0f;
    float pre_delay = 0.0f;     ///< seconds waited before the clip starts
};

struct NarrationClip : NarrationPlayable {};
struct NarrationVariant : NarrationPlayable {};

struct NarrationVariantGroup {
    SoundEntryList variants;  ///< each holds a NarrationVariant
};

struct NarrationGroup {
    float volume = 1.0f;
    PitchRange pitch;
    SpatialSettings spatial{0.0f, 1.0f, 25.0f};
    audio::BusRef bus;
    SoundEntryList entries;   ///< NarrationClip or NarrationVariantGroup, played in order
};

using EntryBody = std::variant<Folder, SfxDefinition, SfxVariantGroup, SfxVariant, MusicDefinition,
                               NarrationGroup, NarrationClip, NarrationVariantGroup, NarrationVariant>;

enum class EntryKind {
    Folder,
    Sfx,
    SfxVariantGroup,
    SfxVariant,
    Music,
    NarrationGroup,
    NarrationClip,
    NarrationVariantGroup,
    NarrationVariant
};

struct SoundEntry {
    std::string id;     ///< stable identity; assigned on first lookup build when empty
    std::string name;   ///< display name, unique in the flattened registry
    EntryBody body;

    EntryKind kind() const { return static_cast<EntryKind>(body.index()); }

    template<typename T> bool is() const { return std::holds_alternative<T>(body); }
    template<typename T> const T* as() const { return std::get_if<T>(&body); }
    template<typename T> T* as() { return std::get_if<T>(&body); }

    // Child list for kinds that have one (folder children, variants, narration entries).
    const SoundEntryList* children() const;
    SoundEntryList* children();
};

template<typename T>
std::shared_ptr<SoundEntry> make_entry(std::string name, T body) {
    auto entry = std::make_shared<SoundEntry>();
    entry->name = std::move(name);
    entry->body = std::move(body);
    return entry;
}

// NarrationClip or NarrationVariant payload, else nullptr.
const NarrationPlayable* as_narration_playable(const SoundEntry& entry);

const char* kind_name(EntryKind kind);

// 32 lowercase hex digits, random.
std::string generate_entry_id();

} // namespace sk::registry
