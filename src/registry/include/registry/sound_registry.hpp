#pragma once
#include "registry/sound_entry.hpp"
#include "core/random.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sk::registry {

struct VariantPath {
    SoundEntryPtr group;    ///< SfxVariantGroup
    SoundEntryPtr variant;  ///< SfxVariant inside `group`
};

struct NarrationPath {
    SoundEntryPtr group;    ///< NarrationGroup
    SoundEntryPtr entry;    ///< NarrationClip or NarrationVariant to play on its own
};

/**
 * @brief Catalog of sound definitions
 *
 * Authored as a tree of folders and groups, resolved at runtime through a flat name table.
 * The table is built once per activation; names are unique across it and the first entry
 * registered under a name wins. Unresolved names yield nullptr, never an exception.
 */
class SoundRegistry {
public:
    using DuplicateCallback = std::function<void(const SoundEntry& kept, const SoundEntry& dropped)>;

    explicit SoundRegistry(uint32_t random_seed = 0);

    // Tree management (invalidates the lookup table)
    void add_root(std::shared_ptr<SoundEntry> entry);
    const SoundEntryList& roots() const { return roots_; }
    void clear();

    /**
     * @brief Walk the tree once: assign missing ids and fill the flat name table
     *
     * Folder children, narration group entries and narration variants are inserted;
     * sfx variants are reachable only through "Group.Variant" paths. Duplicate names keep
     * the first occurrence and are reported through the log and the duplicate callback.
     */
    void build_lookup();

    /**
     * @brief Resolve a name, falling back to "Group.Item" path resolution
     * @return Entry or nullptr when nothing matches
     */
    SoundEntryPtr get_entry(const std::string& name) const;

    // Same as get_entry, but nullptr when the entry is of a different kind.
    template<typename Kind>
    SoundEntryPtr get_entry_as(const std::string& name) const {
        auto entry = get_entry(name);
        return entry && entry->is<Kind>() ? entry : nullptr;
    }

    SoundEntryPtr get_sfx(const std::string& name) const { return get_entry_as<SfxDefinition>(name); }
    SoundEntryPtr get_music(const std::string& name) const { return get_entry_as<MusicDefinition>(name); }
    SoundEntryPtr get_folder(const std::string& name) const { return get_entry_as<Folder>(name); }
    SoundEntryPtr get_sfx_variant_group(const std::string& name) const { return get_entry_as<SfxVariantGroup>(name); }
    SoundEntryPtr get_narration_group(const std::string& name) const { return get_entry_as<NarrationGroup>(name); }

    // "Group.Variant" against an SfxVariantGroup; matching is case-insensitive.
    std::optional<VariantPath> try_resolve_variant_path(const std::string& path) const;

    // "Group.Item" against a NarrationGroup. Item may name a clip, a variant group (one of its
    // variants is picked) or a variant nested in one of the group's variant groups.
    std::optional<NarrationPath> try_resolve_narration_path(const std::string& path) const;

    // The SfxVariantGroup that lists `variant`, or nullptr.
    SoundEntryPtr owning_variant_group(const SoundEntry& variant) const;

    const std::vector<std::string>& duplicate_names() const { ensure_lookup(); return duplicates_; }
    void set_duplicate_callback(DuplicateCallback cb) { duplicate_callback_ = std::move(cb); }

    size_t lookup_size() const { ensure_lookup(); return lookup_.size(); }

private:
    void ensure_lookup() const;
    void add_recursive(const std::shared_ptr<SoundEntry>& entry, int depth) const;
    SoundEntryPtr find_exact(const std::string& name) const;

    SoundEntryList roots_;

    // Lookup state is rebuilt lazily from const accessors.
    mutable std::unordered_map<std::string, std::shared_ptr<SoundEntry>> lookup_;
    mutable std::unordered_map<const SoundEntry*, std::shared_ptr<SoundEntry>> variant_owner_;
    mutable std::vector<std::string> duplicates_;
    mutable bool lookup_built_ = false;
    mutable core::Random random_;

    DuplicateCallback duplicate_callback_;
};

// Split "Group.Item" on the first '.', trimming both halves. False when either half is empty.
bool split_group_item(const std::string& path, std::string& group, std::string& item);

bool iequals(const std::string& a, const std::string& b);

// Uniform pick among variants that have a clip, starting at a random offset and rotating.
SoundEntryPtr pick_narration_variant(const NarrationVariantGroup& group, core::Random& random);

} // namespace sk::registry
