#include "registry/sound_registry.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>

namespace sk::registry {

namespace {

constexpr int kMaxTreeDepth = 64;

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

bool iequals(const std::string& a, const std::string& b) {
    if(a.size() != b.size()) return false;
    for(size_t i = 0; i < a.size(); ++i) {
        if(std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

bool split_group_item(const std::string& path, std::string& group, std::string& item) {
    group.clear();
    item.clear();
    if(is_blank(path)) return false;

    const size_t dot = path.find('.');
    if(dot == std::string::npos || dot == 0 || dot >= path.size() - 1) return false;

    group = trim(path.substr(0, dot));
    item = trim(path.substr(dot + 1));
    return !group.empty() && !item.empty();
}

SoundEntryPtr pick_narration_variant(const NarrationVariantGroup& group, core::Random& random) {
    const auto& variants = group.variants;
    if(variants.empty()) return nullptr;

    const size_t start = random.index(variants.size());
    for(size_t i = 0; i < variants.size(); ++i) {
        const auto& candidate = variants[(start + i) % variants.size()];
        if(!candidate) continue;
        const auto* playable = as_narration_playable(*candidate);
        if(playable && playable->clip) return candidate;
    }
    return nullptr;
}

SoundRegistry::SoundRegistry(uint32_t random_seed) : random_(random_seed) {}

void SoundRegistry::add_root(std::shared_ptr<SoundEntry> entry) {
    if(!entry) return;
    roots_.push_back(std::move(entry));
    lookup_built_ = false;
}

void SoundRegistry::clear() {
    roots_.clear();
    lookup_.clear();
    variant_owner_.clear();
    duplicates_.clear();
    lookup_built_ = false;
}

void SoundRegistry::build_lookup() {
    lookup_.clear();
    variant_owner_.clear();
    duplicates_.clear();
    for(const auto& root : roots_) {
        add_recursive(root, 0);
    }
    lookup_built_ = true;
    sk::log::debug("SoundRegistry: lookup built with " + std::to_string(lookup_.size()) + " names");
}

void SoundRegistry::ensure_lookup() const {
    if(!lookup_built_) const_cast<SoundRegistry*>(this)->build_lookup();
}

void SoundRegistry::add_recursive(const std::shared_ptr<SoundEntry>& entry, int depth) const {
    if(!entry) return;
    if(depth > kMaxTreeDepth) {
        sk::log::warn("SoundRegistry: Tree deeper than " + std::to_string(kMaxTreeDepth) + " levels at '" + entry->name + "'; skipping.");
        return;
    }

    if(entry->id.empty()) entry->id = generate_entry_id();

    if(!is_blank(entry->name)) {
        auto [it, inserted] = lookup_.emplace(entry->name, entry);
        if(!inserted) {
            duplicates_.push_back(entry->name);
            sk::log::warn("SoundRegistry: Duplicate name '" + entry->name + "'. Keeping first occurrence.");
            if(duplicate_callback_) duplicate_callback_(*it->second, *entry);
        }
    }

    if(auto* group = entry->as<SfxVariantGroup>()) {
        // Addressed by path only; remember the owner so a bare variant can be played with
        // its group's settings.
        for(const auto& variant : group->variants) {
            if(!variant) continue;
            if(variant->id.empty()) variant->id = generate_entry_id();
            variant_owner_.emplace(variant.get(), entry);
        }
        return;
    }

    if(auto* children = entry->children()) {
        for(const auto& child : *children) {
            add_recursive(child, depth + 1);
        }
    }
}

SoundEntryPtr SoundRegistry::find_exact(const std::string& name) const {
    ensure_lookup();
    auto it = lookup_.find(name);
    return it == lookup_.end() ? nullptr : it->second;
}

SoundEntryPtr SoundRegistry::get_entry(const std::string& name) const {
    if(is_blank(name)) return nullptr;
    if(auto exact = find_exact(name)) return exact;

    if(name.find('.') == std::string::npos) return nullptr;
    if(auto path = try_resolve_variant_path(name)) return path->variant;
    if(auto path = try_resolve_narration_path(name)) return path->entry;
    return nullptr;
}

std::optional<VariantPath> SoundRegistry::try_resolve_variant_path(const std::string& path) const {
    std::string group_name, item_name;
    if(!split_group_item(path, group_name, item_name)) return std::nullopt;

    auto group_entry = find_exact(group_name);
    const auto* group = group_entry ? group_entry->as<SfxVariantGroup>() : nullptr;
    if(!group) return std::nullopt;

    for(const auto& candidate : group->variants) {
        if(!candidate) continue;
        if(iequals(candidate->name, item_name)) {
            return VariantPath{group_entry, candidate};
        }
    }
    return std::nullopt;
}

std::optional<NarrationPath> SoundRegistry::try_resolve_narration_path(const std::string& path) const {
    std::string group_name, item_name;
    if(!split_group_item(path, group_name, item_name)) return std::nullopt;

    auto group_entry = find_exact(group_name);
    const auto* group = group_entry ? group_entry->as<NarrationGroup>() : nullptr;
    if(!group) return std::nullopt;

    for(const auto& candidate : group->entries) {
        if(!candidate) continue;
        if(iequals(candidate->name, item_name)) {
            if(const auto* variants = candidate->as<NarrationVariantGroup>()) {
                if(auto picked = pick_narration_variant(*variants, random_)) {
                    return NarrationPath{group_entry, picked};
                }
                continue;
            }
            if(as_narration_playable(*candidate)) {
                return NarrationPath{group_entry, candidate};
            }
        }

        if(const auto* variants = candidate->as<NarrationVariantGroup>()) {
            for(const auto& variant : variants->variants) {
                if(variant && iequals(variant->name, item_name)) {
                    return NarrationPath{group_entry, variant};
                }
            }
        }
    }
    return std::nullopt;
}

SoundEntryPtr SoundRegistry::owning_variant_group(const SoundEntry& variant) const {
    ensure_lookup();
    auto it = variant_owner_.find(&variant);
    return it == variant_owner_.end() ? nullptr : it->second;
}

} // namespace sk::registry
