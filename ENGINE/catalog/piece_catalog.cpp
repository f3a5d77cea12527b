#include "catalog/piece_catalog.hpp"

#include <array>

#include "utils/string_utils.hpp"

namespace flatrig::catalog {
namespace {

constexpr std::array<const char*, 7> kImageExtensions = {
    ".png", ".jpg", ".jpeg", ".webp", ".bmp", ".gif", ".tga"
};

std::string_view strip_directory(std::string_view name) {
    const std::size_t slash = name.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return name;
    }
    return name.substr(slash + 1);
}

std::string_view strip_image_extension(std::string_view name) {
    for (const char* ext : kImageExtensions) {
        if (strings::ends_with_ci(name, ext)) {
            return name.substr(0, name.size() - std::string_view(ext).size());
        }
    }
    return name;
}

}

std::string normalize_piece_name(std::string_view raw) {
    const std::string trimmed = strings::trim_copy(raw);
    std::string_view view = strip_directory(trimmed);
    view = strip_image_extension(view);
    return strings::trim_copy(view);
}

std::string resolve_piece_name(std::string_view raw, const AliasMap& aliases) {
    std::string name = normalize_piece_name(raw);
    if (name.empty()) {
        return name;
    }
    auto it = aliases.find(name);
    if (it != aliases.end()) {
        return it->second;
    }
    return name;
}

std::optional<std::pair<std::string, std::string>> parse_alias_pair(std::string_view text) {
    const std::size_t eq = text.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }
    std::string from = normalize_piece_name(text.substr(0, eq));
    std::string to   = normalize_piece_name(text.substr(eq + 1));
    if (from.empty() || to.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(from), std::move(to));
}

PieceCatalog::PieceCatalog(std::vector<PieceCatalogEntry> entries) {
    entries_.reserve(entries.size());
    for (auto& entry : entries) {
        add(std::move(entry));
    }
}

bool PieceCatalog::add(PieceCatalogEntry entry) {
    entry.name = strings::trim_copy(entry.name);
    if (entry.name.empty() || index_.count(entry.name) != 0) {
        return false;
    }
    index_.emplace(entry.name, entries_.size());
    entries_.push_back(std::move(entry));
    return true;
}

const PieceCatalogEntry* PieceCatalog::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::vector<std::string> PieceCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.name);
    }
    return out;
}

void resolve_instance_names(rig::FlatFrame& frame, const AliasMap& aliases) {
    std::size_t kept = 0;
    for (std::size_t i = 0; i < frame.size(); ++i) {
        std::string resolved = resolve_piece_name(frame[i].piece_name, aliases);
        if (resolved.empty()) {
            continue;
        }
        if (kept != i) {
            frame[kept] = std::move(frame[i]);
        }
        frame[kept].piece_name = std::move(resolved);
        ++kept;
    }
    frame.resize(kept);
}

std::map<std::string, std::size_t> count_occurrences(const std::vector<rig::FlatFrame>& frames) {
    std::map<std::string, std::size_t> counts;
    for (const auto& frame : frames) {
        for (const auto& instance : frame) {
            ++counts[instance.piece_name];
        }
    }
    return counts;
}

std::vector<std::string> unmatched_names(const std::map<std::string, std::size_t>& occurrences,
                                         const PieceCatalog& catalog) {
    std::vector<std::string> missing;
    for (const auto& [name, count] : occurrences) {
        if (count > 0 && !catalog.contains(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

}
