#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "rig/rig_types.hpp"

namespace flatrig::catalog {

struct PieceCatalogEntry {
    std::string name;
    double origin_x = 0.0;
    double origin_y = 0.0;
    double scale_x  = 1.0;
    double scale_y  = 1.0;
};

// Normalized authored name -> catalog name.
using AliasMap = std::unordered_map<std::string, std::string>;

// Trims, drops any directory prefix ('/' or '\\') and a trailing image extension.
std::string normalize_piece_name(std::string_view raw);

// normalize_piece_name followed by alias substitution. Empty result means "not a piece".
std::string resolve_piece_name(std::string_view raw, const AliasMap& aliases);

// Parses "from=to" with both sides normalized. Returns nullopt without '=' or with an empty side.
std::optional<std::pair<std::string, std::string>> parse_alias_pair(std::string_view text);

class PieceCatalog {
public:
    PieceCatalog() = default;
    explicit PieceCatalog(std::vector<PieceCatalogEntry> entries);

    // Appends `entry` unless its trimmed name is empty or already present.
    bool add(PieceCatalogEntry entry);

    const PieceCatalogEntry* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    const std::vector<PieceCatalogEntry>& entries() const { return entries_; }
    std::vector<std::string> names() const;
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<PieceCatalogEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

// Rewrites each instance name to its resolved piece name and drops instances
// whose name resolves to nothing. Order is preserved.
void resolve_instance_names(rig::FlatFrame& frame, const AliasMap& aliases);

// Occurrences of every resolved name over all frames, keyed by name.
std::map<std::string, std::size_t> count_occurrences(const std::vector<rig::FlatFrame>& frames);

// Used names with no catalog entry, sorted.
std::vector<std::string> unmatched_names(const std::map<std::string, std::size_t>& occurrences,
                                         const PieceCatalog& catalog);

}
