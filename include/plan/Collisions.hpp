#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_set>
#include <vector>

namespace sn::plan {

using NameSet = std::unordered_set<std::string>;

struct CollisionResolution {
    std::map<std::string, std::string> names;  // original -> final
    std::vector<std::string> unresolved;       // originals no free name could be found for
};

/// Resolves clashes between the desired names of one directory's entries.
///
/// `planned` maps original name -> desired sanitized name for every entry that
/// needs renaming; `untouched` holds the names of siblings that stay as they are.
/// Candidates are settled in sorted order of their original names, so the outcome
/// is reproducible. Final names are pairwise distinct and avoid every untouched
/// name. An entry whose disambiguator space is exhausted is listed in
/// `unresolved` instead; the others are still settled.
CollisionResolution resolveCollisions(const std::map<std::string, std::string>& planned,
                                                     const NameSet& untouched,
                                                     std::size_t maxLength);

/// First of `desired`, `stem_1.ext`, `stem_2.ext`, ... not in `taken`, each kept
/// within `maxLength` code points. Throws std::length_error if the
/// disambiguator space is exhausted, which only very small limits can cause.
std::string findAvailableName(const std::string& desired, const NameSet& taken, std::size_t maxLength);

}
