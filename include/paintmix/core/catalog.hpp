// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <paintmix/core/color.hpp>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pmx {
  // Maximum nr. of pigments a recipe may be constrained to
  constexpr static uint max_pigments_limit = 5;

  // Default nr. of catalog entries retained as candidates for combinatorial search
  constexpr static uint default_candidate_count = 15;

  /* Catalog row describing a single opaque paint; owned by whoever loaded the catalog */
  struct Pigment {
    std::string code;         // Manufacturer's product code, e.g. "C62"
    std::string name;         // Display name
    std::string manufacturer; // Brand
    std::string category;     // e.g. "basic", "metallic", "clear", "character"
    Lab         lab;          // Measured color of the dried paint

  public: // Boilerplate
    bool operator==(const Pigment &o) const {
      return code == o.code && manufacturer == o.manufacturer && name == o.name
          && category == o.category && lab.isApprox(o.lab);
    }
  };

  /* User-facing constraints on the pigments a recipe may draw from */
  struct MixConstraints {
    uint                  max_pigments           = 3;     // Recipe size limit in [1, 5]
    std::set<std::string> excluded_categories    = { };   // Categories never used, e.g. "metallic"
    std::set<std::string> excluded_codes         = { };   // Product codes never used
    std::set<std::string> excluded_manufacturers = { };   // Brands not at hand
    bool                  exclude_white_black    = false; // Add white/black/silver codes to the above
    float                 dilution               = 0.f;   // Solvent fraction of the final paint in [0, 1)

  public:
    // Throws a ValidationException on out-of-range values
    void validate() const;

    // Test whether a pigment is removed from the catalog by these constraints
    bool excludes(const Pigment &p) const;
  };

  // Product codes of whites, blacks and silvers suppressed by exclude_white_black
  std::span<const std::string_view> white_black_silver_codes();

  // Order-preserving removal of excluded pigments
  std::vector<Pigment> filter_catalog(std::span<const Pigment> catalog,
                                      const MixConstraints    &constraints);

  // Retain the pigments closest to a target under DE76, in ascending distance; ties
  // keep their catalog order, so repeated calls over the same catalog agree
  std::vector<Pigment> select_candidates(std::span<const Pigment> catalog,
                                         const Lab               &target,
                                         uint                     n_candidates = default_candidate_count);
} // namespace pmx
