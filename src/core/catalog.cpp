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

#include <paintmix/core/catalog.hpp>
#include <paintmix/core/ranges.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <numeric>

namespace pmx {
  namespace detail {
    constexpr std::array<std::string_view, 12> white_black_silver_codes = {
      "C2", "C8", "C11", "C14", "C33", "C52", "C62",
      "EX-01", "EX-02", "LP-1", "LP-2", "LP-18"
    };
  } // namespace detail

  std::span<const std::string_view> white_black_silver_codes() {
    return detail::white_black_silver_codes;
  }

  void MixConstraints::validate() const {
    runtime_check(max_pigments >= 1 && max_pigments <= max_pigments_limit,
      fmt::format("max_pigments must lie in [1, {}], got {}", max_pigments_limit, max_pigments));
    runtime_check(std::isfinite(dilution) && dilution >= 0.f && dilution < 1.f,
      fmt::format("dilution must lie in [0, 1), got {}", dilution));
  }

  bool MixConstraints::excludes(const Pigment &p) const {
    guard(!excluded_categories.contains(p.category), true);
    guard(!excluded_codes.contains(p.code), true);
    guard(!excluded_manufacturers.contains(p.manufacturer), true);
    if (exclude_white_black)
      guard(rng::find(detail::white_black_silver_codes, p.code) == detail::white_black_silver_codes.end(), true);
    return false;
  }

  std::vector<Pigment> filter_catalog(std::span<const Pigment> catalog,
                                      const MixConstraints    &constraints) {
    pmx_trace();
    return catalog
         | vws::filter([&](const Pigment &p) { return !constraints.excludes(p); })
         | view_to<std::vector<Pigment>>();
  }

  std::vector<Pigment> select_candidates(std::span<const Pigment> catalog,
                                         const Lab               &target,
                                         uint                     n_candidates) {
    pmx_trace();

    // Single-pigment distances to target
    std::vector<float> distances(catalog.size());
    rng::transform(catalog, distances.begin(),
      [&target](const Pigment &p) { return delta_e_76(p.lab, target); });

    // Stable sort of catalog indices by distance
    std::vector<uint> order(catalog.size());
    std::iota(range_iter(order), 0u);
    rng::stable_sort(order, {}, [&distances](uint i) { return distances[i]; });

    // Retain the nearest n_candidates
    return order
         | vws::take(n_candidates)
         | vws::transform([&catalog](uint i) { return catalog[i]; })
         | view_to<std::vector<Pigment>>();
  }
} // namespace pmx
