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

#include <paintmix/core/recipe.hpp>
#include <paintmix/core/nlopt.hpp>
#include <paintmix/core/ranges.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <execution>
#include <iterator>
#include <numeric>

namespace pmx {
  namespace detail {
    // Ratio grid resolution per tier; pairs scan i/20, triples scan i/10
    constexpr uint pair_grid_steps   = 20;
    constexpr uint triple_grid_steps = 10;

    // Single point of the search space; a pigment combination and its ratios
    struct MixEvaluation {
      std::array<uint,  search_tier_ceiling> indices;
      std::array<float, search_tier_ceiling> ratios;
      uint                                   n;
    };

    std::vector<std::array<uint, search_tier_ceiling>> enumerate_combinations(uint n, uint k) {
      std::vector<std::array<uint, search_tier_ceiling>> combinations;
      guard(k > 0 && k <= n && k <= search_tier_ceiling, combinations);
      combinations.reserve(n_choose_k(n, k));

      std::array<uint, search_tier_ceiling> c = { };
      std::iota(c.begin(), c.begin() + k, 0u);
      while (true) {
        combinations.push_back(c);

        // Find rightmost index that can still advance
        int i = static_cast<int>(k) - 1;
        while (i >= 0 && c[i] == n - k + static_cast<uint>(i))
          --i;
        guard_break(i >= 0);

        c[i]++;
        for (uint j = static_cast<uint>(i) + 1; j < k; ++j)
          c[j] = c[j - 1] + 1;
      }

      return combinations;
    }

    std::vector<std::array<float, search_tier_ceiling>> enumerate_ratio_grid(uint k) {
      std::vector<std::array<float, search_tier_ceiling>> grid;
      if (k == 1) {
        grid.push_back({ 1.f, 0.f, 0.f });
      } else if (k == 2) {
        for (uint i = 1; i < pair_grid_steps; ++i) {
          float r = static_cast<float>(i) / static_cast<float>(pair_grid_steps);
          grid.push_back({ r, 1.f - r, 0.f });
        }
      } else if (k == 3) {
        // Third share follows from the first two, accepted only within [0.1, 0.9]
        for (uint i = 1; i < triple_grid_steps; ++i) {
          for (uint j = 1; j < triple_grid_steps; ++j) {
            guard_continue(i + j < triple_grid_steps);
            uint l = triple_grid_steps - i - j;
            grid.push_back({ static_cast<float>(i) / static_cast<float>(triple_grid_steps),
                             static_cast<float>(j) / static_cast<float>(triple_grid_steps),
                             static_cast<float>(l) / static_cast<float>(triple_grid_steps) });
          }
        }
      }
      return grid;
    }

    // Search metric distance of a mix of pool entries to the target; ratios are
    // diluted before mixing, as solvent carries no color
    float eval_distance(const MixSolveInfo      &info,
                        std::span<const uint>    indices,
                        std::span<const float>   ratios) {
      std::array<Lab,   search_tier_ceiling> colors;
      std::array<float, search_tier_ceiling> diluted;
      for (uint i = 0; i < indices.size(); ++i) {
        colors[i]  = info.pool[indices[i]].lab;
        diluted[i] = ratios[i] * (1.f - info.constraints.dilution);
      }

      Lab c = mix(std::span(colors).first(indices.size()),
                  std::span(diluted).first(ratios.size()),
                  info.settings.model,
                  info.settings.params);
      return color_difference(c, info.target, info.settings.search_metric);
    }

    // Non-finite Lab values poison every distance they touch, and with it the search
    void check_finite_input(const Lab &target, std::span<const Pigment> pigments) {
      runtime_check(target.allFinite(),
        fmt::format("target holds a non-finite Lab value ({})", target));
      for (const auto &p : pigments)
        runtime_check(p.lab.allFinite(),
          fmt::format("pigment \"{}\" holds a non-finite Lab value ({})", p.code, p.lab));
    }

    // Fill in ratios of a single combination by local minimization over the simplex
    void solve_local(const MixSolveInfo &info, MixEvaluation &eval) {
      pmx_trace();

      // Lower bound is relaxed for k * min_share > 1, which would leave no feasible point
      uint   n     = eval.n;
      double lower = std::min(static_cast<double>(info.settings.min_share), 1.0 / static_cast<double>(n));
      auto   indices = std::span<const uint>(eval.indices).first(n);

      NLOptInfo solver = {
        .n              = n,
        .algo           = NLOptAlgo::LD_SLSQP,
        .objective      = detail::func_central_diff([&](const eig::VectorXd &x) {
          std::array<float, search_tier_ceiling> r;
          for (uint i = 0; i < n; ++i)
            r[i] = static_cast<float>(std::clamp(x[i], 0.0, 1.0));
          return static_cast<double>(eval_distance(info, indices, std::span(r).first(n)));
        }),
        .eq_constraints = {{ .f = detail::func_dot(eig::VectorXd::Ones(n), 1.0), .tol = 1e-6 }},
        .x_init         = eig::VectorXd::Constant(n, 1.0 / static_cast<double>(n)),
        .upper          = eig::VectorXd::Ones(n),
        .lower          = eig::VectorXd::Constant(n, lower),
        .max_iters      = 200,
        .rel_xpar_tol   = 1e-4
      };
      NLOptResult result = solve(solver);

      // Project result back onto the simplex; SLSQP satisfies the constraint only up to tolerance
      eig::VectorXd x = result.x.cwiseMax(0.0);
      x = (x / x.sum()).cwiseMax(lower);
      for (uint i = 0; i < n; ++i)
        eval.ratios[i] = static_cast<float>(x[i]);
    }
  } // namespace detail

  void SearchSettings::validate() const {
    runtime_check(candidates >= 1,
      "candidate pool must hold at least one pigment");
    runtime_check(std::isfinite(batch_mass) && batch_mass > 0.f,
      fmt::format("batch mass must be positive, got {}", batch_mass));
    runtime_check(std::isfinite(min_share) && min_share >= 0.f && min_share < 1.f,
      fmt::format("minimum share must lie in [0, 1), got {}", min_share));
    runtime_check(std::isfinite(params.gamma) && params.gamma > 0.f,
      fmt::format("mixing gamma must be positive, got {}", params.gamma));
    runtime_check(params.epsilon > 0.f && params.epsilon < 0.5f,
      fmt::format("reflectance epsilon must lie in (0, 0.5), got {}", params.epsilon));
  }

  MixSolution solve_mix(const MixSolveInfo &info) {
    pmx_trace();

    info.constraints.validate();
    info.settings.validate();
    runtime_check<EmptyCatalogException>(!info.pool.empty(),
      "no pigments remain after applying exclusions");
    detail::check_finite_input(info.target, info.pool);

    uint n_pool   = static_cast<uint>(info.pool.size());
    uint max_tier = std::min({ info.constraints.max_pigments, search_tier_ceiling, n_pool });

    MixSolution solution;
    for (uint k = 1; k <= max_tier; ++k) {
      pmx_trace_n("solve_mix_tier");

      // Enumerate the full tier up front, fixing the order in which ties are resolved
      auto combinations = detail::enumerate_combinations(n_pool, k);
      auto grid         = (k == 1 || info.settings.method == SearchMethod::eGrid)
                        ? detail::enumerate_ratio_grid(k)
                        : std::vector<std::array<float, search_tier_ceiling>>(1);

      std::vector<detail::MixEvaluation> evals;
      evals.reserve(combinations.size() * grid.size());
      for (const auto &indices : combinations)
        for (const auto &ratios : grid)
          evals.push_back({ indices, ratios, k });

      // Local search replaces the single placeholder grid point with its own optimum
      if (k > 1 && info.settings.method == SearchMethod::eLocal)
        std::for_each(std::execution::par, range_iter(evals),
          [&info](detail::MixEvaluation &eval) { detail::solve_local(info, eval); });

      // Evaluate all points independently into an index-addressed buffer
      std::vector<float> distances(evals.size());
      std::transform(std::execution::par, range_iter(evals), distances.begin(),
        [&info](const detail::MixEvaluation &eval) {
          return detail::eval_distance(info,
                                       std::span(eval.indices).first(eval.n),
                                       std::span(eval.ratios).first(eval.n));
        });

      // Sequential reduction; the first minimum in enumeration order wins, and
      // later tiers must strictly improve on earlier ones
      auto it = rng::min_element(distances);
      guard_continue(it != distances.end() && *it < solution.distance);

      const auto &best  = evals[std::distance(distances.begin(), it)];
      solution.indices.assign(best.indices.begin(), best.indices.begin() + best.n);
      solution.ratios.assign(best.ratios.begin(),   best.ratios.begin()  + best.n);
      solution.distance = *it;
    }

    return solution;
  }

  RecipeResult solve_recipe(const RecipeSolveInfo &info) {
    pmx_trace();

    info.constraints.validate();
    info.settings.validate();
    detail::check_finite_input(info.target, info.catalog);

    // Exclusion filters first, then prune to the nearest candidates
    auto filtered = filter_catalog(info.catalog, info.constraints);
    runtime_check<EmptyCatalogException>(!filtered.empty(),
      fmt::format("all {} catalog pigments are excluded by the given constraints", info.catalog.size()));
    auto pool = select_candidates(filtered, info.target, info.settings.candidates);

    MixSolution solution = solve_mix({ .target      = info.target,
                                       .pool        = pool,
                                       .constraints = info.constraints,
                                       .settings    = info.settings });

    return format_recipe(info.target, pool, solution, info.constraints, info.settings);
  }

  RecipeResult optimize_recipe(const Lab               &target,
                               std::span<const Pigment> catalog,
                               const MixConstraints    &constraints,
                               const SearchSettings    &settings) {
    return solve_recipe({ .target      = target,
                          .catalog     = catalog,
                          .constraints = constraints,
                          .settings    = settings });
  }

  std::string_view to_string(SearchMethod method) {
    return method == SearchMethod::eLocal ? "local" : "grid";
  }

  SearchMethod search_method_from_string(std::string_view s) {
    if (s == "local" || s == "slsqp")
      return SearchMethod::eLocal;
    runtime_check(s == "grid",
      fmt::format("unknown search method \"{}\"", s));
    return SearchMethod::eGrid;
  }
} // namespace pmx
