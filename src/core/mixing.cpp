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

#include <paintmix/core/mixing.hpp>
#include <paintmix/core/ranges.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <optional>
#include <vector>

namespace pmx {
  namespace detail {
    // Chroma magnitude mapped onto a pseudo-K/S of [1, ~2.2] for typical paints
    constexpr float chroma_ks_scale = 50.f;
    constexpr float chroma_ks_decay = 10.f;

    // Hybrid model weighting constants
    constexpr float hybrid_km_weight_base    = 0.3f;
    constexpr float hybrid_km_weight_dark    = 0.5f;
    constexpr float hybrid_chroma_step       = 0.05f;
    constexpr float hybrid_chroma_floor      = 0.7f;
    constexpr float hybrid_contrib_threshold = 0.01f;

    // Input to a mix, with ratios normalized to sum to 1 and zero-share components removed
    struct MixInput {
      std::vector<Lab>   colors;
      std::vector<float> weights;
    };

    // Validate and normalize a set of colors and ratios; returns nothing if the ratios
    // sum to zero, in which case the caller falls back to the neutral color
    std::optional<MixInput> normalize_mix_input(std::span<const Lab>   colors,
                                                std::span<const float> ratios) {
      runtime_check(colors.size() == ratios.size(), [&] {
        return fmt::format("mix received {} colors but {} ratios", colors.size(), ratios.size()); });
      for (float r : ratios)
        runtime_check(std::isfinite(r) && r >= 0.f, [r] {
          return fmt::format("mix ratios must be finite and non-negative, got {}", r); });

      double total = std::accumulate(range_iter(ratios), 0.0);
      guard(total > 0.0, std::nullopt);

      MixInput input;
      input.colors.reserve(colors.size());
      input.weights.reserve(ratios.size());
      for (auto [c, r] : view_zip(colors, ratios)) {
        guard_continue(r > 0.f);
        input.colors.push_back(c);
        input.weights.push_back(static_cast<float>(r / total));
      }
      return input;
    }

    // Linear, weighted average of a set of colors
    Lab mix_linear(const MixInput &input) {
      Lab c = Lab::Zero();
      for (auto [c_, w] : view_zip(input.colors, input.weights))
        c += c_ * w;
      return c;
    }

    // Kubelka-Munk mixed lightness over a normalized mix input
    float mix_lightness(const MixInput &input, const MixParams &params) {
      std::vector<float> lightness(input.colors.size());
      rng::transform(input.colors, lightness.begin(), [](const Lab &c) { return c[0]; });
      return mix_lightness_kubelka_munk(lightness, input.weights, params);
    }
  } // namespace detail

  float reflectance_from_lightness(float l, const MixParams &params) {
    float r = std::pow(std::clamp(l / 100.f, 0.f, 1.f), params.gamma);
    return std::clamp(r, params.epsilon, 1.f - params.epsilon);
  }

  float mix_lightness_kubelka_munk(std::span<const float> lightness,
                                   std::span<const float> weights,
                                   const MixParams       &params) {
    runtime_check(params.gamma > 0.f, [&] {
      return fmt::format("mixing gamma must be positive, got {}", params.gamma); });

    // K/S is assumed to mix linearly by ratio; accumulate in double, as the inverse
    // below loses most of its precision in float for dark mixtures
    double ks = 0.0;
    for (auto [l, w] : view_zip(lightness, weights))
      ks += static_cast<double>(w) * ks_from_reflectance(reflectance_from_lightness(l, params));

    double r = std::clamp(1.0 + ks - std::sqrt(ks * ks + 2.0 * ks), 0.0, 1.0);
    return static_cast<float>(std::pow(r, 1.0 / static_cast<double>(params.gamma)) * 100.0);
  }

  Lab mix_kubelka_munk(std::span<const Lab>   colors,
                       std::span<const float> ratios,
                       const MixParams       &params) {
    pmx_trace();

    auto input = detail::normalize_mix_input(colors, ratios);
    guard(input, neutral_mix_color);

    // A lone pigment is returned unchanged
    guard(input->colors.size() > 1, input->colors.front());

    Lab c = detail::mix_linear(*input);
    c[0]  = detail::mix_lightness(*input, params);

    // Pseudo-K/S per chroma channel, mixed by ratio, drives a decay of the linearly
    // averaged channel; differing hues muddy the mixture
    for (uint i : { 1u, 2u }) {
      float ks = 0.f;
      for (auto [c_, w] : view_zip(input->colors, input->weights))
        ks += w * (1.f + std::abs(c_[i]) / detail::chroma_ks_scale);
      c[i] *= 1.f / (1.f + ks / detail::chroma_ks_decay);
    }

    return c;
  }

  Lab mix_hybrid(std::span<const Lab>   colors,
                 std::span<const float> ratios,
                 const MixParams       &params) {
    pmx_trace();

    auto input = detail::normalize_mix_input(colors, ratios);
    guard(input, neutral_mix_color);
    guard(input->colors.size() > 1, input->colors.front());

    Lab   c        = detail::mix_linear(*input);
    float l_km     = detail::mix_lightness(*input, params);
    float l_min    = rng::min(input->colors | vws::transform([](const Lab &c_) { return c_[0]; }));
    float darkness = std::clamp((100.f - l_min) / 100.f, 0.f, 1.f);
    float w        = detail::hybrid_km_weight_base + detail::hybrid_km_weight_dark * darkness;
    c[0] = c[0] * (1.f - w) + l_km * w;

    // Chroma attenuates with each additional contributing component, capped at 30%
    auto n_contrib = rng::count_if(input->weights,
      [](float w_) { return w_ > detail::hybrid_contrib_threshold; });
    float scale = std::max(detail::hybrid_chroma_floor,
      1.f - detail::hybrid_chroma_step * static_cast<float>(std::max<std::ptrdiff_t>(n_contrib, 1) - 1));
    c.tail<2>() *= scale;

    return c;
  }

  Lab mix(std::span<const Lab>   colors,
          std::span<const float> ratios,
          MixModel               model,
          const MixParams       &params) {
    switch (model) {
      case MixModel::eHybrid: return mix_hybrid(colors, ratios, params);
      default:                return mix_kubelka_munk(colors, ratios, params);
    }
  }

  std::string_view to_string(MixModel model) {
    return model == MixModel::eHybrid ? "hybrid" : "kubelka-munk";
  }

  MixModel mix_model_from_string(std::string_view s) {
    if (s == "hybrid")
      return MixModel::eHybrid;
    runtime_check(s == "kubelka-munk" || s == "km",
      fmt::format("unknown mixing model \"{}\"", s));
    return MixModel::eKubelkaMunk;
  }
} // namespace pmx
