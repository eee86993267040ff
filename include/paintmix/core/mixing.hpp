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
#include <span>
#include <string_view>

namespace pmx {
  // Available subtractive mixing models
  enum class MixModel {
    eKubelkaMunk, // Single-constant Kubelka-Munk on lightness, chroma decay on a*/b*
    eHybrid       // Blend of Kubelka-Munk and linear lightness, weighted by darkness
  };

  // Tunable constants of the mixing models; passed along explicitly, never global
  struct MixParams {
    float gamma   = 2.2f;  // Exponent mapping L/100 to effective reflectance
    float epsilon = 1e-6f; // Reflectance is clamped to (epsilon, 1 - epsilon)
  };

  // Color returned for an empty or zero-sum ratio vector
  inline const Lab neutral_mix_color = Lab(50.f, 0.f, 0.f);

  /* Kubelka-Munk helper functions */

  // Single-constant K/S ratio of a reflectance, and its inverse
  inline float ks_from_reflectance(float r) { return sqr(1.f - r) / (2.f * r); }
  inline float reflectance_from_ks(float ks) { return 1.f + ks - std::sqrt(ks * ks + 2.f * ks); }

  // Effective reflectance of a lightness value, clamped away from 0 and 1
  float reflectance_from_lightness(float l, const MixParams &params);

  // Kubelka-Munk mixed lightness of a set of lightness values under normalized weights
  float mix_lightness_kubelka_munk(std::span<const float> lightness,
                                   std::span<const float> weights,
                                   const MixParams       &params);

  /* Mixing models; all accept unnormalized, non-negative ratios of equal length to colors */

  // Kubelka-Munk approximation; K/S mixes linearly on lightness, while a*/b* are
  // linearly averaged and then decayed by a ratio-weighted pseudo-K/S per channel
  Lab mix_kubelka_munk(std::span<const Lab>   colors,
                       std::span<const float> ratios,
                       const MixParams       &params = { });

  // Hybrid; lightness interpolates between linear and Kubelka-Munk estimates, leaning
  // towards the latter when dark components are present, and chroma is attenuated
  // with the number of contributing components
  Lab mix_hybrid(std::span<const Lab>   colors,
                 std::span<const float> ratios,
                 const MixParams       &params = { });

  // Dispatch to one of the above models
  Lab mix(std::span<const Lab>   colors,
          std::span<const float> ratios,
          MixModel               model  = MixModel::eKubelkaMunk,
          const MixParams       &params = { });

  // Human-readable model names
  std::string_view to_string(MixModel model);
  MixModel         mix_model_from_string(std::string_view s);
} // namespace pmx
