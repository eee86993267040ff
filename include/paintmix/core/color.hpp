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

#include <paintmix/core/math.hpp>
#include <paintmix/core/utility.hpp>
#include <string>
#include <string_view>

namespace pmx {
  /* Define program's underlying color types as renamed Eigen types */
  using Lab = eig::Array<float, 3, 1>; // CIE L*a*b* triple, L in [0, 100]
  using Xyz = eig::Array<float, 3, 1>; // CIE XYZ triple, Y of reference white is 1
  using Rgb = eig::Array<int,   3, 1>; // 8-bit device RGB triple in [0, 255]

  // Available color difference metrics
  enum class DeltaEMethod {
    eDE76, // Euclidean distance in Lab; cheap, used during search
    eDE00  // CIEDE2000; perceptually corrected, used for reporting
  };

  /*
    Hardcoded model data.
  */

  namespace models {
    // Linear color space transformations
    extern eig::Matrix3f xyz_to_srgb_transform;
    extern eig::Matrix3f srgb_to_xyz_transform;

    // Reference white of the D65 illuminant, 2 deg. observer
    extern Xyz white_d65;
  } // namespace models

  /*
    Color space conversion functions
  */

  // Convert a value in sRGB to linear sRGB
  inline
  float srgb_to_lrgb_f(float f) {
    return f <= 0.04045f
      ? f / 12.92f
      : std::pow((f + 0.055f) / 1.055f, 2.4f);
  }

  // Convert a value in linear sRGB to sRGB
  inline
  float lrgb_to_srgb_f(float f) {
    return f <= 0.0031308f
      ? f * 12.92f
      : std::pow(f, 1.0f / 2.4f) * 1.055f - 0.055f;
  }

  // sRGB/linear sRGB/XYZ conversion shorthands
  eig::Array3f srgb_to_lrgb(eig::Array3f c);
  eig::Array3f lrgb_to_srgb(eig::Array3f c);
  inline Xyz lrgb_to_xyz(const eig::Array3f &c) { return models::srgb_to_xyz_transform * c.matrix(); }
  inline eig::Array3f xyz_to_lrgb(const Xyz &c) { return models::xyz_to_srgb_transform * c.matrix(); }

  // XYZ/Lab conversion under the D65 reference white
  Lab xyz_to_lab(const Xyz &c);
  Xyz lab_to_xyz(const Lab &c);

  // 8-bit device RGB to Lab and back; the latter clamps out-of-gamut channels to [0, 255]
  Lab rgb_to_lab(const Rgb &c);
  Rgb lab_to_rgb(const Lab &c);
  inline Lab rgb_to_lab(int r, int g, int b) { return rgb_to_lab(Rgb(r, g, b)); }
  inline Rgb lab_to_rgb(float l, float a, float b) { return lab_to_rgb(Lab(l, a, b)); }

  // Hexadecimal color codes; accepts "#RRGGBB", "RRGGBB", "#RGB" and "RGB"
  Rgb         parse_hex_rgb(std::string_view hex);
  std::string to_hex(const Rgb &c);

  /*
    Color difference functions
  */

  // CIE76; Euclidean distance in Lab
  inline
  float delta_e_76(const Lab &a, const Lab &b) {
    return (a - b).matrix().norm();
  }

  // CIEDE2000, with unit weighting factors kL = kC = kH = 1
  // Src: Sharma et al., 2005, "The CIEDE2000 color-difference formula:
  //      implementation notes, supplementary test data, and mathematical observations"
  float delta_e_2000(const Lab &a, const Lab &b);

  // Dispatch to one of the above metrics
  inline
  float color_difference(const Lab &a, const Lab &b, DeltaEMethod method) {
    return method == DeltaEMethod::eDE00 ? delta_e_2000(a, b) : delta_e_76(a, b);
  }

  // Human-readable metric names, as they are presented to users
  std::string_view to_string(DeltaEMethod method);
  DeltaEMethod     delta_e_method_from_string(std::string_view s);
} // namespace pmx

template <>
struct fmt::formatter<pmx::Lab> : fmt::formatter<float> {
  auto format(const pmx::Lab &c, fmt::format_context &ctx) const {
    return fmt::format_to(ctx.out(), "L={:.1f}, a={:.1f}, b={:.1f}", c[0], c[1], c[2]);
  }
};
