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

#include <paintmix/core/color.hpp>
#include <paintmix/core/ranges.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace pmx {
  namespace models {
    // Linear color space transformations
    eig::Matrix3f xyz_to_srgb_transform {{ 3.240479f, -1.537150f,-0.498535f },
                                         {-0.969256f,  1.875991f, 0.041556f },
                                         { 0.055648f, -0.204043f, 1.057311f }};
    eig::Matrix3f srgb_to_xyz_transform {{ 0.412453f, 0.357580f, 0.180423f },
                                         { 0.212671f, 0.715160f, 0.072169f },
                                         { 0.019334f, 0.119193f, 0.950227f }};

    // White point is the row sum of the above, s.t. sRGB (1, 1, 1) maps to L = 100
    Xyz white_d65 = srgb_to_xyz_transform.rowwise().sum().array();
  } // namespace models

  namespace detail {
    constexpr float lab_delta = 6.f / 29.f;

    // Forward and inverse companding functions of CIE Lab
    inline float lab_f(float t) {
      return t > lab_delta * lab_delta * lab_delta
        ? std::cbrt(t)
        : t / (3.f * lab_delta * lab_delta) + 4.f / 29.f;
    }

    inline float lab_f_inv(float t) {
      return t > lab_delta
        ? t * t * t
        : 3.f * lab_delta * lab_delta * (t - 4.f / 29.f);
    }

    inline int hex_digit(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
      return -1;
    }
  } // namespace detail

  eig::Array3f srgb_to_lrgb(eig::Array3f c) { rng::transform(c, c.begin(), srgb_to_lrgb_f); return c; }
  eig::Array3f lrgb_to_srgb(eig::Array3f c) { rng::transform(c, c.begin(), lrgb_to_srgb_f); return c; }

  Lab xyz_to_lab(const Xyz &c) {
    Xyz f = (c / models::white_d65).unaryExpr([](float t) { return detail::lab_f(t); });
    return { 116.f * f.y() - 16.f,
             500.f * (f.x() - f.y()),
             200.f * (f.y() - f.z()) };
  }

  Xyz lab_to_xyz(const Lab &c) {
    float fy = (c[0] + 16.f) / 116.f;
    float fx = fy + c[1] / 500.f;
    float fz = fy - c[2] / 200.f;
    return Xyz(detail::lab_f_inv(fx),
               detail::lab_f_inv(fy),
               detail::lab_f_inv(fz)) * models::white_d65;
  }

  Lab rgb_to_lab(const Rgb &c) {
    pmx_trace();
    eig::Array3f srgb = c.max(0).min(255).cast<float>() / 255.f;
    return xyz_to_lab(lrgb_to_xyz(srgb_to_lrgb(srgb)));
  }

  Rgb lab_to_rgb(const Lab &c) {
    pmx_trace();
    eig::Array3f srgb = lrgb_to_srgb(xyz_to_lrgb(lab_to_xyz(c)).max(0.f).min(1.f));
    return (srgb * 255.f).round().max(0.f).min(255.f).cast<int>();
  }

  Rgb parse_hex_rgb(std::string_view hex) {
    if (!hex.empty() && hex.front() == '#')
      hex.remove_prefix(1);
    runtime_check(hex.size() == 6 || hex.size() == 3,
      fmt::format("hex color \"{}\" must hold 3 or 6 digits", hex));

    std::array<int, 6> digits;
    for (uint i = 0; i < hex.size(); ++i) {
      digits[i] = detail::hex_digit(hex[i]);
      runtime_check(digits[i] >= 0,
        fmt::format("hex color \"{}\" holds invalid digit '{}'", hex, hex[i]));
    }

    // Short form expands each digit, e.g. #abc -> #aabbcc
    if (hex.size() == 3)
      return { digits[0] * 17, digits[1] * 17, digits[2] * 17 };
    return { digits[0] * 16 + digits[1],
             digits[2] * 16 + digits[3],
             digits[4] * 16 + digits[5] };
  }

  std::string to_hex(const Rgb &c) {
    Rgb c_ = c.max(0).min(255);
    return fmt::format("#{:02X}{:02X}{:02X}", c_[0], c_[1], c_[2]);
  }

  float delta_e_2000(const Lab &lab_1, const Lab &lab_2) {
    // Evaluated in double precision; the pow(C, 7) terms lose accuracy in float
    double L1 = lab_1[0], a1 = lab_1[1], b1 = lab_1[2];
    double L2 = lab_2[0], a2 = lab_2[1], b2 = lab_2[2];

    // Chroma-dependent a* rescaling
    double C1    = std::hypot(a1, b1);
    double C2    = std::hypot(a2, b2);
    double C_avg = 0.5 * (C1 + C2);
    double C7    = std::pow(C_avg, 7.0);
    double G     = 0.5 * (1.0 - std::sqrt(C7 / (C7 + std::pow(25.0, 7.0))));
    double a1p   = (1.0 + G) * a1;
    double a2p   = (1.0 + G) * a2;
    double C1p   = std::hypot(a1p, b1);
    double C2p   = std::hypot(a2p, b2);

    // Hue angles in [0, 360), zero for achromatic colors
    auto hue = [](double b, double a) {
      guard(a != 0.0 || b != 0.0, 0.0);
      double h = to_degrees(std::atan2(b, a));
      return h < 0.0 ? h + 360.0 : h;
    };
    double h1p = hue(b1, a1p);
    double h2p = hue(b2, a2p);

    // Lightness, chroma and hue differences
    double dLp = L2 - L1;
    double dCp = C2p - C1p;
    double dhp = 0.0;
    if (C1p * C2p != 0.0) {
      dhp = h2p - h1p;
      if (dhp > 180.0)
        dhp -= 360.0;
      else if (dhp < -180.0)
        dhp += 360.0;
    }
    double dHp = 2.0 * std::sqrt(C1p * C2p) * std::sin(to_radians(dhp) / 2.0);

    // Arithmetic means of the above
    double Lp_avg = 0.5 * (L1 + L2);
    double Cp_avg = 0.5 * (C1p + C2p);
    double hp_avg = h1p + h2p;
    if (C1p * C2p != 0.0) {
      if (std::abs(h1p - h2p) <= 180.0)
        hp_avg = 0.5 * (h1p + h2p);
      else if (h1p + h2p < 360.0)
        hp_avg = 0.5 * (h1p + h2p + 360.0);
      else
        hp_avg = 0.5 * (h1p + h2p - 360.0);
    }

    // Weighting functions
    double T = 1.0
             - 0.17 * std::cos(to_radians(hp_avg - 30.0))
             + 0.24 * std::cos(to_radians(2.0 * hp_avg))
             + 0.32 * std::cos(to_radians(3.0 * hp_avg + 6.0))
             - 0.20 * std::cos(to_radians(4.0 * hp_avg - 63.0));
    double d_theta = 30.0 * std::exp(-sqr((hp_avg - 275.0) / 25.0));
    double Cp7     = std::pow(Cp_avg, 7.0);
    double R_C     = 2.0 * std::sqrt(Cp7 / (Cp7 + std::pow(25.0, 7.0)));
    double S_L     = 1.0 + (0.015 * sqr(Lp_avg - 50.0)) / std::sqrt(20.0 + sqr(Lp_avg - 50.0));
    double S_C     = 1.0 + 0.045 * Cp_avg;
    double S_H     = 1.0 + 0.015 * Cp_avg * T;
    double R_T     = -std::sin(to_radians(2.0 * d_theta)) * R_C;

    double tL = dLp / S_L;
    double tC = dCp / S_C;
    double tH = dHp / S_H;
    return static_cast<float>(std::sqrt(tL * tL + tC * tC + tH * tH + R_T * tC * tH));
  }

  std::string_view to_string(DeltaEMethod method) {
    return method == DeltaEMethod::eDE00 ? "DE00" : "DE76";
  }

  DeltaEMethod delta_e_method_from_string(std::string_view s) {
    if (s == "DE00" || s == "de00" || s == "CIEDE2000")
      return DeltaEMethod::eDE00;
    runtime_check(s == "DE76" || s == "de76" || s == "CIE76",
      fmt::format("unknown color difference method \"{}\"", s));
    return DeltaEMethod::eDE76;
  }
} // namespace pmx
