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

#include <paintmix/core/detail/eigen.hpp>
#include <algorithm>
#include <cmath>

namespace pmx {
  // Shorthand unsigned types
  using uint  = unsigned int;
  using uchar = unsigned char;

  // Square shorthand, used throughout the color difference formulae
  template <typename T>
  constexpr inline T sqr(T v) { return v * v; }

  // Degree/radian conversions
  template <typename T>
  constexpr inline T to_radians(T deg) { return deg * static_cast<T>(0.017453292519943295); }
  template <typename T>
  constexpr inline T to_degrees(T rad) { return rad * static_cast<T>(57.29577951308232); }

  // Binomial coefficient n over k, for sizing combination buffers
  constexpr inline
  size_t n_choose_k(size_t n, size_t k) {
    if (k > n)
      return 0;
    size_t r = 1;
    for (size_t i = 1; i <= k; ++i)
      r = r * (n - k + i) / i;
    return r;
  }
} // namespace pmx
