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

#include <paintmix/core/io.hpp>
#include <paintmix/core/json.hpp>
#include <paintmix/core/ranges.hpp>
#include <paintmix/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>

namespace pmx::io {
  namespace detail {
    // Strip surrounding whitespace and carriage returns
    std::string_view trim(std::string_view s) {
      constexpr std::string_view whitespace = " \t\r\n";
      auto first = s.find_first_not_of(whitespace);
      guard(first != std::string_view::npos, std::string_view { });
      auto last = s.find_last_not_of(whitespace);
      return s.substr(first, last - first + 1);
    }

    // Split a line into trimmed fields on a given delimiter
    std::vector<std::string> split(std::string_view line, char delim) {
      auto split = line
                 | std::views::split(delim)
                 | std::views::transform([](auto &&r) {
                     return std::string(trim(std::string_view(r.begin(), r.end())));
                   });
      std::vector<std::string> split_vect;
      rng::copy(split, std::back_inserter(split_vect));
      return split_vect;
    }

    // Parse a finite float in its entirety, or throw
    float parse_float(std::string_view s, std::string_view what) {
      float f;
      auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), f);
      runtime_check(!s.empty() && ec == std::errc() && ptr == s.data() + s.size(),
        fmt::format("failed to parse {} from \"{}\"", what, s));
      runtime_check(std::isfinite(f),
        fmt::format("{} must be finite, got \"{}\"", what, s));
      return f;
    }
  } // namespace detail

  std::string load_string(const fs::path &path) {
    pmx_trace();

    // Check that file path exists
    runtime_check(fs::exists(path),
      fmt::format("failed to resolve path \"{}\"", path.string()));

    // Attempt to open file stream
    std::ifstream ifs(path, std::ios::ate | std::ios::binary);
    runtime_check(ifs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Read file size and construct string to hold data
    size_t file_size = static_cast<size_t>(ifs.tellg());
    std::string str(file_size, ' ');

    // Set input position to start, then read full file into buffer
    ifs.seekg(0);
    ifs.read(str.data(), file_size);
    ifs.close();

    return str;
  }

  void save_string(const fs::path &path, const std::string &str) {
    pmx_trace();

    // Attempt to open output file stream in text mode
    std::ofstream ofs(path, std::ios::out);
    runtime_check(ofs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Write string directly to file in text mode
    ofs.write(str.data(), str.size());
    ofs.close();
  }

  std::vector<Pigment> catalog_from_csv(std::string_view data) {
    pmx_trace();

    constexpr std::array<std::string_view, 7> columns = {
      "code", "name", "manufacturer", "category", "L", "a", "b"
    };

    std::vector<Pigment>               catalog;
    std::optional<std::array<uint, 7>> column_index; // Set by the header line

    // Parse line by line
    std::stringstream ss { std::string(data) };
    std::string       line;
    uint              line_nr = 0;
    while (std::getline(ss, line)) {
      line_nr++;
      auto split_vect = detail::split(line, ',');

      // Skip empty and commented lines
      guard_continue(!split_vect.empty() && !split_vect[0].empty() && split_vect[0][0] != '#');

      // First remaining line is the header; locate each required column
      if (!column_index) {
        column_index.emplace();
        for (auto [i, column] : view_zip(*column_index, columns)) {
          auto it = rng::find(split_vect, column);
          runtime_check(it != split_vect.end(),
            fmt::format("catalog header on line {} lacks column \"{}\"", line_nr, column));
          i = static_cast<uint>(std::distance(split_vect.begin(), it));
        }
        continue;
      }

      // Throw on incorrect input data
      uint max_index = rng::max(*column_index);
      runtime_check(split_vect.size() > max_index,
        fmt::format("catalog data incomplete on line {}", line_nr));

      const auto &ci = *column_index;
      Pigment p = {
        .code         = split_vect[ci[0]],
        .name         = split_vect[ci[1]],
        .manufacturer = split_vect[ci[2]],
        .category     = split_vect[ci[3]],
        .lab          = Lab(detail::parse_float(split_vect[ci[4]], fmt::format("L on line {}", line_nr)),
                            detail::parse_float(split_vect[ci[5]], fmt::format("a on line {}", line_nr)),
                            detail::parse_float(split_vect[ci[6]], fmt::format("b on line {}", line_nr)))
      };
      runtime_check(!p.code.empty(),
        fmt::format("catalog entry on line {} lacks a code", line_nr));
      catalog.push_back(std::move(p));
    }

    runtime_check(column_index.has_value(), "catalog data holds no header line");
    return catalog;
  }

  std::vector<Pigment> load_catalog(const fs::path &path) {
    pmx_trace();

    if (path.extension() == ".json")
      return load_json(path).at("pigments").get<std::vector<Pigment>>();
    return catalog_from_csv(load_string(path));
  }

  std::vector<Preset> load_presets(const fs::path &path) {
    pmx_trace();
    return load_json(path).at("presets").get<std::vector<Preset>>();
  }

  const Preset &find_preset(std::span<const Preset> presets, std::string_view name) {
    auto it = rng::find(presets, name, &Preset::name);
    runtime_check(it != presets.end(),
      fmt::format("no preset named \"{}\"", name));
    return *it;
  }

  Lab parse_target(std::string_view s) {
    s = detail::trim(s);

    // Comma-separated Lab triple
    if (s.find(',') != std::string_view::npos) {
      auto split_vect = detail::split(s, ',');
      runtime_check(split_vect.size() == 3,
        fmt::format("Lab target \"{}\" must hold three values", s));
      Lab lab = { detail::parse_float(split_vect[0], "L"),
                  detail::parse_float(split_vect[1], "a"),
                  detail::parse_float(split_vect[2], "b") };
      runtime_check(lab[0] >= 0.f && lab[0] <= 100.f,
        fmt::format("Lab target lightness must lie in [0, 100], got {}", lab[0]));
      return lab;
    }

    // Otherwise a hex code
    return rgb_to_lab(parse_hex_rgb(s));
  }
} // namespace pmx::io
