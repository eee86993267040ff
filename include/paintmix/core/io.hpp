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

#include <paintmix/core/catalog.hpp>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pmx {
  namespace fs = std::filesystem;

  namespace io {
    /* Named reference color, e.g. a historical livery, selectable as a target */
    struct Preset {
      std::string name;
      std::string category;
      Lab         lab;
    };

    // Simple string load/save to/from file
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);

    // Load a pigment catalog; files ending in ".json" hold an object with a "pigments"
    // array, all others are parsed as comma-separated text (see catalog_from_csv)
    std::vector<Pigment> load_catalog(const fs::path &path);

    // Parse comma-separated catalog data. The first non-comment line is a header naming
    // the columns code, name, manufacturer, category, L, a and b in any order; further
    // columns are ignored, and lines starting with '#' are skipped
    std::vector<Pigment> catalog_from_csv(std::string_view data);

    // Load a preset list; a json object with a "presets" array
    std::vector<Preset> load_presets(const fs::path &path);

    // Find a preset by name, throwing a ValidationException if none matches
    const Preset &find_preset(std::span<const Preset> presets, std::string_view name);

    // Parse a target color from "#RRGGBB", "#RGB" or "L,a,b"
    Lab parse_target(std::string_view s);
  } // namespace io
} // namespace pmx
