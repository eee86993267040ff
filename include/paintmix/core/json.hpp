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

#include <paintmix/core/io.hpp>
#include <paintmix/core/recipe.hpp>
#include <nlohmann/json_fwd.hpp>

namespace pmx {
  // namespace/typename shorthand inside pmx namespace
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);

    /* json (de)serialization for Preset type must be declared in io scope */
    void from_json(const json &js, Preset &p);
    void to_json(json &js, const Preset &p);
  } // namespace io

  /* json (de)serialization for catalog entries; Lab is stored as flat "L", "a", "b" keys */
  void from_json(const json &js, Pigment &p);
  void to_json(json &js, const Pigment &p);

  /* json (de)serialization for configuration types; absent keys keep their defaults */
  void from_json(const json &js, MixParams &p);
  void to_json(json &js, const MixParams &p);

  void from_json(const json &js, MixConstraints &c);
  void to_json(json &js, const MixConstraints &c);

  void from_json(const json &js, SearchSettings &s);
  void to_json(json &js, const SearchSettings &s);

  /* json serialization of results, for export */
  void to_json(json &js, const RecipeLine &l);
  void to_json(json &js, const RecipeResult &r);
} // namespace pmx

/* json (de)serializations for specific Eigen types must be declared in Eigen scope */
namespace Eigen {
  void from_json(const pmx::json &js, pmx::Lab &v);
  void to_json(pmx::json &js, const pmx::Lab &v);
} // namespace Eigen
