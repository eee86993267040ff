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

// Paintmix includes
#include <paintmix/core/catalog.hpp>
#include <paintmix/core/io.hpp>
#include <paintmix/core/json.hpp>
#include <paintmix/core/recipe.hpp>
#include <paintmix/core/utility.hpp>
#include <nlohmann/json.hpp>

// Misc includes
#include <fmt/core.h>

// STL includes
#include <cstdlib>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <vector>

using namespace pmx;

namespace {
  constexpr std::string_view usage =
    "usage: paintmix <catalog.csv|catalog.json> <target> [config.json]\n"
    "  target : #RRGGBB, #RGB, \"L,a,b\" or preset:<name>@<presets.json>\n"
    "  config : json object with optional \"constraints\", \"settings\" and \"output\" (\"text\"|\"json\")\n";

  // Resolve a target argument to a Lab color, looking up presets where requested
  Lab resolve_target(std::string_view arg) {
    constexpr std::string_view preset_prefix = "preset:";
    guard(arg.starts_with(preset_prefix), io::parse_target(arg));

    arg.remove_prefix(preset_prefix.size());
    auto at = arg.rfind('@');
    runtime_check(at != std::string_view::npos,
      fmt::format("preset target \"{}\" must take the form preset:<name>@<presets.json>", arg));

    auto presets = io::load_presets(fs::path(arg.substr(at + 1)));
    return io::find_preset(presets, arg.substr(0, at)).lab;
  }
} // namespace

int main(int argc, char **argv) {
  std::vector<std::string_view> args(argv + 1, argv + argc);
  if (args.size() < 2 || args.size() > 3) {
    fmt::print(stderr, "{}", usage);
    return EXIT_FAILURE;
  }

  try {
    // Load inputs
    auto catalog = io::load_catalog(fs::path(args[0]));
    Lab  target  = resolve_target(args[1]);

    // Optional configuration; absent keys keep their defaults
    MixConstraints constraints;
    SearchSettings settings;
    std::string    output = "text";
    if (args.size() == 3) {
      json config = io::load_json(fs::path(args[2]));
      if (config.contains("constraints"))
        constraints = config.at("constraints").get<MixConstraints>();
      if (config.contains("settings"))
        settings = config.at("settings").get<SearchSettings>();
      output = config.value("output", output);
      runtime_check(output == "text" || output == "json",
        fmt::format("unknown output format \"{}\"", output));
    }

    RecipeResult result = optimize_recipe(target, catalog, constraints, settings);

    if (output == "json")
      fmt::print("{}\n", json(result).dump(2));
    else
      fmt::print("{}", format_recipe_text(result));
  } catch (const std::exception &e) {
    fmt::print(stderr, "{}\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
