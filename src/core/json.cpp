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

#include <paintmix/core/json.hpp>
#include <paintmix/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace pmx {
  namespace io {
    json load_json(const fs::path &path) {
      pmx_trace();

      // Malformed json surfaces as a ValidationException naming the file
      std::string str = load_string(path);
      json js = json::parse(str, nullptr, false);
      runtime_check(!js.is_discarded(),
        fmt::format("failed to parse json from \"{}\"", path.string()));
      return js;
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      pmx_trace();
      save_string(path, js.dump(static_cast<int>(indent)));
    }

    void from_json(const json &js, Preset &p) {
      p.name     = js.at("name").get<std::string>();
      p.category = js.value("category", std::string());
      p.lab      = Lab(js.at("L").get<float>(), js.at("a").get<float>(), js.at("b").get<float>());
      runtime_check(p.lab.allFinite(),
        fmt::format("preset \"{}\" holds a non-finite Lab value", p.name));
    }

    void to_json(json &js, const Preset &p) {
      js["name"]     = p.name;
      js["category"] = p.category;
      js["L"]        = p.lab[0];
      js["a"]        = p.lab[1];
      js["b"]        = p.lab[2];
    }
  } // namespace io

  void from_json(const json &js, Pigment &p) {
    p.code         = js.at("code").get<std::string>();
    p.name         = js.value("name",         std::string());
    p.manufacturer = js.value("manufacturer", std::string());
    p.category     = js.value("category",     std::string());
    p.lab          = Lab(js.at("L").get<float>(), js.at("a").get<float>(), js.at("b").get<float>());
    runtime_check(p.lab.allFinite(),
      fmt::format("pigment \"{}\" holds a non-finite Lab value", p.code));
  }

  void to_json(json &js, const Pigment &p) {
    js["code"]         = p.code;
    js["name"]         = p.name;
    js["manufacturer"] = p.manufacturer;
    js["category"]     = p.category;
    js["L"]            = p.lab[0];
    js["a"]            = p.lab[1];
    js["b"]            = p.lab[2];
  }

  void from_json(const json &js, MixParams &p) {
    p.gamma   = js.value("gamma",   p.gamma);
    p.epsilon = js.value("epsilon", p.epsilon);
  }

  void to_json(json &js, const MixParams &p) {
    js["gamma"]   = p.gamma;
    js["epsilon"] = p.epsilon;
  }

  void from_json(const json &js, MixConstraints &c) {
    c.max_pigments        = js.value("max_pigments",        c.max_pigments);
    c.exclude_white_black = js.value("exclude_white_black", c.exclude_white_black);
    c.dilution            = js.value("dilution",            c.dilution);
    if (js.contains("excluded_categories"))
      c.excluded_categories = js.at("excluded_categories").get<std::set<std::string>>();
    if (js.contains("excluded_codes"))
      c.excluded_codes = js.at("excluded_codes").get<std::set<std::string>>();
    if (js.contains("excluded_manufacturers"))
      c.excluded_manufacturers = js.at("excluded_manufacturers").get<std::set<std::string>>();
    c.validate();
  }

  void to_json(json &js, const MixConstraints &c) {
    js["max_pigments"]           = c.max_pigments;
    js["excluded_categories"]    = c.excluded_categories;
    js["excluded_codes"]         = c.excluded_codes;
    js["excluded_manufacturers"] = c.excluded_manufacturers;
    js["exclude_white_black"]    = c.exclude_white_black;
    js["dilution"]               = c.dilution;
  }

  void from_json(const json &js, SearchSettings &s) {
    s.candidates = js.value("candidates", s.candidates);
    s.batch_mass = js.value("batch_mass", s.batch_mass);
    s.min_share  = js.value("min_share",  s.min_share);
    if (js.contains("params"))
      s.params = js.at("params").get<MixParams>();
    if (js.contains("model"))
      s.model = mix_model_from_string(js.at("model").get<std::string>());
    if (js.contains("method"))
      s.method = search_method_from_string(js.at("method").get<std::string>());
    if (js.contains("search_metric"))
      s.search_metric = delta_e_method_from_string(js.at("search_metric").get<std::string>());
    if (js.contains("report_metric"))
      s.report_metric = delta_e_method_from_string(js.at("report_metric").get<std::string>());
    s.validate();
  }

  void to_json(json &js, const SearchSettings &s) {
    js["candidates"]    = s.candidates;
    js["model"]         = std::string(to_string(s.model));
    js["params"]        = s.params;
    js["search_metric"] = std::string(to_string(s.search_metric));
    js["report_metric"] = std::string(to_string(s.report_metric));
    js["method"]        = std::string(to_string(s.method));
    js["batch_mass"]    = s.batch_mass;
    js["min_share"]     = s.min_share;
  }

  void to_json(json &js, const RecipeLine &l) {
    js["code"]         = l.pigment.code;
    js["name"]         = l.pigment.name;
    js["manufacturer"] = l.pigment.manufacturer;
    js["percentage"]   = l.percentage;
    js["grams"]        = l.grams;
  }

  void to_json(json &js, const RecipeResult &r) {
    js["target"]       = r.target;
    js["target_hex"]   = to_hex(lab_to_rgb(r.target));
    js["mixed"]        = r.mixed;
    js["mixed_hex"]    = to_hex(lab_to_rgb(r.mixed));
    js["lines"]        = r.lines;
    js["metric"]       = std::string(to_string(r.metric));
    js["delta_e"]      = r.delta_e;
    js["quality"]      = std::string(to_string(match_quality(r.delta_e)));
    js["thinner_mass"] = r.thinner_mass;
    js["tier_limited"] = r.tier_limited;
  }
} // namespace pmx

namespace Eigen {
  void from_json(const pmx::json &js, pmx::Lab &v) {
    pmx::runtime_check(js.is_array() && js.size() == 3,
      fmt::format("expected a Lab triple, got {}", js.dump()));
    std::ranges::copy(js, v.begin());
  }

  void to_json(pmx::json &js, const pmx::Lab &v) {
    js = std::vector<pmx::Lab::value_type>(v.begin(), v.end());
  }
} // namespace Eigen
