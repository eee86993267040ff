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

#include <paintmix/core/detail/trace.hpp>
#include <paintmix/core/detail/utility.hpp>
#include <concepts>
#include <source_location>
#include <span>
#include <string>
#include <utility>

// Simple guard statement syntactic sugar
#define guard(expr,...)                if (!(expr)) { return __VA_ARGS__ ; }
#define guard_continue(expr)           if (!(expr)) { continue; }
#define guard_break(expr)              if (!(expr)) { break; }

// Simple range-like syntactic sugar
#define range_iter(c)  c.begin(), c.end()

namespace pmx {
  // Evaluate a boolean expression, throwing a detailed exception of type E pointing
  // to the expression's origin if said expression fails. Remains enabled in release builds.
  template <typename E = ValidationException>
  inline
  void runtime_check(bool expr,
                     std::string_view msg = "",
                     const std::source_location sl = std::source_location::current()) {
    guard(!expr);

    E e;
    e.put("message", msg);
    e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
    e.put("in func", sl.function_name());
    throw e;
  }

  // Variant of runtime_check(...) for hot paths; the message is only produced by
  // calling msg() after the expression has failed
  template <typename E = ValidationException, std::invocable F>
  inline
  void runtime_check(bool expr,
                     F &&msg,
                     const std::source_location sl = std::source_location::current()) {
    guard(!expr);
    runtime_check<E>(false, std::string(std::forward<F>(msg)()), sl);
  }
} // namespace pmx
