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

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/compile.h>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pmx::detail {
  /**
   * Message class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Message {
    std::string _buffer;

  public:
    void put(std::string_view key, std::string_view message) {
      fmt::format_to(std::back_inserter(_buffer),
                     FMT_COMPILE("  {:<8} : {}\n"),
                     key,
                     message);
    }

    std::string get() const {
      return _buffer;
    }
  };

  /**
   * Exception class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Exception : public std::exception, public Message {
    mutable std::string _what;

  protected:
    virtual std::string_view kind() const noexcept {
      return "pmx::detail::Exception";
    }

  public:
    const char * what() const noexcept override {
      _what = fmt::format("{} thrown\n{}", kind(), get());
      return _what.c_str();
    }
  };

  // Thrown on malformed input; negative ratios, mismatched spans, bad constraints or files
  class ValidationException : public Exception {
  protected:
    std::string_view kind() const noexcept override {
      return "pmx::ValidationException";
    }
  };

  // Thrown when no pigment survives the exclusion filters
  class EmptyCatalogException : public Exception {
  protected:
    std::string_view kind() const noexcept override {
      return "pmx::EmptyCatalogException";
    }
  };
} // namespace pmx::detail

namespace pmx {
  using ValidationException   = detail::ValidationException;
  using EmptyCatalogException = detail::EmptyCatalogException;
} // namespace pmx
