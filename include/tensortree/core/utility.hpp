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

#include <tensortree/core/detail/trace.hpp>
#include <tensortree/core/detail/utility.hpp>
#include <source_location>
#include <string_view>
#include <variant>

// Simple guard statement syntactic sugar
#define guard(expr,...)                if (!(expr)) { return __VA_ARGS__ ; }

namespace tt {
  // Debug namespace; mostly check_expr(...) from here on
  namespace debug {
    // Evaluate a boolean expression, throwing a detailed exception pointing
    // to the expression's origin if said expression fails
    inline
    void check_expr(bool expr,
                    const std::string_view &msg = "",
                    const std::source_location sl = std::source_location::current()) {
      guard(!expr);

      detail::Exception e;
      e.put("src", "tt::debug::check_expr(...) failed, checked expression evaluated to false");
      e.put("message", msg);
      e.put("in file", fmt::format("{}({}:{})", sl.file_name(), sl.line(), sl.column()));
      throw e;
    }
  } // namespace debug

  // Visit a variant using syntactic sugar,
  // e.g. 'std::visit(visitor, variant)' formed from 'variant | visit { visitors... };'
  // Src: https://en.cppreference.com/w/cpp/utility/variant/visit
  // Src: https://github.com/AVasK/vx
  /*
    variant | visit {
      [](const Leaf &l)   { ... },
      [](const Branch &b) { ... },
    }
  */
  template <typename... Ts> struct visit : Ts... { using Ts::operator()...; };
  template <typename... Ts> visit(Ts...) -> visit<Ts...>;
  template <typename... Ts, typename... Fs>
  constexpr decltype(auto) operator| (std::variant<Ts...> const& v, visit<Fs...> const& f) {
    return std::visit(f, v);
  }
  template <typename... Ts, typename... Fs>
  constexpr decltype(auto) operator| (std::variant<Ts...> & v, visit<Fs...> const& f) {
    return std::visit(f, v);
  }
} // namespace tt
