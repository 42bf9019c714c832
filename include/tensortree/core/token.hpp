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

#include <tensortree/core/math.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tt {
  /* Single lexical element of tensor tree text */
  struct Token {
    enum class Type : uint {
      eBraceOpen,
      eBraceClose,
      eNumber
    };

    Type             type;
    double           value = 0.0; // Parsed value, only meaningful for eNumber
    std::string_view literal;     // View into the source text the token was scanned from

  public:
    bool is_open()   const { return type == Type::eBraceOpen;  }
    bool is_close()  const { return type == Type::eBraceClose; }
    bool is_number() const { return type == Type::eNumber;     }
  };

  /**
   * Lazy scanner over tensor tree text. Separators (whitespace and commas)
   * are skipped, numbers and braces are produced one by one through next().
   * The scanner holds a view, so the text must outlive it.
   */
  class Tokenizer {
    std::string_view m_text;
    size_t           m_offs = 0;

    void skip_separators();
    Token scan_number();

  public:
    explicit Tokenizer(std::string_view text)
    : m_text(text) { }

    // Produce the next token, or nothing once the text is exhausted;
    // throws FormatError on a character that starts no token
    std::optional<Token> next();

    // Byte offset of the next unscanned character
    size_t offset() const { return m_offs; }

    // True if only separators remain
    bool done();
  };

  // Start a fresh scan over the provided text
  inline
  Tokenizer tokenize(std::string_view text) {
    return Tokenizer(text);
  }

  // Drain a full scan into a vector
  std::vector<Token> tokenize_all(std::string_view text);

  // Rejoin token literals with single spaces, giving a normalized form of scanned text
  std::string to_string(const std::vector<Token> &tokens);
} // namespace tt
