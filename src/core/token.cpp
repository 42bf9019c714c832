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

#include <tensortree/core/exception.hpp>
#include <tensortree/core/token.hpp>
#include <tensortree/core/utility.hpp>
#include <charconv>
#include <cctype>
#include <system_error>

namespace tt {
  namespace detail {
    bool is_separator(char c) {
      return c == ',' || std::isspace(static_cast<unsigned char>(c));
    }

    bool is_digit(char c) {
      return std::isdigit(static_cast<unsigned char>(c));
    }

    bool is_number_start(char c) {
      return is_digit(c) || c == '-' || c == '+' || c == '.';
    }
  } // namespace detail

  void Tokenizer::skip_separators() {
    while (m_offs < m_text.size() && detail::is_separator(m_text[m_offs]))
      m_offs++;
  }

  Token Tokenizer::scan_number() {
    tt_trace();

    const size_t begin = m_offs;
    size_t i = m_offs;
    auto count_digits = [&]() {
      size_t n = 0;
      for (; i < m_text.size() && detail::is_digit(m_text[i]); ++i, ++n);
      return n;
    };

    // Optional sign, then integral and fractional parts; at least one needs digits
    if (m_text[i] == '-' || m_text[i] == '+')
      i++;
    size_t n_digits = count_digits();
    if (i < m_text.size() && m_text[i] == '.') {
      i++;
      n_digits += count_digits();
    }
    if (n_digits == 0)
      throw_error<FormatError>("tt::Tokenizer::next", "malformed number", {
        { "offset",  fmt::format("{}", begin) },
        { "literal", std::string(m_text.substr(begin, i - begin)) } });

    // Optional exponent, which must carry digits if present
    if (i < m_text.size() && (m_text[i] == 'e' || m_text[i] == 'E')) {
      i++;
      if (i < m_text.size() && (m_text[i] == '-' || m_text[i] == '+'))
        i++;
      if (count_digits() == 0)
        throw_error<FormatError>("tt::Tokenizer::next", "malformed number exponent", {
          { "offset",  fmt::format("{}", begin) },
          { "literal", std::string(m_text.substr(begin, i - begin)) } });
    }

    // A literal ends at a separator, a brace, or the end of input
    if (i < m_text.size() && !detail::is_separator(m_text[i]) && m_text[i] != '{' && m_text[i] != '}')
      throw_error<FormatError>("tt::Tokenizer::next", "malformed number", {
        { "offset",  fmt::format("{}", begin) },
        { "literal", std::string(m_text.substr(begin, i - begin + 1)) } });

    std::string_view literal = m_text.substr(begin, i - begin);
    m_offs = i;

    // std::from_chars rejects a leading '+', so strip it before conversion
    std::string_view digits = literal.front() == '+' ? literal.substr(1) : literal;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size())
      throw_error<FormatError>("tt::Tokenizer::next", "unparsable numeric literal", {
        { "offset",  fmt::format("{}", begin) },
        { "literal", std::string(literal) } });

    return { .type = Token::Type::eNumber, .value = value, .literal = literal };
  }

  std::optional<Token> Tokenizer::next() {
    skip_separators();
    guard(m_offs < m_text.size(), std::nullopt);

    char c = m_text[m_offs];
    if (c == '{') {
      return Token { .type = Token::Type::eBraceOpen, .literal = m_text.substr(m_offs++, 1) };
    } else if (c == '}') {
      return Token { .type = Token::Type::eBraceClose, .literal = m_text.substr(m_offs++, 1) };
    } else if (detail::is_number_start(c)) {
      return scan_number();
    }

    throw_error<FormatError>("tt::Tokenizer::next", "unrecognized character", {
      { "offset",    fmt::format("{}", m_offs) },
      { "character", fmt::format("'{}' (0x{:02x})", c, static_cast<unsigned char>(c)) } });
  }

  bool Tokenizer::done() {
    skip_separators();
    return m_offs >= m_text.size();
  }

  std::vector<Token> tokenize_all(std::string_view text) {
    tt_trace();

    std::vector<Token> tokens;
    auto tokenizer = tokenize(text);
    while (auto token = tokenizer.next())
      tokens.push_back(*token);
    return tokens;
  }

  std::string to_string(const std::vector<Token> &tokens) {
    std::string s;
    for (const auto &token : tokens) {
      if (!s.empty())
        s += ' ';
      s += token.literal;
    }
    return s;
  }
} // namespace tt
