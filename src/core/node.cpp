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
#include <tensortree/core/node.hpp>
#include <tensortree/core/utility.hpp>
#include <algorithm>

namespace tt {
  namespace detail {
    // Parse the body of a group whose opening brace was already consumed
    TreeNode build_group(Tokenizer &tokens, uint level) {
      if (level > max_nesting_depth)
        throw_error<FormatError>("tt::build_tree", "groups nested too deeply", {
          { "offset", fmt::format("{}", tokens.offset()) },
          { "level",  fmt::format("{}", level) },
          { "limit",  fmt::format("{}", max_nesting_depth) } });

      NodeBuilder builder;
      while (true) {
        auto token = tokens.next();
        if (!token)
          throw_error<UnexpectedEndOfInput>("tt::build_tree", "token stream exhausted before closing brace", {
            { "offset", fmt::format("{}", tokens.offset()) },
            { "level",  fmt::format("{}", level) } });

        switch (token->type) {
          case Token::Type::eBraceOpen:
            builder.push_child(build_group(tokens, level + 1));
            break;
          case Token::Type::eNumber:
            builder.push_value(token->value);
            break;
          case Token::Type::eBraceClose:
            return std::move(builder).finish();
        }
      }
    }
  } // namespace detail

  void NodeBuilder::flush_values() {
    guard(!m_values.empty());
    m_children.push_back(Leaf { std::move(m_values) });
    m_values.clear();
  }

  void NodeBuilder::push_child(TreeNode child) {
    flush_values();
    m_children.push_back(std::move(child));
  }

  TreeNode NodeBuilder::finish() && {
    if (m_children.empty() && !m_values.empty())
      return Leaf { std::move(m_values) };
    flush_values();
    return Branch { std::move(m_children) };
  }

  bool Branch::operator==(const Branch &o) const {
    return children == o.children;
  }

  size_t TreeNode::size() const {
    return data | visit {
      [](const Leaf &l)   { return l.values.size();   },
      [](const Branch &b) { return b.children.size(); }
    };
  }

  TreeNode build_tree(Tokenizer &tokens) {
    tt_trace();

    auto token = tokens.next();
    if (!token || !token->is_open())
      throw_error<FormatError>("tt::build_tree", "missing opening brace", {
        { "found", token ? std::string(token->literal) : std::string("end of input") } });

    return detail::build_group(tokens, 1);
  }

  TreeNode parse_document(std::string_view text) {
    tt_trace();

    auto tokens = tokenize(text);
    TreeNode root = build_tree(tokens);

    if (!tokens.done())
      throw_error<FormatError>("tt::parse_document", "trailing data after closing brace", {
        { "offset", fmt::format("{}", tokens.offset()) } });

    return root;
  }

  uint compute_depth(const TreeNode &node) {
    return node.data | visit {
      [](const Leaf &) -> uint { return 1u; },
      [](const Branch &b) -> uint {
        if (b.children.empty())
          throw_error<EmptyBranchError>("tt::compute_depth", "branch has no children, depth is undefined");

        uint depth = 0;
        for (const auto &child : b.children)
          depth = std::max(depth, compute_depth(child));
        return depth + 1;
      }
    };
  }
} // namespace tt
