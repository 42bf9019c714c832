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
#include <tensortree/core/token.hpp>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tt {
  // FWD
  struct TreeNode;

  /* Terminal node; raw scattering values of one angular cell */
  struct Leaf {
    std::vector<double> values;

  public:
    bool operator==(const Leaf &) const = default;
  };

  /* Non-terminal node; child order encodes quadrant identity and is never changed */
  struct Branch {
    std::vector<TreeNode> children;

  public:
    bool operator==(const Branch &o) const;
  };

  struct TreeNode {
    std::variant<Leaf, Branch> data;

  public:
    TreeNode() = default;
    TreeNode(Leaf leaf) : data(std::move(leaf)) { }
    TreeNode(Branch branch) : data(std::move(branch)) { }

    bool is_leaf()   const { return std::holds_alternative<Leaf>(data);   }
    bool is_branch() const { return std::holds_alternative<Branch>(data); }

    const Leaf   &leaf()   const { return std::get<Leaf>(data);   }
    const Branch &branch() const { return std::get<Branch>(data); }

    // Number of entries held directly by this node; values for a leaf,
    // children for a branch
    size_t size() const;

    bool operator==(const TreeNode &) const = default;
  };

  /**
   * Accumulates the contents of one bracketed group. Consecutive values are
   * buffered and flushed as a single leaf child when a nested group follows.
   * finish() yields a leaf if the group held only values, and a branch otherwise.
   */
  class NodeBuilder {
    std::vector<TreeNode> m_children;
    std::vector<double>   m_values;

    void flush_values();

  public:
    void push_value(double value) { m_values.push_back(value); }
    void push_child(TreeNode child);

    TreeNode finish() &&;
  };

  // Deepest accepted group nesting; the outer brace of a document is level 1
  constexpr uint max_nesting_depth = 64;

  // Consume tokens of a single bracketed document; the first token must open a brace.
  // Throws FormatError or UnexpectedEndOfInput on malformed input, and FormatError
  // on groups nested beyond max_nesting_depth
  TreeNode build_tree(Tokenizer &tokens);

  // Tokenize and build a full document; trailing tokens after the outer brace are rejected
  TreeNode parse_document(std::string_view text);

  // Maximum nesting level reachable from a node; a leaf counts as one level.
  // Throws EmptyBranchError if a branch without children is encountered
  uint compute_depth(const TreeNode &node);
} // namespace tt
