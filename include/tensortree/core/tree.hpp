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

#include <tensortree/core/index.hpp>
#include <tensortree/core/math.hpp>
#include <tensortree/core/node.hpp>
#include <string_view>
#include <vector>

namespace tt {
  // Matches of a lookup, one per top-level group examined. A leaf entry holds
  // the flat values of a final-level match, a branch entry holds the matches
  // of the sub-slots it was resolved into
  using LookupResult = std::vector<TreeNode>;

  // Number of slots picked per level; also the shape threshold below
  constexpr size_t slots_per_level = 4;

  // Shape predicates on list length. A node holding a single entry is a
  // uniform cell and ends descent. A selected slot holding more than
  // slots_per_level entries is subdivided further; smaller slots are kept as-is
  inline bool is_leaf_shape(const TreeNode &node)       { return node.size() == 1;               }
  inline bool is_subdivided_shape(const TreeNode &node) { return node.size() > slots_per_level;  }

  /**
   * Immutable tensor tree; a parsed data block with its variant and cached
   * depth. Lookups are read-only and may run concurrently.
   */
  class Tree {
    TreeNode    m_root;
    TreeVariant m_variant;
    uint        m_depth;

    TreeNode traverse(const TreeNode &node, const Query &q, uint n) const;

  public:
    // Wrap a built root node; throws FormatError if the root is not a branch,
    // and EmptyBranchError if depth is undefined
    Tree(TreeNode root, TreeVariant variant);

    // Parse a data block and wrap the result
    static Tree parse(std::string_view text, TreeVariant variant);

    const TreeNode &root()    const { return m_root;    }
    TreeVariant     variant() const { return m_variant; }
    uint            depth()   const { return m_depth;   }

    // Descend the tree for an incident grid position. Throws StructuralMismatch
    // if a fixed-size index table cannot be applied to the tree's shape. Queries
    // outside [-1, 1] are not clamped
    LookupResult lookup(const Query &q) const;
    LookupResult lookup(double x, double y = 0.0) const {
      return lookup(Query(x, y));
    }

    bool operator==(const Tree &) const = default;
  };
} // namespace tt
