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
#include <tensortree/core/tree.hpp>
#include <tensortree/core/utility.hpp>
#include <fmt/ranges.h>
#include <algorithm>
#include <cmath>

namespace tt {
  namespace detail {
    // Fail if any slot of an index set lies beyond the node's list length
    void check_index(const TreeNode &node, const IndexSet &idx, uint level) {
      uint max_index = *std::ranges::max_element(idx);
      guard(max_index >= node.size());

      throw_error<StructuralMismatch>("tt::Tree::lookup", "index table exceeds node size", {
        { "kind",  node.is_leaf() ? "leaf" : "branch" },
        { "size",  fmt::format("{}", node.size()) },
        { "index", fmt::format("{}", fmt::join(idx, ", ")) },
        { "level", fmt::format("{}", level) } });
    }
  } // namespace detail

  Tree::Tree(TreeNode root, TreeVariant variant)
  : m_root(std::move(root)),
    m_variant(variant),
    m_depth(0) {
    tt_trace();

    if (!m_root.is_branch())
      throw_error<FormatError>("tt::Tree::Tree", "tree root must be a branch", {
        { "size", fmt::format("{}", m_root.size()) } });

    m_depth = compute_depth(m_root);
  }

  Tree Tree::parse(std::string_view text, TreeVariant variant) {
    return Tree(parse_document(text), variant);
  }

  LookupResult Tree::lookup(const Query &q) const {
    tt_trace();

    const auto &children = m_root.branch().children;

    // Select top-level groups; the anisotropic root is split by quadrant, the
    // isotropic root always walks every other child
    std::vector<uint> selected;
    if (m_variant == TreeVariant::eAnisotropic) {
      IndexSet idx = index::aniso_branch_index(q.x(), q.y());
      if (children.size() == slots_per_level) {
        // Root holds a single quadrant group; one child per quadrant
        selected = { idx[0] };
      } else {
        detail::check_index(m_root, idx, 1);
        selected.assign(idx.begin(), idx.end());
      }
    } else {
      detail::check_index(m_root, index::iso_root, 1);
      selected.assign(index::iso_root.begin(), index::iso_root.end());
    }

    LookupResult result;
    result.reserve(selected.size());
    for (uint i : selected) {
      const auto &child = children[i];
      result.push_back(is_subdivided_shape(child) ? traverse(child, q, 1) : child);
    }
    return result;
  }

  TreeNode Tree::traverse(const TreeNode &node, const Query &q, uint n) const {
    tt_trace();

    // Sparse cell; returned without further descent
    guard(!is_leaf_shape(node), node);

    // Recenter into the half the query lies in; x == 0 shifts toward negative
    double step = std::ldexp(1.0, -static_cast<int>(n));
    Query q_ = (q < 0.0).select(q + step, q - step);
    if (m_variant == TreeVariant::eIsotropic)
      q_.y() = q.y();
    n++;

    IndexSet idx = select_index(m_variant, q_, n >= m_depth);
    detail::check_index(node, idx, n);

    return node.data | visit {
      [&](const Leaf &leaf) -> TreeNode {
        Leaf match;
        match.values.reserve(idx.size());
        for (uint i : idx)
          match.values.push_back(leaf.values[i]);
        return match;
      },
      [&](const Branch &branch) -> TreeNode {
        Branch match;
        match.children.reserve(idx.size());
        for (uint i : idx) {
          const auto &child = branch.children[i];
          match.children.push_back(is_subdivided_shape(child) ? traverse(child, q_, n) : child);
        }
        return match;
      }
    };
  }
} // namespace tt
