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
#include <array>
#include <cmath>
#include <string_view>

namespace tt {
  // Tensor tree format variant; supplied by the container metadata, never
  // inferred from tree shape. Underlying value is the format's dimensionality
  enum class TreeVariant : uint {
    eIsotropic   = 3, // "TensorTree3", branches on a single magnitude coordinate
    eAnisotropic = 4  // "TensorTree4", branches on the signs of two coordinates
  };

  // Parse "3"/"4"/"TensorTree3"/"TensorTree4"; throws FormatError otherwise
  TreeVariant variant_from_string(std::string_view str);

  // Canonical container name, "TensorTree3" or "TensorTree4"
  std::string_view to_string(TreeVariant variant);

  // Ordered child slots examined at one level of descent
  using IndexSet = std::array<uint, 4>;

  /* Fixed child orderings of the tensor tree format. Slot order encodes
     which spatial quadrant a child subtree covers, so these must match
     the format exactly. Rows are addressed by quadrant() / band() */
  namespace index {
    // Intermediate level, stride 4 over 16 children
    constexpr std::array<IndexSet, 4> aniso_branch = {{
      { 0, 4, 8,  12 }, // x <  0, y <  0
      { 2, 6, 10, 14 }, // x <  0, y >= 0
      { 1, 5, 9,  13 }, // x >= 0, y <  0
      { 3, 7, 11, 15 }  // x >= 0, y >= 0
    }};

    // Final level, contiguous blocks of 4 over 16 leaf slots
    constexpr std::array<IndexSet, 4> aniso_leaf = {{
      { 0,  1,  2,  3  },
      { 4,  5,  6,  7  },
      { 8,  9,  10, 11 },
      { 12, 13, 14, 15 }
    }};

    // Intermediate level, stride 2 over 8 children
    constexpr std::array<IndexSet, 2> iso_branch = {{
      { 0, 2, 4, 6 }, // |x| <= 0.5
      { 1, 3, 5, 7 }  // |x| >  0.5
    }};

    // Final level, contiguous blocks of 4 over 8 leaf slots
    constexpr std::array<IndexSet, 2> iso_leaf = {{
      { 0, 1, 2, 3 },
      { 4, 5, 6, 7 }
    }};

    // Root children walked by the isotropic variant, regardless of query
    constexpr IndexSet iso_root = { 0, 2, 4, 6 };

    // Row of the anisotropic tables; the comparison is strict, so both
    // 0.0 and -0.0 fall on the non-negative side
    constexpr uint quadrant(double x, double y) {
      return (x < 0.0 ? 0u : 2u) + (y < 0.0 ? 0u : 1u);
    }

    // Row of the isotropic tables
    inline uint band(double x) {
      return std::abs(x) <= 0.5 ? 0u : 1u;
    }

    constexpr IndexSet aniso_branch_index(double x, double y) { return aniso_branch[quadrant(x, y)]; }
    constexpr IndexSet aniso_leaf_index(double x, double y)   { return aniso_leaf[quadrant(x, y)];   }
    inline    IndexSet iso_branch_index(double x)             { return iso_branch[band(x)];          }
    inline    IndexSet iso_leaf_index(double x)               { return iso_leaf[band(x)];            }
  } // namespace index

  // Select the child slots to examine for a recentered query; is_final selects
  // the leaf tables used at the last level before the leaves
  inline
  IndexSet select_index(TreeVariant variant, const Query &q, bool is_final) {
    if (variant == TreeVariant::eAnisotropic)
      return is_final ? index::aniso_leaf_index(q.x(), q.y()) : index::aniso_branch_index(q.x(), q.y());
    else
      return is_final ? index::iso_leaf_index(q.x()) : index::iso_branch_index(q.x());
  }
} // namespace tt
