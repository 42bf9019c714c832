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

#include <tensortree/core/io.hpp>
#include <tensortree/core/math.hpp>
#include <tensortree/core/tree.hpp>
#include <nlohmann/json_fwd.hpp>

namespace tt {
  // namespace/typename shorthand inside tt namespace
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);
  }

  /* json (de)serialization for TreeVariant; read from "3", "4", "TensorTree3",
     "TensorTree4" or the integers 3 and 4 */
  void from_json(const json &js, TreeVariant &v);
  void to_json(json &js, const TreeVariant &v);

  /* json (de)serialization for TreeNode as nested arrays; a leaf is an array of
     numbers, a branch an array of child arrays */
  void from_json(const json &js, TreeNode &n);
  void to_json(json &js, const TreeNode &n);

  /* json serialization for Tree, as { "variant", "depth", "root" } */
  void to_json(json &js, const Tree &t);

  // Tree has no default state, so deserialization returns by value
  Tree tree_from_json(const json &js);
} // namespace tt

/* json (de)serializations for specific Eigen types must be declared in Eigen scope */
namespace Eigen {
  void from_json(const tt::json &js, Array2d &v);
  void to_json(tt::json &js, const Array2d &v);
} // namespace Eigen
