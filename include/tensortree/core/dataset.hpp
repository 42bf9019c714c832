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

#include <tensortree/core/tree.hpp>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tt {
  // Conventional block names of a BSDF data file
  namespace block {
    constexpr std::string_view transmission_front = "Transmission Front";
    constexpr std::string_view transmission_back  = "Transmission Back";
    constexpr std::string_view reflection_front   = "Reflection Front";
    constexpr std::string_view reflection_back    = "Reflection Back";
  } // namespace block

  /**
   * Named set of tensor trees describing one BSDF; all blocks share the
   * variant declared by their container. Loaded from a json file of the form
   *
   *   { "variant": "TensorTree4",
   *     "blocks": { "Transmission Back": { "path": "tb.txt" },
   *                 "Reflection Front":  { "data": "{ ... }" } } }
   *
   * where relative paths resolve against the configuration file's directory.
   */
  class Dataset {
    TreeVariant                             m_variant;
    std::map<std::string, Tree, std::less<>> m_blocks;

  public:
    explicit Dataset(TreeVariant variant)
    : m_variant(variant) { }

    TreeVariant variant() const { return m_variant;       }
    size_t      size()    const { return m_blocks.size(); }

    // Add a block; its variant must match and its name must be unused
    void insert(std::string_view name, Tree tree);

    bool contains(std::string_view name) const;

    // Access a block by name; throws if no such block exists
    const Tree &at(std::string_view name) const;

    // Block names in sorted order
    std::vector<std::string> names() const;

    LookupResult lookup(std::string_view name, const Query &q) const {
      return at(name).lookup(q);
    }
  };
} // namespace tt
