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

#include <tensortree/core/dataset.hpp>
#include <tensortree/core/io.hpp>
#include <tensortree/core/json.hpp>
#include <tensortree/core/tree.hpp>
#include <tensortree/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace tt::io {
  std::string load_string(const fs::path &path) {
    tt_trace();

    // Check that file path exists
    debug::check_expr(fs::exists(path),
      fmt::format("failed to resolve path \"{}\"", path.string()));

    // Attempt to open file stream
    std::ifstream ifs(path, std::ios::ate | std::ios::binary);
    debug::check_expr(ifs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Read file size and construct string to hold data
    size_t file_size = static_cast<size_t>(ifs.tellg());
    std::string str(file_size, ' ');

    // Set input position to start, then read full file into buffer
    ifs.seekg(0);
    ifs.read(str.data(), file_size);
    ifs.close();

    return str;
  }

  void save_string(const fs::path &path, const std::string &str) {
    tt_trace();

    // Attempt to open output file stream in text mode
    std::ofstream ofs(path, std::ios::out);
    debug::check_expr(ofs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Write string directly to file in text mode
    ofs.write(str.data(), str.size());
    ofs.close();
  }

  Tree load_tree(const fs::path &path, TreeVariant variant) {
    tt_trace();
    return Tree::parse(load_string(path), variant);
  }

  Dataset load_dataset(const fs::path &path) {
    tt_trace();

    json js = load_json(path);
    debug::check_expr(js.contains("variant") && js.contains("blocks"),
      fmt::format("dataset \"{}\" must specify \"variant\" and \"blocks\"", path.string()));

    Dataset dataset(js.at("variant").get<TreeVariant>());
    for (const auto &item : js.at("blocks").items()) {
      const std::string &name  = item.key();
      const json        &block = item.value();
      if (block.contains("data")) {
        dataset.insert(name, Tree::parse(block.at("data").get<std::string>(), dataset.variant()));
      } else {
        debug::check_expr(block.contains("path"),
          fmt::format("block \"{}\" must specify either \"data\" or \"path\"", name));

        // Relative block paths resolve against the configuration's directory
        fs::path block_path = block.at("path").get<std::string>();
        if (block_path.is_relative())
          block_path = path.parent_path() / block_path;
        dataset.insert(name, load_tree(block_path, dataset.variant()));
      }
    }

    return dataset;
  }
} // namespace tt::io
