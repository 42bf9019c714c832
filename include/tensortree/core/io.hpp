#pragma once

#include <tensortree/core/index.hpp>
#include <filesystem>
#include <string>

namespace tt {
  namespace fs = std::filesystem;

  // FWD
  class Tree;
  class Dataset;

  namespace io {
    // Simple string load/save to/from file
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);

    // Load a text file holding a single tensor tree data block, e.g. the contents
    // of a ScatteringData field extracted from its container
    Tree load_tree(const fs::path &path, TreeVariant variant);

    // Load a set of named data blocks described by a json configuration file;
    // see tensortree/core/dataset.hpp for the expected layout
    Dataset load_dataset(const fs::path &path);
  } // namespace io
} // namespace tt
