#pragma once

#include <tensortree/core/dataset.hpp>
#include <tensortree/core/io.hpp>
#include <tensortree/core/json.hpp>
#include <string_view>

namespace tt {
  /* Lookup report of the tt_lookup tool, as
     { "block", "variant", "depth", "query", "result" } */
  json lookup_report(const Dataset &dataset, std::string_view block, const Query &q);

  // Load the dataset at path, then report a lookup on one of its blocks
  json run_lookup(const fs::path &path, std::string_view block, const Query &q);
} // namespace tt
