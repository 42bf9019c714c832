#include <tensortree/app/lookup.hpp>
#include <tensortree/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace tt {
  json lookup_report(const Dataset &dataset, std::string_view block, const Query &q) {
    tt_trace();

    const Tree &tree = dataset.at(block);
    return {
      { "block",   std::string(block) },
      { "variant", tree.variant()     },
      { "depth",   tree.depth()       },
      { "query",   q                  },
      { "result",  tree.lookup(q)     }
    };
  }

  json run_lookup(const fs::path &path, std::string_view block, const Query &q) {
    tt_trace();
    return lookup_report(io::load_dataset(path), block, q);
  }
} // namespace tt
