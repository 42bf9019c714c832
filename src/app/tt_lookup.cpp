// STL includes
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

// Misc includes
#include <fmt/core.h>
#include <nlohmann/json.hpp>

// Tensortree includes
#include <tensortree/app/lookup.hpp>
#include <tensortree/core/utility.hpp>

namespace tt {
  void print_usage(const char *exec) {
    fmt::print(stderr, "usage: {} <dataset.json> <block> <x> [y]\n", exec);
  }
} // namespace tt

int main(int argc, char *argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.size() < 3 || args.size() > 4) {
    tt::print_usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    // Load all blocks of the dataset up front, then query the requested one
    tt::Query q(std::stod(args[2]), args.size() > 3 ? std::stod(args[3]) : 0.0);
    tt::json js = tt::run_lookup(args[0], args[1], q);
    fmt::print("{}\n", js.dump(2));
    tt_trace_frame();
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    fmt::print(stderr, "{}\n", e.what());
    return EXIT_FAILURE;
  }
}
