#include <tensortree/core/dataset.hpp>
#include <tensortree/core/utility.hpp>
#include <fmt/ranges.h>

namespace tt {
  void Dataset::insert(std::string_view name, Tree tree) {
    tt_trace();

    debug::check_expr(tree.variant() == m_variant,
      fmt::format("block \"{}\" is {}, dataset expects {}", name, to_string(tree.variant()), to_string(m_variant)));
    debug::check_expr(!contains(name),
      fmt::format("block \"{}\" is already present", name));

    m_blocks.emplace(std::string(name), std::move(tree));
  }

  bool Dataset::contains(std::string_view name) const {
    return m_blocks.find(name) != m_blocks.end();
  }

  const Tree &Dataset::at(std::string_view name) const {
    auto it = m_blocks.find(name);
    if (it == m_blocks.end()) {
      detail::Exception e;
      e.put("src", "tt::Dataset::at");
      e.put("message", fmt::format("no block named \"{}\"", name));
      e.put("blocks", fmt::format("[{}]", fmt::join(names(), ", ")));
      throw e;
    }
    return it->second;
  }

  std::vector<std::string> Dataset::names() const {
    std::vector<std::string> v;
    v.reserve(m_blocks.size());
    for (const auto &[name, _] : m_blocks)
      v.push_back(name);
    return v;
  }
} // namespace tt
