#include <tensortree/core/exception.hpp>
#include <tensortree/core/io.hpp>
#include <tensortree/core/json.hpp>
#include <tensortree/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace tt {
  namespace io {
    json load_json(const fs::path &path) {
      return json::parse(load_string(path));
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      save_string(path, js.dump(indent));
    }
  } // namespace io

  void from_json(const json &js, TreeVariant &v) {
    if (js.is_number_integer())
      v = variant_from_string(std::to_string(js.get<int>()));
    else
      v = variant_from_string(js.get<std::string>());
  }

  void to_json(json &js, const TreeVariant &v) {
    js = std::string(to_string(v));
  }

  namespace detail {
    TreeNode node_from_json(const json &js, uint level) {
      if (!js.is_array())
        throw_error<FormatError>("tt::from_json", "tree node must be an array", {
          { "type", js.type_name() } });
      if (level > max_nesting_depth)
        throw_error<FormatError>("tt::from_json", "arrays nested too deeply", {
          { "level", fmt::format("{}", level) },
          { "limit", fmt::format("{}", max_nesting_depth) } });

      NodeBuilder builder;
      for (const auto &elem : js) {
        if (elem.is_number()) {
          builder.push_value(elem.get<double>());
        } else if (elem.is_array()) {
          builder.push_child(node_from_json(elem, level + 1));
        } else {
          throw_error<FormatError>("tt::from_json", "tree node entry must be a number or an array", {
            { "type", elem.type_name() } });
        }
      }
      return std::move(builder).finish();
    }
  } // namespace detail

  void from_json(const json &js, TreeNode &n) {
    n = detail::node_from_json(js, 1);
  }

  void to_json(json &js, const TreeNode &n) {
    n.data | visit {
      [&js](const Leaf &leaf) {
        js = leaf.values;
      },
      [&js](const Branch &branch) {
        js = json::array();
        for (const auto &child : branch.children)
          js.push_back(json(child));
      }
    };
  }

  void to_json(json &js, const Tree &t) {
    js["variant"] = t.variant();
    js["depth"]   = t.depth();
    js["root"]    = t.root();
  }

  Tree tree_from_json(const json &js) {
    Tree t(js.at("root").get<TreeNode>(), js.at("variant").get<TreeVariant>());
    if (js.contains("depth"))
      debug::check_expr(js.at("depth").get<uint>() == t.depth(),
        fmt::format("stored depth {} does not match tree depth {}", js.at("depth").get<uint>(), t.depth()));
    return t;
  }
} // namespace tt

namespace Eigen {
  void from_json(const tt::json &js, Array2d &v) {
    tt::debug::check_expr(js.is_array() && js.size() == 2,
      fmt::format("query must be an array of two numbers, got {}", js.dump()));
    v = Array2d(js.at(0).get<double>(), js.at(1).get<double>());
  }

  void to_json(tt::json &js, const Array2d &v) {
    js = { v.x(), v.y() };
  }
} // namespace Eigen
