#include <catch2/catch_test_macros.hpp>
#include <tensortree/core/exception.hpp>
#include <tensortree/core/json.hpp>
#include <nlohmann/json.hpp>
#include <string>

using namespace tt;

TEST_CASE("Json conversion") {
  SECTION("Nodes as nested arrays") {
    TreeNode node = parse_document("{ {1 2} {3 {4} } }");
    json js = node;
    CHECK(js == json::parse("[[1.0, 2.0], [[3.0], [4.0]]]"));
    CHECK(js.get<TreeNode>() == node);
  } // SECTION

  SECTION("Arrays follow the document grouping rules") {
    CHECK(json::parse("[1, 2, 3]").get<TreeNode>()   == parse_document("{1 2 3}"));
    CHECK(json::parse("[1, [2], 3]").get<TreeNode>() == parse_document("{1 {2} 3}"));
    CHECK(json::parse("[]").get<TreeNode>()          == parse_document("{}"));
  } // SECTION

  SECTION("Invalid node entries") {
    CHECK_THROWS_AS(json::parse("3").get<TreeNode>(),            FormatError);
    CHECK_THROWS_AS(json::parse("[1, \"a\"]").get<TreeNode>(),   FormatError);
    CHECK_THROWS_AS(json::parse("[[1], {\"a\": 1}]").get<TreeNode>(), FormatError);
  } // SECTION

  SECTION("Nesting limit") {
    auto nested = [](uint levels) {
      return json::parse(std::string(levels, '[') + "1" + std::string(levels, ']'));
    };
    CHECK(compute_depth(nested(max_nesting_depth).get<TreeNode>()) == max_nesting_depth);
    CHECK_THROWS_AS(nested(max_nesting_depth + 1).get<TreeNode>(), FormatError);
    CHECK_THROWS_AS(nested(1000).get<TreeNode>(),                  FormatError);
  } // SECTION

  SECTION("Tree variant") {
    CHECK(json::parse("\"TensorTree4\"").get<TreeVariant>() == TreeVariant::eAnisotropic);
    CHECK(json::parse("\"3\"").get<TreeVariant>()           == TreeVariant::eIsotropic);
    CHECK(json::parse("4").get<TreeVariant>()               == TreeVariant::eAnisotropic);
    CHECK(json(TreeVariant::eIsotropic) == "TensorTree3");
    CHECK_THROWS_AS(json::parse("5").get<TreeVariant>(), FormatError);
  } // SECTION

  SECTION("Tree") {
    Tree tree = Tree::parse("{ {1 2 3 4}{5 6 7 8}{9 10 11 12}{13 14 15 16} }", TreeVariant::eAnisotropic);
    json js = tree;
    CHECK(js.at("variant") == "TensorTree4");
    CHECK(js.at("depth")   == 2);
    CHECK(js.at("root").size() == 4);
    CHECK(tree_from_json(js) == tree);

    js["depth"] = 3;
    CHECK_THROWS_AS(tree_from_json(js), detail::Exception);
  } // SECTION

  SECTION("Lookup results") {
    Tree tree = Tree::parse("{ {1 2 3 4}{5 6 7 8}{9 10 11 12}{13 14 15 16} }", TreeVariant::eAnisotropic);
    json js = tree.lookup(-0.5, -0.5);
    CHECK(js == json::parse("[[1.0, 2.0, 3.0, 4.0]]"));
  } // SECTION

  SECTION("Query") {
    json js = Query(0.25, -0.5);
    CHECK(js == json::parse("[0.25, -0.5]"));
    CHECK((js.get<Query>() == Query(0.25, -0.5)).all());
    CHECK_THROWS_AS(json::parse("[1.0]").get<Query>(), detail::Exception);
  } // SECTION
}
