#include <catch2/catch_test_macros.hpp>
#include <tensortree/core/exception.hpp>
#include <tensortree/core/node.hpp>
#include <fmt/core.h>
#include <string>

using namespace tt;

TEST_CASE("Tree builder") {
  SECTION("Group of values forms a leaf") {
    TreeNode node = parse_document("{1 2 3}");
    REQUIRE(node.is_leaf());
    CHECK(node.leaf().values == std::vector<double> { 1, 2, 3 });
    CHECK(node.size() == 3);
  } // SECTION

  SECTION("Nested groups form a branch") {
    TreeNode node = parse_document("{ {1 2} {3} }");
    REQUIRE(node.is_branch());
    REQUIRE(node.size() == 2);
    CHECK(node.branch().children[0] == TreeNode(Leaf { { 1, 2 } }));
    CHECK(node.branch().children[1] == TreeNode(Leaf { { 3 } }));
  } // SECTION

  SECTION("Value runs between groups become leaf children") {
    TreeNode node = parse_document("{ 1 2 {3} 4 }");
    TreeNode expected = Branch { {
      Leaf { { 1, 2 } },
      Leaf { { 3 } },
      Leaf { { 4 } }
    } };
    CHECK(node == expected);
  } // SECTION

  SECTION("Child order is preserved") {
    TreeNode node = parse_document("{ {3} {1} {2} {1} }");
    REQUIRE(node.size() == 4);
    CHECK(node.branch().children[0].leaf().values[0] == 3.0);
    CHECK(node.branch().children[1].leaf().values[0] == 1.0);
    CHECK(node.branch().children[2].leaf().values[0] == 2.0);
    CHECK(node.branch().children[3].leaf().values[0] == 1.0);
  } // SECTION

  SECTION("Empty group forms an empty branch") {
    TreeNode node = parse_document("{}");
    REQUIRE(node.is_branch());
    CHECK(node.size() == 0);
  } // SECTION

  SECTION("Builder consumes a single document") {
    auto tokens = tokenize("{1} {2 3}");
    CHECK(build_tree(tokens) == TreeNode(Leaf { { 1 } }));
    CHECK(build_tree(tokens) == TreeNode(Leaf { { 2, 3 } }));
    CHECK(tokens.done());
  } // SECTION

  SECTION("Missing opening brace") {
    CHECK_THROWS_AS(parse_document("1 2 3}"), FormatError);
    CHECK_THROWS_AS(parse_document("}"),      FormatError);
    CHECK_THROWS_AS(parse_document(""),       FormatError);
  } // SECTION

  SECTION("Missing closing brace") {
    CHECK_THROWS_AS(parse_document("{1 2 3"),     UnexpectedEndOfInput);
    CHECK_THROWS_AS(parse_document("{ {1} {2} "), UnexpectedEndOfInput);
    CHECK_THROWS_AS(parse_document("{{{"),        UnexpectedEndOfInput);
  } // SECTION

  SECTION("Trailing data") {
    CHECK_THROWS_AS(parse_document("{1} {2}"), FormatError);
    CHECK_THROWS_AS(parse_document("{1} }"),   FormatError);
    CHECK_NOTHROW(parse_document("{1}  ,\n"));
  } // SECTION

  SECTION("Malformed characters inside a document") {
    CHECK_THROWS_AS(parse_document("{1 x 2}"), FormatError);
    CHECK_THROWS_AS(parse_document("{1.5.3}"), FormatError);
    CHECK_THROWS_AS(parse_document("{1-2}"),   FormatError);
    CHECK_THROWS_AS(parse_document("{2e3.5}"), FormatError);
  } // SECTION

  SECTION("Nesting limit") {
    auto nested = [](uint levels) {
      return std::string(levels, '{') + "1" + std::string(levels, '}');
    };

    TreeNode node = parse_document(nested(max_nesting_depth));
    CHECK(compute_depth(node) == max_nesting_depth);

    CHECK_THROWS_AS(parse_document(nested(max_nesting_depth + 1)), FormatError);
    CHECK_THROWS_AS(parse_document(nested(200000)),                FormatError);
  } // SECTION
}

TEST_CASE("Depth calculator") {
  SECTION("Leaf") {
    CHECK(compute_depth(Leaf { { 1, 2, 3, 4 } }) == 1);
    CHECK(compute_depth(parse_document("{5}")) == 1);
  } // SECTION

  SECTION("Single level of leaves") {
    CHECK(compute_depth(parse_document("{ {1 2 3 4}{5 6 7 8}{9 10 11 12}{13 14 15 16} }")) == 2);
  } // SECTION

  SECTION("Two levels of sixteen children") {
    std::string text = "{";
    for (uint i = 0; i < 16; ++i) {
      text += "{";
      for (uint j = 0; j < 16; ++j)
        text += fmt::format("{{{}}}", i * 16 + j);
      text += "}";
    }
    text += "}";
    CHECK(compute_depth(parse_document(text)) == 3);
  } // SECTION

  SECTION("Uneven branches use the deepest") {
    CHECK(compute_depth(parse_document("{ {1} { {2} { {3} } } }")) == 4);
  } // SECTION

  SECTION("Empty branch") {
    CHECK_THROWS_AS(compute_depth(parse_document("{}")),          EmptyBranchError);
    CHECK_THROWS_AS(compute_depth(parse_document("{ {1} {} }")),  EmptyBranchError);
  } // SECTION
}
