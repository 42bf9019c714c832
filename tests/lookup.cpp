#include <catch2/catch_test_macros.hpp>
#include <tensortree/app/lookup.hpp>
#include <tensortree/core/exception.hpp>
#include <nlohmann/json.hpp>

using namespace tt;

namespace {
  const fs::path data_dir = TT_TEST_DATA_DIR;
} // namespace

TEST_CASE("Lookup report") {
  SECTION("Report fields") {
    json js = run_lookup(data_dir / "dataset.json", "Reflection Front", Query(0.5, 0.5));
    CHECK(js.size() == 5);
    CHECK(js.at("block")   == "Reflection Front");
    CHECK(js.at("variant") == "TensorTree4");
    CHECK(js.at("depth")   == 2);
    CHECK(js.at("query")   == json::parse("[0.5, 0.5]"));
    CHECK(js.at("result")  == json::parse("[[13.0, 14.0, 15.0, 16.0]]"));
  } // SECTION

  SECTION("Descending block") {
    json js = run_lookup(data_dir / "dataset.json", "Transmission Back", Query(-0.5, -0.5));
    CHECK(js.at("depth") == 2);
    REQUIRE(js.at("result").size() == 4);
    CHECK(js.at("result")[0] == json::parse("[12.0, 13.0, 14.0, 15.0]"));
    CHECK(js.at("result")[3] == json::parse("[1212.0, 1213.0, 1214.0, 1215.0]"));
  } // SECTION

  SECTION("Report on a loaded dataset") {
    Dataset dataset = io::load_dataset(data_dir / "dataset.json");
    CHECK(lookup_report(dataset, block::reflection_front, Query(-0.5, -0.5)).at("result")
      == json::parse("[[1.0, 2.0, 3.0, 4.0]]"));
  } // SECTION

  SECTION("Failures reach the caller") {
    CHECK_THROWS_AS(run_lookup(data_dir / "dataset.json", "Reflection Back", Query(0.0, 0.0)),
                    detail::Exception);
    CHECK_THROWS_AS(run_lookup(data_dir / "does_not_exist.json", "Reflection Front", Query(0.0, 0.0)),
                    detail::Exception);
  } // SECTION
}
