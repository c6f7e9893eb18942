#include <modelgen/errors.hpp>
#include <modelgen/expat_reader.hpp>
#include <modelgen/xml_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace modelgen;

TEST_CASE("reader: empty element", "[xml_reader]") {
  expat_reader reader("<root/>");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::start_element);
  CHECK(reader.name() == xml_name{"", "root"});
  CHECK(reader.depth() == 1);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK(reader.name() == xml_name{"", "root"});
  CHECK(reader.depth() == 1);

  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: namespaced names and attributes", "[xml_reader]") {
  expat_reader reader(
      R"(<m:typemap xmlns:m="urn:x"><m:mapping wire-type="uuid"/></m:typemap>)");

  REQUIRE(reader.read());
  CHECK(reader.name() == xml_name{"urn:x", "typemap"});

  REQUIRE(reader.read());
  CHECK(reader.name().local_name == "mapping");
  CHECK(reader.depth() == 2);
  CHECK(reader.attribute("wire-type") == "uuid");
  CHECK(reader.attribute("missing").empty());
}

TEST_CASE("reader: qualified attributes are not reported", "[xml_reader]") {
  expat_reader reader(
      R"(<a xmlns:o="urn:o" o:word="hidden" word="plain"/>)");
  REQUIRE(reader.read());
  CHECK(reader.attribute("word") == "plain");
}

TEST_CASE("reader: text content and line numbers", "[xml_reader]") {
  expat_reader reader("<a>\n  <b>hello</b>\n</a>");

  REQUIRE(reader.read());
  CHECK(reader.line() == 1);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);

  REQUIRE(reader.read());
  CHECK(reader.name().local_name == "b");
  CHECK(reader.line() == 2);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);
  CHECK(reader.text() == "hello");
}

TEST_CASE("read_skip_whitespace skips blank text", "[xml_reader]") {
  expat_reader reader("<a>\n  <b/>\n  text\n</a>");

  REQUIRE(read_skip_whitespace(reader));
  CHECK(reader.name().local_name == "a");
  REQUIRE(read_skip_whitespace(reader));
  CHECK(reader.name().local_name == "b");
  REQUIRE(read_skip_whitespace(reader));
  CHECK(reader.node_type() == xml_node_type::end_element);
  REQUIRE(read_skip_whitespace(reader));
  CHECK(reader.node_type() == xml_node_type::characters);
  REQUIRE(read_skip_whitespace(reader));
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK_FALSE(read_skip_whitespace(reader));
}

TEST_CASE("reader: malformed document throws", "[xml_reader]") {
  CHECK_THROWS_AS(expat_reader("<a><b></a>"), std::runtime_error);
  CHECK_THROWS_AS(expat_reader(""), std::runtime_error);
}

TEST_CASE("reader: a missing file is an io error", "[xml_reader]") {
  CHECK_THROWS_AS(expat_reader::from_file("/nonexistent/dir/config.xml"),
                  io_error);
}

// ---------------------------------------------------------------------------
// read_config_entries
// ---------------------------------------------------------------------------

namespace {

  const xml_name list_root{"urn:cfg", "list"};
  const xml_name list_item{"urn:cfg", "item"};

  std::vector<std::string>
  item_names(std::string_view xml) {
    expat_reader reader(xml);
    std::vector<std::string> names;
    read_config_entries(reader, list_root, list_item, "test",
                        [&](const xml_reader& r) {
                          names.emplace_back(r.attribute("name"));
                        });
    return names;
  }

} // namespace

TEST_CASE("read_config_entries visits entries in order", "[xml_reader]") {
  auto names = item_names(R"(<list xmlns="urn:cfg">
    <item name="a"/>
    <item name="b"></item>
  </list>)");
  REQUIRE(names.size() == 2);
  CHECK(names[0] == "a");
  CHECK(names[1] == "b");

  CHECK(item_names(R"(<list xmlns="urn:cfg"/>)").empty());
}

TEST_CASE("read_config_entries rejects other content", "[xml_reader]") {
  // wrong root namespace
  CHECK_THROWS_AS(item_names(R"(<list><item name="a"/></list>)"),
                  std::runtime_error);
  // foreign child
  CHECK_THROWS_AS(
      item_names(R"(<list xmlns="urn:cfg"><other/></list>)"),
      std::runtime_error);
  // text inside the root
  CHECK_THROWS_AS(item_names(R"(<list xmlns="urn:cfg">text</list>)"),
                  std::runtime_error);
  // non-empty entry
  CHECK_THROWS_AS(
      item_names(R"(<list xmlns="urn:cfg"><item><item/></item></list>)"),
      std::runtime_error);
}

TEST_CASE("config errors carry the context and line", "[xml_reader]") {
  try {
    item_names("<list xmlns=\"urn:cfg\">\n\n<other/></list>");
    FAIL("expected std::runtime_error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()) ==
          "test: line 3: unexpected content inside <list>");
  }
}
