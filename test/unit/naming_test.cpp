#include <modelgen/expat_reader.hpp>
#include <modelgen/naming.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace modelgen;

TEST_CASE("field_name capitalizes a single word", "[naming]") {
  CHECK(field_name("foo") == "Foo");
}

TEST_CASE("struct_name joins underscore separated words", "[naming]") {
  CHECK(struct_name("Foo_Bar") == "FooBar");
}

TEST_CASE("struct_tag keeps the raw column name", "[naming]") {
  CHECK(struct_tag("Foo_Bar") == "ovs:\"Foo_Bar\"");
  CHECK(struct_tag("_uuid") == "ovs:\"_uuid\"");
}

TEST_CASE("file_name lower-cases and appends .go", "[naming]") {
  CHECK(file_name("foo") == "foo.go");
  CHECK(file_name("Logical_Switch") == "logical_switch.go");
}

TEST_CASE("camel_case", "[naming]") {
  struct {
    const char* in;
    const char* expected;
  } cases[] = {
      {"foo_bar_baz", "FooBarBaz"},
      {"foo-bar-baz", "FooBarBaz"},
      {"foos-bars-bazs", "FoosBarsBazs"},
      {"ip_port_mappings", "IPPortMappings"},
      {"external_ids", "ExternalIDs"},
      {"ip_prefix", "IPPrefix"},
      {"dns_records", "DNSRecords"},
      {"logical_ip", "LogicalIP"},
      {"ip", "IP"},
  };

  for (const auto& c : cases) {
    SECTION(c.in) { CHECK(camel_case(c.in) == c.expected); }
  }
}

TEST_CASE("camel_case drops empty tokens", "[naming]") {
  CHECK(camel_case("") == "");
  CHECK(camel_case("_foo__bar_") == "FooBar");
  CHECK(camel_case("--") == "");
}

TEST_CASE("camel_case leaves the tail of a word unchanged", "[naming]") {
  CHECK(camel_case("fooBar_baz") == "FooBarBaz");
  CHECK(camel_case("Port_Group") == "PortGroup");
}

TEST_CASE("acronym lookup is case-insensitive", "[naming]") {
  CHECK(camel_case("Ip_Uuid") == "IPUUID");
  CHECK(camel_case("vm_ids") == "VMIDs");
}

TEST_CASE("acronym_set defaults", "[naming]") {
  auto set = acronym_set::defaults();
  CHECK(set.size() == 38);
  CHECK(set.contains("ip"));
  CHECK(set.contains("UUID"));
  CHECK_FALSE(set.contains("VIF"));
  CHECK(set.words().count("HTTPS") == 1);
}

TEST_CASE("custom acronym set changes camel_case", "[naming]") {
  acronym_set set{"vif"};
  CHECK(set.contains("VIF"));
  CHECK(camel_case("vif_ip", set) == "VIFIp");
  CHECK(camel_case("vifs", set) == "VIFs");

  set.merge(acronym_set::defaults());
  CHECK(camel_case("vif_ip", set) == "VIFIP");
}

TEST_CASE("acronym_set::load reads an override file", "[naming]") {
  expat_reader reader(R"(<acronyms xmlns="http://modelgen.dev/acronyms">
  <acronym word="VIF"/>
  <acronym word="lsp"/>
</acronyms>)");

  auto loaded = acronym_set::load(reader);
  CHECK(loaded.size() == 2);
  CHECK(loaded.contains("vif"));
  CHECK(loaded.words().count("LSP") == 1);
}

TEST_CASE("acronym_set::load rejects the wrong root element", "[naming]") {
  expat_reader reader(R"(<typemap xmlns="http://modelgen.dev/typemap"/>)");
  CHECK_THROWS_AS(acronym_set::load(reader), std::runtime_error);
}

TEST_CASE("acronym_set::load rejects an invalid word", "[naming]") {
  expat_reader reader(R"(<acronyms xmlns="http://modelgen.dev/acronyms">
  <acronym word="not-a-word"/>
</acronyms>)");
  CHECK_THROWS_AS(acronym_set::load(reader), std::runtime_error);
}

TEST_CASE("is_go_identifier", "[naming]") {
  CHECK(is_go_identifier("Foo"));
  CHECK(is_go_identifier("_x1"));
  CHECK_FALSE(is_go_identifier(""));
  CHECK_FALSE(is_go_identifier("1abc"));
  CHECK_FALSE(is_go_identifier("a-b"));
  CHECK_FALSE(is_go_identifier("type"));
}
