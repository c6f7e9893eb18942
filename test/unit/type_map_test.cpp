#include <modelgen/errors.hpp>
#include <modelgen/expat_reader.hpp>
#include <modelgen/type_map.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace modelgen;

// ---------------------------------------------------------------------------
// atomic types
// ---------------------------------------------------------------------------

TEST_CASE("atomic_type maps the OVSDB atomic types", "[type_map]") {
  CHECK(atomic_type("integer") == "int");
  CHECK(atomic_type("real") == "float64");
  CHECK(atomic_type("boolean") == "bool");
  CHECK(atomic_type("string") == "string");
  CHECK(atomic_type("uuid") == "string");
}

TEST_CASE("atomic_type returns empty for an unknown token", "[type_map]") {
  CHECK(atomic_type("notAType").empty());
  CHECK(atomic_type("").empty());
}

TEST_CASE("type_map defaults has 5 entries without imports", "[type_map]") {
  auto map = type_map::defaults();
  CHECK(map.size() == 5);
  for (const auto& name : {"integer", "real", "boolean", "string", "uuid"}) {
    SECTION(name) {
      auto* m = map.find(name);
      REQUIRE(m != nullptr);
      CHECK(m->import_path.empty());
    }
  }
}

// ---------------------------------------------------------------------------
// field types
// ---------------------------------------------------------------------------

TEST_CASE("field_type composes complex column types", "[type_map]") {
  auto types = type_map::defaults();

  SECTION("atomic") {
    CHECK(field_type(types, "t", "c", atomic_column("integer")).type == "int");
  }
  SECTION("optional") {
    CHECK(field_type(types, "t", "c", optional_column("string")).type ==
          "*string");
  }
  SECTION("set") {
    CHECK(field_type(types, "t", "c", set_column("uuid")).type == "[]string");
  }
  SECTION("bounded set") {
    CHECK(field_type(types, "t", "c", set_column("real", 4)).type ==
          "[]float64");
  }
  SECTION("map") {
    CHECK(field_type(types, "t", "c", map_column("string", "integer")).type ==
          "map[string]int");
  }
}

TEST_CASE("field_type reports the offending column", "[type_map]") {
  auto types = type_map::defaults();
  try {
    field_type(types, "Bridge", "ports", map_column("string", "notAType"));
    FAIL("expected unrecognized_type_error");
  } catch (const unrecognized_type_error& e) {
    CHECK(e.table() == "Bridge");
    CHECK(e.column() == "ports");
    CHECK(e.type() == "notAType");
  }
}

TEST_CASE("field_type is a generation_error for unknown keys", "[type_map]") {
  auto types = type_map::defaults();
  CHECK_THROWS_AS(field_type(types, "t", "c", atomic_column("blob")),
                  generation_error);
}

TEST_CASE("field_type collects imports of overridden types", "[type_map]") {
  auto types = type_map::defaults();
  types.set("uuid", {"uuid.UUID", "github.com/google/uuid"});

  auto r = field_type(types, "t", "c", map_column("uuid", "uuid"));
  CHECK(r.type == "map[uuid.UUID]uuid.UUID");
  REQUIRE(r.imports.size() == 1);
  CHECK(r.imports[0] == "github.com/google/uuid");
}

// ---------------------------------------------------------------------------
// load and merge
// ---------------------------------------------------------------------------

TEST_CASE("type_map::load reads mappings", "[type_map]") {
  expat_reader reader(R"(<typemap xmlns="http://modelgen.dev/typemap">
  <mapping wire-type="uuid" go-type="uuid.UUID" go-import="github.com/google/uuid"/>
  <mapping wire-type="integer" go-type="int64"/>
</typemap>)");

  auto overrides = type_map::load(reader);
  CHECK(overrides.size() == 2);

  auto map = type_map::defaults();
  map.merge(overrides);
  CHECK(map.size() == 5);
  CHECK(map.find("uuid")->go_type == "uuid.UUID");
  CHECK(map.find("uuid")->import_path == "github.com/google/uuid");
  CHECK(map.find("integer")->go_type == "int64");
  CHECK(map.find("real")->go_type == "float64");
}

TEST_CASE("type_map::load rejects unknown wire types", "[type_map]") {
  expat_reader reader(R"(<typemap xmlns="http://modelgen.dev/typemap">
  <mapping wire-type="blob" go-type="[]byte"/>
</typemap>)");
  CHECK_THROWS_AS(type_map::load(reader), std::runtime_error);
}

TEST_CASE("type_map::load rejects a mapping without go-type", "[type_map]") {
  expat_reader reader(R"(<typemap xmlns="http://modelgen.dev/typemap">
  <mapping wire-type="real"/>
</typemap>)");
  CHECK_THROWS_AS(type_map::load(reader), std::runtime_error);
}

TEST_CASE("type_map::load rejects the wrong namespace", "[type_map]") {
  expat_reader reader(R"(<typemap><mapping wire-type="real" go-type="float32"/></typemap>)");
  CHECK_THROWS_AS(type_map::load(reader), std::runtime_error);
}

TEST_CASE("type_map::merge rejects unknown wire types", "[type_map]") {
  type_map overrides;
  overrides.set("blob", {"[]byte", ""});
  auto map = type_map::defaults();
  CHECK_THROWS_AS(map.merge(overrides), std::runtime_error);
  CHECK_FALSE(map.contains("blob"));
}
