#include <modelgen/database_model.hpp>
#include <modelgen/dry_run_writer.hpp>
#include <modelgen/errors.hpp>
#include <modelgen/generator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace modelgen;

namespace {

  class recording_writer : public output_writer {
  public:
    std::vector<std::pair<std::filesystem::path, std::string>> files;

    void
    write(const std::filesystem::path& path, std::string_view content) override {
      files.emplace_back(path, std::string(content));
    }
  };

  database_schema
  switch_schema() {
    database_schema schema;
    schema.name = "Open_vSwitch";
    schema.version = "8.3.0";

    table_schema port;
    port.columns.emplace("name", atomic_column("string"));
    schema.tables.emplace("Port", std::move(port));

    table_schema bridge;
    bridge.columns.emplace("name", atomic_column("string"));
    bridge.columns.emplace("ports", set_column("uuid"));
    schema.tables.emplace("Bridge", std::move(bridge));
    return schema;
  }

  const std::string expected_model =
      "// Code generated by \"modelgen\"\n"
      "// DO NOT EDIT.\n"
      "\n"
      "package ovsmodel\n"
      "\n"
      "import (\n"
      "\t\"github.com/ovn-org/libovsdb/model\"\n"
      ")\n"
      "\n"
      "// FullDatabaseModel returns the DatabaseModel object to be used in libovsdb\n"
      "func FullDatabaseModel() (model.ClientDBModel, error) {\n"
      "\treturn model.NewClientDBModel(\"Open_vSwitch\", map[string]model.Model{\n"
      "\t\t\"Bridge\": &Bridge{},\n"
      "\t\t\"Port\":   &Port{},\n"
      "\t})\n"
      "}\n";

} // namespace

// ---------------------------------------------------------------------------
// model.go
// ---------------------------------------------------------------------------

TEST_CASE("the database model registers every table", "[database_model]") {
  auto model = build_database_template("ovsmodel", switch_schema());
  CHECK(model.context.find(context_key::database_name)->as_string() ==
        "Open_vSwitch");

  const auto& tables = model.context.find(context_key::tables)->as_list();
  REQUIRE(tables.size() == 2);
  CHECK(tables[0].as_map().find("TableName")->as_string() == "Bridge");
  CHECK(tables[1].as_map().find("StructName")->as_string() == "Port");

  std::ostringstream sink;
  dry_run_writer writer{sink};
  generator gen{writer};
  CHECK(gen.format(model.tmpl, model.context) == expected_model);
}

TEST_CASE("postModelDefinitions extends model.go", "[database_model]") {
  auto model = build_database_template("ovsmodel", switch_schema());
  model.tmpl.parse("{{ define \"postModelDefinitions\" }}\n"
                   "var schemaVersion = \"8.3.0\"\n"
                   "{{ end }}");
  CHECK(model.tmpl.is_sealed(main_section));
  CHECK_THROWS_AS(model.tmpl.parse("{{ define \"main\" }}package x{{ end }}"),
                  template_error);

  std::ostringstream sink;
  dry_run_writer writer{sink};
  generator gen{writer};
  CHECK(gen.format(model.tmpl, model.context) ==
        expected_model + "\nvar schemaVersion = \"8.3.0\"\n");
}

// ---------------------------------------------------------------------------
// packages
// ---------------------------------------------------------------------------

TEST_CASE("a package holds one file per table then model.go",
          "[database_model]") {
  recording_writer writer;
  generator gen{writer};
  auto files = render_package(switch_schema(), package_options{}, gen);

  REQUIRE(files.size() == 3);
  CHECK(files[0].filename == "bridge.go");
  CHECK(files[1].filename == "port.go");
  CHECK(files[2].filename == "model.go");
  CHECK(files[2].content == expected_model);
  CHECK(files[1].content ==
        "// Code generated by \"modelgen\"\n"
        "// DO NOT EDIT.\n"
        "\n"
        "package ovsmodel\n"
        "\n"
        "// Port defines an object in Port table\n"
        "type Port struct {\n"
        "\tUUID string `ovs:\"_uuid\"`\n"
        "\tName string `ovs:\"name\"`\n"
        "}\n");
  CHECK(writer.files.empty());
}

TEST_CASE("the customizer runs once per table", "[database_model]") {
  recording_writer writer;
  generator gen{writer};

  std::vector<std::string> seen;
  package_options options;
  options.package_name = "vswitch";
  options.customize = [&seen](std::string_view name, table_template& table) {
    seen.emplace_back(name);
    table.tmpl.define(hook::post_struct_definitions,
                      "\nfunc (t *{{ index . \"StructName\" }}) Table() string {\n"
                      "return {{ printf \"%q\" (index . \"TableName\") }}\n"
                      "}\n");
  };
  auto files = render_package(switch_schema(), options, gen);

  REQUIRE(seen.size() == 2);
  CHECK(seen[0] == "Bridge");
  CHECK(seen[1] == "Port");
  REQUIRE(files.size() == 3);
  CHECK(files[1].content ==
        "// Code generated by \"modelgen\"\n"
        "// DO NOT EDIT.\n"
        "\n"
        "package vswitch\n"
        "\n"
        "// Port defines an object in Port table\n"
        "type Port struct {\n"
        "\tUUID string `ovs:\"_uuid\"`\n"
        "\tName string `ovs:\"name\"`\n"
        "}\n"
        "\n"
        "func (t *Port) Table() string {\n"
        "\treturn \"Port\"\n"
        "}\n");
}

TEST_CASE("generate_package writes every rendered file", "[database_model]") {
  recording_writer writer;
  generator gen{writer};
  auto files = generate_package(switch_schema(), package_options{}, gen, "out");

  REQUIRE(writer.files.size() == 3);
  CHECK(writer.files[0].first == std::filesystem::path("out/bridge.go"));
  CHECK(writer.files[2].first == std::filesystem::path("out/model.go"));
  CHECK(writer.files[2].second == files[2].content);
}

TEST_CASE("a failing table writes nothing", "[database_model]") {
  recording_writer writer;
  generator gen{writer};

  auto schema = switch_schema();
  schema.tables.emplace("Zone", table_schema{});
  schema.tables.at("Zone").columns.emplace("kind", atomic_column("notAType"));
  CHECK_THROWS_AS(generate_package(schema, package_options{}, gen, "out"),
                  unrecognized_type_error);
  CHECK(writer.files.empty());

  package_options options;
  options.customize = [](std::string_view name, table_template& table) {
    if (name == "Port")
      table.tmpl.define(hook::pre_struct_definitions, "\nWRONG FORMAT\n");
  };
  CHECK_THROWS_AS(generate_package(switch_schema(), options, gen, "out"),
                  format_error);
  CHECK(writer.files.empty());
}

TEST_CASE("tables may not collide on structs or files", "[database_model]") {
  recording_writer writer;
  generator gen{writer};

  database_schema same_struct;
  same_struct.name = "db";
  same_struct.tables.emplace("foo_bar", table_schema{});
  same_struct.tables.emplace("foo-bar", table_schema{});
  CHECK_THROWS_AS(render_package(same_struct, package_options{}, gen),
                  generation_error);

  database_schema same_file;
  same_file.name = "db";
  same_file.tables.emplace("Ab", table_schema{});
  same_file.tables.emplace("aB", table_schema{});
  CHECK_THROWS_AS(render_package(same_file, package_options{}, gen),
                  generation_error);

  database_schema reserved;
  reserved.name = "db";
  reserved.tables.emplace("Model", table_schema{});
  CHECK_THROWS_AS(render_package(reserved, package_options{}, gen),
                  generation_error);
}
