#include <modelgen/errors.hpp>
#include <modelgen/text_template.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cctype>
#include <sstream>
#include <string>

using namespace modelgen;

namespace {

  std::string
  render(std::string_view text, const value& data = {}) {
    text_template t("main");
    t.parse(text);
    return t.render(data);
  }

} // namespace

// ---------------------------------------------------------------------------
// actions and data access
// ---------------------------------------------------------------------------

TEST_CASE("fields and index read the data context", "[text_template]") {
  value data = value_map{{"Name", "x"}, {"Inner", value_map{{"N", 3}}}};
  CHECK(render("{{ .Name }}-{{ .Inner.N }}", data) == "x-3");
  CHECK(render(R"({{ index . "Name" }})", data) == "x");
  CHECK(render(R"({{ index . "Inner" "N" }})", data) == "3");
}

TEST_CASE("missing map keys are errors", "[text_template]") {
  value data = value_map{{"Name", "x"}};
  CHECK_THROWS_AS(render("{{ .Nope }}", data), render_error);
  CHECK_THROWS_AS(render(R"({{ index . "Nope" }})", data), render_error);
}

TEST_CASE("nil prints as <no value>", "[text_template]") {
  CHECK(render("{{ nil }}|{{ . }}") == "<no value>|<no value>");
}

TEST_CASE("literals", "[text_template]") {
  CHECK(render(R"({{ "a\tb" }}|{{ `raw\n` }}|{{ 42 }}|{{ 1.5 }}|{{ true }})") ==
        "a\tb|raw\\n|42|1.5|true");
}

// ---------------------------------------------------------------------------
// control structures
// ---------------------------------------------------------------------------

TEST_CASE("if, else if and else", "[text_template]") {
  const char* text = "{{ if eq . 1 }}one{{ else if eq . 2 }}two{{ else }}many{{ end }}";
  CHECK(render(text, 1) == "one");
  CHECK(render(text, 2) == "two");
  CHECK(render(text, 3) == "many");
}

TEST_CASE("with rebinds dot and falls back to else", "[text_template]") {
  const char* text = R"({{ with index . "A" }}[{{ . }}]{{ else }}none{{ end }})";
  CHECK(render(text, value_map{{"A", "x"}}) == "[x]");
  CHECK(render(text, value_map{{"A", ""}}) == "none");
}

TEST_CASE("range over lists with index and element", "[text_template]") {
  value data = value_list{"a", "b", "c"};
  CHECK(render("{{ range . }}{{ . }}{{ end }}", data) == "abc");
  CHECK(render("{{ range $i, $e := . }}{{ $i }}={{ $e }} {{ end }}", data) ==
        "0=a 1=b 2=c ");
}

TEST_CASE("range over a map visits keys in sorted order", "[text_template]") {
  value data = value_map{{"b", 2}, {"a", 1}, {"c", 3}};
  CHECK(render("{{ range $k, $v := . }}{{ $k }}{{ $v }}{{ end }}", data) ==
        "a1b2c3");
}

TEST_CASE("range else runs for empty collections", "[text_template]") {
  const char* text = "{{ range . }}x{{ else }}empty{{ end }}";
  CHECK(render(text, value_list{}) == "empty");
  CHECK(render(text) == "empty");
}

TEST_CASE("range over an integer", "[text_template]") {
  CHECK(render("{{ range 3 }}{{ . }}{{ end }}") == "012");
}

TEST_CASE("break and continue", "[text_template]") {
  value data = value_list{1, 2, 3, 4};
  CHECK(render("{{ range . }}{{ if eq . 3 }}{{ break }}{{ end }}{{ . }}{{ end }}",
               data) == "12");
  CHECK(render("{{ range . }}{{ if eq . 2 }}{{ continue }}{{ end }}{{ . }}{{ end }}",
               data) == "134");
}

TEST_CASE("variables can be declared and reassigned", "[text_template]") {
  CHECK(render("{{ $x := 1 }}{{ $x = 2 }}{{ $x }}") == "2");
  CHECK(render("{{ $x := 1 }}{{ range 3 }}{{ $x = . }}{{ end }}{{ $x }}") ==
        "2");
  CHECK(render("{{ range $i, $e := . }}{{ $.Sep }}{{ end }}",
               value_map{{"Sep", "-"}}) == "-");
}

TEST_CASE("pipelines pass the value as the last argument", "[text_template]") {
  CHECK(render(R"({{ "x" | printf "%s-%s" "a" }})") == "a-x");
  CHECK(render("{{ (len .) | printf \"%d\" }}", value_list{1, 2}) == "2");
}

// ---------------------------------------------------------------------------
// functions
// ---------------------------------------------------------------------------

TEST_CASE("and and or short-circuit", "[text_template]") {
  CHECK(render(R"({{ and 1 0 (index . "missing") }})", value_map{}) == "0");
  CHECK(render(R"({{ or 0 "x" (index . "missing") }})", value_map{}) == "x");
  CHECK(render("{{ not 0 }}") == "true");
}

TEST_CASE("comparisons", "[text_template]") {
  CHECK(render("{{ lt 1 2 }} {{ le 2 2 }} {{ gt 1 2 }} {{ ge 1.5 1 }}") ==
        "true true false true");
  CHECK(render(R"({{ eq "a" "b" "a" }} {{ ne "a" "a" }})") == "true false");
  CHECK_THROWS_AS(render(R"({{ eq 1 "a" }})"), render_error);
}

TEST_CASE("len", "[text_template]") {
  CHECK(render(R"({{ len "abc" }})") == "3");
  CHECK(render("{{ len . }}", value_map{{"a", 1}}) == "1");
  CHECK_THROWS_AS(render("{{ len 3 }}"), render_error);
}

TEST_CASE("printf verbs", "[text_template]") {
  CHECK(render(R"({{ printf "%-5s|%5s|%03d|%.2f|%q|%t|%x|%%" "ab" "cd" 7 3.14159 "x" true 255 }})") ==
        "ab   |   cd|007|3.14|\"x\"|true|ff|%");
  CHECK(render(R"({{ printf "%v %v" 1 }})") == "1 %!v(MISSING)");
  CHECK(render(R"({{ printf "%d" "x" }})") == "%!d(string=x)");
  CHECK(render(R"({{ printf "a" 1 }})") == "a%!(EXTRA int=1)");
}

TEST_CASE("printf %f is not truncated for wide output", "[text_template]") {
  auto out = render(R"({{ printf "%.300f" 1e300 }})");
  REQUIRE(out.size() == 602);
  CHECK(out.front() == '1');
  CHECK(out[301] == '.');
  CHECK(out.substr(302) == std::string(300, '0'));
}

TEST_CASE("print and println", "[text_template]") {
  CHECK(render(R"({{ print 1 2 "a" 3 }})") == "1 2a3");
  CHECK(render(R"({{ println 1 "a" }})") == "1 a\n");
}

TEST_CASE("custom functions", "[text_template]") {
  text_template t("main");
  t.add_function("upper", [](std::span<const value> args) -> value {
    std::string s = args[0].as_string();
    for (auto& c : s)
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
  });
  t.parse(R"({{ upper "go" }})");
  CHECK(t.render(value()) == "GO");
}

TEST_CASE("function errors name the section and line", "[text_template]") {
  text_template t("main");
  t.parse("\n{{ index . 5 }}");
  try {
    t.render(value_list{});
    FAIL("expected render_error");
  } catch (const render_error& e) {
    CHECK(std::string(e.what()).find("template: main:2:") == 0);
  }
}

// ---------------------------------------------------------------------------
// sections
// ---------------------------------------------------------------------------

TEST_CASE("template calls a named section", "[text_template]") {
  text_template t("main");
  t.parse(R"({{ define "item" }}<{{ . }}>{{ end }}{{ range . }}{{ template "item" . }}{{ end }})");
  CHECK(t.has_section("item"));
  CHECK(t.render(value_list{1, 2}) == "<1><2>");
  CHECK(t.render("item", 9) == "<9>");
}

TEST_CASE("block provides an overridable default", "[text_template]") {
  text_template t("main");
  t.parse(R"(a{{ block "b" . }}default{{ end }}c)");
  CHECK(t.render(value()) == "adefaultc");
  t.parse(R"({{ define "b" }}custom{{ end }})");
  CHECK(t.render(value()) == "acustomc");
}

TEST_CASE("an empty define does not replace a non-empty section",
          "[text_template]") {
  text_template t("main");
  t.parse(R"({{ define "x" }}kept{{ end }})");
  t.parse(R"({{ define "x" }}{{ end }})");
  CHECK(t.render("x", value()) == "kept");
  t.define("x", "");
  CHECK(t.render("x", value()) == "");
}

TEST_CASE("define replaces a section", "[text_template]") {
  text_template t("main");
  t.parse(R"(<{{ template "x" . }}>{{ define "x" }}a{{ end }})");
  t.define("x", "{{ . }}");
  CHECK(t.render(5) == "<5>");
}

TEST_CASE("sealed sections cannot be redefined", "[text_template]") {
  text_template t("main");
  t.parse(R"({{ define "fixed" }}f{{ end }}{{ template "fixed" }})");
  t.seal("fixed");
  t.seal("main");
  CHECK(t.is_sealed("fixed"));

  CHECK_THROWS_AS(t.parse(R"({{ define "fixed" }}g{{ end }})"), template_error);
  CHECK_THROWS_AS(t.define("fixed", "g"), template_error);
  CHECK_THROWS_AS(t.parse("top-level text"), template_error);
  CHECK(t.render(value()) == "f");
}

TEST_CASE("a failed parse installs nothing", "[text_template]") {
  text_template t("main");
  t.parse(R"({{ define "a" }}1{{ end }})");
  t.seal("main");
  CHECK_THROWS_AS(t.parse(R"({{ define "a" }}2{{ end }}text)"), template_error);
  CHECK(t.render("a", value()) == "1");
  CHECK_THROWS_AS(t.parse(R"({{ define "a" }}2{{ end }}{{ if }})"),
                  template_error);
  CHECK(t.render("a", value()) == "1");
}

TEST_CASE("unknown sections and runaway recursion are render errors",
          "[text_template]") {
  text_template t("main");
  t.parse(R"({{ define "loop" }}{{ template "loop" . }}{{ end }})");
  CHECK_THROWS_AS(t.render("nope", value()), render_error);
  CHECK_THROWS_AS(t.render("loop", value()), render_error);
}

TEST_CASE("copies are independent", "[text_template]") {
  text_template a("main");
  a.parse(R"({{ define "x" }}a{{ end }}{{ template "x" }})");
  text_template b = a;
  b.define("x", "b");
  CHECK(a.render(value()) == "a");
  CHECK(b.render(value()) == "b");
}

TEST_CASE("execute writes to a stream", "[text_template]") {
  text_template t("main");
  t.parse("{{ . }}!");
  std::ostringstream os;
  t.execute(os, value("hi"));
  CHECK(os.str() == "hi!");
}
