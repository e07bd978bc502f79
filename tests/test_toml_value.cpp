#include <catch2/catch.hpp>
#include <plume/toml_value.hpp>
#include <plume/template/context.hpp>
#include <cstdlib>

using namespace plume;

static std::string fixture_dir() {
    const char* src = std::getenv("PLUME_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== value_from_toml =====

TEST_CASE("TOML scalars map to value kinds", "[toml]") {
    auto doc = toml::parse(R"(
s = "text"
i = -7
f = 2.5
b = true
d = 2026-01-15
)");
    auto v = value_from_toml(doc);
    REQUIRE(v.is_table());
    REQUIRE(v.find("s")->as_string() == "text");
    REQUIRE(v.find("i")->as_integer() == -7);
    REQUIRE(v.find("f")->as_float() == 2.5);
    REQUIRE(v.find("b")->as_boolean() == true);
    REQUIRE(v.find("d")->is_date());
    REQUIRE(v.find("d")->as_date() == Date{2026, 1, 15});
}

TEST_CASE("TOML times become strings", "[toml]") {
    auto doc = toml::parse(R"(
t = 07:32:00
dt = 1979-05-27T07:32:00Z
)");
    auto v = value_from_toml(doc);
    REQUIRE(v.find("t")->is_string());
    REQUIRE(v.find("t")->as_string().rfind("07:32:00", 0) == 0);
    REQUIRE(v.find("dt")->is_string());
    REQUIRE(v.find("dt")->as_string().find("1979-05-27") == 0);
}

TEST_CASE("TOML arrays and tables nest", "[toml]") {
    auto doc = toml::parse(R"(
[[papers]]
title = "One"
tags = ["a", "b"]

[[papers]]
title = "Two"
tags = []
)");
    auto v = value_from_toml(doc);
    const auto& papers = v.find("papers")->as_list();
    REQUIRE(papers.size() == 2);
    REQUIRE(papers[0].find("title")->as_string() == "One");
    REQUIRE(papers[0].find("tags")->as_list().size() == 2);
    REQUIRE(papers[0].find("tags")->as_list()[1].as_string() == "b");
    REQUIRE(papers[1].find("tags")->as_list().empty());
}

// ===== TemplateContext =====

TEST_CASE("parse_toml builds a table context", "[toml][context]") {
    auto ctx = TemplateContext::parse_toml("name = \"World\"");
    REQUIRE(ctx.is_ok());
    REQUIRE(ctx.value().root().find("name")->as_string() == "World");
}

TEST_CASE("parse_toml reports syntax errors with position", "[toml][context]") {
    auto ctx = TemplateContext::parse_toml("a = 1\nb = = 2\n", "broken.toml");
    REQUIRE(ctx.is_err());
    REQUIRE(ctx.error().code == PlumeError::Parse);
    REQUIRE(ctx.error().file == "broken.toml");
    REQUIRE(ctx.error().line == 2);
}

TEST_CASE("load_toml reads a data file", "[toml][context]") {
    auto ctx = TemplateContext::load_toml(fixture_dir() + "/paper.toml");
    REQUIRE(ctx.is_ok());
    const auto& paper = *ctx.value().root().find("paper");
    REQUIRE(paper.find("title")->as_string() == "Test Paper One");
    REQUIRE(paper.find("authors")->as_list().size() == 2);
    REQUIRE(paper.find("date")->as_date().to_string() == "2026-01-15");
}

TEST_CASE("load_toml on a missing file is an IO error", "[toml][context]") {
    auto ctx = TemplateContext::load_toml(fixture_dir() + "/does-not-exist.toml");
    REQUIRE(ctx.is_err());
    REQUIRE(ctx.error().code == PlumeError::IO);
}
