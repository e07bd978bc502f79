#include <catch2/catch.hpp>
#include <plume/template/resolver.hpp>

using namespace plume;

static Path path(const std::string& text) {
    auto p = Path::parse(text);
    REQUIRE(p.is_ok());
    return std::move(p).value();
}

static TemplateContext paper_context() {
    return TemplateContext(Value::table({
        {"paper", Value::table({
            {"title", Value::string("Test Paper One")},
            {"pages", Value::integer(12)},
            {"authors", Value::list({
                Value::table({{"name", Value::string("Alice")}}),
                Value::table({{"name", Value::string("Bob")}}),
            })},
        })},
        {"name", Value::string("root name")},
    }));
}

// ===== Context lookup =====

TEST_CASE("resolve top-level and nested keys", "[resolver]") {
    auto ctx = paper_context();
    auto title = resolve(path("paper.title"), ctx);
    REQUIRE(title.is_ok());
    REQUIRE(title.value()->as_string() == "Test Paper One");

    auto paper = resolve(path("paper"), ctx);
    REQUIRE(paper.is_ok());
    REQUIRE(paper.value()->is_table());
}

TEST_CASE("resolved values are borrowed from the context", "[resolver]") {
    auto ctx = paper_context();
    auto a = resolve(path("paper.authors"), ctx);
    auto b = resolve(path("paper.authors"), ctx);
    REQUIRE(a.is_ok());
    REQUIRE(a.value() == b.value());
}

TEST_CASE("missing keys report the full path", "[resolver][error]") {
    auto ctx = paper_context();
    for (const char* p : {"missing", "paper.missing", "paper.title.length",
                          "paper.authors.name"}) {
        INFO(p);
        auto r = resolve(path(p), ctx);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PlumeError::UnknownKey);
        REQUIRE(r.error().path == p);
    }
}

TEST_CASE("non-table root resolves nothing", "[resolver]") {
    TemplateContext ctx(Value::string("just text"));
    auto r = resolve(path("x"), ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PlumeError::UnknownKey);
}

TEST_CASE("empty path is rejected", "[resolver][error]") {
    auto ctx = paper_context();
    auto r = resolve(Path{}, ctx);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PlumeError::InvalidSyntax);
}

// ===== Scope =====

TEST_CASE("scope bindings are searched innermost first", "[resolver][scope]") {
    auto outer = Value::string("outer");
    auto inner = Value::string("inner");
    Scope scope;
    REQUIRE(scope.empty());
    scope.push("x", &outer);
    scope.push("y", &inner);
    REQUIRE(scope.depth() == 2);
    REQUIRE(scope.find("x") == &outer);
    REQUIRE(scope.find("y") == &inner);
    REQUIRE(scope.find("z") == nullptr);

    scope.push("x", &inner);
    REQUIRE(scope.find("x") == &inner);
    scope.pop();
    REQUIRE(scope.find("x") == &outer);
}

TEST_CASE("rebind moves the innermost binding", "[resolver][scope]") {
    auto first = Value::integer(1);
    auto second = Value::integer(2);
    Scope scope;
    scope.push("n", &first);
    scope.rebind(&second);
    REQUIRE(scope.find("n") == &second);
    REQUIRE(scope.depth() == 1);
}

TEST_CASE("pop and rebind on an empty scope are no-ops", "[resolver][scope]") {
    Scope scope;
    scope.pop();
    scope.rebind(nullptr);
    REQUIRE(scope.empty());
}

TEST_CASE("loop bindings shadow context keys", "[resolver][scope]") {
    auto ctx = paper_context();
    const auto& authors = ctx.root().find("paper")->find("authors")->as_list();
    Scope scope;
    scope.push("name", &authors[0]);

    auto shadowed = resolve(path("name.name"), ctx, scope);
    REQUIRE(shadowed.is_ok());
    REQUIRE(shadowed.value()->as_string() == "Alice");

    // Unbound heads still fall through to the root
    auto title = resolve(path("paper.title"), ctx, scope);
    REQUIRE(title.is_ok());
    REQUIRE(title.value()->as_string() == "Test Paper One");

    scope.pop();
    auto root = resolve(path("name"), ctx, scope);
    REQUIRE(root.value()->as_string() == "root name");
}

TEST_CASE("a shadowing binding hides the whole root subtree", "[resolver][scope]") {
    auto ctx = paper_context();
    auto other = Value::table({{"id", Value::string("p2")}});
    Scope scope;
    scope.push("paper", &other);
    auto r = resolve(path("paper.title"), ctx, scope);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PlumeError::UnknownKey);
    REQUIRE(r.error().path == "paper.title");
}

// ===== Scalars =====

TEST_CASE("resolve_scalar stringifies", "[resolver]") {
    auto ctx = paper_context();
    auto pages = resolve_scalar(path("paper.pages"), ctx);
    REQUIRE(pages.is_ok());
    REQUIRE(pages.value() == "12");
}

TEST_CASE("resolve_scalar rejects composites", "[resolver][error]") {
    auto ctx = paper_context();
    auto list = resolve_scalar(path("paper.authors"), ctx);
    REQUIRE(list.is_err());
    REQUIRE(list.error().code == PlumeError::TypeMismatch);
    REQUIRE(list.error().path == "paper.authors");
    REQUIRE(list.error().actual == "List");

    auto table = resolve_scalar(path("paper"), ctx);
    REQUIRE(table.is_err());
    REQUIRE(table.error().actual == "Table");
}
