#include <catch2/catch.hpp>
#include <fillin/template.hpp>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <string>

using namespace fillin;

static std::string fixture_dir() {
    const char* src = std::getenv("FILLIN_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

static std::shared_ptr<Engine> fixture_engine() {
    auto engine = std::make_shared<Engine>();
    engine->set_template_path({fixture_dir() + "/templates"});
    engine->variables().set("name", "Sam");
    engine->variables().set("special", "soup");
    engine->functions().set("price", [](const std::vector<std::string>& args) {
        return Result<std::string>::ok("$" + args.at(0) + "." + args.at(1));
    });
    return engine;
}

// ===== Text =====

TEST_CASE("template starts empty", "[template]") {
    Template t;
    REQUIRE(t.text().empty());
    auto r = t.interpret();
    REQUIRE(r.is_ok());
    REQUIRE(r.value().empty());
}

TEST_CASE("set_text replaces text", "[template]") {
    Template t("first");
    t.set_text("second");
    REQUIRE(t.text() == "second");
}

TEST_CASE("interpret does not modify template text", "[template]") {
    auto engine = fixture_engine();
    Template t("hey, [[$name]]!", engine);
    REQUIRE(t.interpret().value() == "hey, Sam!");
    REQUIRE(t.text() == "hey, [[$name]]!");
    REQUIRE(t.interpret().value() == "hey, Sam!");
}

TEST_CASE("interpret_to streams the same text", "[template]") {
    auto engine = fixture_engine();
    Template t("hey, [[$name]]!", engine);
    std::ostringstream out;
    REQUIRE(t.interpret_to(out).is_ok());
    REQUIRE(out.str() == t.interpret().value());
}

TEST_CASE("templates default to the shared engine", "[template]") {
    Engine::shared()->variables().set("shared_greeting", "hi there");
    Template t("[[$shared_greeting]]");
    REQUIRE(&t.engine() == Engine::shared().get());
    REQUIRE(t.interpret().value() == "hi there");
    Engine::shared()->variables().erase("shared_greeting");
}

TEST_CASE("null engine falls back to the shared one", "[template]") {
    Template t("x", nullptr);
    REQUIRE(&t.engine() == Engine::shared().get());
}

TEST_CASE("templates with separate engines are isolated", "[template]") {
    auto a = std::make_shared<Engine>();
    auto b = std::make_shared<Engine>();
    REQUIRE(b->set_delimiters(Delimiters{"{", "}"}).is_ok());
    a->variables().set("v", "from a");
    b->variables().set("v", "from b");

    Template ta("[[$v]] {$v}", a);
    Template tb("[[$v]] {$v}", b);
    REQUIRE(ta.interpret().value() == "from a {$v}");
    REQUIRE(tb.interpret().value() == "[[$v]] from b");
}

// ===== Files =====

TEST_CASE("load_file reads from search path and interprets", "[template]") {
    Template t(std::string(), fixture_engine());
    REQUIRE(t.load_file("greeting.tmpl").is_ok());
    auto r = t.interpret();
    REQUIRE(r.is_ok());
    REQUIRE(r.value() ==
        "Hello, Sam!\n"
        "Today's special is soup at $4.99.\n"
        "Use [[ and ]] to write delimiters.\n");
}

TEST_CASE("load_file null empties the text", "[template]") {
    Template t("old text", fixture_engine());
    REQUIRE(t.load_file("null").is_ok());
    REQUIRE(t.text().empty());
}

TEST_CASE("load_file of missing file keeps text", "[template]") {
    Template t("old text", fixture_engine());
    auto st = t.load_file("does_not_exist.tmpl");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == FillinError::NotFound);
    REQUIRE(t.text() == "old text");
}

// ===== Properties =====

TEST_CASE("properties store arbitrary values", "[template]") {
    Template t;
    t.set_property("title", std::string("Home"));
    t.set_property("count", 3);

    REQUIRE(t.has_property("title"));
    REQUIRE_FALSE(t.has_property("missing"));
    REQUIRE(t.property("missing") == nullptr);

    const std::string* title = t.property_as<std::string>("title");
    REQUIRE(title != nullptr);
    REQUIRE(*title == "Home");
    REQUIRE(*t.property_as<int>("count") == 3);
    REQUIRE(t.property_as<double>("count") == nullptr);
}

TEST_CASE("properties overwrite and do not affect interpretation", "[template]") {
    Template t("[[$nothing_here]]", std::make_shared<Engine>());
    t.set_property("nothing_here", std::string("ignored"));
    t.set_property("nothing_here", 7);
    REQUIRE(*t.property_as<int>("nothing_here") == 7);
    REQUIRE(t.interpret().value().empty());
}
