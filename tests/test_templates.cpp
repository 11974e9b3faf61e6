// tests/test_templates.cpp
#include <catch2/catch_test_macros.hpp>
#include "pipeflow/dsl/templates.h"
#include "test_fakes.h"

using pipeflow::TemplateResolver;
using pipeflow::Value;
using pipeflow::testing::make_node;

TEST_CASE("Whole-string expression resolves a nested input path", "[templates]") {
    auto node = make_node("n1", "code_execution_node");
    Value input = {{"file", {{"name", "x.pdb"}}}};

    REQUIRE(TemplateResolver::resolve("{{input.file.name}}", node, input) == "x.pdb");
}

TEST_CASE("Missing paths resolve to empty without throwing", "[templates]") {
    auto node = make_node("n1", "code_execution_node");

    Value whole;
    REQUIRE_NOTHROW(whole = TemplateResolver::resolve("{{input.missing}}", node, Value::object()));
    REQUIRE(whole == "");

    REQUIRE(TemplateResolver::resolve("a{{input.missing.deeper}}b", node, Value::object()) == "ab");
    REQUIRE(TemplateResolver::resolve("{{config.nope[3]}}", node, Value::object()) == "");
}

TEST_CASE("Oversized array indices are misses", "[templates]") {
    auto node = make_node("n1", "code_execution_node");
    Value input = {{"a", Value::array({1, 2})}};

    Value whole;
    REQUIRE_NOTHROW(whole = TemplateResolver::resolve("{{input.a[99999999999999999999999]}}", node, input));
    REQUIRE(whole == "");
    REQUIRE(TemplateResolver::resolve("n={{input.a[99999999999999999999999]}}", node, input) == "n=");
    REQUIRE(TemplateResolver::resolve("{{input.a[1]}}", node, input) == 2);
}

TEST_CASE("Whole-string expressions keep the JSON type", "[templates]") {
    auto node = make_node("n1", "code_execution_node", {{"count", 3}, {"flags", {true, false}}});

    REQUIRE(TemplateResolver::resolve("{{config.count}}", node, nullptr) == 3);
    REQUIRE(TemplateResolver::resolve("{{ config.flags }}", node, nullptr) == Value({true, false}));
    REQUIRE(TemplateResolver::resolve("{{config.flags[1]}}", node, nullptr) == false);
}

TEST_CASE("Embedded expressions are stringified", "[templates]") {
    auto node = make_node("n7", "http_request_node", {{"n", 2}, {"obj", {{"a", 1}}}});
    node.label = "Fetch";

    REQUIRE(TemplateResolver::resolve("id={{node.id}} n={{config.n}}", node, nullptr) == "id=n7 n=2");
    REQUIRE(TemplateResolver::resolve("{{node.label}}:{{config.obj}}", node, nullptr) == "Fetch:{\"a\":1}");
    REQUIRE(TemplateResolver::resolve("status {{node.status}}", node, nullptr) == "status idle");
}

TEST_CASE("Objects and arrays are walked recursively", "[templates]") {
    auto node = make_node("n1", "rfdiffusion_node", {{"contigs", "A1-50"}});
    Value input = {{"target", {{"file_id", "f-1"}}}};
    Value tmpl = {
        {"jobId", "{{node.id}}"},
        {"parameters", {{"contigs", "{{config.contigs}}"}, {"ids", {"{{input.target.file_id}}", 7}}}},
        {"untouched", 1.5}
    };

    Value resolved = TemplateResolver::resolve(tmpl, node, input);
    REQUIRE(resolved["jobId"] == "n1");
    REQUIRE(resolved["parameters"]["contigs"] == "A1-50");
    REQUIRE(resolved["parameters"]["ids"] == Value({"f-1", 7}));
    REQUIRE(resolved["untouched"] == 1.5);
}

TEST_CASE("Malformed and unterminated expressions stay literal", "[templates]") {
    auto node = make_node("n1", "code_execution_node", {{"a", "x"}});

    REQUIRE(TemplateResolver::resolve("{{config..a}}", node, nullptr) == "{{config..a}}");
    REQUIRE(TemplateResolver::resolve("{{config.a[x]}}", node, nullptr) == "{{config.a[x]}}");
    REQUIRE(TemplateResolver::resolve("keep {{config.a", node, nullptr) == "keep {{config.a");
    REQUIRE(TemplateResolver::resolve("function() { return {a: 1}; }", node, nullptr) ==
            "function() { return {a: 1}; }");
}

TEST_CASE("Parser splits literal and expression segments", "[templates]") {
    auto segments = TemplateResolver::parse("a {{ input.list[2].name }} b");
    REQUIRE(segments.size() == 3);
    REQUIRE_FALSE(segments[0].is_expression);
    REQUIRE(segments[1].is_expression);
    REQUIRE(segments[1].path.size() == 4);
    REQUIRE(std::get<size_t>(segments[1].path[2].key) == 2);
    REQUIRE(segments[2].text == " b");

    REQUIRE(TemplateResolver::contains_expression("x {{node.id}}"));
    REQUIRE_FALSE(TemplateResolver::contains_expression("{{ not valid! }}"));
}

TEST_CASE("Reserved flag keys are recognised and stripped", "[templates]") {
    REQUIRE(pipeflow::is_reserved_flag("__send_body__"));
    REQUIRE(pipeflow::is_reserved_flag("__auth_type__"));
    REQUIRE_FALSE(pipeflow::is_reserved_flag("____"));
    REQUIRE_FALSE(pipeflow::is_reserved_flag("_private"));

    Value payload = {{"__send_body__", true}, {"name", "x"}, {"__body_json__", "{}"}};
    REQUIRE(pipeflow::strip_reserved_flags(payload) == Value({{"name", "x"}}));
}
