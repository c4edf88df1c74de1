#include "easymcp/util/json_schema.hpp"

#include <cassert>
#include <iostream>

using namespace easymcp;

// ============================================================================
// JSON Schema Validation Tests
// ============================================================================

static std::string failing_path(const Json& schema, const Json& instance)
{
    try
    {
        util::schema::validate(schema, instance);
    }
    catch (const ValidationError& e)
    {
        return e.path();
    }
    return "";
}

void test_basic_object_validation()
{
    std::cout << "test_basic_object_validation...\n";
    Json schema = {{"type", "object"},
                   {"required", Json::array({"a", "b"})},
                   {"properties", {{"a", Json{{"type", "integer"}}}, {"b", Json{{"type", "integer"}}}}}};
    util::schema::validate(schema, Json{{"a", 2}, {"b", 3}});
    std::cout << "  [PASS]\n";
}

void test_missing_required()
{
    std::cout << "test_missing_required...\n";
    Json schema = {{"type", "object"},
                   {"required", Json::array({"name"})},
                   {"properties", {{"name", Json{{"type", "string"}}}}}};
    bool failed = false;
    try
    {
        util::schema::validate(schema, Json{{"other", 1}});
    }
    catch (const ValidationError& e)
    {
        failed = true;
        assert(e.path() == "$.name");
        assert(std::string(e.kind()) == "SchemaValidationFailed");
    }
    assert(failed);
    std::cout << "  [PASS]\n";
}

void test_invalid_type()
{
    std::cout << "test_invalid_type...\n";
    Json schema = {{"type", "object"}, {"properties", {{"a", Json{{"type", "integer"}}}}}};
    assert(failing_path(schema, Json{{"a", "x"}}) == "$.a");
    assert(failing_path(schema, Json::array()) == "$");
    // number accepts integers, integer rejects floats
    util::schema::validate(Json{{"type", "number"}}, Json(3));
    assert(failing_path(Json{{"type", "integer"}}, Json(3.5)) == "$");
    std::cout << "  [PASS]\n";
}

void test_nested_paths()
{
    std::cout << "test_nested_paths...\n";
    Json schema = {
        {"type", "object"},
        {"properties",
         {{"user",
           {{"type", "object"},
            {"required", Json::array({"name"})},
            {"properties", {{"name", Json{{"type", "string"}}}}}}},
          {"items", {{"type", "array"}, {"items", Json{{"type", "integer"}}}}}}}};

    util::schema::validate(schema, Json{{"user", {{"name", "a"}}}, {"items", {1, 2, 3}}});
    assert(failing_path(schema, Json{{"user", {{"name", 5}}}}) == "$.user.name");
    assert(failing_path(schema, Json{{"user", Json::object()}}) == "$.user.name");
    assert(failing_path(schema, Json{{"items", {1, 2, "three"}}}) == "$.items[2]");
    std::cout << "  [PASS]\n";
}

void test_absent_schema_passes()
{
    std::cout << "test_absent_schema_passes...\n";
    util::schema::validate(Json(), Json{{"anything", true}});
    util::schema::validate(Json::object(), Json("text"));
    assert(util::schema::is_unconstrained(Json()));
    assert(util::schema::is_unconstrained(Json::object()));
    assert(!util::schema::is_unconstrained(Json{{"type", "string"}}));
    std::cout << "  [PASS]\n";
}

void test_malformed_schema_nodes()
{
    std::cout << "test_malformed_schema_nodes...\n";
    Json bad_node = {{"type", "object"}, {"properties", {{"a", "not a schema"}}}};
    assert(failing_path(bad_node, Json{{"a", 1}}) == "$.a");

    Json bad_type = {{"type", Json::array({"string", "null"})}};
    assert(failing_path(bad_type, Json("x")) == "$");

    Json unknown_type = {{"type", "date"}};
    assert(failing_path(unknown_type, Json("2024-01-01")) == "$");
    std::cout << "  [PASS]\n";
}

void test_description_is_ignored()
{
    std::cout << "test_description_is_ignored...\n";
    Json schema = {{"type", "string"}, {"description", "free text"}};
    util::schema::validate(schema, Json("ok"));
    std::cout << "  [PASS]\n";
}

int main()
{
    std::cout << "JSON schema tests\n";
    test_basic_object_validation();
    test_missing_required();
    test_invalid_type();
    test_nested_paths();
    test_absent_schema_passes();
    test_malformed_schema_nodes();
    test_description_is_ignored();
    std::cout << "All JSON schema tests passed\n";
    return 0;
}
