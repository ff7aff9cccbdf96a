#include "apischema/validation/validator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace apischema;
using validation::ValidationError;
using validation::Validator;

namespace
{

std::vector<ValidationError> request_errors(const Json& schema, const Json& instance)
{
    auto validator = Validator::request(schema);
    return validator.iter_errors(instance).collect();
}

std::vector<ValidationError> response_errors(const Json& schema, const Json& instance)
{
    auto validator = Validator::response(schema);
    return validator.iter_errors(instance).collect();
}

} // namespace

void test_nullable_type()
{
    std::cout << "test_nullable_type...\n";
    Json schema = {{"type", "string"}, {"nullable", true}};
    assert(request_errors(schema, nullptr).empty());
    assert(response_errors(schema, nullptr).empty());
    assert(request_errors(schema, "x").empty());

    auto errors = request_errors(schema, 42);
    assert(errors.size() == 1);
    assert(errors[0].validator == "type");
    assert(response_errors(schema, 42).size() == 1);

    // The vendor spelling counts too; anything but boolean true does not.
    assert(request_errors(Json{{"type", "string"}, {"x-nullable", true}}, nullptr).empty());
    assert(request_errors(Json{{"type", "string"}, {"nullable", false}}, nullptr).size() == 1);
    assert(request_errors(Json{{"type", "string"}, {"nullable", "yes"}}, nullptr).size() == 1);
    assert(request_errors(Json{{"type", "string"}}, nullptr).size() == 1);
    std::cout << "  [PASS]\n";
}

void test_nullable_enum_and_one_of()
{
    std::cout << "test_nullable_enum_and_one_of...\n";
    Json enumerated = {{"enum", Json::array({"a", "b"})}, {"nullable", true}};
    assert(request_errors(enumerated, nullptr).empty());
    assert(response_errors(enumerated, nullptr).empty());
    assert(request_errors(enumerated, "c").size() == 1);

    Json choice = {{"oneOf", Json::array({Json{{"type", "string"}}, Json{{"type", "integer"}}})},
                   {"nullable", true}};
    assert(request_errors(choice, nullptr).empty());
    assert(response_errors(choice, nullptr).empty());
    assert(request_errors(Json{{"oneOf", choice["oneOf"]}}, nullptr).size() == 1);
    std::cout << "  [PASS]\n";
}

void test_one_of_exactly_one()
{
    std::cout << "test_one_of_exactly_one...\n";
    Json schema = {{"oneOf", Json::array({Json{{"type", "string"}}, Json{{"type", "number"}}})}};
    assert(request_errors(schema, "x").empty());
    assert(request_errors(schema, 5).empty());

    auto errors = request_errors(schema, true);
    assert(errors.size() == 1);
    assert(errors[0].validator == "oneOf");
    assert(errors[0].message == "true is not valid under any of the given schemas");
    assert(errors[0].context.size() == 2);

    Json ambiguous = {{"oneOf", Json::array({Json{{"type", "string"}}, Json::object()})}};
    errors = request_errors(ambiguous, "x");
    assert(errors.size() == 1);
    assert(errors[0].message.find("is valid under each of") != std::string::npos);
    assert(response_errors(ambiguous, "x").size() == 1);
    std::cout << "  [PASS]\n";
}

void test_all_of_merges_subschemas()
{
    std::cout << "test_all_of_merges_subschemas...\n";
    Json schema = {{"allOf", Json::array({Json{{"type", "object"}},
                                          Json{{"properties", {{"a", {{"type", "integer"}}}}}}})}};
    assert(request_errors(schema, Json{{"a", 1}}).empty());

    auto errors = request_errors(schema, Json{{"a", "x"}});
    assert(errors.size() == 1);
    assert(errors[0].json_pointer() == "/a");
    assert(errors[0].schema_pointer() == "/allOf/1/properties/a/type");

    errors = request_errors(schema, 7);
    assert(errors.size() == 1);
    assert(errors[0].schema_pointer() == "/allOf/0/type");

    // Later subschemas overwrite earlier keywords.
    Json overridden = {{"allOf", Json::array({Json{{"type", "string"}}, Json{{"type", "integer"}}})}};
    assert(request_errors(overridden, 3).empty());
    assert(request_errors(overridden, "s").size() == 1);

    // A readOnly property arriving through allOf in a request is still rejected.
    Json composed = {{"allOf", Json::array({Json{{"type", "object"}},
                                            Json{{"properties", {{"id", {{"readOnly", true}}}}}}})}};
    errors = request_errors(composed, Json{{"id", "abc"}});
    assert(errors.size() == 1);
    assert(errors[0].message == "Property is read-only");
    std::cout << "  [PASS]\n";
}

void test_all_of_replaces_object_keywords_whole()
{
    std::cout << "test_all_of_replaces_object_keywords_whole...\n";
    Json schema = {{"allOf", Json::array({Json{{"properties", {{"a", {{"type", "string"}}}}}},
                                          Json{{"properties", {{"a", {{"type", "number"}}}}}}})}};
    auto errors = request_errors(schema, Json{{"a", "x"}});
    assert(errors.size() == 1);
    assert(errors[0].schema_pointer() == "/allOf/1/properties/a/type");
    assert(request_errors(schema, Json{{"a", 1}}).empty());

    // Keys of the earlier "properties" that the later one lacks are gone.
    Json dropped = {{"allOf", Json::array({Json{{"properties", {{"a", {{"type", "string"}}},
                                                                {"b", {{"type", "string"}}}}}},
                                           Json{{"properties", {{"a", {{"type", "number"}}}}}}})}};
    assert(request_errors(dropped, Json{{"a", 1}, {"b", 2}}).empty());
    assert(request_errors(dropped, Json{{"a", "x"}, {"b", 2}}).size() == 1);
    // The Draft 4 rule still checks every member on its own.
    auto strict = Validator::draft4(dropped);
    Json both = {{"a", 1}, {"b", 2}};
    assert(strict.iter_errors(both).collect().size() == 2);
    std::cout << "  [PASS]\n";
}

void test_all_of_member_references()
{
    std::cout << "test_all_of_member_references...\n";
    Json schema = {{"definitions",
                    {{"Base", {{"type", "object"}, {"properties", {{"id", {{"type", "integer"}}}}}}},
                     {"Alias", {{"$ref", "#/definitions/Base"}}}}},
                   {"allOf", Json::array({Json{{"$ref", "#/definitions/Base"}},
                                          Json{{"required", Json::array({"name"})}}})}};

    auto errors = request_errors(schema, Json::object());
    assert(errors.size() == 1);
    assert(errors[0].validator == "required");
    assert(errors[0].schema_pointer() == "/allOf/1/required");
    assert(Validator::draft4(schema).is_valid(Json::object()) == false);

    errors = request_errors(schema, Json{{"id", "x"}, {"name", "rex"}});
    assert(errors.size() == 1);
    assert(errors[0].schema_pointer() == "/allOf/0/properties/id/type");
    assert(request_errors(schema, Json{{"id", 1}, {"name", "rex"}}).empty());

    // Chains of references are followed to the schema they end at.
    Json chained = schema;
    chained["allOf"][0] = Json{{"$ref", "#/definitions/Alias"}};
    assert(request_errors(chained, Json::object()).size() == 1);
    assert(request_errors(chained, Json{{"id", "x"}, {"name", "rex"}}).size() == 1);

    Json looping = {{"definitions", {{"A", {{"$ref", "#/definitions/B"}}},
                                     {"B", {{"$ref", "#/definitions/A"}}}}},
                    {"allOf", Json::array({Json{{"$ref", "#/definitions/A"}}})}};
    bool threw = false;
    try
    {
        request_errors(looping, Json::object());
    }
    catch (const CircularReferenceError&)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        request_errors(Json{{"allOf", Json::array({Json{{"$ref", "#/definitions/Missing"}}})}},
                       Json::object());
    }
    catch (const ResolutionError& e)
    {
        threw = true;
        assert(e.uri() == "#/definitions/Missing");
    }
    assert(threw);
    std::cout << "  [PASS]\n";
}

void test_required_exemptions()
{
    std::cout << "test_required_exemptions...\n";
    Json read_only = {{"type", "object"},
                      {"required", Json::array({"id"})},
                      {"properties", {{"id", {{"type", "string"}, {"readOnly", true}}}}}};
    assert(request_errors(read_only, Json::object()).empty());
    auto errors = response_errors(read_only, Json::object());
    assert(errors.size() == 1);
    assert(errors[0].message == "\"id\" is a required property");
    assert(errors[0].validator == "required");

    Json write_only = {{"type", "object"},
                       {"required", Json::array({"password"})},
                       {"properties", {{"password", {{"type", "string"}, {"writeOnly", true}}}}}};
    assert(response_errors(write_only, Json::object()).empty());
    assert(request_errors(write_only, Json::object()).size() == 1);

    Json vendor = {{"type", "object"},
                   {"required", Json::array({"secret"})},
                   {"properties", {{"secret", {{"type", "string"}, {"x-writeOnly", true}}}}}};
    assert(response_errors(vendor, Json::object()).empty());
    assert(request_errors(vendor, Json::object()).size() == 1);

    // Only a literal true exempts.
    Json not_read_only = {{"type", "object"},
                          {"required", Json::array({"id"})},
                          {"properties", {{"id", {{"readOnly", false}}}}}};
    assert(request_errors(not_read_only, Json::object()).size() == 1);

    Json undeclared = {{"required", Json::array({"id"})}};
    assert(request_errors(undeclared, Json::object()).size() == 1);
    assert(request_errors(undeclared, "scalar").empty());
    std::cout << "  [PASS]\n";
}

void test_direction_markers_reject_supplied_values()
{
    std::cout << "test_direction_markers_reject_supplied_values...\n";
    Json schema = {{"type", "object"},
                   {"properties",
                    {{"id", {{"type", "string"}, {"readOnly", true}}},
                     {"password", {{"type", "string"}, {"writeOnly", true}}},
                     {"token", {{"type", "string"}, {"x-writeOnly", true}}}}}};

    auto errors = request_errors(schema, Json{{"id", "abc"}});
    assert(errors.size() == 1);
    assert(errors[0].message == "Property is read-only");
    assert(errors[0].validator == "readOnly");
    assert(errors[0].json_pointer() == "/id");
    assert(request_errors(schema, Json{{"password", "x"}, {"token", "t"}}).empty());

    errors = response_errors(schema, Json{{"password", "x"}});
    assert(errors.size() == 1);
    assert(errors[0].message == "Property is write-only");
    assert(errors[0].validator == "writeOnly");
    assert(errors[0].json_pointer() == "/password");

    errors = response_errors(schema, Json{{"token", "t"}});
    assert(errors.size() == 1);
    assert(errors[0].validator == "x-writeOnly");
    assert(response_errors(schema, Json{{"id", "abc"}}).empty());

    Json relaxed = {{"properties", {{"id", {{"readOnly", false}}}}}};
    assert(request_errors(relaxed, Json{{"id", "abc"}}).empty());
    std::cout << "  [PASS]\n";
}

void test_response_nullable_object()
{
    std::cout << "test_response_nullable_object...\n";
    Json schema = {{"type", "object"},
                   {"nullable", true},
                   {"properties", {{"a", {{"type", "string"}}}}},
                   {"required", Json::array({"a"})}};
    assert(response_errors(schema, nullptr).empty());
    assert(response_errors(schema, Json{{"a", "x"}}).empty());
    assert(response_errors(schema, Json{{"a", 1}}).size() == 1);

    Json nested = {{"type", "object"},
                   {"properties", {{"child", {{"type", "object"}, {"x-nullable", true}}}}}};
    assert(response_errors(nested, Json{{"child", nullptr}}).empty());
    assert(request_errors(nested, Json{{"child", nullptr}}).empty());
    std::cout << "  [PASS]\n";
}

void test_make_validator()
{
    std::cout << "test_make_validator...\n";
    auto request = validation::make_validator(Json::object(), Direction::Request);
    auto response = validation::make_validator(Json::object(), Direction::Response);
    assert(request.has_keyword("readOnly"));
    assert(!request.has_keyword("writeOnly"));
    assert(response.has_keyword("writeOnly"));
    assert(response.has_keyword("x-writeOnly"));
    assert(!response.has_keyword("readOnly"));
    assert(response.has_keyword("allOf"));

    assert(direction_from_string("response") == Direction::Response);
    assert(direction_from_string("request") == Direction::Request);
    assert(to_string(Direction::Response) == "response");
    std::cout << "  [PASS]\n";
}

int main()
{
    test_nullable_type();
    test_nullable_enum_and_one_of();
    test_one_of_exactly_one();
    test_all_of_merges_subschemas();
    test_all_of_replaces_object_keywords_whole();
    test_all_of_member_references();
    test_required_exemptions();
    test_direction_markers_reject_supplied_values();
    test_response_nullable_object();
    test_make_validator();
    std::cout << "All OpenAPI validation tests passed\n";
    return 0;
}
