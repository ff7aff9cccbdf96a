/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the umbrella apischema.hpp header
///
/// Including just <apischema.hpp> is enough to resolve a document and validate
/// a payload against it.

#include "apischema.hpp"

#include <cassert>
#include <iostream>

using namespace apischema;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_resolve_then_validate..." << std::endl;
    {
        Json spec = {
            {"components",
             {{"schemas",
               {{"Pet",
                 {{"type", "object"},
                  {"required", Json::array({"id", "name"})},
                  {"properties",
                   {{"id", {{"type", "integer"}, {"readOnly", true}}},
                    {"name", {{"type", "string"}}},
                    {"tag", {{"type", "string"}, {"nullable", true}}}}}}}}}}},
            {"body", {{"$ref", "#/components/schemas/Pet"}}}};

        Json resolved = resolver::resolve_refs(spec);
        Json schema = resolved["body"];

        auto request = validation::make_validator(schema, Direction::Request);
        auto response = validation::make_validator(schema, Direction::Response);

        Json created = {{"name", "rex"}, {"tag", nullptr}};
        assert(request.is_valid(created));
        assert(!response.is_valid(created));
        assert(response.is_valid(Json{{"id", 1}, {"name", "rex"}}));
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_version_and_errors_accessible..." << std::endl;
    {
        assert(VERSION_MAJOR >= 1);
        (void)sizeof(ResolutionError);
        (void)sizeof(InstanceValidationError);
        (void)sizeof(telemetry::InMemorySpanExporter);
        (void)sizeof(Settings);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All main header tests passed ===" << std::endl;
    return 0;
}
