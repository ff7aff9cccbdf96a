#include "apischema/validation/format.hpp"
#include "apischema/validation/validator.hpp"

#include <cassert>

using namespace apischema;
using validation::FormatChecker;

int main()
{
    auto checker = FormatChecker::draft4();
    for (const char* format : {"email", "ipv4", "ipv6", "hostname", "uri", "date-time"})
        assert(checker.has(format));
    assert(!checker.has("uuid"));

    assert(checker.conforms("user@example.com", "email"));
    assert(!checker.conforms("user.example.com", "email"));

    assert(checker.conforms("192.168.0.1", "ipv4"));
    assert(!checker.conforms("256.1.1.1", "ipv4"));
    assert(!checker.conforms("1.2.3", "ipv4"));

    assert(checker.conforms("::1", "ipv6"));
    assert(checker.conforms("2001:db8::8a2e:370:7334", "ipv6"));
    assert(!checker.conforms("2001:db8::g", "ipv6"));

    assert(checker.conforms("api.example.com", "hostname"));
    assert(!checker.conforms("-bad.example.com", "hostname"));
    assert(!checker.conforms(std::string(64, 'a') + ".com", "hostname"));

    assert(checker.conforms("https://example.com/a?b=c", "uri"));
    assert(!checker.conforms("/relative/path", "uri"));

    assert(checker.conforms("2024-02-29T12:30:00Z", "date-time"));
    assert(checker.conforms("2024-02-29T12:30:00.125+02:00", "date-time"));
    assert(!checker.conforms("2024-02-29 12:30", "date-time"));

    // Non-strings and unknown formats always conform.
    assert(checker.conforms(42, "email"));
    assert(checker.conforms("anything", "uuid"));

    checker.checks("even-length", [](const std::string& s) { return s.size() % 2 == 0; });
    assert(checker.conforms("ab", "even-length"));
    assert(!checker.conforms("abc", "even-length"));

    auto validator = validation::Validator::response(
        Json{{"properties", {{"contact", {{"type", "string"}, {"format", "email"}}}}}}, checker);
    assert(validator.is_valid(Json{{"contact", "a@b.io"}}));
    Json nobody = {{"contact", "nobody"}};
  auto errors = validator.iter_errors(nobody).collect();
    assert(errors.size() == 1);
    assert(errors[0].validator == "format");
    assert(errors[0].json_pointer() == "/contact");
    return 0;
}
