#pragma once
#include "apischema/types.hpp"

#include <functional>
#include <map>
#include <string>

namespace apischema::validation
{

/// Registry of "format" checks. Formats without a check, and non-string
/// instances, always conform.
class FormatChecker
{
  public:
    using Check = std::function<bool(const std::string&)>;

    FormatChecker() = default;

    /// email, ipv4, ipv6, hostname, uri, date-time
    static FormatChecker draft4();

    FormatChecker& checks(const std::string& format, Check check);
    bool has(const std::string& format) const;
    bool conforms(const Json& instance, const std::string& format) const;

  private:
    std::map<std::string, Check> checkers_;
};

} // namespace apischema::validation
