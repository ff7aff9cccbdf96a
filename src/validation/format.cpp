#include "apischema/validation/format.hpp"

#include "apischema/util/regex.hpp"

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace apischema::validation
{

namespace
{

bool is_email(const std::string& value)
{
    return std::regex_match(value, util::regex::cached(R"(^[^@\s]+@[^@\s]+\.[^@\s]+$)"));
}

bool is_ipv4(const std::string& value)
{
    if (!std::regex_match(value, util::regex::cached(R"(^\d{1,3}(\.\d{1,3}){3}$)")))
        return false;
    size_t start = 0;
    while (start <= value.size())
    {
        auto dot = value.find('.', start);
        auto octet = value.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (std::stoi(octet) > 255)
            return false;
        if (dot == std::string::npos)
            break;
        start = dot + 1;
    }
    return true;
}

bool is_ipv6(const std::string& value)
{
    unsigned char buf[16];
    return inet_pton(AF_INET6, value.c_str(), buf) == 1;
}

bool is_hostname(const std::string& value)
{
    if (!std::regex_match(value, util::regex::cached(R"(^[A-Za-z0-9][A-Za-z0-9\.\-]{1,255}$)")))
        return false;
    size_t start = 0;
    while (true)
    {
        auto dot = value.find('.', start);
        size_t len = (dot == std::string::npos ? value.size() : dot) - start;
        if (len > 63)
            return false;
        if (dot == std::string::npos)
            return true;
        start = dot + 1;
    }
}

bool is_uri(const std::string& value)
{
    return std::regex_match(value, util::regex::cached(R"(^[A-Za-z][A-Za-z0-9+.\-]*:[^\s]*$)"));
}

bool is_date_time(const std::string& value)
{
    return std::regex_match(
        value, util::regex::cached(
                   R"(^\d{4}-\d{2}-\d{2}[Tt]\d{2}:\d{2}:\d{2}(\.\d+)?([Zz]|[+\-]\d{2}:\d{2})$)"));
}

} // namespace

FormatChecker FormatChecker::draft4()
{
    FormatChecker checker;
    checker.checks("email", is_email)
        .checks("ipv4", is_ipv4)
        .checks("ipv6", is_ipv6)
        .checks("hostname", is_hostname)
        .checks("uri", is_uri)
        .checks("date-time", is_date_time);
    return checker;
}

FormatChecker& FormatChecker::checks(const std::string& format, Check check)
{
    checkers_[format] = std::move(check);
    return *this;
}

bool FormatChecker::has(const std::string& format) const
{
    return checkers_.count(format) > 0;
}

bool FormatChecker::conforms(const Json& instance, const std::string& format) const
{
    if (!instance.is_string())
        return true;
    auto it = checkers_.find(format);
    if (it == checkers_.end() || !it->second)
        return true;
    return it->second(instance.get<std::string>());
}

} // namespace apischema::validation
