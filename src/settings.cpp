#include "apischema/settings.hpp"

#include "apischema/logging.hpp"

#include <algorithm>
#include <cstdlib>

namespace apischema
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_flag(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

static int getenv_int(const char* key, int defv)
{
    const char* v = std::getenv(key);
    if (!v)
        return defv;
    try
    {
        size_t pos = 0;
        std::string s(v);
        int parsed = std::stoi(s, &pos, 10);
        if (pos != s.size() || parsed < 0)
            return defv;
        return parsed;
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("APISCHEMA_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.http_connect_timeout_ms =
        getenv_int("APISCHEMA_HTTP_CONNECT_TIMEOUT_MS", s.http_connect_timeout_ms);
    s.http_read_timeout_ms = getenv_int("APISCHEMA_HTTP_READ_TIMEOUT_MS", s.http_read_timeout_ms);
    s.http_follow_redirects = parse_flag(getenv_str("APISCHEMA_HTTP_FOLLOW_REDIRECTS", "0"));
    s.strict_local_refs = parse_flag(getenv_str("APISCHEMA_STRICT_LOCAL_REFS", "1"));
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("http_connect_timeout_ms"))
        s.http_connect_timeout_ms = j.at("http_connect_timeout_ms").get<int>();
    if (j.contains("http_read_timeout_ms"))
        s.http_read_timeout_ms = j.at("http_read_timeout_ms").get<int>();
    if (j.contains("http_follow_redirects"))
        s.http_follow_redirects = j.at("http_follow_redirects").get<bool>();
    if (j.contains("strict_local_refs"))
        s.strict_local_refs = j.at("strict_local_refs").get<bool>();
    return s;
}

void Settings::apply_logging() const
{
    logging::set_level(logging::log_level_from_string(log_level));
}

} // namespace apischema
