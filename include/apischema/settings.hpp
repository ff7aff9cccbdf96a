#pragma once
#include "apischema/types.hpp"

#include <string>

namespace apischema
{

struct Settings
{
    std::string log_level{"WARNING"};
    int http_connect_timeout_ms{5000};
    int http_read_timeout_ms{10000};
    bool http_follow_redirects{false};
    bool strict_local_refs{true};

    static Settings from_env();
    static Settings from_json(const Json& j);

    /// Install log_level as the process-wide logging threshold.
    void apply_logging() const;
};

} // namespace apischema
