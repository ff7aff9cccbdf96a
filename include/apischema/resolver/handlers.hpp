#pragma once
#include "apischema/settings.hpp"
#include "apischema/types.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace apischema::resolver
{

/// Transport limits for remote fetches. A hung server is bounded by these.
struct FetchOptions
{
    int connect_timeout_ms{5000};
    int read_timeout_ms{10000};
    bool follow_redirects{false};
};

FetchOptions fetch_options(const Settings& settings);

/// Fetches the document at an absolute URI (fragment already removed) and
/// returns it parsed. Failures are reported as ResolutionError.
using FetchHandler = std::function<Json(const std::string& uri)>;

/// Keyed by lower-case URI scheme.
using HandlerMap = std::unordered_map<std::string, FetchHandler>;

FetchHandler http_handler(FetchOptions options = {});
FetchHandler file_handler();

/// http, https and file.
HandlerMap default_handlers(FetchOptions options = {});

/// Parse a fetched body, wrapping parse failures in ResolutionError naming `uri`.
Json parse_document(const std::string& uri, const std::string& body);

} // namespace apischema::resolver
