#include "apischema/resolver/handlers.hpp"

#include "apischema/exceptions.hpp"
#include "apischema/logging.hpp"
#include "apischema/util/uri.hpp"

#include <filesystem>
#include <fstream>
#include <httplib.h>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace apischema::resolver
{

namespace
{

constexpr const char* kLogger = "apischema.resolver";

void set_timeout_ms(httplib::Client& cli, int connect_ms, int read_ms)
{
    cli.set_connection_timeout(connect_ms / 1000, (connect_ms % 1000) * 1000);
    cli.set_read_timeout(read_ms / 1000, (read_ms % 1000) * 1000);
}

Json fetch_http(const FetchOptions& options, const std::string& uri)
{
    auto parsed = util::uri::parse(uri);
    std::string scheme = util::uri::scheme_of(uri);
    if (scheme != "http" && scheme != "https")
        throw UnknownSchemeError(uri, "HTTP handler cannot fetch scheme '" + scheme + "'");
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (scheme == "https")
        throw ResolutionError(uri, "https requires a build with OpenSSL support");
#endif
    if (!parsed.has_authority || parsed.authority.empty())
        throw ResolutionError(uri, "URI has no host");

    std::string path = parsed.path.empty() ? "/" : parsed.path;
    if (parsed.has_query)
        path += "?" + parsed.query;

    std::string scheme_host_port = scheme + "://" + parsed.authority;
    std::unique_ptr<httplib::Client> cli;
    try
    {
        cli = std::make_unique<httplib::Client>(scheme_host_port);
    }
    catch (const std::invalid_argument& e)
    {
        throw ResolutionError(uri, std::string("Invalid URI: ") + e.what());
    }

    set_timeout_ms(*cli, options.connect_timeout_ms, options.read_timeout_ms);
    cli->set_follow_location(options.follow_redirects);
    cli->set_default_headers({{"Accept", "application/json"}});

    logging::debug("GET " + uri, kLogger);
    auto res = cli->Get(path.c_str());
    if (!res)
        throw ResolutionError(uri, "HTTP request failed: " + httplib::to_string(res.error()));
    if (res->status < 200 || res->status >= 300)
        throw ResolutionError(uri, "HTTP error " + std::to_string(res->status));
    return parse_document(uri, res->body);
}

Json fetch_file(const std::string& uri)
{
    std::string path = util::uri::file_path(uri);
    std::ifstream in(std::filesystem::path(path), std::ios::binary);
    if (!in)
        throw ResolutionError(uri, "Unable to open file");

    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_document(uri, ss.str());
}

} // namespace

FetchOptions fetch_options(const Settings& settings)
{
    FetchOptions options;
    options.connect_timeout_ms = settings.http_connect_timeout_ms;
    options.read_timeout_ms = settings.http_read_timeout_ms;
    options.follow_redirects = settings.http_follow_redirects;
    return options;
}

Json parse_document(const std::string& uri, const std::string& body)
{
    try
    {
        return Json::parse(body);
    }
    catch (const Json::parse_error& e)
    {
        throw ResolutionError(uri, "Invalid JSON document (" + std::string(e.what()) + ")");
    }
}

FetchHandler http_handler(FetchOptions options)
{
    return [options](const std::string& uri) { return fetch_http(options, uri); };
}

FetchHandler file_handler()
{
    return [](const std::string& uri) { return fetch_file(uri); };
}

HandlerMap default_handlers(FetchOptions options)
{
    HandlerMap handlers;
    handlers["http"] = http_handler(options);
    handlers["https"] = http_handler(options);
    handlers["file"] = file_handler();
    return handlers;
}

} // namespace apischema::resolver
