#include "apischema/resolver/resolver.hpp"

#include "apischema/logging.hpp"
#include "apischema/telemetry.hpp"
#include "apischema/util/pointer.hpp"
#include "apischema/util/uri.hpp"

#include <algorithm>

namespace apischema::resolver
{

namespace
{
constexpr const char* kLogger = "apischema.resolver";
}

// Pushes a resolution scope for the lifetime of the guard.
class RefResolver::ScopeGuard
{
  public:
    ScopeGuard(RefResolver& resolver, std::string uri, const Json& document) : resolver_(resolver)
    {
        resolver_.scopes_.push_back(Scope{std::move(uri), &document});
    }
    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ~ScopeGuard()
    {
        resolver_.scopes_.pop_back();
    }

  private:
    RefResolver& resolver_;
};

// Marks a reference target as being inlined; entering it again is a cycle.
class RefResolver::ExpansionGuard
{
  public:
    ExpansionGuard(RefResolver& resolver, const std::string& location, const std::string& ref)
        : resolver_(resolver)
    {
        auto& expanding = resolver_.expanding_;
        if (std::find(expanding.begin(), expanding.end(), location) != expanding.end())
            throw CircularReferenceError(ref, "Circular reference cannot be inlined");
        expanding.push_back(location);
    }
    ExpansionGuard(const ExpansionGuard&) = delete;
    ExpansionGuard& operator=(const ExpansionGuard&) = delete;
    ~ExpansionGuard()
    {
        resolver_.expanding_.pop_back();
    }

  private:
    RefResolver& resolver_;
};

ResolverOptions ResolverOptions::from_settings(const Settings& settings)
{
    ResolverOptions options;
    options.strict_local_refs = settings.strict_local_refs;
    return options;
}

RefResolver::RefResolver(ReferenceStore& store, HandlerMap handlers, ResolverOptions options)
    : store_(store), handlers_(std::move(handlers)), options_(std::move(options))
{
}

Json RefResolver::resolve(const Json& spec)
{
    auto span = telemetry::resolve_span(options_.base_uri);
    scopes_.clear();
    expanding_.clear();
    uncached_.clear();

    ScopeGuard root(*this,
                    util::uri::split_fragment(util::uri::normalize_scheme(options_.base_uri)).first,
                    spec);
    Json resolved = spec;
    resolve_node(resolved);
    return resolved;
}

const Json& RefResolver::resolve_document(const std::string& uri)
{
    uncached_.clear();
    return acquire(util::uri::split_fragment(util::uri::normalize_scheme(uri)).first);
}

void RefResolver::resolve_node(Json& node)
{
    if (node.is_object())
    {
        auto ref_it = node.find("$ref");
        if (ref_it != node.end() && ref_it->is_string())
        {
            std::string ref = ref_it->get<std::string>();
            if (!ref.empty() && ref[0] == '#' && resolve_local(node, ref))
                return;
            resolve_remote(node, ref);
            return;
        }
    }
    if (node.is_object() || node.is_array())
    {
        for (auto& child : node)
            resolve_node(child);
    }
}

bool RefResolver::resolve_local(Json& node, const std::string& ref)
{
    const Scope& scope = scopes_.back();
    std::string json_pointer = util::pointer::from_fragment(ref.substr(1));
    const Json* target = util::pointer::find(*scope.document, json_pointer);
    if (!target)
    {
        if (options_.strict_local_refs)
            throw InternalReferenceError(ref, "Unresolvable local reference");
        logging::debug("Local lookup failed, trying scheme resolution for " + ref, kLogger);
        return false;
    }

    ExpansionGuard expansion(*this, scope.uri + "#" + json_pointer, ref);
    logging::debug("Resolved local reference " + ref, kLogger);

    if (target->is_object())
    {
        // Fields of the target win over siblings of "$ref".
        node.erase("$ref");
        for (const auto& [key, value] : target->items())
            node[key] = value;
    }
    else
    {
        node = *target;
    }
    resolve_node(node);
    return true;
}

void RefResolver::resolve_remote(Json& node, const std::string& ref)
{
    std::string absolute = util::uri::join(scopes_.back().uri, ref);
    auto [document_uri, fragment] = util::uri::split_fragment(absolute);

    const Json& document = acquire(document_uri);
    ScopeGuard scope(*this, document_uri, document);

    std::string json_pointer = util::pointer::from_fragment(fragment);
    const Json* target = util::pointer::find(document, json_pointer);
    if (!target)
        throw ResolutionError(absolute, "Unresolvable JSON pointer '" + json_pointer + "'");

    ExpansionGuard expansion(*this, document_uri + "#" + json_pointer, ref);
    logging::debug("Resolved reference " + ref + " -> " + absolute, kLogger);

    Json resolved = *target;
    resolve_node(resolved);
    node = std::move(resolved);
}

const Json& RefResolver::acquire(const std::string& uri)
{
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it)
    {
        if (it->uri == uri)
            return *it->document;
    }

    auto cached = store_.find(uri);
    if (cached != store_.end())
    {
        logging::debug("Store hit for " + uri, kLogger);
        return cached->second;
    }
    auto fetched = uncached_.find(uri);
    if (fetched != uncached_.end())
        return fetched->second;
    return fetch(uri);
}

const Json& RefResolver::fetch(const std::string& uri)
{
    std::string scheme = util::uri::scheme_of(uri);
    auto handler = handlers_.find(scheme);
    if (scheme.empty())
        throw UnknownSchemeError(uri, "Relative reference has no base URI to resolve against");
    if (handler == handlers_.end() || !handler->second)
        throw UnknownSchemeError(uri, "No handler registered for scheme '" + scheme + "'");

    Json document;
    {
        auto span = telemetry::fetch_span(uri, scheme);
        try
        {
            document = handler->second(uri);
        }
        catch (const ResolutionError& e)
        {
            span.fail(e.what());
            logging::error(e.what(), kLogger);
            throw;
        }
        catch (const std::exception& e)
        {
            span.fail(e.what());
            logging::error("Fetch failed for " + uri + ": " + e.what(), kLogger);
            throw ResolutionError(uri, std::string("Fetch failed (") + e.what() + ")");
        }
    }

    auto& target = options_.cache_remote ? store_ : uncached_;
    auto [pos, inserted] = target.emplace(uri, std::move(document));
    (void)inserted;
    return pos->second;
}

Json resolve_refs(const Json& spec)
{
    ReferenceStore store;
    return resolve_refs(spec, store);
}

Json resolve_refs(const Json& spec, ReferenceStore& store, const HandlerMap& handlers,
                  const ResolverOptions& options)
{
    RefResolver resolver(store, handlers, options);
    return resolver.resolve(spec);
}

} // namespace apischema::resolver
