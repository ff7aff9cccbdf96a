#pragma once
#include "apischema/exceptions.hpp"
#include "apischema/resolver/handlers.hpp"
#include "apischema/settings.hpp"
#include "apischema/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace apischema::resolver
{

/// Absolute document URI (no fragment) -> fetched document.
/// Caller-owned and not synchronized: share it across resolve calls only from one
/// thread at a time.
using ReferenceStore = std::unordered_map<std::string, Json>;

struct ResolverOptions
{
    /// URI of the root document; relative references are joined against it.
    std::string base_uri;
    /// Raise InternalReferenceError for "#..." references that do not exist instead of
    /// handing them to scheme-based resolution.
    bool strict_local_refs{true};
    /// Keep fetched documents in the store. When false, each document is fetched at
    /// most once per resolve() call and dropped when the next call starts.
    bool cache_remote{true};

    static ResolverOptions from_settings(const Settings& settings);
};

/// Rewrites {"$ref": ...} nodes into the subtree they designate.
///
/// Local references ("#/a/b") are looked up in the original document of the
/// current resolution scope and their fields are merged over the reference node.
/// Any other reference is joined against the scope URI, its document is taken from
/// the store or fetched by the handler for its scheme, and the node is replaced by
/// the designated fragment. Fetched fragments are resolved in turn, relative to the
/// document they came from.
///
/// A resolver is not reentrant; use one per thread.
class RefResolver
{
  public:
    explicit RefResolver(ReferenceStore& store, HandlerMap handlers = default_handlers(),
                         ResolverOptions options = {});

    /// Returns a fully inlined deep copy of `spec`. `spec` is never modified.
    Json resolve(const Json& spec);

    /// Document for an absolute URI (fragment ignored), from the store or fetched.
    /// Without cache_remote the reference stays valid until the next call on this
    /// resolver.
    const Json& resolve_document(const std::string& uri);

    const ReferenceStore& store() const
    {
        return store_;
    }
    const HandlerMap& handlers() const
    {
        return handlers_;
    }
    const ResolverOptions& options() const
    {
        return options_;
    }

  private:
    struct Scope
    {
        std::string uri;
        const Json* document;
    };

    class ScopeGuard;
    class ExpansionGuard;

    void resolve_node(Json& node);
    bool resolve_local(Json& node, const std::string& ref);
    void resolve_remote(Json& node, const std::string& ref);
    const Json& acquire(const std::string& uri);
    const Json& fetch(const std::string& uri);

    ReferenceStore& store_;
    HandlerMap handlers_;
    ResolverOptions options_;
    std::vector<Scope> scopes_;
    std::vector<std::string> expanding_;
    std::unordered_map<std::string, Json> uncached_;
};

/// Resolve with a private store and the default handlers.
Json resolve_refs(const Json& spec);

Json resolve_refs(const Json& spec, ReferenceStore& store,
                  const HandlerMap& handlers = default_handlers(),
                  const ResolverOptions& options = {});

} // namespace apischema::resolver
