#pragma once
#include <stdexcept>
#include <string>

namespace apischema
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// A JSON reference could not be resolved. Fatal for the resolve call.
class ResolutionError : public Error
{
  public:
    ResolutionError(std::string uri, const std::string& message)
        : Error(message + ": " + uri), uri_(std::move(uri))
    {
    }

    /// The reference (or absolute document URI) that failed.
    const std::string& uri() const noexcept
    {
        return uri_;
    }

  private:
    std::string uri_;
};

/// No fetch handler is registered for the URI's scheme.
struct UnknownSchemeError : public ResolutionError
{
    using ResolutionError::ResolutionError;
};

/// A document-local reference points at a path that does not exist.
struct InternalReferenceError : public ResolutionError
{
    using ResolutionError::ResolutionError;
};

/// A reference was re-entered while its own target was being expanded.
struct CircularReferenceError : public ResolutionError
{
    using ResolutionError::ResolutionError;
};

/// The schema itself is malformed (unknown type name, keyword of the wrong shape).
struct SchemaError : public Error
{
    using Error::Error;
};

} // namespace apischema
