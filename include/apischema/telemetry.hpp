// apischema resolver tracing (no-op unless an exporter is configured)
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apischema::telemetry
{

enum class SpanKind
{
    Resolve,
    Fetch
};

enum class StatusCode
{
    Ok,
    Error
};

/// One finished resolve() call or document fetch.
struct Span
{
    SpanKind kind{SpanKind::Resolve};
    /// Base URI of a resolve, document URI of a fetch.
    std::string uri;
    /// Handler scheme; empty for resolve spans.
    std::string scheme;
    StatusCode status{StatusCode::Ok};
    std::optional<std::string> error;
    /// Spans still open on the same thread when this one started.
    std::size_t depth{0};
    std::chrono::steady_clock::duration elapsed{};

    std::string name() const;
};

class SpanExporter
{
  public:
    virtual ~SpanExporter() = default;
    virtual void export_span(const Span& span) = 0;
};

/// Keeps finished spans in completion order. Not synchronized.
class InMemorySpanExporter : public SpanExporter
{
  public:
    void export_span(const Span& span) override;
    const std::vector<Span>& finished_spans() const;
    void reset();

  private:
    std::vector<Span> spans_;
};

void set_span_exporter(std::shared_ptr<SpanExporter> exporter);
std::shared_ptr<SpanExporter> span_exporter();

/// Exports its span on destruction. A scope left by an exception is marked Error.
class SpanScope
{
  public:
    SpanScope(SpanKind kind, std::string uri, std::string scheme = {});
    SpanScope(const SpanScope&) = delete;
    SpanScope& operator=(const SpanScope&) = delete;
    ~SpanScope();

    bool active() const
    {
        return exporter_ != nullptr;
    }

    /// Marks the span Error with `message`.
    void fail(const std::string& message);

  private:
    std::shared_ptr<SpanExporter> exporter_;
    int uncaught_on_enter_{0};
    std::chrono::steady_clock::time_point start_;
    Span span_;
};

SpanScope resolve_span(const std::string& base_uri);
SpanScope fetch_span(const std::string& uri, const std::string& scheme);

} // namespace apischema::telemetry
