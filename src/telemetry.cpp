#include "apischema/telemetry.hpp"

#include <exception>
#include <mutex>

namespace apischema::telemetry
{
namespace
{

std::mutex exporter_mutex;
std::shared_ptr<SpanExporter> exporter;

thread_local std::size_t open_spans = 0;

} // namespace

std::string Span::name() const
{
    return kind == SpanKind::Fetch ? "fetch " + uri : "resolve";
}

void InMemorySpanExporter::export_span(const Span& span)
{
    spans_.push_back(span);
}

const std::vector<Span>& InMemorySpanExporter::finished_spans() const
{
    return spans_;
}

void InMemorySpanExporter::reset()
{
    spans_.clear();
}

void set_span_exporter(std::shared_ptr<SpanExporter> next)
{
    std::lock_guard<std::mutex> lock(exporter_mutex);
    exporter = std::move(next);
}

std::shared_ptr<SpanExporter> span_exporter()
{
    std::lock_guard<std::mutex> lock(exporter_mutex);
    return exporter;
}

SpanScope::SpanScope(SpanKind kind, std::string uri, std::string scheme)
    : exporter_(span_exporter())
{
    if (!exporter_)
        return;
    uncaught_on_enter_ = std::uncaught_exceptions();
    start_ = std::chrono::steady_clock::now();
    span_.kind = kind;
    span_.uri = std::move(uri);
    span_.scheme = std::move(scheme);
    span_.depth = open_spans++;
}

SpanScope::~SpanScope()
{
    if (!exporter_)
        return;
    --open_spans;
    if (std::uncaught_exceptions() > uncaught_on_enter_)
        span_.status = StatusCode::Error;
    span_.elapsed = std::chrono::steady_clock::now() - start_;
    exporter_->export_span(span_);
}

void SpanScope::fail(const std::string& message)
{
    if (!exporter_)
        return;
    span_.status = StatusCode::Error;
    span_.error = message;
}

SpanScope resolve_span(const std::string& base_uri)
{
    return SpanScope(SpanKind::Resolve, base_uri);
}

SpanScope fetch_span(const std::string& uri, const std::string& scheme)
{
    return SpanScope(SpanKind::Fetch, uri, scheme);
}

} // namespace apischema::telemetry
