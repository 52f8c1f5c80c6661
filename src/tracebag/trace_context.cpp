#include <tracebag/extra.h>
#include <tracebag/trace_context.h>

#include <utility>

namespace tracebag {
namespace tracing {

TraceContext::TraceContext(TraceID trace_id, std::uint64_t span_id,
                           ExtraList extra)
    : trace_id_(trace_id),
      span_id_(span_id),
      extra_(std::make_shared<const ExtraList>(std::move(extra))) {}

TraceContext TraceContext::with_extra(ExtraList extra) const {
  return TraceContext(trace_id_, span_id_, std::move(extra));
}

TraceContext TraceContext::child(std::uint64_t span_id) const {
  TraceContext result = *this;
  result.span_id_ = span_id;
  return result;
}

}  // namespace tracing
}  // namespace tracebag
