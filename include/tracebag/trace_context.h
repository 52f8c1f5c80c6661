#pragma once

// This component provides a class, `TraceContext`, that carries the identity
// of a span together with an ordered list of opaque `Extra` objects that
// plugins attach to it.
//
// `TraceContext` is immutable. "Changing" the extra list means making a new
// context with `with_extra`. Copies of a context share the same list, which
// makes it cheap to tell whether a context was changed: compare
// `extra_list()` pointers.

#include <cstdint>
#include <memory>
#include <vector>

#include "trace_id.h"

namespace tracebag {
namespace tracing {

class Extra;

using ExtraList = std::vector<std::shared_ptr<Extra>>;

class TraceContext {
  TraceID trace_id_;
  std::uint64_t span_id_;
  std::shared_ptr<const ExtraList> extra_;

 public:
  TraceContext(TraceID trace_id, std::uint64_t span_id, ExtraList extra = {});

  TraceID trace_id() const { return trace_id_; }
  std::uint64_t span_id() const { return span_id_; }

  const ExtraList& extra() const { return *extra_; }
  const std::shared_ptr<const ExtraList>& extra_list() const { return extra_; }

  // Return a copy of this context having the specified `extra` list.
  TraceContext with_extra(ExtraList extra) const;

  // Return a context for a child span having the specified `span_id`. The
  // child shares this context's extra list, as a tracer would before
  // decorating the child.
  TraceContext child(std::uint64_t span_id) const;
};

}  // namespace tracing
}  // namespace tracebag
