#pragma once

// This component provides the classes that manage one piece of mutable,
// per-span state carried in `TraceContext::extra()`.
//
// `Extra` is the base class of such state. Each `Extra` is created by one
// `ExtraFactory`, and remembers which factory created it. Several factories
// can coexist on the same context; each manages only its own objects.
//
// When a child span is created, its context starts out sharing the parent's
// extra list, and so the parent's `Extra` objects. `ExtraFactory::decorate`
// then gives the child a state object of its own: every `Extra` is "claimed"
// by exactly one (trace ID, span ID), and a context whose list holds only an
// object claimed by another span gets a new object whose state starts from
// the other one. Updates made to the child are thus invisible to the parent
// and to siblings.
//
// `decorate` must run on every new context, for example from the hook that
// a tracer calls whenever it makes a span context.
//
// Both the claim and the state of derived classes are updated with atomic
// operations only. No locks are taken.

#include <cstdint>
#include <memory>

#include "trace_context.h"
#include "trace_id.h"

namespace tracebag {
namespace tracing {

class ExtraFactory;

class Extra {
  friend class ExtraFactory;

  struct Claim {
    TraceID trace_id;
    std::uint64_t span_id;
  };

  const ExtraFactory* factory_;
  // Null until claimed. Accessed only through `std::atomic_*`.
  std::shared_ptr<const Claim> claim_;

 public:
  virtual ~Extra() {}

  const ExtraFactory& factory() const { return *factory_; }

  // Claim this object for the span having the specified `trace_id` and
  // `span_id`, if it isn't claimed already. Return whether this object is now
  // claimed by that span, including when it already was.
  bool try_to_claim(TraceID trace_id, std::uint64_t span_id);

 protected:
  explicit Extra(const ExtraFactory& factory) : factory_(&factory) {}

  // Return whether this object's state is still the factory's initial state,
  // i.e. nothing has changed it since creation.
  virtual bool state_is_initial() const = 0;

  // Replace this object's state with the state of the specified `other`,
  // which was created by the same factory.
  virtual void adopt_state_of(const Extra& other) = 0;

  // Merge the state of the specified `other`, which was created by the same
  // factory, into this object's state. Where both have a value for the same
  // thing, this object's value wins.
  virtual void merge_state_from(const Extra& other) = 0;
};

class ExtraFactory {
 public:
  virtual ~ExtraFactory() {}

  // Return a new `Extra` having this factory's initial state. The object
  // must not be claimed. It's a programming error to add more than one
  // object made by this factory to a context's extra list.
  virtual std::shared_ptr<Extra> create() const = 0;

  // Return a context equivalent to the specified `context` whose extra list
  // holds exactly one object made by this factory, claimed by `context`'s
  // span. If the list held an object claimed by another span, its state is
  // carried into the claimed object and it is removed from the list. Return
  // `context` itself if its list needed no change. Throw `std::logic_error`
  // if more than one object made by this factory is claimed by other spans,
  // which means that something added the result of `create()` to the list
  // more than once. The factory must outlive the objects it makes.
  TraceContext decorate(const TraceContext& context) const;
};

}  // namespace tracing
}  // namespace tracebag
