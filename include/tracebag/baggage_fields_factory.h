#pragma once

// This component provides a class, `BaggageFieldsFactory`, that manages the
// `BaggageState` of each span context.
//
// A factory is made from a `FinalizedBaggageConfig`. Every `BaggageState` it
// creates starts out sharing the factory's initial array, which holds the
// configured fields without values. The factory must outlive the states it
// creates and the contexts that hold them.
//
// Typical use, in the hook that runs whenever a span context is made:
//
//     TraceContext decorated = factory.decorate(context);
//     auto state = factory.find(decorated);
//     state->update_value(BaggageField{"user.id"}, "1234");

#include <cstddef>
#include <memory>
#include <unordered_map>
#include <vector>

#include "baggage_config.h"
#include "baggage_field.h"
#include "baggage_state.h"
#include "extra.h"
#include "trace_context.h"

namespace tracebag {
namespace tracing {

class Logger;

class BaggageFieldsFactory : public ExtraFactory {
  friend class BaggageState;

  std::shared_ptr<const BaggageState::Array> initial_array_;
  std::vector<BaggageField> initial_fields_;
  std::unordered_map<BaggageField, std::size_t> initial_field_indices_;
  bool dynamic_;
  std::size_t max_fields_;
  std::size_t update_attempts_;
  std::shared_ptr<Logger> logger_;

 public:
  explicit BaggageFieldsFactory(const FinalizedBaggageConfig& config);

  std::shared_ptr<Extra> create() const override;

  // Return this factory's state in the specified `context`, or return null if
  // `context` has none.
  std::shared_ptr<BaggageState> find(const TraceContext& context) const;

  const std::shared_ptr<const BaggageState::Array>& initial_array() const {
    return initial_array_;
  }
};

}  // namespace tracing
}  // namespace tracebag
