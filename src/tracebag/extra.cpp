#include <tracebag/extra.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace tracebag {
namespace tracing {

bool Extra::try_to_claim(TraceID trace_id, std::uint64_t span_id) {
  auto claim = std::make_shared<const Claim>(Claim{trace_id, span_id});
  std::shared_ptr<const Claim> current;
  if (std::atomic_compare_exchange_strong(&claim_, &current, claim)) {
    return true;
  }
  // `current` now holds whoever won the claim.
  return current->trace_id == trace_id && current->span_id == span_id;
}

TraceContext ExtraFactory::decorate(const TraceContext& context) const {
  const TraceID trace_id = context.trace_id();
  const std::uint64_t span_id = context.span_id();
  const ExtraList& extra = context.extra();

  std::shared_ptr<Extra> claimed;
  const std::size_t none = extra.size();
  std::size_t existing_index = none;
  for (std::size_t i = 0; i < extra.size(); ++i) {
    const auto& next = extra[i];
    // Leave other factories' objects alone, even if they are the same type.
    if (next == nullptr || next->factory_ != this) {
      continue;
    }

    if (claimed == nullptr && next->try_to_claim(trace_id, span_id)) {
      claimed = next;
      continue;
    }

    if (existing_index != none) {
      throw std::logic_error(
          "BUG: something added the result of ExtraFactory::create() more "
          "than once to a context's extra list");
    }
    existing_index = i;
  }

  // Easiest when there's neither existing state to carry over, nor a need to
  // change the extra list.
  if (claimed != nullptr && existing_index == none) {
    return context;
  }

  ExtraList new_extra = extra;

  if (claimed == nullptr) {
    claimed = create();
    claimed->try_to_claim(trace_id, span_id);
    new_extra.push_back(claimed);
  }

  if (existing_index != none) {
    const std::shared_ptr<Extra> existing = new_extra[existing_index];
    new_extra.erase(new_extra.begin() + existing_index);

    if (claimed->state_is_initial()) {
      claimed->adopt_state_of(*existing);
    } else if (!existing->state_is_initial()) {
      claimed->merge_state_from(*existing);
    }
  }

  return context.with_extra(std::move(new_extra));
}

}  // namespace tracing
}  // namespace tracebag
