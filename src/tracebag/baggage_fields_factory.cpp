#include <tracebag/baggage_fields_factory.h>
#include <tracebag/logger.h>

#include <ostream>
#include <utility>

namespace tracebag {
namespace tracing {

BaggageFieldsFactory::BaggageFieldsFactory(
    const FinalizedBaggageConfig& config)
    : initial_fields_(config.fields),
      dynamic_(config.dynamic),
      max_fields_(config.max_fields),
      update_attempts_(config.update_attempts),
      logger_(config.logger) {
  auto initial = std::make_shared<BaggageState::Array>();
  initial->reserve(initial_fields_.size());
  for (std::size_t i = 0; i < initial_fields_.size(); ++i) {
    initial->push_back(BaggageState::Array::value_type{initial_fields_[i],
                                                        nullopt});
    initial_field_indices_.emplace(initial_fields_[i], i);
  }
  initial_array_ = std::move(initial);

  if (config.log_on_startup) {
    logger_->log_startup([&](std::ostream& log) {
      log << "TRACEBAG BAGGAGE CONFIGURATION - " << config_json(config);
    });
  }
}

std::shared_ptr<Extra> BaggageFieldsFactory::create() const {
  // `BaggageState`'s constructor is private, so `std::make_shared` can't call
  // it.
  return std::shared_ptr<BaggageState>(new BaggageState(*this));
}

std::shared_ptr<BaggageState> BaggageFieldsFactory::find(
    const TraceContext& context) const {
  for (const auto& extra : context.extra()) {
    if (extra != nullptr && &extra->factory() == this) {
      return std::static_pointer_cast<BaggageState>(extra);
    }
  }
  return nullptr;
}

}  // namespace tracing
}  // namespace tracebag
