#include <tracebag/baggage_codec.h>
#include <tracebag/baggage_config.h>
#include <tracebag/baggage_fields_factory.h>
#include <tracebag/dict_reader.h>
#include <tracebag/dict_writer.h>
#include <tracebag/null_logger.h>
#include <tracebag/string_view.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

namespace tb = tracebag::tracing;

class MapReader : public tb::DictReader {
  std::unordered_map<std::string, std::string> map_;

 public:
  ~MapReader() override = default;

  MapReader(std::unordered_map<std::string, std::string> map)
      : map_(std::move(map)) {}

  tb::Optional<tb::StringView> lookup(tb::StringView key) const override {
    auto it = map_.find(std::string(key));
    if (it == map_.cend()) return tb::nullopt;

    return it->second;
  }

  void visit(const std::function<void(tb::StringView key,
                                      tb::StringView value)>&) const override{};
};

class NullWriter : public tb::DictWriter {
 public:
  void set(tb::StringView, tb::StringView) override {}
};

extern "C" int LLVMFuzzerTestOneInput(const std::uint8_t* data, size_t size) {
  static const tb::BaggageFieldsFactory factory = [] {
    tb::BaggageConfig config;
    config.fields = {"user-id"};
    config.dynamic = true;
    config.logger = std::make_shared<tb::NullLogger>();
    config.log_on_startup = false;
    return tb::BaggageFieldsFactory{*tb::finalize_config(config)};
  }();
  static const tb::W3CBaggageCodec codec;

  const auto context = factory.decorate(tb::TraceContext{tb::TraceID{1}, 1});
  const auto state = factory.find(context);

  MapReader reader({{"baggage", std::string((const char*)data, size)}});
  tb::extract(*state, codec, reader);

  NullWriter writer;
  tb::inject(*state, codec, writer);
  return 0;
}
