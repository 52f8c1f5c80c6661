#include <tracebag/baggage_codec.h>
#include <tracebag/baggage_config.h>
#include <tracebag/baggage_fields_factory.h>
#include <tracebag/dict_reader.h>
#include <tracebag/dict_writer.h>
#include <tracebag/trace_context.h>

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace tb = tracebag::tracing;

struct CinReader : public tb::DictReader {
  std::string input;

  tb::Optional<tb::StringView> lookup(tb::StringView key) const override {
    if (key != "baggage") return tb::nullopt;
    return input;
  }

  void visit(
      const std::function<void(tb::StringView key, tb::StringView value)>&
          visitor) const override {
    visitor("baggage", input);
  };
};

struct CoutWriter : public tb::DictWriter {
  void set(tb::StringView key, tb::StringView value) override {
    std::cout << key << ": " << value << '\n';
  }
};

int main() {
  tb::BaggageConfig cfg;
  cfg.fields = {"user-id", "session-id"};
  cfg.dynamic = true;
  cfg.log_on_startup = false;
  const auto finalized_cfg = tb::finalize_config(cfg);
  if (auto error = finalized_cfg.if_error()) {
    std::cerr << "Failed to configure baggage: " << error->message
              << std::endl;
    return error->code;
  }

  const tb::BaggageFieldsFactory factory(*finalized_cfg);
  const tb::W3CBaggageCodec codec;

  std::cout
      << "This program demonstrates how baggage, key-value pairs attached to "
         "a request, is carried from a parent span to its children.\n"
         "Each line you enter is parsed as a W3C \"baggage\" header into the "
         "parent span's baggage. A child span is then created, which starts "
         "with a copy of the parent's baggage and adds a field of its own.\n"
         "Try:\n"
         "- user-id=42,team=proxy\n"
         "- ,invalid=input\n"
         "or ./tracebag_baggage_example < list-of-baggages.txt\n\n";

  std::uint64_t next_span_id = 1;
  const tb::TraceID trace_id{0xcafebabe};

  CinReader reader;
  std::cout << "Enter baggage (or 'CTRL+C' to quit): ";
  while (std::getline(std::cin, reader.input)) {
    const auto parent =
        factory.decorate(tb::TraceContext{trace_id, next_span_id++});
    const auto parent_state = factory.find(parent);

    const auto parsed = tb::W3CBaggageCodec::parse(reader.input);
    if (auto error = parsed.if_error()) {
      std::cout << "Error parsing \"" << reader.input
                << "\": " << error->message << "\n";
    } else if (!tb::extract(*parent_state, codec, reader)) {
      std::cout << "No baggage field changed.\n";
    } else {
      const auto child = factory.decorate(parent.child(next_span_id++));
      const auto child_state = factory.find(child);
      child_state->update_value(tb::BaggageField{"span"}, "child");

      std::cout << "Parent: " << *parent_state << '\n'
                << "Child:  " << *child_state << '\n'
                << "Child's outgoing headers:\n";
      CoutWriter writer;
      if (auto injected = tb::inject(*child_state, codec, writer);
          !injected) {
        std::cout << injected.error() << '\n';
      }
    }

    std::cout << "\nEnter baggage (or 'CTRL+C' to quit): ";
  }
  return 0;
}
