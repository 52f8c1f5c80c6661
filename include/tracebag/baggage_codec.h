#pragma once

// This component provides an interface, `BaggageCodec`, for converting the
// fields of a `BaggageState` to and from the value of a request header, and
// an implementation of it, `W3CBaggageCodec`, for the W3C "baggage" header.
//
// `extract` and `inject` connect a codec to the `DictReader` and `DictWriter`
// interfaces used for headers and other carriers.

#include <string>
#include <utility>
#include <vector>

#include "baggage_field.h"
#include "baggage_state.h"
#include "expected.h"
#include "optional.h"
#include "string_view.h"

namespace tracebag {
namespace tracing {

class DictReader;
class DictWriter;

class BaggageCodec {
 public:
  virtual ~BaggageCodec() {}

  // Return the names of the headers that `decode` understands.
  virtual const std::vector<std::string>& extract_key_names() const = 0;
  // Return the names of the headers that `encode` produces.
  virtual const std::vector<std::string>& inject_key_names() const = 0;

  // Update the specified `state` with the fields in the specified header
  // `value`. Return whether `state` changed.
  virtual bool decode(BaggageState& state, StringView value) const = 0;

  // Return the header value for the specified `values`, or `nullopt` if no
  // field has a value.
  virtual Optional<std::string> encode(
      const BaggageState::Map& values) const = 0;
};

class W3CBaggageCodec : public BaggageCodec {
  std::vector<std::string> key_names_;

 public:
  using Items = std::vector<std::pair<std::string, std::string>>;

  W3CBaggageCodec();

  const std::vector<std::string>& extract_key_names() const override;
  const std::vector<std::string>& inject_key_names() const override;

  // Fields are updated in header order. A malformed `value` updates nothing.
  bool decode(BaggageState& state, StringView value) const override;

  // Fields without a value are omitted.
  Optional<std::string> encode(const BaggageState::Map& values) const override;

  // Return the key/value pairs in the specified `value` of a "baggage"
  // header, in order, or an error if `value` is malformed. Whitespace around
  // keys and values is ignored, and so are properties (the text following a
  // ";" in a list member).
  static Expected<Items> parse(StringView value);
};

// Decode each of the specified `codec`'s extract headers found in the
// specified `reader` into the specified `state`. Return whether `state`
// changed.
bool extract(BaggageState& state, const BaggageCodec& codec,
             const DictReader& reader);

// Encode the specified `state`, without the specified `filtered` fields, and
// write the result to each of the specified `codec`'s inject headers in the
// specified `writer`. Write nothing if no field has a value. Return an error
// if more than 64 fields are filtered.
Expected<void> inject(const BaggageState& state, const BaggageCodec& codec,
                      DictWriter& writer,
                      const std::vector<BaggageField>& filtered = {});

}  // namespace tracing
}  // namespace tracebag
