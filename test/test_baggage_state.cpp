#include <tracebag/baggage_config.h>
#include <tracebag/baggage_fields_factory.h>
#include <tracebag/baggage_state.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "loggers.h"
#include "test.h"

#define STATE_TEST(x) TEST_CASE(x, "[baggage_state]")

using namespace tracebag::tracing;

namespace {

struct Fixture {
  std::shared_ptr<MockLogger> logger = std::make_shared<MockLogger>();
  std::unique_ptr<BaggageFieldsFactory> factory;

  explicit Fixture(std::vector<std::string> fields, bool dynamic = false,
                   std::size_t max_fields = 64,
                   std::size_t update_attempts = 3) {
    BaggageConfig config;
    config.fields = std::move(fields);
    config.dynamic = dynamic;
    config.max_fields = max_fields;
    config.update_attempts = update_attempts;
    config.logger = logger;
    config.log_on_startup = false;

    auto finalized = finalize_config(config);
    REQUIRE(finalized);
    factory = std::make_unique<BaggageFieldsFactory>(*finalized);
  }

  std::shared_ptr<BaggageState> new_state() const {
    return std::static_pointer_cast<BaggageState>(factory->create());
  }
};

std::vector<std::string> names(const std::vector<BaggageField>& fields) {
  std::vector<std::string> result;
  for (const auto& field : fields) {
    result.push_back(field.name());
  }
  return result;
}

BaggageField field(std::string name) { return BaggageField{std::move(name)}; }

}  // namespace

STATE_TEST("a new state has the configured fields without values") {
  Fixture fixture{{"country-code", "user-id"}};
  const auto state = fixture.new_state();

  CHECK(!state->is_dynamic());
  CHECK(names(state->get_all_fields()) ==
        std::vector<std::string>{"country-code", "user-id"});
  CHECK(state->get_value(field("country-code")) == nullopt);
  CHECK(state->get_value(field("user-id")) == nullopt);
  CHECK(state->array() == fixture.factory->initial_array());
  CHECK(state->to_string() == "BaggageState{country-code=null,user-id=null}");
}

STATE_TEST("update_value") {
  Fixture fixture{{"a", "b"}};
  const auto state = fixture.new_state();

  SECTION("sets a configured field") {
    CHECK(state->update_value(field("a"), "1"));
    CHECK(state->get_value(field("a")) == "1");
    CHECK(state->get_value(field("b")) == nullopt);
    CHECK(state->array() != fixture.factory->initial_array());
    CHECK(state->to_string() == "BaggageState{a=1,b=null}");

    // The initial array is shared, and so never modified.
    CHECK(fixture.new_state()->get_value(field("a")) == nullopt);
  }

  SECTION("field names are not case sensitive") {
    CHECK(state->update_value(field("A"), "1"));
    CHECK(state->get_value(field("a")) == "1");
    CHECK(names(state->get_all_fields()) == std::vector<std::string>{"a", "b"});
  }

  SECTION("setting the same value again changes nothing") {
    REQUIRE(state->update_value(field("a"), "1"));
    const auto before = state->array();
    CHECK(!state->update_value(field("a"), "1"));
    CHECK(state->array() == before);
    CHECK(!state->update_value(field("b"), nullopt));
    CHECK(state->array() == before);
  }

  SECTION("nullopt clears the value but keeps the field") {
    REQUIRE(state->update_value(field("a"), "1"));
    CHECK(state->update_value(field("a"), nullopt));
    CHECK(state->get_value(field("a")) == nullopt);
    CHECK(names(state->get_all_fields()) == std::vector<std::string>{"a", "b"});
  }

  SECTION("unknown fields are ignored unless dynamic") {
    const auto before = state->array();
    CHECK(!state->update_value(field("c"), "3"));
    CHECK(state->array() == before);
    CHECK(state->get_value(field("c")) == nullopt);
    CHECK(fixture.logger->error_count() == 0);
  }

  SECTION("old snapshots are unaffected") {
    REQUIRE(state->update_value(field("a"), "1"));
    auto snapshot = state->to_map_filtering_fields();
    REQUIRE(snapshot);
    REQUIRE(state->update_value(field("a"), "2"));
    CHECK(snapshot->get(field("a")) == "1");
    CHECK(state->get_value(field("a")) == "2");
  }
}

STATE_TEST("dynamic fields") {
  Fixture fixture{{"a"}, true, 3};
  const auto state = fixture.new_state();
  CHECK(state->is_dynamic());

  SECTION("are appended after the configured fields") {
    CHECK(state->update_value(field("c"), "3"));
    CHECK(state->update_value(field("b"), "2"));
    CHECK(names(state->get_all_fields()) ==
          std::vector<std::string>{"a", "c", "b"});
    CHECK(state->get_value(field("b")) == "2");
    CHECK(state->get_value(field("C")) == "3");
    CHECK(state->to_string() == "BaggageState{a=null,c=3,b=2}");
  }

  SECTION("may be added without a value") {
    CHECK(state->update_value(field("b"), nullopt));
    CHECK(names(state->get_all_fields()) == std::vector<std::string>{"a", "b"});
    CHECK(state->get_value(field("b")) == nullopt);
  }

  SECTION("are limited by max_fields") {
    REQUIRE(state->update_value(field("b"), "2"));
    REQUIRE(state->update_value(field("c"), "3"));
    const auto before = state->array();

    CHECK(!state->update_value(field("d"), "4"));
    CHECK(state->array() == before);
    CHECK(fixture.logger->error_count() == 1);
    CHECK(fixture.logger->first_error().find("\"d\"") != std::string::npos);

    // Fields already present can still change.
    CHECK(state->update_value(field("c"), "33"));
    CHECK(state->get_value(field("c")) == "33");
    CHECK(fixture.logger->error_count() == 1);
  }
}

STATE_TEST("to_map_filtering_fields") {
  Fixture fixture{{"a", "b", "c"}};
  const auto state = fixture.new_state();
  REQUIRE(state->update_value(field("a"), "1"));
  REQUIRE(state->update_value(field("b"), "2"));

  SECTION("without filters shows everything") {
    auto map = state->to_map_filtering_fields();
    REQUIRE(map);
    CHECK(map->size() == 3);
    CHECK(map->array() == state->array());
  }

  SECTION("hides the filtered fields") {
    auto map = state->to_map_filtering_fields({field("B"), field("unknown")});
    REQUIRE(map);
    CHECK(map->to_string() == "UnsafeArrayMap{a=1,c=null}");
    CHECK(!map->contains_key(field("b")));
  }

  SECTION("rejects more than 64 filtered fields") {
    std::vector<BaggageField> filtered;
    for (int i = 0; i < 65; ++i) {
      filtered.push_back(field("f" + std::to_string(i)));
    }
    auto map = state->to_map_filtering_fields(filtered);
    REQUIRE(!map);
    CHECK(map.error().code == Error::TOO_MANY_FILTERED_KEYS);
  }
}

STATE_TEST("concurrent additions of distinct fields all succeed") {
  const std::size_t num_threads = 32;
  // Each lost race means another thread's field went in, so a thread can
  // lose at most `num_threads - 1` times.
  Fixture fixture{{}, true, 64, num_threads};
  const auto state = fixture.new_state();

  std::atomic<std::size_t> successes{0};
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&, i]() {
      if (state->update_value(field("field" + std::to_string(i)),
                              std::to_string(i))) {
        ++successes;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  CHECK(successes.load() == num_threads);
  CHECK(state->get_all_fields().size() == num_threads);
  for (std::size_t i = 0; i < num_threads; ++i) {
    CHECK(state->get_value(field("field" + std::to_string(i))) ==
          std::to_string(i));
  }
  CHECK(fixture.logger->error_count() == 0);
}

STATE_TEST("an update that keeps losing races is logged") {
  const std::size_t num_threads = 16;
  Fixture fixture{{}, true, 64, 1};
  const auto state = fixture.new_state();

  std::atomic<std::size_t> successes{0};
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < num_threads; ++i) {
    threads.emplace_back([&, i]() {
      if (state->update_value(field("field" + std::to_string(i)), "x")) {
        ++successes;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  // Every update is either applied or reported.
  const std::size_t applied = successes.load();
  CHECK(applied >= 1);
  CHECK(state->get_all_fields().size() == applied);
  CHECK(applied + std::size_t(fixture.logger->error_count()) == num_threads);
  if (fixture.logger->error_count() > 0) {
    CHECK(fixture.logger->first_error().find("Failed to update") !=
          std::string::npos);
  }
}

STATE_TEST("merge_state_keeping_ours_on_conflict") {
  Fixture fixture{{"a", "b"}, true};
  const auto ours = fixture.new_state();
  const auto theirs = fixture.new_state();

  SECTION("ours wins unless it has no value") {
    REQUIRE(ours->update_value(field("a"), "1"));
    REQUIRE(theirs->update_value(field("a"), "2"));
    REQUIRE(theirs->update_value(field("b"), "3"));
    REQUIRE(theirs->update_value(field("c"), "4"));
    const auto before = ours->array();

    const auto merged = ours->merge_state_keeping_ours_on_conflict(*theirs);
    CHECK(BaggageState::Map::create(merged).to_string() ==
          "UnsafeArrayMap{a=1,b=3,c=4}");
    // Neither state changes.
    CHECK(ours->array() == before);
    CHECK(theirs->get_value(field("a")) == "2");
  }

  SECTION("their missing values don't clear ours") {
    REQUIRE(ours->update_value(field("a"), "1"));
    REQUIRE(theirs->update_value(field("b"), "2"));
    REQUIRE(theirs->update_value(field("b"), nullopt));
    CHECK(ours->merge_state_keeping_ours_on_conflict(*theirs) ==
          ours->array());
  }

  SECTION("nothing to merge returns our array") {
    REQUIRE(ours->update_value(field("a"), "1"));
    REQUIRE(ours->update_value(field("c"), "3"));
    REQUIRE(theirs->update_value(field("a"), "2"));
    REQUIRE(theirs->update_value(field("c"), "4"));
    CHECK(ours->merge_state_keeping_ours_on_conflict(*theirs) ==
          ours->array());
    CHECK(ours->merge_state_keeping_ours_on_conflict(*ours) == ours->array());
  }

  SECTION("new fields keep their order") {
    REQUIRE(ours->update_value(field("x"), "1"));
    REQUIRE(theirs->update_value(field("z"), "26"));
    REQUIRE(theirs->update_value(field("y"), "25"));
    const auto merged = ours->merge_state_keeping_ours_on_conflict(*theirs);
    CHECK(BaggageState::Map::create(merged).to_string() ==
          "UnsafeArrayMap{a=null,b=null,x=1,z=26,y=25}");
  }
}

STATE_TEST("merging beyond max_fields drops only the overflow") {
  Fixture fixture{{"a"}, true, 3};
  const auto ours = fixture.new_state();
  const auto theirs = fixture.new_state();
  REQUIRE(ours->update_value(field("b"), "2"));
  REQUIRE(theirs->update_value(field("a"), "1"));
  REQUIRE(theirs->update_value(field("c"), "3"));
  REQUIRE(theirs->update_value(field("d"), "4"));

  std::shared_ptr<const BaggageState::Array> merged;
  REQUIRE_NOTHROW(merged = ours->merge_state_keeping_ours_on_conflict(*theirs));
  CHECK(BaggageState::Map::create(merged).to_string() ==
        "UnsafeArrayMap{a=1,b=2,c=3}");
  CHECK(fixture.logger->error_count() == 1);
  CHECK(fixture.logger->first_error().find("Ignoring 1") != std::string::npos);
}

STATE_TEST("equality compares current contents") {
  Fixture fixture{{"a"}, true};
  const auto left = fixture.new_state();
  const auto right = fixture.new_state();
  CHECK(*left == *right);

  REQUIRE(left->update_value(field("a"), "1"));
  CHECK(*left != *right);
  REQUIRE(right->update_value(field("A"), "1"));
  CHECK(*left == *right);

  REQUIRE(left->update_value(field("b"), nullopt));
  CHECK(*left != *right);
}
