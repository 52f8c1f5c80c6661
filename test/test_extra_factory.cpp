#include <tracebag/baggage_config.h>
#include <tracebag/baggage_fields_factory.h>
#include <tracebag/baggage_state.h>
#include <tracebag/extra.h>
#include <tracebag/null_logger.h>
#include <tracebag/trace_context.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "test.h"

#define DECORATE_TEST(x) TEST_CASE(x, "[extra]")

using namespace tracebag::tracing;

namespace {

std::unique_ptr<BaggageFieldsFactory> make_factory(
    std::vector<std::string> fields, bool dynamic = true) {
  BaggageConfig config;
  config.fields = std::move(fields);
  config.dynamic = dynamic;
  config.logger = std::make_shared<NullLogger>();
  config.log_on_startup = false;

  auto finalized = finalize_config(config);
  REQUIRE(finalized);
  return std::make_unique<BaggageFieldsFactory>(*finalized);
}

std::shared_ptr<BaggageState> new_state(const BaggageFieldsFactory& factory) {
  return std::static_pointer_cast<BaggageState>(factory.create());
}

BaggageField field(std::string name) { return BaggageField{std::move(name)}; }

const TraceID trace_id{0xcafebabe, 0xdeadbeef};

}  // namespace

DECORATE_TEST("try_to_claim") {
  const auto factory = make_factory({"a"});
  const auto state = factory->create();

  CHECK(state->try_to_claim(trace_id, 1));
  // Claiming again for the same span is fine.
  CHECK(state->try_to_claim(trace_id, 1));
  CHECK(!state->try_to_claim(trace_id, 2));
  CHECK(!state->try_to_claim(TraceID{0xcafebabe}, 1));
}

DECORATE_TEST("decorating a context without state adds a claimed state") {
  const auto factory = make_factory({"a"});
  const TraceContext context{trace_id, 1};
  CHECK(factory->find(context) == nullptr);

  const TraceContext decorated = factory->decorate(context);
  CHECK(decorated.trace_id() == trace_id);
  CHECK(decorated.span_id() == 1);
  REQUIRE(decorated.extra().size() == 1);
  const auto state = factory->find(decorated);
  REQUIRE(state != nullptr);
  CHECK(state->array() == factory->initial_array());

  // The original context is never modified.
  CHECK(context.extra().empty());

  // The new state belongs to this span.
  CHECK(state->try_to_claim(trace_id, 1));
  CHECK(!state->try_to_claim(trace_id, 2));
}

DECORATE_TEST("decorating an already decorated context changes nothing") {
  const auto factory = make_factory({"a"});
  const TraceContext decorated = factory->decorate(TraceContext{trace_id, 1});
  const TraceContext again = factory->decorate(decorated);
  CHECK(again.extra_list() == decorated.extra_list());
}

DECORATE_TEST("a child span gets its own copy of its parent's state") {
  const auto factory = make_factory({"a", "b"});
  const TraceContext parent = factory->decorate(TraceContext{trace_id, 1});
  const auto parent_state = factory->find(parent);
  REQUIRE(parent_state->update_value(field("a"), "1"));

  const TraceContext child = factory->decorate(parent.child(2));
  REQUIRE(child.extra().size() == 1);
  const auto child_state = factory->find(child);
  REQUIRE(child_state != nullptr);
  CHECK(child_state != parent_state);

  // The child adopted the parent's array wholesale.
  CHECK(child_state->array() == parent_state->array());
  CHECK(child_state->get_value(field("a")) == "1");

  SECTION("changes to the child are invisible to the parent") {
    REQUIRE(child_state->update_value(field("a"), "2"));
    REQUIRE(child_state->update_value(field("c"), "3"));
    CHECK(parent_state->get_value(field("a")) == "1");
    CHECK(parent_state->get_value(field("c")) == nullopt);
  }

  SECTION("siblings don't see each other's changes") {
    const TraceContext sibling = factory->decorate(parent.child(3));
    const auto sibling_state = factory->find(sibling);
    REQUIRE(child_state->update_value(field("b"), "child"));
    REQUIRE(sibling_state->update_value(field("b"), "sibling"));
    CHECK(child_state->get_value(field("b")) == "child");
    CHECK(sibling_state->get_value(field("b")) == "sibling");
    CHECK(parent_state->get_value(field("b")) == nullopt);
  }
}

DECORATE_TEST("a diverged unclaimed state is merged with its ancestor") {
  const auto factory = make_factory({"a", "b"});
  const TraceContext parent = factory->decorate(TraceContext{trace_id, 1});
  const auto parent_state = factory->find(parent);
  REQUIRE(parent_state->update_value(field("a"), "parent"));
  REQUIRE(parent_state->update_value(field("c"), "parent"));

  // For example, state that was extracted from a request and attached to the
  // child before the child was decorated.
  const auto extracted = new_state(*factory);
  REQUIRE(extracted->update_value(field("a"), "extracted"));
  REQUIRE(extracted->update_value(field("d"), "extracted"));

  const TraceContext undecorated{trace_id, 2,
                                 ExtraList{parent.extra()[0], extracted}};
  const TraceContext child = factory->decorate(undecorated);

  REQUIRE(child.extra().size() == 1);
  CHECK(factory->find(child) == extracted);
  CHECK(extracted->to_string() ==
        "BaggageState{a=extracted,b=null,d=extracted,c=parent}");
  CHECK(parent_state->to_string() ==
        "BaggageState{a=parent,b=null,c=parent}");
}

DECORATE_TEST("an initial ancestor leaves a diverged state alone") {
  const auto factory = make_factory({"a"});
  const auto ancestor = new_state(*factory);
  REQUIRE(ancestor->try_to_claim(trace_id, 1));

  const auto ours = new_state(*factory);
  REQUIRE(ours->update_value(field("a"), "1"));
  const auto before = ours->array();

  const TraceContext child =
      factory->decorate(TraceContext{trace_id, 2, ExtraList{ancestor, ours}});
  REQUIRE(child.extra().size() == 1);
  CHECK(child.extra()[0] == ours);
  CHECK(ours->array() == before);
}

DECORATE_TEST("state attached twice to a context is a bug") {
  const auto factory = make_factory({"a"});
  const auto first = factory->create();
  const auto second = factory->create();
  REQUIRE(first->try_to_claim(trace_id, 1));
  REQUIRE(second->try_to_claim(trace_id, 3));

  const TraceContext context{trace_id, 2, ExtraList{first, second}};
  CHECK_THROWS_AS(factory->decorate(context), std::logic_error);
}

DECORATE_TEST("factories manage only their own state") {
  const auto requests = make_factory({"request-id"});
  const auto users = make_factory({"user-id"});

  const TraceContext context =
      users->decorate(requests->decorate(TraceContext{trace_id, 1}));
  REQUIRE(context.extra().size() == 2);

  const auto request_state = requests->find(context);
  const auto user_state = users->find(context);
  REQUIRE(request_state != nullptr);
  REQUIRE(user_state != nullptr);
  CHECK(&request_state->factory() == requests.get());
  CHECK(&user_state->factory() == users.get());

  REQUIRE(request_state->update_value(field("request-id"), "r1"));
  CHECK(user_state->get_value(field("request-id")) == nullopt);

  // Decorating a child with one factory leaves the other's state in place.
  const TraceContext child = requests->decorate(context.child(2));
  REQUIRE(child.extra().size() == 2);
  CHECK(users->find(child) == user_state);
  const auto child_request_state = requests->find(child);
  CHECK(child_request_state != request_state);
  CHECK(child_request_state->get_value(field("request-id")) == "r1");
}

DECORATE_TEST("null entries in the extra list are skipped") {
  const auto factory = make_factory({"a"});
  const TraceContext context{trace_id, 1, ExtraList{nullptr}};
  const TraceContext decorated = factory->decorate(context);
  REQUIRE(decorated.extra().size() == 2);
  CHECK(decorated.extra()[0] == nullptr);
  CHECK(factory->find(decorated) != nullptr);
}
