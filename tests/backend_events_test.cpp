#include <gtest/gtest.h>

#include "enginebridge/backend_events.hpp"
#include "enginebridge/error.hpp"

#include "support/backend_frames.hpp"

using namespace enginebridge;
namespace ebt = enginebridge::testing;

TEST(BackendEventsTest, ParsesUpdateAndNestedBuffer) {
  auto event = parse_backend_frame(ebt::update_frame("thinking", "hmm"));
  ASSERT_TRUE(event.has_value());
  const auto* update = std::get_if<UpdateEvent>(&*event);
  ASSERT_NE(update, nullptr);

  auto payload = parse_buffer_payload(update->buffer);
  ASSERT_TRUE(payload.has_value());
  EXPECT_EQ(payload->segment_type, SegmentType::Thinking);
  EXPECT_EQ(payload->content, "hmm");
}

TEST(BackendEventsTest, ParsesStateEvent) {
  auto idle = parse_backend_frame(ebt::state_frame(false));
  ASSERT_TRUE(idle.has_value());
  EXPECT_FALSE(std::get<StateEvent>(*idle).in_progress);

  auto busy = parse_backend_frame(ebt::state_frame(true));
  ASSERT_TRUE(busy.has_value());
  EXPECT_TRUE(std::get<StateEvent>(*busy).in_progress);
}

TEST(BackendEventsTest, MissingFieldsFallBackToDefaults) {
  auto update = parse_backend_frame(R"({"type":"update"})");
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(std::get<UpdateEvent>(*update).buffer, "{}");
  EXPECT_FALSE(parse_buffer_payload("{}").has_value());

  auto state = parse_backend_frame(R"({"type":"state"})");
  ASSERT_TRUE(state.has_value());
  EXPECT_FALSE(std::get<StateEvent>(*state).in_progress);

  auto payload = parse_buffer_payload(R"({"type":"chat"})");
  ASSERT_TRUE(payload.has_value());
  EXPECT_TRUE(payload->content.empty());
}

TEST(BackendEventsTest, IgnoresUnknownTypes) {
  EXPECT_FALSE(parse_backend_frame(R"({"type":"presence","users":[]})").has_value());
  EXPECT_FALSE(parse_backend_frame(R"({"buffer":"{}"})").has_value());
  EXPECT_FALSE(parse_buffer_payload(R"({"type":"tool","chat":{"content":"x"}})").has_value());
}

TEST(BackendEventsTest, MalformedJsonIsProtocolError) {
  EXPECT_THROW(parse_backend_frame("{not json"), ProtocolError);
  EXPECT_THROW(parse_backend_frame("[1,2]"), ProtocolError);
  EXPECT_THROW(parse_buffer_payload("chat"), ProtocolError);
}
