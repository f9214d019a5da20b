#include <gtest/gtest.h>

#include "analysis/stream_event_adapter.h"
#include "test_util.h"

using namespace analysis;
using testutil::S;

namespace {

storage::Mutation mutation(storage::MutationKind kind, uint64_t seq, const std::string& id) {
  storage::Mutation m;
  m.kind = kind;
  m.table_name = "orders";
  m.keys = storage::Item{{"order_id", S(id)}};
  if (kind != storage::MutationKind::Remove) m.new_image = storage::Item{{"order_id", S(id)}, {"status", S("new")}};
  if (kind != storage::MutationKind::Insert) m.old_image = storage::Item{{"order_id", S(id)}, {"status", S("old")}};
  m.sequence = seq;
  m.size_bytes = 20;
  return m;
}

OperationRecord write(std::vector<storage::Mutation> mutations) {
  OperationRecord r;
  r.kind = OperationKind::PutItem;
  r.table_name = "orders";
  r.success = true;
  r.timestamp_ms = 1700000000000;
  r.mutations = std::move(mutations);
  return r;
}

}  // namespace

TEST(StreamEventAdapter, PublishesOneEventPerMutation) {
  StreamEventAdapter streams;
  const auto events = streams.Publish(write({mutation(storage::MutationKind::Insert, 1, "o1")}));
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, storage::MutationKind::Insert);
  EXPECT_EQ(events[0].sequence, 1u);
  EXPECT_FALSE(events[0].event_id.empty());
  EXPECT_FALSE(events[0].old_image.has_value());
  EXPECT_EQ(streams.Size("orders"), 1u);
}

TEST(StreamEventAdapter, FailedOrEmptyWritesPublishNothing) {
  StreamEventAdapter streams;
  auto failed = write({mutation(storage::MutationKind::Insert, 1, "o1")});
  failed.success = false;
  EXPECT_TRUE(streams.Publish(failed).empty());
  EXPECT_TRUE(streams.Publish(write({})).empty());
  EXPECT_EQ(streams.Size("orders"), 0u);
}

TEST(StreamEventAdapter, LogStaysOrderedBySequence) {
  StreamEventAdapter streams;
  streams.Publish(write({mutation(storage::MutationKind::Insert, 1, "a")}));
  streams.Publish(write({mutation(storage::MutationKind::Modify, 3, "a")}));
  streams.Publish(write({mutation(storage::MutationKind::Insert, 2, "b")}));
  streams.Publish(write({mutation(storage::MutationKind::Remove, 4, "b")}));

  const auto recent = streams.Recent("orders", 10);
  ASSERT_EQ(recent.size(), 4u);
  for (size_t i = 0; i < recent.size(); ++i) EXPECT_EQ(recent[i].sequence, i + 1);

  const auto last_two = streams.Recent("orders", 2);
  ASSERT_EQ(last_two.size(), 2u);
  EXPECT_EQ(last_two[0].sequence, 3u);
  EXPECT_EQ(last_two[1].kind, storage::MutationKind::Remove);

  EXPECT_TRUE(streams.Recent("missing", 5).empty());
}

TEST(StreamEventAdapter, RendersStreamsRecord) {
  StreamEventAdapter streams;
  const auto events = streams.Publish(write({mutation(storage::MutationKind::Modify, 7, "o1")}));
  ASSERT_EQ(events.size(), 1u);

  const auto json = StreamEventToJson(events[0]);
  const auto v = json.View();
  EXPECT_EQ(std::string(v.GetString("eventName").c_str()), "MODIFY");
  EXPECT_EQ(std::string(v.GetString("eventSource").c_str()), "aws:dynamodb");
  const auto ddb = v.GetObject("dynamodb");
  EXPECT_EQ(std::string(ddb.GetString("SequenceNumber").c_str()), "7");
  EXPECT_EQ(std::string(ddb.GetString("StreamViewType").c_str()), "NEW_AND_OLD_IMAGES");
  EXPECT_EQ(std::string(ddb.GetObject("Keys").GetObject("order_id").GetString("S").c_str()), "o1");
  EXPECT_EQ(std::string(ddb.GetObject("NewImage").GetObject("status").GetString("S").c_str()), "new");
  EXPECT_EQ(std::string(ddb.GetObject("OldImage").GetObject("status").GetString("S").c_str()), "old");
  EXPECT_EQ(ddb.GetInt64("ApproximateCreationDateTime"), 1700000000);
}
