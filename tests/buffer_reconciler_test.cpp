#include <gtest/gtest.h>

#include "enginebridge/buffer_reconciler.hpp"

#include <string>
#include <vector>

using enginebridge::BufferReconciler;
using enginebridge::ReconcileMode;
using enginebridge::SegmentType;

TEST(BufferReconcilerTest, FirstUpdateIsEmittedVerbatim) {
  BufferReconciler reconciler;
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, "Hello"), "Hello");
  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Undetermined);
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "Hello");
}

TEST(BufferReconcilerTest, GrowingSnapshotsConcatenateToFinalContent) {
  BufferReconciler reconciler;
  const std::vector<std::string> snapshots = {"The", "The quick", "The quick brown", "The quick brown fox"};

  std::string assembled;
  for (const auto& snapshot : snapshots) {
    assembled += reconciler.reconcile(SegmentType::Chat, snapshot);
  }

  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Snapshot);
  EXPECT_EQ(assembled, snapshots.back());
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), snapshots.back());
}

TEST(BufferReconcilerTest, NonContinuationSelectsDeltaMode) {
  BufferReconciler reconciler;
  const std::vector<std::string> deltas = {"Hello", ", wor", "ld", "!"};

  std::string assembled;
  for (const auto& delta : deltas) {
    assembled += reconciler.reconcile(SegmentType::Chat, delta);
  }

  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Delta);
  EXPECT_EQ(assembled, "Hello, world!");
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "Hello, world!");
}

TEST(BufferReconcilerTest, ModeIsStickyOnceDetermined) {
  BufferReconciler reconciler;
  reconciler.reconcile(SegmentType::Chat, "ab");
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, "cd"), "cd");
  ASSERT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Delta);

  // Looks like a snapshot of the accumulated text, but delta mode keeps it verbatim.
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, "abcdef"), "abcdef");
  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Delta);
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "abcdabcdef");
}

TEST(BufferReconcilerTest, EmptyContentIsIgnored) {
  BufferReconciler reconciler;
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, ""), "");
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "");

  reconciler.reconcile(SegmentType::Chat, "Hi");
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, ""), "");
  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Undetermined);
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "Hi");
}

TEST(BufferReconcilerTest, SegmentTypesAreTrackedIndependently) {
  BufferReconciler reconciler;
  reconciler.reconcile(SegmentType::Thinking, "step one");
  reconciler.reconcile(SegmentType::Thinking, "step one, step two");
  reconciler.reconcile(SegmentType::Chat, "Answer");
  reconciler.reconcile(SegmentType::Chat, " continues");

  EXPECT_EQ(reconciler.mode(SegmentType::Thinking), ReconcileMode::Snapshot);
  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Delta);
  EXPECT_EQ(reconciler.previous_content(SegmentType::Chat), "Answer continues");
}

TEST(BufferReconcilerTest, RepeatedSnapshotEmitsNothing) {
  BufferReconciler reconciler;
  reconciler.reconcile(SegmentType::Chat, "Same");
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, "Same"), "");
  EXPECT_EQ(reconciler.mode(SegmentType::Chat), ReconcileMode::Snapshot);
  EXPECT_EQ(reconciler.reconcile(SegmentType::Chat, "Same text"), " text");
}
