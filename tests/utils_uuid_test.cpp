#include <gtest/gtest.h>

#include "enginebridge/utils/uuid.hpp"

#include <regex>
#include <set>

TEST(UUIDTest, GeneratesValidUUIDv4Format) {
  const std::string id = enginebridge::utils::uuid4();
  static const std::regex pattern(R"([0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12})");

  EXPECT_EQ(id.size(), 36u);
  EXPECT_TRUE(std::regex_match(id, pattern));
}

TEST(UUIDTest, SessionIdsDoNotRepeat) {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    EXPECT_TRUE(seen.insert(enginebridge::utils::uuid4()).second);
  }
}
