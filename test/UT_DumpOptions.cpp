#include <gtest/gtest.h>

#include <limits>

#include "rxd/dump/DumpOptions.h"
#include "rxd/utility/Exceptions.h"

using namespace rxd;

namespace testing {

TEST(DumpOptions, Defaults) {
  DumpOptions options;
  EXPECT_FALSE(options.GetControlPictures());
  EXPECT_FALSE(options.GetLineCount());
  EXPECT_EQ(options.GetLineWidth(), 16);
  EXPECT_EQ(options.GetByteGroupLength(), 1);
  EXPECT_FALSE(options.GetByteLimit());
}

TEST(DumpOptions, Chaining) {
  auto options = DumpOptions {}.SetControlPictures(true).SetLineCount(3).SetLineWidth(8).SetByteGroupLength(2);
  EXPECT_TRUE(options.GetControlPictures());
  ASSERT_TRUE(options.GetLineCount());
  EXPECT_EQ(*options.GetLineCount(), 3);
  EXPECT_EQ(options.GetLineWidth(), 8);
  EXPECT_EQ(options.GetByteGroupLength(), 2);
  ASSERT_TRUE(options.GetByteLimit());
  EXPECT_EQ(*options.GetByteLimit(), 24);

  // Setters return the same object.
  DumpOptions original;
  EXPECT_EQ(&original.SetLineWidth(4), &original);
}

TEST(DumpOptions, Remove_Line_Count) {
  auto options = DumpOptions {}.SetLineCount(0);
  ASSERT_TRUE(options.GetLineCount());
  EXPECT_EQ(*options.GetByteLimit(), 0);

  options.SetLineCount(std::nullopt);
  EXPECT_FALSE(options.GetLineCount());
}

TEST(DumpOptions, Byte_Limit_Saturates) {
  auto options = DumpOptions {}.SetLineCount(std::size_t {1} << 60).SetLineWidth(16);
  ASSERT_TRUE(options.GetByteLimit());
  EXPECT_EQ(*options.GetByteLimit(), std::numeric_limits<offset_t>::max());

  options.SetLineCount(std::numeric_limits<std::size_t>::max()).SetLineWidth(256);
  EXPECT_EQ(*options.GetByteLimit(), std::numeric_limits<offset_t>::max());

  // The largest count that still fits is exact.
  options.SetLineCount(std::numeric_limits<offset_t>::max() / 256);
  EXPECT_EQ(*options.GetByteLimit(), std::numeric_limits<offset_t>::max() / 256 * 256);
}

TEST(DumpOptions, Width_Bounds) {
  DumpOptions options;
  EXPECT_NO_THROW(options.SetLineWidth(1));
  EXPECT_NO_THROW(options.SetLineWidth(256));
  EXPECT_THROW(options.SetLineWidth(0), InvalidConfiguration);
  EXPECT_THROW(options.SetLineWidth(257), InvalidConfiguration);
  // A rejected value leaves the last good one in place.
  EXPECT_EQ(options.GetLineWidth(), 256);

  EXPECT_NO_THROW(options.SetByteGroupLength(1));
  EXPECT_NO_THROW(options.SetByteGroupLength(256));
  EXPECT_THROW(options.SetByteGroupLength(0), InvalidConfiguration);
  EXPECT_THROW(options.SetByteGroupLength(1000), InvalidConfiguration);
  EXPECT_EQ(options.GetByteGroupLength(), 256);
}

TEST(DumpOptions, Error_Names_Value) {
  try {
    DumpOptions {}.SetLineWidth(300);
    FAIL() << "expected InvalidConfiguration";
  }
  catch (const InvalidConfiguration& ex) {
    std::string message = ex.what();
    EXPECT_NE(message.find("line width"), std::string::npos);
    EXPECT_NE(message.find("300"), std::string::npos);
  }

  try {
    DumpOptions {}.SetByteGroupLength(0);
    FAIL() << "expected InvalidConfiguration";
  }
  catch (const InvalidConfiguration& ex) {
    std::string message = ex.what();
    EXPECT_NE(message.find("byte group length"), std::string::npos);
    EXPECT_NE(message.find("0"), std::string::npos);
  }
}

}  // namespace testing
