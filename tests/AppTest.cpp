#include <gtest/gtest.h>

#include "Jelly/Core/Exceptions.hpp"
#include "app.hpp"

namespace jelly {
  namespace {

    TEST(AppTest, ParsesPositiveFrameCount)
    {
      EXPECT_EQ(App::parseFrameCount("600"), 600u);
      EXPECT_EQ(App::parseFrameCount("1"), 1u);
    }

    TEST(AppTest, RejectsNegativeAndZeroFrameCount)
    {
      EXPECT_THROW(App::parseFrameCount("-5"), RuntimeException);
      EXPECT_THROW(App::parseFrameCount("0"), RuntimeException);
    }

    TEST(AppTest, RejectsMalformedFrameCount)
    {
      EXPECT_THROW(App::parseFrameCount("abc"), RuntimeException);
      EXPECT_THROW(App::parseFrameCount("12frames"), RuntimeException);
      EXPECT_THROW(App::parseFrameCount(""), RuntimeException);
      EXPECT_THROW(App::parseFrameCount("99999999999999999999999"), RuntimeException);
    }

  } // namespace
} // namespace jelly
