// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Asserts.h"

#include "testing/Utils.h"

#include <string>
#include <string_view>

#if !defined(WAVE_ASSERT_DISABLE_ASSERTS)

// Assert failure messages must reach stderr before the process terminates.

#define WAVE_STANDARD_ASSERT_MSG_PREFIX(condition)                             \
  "Assertion `" #condition "` failed"                                          \
  ".*"

TEST(AssertsDeathTest, BinaryExprDecomposition) {
  ASSERT_DEATH(
      {
        int32_t x = 1;
        int32_t y = 2;
        WAVE_assert(x == y);
      },
      WAVE_STANDARD_ASSERT_MSG_PREFIX(x == y) "1 == 2");
  ASSERT_DEATH(
      {
        int64_t replicas = 4;
        int64_t index = 4;
        WAVE_assert(index < replicas);
      },
      WAVE_STANDARD_ASSERT_MSG_PREFIX(index < replicas) "4 < 4");
  // With custom formatted context.
  ASSERT_DEATH(
      {
        int32_t x = 1;
        int32_t y = 2;
        WAVE_assertv(x == y, "x-y was {0}", x - y);
      },
      WAVE_STANDARD_ASSERT_MSG_PREFIX(x == y) "x-y was -1");
  // Strings and views.
  ASSERT_DEATH(
      {
        std::string s = "read";
        WAVE_assert(s != "read");
      },
      WAVE_STANDARD_ASSERT_MSG_PREFIX(s != "read") "read != read");
  ASSERT_DEATH(
      {
        using namespace std::literals;

        auto sa = "mma"sv;
        const std::string sb = "reduce";
        WAVE_assert(sa == sb);
      },
      WAVE_STANDARD_ASSERT_MSG_PREFIX(sa == sb) "mma == reduce");
}

TEST(AssertsDeathTest, IntegralRangeChecks) {
  ASSERT_DEATH(
      {
        int32_t y = 20;
        WAVE_assert_limit(y, 20);
      },
      "20 is not in \\[0, 20\\)");
  ASSERT_DEATH(
      {
        int32_t y = -1;
        WAVE_assert_limit(y, 3);
      },
      "-1 is not in \\[0, 3\\)");
}

TEST(AssertsDeathTest, GraphInvariants) {
  ASSERT_DEATH(
      {
        mlir::MLIRContext context;
        wave::IndexingContext idxc(&context);
        wave::Graph graph(idxc);
        wave::GraphBuilder builder(graph);
        wave::NodeId x =
            builder.placeholder("x", wave::DataType::f32);
        builder.binary("y", "add", x, x);
        graph.erase(x);
      },
      "cannot erase x, it still has 2 users");
}

#undef WAVE_STANDARD_ASSERT_MSG_PREFIX

#endif // WAVE_ASSERT_DISABLE_ASSERTS

// WAVE_debug* asserts are elided unless WAVE_ASSERT_ENABLE_DEBUG_ASSERTS is
// defined.
TEST(AssertsDeathTest, MacroElisionDebug) {
#if !defined(WAVE_ASSERT_ENABLE_DEBUG_ASSERTS)
  WAVE_debug(2 < 1);
  WAVE_debugv(2 + 2 != 4, "was hoping against hope");
#endif // WAVE_ASSERT_ENABLE_DEBUG_ASSERTS
}
