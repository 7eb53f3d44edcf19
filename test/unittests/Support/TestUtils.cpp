// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Utils.h"

#include "testing/Utils.h"

#include <cstdint>
#include <vector>

namespace wave::utils {

namespace {

TEST(UtilsTest, CeilDiv) {
  EXPECT_EQ(ceilDiv<std::int64_t>(8, 2), 4);
  EXPECT_EQ(ceilDiv<std::int64_t>(9, 2), 5);
  EXPECT_EQ(ceilDiv<std::int64_t>(1, 16), 1);
}

TEST(UtilsTest, Product) {
  std::vector<std::int64_t> shape = {2, 3, 4};
  EXPECT_EQ(product(shape.begin(), shape.end()), 24);
  EXPECT_EQ(product(shape.begin(), shape.begin()), 1);
}

TEST(UtilsTest, CalculateStrides) {
  llvm::SmallVector<std::int64_t> shape = {4, 2};
  EXPECT_EQ(calculateStrides<std::int64_t>(shape),
            (llvm::SmallVector<std::int64_t>{2, 1}));

  llvm::SmallVector<std::int64_t> shape3 = {2, 3, 5};
  EXPECT_EQ(calculateStrides<std::int64_t>(shape3),
            (llvm::SmallVector<std::int64_t>{15, 5, 1}));
}

TEST(UtilsTest, SampleRowMajor) {
  llvm::SmallVector<llvm::SmallVector<std::int64_t>> points;
  sample({2, 2}, [&](llvm::ArrayRef<std::int64_t> index) {
    points.emplace_back(index.begin(), index.end());
  });
  ASSERT_EQ(points.size(), 4u);
  EXPECT_EQ(points[0], (llvm::SmallVector<std::int64_t>{0, 0}));
  EXPECT_EQ(points[1], (llvm::SmallVector<std::int64_t>{0, 1}));
  EXPECT_EQ(points[2], (llvm::SmallVector<std::int64_t>{1, 0}));
  EXPECT_EQ(points[3], (llvm::SmallVector<std::int64_t>{1, 1}));
}

TEST(UtilsTest, SampleRankZero) {
  unsigned calls = 0;
  sample({}, [&](llvm::ArrayRef<std::int64_t> index) {
    EXPECT_TRUE(index.empty());
    ++calls;
  });
  EXPECT_EQ(calls, 1u);
}

TEST(UtilsTest, Join) {
  std::vector<int> values = {1, 2, 3};
  EXPECT_EQ(join(values, ", "), "1, 2, 3");
}

} // namespace

} // namespace wave::utils
