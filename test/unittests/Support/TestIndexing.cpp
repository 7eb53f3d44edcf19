// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Support/Indexing.h"

#include "testing/Utils.h"

namespace wave {

namespace {

using IndexingContextTest = testing::IndexingTest;

TEST_F(IndexingContextTest, SymbolsAreUniqued) {
  EXPECT_EQ(idxc.getSymbol("M"), M);
  EXPECT_NE(M, N);
  EXPECT_EQ(idxc.getSymbolName(K), "K");
  EXPECT_TRUE(isIndexSymbol(M));
  EXPECT_FALSE(isIndexSymbol(M + 1));

  EXPECT_FALSE(idxc.lookupSymbol("NOT_CREATED").has_value());
  ASSERT_TRUE(idxc.lookupSymbol("BLOCK_K").has_value());
  EXPECT_EQ(*idxc.lookupSymbol("BLOCK_K"), BLOCK_K);
}

TEST_F(IndexingContextTest, StaticValues) {
  EXPECT_FALSE(idxc.getStaticValue(M).has_value());
  EXPECT_FALSE(idxc.isBound(M));

  idxc.bindConstant(M, 128);
  idxc.bindConstant(BLOCK_M, 32);
  EXPECT_TRUE(idxc.isBound(M));
  EXPECT_EQ(idxc.getStaticValue(M), 128);
  EXPECT_EQ(idxc.getStaticValue(M.ceilDiv(BLOCK_M)), 4);
  EXPECT_EQ(idxc.getStaticValue(M.floorDiv(2) + 3), 67);
  // N is still symbolic.
  EXPECT_FALSE(idxc.getStaticValue(M + N).has_value());

  // Rebinding overwrites.
  idxc.bindConstant(M, 64);
  EXPECT_EQ(idxc.getStaticValue(M.ceilDiv(BLOCK_M)), 2);
}

TEST_F(IndexingContextTest, Substitute) {
  IndexExpr half = K.floorDiv(2);
  EXPECT_EQ(idxc.substitute(half, {{K, constant(32)}}), constant(16));
  EXPECT_EQ(idxc.substitute(half, {{K, BLOCK_K}}), BLOCK_K.floorDiv(2));
  EXPECT_EQ(idxc.substitute(M + N, {}), M + N);
}

TEST_F(IndexingContextTest, Print) {
  EXPECT_EQ(idxc.str(M), "M");
  EXPECT_EQ(idxc.str(constant(7)), "7");
  EXPECT_EQ(idxc.str(K.floorDiv(2)), "K floordiv 2");
  EXPECT_EQ(idxc.str(M.ceilDiv(BLOCK_M)), "M ceildiv BLOCK_M");
  EXPECT_EQ(idxc.str(IndexExpr()), "<<null>>");
}

TEST_F(IndexingContextTest, InferDim) {
  EXPECT_EQ(inferDim(M), M);
  EXPECT_EQ(inferDim(K.floorDiv(2)), K);
  EXPECT_FALSE(inferDim(constant(4)));

  llvm::SmallVector<IndexExpr> dims =
      inferDims({M, constant(1), K.floorDiv(2)});
  ASSERT_EQ(dims.size(), 2u);
  EXPECT_EQ(dims[0], M);
  EXPECT_EQ(dims[1], K);
}

} // namespace

} // namespace wave
