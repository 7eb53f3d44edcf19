// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/IndexMapping.h"

#include "testing/Utils.h"

#include <initializer_list>
#include <string>

namespace wave {

namespace {

using testing::errorMessage;
using testing::unwrap;

class IndexMappingTest : public testing::IndexingTest {
protected:
  IndexExpr X = idxc.getSymbol("X");
  IndexExpr Y = idxc.getSymbol("Y");
  IndexExpr i = IndexMapping::iterator(idxc, 0);
  IndexExpr j = IndexMapping::iterator(idxc, 1);

  static SymbolsMap
  makeMap(std::initializer_list<std::pair<IndexExpr, IndexExpr>> entries) {
    SymbolsMap map;
    for (const auto &[symbol, expr] : entries) {
      map[symbol] = expr;
    }
    return map;
  }
};

TEST_F(IndexMappingTest, IteratorSymbols) {
  EXPECT_EQ(idxc.getSymbolName(i), "$index0");
  EXPECT_EQ(idxc.getSymbolName(j), "$index1");
  EXPECT_EQ(IndexMapping::iterator(idxc, 0), i);
  EXPECT_EQ(idxc.getSymbolName(IndexMapping::dynamicVal(idxc, 2)),
            "$dynamic_val2");
}

TEST_F(IndexMappingTest, IterationShapeFromTranspose) {
  // Reads X[j, i] into Y[i, j].
  IndexMapping mapping = unwrap(IndexMapping::get(
      idxc, 2, makeMap({{X, j}, {Y, i}}), makeMap({{X, i}, {Y, j}})));

  EXPECT_EQ(mapping.getNumIterators(), 2u);
  ASSERT_EQ(mapping.getIterationShape().size(), 2u);
  EXPECT_EQ(mapping.getIterationShape()[0], X);
  EXPECT_EQ(mapping.getIterationShape()[1], Y);

  EXPECT_FALSE(mapping.isInputIdentity());
  EXPECT_TRUE(mapping.isOutputIdentity());
  EXPECT_FALSE(mapping.isIdentity());

  EXPECT_EQ(mapping.getInputShape(), (llvm::SmallVector<IndexExpr>{X, Y}));
  EXPECT_EQ(mapping.mapInputIndices(), (llvm::SmallVector<IndexExpr>{j, i}));
  EXPECT_EQ(unwrap(mapping.mapInputIndices({Y, X})),
            (llvm::SmallVector<IndexExpr>{i, j}));
  EXPECT_EQ(mapping.getIterIndex(j), 1u);
  EXPECT_FALSE(mapping.getIterIndex(X).has_value());
}

TEST_F(IndexMappingTest, Identity) {
  IndexMapping mapping = unwrap(IndexMapping::get(
      idxc, 2, makeMap({{M, i}, {N, j}}), makeMap({{M, i}, {N, j}})));
  EXPECT_TRUE(mapping.isIdentity());
  EXPECT_EQ(mapping.getIterationShape()[0], M);
  EXPECT_EQ(mapping.getIterationShape()[1], N);
}

TEST_F(IndexMappingTest, OffsetCoordinatesDoNotUnify) {
  // `i + 1` is not a verbatim iterator, so only the output determines the
  // domain.
  IndexMapping mapping = unwrap(
      IndexMapping::get(idxc, 1, makeMap({{M, i + 1}}), makeMap({{N, i}})));
  EXPECT_EQ(mapping.getIterationShape()[0], N);
}

TEST_F(IndexMappingTest, IteratorConflict) {
  EXPECT_EQ(errorMessage(IndexMapping::get(idxc, 1, makeMap({{X, i}}),
                                           makeMap({{Y, i}}))),
            "iterator conflict: $index0 is claimed by X and Y");
}

TEST_F(IndexMappingTest, SameCoordinateOnDistinctIterators) {
  // Each iterator is claimed by one symbol only, so both take the size of X.
  IndexMapping mapping = unwrap(
      IndexMapping::get(idxc, 2, makeMap({{X, i}}), makeMap({{X, j}})));
  EXPECT_EQ(mapping.getIterationShape()[0], X);
  EXPECT_EQ(mapping.getIterationShape()[1], X);
  EXPECT_FALSE(mapping.isIdentity());
}

TEST_F(IndexMappingTest, UnmappedIterator) {
  EXPECT_EQ(errorMessage(IndexMapping::get(idxc, 2, makeMap({{X, i}}),
                                           makeMap({{X, i}}))),
            "cannot determine iteration domain: iterator $index1 is not "
            "mapped to any coordinate");
}

TEST_F(IndexMappingTest, UnknownCoordinate) {
  IndexMapping mapping = unwrap(
      IndexMapping::get(idxc, 1, makeMap({{X, i}}), makeMap({{X, i}})));
  EXPECT_EQ(errorMessage(mapping.mapOutputIndices({Y})),
            "Y is not a mapped coordinate");
}

TEST_F(IndexMappingTest, SubstituteReturnsNewMapping) {
  IndexExpr d = IndexMapping::dynamicVal(idxc, 0);
  IndexMapping mapping = unwrap(IndexMapping::get(
      idxc, 1, makeMap({{X, i + BLOCK_M}}), makeMap({{X, i}}),
      {makeMap({{X, i + BLOCK_M}})}));
  EXPECT_EQ(mapping.getNumDynamicVals(), 1u);
  EXPECT_EQ(mapping.getDynamicValIndices()[0], d);

  IndexMapping substituted =
      unwrap(mapping.substitute({{BLOCK_M, constant(16)}}));
  EXPECT_EQ(substituted.mapInputIndices()[0], i + 16);
  EXPECT_EQ(substituted.getDynamicValMappings()[0].lookup(X), i + 16);
  // The original is unchanged.
  EXPECT_EQ(mapping.mapInputIndices()[0], i + BLOCK_M);
}

TEST_F(IndexMappingTest, Print) {
  IndexMapping mapping = unwrap(
      IndexMapping::get(idxc, 1, makeMap({{X, i}}), makeMap({{X, i}})));
  std::string result;
  llvm::raw_string_ostream os(result);
  mapping.print(os);
  EXPECT_EQ(os.str(), "IndexMapping(iters=[$index0], input_mapping={X: "
                      "$index0}, output_mapping={X: $index0}, "
                      "dynamic_val_mappings=[])");
}

} // namespace

} // namespace wave
