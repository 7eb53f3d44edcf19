// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Expansion/DimScaling.h"

#include "wave/Constraints/ConstraintSetup.h"

#include "testing/Utils.h"

#include <string>

namespace wave {

namespace {

using testing::errorMessage;
using testing::unwrap;

class DimScalingTest : public testing::GraphTest {
protected:
  ConstraintSet constraints;

  std::string warnings;

  DimScaling resolve(NodeId node) {
    llvm::raw_string_ostream os(warnings);
    return unwrap(resolveDimensionScaling(graph, node, constraints, os));
  }

  // Read of a fresh `Memory[shape]` with the given vector widths.
  NodeId makeRead(llvm::ArrayRef<ShapeDim> shape, ShapeEntries widths) {
    NodeId arg = builder.placeholder("a", memory(shape));
    NodeId read = builder.read("read", arg);
    graph.getOp(read).setVectorShapes(vectorShapes(widths));
    return read;
  }
};

TEST_F(DimScalingTest, TileOverWavesAndVectorWidth) {
  addHardware(constraints, {}, {2, 1, 1});
  constraints.add<WorkgroupConstraint>(M, BLOCK_M, 0);
  constraints.add<WorkgroupConstraint>(N, BLOCK_N, 1);
  constraints.add<TilingConstraint>(K, BLOCK_K);
  idxc.bindConstant(BLOCK_M, 64);
  idxc.bindConstant(BLOCK_N, 32);
  idxc.bindConstant(BLOCK_K, 32);

  NodeId read = makeRead({M, K}, {{M, 16}, {N, 16}, {K, 16}});
  DimScaling scaling = resolve(read);

  // Resolved in constraint order. N is not indexed by the read but still
  // carries a vector width.
  ASSERT_EQ(scaling.size(), 3u);
  EXPECT_EQ(scaling.lookup(M), 2);
  EXPECT_EQ(scaling.lookup(N), 2);
  EXPECT_EQ(scaling.lookup(K), 2);
  EXPECT_EQ(scaling.begin()->first, M);
  EXPECT_EQ(scaling.back().first, K);
  EXPECT_TRUE(warnings.empty());
}

TEST_F(DimScalingTest, UnevenTilesRoundUp) {
  addHardware(constraints, {});
  constraints.add<WorkgroupConstraint>(M, constant(40), 0);
  NodeId read = makeRead({M}, {{M, 16}});
  EXPECT_EQ(resolve(read).lookup(M), 3);
  EXPECT_NE(warnings.find("warning: tile size is not divisible by wave count "
                          "and vector size, got: dim=M, tile_size=40, "
                          "wave_count=1, vector_size=16 for read"),
            std::string::npos)
      << warnings;
}

TEST_F(DimScalingTest, WorkgroupDimsPastGridShareLastWaveCount) {
  IndexExpr B = idxc.getSymbol("B");
  addHardware(constraints, {}, {1, 1, 2});
  constraints.add<WorkgroupConstraint>(B, constant(64), 3);
  NodeId read = makeRead({B}, {{B, 16}});
  EXPECT_EQ(resolve(read).lookup(B), 2);
  EXPECT_TRUE(warnings.empty());
}

TEST_F(DimScalingTest, WaveCountFromSetupPastGrid) {
  IndexExpr B = idxc.getSymbol("B");
  HardwareConstraint &hardware = constraints.add<HardwareConstraint>(64);
  constraints.add<WorkgroupConstraint>(B, constant(64), 3);
  constraints.add<WaveConstraint>(B, constant(32));
  ASSERT_FALSE(static_cast<bool>(initializeWaveConstraints(constraints, idxc)));
  ASSERT_EQ(hardware.getWavesPerBlock(),
            (HardwareConstraint::WavesPerBlock{1, 1, 2}));

  NodeId read = makeRead({B}, {{B, 16}});
  EXPECT_EQ(resolve(read).lookup(B), 2);
}

TEST_F(DimScalingTest, DerivedShapeUsesSubstitutedTile) {
  addHardware(constraints, {});
  constraints.add<TilingConstraint>(K, BLOCK_K);
  idxc.bindConstant(BLOCK_K, 32);

  NodeId packed = makeRead({M, K.floorDiv(2)}, {{K, 4}});
  NodeId plain = makeRead({M, K}, {{K, 4}});
  EXPECT_EQ(graph.getOp(packed).getIndexingDims(),
            (llvm::ArrayRef<IndexExpr>{M, K}));
  EXPECT_EQ(resolve(packed).lookup(K), 4);
  EXPECT_EQ(resolve(plain).lookup(K), 8);
}

TEST_F(DimScalingTest, SkipsDimsWithoutVectorWidth) {
  addHardware(constraints, {});
  constraints.add<WorkgroupConstraint>(M, constant(32), 0);
  constraints.add<WorkgroupConstraint>(N, constant(32), 1);
  // Batch-like dims have a zero width.
  NodeId read = makeRead({M, N}, {{M, 0}});
  DimScaling scaling = resolve(read);
  EXPECT_TRUE(scaling.empty());
}

TEST_F(DimScalingTest, StaticExtentFallback) {
  addHardware(constraints, {});
  idxc.bindConstant(M, 64);
  NodeId read = makeRead({M, N}, {{M, 16}, {N, 16}});
  DimScaling scaling = resolve(read);
  // N has neither a constraint nor a static extent.
  ASSERT_EQ(scaling.size(), 1u);
  EXPECT_EQ(scaling.lookup(M), 4);
}

TEST_F(DimScalingTest, ReductionDimOfReduce) {
  addHardware(constraints, {});
  idxc.bindConstant(K, 64);
  NodeId read = makeRead({M, K}, {{M, 16}, {K, 16}});
  NodeId sum = builder.reduce("sum", "sum", read, K);
  graph.getOp(sum).setVectorShapes(vectorShapes({{M, 16}, {K, 16}}));

  DimScaling scaling = resolve(sum);
  ASSERT_EQ(scaling.size(), 1u);
  EXPECT_EQ(scaling.lookup(K), 4);
}

TEST_F(DimScalingTest, NoVectorShapes) {
  NodeId read = makeRead({M}, {});
  NodeId scale = builder.placeholder("scale", DataType::f32);
  // Resolved before the hardware constraint is consulted.
  EXPECT_TRUE(resolve(read).empty());
  EXPECT_TRUE(resolve(scale).empty());
}

TEST_F(DimScalingTest, HardwareConstraintRequired) {
  NodeId read = makeRead({M}, {{M, 16}});
  EXPECT_EQ(errorMessage(resolveDimensionScaling(graph, read, constraints)),
            "exactly one hardware constraint must be provided, got 0");
}

TEST_F(DimScalingTest, UnknownTileSize) {
  addHardware(constraints, {});
  constraints.add<WorkgroupConstraint>(M, BLOCK_M, 0);
  NodeId read = makeRead({M}, {{M, 16}});
  EXPECT_EQ(errorMessage(resolveDimensionScaling(graph, read, constraints)),
            "tile size, wave count and vector size must be statically known, "
            "got: dim=M, tile_size=<<unknown>>, wave_count=1, vector_size=16 "
            "for read");
}

TEST_F(DimScalingTest, UnknownWaveCount) {
  constraints.add<HardwareConstraint>(64, std::nullopt,
                                      vectorShapes({{M, 16}}));
  constraints.add<WorkgroupConstraint>(M, constant(64), 0);
  NodeId read = makeRead({M}, {{M, 16}});
  EXPECT_EQ(errorMessage(resolveDimensionScaling(graph, read, constraints)),
            "tile size, wave count and vector size must be statically known, "
            "got: dim=M, tile_size=64, wave_count=<<unknown>>, "
            "vector_size=16 for read");
}

} // namespace

} // namespace wave
