// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Expansion/ExpansionUtils.h"

#include "testing/Utils.h"

#include <cstdint>
#include <map>

namespace wave {

namespace {

class ExpansionUtilsTest : public testing::GraphTest {
protected:
  static DimScaling makeScaling(ShapeEntries entries) {
    DimScaling scaling;
    for (const auto &[dim, factor] : entries) {
      scaling[dim] = factor;
    }
    return scaling;
  }
};

TEST_F(ExpansionUtilsTest, Strides) {
  EXPECT_EQ(computeStrides(makeScaling({{M, 4}, {N, 2}})),
            (llvm::SmallVector<std::int64_t>{2, 1}));
  EXPECT_EQ(computeStrides(makeScaling({{M, 2}, {N, 3}, {K, 4}})),
            (llvm::SmallVector<std::int64_t>{12, 4, 1}));
}

TEST_F(ExpansionUtilsTest, IndexedDimsFollowOperandOrder) {
  DimScaling scaling = makeScaling({{K, 2}, {M, 2}});
  EXPECT_EQ(getIndexedDims(scaling, {M, N, K}),
            (llvm::SmallVector<IndexExpr>{M, K}));
}

TEST_F(ExpansionUtilsTest, EnumerateRowMajor) {
  DimScaling scaling = makeScaling({{M, 2}, {N, 3}});
  llvm::SmallVector<DimQuery> queries = enumerateDimQueries(scaling, {M, N});
  ASSERT_EQ(queries.size(), 6u);
  EXPECT_EQ(queries[0], (DimQuery{{M, 0}, {N, 0}}));
  EXPECT_EQ(queries[1], (DimQuery{{M, 0}, {N, 1}}));
  EXPECT_EQ(queries[3], (DimQuery{{M, 1}, {N, 0}}));
  EXPECT_EQ(queries[5], (DimQuery{{M, 1}, {N, 2}}));

  for (unsigned i = 0; i < queries.size(); ++i) {
    EXPECT_EQ(linearizeDimQuery(scaling, queries[i]),
              static_cast<std::int64_t>(i));
  }
}

TEST_F(ExpansionUtilsTest, EnumerateWithoutScaledDims) {
  llvm::SmallVector<DimQuery> queries =
      enumerateDimQueries(makeScaling({{K, 4}}), {M, N});
  ASSERT_EQ(queries.size(), 1u);
  EXPECT_TRUE(queries[0].empty());
}

TEST_F(ExpansionUtilsTest, DimQueryKeysIdentifyQueries) {
  DimQuery query{{M, 1}, {N, 0}};
  DimQuery::Key key = query.getKey();
  ASSERT_EQ(key.size(), 2u);
  EXPECT_EQ(key[0].first,
            reinterpret_cast<std::uintptr_t>(M.getAsOpaquePointer()));
  EXPECT_EQ(key[0].second, 1);

  std::map<DimQuery::Key, int> keys;
  keys.emplace(query.getKey(), 0);
  keys.emplace(DimQuery{{M, 0}, {N, 0}}.getKey(), 1);
  keys.emplace(DimQuery{{N, 0}, {M, 1}}.getKey(), 2);
  keys.emplace(DimQuery{{M, 1}, {N, 0}}.getKey(), 3);
  EXPECT_EQ(keys.size(), 3u);
  EXPECT_EQ(keys.at(DimQuery{{M, 1}, {N, 0}}.getKey()), 0);
  EXPECT_EQ(keys.at(DimQuery{{N, 0}, {M, 1}}.getKey()), 2);
}

TEST_F(ExpansionUtilsTest, Expandable) {
  NodeId a = builder.placeholder("a", memory({M}));
  NodeId x = builder.placeholder("x", DataType::f32);
  NodeId read = builder.read("read", a);
  NodeId neg = builder.unary("neg", "neg", x);
  NodeId loop = builder.iterate("loop", K, {read});
  NodeId out = builder.output({read});

  EXPECT_FALSE(isExpandable(graph.getOp(a)));
  EXPECT_FALSE(isExpandable(graph.getOp(x)));
  EXPECT_TRUE(isExpandable(graph.getOp(read)));
  EXPECT_FALSE(isExpandable(graph.getOp(neg)));
  EXPECT_FALSE(isExpandable(graph.getOp(loop)));
  EXPECT_FALSE(isExpandable(graph.getOp(out)));
  EXPECT_TRUE(isExpandable(graph.getOp(builder.getIterArgs(loop)[0])));
}

TEST_F(ExpansionUtilsTest, ExpandedNames) {
  IndexExpr BLOCK = idxc.getSymbol("BLOCK_SIZE");
  NodeId global = builder.placeholder("a", memory({M, BLOCK}));
  NodeId shared =
      builder.placeholder("a_smem", memory({M, N}, AddressSpace::Shared));
  NodeId globalRead = builder.read("read", global);
  NodeId sharedRead = builder.read("read", shared);
  NodeId sharedWrite = builder.write("write", sharedRead, shared);

  EXPECT_EQ(getExpandedName(graph, graph.getOp(globalRead),
                            DimQuery{{M, 1}, {BLOCK, 0}}),
            "read_M:1_BLOC*:0");
  EXPECT_EQ(getExpandedName(graph, graph.getOp(sharedRead),
                            DimQuery{{M, 0}, {N, 1}}),
            "read_shared_M:0_N:1");
  EXPECT_EQ(getExpandedName(graph, graph.getOp(sharedWrite), DimQuery{{N, 3}}),
            "write_shared_N:3");
  EXPECT_EQ(getExpandedName(graph, graph.getOp(globalRead), DimQuery{}),
            "read");
}

TEST_F(ExpansionUtilsTest, ReshapeMergesSources) {
  NodeId a = builder.placeholder("a", memory({M}));
  NodeId read = builder.read("read", a);
  NodeId reshape = builder.reshape("reshape", read, vectorShapes({{M, 2}}));
  graph.getOp(reshape).setVectorShapes(vectorShapes({{M, 8}}));
  const auto &reshapeOp = graph.getOpAs<ReshapeOp>(reshape);

  llvm::SmallVector<DimQuery> first =
      getReshapeDimQueries(reshapeOp, DimQuery{{M, 0}});
  ASSERT_EQ(first.size(), 4u);
  for (unsigned i = 0; i < 4; ++i) {
    EXPECT_EQ(first[i], (DimQuery{{M, i}}));
  }

  llvm::SmallVector<DimQuery> second =
      getReshapeDimQueries(reshapeOp, DimQuery{{M, 1}});
  ASSERT_EQ(second.size(), 4u);
  EXPECT_EQ(second.front(), (DimQuery{{M, 4}}));
  EXPECT_EQ(second.back(), (DimQuery{{M, 7}}));
}

TEST_F(ExpansionUtilsTest, ReshapeSplitsSource) {
  NodeId a = builder.placeholder("a", memory({M, N}));
  NodeId read = builder.read("read", a);
  NodeId reshape =
      builder.reshape("reshape", read, vectorShapes({{M, 8}, {N, 4}}));
  graph.getOp(reshape).setVectorShapes(vectorShapes({{M, 2}, {N, 4}}));
  const auto &reshapeOp = graph.getOpAs<ReshapeOp>(reshape);

  // M: four replicas share one source. N is unchanged.
  llvm::SmallVector<DimQuery> queries =
      getReshapeDimQueries(reshapeOp, DimQuery{{M, 7}, {N, 1}});
  ASSERT_EQ(queries.size(), 1u);
  EXPECT_EQ(queries[0], (DimQuery{{M, 1}, {N, 1}}));
}

TEST_F(ExpansionUtilsTest, RemoveOriginalNodes) {
  NodeId a = builder.placeholder("a", memory({M}));
  NodeId read = builder.read("read", a);
  NodeId neg = builder.unary("neg", "neg", read);
  NodeId kept = builder.unary("kept", "abs", read);
  NodeId sink = builder.write("write", neg, a);
  NodeId user = builder.write("write_kept", kept, a);

  // Everything but `user` counts as original and the only leaf is the sink.
  removeOriginalNodes(graph, {sink},
                      [&](NodeId id) { return id != user; });

  EXPECT_TRUE(graph.getOp(sink).isErased());
  EXPECT_TRUE(graph.getOp(neg).isErased());
  // `read` still feeds `kept`.
  EXPECT_FALSE(graph.getOp(read).isErased());
  EXPECT_FALSE(graph.getOp(kept).isErased());
  EXPECT_FALSE(graph.getOp(a).isErased());
}

TEST_F(ExpansionUtilsTest, RemoveUnusedRegistersAndIterArgs) {
  NodeId used = builder.newRegister("used", registerType({M}), 0.0);
  NodeId unused = builder.newRegister("unused", registerType({M}), 1.0);
  NodeId loop = builder.iterate("loop", K, {used, used});
  llvm::SmallVector<NodeId> iterArgs = builder.getIterArgs(loop);
  builder.setInsertionRegion(graph.getOpAs<IterateOp>(loop).getBody());
  builder.output({iterArgs[0], iterArgs[0]});

  removeUnusedRegisters(graph);
  removeUnusedIterArgs(graph);

  EXPECT_FALSE(graph.getOp(used).isErased());
  EXPECT_TRUE(graph.getOp(unused).isErased());
  EXPECT_FALSE(graph.getOp(iterArgs[0]).isErased());
  EXPECT_TRUE(graph.getOp(iterArgs[1]).isErased());
}

} // namespace

} // namespace wave
