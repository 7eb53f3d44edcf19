// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Expansion/ExpansionUtils.h"

#include "wave/Asserts.h"
#include "wave/Support/Logger.h"
#include "wave/Utils.h"

#include "llvm/Support/FormatVariadic.h"

namespace wave {

llvm::SmallVector<std::int64_t> computeStrides(const DimScaling &scaling) {
  llvm::SmallVector<std::int64_t> shape;
  for (const auto &[dim, factor] : scaling) {
    shape.push_back(factor);
  }
  return utils::calculateStrides<std::int64_t>(shape);
}

llvm::SmallVector<IndexExpr> getIndexedDims(const DimScaling &scaling,
                                            llvm::ArrayRef<IndexExpr> dims) {
  llvm::SmallVector<IndexExpr> result;
  for (IndexExpr dim : dims) {
    if (scaling.count(dim) && !llvm::is_contained(result, dim)) {
      result.push_back(dim);
    }
  }
  return result;
}

llvm::SmallVector<IndexExpr> getIndexedDims(const DimScaling &scaling,
                                            const Op &op) {
  return getIndexedDims(scaling, op.getIndexingDims());
}

llvm::SmallVector<DimQuery>
enumerateDimQueries(const DimScaling &scaling,
                    llvm::ArrayRef<IndexExpr> dims) {
  llvm::SmallVector<IndexExpr> indexed = getIndexedDims(scaling, dims);
  llvm::SmallVector<std::int64_t> shape;
  for (IndexExpr dim : indexed) {
    shape.push_back(scaling.lookup(dim));
  }
  llvm::SmallVector<DimQuery> queries;
  utils::sample(shape, [&](llvm::ArrayRef<std::int64_t> index) {
    DimQuery query;
    for (unsigned i = 0; i < indexed.size(); ++i) {
      query.set(indexed[i], index[i]);
    }
    queries.push_back(std::move(query));
  });
  return queries;
}

std::int64_t linearizeDimQuery(const DimScaling &scaling,
                               const DimQuery &query) {
  llvm::SmallVector<std::int64_t> shape;
  for (const auto &[dim, value] : query) {
    WAVE_assertv(scaling.count(dim), "query dim has no scaling factor");
    shape.push_back(scaling.lookup(dim));
  }
  llvm::SmallVector<std::int64_t> strides =
      utils::calculateStrides<std::int64_t>(shape);
  std::int64_t linear = 0;
  unsigned i = 0;
  for (const auto &[dim, value] : query) {
    linear += value * strides[i++];
  }
  return linear;
}

bool isExpandable(const Op &op) {
  if (op.isScalar()) {
    return false;
  }
  switch (op.getKind()) {
  case OpKind::Placeholder:
  case OpKind::Iterate:
  case OpKind::Output:
    return false;
  default:
    return true;
  }
}

namespace {

bool accessesSharedMemory(const Graph &graph, const Op &op) {
  NodeId memory = kInvalidNodeId;
  if (const auto *read = llvm::dyn_cast<ReadOp>(&op)) {
    memory = read->getMemory();
  } else if (const auto *write = llvm::dyn_cast<WriteOp>(&op)) {
    memory = write->getMemory();
  }
  if (memory == kInvalidNodeId) {
    return false;
  }
  const auto &type = graph.getOp(memory).getType();
  return type && type->isMemory() &&
         type->getAddressSpace() == AddressSpace::Shared;
}

} // namespace

std::string getExpandedName(const Graph &graph, const Op &op,
                            const DimQuery &query) {
  constexpr std::size_t kMaxDimNameLength = 4;
  const IndexingContext &idxc = graph.getIndexingContext();
  std::string name = op.getName().str();
  if (accessesSharedMemory(graph, op)) {
    name += "_shared";
  }
  for (const auto &[dim, value] : query) {
    std::string dimName = idxc.str(dim);
    if (dimName.size() > kMaxDimNameLength) {
      dimName = dimName.substr(0, kMaxDimNameLength) + "*";
    }
    name += llvm::formatv("_{0}:{1}", dimName, value).str();
  }
  return name;
}

llvm::SmallVector<DimQuery> getReshapeDimQueries(const ReshapeOp &reshape,
                                                 const DimQuery &query) {
  const VectorShapes &sourceShapes = reshape.getVectorShapes();
  const VectorShapes &targetShapes = reshape.getTargetVectorShape();

  // Candidate source values of every dim of `query`.
  llvm::SmallVector<IndexExpr> dims;
  llvm::SmallVector<llvm::SmallVector<std::int64_t>> values;
  for (const auto &[dim, value] : query) {
    dims.push_back(dim);
    llvm::SmallVector<std::int64_t> &candidates = values.emplace_back();
    auto sourceIt = sourceShapes.find(dim);
    auto targetIt = targetShapes.find(dim);
    if (sourceIt == sourceShapes.end() || targetIt == targetShapes.end() ||
        sourceIt->second <= 0 || targetIt->second <= 0) {
      candidates.push_back(value);
      continue;
    }
    std::int64_t source = sourceIt->second;
    std::int64_t target = targetIt->second;
    if (source < target) {
      candidates.push_back(value / (target / source));
    } else if (source > target) {
      std::int64_t scale = source / target;
      for (std::int64_t i = 0; i < scale; ++i) {
        candidates.push_back(value * scale + i);
      }
    } else {
      candidates.push_back(value);
    }
  }

  llvm::SmallVector<std::int64_t> shape;
  for (const auto &candidates : values) {
    shape.push_back(candidates.size());
  }
  llvm::SmallVector<DimQuery> queries;
  utils::sample(shape, [&](llvm::ArrayRef<std::int64_t> index) {
    DimQuery sourceQuery;
    for (unsigned i = 0; i < dims.size(); ++i) {
      sourceQuery.set(dims[i], values[i][index[i]]);
    }
    queries.push_back(std::move(sourceQuery));
  });
  return queries;
}

namespace {

// Nodes that stay in the graph after expansion, cloned or not.
bool isRetained(const Op &op) {
  return llvm::isa<OutputOp, IterateOp, PlaceholderOp>(op) || op.isScalar();
}

} // namespace

void removeOriginalNodes(Graph &graph, llvm::ArrayRef<NodeId> leaves,
                         llvm::function_ref<bool(NodeId)> isOriginal) {
  llvm::SmallVector<NodeId> worklist(leaves.rbegin(), leaves.rend());
  while (!worklist.empty()) {
    NodeId id = worklist.pop_back_val();
    Op &op = graph.getOp(id);
    if (op.isErased() || !isOriginal(id) || isRetained(op) ||
        op.hasUsers()) {
      continue;
    }
    llvm::SmallVector<NodeId> operands(op.getOperands());
    WAVE_TRACE(LogComponent::Expansion, "erase original {0}", op.getName());
    graph.erase(id);
    // Operands may have lost their last user.
    for (NodeId operand : llvm::reverse(operands)) {
      worklist.push_back(operand);
    }
  }
}

void removeUnusedRegisters(Graph &graph) {
  graph.walk([&](Op &op) {
    if (llvm::isa<NewRegisterOp>(op) && !op.hasUsers()) {
      graph.erase(op.getId());
    }
  });
}

void removeUnusedIterArgs(Graph &graph) {
  graph.walk([&](Op &op) {
    if (llvm::isa<IterArgOp>(op) && !op.hasUsers()) {
      graph.erase(op.getId());
    }
  });
}

} // namespace wave
