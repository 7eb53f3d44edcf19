// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/Builder.h"

#include "wave/Asserts.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"

namespace wave {

template <typename OpT>
std::unique_ptr<OpT> GraphBuilder::makeOp(llvm::StringRef name,
                                          llvm::ArrayRef<NodeId> operands) const {
  auto op = std::make_unique<OpT>();
  op->name = name.str();
  op->operands.assign(operands.begin(), operands.end());
  return op;
}

NodeId GraphBuilder::insert(std::unique_ptr<Op> op) {
  return graph.append(insertionRegion, std::move(op));
}

const ShapedType &GraphBuilder::getShapedType(NodeId id) const {
  const Op &op = graph.getOp(id);
  WAVE_assertv(op.getType().has_value(), "{0} has no shaped type",
               op.getName());
  return *op.getType();
}

llvm::SmallVector<IndexExpr>
GraphBuilder::mergeDims(llvm::ArrayRef<IndexExpr> dims,
                        llvm::ArrayRef<IndexExpr> extra) {
  llvm::SmallVector<IndexExpr> result(dims.begin(), dims.end());
  for (IndexExpr dim : extra) {
    if (!llvm::is_contained(result, dim)) {
      result.push_back(dim);
    }
  }
  return result;
}

NodeId GraphBuilder::placeholder(llvm::StringRef name, ShapedType type) {
  WAVE_assertv(insertionRegion == Graph::kRootRegion,
               "kernel arguments belong to the root region");
  auto op = makeOp<PlaceholderOp>(name, {});
  op->indexingDims = type.getIndexingDims();
  op->type = std::move(type);
  op->argIndex = numArgs++;
  return insert(std::move(op));
}

NodeId GraphBuilder::placeholder(llvm::StringRef name, DataType dtype) {
  WAVE_assertv(insertionRegion == Graph::kRootRegion,
               "kernel arguments belong to the root region");
  auto op = makeOp<PlaceholderOp>(name, {});
  op->scalarType = dtype;
  op->argIndex = numArgs++;
  return insert(std::move(op));
}

NodeId GraphBuilder::newRegister(llvm::StringRef name, ShapedType type,
                                 double value) {
  WAVE_assertv(type.isRegister(), "{0} requires a Register type", name);
  auto op = makeOp<NewRegisterOp>(name, {});
  op->indexingDims = type.getIndexingDims();
  op->type = std::move(type);
  op->value = value;
  return insert(std::move(op));
}

NodeId GraphBuilder::read(llvm::StringRef name, NodeId memory,
                          std::optional<std::int64_t> elementsPerThread,
                          std::optional<IndexMapping> mapping) {
  const ShapedType &memoryType = getShapedType(memory);
  WAVE_assertv(memoryType.isMemory(), "{0} reads from a non-memory value",
               name);
  auto op = makeOp<ReadOp>(name, {memory});
  if (mapping) {
    llvm::SmallVector<IndexExpr> shape = mapping->getOutputShape();
    op->type = memoryType.getRegisterLike(shape);
    op->indexingDims = inferDims(shape);
  } else {
    op->type = memoryType.getRegisterLike(memoryType.getShape());
    op->indexingDims = memoryType.getIndexingDims();
  }
  op->elementsPerThread = elementsPerThread;
  op->mapping = std::move(mapping);
  return insert(std::move(op));
}

NodeId GraphBuilder::write(llvm::StringRef name, NodeId value, NodeId memory,
                           std::optional<std::int64_t> elementsPerThread,
                           std::optional<IndexMapping> mapping) {
  const ShapedType &memoryType = getShapedType(memory);
  WAVE_assertv(memoryType.isMemory(), "{0} writes to a non-memory value",
               name);
  auto op = makeOp<WriteOp>(name, {value, memory});
  op->type = memoryType;
  op->indexingDims = mapping ? inferDims(mapping->getInputShape())
                             : memoryType.getIndexingDims();
  op->elementsPerThread = elementsPerThread;
  op->mapping = std::move(mapping);
  return insert(std::move(op));
}

NodeId GraphBuilder::unary(llvm::StringRef name, llvm::StringRef function,
                           NodeId operand) {
  const Op &source = graph.getOp(operand);
  auto op = makeOp<UnaryOp>(name, {operand});
  op->type = source.getType();
  op->scalarType = source.getScalarType();
  op->indexingDims.assign(source.getIndexingDims().begin(),
                          source.getIndexingDims().end());
  op->function = function.str();
  return insert(std::move(op));
}

NodeId GraphBuilder::binary(llvm::StringRef name, llvm::StringRef function,
                            NodeId lhs, NodeId rhs) {
  const Op &lhsOp = graph.getOp(lhs);
  const Op &rhsOp = graph.getOp(rhs);
  auto op = makeOp<BinaryOp>(name, {lhs, rhs});
  if (!lhsOp.getType() && !rhsOp.getType()) {
    op->scalarType = lhsOp.getScalarType();
  } else if (!rhsOp.getType() ||
             (lhsOp.getType() &&
              lhsOp.getType()->getRank() >= rhsOp.getType()->getRank())) {
    op->type = lhsOp.getType();
  } else {
    op->type = rhsOp.getType();
  }
  op->indexingDims =
      mergeDims(lhsOp.getIndexingDims(), rhsOp.getIndexingDims());
  op->function = function.str();
  return insert(std::move(op));
}

NodeId GraphBuilder::mma(llvm::StringRef name, NodeId lhs, NodeId rhs,
                         NodeId acc) {
  const Op &lhsOp = graph.getOp(lhs);
  const Op &rhsOp = graph.getOp(rhs);
  const Op &accOp = graph.getOp(acc);
  llvm::ArrayRef<IndexExpr> accDims = accOp.getIndexingDims();

  const auto *reductionDim = llvm::find_if(
      lhsOp.getIndexingDims(),
      [&](IndexExpr dim) { return !llvm::is_contained(accDims, dim); });
  WAVE_assertv(reductionDim != lhsOp.getIndexingDims().end(),
               "{0} has no reduction dimension", name);

  auto op = makeOp<MMAOp>(name, {lhs, rhs, acc});
  op->type = getShapedType(acc);
  op->indexingDims = mergeDims(mergeDims(accDims, lhsOp.getIndexingDims()),
                               rhsOp.getIndexingDims());
  op->reductionDim = *reductionDim;
  return insert(std::move(op));
}

NodeId GraphBuilder::reduce(llvm::StringRef name, llvm::StringRef function,
                            NodeId source, IndexExpr dim,
                            std::optional<NodeId> init) {
  const ShapedType &sourceType = getShapedType(source);
  const Op &sourceOp = graph.getOp(source);
  WAVE_assertv(llvm::is_contained(sourceOp.getIndexingDims(), dim),
               "{0} reduces over a dimension its source does not index",
               name);

  llvm::SmallVector<IndexExpr> shape;
  for (IndexExpr entry : sourceType.getShape()) {
    if (inferDim(entry) != dim) {
      shape.push_back(entry);
    }
  }
  llvm::SmallVector<NodeId> operands{source};
  if (init) {
    operands.push_back(*init);
  }

  auto op = makeOp<ReduceOp>(name, operands);
  op->type = sourceType.getRegisterLike(shape);
  for (IndexExpr sourceDim : sourceOp.getIndexingDims()) {
    if (sourceDim != dim) {
      op->indexingDims.push_back(sourceDim);
    }
  }
  op->function = function.str();
  op->reductionDim = dim;
  op->numSources = 1;
  return insert(std::move(op));
}

NodeId GraphBuilder::reshape(llvm::StringRef name, NodeId arg,
                             VectorShapes targetVectorShape) {
  const Op &argOp = graph.getOp(arg);
  auto op = makeOp<ReshapeOp>(name, {arg});
  op->type = argOp.getType();
  op->indexingDims.assign(argOp.getIndexingDims().begin(),
                          argOp.getIndexingDims().end());
  op->targetVectorShape = std::move(targetVectorShape);
  return insert(std::move(op));
}

NodeId GraphBuilder::iterate(llvm::StringRef name, IndexExpr axis,
                             llvm::ArrayRef<NodeId> inits) {
  auto op = makeOp<IterateOp>(name, inits);
  for (NodeId init : inits) {
    op->indexingDims =
        mergeDims(op->indexingDims, graph.getOp(init).getIndexingDims());
  }
  op->axis = axis;
  NodeId id = insert(std::move(op));

  RegionId body = graph.createRegion(id);
  graph.getOpAs<IterateOp>(id).body = body;
  for (auto [i, init] : llvm::enumerate(inits)) {
    const Op &initOp = graph.getOp(init);
    auto iterArg =
        makeOp<IterArgOp>(llvm::formatv("{0}_arg{1}", name, i).str(), {});
    iterArg->type = initOp.getType();
    iterArg->scalarType = initOp.getScalarType();
    iterArg->indexingDims.assign(initOp.getIndexingDims().begin(),
                                 initOp.getIndexingDims().end());
    iterArg->setIterIdx(i);
    graph.append(body, std::move(iterArg));
  }
  return id;
}

llvm::SmallVector<NodeId> GraphBuilder::getIterArgs(NodeId iterate) const {
  llvm::SmallVector<NodeId> iterArgs;
  for (NodeId id :
       graph.getRegionOps(graph.getOpAs<IterateOp>(iterate).getBody())) {
    if (llvm::isa<IterArgOp>(graph.getOp(id))) {
      iterArgs.push_back(id);
    }
  }
  llvm::sort(iterArgs, [&](NodeId lhs, NodeId rhs) {
    return graph.getOpAs<IterArgOp>(lhs).getIterIdx() <
           graph.getOpAs<IterArgOp>(rhs).getIterIdx();
  });
  return iterArgs;
}

NodeId GraphBuilder::getResult(llvm::StringRef name, NodeId iterate,
                               unsigned index) {
  const auto &iterateOp = graph.getOpAs<IterateOp>(iterate);
  WAVE_assert_limit(index, iterateOp.getInits().size());
  const Op &initOp = graph.getOp(iterateOp.getInits()[index]);
  auto op = makeOp<GetResultOp>(name, {iterate});
  op->type = initOp.getType();
  op->scalarType = initOp.getScalarType();
  op->indexingDims.assign(initOp.getIndexingDims().begin(),
                          initOp.getIndexingDims().end());
  op->resultIndex = index;
  return insert(std::move(op));
}

NodeId GraphBuilder::output(llvm::ArrayRef<NodeId> values) {
  return insert(makeOp<OutputOp>("output", values));
}

} // namespace wave
