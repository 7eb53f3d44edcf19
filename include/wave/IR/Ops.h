// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_OPS_H
#define WAVE_IR_OPS_H

#include "wave/Asserts.h"
#include "wave/IR/DataType.h"
#include "wave/IR/DimQuery.h"
#include "wave/IR/IndexMapping.h"
#include "wave/IR/Types.h"
#include "wave/Support/Indexing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Casting.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace wave {

using NodeId = std::uint32_t;
using RegionId = std::uint32_t;

inline constexpr NodeId kInvalidNodeId = std::numeric_limits<NodeId>::max();

/// Per-dimension vector width of an operation. A zero width marks a
/// batch-like dimension.
using VectorShapes = llvm::MapVector<IndexExpr, std::int64_t>;

enum class OpKind : std::uint8_t {
  Placeholder,
  IterArg,
  NewRegister,
  Read,
  Write,
  Unary,
  Binary,
  MMA,
  Reduce,
  Reshape,
  Iterate,
  GetResult,
  Output,
};

llvm::StringRef getOpKindName(OpKind kind);

/// Base class of all graph operations. Operations are owned by a `Graph` and
/// refer to each other by `NodeId`; operand and user lists are maintained by
/// the graph.
class Op {
public:
  virtual ~Op() = default;

  OpKind getKind() const { return kind; }
  NodeId getId() const { return id; }

  llvm::StringRef getName() const { return name; }
  void setName(std::string newName) { name = std::move(newName); }

  llvm::ArrayRef<NodeId> getOperands() const { return operands; }
  unsigned getNumOperands() const { return operands.size(); }
  NodeId getOperand(unsigned index) const {
    WAVE_assert_limit(index, operands.size());
    return operands[index];
  }

  /// One entry per use, a user that takes this op twice appears twice.
  llvm::ArrayRef<NodeId> getUsers() const { return users; }
  bool hasUsers() const { return !users.empty(); }

  const std::optional<ShapedType> &getType() const { return type; }
  std::optional<DataType> getScalarType() const { return scalarType; }
  /// Value-typed (non-shaped) operation.
  bool isScalar() const { return scalarType.has_value(); }

  llvm::ArrayRef<IndexExpr> getIndexingDims() const { return indexingDims; }
  void setIndexingDims(llvm::ArrayRef<IndexExpr> dims) {
    indexingDims.assign(dims.begin(), dims.end());
  }

  const VectorShapes &getVectorShapes() const { return vectorShapes; }
  bool hasVectorShapes() const { return !vectorShapes.empty(); }
  void setVectorShapes(VectorShapes shapes) {
    vectorShapes = std::move(shapes);
  }

  const std::optional<DimQuery> &getDimQuery() const { return dimQuery; }
  void setDimQuery(DimQuery query) { dimQuery = std::move(query); }

  bool isLastMmaNode() const { return lastMmaNode; }
  void setLastMmaNode(bool value) { lastMmaNode = value; }

  RegionId getRegion() const { return region; }
  bool isErased() const { return erased; }

  /// Copy of this operation, detached from any graph.
  virtual std::unique_ptr<Op> clone() const = 0;

protected:
  explicit Op(OpKind kind) : kind(kind) {}
  Op(const Op &) = default;
  Op &operator=(const Op &) = delete;

private:
  friend class Graph;
  friend class GraphBuilder;

  OpKind kind;
  NodeId id = kInvalidNodeId;
  std::string name;
  llvm::SmallVector<NodeId> operands;
  llvm::SmallVector<NodeId> users;
  std::optional<ShapedType> type;
  std::optional<DataType> scalarType;
  llvm::SmallVector<IndexExpr> indexingDims;
  VectorShapes vectorShapes;
  std::optional<DimQuery> dimQuery;
  bool lastMmaNode = false;

  // Position in the owning region.
  RegionId region = 0;
  NodeId prev = kInvalidNodeId;
  NodeId next = kInvalidNodeId;
  bool erased = false;
};

template <typename ConcreteOp, OpKind Kind>
class OpBase : public Op {
public:
  static constexpr OpKind kKind = Kind;

  static bool classof(const Op *op) { return op->getKind() == Kind; }

  std::unique_ptr<Op> clone() const override {
    return std::make_unique<ConcreteOp>(static_cast<const ConcreteOp &>(*this));
  }

protected:
  OpBase() : Op(Kind) {}
};

/// Kernel argument: a memory buffer or a scalar.
class PlaceholderOp : public OpBase<PlaceholderOp, OpKind::Placeholder> {
public:
  unsigned getArgIndex() const { return argIndex; }

private:
  friend class GraphBuilder;
  unsigned argIndex = 0;
};

/// Loop-carried value entering the body of an `IterateOp`.
class IterArgOp : public OpBase<IterArgOp, OpKind::IterArg> {
public:
  unsigned getIterIdx() const { return iterIdx; }
  void setIterIdx(unsigned index) { iterIdx = index; }

private:
  unsigned iterIdx = 0;
};

/// Register filled with a constant.
class NewRegisterOp : public OpBase<NewRegisterOp, OpKind::NewRegister> {
public:
  double getValue() const { return value; }

private:
  friend class GraphBuilder;
  double value = 0.0;
};

class ReadOp : public OpBase<ReadOp, OpKind::Read> {
public:
  NodeId getMemory() const { return getOperand(0); }
  std::optional<std::int64_t> getElementsPerThread() const {
    return elementsPerThread;
  }
  const std::optional<IndexMapping> &getMapping() const { return mapping; }

private:
  friend class GraphBuilder;
  std::optional<std::int64_t> elementsPerThread;
  std::optional<IndexMapping> mapping;
};

class WriteOp : public OpBase<WriteOp, OpKind::Write> {
public:
  NodeId getValue() const { return getOperand(0); }
  NodeId getMemory() const { return getOperand(1); }
  std::optional<std::int64_t> getElementsPerThread() const {
    return elementsPerThread;
  }
  const std::optional<IndexMapping> &getMapping() const { return mapping; }

private:
  friend class GraphBuilder;
  std::optional<std::int64_t> elementsPerThread;
  std::optional<IndexMapping> mapping;
};

/// Elementwise operation on one register, e.g. `exp2`.
class UnaryOp : public OpBase<UnaryOp, OpKind::Unary> {
public:
  llvm::StringRef getFunction() const { return function; }

private:
  friend class GraphBuilder;
  std::string function;
};

/// Elementwise operation on two registers, e.g. `add`.
class BinaryOp : public OpBase<BinaryOp, OpKind::Binary> {
public:
  llvm::StringRef getFunction() const { return function; }
  NodeId getLhs() const { return getOperand(0); }
  NodeId getRhs() const { return getOperand(1); }

private:
  friend class GraphBuilder;
  std::string function;
};

/// `acc + lhs * rhs^T` contracting over the reduction dimension.
class MMAOp : public OpBase<MMAOp, OpKind::MMA> {
public:
  NodeId getLhs() const { return getOperand(0); }
  NodeId getRhs() const { return getOperand(1); }
  NodeId getAcc() const { return getOperand(2); }
  IndexExpr getReductionDim() const { return reductionDim; }

private:
  friend class GraphBuilder;
  IndexExpr reductionDim;
};

/// Reduction of its sources along `reductionDim`, combined with an optional
/// init value. Operands are the sources followed by the init value.
class ReduceOp : public OpBase<ReduceOp, OpKind::Reduce> {
public:
  llvm::StringRef getFunction() const { return function; }
  IndexExpr getReductionDim() const { return reductionDim; }

  unsigned getNumSources() const { return numSources; }
  void setNumSources(unsigned count) { numSources = count; }
  llvm::ArrayRef<NodeId> getSources() const {
    return getOperands().take_front(numSources);
  }
  bool hasInit() const { return getNumOperands() > numSources; }
  NodeId getInit() const {
    WAVE_assertv(hasInit(), "reduce has no init value");
    return getOperand(numSources);
  }

private:
  friend class GraphBuilder;
  std::string function;
  IndexExpr reductionDim;
  unsigned numSources = 1;
};

/// Changes the expansion granularity of its argument. The op's own vector
/// shapes describe its result, `targetVectorShape` the argument's.
class ReshapeOp : public OpBase<ReshapeOp, OpKind::Reshape> {
public:
  llvm::ArrayRef<NodeId> getArgs() const { return getOperands(); }
  const VectorShapes &getTargetVectorShape() const { return targetVectorShape; }

private:
  friend class GraphBuilder;
  VectorShapes targetVectorShape;
};

/// Loop over `axis` carrying its init values through `IterArgOp`s of the body
/// region. The body's `OutputOp` yields the next values.
class IterateOp : public OpBase<IterateOp, OpKind::Iterate> {
public:
  IndexExpr getAxis() const { return axis; }
  RegionId getBody() const { return body; }
  llvm::ArrayRef<NodeId> getInits() const { return getOperands(); }

  /// Trip count, set once during constraint setup.
  std::optional<IndexExpr> getCount() const { return count; }
  void setCount(IndexExpr value) { count = value; }

private:
  friend class GraphBuilder;
  IndexExpr axis;
  RegionId body = 0;
  std::optional<IndexExpr> count;
};

class GetResultOp : public OpBase<GetResultOp, OpKind::GetResult> {
public:
  NodeId getIterate() const { return getOperand(0); }
  unsigned getResultIndex() const { return resultIndex; }
  void setResultIndex(unsigned index) { resultIndex = index; }

private:
  friend class GraphBuilder;
  unsigned resultIndex = 0;
};

/// Terminator of a region: the kernel results in the root region, the yielded
/// values in an iterate body.
class OutputOp : public OpBase<OutputOp, OpKind::Output> {
public:
  llvm::ArrayRef<NodeId> getValues() const { return getOperands(); }
};

} // namespace wave

#endif // WAVE_IR_OPS_H
