// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_TESTING_UTILS_H
#define WAVE_TESTING_UTILS_H

#include "wave/Asserts.h"
#include "wave/Constraints/Constraints.h"
#include "wave/IR/Builder.h"
#include "wave/IR/Graph.h"
#include "wave/Support/Indexing.h"
#include "wave/Support/Logger.h"

#include "mlir/IR/MLIRContext.h"
#include "llvm/Support/Error.h"

// A convenience include so that tests only need "testing/Utils.h".
#include "gtest/gtest.h"

#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <utility>

namespace wave::testing {

// Helper macro for logging on behalf of `wave::LogComponent::Test`.
#define WAVE_TEST_DEBUG(/* fmt, args */...)                                    \
  WAVE_DEBUG(wave::LogComponent::Test, __VA_ARGS__)

// Unwraps an `llvm::Expected`, failing the current test on error.
template <typename T>
T unwrap(llvm::Expected<T> value) {
  if (!value) {
    ADD_FAILURE() << llvm::toString(value.takeError());
    std::abort();
  }
  return std::move(*value);
}

// Message of a failed `llvm::Expected`, or the empty string on success.
template <typename T>
std::string errorMessage(llvm::Expected<T> value) {
  if (value) {
    return {};
  }
  return llvm::toString(value.takeError());
}

inline std::string errorMessage(llvm::Error error) {
  if (!error) {
    return {};
  }
  return llvm::toString(std::move(error));
}

// Fixture owning an indexing context with the usual GEMM symbols.
class IndexingTest : public ::testing::Test {
protected:
  mlir::MLIRContext context;
  IndexingContext idxc{&context};

  IndexExpr M = idxc.getSymbol("M");
  IndexExpr N = idxc.getSymbol("N");
  IndexExpr K = idxc.getSymbol("K");
  IndexExpr BLOCK_M = idxc.getSymbol("BLOCK_M");
  IndexExpr BLOCK_N = idxc.getSymbol("BLOCK_N");
  IndexExpr BLOCK_K = idxc.getSymbol("BLOCK_K");

  IndexExpr constant(std::int64_t value) const {
    return idxc.getConstant(value);
  }

  ShapedType memory(llvm::ArrayRef<ShapeDim> shape,
                    AddressSpace addressSpace = AddressSpace::Global,
                    DataType dtype = DataType::f16) {
    return unwrap(ShapedType::getMemory(idxc, shape, addressSpace, dtype));
  }

  ShapedType registerType(llvm::ArrayRef<ShapeDim> shape,
                          DataType dtype = DataType::f32) {
    return unwrap(ShapedType::getRegister(idxc, shape, dtype));
  }

  using ShapeEntries =
      std::initializer_list<std::pair<IndexExpr, std::int64_t>>;

  static VectorShapes vectorShapes(ShapeEntries entries) {
    VectorShapes shapes;
    for (const auto &[dim, width] : entries) {
      shapes[dim] = width;
    }
    return shapes;
  }

  // Hardware constraint with one wave per block and the given vector widths.
  HardwareConstraint &addHardware(ConstraintSet &constraints,
                                  ShapeEntries entries,
                                  HardwareConstraint::WavesPerBlock waves = {
                                      1, 1, 1}) {
    return constraints.add<HardwareConstraint>(64, waves,
                                               vectorShapes(entries));
  }
};

// Fixture with a graph and a builder on top of `IndexingTest`.
class GraphTest : public IndexingTest {
protected:
  Graph graph{idxc};
  GraphBuilder builder{graph};

  unsigned countLive(OpKind kind) const {
    unsigned count = 0;
    for (NodeId id : graph.getAllOps()) {
      count += graph.getOp(id).getKind() == kind;
    }
    return count;
  }

  llvm::SmallVector<NodeId> liveOps(OpKind kind) const {
    llvm::SmallVector<NodeId> result;
    for (NodeId id : graph.getAllOps()) {
      if (graph.getOp(id).getKind() == kind) {
        result.push_back(id);
      }
    }
    return result;
  }
};

} // namespace wave::testing

#endif // WAVE_TESTING_UTILS_H
