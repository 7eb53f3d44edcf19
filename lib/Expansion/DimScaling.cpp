// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Expansion/DimScaling.h"

#include "wave/Support/Logger.h"
#include "wave/Utils.h"

#include "llvm/ADT/DenseMap.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/WithColor.h"

#include <algorithm>

namespace wave {

namespace {

std::string formatStatic(std::optional<std::int64_t> value) {
  return value ? std::to_string(*value) : std::string("<<unknown>>");
}

// Vector width of `dim`, zero when the op does not declare one.
std::int64_t getVectorSize(const Op &op, IndexExpr dim) {
  const VectorShapes &vectorShapes = op.getVectorShapes();
  auto it = vectorShapes.find(dim);
  return it == vectorShapes.end() ? 0 : it->second;
}

} // namespace

llvm::Expected<DimScaling>
resolveDimensionScaling(const Graph &graph, NodeId node,
                        const ConstraintSet &constraints,
                        llvm::raw_ostream &warnings) {
  const Op &op = graph.getOp(node);
  const IndexingContext &idxc = graph.getIndexingContext();
  DimScaling scaling;
  if (!op.hasVectorShapes()) {
    return scaling;
  }

  auto hardware = constraints.getHardwareConstraint();
  if (!hardware) {
    return hardware.takeError();
  }

  // Shape entries keyed by the dimension they are derived from.
  llvm::DenseMap<IndexExpr, IndexExpr> dimToShape;
  if (const auto &type = op.getType()) {
    for (IndexExpr entry : type->getShape()) {
      if (IndexExpr dim = inferDim(entry)) {
        dimToShape[dim] = entry;
      }
    }
  }

  for (const Constraint &constraint : constraints) {
    if (!llvm::isa<WorkgroupConstraint, TilingConstraint>(constraint)) {
      continue;
    }
    const auto &distribution = llvm::cast<DistributionConstraint>(constraint);
    IndexExpr dim = distribution.getDim();

    std::optional<std::int64_t> tileSize =
        idxc.getStaticValue(distribution.getTileSize());
    auto shapeIt = dimToShape.find(dim);
    if (shapeIt != dimToShape.end() && shapeIt->second != dim) {
      IndexExpr derived = idxc.substitute(
          shapeIt->second, {{dim, distribution.getTileSize()}});
      tileSize = idxc.getStaticValue(derived);
    }

    if (!op.getVectorShapes().count(dim)) {
      continue;
    }
    std::int64_t vectorSize = getVectorSize(op, dim);
    // Batch-like dimension.
    if (vectorSize == 0) {
      continue;
    }

    std::optional<std::int64_t> waveCount = 1;
    if (const auto *workgroup = llvm::dyn_cast<WorkgroupConstraint>(&constraint)) {
      const auto &wavesPerBlock = hardware->getWavesPerBlock();
      if (!wavesPerBlock) {
        waveCount = std::nullopt;
      } else {
        // Workgroup dims past 2 are folded into the last grid dim.
        unsigned slot = std::min(workgroup->getWorkgroupDim(), 2u);
        waveCount = (*wavesPerBlock)[slot];
      }
    }

    if (!tileSize || !waveCount || *waveCount <= 0) {
      return llvm::createStringError(
          llvm::formatv("tile size, wave count and vector size must be "
                        "statically known, got: dim={0}, tile_size={1}, "
                        "wave_count={2}, vector_size={3} for {4}",
                        idxc.str(dim), formatStatic(tileSize),
                        formatStatic(waveCount), vectorSize, op.getName())
              .str());
    }

    if (*tileSize % *waveCount != 0 ||
        (*tileSize / *waveCount) % vectorSize != 0) {
      llvm::WithColor::warning(warnings)
          << llvm::formatv("tile size is not divisible by wave count and "
                           "vector size, got: dim={0}, tile_size={1}, "
                           "wave_count={2}, vector_size={3} for {4}",
                           idxc.str(dim), *tileSize, *waveCount, vectorSize,
                           op.getName())
          << "\n";
    }

    scaling[dim] = utils::ceilDiv(*tileSize, *waveCount * vectorSize);
    WAVE_TRACE(LogComponent::DimScaling, "{0}: {1} -> {2}", op.getName(),
               idxc.str(dim), scaling[dim]);
  }

  if (op.isScalar()) {
    return DimScaling{};
  }

  // Dimensions without constraints that have a static extent.
  auto resolveFromExtent = [&](IndexExpr dim) {
    if (scaling.count(dim)) {
      return;
    }
    std::optional<std::int64_t> extent = idxc.getStaticValue(dim);
    std::int64_t vectorSize = getVectorSize(op, dim);
    if (!extent || vectorSize <= 0) {
      return;
    }
    scaling[dim] = utils::ceilDiv(*extent, vectorSize);
    WAVE_TRACE(LogComponent::DimScaling, "{0}: {1} -> {2} from extent",
               op.getName(), idxc.str(dim), scaling[dim]);
  };

  for (IndexExpr dim : op.getIndexingDims()) {
    resolveFromExtent(dim);
  }
  if (const auto *reduce = llvm::dyn_cast<ReduceOp>(&op)) {
    resolveFromExtent(reduce->getReductionDim());
  }
  return scaling;
}

} // namespace wave
