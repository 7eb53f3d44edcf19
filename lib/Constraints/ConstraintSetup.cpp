// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Constraints/ConstraintSetup.h"

#include "wave/Support/Logger.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"

#include <algorithm>

namespace wave {

llvm::MapVector<NodeId, IndexExpr>
createInductionVars(Graph &graph, ConstraintSet &constraints) {
  IndexingContext &idxc = graph.getIndexingContext();
  llvm::MapVector<NodeId, IndexExpr> inductionVars;
  for (NodeId id : graph.getAllOps()) {
    const auto *iterate = llvm::dyn_cast<IterateOp>(&graph.getOp(id));
    if (!iterate) {
      continue;
    }
    IndexExpr inductionVar =
        idxc.getSymbol("$ARG" + idxc.str(iterate->getAxis()));
    inductionVars[id] = inductionVar;
    for (TilingConstraint *tiling : constraints.getAll<TilingConstraint>()) {
      if (tiling->getDim() == iterate->getAxis()) {
        tiling->setInductionVar(inductionVar);
      }
    }
    WAVE_DEBUG(LogComponent::Constraints, "induction variable of {0} is {1}",
               iterate->getName(), idxc.str(inductionVar));
  }
  return inductionVars;
}

llvm::Error initializeWaveConstraints(ConstraintSet &constraints,
                                      IndexingContext &idxc) {
  auto hardware = constraints.getHardwareConstraint();
  if (!hardware) {
    return hardware.takeError();
  }
  llvm::SmallVector<WorkgroupConstraint *> workgroups =
      constraints.getAll<WorkgroupConstraint>();
  llvm::SmallVector<WaveConstraint *> waves =
      constraints.getAll<WaveConstraint>();

  for (WaveConstraint *wave : waves) {
    for (const WorkgroupConstraint *workgroup : workgroups) {
      if (wave->getDim() == workgroup->getDim()) {
        wave->setWaveIdFromHardwareAndWorkgroupConstraint(idxc, *hardware,
                                                          *workgroup);
      }
    }
  }

  if (hardware->getWavesPerBlock()) {
    return llvm::Error::success();
  }

  HardwareConstraint::WavesPerBlock wavesPerBlock{1, 1, 1};
  for (const WaveConstraint *wave : waves) {
    if (!wave->getWavesPerBlock() || !wave->getWorkgroupDim()) {
      return llvm::createStringError(
          llvm::formatv("wave constraint on {0} has no matching workgroup "
                        "constraint",
                        idxc.str(wave->getDim()))
              .str());
    }
    std::optional<std::int64_t> count =
        idxc.getStaticValue(*wave->getWavesPerBlock());
    if (!count) {
      return llvm::createStringError(
          llvm::formatv("waves per block along {0} must be statically known, "
                        "got {1}",
                        idxc.str(wave->getDim()),
                        idxc.str(*wave->getWavesPerBlock()))
              .str());
    }
    wavesPerBlock[std::min(*wave->getWorkgroupDim(), 2u)] = *count;
  }
  hardware->setWavesPerBlock(wavesPerBlock);
  WAVE_DEBUG(LogComponent::Constraints, "waves per block: [{0}, {1}, {2}]",
             wavesPerBlock[0], wavesPerBlock[1], wavesPerBlock[2]);
  return llvm::Error::success();
}

void initializeReductions(Graph &graph, const ConstraintSet &constraints) {
  const IndexingContext &idxc = graph.getIndexingContext();
  for (NodeId id : graph.getAllOps()) {
    auto *iterate = llvm::dyn_cast<IterateOp>(&graph.getOp(id));
    if (!iterate) {
      continue;
    }
    for (const TilingConstraint *tiling :
         constraints.getAll<TilingConstraint>()) {
      if (tiling->getDim() == iterate->getAxis()) {
        iterate->setCount(idxc.substituteBindings(tiling->getCount()));
      }
    }
  }
}

void initializeSymbolicConstraints(ConstraintSet &constraints,
                                   IndexingContext &idxc) {
  auto asDistribution = [](auto typed) {
    return llvm::SmallVector<const DistributionConstraint *>(typed.begin(),
                                                             typed.end());
  };
  llvm::SmallVector<const DistributionConstraint *> workgroups =
      asDistribution(constraints.getAll<WorkgroupConstraint>());
  llvm::SmallVector<const DistributionConstraint *> waves =
      asDistribution(constraints.getAll<WaveConstraint>());
  llvm::SmallVector<const DistributionConstraint *> tilings =
      asDistribution(constraints.getAll<TilingConstraint>());

  llvm::SmallVector<std::unique_ptr<Constraint>> newWorkgroups;
  llvm::SmallVector<std::unique_ptr<Constraint>> newWaves;
  llvm::SmallVector<std::unique_ptr<Constraint>> newTilings;
  llvm::SmallVector<SymbolicAlias *> aliases =
      constraints.getAll<SymbolicAlias>();
  for (const SymbolicAlias *alias : aliases) {
    for (auto &constraint : alias->createNewConstraints(workgroups)) {
      newWorkgroups.push_back(std::move(constraint));
    }
    for (auto &constraint : alias->createNewConstraints(waves)) {
      newWaves.push_back(std::move(constraint));
    }
    for (auto &constraint : alias->createNewConstraints(tilings)) {
      newTilings.push_back(std::move(constraint));
    }
  }

  // A wave constraint covering the whole workgroup tile is redundant.
  llvm::erase_if(newWaves, [&](const std::unique_ptr<Constraint> &wave) {
    const auto &waveConstraint = llvm::cast<WaveConstraint>(*wave);
    return llvm::any_of(newWorkgroups, [&](const auto &workgroup) {
      const auto &workgroupConstraint =
          llvm::cast<WorkgroupConstraint>(*workgroup);
      return waveConstraint.getDim() == workgroupConstraint.getDim() &&
             waveConstraint.getTileSize() == workgroupConstraint.getTileSize();
    });
  });

  for (auto *group : {&newWorkgroups, &newWaves, &newTilings}) {
    for (auto &constraint : *group) {
      constraints.add(std::move(constraint));
    }
  }

  for (const SymbolicAlias *alias : aliases) {
    if (!idxc.getStaticValue(alias->getTarget())) {
      continue;
    }
    std::optional<std::int64_t> value =
        idxc.getStaticValue(alias->apply(alias->getTarget()));
    if (value) {
      idxc.bindConstant(alias->getSource(), *value);
      WAVE_DEBUG(LogComponent::Constraints, "bind alias {0} = {1}",
                 idxc.str(alias->getSource()), *value);
    }
  }
}

llvm::Expected<std::array<std::int64_t, 3>>
inferGridShape(const ConstraintSet &constraints, const IndexingContext &idxc) {
  constexpr unsigned kMaxWorkgroupDim = 2;
  std::array<std::int64_t, 3> grid{1, 1, 1};

  llvm::SmallVector<IndexExpr> aliased;
  for (const SymbolicAlias *alias : constraints.getAll<SymbolicAlias>()) {
    aliased.push_back(alias->getSource());
  }

  for (const WorkgroupConstraint *workgroup :
       constraints.getAll<WorkgroupConstraint>()) {
    if (llvm::is_contained(aliased, workgroup->getDim()) ||
        !workgroup->isPrimary()) {
      continue;
    }
    std::optional<std::int64_t> count =
        idxc.getStaticValue(workgroup->getCount());
    if (!count) {
      return llvm::createStringError(
          llvm::formatv("workgroup count along {0} must be statically known, "
                        "got {1}",
                        idxc.str(workgroup->getDim()),
                        idxc.str(workgroup->getCount()))
              .str());
    }
    grid[std::min(workgroup->getWorkgroupDim(), kMaxWorkgroupDim)] *= *count;
  }
  return grid;
}

llvm::Error assignVectorShapes(Graph &graph, const ConstraintSet &constraints) {
  auto hardware = constraints.getHardwareConstraint();
  if (!hardware) {
    return hardware.takeError();
  }
  graph.walk([&](Op &op) {
    if (op.getType() && !op.hasVectorShapes()) {
      op.setVectorShapes(hardware->getVectorShapes());
    }
  });
  return llvm::Error::success();
}

} // namespace wave
