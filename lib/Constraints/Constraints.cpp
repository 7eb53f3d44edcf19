// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Constraints/Constraints.h"

#include "wave/Asserts.h"

#include "llvm/Support/FormatVariadic.h"

namespace wave {

void WorkgroupConstraint::print(llvm::raw_ostream &os,
                                const IndexingContext &idxc) const {
  os << "WorkgroupConstraint(dim=" << idxc.str(getDim())
     << ", tile_size=" << idxc.str(getTileSize())
     << ", workgroup_dim=" << workgroupDim
     << ", primary=" << (primary ? "true" : "false") << ")";
}

void TilingConstraint::print(llvm::raw_ostream &os,
                             const IndexingContext &idxc) const {
  os << "TilingConstraint(dim=" << idxc.str(getDim())
     << ", tile_size=" << idxc.str(getTileSize());
  if (inductionVar) {
    os << ", induction_var=" << idxc.str(*inductionVar);
  }
  os << ")";
}

void WaveConstraint::setWaveIdFromHardwareAndWorkgroupConstraint(
    IndexingContext &idxc, const HardwareConstraint &hardware,
    const WorkgroupConstraint &workgroup) {
  WAVE_assertv(getDim() == workgroup.getDim(),
               "wave and workgroup constraints distribute different dims");
  unsigned dim = workgroup.getWorkgroupDim();
  IndexExpr threadId = idxc.getSymbol(llvm::formatv("THREAD_{0}", dim).str());
  // Lanes of a wave are laid out along the first grid dimension.
  waveId = dim == 0 ? threadId.floorDiv(hardware.getThreadsPerWave())
                    : threadId;
  wavesPerBlock = workgroup.getTileSize().floorDiv(getTileSize());
  workgroupDim = dim;
}

void WaveConstraint::print(llvm::raw_ostream &os,
                           const IndexingContext &idxc) const {
  os << "WaveConstraint(dim=" << idxc.str(getDim())
     << ", tile_size=" << idxc.str(getTileSize());
  if (waveId) {
    os << ", wave_id=" << idxc.str(*waveId);
  }
  if (wavesPerBlock) {
    os << ", waves_per_block=" << idxc.str(*wavesPerBlock);
  }
  os << ")";
}

std::optional<HardwareConstraint::WavesPerBlock>
HardwareConstraint::getThreadsPerBlock() const {
  if (!wavesPerBlock) {
    return std::nullopt;
  }
  return WavesPerBlock{(*wavesPerBlock)[0] * threadsPerWave,
                       (*wavesPerBlock)[1], (*wavesPerBlock)[2]};
}

void HardwareConstraint::print(llvm::raw_ostream &os,
                               const IndexingContext &idxc) const {
  os << "HardwareConstraint(threads_per_wave=" << threadsPerWave;
  if (wavesPerBlock) {
    os << ", waves_per_block=[" << (*wavesPerBlock)[0] << ", "
       << (*wavesPerBlock)[1] << ", " << (*wavesPerBlock)[2] << "]";
  }
  os << ", vector_shapes={";
  llvm::interleaveComma(vectorShapes, os, [&](const auto &entry) {
    os << idxc.str(entry.first) << ": " << entry.second;
  });
  os << "})";
}

llvm::SmallVector<std::unique_ptr<Constraint>>
SymbolicAlias::createNewConstraints(
    llvm::ArrayRef<const DistributionConstraint *> constraints) const {
  llvm::SmallVector<std::unique_ptr<Constraint>> result;
  for (const DistributionConstraint *constraint : constraints) {
    if (constraint->getDim() != target) {
      continue;
    }
    std::unique_ptr<Constraint> copy = constraint->clone();
    auto &distribution = llvm::cast<DistributionConstraint>(*copy);
    distribution.setDim(source);
    distribution.setTileSize(apply(constraint->getTileSize()));
    result.push_back(std::move(copy));
  }
  return result;
}

void SymbolicAlias::print(llvm::raw_ostream &os,
                          const IndexingContext &idxc) const {
  os << "SymbolicAlias(source=" << idxc.str(source)
     << ", target=" << idxc.str(target) << ")";
}

llvm::Expected<HardwareConstraint &> ConstraintSet::getHardwareConstraint() {
  llvm::SmallVector<HardwareConstraint *> hardware =
      getAll<HardwareConstraint>();
  if (hardware.size() != 1) {
    return llvm::createStringError(
        llvm::formatv("exactly one hardware constraint must be provided, got "
                      "{0}",
                      hardware.size())
            .str());
  }
  return *hardware.front();
}

llvm::Expected<const HardwareConstraint &>
ConstraintSet::getHardwareConstraint() const {
  llvm::SmallVector<const HardwareConstraint *> hardware =
      getAll<HardwareConstraint>();
  if (hardware.size() != 1) {
    return llvm::createStringError(
        llvm::formatv("exactly one hardware constraint must be provided, got "
                      "{0}",
                      hardware.size())
            .str());
  }
  return *hardware.front();
}

void ConstraintSet::print(llvm::raw_ostream &os,
                          const IndexingContext &idxc) const {
  for (const Constraint &constraint : *this) {
    constraint.print(os, idxc);
    os << "\n";
  }
}

} // namespace wave
