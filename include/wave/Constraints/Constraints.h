// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_CONSTRAINTS_CONSTRAINTS_H
#define WAVE_CONSTRAINTS_CONSTRAINTS_H

#include "wave/IR/Ops.h"
#include "wave/Support/Indexing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/iterator.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace wave {

enum class ConstraintKind : std::uint8_t {
  Workgroup,
  Tiling,
  Wave,
  Hardware,
  SymbolicAlias,
};

/// A declarative rule of the hardware decomposition of a kernel.
class Constraint {
public:
  virtual ~Constraint() = default;

  ConstraintKind getKind() const { return kind; }

  virtual std::unique_ptr<Constraint> clone() const = 0;
  virtual void print(llvm::raw_ostream &os,
                     const IndexingContext &idxc) const = 0;

protected:
  explicit Constraint(ConstraintKind kind) : kind(kind) {}
  Constraint(const Constraint &) = default;

private:
  ConstraintKind kind;
};

/// Constraint distributing `dim` in tiles of `tileSize`.
class DistributionConstraint : public Constraint {
public:
  IndexExpr getDim() const { return dim; }
  void setDim(IndexExpr value) { dim = value; }
  IndexExpr getTileSize() const { return tileSize; }
  void setTileSize(IndexExpr value) { tileSize = value; }

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::Workgroup ||
           constraint->getKind() == ConstraintKind::Tiling ||
           constraint->getKind() == ConstraintKind::Wave;
  }

protected:
  DistributionConstraint(ConstraintKind kind, IndexExpr dim,
                         IndexExpr tileSize)
      : Constraint(kind), dim(dim), tileSize(tileSize) {}

private:
  IndexExpr dim;
  IndexExpr tileSize;
};

/// Distributes `dim` across workgroups along grid dimension `workgroupDim`.
class WorkgroupConstraint : public DistributionConstraint {
public:
  WorkgroupConstraint(IndexExpr dim, IndexExpr tileSize, unsigned workgroupDim,
                      bool primary = true)
      : DistributionConstraint(ConstraintKind::Workgroup, dim, tileSize),
        workgroupDim(workgroupDim), primary(primary) {}

  unsigned getWorkgroupDim() const { return workgroupDim; }
  void setWorkgroupDim(unsigned value) { workgroupDim = value; }

  /// Only primary constraints contribute to the grid shape.
  bool isPrimary() const { return primary; }
  void setPrimary(bool value) { primary = value; }

  /// Number of workgroups along `dim`.
  IndexExpr getCount() const { return getDim().ceilDiv(getTileSize()); }

  std::unique_ptr<Constraint> clone() const override {
    return std::make_unique<WorkgroupConstraint>(*this);
  }
  void print(llvm::raw_ostream &os,
             const IndexingContext &idxc) const override;

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::Workgroup;
  }

private:
  unsigned workgroupDim;
  bool primary;
};

/// Tiles `dim` sequentially, typically by the iterate over that axis.
class TilingConstraint : public DistributionConstraint {
public:
  TilingConstraint(IndexExpr dim, IndexExpr tileSize)
      : DistributionConstraint(ConstraintKind::Tiling, dim, tileSize) {}

  std::optional<IndexExpr> getInductionVar() const { return inductionVar; }
  void setInductionVar(IndexExpr value) { inductionVar = value; }

  /// Number of tiles along `dim`.
  IndexExpr getCount() const { return getDim().ceilDiv(getTileSize()); }

  std::unique_ptr<Constraint> clone() const override {
    return std::make_unique<TilingConstraint>(*this);
  }
  void print(llvm::raw_ostream &os,
             const IndexingContext &idxc) const override;

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::Tiling;
  }

private:
  std::optional<IndexExpr> inductionVar;
};

class HardwareConstraint;

/// Distributes the workgroup tile of `dim` across waves.
class WaveConstraint : public DistributionConstraint {
public:
  WaveConstraint(IndexExpr dim, IndexExpr tileSize)
      : DistributionConstraint(ConstraintKind::Wave, dim, tileSize) {}

  std::optional<IndexExpr> getWaveId() const { return waveId; }
  std::optional<IndexExpr> getWavesPerBlock() const { return wavesPerBlock; }
  std::optional<unsigned> getWorkgroupDim() const { return workgroupDim; }

  /// Derives the wave id, the waves per block and the grid dimension from the
  /// workgroup constraint distributing the same dimension.
  void setWaveIdFromHardwareAndWorkgroupConstraint(
      IndexingContext &idxc, const HardwareConstraint &hardware,
      const WorkgroupConstraint &workgroup);

  std::unique_ptr<Constraint> clone() const override {
    return std::make_unique<WaveConstraint>(*this);
  }
  void print(llvm::raw_ostream &os,
             const IndexingContext &idxc) const override;

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::Wave;
  }

private:
  std::optional<IndexExpr> waveId;
  std::optional<IndexExpr> wavesPerBlock;
  std::optional<unsigned> workgroupDim;
};

/// Fixed properties of the target: lanes per wave, waves per workgroup and
/// the default per-dimension vector widths of operations.
class HardwareConstraint : public Constraint {
public:
  using WavesPerBlock = std::array<std::int64_t, 3>;

  HardwareConstraint(unsigned threadsPerWave,
                     std::optional<WavesPerBlock> wavesPerBlock = std::nullopt,
                     VectorShapes vectorShapes = {})
      : Constraint(ConstraintKind::Hardware), threadsPerWave(threadsPerWave),
        wavesPerBlock(wavesPerBlock), vectorShapes(std::move(vectorShapes)) {}

  unsigned getThreadsPerWave() const { return threadsPerWave; }

  const std::optional<WavesPerBlock> &getWavesPerBlock() const {
    return wavesPerBlock;
  }
  void setWavesPerBlock(WavesPerBlock value) { wavesPerBlock = value; }

  const VectorShapes &getVectorShapes() const { return vectorShapes; }

  /// Workgroup size in threads, known once the waves per block are.
  std::optional<WavesPerBlock> getThreadsPerBlock() const;

  std::unique_ptr<Constraint> clone() const override {
    return std::make_unique<HardwareConstraint>(*this);
  }
  void print(llvm::raw_ostream &os,
             const IndexingContext &idxc) const override;

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::Hardware;
  }

private:
  unsigned threadsPerWave;
  std::optional<WavesPerBlock> wavesPerBlock;
  VectorShapes vectorShapes;
};

/// Declares `source` as an alias of `target`: constraints on `target` are
/// replicated on `source` with their tile sizes mapped by `sourceToTarget`.
class SymbolicAlias : public Constraint {
public:
  using Function = std::function<IndexExpr(IndexExpr)>;

  SymbolicAlias(IndexExpr source, IndexExpr target, Function sourceToTarget)
      : Constraint(ConstraintKind::SymbolicAlias), source(source),
        target(target), sourceToTarget(std::move(sourceToTarget)) {}

  IndexExpr getSource() const { return source; }
  IndexExpr getTarget() const { return target; }
  IndexExpr apply(IndexExpr expr) const { return sourceToTarget(expr); }

  /// Copies of the constraints of `constraints` that distribute `target`,
  /// rewritten to distribute `source`.
  llvm::SmallVector<std::unique_ptr<Constraint>>
  createNewConstraints(llvm::ArrayRef<const DistributionConstraint *>
                           constraints) const;

  std::unique_ptr<Constraint> clone() const override {
    return std::make_unique<SymbolicAlias>(*this);
  }
  void print(llvm::raw_ostream &os,
             const IndexingContext &idxc) const override;

  static bool classof(const Constraint *constraint) {
    return constraint->getKind() == ConstraintKind::SymbolicAlias;
  }

private:
  IndexExpr source;
  IndexExpr target;
  Function sourceToTarget;
};

/// Ordered, owning collection of constraints.
class ConstraintSet {
  using Storage = std::vector<std::unique_ptr<Constraint>>;

public:
  using iterator = llvm::pointee_iterator<Storage::iterator>;
  using const_iterator = llvm::pointee_iterator<Storage::const_iterator>;

  ConstraintSet() = default;
  ConstraintSet(ConstraintSet &&) = default;
  ConstraintSet &operator=(ConstraintSet &&) = default;

  template <typename T, typename... Args>
  T &add(Args &&...args) {
    auto constraint = std::make_unique<T>(std::forward<Args>(args)...);
    T &result = *constraint;
    constraints.push_back(std::move(constraint));
    return result;
  }

  void add(std::unique_ptr<Constraint> constraint) {
    constraints.push_back(std::move(constraint));
  }

  iterator begin() { return iterator(constraints.begin()); }
  iterator end() { return iterator(constraints.end()); }
  const_iterator begin() const { return const_iterator(constraints.begin()); }
  const_iterator end() const { return const_iterator(constraints.end()); }
  std::size_t size() const { return constraints.size(); }

  template <typename T>
  llvm::SmallVector<T *> getAll() {
    llvm::SmallVector<T *> result;
    for (Constraint &constraint : *this) {
      if (auto *typed = llvm::dyn_cast<T>(&constraint)) {
        result.push_back(typed);
      }
    }
    return result;
  }

  template <typename T>
  llvm::SmallVector<const T *> getAll() const {
    llvm::SmallVector<const T *> result;
    for (const Constraint &constraint : *this) {
      if (const auto *typed = llvm::dyn_cast<T>(&constraint)) {
        result.push_back(typed);
      }
    }
    return result;
  }

  /// The hardware constraint; an error unless there is exactly one.
  llvm::Expected<HardwareConstraint &> getHardwareConstraint();
  llvm::Expected<const HardwareConstraint &> getHardwareConstraint() const;

  void print(llvm::raw_ostream &os, const IndexingContext &idxc) const;

private:
  Storage constraints;
};

} // namespace wave

#endif // WAVE_CONSTRAINTS_CONSTRAINTS_H
