// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_TYPES_H
#define WAVE_IR_TYPES_H

#include "wave/IR/DataType.h"
#include "wave/Support/Indexing.h"

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>

namespace wave {

enum class AddressSpace : std::uint8_t { Register, Shared, Global };

inline constexpr std::uint8_t kNumAddressSpaces =
    static_cast<std::uint8_t>(AddressSpace::Global) + 1;

llvm::StringRef getAddressSpaceName(AddressSpace addressSpace);

enum class BufferUsage : std::uint8_t { None, Input, Output };

llvm::StringRef getBufferUsageName(BufferUsage usage);

/// Physical shape of storage whose layout differs from its logical shape.
struct MemoryLayout {
  llvm::SmallVector<IndexExpr> shape;
};

/// One entry of a declared shape: an index expression or an integer that is
/// promoted to a constant expression.
class ShapeDim {
public:
  ShapeDim(std::int64_t value) : entry(value) {}
  ShapeDim(IndexExpr expr) : entry(expr) {}

  /// Returns the entry as an index expression. A null expression is returned
  /// unchanged so that callers can report it.
  IndexExpr resolve(const IndexingContext &idxc) const;

private:
  std::variant<std::int64_t, IndexExpr> entry;
};

/// Declarative type attached to graph values: addressable storage (`Memory`)
/// or a virtual register value (`Register`). Instances are immutable and
/// cheap to copy.
class ShapedType {
public:
  enum class Kind : std::uint8_t { Memory, Register };

  static llvm::Expected<ShapedType>
  getMemory(const IndexingContext &idxc, llvm::ArrayRef<ShapeDim> shape,
            AddressSpace addressSpace, DataType dtype,
            std::optional<MemoryLayout> physicalLayout = std::nullopt,
            BufferUsage usage = BufferUsage::None);

  static llvm::Expected<ShapedType> getRegister(const IndexingContext &idxc,
                                                llvm::ArrayRef<ShapeDim> shape,
                                                DataType dtype);

  Kind getKind() const { return impl->kind; }
  bool isMemory() const { return getKind() == Kind::Memory; }
  bool isRegister() const { return getKind() == Kind::Register; }

  llvm::ArrayRef<IndexExpr> getShape() const { return impl->shape; }
  unsigned getRank() const { return impl->shape.size(); }
  DataType getDataType() const { return impl->dtype; }
  AddressSpace getAddressSpace() const { return impl->addressSpace; }
  const std::optional<MemoryLayout> &getPhysicalLayout() const {
    return impl->physicalLayout;
  }
  BufferUsage getUsage() const { return impl->usage; }

  /// Dimension symbols the shape is built from, in shape order.
  llvm::SmallVector<IndexExpr> getIndexingDims() const;

  /// Register type with the same element type and the given shape.
  ShapedType getRegisterLike(llvm::ArrayRef<IndexExpr> shape) const;

  void print(llvm::raw_ostream &os, const IndexingContext &idxc) const;

  friend bool operator==(const ShapedType &lhs, const ShapedType &rhs) {
    return lhs.impl == rhs.impl || *lhs.impl == *rhs.impl;
  }
  friend bool operator!=(const ShapedType &lhs, const ShapedType &rhs) {
    return !(lhs == rhs);
  }

private:
  struct Storage {
    Kind kind;
    llvm::SmallVector<IndexExpr> shape;
    DataType dtype;
    AddressSpace addressSpace;
    std::optional<MemoryLayout> physicalLayout;
    BufferUsage usage;

    bool operator==(const Storage &other) const;
  };

  explicit ShapedType(std::shared_ptr<const Storage> impl)
      : impl(std::move(impl)) {}

  static llvm::Expected<llvm::SmallVector<IndexExpr>>
  resolveShape(const IndexingContext &idxc, llvm::ArrayRef<ShapeDim> shape);

  std::shared_ptr<const Storage> impl;
};

} // namespace wave

#endif // WAVE_IR_TYPES_H
