// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/Types.h"

#include "wave/Asserts.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"

namespace wave {

llvm::StringRef getAddressSpaceName(AddressSpace addressSpace) {
  switch (addressSpace) {
  case AddressSpace::Register:
    return "Register";
  case AddressSpace::Shared:
    return "Shared";
  case AddressSpace::Global:
    return "Global";
  }
  return "<<invalid>>";
}

llvm::StringRef getBufferUsageName(BufferUsage usage) {
  switch (usage) {
  case BufferUsage::None:
    return "None";
  case BufferUsage::Input:
    return "Input";
  case BufferUsage::Output:
    return "Output";
  }
  return "<<invalid>>";
}

IndexExpr ShapeDim::resolve(const IndexingContext &idxc) const {
  if (const auto *value = std::get_if<std::int64_t>(&entry)) {
    return idxc.getConstant(*value);
  }
  return std::get<IndexExpr>(entry);
}

bool ShapedType::Storage::operator==(const Storage &other) const {
  if (kind != other.kind || shape != other.shape || dtype != other.dtype ||
      addressSpace != other.addressSpace || usage != other.usage) {
    return false;
  }
  if (physicalLayout.has_value() != other.physicalLayout.has_value()) {
    return false;
  }
  return !physicalLayout || physicalLayout->shape == other.physicalLayout->shape;
}

llvm::Expected<llvm::SmallVector<IndexExpr>>
ShapedType::resolveShape(const IndexingContext &idxc,
                         llvm::ArrayRef<ShapeDim> shape) {
  if (shape.empty()) {
    return llvm::createStringError(
        "shaped type requires at least one shape entry");
  }
  llvm::SmallVector<IndexExpr> resolved;
  for (auto [i, dim] : llvm::enumerate(shape)) {
    IndexExpr expr = dim.resolve(idxc);
    if (!expr) {
      return llvm::createStringError(
          llvm::formatv("shape entry {0} is not an index expression", i).str());
    }
    resolved.push_back(expr);
  }
  return resolved;
}

llvm::Expected<ShapedType> ShapedType::getMemory(
    const IndexingContext &idxc, llvm::ArrayRef<ShapeDim> shape,
    AddressSpace addressSpace, DataType dtype,
    std::optional<MemoryLayout> physicalLayout, BufferUsage usage) {
  auto resolved = resolveShape(idxc, shape);
  if (!resolved) {
    return resolved.takeError();
  }
  if (!isValidDataType(dtype)) {
    return llvm::createStringError(
        llvm::formatv("invalid data type {0}", static_cast<unsigned>(dtype))
            .str());
  }
  if (static_cast<std::uint8_t>(addressSpace) >= kNumAddressSpaces) {
    return llvm::createStringError(
        llvm::formatv("invalid address space {0}",
                      static_cast<unsigned>(addressSpace))
            .str());
  }
  if (addressSpace == AddressSpace::Register) {
    return llvm::createStringError(
        "Register address space cannot be requested for Memory, declare a "
        "Register type instead");
  }
  if (physicalLayout) {
    for (auto [i, expr] : llvm::enumerate(physicalLayout->shape)) {
      if (!expr) {
        return llvm::createStringError(
            llvm::formatv("physical layout entry {0} is not an index expression",
                          i)
                .str());
      }
    }
  }
  auto storage = std::make_shared<const Storage>(
      Storage{Kind::Memory, std::move(*resolved), dtype, addressSpace,
              std::move(physicalLayout), usage});
  return ShapedType(std::move(storage));
}

llvm::Expected<ShapedType>
ShapedType::getRegister(const IndexingContext &idxc,
                        llvm::ArrayRef<ShapeDim> shape, DataType dtype) {
  auto resolved = resolveShape(idxc, shape);
  if (!resolved) {
    return resolved.takeError();
  }
  if (!isValidDataType(dtype)) {
    return llvm::createStringError(
        llvm::formatv("invalid data type {0}", static_cast<unsigned>(dtype))
            .str());
  }
  auto storage = std::make_shared<const Storage>(
      Storage{Kind::Register, std::move(*resolved), dtype,
              AddressSpace::Register, std::nullopt, BufferUsage::None});
  return ShapedType(std::move(storage));
}

llvm::SmallVector<IndexExpr> ShapedType::getIndexingDims() const {
  return inferDims(getShape());
}

ShapedType ShapedType::getRegisterLike(llvm::ArrayRef<IndexExpr> shape) const {
  WAVE_assertv(!shape.empty(), "register type requires a non-empty shape");
  auto storage = std::make_shared<const Storage>(
      Storage{Kind::Register, llvm::SmallVector<IndexExpr>(shape), getDataType(),
              AddressSpace::Register, std::nullopt, BufferUsage::None});
  return ShapedType(std::move(storage));
}

void ShapedType::print(llvm::raw_ostream &os,
                       const IndexingContext &idxc) const {
  os << (isMemory() ? "Memory[" : "Register[");
  llvm::interleaveComma(getShape(), os,
                        [&](IndexExpr expr) { idxc.print(os, expr); });
  if (isMemory()) {
    os << ", " << getAddressSpaceName(getAddressSpace());
  }
  os << ", " << getDataType() << "]";
  if (const auto &layout = getPhysicalLayout()) {
    os << " layout[";
    llvm::interleaveComma(layout->shape, os,
                          [&](IndexExpr expr) { idxc.print(os, expr); });
    os << "]";
  }
  if (getUsage() != BufferUsage::None) {
    os << " usage=" << getBufferUsageName(getUsage());
  }
}

} // namespace wave
