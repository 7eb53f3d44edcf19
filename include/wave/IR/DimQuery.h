// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#ifndef WAVE_IR_DIMQUERY_H
#define WAVE_IR_DIMQUERY_H

#include "wave/Support/Indexing.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <utility>

namespace wave {

/// Replica coordinate of an expanded node: an ordered assignment of integer
/// indices to a subset of dimension symbols.
class DimQuery {
public:
  using Entry = std::pair<IndexExpr, std::int64_t>;
  using const_iterator = llvm::SmallVectorImpl<Entry>::const_iterator;

  DimQuery() = default;
  DimQuery(std::initializer_list<Entry> init) {
    for (const Entry &entry : init) {
      set(entry.first, entry.second);
    }
  }

  /// Sets the index of `dim`, appending it if not present.
  void set(IndexExpr dim, std::int64_t value) {
    auto *it = llvm::find_if(
        entries, [&](const Entry &entry) { return entry.first == dim; });
    if (it != entries.end()) {
      it->second = value;
      return;
    }
    entries.emplace_back(dim, value);
  }

  std::optional<std::int64_t> lookup(IndexExpr dim) const {
    const auto *it = llvm::find_if(
        entries, [&](const Entry &entry) { return entry.first == dim; });
    if (it == entries.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool contains(IndexExpr dim) const { return lookup(dim).has_value(); }

  const_iterator begin() const { return entries.begin(); }
  const_iterator end() const { return entries.end(); }
  std::size_t size() const { return entries.size(); }
  bool empty() const { return entries.empty(); }

  /// Key usable in ordered containers. Symbols are uniqued, so their storage
  /// addresses identify them.
  using Key = llvm::SmallVector<std::pair<std::uintptr_t, std::int64_t>, 4>;

  Key getKey() const {
    Key key;
    for (const auto &[dim, value] : entries) {
      key.emplace_back(
          reinterpret_cast<std::uintptr_t>(dim.getAsOpaquePointer()), value);
    }
    return key;
  }

  friend bool operator==(const DimQuery &lhs, const DimQuery &rhs) {
    return lhs.entries == rhs.entries;
  }
  friend bool operator!=(const DimQuery &lhs, const DimQuery &rhs) {
    return !(lhs == rhs);
  }

  void print(llvm::raw_ostream &os, const IndexingContext &idxc) const {
    os << "{";
    llvm::interleaveComma(entries, os, [&](const Entry &entry) {
      idxc.print(os, entry.first);
      os << ": " << entry.second;
    });
    os << "}";
  }

private:
  llvm::SmallVector<Entry, 4> entries;
};

} // namespace wave

#endif // WAVE_IR_DIMQUERY_H
