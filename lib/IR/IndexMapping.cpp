// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/IndexMapping.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"

namespace wave {

IndexExpr IndexMapping::iterator(IndexingContext &idxc, unsigned index) {
  return idxc.getSymbol(llvm::formatv("$index{0}", index).str());
}

IndexExpr IndexMapping::dynamicVal(IndexingContext &idxc, unsigned index) {
  return idxc.getSymbol(llvm::formatv("$dynamic_val{0}", index).str());
}

llvm::Expected<IndexMapping>
IndexMapping::get(IndexingContext &idxc, unsigned numIterators,
                  SymbolsMap inputs, SymbolsMap outputs,
                  llvm::ArrayRef<SymbolsMap> dynamicValMappings) {
  IndexMapping mapping(idxc);
  for (unsigned i = 0; i < numIterators; ++i) {
    mapping.iters.push_back(iterator(idxc, i));
  }

  llvm::SmallVector<IndexExpr> iterShape(numIterators);
  auto unify = [&](const SymbolsMap &coordinates) -> llvm::Error {
    for (const auto &[symbol, expr] : coordinates) {
      std::optional<unsigned> index = mapping.getIterIndex(expr);
      if (!index) {
        continue;
      }
      IndexExpr &current = iterShape[*index];
      if (current && current != symbol) {
        return llvm::createStringError(
            llvm::formatv("iterator conflict: {0} is claimed by {1} and {2}",
                          idxc.str(expr), idxc.str(current), idxc.str(symbol))
                .str());
      }
      current = symbol;
    }
    return llvm::Error::success();
  };
  if (llvm::Error error = unify(inputs)) {
    return std::move(error);
  }
  if (llvm::Error error = unify(outputs)) {
    return std::move(error);
  }

  for (auto [i, symbol] : llvm::enumerate(iterShape)) {
    if (!symbol) {
      return llvm::createStringError(
          llvm::formatv("cannot determine iteration domain: iterator {0} is "
                        "not mapped to any coordinate",
                        idxc.str(mapping.iters[i]))
              .str());
    }
  }

  mapping.iterationShape = std::move(iterShape);
  mapping.inputMapping = std::move(inputs);
  mapping.outputMapping = std::move(outputs);
  mapping.dynamicValMappings.assign(dynamicValMappings.begin(),
                                    dynamicValMappings.end());
  for (unsigned i = 0; i < dynamicValMappings.size(); ++i) {
    mapping.dynamicValIndices.push_back(dynamicVal(idxc, i));
  }
  return mapping;
}

std::optional<unsigned> IndexMapping::getIterIndex(IndexExpr symbol) const {
  const auto *it = llvm::find(iters, symbol);
  if (it == iters.end()) {
    return std::nullopt;
  }
  return static_cast<unsigned>(std::distance(iters.begin(), it));
}

static llvm::SmallVector<IndexExpr> getKeys(const SymbolsMap &mapping) {
  return llvm::to_vector(llvm::make_first_range(mapping));
}

static llvm::SmallVector<IndexExpr> getValues(const SymbolsMap &mapping) {
  return llvm::to_vector(llvm::make_second_range(mapping));
}

llvm::SmallVector<IndexExpr> IndexMapping::getInputShape() const {
  return getKeys(inputMapping);
}

llvm::SmallVector<IndexExpr> IndexMapping::getOutputShape() const {
  return getKeys(outputMapping);
}

llvm::SmallVector<IndexExpr> IndexMapping::mapInputIndices() const {
  return getValues(inputMapping);
}

llvm::Expected<llvm::SmallVector<IndexExpr>>
IndexMapping::mapInputIndices(llvm::ArrayRef<IndexExpr> symbols) const {
  return mapIndices(inputMapping, symbols);
}

llvm::SmallVector<IndexExpr> IndexMapping::mapOutputIndices() const {
  return getValues(outputMapping);
}

llvm::Expected<llvm::SmallVector<IndexExpr>>
IndexMapping::mapOutputIndices(llvm::ArrayRef<IndexExpr> symbols) const {
  return mapIndices(outputMapping, symbols);
}

llvm::Expected<llvm::SmallVector<IndexExpr>>
IndexMapping::mapIndices(const SymbolsMap &mapping,
                         llvm::ArrayRef<IndexExpr> symbols) const {
  llvm::SmallVector<IndexExpr> result;
  for (IndexExpr symbol : symbols) {
    auto it = mapping.find(symbol);
    if (it == mapping.end()) {
      return llvm::createStringError(
          llvm::formatv("{0} is not a mapped coordinate", idxc->str(symbol))
              .str());
    }
    result.push_back(it->second);
  }
  return result;
}

static bool isIdentityMapping(llvm::ArrayRef<IndexExpr> iters,
                              const SymbolsMap &mapping) {
  if (iters.size() != mapping.size()) {
    return false;
  }
  return llvm::all_of(llvm::zip(iters, mapping), [](auto pair) {
    return std::get<0>(pair) == std::get<1>(pair).second;
  });
}

bool IndexMapping::isInputIdentity() const {
  return isIdentityMapping(iters, inputMapping);
}

bool IndexMapping::isOutputIdentity() const {
  return isIdentityMapping(iters, outputMapping);
}

llvm::Expected<IndexMapping> IndexMapping::substitute(
    llvm::ArrayRef<IndexSubstitution> substitutions) const {
  auto substituteAll = [&](const SymbolsMap &mapping) {
    SymbolsMap result;
    for (const auto &[symbol, expr] : mapping) {
      result[symbol] = idxc->substitute(expr, substitutions);
    }
    return result;
  };
  llvm::SmallVector<SymbolsMap> dynamicVals;
  for (const SymbolsMap &mapping : dynamicValMappings) {
    dynamicVals.push_back(substituteAll(mapping));
  }
  return get(*idxc, getNumIterators(), substituteAll(inputMapping),
             substituteAll(outputMapping), dynamicVals);
}

void IndexMapping::print(llvm::raw_ostream &os) const {
  auto printMapping = [&](const SymbolsMap &mapping) {
    os << "{";
    llvm::interleaveComma(mapping, os, [&](const auto &entry) {
      idxc->print(os, entry.first);
      os << ": ";
      idxc->print(os, entry.second);
    });
    os << "}";
  };
  os << "IndexMapping(iters=[";
  llvm::interleaveComma(iters, os, [&](IndexExpr it) { idxc->print(os, it); });
  os << "], input_mapping=";
  printMapping(inputMapping);
  os << ", output_mapping=";
  printMapping(outputMapping);
  os << ", dynamic_val_mappings=[";
  llvm::interleaveComma(dynamicValMappings, os,
                        [&](const SymbolsMap &mapping) { printMapping(mapping); });
  os << "])";
}

} // namespace wave
