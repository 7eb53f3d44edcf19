// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/IR/Graph.h"

#include "wave/Asserts.h"
#include "wave/Support/Logger.h"

#include "llvm/ADT/STLExtras.h"

namespace wave {

Graph::Graph(IndexingContext &idxc) : idxc(&idxc) {
  regions.emplace_back();
}

RegionId Graph::createRegion(NodeId parent) {
  WAVE_assert_limit(parent, ops.size());
  regions.push_back(Region{parent, kInvalidNodeId, kInvalidNodeId});
  return regions.size() - 1;
}

NodeId Graph::getRegionParent(RegionId region) const {
  WAVE_assert_limit(region, regions.size());
  return regions[region].parent;
}

Op &Graph::getOp(NodeId id) {
  WAVE_assert_limit(id, ops.size());
  return *ops[id];
}

const Op &Graph::getOp(NodeId id) const {
  WAVE_assert_limit(id, ops.size());
  return *ops[id];
}

NodeId Graph::add(std::unique_ptr<Op> op) {
  NodeId id = ops.size();
  op->id = id;
  op->users.clear();
  op->prev = kInvalidNodeId;
  op->next = kInvalidNodeId;
  op->erased = false;
  ops.push_back(std::move(op));
  addUses(id);
  return id;
}

void Graph::addUses(NodeId user) {
  for (NodeId operand : getOp(user).operands) {
    WAVE_assertv(!getOp(operand).isErased(), "operand {0} of {1} is erased",
                 getOp(operand).getName(), getOp(user).getName());
    getOp(operand).users.push_back(user);
  }
}

void Graph::removeUse(NodeId value, NodeId user) {
  auto &users = getOp(value).users;
  auto *it = llvm::find(users, user);
  WAVE_assertv(it != users.end(), "{0} is not a user of {1}",
               getOp(user).getName(), getOp(value).getName());
  users.erase(it);
}

NodeId Graph::append(RegionId region, std::unique_ptr<Op> op) {
  WAVE_assert_limit(region, regions.size());
  NodeId id = add(std::move(op));
  Op &newOp = getOp(id);
  Region &r = regions[region];
  newOp.region = region;
  newOp.prev = r.last;
  if (r.last != kInvalidNodeId) {
    getOp(r.last).next = id;
  } else {
    r.first = id;
  }
  r.last = id;
  WAVE_TRACE(LogComponent::Graph, "append {0} to region {1}", newOp.getName(),
             region);
  return id;
}

NodeId Graph::insertAfter(NodeId anchor, std::unique_ptr<Op> op) {
  WAVE_assertv(!getOp(anchor).isErased(), "cannot insert after erased {0}",
               getOp(anchor).getName());
  RegionId region = getOp(anchor).region;
  NodeId id = add(std::move(op));
  Op &newOp = getOp(id);
  Op &anchorOp = getOp(anchor);
  newOp.region = region;
  newOp.prev = anchor;
  newOp.next = anchorOp.next;
  if (anchorOp.next != kInvalidNodeId) {
    getOp(anchorOp.next).prev = id;
  } else {
    regions[region].last = id;
  }
  anchorOp.next = id;
  return id;
}

NodeId Graph::cloneAfter(NodeId original, NodeId anchor) {
  return insertAfter(anchor, getOp(original).clone());
}

void Graph::setOperand(NodeId user, unsigned index, NodeId value) {
  Op &op = getOp(user);
  WAVE_assert_limit(index, op.operands.size());
  removeUse(op.operands[index], user);
  op.operands[index] = value;
  getOp(value).users.push_back(user);
}

void Graph::setOperands(NodeId user, llvm::ArrayRef<NodeId> values) {
  Op &op = getOp(user);
  for (NodeId operand : op.operands) {
    removeUse(operand, user);
  }
  op.operands.assign(values.begin(), values.end());
  addUses(user);
}

void Graph::erase(NodeId id) {
  Op &op = getOp(id);
  WAVE_assertv(!op.isErased(), "{0} is already erased", op.getName());
  WAVE_assertv(!op.hasUsers(), "cannot erase {0}, it still has {1} users",
               op.getName(), op.users.size());
  for (NodeId operand : op.operands) {
    removeUse(operand, id);
  }
  op.operands.clear();

  Region &r = regions[op.region];
  if (op.prev != kInvalidNodeId) {
    getOp(op.prev).next = op.next;
  } else {
    r.first = op.next;
  }
  if (op.next != kInvalidNodeId) {
    getOp(op.next).prev = op.prev;
  } else {
    r.last = op.prev;
  }
  op.prev = kInvalidNodeId;
  op.next = kInvalidNodeId;
  op.erased = true;
  WAVE_TRACE(LogComponent::Graph, "erase {0}", op.getName());
}

llvm::SmallVector<NodeId> Graph::getRegionOps(RegionId region) const {
  WAVE_assert_limit(region, regions.size());
  llvm::SmallVector<NodeId> result;
  for (NodeId id = regions[region].first; id != kInvalidNodeId;
       id = getOp(id).next) {
    result.push_back(id);
  }
  return result;
}

void Graph::collectOps(RegionId region,
                       llvm::SmallVectorImpl<NodeId> &result) const {
  for (NodeId id : getRegionOps(region)) {
    result.push_back(id);
    if (const auto *iterate = llvm::dyn_cast<IterateOp>(&getOp(id))) {
      collectOps(iterate->getBody(), result);
    }
  }
}

llvm::SmallVector<NodeId> Graph::getAllOps() const {
  llvm::SmallVector<NodeId> result;
  collectOps(kRootRegion, result);
  return result;
}

void Graph::walk(llvm::function_ref<void(Op &)> fn) {
  for (NodeId id : getAllOps()) {
    if (!getOp(id).isErased()) {
      fn(getOp(id));
    }
  }
}

NodeId Graph::getRegionOutput(RegionId region) const {
  WAVE_assert_limit(region, regions.size());
  for (NodeId id = regions[region].last; id != kInvalidNodeId;
       id = getOp(id).prev) {
    if (llvm::isa<OutputOp>(getOp(id))) {
      return id;
    }
  }
  return kInvalidNodeId;
}

void Graph::printRegion(llvm::raw_ostream &os, RegionId region,
                        unsigned indent) const {
  for (NodeId id : getRegionOps(region)) {
    const Op &op = getOp(id);
    os.indent(indent) << "%" << op.getName() << " = "
                      << getOpKindName(op.getKind()) << "(";
    llvm::interleaveComma(op.getOperands(), os, [&](NodeId operand) {
      os << "%" << getOp(operand).getName();
    });
    os << ")";
    if (const auto &type = op.getType()) {
      os << " : ";
      type->print(os, *idxc);
    } else if (auto scalarType = op.getScalarType()) {
      os << " : " << *scalarType;
    }
    if (const auto &query = op.getDimQuery()) {
      os << " dims ";
      query->print(os, *idxc);
    }
    if (op.isLastMmaNode()) {
      os << " last_mma";
    }
    os << "\n";
    if (const auto *iterate = llvm::dyn_cast<IterateOp>(&op)) {
      printRegion(os, iterate->getBody(), indent + 2);
    }
  }
}

void Graph::print(llvm::raw_ostream &os) const {
  printRegion(os, kRootRegion, 0);
}

SymbolArgumentMap getSymbolArgumentMap(const Graph &graph) {
  SymbolArgumentMap result;
  for (NodeId id : graph.getRegionOps(Graph::kRootRegion)) {
    const auto *placeholder = llvm::dyn_cast<PlaceholderOp>(&graph.getOp(id));
    if (!placeholder || !placeholder->getType() ||
        !placeholder->getType()->isMemory()) {
      continue;
    }
    for (auto [dim, symbol] :
         llvm::enumerate(placeholder->getType()->getShape())) {
      result.insert(std::make_pair(
          symbol, std::make_pair(placeholder->getArgIndex(),
                                 static_cast<unsigned>(dim))));
    }
  }
  return result;
}

} // namespace wave
