// SPDX-FileCopyrightText: (c) 2025 Tenstorrent AI ULC
//
// SPDX-License-Identifier: Apache-2.0

#include "wave/Expansion/Expansion.h"

#include "wave/Asserts.h"
#include "wave/Support/Logger.h"

#include "llvm/Support/FormatVariadic.h"

namespace wave {

namespace {

ExpansionMetadata makeMetadata(const Op &operand, DimQuery query) {
  ExpansionMetadata metadata;
  metadata.doNotExpand = !isExpandable(operand);
  metadata.dimQuery = std::move(query);
  return metadata;
}

DimQuery dropDim(const DimQuery &query, IndexExpr dim) {
  DimQuery result;
  for (const auto &[queryDim, value] : query) {
    if (queryDim != dim) {
      result.set(queryDim, value);
    }
  }
  return result;
}

} // namespace

ExpansionSession::ExpansionSession(Graph &graph,
                                   const ConstraintSet &constraints)
    : graph(graph), constraints(constraints), numOriginal(graph.size()) {}

llvm::Expected<const DimScaling &> ExpansionSession::getScaling(NodeId node) {
  auto it = scalings.find(node);
  if (it != scalings.end()) {
    return it->second;
  }
  auto scaling = resolveDimensionScaling(graph, node, constraints);
  if (!scaling) {
    return scaling.takeError();
  }
  return scalings.emplace(node, std::move(*scaling)).first->second;
}

std::optional<NodeId>
ExpansionSession::lookupClone(NodeId node, const DimQuery &query) const {
  auto it = memo.find(MemoKey(node, query.getKey()));
  if (it == memo.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Restricts `query` to the scaled dims of `node`. Missing dims take replica 0,
// except the reduction dim of an MMA which takes the end of the chain.
llvm::Expected<DimQuery>
ExpansionSession::normalizeQuery(NodeId node, const DimQuery &query) {
  auto scaling = getScaling(node);
  if (!scaling) {
    return scaling.takeError();
  }
  const Op &op = graph.getOp(node);
  IndexExpr chainDim;
  if (const auto *mma = llvm::dyn_cast<MMAOp>(&op)) {
    chainDim = mma->getReductionDim();
  }

  DimQuery result;
  for (IndexExpr dim : getIndexedDims(*scaling, op)) {
    std::int64_t scale = scaling->lookup(dim);
    std::optional<std::int64_t> value = query.lookup(dim);
    if (!value) {
      value = dim == chainDim ? scale - 1 : 0;
    }
    // Broadcast along dims that are not replicated.
    if (scale == 1) {
      value = 0;
    }
    if (*value < 0 || *value >= scale) {
      return llvm::createStringError(
          llvm::formatv("replica {0} of {1} is out of range for {2}, which "
                        "expands into {3} replicas",
                        *value, graph.getIndexingContext().str(dim),
                        op.getName(), scale)
              .str());
    }
    result.set(dim, *value);
  }
  return result;
}

llvm::Expected<NodeId> ExpansionSession::expandNode(NodeId node,
                                                    const DimQuery &query) {
  const Op &op = graph.getOp(node);
  WAVE_assertv(isOriginal(node), "{0} is not an original node", op.getName());
  WAVE_assertv(isExpandable(op), "{0} cannot be expanded", op.getName());

  auto normalized = normalizeQuery(node, query);
  if (!normalized) {
    return normalized.takeError();
  }
  if (std::optional<NodeId> clone = lookupClone(node, *normalized)) {
    return *clone;
  }

  // Position among the flattened loop-carried values.
  std::optional<std::int64_t> flattenedIndex;
  if (const auto *iterArg = llvm::dyn_cast<IterArgOp>(&op)) {
    auto index = getFlattenedIndex(graph.getRegionParent(op.getRegion()),
                                   iterArg->getIterIdx(), *normalized);
    if (!index) {
      return index.takeError();
    }
    flattenedIndex = *index;
  } else if (const auto *getResult = llvm::dyn_cast<GetResultOp>(&op)) {
    if (auto err = expandIterate(getResult->getIterate())) {
      return std::move(err);
    }
    auto index = getFlattenedIndex(getResult->getIterate(),
                                   getResult->getResultIndex(), *normalized);
    if (!index) {
      return index.takeError();
    }
    flattenedIndex = *index;
  }

  ExpansionMetadata metadata;
  metadata.dimQuery = *normalized;
  auto operands = resolveOperands(node, metadata);
  if (!operands) {
    return operands.takeError();
  }

  NodeId clone = createClone(node, metadata, *operands);
  Op &cloneOp = graph.getOp(clone);
  if (auto *iterArg = llvm::dyn_cast<IterArgOp>(&cloneOp)) {
    iterArg->setIterIdx(static_cast<unsigned>(*flattenedIndex));
  } else if (auto *getResult = llvm::dyn_cast<GetResultOp>(&cloneOp)) {
    getResult->setResultIndex(static_cast<unsigned>(*flattenedIndex));
  } else if (auto *reduce = llvm::dyn_cast<ReduceOp>(&cloneOp)) {
    const auto &original = llvm::cast<ReduceOp>(op);
    reduce->setNumSources(operands->size() - (original.hasInit() ? 1 : 0));
  }

  memo.emplace(MemoKey(node, normalized->getKey()), clone);
  return clone;
}

llvm::Expected<llvm::SmallVector<NodeId>>
ExpansionSession::expandAllCoordinates(NodeId node) {
  auto scaling = getScaling(node);
  if (!scaling) {
    return scaling.takeError();
  }
  llvm::SmallVector<NodeId> clones;
  for (const DimQuery &query :
       enumerateDimQueries(*scaling, graph.getOp(node).getIndexingDims())) {
    auto clone = expandNode(node, query);
    if (!clone) {
      return clone.takeError();
    }
    clones.push_back(*clone);
  }
  return clones;
}

llvm::Expected<NodeId>
ExpansionSession::resolveOperand(NodeId operand,
                                 const ExpansionMetadata &metadata) {
  if (metadata.doNotExpand) {
    return operand;
  }
  return expandNode(operand, metadata.dimQuery);
}

llvm::Expected<llvm::SmallVector<NodeId>>
ExpansionSession::resolveOperands(NodeId node, ExpansionMetadata &metadata) {
  const Op &op = graph.getOp(node);
  switch (op.getKind()) {
  case OpKind::MMA:
    return resolveMMAOperands(node, metadata);
  case OpKind::Reduce:
    return resolveReduceOperands(node, metadata);
  case OpKind::Reshape:
    return resolveReshapeOperands(node, metadata);
  default:
    break;
  }

  llvm::SmallVector<NodeId> operands;
  for (NodeId operand : op.getOperands()) {
    auto resolved = resolveOperand(
        operand, makeMetadata(graph.getOp(operand), metadata.dimQuery));
    if (!resolved) {
      return resolved.takeError();
    }
    operands.push_back(*resolved);
  }
  return operands;
}

// Replicas along the reduction dim accumulate into each other: replica k
// takes replica k - 1 as accumulator.
llvm::Expected<llvm::SmallVector<NodeId>>
ExpansionSession::resolveMMAOperands(NodeId node, ExpansionMetadata &metadata) {
  const auto &mma = graph.getOpAs<MMAOp>(node);
  IndexExpr reductionDim = mma.getReductionDim();
  auto scaling = getScaling(node);
  if (!scaling) {
    return scaling.takeError();
  }
  const DimQuery &query = metadata.dimQuery;

  llvm::SmallVector<NodeId> operands;
  for (NodeId operand : {mma.getLhs(), mma.getRhs()}) {
    auto resolved =
        resolveOperand(operand, makeMetadata(graph.getOp(operand), query));
    if (!resolved) {
      return resolved.takeError();
    }
    operands.push_back(*resolved);
  }

  std::optional<std::int64_t> step = query.lookup(reductionDim);
  if (step && *step > 0) {
    DimQuery previous = query;
    previous.set(reductionDim, *step - 1);
    auto acc = expandNode(node, previous);
    if (!acc) {
      return acc.takeError();
    }
    operands.push_back(*acc);
  } else {
    auto acc = resolveOperand(
        mma.getAcc(), makeMetadata(graph.getOp(mma.getAcc()),
                                   dropDim(query, reductionDim)));
    if (!acc) {
      return acc.takeError();
    }
    operands.push_back(*acc);
  }

  metadata.lastMmaNode = !step || *step == scaling->lookup(reductionDim) - 1;
  return operands;
}

// Every source contributes one operand per replica along the reduction dim.
llvm::Expected<llvm::SmallVector<NodeId>>
ExpansionSession::resolveReduceOperands(NodeId node,
                                        const ExpansionMetadata &metadata) {
  const auto &reduce = graph.getOpAs<ReduceOp>(node);
  IndexExpr reductionDim = reduce.getReductionDim();
  auto scaling = getScaling(node);
  if (!scaling) {
    return scaling.takeError();
  }
  std::int64_t count =
      scaling->count(reductionDim) ? scaling->lookup(reductionDim) : 1;

  llvm::SmallVector<NodeId> operands;
  for (NodeId source : reduce.getSources()) {
    for (std::int64_t i = 0; i < count; ++i) {
      DimQuery query = metadata.dimQuery;
      query.set(reductionDim, i);
      auto resolved =
          resolveOperand(source, makeMetadata(graph.getOp(source), query));
      if (!resolved) {
        return resolved.takeError();
      }
      operands.push_back(*resolved);
    }
  }
  if (reduce.hasInit()) {
    NodeId init = reduce.getInit();
    auto resolved = resolveOperand(
        init, makeMetadata(graph.getOp(init), metadata.dimQuery));
    if (!resolved) {
      return resolved.takeError();
    }
    operands.push_back(*resolved);
  }
  return operands;
}

llvm::Expected<llvm::SmallVector<NodeId>>
ExpansionSession::resolveReshapeOperands(NodeId node,
                                         const ExpansionMetadata &metadata) {
  const auto &reshape = graph.getOpAs<ReshapeOp>(node);
  llvm::SmallVector<DimQuery> sourceQueries =
      getReshapeDimQueries(reshape, metadata.dimQuery);

  llvm::SmallVector<NodeId> operands;
  for (NodeId arg : reshape.getArgs()) {
    for (unsigned index = 0; index < sourceQueries.size(); ++index) {
      const DimQuery &sourceQuery = sourceQueries[index];
      ExpansionMetadata argMetadata =
          makeMetadata(graph.getOp(arg), sourceQuery);
      argMetadata.sourceDimQuery = sourceQuery;
      argMetadata.numQueries = sourceQueries.size();
      argMetadata.queryIndex = index;
      auto resolved = resolveOperand(arg, argMetadata);
      if (!resolved) {
        return resolved.takeError();
      }
      WAVE_TRACE(LogComponent::Expansion, "{0}: source {1} of {2} is {3}",
                 reshape.getName(), *argMetadata.queryIndex,
                 *argMetadata.numQueries, graph.getOp(*resolved).getName());
      operands.push_back(*resolved);
    }
  }
  return operands;
}

NodeId ExpansionSession::createClone(NodeId node,
                                     const ExpansionMetadata &metadata,
                                     llvm::ArrayRef<NodeId> operands) {
  auto it = lastClone.find(node);
  NodeId anchor = it == lastClone.end() ? node : it->second;
  NodeId clone = graph.cloneAfter(node, anchor);
  graph.setOperands(clone, operands);

  Op &cloneOp = graph.getOp(clone);
  cloneOp.setName(getExpandedName(graph, graph.getOp(node), metadata.dimQuery));
  cloneOp.setDimQuery(metadata.dimQuery);
  cloneOp.setLastMmaNode(metadata.lastMmaNode);
  lastClone[node] = clone;
  WAVE_TRACE(LogComponent::Expansion, "clone {0}", cloneOp.getName());
  return clone;
}

llvm::Expected<const ExpansionSession::IterateInfo &>
ExpansionSession::getIterateInfo(NodeId iterate) {
  auto it = iterates.find(iterate);
  if (it != iterates.end()) {
    return it->second;
  }

  const auto &iterateOp = graph.getOpAs<IterateOp>(iterate);
  unsigned numInits = iterateOp.getInits().size();
  IterateInfo info;
  info.iterArgs.assign(numInits, kInvalidNodeId);
  for (NodeId id : graph.getRegionOps(iterateOp.getBody())) {
    const auto *iterArg = llvm::dyn_cast<IterArgOp>(&graph.getOp(id));
    if (iterArg && isOriginal(id) && iterArg->getIterIdx() < numInits) {
      info.iterArgs[iterArg->getIterIdx()] = id;
    }
  }

  std::int64_t offset = 0;
  for (unsigned i = 0; i < numInits; ++i) {
    if (info.iterArgs[i] == kInvalidNodeId) {
      return llvm::createStringError(
          llvm::formatv("{0} has no iteration argument for init {1}",
                        iterateOp.getName(), i)
              .str());
    }
    auto scaling = getScaling(info.iterArgs[i]);
    if (!scaling) {
      return scaling.takeError();
    }
    info.offsets.push_back(offset);
    info.queries.push_back(enumerateDimQueries(
        *scaling, graph.getOp(info.iterArgs[i]).getIndexingDims()));
    offset += info.queries.back().size();
  }
  return iterates.emplace(iterate, std::move(info)).first->second;
}

llvm::Expected<std::int64_t>
ExpansionSession::getFlattenedIndex(NodeId iterate, unsigned index,
                                    const DimQuery &query) {
  auto info = getIterateInfo(iterate);
  if (!info) {
    return info.takeError();
  }
  WAVE_assert_limit(index, info->iterArgs.size());
  NodeId iterArg = info->iterArgs[index];
  std::int64_t offset = info->offsets[index];
  if (!isExpandable(graph.getOp(iterArg))) {
    return offset;
  }
  auto scaling = getScaling(iterArg);
  if (!scaling) {
    return scaling.takeError();
  }
  auto argQuery = normalizeQuery(iterArg, query);
  if (!argQuery) {
    return argQuery.takeError();
  }
  return offset + linearizeDimQuery(*scaling, *argQuery);
}

// Expands an iterate in place: its loop-carried values are replaced by their
// replicas, flattened init by init.
llvm::Error ExpansionSession::expandIterate(NodeId iterate) {
  if (!expandedIterates.insert(iterate).second) {
    return llvm::Error::success();
  }
  auto infoOr = getIterateInfo(iterate);
  if (!infoOr) {
    return infoOr.takeError();
  }
  const IterateInfo &info = *infoOr;
  const auto &iterateOp = graph.getOpAs<IterateOp>(iterate);
  RegionId body = iterateOp.getBody();

  llvm::SmallVector<NodeId> inits(iterateOp.getInits().begin(),
                                  iterateOp.getInits().end());
  NodeId output = graph.getRegionOutput(body);
  llvm::SmallVector<NodeId> yields;
  if (output != kInvalidNodeId) {
    llvm::ArrayRef<NodeId> values =
        graph.getOpAs<OutputOp>(output).getValues();
    yields.assign(values.begin(), values.end());
    if (yields.size() != inits.size()) {
      return llvm::createStringError(
          llvm::formatv("{0} yields {1} values for {2} inits",
                        iterateOp.getName(), yields.size(), inits.size())
              .str());
    }
  }

  for (unsigned i = 0; i < inits.size(); ++i) {
    NodeId iterArg = info.iterArgs[i];
    if (!isExpandable(graph.getOp(iterArg))) {
      graph.getOpAs<IterArgOp>(iterArg).setIterIdx(info.offsets[i]);
      continue;
    }
    for (const DimQuery &query : info.queries[i]) {
      auto clone = expandNode(iterArg, query);
      if (!clone) {
        return clone.takeError();
      }
    }
  }

  llvm::SmallVector<NodeId> newInits;
  llvm::SmallVector<NodeId> newYields;
  for (unsigned i = 0; i < inits.size(); ++i) {
    for (const DimQuery &query : info.queries[i]) {
      auto init =
          resolveOperand(inits[i], makeMetadata(graph.getOp(inits[i]), query));
      if (!init) {
        return init.takeError();
      }
      newInits.push_back(*init);
      if (yields.empty()) {
        continue;
      }
      auto yield = resolveOperand(
          yields[i], makeMetadata(graph.getOp(yields[i]), query));
      if (!yield) {
        return yield.takeError();
      }
      newYields.push_back(*yield);
    }
  }

  // Must run while the yields still have their original user.
  if (auto err = expandRegion(body)) {
    return err;
  }

  // Results that are not cloned still need their flattened index.
  llvm::SmallVector<NodeId> users(iterateOp.getUsers().begin(),
                                  iterateOp.getUsers().end());
  for (NodeId user : users) {
    auto *getResult = llvm::dyn_cast<GetResultOp>(&graph.getOp(user));
    if (getResult && isOriginal(user) && !isExpandable(*getResult)) {
      getResult->setResultIndex(
          static_cast<unsigned>(info.offsets[getResult->getResultIndex()]));
    }
  }

  leaves.append(inits.begin(), inits.end());
  leaves.append(yields.begin(), yields.end());
  graph.setOperands(iterate, newInits);
  if (output != kInvalidNodeId) {
    graph.setOperands(output, newYields);
  }
  WAVE_DEBUG(LogComponent::Expansion, "{0}: {1} inits expanded into {2}",
             iterateOp.getName(), inits.size(), newInits.size());
  return llvm::Error::success();
}

// Expands the iterates of `region` and its sinks, the operations nothing
// consumes, at every replica coordinate.
llvm::Error ExpansionSession::expandRegion(RegionId region) {
  llvm::SmallVector<NodeId> regionIterates;
  llvm::SmallVector<NodeId> sinks;
  for (NodeId id : graph.getRegionOps(region)) {
    if (!isOriginal(id)) {
      continue;
    }
    const Op &op = graph.getOp(id);
    if (llvm::isa<IterateOp>(op)) {
      regionIterates.push_back(id);
    } else if (isExpandable(op) && !op.hasUsers()) {
      sinks.push_back(id);
    }
  }

  for (NodeId iterate : regionIterates) {
    if (auto err = expandIterate(iterate)) {
      return err;
    }
  }
  for (NodeId sink : sinks) {
    auto clones = expandAllCoordinates(sink);
    if (!clones) {
      return clones.takeError();
    }
    leaves.push_back(sink);
  }
  return llvm::Error::success();
}

// Replaces every returned value by all of its replicas.
llvm::Error ExpansionSession::expandOutput(NodeId output) {
  llvm::ArrayRef<NodeId> values = graph.getOpAs<OutputOp>(output).getValues();
  llvm::SmallVector<NodeId> originalValues(values.begin(), values.end());
  llvm::SmallVector<NodeId> newValues;
  for (NodeId value : originalValues) {
    if (!isExpandable(graph.getOp(value))) {
      newValues.push_back(value);
      continue;
    }
    auto clones = expandAllCoordinates(value);
    if (!clones) {
      return clones.takeError();
    }
    newValues.append(clones->begin(), clones->end());
    leaves.push_back(value);
  }
  graph.setOperands(output, newValues);
  return llvm::Error::success();
}

llvm::Error ExpansionSession::expandAll() {
  NodeId output = graph.getRegionOutput(Graph::kRootRegion);
  if (auto err = expandRegion(Graph::kRootRegion)) {
    return err;
  }
  if (output != kInvalidNodeId) {
    return expandOutput(output);
  }
  return llvm::Error::success();
}

void ExpansionSession::removeDeadNodes() {
  removeOriginalNodes(graph, leaves,
                      [this](NodeId id) { return isOriginal(id); });
  removeUnusedRegisters(graph);
  removeUnusedIterArgs(graph);
}

llvm::Error expandGraph(Graph &graph, const ConstraintSet &constraints,
                        ExpansionOptions options) {
  WAVE_DEBUG(LogComponent::Expansion, "expanding graph of {0} operations",
             graph.size());
  ExpansionSession session(graph, constraints);
  if (auto err = session.expandAll()) {
    return err;
  }
  WAVE_DEBUG(LogComponent::Expansion, "created {0} clones",
             session.getNumClones());
  if (!options.removeDeadNodes) {
    return llvm::Error::success();
  }
  session.removeDeadNodes();
  if (options.verify) {
    return verifyExpandedGraph(graph);
  }
  return llvm::Error::success();
}

llvm::Error verifyExpandedGraph(const Graph &graph) {
  for (NodeId id : graph.getAllOps()) {
    const Op &op = graph.getOp(id);
    if (llvm::isa<PlaceholderOp, IterateOp, OutputOp>(op) || op.isScalar()) {
      continue;
    }
    if (!op.getDimQuery()) {
      return llvm::createStringError(
          llvm::formatv("{0} was not expanded", op.getName()).str());
    }
  }
  return llvm::Error::success();
}

} // namespace wave
