//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include "TestKernels.h"
#include <Errors.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

using namespace skein;

PartitionPtr makePartition(const std::vector<int64_t>& values) {
    std::vector<uint8_t> buffer(values.size() * sizeof(int64_t));
    if(!values.empty())
        std::memcpy(buffer.data(), values.data(), buffer.size());
    return std::make_shared<const Partition>(std::move(buffer), values.size());
}

std::vector<int64_t> values(const PartitionPtr& partition) {
    if(!partition)
        throw std::runtime_error("null partition");
    std::vector<int64_t> res(partition->size() / sizeof(int64_t));
    if(!res.empty())
        std::memcpy(res.data(), partition->data(), res.size() * sizeof(int64_t));
    return res;
}

std::vector<int64_t> concatValues(const std::vector<PartitionPtr>& partitions) {
    std::vector<int64_t> res;
    for(const auto& p : partitions) {
        auto v = values(p);
        res.insert(res.end(), v.begin(), v.end());
    }
    return res;
}

std::vector<int64_t> collectValues(ResultStream& stream) {
    return concatValues(stream.collect());
}

static const PartitionPtr& single(const std::vector<PartitionPtr>& inputs, const std::string& kernel) {
    if(inputs.size() != 1)
        throw std::runtime_error(kernel + " expects one input, got " + std::to_string(inputs.size()));
    return inputs.front();
}

std::vector<PartitionPtr> RangeSource::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    std::vector<int64_t> v;
    auto start = _offset + static_cast<int64_t>(context.partitionIndex) * _rows;
    for(int64_t i = 0; i < _rows; ++i)
        v.push_back(start + i);
    return {makePartition(v)};
}

std::vector<PartitionPtr> MapKernel::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    auto v = values(single(inputs, name()));
    for(auto& x : v)
        x = _f(x);
    return {makePartition(v)};
}

std::vector<PartitionPtr> FilterKernel::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    auto v = values(single(inputs, name()));
    v.erase(std::remove_if(v.begin(), v.end(), [this](int64_t x) { return !_pred(x); }), v.end());
    return {makePartition(v)};
}

std::vector<PartitionPtr> HashPartitioner::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    auto n = std::max<size_t>(context.numOutputs, 1);
    std::vector<std::vector<int64_t>> buckets(n);
    for(auto x : values(single(inputs, name()))) {
        auto b = static_cast<size_t>(((x % static_cast<int64_t>(n)) + static_cast<int64_t>(n)) % static_cast<int64_t>(n));
        buckets[b].push_back(x);
    }
    std::vector<PartitionPtr> res;
    for(const auto& b : buckets)
        res.push_back(makePartition(b));
    return res;
}

std::vector<PartitionPtr> RangePartitioner::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    auto n = static_cast<int64_t>(std::max<size_t>(context.numOutputs, 1));
    std::vector<std::vector<int64_t>> buckets(n);
    for(auto x : values(single(inputs, name()))) {
        auto b = std::min(n - 1, std::max<int64_t>(0, x * n / (_maxValue + 1)));
        buckets[b].push_back(x);
    }
    std::vector<PartitionPtr> res;
    for(const auto& b : buckets)
        res.push_back(makePartition(b));
    return res;
}

std::vector<PartitionPtr> ConcatMerge::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    return {makePartition(concatValues(inputs))};
}

std::vector<PartitionPtr> SortMerge::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    auto v = concatValues(inputs);
    std::sort(v.begin(), v.end());
    return {makePartition(v)};
}

std::vector<PartitionPtr> SumMerge::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    int64_t sum = 0;
    for(auto x : concatValues(inputs))
        sum += x;
    return {makePartition({sum})};
}

std::vector<PartitionPtr> JoinProbe::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    if(context.inputsPerSide.size() != 2)
        throw std::runtime_error("join expects two sides");
    auto numLeft = context.inputsPerSide[0];
    if(numLeft > inputs.size())
        throw std::runtime_error("join got fewer inputs than announced");

    std::vector<PartitionPtr> left(inputs.begin(), inputs.begin() + numLeft);
    std::vector<PartitionPtr> right(inputs.begin() + numLeft, inputs.end());
    std::multiset<int64_t> build;
    for(auto x : concatValues(left))
        build.insert(x);

    std::vector<int64_t> res;
    for(auto x : concatValues(right)) {
        auto n = build.count(x);
        for(size_t i = 0; i < n; ++i)
            res.push_back(x);
    }
    std::sort(res.begin(), res.end());
    return {makePartition(res)};
}

std::vector<PartitionPtr> FaultyKernel::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _attempts[context.partitionIndex]++;
    }
    if(context.partitionIndex == _partitionIndex && context.attempt <= _failingAttempts) {
        auto msg = "injected fault in partition " + std::to_string(context.partitionIndex) + ", attempt " +
                   std::to_string(context.attempt);
        if(_fault == Fault::TRANSIENT)
            throw TaskTransientError(msg);
        throw std::runtime_error(msg);
    }
    return {single(inputs, name())};
}

size_t FaultyKernel::attempts(size_t partitionIndex) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _attempts.find(partitionIndex);
    return it == _attempts.end() ? 0 : it->second;
}

size_t FaultyKernel::totalExecutions() const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t n = 0;
    for(const auto& kv : _attempts)
        n += kv.second;
    return n;
}

std::vector<PartitionPtr> SlowKernel::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    _started++;
    auto now = ++_running;
    auto max = _maxRunning.load();
    while(now > max && !_maxRunning.compare_exchange_weak(max, now)) {}

    auto deadline = std::chrono::steady_clock::now() + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(_duration));
    while(std::chrono::steady_clock::now() < deadline) {
        if(context.cancelled()) {
            _running--;
            _cancelled++;
            throw CancellationError("slow task " + std::to_string(context.taskID) + " was cancelled");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    _running--;

    if(inputs.empty())
        return {makePartition({static_cast<int64_t>(context.partitionIndex)})};
    return {single(inputs, name())};
}

std::vector<PartitionPtr> CountingKernel::execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _executions[context.partitionIndex]++;
    }
    return {single(inputs, name())};
}

size_t CountingKernel::executions(size_t partitionIndex) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _executions.find(partitionIndex);
    return it == _executions.end() ? 0 : it->second;
}

size_t CountingKernel::totalExecutions() const {
    std::lock_guard<std::mutex> lock(_mutex);
    size_t n = 0;
    for(const auto& kv : _executions)
        n += kv.second;
    return n;
}

PhysicalPlan sumPlan(int64_t numSources, int64_t rowsPerPartition, int64_t numReducers, const KernelPtr& reduceWrapper) {
    auto src = PhysicalOperator::source("numbers", numSources, std::make_shared<RangeSource>(rowsPerPartition));
    auto doubled = PhysicalOperator::map(src, "double", std::make_shared<MapKernel>("double", [](int64_t x) { return 2 * x; }));
    auto agg = PhysicalOperator::aggregate(doubled, numReducers, std::make_shared<HashPartitioner>(),
                                           std::make_shared<SumMerge>());
    if(!reduceWrapper)
        return PhysicalPlan(agg);
    return PhysicalPlan(PhysicalOperator::map(agg, reduceWrapper->name(), reduceWrapper));
}
