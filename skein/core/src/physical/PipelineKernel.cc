//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <physical/PipelineKernel.h>
#include <Errors.h>
#include <StringUtils.h>

namespace skein {

    PipelineKernel::PipelineKernel(const KernelPtr &head, const std::vector<KernelPtr> &operators,
                                   const KernelPtr &tail) : _head(head), _operators(operators), _tail(tail) {
        std::vector<std::string> names;
        if(_head)
            names.push_back(_head->name());
        for(const auto& op : _operators)
            names.push_back(op->name());
        if(_tail)
            names.push_back(_tail->name());
        _name = names.empty() ? "forward" : join(names, "->");
    }

    void PipelineKernel::checkSingle(const std::vector<PartitionPtr> &partitions, const IComputeKernel *kernel) {
        if(partitions.size() != 1 || !partitions.front())
            throw std::runtime_error("kernel " + (kernel ? kernel->name() : std::string("forward")) +
                                     " must produce exactly one partition, produced " +
                                     std::to_string(partitions.size()));
    }

    std::vector<PartitionPtr> PipelineKernel::execute(const KernelContext &context,
                                                      const std::vector<PartitionPtr> &inputs) {
        std::vector<PartitionPtr> current;
        if(_head) {
            KernelContext hc = context;
            hc.numOutputs = 1;
            current = _head->execute(hc, inputs);
        } else {
            current = inputs;
        }
        checkSingle(current, _head.get());

        KernelContext oc = context;
        oc.numOutputs = 1;
        oc.inputsPerSide = {1};
        for(const auto& op : _operators) {
            if(context.cancelled())
                throw CancellationError("task " + std::to_string(context.taskID) + " was cancelled");
            current = op->execute(oc, current);
            checkSingle(current, op.get());
        }

        if(!_tail) {
            if(context.numOutputs != 1)
                throw std::runtime_error("task " + std::to_string(context.taskID) + " expects " +
                                         std::to_string(context.numOutputs) + " outputs, but has no partitioner");
            return current;
        }

        if(context.cancelled())
            throw CancellationError("task " + std::to_string(context.taskID) + " was cancelled");

        KernelContext tc = context;
        tc.inputsPerSide = {1};
        auto buckets = _tail->execute(tc, current);
        if(buckets.size() != context.numOutputs)
            throw std::runtime_error("partitioner " + _tail->name() + " produced " + std::to_string(buckets.size()) +
                                     " buckets, expected " + std::to_string(context.numOutputs));
        for(const auto& b : buckets)
            if(!b)
                throw std::runtime_error("partitioner " + _tail->name() + " produced an empty bucket handle");
        return buckets;
    }
}
