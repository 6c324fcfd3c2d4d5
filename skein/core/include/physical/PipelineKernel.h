//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PIPELINEKERNEL_H
#define SKEIN_PIPELINEKERNEL_H

#include "ComputeKernel.h"

namespace skein {

    /*!
     * compute of a fused task: an optional head (source, or the merge side of an exchange) consuming all task
     * inputs, then the pipelined operators one partition at a time, then an optional partitioner splitting
     * the result into the buckets of the next exchange.
     */
    class PipelineKernel : public IComputeKernel {
    private:
        KernelPtr _head;
        std::vector<KernelPtr> _operators;
        KernelPtr _tail;
        std::string _name;

        static void checkSingle(const std::vector<PartitionPtr>& partitions, const IComputeKernel* kernel);
    public:
        PipelineKernel(const KernelPtr& head, const std::vector<KernelPtr>& operators, const KernelPtr& tail);

        std::string name() const override { return _name; }

        std::vector<PartitionPtr> execute(const KernelContext& context,
                                          const std::vector<PartitionPtr>& inputs) override;

        size_t numFused() const { return _operators.size() + (_head ? 1 : 0) + (_tail ? 1 : 0); }
    };
}

#endif //SKEIN_PIPELINEKERNEL_H
