//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_COMPUTEKERNEL_H
#define SKEIN_COMPUTEKERNEL_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <Partition.h>
#include <Defs.h>

namespace skein {

    /*!
     * everything a kernel gets to know about the task it runs for
     */
    struct KernelContext {
        TaskID taskID;
        StageID stageID;
        size_t partitionIndex;              //! index of the task within its stage
        size_t numPartitions;               //! number of tasks of the stage
        size_t numOutputs;                  //! number of partitions the kernel has to return
        size_t attempt;                     //! 1 for the first attempt
        std::vector<size_t> inputsPerSide;  //! for multi-input kernels (e.g. join) how many inputs belong to each side
        std::string worker;                 //! where the task runs
        std::shared_ptr<const std::atomic_bool> cancelFlag;

        KernelContext() : taskID(INVALID_TASK), stageID(INVALID_STAGE), partitionIndex(0), numPartitions(1),
        numOutputs(1), attempt(1) {}

        /*!
         * cooperative cancellation, long running kernels should check it regularly
         */
        bool cancelled() const { return cancelFlag && cancelFlag->load(); }
    };

    /*!
     * opaque unit of compute invoked on materialized inputs. Implementations must be safe to call
     * concurrently for different tasks. Transient conditions are signaled by throwing TaskTransientError,
     * unreadable inputs by PartitionLostError. Any other exception is a terminal compute error.
     */
    class IComputeKernel {
    public:
        virtual ~IComputeKernel() = default;

        virtual std::string name() const = 0;

        virtual std::vector<PartitionPtr> execute(const KernelContext& context,
                                                  const std::vector<PartitionPtr>& inputs) = 0;
    };

    using KernelPtr = std::shared_ptr<IComputeKernel>;
}

#endif //SKEIN_COMPUTEKERNEL_H
