//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_TASK_H
#define SKEIN_TASK_H

#include <memory>
#include <string>
#include <vector>
#include <Defs.h>
#include <ResourceRequest.h>
#include "ComputeKernel.h"

namespace skein {

    enum class TaskState {
        PENDING,    //! waiting for inputs
        READY,      //! all inputs materialized, waiting for a slot
        SUBMITTED,  //! handed to the backend
        RUNNING,    //! backend reported the start
        SUCCEEDED,
        FAILED,
        CANCELLED
    };

    extern std::string taskStateToString(TaskState state);

    inline bool isInFlight(TaskState state) {
        return state == TaskState::SUBMITTED || state == TaskState::RUNNING;
    }

    /*!
     * one schedulable unit: a compute kernel over input partitions producing output partitions.
     * Immutable, execution state is tracked by the scheduler.
     */
    struct Task {
        TaskID id;
        StageID stage;
        size_t branch;
        size_t partitionIndex;
        size_t numPartitions;
        std::vector<PartitionID> inputs;
        std::vector<size_t> inputsPerSide;
        std::vector<PartitionID> outputs;
        ResourceRequest resources;
        KernelPtr kernel;
        std::vector<OperatorID> operators;
        std::vector<std::string> operatorNames;

        Task() : id(INVALID_TASK), stage(INVALID_STAGE), branch(0), partitionIndex(0), numPartitions(0) {}

        size_t outputArity() const { return outputs.size(); }

        std::string description() const;
    };

    using TaskPtr = std::shared_ptr<const Task>;
}

#endif //SKEIN_TASK_H
