//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_STAGE_H
#define SKEIN_STAGE_H

#include <vector>
#include <plan/PhysicalOperator.h>
#include "Task.h"

namespace skein {

    enum class StageBoundary {
        PIPELINED,      //! results are streamed to the consumer (root stage)
        MATERIALIZING   //! results are materialized for a later stage
    };

    enum class BranchHead {
        SOURCE,     //! reads from a source operator
        EXCHANGE,   //! merges the buckets written by the producer stages of an exchange
        FORWARD     //! reads the outputs of a producer stage one to one
    };

    extern std::string stageBoundaryToString(StageBoundary boundary);
    extern std::string branchHeadToString(BranchHead head);

    /*!
     * a chain of fused operators within a stage. A stage has more than one branch when a concat merges inputs.
     */
    struct StageBranch {
        BranchHead head;
        OperatorPtr headOperator;           //! source or exchange operator, nullptr for FORWARD
        std::vector<StageID> inputStages;   //! EXCHANGE: producer stage per side, FORWARD: the producer stage
        std::vector<OperatorPtr> fused;     //! pipelined operators
        OperatorPtr exchange;               //! exchange consuming this branch (partitioner tail), may be nullptr
        size_t exchangeSide;
        size_t numBuckets;                  //! output arity of each task if exchange is set
        int64_t numPartitions;              //! SOURCE/EXCHANGE task count, AUTO_PARTITIONS if decided at runtime
        bool adaptive;                      //! task count of an EXCHANGE head decided from producer statistics

        StageBranch() : head(BranchHead::FORWARD), exchangeSide(0), numBuckets(1),
        numPartitions(AUTO_PARTITIONS), adaptive(false) {}

        std::vector<OperatorPtr> operators() const;
    };

    /*!
     * maximal subgraph of tasks which can be pipelined without a materialization barrier
     */
    struct Stage {
        StageID id;
        StageBoundary boundary;
        std::vector<StageBranch> branches;
        std::vector<StageID> predecessors;
        bool deferred;  //! tasks are instantiated during execution (adaptive stage or downstream of one)

        Stage() : id(INVALID_STAGE), boundary(StageBoundary::MATERIALIZING), deferred(false) {}

        bool adaptive() const;
        std::string name() const;
    };

    /*!
     * tasks of one stage and their outputs, in task order
     */
    struct StageInstance {
        std::vector<TaskPtr> tasks;
        std::vector<PartitionID> outputs;
    };
}

#endif //SKEIN_STAGE_H
