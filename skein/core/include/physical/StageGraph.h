//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_STAGEGRAPH_H
#define SKEIN_STAGEGRAPH_H

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <plan/PhysicalPlan.h>
#include "Stage.h"

namespace skein {

    /*!
     * knobs of the translation which are also needed to instantiate deferred stages
     */
    struct TranslationSettings {
        bool adaptive;
        size_t maxAdaptivePartitions;
        size_t targetPartitionSize;
        size_t defaultPartitions;

        TranslationSettings() : adaptive(false), maxAdaptivePartitions(16), targetPartitionSize(64 * 1024 * 1024),
        defaultPartitions(4) {}
    };

    /*!
     * hands out task and partition ids
     */
    struct IDAllocator {
        TaskID nextTask;
        PartitionID nextPartition;

        IDAllocator() : nextTask(0), nextPartition(0) {}
        TaskID task() { return nextTask++; }
        PartitionID partition() { return nextPartition++; }
    };

    /*!
     * the stage/task DAG of one plan, immutable after translation. Stage ids are a topological order.
     * Tasks of deferred stages are not part of the graph, they are instantiated during execution.
     */
    class StageGraph {
        friend class PlanTranslator;
    private:
        PhysicalPlan _plan;
        std::vector<Stage> _stages;
        std::map<StageID, StageInstance> _instances;
        std::map<TaskID, TaskPtr> _tasks;
        std::map<PartitionID, TaskID> _producers;
        std::map<OperatorID, std::vector<TaskID>> _operatorTasks;
        StageID _root;
        bool _ordered;
        TranslationSettings _settings;
        IDAllocator _ids;

        void addInstance(StageID id, const StageInstance& instance);
    public:
        explicit StageGraph(const PhysicalPlan& plan) : _plan(plan), _root(INVALID_STAGE), _ordered(true) {}

        const PhysicalPlan& plan() const { return _plan; }

        const std::vector<Stage>& stages() const { return _stages; }
        const Stage& stage(StageID id) const;
        size_t numStages() const { return _stages.size(); }
        StageID rootStage() const { return _root; }

        /*!
         * stages directly reading outputs of stage id
         */
        std::vector<StageID> successors(StageID id) const;

        bool isInstantiated(StageID id) const { return _instances.find(id) != _instances.end(); }
        const StageInstance& instance(StageID id) const;
        const std::map<StageID, StageInstance>& instances() const { return _instances; }
        bool hasDeferredStages() const;

        /*!
         * statically known tasks, ordered by id
         */
        std::vector<TaskPtr> tasks() const;
        TaskPtr task(TaskID id) const;
        size_t numTasks() const { return _tasks.size(); }

        /*!
         * tasks implementing a plan node (statically known ones)
         */
        std::vector<TaskID> tasksForOperator(OperatorID id) const;

        TaskID producerOf(PartitionID id) const;

        /*!
         * whether the plan's final operator defines an order on the output
         */
        bool ordered() const { return _ordered; }

        const TranslationSettings& settings() const { return _settings; }

        /*!
         * id counters after the static part, used for runtime instantiation
         */
        IDAllocator runtimeIDs() const { return _ids; }

        /*!
         * checks that stages are acyclic and all task inputs resolve within the same or an earlier stage
         */
        void validate() const;

        nlohmann::json getJSON() const;
    };
}

#endif //SKEIN_STAGEGRAPH_H
