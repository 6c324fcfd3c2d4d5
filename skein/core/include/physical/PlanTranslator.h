//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PLANTRANSLATOR_H
#define SKEIN_PLANTRANSLATOR_H

#include <functional>
#include <map>
#include <memory>
#include <ContextOptions.h>
#include <optional.h>
#include "StageGraph.h"

namespace skein {

    /*!
     * lowers a physical plan into stages of fused tasks. Stage boundaries are inserted at exchange operators
     * (repartition, sort, aggregate, join) and after operators with more than one consumer.
     */
    class PlanTranslator {
    private:
        TranslationSettings _settings;

        // state of one translation
        std::vector<Stage> _stages;
        std::map<OperatorID, size_t> _consumers;
        std::map<OperatorID, StageID> _materialized;

        std::vector<StageBranch> lower(const OperatorPtr& op);
        StageID close(const std::vector<StageBranch>& branches, StageBoundary boundary);
        StageBranch forwardFrom(StageID stage) const;

        void validateOperator(const PhysicalOperator& op) const;
    public:
        explicit PlanTranslator(const ContextOptions& options);
        explicit PlanTranslator(const TranslationSettings& settings) : _settings(settings) {}

        /*!
         * translate plan, throws PlanTranslationError if the plan is malformed
         */
        std::shared_ptr<const StageGraph> translate(const PhysicalPlan& plan);

        using BytesLookup = std::function<option<size_t>(PartitionID)>;

        /*!
         * creates the tasks of a stage. All predecessors must be instantiated (contained in instances).
         * For adaptive stages bytesOf gives the size of producer buckets.
         */
        static StageInstance instantiateStage(const Stage& stage,
                                              const std::map<StageID, StageInstance>& instances,
                                              const TranslationSettings& settings,
                                              const BytesLookup& bytesOf,
                                              IDAllocator& ids);

        /*!
         * groups consecutive buckets such that each group holds about targetSize bytes. Returns [begin, end)
         * ranges, at least one.
         */
        static std::vector<std::pair<size_t, size_t>> coalesceBuckets(const std::vector<size_t>& bucketBytes,
                                                                      size_t targetSize);
    };
}

#endif //SKEIN_PLANTRANSLATOR_H
