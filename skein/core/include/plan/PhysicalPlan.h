//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PHYSICALPLAN_H
#define SKEIN_PHYSICALPLAN_H

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include "PhysicalOperator.h"

namespace skein {

    /*!
     * immutable physical plan DAG rooted at the final output operator. Only read by the translator.
     */
    class PhysicalPlan {
    private:
        OperatorPtr _root;
    public:
        explicit PhysicalPlan(const OperatorPtr& root) : _root(root) {}

        const OperatorPtr& root() const { return _root; }

        /*!
         * whether the order of the final output is significant
         */
        bool ordered() const { return _root && _root->ordered(); }

        /*!
         * visits each reachable operator once, inputs before consumers.
         * Throws PlanTranslationError on null inputs and cycles.
         */
        void foreachOperator(const std::function<void(const PhysicalOperator&)>& f) const;

        /*!
         * all reachable operators, inputs before consumers
         */
        std::vector<OperatorPtr> operators() const;

        /*!
         * number of consumers of each reachable operator within the plan
         */
        std::map<OperatorID, size_t> consumerCounts() const;

        nlohmann::json getJSON() const;
    };
}

#endif //SKEIN_PHYSICALPLAN_H
