//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <physical/Stage.h>
#include <StringUtils.h>

namespace skein {

    std::string stageBoundaryToString(StageBoundary boundary) {
        return boundary == StageBoundary::PIPELINED ? "pipelined" : "materializing";
    }

    std::string branchHeadToString(BranchHead head) {
        switch(head) {
            case BranchHead::SOURCE:
                return "source";
            case BranchHead::EXCHANGE:
                return "exchange";
            default:
                return "forward";
        }
    }

    std::vector<OperatorPtr> StageBranch::operators() const {
        std::vector<OperatorPtr> ops;
        if(headOperator)
            ops.push_back(headOperator);
        ops.insert(ops.end(), fused.begin(), fused.end());
        if(exchange)
            ops.push_back(exchange);
        return ops;
    }

    bool Stage::adaptive() const {
        for(const auto& b : branches)
            if(b.adaptive)
                return true;
        return false;
    }

    std::string Stage::name() const {
        std::vector<std::string> names;
        for(const auto& b : branches)
            for(const auto& op : b.operators())
                names.push_back(op->name());
        return "stage " + std::to_string(id) + " [" + join(names, ", ") + "]";
    }
}
