//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_PHYSICALOPERATORTYPE_H
#define SKEIN_PHYSICALOPERATORTYPE_H

#include <string>

namespace skein {
    enum class PhysicalOperatorType {
        UNKNOWN,
        SOURCE,
        MAP,
        FILTER,
        PROJECT,
        REPARTITION,
        SORT,
        AGGREGATE,
        JOIN,
        CONCAT
    };

    /*!
     * operators which work partition by partition and can be fused
     */
    inline bool isPipelined(PhysicalOperatorType type) {
        return type == PhysicalOperatorType::MAP || type == PhysicalOperatorType::FILTER ||
               type == PhysicalOperatorType::PROJECT;
    }

    /*!
     * operators which reshuffle data globally and thus force a stage boundary
     */
    inline bool requiresExchange(PhysicalOperatorType type) {
        return type == PhysicalOperatorType::REPARTITION || type == PhysicalOperatorType::SORT ||
               type == PhysicalOperatorType::AGGREGATE || type == PhysicalOperatorType::JOIN;
    }

    extern std::string operatorTypeToString(PhysicalOperatorType type);
}

#endif //SKEIN_PHYSICALOPERATORTYPE_H
