//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_ENVIRONMENT_H
#define SKEIN_ENVIRONMENT_H

#include <map>
#include <string>

namespace skein {

    /*!
     * constructs skein.env options
     * @return
     */
    extern std::map<std::string, std::string> getSkeinEnvironment();

    /*!
     * environment variable which overrides option key, e.g. skein.maxTaskRetries -> SKEIN_MAXTASKRETRIES
     */
    extern std::string environmentVariableForKey(const std::string& key);
}

#endif //SKEIN_ENVIRONMENT_H
