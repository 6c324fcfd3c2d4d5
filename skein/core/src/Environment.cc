//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Environment.h>
#include <Utils.h>
#include <boost/algorithm/string.hpp>

namespace skein {

    std::map<std::string, std::string> getSkeinEnvironment() {
        std::map<std::string, std::string> m;

        // user, host
        m["skein.env.user"] = getUserName();
        m["skein.env.hostname"] = getHostName();

        return m;
    }

    std::string environmentVariableForKey(const std::string &key) {
        auto name = boost::algorithm::to_upper_copy(key);
        boost::algorithm::replace_all(name, ".", "_");
        return name;
    }
}
