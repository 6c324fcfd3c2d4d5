//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <StringUtils.h>
#include <boost/algorithm/string.hpp>
#include <stdexcept>
#include <cstdlib>

namespace skein {

    static const char* trueStrings[] = {"true", "yes", "on", "1"};
    static const char* falseStrings[] = {"false", "no", "off", "0"};

    bool isBoolString(const std::string& str) {
        auto s = boost::algorithm::to_lower_copy(trim(str));
        for(auto t : trueStrings)
            if(s == t)
                return true;
        for(auto f : falseStrings)
            if(s == f)
                return true;
        return false;
    }

    bool parseBoolString(const std::string& str) {
        auto s = boost::algorithm::to_lower_copy(trim(str));
        for(auto t : trueStrings)
            if(s == t)
                return true;
        for(auto f : falseStrings)
            if(s == f)
                return false;
        throw std::invalid_argument("'" + str + "' is not a boolean string");
    }

    bool isIntegerString(const char* s, bool ignoreWhitespace) {
        if(!s)
            return false;
        std::string str(s);
        if(ignoreWhitespace)
            trim(str);
        if(str.empty())
            return false;
        size_t pos = 0;
        if(str[0] == '-' || str[0] == '+')
            pos = 1;
        if(pos == str.length())
            return false;
        for(; pos < str.length(); ++pos)
            if(!std::isdigit(str[pos]))
                return false;
        return true;
    }

    bool isFloatString(const char* s, bool ignoreWhitespace) {
        if(!s)
            return false;
        std::string str(s);
        if(ignoreWhitespace)
            trim(str);
        if(str.empty())
            return false;
        char* end = nullptr;
        std::strtod(str.c_str(), &end);
        return end && *end == '\0';
    }
}
