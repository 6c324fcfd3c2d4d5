//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_STRINGUTILS_H
#define SKEIN_STRINGUTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>
#include <sstream>

namespace skein {

    /*!
     * checks whether string holds a boolean value (true/false, yes/no, on/off, 1/0; case insensitive)
     */
    extern bool isBoolString(const std::string& str);

    /*!
     * parse string, throws std::invalid_argument if not a boolean string.
     * @param str
     * @return the value of the boolean str
     */
    extern bool parseBoolString(const std::string& str);

    extern bool isIntegerString(const char* s, bool ignoreWhitespace=true);

    extern bool isFloatString(const char* s, bool ignoreWhitespace=true);

    // trim from start (in place)
    inline void ltrim(std::string &s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) {
            return !std::isspace(ch);
        }));
    }

    // trim from end (in place)
    inline void rtrim(std::string &s) {
        s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) {
            return !std::isspace(ch);
        }).base(), s.end());
    }

    // trim from both ends (in place)
    inline void trim(std::string &s) {
        ltrim(s);
        rtrim(s);
    }

    inline std::string trim(const std::string& s) {
        std::string copy(s.c_str());
        ltrim(copy);
        rtrim(copy);
        return copy;
    }

    inline std::string toLower(const std::string& s) {
        std::string res(s);
        std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) { return std::tolower(c); });
        return res;
    }

    /*!
     * returns a correctly pluralized version of a word and its count
     * @param t count
     * @param base_word word in singular form
     * @return pluralized version. E.g. for inputs 1, task this will return "1 task"
     */
    template<typename T> std::string pluralize(const T t, const std::string& base_word) {
        if(t == 1)
            return std::to_string(t) + " " + base_word;
        return std::to_string(t) + " " + base_word + "s";
    }

    /*!
     * joins a list of elements with a separator, elements are streamed via operator <<
     */
    template<typename Iterable> std::string join(const Iterable& elements, const std::string& sep) {
        std::stringstream ss;
        bool first = true;
        for(const auto& el : elements) {
            if(!first)
                ss<<sep;
            ss<<el;
            first = false;
        }
        return ss.str();
    }
}

#endif //SKEIN_STRINGUTILS_H
