//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <Utils.h>
#include <Logger.h>
#include <map>
#include <mutex>
#include <string>
#include <boost/algorithm/string.hpp>
#include <iomanip>
#include <pwd.h>

namespace skein {

    static std::mutex uuidGeneratorMutex; // boost uuids are not threadsafe
    static boost::uuids::random_generator uuidGenerator;

    uniqueid_t getUniqueID() {
        std::lock_guard<std::mutex> lock(uuidGeneratorMutex);
        auto uuid = uuidGenerator();
        return uuid;
    }

    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    size_t memStringToSize(const std::string& str) {
        using namespace boost::algorithm;

        auto s = to_lower_copy(trim_copy(str));
        if(s.empty()) {
            Logger::instance()
                    .logger("memory")
                    .warn("empty memory config string given, defaulting to 0");
            return 0;
        }

        // format similar to spark's, fractions and combinations (e.g. 1g512m) can be specified
        std::map<std::string, size_t> lookup = {{"b", 1LL},
                                                {"k", 1024LL},
                                                {"kb", 1024LL},
                                                {"m", 1024 * 1024LL},
                                                {"mb", 1024 * 1024LL},
                                                {"g", 1024 * 1024 * 1024LL},
                                                {"gb", 1024 * 1024 * 1024LL},
                                                {"t", 1024 * 1024 * 1024 * 1024LL},
                                                {"tb", 1024 * 1024 * 1024 * 1024LL}};

        // split into alternating number/suffix parts
        std::vector<std::string> parts;
        std::vector<bool> types;
        size_t last = 0;
        bool isLastNumber = isDigit(s[0]) || (s[0] == '.');
        for(size_t i = 1; i < s.length(); i++) {
            bool number = isDigit(s[i]) || (s[i] == '.');
            if(number != isLastNumber) {
                parts.push_back(trim_copy(s.substr(last, i - last)));
                types.push_back(isLastNumber);
                isLastNumber = number;
                last = i;
            }
        }
        parts.push_back(trim_copy(s.substr(last)));
        types.push_back(isLastNumber);

        if(!types[0]) {
            Logger::instance().logger("memory").error("malformed memory string '" + str +"' encountered");
            return 0;
        }

        double sum = 0;
        for(size_t i = 0; i < parts.size(); ++i) {
            if(!types[i]) {
                Logger::instance().logger("memory").error("malformed memory string '" + str +"' encountered");
                return 0;
            }

            double coeff = 0.0;
            try {
                coeff = std::stod(parts[i]);
            } catch(const std::exception& e) {
                Logger::instance().logger("memory").error("malformed memory string '" + str +"' encountered");
                return 0;
            }

            // number without suffix counts as bytes
            if(i + 1 == parts.size()) {
                sum += coeff;
                break;
            }

            auto it = lookup.find(parts[i + 1]);
            if(it == lookup.end()) {
                Logger::instance().logger("memory").error("Unknown memory suffix '" + parts[i + 1] +"' encountered");
                return 0;
            }
            sum += coeff * it->second;
            i++;
        }

        return static_cast<size_t>(sum);
    }

    std::string sizeToMemString(size_t size) {
        using namespace std;
        static const char *SIZES[] = { "B", "KB", "MB", "GB", "TB", "PB"};

        size_t div = 0;
        size_t rem = 0;

        while (size >= 1024 && div + 1 < (sizeof(SIZES) / sizeof(*SIZES))) {
            rem = (size % 1024);
            div++;
            size /= 1024;
        }

        double size_d = (float)size + (float)rem / 1024.0;
        stringstream ss(stringstream::in | stringstream::out);
        ss<<setprecision(2)<<fixed<<size_d<<" "<<SIZES[div];
        return ss.str();
    }

    bool stringToBool(const std::string& s) {
        try {
            return parseBoolString(s);
        } catch(const std::invalid_argument& e) {
            Logger::instance().defaultLogger().error("could not convert " + s + " to boolean value. Returning false.");
            return false;
        }
    }

    std::string getUserName() {
        auto uid = geteuid();
        auto pw = getpwuid(uid);
        if(pw)
            return std::string(pw->pw_name);
        return "";
    }

    std::string getHostName() {
        char buf[256];
        if(0 == gethostname(buf, sizeof(buf))) {
            buf[sizeof(buf) - 1] = '\0';
            return std::string(buf);
        }
        return "";
    }
}
