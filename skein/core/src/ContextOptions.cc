//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ContextOptions.h>
#include <Environment.h>
#include <Logger.h>
#include <fstream>
#include <thread>
#include <chrono>
#include <ctime>
#include <boost/algorithm/string.hpp>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace skein {

    ContextOptions ContextOptions::defaults() {
        ContextOptions co;

        auto executorCount = std::max(1u, std::thread::hardware_concurrency());

        co._store = {{"skein.backend", "local"},
                     {"skein.executorCount", std::to_string(executorCount)},
                     {"skein.local.numGPUs", "0"},
                     {"skein.local.memory", "2GB"},
                     {"skein.maxConcurrentTasks", "0"},
                     {"skein.maxTaskRetries", "3"},
                     {"skein.retry.baseDelayMs", "100"},
                     {"skein.retry.maxDelayMs", "5000"},
                     {"skein.taskTimeout", "0"},
                     {"skein.orderedOutput", "true"},
                     {"skein.adaptive.enable", "false"},
                     {"skein.adaptive.maxPartitions", "16"},
                     {"skein.adaptive.targetPartitionSize", "64MB"},
                     {"skein.shuffle.defaultPartitions", std::to_string(executorCount)},
                     {"skein.cancelGracePeriod", "5.0"},
                     {"skein.recomputeDepthLimit", "8"},
                     {"skein.scheduler.pollInterval", "50"},
                     {"skein.handleSignals", "false"},
                     {"skein.cluster.configFile", ""},
                     {"skein.cluster.submitTimeout", "30"},
                     {"skein.cluster.capacityPollInterval", "250"}};

        // add environment info
        for(const auto& kv : getSkeinEnvironment())
            co._store[kv.first] = kv.second;

        return co;
    }

    static void emitYAML(YAML::Emitter& out, const std::map<std::string, std::string>& entries) {
        // group by first component, recurse on the rest
        std::map<std::string, std::map<std::string, std::string>> groups;
        std::map<std::string, std::string> leaves;
        for(const auto& kv : entries) {
            auto pos = kv.first.find('.');
            if(pos == std::string::npos)
                leaves[kv.first] = kv.second;
            else
                groups[kv.first.substr(0, pos)][kv.first.substr(pos + 1)] = kv.second;
        }

        out<<YAML::BeginMap;
        for(const auto& kv : leaves)
            out<<YAML::Key<<kv.first<<YAML::Value<<kv.second;
        for(const auto& g : groups) {
            out<<YAML::Key<<g.first<<YAML::Value;
            emitYAML(out, g.second);
        }
        out<<YAML::EndMap;
    }

    bool ContextOptions::toYAML(const std::string &path, bool overwrite) const {
        if(!overwrite && fileExists(path)) {
            Logger::instance().defaultLogger().error("file " + path + " already exists, not overwriting configuration");
            return false;
        }

        YAML::Emitter out;
        out.SetIndent(4);

        out<<YAML::Comment("Skein configuration file");
        auto cur_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::string date_string = std::ctime(&cur_t);
        trim(date_string);
        out<<YAML::Newline;
        out<<YAML::Comment("\tcreated " + date_string);
        out<<YAML::Newline;

        // environment info is not configuration
        std::map<std::string, std::string> entries;
        for(const auto& kv : _store)
            if(!boost::algorithm::starts_with(kv.first, "skein.env."))
                entries[kv.first] = kv.second;
        emitYAML(out, entries);

        if(!out.good()) {
            Logger::instance().defaultLogger().error("error while saving setting to YAML: " + out.GetLastError());
            return false;
        }

        std::ofstream ofs(path);
        if(!ofs.good())
            return false;
        ofs<<out.c_str()<<std::endl;
        return ofs.good();
    }

    std::vector<std::pair<std::string, std::string>> decodeYAML(const YAML::Node& node) {
        using namespace std;

        vector<pair<string, string>> res;
        if(node.IsMap()) {
            for(auto p : node) {
                auto key = p.first.as<std::string>();
                auto val = p.second;
                if(val.IsScalar()) {
                    res.push_back(make_pair(key, val.as<std::string>()));
                } else {
                    auto decoded_el = decodeYAML(val);
                    for(const auto& pp : decoded_el) {
                        res.push_back(make_pair(pp.first.length() > 0
                                                ? key + "." + pp.first
                                                : key, pp.second));
                    }
                }
            }
            return res;
        } else if(node.IsSequence()) {
            // sequences of maps are flattened, scalar lists are stored as ['a','b']
            if(0 == node.size())
                return {make_pair("", "[]")};

            if(node[0].IsScalar()) {
                stringstream ss;
                ss<<"[";
                for(auto val : node) {
                    ss<<"'"<<val.as<std::string>()<<"',";
                }
                auto valstr = ss.str();
                valstr.back() = ']';
                return {make_pair("", valstr)};
            } else
                for(auto el : node) {
                    auto decoded_el = decodeYAML(el);
                    res.insert(res.end(), decoded_el.begin(), decoded_el.end());
                }
            return res;
        } else {
            // unsupported, i.e. do not add.
            return {};
        }
    }

    ContextOptions ContextOptions::fromYAML(const std::string &path) {
        ContextOptions co = defaults();
        try {
            YAML::Node config = YAML::LoadFile(path);
            auto res = decodeYAML(config);

            if(res.empty()) {
                Logger::instance().defaultLogger().warn("loaded empty configuration file from " + path);
            }

            for(const auto& kv : res) {
                if(co._store.find(kv.first) == co._store.end())
                    Logger::instance().defaultLogger().warn("parsing skein option '" + kv.first + "' that is not present in default settings.");
                co._store[kv.first] = kv.second;
            }

            return co;
        } catch(const YAML::Exception& e) {
            Logger::instance().defaultLogger().error("error while parsing configuration file "
                                                     + path + "\n" + e.what());
            return defaults();
        }
    }

    void ContextOptions::updateWith(const ContextOptions &other) {
        for(const auto& keyval : other._store)
            _store[keyval.first] = keyval.second;
    }

    size_t ContextOptions::applyEnvironment() {
        size_t count = 0;
        for(auto& keyval : _store) {
            if(boost::algorithm::starts_with(keyval.first, "skein.env."))
                continue;
            auto var = environmentVariableForKey(keyval.first);
            auto value = std::getenv(var.c_str());
            if(value) {
                keyval.second = value;
                count++;
            }
        }
        return count;
    }

    ContextOptions ContextOptions::load(const std::string &filename) {
        ContextOptions options = defaults();

        // check whether SKEIN_HOME is set, else use local directory
        char* skein_home = std::getenv("SKEIN_HOME");
        auto path = skein_home ? std::string(skein_home) + "/" + filename : "./" + filename;
        if(fileExists(path)) {
            options.updateWith(ContextOptions::fromYAML(path));
            Logger::instance().defaultLogger().info("updated skein settings via options through " + path);
        }

        auto overridden = options.applyEnvironment();
        if(overridden > 0)
            Logger::instance().defaultLogger().info("overrode " + pluralize(overridden, "option") + " via environment");

        return options;
    }

    unsigned int ContextOptions::EXECUTOR_COUNT() const {
        auto executorCount = std::stoi(_store.at("skein.executorCount"));
        if(executorCount <= 0) {
            Logger::instance().defaultLogger().warn("executor count must be positive, using 1 executor");
            return 1;
        }
        return static_cast<unsigned int>(executorCount);
    }

    size_t ContextOptions::MAX_CONCURRENT_TASKS() const {
        auto n = std::stol(_store.at("skein.maxConcurrentTasks"));
        return n > 0 ? static_cast<size_t>(n) : 0;
    }

    size_t ContextOptions::ADAPTIVE_MAX_PARTITIONS() const {
        auto n = std::stol(_store.at("skein.adaptive.maxPartitions"));
        return n > 0 ? static_cast<size_t>(n) : 1;
    }

    size_t ContextOptions::DEFAULT_SHUFFLE_PARTITIONS() const {
        auto n = std::stol(_store.at("skein.shuffle.defaultPartitions"));
        return n > 0 ? static_cast<size_t>(n) : 1;
    }

    void ContextOptions::set(const std::string &key, const std::string &value) {
        // check that key exists, else issue warning!
        auto it = _store.find(key);

        if(it == _store.end())
            Logger::instance().defaultLogger().error("could not find key '" + key + "'");
        else
            _store[key] = value;
    }

    std::string ContextOptions::toString() const {
        std::stringstream ss;
        for(const auto& opt : _store) {
            ss<<opt.first<<" : "<<opt.second<<std::endl;
        }
        return ss.str();
    }

    bool ContextOptions::containsKey(const std::string &key) const {
        return _store.find(key) != _store.end();
    }

    std::string ContextOptions::get(const std::string &key, const std::string &alt) const {
        auto it = _store.find(key);
        if(it == _store.end())
            return alt;
        return it->second;
    }

    Backend ContextOptions::BACKEND() const {
        auto b = get("skein.backend", "");
        if(0 == b.length()) {
            Logger::instance().defaultLogger().warn("no backend specified explicitly, defaulting to local");
            return Backend::LOCAL;
        }

        if(b == "local") {
            return Backend::LOCAL;
        } else if(b == "cluster") {
            return Backend::CLUSTER;
        } else {
            Logger::instance().defaultLogger().error("found unknown backend '" + b + "', defaulting to local execution.");
            return Backend::LOCAL;
        }
    }

    std::string ContextOptions::asJSON() const {
        nlohmann::json json;

        for(const auto& keyval : _store) {
            // convert to correct type (match basically)
            if(keyval.second.empty())
                json[keyval.first] = keyval.second;
            else if(isIntegerString(keyval.second.c_str()))
                json[keyval.first] = std::stoll(keyval.second);
            else if(isBoolString(keyval.second))
                json[keyval.first] = parseBoolString(keyval.second);
            else if(isFloatString(keyval.second.c_str()))
                json[keyval.first] = std::stod(keyval.second);
            else
                json[keyval.first] = keyval.second;
        }
        return json.dump();
    }
}
