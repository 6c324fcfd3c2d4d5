//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/cluster/ClusterConfig.h>
#include <algorithm>
#include <Errors.h>
#include <Logger.h>
#include <StringUtils.h>
#include <Utils.h>
#include <yaml-cpp/yaml.h>

namespace skein {

    // memory is given either as bytes or as a suffix string (e.g. 2GB)
    static size_t decodeMemory(const YAML::Node& node) {
        auto s = trim(node.as<std::string>());
        if(isIntegerString(s.c_str()))
            return std::stoull(s);
        return memStringToSize(s);
    }

    static ClusterConfig decodeCluster(const YAML::Node& root) {
        ClusterConfig config;
        auto types = root["available_node_types"];
        if(!types || !types.IsMap())
            throw SkeinException("cluster description has no available_node_types");

        std::string head;
        if(root["head_node_type"])
            head = root["head_node_type"].as<std::string>();

        for(auto it = types.begin(); it != types.end(); ++it) {
            auto name = it->first.as<std::string>();
            auto node = it->second;

            WorkerClass wc;
            wc.name = name;
            auto resources = node["resources"];
            bool hasCPU = false;
            if(resources && resources.IsMap()) {
                for(auto rt = resources.begin(); rt != resources.end(); ++rt) {
                    auto key = toLower(rt->first.as<std::string>());
                    if(key == "cpu") {
                        wc.resources.cpus = rt->second.as<double>();
                        hasCPU = true;
                    }
                    else if(key == "gpu")
                        wc.resources.gpus = rt->second.as<double>();
                    else if(key == "memory" || key == "object_store_memory")
                        wc.resources.memory = decodeMemory(rt->second);
                    else
                        Logger::instance().logger("cluster ee").warn("ignoring unknown resource '" + key +
                                                                      "' of node type " + name);
                }
            }
            if(!hasCPU)
                wc.resources.cpus = 1.0;
            wc.minWorkers = node["min_workers"] ? node["min_workers"].as<size_t>() : 0;
            wc.maxWorkers = node["max_workers"] ? node["max_workers"].as<size_t>() : 0;
            config.addWorkerClass(wc, name == head);
        }

        if(!head.empty() && config.headClass() != head)
            throw SkeinException("head node type " + head + " is not an available node type");
        return config;
    }

    ClusterConfig ClusterConfig::fromYAML(const std::string &path) {
        if(!fileExists(path))
            throw SkeinException("cluster description " + path + " not found");
        try {
            return decodeCluster(YAML::LoadFile(path));
        } catch(const YAML::Exception& e) {
            throw SkeinException("error while parsing cluster description " + path + "\n" + e.what());
        }
    }

    ClusterConfig ClusterConfig::fromString(const std::string &yaml) {
        try {
            return decodeCluster(YAML::Load(yaml));
        } catch(const YAML::Exception& e) {
            throw SkeinException(std::string("error while parsing cluster description\n") + e.what());
        }
    }

    ClusterConfig ClusterConfig::singleNode(const ResourceSummary &resources) {
        ClusterConfig config;
        config.addWorkerClass(WorkerClass("head", resources, 0, 0), true);
        return config;
    }

    void ClusterConfig::addWorkerClass(const WorkerClass &wc, bool head) {
        auto c = wc;
        if(c.resources.memory == 0)
            c.resources.memory = _defaultMemory;
        // the head node always runs, even if the description lists no additional workers for it
        if(head) {
            c.maxWorkers = std::max(c.maxWorkers, (size_t)1);
            _headClass = c.name;
        }
        if(c.minWorkers > c.maxWorkers)
            throw SkeinException("node type " + c.name + " has min_workers > max_workers");
        _classes.push_back(c);
    }

    size_t ClusterConfig::initialWorkers(const std::string &className) const {
        const auto& wc = workerClass(className);
        if(className == _headClass)
            return std::max(wc.minWorkers, (size_t)1);
        return wc.minWorkers;
    }

    const WorkerClass& ClusterConfig::workerClass(const std::string &className) const {
        for(const auto& wc : _classes)
            if(wc.name == className)
                return wc;
        throw SkeinException("unknown worker class " + className);
    }
}
