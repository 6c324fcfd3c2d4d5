//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_CLUSTERCONFIG_H
#define SKEIN_CLUSTERCONFIG_H

#include <string>
#include <vector>
#include <ResourceRequest.h>

namespace skein {

    /*!
     * description of a multi-node cluster: the available node types (worker classes) and which one is the head.
     * Read from a YAML file of the form
     *
     * available_node_types:
     *   head.default:
     *     resources: {CPU: 4, GPU: 0, memory: 4GB}
     *     max_workers: 0
     *   worker.gpu:
     *     resources: {CPU: 4, GPU: 1}
     *     min_workers: 1
     *     max_workers: 2
     * head_node_type: head.default
     */
    class ClusterConfig {
    private:
        std::string _name;
        std::vector<WorkerClass> _classes;
        std::string _headClass;
        size_t _defaultMemory;
    public:
        ClusterConfig() : _name("cluster"), _defaultMemory(1024 * 1024 * 1024) {}

        /*!
         * loads the config, throws SkeinException if the file can not be read or has no node types
         */
        static ClusterConfig fromYAML(const std::string& path);
        static ClusterConfig fromString(const std::string& yaml);

        /*!
         * a single head node with the given resources
         */
        static ClusterConfig singleNode(const ResourceSummary& resources);

        void addWorkerClass(const WorkerClass& wc, bool head=false);

        std::string name() const { return _name; }
        const std::vector<WorkerClass>& workerClasses() const { return _classes; }
        std::string headClass() const { return _headClass; }

        /*!
         * workers of a class started with the cluster (1 for the head class, min_workers else)
         */
        size_t initialWorkers(const std::string& className) const;

        const WorkerClass& workerClass(const std::string& className) const;
    };
}

#endif //SKEIN_CLUSTERCONFIG_H
