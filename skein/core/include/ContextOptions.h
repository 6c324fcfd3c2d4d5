//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_CONTEXTOPTIONS_H
#define SKEIN_CONTEXTOPTIONS_H

#include <map>
#include <string>
#include <StringUtils.h>
#include <Utils.h>

namespace skein {

    enum class Backend {
        LOCAL,
        CLUSTER
    };

    /*!
     * represents the parameters passed to a context controlling
     * scheduling, retries and the execution backend
     */
    class ContextOptions {
    private:
        // data is internally stored via a string-string hashmap
        std::map<std::string, std::string> _store;

        // helper function to update values with other options
        void updateWith(const ContextOptions& other);
    public:
        ContextOptions() {}
        ContextOptions(const ContextOptions& other) : _store(other._store)    {}
        inline ContextOptions& operator = (const ContextOptions& other) {
            _store = other._store;
            return *this;
        }
        ~ContextOptions() {}

        Backend BACKEND() const; //! which backend to use for task execution

        unsigned int EXECUTOR_COUNT() const;                //! how many worker threads the local backend uses
        double LOCAL_NUM_GPUS() const { return std::stod(_store.at("skein.local.numGPUs")); }
        size_t LOCAL_MEMORY() const { return memStringToSize(_store.at("skein.local.memory")); }

        size_t MAX_CONCURRENT_TASKS() const; //! upper bound of submitted+running tasks, 0 means bounded by capacity only
        size_t MAX_TASK_RETRIES() const { return std::stoul(_store.at("skein.maxTaskRetries")); }
        double RETRY_BASE_DELAY() const { return std::stod(_store.at("skein.retry.baseDelayMs")) / 1000.0; } //! in s
        double RETRY_MAX_DELAY() const { return std::stod(_store.at("skein.retry.maxDelayMs")) / 1000.0; } //! in s
        double TASK_TIMEOUT() const { return std::stod(_store.at("skein.taskTimeout")); } //! in s, 0 disables the timeout

        bool ORDERED_OUTPUT() const { return stringToBool(_store.at("skein.orderedOutput")); }

        bool ADAPTIVE_REPARTITIONING() const { return stringToBool(_store.at("skein.adaptive.enable")); }
        size_t ADAPTIVE_MAX_PARTITIONS() const;
        size_t ADAPTIVE_TARGET_PARTITION_SIZE() const { return memStringToSize(_store.at("skein.adaptive.targetPartitionSize")); }
        size_t DEFAULT_SHUFFLE_PARTITIONS() const;

        double CANCEL_GRACE_PERIOD() const { return std::stod(_store.at("skein.cancelGracePeriod")); } //! in s
        size_t RECOMPUTE_DEPTH_LIMIT() const { return std::stoul(_store.at("skein.recomputeDepthLimit")); }
        double SCHEDULER_POLL_INTERVAL() const { return std::stod(_store.at("skein.scheduler.pollInterval")) / 1000.0; } //! in s
        bool HANDLE_SIGNALS() const { return stringToBool(_store.at("skein.handleSignals")); }

        std::string CLUSTER_CONFIG_FILE() const { return _store.at("skein.cluster.configFile"); }
        double CLUSTER_SUBMIT_TIMEOUT() const { return std::stod(_store.at("skein.cluster.submitTimeout")); } //! in s
        double CLUSTER_CAPACITY_POLL_INTERVAL() const { return std::stod(_store.at("skein.cluster.capacityPollInterval")) / 1000.0; } //! in s

        /*!
         * return options as JSON string (string,string keys)
         * @return JSON
         */
        std::string asJSON() const;

        /*!
         * saves current configuration object to yaml file
         * @param path where to store the data
         * @param overwrite whether to overwrite the file
         * @return true on success
         */
        bool toYAML(const std::string& path, bool overwrite=false) const;

        /*!
         * @param path where to find the configuration file. Missing keys/options are filled with default values.
         * @return ContextOptions object with info filled from YAML.
         */
        static ContextOptions fromYAML(const std::string& path);

        /*!
         * creates object with default options
         * @return
         */
        static ContextOptions defaults();

        /*!
         * retrieves context options from defaults, then SKEIN_HOME or the local directory via yaml files,
         * then environment variables (SKEIN_<KEY>)
         * @return
         */
        static ContextOptions load(const std::string& filename="config.yaml");

        /*!
         * overrides options for which an environment variable is set
         * @return number of overridden options
         */
        size_t applyEnvironment();

        void set(const std::string& key, const std::string& value);

        /*!
         * prints out options nicely formatted
         * @return
         */
        std::string toString() const;

        /*!
         * check whether key is contained within options
         * @param key key to check for
         * @return true if key represents a valid option key
         */
        bool containsKey(const std::string& key) const;

        std::map<std::string, std::string> store() const { return _store; }

        /*!
         * retrieves entry of key, if not there returns alt
         */
        std::string get(const std::string& key, const std::string& alt = "") const;
    };
}

#endif //SKEIN_CONTEXTOPTIONS_H
