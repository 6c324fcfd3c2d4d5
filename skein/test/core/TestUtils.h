//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_TESTUTILS_H
#define SKEIN_TESTUTILS_H

#include "gtest/gtest.h"

#include <chrono>
#include <mutex>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <ContextOptions.h>
#include <Context.h>
#include <Logger.h>
#include <Timer.h>

#include <boost/filesystem/operations.hpp>

#include "TestKernels.h"

#ifndef SKEIN_TEST_RESOURCES
#define SKEIN_TEST_RESOURCES "../resources"
#endif

/*!
 * polls cond until it holds or timeout (in s) passed
 */
template<typename Condition> bool waitFor(Condition cond, double timeout=5.0) {
    skein::Timer timer;
    while(!cond()) {
        if(timer.time() > timeout)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

/*!
 * records everything a backend reports about submissions
 */
class RecordingListener : public skein::ITaskListener {
public:
    std::mutex mutex;
    std::vector<std::pair<skein::TaskID, std::string>> started;
    std::vector<skein::TaskResult> results;
    std::vector<skein::TaskFailure> failures;

    void onStarted(skein::TaskID id, size_t attempt, const std::string& worker) override {
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(std::make_pair(id, worker));
    }

    void onSuccess(const skein::TaskResult& result) override {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(result);
    }

    void onFailure(const skein::TaskFailure& failure) override {
        std::lock_guard<std::mutex> lock(mutex);
        failures.push_back(failure);
    }

    size_t numDone() {
        std::lock_guard<std::mutex> lock(mutex);
        return results.size() + failures.size();
    }

    size_t numStarted() {
        std::lock_guard<std::mutex> lock(mutex);
        return started.size();
    }

    bool waitDone(size_t n, double timeout=5.0) {
        return waitFor([this, n]() { return numDone() >= n; }, timeout);
    }
};

/*!
 * a standalone task for driving backends directly
 */
inline skein::TaskPtr makeTask(skein::TaskID id, const skein::KernelPtr& kernel, std::vector<skein::PartitionID> inputs={},
                               size_t numOutputs=1, const skein::ResourceRequest& resources=skein::ResourceRequest()) {
    auto task = std::make_shared<skein::Task>();
    task->id = id;
    task->stage = 0;
    task->partitionIndex = static_cast<size_t>(id);
    task->numPartitions = static_cast<size_t>(id) + 1;
    task->inputs = inputs;
    task->inputsPerSide = {inputs.size()};
    for(size_t i = 0; i < numOutputs; ++i)
        task->outputs.push_back(1000 * id + static_cast<skein::PartitionID>(i));
    task->resources = resources;
    task->kernel = kernel;
    task->operatorNames = {kernel ? kernel->name() : "none"};
    return task;
}

inline skein::TaskSubmission makeSubmission(const skein::TaskPtr& task, size_t attempt=1,
                                            const std::vector<skein::PartitionRef>& inputs={}) {
    skein::TaskSubmission s;
    s.task = task;
    s.attempt = attempt;
    s.inputs = inputs;
    return s;
}

inline skein::PartitionRef residentRef(skein::PartitionID id, const skein::PartitionPtr& data) {
    skein::PartitionRef ref(id, skein::INVALID_TASK, 0);
    ref.state = skein::PartitionState::MATERIALIZED;
    ref.data = data;
    return ref;
}

class SkeinTest : public ::testing::Test {
protected:
    std::string testName;
    std::string scratchDir;

    void SetUp() override {
        testName = std::string(::testing::UnitTest::GetInstance()->current_test_info()->test_case_name()) + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name());
        scratchDir = "/tmp/" + testName;
    }

    inline void remove_temp_files() {
        skein::Timer timer;
        boost::filesystem::remove_all(scratchDir.c_str());
        std::cout<<"removed temp files in "<<timer.time()<<"s"<<std::endl;
    }

    ~SkeinTest() override {
        remove_temp_files();
    }

    /*!
     * small, fast configuration: few executors, short backoff, short grace period
     */
    inline skein::ContextOptions testOptions() {
        using namespace skein;
        ContextOptions co = ContextOptions::defaults();
        co.set("skein.backend", "local");
        co.set("skein.executorCount", "4");
        co.set("skein.local.memory", "256MB");
        co.set("skein.maxTaskRetries", "3");
        co.set("skein.retry.baseDelayMs", "1");
        co.set("skein.retry.maxDelayMs", "20");
        co.set("skein.shuffle.defaultPartitions", "4");
        co.set("skein.cancelGracePeriod", "2.0");
        co.set("skein.scheduler.pollInterval", "5");
        co.set("skein.handleSignals", "false");
        co.set("skein.cluster.submitTimeout", "0.5");
        co.set("skein.cluster.capacityPollInterval", "20");
        return co;
    }

    inline skein::ContextOptions clusterTestOptions() {
        auto co = testOptions();
        co.set("skein.backend", "cluster");
        return co;
    }
};

#endif //SKEIN_TESTUTILS_H
