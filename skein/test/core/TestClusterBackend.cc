//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include "TestUtils.h"
#include <ee/cluster/ClusterBackend.h>
#include <ee/cluster/EmulatedCluster.h>
#include <algorithm>
#include <atomic>
#include <numeric>

using namespace skein;

/*!
 * records worker loss and capacity changes
 */
class RecordingBackendListener : public IBackendListener {
public:
    std::mutex mutex;
    std::vector<ResourceSummary> capacities;
    std::vector<std::pair<std::string, std::vector<PartitionID>>> lost;

    void onCapacityChanged(const ResourceSummary& capacity) override {
        std::lock_guard<std::mutex> lock(mutex);
        capacities.push_back(capacity);
    }

    void onWorkerLost(const std::string& worker, const std::vector<PartitionID>& partitions) override {
        std::lock_guard<std::mutex> lock(mutex);
        lost.push_back(std::make_pair(worker, partitions));
    }

    size_t numLost() {
        std::lock_guard<std::mutex> lock(mutex);
        return lost.size();
    }
};

/*!
 * source kernel producing one row once opened
 */
class GatedSource : public IComputeKernel {
    std::atomic_bool _open;
    std::atomic_bool _running;
public:
    GatedSource() : _open(false), _running(false) {}
    std::string name() const override { return "gated"; }
    std::vector<PartitionPtr> execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) override {
        _running = true;
        while(!_open)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return {makePartition({1})};
    }
    void open() { _open = true; }
    bool running() const { return _running.load(); }
};

class ClusterBackendTest : public SkeinTest {
protected:
    std::string clusterFile() const {
        return std::string(SKEIN_TEST_RESOURCES) + "/cluster.yaml";
    }

    ContextOptions clusterOptions() {
        auto co = clusterTestOptions();
        co.set("skein.cluster.configFile", clusterFile());
        return co;
    }

    static int64_t total(const std::vector<int64_t>& v) {
        return std::accumulate(v.begin(), v.end(), int64_t(0));
    }

    static PartitionRef remoteRef(const MaterializedPartition& mp) {
        PartitionRef ref(mp.id, INVALID_TASK, 0);
        ref.state = PartitionState::MATERIALIZED;
        ref.location = mp.location;
        ref.numRows = mp.numRows;
        ref.numBytes = mp.numBytes;
        return ref;
    }
};

TEST_F(ClusterBackendTest, CapacityOfLiveWorkers) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);

    EXPECT_EQ(backend.name(), "cluster");
    // head with 2 CPUs, two CPU workers with 1 CPU each
    auto capacity = backend.advertiseCapacity();
    EXPECT_DOUBLE_EQ(capacity.cpus, 4.0);
    EXPECT_DOUBLE_EQ(capacity.gpus, 0.0);
    EXPECT_EQ(cluster->liveWorkers().size(), 3);
    EXPECT_EQ(backend.workerClasses().size(), 3);

    auto listener = std::make_shared<RecordingBackendListener>();
    backend.subscribe(listener);
    auto id = cluster->addWorker("worker.gpu");
    EXPECT_EQ(id, "worker.gpu-1");
    EXPECT_DOUBLE_EQ(backend.advertiseCapacity().gpus, 1.0);
    EXPECT_DOUBLE_EQ(backend.advertiseCapacity().cpus, 8.0);
    {
        std::lock_guard<std::mutex> lock(listener->mutex);
        ASSERT_FALSE(listener->capacities.empty());
        EXPECT_DOUBLE_EQ(listener->capacities.back().gpus, 1.0);
    }

    // node types are bounded by max_workers
    EXPECT_THROW(cluster->addWorker("head.default"), SkeinException);
    cluster->addWorker("worker.cpu");
    cluster->addWorker("worker.cpu");
    EXPECT_THROW(cluster->addWorker("worker.cpu"), SkeinException);
    EXPECT_THROW(cluster->addWorker("worker.tpu"), SkeinException);

    ASSERT_TRUE(cluster->killWorker("worker.cpu-1"));
    EXPECT_FALSE(cluster->killWorker("worker.cpu-1"));
    EXPECT_DOUBLE_EQ(backend.advertiseCapacity().cpus, 9.0);
    EXPECT_EQ(listener->numLost(), 1);
    backend.unsubscribe(listener.get());
}

TEST_F(ClusterBackendTest, RunsTasksRemotely) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();

    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(3))), listener);
    ASSERT_TRUE(listener->waitDone(1));
    ASSERT_EQ(listener->results.size(), 1);
    auto out = listener->results.front().outputs.front();
    EXPECT_EQ(out.id, 1000);
    EXPECT_FALSE(out.location.empty());
    EXPECT_EQ(out.numRows.value(), 3);
    // data stays on the worker
    EXPECT_EQ(out.data, nullptr);
    EXPECT_EQ(cluster->locationOf(out.id), out.location);
    EXPECT_EQ(values(backend.fetch(remoteRef(out))), std::vector<int64_t>({3, 4, 5}));

    // consumers read inputs from the worker holding them
    backend.submit(makeSubmission(makeTask(2, std::make_shared<SumMerge>(), {out.id}), 1, {remoteRef(out)}), listener);
    ASSERT_TRUE(listener->waitDone(2));
    ASSERT_EQ(listener->results.size(), 2);
    auto sum = listener->results.back().outputs.front();
    EXPECT_EQ(values(backend.fetch(remoteRef(sum))), std::vector<int64_t>({12}));

    backend.release({remoteRef(out), remoteRef(sum)});
    EXPECT_EQ(cluster->numStoredPartitions(), 0);
    EXPECT_THROW(backend.fetch(remoteRef(out)), PartitionLostError);
    EXPECT_TRUE(waitFor([&]() { return backend.numPendingRequests() == 0; }));
}

TEST_F(ClusterBackendTest, WorkerLossLosesPartitions) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();
    auto events = std::make_shared<RecordingBackendListener>();
    backend.subscribe(events);

    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(3))), listener);
    ASSERT_TRUE(listener->waitDone(1));
    auto out = listener->results.front().outputs.front();

    ASSERT_TRUE(cluster->killWorker(out.location));
    ASSERT_TRUE(waitFor([&]() { return events->numLost() == 1; }));
    {
        std::lock_guard<std::mutex> lock(events->mutex);
        EXPECT_EQ(events->lost.front().first, out.location);
        EXPECT_EQ(events->lost.front().second, std::vector<PartitionID>({out.id}));
    }
    EXPECT_THROW(backend.fetch(remoteRef(out)), PartitionLostError);

    backend.submit(makeSubmission(makeTask(2, std::make_shared<ConcatMerge>(), {out.id}), 1, {remoteRef(out)}), listener);
    ASSERT_TRUE(listener->waitDone(2));
    ASSERT_EQ(listener->failures.size(), 1);
    EXPECT_EQ(listener->failures.front().kind, FailureKind::INPUT_LOST);
    EXPECT_EQ(listener->failures.front().lostInputs, std::vector<PartitionID>({out.id}));
    backend.unsubscribe(events.get());
}

TEST_F(ClusterBackendTest, RunningTaskOnLostWorkerIsTransient) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();
    auto slow = std::make_shared<SlowKernel>(30.0);

    backend.submit(makeSubmission(makeTask(1, slow)), listener);
    ASSERT_TRUE(waitFor([&]() { return listener->numStarted() == 1; }));
    std::string worker;
    {
        std::lock_guard<std::mutex> lock(listener->mutex);
        worker = listener->started.front().second;
    }
    ASSERT_TRUE(cluster->killWorker(worker));
    ASSERT_TRUE(listener->waitDone(1));
    EXPECT_EQ(listener->failures.front().kind, FailureKind::TRANSIENT);
    EXPECT_EQ(listener->failures.front().worker, worker);
    EXPECT_TRUE(waitFor([&]() { return cluster->numRunningTasks() == 0 && slow->running() == 0; }));
}

TEST_F(ClusterBackendTest, TaskFinishingOnLostWorkerIsNotSuccessful) {
    auto gated = std::make_shared<GatedSource>();
    std::mutex mutex;
    std::vector<messages::TaskResponse> responses;

    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::singleNode(ResourceSummary(1.0, 0.0, 1024 * 1024)));
    cluster->registerKernel("gated", gated);
    // the kernel completes after the worker died, but before the loss reaches the running attempt
    cluster->setEventHandler([&gated](const messages::ClusterEvent& event) {
        if(event.kind() != messages::ClusterEvent::WORKER_LOST)
            return;
        gated->open();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    });

    messages::TaskRequest req;
    req.set_task_id(1);
    req.set_attempt(1);
    req.set_kernel("gated");
    req.add_output_ids(42);
    req.set_num_partitions(1);
    fillResources(req.mutable_resources(), ResourceRequest(1.0));
    ASSERT_TRUE(cluster->invokeAsync(req, [&](const messages::TaskResponse& r) {
        std::lock_guard<std::mutex> lock(mutex);
        responses.push_back(r);
    }));
    ASSERT_TRUE(waitFor([&]() { return gated->running(); }));

    ASSERT_TRUE(cluster->killWorker("head-1"));
    EXPECT_TRUE(cluster->liveWorkers().empty());

    auto outcomes = [&]() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<messages::TaskResponse> v;
        for(const auto& r : responses)
            if(r.status() != messages::TASK_QUEUED && r.status() != messages::TASK_RUNNING)
                v.push_back(r);
        return v;
    };
    ASSERT_TRUE(waitFor([&]() { return !outcomes().empty(); }));
    auto done = outcomes();
    ASSERT_EQ(done.size(), 1);
    EXPECT_EQ(done.front().status(), messages::WORKER_LOST);
    EXPECT_EQ(done.front().outputs_size(), 0);
    EXPECT_EQ(cluster->numStoredPartitions(), 0);

    messages::PartitionInfo info;
    info.set_id(42);
    info.set_location("head-1");
    EXPECT_THROW(cluster->fetch(info), PartitionLostError);
    cluster->setEventHandler(nullptr);
}

TEST_F(ClusterBackendTest, UnknownExceptionIsTerminal) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();

    backend.submit(makeSubmission(makeTask(1, std::make_shared<ThrowsNonException>())), listener);
    ASSERT_TRUE(listener->waitDone(1));
    ASSERT_EQ(listener->failures.size(), 1);
    EXPECT_EQ(listener->failures.front().kind, FailureKind::TERMINAL);
    EXPECT_NE(listener->failures.front().message.find("unknown exception"), std::string::npos);
    EXPECT_TRUE(waitFor([&]() { return cluster->numRunningTasks() == 0; }));
}

TEST_F(ClusterBackendTest, CancelQueuedAndRunning) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();
    auto slow = std::make_shared<SlowKernel>(30.0);

    // the cluster has 4 CPUs, the fifth task is queued
    for(TaskID i = 0; i < 5; ++i)
        backend.submit(makeSubmission(makeTask(i, slow)), listener);
    ASSERT_TRUE(waitFor([&]() { return slow->running() == 4; }));
    EXPECT_EQ(cluster->numQueuedTasks(), 1);

    // queued one first, otherwise it gets placed once a slot frees up
    for(TaskID i = 5; i-- > 0;)
        backend.cancel(i);
    ASSERT_TRUE(listener->waitDone(5));
    for(const auto& f : listener->failures)
        EXPECT_EQ(f.kind, FailureKind::CANCELLED);
    EXPECT_EQ(slow->cancelled(), 4);
    EXPECT_EQ(cluster->numQueuedTasks(), 0);
    EXPECT_TRUE(waitFor([&]() { return backend.numPendingRequests() == 0 && cluster->numRunningTasks() == 0; }));
}

TEST_F(ClusterBackendTest, Unsatisfiable) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();

    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(1), {}, 1, ResourceRequest(1.0, 2.0))), listener);
    ASSERT_EQ(listener->failures.size(), 1);
    EXPECT_EQ(listener->failures.front().kind, FailureKind::UNSATISFIABLE);

    // the cluster scheduler rejects such requests as well
    messages::TaskRequest req;
    req.set_task_id(2);
    req.set_attempt(1);
    fillResources(req.mutable_resources(), ResourceRequest(64.0));
    std::vector<messages::TaskStatus> statuses;
    ASSERT_TRUE(cluster->invokeAsync(req, [&statuses](const messages::TaskResponse& r) {
        statuses.push_back(r.status());
    }));
    ASSERT_EQ(statuses.size(), 1);
    EXPECT_EQ(statuses.front(), messages::REJECTED);
}

TEST_F(ClusterBackendTest, UnreachableClusterIsTransient) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    ClusterBackend backend(clusterOptions(), cluster);
    auto listener = std::make_shared<RecordingListener>();

    cluster->setNetworkPartitioned(true);
    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(1))), listener);
    ASSERT_EQ(listener->failures.size(), 1);
    EXPECT_EQ(listener->failures.front().kind, FailureKind::TRANSIENT);
    EXPECT_EQ(backend.numPendingRequests(), 0);

    cluster->setNetworkPartitioned(false);
    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(1)), 2), listener);
    ASSERT_TRUE(listener->waitDone(2));
    ASSERT_EQ(listener->results.size(), 1);
    EXPECT_EQ(listener->results.front().attempt, 2);
}

TEST_F(ClusterBackendTest, UnacknowledgedSubmissionTimesOut) {
    auto cluster = std::make_shared<EmulatedCluster>(ClusterConfig::fromYAML(clusterFile()));
    auto co = clusterOptions();
    co.set("skein.cluster.submitTimeout", "0.1");
    ClusterBackend backend(co, cluster);
    auto listener = std::make_shared<RecordingListener>();

    cluster->dropNextRequests(1);
    Timer timer;
    backend.submit(makeSubmission(makeTask(1, std::make_shared<RangeSource>(1))), listener);
    EXPECT_EQ(backend.numPendingRequests(), 1);
    ASSERT_TRUE(listener->waitDone(1));
    EXPECT_GE(timer.time(), 0.1);
    ASSERT_EQ(listener->failures.size(), 1);
    EXPECT_EQ(listener->failures.front().kind, FailureKind::TRANSIENT);
    EXPECT_EQ(backend.numPendingRequests(), 0);
}

// end-to-end executions on the emulated cluster

TEST_F(ClusterBackendTest, SumAggregate) {
    Context c(clusterOptions());
    ASSERT_NE(c.cluster(), nullptr);
    auto stream = c.execute(sumPlan(6, 10, 3));
    EXPECT_EQ(total(collectValues(*stream)), expectedSum(60));
    EXPECT_EQ(stream->metrics().numRecomputed, 0);

    auto backend = std::dynamic_pointer_cast<ClusterBackend>(c.backend());
    ASSERT_NE(backend, nullptr);
    EXPECT_TRUE(waitFor([&]() { return backend->numPendingRequests() == 0; }));
    // intermediate and delivered partitions were released on the workers
    EXPECT_TRUE(waitFor([&]() { return c.cluster()->numStoredPartitions() == 0; }));
}

TEST_F(ClusterBackendTest, LostPartitionsAreRecomputed) {
    Context c(clusterOptions());
    auto cluster = c.cluster();
    ASSERT_NE(cluster, nullptr);

    // kill the worker holding the first input of the first reduce task, once
    std::atomic_bool killed(false);
    std::string victim;
    cluster->setTaskHook([&](const messages::TaskRequest& request, const std::string& worker) {
        if(request.stage_id() != 1 || request.inputs_size() == 0)
            return;
        bool expected = false;
        if(killed.compare_exchange_strong(expected, true)) {
            victim = request.inputs(0).location();
            cluster->killWorker(victim);
        }
    });

    auto stream = c.execute(sumPlan(4, 10, 2));
    EXPECT_EQ(total(collectValues(*stream)), expectedSum(40));
    EXPECT_TRUE(killed.load());
    EXPECT_FALSE(victim.empty());

    const auto& m = stream->metrics();
    EXPECT_GE(m.numLostPartitions, 1);
    EXPECT_GE(m.numRecomputed, 1);
    EXPECT_GE(m.numSubmitted, m.numTasks + m.numRecomputed);
    cluster->setTaskHook(nullptr);
}

TEST_F(ClusterBackendTest, RecomputeDepthLimit) {
    auto co = clusterOptions();
    co.set("skein.recomputeDepthLimit", "0");
    Context c(co);
    auto cluster = c.cluster();

    std::atomic_bool killed(false);
    cluster->setTaskHook([&](const messages::TaskRequest& request, const std::string& worker) {
        if(request.stage_id() != 1 || request.inputs_size() == 0)
            return;
        bool expected = false;
        if(killed.compare_exchange_strong(expected, true))
            cluster->killWorker(request.inputs(0).location());
    });

    auto stream = c.execute(sumPlan(4, 10, 2));
    EXPECT_THROW(stream->collect(), TaskTerminalError);
    EXPECT_EQ(stream->status(), ExecutionStatus::FAILED);
    EXPECT_EQ(stream->metrics().numRecomputed, 0);
    cluster->setTaskHook(nullptr);
}

TEST_F(ClusterBackendTest, NetworkPartitionIsRetried) {
    auto co = clusterOptions();
    co.set("skein.maxTaskRetries", "50");
    Context c(co);
    auto cluster = c.cluster();

    cluster->setNetworkPartitioned(true);
    auto stream = c.execute(sumPlan(2, 10, 2));
    ASSERT_TRUE(waitFor([&]() {
        stream->scheduler().step(0.01);
        return stream->metrics().numFailedAttempts >= 2;
    }));
    cluster->setNetworkPartitioned(false);

    EXPECT_EQ(total(collectValues(*stream)), expectedSum(20));
    EXPECT_GE(stream->metrics().numRetries, 2);
}

TEST_F(ClusterBackendTest, DroppedRequestsAreRetried) {
    auto co = clusterOptions();
    co.set("skein.cluster.submitTimeout", "0.1");
    Context c(co);
    c.cluster()->dropNextRequests(2);

    auto stream = c.execute(sumPlan(2, 10, 2));
    EXPECT_EQ(total(collectValues(*stream)), expectedSum(20));
    EXPECT_EQ(stream->metrics().numRetries, 2);

    auto backend = std::dynamic_pointer_cast<ClusterBackend>(c.backend());
    EXPECT_TRUE(waitFor([&]() { return backend->numPendingRequests() == 0; }));
}

TEST_F(ClusterBackendTest, WaitsForCapacity) {
    Context c(clusterOptions());
    auto cluster = c.cluster();

    // no GPU worker runs yet, the tasks wait instead of failing
    auto src = PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(5));
    src->setResources(ResourceRequest(1.0, 1.0));
    auto stream = c.execute(PhysicalPlan(src));

    Timer timer;
    while(timer.time() < 0.1)
        stream->scheduler().step(0.01);
    EXPECT_EQ(stream->status(), ExecutionStatus::RUNNING);
    EXPECT_EQ(stream->metrics().numSubmitted, 0);

    cluster->addWorker("worker.gpu");
    std::vector<int64_t> expected(10);
    std::iota(expected.begin(), expected.end(), 0);
    EXPECT_EQ(collectValues(*stream), expected);
}

TEST_F(ClusterBackendTest, UnsatisfiableOnCluster) {
    Context c(clusterOptions());
    auto src = PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(5));
    // the largest GPU node has a single GPU
    src->setResources(ResourceRequest(1.0, 2.0));
    auto stream = c.execute(PhysicalPlan(src));
    EXPECT_THROW(stream->collect(), ResourceUnsatisfiable);
}

TEST_F(ClusterBackendTest, SingleNodeWithoutDescription) {
    auto co = clusterTestOptions();
    Context c(co);
    ASSERT_NE(c.cluster(), nullptr);
    EXPECT_EQ(c.cluster()->liveWorkers(), std::vector<std::string>({"head-1"}));
    EXPECT_DOUBLE_EQ(c.backend()->advertiseCapacity().cpus, 4.0);

    auto stream = c.execute(sumPlan(3, 10, 2));
    EXPECT_EQ(total(collectValues(*stream)), expectedSum(30));
}
