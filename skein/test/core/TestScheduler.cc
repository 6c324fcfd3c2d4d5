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
#include <ee/local/LocalBackend.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <numeric>

using namespace skein;

class SchedulerTest : public SkeinTest {};

/*!
 * blocks the first attempt of every task until it gets cancelled, later attempts forward their input
 */
class StallFirstAttempt : public IComputeKernel {
public:
    std::string name() const override { return "stall"; }
    std::vector<PartitionPtr> execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) override {
        if(1 == context.attempt) {
            while(!context.cancelled())
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            throw CancellationError("stalled attempt cancelled");
        }
        return {inputs.front()};
    }
};

/*!
 * appends its label to a shared log on every call, forwards its input
 */
class CallLog : public IComputeKernel {
    std::string _label;
    std::shared_ptr<std::vector<std::string>> _log;
    std::shared_ptr<std::mutex> _mutex;
public:
    CallLog(const std::string& label, const std::shared_ptr<std::vector<std::string>>& log,
            const std::shared_ptr<std::mutex>& mutex) : _label(label), _log(log), _mutex(mutex) {}
    std::string name() const override { return _label; }
    std::vector<PartitionPtr> execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) override {
        std::lock_guard<std::mutex> lock(*_mutex);
        _log->push_back(_label);
        return {inputs.front()};
    }
};

/*!
 * forwards its input, holding back the given partition index (or every one) until opened
 */
class Gate : public IComputeKernel {
    size_t _partitionIndex;
    bool _all;
    std::atomic_bool _open;
public:
    explicit Gate(size_t partitionIndex) : _partitionIndex(partitionIndex), _all(false), _open(false) {}
    Gate() : _partitionIndex(0), _all(true), _open(false) {}
    std::string name() const override { return "gate"; }
    std::vector<PartitionPtr> execute(const KernelContext& context, const std::vector<PartitionPtr>& inputs) override {
        if(_all || context.partitionIndex == _partitionIndex) {
            while(!_open) {
                if(context.cancelled())
                    throw CancellationError("gated task cancelled");
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }
        return {inputs.front()};
    }
    void open() { _open = true; }
};

static std::vector<int64_t> iota(int64_t n, int64_t start=0) {
    std::vector<int64_t> v(static_cast<size_t>(n));
    std::iota(v.begin(), v.end(), start);
    return v;
}

static LocalBackend& localBackend(Context& c) {
    auto backend = std::dynamic_pointer_cast<LocalBackend>(c.backend());
    if(!backend)
        throw std::runtime_error("context does not run on the local backend");
    return *backend;
}

TEST_F(SchedulerTest, SumAggregate) {
    Context c(testOptions());
    auto stream = c.execute(sumPlan(4, 25, 4));
    auto v = collectValues(*stream);

    // one sum per reducer
    ASSERT_EQ(v.size(), 4);
    EXPECT_EQ(std::accumulate(v.begin(), v.end(), int64_t(0)), expectedSum(100));
    EXPECT_EQ(stream->status(), ExecutionStatus::SUCCEEDED);

    const auto& m = stream->metrics();
    EXPECT_EQ(m.numTasks, 8);
    EXPECT_EQ(m.numSucceeded, 8);
    EXPECT_EQ(m.numSubmitted, 8);
    EXPECT_EQ(m.numRetries, 0);
    EXPECT_EQ(m.numOutputs, 4);
    EXPECT_EQ(stream->numDelivered(), 4);

    // everything got released once delivered
    EXPECT_EQ(stream->scheduler().partitions().numHeld(), 0);
    EXPECT_EQ(stream->scheduler().numInFlight(), 0);
    EXPECT_FALSE(stream->hasNext());
    EXPECT_THROW(stream->next(), std::out_of_range);
}

TEST_F(SchedulerTest, TransientFailureIsRetried) {
    Context c(testOptions());
    auto expected = collectValues(*c.execute(sumPlan(4, 25, 1)));

    auto faulty = std::make_shared<FaultyKernel>(0, 2, FaultyKernel::Fault::TRANSIENT);
    auto stream = c.execute(sumPlan(4, 25, 1, faulty));
    auto v = collectValues(*stream);

    // same result as without failures
    ASSERT_EQ(v.size(), 1);
    EXPECT_EQ(v, expected);
    EXPECT_EQ(v.front(), expectedSum(100));
    // two failed attempts, one successful
    EXPECT_EQ(faulty->attempts(0), 3);
    EXPECT_EQ(stream->metrics().numRetries, 2);
    EXPECT_EQ(stream->metrics().numFailedAttempts, 2);
    EXPECT_EQ(stream->status(), ExecutionStatus::SUCCEEDED);
}

TEST_F(SchedulerTest, UnblockingTasksGoFirst) {
    auto co = testOptions();
    co.set("skein.maxConcurrentTasks", "1");
    Context c(co);

    auto log = std::make_shared<std::vector<std::string>>();
    auto mutex = std::make_shared<std::mutex>();
    auto logged = [&](const OperatorPtr& parent, const std::string& label) {
        return PhysicalOperator::map(parent, label, std::make_shared<CallLog>(label, log, mutex));
    };

    // a: two map tasks feeding one reducer, b: a single map task feeding its reducer
    auto a = logged(PhysicalOperator::source("a-numbers", 2, std::make_shared<RangeSource>(5)), "a");
    auto b = logged(PhysicalOperator::source("b-numbers", 1, std::make_shared<RangeSource>(5, 10)), "b");
    auto ra = logged(PhysicalOperator::aggregate(a, 1, std::make_shared<HashPartitioner>(), std::make_shared<SumMerge>()), "ra");
    auto rb = logged(PhysicalOperator::aggregate(b, 1, std::make_shared<HashPartitioner>(), std::make_shared<SumMerge>()), "rb");
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::concat({ra, rb})));

    auto v = collectValues(*stream);
    EXPECT_EQ(v, std::vector<int64_t>({45, 60}));
    EXPECT_LE(stream->metrics().maxInFlight, 1);

    // b unblocks its reducer on its own and overtakes the earlier a tasks. The second a task
    // then completes the input of ra, both reducers are ready in stage order afterwards.
    std::lock_guard<std::mutex> lock(*mutex);
    EXPECT_EQ(*log, std::vector<std::string>({"b", "a", "a", "rb", "ra"}));
}

TEST_F(SchedulerTest, ReadyOnceAllInputsAreMaterialized) {
    auto co = testOptions();
    co.set("skein.maxConcurrentTasks", "1");
    Context c(co);

    // second map task and the independent concat branch wait for their gates
    auto mapGate = std::make_shared<Gate>(1);
    auto sideGate = std::make_shared<Gate>();
    auto mapped = PhysicalOperator::map(PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(5)),
                                        "gate", mapGate);
    auto agg = PhysicalOperator::aggregate(mapped, 1, std::make_shared<HashPartitioner>(), std::make_shared<SumMerge>());
    auto side = PhysicalOperator::map(PhysicalOperator::source("side", 1, std::make_shared<RangeSource>(1, 100)),
                                      "side-gate", sideGate);
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::concat({agg, side})));
    auto& scheduler = stream->scheduler();

    const auto& graph = scheduler.graph();
    ASSERT_EQ(graph.numStages(), 2);
    const auto& producers = graph.instance(0).tasks;
    ASSERT_EQ(producers.size(), 2);
    TaskPtr reducer, sideTask;
    for(const auto& t : graph.instance(1).tasks) {
        if(t->inputs.empty())
            sideTask = t;
        else
            reducer = t;
    }
    ASSERT_TRUE(reducer && sideTask);
    auto pending = producers[1]->outputs.front();

    ASSERT_TRUE(waitFor([&]() {
        scheduler.step(0.01);
        return scheduler.taskState(producers[0]->id) == TaskState::SUCCEEDED &&
               scheduler.taskState(producers[1]->id) == TaskState::RUNNING;
    }));
    // one input materialized, the other one is still being produced
    EXPECT_EQ(scheduler.partitions().state(producers[0]->outputs.front()), PartitionState::MATERIALIZED);
    EXPECT_EQ(scheduler.partitions().state(pending), PartitionState::MATERIALIZING);
    EXPECT_EQ(scheduler.taskState(reducer->id), TaskState::PENDING);
    for(int i = 0; i < 5; ++i)
        scheduler.step(0.01);
    EXPECT_EQ(scheduler.taskState(reducer->id), TaskState::PENDING);

    mapGate->open();
    ASSERT_TRUE(waitFor([&]() {
        scheduler.step(0.01);
        return scheduler.taskState(producers[1]->id) == TaskState::SUCCEEDED;
    }));
    EXPECT_EQ(scheduler.partitions().state(pending), PartitionState::MATERIALIZED);
    // the side task took the only slot, the reducer waits as ready
    EXPECT_EQ(scheduler.taskState(reducer->id), TaskState::READY);
    EXPECT_NE(scheduler.taskState(sideTask->id), TaskState::READY);

    sideGate->open();
    auto v = collectValues(*stream);
    ASSERT_EQ(v.size(), 2);
    EXPECT_EQ(v.front(), 45);
}

TEST_F(SchedulerTest, TerminalFailureAbortsExecution) {
    Context c(testOptions());
    auto faulty = std::make_shared<FaultyKernel>(1, 1, FaultyKernel::Fault::TERMINAL);
    auto src = PhysicalOperator::source("numbers", 4, std::make_shared<RangeSource>(10));
    auto mapped = PhysicalOperator::map(src, "faulty", faulty);
    auto agg = PhysicalOperator::aggregate(mapped, 2, std::make_shared<HashPartitioner>(),
                                           std::make_shared<SumMerge>());
    auto stream = c.execute(PhysicalPlan(agg));

    size_t numErrors = 0;
    try {
        stream->hasNext();
    } catch(const TaskTerminalError& e) {
        numErrors++;
        EXPECT_EQ(e.stageID(), 0);
        EXPECT_EQ(e.context().partitionIndex, 1);
        ASSERT_EQ(e.retryHistory().size(), 1);
        EXPECT_EQ(e.retryHistory().front().kind, FailureKind::TERMINAL);
        EXPECT_NE(std::find(e.context().operators.begin(), e.context().operators.end(), "faulty"),
                  e.context().operators.end());
        EXPECT_NE(std::string(e.what()).find("injected fault"), std::string::npos);
    }
    EXPECT_EQ(numErrors, 1);

    // reported once, then the stream ends
    EXPECT_FALSE(stream->hasNext());
    EXPECT_EQ(stream->status(), ExecutionStatus::FAILED);

    // compute errors are not retried, nothing downstream ran
    EXPECT_EQ(faulty->attempts(1), 1);
    const auto& scheduler = stream->scheduler();
    for(const auto& task : scheduler.graph().instance(1).tasks)
        EXPECT_NE(scheduler.taskState(task->id), TaskState::SUCCEEDED);
    EXPECT_EQ(scheduler.numInFlight(), 0);
    EXPECT_EQ(scheduler.partitions().numHeld(), 0);
}

TEST_F(SchedulerTest, RetriesAreBounded) {
    auto co = testOptions();
    co.set("skein.maxTaskRetries", "2");
    Context c(co);
    auto faulty = std::make_shared<FaultyKernel>(0, 100, FaultyKernel::Fault::TRANSIENT);
    auto src = PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(10));
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::map(src, "faulty", faulty)));

    try {
        stream->collect();
        FAIL()<<"execution should have failed";
    } catch(const TaskTerminalError& e) {
        EXPECT_EQ(e.retryHistory().size(), 3);
        for(const auto& f : e.retryHistory())
            EXPECT_EQ(f.kind, FailureKind::TRANSIENT);
    }
    EXPECT_EQ(faulty->attempts(0), 3);
    EXPECT_EQ(stream->metrics().numRetries, 2);
}

TEST_F(SchedulerTest, CancelStopsEverything) {
    Context c(testOptions());
    auto slow = std::make_shared<SlowKernel>(30.0);
    auto src = PhysicalOperator::source("sleepy", 10, slow);
    auto stream = c.execute(PhysicalPlan(src));

    auto& scheduler = stream->scheduler();
    ASSERT_TRUE(waitFor([&]() {
        scheduler.step(0.01);
        return slow->running() >= 4;
    }));
    // capacity of 4 CPUs bounds what runs at once
    EXPECT_EQ(scheduler.numInFlight(), 4);

    Timer timer;
    stream->cancel();
    EXPECT_LT(timer.time(), 2.5);
    EXPECT_EQ(stream->status(), ExecutionStatus::CANCELLED);
    EXPECT_EQ(scheduler.countTasks(TaskState::RUNNING), 0);
    EXPECT_EQ(scheduler.countTasks(TaskState::SUBMITTED), 0);
    EXPECT_EQ(scheduler.countTasks(TaskState::READY), 0);
    EXPECT_EQ(scheduler.countTasks(TaskState::CANCELLED), 10);
    EXPECT_EQ(localBackend(c).numRunningTasks(), 0);
    EXPECT_EQ(scheduler.partitions().numHeld(), 0);
    EXPECT_EQ(slow->cancelled(), 4);

    EXPECT_THROW(stream->hasNext(), CancellationError);
    EXPECT_FALSE(stream->hasNext());
}

TEST_F(SchedulerTest, RequestCancelFromOtherThread) {
    Context c(testOptions());
    auto slow = std::make_shared<SlowKernel>(30.0);
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::source("sleepy", 6, slow)));

    std::thread canceller([&]() {
        waitFor([&]() { return slow->running() > 0; });
        stream->requestCancel();
    });
    EXPECT_THROW(stream->collect(), CancellationError);
    canceller.join();
    EXPECT_EQ(stream->status(), ExecutionStatus::CANCELLED);
    EXPECT_EQ(localBackend(c).numRunningTasks(), 0);
}

TEST_F(SchedulerTest, ExecuteGraphAgain) {
    Context c(testOptions());
    auto graph = c.translate(sumPlan(3, 10, 2));

    auto first = c.execute(graph);
    auto a = collectValues(*first);

    // a cancelled execution does not affect the next one
    auto cancelled = c.execute(graph);
    cancelled->cancel();
    EXPECT_THROW(cancelled->collect(), CancellationError);

    auto second = c.execute(graph);
    auto b = collectValues(*second);
    EXPECT_EQ(a, b);
    EXPECT_EQ(std::accumulate(b.begin(), b.end(), int64_t(0)), expectedSum(30));
}

TEST_F(SchedulerTest, MaxConcurrentTasks) {
    auto co = testOptions();
    co.set("skein.maxConcurrentTasks", "2");
    Context c(co);
    auto slow = std::make_shared<SlowKernel>(0.02);
    auto src = PhysicalOperator::source("numbers", 8, std::make_shared<RangeSource>(4));
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::map(src, "slow", slow)));

    auto v = collectValues(*stream);
    EXPECT_EQ(v, iota(32));
    EXPECT_LE(slow->maxRunning(), 2);
    EXPECT_LE(stream->metrics().maxInFlight, 2);
    EXPECT_EQ(slow->started(), 8);
}

TEST_F(SchedulerTest, CapacityBoundsInFlightTasks) {
    auto co = testOptions();
    co.set("skein.executorCount", "2");
    Context c(co);
    auto slow = std::make_shared<SlowKernel>(0.02);
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::source("sleepy", 8, slow)));

    EXPECT_EQ(collectValues(*stream), iota(8));
    EXPECT_LE(stream->metrics().maxInFlight, 2);
}

TEST_F(SchedulerTest, OrderedOutput) {
    Context c(testOptions());
    auto delay = std::make_shared<MapKernel>("delay", [](int64_t x) {
        // first partition finishes last
        if(0 == x)
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return x;
    });
    auto src = PhysicalOperator::source("numbers", 8, std::make_shared<RangeSource>(3));
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::map(src, "delay", delay)));
    EXPECT_TRUE(stream->scheduler().ordered());
    EXPECT_EQ(collectValues(*stream), iota(24));
}

TEST_F(SchedulerTest, UnorderedOutput) {
    auto co = testOptions();
    co.set("skein.orderedOutput", "false");
    Context c(co);
    auto delay = std::make_shared<MapKernel>("delay", [](int64_t x) {
        if(0 == x)
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return x;
    });
    auto src = PhysicalOperator::source("numbers", 8, std::make_shared<RangeSource>(3));
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::map(src, "delay", delay)));
    EXPECT_FALSE(stream->scheduler().ordered());

    // completion order, the slow first partition does not hold back the others
    ASSERT_TRUE(stream->hasNext());
    EXPECT_NE(values(stream->next()).front(), 0);

    auto v = collectValues(*stream);
    EXPECT_EQ(v.size(), 21);
    EXPECT_EQ(stream->numDelivered(), 8);
}

TEST_F(SchedulerTest, Sort) {
    Context c(testOptions());
    // a permutation of [0, 40)
    auto shuffle = std::make_shared<MapKernel>("shuffle", [](int64_t x) { return (x * 7) % 40; });
    auto src = PhysicalOperator::source("numbers", 4, std::make_shared<RangeSource>(10));
    auto mapped = PhysicalOperator::map(src, "shuffle", shuffle);
    auto sorted = PhysicalOperator::sort(mapped, 4, std::make_shared<RangePartitioner>(39),
                                         std::make_shared<SortMerge>());
    auto stream = c.execute(PhysicalPlan(sorted));
    EXPECT_EQ(collectValues(*stream), iota(40));
}

TEST_F(SchedulerTest, Join) {
    Context c(testOptions());
    auto left = PhysicalOperator::source("left", 2, std::make_shared<RangeSource>(10));
    auto right = PhysicalOperator::source("right", 3, std::make_shared<RangeSource>(10, 10));
    auto joined = PhysicalOperator::join(left, right, 4, std::make_shared<HashPartitioner>(),
                                         std::make_shared<HashPartitioner>(), std::make_shared<JoinProbe>());
    auto stream = c.execute(PhysicalPlan(joined));
    auto v = collectValues(*stream);
    std::sort(v.begin(), v.end());
    EXPECT_EQ(v, iota(10, 10));
}

TEST_F(SchedulerTest, AdaptivePartitioning) {
    auto co = testOptions();
    co.set("skein.adaptive.enable", "true");
    co.set("skein.adaptive.maxPartitions", "8");
    co.set("skein.adaptive.targetPartitionSize", "1KB");
    Context c(co);

    auto stream = c.execute(sumPlan(4, 10, AUTO_PARTITIONS));
    auto v = collectValues(*stream);
    // all buckets together are smaller than the target size
    ASSERT_EQ(v.size(), 1);
    EXPECT_EQ(v.front(), expectedSum(40));
    EXPECT_EQ(stream->metrics().numRuntimeStages, 1);
    EXPECT_EQ(stream->metrics().numTasks, 5);
    EXPECT_EQ(stream->scheduler().partitions().numHeld(), 0);
}

TEST_F(SchedulerTest, TaskTimeout) {
    auto co = testOptions();
    co.set("skein.taskTimeout", "0.1");
    Context c(co);
    auto src = PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(5));
    auto stream = c.execute(PhysicalPlan(PhysicalOperator::map(src, "stall", std::make_shared<StallFirstAttempt>())));

    EXPECT_EQ(collectValues(*stream), iota(10));
    EXPECT_EQ(stream->metrics().numTimeouts, 2);
    EXPECT_EQ(stream->metrics().numRetries, 2);
}

TEST_F(SchedulerTest, UnsatisfiableRequest) {
    Context c(testOptions());
    auto src = PhysicalOperator::source("numbers", 2, std::make_shared<RangeSource>(5));
    src->setResources(ResourceRequest(64.0));
    auto stream = c.execute(PhysicalPlan(src));

    try {
        stream->hasNext();
        FAIL()<<"request for 64 CPUs should not be satisfiable";
    } catch(const ResourceUnsatisfiable& e) {
        EXPECT_NE(e.taskID(), INVALID_TASK);
    }
    EXPECT_EQ(stream->status(), ExecutionStatus::FAILED);
    // nothing was submitted
    EXPECT_EQ(stream->metrics().numSubmitted, 0);
}

TEST_F(SchedulerTest, MetricsJSON) {
    Context c(testOptions());
    auto stream = c.execute(sumPlan(2, 10, 2));
    stream->collect();

    auto j = stream->metrics().getJSON();
    EXPECT_EQ(j["numTasks"].get<size_t>(), 4);
    EXPECT_EQ(j["numSucceeded"].get<size_t>(), 4);
    EXPECT_EQ(j["numOutputs"].get<size_t>(), 2);
    ASSERT_EQ(j["stages"].size(), 2);
    EXPECT_EQ(j["stages"][0]["numSucceeded"].get<size_t>(), 2);
    EXPECT_GE(j["wallTime"].get<double>(), 0.0);
    EXPECT_NE(stream->metrics().summary().find("4 tasks of 4 succeeded"), std::string::npos);
}
