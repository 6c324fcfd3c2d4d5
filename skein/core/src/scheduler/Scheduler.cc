//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <scheduler/Scheduler.h>
#include <physical/PlanTranslator.h>
#include <Signals.h>
#include <StringUtils.h>
#include <algorithm>
#include <sstream>

namespace skein {

    std::string executionStatusToString(ExecutionStatus status) {
        switch(status) {
            case ExecutionStatus::RUNNING:
                return "running";
            case ExecutionStatus::SUCCEEDED:
                return "succeeded";
            case ExecutionStatus::FAILED:
                return "failed";
            case ExecutionStatus::CANCELLED:
                return "cancelled";
            default:
                return "unknown";
        }
    }

    static double secondsBetween(Scheduler::clock::time_point a, Scheduler::clock::time_point b) {
        return std::chrono::duration<double>(b - a).count();
    }

    static Scheduler::clock::duration toDuration(double seconds) {
        return std::chrono::duration_cast<Scheduler::clock::duration>(std::chrono::duration<double>(seconds));
    }

    Scheduler::Scheduler(const ContextOptions &options, const std::shared_ptr<IBackend> &backend,
                         const std::shared_ptr<const StageGraph> &graph) : _options(options), _backend(backend),
                         _graph(graph), _retryPolicy(options), _maxConcurrentTasks(options.MAX_CONCURRENT_TASKS()),
                         _taskTimeout(options.TASK_TIMEOUT()), _pollInterval(options.SCHEDULER_POLL_INTERVAL()),
                         _recomputeDepthLimit(options.RECOMPUTE_DEPTH_LIMIT()), _ordered(options.ORDERED_OUTPUT()),
                         _handleSignals(options.HANDLE_SIGNALS()), _channel(std::make_shared<EventChannel>()),
                         _budget(ResourceSummary()), _readyCounter(0), _nextRoot(0), _status(ExecutionStatus::RUNNING),
                         _errorReported(false), _started(false) {
        if(!_backend)
            throw SkeinException("scheduler requires a backend");
        if(!_graph)
            throw SkeinException("scheduler requires a stage graph");

        // an unordered final operator defines no order to preserve
        _ordered = _ordered && _graph->ordered();
        _ids = _graph->runtimeIDs();
        _budget.resize(_backend->advertiseCapacity());
        _workerClasses = _backend->workerClasses();
        if(_pollInterval <= 0.0)
            _pollInterval = 0.05;

        _taskListener = std::make_shared<ChannelTaskListener>(_channel);
        _backendListener = std::make_shared<ChannelBackendListener>(_channel);
        _backend->subscribe(_backendListener);
    }

    Scheduler::~Scheduler() {
        if(_started && !finished()) {
            try {
                cancel();
            } catch(const std::exception& e) {
                logger().error(std::string("failed to cancel execution on destruction: ") + e.what());
            }
        }
        _backend->unsubscribe(_backendListener.get());
    }

    void Scheduler::start() {
        _started = true;
        _startTime = clock::now();

        for(const auto& kv : _graph->instances())
            addInstance(kv.first, kv.second);

        std::stringstream ss;
        ss<<"executing "<<pluralize(_graph->numStages(), "stage")<<" ("<<pluralize(_runs.size(), "task");
        if(_graph->hasDeferredStages())
            ss<<", deferred stages instantiated at runtime";
        ss<<") on "<<_backend->name()<<" backend with capacity "<<_budget.capacity().toString();
        logger().info(ss.str());
    }

    void Scheduler::addInstance(StageID id, const StageInstance &instance) {
        _instances[id] = instance;

        for(const auto& task : instance.tasks) {
            TaskRun run;
            run.task = task;
            for(size_t i = 0; i < task->outputs.size(); ++i)
                _store.add(task->outputs[i], task->id, i);
            for(auto in : task->inputs) {
                _store.addConsumer(in);
                _consumersOf[in].push_back(task->id);
                if(!_store.get(in).materialized())
                    run.unmaterialized++;
            }
            auto& r = _runs[task->id] = run;
            if(0 == r.unmaterialized)
                makeReady(r);
        }
        _metrics.addStageTasks(id, instance.tasks.size());

        // stream markers keep root partitions alive until they are delivered
        if(id == _graph->rootStage()) {
            _rootOutputs = instance.outputs;
            for(auto pid : _rootOutputs)
                _store.pin(pid);
        }

        pinForDeferredSuccessors(id);
    }

    void Scheduler::pinForDeferredSuccessors(StageID id) {
        for(auto succ : _graph->successors(id)) {
            if(_instances.find(succ) != _instances.end() || !_graph->stage(succ).deferred)
                continue;
            for(auto pid : _instances.at(id).outputs) {
                _store.pin(pid);
                _pinnedFor[succ].push_back(pid);
            }
        }
    }

    bool Scheduler::readyToInstantiate(const Stage &stage) const {
        for(auto p : stage.predecessors)
            if(_instances.find(p) == _instances.end())
                return false;

        // adaptive partition counts need the sizes of all producer buckets
        if(stage.adaptive()) {
            for(auto p : stage.predecessors)
                for(auto pid : _instances.at(p).outputs)
                    if(!_store.get(pid).materialized())
                        return false;
        }
        return true;
    }

    void Scheduler::instantiateDeferred() {
        for(const auto& stage : _graph->stages()) {
            if(finished())
                return;
            if(!stage.deferred || _instances.find(stage.id) != _instances.end() || !readyToInstantiate(stage))
                continue;

            auto bytesOf = [this](PartitionID pid) -> option<size_t> {
                if(!_store.contains(pid))
                    return option<size_t>::none;
                return _store.get(pid).numBytes;
            };

            StageInstance instance;
            try {
                instance = PlanTranslator::instantiateStage(stage, _instances, _graph->settings(), bytesOf, _ids);
            } catch(const std::exception& e) {
                abort(std::current_exception(), "failed to instantiate " + stage.name() + ": " + e.what());
                return;
            }

            addInstance(stage.id, instance);
            _metrics.numRuntimeStages++;
            logger().info("instantiated " + stage.name() + " with " + pluralize(instance.tasks.size(), "task"));

            auto it = _pinnedFor.find(stage.id);
            if(it != _pinnedFor.end()) {
                for(auto pid : it->second)
                    _store.unpin(pid);
                _pinnedFor.erase(it);
            }
        }
    }

    void Scheduler::makeReady(TaskRun &run, double delay) {
        run.state = TaskState::READY;
        run.readySeq = ++_readyCounter;
        run.notBefore = clock::now() + toDuration(delay);
        _ready[run.task->stage].push_back(run.task->id);
    }

    void Scheduler::removeFromReady(const TaskRun &run) {
        auto it = _ready.find(run.task->stage);
        if(it == _ready.end())
            return;
        auto& queue = it->second;
        queue.erase(std::remove(queue.begin(), queue.end(), run.task->id), queue.end());
        if(queue.empty())
            _ready.erase(it);
    }

    size_t Scheduler::unblockScore(const TaskRun &run) const {
        // pending consumers whose only missing inputs are produced by this task
        size_t score = 0;
        std::set<TaskID> visited;
        for(auto out : run.task->outputs) {
            auto it = _consumersOf.find(out);
            if(it == _consumersOf.end())
                continue;
            for(auto c : it->second) {
                if(!visited.insert(c).second)
                    continue;
                const auto& consumer = _runs.at(c);
                if(consumer.state != TaskState::PENDING)
                    continue;
                size_t missing = 0;
                for(auto in : consumer.task->inputs) {
                    const auto& ref = _store.get(in);
                    if(ref.producer == run.task->id && !ref.materialized())
                        missing++;
                }
                if(missing == consumer.unmaterialized)
                    score++;
            }
        }
        return score;
    }

    void Scheduler::schedule() {
        auto now = clock::now();
        while(!finished()) {
            if(_maxConcurrentTasks > 0 && _inFlight.size() >= _maxConcurrentTasks)
                break;

            // FIFO within a stage, across stages the task unblocking most consumers first
            TaskRun* best = nullptr;
            size_t bestScore = 0;
            for(const auto& kv : _ready) {
                for(auto id : kv.second) {
                    auto& run = _runs.at(id);
                    if(run.notBefore > now)
                        continue;
                    auto score = unblockScore(run);
                    if(!best || score > bestScore || (score == bestScore && run.readySeq < best->readySeq)) {
                        best = &run;
                        bestScore = score;
                    }
                    break;
                }
            }
            if(!best)
                break;

            const auto& request = best->task->resources;
            if(!isSatisfiable(request, _workerClasses)) {
                auto msg = "task " + std::to_string(best->task->id) + " requests " + request.toString() +
                           ", which no worker class of the " + _backend->name() + " backend offers";
                abort(std::make_exception_ptr(ResourceUnsatisfiable(msg, best->task->id)), msg);
                return;
            }

            // backpressure, the task waits for resources to be released
            if(!_budget.tryAcquire(request))
                break;

            submit(*best);
        }
    }

    void Scheduler::submit(TaskRun &run) {
        const auto& task = run.task;
        removeFromReady(run);
        run.attempt++;
        run.state = TaskState::SUBMITTED;
        run.submittedAt = clock::now();
        _inFlight[task->id] = run.attempt;
        _metrics.numSubmitted++;
        _metrics.maxInFlight = std::max(_metrics.maxInFlight, _inFlight.size());

        TaskSubmission submission;
        submission.task = task;
        submission.attempt = run.attempt;
        submission.timeout = _taskTimeout;
        for(auto in : task->inputs)
            submission.inputs.push_back(_store.get(in));
        for(auto out : task->outputs)
            _store.markMaterializing(out);

        logger().debug("submit " + task->description() + " (attempt " + std::to_string(run.attempt) + ")");
        try {
            _backend->submit(submission, _taskListener);
        } catch(const std::exception& e) {
            _taskListener->onFailure(TaskFailure(task->id, run.attempt, FailureKind::TERMINAL,
                                                 std::string("backend rejected submission: ") + e.what()));
        }
    }

    void Scheduler::settle(TaskID id) {
        _inFlight.erase(id);
        _budget.release(_runs.at(id).task->resources);
    }

    bool Scheduler::isStale(const SchedulerEvent &event) const {
        auto it = _inFlight.find(event.taskID);
        return it == _inFlight.end() || it->second != event.attempt;
    }

    bool Scheduler::isRoot(PartitionID id) const {
        return std::find(_rootOutputs.begin(), _rootOutputs.end(), id) != _rootOutputs.end();
    }

    void Scheduler::process(const SchedulerEvent &event) {
        switch(event.type) {
            case SchedulerEventType::TASK_STARTED:
                onTaskStarted(event);
                break;
            case SchedulerEventType::TASK_SUCCEEDED:
                onTaskSucceeded(event);
                break;
            case SchedulerEventType::TASK_FAILED:
                onTaskFailed(event);
                break;
            case SchedulerEventType::CAPACITY_CHANGED:
                logger().info("backend capacity changed to " + event.capacity.toString());
                _budget.resize(event.capacity);
                _workerClasses = _backend->workerClasses();
                break;
            case SchedulerEventType::WORKER_LOST:
                onWorkerLost(event);
                break;
            case SchedulerEventType::CANCEL:
                cancel();
                break;
        }
    }

    void Scheduler::onTaskStarted(const SchedulerEvent &event) {
        if(isStale(event))
            return;
        auto& run = _runs.at(event.taskID);
        if(run.state == TaskState::SUBMITTED)
            run.state = TaskState::RUNNING;
    }

    void Scheduler::onTaskSucceeded(const SchedulerEvent &event) {
        if(isStale(event)) {
            discardResult(event.result);
            return;
        }

        auto& run = _runs.at(event.taskID);
        const auto& task = run.task;
        settle(task->id);

        if(event.result.outputs.size() != task->outputs.size()) {
            run.state = TaskState::FAILED;
            terminalFailure(run, "backend returned " + pluralize(event.result.outputs.size(), "output") +
                                 ", expected " + std::to_string(task->outputs.size()));
            return;
        }

        run.state = TaskState::SUCCEEDED;
        _metrics.taskSucceeded(task->stage, event.result.runtime);

        std::vector<PartitionRef> duplicates;
        for(const auto& mp : event.result.outputs) {
            if(_store.markMaterialized(mp)) {
                partitionMaterialized(mp.id);
            } else if(!mp.location.empty() && mp.location != _store.get(mp.id).location) {
                // rematerialized a partition which is still available elsewhere
                PartitionRef ref(mp.id, task->id, 0);
                ref.location = mp.location;
                duplicates.push_back(ref);
            }
        }
        if(!duplicates.empty())
            _backend->release(duplicates);

        for(auto in : task->inputs)
            _store.releaseConsumer(in);
    }

    void Scheduler::discardResult(const TaskResult &result) {
        std::vector<PartitionRef> refs;
        for(const auto& mp : result.outputs) {
            if(mp.location.empty())
                continue;
            if(_store.contains(mp.id) && _store.get(mp.id).materialized() && _store.get(mp.id).location == mp.location)
                continue;
            PartitionRef ref(mp.id, result.taskID, 0);
            ref.location = mp.location;
            refs.push_back(ref);
        }
        if(!refs.empty())
            _backend->release(refs);
    }

    void Scheduler::onTaskFailed(const SchedulerEvent &event) {
        if(isStale(event))
            return;

        auto& run = _runs.at(event.taskID);
        settle(event.taskID);
        const auto& failure = event.failure;
        run.history.push_back(failure);
        _metrics.numFailedAttempts++;

        switch(failure.kind) {
            case FailureKind::TRANSIENT:
            case FailureKind::TIMEOUT:
            case FailureKind::CANCELLED: // not requested by the scheduler, e.g. dropped by the backend
                retryOrAbort(run, failure);
                break;
            case FailureKind::INPUT_LOST: {
                if(failure.lostInputs.empty() || !_retryPolicy.canRetry(run.retries)) {
                    retryOrAbort(run, failure);
                    break;
                }
                run.retries++;
                _metrics.numRetries++;
                logger().warn(failure.toString() + ", rematerializing " + pluralize(failure.lostInputs.size(), "input"));

                run.state = TaskState::PENDING;
                for(auto pid : failure.lostInputs)
                    if(_store.contains(pid) && _store.markLost(pid))
                        partitionLost(pid);
                if(finished())
                    return;

                run.unmaterialized = 0;
                for(auto in : run.task->inputs)
                    if(!_store.get(in).materialized())
                        run.unmaterialized++;
                if(0 == run.unmaterialized)
                    makeReady(run);
                break;
            }
            case FailureKind::UNSATISFIABLE: {
                run.state = TaskState::FAILED;
                abort(std::make_exception_ptr(ResourceUnsatisfiable(failure.message, run.task->id)), failure.message);
                break;
            }
            default:
                run.state = TaskState::FAILED;
                terminalFailure(run, failure.message);
                break;
        }
    }

    void Scheduler::retryOrAbort(TaskRun &run, const TaskFailure &failure) {
        if(!_retryPolicy.canRetry(run.retries)) {
            run.state = TaskState::FAILED;
            terminalFailure(run, "giving up after " + pluralize(run.history.size(), "failed attempt") + ", last: " +
                                 failure.toString());
            return;
        }

        run.retries++;
        _metrics.numRetries++;
        auto delay = _retryPolicy.backoff(run.retries);
        std::stringstream ss;
        ss<<failure.toString()<<", retry "<<run.retries<<"/"<<_retryPolicy.maxRetries()<<" in "<<delay<<"s";
        logger().warn(ss.str());

        // inputs lost while the attempt ran have to be rematerialized first
        run.unmaterialized = 0;
        for(auto in : run.task->inputs)
            if(!_store.get(in).materialized())
                run.unmaterialized++;
        if(0 == run.unmaterialized)
            makeReady(run, delay);
        else
            run.state = TaskState::PENDING;
    }

    void Scheduler::onWorkerLost(const SchedulerEvent &event) {
        std::set<PartitionID> ids(event.partitions.begin(), event.partitions.end());
        for(auto pid : _store.onLocation(event.worker))
            ids.insert(pid);

        logger().warn("worker " + event.worker + " lost, " + pluralize(ids.size(), "partition") + " affected");
        for(auto pid : ids) {
            if(finished())
                return;
            if(_store.contains(pid) && _store.markLost(pid))
                partitionLost(pid);
        }
    }

    void Scheduler::checkTimeouts() {
        if(_taskTimeout <= 0.0)
            return;

        auto now = clock::now();
        std::vector<TaskID> expired;
        for(const auto& kv : _inFlight)
            if(secondsBetween(_runs.at(kv.first).submittedAt, now) > _taskTimeout)
                expired.push_back(kv.first);

        for(auto id : expired) {
            if(finished())
                return;
            auto& run = _runs.at(id);
            std::stringstream ss;
            ss<<"exceeded timeout of "<<_taskTimeout<<"s";
            TaskFailure failure(id, run.attempt, FailureKind::TIMEOUT, ss.str());
            _backend->cancel(id);
            settle(id);
            run.history.push_back(failure);
            _metrics.numFailedAttempts++;
            _metrics.numTimeouts++;
            retryOrAbort(run, failure);
        }
    }

    void Scheduler::partitionMaterialized(PartitionID id) {
        auto it = _consumersOf.find(id);
        if(it != _consumersOf.end()) {
            for(auto c : it->second) {
                auto& consumer = _runs.at(c);
                if(consumer.state != TaskState::PENDING || 0 == consumer.unmaterialized)
                    continue;
                if(0 == --consumer.unmaterialized)
                    makeReady(consumer);
            }
        }

        if(!_ordered && isRoot(id) && _delivered.find(id) == _delivered.end())
            _completedRoots.push_back(id);
    }

    void Scheduler::partitionLost(PartitionID id) {
        _metrics.numLostPartitions++;

        auto it = _consumersOf.find(id);
        if(it != _consumersOf.end()) {
            for(auto c : it->second) {
                auto& consumer = _runs.at(c);
                if(consumer.state == TaskState::PENDING) {
                    consumer.unmaterialized++;
                } else if(consumer.state == TaskState::READY) {
                    removeFromReady(consumer);
                    consumer.state = TaskState::PENDING;
                    consumer.unmaterialized = 1;
                }
            }
        }

        if(!_ordered)
            _completedRoots.erase(std::remove(_completedRoots.begin(), _completedRoots.end(), id), _completedRoots.end());

        if(_store.needed(id))
            recompute(_store.get(id).producer, 1);
    }

    void Scheduler::recompute(TaskID producer, size_t depth) {
        auto& run = _runs.at(producer);
        // a producer which did not finish (again) yet writes all of its outputs anyway
        if(run.state != TaskState::SUCCEEDED)
            return;

        if(depth > _recomputeDepthLimit) {
            run.state = TaskState::FAILED;
            terminalFailure(run, "rematerializing lost partitions requires a recompute chain deeper than " +
                                 std::to_string(_recomputeDepthLimit));
            return;
        }

        _metrics.numRecomputed++;
        logger().warn("recomputing " + run.task->description() + " (depth " + std::to_string(depth) + ")");

        run.state = TaskState::PENDING;
        run.recomputeDepth = depth;
        for(auto out : run.task->outputs) {
            auto state = _store.state(out);
            if(state == PartitionState::LOST || state == PartitionState::RELEASED)
                _store.markPending(out);
        }

        run.unmaterialized = 0;
        for(auto in : run.task->inputs) {
            _store.addConsumer(in);
            auto state = _store.state(in);
            if(state == PartitionState::MATERIALIZED)
                continue;
            run.unmaterialized++;
            // evicted or lost inputs have to be rematerialized first
            if(state == PartitionState::LOST || state == PartitionState::RELEASED) {
                _store.markPending(in);
                recompute(_store.get(in).producer, depth + 1);
                if(finished())
                    return;
            }
        }
        if(0 == run.unmaterialized)
            makeReady(run);
    }

    void Scheduler::collectGarbage() {
        releasePartitions(_store.collectGarbage());
    }

    void Scheduler::releasePartitions(const std::vector<PartitionID> &ids) {
        std::vector<PartitionRef> refs;
        for(auto id : ids)
            refs.push_back(_store.get(id));
        if(!refs.empty())
            _backend->release(refs);
    }

    void Scheduler::terminalFailure(const TaskRun &run, const std::string &message) {
        TaskFailureContext context;
        context.taskID = run.task->id;
        context.stageID = run.task->stage;
        context.partitionIndex = run.task->partitionIndex;
        context.operators = run.task->operatorNames;
        context.history = run.history;
        TaskTerminalError err(message, context);
        abort(std::make_exception_ptr(err), err.what());
    }

    void Scheduler::abort(std::exception_ptr error, const std::string &reason) {
        if(finished())
            return;
        _error = error;
        logger().error("execution failed: " + reason);
        teardown(ExecutionStatus::FAILED);
    }

    void Scheduler::cancel() {
        if(finished())
            return;
        if(!_started) {
            _started = true;
            _startTime = clock::now();
        }
        _error = std::make_exception_ptr(CancellationError());
        logger().info("cancelling execution");
        teardown(ExecutionStatus::CANCELLED);
    }

    void Scheduler::requestCancel() {
        _channel->push(SchedulerEvent(SchedulerEventType::CANCEL));
    }

    void Scheduler::teardown(ExecutionStatus status) {
        _status = status;

        for(auto& kv : _runs) {
            auto& run = kv.second;
            if(run.state == TaskState::SUCCEEDED || run.state == TaskState::FAILED || run.state == TaskState::CANCELLED)
                continue;
            run.state = TaskState::CANCELLED;
            _metrics.numCancelledTasks++;
        }
        _ready.clear();

        for(const auto& kv : _inFlight)
            _backend->cancel(kv.first);

        // give in-flight tasks the grace period to stop
        auto deadline = clock::now() + toDuration(_options.CANCEL_GRACE_PERIOD());
        while(!_inFlight.empty() && clock::now() < deadline) {
            SchedulerEvent event;
            auto left = secondsBetween(clock::now(), deadline);
            if(!_channel->pop(event, std::max(0.001, std::min(left, _pollInterval))))
                continue;
            if(event.type != SchedulerEventType::TASK_SUCCEEDED && event.type != SchedulerEventType::TASK_FAILED)
                continue;
            if(isStale(event))
                continue;
            if(event.type == SchedulerEventType::TASK_SUCCEEDED)
                discardResult(event.result);
            settle(event.taskID);
        }
        if(!_inFlight.empty())
            logger().warn(pluralize(_inFlight.size(), "task") + " did not stop within the grace period");
        _inFlight.clear();

        releasePartitions(_store.releaseAll());
        _pinnedFor.clear();
        _completedRoots.clear();

        _metrics.wallTime = secondsBetween(_startTime, clock::now());
        logger().info("execution " + executionStatusToString(status) + ": " + _metrics.summary());
    }

    bool Scheduler::rootComplete() const {
        if(_instances.find(_graph->rootStage()) == _instances.end())
            return false;
        return _delivered.size() == _rootOutputs.size();
    }

    bool Scheduler::stalled() const {
        if(!_inFlight.empty() || !_ready.empty() || _channel->sizeApprox() > 0)
            return false;
        if(_instances.find(_graph->rootStage()) == _instances.end())
            return true;
        for(auto pid : _rootOutputs)
            if(_delivered.find(pid) == _delivered.end() && !_store.get(pid).materialized())
                return true;
        return false;
    }

    void Scheduler::finish() {
        _status = ExecutionStatus::SUCCEEDED;
        for(const auto& kv : _inFlight)
            _backend->cancel(kv.first);
        _inFlight.clear();
        collectGarbage();
        _metrics.wallTime = secondsBetween(_startTime, clock::now());
        logger().info("execution succeeded: " + _metrics.summary());
    }

    double Scheduler::waitTime(double timeout) const {
        auto now = clock::now();
        double wait = timeout;
        for(const auto& kv : _ready) {
            for(auto id : kv.second) {
                const auto& run = _runs.at(id);
                if(run.notBefore > now)
                    wait = std::min(wait, secondsBetween(now, run.notBefore));
            }
        }
        if(_taskTimeout > 0.0)
            wait = std::min(wait, _pollInterval);
        return std::max(wait, 0.001);
    }

    void Scheduler::maintain() {
        if(finished())
            return;
        checkTimeouts();
        if(finished())
            return;
        instantiateDeferred();
        if(finished())
            return;
        schedule();
        if(finished())
            return;
        collectGarbage();

        if(stalled())
            abort(std::make_exception_ptr(SkeinException("execution stalled, no task can make progress")),
                  "no runnable or running task left before all results were produced");
    }

    bool Scheduler::step(double timeout) {
        if(!_started)
            start();
        if(finished())
            return false;

        if(_handleSignals && check_interrupted()) {
            reset_signals();
            logger().warn("interrupted, cancelling execution");
            cancel();
            return false;
        }

        maintain();
        if(finished())
            return false;

        SchedulerEvent event;
        if(_channel->pop(event, waitTime(timeout))) {
            process(event);
            while(!finished() && _channel->pop(event))
                process(event);
            maintain();
        }
        return !finished();
    }

    bool Scheduler::nextDeliverable(PartitionID &id) {
        if(_ordered) {
            if(_nextRoot < _rootOutputs.size() && _store.get(_rootOutputs[_nextRoot]).materialized()) {
                id = _rootOutputs[_nextRoot];
                return true;
            }
            return false;
        }

        while(!_completedRoots.empty()) {
            auto front = _completedRoots.front();
            if(_delivered.find(front) != _delivered.end() || !_store.get(front).materialized()) {
                _completedRoots.pop_front();
                continue;
            }
            id = front;
            return true;
        }
        return false;
    }

    PartitionPtr Scheduler::nextOutput() {
        if(!_started)
            start();

        while(true) {
            if(_status == ExecutionStatus::FAILED || _status == ExecutionStatus::CANCELLED) {
                if(!_errorReported && _error) {
                    _errorReported = true;
                    std::rethrow_exception(_error);
                }
                return nullptr;
            }
            if(_status == ExecutionStatus::SUCCEEDED)
                return nullptr;

            PartitionID pid = INVALID_PARTITION;
            if(nextDeliverable(pid)) {
                PartitionPtr data;
                try {
                    data = _backend->fetch(_store.get(pid));
                } catch(const PartitionLostError& e) {
                    logger().warn(std::string("result partition lost: ") + e.what());
                    if(_store.markLost(pid))
                        partitionLost(pid);
                    continue;
                }

                _delivered.insert(pid);
                if(_ordered)
                    _nextRoot++;
                else
                    _completedRoots.pop_front();
                _store.unpin(pid);
                if(0 == _metrics.numOutputs)
                    _metrics.timeToFirstOutput = secondsBetween(_startTime, clock::now());
                _metrics.numOutputs++;
                collectGarbage();

                if(rootComplete())
                    finish();
                return data;
            }

            if(rootComplete()) {
                finish();
                return nullptr;
            }
            step(_pollInterval);
        }
    }

    TaskState Scheduler::taskState(TaskID id) const {
        auto it = _runs.find(id);
        if(it == _runs.end())
            throw std::out_of_range("unknown task " + std::to_string(id));
        return it->second.state;
    }

    size_t Scheduler::countTasks(TaskState state) const {
        size_t n = 0;
        for(const auto& kv : _runs)
            if(kv.second.state == state)
                n++;
        return n;
    }

    std::vector<TaskFailure> Scheduler::failures(TaskID id) const {
        auto it = _runs.find(id);
        if(it == _runs.end())
            return {};
        return it->second.history;
    }
}
