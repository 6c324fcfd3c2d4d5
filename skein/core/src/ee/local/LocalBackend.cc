//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/local/LocalBackend.h>
#include <Timer.h>
#include <algorithm>

namespace skein {

    /*!
     * runs one submission on an executor thread and reports to the listener
     */
    class LocalTask : public IExecutorTask {
    private:
        LocalBackend* _backend;
        TaskSubmission _submission;
        std::shared_ptr<ITaskListener> _listener;
        std::shared_ptr<std::atomic_bool> _cancelFlag;

        TaskFailure failure(FailureKind kind, const std::string& message) const {
            TaskFailure f(_submission.task->id, _submission.attempt, kind, message);
            if(owner())
                f.worker = owner()->name();
            return f;
        }

        void run();
    public:
        LocalTask(LocalBackend* backend, const TaskSubmission& submission,
                  const std::shared_ptr<ITaskListener>& listener,
                  const std::shared_ptr<std::atomic_bool>& cancelFlag) : _backend(backend), _submission(submission),
                  _listener(listener), _cancelFlag(cancelFlag) {}

        void execute() override {
            run();
        }

        void discard() override {
            _backend->taskDone(_submission.task->id, _cancelFlag, false);
            _listener->onFailure(failure(FailureKind::CANCELLED, "task dropped from queue"));
        }
    };

    void LocalTask::run() {
        const auto& task = _submission.task;
        if(_cancelFlag->load()) {
            _backend->taskDone(task->id, _cancelFlag, false);
            _listener->onFailure(failure(FailureKind::CANCELLED, "cancelled before start"));
            return;
        }

        // local partitions are always resident
        std::vector<PartitionPtr> inputs;
        std::vector<PartitionID> missing;
        for(const auto& ref : _submission.inputs) {
            if(!ref.data)
                missing.push_back(ref.id);
            inputs.push_back(ref.data);
        }
        if(!missing.empty()) {
            auto f = failure(FailureKind::INPUT_LOST, "inputs are not resident");
            f.lostInputs = missing;
            _backend->taskDone(task->id, _cancelFlag, false);
            _listener->onFailure(f);
            return;
        }

        KernelContext ctx;
        ctx.taskID = task->id;
        ctx.stageID = task->stage;
        ctx.partitionIndex = task->partitionIndex;
        ctx.numPartitions = task->numPartitions;
        ctx.numOutputs = task->outputArity();
        ctx.attempt = _submission.attempt;
        ctx.inputsPerSide = task->inputsPerSide;
        ctx.worker = owner() ? owner()->name() : "driver";
        ctx.cancelFlag = _cancelFlag;

        _backend->taskStarted();
        _listener->onStarted(task->id, _submission.attempt, ctx.worker);

        // the kernel has finished before the outcome is reported
        Timer timer;
        TaskResult result;
        TaskFailure f;
        bool success = false;
        try {
            auto outputs = task->kernel->execute(ctx, inputs);
            if(outputs.size() != task->outputArity())
                throw std::runtime_error("kernel " + task->kernel->name() + " returned " +
                                         std::to_string(outputs.size()) + " partitions, expected " +
                                         std::to_string(task->outputArity()));

            result.taskID = task->id;
            result.attempt = _submission.attempt;
            result.worker = ctx.worker;
            result.runtime = timer.time();
            for(size_t i = 0; i < outputs.size(); ++i)
                result.outputs.push_back(MaterializedPartition(task->outputs[i], outputs[i]));
            success = true;
        } catch(const CancellationError& e) {
            f = failure(FailureKind::CANCELLED, e.what());
        } catch(const TaskTransientError& e) {
            f = failure(FailureKind::TRANSIENT, e.what());
        } catch(const PartitionLostError& e) {
            f = failure(FailureKind::INPUT_LOST, e.what());
            f.lostInputs = e.partitions();
        } catch(const std::exception& e) {
            f = failure(FailureKind::TERMINAL, e.what());
        } catch(...) {
            f = failure(FailureKind::TERMINAL, "kernel " + task->kernel->name() + " threw an unknown exception");
        }

        _backend->taskDone(task->id, _cancelFlag, true);
        if(success)
            _listener->onSuccess(result);
        else
            _listener->onFailure(f);
    }

    LocalBackend::LocalBackend(const ContextOptions &options) : _options(options), _numRunning(0) {
        auto numExecutors = options.EXECUTOR_COUNT();
        _capacity = ResourceSummary(numExecutors, options.LOCAL_NUM_GPUS(), options.LOCAL_MEMORY());

        for(unsigned i = 0; i < numExecutors; ++i) {
            auto executor = std::unique_ptr<Executor>(new Executor("E/" + std::to_string(i + 1), i + 1));
            executor->attachWorkQueue(&_queue);
            executor->processQueue();
            _executors.push_back(std::move(executor));
        }

        logger().info("started local backend with " + pluralize(numExecutors, "executor") + ", capacity " +
                      _capacity.toString());
    }

    LocalBackend::~LocalBackend() {
        // drop queued tasks, finish the running ones
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for(auto& kv : _cancelFlags)
                for(auto& flag : kv.second)
                    flag->store(true);
        }
        _queue.clear();
        for(auto& e : _executors)
            e->release();
        _executors.clear();
    }

    std::vector<WorkerClass> LocalBackend::workerClasses() const {
        return {WorkerClass("local", _capacity, 1, 1)};
    }

    void LocalBackend::submit(const TaskSubmission &submission, const std::shared_ptr<ITaskListener> &listener) {
        const auto& task = submission.task;
        if(!isSatisfiable(task->resources, workerClasses())) {
            TaskFailure f(task->id, submission.attempt, FailureKind::UNSATISFIABLE,
                          "request " + task->resources.toString() + " exceeds local capacity " + _capacity.toString());
            listener->onFailure(f);
            return;
        }

        auto flag = std::make_shared<std::atomic_bool>(false);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _cancelFlags[task->id].push_back(flag);
        }
        logger().debug("submitting " + task->description() + ", attempt " + std::to_string(submission.attempt));
        _queue.addTask(std::unique_ptr<IExecutorTask>(new LocalTask(this, submission, listener, flag)));
    }

    void LocalBackend::cancel(TaskID id) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _cancelFlags.find(id);
        if(it != _cancelFlags.end())
            for(auto& flag : it->second)
                flag->store(true);
    }

    PartitionPtr LocalBackend::fetch(const PartitionRef &ref) {
        if(!ref.data)
            throw PartitionLostError("partition " + std::to_string(ref.id) + " is not resident", {ref.id});
        return ref.data;
    }

    void LocalBackend::taskStarted() {
        _numRunning++;
    }

    void LocalBackend::taskDone(TaskID id, const std::shared_ptr<std::atomic_bool>& flag, bool started) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _cancelFlags.find(id);
        if(it != _cancelFlags.end()) {
            auto& flags = it->second;
            flags.erase(std::remove(flags.begin(), flags.end(), flag), flags.end());
            if(flags.empty())
                _cancelFlags.erase(it);
        }
        if(started)
            _numRunning--;
    }
}
