//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/cluster/EmulatedCluster.h>
#include <Errors.h>
#include <StringUtils.h>
#include <Timer.h>
#include <algorithm>
#include <cmath>

namespace skein {

    /*!
     * one placed attempt on the executor pool of the emulated cluster
     */
    class ClusterTask : public IExecutorTask {
    private:
        EmulatedCluster* _cluster;
        EmulatedCluster::AttemptPtr _attempt;
    public:
        ClusterTask(EmulatedCluster* cluster, const EmulatedCluster::AttemptPtr& attempt) : _cluster(cluster),
        _attempt(attempt) {}

        void execute() override {
            _cluster->run(_attempt);
        }

        void discard() override {
            auto r = _cluster->responseFor(_attempt, messages::CANCELLED, "cluster shut down");
            _cluster->finish(_attempt, r);
        }
    };

    EmulatedCluster::EmulatedCluster(const ClusterConfig &config, size_t numThreads) : _config(config),
    _partitioned(false), _dropRequests(0), _shutdown(false) {
        if(config.workerClasses().empty())
            throw SkeinException("cluster description without worker classes");

        for(const auto& wc : config.workerClasses())
            for(unsigned i = 0; i < config.initialWorkers(wc.name); ++i)
                startWorker(wc.name);

        // one thread per CPU the cluster could ever offer
        if(0 == numThreads) {
            double cpus = 0.0;
            for(const auto& wc : config.workerClasses())
                cpus += wc.resources.cpus * wc.maxWorkers;
            numThreads = std::min((size_t)64, std::max((size_t)2, (size_t)std::ceil(cpus)));
        }
        for(unsigned i = 0; i < numThreads; ++i) {
            auto executor = std::unique_ptr<Executor>(new Executor("C/" + std::to_string(i + 1), i + 1));
            executor->attachWorkQueue(&_workQueue);
            executor->processQueue();
            _executors.push_back(std::move(executor));
        }

        logger().info("started emulated cluster with " + pluralize(_workers.size(), "worker") + " and " +
                      pluralize(numThreads, "thread"));
    }

    EmulatedCluster::~EmulatedCluster() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _shutdown = true;
            for(auto& a : _active)
                a->cancelFlag->store(true);
        }
        _workQueue.clear();
        for(auto& e : _executors)
            e->release();
        _executors.clear();
    }

    std::string EmulatedCluster::startWorker(const std::string &className) {
        const auto& wc = _config.workerClass(className);
        Worker w;
        w.id = className + "-" + std::to_string(++_workerCounter[className]);
        w.className = className;
        w.resources = wc.resources;
        auto id = w.id;
        _workers[id] = w;
        return id;
    }

    messages::ClusterState EmulatedCluster::stateWithoutLock() const {
        ResourceSummary total, available;
        unsigned live = 0;
        for(const auto& kv : _workers) {
            if(!kv.second.alive)
                continue;
            total += kv.second.resources;
            available += kv.second.free();
            live++;
        }
        messages::ClusterState state;
        fillResources(state.mutable_total(), total);
        fillResources(state.mutable_available(), available);
        state.set_live_workers(live);
        return state;
    }

    messages::ClusterState EmulatedCluster::pollState() {
        std::lock_guard<std::mutex> lock(_mutex);
        return stateWithoutLock();
    }

    void EmulatedCluster::registerKernel(const std::string &key, const KernelPtr &kernel) {
        std::lock_guard<std::mutex> lock(_mutex);
        _kernels[key] = kernel;
    }

    void EmulatedCluster::setEventHandler(EventCallback handler) {
        std::lock_guard<std::mutex> lock(_eventMutex);
        _eventHandler = std::move(handler);
    }

    void EmulatedCluster::emit(const messages::ClusterEvent &event) {
        // handler is invoked under the event lock, so resetting the handler waits for running invocations
        std::lock_guard<std::mutex> lock(_eventMutex);
        if(_eventHandler)
            _eventHandler(event);
    }

    void EmulatedCluster::setTaskHook(TaskHook hook) {
        std::lock_guard<std::mutex> lock(_mutex);
        _taskHook = std::move(hook);
    }

    void EmulatedCluster::setNetworkPartitioned(bool partitioned) {
        std::lock_guard<std::mutex> lock(_mutex);
        _partitioned = partitioned;
        logger().warn(partitioned ? "network partitioned" : "network healed");
    }

    void EmulatedCluster::dropNextRequests(size_t n) {
        std::lock_guard<std::mutex> lock(_mutex);
        _dropRequests = n;
    }

    messages::TaskResponse EmulatedCluster::responseFor(const AttemptPtr &attempt, messages::TaskStatus status,
                                                        const std::string &message) const {
        messages::TaskResponse r;
        r.set_task_id(attempt->request.task_id());
        r.set_attempt(attempt->request.attempt());
        r.set_status(status);
        r.set_worker_id(attempt->worker);
        if(!message.empty())
            r.set_error_message(message);
        return r;
    }

    bool EmulatedCluster::invokeAsync(const messages::TaskRequest &request, ResponseCallback callback) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if(_shutdown || _partitioned)
                return false;
            if(_dropRequests > 0) {
                _dropRequests--;
                logger().warn("request for task " + std::to_string(request.task_id()) + " lost in network");
                return true;
            }
        }

        auto attempt = std::make_shared<Attempt>();
        attempt->request = request;
        attempt->callback = std::move(callback);

        if(!isSatisfiable(requestFromMessage(request.resources()), workerClasses())) {
            attempt->done = true;
            attempt->callback(responseFor(attempt, messages::REJECTED, "no node type offers " +
                                          requestFromMessage(request.resources()).toString()));
            return true;
        }

        {
            std::lock_guard<std::mutex> lock(_mutex);
            _queued.push_back(attempt);
        }
        attempt->callback(responseFor(attempt, messages::TASK_QUEUED));
        dispatch();
        return true;
    }

    void EmulatedCluster::dispatch() {
        std::vector<AttemptPtr> placed;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if(_shutdown)
                return;

            auto it = _queued.begin();
            while(it != _queued.end()) {
                auto request = requestFromMessage((*it)->request.resources());
                Worker* target = nullptr;
                for(auto& kv : _workers) {
                    if(kv.second.alive && kv.second.free().fits(request)) {
                        target = &kv.second;
                        break;
                    }
                }

                // not enough free resources right now, the attempt waits for a worker
                if(!target) {
                    ++it;
                    continue;
                }

                target->used += request;
                (*it)->worker = target->id;
                _active.push_back(*it);
                placed.push_back(*it);
                it = _queued.erase(it);
            }
        }

        for(const auto& a : placed)
            _workQueue.addTask(std::unique_ptr<IExecutorTask>(new ClusterTask(this, a)));
    }

    bool EmulatedCluster::finish(const AttemptPtr &attempt, messages::TaskResponse &response,
                                 const std::vector<std::pair<PartitionID, PartitionPtr>>& outputs) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if(attempt->done)
                return false;
            attempt->done = true;

            if(!attempt->worker.empty()) {
                auto it = _workers.find(attempt->worker);
                if(it != _workers.end() && it->second.alive) {
                    it->second.used -= requestFromMessage(attempt->request.resources());
                    for(const auto& p : outputs)
                        it->second.store[p.first] = p.second;
                } else if(response.status() == messages::TASK_OK) {
                    // outputs died with the worker
                    response.set_status(messages::WORKER_LOST);
                    response.clear_outputs();
                    response.set_error_message("worker " + attempt->worker + " was lost before outputs were stored");
                }
            }
            _active.erase(std::remove(_active.begin(), _active.end(), attempt), _active.end());
            _queued.erase(std::remove(_queued.begin(), _queued.end(), attempt), _queued.end());
        }

        attempt->callback(response);
        dispatch();
        return true;
    }

    void EmulatedCluster::run(const AttemptPtr &attempt) {
        const auto& request = attempt->request;
        if(attempt->cancelFlag->load()) {
            auto r = responseFor(attempt, messages::CANCELLED, "cancelled before start");
            finish(attempt, r);
            return;
        }

        TaskHook hook;
        KernelPtr kernel;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if(attempt->done)
                return;
            hook = _taskHook;
            auto it = _kernels.find(request.kernel());
            if(it != _kernels.end())
                kernel = it->second;
        }
        attempt->callback(responseFor(attempt, messages::TASK_RUNNING));

        if(hook)
            hook(request, attempt->worker);

        if(!kernel) {
            auto r = responseFor(attempt, messages::TASK_ERROR, "unknown kernel " + request.kernel());
            finish(attempt, r);
            return;
        }

        // read inputs from the workers holding them
        std::vector<PartitionPtr> inputs;
        std::vector<PartitionID> lost;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for(const auto& info : request.inputs()) {
                PartitionPtr data;
                auto wt = _workers.find(info.location());
                if(wt != _workers.end() && wt->second.alive) {
                    auto pt = wt->second.store.find(info.id());
                    if(pt != wt->second.store.end())
                        data = pt->second;
                }
                if(!data)
                    lost.push_back(info.id());
                inputs.push_back(data);
            }
        }
        if(!lost.empty()) {
            auto r = responseFor(attempt, messages::INPUT_LOST, pluralize(lost.size(), "input") + " not available");
            for(auto id : lost)
                r.add_lost_inputs(id);
            finish(attempt, r);
            return;
        }

        KernelContext ctx;
        ctx.taskID = request.task_id();
        ctx.stageID = request.stage_id();
        ctx.partitionIndex = request.partition_index();
        ctx.numPartitions = request.num_partitions();
        ctx.numOutputs = request.output_ids_size();
        ctx.attempt = request.attempt();
        for(auto n : request.inputs_per_side())
            ctx.inputsPerSide.push_back(n);
        ctx.worker = attempt->worker;
        ctx.cancelFlag = attempt->cancelFlag;

        Timer timer;
        messages::TaskResponse r;
        std::vector<std::pair<PartitionID, PartitionPtr>> stored;
        try {
            auto outputs = kernel->execute(ctx, inputs);
            if(outputs.size() != static_cast<size_t>(request.output_ids_size()))
                throw std::runtime_error("kernel " + kernel->name() + " returned " + std::to_string(outputs.size()) +
                                         " partitions, expected " + std::to_string(request.output_ids_size()));

            r = responseFor(attempt, messages::TASK_OK);
            for(int i = 0; i < request.output_ids_size(); ++i) {
                if(!outputs[i])
                    throw std::runtime_error("kernel " + kernel->name() + " returned a null partition");
                auto info = r.add_outputs();
                info->set_id(request.output_ids(i));
                info->set_location(attempt->worker);
                info->set_num_rows(outputs[i]->numRows());
                info->set_num_bytes(outputs[i]->size());
                stored.emplace_back(request.output_ids(i), outputs[i]);
            }
        } catch(const CancellationError& e) {
            r = responseFor(attempt, messages::CANCELLED, e.what());
            stored.clear();
        } catch(const TaskTransientError& e) {
            r = responseFor(attempt, messages::TASK_TRANSIENT_ERROR, e.what());
            stored.clear();
        } catch(const PartitionLostError& e) {
            r = responseFor(attempt, messages::INPUT_LOST, e.what());
            for(auto id : e.partitions())
                r.add_lost_inputs(id);
            stored.clear();
        } catch(const std::exception& e) {
            r = responseFor(attempt, messages::TASK_ERROR, e.what());
            stored.clear();
        } catch(...) {
            r = responseFor(attempt, messages::TASK_ERROR, "kernel " + kernel->name() + " threw an unknown exception");
            stored.clear();
        }
        r.set_runtime(timer.time());
        finish(attempt, r, stored);
    }

    void EmulatedCluster::abort(TaskID id) {
        std::vector<AttemptPtr> dequeued;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            for(const auto& a : _queued)
                if(a->request.task_id() == id)
                    dequeued.push_back(a);
            for(const auto& a : _active)
                if(a->request.task_id() == id)
                    a->cancelFlag->store(true);
        }
        for(const auto& a : dequeued) {
            auto r = responseFor(a, messages::CANCELLED, "aborted while queued");
            finish(a, r);
        }
    }

    PartitionPtr EmulatedCluster::fetch(const messages::PartitionInfo &info) {
        std::lock_guard<std::mutex> lock(_mutex);
        auto wt = _workers.find(info.location());
        if(wt != _workers.end() && wt->second.alive) {
            auto pt = wt->second.store.find(info.id());
            if(pt != wt->second.store.end())
                return pt->second;
        }
        throw PartitionLostError("partition " + std::to_string(info.id()) + " not available on " + info.location(),
                                 {info.id()});
    }

    void EmulatedCluster::release(const std::vector<messages::PartitionInfo> &partitions) {
        std::lock_guard<std::mutex> lock(_mutex);
        for(const auto& info : partitions) {
            auto wt = _workers.find(info.location());
            if(wt != _workers.end())
                wt->second.store.erase(info.id());
        }
    }

    bool EmulatedCluster::killWorker(const std::string &id) {
        std::vector<AttemptPtr> victims;
        messages::ClusterEvent lostEvent;
        messages::ClusterEvent capacityEvent;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _workers.find(id);
            if(it == _workers.end() || !it->second.alive)
                return false;

            auto& w = it->second;
            w.alive = false;
            w.used = ResourceSummary();
            lostEvent.set_kind(messages::ClusterEvent::WORKER_LOST);
            lostEvent.set_worker_id(id);
            for(const auto& kv : w.store)
                lostEvent.add_lost_partitions(kv.first);
            w.store.clear();

            for(const auto& a : _active)
                if(a->worker == id)
                    victims.push_back(a);

            *lostEvent.mutable_state() = stateWithoutLock();
            capacityEvent.set_kind(messages::ClusterEvent::CAPACITY_CHANGED);
            *capacityEvent.mutable_state() = stateWithoutLock();
        }

        logger().warn("worker " + id + " lost, " + pluralize(lostEvent.lost_partitions_size(), "partition") +
                      " and " + pluralize(victims.size(), "running task") + " affected");

        emit(lostEvent);
        emit(capacityEvent);
        for(const auto& a : victims) {
            a->cancelFlag->store(true);
            auto r = responseFor(a, messages::WORKER_LOST, "worker " + id + " was lost");
            finish(a, r);
        }
        return true;
    }

    std::string EmulatedCluster::addWorker(const std::string &className) {
        std::string id;
        messages::ClusterEvent event;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            const auto& wc = _config.workerClass(className);
            size_t live = 0;
            for(const auto& kv : _workers)
                if(kv.second.alive && kv.second.className == className)
                    live++;
            if(live >= wc.maxWorkers)
                throw SkeinException("node type " + className + " is at max_workers=" + std::to_string(wc.maxWorkers));
            id = startWorker(className);
            event.set_kind(messages::ClusterEvent::CAPACITY_CHANGED);
            *event.mutable_state() = stateWithoutLock();
        }
        logger().info("added worker " + id);
        emit(event);
        dispatch();
        return id;
    }

    std::vector<std::string> EmulatedCluster::liveWorkers() const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::vector<std::string> ids;
        for(const auto& kv : _workers)
            if(kv.second.alive)
                ids.push_back(kv.first);
        return ids;
    }

    std::string EmulatedCluster::locationOf(PartitionID id) const {
        std::lock_guard<std::mutex> lock(_mutex);
        for(const auto& kv : _workers)
            if(kv.second.alive && kv.second.store.count(id))
                return kv.first;
        return "";
    }

    size_t EmulatedCluster::numStoredPartitions() const {
        std::lock_guard<std::mutex> lock(_mutex);
        size_t n = 0;
        for(const auto& kv : _workers)
            n += kv.second.store.size();
        return n;
    }

    size_t EmulatedCluster::numRunningTasks() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _active.size();
    }

    size_t EmulatedCluster::numQueuedTasks() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _queued.size();
    }
}
