//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/cluster/ClusterBackend.h>
#include <StringUtils.h>

namespace skein {

    ClusterBackend::ClusterBackend(const ContextOptions &options,
                                   const std::shared_ptr<IClusterClient> &client) : _options(options),
                                   _client(client), _table(new RequestTable()), _done(false) {
        if(!_client)
            throw SkeinException("cluster backend requires a cluster client");

        updateCapacity(_client->pollState());
        _client->setEventHandler([this](const messages::ClusterEvent& event) { handleEvent(event); });
        _monitor = std::thread([this]() { monitor(); });

        logger().info("connected to cluster with " + pluralize(_client->workerClasses().size(), "worker class") +
                      ", capacity " + advertiseCapacity().toString());
    }

    ClusterBackend::~ClusterBackend() {
        {
            std::lock_guard<std::mutex> lock(_monitorMutex);
            _done = true;
        }
        _monitorCV.notify_all();
        if(_monitor.joinable())
            _monitor.join();

        // waits for running event handlers
        _client->setEventHandler(nullptr);

        std::vector<TaskID> pending;
        {
            std::lock_guard<std::mutex> lock(_table->mutex);
            for(const auto& kv : _table->requests)
                pending.push_back(kv.first.first);
        }
        for(auto id : pending)
            _client->abort(id);
    }

    std::string ClusterBackend::kernelKey(const KernelPtr &kernel) {
        std::lock_guard<std::mutex> lock(_kernelMutex);
        auto it = _kernels.find(kernel.get());
        if(it != _kernels.end())
            return it->second.first;

        auto key = kernel->name() + "/" + uuidToString(getUniqueID());
        _client->registerKernel(key, kernel);
        _kernels[kernel.get()] = std::make_pair(key, kernel);
        return key;
    }

    messages::TaskRequest ClusterBackend::encode(const TaskSubmission &submission, const std::string &kernelKey) const {
        const auto& task = submission.task;
        messages::TaskRequest req;
        req.set_task_id(task->id);
        req.set_attempt(static_cast<uint32_t>(submission.attempt));
        req.set_kernel(kernelKey);
        req.set_stage_id(task->stage);
        req.set_partition_index(task->partitionIndex);
        req.set_num_partitions(task->numPartitions);
        for(const auto& ref : submission.inputs)
            fillPartitionInfo(req.add_inputs(), ref);
        for(auto id : task->outputs)
            req.add_output_ids(id);
        for(auto n : task->inputsPerSide)
            req.add_inputs_per_side(n);
        fillResources(req.mutable_resources(), task->resources);
        req.set_timeout_ms(static_cast<uint64_t>(submission.timeout * 1000.0));
        return req;
    }

    void ClusterBackend::submit(const TaskSubmission &submission, const std::shared_ptr<ITaskListener> &listener) {
        const auto& task = submission.task;
        if(!isSatisfiable(task->resources, workerClasses())) {
            listener->onFailure(TaskFailure(task->id, submission.attempt, FailureKind::UNSATISFIABLE,
                                            "no worker class offers " + task->resources.toString()));
            return;
        }

        auto req = encode(submission, kernelKey(task->kernel));
        auto key = std::make_pair(task->id, submission.attempt);
        {
            std::lock_guard<std::mutex> lock(_table->mutex);
            Request r;
            r.submission = submission;
            r.listener = listener;
            r.sentAt = std::chrono::steady_clock::now();
            _table->requests[key] = r;
        }

        logger().debug("submitting " + task->description() + ", attempt " + std::to_string(submission.attempt));

        auto table = _table;
        bool sent = false;
        std::string reason = "cluster unreachable";
        try {
            sent = _client->invokeAsync(req, [table](const messages::TaskResponse& response) {
                handleResponse(table, response);
            });
        } catch(const std::exception& e) {
            reason = e.what();
        }

        if(!sent) {
            {
                std::lock_guard<std::mutex> lock(_table->mutex);
                _table->requests.erase(key);
            }
            logger().warn("submission of task " + std::to_string(task->id) + " failed: " + reason);
            listener->onFailure(TaskFailure(task->id, submission.attempt, FailureKind::TRANSIENT,
                                            "submission failed: " + reason));
        }
    }

    void ClusterBackend::handleResponse(const std::shared_ptr<RequestTable> &table,
                                        const messages::TaskResponse &response) {
        auto key = std::make_pair(static_cast<TaskID>(response.task_id()), static_cast<size_t>(response.attempt()));
        Request request;
        {
            std::lock_guard<std::mutex> lock(table->mutex);
            auto it = table->requests.find(key);
            // late response of an attempt which was already settled
            if(it == table->requests.end())
                return;

            it->second.acknowledged = true;
            if(response.status() == messages::TASK_QUEUED)
                return;
            request = it->second;
            if(response.status() != messages::TASK_RUNNING)
                table->requests.erase(it);
        }

        const auto& listener = request.listener;
        auto id = key.first;
        auto attempt = key.second;
        switch(response.status()) {
            case messages::TASK_RUNNING:
                listener->onStarted(id, attempt, response.worker_id());
                return;
            case messages::TASK_OK: {
                TaskResult result;
                result.taskID = id;
                result.attempt = attempt;
                result.worker = response.worker_id();
                result.runtime = response.runtime();
                for(const auto& info : response.outputs())
                    result.outputs.push_back(partitionFromMessage(info));
                listener->onSuccess(result);
                return;
            }
            default:
                break;
        }

        FailureKind kind = FailureKind::UNKNOWN;
        switch(response.status()) {
            case messages::WORKER_LOST:
            case messages::TASK_TRANSIENT_ERROR:
            case messages::TIMEOUT:
                kind = FailureKind::TRANSIENT;
                break;
            case messages::INPUT_LOST:
                kind = FailureKind::INPUT_LOST;
                break;
            case messages::CANCELLED:
                kind = FailureKind::CANCELLED;
                break;
            case messages::REJECTED:
                kind = FailureKind::UNSATISFIABLE;
                break;
            default:
                kind = FailureKind::TERMINAL;
                break;
        }
        TaskFailure f(id, attempt, kind, response.error_message().empty() ? taskStatusToString(response.status())
                                                                          : response.error_message());
        f.worker = response.worker_id();
        for(auto pid : response.lost_inputs())
            f.lostInputs.push_back(pid);
        listener->onFailure(f);
    }

    void ClusterBackend::handleEvent(const messages::ClusterEvent &event) {
        if(event.kind() == messages::ClusterEvent::WORKER_LOST) {
            std::vector<PartitionID> lost(event.lost_partitions().begin(), event.lost_partitions().end());
            logger().warn("lost worker " + event.worker_id() + " holding " + pluralize(lost.size(), "partition"));
            notifyWorkerLost(event.worker_id(), lost);
        }
        if(event.has_state())
            updateCapacity(event.state());
    }

    void ClusterBackend::updateCapacity(const messages::ClusterState &state) {
        auto capacity = summaryFromMessage(state.total());
        {
            std::lock_guard<std::mutex> lock(_capacityMutex);
            if(capacity == _capacity)
                return;
            _capacity = capacity;
        }
        logger().info("cluster capacity changed to " + capacity.toString() + " on " +
                      pluralize(state.live_workers(), "worker"));
        notifyCapacityChanged(capacity);
    }

    ResourceSummary ClusterBackend::advertiseCapacity() const {
        std::lock_guard<std::mutex> lock(_capacityMutex);
        return _capacity;
    }

    void ClusterBackend::cancel(TaskID id) {
        // requests the cluster never acknowledged can not be aborted remotely
        std::vector<Request> unacknowledged;
        {
            std::lock_guard<std::mutex> lock(_table->mutex);
            auto it = _table->requests.begin();
            while(it != _table->requests.end()) {
                if(it->first.first == id && !it->second.acknowledged) {
                    unacknowledged.push_back(it->second);
                    it = _table->requests.erase(it);
                } else
                    ++it;
            }
        }
        _client->abort(id);
        for(const auto& r : unacknowledged)
            r.listener->onFailure(TaskFailure(id, r.submission.attempt, FailureKind::CANCELLED, "cancelled before acknowledgement"));
    }

    PartitionPtr ClusterBackend::fetch(const PartitionRef &ref) {
        if(ref.data)
            return ref.data;
        messages::PartitionInfo info;
        fillPartitionInfo(&info, ref);
        return _client->fetch(info);
    }

    void ClusterBackend::release(const std::vector<PartitionRef> &partitions) {
        std::vector<messages::PartitionInfo> infos;
        for(const auto& ref : partitions) {
            if(ref.location.empty())
                continue;
            messages::PartitionInfo info;
            fillPartitionInfo(&info, ref);
            infos.push_back(info);
        }
        if(!infos.empty())
            _client->release(infos);
    }

    size_t ClusterBackend::numPendingRequests() const {
        std::lock_guard<std::mutex> lock(_table->mutex);
        return _table->requests.size();
    }

    void ClusterBackend::checkSubmitTimeouts() {
        auto timeout = std::chrono::duration<double>(_options.CLUSTER_SUBMIT_TIMEOUT());
        auto now = std::chrono::steady_clock::now();
        std::vector<Request> expired;
        {
            std::lock_guard<std::mutex> lock(_table->mutex);
            auto it = _table->requests.begin();
            while(it != _table->requests.end()) {
                if(!it->second.acknowledged && now - it->second.sentAt > timeout) {
                    expired.push_back(it->second);
                    it = _table->requests.erase(it);
                } else
                    ++it;
            }
        }

        for(const auto& r : expired) {
            auto id = r.submission.task->id;
            logger().warn("task " + std::to_string(id) + " was not acknowledged within " +
                          std::to_string(_options.CLUSTER_SUBMIT_TIMEOUT()) + "s");
            _client->abort(id);
            r.listener->onFailure(TaskFailure(id, r.submission.attempt, FailureKind::TRANSIENT, "submission timed out"));
        }
    }

    void ClusterBackend::monitor() {
        auto interval = std::chrono::duration<double>(_options.CLUSTER_CAPACITY_POLL_INTERVAL());
        std::unique_lock<std::mutex> lock(_monitorMutex);
        while(!_done) {
            _monitorCV.wait_for(lock, interval);
            if(_done)
                break;
            lock.unlock();
            try {
                updateCapacity(_client->pollState());
            } catch(const std::exception& e) {
                logger().warn(std::string("failed to poll cluster state: ") + e.what());
            }
            checkSubmitTimeouts();
            lock.lock();
        }
    }
}
