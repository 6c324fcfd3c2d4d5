//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_SCHEDULEREVENT_H
#define SKEIN_SCHEDULEREVENT_H

#include <memory>
#include <blockingconcurrentqueue.h>
#include <ee/IBackend.h>

namespace skein {

    enum class SchedulerEventType {
        TASK_STARTED,
        TASK_SUCCEEDED,
        TASK_FAILED,
        CAPACITY_CHANGED,
        WORKER_LOST,
        CANCEL
    };

    /*!
     * completion and backend notifications consumed by the scheduler's event loop
     */
    struct SchedulerEvent {
        SchedulerEventType type;
        TaskID taskID;
        size_t attempt;
        std::string worker;
        TaskResult result;
        TaskFailure failure;
        ResourceSummary capacity;
        std::vector<PartitionID> partitions;

        SchedulerEvent() : type(SchedulerEventType::CANCEL), taskID(INVALID_TASK), attempt(0) {}
        explicit SchedulerEvent(SchedulerEventType type) : type(type), taskID(INVALID_TASK), attempt(0) {}
    };

    /*!
     * multi-producer queue of events. Backend threads push, the scheduler pops.
     */
    class EventChannel {
    private:
        moodycamel::BlockingConcurrentQueue<SchedulerEvent> _queue;
    public:
        void push(SchedulerEvent event) {
            _queue.enqueue(std::move(event));
        }

        /*!
         * pops the next event
         * @param event where to store it
         * @param timeout how long to wait in s, 0 means non-blocking
         * @return true if an event was popped
         */
        bool pop(SchedulerEvent& event, double timeout=0.0) {
            if(timeout <= 0.0)
                return _queue.try_dequeue(event);
            return _queue.wait_dequeue_timed(event, static_cast<std::int64_t>(timeout * 1000000.0));
        }

        size_t sizeApprox() const { return _queue.size_approx(); }
    };

    using EventChannelPtr = std::shared_ptr<EventChannel>;

    /*!
     * forwards task outcomes of a backend into an event channel
     */
    class ChannelTaskListener : public ITaskListener {
    private:
        EventChannelPtr _channel;
    public:
        explicit ChannelTaskListener(const EventChannelPtr& channel) : _channel(channel) {}

        void onStarted(TaskID id, size_t attempt, const std::string& worker) override {
            SchedulerEvent ev(SchedulerEventType::TASK_STARTED);
            ev.taskID = id;
            ev.attempt = attempt;
            ev.worker = worker;
            _channel->push(std::move(ev));
        }

        void onSuccess(const TaskResult& result) override {
            SchedulerEvent ev(SchedulerEventType::TASK_SUCCEEDED);
            ev.taskID = result.taskID;
            ev.attempt = result.attempt;
            ev.worker = result.worker;
            ev.result = result;
            _channel->push(std::move(ev));
        }

        void onFailure(const TaskFailure& failure) override {
            SchedulerEvent ev(SchedulerEventType::TASK_FAILED);
            ev.taskID = failure.taskID;
            ev.attempt = failure.attempt;
            ev.worker = failure.worker;
            ev.failure = failure;
            _channel->push(std::move(ev));
        }
    };

    /*!
     * forwards capacity changes and worker loss into an event channel
     */
    class ChannelBackendListener : public IBackendListener {
    private:
        EventChannelPtr _channel;
    public:
        explicit ChannelBackendListener(const EventChannelPtr& channel) : _channel(channel) {}

        void onCapacityChanged(const ResourceSummary& capacity) override {
            SchedulerEvent ev(SchedulerEventType::CAPACITY_CHANGED);
            ev.capacity = capacity;
            _channel->push(std::move(ev));
        }

        void onWorkerLost(const std::string& worker, const std::vector<PartitionID>& partitions) override {
            SchedulerEvent ev(SchedulerEventType::WORKER_LOST);
            ev.worker = worker;
            ev.partitions = partitions;
            _channel->push(std::move(ev));
        }
    };
}

#endif //SKEIN_SCHEDULEREVENT_H
