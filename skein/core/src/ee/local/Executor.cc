//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/local/Executor.h>
#include <chrono>

namespace skein {

    WorkQueue::WorkQueue() {
        _numPendingTasks = 0;
        _numCompletedTasks = 0;
    }

    bool WorkQueue::workTask(Executor& executor, double timeout) {
        std::unique_ptr<IExecutorTask> task;
        bool dequeued = false;
        if(timeout <= 0.0)
            dequeued = _queue.try_dequeue(task);
        else
            dequeued = _queue.wait_dequeue_timed(task, static_cast<std::int64_t>(timeout * 1000000.0));

        if(!dequeued || !task)
            return false;

        task->setOwner(&executor);
        task->execute();
        // save which thread executed this task
        task->setID(std::this_thread::get_id());

        _numPendingTasks.fetch_add(-1, std::memory_order_release);
        _numCompletedTasks.fetch_add(1, std::memory_order_release);
        return true;
    }

    void WorkQueue::waitUntilAllTasksFinished() {
        while(_numPendingTasks.load(std::memory_order_acquire) != 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
        }
    }

    size_t WorkQueue::clear() {
        size_t dropped = 0;
        std::unique_ptr<IExecutorTask> task;
        while(_queue.try_dequeue(task)) {
            if(task)
                task->discard();
            _numPendingTasks.fetch_add(-1, std::memory_order_release);
            dropped++;
        }
        return dropped;
    }

    void Executor::attachWorkQueue(WorkQueue *queue) {
        _workQueue.exchange(queue, std::memory_order_acquire);
    }

    void Executor::removeFromQueue() {
        _workQueue.exchange(nullptr, std::memory_order_acquire);
    }

    Executor::Executor(const std::string &name, size_t threadNumber) : _name(name), _threadNumber(threadNumber),
    _uuid(getUniqueID()), _done(false), _workQueue(nullptr) {
    }

    void Executor::worker() {
        _threadID = std::this_thread::get_id();

        bool done = _done.load(std::memory_order_acquire);
        while(!done) {
            WorkQueue *queue = nullptr;
            if((queue = _workQueue.load(std::memory_order_acquire))) {
                // blocks shortly, so release() is observed in time
                queue->workTask(*this, 0.01);
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            done = _done.load(std::memory_order_acquire);
        }
    }

    void Executor::processQueue() {
        if(isRunning())
            return;

        _done = false;
        _thread = std::thread(&Executor::worker, this);
    }

    void Executor::release() {
        // stops detached queue.
        _done = true;

        if(_thread.joinable())
            _thread.join();
    }
}
