//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_EXECUTOR_H
#define SKEIN_EXECUTOR_H

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <blockingconcurrentqueue.h>
#include <Logger.h>
#include <Utils.h>
#include <mt/ITask.h>

namespace skein {

    class Executor;
    class WorkQueue;

    /*!
     * unit of work run by an executor thread
     */
    class IExecutorTask : public ITask {
    private:
        Executor* _owner;
    public:
        IExecutorTask() : _owner(nullptr) {}
        virtual ~IExecutorTask() = default;

        Executor* owner() const { return _owner; }
        void setOwner(Executor* owner) { _owner = owner; }

        /*!
         * called instead of execute() when the task is dropped from the queue
         */
        virtual void discard() {}
    };

    using ExecutorTaskQueueType=moodycamel::BlockingConcurrentQueue<std::unique_ptr<IExecutorTask>>;

    /*!
     * helper class to attach Tasks to
     */
    class WorkQueue {
    private:
        ExecutorTaskQueueType _queue;
        std::atomic_int _numPendingTasks;
        std::atomic_int _numCompletedTasks;
    public:

        WorkQueue();

        /*!
         * MT safe function to add a task to the working queue
         * @param task
         */
        void addTask(std::unique_ptr<IExecutorTask> task) {
            if(!task)
                return;
            _numPendingTasks.fetch_add(1, std::memory_order_release);
            _queue.enqueue(std::move(task));
        }

        size_t numPendingTasks() const {
            return _numPendingTasks;
        }

        size_t numCompletedTasks() const { return _numCompletedTasks; }

        /*!
         * work on one task. To be called from any worker thread
         * @param executor the executor who works on this task. (I.e. the caller)
         * @param timeout how long to wait for a task in s, 0 means non-blocking
         * @return true if task was worked on, false else
         */
        bool workTask(Executor& executor, double timeout=0.0);

        /*!
         * blocking call until all tasks on this queue are worked on
         */
        void waitUntilAllTasksFinished();

        /*!
         * removes all tasks which did not start yet, calling discard() on them
         * @return number of dropped tasks
         */
        size_t clear();
    };

    // one executor == one thread
    class Executor {
    private:

        // name to identify this executor
        std::string _name;

        std::thread::id         _threadID;
        size_t                  _threadNumber;

        // unique id of this executor
        uniqueid_t              _uuid;

        std::atomic_bool _done;

        // atomic workqueue (note: executor may be attached or not!)
        std::atomic<WorkQueue*> _workQueue;

        std::thread _thread;

        /*!
         * helper function for each thread to fetch the next available task
         */
        void worker();
    public:

        Executor(const std::string& name, size_t threadNumber);

        Executor(const Executor& other) = delete;
        Executor& operator = (const Executor& other) = delete;

        virtual ~Executor() {
            release();
        }

        std::string name() const { return _name; }

        inline void info(const std::string& message) {
            Logger::instance().logger(_name).info(message);
        }

        inline void error(const std::string& message) {
            Logger::instance().logger(_name).error(message);
        }

        size_t threadNumber() const { return _threadNumber; }
        uniqueid_t getUUID() const { return _uuid; }

        /*!
         * attach executor to a queue, tasks of the queue are then processed by its thread
         */
        void attachWorkQueue(WorkQueue* queue);
        void removeFromQueue();

        /*!
         * starts the thread of this executor
         */
        void processQueue();

        bool isRunning() const { return _thread.joinable(); }

        /*!
         * stops the thread of this executor (after its current task)
         */
        void release();
    };
}
#endif //SKEIN_EXECUTOR_H
