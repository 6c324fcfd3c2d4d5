//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_ERRORS_H
#define SKEIN_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include "Defs.h"

namespace skein {

    /*!
     * classification of a failed task attempt as reported by a backend
     */
    enum class FailureKind {
        UNKNOWN,
        TRANSIENT,      //! worker loss, preemption, submission failure or a kernel signaling a transient condition
        TERMINAL,       //! compute/data error
        INPUT_LOST,     //! one or more inputs could not be read anymore
        TIMEOUT,        //! task exceeded the per-task timeout
        CANCELLED,      //! aborted on request
        UNSATISFIABLE   //! no worker class can ever run the task
    };

    extern std::string failureKindToString(FailureKind kind);

    inline bool isRetryable(FailureKind kind) {
        return kind == FailureKind::TRANSIENT || kind == FailureKind::TIMEOUT;
    }

    /*!
     * one failed attempt of a task
     */
    struct TaskFailure {
        TaskID taskID;
        size_t attempt;
        FailureKind kind;
        std::string message;
        std::string worker;
        std::vector<PartitionID> lostInputs;

        TaskFailure() : taskID(INVALID_TASK), attempt(0), kind(FailureKind::UNKNOWN) {}
        TaskFailure(TaskID id, size_t attempt, FailureKind kind, const std::string& message) : taskID(id),
        attempt(attempt), kind(kind), message(message) {}

        std::string toString() const;
    };

    class SkeinException : public std::runtime_error {
    public:
        explicit SkeinException(const std::string& message) : std::runtime_error(message) {}
    };

    /*!
     * plan is malformed, raised during translation and never retried
     */
    class PlanTranslationError : public SkeinException {
    public:
        explicit PlanTranslationError(const std::string& message, OperatorID op=-1) : SkeinException(message), _operatorID(op) {}
        OperatorID operatorID() const { return _operatorID; }
    private:
        OperatorID _operatorID;
    };

    /*!
     * a task's resource request exceeds every worker class of the backend
     */
    class ResourceUnsatisfiable : public SkeinException {
    public:
        explicit ResourceUnsatisfiable(const std::string& message, TaskID task=INVALID_TASK) : SkeinException(message), _taskID(task) {}
        TaskID taskID() const { return _taskID; }
    private:
        TaskID _taskID;
    };

    /*!
     * thrown by compute kernels to signal a condition worth retrying
     */
    class TaskTransientError : public SkeinException {
    public:
        explicit TaskTransientError(const std::string& message) : SkeinException(message) {}
    };

    /*!
     * thrown when partition data is not available anymore (e.g. the worker holding it died)
     */
    class PartitionLostError : public SkeinException {
    public:
        PartitionLostError(const std::string& message, const std::vector<PartitionID>& ids) : SkeinException(message), _ids(ids) {}
        const std::vector<PartitionID>& partitions() const { return _ids; }
    private:
        std::vector<PartitionID> _ids;
    };

    /*!
     * where a terminal failure originated
     */
    struct TaskFailureContext {
        TaskID taskID;
        StageID stageID;
        size_t partitionIndex;
        std::vector<std::string> operators; //! names of the plan nodes the task implements
        std::vector<TaskFailure> history;   //! all failed attempts, oldest first

        TaskFailureContext() : taskID(INVALID_TASK), stageID(INVALID_STAGE), partitionIndex(0) {}
    };

    /*!
     * compute/data error or exhausted retries, aborts the whole execution
     */
    class TaskTerminalError : public SkeinException {
    public:
        TaskTerminalError(const std::string& message, const TaskFailureContext& context);

        const TaskFailureContext& context() const { return _context; }
        TaskID taskID() const { return _context.taskID; }
        StageID stageID() const { return _context.stageID; }
        const std::vector<TaskFailure>& retryHistory() const { return _context.history; }
    private:
        TaskFailureContext _context;
    };

    /*!
     * execution was cancelled, not a failure
     */
    class CancellationError : public SkeinException {
    public:
        explicit CancellationError(const std::string& message="execution was cancelled") : SkeinException(message) {}
    };
}

#endif //SKEIN_ERRORS_H
