//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_ITASK_H
#define SKEIN_ITASK_H

#include <thread>
#include <vector>
#include <cstddef>

namespace skein {

/*!
 * interface for defining tasks that can be run by a pool of worker threads
 */
class ITask {
private:
    std::thread::id _id; //! the id of the thread that executed the task.

    std::vector<size_t> _orderNumbers; //! for restoring submission order when processing asynchronously

public:
    ITask() {};
    ITask(const ITask& other) : _id(other._id), _orderNumbers(other._orderNumbers)  {}
    virtual ~ITask() = default;
    ITask(ITask&& other) = default;
    ITask& operator = (ITask&& other) = default;

    /*!
     * interface to run a task
     */
    virtual void execute() = 0;

    std::thread::id getID() const {
        return _id;
    }

    void setID(const std::thread::id& id) {
        _id = id;
    }

    void setOrder(size_t order) { _orderNumbers = std::vector<size_t>{order}; }

    size_t getOrder(const size_t nth) const {
        return _orderNumbers.at(nth);
    }

    std::vector<size_t> getOrder() const { return _orderNumbers; }

    void setOrder(const std::vector<size_t>& order) {
        _orderNumbers = order;
    }

    /*!
     * lexicographic comparison of the ordering numbers of two tasks
     * @param other
     * @return true if this task comes before other
     */
    bool compareAscOrder(const ITask& other) const {
        for(size_t i = 0; i < _orderNumbers.size() && i < other._orderNumbers.size(); ++i) {
            if(_orderNumbers[i] != other._orderNumbers[i])
                return _orderNumbers[i] < other._orderNumbers[i];
        }
        return _orderNumbers.size() < other._orderNumbers.size();
    }
};
}
#endif //SKEIN_ITASK_H
