//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ee/IBackend.h>
#include <algorithm>

namespace skein {

    void IBackend::subscribe(const std::shared_ptr<IBackendListener> &listener) {
        if(!listener)
            return;
        std::unique_lock<boost::shared_mutex> lock(_listenerMutex);
        _listeners.push_back(listener);
    }

    void IBackend::unsubscribe(const IBackendListener *listener) {
        std::unique_lock<boost::shared_mutex> lock(_listenerMutex);
        _listeners.erase(std::remove_if(_listeners.begin(), _listeners.end(),
                                        [listener](const std::weak_ptr<IBackendListener>& l) {
            auto p = l.lock();
            return !p || p.get() == listener;
        }), _listeners.end());
    }

    std::vector<std::shared_ptr<IBackendListener>> IBackend::listeners() {
        boost::shared_lock<boost::shared_mutex> lock(_listenerMutex);
        std::vector<std::shared_ptr<IBackendListener>> res;
        for(const auto& l : _listeners) {
            auto p = l.lock();
            if(p)
                res.push_back(p);
        }
        return res;
    }

    void IBackend::notifyCapacityChanged(const ResourceSummary &capacity) {
        for(const auto& l : listeners())
            l->onCapacityChanged(capacity);
    }

    void IBackend::notifyWorkerLost(const std::string &worker, const std::vector<PartitionID> &partitions) {
        for(const auto& l : listeners())
            l->onWorkerLost(worker, partitions);
    }
}
