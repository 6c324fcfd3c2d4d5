//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#include <ResourceRequest.h>
#include <Utils.h>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace skein {

    static const double epsilon = 1e-9;

    static int64_t toMilli(double amount) {
        return static_cast<int64_t>(std::llround(amount * 1000.0));
    }

    static int64_t memoryOf(const ResourceRequest& request) {
        return static_cast<int64_t>(request.memoryBytes().value_or(0));
    }

    bool ResourceRequest::valid() const {
        if(!std::isfinite(_numCPUs) || !std::isfinite(_numGPUs))
            return false;
        return _numCPUs >= 0.0 && _numGPUs >= 0.0;
    }

    ResourceRequest ResourceRequest::max(const ResourceRequest &a, const ResourceRequest &b) {
        option<size_t> memory;
        if(a.memoryBytes().has_value() && b.memoryBytes().has_value())
            memory = std::max(a.memoryBytes().value(), b.memoryBytes().value());
        else if(a.memoryBytes().has_value())
            memory = a.memoryBytes();
        else if(b.memoryBytes().has_value())
            memory = b.memoryBytes();
        return ResourceRequest(std::max(a.numCPUs(), b.numCPUs()), std::max(a.numGPUs(), b.numGPUs()), memory);
    }

    std::string ResourceRequest::toString() const {
        std::stringstream ss;
        ss<<"{cpus: "<<_numCPUs<<", gpus: "<<_numGPUs;
        if(_memoryBytes.has_value())
            ss<<", memory: "<<sizeToMemString(_memoryBytes.value());
        ss<<"}";
        return ss.str();
    }

    bool ResourceSummary::fits(const ResourceRequest &request) const {
        if(request.numCPUs() > cpus + epsilon)
            return false;
        if(request.numGPUs() > gpus + epsilon)
            return false;
        if(request.memoryBytes().has_value() && request.memoryBytes().value() > memory)
            return false;
        return true;
    }

    ResourceSummary& ResourceSummary::operator+=(const ResourceSummary &other) {
        cpus += other.cpus;
        gpus += other.gpus;
        memory += other.memory;
        return *this;
    }

    ResourceSummary& ResourceSummary::operator-=(const ResourceRequest &request) {
        cpus = std::max(0.0, cpus - request.numCPUs());
        gpus = std::max(0.0, gpus - request.numGPUs());
        auto m = request.memoryBytes().value_or(0);
        memory = memory > m ? memory - m : 0;
        return *this;
    }

    ResourceSummary& ResourceSummary::operator+=(const ResourceRequest &request) {
        cpus += request.numCPUs();
        gpus += request.numGPUs();
        memory += request.memoryBytes().value_or(0);
        return *this;
    }

    std::string ResourceSummary::toString() const {
        std::stringstream ss;
        ss<<"{cpus: "<<cpus<<", gpus: "<<gpus<<", memory: "<<sizeToMemString(memory)<<"}";
        return ss.str();
    }

    bool isSatisfiable(const ResourceRequest &request, const std::vector<WorkerClass> &classes) {
        if(!request.valid())
            return false;
        for(const auto& wc : classes) {
            if(wc.maxWorkers > 0 && wc.resources.fits(request))
                return true;
        }
        return false;
    }

    ResourceBudget::ResourceBudget(const ResourceSummary &capacity) {
        _capacityMilliCPUs = toMilli(capacity.cpus);
        _capacityMilliGPUs = toMilli(capacity.gpus);
        _capacityMemory = static_cast<int64_t>(capacity.memory);
        _milliCPUs = _capacityMilliCPUs.load();
        _milliGPUs = _capacityMilliGPUs.load();
        _memory = _capacityMemory.load();
    }

    bool ResourceBudget::tryAcquire(const ResourceRequest &request) {
        auto cpus = toMilli(request.numCPUs());
        auto gpus = toMilli(request.numGPUs());
        auto memory = memoryOf(request);

        // take all three, give back if one went negative
        bool ok = true;
        if(_milliCPUs.fetch_sub(cpus) - cpus < 0)
            ok = false;
        if(_milliGPUs.fetch_sub(gpus) - gpus < 0)
            ok = false;
        if(_memory.fetch_sub(memory) - memory < 0)
            ok = false;

        if(!ok) {
            _milliCPUs.fetch_add(cpus);
            _milliGPUs.fetch_add(gpus);
            _memory.fetch_add(memory);
        }
        return ok;
    }

    void ResourceBudget::release(const ResourceRequest &request) {
        _milliCPUs.fetch_add(toMilli(request.numCPUs()));
        _milliGPUs.fetch_add(toMilli(request.numGPUs()));
        _memory.fetch_add(memoryOf(request));
    }

    void ResourceBudget::resize(const ResourceSummary &capacity) {
        auto cpus = toMilli(capacity.cpus);
        auto gpus = toMilli(capacity.gpus);
        auto memory = static_cast<int64_t>(capacity.memory);
        _milliCPUs.fetch_add(cpus - _capacityMilliCPUs.exchange(cpus));
        _milliGPUs.fetch_add(gpus - _capacityMilliGPUs.exchange(gpus));
        _memory.fetch_add(memory - _capacityMemory.exchange(memory));
    }

    ResourceSummary ResourceBudget::available() const {
        return ResourceSummary(std::max<int64_t>(0, _milliCPUs.load()) / 1000.0,
                               std::max<int64_t>(0, _milliGPUs.load()) / 1000.0,
                               static_cast<size_t>(std::max<int64_t>(0, _memory.load())));
    }

    ResourceSummary ResourceBudget::capacity() const {
        return ResourceSummary(_capacityMilliCPUs.load() / 1000.0,
                               _capacityMilliGPUs.load() / 1000.0,
                               static_cast<size_t>(_capacityMemory.load()));
    }
}
