#pragma once

#include <string>
#include <unordered_map>

namespace automflow {
namespace engine {

/**
 * Worker slot accounting for the scheduler
 *
 * Tracks the global active count against a global cap and one active count per
 * batch. tryAcquire() and release() always move both counters together, so
 * every exit path of an execution gives back exactly what it took.
 *
 * Not synchronized: the owning ExecutionManager calls it under its own mutex.
 */
class WorkerAdmission {
public:
    explicit WorkerAdmission(int globalLimit);

    /**
     * Take one slot for batchId (empty for single runs, which only count
     * globally when admitted through here). Returns false if either the global
     * cap or batchLimit is reached.
     */
    bool tryAcquire(const std::string& batchId, int batchLimit);

    /**
     * Check without taking
     */
    bool canAcquire(const std::string& batchId, int batchLimit) const;

    /**
     * Give back one slot previously taken for batchId
     */
    void release(const std::string& batchId);

    int active() const { return m_active; }
    int activeFor(const std::string& batchId) const;
    int globalLimit() const { return m_globalLimit; }

private:
    int m_globalLimit;
    int m_active = 0;
    std::unordered_map<std::string, int> m_perBatch;
};

} // namespace engine
} // namespace automflow
