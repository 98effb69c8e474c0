#include "engine/WorkerAdmission.hpp"
#include "server/Logger.hpp"
#include <algorithm>

namespace automflow {
namespace engine {

WorkerAdmission::WorkerAdmission(int globalLimit)
    : m_globalLimit(std::max(1, globalLimit))
{}

bool WorkerAdmission::canAcquire(const std::string& batchId, int batchLimit) const {
    if (m_active >= m_globalLimit) {
        return false;
    }
    if (!batchId.empty() && activeFor(batchId) >= std::max(1, batchLimit)) {
        return false;
    }
    return true;
}

bool WorkerAdmission::tryAcquire(const std::string& batchId, int batchLimit) {
    if (!canAcquire(batchId, batchLimit)) {
        return false;
    }
    ++m_active;
    if (!batchId.empty()) {
        ++m_perBatch[batchId];
    }
    return true;
}

void WorkerAdmission::release(const std::string& batchId) {
    if (m_active <= 0) {
        LOG_WARN("Worker release without matching acquire (batch: " + batchId + ")");
        return;
    }
    --m_active;

    if (batchId.empty()) {
        return;
    }
    auto it = m_perBatch.find(batchId);
    if (it == m_perBatch.end()) {
        LOG_WARN("Worker release for unknown batch " + batchId);
        return;
    }
    if (--it->second <= 0) {
        m_perBatch.erase(it);
    }
}

int WorkerAdmission::activeFor(const std::string& batchId) const {
    auto it = m_perBatch.find(batchId);
    return it != m_perBatch.end() ? it->second : 0;
}

} // namespace engine
} // namespace automflow
