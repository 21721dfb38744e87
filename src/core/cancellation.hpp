#pragma once

#include <atomic>

namespace sysmend {

// Checked between sub-steps and between batch members, never mid-step.
class CancellationToken
{
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }
    void reset() { m_cancelled.store(false); }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace sysmend
