#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

class QThreadPool;

namespace sysmend {

// Zero-argument fact query. Throwing marks the fact as failed.
using FactQuery = std::function<FactValue()>;
using FactSource = std::map<std::string, FactQuery>;

// Computed from already-resolved facts after the concurrent phase.
struct DerivedFact {
    std::string key;
    std::vector<std::string> inputs;
    std::function<FactValue(const FactMap &inputs)> compute;
};

struct ProberOptions {
    int maxConcurrency = 8;
    std::chrono::milliseconds probeTimeout{5000};
    // How long the destructor waits for abandoned units before leaving them
    // to finish on their own.
    std::chrono::milliseconds shutdownGrace{2000};
    std::function<std::chrono::steady_clock::time_point()> clock;
};

// Time left before the deadline of the probe running the calling query, or
// nullopt outside a probe unit. Queries that block pass it on to their own
// waits so an abandoned unit gives its worker back promptly.
std::optional<std::chrono::milliseconds> remainingProbeTime();

/**
 * FactProber runs fact queries on a bounded worker pool, each bounded by a
 * shared deadline, and owns the process-wide snapshot cache.
 *
 * probe() never throws for query failures: timeouts, exceptions and unknown
 * keys are recorded per fact inside the returned snapshot.
 */
class FactProber
{
public:
    FactProber(FactSource source, std::vector<DerivedFact> derived,
               ProberOptions options = ProberOptions());
    ~FactProber();

    FactProber(const FactProber &) = delete;
    FactProber &operator=(const FactProber &) = delete;

    SnapshotPtr probe(const std::set<std::string> &keys,
                      std::chrono::milliseconds timeout);

    // Returns the cached snapshot while it is fresh, otherwise refreshes it
    // with a single in-flight probe shared by all concurrent callers.
    SnapshotPtr getCached(const std::set<std::string> &keys,
                          std::chrono::milliseconds ttl);

    void invalidate();

    std::shared_ptr<const CacheEntry> cacheEntry() const;
    std::set<std::string> knownKeys() const;
    // Raw and derived keys this prober can resolve.
    std::set<std::string> availableKeys() const;
    int probeCount() const;

private:
    struct ProbeBoard;

    std::chrono::steady_clock::time_point now() const;
    std::set<std::string> expandDerivedInputs(const std::set<std::string> &keys) const;
    void computeDerived(const std::set<std::string> &requested, FactMap &facts) const;
    bool isFresh(const CacheEntry &entry, std::chrono::milliseconds ttl,
                 const std::set<std::string> &keys) const;

    FactSource m_source;
    std::map<std::string, DerivedFact> m_derived;
    ProberOptions m_options;
    std::unique_ptr<QThreadPool> m_pool;

    std::shared_ptr<const CacheEntry> m_entry;

    mutable std::mutex m_flightMutex;
    std::set<std::string> m_knownKeys;
    std::shared_future<SnapshotPtr> m_inFlight;
    bool m_refreshing = false;
    bool m_invalidated = false;

    std::atomic<int> m_probeCount{0};
};

} // namespace sysmend
