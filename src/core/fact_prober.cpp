#include "core/fact_prober.hpp"

#include <condition_variable>
#include <exception>
#include <utility>

#include <QRunnable>
#include <QThreadPool>

#include "common/logging.hpp"

namespace sysmend {

namespace {

constexpr const char *kTimeoutError = "timeout";
constexpr const char *kUnknownFactError = "unknown fact";

std::string makeSnapshotId(std::chrono::system_clock::time_point timestamp, int sequence)
{
    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                             timestamp.time_since_epoch())
                             .count();
    return "snapshot-" + std::to_string(epochMs) + "-" + std::to_string(sequence);
}

nlohmann::json keysToJson(const std::set<std::string> &keys)
{
    return nlohmann::json(std::vector<std::string>(keys.begin(), keys.end()));
}

thread_local std::optional<std::chrono::steady_clock::time_point> t_probeDeadline;

// Publishes the probe deadline to the query running on this worker thread.
class DeadlineScope
{
public:
    explicit DeadlineScope(std::chrono::steady_clock::time_point deadline)
    {
        t_probeDeadline = deadline;
    }
    ~DeadlineScope() { t_probeDeadline.reset(); }

    DeadlineScope(const DeadlineScope &) = delete;
    DeadlineScope &operator=(const DeadlineScope &) = delete;
};

} // namespace

std::optional<std::chrono::milliseconds> remainingProbeTime()
{
    if (!t_probeDeadline) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *t_probeDeadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

struct FactProber::ProbeBoard {
    std::mutex mutex;
    std::condition_variable done;
    FactMap results;
    size_t pending = 0;
    bool abandoned = false;
    // Units executing a query, and those among them whose pool slot was
    // handed back when the probe gave up on them.
    std::set<std::string> running;
    std::set<std::string> released;
};

FactProber::FactProber(FactSource source, std::vector<DerivedFact> derived,
                       ProberOptions options)
    : m_source(std::move(source))
    , m_options(std::move(options))
    , m_pool(std::make_unique<QThreadPool>())
{
    for (auto &fact : derived) {
        const std::string key = fact.key;
        m_derived[key] = std::move(fact);
    }
    if (m_options.maxConcurrency < 1) {
        m_options.maxConcurrency = 1;
    }
    m_pool->setMaxThreadCount(m_options.maxConcurrency);
}

FactProber::~FactProber()
{
    m_pool->clear();
    if (m_pool->waitForDone(static_cast<int>(m_options.shutdownGrace.count()))) {
        return;
    }

    // A query that never returns cannot be joined. Its unit holds a raw
    // pointer to the pool, so the pool is left alive for it.
    SMLOG_WARN(QStringLiteral("FactProber"),
               QStringLiteral("~FactProber"),
               QStringLiteral("workers_outlived_prober"),
               QStringLiteral("query_ignored_deadline"),
               QStringLiteral("detach_pool"),
               sysmend::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"activeThreads", m_pool->activeThreadCount()},
                               {"graceMs", m_options.shutdownGrace.count()}}));
    static_cast<void>(m_pool.release());
}

std::chrono::steady_clock::time_point FactProber::now() const
{
    if (m_options.clock) {
        return m_options.clock();
    }
    return std::chrono::steady_clock::now();
}

std::set<std::string> FactProber::expandDerivedInputs(const std::set<std::string> &keys) const
{
    std::set<std::string> expanded;
    std::vector<std::string> pending(keys.begin(), keys.end());
    while (!pending.empty()) {
        const std::string key = pending.back();
        pending.pop_back();
        if (!expanded.insert(key).second) {
            continue;
        }
        const auto it = m_derived.find(key);
        if (it != m_derived.end()) {
            pending.insert(pending.end(), it->second.inputs.begin(), it->second.inputs.end());
        }
    }
    return expanded;
}

void FactProber::computeDerived(const std::set<std::string> &requested, FactMap &facts) const
{
    std::set<std::string> visiting;

    std::function<void(const std::string &)> computeOne = [&](const std::string &key) {
        if (facts.count(key) != 0) {
            return;
        }
        const auto it = m_derived.find(key);
        if (it == m_derived.end()) {
            return;
        }
        const auto stamp = std::chrono::system_clock::now();
        if (!visiting.insert(key).second) {
            facts[key] = Fact::failed(key, "cyclic derived fact", stamp);
            return;
        }

        const DerivedFact &derived = it->second;
        FactMap inputs;
        for (const auto &input : derived.inputs) {
            computeOne(input);
            const auto found = facts.find(input);
            if (found == facts.end() || !found->second.ok() || !found->second.hasValue()) {
                facts[key] = Fact::failed(key, "missing input: " + input, stamp);
                return;
            }
            inputs.emplace(input, found->second);
        }

        try {
            facts[key] = Fact::resolved(key, derived.compute(inputs), stamp);
        } catch (const std::exception &ex) {
            facts[key] = Fact::failed(key, ex.what(), stamp);
        } catch (...) {
            facts[key] = Fact::failed(key, "unknown exception", stamp);
        }
    };

    for (const auto &key : requested) {
        computeOne(key);
    }
}

SnapshotPtr FactProber::probe(const std::set<std::string> &keys,
                              std::chrono::milliseconds timeout)
{
    const int sequence = ++m_probeCount;
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + timeout;
    const std::set<std::string> expanded = expandDerivedInputs(keys);

    SMLOG_DEBUG(QStringLiteral("FactProber"),
                QStringLiteral("probe"),
                QStringLiteral("probe_start"),
                QStringLiteral("fact_request"),
                QStringLiteral("thread_pool"),
                sysmend::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"keys", keysToJson(expanded)},
                                {"timeoutMs", timeout.count()},
                                {"workers", m_options.maxConcurrency}}));

    auto board = std::make_shared<ProbeBoard>();
    FactMap facts;

    {
        std::lock_guard<std::mutex> lock(board->mutex);
        for (const auto &key : expanded) {
            if (m_source.count(key) != 0) {
                ++board->pending;
            }
        }
    }

    for (const auto &key : expanded) {
        const auto it = m_source.find(key);
        if (it == m_source.end()) {
            if (m_derived.count(key) == 0) {
                facts[key] = Fact::failed(key, kUnknownFactError,
                                          std::chrono::system_clock::now());
            }
            continue;
        }

        FactQuery query = it->second;
        QThreadPool *pool = m_pool.get();
        m_pool->start(QRunnable::create([board, key, query, pool, deadline]() {
            {
                std::lock_guard<std::mutex> lock(board->mutex);
                if (board->abandoned) {
                    return;
                }
                board->running.insert(key);
            }

            Fact fact;
            {
                DeadlineScope scope(deadline);
                try {
                    fact = Fact::resolved(key, query(), std::chrono::system_clock::now());
                } catch (const std::exception &ex) {
                    fact = Fact::failed(key, ex.what(), std::chrono::system_clock::now());
                } catch (...) {
                    fact = Fact::failed(key, "unknown exception", std::chrono::system_clock::now());
                }
            }

            std::lock_guard<std::mutex> lock(board->mutex);
            board->running.erase(key);
            if (board->released.erase(key) != 0) {
                // Take back the slot handed out when this unit was abandoned.
                pool->reserveThread();
            }
            if (board->abandoned) {
                return;
            }
            board->results[key] = std::move(fact);
            if (--board->pending == 0) {
                board->done.notify_all();
            }
        }));
    }

    {
        std::unique_lock<std::mutex> lock(board->mutex);
        board->done.wait_until(lock, deadline, [&board] { return board->pending == 0; });
        board->abandoned = true;
        // Late units keep running but no longer count against the pool, so
        // the next probe is not starved by them.
        for (const auto &key : board->running) {
            board->released.insert(key);
            m_pool->releaseThread();
        }
        for (auto &item : board->results) {
            facts[item.first] = item.second;
        }
    }

    std::vector<std::string> timedOut;
    for (const auto &key : expanded) {
        if (m_source.count(key) != 0 && facts.count(key) == 0) {
            facts[key] = Fact::failed(key, kTimeoutError, std::chrono::system_clock::now());
            timedOut.push_back(key);
        }
    }

    computeDerived(expanded, facts);

    const auto capturedAt = std::chrono::system_clock::now();
    auto snapshot = std::make_shared<const Snapshot>(makeSnapshotId(capturedAt, sequence),
                                                     capturedAt, std::move(facts));

    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();
    if (!timedOut.empty()) {
        SMLOG_WARN(QStringLiteral("FactProber"),
                   QStringLiteral("probe"),
                   QStringLiteral("probe_timeout"),
                   QStringLiteral("deadline_elapsed"),
                   QStringLiteral("abandon_unit"),
                   sysmend::logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"keys", timedOut}, {"timeoutMs", timeout.count()}}));
    }
    SMLOG_INFO(QStringLiteral("FactProber"),
               QStringLiteral("probe"),
               QStringLiteral("probe_complete"),
               QStringLiteral("fact_request"),
               QStringLiteral("thread_pool"),
               sysmend::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"snapshotId", snapshot->id()},
                               {"facts", snapshot->facts().size()},
                               {"elapsedMs", elapsedMs}}));
    return snapshot;
}

bool FactProber::isFresh(const CacheEntry &entry, std::chrono::milliseconds ttl,
                         const std::set<std::string> &keys) const
{
    if (now() - entry.capturedAt > ttl) {
        return false;
    }
    for (const auto &key : keys) {
        if (!entry.snapshot->contains(key)) {
            return false;
        }
    }
    return true;
}

SnapshotPtr FactProber::getCached(const std::set<std::string> &keys,
                                  std::chrono::milliseconds ttl)
{
    std::promise<SnapshotPtr> promise;
    std::set<std::string> toProbe;
    {
        std::unique_lock<std::mutex> lock(m_flightMutex);
        m_knownKeys.insert(keys.begin(), keys.end());

        const auto entry = std::atomic_load(&m_entry);
        if (!m_invalidated && entry && isFresh(*entry, ttl, keys)) {
            return entry->snapshot;
        }

        if (m_refreshing) {
            // Join the refresh already in flight.
            std::shared_future<SnapshotPtr> flight = m_inFlight;
            lock.unlock();
            return flight.get();
        }

        m_refreshing = true;
        m_invalidated = false;
        m_inFlight = promise.get_future().share();
        toProbe = m_knownKeys;
    }

    SMLOG_DEBUG(QStringLiteral("FactProber"),
                QStringLiteral("getCached"),
                QStringLiteral("cache_refresh"),
                QStringLiteral("cache_stale"),
                QStringLiteral("single_flight_probe"),
                sysmend::logging::defaultWho(),
                QString(),
                (nlohmann::json{{"keys", keysToJson(toProbe)}, {"ttlMs", ttl.count()}}));

    // Clears the in-flight marker on every exit path.
    struct FlightReset {
        FactProber *prober;
        ~FlightReset()
        {
            std::lock_guard<std::mutex> lock(prober->m_flightMutex);
            prober->m_refreshing = false;
            prober->m_inFlight = std::shared_future<SnapshotPtr>();
        }
    } flightReset{this};

    try {
        SnapshotPtr snapshot = probe(toProbe, m_options.probeTimeout);
        std::shared_ptr<const CacheEntry> fresh =
            std::make_shared<const CacheEntry>(CacheEntry{snapshot, now(), ttl});
        std::atomic_store(&m_entry, fresh);
        promise.set_value(snapshot);
        return snapshot;
    } catch (const std::exception &ex) {
        // The previous entry stays published.
        SMLOG_ERROR(QStringLiteral("FactProber"),
                    QStringLiteral("getCached"),
                    QStringLiteral("cache_refresh_failed"),
                    QStringLiteral("probe_exception"),
                    QStringLiteral("retain_previous"),
                    sysmend::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
        promise.set_exception(std::current_exception());
        throw;
    } catch (...) {
        SMLOG_ERROR(QStringLiteral("FactProber"),
                    QStringLiteral("getCached"),
                    QStringLiteral("cache_refresh_failed"),
                    QStringLiteral("probe_exception"),
                    QStringLiteral("retain_previous"),
                    sysmend::logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", "unknown exception"}}));
        promise.set_exception(std::current_exception());
        throw;
    }
}

void FactProber::invalidate()
{
    std::lock_guard<std::mutex> lock(m_flightMutex);
    m_invalidated = true;
}

std::shared_ptr<const CacheEntry> FactProber::cacheEntry() const
{
    return std::atomic_load(&m_entry);
}

std::set<std::string> FactProber::knownKeys() const
{
    std::lock_guard<std::mutex> lock(m_flightMutex);
    return m_knownKeys;
}

std::set<std::string> FactProber::availableKeys() const
{
    std::set<std::string> keys;
    for (const auto &item : m_source) {
        keys.insert(item.first);
    }
    for (const auto &item : m_derived) {
        keys.insert(item.first);
    }
    return keys;
}

int FactProber::probeCount() const
{
    return m_probeCount.load();
}

} // namespace sysmend
