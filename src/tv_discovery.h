#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QHash>
#include <QList>
#include <QObject>
#include <QString>

#include "tv_types.h"

namespace phicore::samsungtv::ipc {

class DeviceClassifier;

using CandidateList = QList<DiscoveredCandidate>;

// A time-boxed, best-effort source of raw candidate records.
class DiscoveryTransport
{
public:
    virtual ~DiscoveryTransport() = default;

    virtual QString name() const = 0;
    virtual void discover(int timeoutMs, std::function<void(const CandidateList &)> done) = 0;
};

// Merges raw records by IP. Sources are unioned and populated fields are
// never replaced with empty ones. Order follows first appearance.
CandidateList mergeCandidates(const CandidateList &raw);

class DiscoveryAggregator
{
public:
    using Callback = std::function<void(const CandidateList &)>;

    DiscoveryAggregator(DeviceClassifier *classifier, std::function<std::int64_t()> clock);

    void setTransports(QList<DiscoveryTransport *> transports);

    // Callers arriving while a scan runs are attached to that scan.
    void scan(int timeoutMs, Callback done);

    bool isRunning() const { return m_running; }
    CandidateList discovered() const;
    std::optional<DiscoveredCandidate> discoveredForIp(const QString &ip) const;
    // Results are kept per IP across scans; a newer record replaces an older one.
    void remember(const DiscoveredCandidate &candidate);
    std::int64_t lastScan() const { return m_lastScan; }

private:
    struct ScanState {
        int pendingTransports = 0;
        CandidateList raw;
    };

    void classifyAll(const CandidateList &merged);
    void finish(const CandidateList &results);

    DeviceClassifier *m_classifier = nullptr;
    std::function<std::int64_t()> m_clock;
    QList<DiscoveryTransport *> m_transports;

    bool m_running = false;
    QList<Callback> m_waiters;
    std::shared_ptr<ScanState> m_scan;

    QList<QString> m_order;
    QHash<QString, DiscoveredCandidate> m_byIp;
    std::int64_t m_lastScan = 0;
    QObject m_scope;
};

} // namespace phicore::samsungtv::ipc
