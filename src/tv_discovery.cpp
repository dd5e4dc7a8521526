#include "tv_discovery.h"

#include <utility>

#include <QPointer>
#include <QVector>

#include "tv_classifier.h"
#include "tv_log.h"

namespace phicore::samsungtv::ipc {

namespace {

void fillIfEmpty(QString *target, const QString &value)
{
    if (target->isEmpty() && !value.isEmpty())
        *target = value;
}

void mergeInto(DiscoveredCandidate *target, const DiscoveredCandidate &entry)
{
    target->sources.unite(entry.sources);
    fillIfEmpty(&target->id, entry.id);
    fillIfEmpty(&target->mac, entry.mac);
    fillIfEmpty(&target->model, entry.model);
    fillIfEmpty(&target->uuid, entry.uuid);
    fillIfEmpty(&target->name, entry.name);
    fillIfEmpty(&target->manufacturer, entry.manufacturer);
    fillIfEmpty(&target->usn, entry.usn);
    fillIfEmpty(&target->location, entry.location);
    fillIfEmpty(&target->st, entry.st);
    fillIfEmpty(&target->server, entry.server);
    fillIfEmpty(&target->protocol, entry.protocol);
    fillIfEmpty(&target->renderingControlUrl, entry.renderingControlUrl);
    fillIfEmpty(&target->renderingControlEventUrl, entry.renderingControlEventUrl);
    if (target->api == ApiKind::Unknown)
        target->api = entry.api;
    if (target->port <= 0)
        target->port = entry.port;
    if (!target->tokenAuthSupport.has_value())
        target->tokenAuthSupport = entry.tokenAuthSupport;
    if (!target->hjAvailable.has_value())
        target->hjAvailable = entry.hjAvailable;
}

} // namespace

CandidateList mergeCandidates(const CandidateList &raw)
{
    QList<QString> order;
    QHash<QString, DiscoveredCandidate> byIp;
    for (const DiscoveredCandidate &entry : raw) {
        const QString ip = entry.ip.trimmed();
        if (ip.isEmpty())
            continue;
        auto it = byIp.find(ip);
        if (it == byIp.end()) {
            DiscoveredCandidate first = entry;
            first.ip = ip;
            byIp.insert(ip, first);
            order.append(ip);
            continue;
        }
        mergeInto(&it.value(), entry);
    }

    CandidateList out;
    out.reserve(order.size());
    for (const QString &ip : std::as_const(order))
        out.append(byIp.value(ip));
    return out;
}

DiscoveryAggregator::DiscoveryAggregator(DeviceClassifier *classifier, std::function<std::int64_t()> clock)
    : m_classifier(classifier)
    , m_clock(std::move(clock))
{
}

void DiscoveryAggregator::setTransports(QList<DiscoveryTransport *> transports)
{
    m_transports = std::move(transports);
}

void DiscoveryAggregator::scan(int timeoutMs, Callback done)
{
    m_waiters.append(std::move(done));
    if (m_running) {
        qCDebug(tvLog) << "Discovery already running, joining current scan";
        return;
    }
    m_running = true;

    QStringList names;
    for (DiscoveryTransport *transport : std::as_const(m_transports))
        names.append(transport->name());
    qCDebug(tvLog).noquote() << "Discovery started (" << names.join(QLatin1Char(',')) << ") timeout" << timeoutMs << "ms";

    if (m_transports.isEmpty()) {
        finish({});
        return;
    }

    auto state = std::make_shared<ScanState>();
    state->pendingTransports = m_transports.size();
    m_scan = state;

    QPointer<QObject> guard(&m_scope);
    for (DiscoveryTransport *transport : std::as_const(m_transports)) {
        const QString transportName = transport->name();
        transport->discover(timeoutMs, [this, guard, state, transportName](const CandidateList &batch) {
            if (!guard)
                return;
            qCDebug(tvLog) << transportName << "discovery finished:" << batch.size() << "candidates";
            state->raw.append(batch);
            if (--state->pendingTransports > 0)
                return;
            if (m_scan != state)
                return;
            classifyAll(mergeCandidates(state->raw));
        });
    }
}

CandidateList DiscoveryAggregator::discovered() const
{
    CandidateList out;
    for (const QString &ip : m_order)
        out.append(m_byIp.value(ip));
    return out;
}

std::optional<DiscoveredCandidate> DiscoveryAggregator::discoveredForIp(const QString &ip) const
{
    auto it = m_byIp.constFind(ip);
    if (it == m_byIp.constEnd())
        return std::nullopt;
    return it.value();
}

void DiscoveryAggregator::remember(const DiscoveredCandidate &candidate)
{
    if (candidate.ip.isEmpty())
        return;
    if (!m_byIp.contains(candidate.ip))
        m_order.append(candidate.ip);
    m_byIp.insert(candidate.ip, candidate);
}

void DiscoveryAggregator::classifyAll(const CandidateList &merged)
{
    if (merged.isEmpty() || !m_classifier) {
        finish({});
        return;
    }

    struct Pending {
        int remaining = 0;
        QVector<std::optional<DiscoveredCandidate>> results;
    };
    auto pending = std::make_shared<Pending>();
    pending->remaining = merged.size();
    pending->results.resize(merged.size());

    QPointer<QObject> guard(&m_scope);
    for (int i = 0; i < merged.size(); ++i) {
        m_classifier->classify(merged.at(i), [this, guard, pending, i](const std::optional<DiscoveredCandidate> &result) {
            if (!guard)
                return;
            pending->results[i] = result;
            if (--pending->remaining > 0)
                return;
            CandidateList classified;
            for (const auto &entry : std::as_const(pending->results)) {
                if (entry.has_value())
                    classified.append(*entry);
            }
            finish(classified);
        });
    }
}

void DiscoveryAggregator::finish(const CandidateList &results)
{
    for (const DiscoveredCandidate &candidate : results)
        remember(candidate);
    m_lastScan = m_clock ? m_clock() : 0;
    m_running = false;
    m_scan.reset();

    qCDebug(tvLog) << "Discovery finished: classified" << results.size();

    const QList<Callback> waiters = std::exchange(m_waiters, {});
    for (const Callback &waiter : waiters)
        waiter(results);
}

} // namespace phicore::samsungtv::ipc
