#pragma once

#include <cstdint>
#include <functional>

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QObject>
#include <QString>

namespace phicore::samsungtv::ipc {

class HttpClient;

enum class PingResult {
    Reachable,
    Unreachable,
    Unavailable
};

struct JsonFetch {
    bool ok = false;
    QJsonObject body;
    QString error;
};

struct TextFetch {
    bool ok = false;
    QByteArray body;
    QString error;
};

// One-shot timed network primitives. Every callback fires exactly once.
class NetworkProbes
{
public:
    virtual ~NetworkProbes() = default;

    virtual void checkPort(const QString &ip, int port, int timeoutMs, std::function<void(bool)> done) = 0;
    virtual void fetchJson(const QString &url, int timeoutMs, std::function<void(const JsonFetch &)> done) = 0;
    virtual void fetchText(const QString &url, int timeoutMs, std::function<void(const TextFetch &)> done) = 0;
    virtual void ping(const QString &ip, int timeoutMs, std::function<void(PingResult)> done) = 0;
    virtual void macForIp(const QString &ip, std::function<void(const QString &)> done) = 0;
    virtual void ipForMac(const QString &mac, std::function<void(const QString &)> done) = 0;
    virtual bool sendWakeOnLan(const QString &mac, QString *error = nullptr) = 0;
    virtual QString localAddressFor(const QString &targetIp) = 0;
};

// "ip neigh" output -> mac -> ip.
QHash<QString, QString> parseNeighbourTable(const QString &text);
// "arp -an" output -> mac -> ip.
QHash<QString, QString> parseArpTable(const QString &text);
// MAC from "ip neigh show <ip>" or "arp -n <ip>" output.
QString parseMacFromNeighbourLine(const QString &text);
QString parseMacFromArpLine(const QString &text);

QByteArray buildMagicPacket(const QString &mac, QString *error = nullptr);

class SystemNetworkProbes final : public NetworkProbes
{
public:
    explicit SystemNetworkProbes(HttpClient *http);
    ~SystemNetworkProbes() override;

    void checkPort(const QString &ip, int port, int timeoutMs, std::function<void(bool)> done) override;
    void fetchJson(const QString &url, int timeoutMs, std::function<void(const JsonFetch &)> done) override;
    void fetchText(const QString &url, int timeoutMs, std::function<void(const TextFetch &)> done) override;
    void ping(const QString &ip, int timeoutMs, std::function<void(PingResult)> done) override;
    void macForIp(const QString &ip, std::function<void(const QString &)> done) override;
    void ipForMac(const QString &mac, std::function<void(const QString &)> done) override;
    bool sendWakeOnLan(const QString &mac, QString *error = nullptr) override;
    QString localAddressFor(const QString &targetIp) override;

private:
    struct ProcessOutput {
        bool started = false;
        int exitCode = -1;
        QByteArray stdOut;
    };

    void runProcess(const QString &program,
                           const QStringList &args,
                           int timeoutMs,
                           std::function<void(const ProcessOutput &)> done);

    void refreshNeighbourTable(std::function<void()> done);

    HttpClient *m_http = nullptr;
    // Parent of sockets and processes in flight.
    QObject m_scope;
    bool m_pingUnavailable = false;
    QHash<QString, QString> m_ipByMac;
    std::int64_t m_ipByMacTs = 0;
};

} // namespace phicore::samsungtv::ipc
