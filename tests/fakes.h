#pragma once

#include <functional>
#include <utility>

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QVariant>

#include "tv_adapter.h"
#include "tv_discovery.h"
#include "tv_host.h"
#include "tv_http.h"
#include "tv_netprobe.h"

namespace phicore::samsungtv::ipc::testing {

// Answers every probe synchronously from the tables below. With deferJson
// set, JSON fetches wait in deferred until releaseDeferred().
class FakeProbes final : public NetworkProbes
{
public:
    void checkPort(const QString &ip, int port, int timeoutMs, std::function<void(bool)> done) override
    {
        Q_UNUSED(timeoutMs);
        const QString key = QStringLiteral("%1:%2").arg(ip).arg(port);
        portChecks.append(key);
        done(openPorts.contains(key));
    }

    void fetchJson(const QString &url, int timeoutMs, std::function<void(const JsonFetch &)> done) override
    {
        Q_UNUSED(timeoutMs);
        fetchedUrls.append(url);
        JsonFetch fetch;
        if (json.contains(url)) {
            fetch.ok = true;
            fetch.body = json.value(url);
        } else {
            fetch.error = QStringLiteral("unreachable");
        }
        if (deferJson) {
            deferred.append([fetch, done]() { done(fetch); });
            return;
        }
        done(fetch);
    }

    void releaseDeferred()
    {
        const QList<std::function<void()>> pending = std::exchange(deferred, {});
        for (const auto &callback : pending)
            callback();
    }

    void fetchText(const QString &url, int timeoutMs, std::function<void(const TextFetch &)> done) override
    {
        Q_UNUSED(timeoutMs);
        fetchedUrls.append(url);
        TextFetch fetch;
        if (text.contains(url)) {
            fetch.ok = true;
            fetch.body = text.value(url);
        } else {
            fetch.error = QStringLiteral("unreachable");
        }
        done(fetch);
    }

    void ping(const QString &ip, int timeoutMs, std::function<void(PingResult)> done) override
    {
        Q_UNUSED(timeoutMs);
        done(pingable.contains(ip) ? PingResult::Reachable : PingResult::Unreachable);
    }

    void macForIp(const QString &ip, std::function<void(const QString &)> done) override
    {
        done(macByIp.value(ip));
    }

    void ipForMac(const QString &mac, std::function<void(const QString &)> done) override
    {
        done(ipByMac.value(mac));
    }

    bool sendWakeOnLan(const QString &mac, QString *error = nullptr) override
    {
        if (wolFails) {
            if (error)
                *error = QStringLiteral("socket error");
            return false;
        }
        wolSent.append(mac);
        return true;
    }

    QString localAddressFor(const QString &targetIp) override
    {
        Q_UNUSED(targetIp);
        return QStringLiteral("192.168.1.10");
    }

    QSet<QString> openPorts;
    QHash<QString, QJsonObject> json;
    QHash<QString, QByteArray> text;
    QSet<QString> pingable;
    QHash<QString, QString> macByIp;
    QHash<QString, QString> ipByMac;
    bool wolFails = false;
    bool deferJson = false;
    QList<std::function<void()>> deferred;

    QStringList portChecks;
    QStringList fetchedUrls;
    QStringList wolSent;
};

// Records sent keys; results come from perKey, then defaultResult. Info
// queries answer from infoByIp, or wait in heldInfo while holdInfo is set.
class FakeAdapter final : public ProtocolAdapter
{
public:
    explicit FakeAdapter(ApiKind kind)
        : m_kind(kind)
    {
    }

    ApiKind api() const override { return m_kind; }

    void sendKey(const Device &device, const QString &key, CommandCallback done) override
    {
        sent.append(qMakePair(device.id, key));
        done(perKey.value(key, defaultResult));
    }

    void pair(const Device &device, const QString &pin, PairingCallback done) override
    {
        pairedDevices.append(device);
        pins.append(pin);
        done(pairResult);
    }

    void queryInfo(const Device &device, InfoCallback done) override
    {
        infoQueries.append(device.ip);
        InfoResult result;
        if (infoByIp.contains(device.ip)) {
            result.ok = true;
            result.info = infoByIp.value(device.ip);
        } else {
            result.error = QStringLiteral("unreachable");
        }
        if (holdInfo) {
            heldInfo.append([result, done]() { done(result); });
            return;
        }
        done(result);
    }

    void releaseInfo()
    {
        const QList<std::function<void()>> pending = std::exchange(heldInfo, {});
        for (const auto &callback : pending)
            callback();
    }

    QStringList keys() const
    {
        QStringList out;
        for (const auto &entry : sent)
            out.append(entry.second);
        return out;
    }

    CommandResult defaultResult = CommandResult::success();
    QHash<QString, CommandResult> perKey;
    PairingResult pairResult;
    QHash<QString, QJsonObject> infoByIp;
    bool holdInfo = false;
    QList<std::function<void()>> heldInfo;

    QList<QPair<QString, QString>> sent;
    QStringList infoQueries;
    QList<Device> pairedDevices;
    QStringList pins;

private:
    ApiKind m_kind;
};

// Records every request and holds its callback until respond().
class FakeHttpClient final : public HttpClient
{
public:
    struct Request {
        QByteArray method;
        QUrl url;
        HttpHeaders headers;
        QByteArray payload;
        Callback callback;

        QByteArray header(const QByteArray &name) const
        {
            for (const auto &entry : headers) {
                if (entry.first.compare(name, Qt::CaseInsensitive) == 0)
                    return entry.second;
            }
            return {};
        }
    };

    FakeHttpClient()
        : HttpClient(nullptr)
    {
    }

    void send(const QByteArray &method,
              const QUrl &url,
              const HttpHeaders &headers,
              const QByteArray &payload,
              int timeoutMs,
              Callback callback) const override
    {
        Q_UNUSED(timeoutMs);
        requests.append(Request { method, url, headers, payload, std::move(callback) });
    }

    void respond(int index, const HttpResult &result)
    {
        const Callback callback = requests.at(index).callback;
        callback(result);
    }

    static HttpResult granted(const QByteArray &sid, const QByteArray &timeout)
    {
        HttpResult result;
        result.ok = true;
        result.statusCode = 200;
        result.headers.insert("sid", sid);
        result.headers.insert("timeout", timeout);
        return result;
    }

    static HttpResult failed(const QString &error)
    {
        HttpResult result;
        result.error = error;
        return result;
    }

    QList<QByteArray> methods() const
    {
        QList<QByteArray> out;
        for (const Request &request : requests)
            out.append(request.method);
        return out;
    }

    mutable QList<Request> requests;
};

class FakeTransport final : public DiscoveryTransport
{
public:
    QString name() const override { return QStringLiteral("fake"); }

    void discover(int timeoutMs, std::function<void(const CandidateList &)> done) override
    {
        Q_UNUSED(timeoutMs);
        ++scans;
        done(batch);
    }

    CandidateList batch;
    int scans = 0;
};

class FakeHost final : public HostBridge
{
public:
    void persistDevices(const QJsonArray &devices) override
    {
        persistedDevices = devices;
        ++devicePersists;
    }

    void persistSecrets(const QString &blob) override
    {
        persistedSecrets = blob;
        ++secretPersists;
    }

    void persistDeviceTrees(const QHash<QString, QString> &trees) override { persistedTrees = trees; }

    void ensureDeviceTree(const Device &device) override { trees.insert(device.name); }

    void removeDeviceTree(const QString &name) override
    {
        trees.remove(name);
        states.remove(name);
        removed.append(name);
    }

    void migrateDeviceTree(const QString &oldName, const Device &device) override
    {
        migrations.append(qMakePair(oldName, device.name));
        trees.insert(device.name);
        states.insert(device.name, states.value(oldName));
        if (oldName != device.name) {
            trees.remove(oldName);
            states.remove(oldName);
        }
    }

    void setState(const QString &deviceName, const QString &channelId, const QVariant &value) override
    {
        states[deviceName].insert(channelId, value);
    }

    void reportError(const QString &message) override { errors.append(message); }

    QVariant state(const QString &deviceName, const QString &channelId) const
    {
        return states.value(deviceName).value(channelId);
    }

    bool hasState(const QString &deviceName, const QString &channelId) const
    {
        return states.value(deviceName).contains(channelId);
    }

    QSet<QString> trees;
    QHash<QString, QHash<QString, QVariant>> states;
    QStringList removed;
    QList<QPair<QString, QString>> migrations;
    QStringList errors;

    QJsonArray persistedDevices;
    int devicePersists = 0;
    QString persistedSecrets;
    int secretPersists = 0;
    QHash<QString, QString> persistedTrees;
};

} // namespace phicore::samsungtv::ipc::testing
