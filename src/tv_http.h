#pragma once

#include <functional>

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QSet>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;
class QNetworkRequest;

namespace phicore::samsungtv::ipc {

struct HttpResult {
    bool ok = false;
    bool timedOut = false;
    int statusCode = 0;
    QByteArray payload;
    // Response headers, keys lower-cased.
    QHash<QByteArray, QByteArray> headers;
    QString error;
};

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

class HttpClient
{
public:
    using Callback = std::function<void(const HttpResult &)>;

    explicit HttpClient(QNetworkAccessManager *manager);
    // Aborts requests still in flight without invoking their callbacks.
    virtual ~HttpClient();

    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    void get(const QUrl &url, int timeoutMs, Callback callback) const;
    bool hasPending() const { return !m_inFlight.isEmpty(); }

    void postJson(const QUrl &url,
                  const QByteArray &payload,
                  int timeoutMs,
                  Callback callback) const;

    // Arbitrary verbs (SUBSCRIBE, UNSUBSCRIBE, DELETE) go through here too;
    // get() and postJson() are built on it.
    virtual void send(const QByteArray &method,
              const QUrl &url,
              const HttpHeaders &headers,
              const QByteArray &payload,
              int timeoutMs,
              Callback callback) const;

private:
    QNetworkRequest buildRequest(const QUrl &url, const HttpHeaders &headers) const;

    QNetworkAccessManager *m_manager = nullptr;
    mutable QSet<QNetworkReply *> m_inFlight;
};

} // namespace phicore::samsungtv::ipc
