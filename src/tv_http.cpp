#include "tv_http.h"

#include <memory>
#include <utility>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

namespace phicore::samsungtv::ipc {

HttpClient::HttpClient(QNetworkAccessManager *manager)
    : m_manager(manager)
{
}

HttpClient::~HttpClient()
{
    const QSet<QNetworkReply *> pending = std::exchange(m_inFlight, {});
    for (QNetworkReply *reply : pending) {
        QObject::disconnect(reply, nullptr, nullptr, nullptr);
        reply->abort();
        reply->deleteLater();
    }
}

void HttpClient::get(const QUrl &url, int timeoutMs, Callback callback) const
{
    send(QByteArrayLiteral("GET"), url, {}, {}, timeoutMs, std::move(callback));
}

void HttpClient::postJson(const QUrl &url,
                          const QByteArray &payload,
                          int timeoutMs,
                          Callback callback) const
{
    HttpHeaders headers;
    headers.append({ QByteArrayLiteral("Content-Type"), QByteArrayLiteral("application/json") });
    send(QByteArrayLiteral("POST"), url, headers, payload, timeoutMs, std::move(callback));
}

void HttpClient::send(const QByteArray &method,
                      const QUrl &url,
                      const HttpHeaders &headers,
                      const QByteArray &payload,
                      int timeoutMs,
                      Callback callback) const
{
    if (!m_manager) {
        HttpResult result;
        result.error = QStringLiteral("Network manager unavailable");
        callback(result);
        return;
    }
    if (!url.isValid() || url.host().isEmpty()) {
        HttpResult result;
        result.error = QStringLiteral("Invalid URL");
        callback(result);
        return;
    }

    const QNetworkRequest request = buildRequest(url, headers);
    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET"))
        reply = m_manager->get(request);
    else if (method == QByteArrayLiteral("POST"))
        reply = m_manager->post(request, payload);
    else
        reply = m_manager->sendCustomRequest(request, method, payload);

    if (!reply) {
        HttpResult result;
        result.error = QStringLiteral("Failed to create network request");
        callback(result);
        return;
    }

    m_inFlight.insert(reply);
    auto timedOut = std::make_shared<bool>(false);
    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply, timedOut]() {
        *timedOut = true;
        reply->abort();
    });

    QObject::connect(reply, &QNetworkReply::finished, reply, [this, reply, timedOut, callback]() {
        m_inFlight.remove(reply);
        HttpResult result;
        result.timedOut = *timedOut;
        result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        result.payload = reply->readAll();
        for (const QNetworkReply::RawHeaderPair &header : reply->rawHeaderPairs())
            result.headers.insert(header.first.toLower(), header.second);

        if (result.timedOut) {
            result.error = QStringLiteral("Request timed out");
        } else if (reply->error() != QNetworkReply::NoError && result.statusCode == 0) {
            result.error = reply->errorString();
        } else if (result.statusCode >= 200 && result.statusCode < 300) {
            result.ok = true;
        } else {
            result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
        }

        reply->deleteLater();
        callback(result);
    });

    timer->start(timeoutMs > 0 ? timeoutMs : 10000);
}

QNetworkRequest HttpClient::buildRequest(const QUrl &url, const HttpHeaders &headers) const
{
    QNetworkRequest out(url);
    out.setRawHeader("User-Agent", "phi-adapter-samsungtv-ipc/1.0");
    out.setTransferTimeout(0);
    for (const auto &header : headers)
        out.setRawHeader(header.first, header.second);

#if QT_CONFIG(ssl)
    if (url.scheme() == QLatin1String("https")) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        out.setSslConfiguration(ssl);
    }
#endif

    return out;
}

} // namespace phicore::samsungtv::ipc
