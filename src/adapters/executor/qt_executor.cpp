#include "qt_executor.h"
#include "core/log_manager.h"
#include <QNetworkReply>
#include <QPointer>
#include <QTimer>
#include <QUrl>
#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

namespace {

struct PendingState {
    bool resolved = false;
    bool timedOut = false;
};

int statusOf(QNetworkReply* reply)
{
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

}

QtExecutor::QtExecutor(bool insecure)
    : m_nam(std::make_unique<QNetworkAccessManager>())
    , m_insecure(insecure)
{
}

QtExecutor::~QtExecutor() = default;

bool QtExecutor::isIncrementalContentType(const QString& contentType)
{
    return !contentType.contains(QStringLiteral("application/json"), Qt::CaseInsensitive);
}

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};

#if QT_CONFIG(ssl)
    if (m_insecure) {
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        req.setSslConfiguration(ssl);
    }
#endif

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    return req;
}

QNetworkReply* QtExecutor::send(const ProviderRequest& request) {
    QNetworkRequest req = buildQtRequest(request);

    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return m_nam->post(req, request.body);
    if (method == "GET")
        return m_nam->get(req);
    return m_nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

Result<ProviderResponse> QtExecutor::collect(QNetworkReply* reply, bool timedOut) const {
    if (timedOut)
        return std::unexpected(DomainFailure::timeout(QStringLiteral("upstream request timed out")));

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid()) {
        // never got an HTTP status line: DNS, refused, TLS or aborted
        return std::unexpected(DomainFailure::internal(reply->errorString()));
    }

    ProviderResponse resp;
    resp.statusCode = status.toInt();
    resp.body = reply->readAll();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
    return resp;
}

QNetworkReply* QtExecutor::execute(const ProviderRequest& request, ResponseCallback done) {
    QNetworkReply* reply = send(request);
    auto state = std::make_shared<PendingState>();

    auto* timer = new QTimer(reply);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, reply, [reply, state]() {
        LOG_WARNING(QStringLiteral("QtExecutor: request to %1 timed out")
                        .arg(reply->url().toString()));
        state->timedOut = true;
        reply->abort();
    });
    timer->start(m_requestTimeout);

    QObject::connect(reply, &QNetworkReply::finished, reply, [this, reply, timer, state, done]() {
        timer->stop();
        if (state->resolved)
            return;
        state->resolved = true;
        Result<ProviderResponse> result = collect(reply, state->timedOut);
        reply->deleteLater();
        done(std::move(result));
    });

    return reply;
}

QNetworkReply* QtExecutor::connectStream(const ProviderRequest& request, StreamCallback ready) {
    QNetworkReply* reply = send(request);
    auto state = std::make_shared<PendingState>();

    // Connections made against the guard are dropped once the reply is handed over.
    auto* guard = new QObject(reply);
    auto* timer = new QTimer(guard);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, guard, [reply, state]() {
        LOG_WARNING(QStringLiteral("QtExecutor: stream to %1 timed out before first byte")
                        .arg(reply->url().toString()));
        state->timedOut = true;
        reply->abort();
    });
    timer->start(m_requestTimeout);

    auto tryHandOver = [reply, guard, timer, state, ready]() {
        if (state->resolved)
            return;
        const int status = statusOf(reply);
        if (status < 200 || status >= 300)
            return;
        const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();
        if (!isIncrementalContentType(contentType))
            return;

        state->resolved = true;
        timer->stop();
        QObject::disconnect(reply, nullptr, guard, nullptr);
        guard->deleteLater();

        LOG_DEBUG(QStringLiteral("QtExecutor: incremental stream opened (HTTP %1, %2)")
                      .arg(status).arg(contentType));
        StreamStart start;
        start.reply = reply;
        ready(start);
    };

    QObject::connect(reply, &QNetworkReply::metaDataChanged, guard, tryHandOver);
    QObject::connect(reply, &QNetworkReply::readyRead, guard, tryHandOver);
    QObject::connect(reply, &QNetworkReply::finished, guard, [this, reply, guard, timer, state, ready, tryHandOver]() {
        tryHandOver();
        if (state->resolved)
            return;
        state->resolved = true;
        timer->stop();

        Result<ProviderResponse> result = collect(reply, state->timedOut);
        guard->deleteLater();
        reply->deleteLater();

        if (!result) {
            ready(std::unexpected(result.error()));
            return;
        }
        StreamStart start;
        start.buffered = std::move(*result);
        ready(start);
    });

    return reply;
}
