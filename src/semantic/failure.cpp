#include "failure.h"
#include <QJsonDocument>

namespace {

QJsonObject typedError(const QString& message, const QString& type)
{
    QJsonObject err;
    err[QStringLiteral("message")] = message;
    err[QStringLiteral("type")] = type;
    QJsonObject root;
    root[QStringLiteral("error")] = err;
    return root;
}

}

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::InvalidInput:    return 400;
    case ErrorKind::NotFound:        return 404;
    case ErrorKind::UpstreamHttp:    return upstreamStatus > 0 ? upstreamStatus : 502;
    case ErrorKind::Timeout:         return 504;
    case ErrorKind::Parse:
    case ErrorKind::StreamTransport:
    case ErrorKind::Internal:
    default:                         return 500;
    }
}

QJsonObject DomainFailure::toJson() const {
    switch (kind) {
    case ErrorKind::InvalidInput:
        return typedError(message, QStringLiteral("invalid_request_error"));
    case ErrorKind::NotFound: {
        QJsonObject root;
        root[QStringLiteral("error")] = message;
        return root;
    }
    case ErrorKind::UpstreamHttp:
        return typedError(message, QStringLiteral("upstream_error"));
    case ErrorKind::Parse:
        return typedError(QStringLiteral("Error parsing response"), QStringLiteral("parse_error"));
    case ErrorKind::StreamTransport:
        return typedError(message.isEmpty() ? QStringLiteral("Stream error") : message,
                          QStringLiteral("stream_error"));
    case ErrorKind::Timeout:
        return typedError(QStringLiteral("Request timeout - the OpenAI server took too long to respond"),
                          QStringLiteral("timeout_error"));
    case ErrorKind::Internal:
    default:
        return typedError(QStringLiteral("Internal server error"), QStringLiteral("server_error"));
    }
}

QByteArray DomainFailure::toBody() const {
    // Upstream error bodies reach the client byte for byte.
    if (kind == ErrorKind::UpstreamHttp && !upstreamBody.isEmpty())
        return upstreamBody;
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, 0, {}};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::NotFound, QStringLiteral("not_found"), msg, 0, {}};
}

DomainFailure DomainFailure::upstreamHttp(int status, const QByteArray& body, const QString& msg) {
    return {ErrorKind::UpstreamHttp, QStringLiteral("upstream.http_%1").arg(status), msg, status, body};
}

DomainFailure DomainFailure::parse(const QString& msg) {
    return {ErrorKind::Parse, QStringLiteral("parse_error"), msg, 0, {}};
}

DomainFailure DomainFailure::streamTransport(const QString& msg) {
    return {ErrorKind::StreamTransport, QStringLiteral("stream_error"), msg, 0, {}};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::Timeout, QStringLiteral("timeout"), msg, 0, {}};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, QStringLiteral("internal"), msg, 0, {}};
}
