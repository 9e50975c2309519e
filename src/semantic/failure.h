#pragma once
#include "types.h"
#include <QByteArray>
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     code;
    QString     message;
    int         upstreamStatus = 0;
    QByteArray  upstreamBody;

    int httpStatus() const;
    QJsonObject toJson() const;
    QByteArray toBody() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure upstreamHttp(int status, const QByteArray& body, const QString& msg);
    static DomainFailure parse(const QString& msg);
    static DomainFailure streamTransport(const QString& msg);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
