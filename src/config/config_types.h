#pragma once
#include <QString>
#include <QUrl>

struct ListenConfig {
    QString host = QStringLiteral("localhost");
    int port = 11434;
};

struct UpstreamConfig {
    QString host = QStringLiteral("https://api.openai.com");
    int port = 443;
    QString apiKey;
    bool insecure = false;

    // Scheme defaults to http when the host carries none; any path is kept as a prefix.
    QString baseUrl() const {
        QString withScheme = host.trimmed();
        if (!withScheme.contains(QStringLiteral("://")))
            withScheme.prepend(QStringLiteral("http://"));
        QUrl url(withScheme);
        if (port > 0)
            url.setPort(port);
        QString result = url.toString(QUrl::StripTrailingSlash);
        while (result.endsWith(QLatin1Char('/')))
            result.chop(1);
        return result;
    }
};

struct RuntimeOptions {
    bool debugMode = false;
    int requestTimeout = 30000;
    QString logDir;
};

struct GatewayConfig {
    ListenConfig listen;
    UpstreamConfig upstream;
    RuntimeOptions runtime;

    bool isValid() const {
        return !upstream.apiKey.trimmed().isEmpty()
            && listen.port > 0 && listen.port <= 65535
            && upstream.port > 0 && upstream.port <= 65535
            && runtime.requestTimeout > 0;
    }
};
