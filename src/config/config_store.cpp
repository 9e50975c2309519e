#include "config_store.h"
#include <QFile>
#include <QJsonDocument>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    m_error.clear();

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        m_error = QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        m_error = QStringLiteral("%1 does not hold a JSON object").arg(path);
        return false;
    }

    apply(doc.object());
    return true;
}

void ConfigStore::apply(const QJsonObject& root) {
    // listen
    QJsonObject l = root["listen"].toObject();
    m_config.listen.host = jsonStringEither(l, "host", "host", m_config.listen.host);
    m_config.listen.port = jsonIntEither(l, "port", "port", m_config.listen.port);

    // upstream
    QJsonObject u = root["upstream"].toObject();
    m_config.upstream.host = jsonStringEither(u, "host", "host", m_config.upstream.host);
    m_config.upstream.port = jsonIntEither(u, "port", "port", m_config.upstream.port);
    m_config.upstream.apiKey = jsonStringEither(u, "api_key", "apiKey", m_config.upstream.apiKey);
    m_config.upstream.insecure = jsonBoolEither(u, "insecure", "insecure", m_config.upstream.insecure);

    // runtime
    QJsonObject rt = root["runtime"].toObject();
    m_config.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", m_config.runtime.debugMode);
    m_config.runtime.requestTimeout = jsonIntEither(rt, "request_timeout", "requestTimeout",
                                                    m_config.runtime.requestTimeout);
    m_config.runtime.logDir = jsonStringEither(rt, "log_dir", "logDir", m_config.runtime.logDir);
}
