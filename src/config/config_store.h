#pragma once
#include "config_types.h"
#include <QJsonObject>

// Loads a GatewayConfig from a JSON file. Keys are accepted in snake_case or camelCase;
// anything missing keeps the value already held, so callers can layer sources.
class ConfigStore {
public:
    ConfigStore() = default;
    explicit ConfigStore(const GatewayConfig& base) : m_config(base) {}

    bool load(const QString& path);
    void apply(const QJsonObject& root);

    const GatewayConfig& config() const { return m_config; }
    QString filePath() const { return m_filePath; }
    QString errorString() const { return m_error; }

private:
    GatewayConfig m_config;
    QString m_filePath;
    QString m_error;
};
