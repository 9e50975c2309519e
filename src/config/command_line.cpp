#include "command_line.h"
#include "config_store.h"

namespace {

Result<int> parsePort(const QCommandLineParser& parser, const QString& name)
{
    bool ok = false;
    const int port = parser.value(name).toInt(&ok);
    if (!ok || port <= 0 || port > 65535) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_port"),
            QStringLiteral("--%1 expects a port between 1 and 65535, got '%2'")
                .arg(name, parser.value(name))));
    }
    return port;
}

}

void CommandLine::configure(QCommandLineParser& parser)
{
    parser.setApplicationDescription(
        QStringLiteral("Ollama-compatible gateway that forwards to an OpenAI chat-completions API"));
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        {{QStringLiteral("oh"), QStringLiteral("ollama-host")},
         QStringLiteral("Address to listen on (default: localhost)."), QStringLiteral("host")},
        {{QStringLiteral("op"), QStringLiteral("ollama-port")},
         QStringLiteral("Port to listen on (default: 11434)."), QStringLiteral("port")},
        {{QStringLiteral("oah"), QStringLiteral("openai-host")},
         QStringLiteral("Upstream OpenAI host (default: https://api.openai.com)."), QStringLiteral("host")},
        {{QStringLiteral("oap"), QStringLiteral("openai-port")},
         QStringLiteral("Upstream OpenAI port (default: 443)."), QStringLiteral("port")},
        {{QStringLiteral("oak"), QStringLiteral("openai-key")},
         QStringLiteral("Upstream OpenAI API key (required)."), QStringLiteral("key")},
        {QStringLiteral("timeout"),
         QStringLiteral("Upstream request timeout in milliseconds (default: 30000)."), QStringLiteral("ms")},
        {QStringLiteral("log-dir"),
         QStringLiteral("Directory for ollama_gateway.log."), QStringLiteral("dir")},
        {QStringLiteral("config"),
         QStringLiteral("JSON configuration file."), QStringLiteral("file")},
        {QStringLiteral("debug"), QStringLiteral("Enable debug logging.")},
        {QStringLiteral("insecure"), QStringLiteral("Skip TLS peer verification for the upstream.")},
    });
}

Result<GatewayConfig> CommandLine::toConfig(const QCommandLineParser& parser)
{
    ConfigStore store;
    if (parser.isSet(QStringLiteral("config"))) {
        if (!store.load(parser.value(QStringLiteral("config")))) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("config_unreadable"), store.errorString()));
        }
    }

    GatewayConfig config = store.config();

    if (parser.isSet(QStringLiteral("ollama-host")))
        config.listen.host = parser.value(QStringLiteral("ollama-host"));
    if (parser.isSet(QStringLiteral("ollama-port"))) {
        auto port = parsePort(parser, QStringLiteral("ollama-port"));
        if (!port) return std::unexpected(port.error());
        config.listen.port = *port;
    }
    if (parser.isSet(QStringLiteral("openai-host")))
        config.upstream.host = parser.value(QStringLiteral("openai-host"));
    if (parser.isSet(QStringLiteral("openai-port"))) {
        auto port = parsePort(parser, QStringLiteral("openai-port"));
        if (!port) return std::unexpected(port.error());
        config.upstream.port = *port;
    }
    if (parser.isSet(QStringLiteral("openai-key")))
        config.upstream.apiKey = parser.value(QStringLiteral("openai-key"));
    if (parser.isSet(QStringLiteral("timeout"))) {
        bool ok = false;
        const int timeout = parser.value(QStringLiteral("timeout")).toInt(&ok);
        if (!ok || timeout <= 0) {
            return std::unexpected(DomainFailure::invalidInput(
                QStringLiteral("invalid_timeout"),
                QStringLiteral("--timeout expects a positive number of milliseconds")));
        }
        config.runtime.requestTimeout = timeout;
    }
    if (parser.isSet(QStringLiteral("log-dir")))
        config.runtime.logDir = parser.value(QStringLiteral("log-dir"));
    if (parser.isSet(QStringLiteral("debug")))
        config.runtime.debugMode = true;
    if (parser.isSet(QStringLiteral("insecure")))
        config.upstream.insecure = true;

    if (config.upstream.apiKey.trimmed().isEmpty()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("missing_api_key"),
            QStringLiteral("OpenAI API key is required (--openai-key)")));
    }
    if (!config.isValid()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_config"),
            QStringLiteral("configuration holds an out-of-range port or timeout")));
    }

    return config;
}
