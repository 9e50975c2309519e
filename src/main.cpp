#include <QCoreApplication>
#include <QCommandLineParser>

#include "adapters/inbound/ollama.h"
#include "adapters/outbound/openai.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/gateway_endpoints.h"
#include "proxy/gateway_server.h"
#include "config/command_line.h"
#include "core/log_manager.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ollama_gateway"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Command line + config file ---
    QCommandLineParser parser;
    CommandLine::configure(parser);
    parser.process(app);

    auto configResult = CommandLine::toConfig(parser);
    if (!configResult) {
        LOG_ERROR(QStringLiteral("configuration error: %1").arg(configResult.error().message));
        return 1;
    }
    const GatewayConfig config = *configResult;

    // --- 2. Log ---
    LogManager& log = LogManager::instance();
    log.setMinimumLevel(config.runtime.debugMode ? LogManager::Debug : LogManager::Info);
    if (!config.runtime.logDir.isEmpty() && !log.initialize(config.runtime.logDir)) {
        LOG_WARNING(QStringLiteral("file logging disabled, continuing with stderr only"));
    }

    // --- 3. Executor + adapters ---
    QtExecutor executor(config.upstream.insecure);
    executor.setRequestTimeout(config.runtime.requestTimeout);

    OllamaAdapter inbound;
    OpenAIOutbound outbound(config.upstream.baseUrl(), config.upstream.apiKey);

    // --- 4. Endpoints + server ---
    GatewayEndpoints endpoints(&inbound, &outbound, &executor);
    GatewayServer server;
    server.setEndpoints(&endpoints);

    if (!server.start(config.listen)) {
        return 1;
    }

    LOG_INFO(QStringLiteral("Ollama-compatible API server running on %1:%2")
                 .arg(config.listen.host)
                 .arg(config.listen.port));
    LOG_INFO(QStringLiteral("Forwarding %1 requests to the %2 upstream at %3")
                 .arg(inbound.protocol(), outbound.adapterId(), outbound.baseUrl()));
    LOG_INFO(QStringLiteral("OpenAI API key: configured"));
    if (config.upstream.insecure) {
        LOG_WARNING(QStringLiteral("TLS peer verification for the upstream is disabled"));
    }

    const int rc = app.exec();
    server.stop();
    log.shutdown();
    return rc;
}
