#pragma once
#include "config_types.h"
#include "semantic/ports.h"
#include <QCommandLineParser>

class CommandLine {
public:
    static void configure(QCommandLineParser& parser);

    // Layers defaults, the optional --config file and explicit options, in that order.
    static Result<GatewayConfig> toConfig(const QCommandLineParser& parser);
};
