#pragma once
#include "ports.h"
#include <QByteArray>
#include <functional>

// Re-frames an upstream "data: <json>" event stream into newline-delimited
// Ollama frames. Input arrives in arbitrary byte chunks; every frame and
// the terminal marker go to the sink in parse order, and the marker is
// written at most once, always last.
class StreamTranslator {
public:
    using Sink = std::function<void(const QByteArray&)>;

    StreamTranslator(IInboundAdapter* inbound,
                     IOutboundAdapter* outbound,
                     ReplyShape shape,
                     Sink sink);

    void feed(const QByteArray& chunk);
    void finish();
    void fail(const QString& message);
    void cancel();

    StreamState state() const { return m_state; }
    bool isTerminated() const { return m_state == StreamState::Terminated; }
    QByteArray pendingFragment() const { return m_lineBuffer; }

    static QByteArray terminalMarker();

private:
    IInboundAdapter* m_inbound;
    IOutboundAdapter* m_outbound;
    ReplyShape m_shape;
    Sink m_sink;
    QByteArray m_lineBuffer;
    StreamState m_state = StreamState::AwaitingFirst;

    void processLine(QByteArray line);
    void handleDelta(const TargetResponseUnit& delta);
    void writeFrame(const QByteArray& json);
    void terminate();
};
