#include "stream_translator.h"
#include "core/log_manager.h"

namespace {

const QByteArray kDataPrefix = QByteArrayLiteral("data:");
const QByteArray kDonePayload = QByteArrayLiteral("[DONE]");

}

StreamTranslator::StreamTranslator(IInboundAdapter* inbound,
                                   IOutboundAdapter* outbound,
                                   ReplyShape shape,
                                   Sink sink)
    : m_inbound(inbound)
    , m_outbound(outbound)
    , m_shape(shape)
    , m_sink(std::move(sink))
{
    Q_ASSERT(m_inbound);
    Q_ASSERT(m_outbound);
}

QByteArray StreamTranslator::terminalMarker()
{
    return QByteArrayLiteral("[DONE]\n");
}

void StreamTranslator::feed(const QByteArray& chunk)
{
    if (isTerminated() || chunk.isEmpty()) {
        return;
    }

    m_lineBuffer.append(chunk);

    qsizetype newline = m_lineBuffer.indexOf('\n');
    while (newline >= 0) {
        QByteArray line = m_lineBuffer.left(newline);
        m_lineBuffer.remove(0, newline + 1);
        processLine(std::move(line));
        if (isTerminated()) {
            m_lineBuffer.clear();
            return;
        }
        newline = m_lineBuffer.indexOf('\n');
    }
}

void StreamTranslator::finish()
{
    if (isTerminated()) {
        return;
    }

    // The upstream may close without a trailing newline on its last record.
    if (!m_lineBuffer.trimmed().isEmpty()) {
        QByteArray residual = m_lineBuffer;
        m_lineBuffer.clear();
        processLine(std::move(residual));
    }
    m_lineBuffer.clear();

    if (!isTerminated()) {
        terminate();
    }
}

void StreamTranslator::fail(const QString& message)
{
    if (isTerminated()) {
        return;
    }

    LOG_ERROR(QStringLiteral("StreamTranslator: upstream transport error: %1").arg(message));
    m_lineBuffer.clear();
    writeFrame(m_inbound->encodeFailure(DomainFailure::streamTransport(message)));
    terminate();
}

void StreamTranslator::cancel()
{
    m_lineBuffer.clear();
    m_state = StreamState::Terminated;
}

void StreamTranslator::processLine(QByteArray line)
{
    if (line.endsWith('\r')) {
        line.chop(1);
    }

    // Keep-alive comments, event names and blank separators carry no data.
    if (!line.startsWith(kDataPrefix)) {
        return;
    }

    QByteArray payload = line.mid(kDataPrefix.size());
    if (payload.startsWith(' ')) {
        payload.remove(0, 1);
    }

    if (payload.trimmed() == kDonePayload) {
        terminate();
        return;
    }

    ProviderChunk chunk;
    chunk.data = payload;
    Result<TargetResponseUnit> parsed = m_outbound->parseChunk(chunk);
    if (!parsed) {
        LOG_WARNING(QStringLiteral("StreamTranslator: chunk parse error: %1")
                        .arg(parsed.error().message));
        writeFrame(m_inbound->encodeFailure(parsed.error()));
        terminate();
        return;
    }

    if (parsed->isError()) {
        LOG_WARNING(QStringLiteral("StreamTranslator: upstream reported an error mid-stream"));
        writeFrame(m_inbound->encodeStreamError(parsed->error));
        terminate();
        return;
    }

    handleDelta(*parsed);
}

void StreamTranslator::handleDelta(const TargetResponseUnit& delta)
{
    if (!delta.hasChoice) {
        return;
    }

    if (m_state == StreamState::AwaitingFirst) {
        auto opening = m_inbound->encodeStreamFrame(delta, m_shape, FrameKind::Opening);
        if (!opening) {
            writeFrame(m_inbound->encodeFailure(opening.error()));
            terminate();
            return;
        }
        writeFrame(*opening);
        m_state = StreamState::Streaming;
    }

    const bool done = delta.choice.isFinished();
    const bool carriesPayload = !delta.choice.content.isEmpty() || !delta.choice.toolCalls.isEmpty();
    if (carriesPayload || done) {
        auto frame = m_inbound->encodeStreamFrame(
            delta, m_shape, done ? FrameKind::Final : FrameKind::Content);
        if (!frame) {
            writeFrame(m_inbound->encodeFailure(frame.error()));
            terminate();
            return;
        }
        writeFrame(*frame);
    }

    if (done) {
        terminate();
    }
}

void StreamTranslator::writeFrame(const QByteArray& json)
{
    QByteArray line = json;
    line.append('\n');
    m_sink(line);
}

void StreamTranslator::terminate()
{
    if (isTerminated()) {
        return;
    }
    m_state = StreamState::Terminated;
    m_lineBuffer.clear();
    m_sink(terminalMarker());
}
