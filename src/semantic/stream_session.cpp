#include "stream_session.h"
#include "core/log_manager.h"

StreamSession::StreamSession(QNetworkReply* reply,
                             IInboundAdapter* inbound,
                             IOutboundAdapter* outbound,
                             ReplyShape shape,
                             std::shared_ptr<IReplyChannel> channel,
                             QObject* parent)
    : QObject(parent)
    , m_reply(reply)
    , m_channel(std::move(channel))
    , m_translator(inbound, outbound, shape, [this](const QByteArray& bytes) {
          if (m_channel && m_channel->isOpen()) {
              m_channel->writeChunk(bytes);
          }
      })
{
    Q_ASSERT(m_reply);

    // Take ownership of the reply so it is cleaned up with this session
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamSession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamSession::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &StreamSession::onReplyError);
}

StreamSession::~StreamSession()
{
    releaseUpstream();
}

void StreamSession::start()
{
    // Bytes that arrived while the connection was being established are
    // already buffered and will not raise another readyRead.
    if (m_reply && m_reply->bytesAvailable() > 0) {
        onReadyRead();
    }
    if (m_reply && m_reply->isFinished()) {
        onReplyFinished();
    }
}

void StreamSession::abort()
{
    if (m_finished) {
        return;
    }
    LOG_INFO(QStringLiteral("StreamSession: client disconnected mid-stream, releasing upstream"));
    m_translator.cancel();
    checkTerminated();
}

void StreamSession::onReadyRead()
{
    if (!m_reply) return;
    m_translator.feed(m_reply->readAll());
    checkTerminated();
}

void StreamSession::onReplyFinished()
{
    if (!m_reply || m_finished) return;

    if (m_reply->error() != QNetworkReply::NoError) {
        onReplyError(m_reply->error());
        return;
    }

    if (m_reply->bytesAvailable() > 0) {
        m_translator.feed(m_reply->readAll());
    }
    m_translator.finish();
    checkTerminated();
}

void StreamSession::onReplyError(QNetworkReply::NetworkError code)
{
    if (!m_reply || m_finished) return;

    if (m_reply->bytesAvailable() > 0) {
        m_translator.feed(m_reply->readAll());
    }

    if (code == QNetworkReply::RemoteHostClosedError) {
        // Upstream hung up: close the stream cleanly, nothing is fabricated.
        LOG_WARNING(QStringLiteral("StreamSession: upstream closed the connection"));
        m_translator.finish();
    } else {
        m_translator.fail(m_reply->errorString());
    }
    checkTerminated();
}

void StreamSession::checkTerminated()
{
    if (m_finished || !m_translator.isTerminated()) {
        return;
    }
    m_finished = true;
    releaseUpstream();
    emit finished();
}

void StreamSession::releaseUpstream()
{
    if (!m_reply) {
        return;
    }
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    disconnect(reply, nullptr, this, nullptr);
    if (reply->isRunning()) {
        reply->abort();
    }
    reply->deleteLater();
}
