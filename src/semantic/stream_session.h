#pragma once
#include "ports.h"
#include "stream_translator.h"
#include <QObject>
#include <QNetworkReply>
#include <memory>

// Pumps one upstream streaming reply through a StreamTranslator into the
// client's reply channel. Lives for exactly one inbound exchange.
class StreamSession : public QObject {
    Q_OBJECT
public:
    StreamSession(QNetworkReply* reply,
                  IInboundAdapter* inbound,
                  IOutboundAdapter* outbound,
                  ReplyShape shape,
                  std::shared_ptr<IReplyChannel> channel,
                  QObject* parent = nullptr);
    ~StreamSession() override;

    void start();
    void abort();

    StreamState state() const { return m_translator.state(); }

signals:
    void finished();

private slots:
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);

private:
    QNetworkReply* m_reply;
    std::shared_ptr<IReplyChannel> m_channel;
    StreamTranslator m_translator;
    bool m_finished = false;

    void checkTerminated();
    void releaseUpstream();
};
