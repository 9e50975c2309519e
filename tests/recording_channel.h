#pragma once
#include "semantic/ports.h"

// IReplyChannel that records everything written to it.
class RecordingChannel : public IReplyChannel {
public:
    int status = 0;
    QByteArray body;
    QString contentType;
    QString streamContentType;
    QList<QByteArray> chunks;
    bool streaming = false;
    bool ended = false;
    bool open = true;

    bool isOpen() const override { return open; }

    void sendResponse(int s, const QByteArray& b, const QString& ct) override
    {
        if (!open)
            return;
        status = s;
        body = b;
        contentType = ct;
        open = false;
    }

    void beginStream(const QString& ct) override
    {
        if (!open)
            return;
        streaming = true;
        status = 200;
        streamContentType = ct;
    }

    void writeChunk(const QByteArray& data) override
    {
        if (open && streaming)
            chunks.append(data);
    }

    void endStream() override
    {
        if (!open)
            return;
        ended = true;
        open = false;
    }

    void setCloseHandler(std::function<void()> handler) override
    {
        m_closeHandler = std::move(handler);
    }

    bool hasCloseHandler() const { return static_cast<bool>(m_closeHandler); }

    // Simulates the client hanging up.
    void disconnectPeer()
    {
        open = false;
        auto handler = std::move(m_closeHandler);
        m_closeHandler = nullptr;
        if (handler)
            handler();
    }

    QByteArray streamed() const
    {
        QByteArray all;
        for (const QByteArray& c : chunks)
            all.append(c);
        return all;
    }

    // Stream output split into lines, newline stripped.
    QList<QByteArray> lines() const
    {
        QList<QByteArray> out = streamed().split('\n');
        if (!out.isEmpty() && out.last().isEmpty())
            out.removeLast();
        return out;
    }

private:
    std::function<void()> m_closeHandler;
};
