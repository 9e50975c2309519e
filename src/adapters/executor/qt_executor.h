#pragma once
#include "semantic/ports.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <memory>

class QtExecutor : public IExecutor {
public:
    explicit QtExecutor(bool insecure = false);
    ~QtExecutor() override;

    QNetworkReply* execute(const ProviderRequest& request, ResponseCallback done) override;
    QNetworkReply* connectStream(const ProviderRequest& request, StreamCallback ready) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    int requestTimeout() const { return m_requestTimeout; }

    static bool isIncrementalContentType(const QString& contentType);

private:
    std::unique_ptr<QNetworkAccessManager> m_nam;
    bool m_insecure = false;
    int m_requestTimeout = 30000;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(const ProviderRequest& request);
    Result<ProviderResponse> collect(QNetworkReply* reply, bool timedOut) const;
};
