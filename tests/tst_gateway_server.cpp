#include <QTest>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpSocket>
#include "proxy/gateway_server.h"
#include "pipeline/gateway_endpoints.h"
#include "adapters/inbound/ollama.h"
#include "adapters/outbound/openai.h"
#include "fake_executor.h"

namespace {

struct HttpReply {
    int status = 0;
    QMap<QString, QString> headers;
    QByteArray body;
};

QByteArray dechunk(const QByteArray& data)
{
    QByteArray out;
    int pos = 0;
    while (pos < data.size()) {
        const int lineEnd = data.indexOf("\r\n", pos);
        if (lineEnd < 0)
            break;
        bool ok = false;
        const int size = data.mid(pos, lineEnd - pos).toInt(&ok, 16);
        if (!ok || size == 0)
            break;
        out.append(data.mid(lineEnd + 2, size));
        pos = lineEnd + 2 + size + 2;
    }
    return out;
}

HttpReply parseReply(const QByteArray& raw)
{
    HttpReply reply;
    const int headerEnd = raw.indexOf("\r\n\r\n");
    if (headerEnd < 0)
        return reply;

    const QList<QByteArray> lines = raw.left(headerEnd).split('\n');
    const QList<QByteArray> statusLine = lines.value(0).trimmed().split(' ');
    reply.status = statusLine.value(1).toInt();
    for (int i = 1; i < lines.size(); ++i) {
        const int colon = lines[i].indexOf(':');
        if (colon > 0) {
            reply.headers[QString::fromLatin1(lines[i].left(colon).trimmed().toLower())] =
                QString::fromLatin1(lines[i].mid(colon + 1).trimmed());
        }
    }

    reply.body = raw.mid(headerEnd + 4);
    if (reply.headers.value(QStringLiteral("transfer-encoding")) == QStringLiteral("chunked"))
        reply.body = dechunk(reply.body);
    return reply;
}

QByteArray post(const QString& path, const QByteArray& body, const QByteArray& extraHeaders = {})
{
    return "POST " + path.toLatin1() + " HTTP/1.1\r\n"
           "Host: localhost\r\n"
           "Content-Type: application/json\r\n"
           + extraHeaders
           + "Content-Length: " + QByteArray::number(body.size()) + "\r\n\r\n"
           + body;
}

// Client side of one exchange; the server runs on the same event loop.
class Client {
public:
    explicit Client(quint16 port)
    {
        QObject::connect(&m_socket, &QTcpSocket::readyRead, &m_socket,
                         [this]() { m_received += m_socket.readAll(); });
        m_socket.connectToHost(QHostAddress(QHostAddress::LocalHost), port);
        m_socket.waitForConnected(3000);
    }

    void send(const QByteArray& data)
    {
        m_socket.write(data);
        m_socket.flush();
    }

    bool waitForClose(int timeoutMs = 5000)
    {
        QElapsedTimer timer;
        timer.start();
        while (m_socket.state() != QAbstractSocket::UnconnectedState && timer.elapsed() < timeoutMs)
            QTest::qWait(10);
        m_received += m_socket.readAll();
        return m_socket.state() == QAbstractSocket::UnconnectedState;
    }

    void abort() { m_socket.abort(); }

    QByteArray received() const { return m_received; }
    HttpReply reply() const { return parseReply(m_received); }

private:
    QTcpSocket m_socket;
    QByteArray m_received;
};

struct Rig {
    Rig()
        : endpoints(&inbound, &outbound, &executor)
    {
        server.setEndpoints(&endpoints);
    }

    bool start()
    {
        ListenConfig listen;
        listen.host = QStringLiteral("127.0.0.1");
        listen.port = 0;
        return server.start(listen);
    }

    OllamaAdapter inbound;
    OpenAIOutbound outbound{QStringLiteral("http://upstream.test"), QStringLiteral("sk-test")};
    FakeExecutor executor;
    GatewayEndpoints endpoints;
    GatewayServer server;
};

QByteArray sseDelta(const QString& content, const QString& finishReason = QString())
{
    QJsonObject delta;
    delta[QStringLiteral("content")] = content;
    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("delta")] = delta;
    choice[QStringLiteral("finish_reason")] = finishReason.isEmpty()
        ? QJsonValue(QJsonValue::Null) : QJsonValue(finishReason);
    QJsonObject root;
    root[QStringLiteral("model")] = QStringLiteral("gpt-4o");
    root[QStringLiteral("created")] = 1704067200;
    root[QStringLiteral("choices")] = QJsonArray{choice};
    return "data: " + QJsonDocument(root).toJson(QJsonDocument::Compact) + "\n\n";
}

const QByteArray kChatBody =
    R"({"model":"gpt-4o","messages":[{"role":"user","content":"Hi"}]})";

}

class TestGatewayServer : public QObject {
    Q_OBJECT

private slots:
    void testResolveListenAddress_data() {
        QTest::addColumn<QString>("host");
        QTest::addColumn<QString>("expected");

        QTest::newRow("localhost") << QStringLiteral("localhost") << QStringLiteral("127.0.0.1");
        QTest::newRow("any") << QStringLiteral("0.0.0.0") << QStringLiteral("0.0.0.0");
        QTest::newRow("wildcard") << QStringLiteral("*") << QStringLiteral("0.0.0.0");
        QTest::newRow("empty") << QString() << QStringLiteral("0.0.0.0");
        QTest::newRow("literal") << QStringLiteral(" 10.1.2.3 ") << QStringLiteral("10.1.2.3");
        QTest::newRow("ipv6") << QStringLiteral("::1") << QStringLiteral("::1");
    }

    void testResolveListenAddress() {
        QFETCH(QString, host);
        QFETCH(QString, expected);
        QCOMPARE(GatewayServer::resolveListenAddress(host), QHostAddress(expected));
    }

    void testStartAndStop() {
        Rig rig;
        QSignalSpy status(&rig.server, &GatewayServer::statusChanged);
        QVERIFY(rig.start());
        QVERIFY(rig.server.isRunning());
        QVERIFY(rig.server.serverPort() > 0);
        QCOMPARE(status.count(), 1);
        QCOMPARE(status.at(0).at(0).toBool(), true);

        GatewayServer clash;
        ListenConfig taken;
        taken.host = QStringLiteral("127.0.0.1");
        taken.port = rig.server.serverPort();
        QVERIFY(!clash.start(taken));
        QVERIFY(!clash.isRunning());

        rig.server.stop();
        QVERIFY(!rig.server.isRunning());
        QCOMPARE(rig.server.serverPort(), quint16(0));
        QCOMPARE(status.count(), 2);
    }

    void testHealth() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send("GET /health?check=1 HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QVERIFY(client.waitForClose());

        const HttpReply reply = client.reply();
        QCOMPARE(reply.status, 200);
        QCOMPARE(reply.headers.value(QStringLiteral("content-type")), QStringLiteral("application/json"));
        QCOMPARE(reply.headers.value(QStringLiteral("connection")), QStringLiteral("close"));
        QCOMPARE(reply.headers.value(QStringLiteral("content-length")).toInt(), reply.body.size());
        QCOMPARE(reply.body, QByteArray(R"({"status":"healthy"})"));
    }

    void testUnknownRoute() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send("GET /api/unknown HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QVERIFY(client.waitForClose());

        const HttpReply reply = client.reply();
        QCOMPARE(reply.status, 404);
        const QJsonObject body = QJsonDocument::fromJson(reply.body).object();
        QCOMPARE(body[QStringLiteral("error")].toString(), QStringLiteral("route not found"));
        QCOMPARE(body[QStringLiteral("path")].toString(), QStringLiteral("/api/unknown"));
    }

    void testWrongMethod() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send("GET /api/chat HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QVERIFY(client.waitForClose());
        QCOMPARE(client.reply().status, 404);
        QCOMPARE(rig.executor.calls(), 0);
    }

    void testMalformedRequestLine() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send("garbage\r\n\r\n");
        QVERIFY(client.waitForClose());
        QCOMPARE(client.reply().status, 400);
    }

    void testChunkedRequestRejected() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send("POST /api/chat HTTP/1.1\r\nHost: localhost\r\n"
                    "Transfer-Encoding: chunked\r\n\r\n"
                    "5\r\nhello\r\n0\r\n\r\n");
        QVERIFY(client.waitForClose());
        QCOMPARE(client.reply().status, 501);
        QCOMPARE(rig.executor.calls(), 0);
    }

    void testWithoutEndpoints() {
        GatewayServer server;
        ListenConfig listen;
        listen.host = QStringLiteral("127.0.0.1");
        listen.port = 0;
        QVERIFY(server.start(listen));

        Client client(server.serverPort());
        client.send("GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
        QVERIFY(client.waitForClose());
        QCOMPARE(client.reply().status, 503);
    }

    void testBodySplitAcrossWrites() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());

        const QByteArray request = post(QStringLiteral("/api/chat"), kChatBody);
        const int cut = request.size() - 10;
        client.send(request.left(cut));
        QTest::qWait(50);
        QCOMPARE(rig.executor.calls(), 0);

        client.send(request.mid(cut));
        QTRY_COMPARE(rig.executor.calls(), 1);
        QCOMPARE(QJsonDocument::fromJson(rig.executor.lastRequest().body)
                     .object()[QStringLiteral("model")].toString(),
                 QStringLiteral("gpt-4o"));

        rig.executor.respond(200,
            R"({"model":"gpt-4o","created":1704067200,"choices":[{"index":0,)"
            R"("message":{"role":"assistant","content":"Hello"},"finish_reason":"stop"}]})");
        QVERIFY(client.waitForClose());

        const HttpReply reply = client.reply();
        QCOMPARE(reply.status, 200);
        const QJsonObject body = QJsonDocument::fromJson(reply.body).object();
        QCOMPARE(body[QStringLiteral("message")].toObject()[QStringLiteral("content")].toString(),
                 QStringLiteral("Hello"));
    }

    void testUpstreamErrorStatusReachesClient() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send(post(QStringLiteral("/api/chat"), kChatBody));
        QTRY_VERIFY(rig.executor.hasPendingResponse());

        const QByteArray upstream = R"({"error":{"message":"Invalid API key"}})";
        rig.executor.respond(401, upstream);
        QVERIFY(client.waitForClose());
        QCOMPARE(client.reply().status, 401);
        QCOMPARE(client.reply().body, upstream);
    }

    void testStreamingEndToEnd() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send(post(QStringLiteral("/api/chat"),
                         R"({"model":"gpt-4o","stream":true,"messages":[{"role":"user","content":"Hi"}]})"));
        QTRY_VERIFY(rig.executor.hasPendingStream());
        QTest::qWait(20);
        QVERIFY(client.received().isEmpty());

        FakeNetworkReply* upstream = rig.executor.openStream();
        upstream->feed(sseDelta(QStringLiteral("Hel")));
        upstream->feed(sseDelta(QStringLiteral("lo")));
        upstream->feed(sseDelta(QString(), QStringLiteral("stop")) + "data: [DONE]\n\n");
        QVERIFY(client.waitForClose());

        const HttpReply reply = client.reply();
        QCOMPARE(reply.status, 200);
        QCOMPARE(reply.headers.value(QStringLiteral("content-type")), QStringLiteral("text/event-stream"));
        QCOMPARE(reply.headers.value(QStringLiteral("transfer-encoding")), QStringLiteral("chunked"));
        QCOMPARE(reply.headers.value(QStringLiteral("cache-control")), QStringLiteral("no-cache"));
        QVERIFY(client.received().endsWith("0\r\n\r\n"));

        QList<QByteArray> lines = reply.body.split('\n');
        QCOMPARE(lines.takeLast(), QByteArray());
        QCOMPARE(lines.size(), 5);
        QCOMPARE(QJsonDocument::fromJson(lines[1]).object()[QStringLiteral("message")].toObject()
                     [QStringLiteral("content")].toString(),
                 QStringLiteral("Hel"));
        QCOMPARE(lines[4], QByteArray("[DONE]"));
        QCOMPARE(rig.endpoints.activeStreams(), 0);
    }

    void testClientDisconnectAbortsUpstream() {
        Rig rig;
        QVERIFY(rig.start());
        Client client(rig.server.serverPort());
        client.send(post(QStringLiteral("/api/chat"), kChatBody));
        QTRY_VERIFY(rig.executor.hasPendingResponse());

        QPointer<FakeNetworkReply> upstream = rig.executor.pendingReply();
        QVERIFY(upstream);
        client.abort();
        QTRY_VERIFY(upstream->isAborted());
    }

    void testClientDisconnectMidStream() {
        Rig rig;
        QVERIFY(rig.start());
        QSignalSpy finished(&rig.endpoints, &GatewayEndpoints::streamFinished);
        Client client(rig.server.serverPort());
        client.send(post(QStringLiteral("/api/chat"),
                         R"({"stream":true,"messages":[{"role":"user","content":"Hi"}]})"));
        QTRY_VERIFY(rig.executor.hasPendingStream());

        FakeNetworkReply* upstream = rig.executor.openStream();
        upstream->feed(sseDelta(QStringLiteral("Hel")));
        QTRY_VERIFY(client.received().contains("Hel"));
        QVERIFY(!upstream->isAborted());

        client.abort();
        QTRY_COMPARE(finished.count(), 1);
        QCOMPARE(rig.endpoints.activeStreams(), 0);
    }
};

QTEST_MAIN(TestGatewayServer)
#include "tst_gateway_server.moc"
