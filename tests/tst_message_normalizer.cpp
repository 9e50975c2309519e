#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include "adapters/inbound/message_normalizer.h"

namespace {

QJsonObject msg(const QString& role, const QString& content)
{
    QJsonObject m;
    m[QStringLiteral("role")] = role;
    m[QStringLiteral("content")] = content;
    return m;
}

}

class TestMessageNormalizer : public QObject {
    Q_OBJECT

private slots:
    void testMessagesFilteredInOrder() {
        QJsonArray messages;
        messages.append(msg(QStringLiteral("system"), QStringLiteral("be brief")));
        QJsonObject noContent;
        noContent[QStringLiteral("role")] = QStringLiteral("user");
        messages.append(noContent);
        QJsonObject noRole;
        noRole[QStringLiteral("content")] = QStringLiteral("orphan");
        messages.append(noRole);
        messages.append(msg(QStringLiteral("user"), QStringLiteral("hi")));
        messages.append(msg(QStringLiteral("assistant"), QStringLiteral("hello")));

        QJsonObject body;
        body[QStringLiteral("messages")] = messages;
        body[QStringLiteral("prompt")] = QStringLiteral("ignored");

        auto out = MessageNormalizer::normalize(body);
        QVERIFY(!out.synthesized);
        QCOMPARE(out.messages.size(), 3);
        QCOMPARE(out.messages[0], (Message{QStringLiteral("system"), QStringLiteral("be brief")}));
        QCOMPARE(out.messages[1], (Message{QStringLiteral("user"), QStringLiteral("hi")}));
        QCOMPARE(out.messages[2], (Message{QStringLiteral("assistant"), QStringLiteral("hello")}));
    }

    void testNonStringContentIsDropped() {
        QJsonObject parts;
        parts[QStringLiteral("role")] = QStringLiteral("user");
        parts[QStringLiteral("content")] = QJsonArray{QJsonObject{{QStringLiteral("type"), QStringLiteral("text")},
                                                                  {QStringLiteral("text"), QStringLiteral("hi")}}};
        QJsonObject number;
        number[QStringLiteral("role")] = QStringLiteral("user");
        number[QStringLiteral("content")] = 42;

        QJsonObject body;
        body[QStringLiteral("messages")] = QJsonArray{parts, number, msg(QStringLiteral("user"), QStringLiteral("kept"))};

        auto out = MessageNormalizer::normalize(body);
        QVERIFY(out.fromMessageList);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0].content, QStringLiteral("kept"));

        body[QStringLiteral("messages")] = QJsonArray{parts, number};
        body[QStringLiteral("prompt")] = QStringLiteral("fallback");
        out = MessageNormalizer::normalize(body);
        QVERIFY(!out.fromMessageList);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0].content, QStringLiteral("fallback"));
    }

    void testEmptyMessagesFallThroughToSystem() {
        QJsonObject body;
        body[QStringLiteral("messages")] = QJsonArray{msg(QStringLiteral("user"), QString())};
        body[QStringLiteral("system")] = QStringLiteral("you are a bot");
        body[QStringLiteral("prompt")] = QStringLiteral("later");

        auto out = MessageNormalizer::normalize(body);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0].role, QStringLiteral("system"));
        QCOMPARE(out.messages[0].content, QStringLiteral("you are a bot"));
    }

    void testPlainPromptIsOneUserMessage() {
        const QString prompt = QStringLiteral("  Why is the sky blue?\nAnswer briefly.  ");
        QJsonObject body;
        body[QStringLiteral("prompt")] = prompt;

        auto out = MessageNormalizer::normalize(body);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0].role, QStringLiteral("user"));
        QCOMPARE(out.messages[0].content, prompt);
    }

    void testTaggedPrompt_data() {
        QTest::addColumn<QString>("prompt");
        QTest::addColumn<QStringList>("expected");   // role:content pairs

        QTest::newRow("balanced")
            << QStringLiteral("<user>\nHi there\n</user>\n<assistant>Hello!</assistant>\n<user>How are you?</user>")
            << QStringList{QStringLiteral("user:Hi there"),
                           QStringLiteral("assistant:Hello!"),
                           QStringLiteral("user:How are you?")};
        QTest::newRow("opening-closes-previous")
            << QStringLiteral("<user>one\n<assistant>two\n<user>three")
            << QStringList{QStringLiteral("user:one"),
                           QStringLiteral("assistant:two"),
                           QStringLiteral("user:three")};
        QTest::newRow("text-before-first-tag-dropped")
            << QStringLiteral("preamble line\n<user>question</user>")
            << QStringList{QStringLiteral("user:question")};
        QTest::newRow("text-between-spans-dropped")
            << QStringLiteral("<user>a</user> stray <assistant>b</assistant>")
            << QStringList{QStringLiteral("user:a"), QStringLiteral("assistant:b")};
        QTest::newRow("multiline-span")
            << QStringLiteral("<assistant>\nline 1\nline 2\n</assistant>")
            << QStringList{QStringLiteral("assistant:line 1\nline 2")};
        QTest::newRow("empty-span-skipped")
            << QStringLiteral("<user>   </user><assistant>reply</assistant>")
            << QStringList{QStringLiteral("assistant:reply")};
        QTest::newRow("mismatched-close")
            << QStringLiteral("<user>x</assistant> tail")
            << QStringList{QStringLiteral("user:x")};
        QTest::newRow("unterminated-trailing")
            << QStringLiteral("<user>first</user><assistant>partial answer")
            << QStringList{QStringLiteral("user:first"),
                           QStringLiteral("assistant:partial answer")};
    }

    void testTaggedPrompt() {
        QFETCH(QString, prompt);
        QFETCH(QStringList, expected);

        QJsonObject body;
        body[QStringLiteral("prompt")] = prompt;
        auto out = MessageNormalizer::normalize(body);

        QStringList actual;
        for (const Message& m : out.messages)
            actual.append(m.role + QLatin1Char(':') + m.content);
        QCOMPARE(actual, expected);
        QVERIFY(!out.synthesized);
    }

    void testTagsWithoutContentSynthesize() {
        QJsonObject body;
        body[QStringLiteral("prompt")] = QStringLiteral("<user></user>");
        auto out = MessageNormalizer::normalize(body);
        QVERIFY(out.synthesized);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0], (Message{QStringLiteral("user"), QString()}));
    }

    void testHistoryKeepsUserAndAssistant() {
        QJsonArray history;
        history.append(msg(QStringLiteral("user"), QStringLiteral("q")));
        history.append(msg(QStringLiteral("system"), QStringLiteral("dropped")));
        QJsonObject noContent;
        noContent[QStringLiteral("role")] = QStringLiteral("assistant");
        history.append(noContent);

        QJsonObject body;
        body[QStringLiteral("history")] = history;
        auto out = MessageNormalizer::normalize(body);

        QCOMPARE(out.messages.size(), 2);
        QCOMPARE(out.messages[0], (Message{QStringLiteral("user"), QStringLiteral("q")}));
        QCOMPARE(out.messages[1], (Message{QStringLiteral("assistant"), QString()}));
    }

    void testNothingMatchedSynthesizesEmptyUser() {
        QJsonObject body;
        body[QStringLiteral("model")] = QStringLiteral("gpt-4o");
        body[QStringLiteral("messages")] = QJsonArray();
        body[QStringLiteral("prompt")] = QString();

        auto out = MessageNormalizer::normalize(body);
        QVERIFY(out.synthesized);
        QCOMPARE(out.messages.size(), 1);
        QCOMPARE(out.messages[0].role, QStringLiteral("user"));
        QVERIFY(out.messages[0].content.isEmpty());
    }

    void testNonStringFieldsIgnored() {
        QJsonObject body;
        body[QStringLiteral("system")] = 42;
        body[QStringLiteral("prompt")] = QJsonArray{QStringLiteral("x")};
        body[QStringLiteral("messages")] = QStringLiteral("not an array");

        auto out = MessageNormalizer::normalize(body);
        QVERIFY(out.synthesized);
    }
};

QTEST_MAIN(TestMessageNormalizer)
#include "tst_message_normalizer.moc"
