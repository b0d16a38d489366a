/**
 * @file test_reconciler.cpp
 * @brief Unit tests for Reconciler class
 *
 * Tests idempotent imports, the message dedup window, thread aggregates,
 * cancellation, outbound recording and duplicate remediation.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QSignalSpy>
#include "sync/reconciler.h"
#include "sync/sqliterecordstore.h"
#include "mappers/recordcodecs.h"

using namespace PhoneSync;

namespace {

/**
 * @brief Stream that also reports rows it could not decode
 */
template<typename T>
class FailingRecordStream : public ListRecordStream<T>
{
public:
    FailingRecordStream(const QList<T> &records, const QStringList &errors)
        : ListRecordStream<T>(records)
    {
        for (const QString &error : errors) {
            this->reportError(error);
        }
    }
};

/**
 * @brief Sender that never transmits, answering from a preset result
 */
class FakeSender : public OutboundSender
{
public:
    SendResult nextResult;
    QStringList sent;

    SendResult send(const QString &identity, const QString &content) override
    {
        sent << identity + ": " + content;
        return nextResult;
    }
};

} // namespace

class TestReconciler : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Contact Tests ==========
    void testImportContacts();
    void testContactsIdempotent();
    void testContactUpdated();

    // ========== Message Tests ==========
    void testImportMessagesBuildsThreads();
    void testMessagesIdempotent();
    void testDedupWithinWindow();
    void testDedupOutsideWindow();
    void testDedupDefaultWindow();
    void testDedupIgnoresWhitespace();
    void testThreadConsistencyOutOfOrder();
    void testUnreadCount();
    void testGroupThread();
    void testThreadLinksContact();
    void testThreadLinksContactTrunkPrefix();
    void testMessageWithoutTimestamp();
    void testDecodeErrorsCounted();
    void testCancellationKeepsCommitted();

    // ========== Call Tests ==========
    void testImportCalls();
    void testCallWithoutTimestamp();

    // ========== Outbound Tests ==========
    void testRecordOutboundSent();
    void testRecordOutboundFailed();
    void testRecordOutboundTwice();

    // ========== Remediation Tests ==========
    void testRemoveDuplicateMessages();
    void testRemoveDuplicatesNothingToDo();

private:
    MessageRecord makeMessage(const QString &id, const QString &identity, const QString &text,
                              const QDateTime &time,
                              MessageDirection direction = MessageDirection::Inbound,
                              bool read = true);
    ContactRecord makeContact(const QString &id, const QString &first, const QString &phone);
    ImportResult importMessages(const QList<MessageRecord> &messages);
    void verifyThreadConsistency();
    QDateTime at(qint64 seconds) const;

    SqliteRecordStore *m_store;
    Reconciler *m_reconciler;
};

void TestReconciler::initTestCase()
{
    qDebug() << "Starting Reconciler tests";
}

void TestReconciler::cleanupTestCase()
{
    qDebug() << "Reconciler tests complete";
}

void TestReconciler::init()
{
    m_store = new SqliteRecordStore(":memory:");
    QVERIFY(m_store->open());
    m_reconciler = new Reconciler(m_store);
}

void TestReconciler::cleanup()
{
    delete m_reconciler;
    delete m_store;
    m_reconciler = nullptr;
    m_store = nullptr;
}

QDateTime TestReconciler::at(qint64 seconds) const
{
    return QDateTime(QDate(2024, 2, 1), QTime(8, 0), Qt::UTC).addSecs(seconds);
}

MessageRecord TestReconciler::makeMessage(const QString &id, const QString &identity,
                                          const QString &text, const QDateTime &time,
                                          MessageDirection direction, bool read)
{
    MessageRecord message;
    message.id = id;
    message.phoneIdentity = RecordCodecs::normalizePhone(identity);
    message.conversationKey = message.phoneIdentity;
    message.text = text;
    message.timestamp = time;
    message.direction = direction;
    message.isRead = read;
    return message;
}

ContactRecord TestReconciler::makeContact(const QString &id, const QString &first, const QString &phone)
{
    ContactRecord contact;
    contact.id = id;
    contact.firstName = first;
    contact.phoneNumbers.append(LabeledValue{"mobile", phone});
    return contact;
}

ImportResult TestReconciler::importMessages(const QList<MessageRecord> &messages)
{
    ListRecordStream<MessageRecord> stream(messages);
    return m_reconciler->importRecords(stream);
}

void TestReconciler::verifyThreadConsistency()
{
    const QList<ConversationThread> threads = m_store->threads(-1, 0, true);
    for (const ConversationThread &thread : threads) {
        QList<MessageRecord> messages = m_store->threadMessages(thread.key);
        QVERIFY(!messages.isEmpty());

        MessageRecord latest = messages.first();
        int unread = 0;
        for (const MessageRecord &message : messages) {
            if (message.timestamp >= latest.timestamp) {
                latest = message;
            }
            if (message.direction == MessageDirection::Inbound && !message.isRead) {
                unread++;
            }
        }

        QCOMPARE(thread.lastMessageId, latest.id);
        QCOMPARE(thread.lastActivity, latest.timestamp);
        QCOMPARE(thread.messageCount, messages.size());
        QCOMPARE(thread.unreadCount, unread);
    }
}

// ========== Contact Tests ==========

void TestReconciler::testImportContacts()
{
    ListRecordStream<ContactRecord> stream({
        makeContact("1", "Alice", "+19415180701"),
        makeContact("2", "Bob", "5551234")
    });

    ImportResult result = m_reconciler->importRecords(stream);
    QCOMPARE(result.imported, 2);
    QCOMPARE(result.skipped, 0);
    QCOMPARE(result.errors, 0);
    QCOMPARE(m_store->contactCount(), 2);
    QCOMPARE(m_store->contactIdForPhone("(941) 518-0701"), QString("1"));
}

void TestReconciler::testContactsIdempotent()
{
    QList<ContactRecord> contacts = {
        makeContact("1", "Alice", "+19415180701"),
        makeContact("2", "Bob", "5551234")
    };

    ListRecordStream<ContactRecord> first(contacts);
    QCOMPARE(m_reconciler->importRecords(first).imported, 2);

    ListRecordStream<ContactRecord> second(contacts);
    ImportResult result = m_reconciler->importRecords(second);
    QCOMPARE(result.imported, 0);
    QCOMPARE(result.updated, 0);
    QCOMPARE(result.skipped, 2);
    QCOMPARE(m_store->contactCount(), 2);
}

void TestReconciler::testContactUpdated()
{
    ListRecordStream<ContactRecord> first({makeContact("1", "Alice", "+19415180701")});
    m_reconciler->importRecords(first);

    ContactRecord changed = makeContact("1", "Alicia", "+19415180701");
    changed.emails.append(LabeledValue{"home", "alicia@example.com"});
    ListRecordStream<ContactRecord> second({changed});

    ImportResult result = m_reconciler->importRecords(second);
    QCOMPARE(result.imported, 0);
    QCOMPARE(result.updated, 1);
    QCOMPARE(m_store->contact("1").firstName, QString("Alicia"));
    QCOMPARE(m_store->contact("1").emails.size(), 1);
}

// ========== Message Tests ==========

void TestReconciler::testImportMessagesBuildsThreads()
{
    ImportResult result = importMessages({
        makeMessage("1", "+19415180701", "Hi", at(0), MessageDirection::Outbound),
        makeMessage("2", "+19415180701", "Hello", at(60)),
        makeMessage("3", "5551234", "Lunch?", at(120))
    });

    QCOMPARE(result.imported, 3);
    QCOMPARE(result.errors, 0);
    QCOMPARE(m_store->threadCount(), 2);

    ConversationThread thread = m_store->thread("(941) 518-0701");
    QVERIFY(thread.isValid());
    QCOMPARE(thread.phoneIdentity, QString("(941) 518-0701"));
    QCOMPARE(thread.messageCount, 2);
    QCOMPARE(thread.lastMessageId, QString("2"));
    QCOMPARE(thread.lastMessagePreview, QString("Hello"));
    QVERIFY(!thread.isGroup);

    QList<ConversationThread> threads = m_store->threads();
    QCOMPARE(threads.first().key, QString("5551234"));
    verifyThreadConsistency();
}

void TestReconciler::testMessagesIdempotent()
{
    QList<MessageRecord> messages = {
        makeMessage("1", "5551234", "one", at(0)),
        makeMessage("2", "5551234", "two", at(10), MessageDirection::Inbound, false),
        makeMessage("3", "+19415180701", "three", at(20))
    };

    importMessages(messages);
    ConversationThread before = m_store->thread("5551234");

    ImportResult result = importMessages(messages);
    QCOMPARE(result.imported, 0);
    QCOMPARE(result.skipped, 3);
    QCOMPARE(m_store->messageCount(), 3);
    QCOMPARE(m_store->threadCount(), 2);

    ConversationThread after = m_store->thread("5551234");
    QCOMPARE(after.messageCount, before.messageCount);
    QCOMPARE(after.unreadCount, before.unreadCount);
    QCOMPARE(after.lastMessageId, before.lastMessageId);
    QCOMPARE(after.lastActivity, before.lastActivity);
}

void TestReconciler::testDedupWithinWindow()
{
    m_reconciler->setDedupWindowSeconds(60);

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "See you soon", at(0)),
        makeMessage("2", "5551234", "See you soon", at(2))
    });

    QCOMPARE(result.imported, 1);
    QCOMPARE(result.skipped, 1);
    QCOMPARE(m_store->messageCount(), 1);
    QVERIFY(m_store->hasMessage("1"));
    QVERIFY(!m_store->hasMessage("2"));
}

void TestReconciler::testDedupOutsideWindow()
{
    m_reconciler->setDedupWindowSeconds(60);

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "Happy birthday", at(0)),
        makeMessage("2", "5551234", "Happy birthday", at(10 * 24 * 3600))
    });

    QCOMPARE(result.imported, 2);
    QCOMPARE(result.skipped, 0);
    QCOMPARE(m_store->thread("5551234").messageCount, 2);
}

void TestReconciler::testDedupDefaultWindow()
{
    QCOMPARE(m_reconciler->dedupWindowSeconds(), 0);

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "ok", at(0)),
        makeMessage("2", "5551234", "ok", at(0)),
        makeMessage("3", "5551234", "ok", at(1))
    });

    QCOMPARE(result.imported, 2);
    QCOMPARE(result.skipped, 1);
    QVERIFY(!m_store->hasMessage("2"));
}

void TestReconciler::testDedupIgnoresWhitespace()
{
    m_reconciler->setDedupWindowSeconds(60);

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "on my way", at(0)),
        makeMessage("2", "5551234", "  on  my way\n", at(30)),
        makeMessage("3", "+19415180701", "on my way", at(30))
    });

    QCOMPARE(result.imported, 2);
    QCOMPARE(result.skipped, 1);
    QVERIFY(m_store->hasMessage("3"));
}

void TestReconciler::testThreadConsistencyOutOfOrder()
{
    ImportResult result = importMessages({
        makeMessage("3", "5551234", "latest", at(300)),
        makeMessage("1", "5551234", "earliest", at(100)),
        makeMessage("2", "5551234", "middle", at(200))
    });
    QCOMPARE(result.imported, 3);

    ConversationThread thread = m_store->thread("5551234");
    QCOMPARE(thread.lastMessageId, QString("3"));
    QCOMPARE(thread.lastMessagePreview, QString("latest"));
    QCOMPARE(thread.lastActivity, at(300));
    verifyThreadConsistency();
}

void TestReconciler::testUnreadCount()
{
    importMessages({
        makeMessage("1", "5551234", "a", at(0), MessageDirection::Inbound, false),
        makeMessage("2", "5551234", "b", at(1), MessageDirection::Inbound, false),
        makeMessage("3", "5551234", "c", at(2), MessageDirection::Outbound, false),
        makeMessage("4", "5551234", "d", at(3), MessageDirection::Inbound, true)
    });

    QCOMPARE(m_store->thread("5551234").unreadCount, 2);

    QVERIFY(m_store->markThreadRead("5551234"));
    QCOMPARE(m_store->thread("5551234").unreadCount, 0);
    verifyThreadConsistency();
}

void TestReconciler::testGroupThread()
{
    QStringList participants = {"+19415180701", "5551234"};
    QString key = RecordCodecs::groupConversationKey(participants);

    MessageRecord message = makeMessage("1", "5551234", "hello all", at(0));
    message.conversationKey = key;
    message.isGroup = true;
    message.participants = QStringList({"(941) 518-0701", "5551234"});
    message.groupName = "Weekend";

    ImportResult result = importMessages({message});
    QCOMPARE(result.imported, 1);

    ConversationThread thread = m_store->thread(key);
    QVERIFY(thread.isValid());
    QVERIFY(thread.isGroup);
    QCOMPARE(thread.groupName, QString("Weekend"));
    QCOMPARE(thread.participants, message.participants);
    QVERIFY(thread.contactId.isEmpty());
}

void TestReconciler::testThreadLinksContact()
{
    ListRecordStream<ContactRecord> contacts({makeContact("7", "Carol", "941-518-0701")});
    m_reconciler->importRecords(contacts);

    importMessages({makeMessage("1", "+19415180701", "hey Carol", at(0))});
    QCOMPARE(m_store->thread("(941) 518-0701").contactId, QString("7"));
}

void TestReconciler::testThreadLinksContactTrunkPrefix()
{
    ListRecordStream<ContactRecord> contacts({makeContact("8", "Dave", "1 (941) 518-0701")});
    m_reconciler->importRecords(contacts);

    importMessages({
        makeMessage("1", "+19415180701", "from the handle", at(0)),
        makeMessage("2", "1-941-518-0701", "same person", at(10))
    });

    ConversationThread thread = m_store->thread("(941) 518-0701");
    QCOMPARE(thread.contactId, QString("8"));
    QCOMPARE(thread.messageCount, 2);
    QCOMPARE(m_store->threadCount(), 1);
}

void TestReconciler::testMessageWithoutTimestamp()
{
    QSignalSpy spy(m_reconciler, &Reconciler::errorOccurred);

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "no time", QDateTime()),
        makeMessage("2", "5551234", "fine", at(0))
    });

    QCOMPARE(result.imported, 1);
    QCOMPARE(result.errors, 1);
    QCOMPARE(result.errorList.size(), 1);
    QVERIFY(result.errorList.first().startsWith("RecordDecodeError"));
    QCOMPARE(spy.count(), 1);
}

void TestReconciler::testDecodeErrorsCounted()
{
    FailingRecordStream<MessageRecord> stream(
        {makeMessage("1", "5551234", "good", at(0))},
        {"Message 2 has no date", "Message 3 has no date"});

    ImportResult result = m_reconciler->importRecords(stream);
    QCOMPARE(result.imported, 1);
    QCOMPARE(result.errors, 2);
    QVERIFY(result.errorList.at(0).startsWith("RecordDecodeError"));
    QCOMPARE(result.total(), 3);
}

void TestReconciler::testCancellationKeepsCommitted()
{
    int checks = 0;
    m_reconciler->setCancelCheck([&checks]() { return ++checks > 2; });

    ImportResult result = importMessages({
        makeMessage("1", "5551234", "one", at(0)),
        makeMessage("2", "5551234", "two", at(1)),
        makeMessage("3", "5551234", "three", at(2)),
        makeMessage("4", "5551234", "four", at(3))
    });

    QVERIFY(result.cancelled);
    QCOMPARE(result.imported, 2);
    QCOMPARE(m_store->messageCount(), 2);

    ConversationThread thread = m_store->thread("5551234");
    QCOMPARE(thread.messageCount, 2);
    QCOMPARE(thread.lastMessageId, QString("2"));
    verifyThreadConsistency();

    // Resuming imports the remainder only
    m_reconciler->setCancelCheck(nullptr);
    result = importMessages({
        makeMessage("1", "5551234", "one", at(0)),
        makeMessage("2", "5551234", "two", at(1)),
        makeMessage("3", "5551234", "three", at(2)),
        makeMessage("4", "5551234", "four", at(3))
    });
    QCOMPARE(result.imported, 2);
    QCOMPARE(result.skipped, 2);
    verifyThreadConsistency();
}

// ========== Call Tests ==========

void TestReconciler::testImportCalls()
{
    CallRecord outgoing;
    outgoing.id = "1";
    outgoing.phoneIdentity = "(941) 518-0701";
    outgoing.timestamp = at(0);
    outgoing.durationSeconds = 65;
    outgoing.direction = CallDirection::Outgoing;

    CallRecord missed;
    missed.id = "2";
    missed.phoneIdentity = "5551234";
    missed.timestamp = at(100);
    missed.direction = CallDirection::Missed;

    ListRecordStream<CallRecord> first({outgoing, missed});
    ImportResult result = m_reconciler->importRecords(first);
    QCOMPARE(result.imported, 2);

    ListRecordStream<CallRecord> second({outgoing, missed});
    result = m_reconciler->importRecords(second);
    QCOMPARE(result.imported, 0);
    QCOMPARE(result.skipped, 2);
    QCOMPARE(m_store->callCount(), 2);
    QCOMPARE(m_store->callStatistics().missedCalls, 1);
}

void TestReconciler::testCallWithoutTimestamp()
{
    CallRecord undated;
    undated.id = "1";
    undated.phoneIdentity = "5551234";

    ListRecordStream<CallRecord> stream({undated});
    ImportResult result = m_reconciler->importRecords(stream);
    QCOMPARE(result.imported, 0);
    QCOMPARE(result.errors, 1);
    QVERIFY(result.errorList.first().startsWith("RecordDecodeError"));
    QCOMPARE(m_store->callCount(), 0);
}

// ========== Outbound Tests ==========

void TestReconciler::testRecordOutboundSent()
{
    FakeSender sender;
    DeliveryReceipt receipt;
    receipt.messageId = "host-42";
    receipt.sentAt = at(500);
    receipt.delivered = true;
    sender.nextResult = SendResult::success(receipt);

    OutboundReport report;
    report.identity = "+1 941 518 0701";
    report.content = "Running late";
    report.channel = ChannelKind::IpMessage;
    report.result = sender.send(report.identity, report.content);

    QString messageId;
    QVERIFY(m_reconciler->recordOutbound(report, &messageId));
    QCOMPARE(messageId, QString("host-42"));
    QCOMPARE(sender.sent.size(), 1);

    MessageRecord stored = m_store->message("host-42");
    QCOMPARE(stored.direction, MessageDirection::Outbound);
    QCOMPARE(stored.conversationKey, QString("(941) 518-0701"));
    QCOMPARE(stored.timestamp, at(500));
    QVERIFY(stored.isDelivered);
    QVERIFY(!stored.isFailed);
    QVERIFY(stored.isRead);

    ConversationThread thread = m_store->thread("(941) 518-0701");
    QCOMPARE(thread.lastMessageId, QString("host-42"));
    QCOMPARE(thread.unreadCount, 0);
}

void TestReconciler::testRecordOutboundFailed()
{
    OutboundReport report;
    report.identity = "5551234";
    report.content = "Are you there?";
    report.result = SendResult::failure(SendError::HostUnavailable, "Messages is not running");

    QString messageId;
    QVERIFY(m_reconciler->recordOutbound(report, &messageId));
    QVERIFY(messageId.startsWith("outbound-"));

    MessageRecord stored = m_store->message(messageId);
    QVERIFY(stored.isFailed);
    QVERIFY(!stored.isDelivered);
    QCOMPARE(m_store->thread("5551234").messageCount, 1);
}

void TestReconciler::testRecordOutboundTwice()
{
    DeliveryReceipt receipt;
    receipt.messageId = "host-1";
    receipt.sentAt = at(0);

    OutboundReport report;
    report.identity = "5551234";
    report.content = "ping";
    report.result = SendResult::success(receipt);

    QVERIFY(m_reconciler->recordOutbound(report));
    QVERIFY(!m_reconciler->recordOutbound(report));
    QCOMPARE(m_store->messageCount(), 1);
}

// ========== Remediation Tests ==========

void TestReconciler::testRemoveDuplicateMessages()
{
    // Legacy rows stored without dedup signatures
    ConversationThread direct;
    direct.key = "5551234";
    direct.phoneIdentity = "5551234";
    QVERIFY(m_store->saveThread(direct));

    ConversationThread stray;
    stray.key = "5551234-legacy";
    stray.phoneIdentity = "5551234";
    QVERIFY(m_store->saveThread(stray));

    MessageRecord first = makeMessage("1", "5551234", "hi there", at(0));
    MessageRecord repeat = makeMessage("2", "5551234", "hi  there", at(3 * 24 * 3600));
    MessageRecord other = makeMessage("3", "5551234", "different", at(60));
    MessageRecord legacy = makeMessage("4", "5551234", "hi there", at(120));
    legacy.conversationKey = "5551234-legacy";

    QVERIFY(m_store->insertMessage(first, QString("")));
    QVERIFY(m_store->insertMessage(repeat, QString("")));
    QVERIFY(m_store->insertMessage(other, QString("")));
    QVERIFY(m_store->insertMessage(legacy, QString("")));

    CleanupReport report = m_reconciler->removeDuplicateMessages();
    QCOMPARE(report.groupsExamined, 2);
    QCOMPARE(report.duplicatesRemoved, 2);
    QCOMPARE(report.threadsRepaired, 2);
    QCOMPARE(report.threadsRemoved, 1);

    QVERIFY(m_store->hasMessage("1"));
    QVERIFY(!m_store->hasMessage("2"));
    QVERIFY(m_store->hasMessage("3"));
    QVERIFY(!m_store->hasMessage("4"));
    QVERIFY(!m_store->thread("5551234-legacy").isValid());

    ConversationThread thread = m_store->thread("5551234");
    QCOMPARE(thread.messageCount, 2);
    QCOMPARE(thread.lastMessageId, QString("3"));
    verifyThreadConsistency();
}

void TestReconciler::testRemoveDuplicatesNothingToDo()
{
    importMessages({
        makeMessage("1", "5551234", "a", at(0)),
        makeMessage("2", "5551234", "b", at(1))
    });

    CleanupReport report = m_reconciler->removeDuplicateMessages();
    QCOMPARE(report.groupsExamined, 2);
    QCOMPARE(report.duplicatesRemoved, 0);
    QCOMPARE(report.threadsRepaired, 0);
    QCOMPARE(report.threadsRemoved, 0);
    QCOMPARE(m_store->messageCount(), 2);
}

QTEST_MAIN(TestReconciler)
#include "test_reconciler.moc"
