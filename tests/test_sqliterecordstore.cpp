/**
 * @file test_sqliterecordstore.cpp
 * @brief Unit tests for SqliteRecordStore
 *
 * Tests persistence of contacts, messages, threads and calls, the query
 * surface, transactions and the vCard export.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include "sync/sqliterecordstore.h"

using namespace PhoneSync;

class TestSqliteRecordStore : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Lifecycle Tests ==========
    void testOpenMemory();
    void testReopenFile();

    // ========== Contact Tests ==========
    void testInsertContact();
    void testUpdateContactReplacesPhones();
    void testContactsOrderAndPaging();
    void testExportContactsVCard();

    // ========== Message Tests ==========
    void testInsertMessageWithAttachments();
    void testDuplicateWindow();
    void testThreadMessagesOrder();
    void testSearchMessages();
    void testDeleteMessages();

    // ========== Thread Tests ==========
    void testSaveAndLoadThread();
    void testThreadsOrderAndArchive();
    void testRecomputeThread();
    void testMarkThreadRead();
    void testDeleteEmptyThreads();

    // ========== Call Tests ==========
    void testInsertCallLinksContact();
    void testCallStatistics();

    // ========== Transaction Tests ==========
    void testTransactionRollback();
    void testNestedTransaction();

private:
    MessageRecord makeMessage(const QString &id, const QString &key, const QString &text,
                              const QDateTime &time,
                              MessageDirection direction = MessageDirection::Inbound,
                              bool read = true);
    ConversationThread makeThread(const QString &key);
    QDateTime at(int minutes) const;

    SqliteRecordStore *m_store;
};

void TestSqliteRecordStore::initTestCase()
{
    qDebug() << "Starting SqliteRecordStore tests";
}

void TestSqliteRecordStore::cleanupTestCase()
{
    qDebug() << "SqliteRecordStore tests complete";
}

void TestSqliteRecordStore::init()
{
    m_store = new SqliteRecordStore(":memory:");
    QVERIFY(m_store->open());
}

void TestSqliteRecordStore::cleanup()
{
    delete m_store;
    m_store = nullptr;
}

QDateTime TestSqliteRecordStore::at(int minutes) const
{
    return QDateTime(QDate(2024, 3, 1), QTime(12, 0), Qt::UTC).addSecs(minutes * 60);
}

MessageRecord TestSqliteRecordStore::makeMessage(const QString &id, const QString &key,
                                                 const QString &text, const QDateTime &time,
                                                 MessageDirection direction, bool read)
{
    MessageRecord message;
    message.id = id;
    message.conversationKey = key;
    message.phoneIdentity = key;
    message.text = text;
    message.timestamp = time;
    message.direction = direction;
    message.isRead = read;
    return message;
}

ConversationThread TestSqliteRecordStore::makeThread(const QString &key)
{
    ConversationThread thread;
    thread.key = key;
    thread.phoneIdentity = key;
    return thread;
}

// ========== Lifecycle Tests ==========

void TestSqliteRecordStore::testOpenMemory()
{
    QVERIFY(m_store->isAvailable());
    QCOMPARE(m_store->backendId(), QString("sqlite"));
    QCOMPARE(m_store->contactCount(), 0);
    QCOMPARE(m_store->messageCount(), 0);
    QCOMPARE(m_store->threadCount(), 0);
    QCOMPARE(m_store->callCount(), 0);

    m_store->close();
    QVERIFY(!m_store->isAvailable());
}

void TestSqliteRecordStore::testReopenFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = dir.filePath("store.db");

    {
        SqliteRecordStore store(path);
        QVERIFY(store.open());
        QVERIFY(store.saveThread(makeThread("5551234")));
        QVERIFY(store.insertMessage(makeMessage("1", "5551234", "kept", at(0)), "sig"));
    }

    SqliteRecordStore store(path);
    QVERIFY(store.open());
    QCOMPARE(store.messageCount(), 1);
    QCOMPARE(store.message("1").text, QString("kept"));
    QCOMPARE(store.message("1").timestamp, at(0));
}

// ========== Contact Tests ==========

void TestSqliteRecordStore::testInsertContact()
{
    ContactRecord contact;
    contact.id = "1";
    contact.firstName = "Alice";
    contact.lastName = "Anders";
    contact.organization = "Acme";
    contact.phoneNumbers.append(LabeledValue{"mobile", "+19415180701"});
    contact.emails.append(LabeledValue{"work", "alice@example.com"});

    QVERIFY(!m_store->hasContact("1"));
    QVERIFY(m_store->insertContact(contact, "hash-1"));
    QVERIFY(m_store->hasContact("1"));
    QCOMPARE(m_store->contactContentHash("1"), QString("hash-1"));
    QVERIFY(m_store->contactContentHash("2").isEmpty());

    ContactRecord loaded = m_store->contact("1");
    QCOMPARE(loaded.firstName, QString("Alice"));
    QCOMPARE(loaded.organization, QString("Acme"));
    QVERIFY(loaded.phoneNumbers == contact.phoneNumbers);
    QVERIFY(loaded.emails == contact.emails);

    QCOMPARE(m_store->contactIdForPhone("(941) 518-0701"), QString("1"));
    QVERIFY(m_store->contactIdForPhone("5551234").isEmpty());

    // Duplicate id is rejected
    QVERIFY(!m_store->insertContact(contact, "hash-1"));
    QVERIFY(!m_store->lastError().isEmpty());
}

void TestSqliteRecordStore::testUpdateContactReplacesPhones()
{
    ContactRecord contact;
    contact.id = "1";
    contact.firstName = "Bob";
    contact.phoneNumbers.append(LabeledValue{"home", "555-1234"});
    QVERIFY(m_store->insertContact(contact, "h1"));

    contact.phoneNumbers.clear();
    contact.phoneNumbers.append(LabeledValue{"mobile", "555-9999"});
    QVERIFY(m_store->updateContact(contact, "h2"));

    QCOMPARE(m_store->contactCount(), 1);
    QCOMPARE(m_store->contactContentHash("1"), QString("h2"));
    QCOMPARE(m_store->contact("1").phoneNumbers.size(), 1);
    QVERIFY(m_store->contactIdForPhone("5551234").isEmpty());
    QCOMPARE(m_store->contactIdForPhone("5559999"), QString("1"));
}

void TestSqliteRecordStore::testContactsOrderAndPaging()
{
    const QStringList names = {"charlie", "Alice", "bob"};
    for (int i = 0; i < names.size(); ++i) {
        ContactRecord contact;
        contact.id = QString::number(i + 1);
        contact.firstName = names[i];
        QVERIFY(m_store->insertContact(contact, "h"));
    }

    QList<ContactRecord> all = m_store->contacts();
    QCOMPARE(all.size(), 3);
    QCOMPARE(all[0].firstName, QString("Alice"));
    QCOMPARE(all[1].firstName, QString("bob"));
    QCOMPARE(all[2].firstName, QString("charlie"));

    QList<ContactRecord> page = m_store->contacts(1, 1);
    QCOMPARE(page.size(), 1);
    QCOMPARE(page[0].firstName, QString("bob"));

    QCOMPARE(m_store->contacts(-1, 2).size(), 1);
}

void TestSqliteRecordStore::testExportContactsVCard()
{
    ContactRecord contact;
    contact.id = "5";
    contact.firstName = "Vera";
    contact.lastName = "Card";
    QVERIFY(m_store->insertContact(contact, "h"));

    QString document = m_store->exportContactsVCard();
    QCOMPARE(document.count("BEGIN:VCARD"), 1);
    QVERIFY(document.contains("FN:Vera Card\r\n"));
    QVERIFY(document.contains("UID:phone-contact-5\r\n"));
}

// ========== Message Tests ==========

void TestSqliteRecordStore::testInsertMessageWithAttachments()
{
    QVERIFY(m_store->saveThread(makeThread("5551234")));

    MessageRecord message = makeMessage("10", "5551234", "photo", at(0));
    message.guid = "GUID-10";
    message.channel = ChannelKind::IpMessage;
    message.isDelivered = true;
    message.attachments << "IMG_0001.jpg" << "voice.caf";
    QVERIFY(m_store->insertMessage(message, "sig-10"));

    QVERIFY(m_store->hasMessage("10"));
    QVERIFY(!m_store->hasMessage("11"));

    MessageRecord loaded = m_store->message("10");
    QCOMPARE(loaded.guid, QString("GUID-10"));
    QCOMPARE(loaded.conversationKey, QString("5551234"));
    QCOMPARE(loaded.channel, ChannelKind::IpMessage);
    QCOMPARE(loaded.direction, MessageDirection::Inbound);
    QCOMPARE(loaded.timestamp, at(0));
    QVERIFY(loaded.isDelivered);
    QVERIFY(!loaded.isFailed);
    QCOMPARE(loaded.attachments, QStringList({"IMG_0001.jpg", "voice.caf"}));

    QVERIFY(m_store->message("missing").id.isEmpty());
}

void TestSqliteRecordStore::testDuplicateWindow()
{
    QVERIFY(m_store->saveThread(makeThread("5551234")));
    QVERIFY(m_store->insertMessage(makeMessage("1", "5551234", "hi", at(0)), "sig"));

    QDateTime twoSecondsLater = at(0).addSecs(2);
    QVERIFY(m_store->hasDuplicateMessage("5551234", "sig", twoSecondsLater, 60));
    QVERIFY(m_store->hasDuplicateMessage("5551234", "sig", twoSecondsLater, 2));
    QVERIFY(!m_store->hasDuplicateMessage("5551234", "sig", twoSecondsLater, 1));
    QVERIFY(m_store->hasDuplicateMessage("5551234", "sig", at(0), 0));
    QVERIFY(!m_store->hasDuplicateMessage("5551234", "other", at(0), 60));
    QVERIFY(!m_store->hasDuplicateMessage("(941) 518-0701", "sig", at(0), 60));
}

void TestSqliteRecordStore::testThreadMessagesOrder()
{
    QVERIFY(m_store->saveThread(makeThread("5551234")));
    QVERIFY(m_store->insertMessage(makeMessage("3", "5551234", "third", at(3)), "a"));
    QVERIFY(m_store->insertMessage(makeMessage("1", "5551234", "first", at(1)), "b"));
    QVERIFY(m_store->insertMessage(makeMessage("2", "5551234", "second", at(2)), "c"));

    QList<MessageRecord> messages = m_store->threadMessages("5551234");
    QCOMPARE(messages.size(), 3);
    QCOMPARE(messages[0].text, QString("first"));
    QCOMPARE(messages[2].text, QString("third"));

    QList<MessageRecord> page = m_store->threadMessages("5551234", 1, 1);
    QCOMPARE(page.size(), 1);
    QCOMPARE(page[0].text, QString("second"));

    QCOMPARE(m_store->messageCount("5551234"), 3);
    QCOMPARE(m_store->messageCount("other"), 0);
}

void TestSqliteRecordStore::testSearchMessages()
{
    QVERIFY(m_store->saveThread(makeThread("5551234")));
    QVERIFY(m_store->insertMessage(makeMessage("1", "5551234", "Lunch at noon?", at(1)), "a"));
    QVERIFY(m_store->insertMessage(makeMessage("2", "5551234", "lunch was great", at(2)), "b"));
    QVERIFY(m_store->insertMessage(makeMessage("3", "5551234", "100% sure", at(3)), "c"));

    QList<MessageRecord> found = m_store->searchMessages("lunch");
    QCOMPARE(found.size(), 2);
    QCOMPARE(found[0].id, QString("2"));

    QCOMPARE(m_store->searchMessages("100%").size(), 1);
    QCOMPARE(m_store->searchMessages("%").size(), 1);
    QCOMPARE(m_store->searchMessages("lunch", 1).size(), 1);
    QVERIFY(m_store->searchMessages("  ").isEmpty());
}

void TestSqliteRecordStore::testDeleteMessages()
{
    QVERIFY(m_store->saveThread(makeThread("5551234")));
    MessageRecord message = makeMessage("1", "5551234", "with file", at(0));
    message.attachments << "a.png";
    QVERIFY(m_store->insertMessage(message, "a"));
    QVERIFY(m_store->insertMessage(makeMessage("2", "5551234", "plain", at(1)), "b"));

    QCOMPARE(m_store->deleteMessages({"1", "missing"}), 1);
    QVERIFY(!m_store->hasMessage("1"));
    QVERIFY(m_store->hasMessage("2"));
    QCOMPARE(m_store->deleteMessages({}), 0);
}

// ========== Thread Tests ==========

void TestSqliteRecordStore::testSaveAndLoadThread()
{
    ConversationThread thread;
    thread.key = "group:(941) 518-0701,5551234";
    thread.isGroup = true;
    thread.groupName = "Family";
    thread.participants << "(941) 518-0701" << "5551234";
    thread.lastActivity = at(5);
    thread.lastMessageId = "9";
    thread.lastMessagePreview = "see you";
    thread.messageCount = 4;
    thread.unreadCount = 1;
    QVERIFY(m_store->saveThread(thread));

    ConversationThread loaded = m_store->thread(thread.key);
    QVERIFY(loaded.isValid());
    QVERIFY(loaded.isGroup);
    QCOMPARE(loaded.groupName, QString("Family"));
    QCOMPARE(loaded.participants, thread.participants);
    QCOMPARE(loaded.lastActivity, at(5));
    QCOMPARE(loaded.messageCount, 4);
    QCOMPARE(loaded.unreadCount, 1);
    QVERIFY(!loaded.archived);

    QVERIFY(!m_store->thread("missing").isValid());
}

void TestSqliteRecordStore::testThreadsOrderAndArchive()
{
    ConversationThread older = makeThread("111");
    older.lastActivity = at(1);
    ConversationThread newer = makeThread("222");
    newer.lastActivity = at(2);
    QVERIFY(m_store->saveThread(older));
    QVERIFY(m_store->saveThread(newer));

    QList<ConversationThread> threads = m_store->threads();
    QCOMPARE(threads.size(), 2);
    QCOMPARE(threads[0].key, QString("222"));

    QVERIFY(m_store->setThreadArchived("222", true));
    QVERIFY(!m_store->setThreadArchived("missing", true));

    threads = m_store->threads();
    QCOMPARE(threads.size(), 1);
    QCOMPARE(threads[0].key, QString("111"));

    threads = m_store->threads(-1, 0, true);
    QCOMPARE(threads.size(), 2);
    QVERIFY(threads[0].archived);

    QCOMPARE(m_store->threads(1, 1, true).size(), 1);
}

void TestSqliteRecordStore::testRecomputeThread()
{
    ConversationThread thread = makeThread("5551234");
    thread.messageCount = 99;
    thread.unreadCount = 42;
    QVERIFY(m_store->saveThread(thread));

    QVERIFY(m_store->insertMessage(makeMessage("1", "5551234", "old", at(1), MessageDirection::Inbound, false), "a"));
    QVERIFY(m_store->insertMessage(makeMessage("2", "5551234", "newest", at(3), MessageDirection::Outbound, false), "b"));
    QVERIFY(m_store->insertMessage(makeMessage("3", "5551234", "middle", at(2), MessageDirection::Inbound, true), "c"));

    QVERIFY(m_store->recomputeThread("5551234"));

    ConversationThread loaded = m_store->thread("5551234");
    QCOMPARE(loaded.messageCount, 3);
    QCOMPARE(loaded.unreadCount, 1);
    QCOMPARE(loaded.lastMessageId, QString("2"));
    QCOMPARE(loaded.lastActivity, at(3));
    QCOMPARE(loaded.lastMessagePreview, QString("newest"));
}

void TestSqliteRecordStore::testMarkThreadRead()
{
    ConversationThread thread = makeThread("5551234");
    thread.unreadCount = 2;
    QVERIFY(m_store->saveThread(thread));
    QVERIFY(m_store->insertMessage(makeMessage("1", "5551234", "a", at(1), MessageDirection::Inbound, false), "a"));
    QVERIFY(m_store->insertMessage(makeMessage("2", "5551234", "b", at(2), MessageDirection::Inbound, false), "b"));

    QVERIFY(m_store->markThreadRead("5551234"));
    QCOMPARE(m_store->thread("5551234").unreadCount, 0);
    QVERIFY(m_store->message("1").isRead);
    QVERIFY(m_store->message("2").isRead);

    QVERIFY(m_store->recomputeThread("5551234"));
    QCOMPARE(m_store->thread("5551234").unreadCount, 0);
}

void TestSqliteRecordStore::testDeleteEmptyThreads()
{
    QVERIFY(m_store->saveThread(makeThread("111")));
    QVERIFY(m_store->saveThread(makeThread("222")));
    QVERIFY(m_store->insertMessage(makeMessage("1", "111", "a", at(1)), "a"));

    QCOMPARE(m_store->deleteEmptyThreads(), 1);
    QCOMPARE(m_store->threadCount(), 1);
    QVERIFY(m_store->thread("111").isValid());
    QCOMPARE(m_store->deleteEmptyThreads(), 0);
}

// ========== Call Tests ==========

void TestSqliteRecordStore::testInsertCallLinksContact()
{
    ContactRecord contact;
    contact.id = "7";
    contact.firstName = "Carol";
    contact.phoneNumbers.append(LabeledValue{"mobile", "941-518-0701"});
    QVERIFY(m_store->insertContact(contact, "h"));

    CallRecord call;
    call.id = "1";
    call.phoneIdentity = "(941) 518-0701";
    call.timestamp = at(0);
    call.durationSeconds = 42;
    call.direction = CallDirection::Outgoing;
    QVERIFY(m_store->insertCall(call));
    QVERIFY(m_store->hasCall("1"));

    CallRecord unknown;
    unknown.id = "2";
    unknown.phoneIdentity = "5550000";
    unknown.timestamp = at(5);
    QVERIFY(m_store->insertCall(unknown));

    QList<CallRecord> calls = m_store->calls();
    QCOMPARE(calls.size(), 2);
    QCOMPARE(calls[0].id, QString("2"));
    QVERIFY(calls[0].contactId.isEmpty());
    QCOMPARE(calls[1].contactId, QString("7"));
    QCOMPARE(calls[1].durationSeconds, 42);
    QCOMPARE(calls[1].direction, CallDirection::Outgoing);
    QCOMPARE(calls[1].timestamp, at(0));

    QCOMPARE(m_store->calls(1, 1).size(), 1);
}

void TestSqliteRecordStore::testCallStatistics()
{
    CallStatistics empty = m_store->callStatistics();
    QCOMPARE(empty.totalCalls, 0);
    QCOMPARE(empty.averageCallDuration, 0);

    const QList<CallDirection> directions = {
        CallDirection::Incoming, CallDirection::Outgoing, CallDirection::Missed, CallDirection::Incoming
    };
    const QList<int> durations = {60, 30, 0, 31};
    for (int i = 0; i < directions.size(); ++i) {
        CallRecord call;
        call.id = QString::number(i + 1);
        call.phoneIdentity = "5551234";
        call.timestamp = at(i);
        call.durationSeconds = durations[i];
        call.direction = directions[i];
        QVERIFY(m_store->insertCall(call));
    }

    CallStatistics stats = m_store->callStatistics();
    QCOMPARE(stats.totalCalls, 4);
    QCOMPARE(stats.incomingCalls, 2);
    QCOMPARE(stats.outgoingCalls, 1);
    QCOMPARE(stats.missedCalls, 1);
    QCOMPARE(stats.totalTalkTime, qint64(121));
    QCOMPARE(stats.averageCallDuration, 30);
}

// ========== Transaction Tests ==========

void TestSqliteRecordStore::testTransactionRollback()
{
    {
        Transaction transaction(m_store);
        QVERIFY(transaction.isActive());
        QVERIFY(m_store->saveThread(makeThread("111")));
        // Destroyed without commit
    }
    QCOMPARE(m_store->threadCount(), 0);

    {
        Transaction transaction(m_store);
        QVERIFY(m_store->saveThread(makeThread("222")));
        QVERIFY(transaction.commit());
    }
    QCOMPARE(m_store->threadCount(), 1);

    QVERIFY(!m_store->commitBatch());
}

void TestSqliteRecordStore::testNestedTransaction()
{
    QVERIFY(m_store->beginBatch());
    QVERIFY(m_store->saveThread(makeThread("111")));
    QVERIFY(m_store->beginBatch());
    QVERIFY(m_store->saveThread(makeThread("222")));
    QVERIFY(m_store->commitBatch());
    QVERIFY(m_store->commitBatch());
    QCOMPARE(m_store->threadCount(), 2);

    QVERIFY(m_store->beginBatch());
    QVERIFY(m_store->saveThread(makeThread("333")));
    QVERIFY(m_store->beginBatch());
    m_store->rollbackBatch();
    QVERIFY(!m_store->commitBatch());
    QCOMPARE(m_store->threadCount(), 2);
}

QTEST_MAIN(TestSqliteRecordStore)
#include "test_sqliterecordstore.moc"
