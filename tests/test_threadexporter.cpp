/**
 * @file test_threadexporter.cpp
 * @brief Unit tests for ThreadExporter class
 *
 * Tests CSV, JSON and plain text output of conversation threads and the
 * call log, contact CSV export and file writing.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonObject>
#include "sync/threadexporter.h"
#include "sync/reconciler.h"
#include "sync/sqliterecordstore.h"

using namespace PhoneSync;

class TestThreadExporter : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    QList<CallRecord> TestThreadExporter::sampleCalls() const
{
    CallRecord outgoing;
    outgoing.id = "1";
    outgoing.phoneIdentity = "(941) 518-0701";
    outgoing.contactId = "7";
    outgoing.timestamp = QDateTime(QDate(2024, 4, 2), QTime(10, 0, 0), Qt::UTC);
    outgoing.durationSeconds = 65;
    outgoing.direction = CallDirection::Outgoing;

    CallRecord missed;
    missed.id = "2";
    missed.phoneIdentity = "5551234";
    missed.timestamp = QDateTime(QDate(2024, 4, 1), QTime(8, 30, 0), Qt::UTC);
    missed.direction = CallDirection::Missed;

    return {outgoing, missed};
}

// ========== Format Tests ==========
    void testFormatNames();

    // ========== CSV Tests ==========
    void testCsvHeaderOnly();
    void testCsvRows();
    void testCsvQuoting();

    // ========== JSON Tests ==========
    void testJsonFields();

    // ========== Plain Text Tests ==========
    void testPlainTextArrows();

    // ========== Store Export Tests ==========
    void testExportThreadOrder();
    void testExportUnknownThread();
    void testExportClosedStore();
    void testExportToFile();
    void testExportToFullDevice();

    // ========== Call Log Tests ==========
    void testFormatDuration();
    void testCallsCsv();
    void testCallsJson();
    void testCallsPlainText();
    void testExportCallsFromStore();
    void testExportCallsClosedStore();

    // ========== Contact Tests ==========
    void testContactsCsv();
    void testExportContactsToFile();

private:
    QList<MessageRecord> sampleMessages() const;
    QList<CallRecord> sampleCalls() const;
};

void TestThreadExporter::initTestCase()
{
    qDebug() << "Starting ThreadExporter tests";
}

void TestThreadExporter::cleanupTestCase()
{
    qDebug() << "ThreadExporter tests complete";
}

QList<MessageRecord> TestThreadExporter::sampleMessages() const
{
    MessageRecord sent;
    sent.id = "1";
    sent.phoneIdentity = "(941) 518-0701";
    sent.conversationKey = sent.phoneIdentity;
    sent.text = "Hi Alice";
    sent.direction = MessageDirection::Outbound;
    sent.timestamp = QDateTime(QDate(2024, 4, 1), QTime(9, 0, 0), Qt::UTC);
    sent.isDelivered = true;

    MessageRecord received;
    received.id = "2";
    received.phoneIdentity = "(941) 518-0701";
    received.conversationKey = received.phoneIdentity;
    received.text = "Hello back";
    received.channel = ChannelKind::IpMessage;
    received.direction = MessageDirection::Inbound;
    received.timestamp = QDateTime(QDate(2024, 4, 1), QTime(9, 5, 30), Qt::UTC);
    received.isRead = false;
    received.attachments << "IMG_0001.jpeg";

    return {sent, received};
}

QList<CallRecord> TestThreadExporter::sampleCalls() const
{
    CallRecord outgoing;
    outgoing.id = "1";
    outgoing.phoneIdentity = "(941) 518-0701";
    outgoing.contactId = "7";
    outgoing.timestamp = QDateTime(QDate(2024, 4, 2), QTime(10, 0, 0), Qt::UTC);
    outgoing.durationSeconds = 65;
    outgoing.direction = CallDirection::Outgoing;

    CallRecord missed;
    missed.id = "2";
    missed.phoneIdentity = "5551234";
    missed.timestamp = QDateTime(QDate(2024, 4, 1), QTime(8, 30, 0), Qt::UTC);
    missed.direction = CallDirection::Missed;

    return {outgoing, missed};
}

// ========== Format Tests ==========

void TestThreadExporter::testFormatNames()
{
    ThreadExporter::Format format = ThreadExporter::Format::Csv;

    QVERIFY(ThreadExporter::formatFromName("JSON", &format));
    QVERIFY(format == ThreadExporter::Format::Json);
    QVERIFY(ThreadExporter::formatFromName("txt", &format));
    QVERIFY(format == ThreadExporter::Format::PlainText);
    QVERIFY(ThreadExporter::formatFromName(" csv ", &format));
    QVERIFY(format == ThreadExporter::Format::Csv);
    QVERIFY(!ThreadExporter::formatFromName("xml", &format));

    QCOMPARE(ThreadExporter::formatName(ThreadExporter::Format::PlainText), QString("text"));
    QCOMPARE(ThreadExporter::fileExtension(ThreadExporter::Format::PlainText), QString("txt"));
    QCOMPARE(ThreadExporter::fileExtension(ThreadExporter::Format::Json), QString("json"));
}

// ========== CSV Tests ==========

void TestThreadExporter::testCsvHeaderOnly()
{
    QCOMPARE(ThreadExporter::toCsv({}),
             QString("timestamp,direction,identity,channel,text,read,delivered\r\n"));
}

void TestThreadExporter::testCsvRows()
{
    QString csv = ThreadExporter::toCsv(sampleMessages());
    QStringList lines = csv.split("\r\n");

    QCOMPARE(lines.size(), 4);
    QCOMPARE(lines[1], QString("2024-04-01T09:00:00Z,outbound,(941) 518-0701,sms,Hi Alice,1,1"));
    QCOMPARE(lines[2], QString("2024-04-01T09:05:30Z,inbound,(941) 518-0701,imessage,Hello back,0,0"));
    QVERIFY(lines[3].isEmpty());
}

void TestThreadExporter::testCsvQuoting()
{
    MessageRecord message;
    message.phoneIdentity = "5551234";
    message.text = "Say \"cheese\", ok?\nBye";
    message.timestamp = QDateTime(QDate(2024, 1, 2), QTime(3, 4, 5), Qt::UTC);

    QString csv = ThreadExporter::toCsv({message});
    QVERIFY(csv.contains(",\"Say \"\"cheese\"\", ok?\nBye\",1,0\r\n"));
}

// ========== JSON Tests ==========

void TestThreadExporter::testJsonFields()
{
    QJsonDocument doc = QJsonDocument::fromJson(ThreadExporter::toJson(sampleMessages()).toUtf8());
    QVERIFY(doc.isArray());

    QJsonArray array = doc.array();
    QCOMPARE(array.size(), 2);

    QJsonObject first = array[0].toObject();
    QCOMPARE(first["id"].toString(), QString("1"));
    QCOMPARE(first["timestamp"].toString(), QString("2024-04-01T09:00:00Z"));
    QCOMPARE(first["direction"].toString(), QString("outbound"));
    QCOMPARE(first["identity"].toString(), QString("(941) 518-0701"));
    QCOMPARE(first["channel"].toString(), QString("sms"));
    QCOMPARE(first["delivered"].toBool(), true);
    QCOMPARE(first["failed"].toBool(), false);
    QVERIFY(!first.contains("attachments"));

    QJsonObject second = array[1].toObject();
    QCOMPARE(second["read"].toBool(), false);
    QCOMPARE(second["channel"].toString(), QString("imessage"));
    QCOMPARE(second["attachments"].toArray().size(), 1);
    QCOMPARE(second["attachments"].toArray()[0].toString(), QString("IMG_0001.jpeg"));
}

// ========== Plain Text Tests ==========

void TestThreadExporter::testPlainTextArrows()
{
    QString text = ThreadExporter::toPlainText(sampleMessages());
    QCOMPARE(text, QString("[2024-04-01 09:00:00] -> (941) 518-0701: Hi Alice\n"
                           "[2024-04-01 09:05:30] <- (941) 518-0701: Hello back\n"));
}

// ========== Store Export Tests ==========

void TestThreadExporter::testExportThreadOrder()
{
    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());
    Reconciler reconciler(&store);

    QList<MessageRecord> messages = sampleMessages();
    ListRecordStream<MessageRecord> stream({messages[1], messages[0]});
    QCOMPARE(reconciler.importRecords(stream).imported, 2);

    QString error;
    QString text = ThreadExporter::exportThread(&store, "(941) 518-0701",
                                                ThreadExporter::Format::PlainText, &error);
    QVERIFY(error.isEmpty());
    QVERIFY(text.startsWith("[2024-04-01 09:00:00] -> "));
    QCOMPARE(text.count('\n'), 2);
}

void TestThreadExporter::testExportUnknownThread()
{
    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());

    QString error;
    QString text = ThreadExporter::exportThread(&store, "nobody", ThreadExporter::Format::Csv, &error);
    QVERIFY(text.isEmpty());
    QCOMPARE(error, QString("No conversation nobody"));
}

void TestThreadExporter::testExportClosedStore()
{
    SqliteRecordStore store(":memory:");

    QString error;
    QVERIFY(ThreadExporter::exportThread(&store, "5551234", ThreadExporter::Format::Json, &error).isEmpty());
    QCOMPARE(error, QString("Record store is not open"));

    QVERIFY(ThreadExporter::exportThread(nullptr, "5551234", ThreadExporter::Format::Json).isEmpty());
}

void TestThreadExporter::testExportToFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());
    Reconciler reconciler(&store);

    MessageRecord message = sampleMessages().first();
    message.text = QString::fromUtf8("Caf\xc3\xa9 at 9?");
    ListRecordStream<MessageRecord> stream({message});
    reconciler.importRecords(stream);

    QString path = dir.filePath("thread.csv");
    QString error;
    QVERIFY(ThreadExporter::exportThreadToFile(&store, "(941) 518-0701",
                                               ThreadExporter::Format::Csv, path, &error));

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QString content = QString::fromUtf8(file.readAll());
    QVERIFY(content.contains(QString::fromUtf8("Caf\xc3\xa9 at 9?")));

    QVERIFY(!ThreadExporter::exportThreadToFile(&store, "nobody",
                                                ThreadExporter::Format::Csv, path, &error));
    QCOMPARE(error, QString("No conversation nobody"));
}

void TestThreadExporter::testExportToFullDevice()
{
    if (!QFile::exists("/dev/full")) {
        QSKIP("No /dev/full on this system");
    }

    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());
    Reconciler reconciler(&store);
    ListRecordStream<MessageRecord> stream(sampleMessages());
    reconciler.importRecords(stream);

    // Opening succeeds, every write fails with ENOSPC
    QString error;
    QVERIFY(!ThreadExporter::exportThreadToFile(&store, "(941) 518-0701",
                                                ThreadExporter::Format::Json, "/dev/full", &error));
    QVERIFY(error.startsWith("Failed to write /dev/full"));
}

// ========== Call Log Tests ==========

void TestThreadExporter::testFormatDuration()
{
    QCOMPARE(ThreadExporter::formatDuration(0), QString("0:00"));
    QCOMPARE(ThreadExporter::formatDuration(9), QString("0:09"));
    QCOMPARE(ThreadExporter::formatDuration(65), QString("1:05"));
    QCOMPARE(ThreadExporter::formatDuration(3725), QString("62:05"));
}

void TestThreadExporter::testCallsCsv()
{
    QHash<QString, QString> names;
    names.insert("7", "Carol, Jr.");

    QStringList lines = ThreadExporter::callsToCsv(sampleCalls(), names).split("\r\n");
    QCOMPARE(lines.size(), 4);
    QCOMPARE(lines[0], QString("timestamp,contact,identity,direction,duration"));
    QCOMPARE(lines[1], QString("2024-04-02T10:00:00Z,\"Carol, Jr.\",(941) 518-0701,outgoing,1:05"));
    QCOMPARE(lines[2], QString("2024-04-01T08:30:00Z,Unknown,5551234,missed,0:00"));
}

void TestThreadExporter::testCallsJson()
{
    QHash<QString, QString> names;
    names.insert("7", "Carol");

    QJsonDocument doc = QJsonDocument::fromJson(
        ThreadExporter::callsToJson(sampleCalls(), names).toUtf8());
    QJsonArray array = doc.array();
    QCOMPARE(array.size(), 2);

    QJsonObject first = array[0].toObject();
    QCOMPARE(first["id"].toString(), QString("1"));
    QCOMPARE(first["direction"].toString(), QString("outgoing"));
    QCOMPARE(first["durationSeconds"].toInt(), 65);
    QCOMPARE(first["contactName"].toString(), QString("Carol"));

    QJsonObject second = array[1].toObject();
    QCOMPARE(second["identity"].toString(), QString("5551234"));
    QVERIFY(!second.contains("contactId"));
}

void TestThreadExporter::testCallsPlainText()
{
    QHash<QString, QString> names;
    names.insert("7", "Carol");

    QCOMPARE(ThreadExporter::callsToPlainText(sampleCalls(), names),
             QString("[2024-04-02 10:00:00] OUTGOING call to Carol (1:05)\n"
                     "[2024-04-01 08:30:00] MISSED call from 5551234 (0:00)\n"));
}

void TestThreadExporter::testExportCallsFromStore()
{
    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());
    Reconciler reconciler(&store);

    ContactRecord carol;
    carol.id = "7";
    carol.firstName = "Carol";
    carol.phoneNumbers.append(LabeledValue{"mobile", "941-518-0701"});
    ListRecordStream<ContactRecord> contacts({carol});
    reconciler.importRecords(contacts);

    QList<CallRecord> calls = sampleCalls();
    calls[0].contactId.clear();
    ListRecordStream<CallRecord> stream({calls[1], calls[0]});
    QCOMPARE(reconciler.importRecords(stream).imported, 2);

    QString error;
    QString text = ThreadExporter::exportCalls(&store, ThreadExporter::Format::PlainText, &error);
    QVERIFY(error.isEmpty());

    // Most recent first, linked contact resolved by phone
    QStringList lines = text.split('\n', Qt::SkipEmptyParts);
    QCOMPARE(lines.size(), 2);
    QCOMPARE(lines[0], QString("[2024-04-02 10:00:00] OUTGOING call to Carol (1:05)"));
    QVERIFY(lines[1].contains("from 5551234"));

    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString path = dir.filePath("calls.csv");
    QVERIFY(ThreadExporter::exportCallsToFile(&store, ThreadExporter::Format::Csv, path, &error));
    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QVERIFY(file.readAll().startsWith("timestamp,contact,identity,direction,duration\r\n"));
}

void TestThreadExporter::testExportCallsClosedStore()
{
    SqliteRecordStore store(":memory:");

    QString error;
    QVERIFY(ThreadExporter::exportCalls(&store, ThreadExporter::Format::Csv, &error).isEmpty());
    QCOMPARE(error, QString("Record store is not open"));
    QVERIFY(!ThreadExporter::exportCallsToFile(nullptr, ThreadExporter::Format::Csv,
                                               "unused.csv", &error));
}

// ========== Contact Tests ==========

void TestThreadExporter::testContactsCsv()
{
    ContactRecord alice;
    alice.firstName = "Alice";
    alice.lastName = "Anders";
    alice.organization = "Acme";
    alice.phoneNumbers.append(LabeledValue{"mobile", "+1 (941) 518-0701"});
    alice.phoneNumbers.append(LabeledValue{"work", "555-1234"});
    alice.emails.append(LabeledValue{"home", "alice@example.com"});

    ContactRecord company;
    company.organization = "Nameless Corp";

    QStringList lines = ThreadExporter::contactsToCsv({alice, company}).split("\r\n");
    QCOMPARE(lines.size(), 4);
    QCOMPARE(lines[0], QString("first_name,last_name,display_name,phone_numbers,emails,organization"));
    QCOMPARE(lines[1], QString("Alice,Anders,Alice Anders,mobile: +1 (941) 518-0701; work: 555-1234,"
                               "home: alice@example.com,Acme"));
    QCOMPARE(lines[2], QString(",,Nameless Corp,,,Nameless Corp"));
}

void TestThreadExporter::testExportContactsToFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    SqliteRecordStore store(":memory:");
    QVERIFY(store.open());
    Reconciler reconciler(&store);

    ContactRecord bob;
    bob.id = "2";
    bob.firstName = "Bob";
    ContactRecord alice;
    alice.id = "1";
    alice.firstName = "Alice";
    ListRecordStream<ContactRecord> contacts({bob, alice});
    reconciler.importRecords(contacts);

    QString path = dir.filePath("contacts.csv");
    int exported = 0;
    QString error;
    QVERIFY(ThreadExporter::exportContactsToFile(&store, path, &exported, &error));
    QCOMPARE(exported, 2);

    QFile file(path);
    QVERIFY(file.open(QIODevice::ReadOnly));
    QStringList lines = QString::fromUtf8(file.readAll()).split("\r\n");
    QCOMPARE(lines[1], QString("Alice,,Alice,,,"));
    QCOMPARE(lines[2], QString("Bob,,Bob,,,"));

    SqliteRecordStore closed(":memory:");
    QVERIFY(!ThreadExporter::exportContactsToFile(&closed, path, &exported, &error));
    QCOMPARE(error, QString("Record store is not open"));
}

QTEST_MAIN(TestThreadExporter)
#include "test_threadexporter.moc"
