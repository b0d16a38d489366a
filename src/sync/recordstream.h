#ifndef RECORDSTREAM_H
#define RECORDSTREAM_H

#include <QString>
#include <QStringList>
#include <QList>
#include <functional>
#include <memory>
#include "../backup/sqlitedatabase.h"

namespace PhoneSync {

/**
 * @brief Lazy, finite, single-pass sequence of normalized records
 *
 * Produced by the extractor conduits and consumed by the Reconciler. A
 * stream cannot be rewound; ask the conduit for a new one to iterate again.
 * Rows that fail to decode are skipped and remembered as decode errors.
 */
template<typename T>
class RecordStream
{
public:
    virtual ~RecordStream() = default;

    /**
     * @brief Fetch the next record
     * @return false when the sequence is exhausted or was cancelled
     */
    virtual bool next(T &record) = 0;

    int decodeErrorCount() const { return m_errors.size(); }
    QStringList decodeErrors() const { return m_errors; }
    bool isCancelled() const { return m_cancelled; }

protected:
    void reportError(const QString &error) { m_errors.append(error); }
    void setCancelled() { m_cancelled = true; }

private:
    QStringList m_errors;
    bool m_cancelled = false;
};

/**
 * @brief Stream over records already held in memory
 */
template<typename T>
class ListRecordStream : public RecordStream<T>
{
public:
    explicit ListRecordStream(const QList<T> &records)
        : m_records(records)
    {
    }

    bool next(T &record) override
    {
        if (m_position >= m_records.size()) {
            return false;
        }
        record = m_records.at(m_position++);
        return true;
    }

private:
    QList<T> m_records;
    int m_position = 0;
};

/**
 * @brief Stream that steps a query on an embedded database
 *
 * Owns the database. Once the query is exhausted, fails or is cancelled,
 * the decoder, statement and database are released in that order, so the
 * source file is closed before the next extractor starts.
 */
template<typename T>
class SqliteRecordStream : public RecordStream<T>
{
public:
    /// Decode the current row; return false and set error to skip it
    using Decoder = std::function<bool(const SqliteStatement &row, T &record, QString *error)>;

    SqliteRecordStream(std::unique_ptr<SqliteDatabase> database,
                       SqliteStatement statement,
                       Decoder decoder,
                       std::function<bool()> cancelCheck = nullptr)
        : m_database(std::move(database))
        , m_statement(std::move(statement))
        , m_decoder(std::move(decoder))
        , m_cancelCheck(std::move(cancelCheck))
    {
    }

    ~SqliteRecordStream() override
    {
        finish();
    }

    bool next(T &record) override
    {
        while (!m_finished) {
            if (m_cancelCheck && m_cancelCheck()) {
                this->setCancelled();
                finish();
                return false;
            }

            if (!m_statement.step()) {
                if (m_statement.hasError()) {
                    this->reportError(m_statement.errorString());
                }
                finish();
                return false;
            }

            QString error;
            if (m_decoder(m_statement, record, &error)) {
                return true;
            }
            this->reportError(error);
        }
        return false;
    }

private:
    void finish()
    {
        m_decoder = nullptr;
        m_statement = SqliteStatement();
        m_database.reset();
        m_finished = true;
    }

    std::unique_ptr<SqliteDatabase> m_database;
    SqliteStatement m_statement;
    Decoder m_decoder;
    std::function<bool()> m_cancelCheck;
    bool m_finished = false;
};

} // namespace PhoneSync

#endif // RECORDSTREAM_H
