#ifndef SQLITEDATABASE_H
#define SQLITEDATABASE_H

#include <QString>
#include <QByteArray>
#include <QStringList>

struct sqlite3;
struct sqlite3_stmt;

/**
 * @brief Prepared statement on a SqliteDatabase
 *
 * Move-only. The statement is finalized when the object is destroyed,
 * so it must not outlive the database it was prepared on.
 */
class SqliteStatement
{
public:
    SqliteStatement() = default;
    SqliteStatement(sqlite3 *db, const QString &sql);
    ~SqliteStatement();

    SqliteStatement(SqliteStatement &&other) noexcept;
    SqliteStatement &operator=(SqliteStatement &&other) noexcept;
    SqliteStatement(const SqliteStatement &) = delete;
    SqliteStatement &operator=(const SqliteStatement &) = delete;

    bool isValid() const { return m_stmt != nullptr; }
    QString errorString() const { return m_error; }

    // ========== Binding (1-based indexes) ==========

    void bind(int index, const QString &value);
    void bind(int index, qint64 value);
    void bind(int index, int value) { bind(index, static_cast<qint64>(value)); }
    void bind(int index, bool value) { bind(index, static_cast<qint64>(value ? 1 : 0)); }
    void bindNull(int index);

    // ========== Stepping ==========

    /**
     * @brief Advance to the next row
     * @return true if a row is available, false when done or on error
     *
     * Use hasError() to tell the two apart.
     */
    bool step();

    /**
     * @brief Run a statement that returns no rows
     */
    bool exec();

    /**
     * @brief Reset for re-execution and clear bindings
     */
    void reset();

    bool hasError() const { return !m_error.isEmpty(); }

    // ========== Columns (0-based indexes) ==========

    bool isNull(int column) const;
    QString columnText(int column) const;
    qint64 columnInt64(int column) const;
    int columnInt(int column) const { return static_cast<int>(columnInt64(column)); }
    double columnDouble(int column) const;

private:
    void bindFailed(int rc, int index);

    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_stmt = nullptr;
    QString m_error;
};

/**
 * @brief Owning wrapper around a sqlite3 connection
 *
 * Used both for the read-only embedded databases inside a backup and for
 * the read-write record store. The connection is closed when the object
 * is destroyed.
 */
class SqliteDatabase
{
public:
    enum class OpenMode {
        ReadOnly,
        ReadWrite      ///< Creates the file if needed
    };

    SqliteDatabase() = default;
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase &) = delete;
    SqliteDatabase &operator=(const SqliteDatabase &) = delete;

    /**
     * @brief Open a database file
     *
     * Read-only opens also run a schema query so that a file which is not
     * a database fails here rather than at the first real query.
     *
     * @param path File path, or ":memory:" for a private in-memory database
     */
    bool open(const QString &path, OpenMode mode);

    void close();
    bool isOpen() const { return m_db != nullptr; }

    QString path() const { return m_path; }
    QString errorString() const { return m_error; }
    sqlite3 *handle() const { return m_db; }

    /**
     * @brief Execute one or more SQL statements without results
     */
    bool exec(const QString &sql);

    SqliteStatement prepare(const QString &sql) const;

    // ========== Introspection ==========

    bool hasTable(const QString &table) const;
    bool hasColumn(const QString &table, const QString &column) const;
    QStringList columns(const QString &table) const;

    int changes() const;

private:
    sqlite3 *m_db = nullptr;
    QString m_path;
    QString m_error;
};

#endif // SQLITEDATABASE_H
