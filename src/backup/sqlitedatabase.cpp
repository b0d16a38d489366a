#include "sqlitedatabase.h"

#include <sqlite3.h>
#include <QDebug>

// ========== SqliteStatement ==========

SqliteStatement::SqliteStatement(sqlite3 *db, const QString &sql)
    : m_db(db)
{
    if (!m_db) {
        m_error = "Database is not open";
        return;
    }

    QByteArray utf8 = sql.toUtf8();
    int rc = sqlite3_prepare_v2(m_db, utf8.constData(), -1, &m_stmt, nullptr);
    if (rc != SQLITE_OK) {
        m_error = QString("Failed to prepare statement: %1").arg(sqlite3_errmsg(m_db));
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

SqliteStatement::~SqliteStatement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

SqliteStatement::SqliteStatement(SqliteStatement &&other) noexcept
    : m_db(other.m_db)
    , m_stmt(other.m_stmt)
    , m_error(std::move(other.m_error))
{
    other.m_db = nullptr;
    other.m_stmt = nullptr;
}

SqliteStatement &SqliteStatement::operator=(SqliteStatement &&other) noexcept
{
    if (this != &other) {
        if (m_stmt) {
            sqlite3_finalize(m_stmt);
        }
        m_db = other.m_db;
        m_stmt = other.m_stmt;
        m_error = std::move(other.m_error);
        other.m_db = nullptr;
        other.m_stmt = nullptr;
    }
    return *this;
}

void SqliteStatement::bind(int index, const QString &value)
{
    if (!m_stmt) return;

    if (value.isNull()) {
        bindNull(index);
        return;
    }

    QByteArray utf8 = value.toUtf8();
    int rc = sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        bindFailed(rc, index);
    }
}

void SqliteStatement::bind(int index, qint64 value)
{
    if (!m_stmt) return;

    int rc = sqlite3_bind_int64(m_stmt, index, value);
    if (rc != SQLITE_OK) {
        bindFailed(rc, index);
    }
}

void SqliteStatement::bindNull(int index)
{
    if (!m_stmt) return;

    int rc = sqlite3_bind_null(m_stmt, index);
    if (rc != SQLITE_OK) {
        bindFailed(rc, index);
    }
}

void SqliteStatement::bindFailed(int rc, int index)
{
    m_error = QString("Failed to bind parameter %1: %2").arg(index).arg(sqlite3_errstr(rc));
}

bool SqliteStatement::step()
{
    if (!m_stmt || hasError()) {
        return false;
    }

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        m_error = QString("Statement failed: %1").arg(sqlite3_errmsg(m_db));
    }
    return false;
}

bool SqliteStatement::exec()
{
    if (!m_stmt || hasError()) {
        if (m_error.isEmpty()) {
            m_error = "Statement is not prepared";
        }
        return false;
    }

    int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
        return true;
    }
    m_error = QString("Statement failed: %1").arg(sqlite3_errmsg(m_db));
    return false;
}

void SqliteStatement::reset()
{
    if (!m_stmt) return;

    sqlite3_reset(m_stmt);
    sqlite3_clear_bindings(m_stmt);
    m_error.clear();
}

bool SqliteStatement::isNull(int column) const
{
    return !m_stmt || sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

QString SqliteStatement::columnText(int column) const
{
    if (!m_stmt || sqlite3_column_type(m_stmt, column) == SQLITE_NULL) {
        return QString();
    }

    // Blob columns (some address fields are stored as BLOB) read the same way
    const char *text = reinterpret_cast<const char *>(sqlite3_column_text(m_stmt, column));
    int bytes = sqlite3_column_bytes(m_stmt, column);
    if (!text) {
        return QString("");
    }
    return QString::fromUtf8(text, bytes);
}

qint64 SqliteStatement::columnInt64(int column) const
{
    return m_stmt ? sqlite3_column_int64(m_stmt, column) : 0;
}

double SqliteStatement::columnDouble(int column) const
{
    return m_stmt ? sqlite3_column_double(m_stmt, column) : 0.0;
}

// ========== SqliteDatabase ==========

SqliteDatabase::~SqliteDatabase()
{
    close();
}

bool SqliteDatabase::open(const QString &path, OpenMode mode)
{
    close();
    m_path = path;
    m_error.clear();

    int flags = SQLITE_OPEN_FULLMUTEX;
    if (mode == OpenMode::ReadOnly) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    QByteArray utf8 = path.toUtf8();
    int rc = sqlite3_open_v2(utf8.constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        m_error = QString("Failed to open database %1: %2")
            .arg(path, m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QString(sqlite3_errstr(rc)));
        close();
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (mode == OpenMode::ReadOnly) {
        // sqlite3_open_v2 does not read the header, a bogus file only fails here
        SqliteStatement check(m_db, "SELECT count(*) FROM sqlite_master");
        if (!check.isValid() || (!check.step() && check.hasError())) {
            m_error = QString("Not a readable database %1: %2")
                .arg(path, check.isValid() ? check.errorString() : QString::fromUtf8(sqlite3_errmsg(m_db)));
            check = SqliteStatement();
            close();
            return false;
        }
    }

    return true;
}

void SqliteDatabase::close()
{
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
    }
}

bool SqliteDatabase::exec(const QString &sql)
{
    if (!m_db) {
        m_error = "Database is not open";
        return false;
    }

    char *errMsg = nullptr;
    QByteArray utf8 = sql.toUtf8();
    int rc = sqlite3_exec(m_db, utf8.constData(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        m_error = QString("SQL error: %1").arg(errMsg ? QString::fromUtf8(errMsg) : QString("unknown"));
        sqlite3_free(errMsg);
        qWarning() << "[SqliteDatabase]" << m_error;
        return false;
    }
    return true;
}

SqliteStatement SqliteDatabase::prepare(const QString &sql) const
{
    return SqliteStatement(m_db, sql);
}

bool SqliteDatabase::hasTable(const QString &table) const
{
    SqliteStatement stmt = prepare(
        "SELECT count(*) FROM sqlite_master WHERE type='table' AND name=?1");
    stmt.bind(1, table);
    return stmt.step() && stmt.columnInt64(0) > 0;
}

bool SqliteDatabase::hasColumn(const QString &table, const QString &column) const
{
    return columns(table).contains(column, Qt::CaseInsensitive);
}

QStringList SqliteDatabase::columns(const QString &table) const
{
    QStringList result;
    QString quoted = table;
    quoted.replace('"', "\"\"");

    SqliteStatement stmt = prepare(QString("PRAGMA table_info(\"%1\")").arg(quoted));
    while (stmt.step()) {
        result << stmt.columnText(1);
    }
    return result;
}

int SqliteDatabase::changes() const
{
    return m_db ? sqlite3_changes(m_db) : 0;
}
