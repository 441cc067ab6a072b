#include "photovault/storage/sqlite/SqliteCredentialStoreFactory.hpp"

#include "photovault/crypto/ICryptoProvider.hpp"
#include "photovault/storage/ICredentialStore.hpp"
#include "photovault/storage/StorageErrors.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <sqlite3.h>

namespace photovault::storage::sqlite
{
namespace
{

constexpr std::string_view g_kDbFileName{ "album.db" };
constexpr int g_kBusyTimeoutMs{ 5000 };

[[nodiscard]] std::filesystem::path dbPathFor(const std::filesystem::path& albumDir)
{
    return albumDir / std::filesystem::path{ g_kDbFileName };
}

struct SqliteDbDeleter final
{
    void operator()(sqlite3* db) const noexcept
    {
        if (db != nullptr)
        {
            (void)sqlite3_close_v2(db);
        }
    }
};

struct SqliteStmtDeleter final
{
    void operator()(sqlite3_stmt* stmt) const noexcept
    {
        if (stmt != nullptr)
        {
            (void)sqlite3_finalize(stmt);
        }
    }
};

using SqliteDbPtr = std::unique_ptr<sqlite3, SqliteDbDeleter>;
using SqliteStmtPtr = std::unique_ptr<sqlite3_stmt, SqliteStmtDeleter>;

[[nodiscard]] std::string sqliteErr(sqlite3* db, const char* prefix)
{
    const char* msg = (db != nullptr) ? sqlite3_errmsg(db) : "no-db";
    std::string out{ prefix };
    out.append(": ");
    out.append(msg);
    return out;
}

void exec(sqlite3* db, const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::string msg = sqliteErr(db, "storage: sqlite3_exec failed");
        if (errMsg != nullptr)
        {
            msg.append(" (");
            msg.append(errMsg);
            msg.append(")");
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(msg);
    }
}

[[nodiscard]] SqliteDbPtr openDb(const std::filesystem::path& path, int flags)
{
    sqlite3* raw = nullptr;
    const std::string filename = path.string();
    const int rc = sqlite3_open_v2(filename.c_str(), &raw, flags, nullptr);
    SqliteDbPtr db{ raw };
    if (rc != SQLITE_OK || !db)
    {
        throw std::runtime_error(sqliteErr(raw, "storage: sqlite3_open_v2 failed"));
    }
    (void)sqlite3_busy_timeout(db.get(), g_kBusyTimeoutMs);
    return db;
}

[[nodiscard]] SqliteDbPtr openExisting(const std::filesystem::path& albumDir, int flags)
{
    const auto dbPath = dbPathFor(albumDir);
    std::error_code ec{};
    if (!std::filesystem::is_regular_file(dbPath, ec))
    {
        throw photovault::storage::CredentialsNotFound("storage: album is not initialized");
    }
    return openDb(dbPath, flags);
}

void ensureSchema(sqlite3* db)
{
    exec(db, "CREATE TABLE IF NOT EXISTS credentials ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " kdf_iterations INTEGER NOT NULL,"
             " kdf_memory_kib INTEGER NOT NULL,"
             " kdf_lanes INTEGER NOT NULL,"
             " salt BLOB NOT NULL,"
             " verifier BLOB NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS rotation_journal ("
             " id INTEGER PRIMARY KEY CHECK(id = 1),"
             " status INTEGER NOT NULL,"
             " started_at INTEGER NOT NULL,"
             " kdf_iterations INTEGER NOT NULL,"
             " kdf_memory_kib INTEGER NOT NULL,"
             " kdf_lanes INTEGER NOT NULL,"
             " new_salt BLOB NOT NULL,"
             " new_verifier BLOB NOT NULL,"
             " wrapped_nonce BLOB NOT NULL,"
             " wrapped_tag BLOB NOT NULL,"
             " wrapped_keys BLOB NOT NULL,"
             " total INTEGER NOT NULL"
             ");"
             "CREATE TABLE IF NOT EXISTS rotation_processed ("
             " path TEXT PRIMARY KEY"
             ");");
}

// Rolls back unless commit() ran.
class Transaction final
{
public:
    explicit Transaction(sqlite3* db) : m_db{ db }
    {
        exec(m_db, "BEGIN IMMEDIATE;");
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ~Transaction() noexcept
    {
        if (!m_committed)
        {
            (void)sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    void commit()
    {
        exec(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db;
    bool m_committed{ false };
};

[[nodiscard]] SqliteStmtPtr prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* rawStmt = nullptr;
    const int prepRc = sqlite3_prepare_v2(db, sql, -1, &rawStmt, nullptr);
    SqliteStmtPtr stmt{ rawStmt };
    if (prepRc != SQLITE_OK || !stmt)
    {
        throw std::runtime_error(sqliteErr(db, "storage: sqlite3_prepare_v2 failed"));
    }
    return stmt;
}

void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, std::span<const std::uint8_t> bytes, const char* what)
{
    // A zero-length blob still needs a non-null pointer or SQLite stores NULL.
    static constexpr std::uint8_t kEmpty{ 0U };
    const void* data = bytes.empty() ? static_cast<const void*>(&kEmpty) : bytes.data();
    if (sqlite3_bind_blob(stmt, index, data, static_cast<int>(bytes.size()), SQLITE_STATIC) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

void bindInt64(sqlite3* db, sqlite3_stmt* stmt, int index, std::int64_t value, const char* what)
{
    if (sqlite3_bind_int64(stmt, index, value) != SQLITE_OK)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

void stepDone(sqlite3* db, sqlite3_stmt* stmt, const char* what)
{
    if (sqlite3_step(stmt) != SQLITE_DONE)
    {
        throw std::runtime_error(sqliteErr(db, what));
    }
}

[[nodiscard]] std::span<const std::uint8_t> columnBlob(sqlite3_stmt* stmt, int col)
{
    const void* ptr = sqlite3_column_blob(stmt, col);
    const int bytes = sqlite3_column_bytes(stmt, col);
    if (bytes < 0 || (ptr == nullptr && bytes != 0))
    {
        throw photovault::storage::CredentialsCorrupt("storage: invalid blob column");
    }
    if (bytes == 0)
    {
        return {};
    }
    return std::span<const std::uint8_t>{ static_cast<const std::uint8_t*>(ptr), static_cast<std::size_t>(bytes) };
}

template <std::size_t N>
void copyExact(std::span<const std::uint8_t> src, std::array<std::uint8_t, N>& dst, const char* what)
{
    if (src.size() != N)
    {
        throw photovault::storage::CredentialsCorrupt(what);
    }
    std::copy(src.begin(), src.end(), dst.begin());
}

[[nodiscard]] std::uint32_t columnU32(sqlite3_stmt* stmt, int col)
{
    const sqlite3_int64 v = sqlite3_column_int64(stmt, col);
    if (v < 0 || v > static_cast<sqlite3_int64>(std::numeric_limits<std::uint32_t>::max()))
    {
        throw photovault::storage::CredentialsCorrupt("storage: kdf parameter out of range");
    }
    return static_cast<std::uint32_t>(v);
}

void bindKdf(sqlite3* db, sqlite3_stmt* stmt, int firstIndex, const photovault::crypto::KdfParams& params)
{
    bindInt64(db, stmt, firstIndex, params.iterations, "storage: bind kdf_iterations failed");
    bindInt64(db, stmt, firstIndex + 1, params.memoryKiB, "storage: bind kdf_memory_kib failed");
    bindInt64(db, stmt, firstIndex + 2, params.lanes, "storage: bind kdf_lanes failed");
}

[[nodiscard]] photovault::crypto::KdfParams columnKdf(sqlite3_stmt* stmt, int firstCol)
{
    return photovault::crypto::KdfParams{
        .iterations = columnU32(stmt, firstCol),
        .memoryKiB = columnU32(stmt, firstCol + 1),
        .lanes = columnU32(stmt, firstCol + 2),
    };
}

void upsertCredentials(sqlite3* db, const photovault::storage::StoredCredentials& credentials)
{
    const char* sql = "INSERT INTO credentials(id, kdf_iterations, kdf_memory_kib, kdf_lanes, salt, verifier)"
                      " VALUES (1, ?, ?, ?, ?, ?)"
                      " ON CONFLICT(id) DO UPDATE SET kdf_iterations=excluded.kdf_iterations,"
                      " kdf_memory_kib=excluded.kdf_memory_kib, kdf_lanes=excluded.kdf_lanes,"
                      " salt=excluded.salt, verifier=excluded.verifier;";
    auto stmt = prepare(db, sql);
    bindKdf(db, stmt.get(), 1, credentials.kdf.params);
    bindBlob(db, stmt.get(), 4, credentials.kdf.salt, "storage: bind salt failed");
    bindBlob(db, stmt.get(), 5, credentials.verifier, "storage: bind verifier failed");
    stepDone(db, stmt.get(), "storage: upsert credentials failed");
}

[[nodiscard]] std::optional<photovault::storage::StoredCredentials> selectCredentials(sqlite3* db)
{
    auto stmt = prepare(db, "SELECT kdf_iterations, kdf_memory_kib, kdf_lanes, salt, verifier"
                            " FROM credentials WHERE id = 1;");
    const int stepRc = sqlite3_step(stmt.get());
    if (stepRc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    if (stepRc != SQLITE_ROW)
    {
        throw std::runtime_error(sqliteErr(db, "storage: select credentials failed"));
    }

    photovault::storage::StoredCredentials out{};
    out.kdf.params = columnKdf(stmt.get(), 0);
    copyExact(columnBlob(stmt.get(), 3), out.kdf.salt, "storage: invalid salt size");
    copyExact(columnBlob(stmt.get(), 4), out.verifier, "storage: invalid verifier size");
    return out;
}

[[nodiscard]] bool hasCredentialsTable(sqlite3* db)
{
    auto stmt = prepare(db, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = 'credentials';");
    const int stepRc = sqlite3_step(stmt.get());
    if (stepRc != SQLITE_ROW && stepRc != SQLITE_DONE)
    {
        throw std::runtime_error(sqliteErr(db, "storage: schema lookup failed"));
    }
    return stepRc == SQLITE_ROW;
}

void clearRotation(sqlite3* db)
{
    exec(db, "DELETE FROM rotation_journal; DELETE FROM rotation_processed;");
}

class SqliteCredentialStore final : public photovault::storage::ICredentialStore
{
public:
    [[nodiscard]] bool exists(const std::filesystem::path& albumDir) const override
    {
        std::error_code ec{};
        if (!std::filesystem::is_regular_file(dbPathFor(albumDir), ec))
        {
            return false;
        }
        auto db = openDb(dbPathFor(albumDir), SQLITE_OPEN_READONLY);
        return hasCredentialsTable(db.get()) && selectCredentials(db.get()).has_value();
    }

    void initialize(const std::filesystem::path& albumDir,
                    const photovault::storage::StoredCredentials& credentials) override
    {
        std::error_code ec{};
        std::filesystem::create_directories(albumDir, ec);
        if (ec)
        {
            throw std::runtime_error("storage: failed to create album directory: " + ec.message());
        }

        auto db = openDb(dbPathFor(albumDir), SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
        ensureSchema(db.get());

        Transaction tx{ db.get() };
        if (selectCredentials(db.get()).has_value())
        {
            throw std::invalid_argument("storage: album is already initialized");
        }
        upsertCredentials(db.get(), credentials);
        clearRotation(db.get());
        tx.commit();
    }

    [[nodiscard]] photovault::storage::StoredCredentials
    loadCredentials(const std::filesystem::path& albumDir) const override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READONLY);
        if (!hasCredentialsTable(db.get()))
        {
            throw photovault::storage::CredentialsNotFound("storage: album has no credentials");
        }
        auto credentials = selectCredentials(db.get());
        if (!credentials)
        {
            throw photovault::storage::CredentialsNotFound("storage: album has no credentials");
        }
        return *credentials;
    }

    void storeCredentials(const std::filesystem::path& albumDir,
                          const photovault::storage::StoredCredentials& credentials) override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READWRITE);
        ensureSchema(db.get());
        upsertCredentials(db.get(), credentials);
    }

    [[nodiscard]] std::optional<photovault::storage::RotationJournal>
    loadJournal(const std::filesystem::path& albumDir) const override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), "SELECT status, started_at, kdf_iterations, kdf_memory_kib, kdf_lanes,"
                                      " new_salt, new_verifier, wrapped_nonce, wrapped_tag, wrapped_keys, total"
                                      " FROM rotation_journal WHERE id = 1;");
        const int stepRc = sqlite3_step(stmt.get());
        if (stepRc == SQLITE_DONE)
        {
            return std::nullopt;
        }
        if (stepRc != SQLITE_ROW)
        {
            throw std::runtime_error(sqliteErr(db.get(), "storage: select journal failed"));
        }

        photovault::storage::RotationJournal out{};
        const sqlite3_int64 status = sqlite3_column_int64(stmt.get(), 0);
        if (status == static_cast<sqlite3_int64>(photovault::storage::RotationStatus::InProgress))
        {
            out.status = photovault::storage::RotationStatus::InProgress;
        }
        else if (status == static_cast<sqlite3_int64>(photovault::storage::RotationStatus::Failed))
        {
            out.status = photovault::storage::RotationStatus::Failed;
        }
        else
        {
            throw photovault::storage::CredentialsCorrupt("storage: invalid rotation status");
        }
        out.startedAtUnixSeconds = sqlite3_column_int64(stmt.get(), 1);
        out.next.kdf.params = columnKdf(stmt.get(), 2);
        copyExact(columnBlob(stmt.get(), 5), out.next.kdf.salt, "storage: invalid salt size");
        copyExact(columnBlob(stmt.get(), 6), out.next.verifier, "storage: invalid verifier size");
        copyExact(columnBlob(stmt.get(), 7), out.wrappedKeys.nonce, "storage: invalid nonce size");
        copyExact(columnBlob(stmt.get(), 8), out.wrappedKeys.tag, "storage: invalid tag size");
        const auto wrapped = columnBlob(stmt.get(), 9);
        out.wrappedKeys.cipherText.assign(wrapped.begin(), wrapped.end());
        const sqlite3_int64 total = sqlite3_column_int64(stmt.get(), 10);
        if (total < 0)
        {
            throw photovault::storage::CredentialsCorrupt("storage: invalid rotation total");
        }
        out.totalContainers = static_cast<std::uint64_t>(total);
        return out;
    }

    void beginRotation(const std::filesystem::path& albumDir,
                       const photovault::storage::RotationJournal& journal) override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READWRITE);
        ensureSchema(db.get());

        Transaction tx{ db.get() };
        clearRotation(db.get());

        const char* sql = "INSERT INTO rotation_journal(id, status, started_at, kdf_iterations, kdf_memory_kib,"
                          " kdf_lanes, new_salt, new_verifier, wrapped_nonce, wrapped_tag, wrapped_keys, total)"
                          " VALUES (1, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
        auto stmt = prepare(db.get(), sql);
        bindInt64(db.get(), stmt.get(), 1, static_cast<std::int64_t>(journal.status), "storage: bind status failed");
        bindInt64(db.get(), stmt.get(), 2, journal.startedAtUnixSeconds, "storage: bind started_at failed");
        bindKdf(db.get(), stmt.get(), 3, journal.next.kdf.params);
        bindBlob(db.get(), stmt.get(), 6, journal.next.kdf.salt, "storage: bind new_salt failed");
        bindBlob(db.get(), stmt.get(), 7, journal.next.verifier, "storage: bind new_verifier failed");
        bindBlob(db.get(), stmt.get(), 8, journal.wrappedKeys.nonce, "storage: bind wrapped_nonce failed");
        bindBlob(db.get(), stmt.get(), 9, journal.wrappedKeys.tag, "storage: bind wrapped_tag failed");
        bindBlob(db.get(), stmt.get(), 10, journal.wrappedKeys.cipherText, "storage: bind wrapped_keys failed");
        bindInt64(db.get(), stmt.get(), 11, static_cast<std::int64_t>(journal.totalContainers),
                  "storage: bind total failed");
        stepDone(db.get(), stmt.get(), "storage: insert journal failed");

        tx.commit();
    }

    void setRotationStatus(const std::filesystem::path& albumDir, photovault::storage::RotationStatus status) override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READWRITE);
        auto stmt = prepare(db.get(), "UPDATE rotation_journal SET status = ? WHERE id = 1;");
        bindInt64(db.get(), stmt.get(), 1, static_cast<std::int64_t>(status), "storage: bind status failed");
        stepDone(db.get(), stmt.get(), "storage: update journal status failed");
        if (sqlite3_changes(db.get()) == 0)
        {
            throw std::runtime_error("storage: no rotation journal");
        }
    }

    void markProcessed(const std::filesystem::path& albumDir, const std::string& containerPath) override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READWRITE);
        auto stmt = prepare(db.get(), "INSERT OR IGNORE INTO rotation_processed(path) VALUES (?);");
        if (sqlite3_bind_text(stmt.get(), 1, containerPath.c_str(), static_cast<int>(containerPath.size()),
                              SQLITE_STATIC) != SQLITE_OK)
        {
            throw std::runtime_error(sqliteErr(db.get(), "storage: bind path failed"));
        }
        stepDone(db.get(), stmt.get(), "storage: insert processed path failed");
    }

    [[nodiscard]] std::vector<std::string> processedPaths(const std::filesystem::path& albumDir) const override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READONLY);
        auto stmt = prepare(db.get(), "SELECT path FROM rotation_processed ORDER BY path;");

        std::vector<std::string> out{};
        for (;;)
        {
            const int stepRc = sqlite3_step(stmt.get());
            if (stepRc == SQLITE_DONE)
            {
                break;
            }
            if (stepRc != SQLITE_ROW)
            {
                throw std::runtime_error(sqliteErr(db.get(), "storage: select processed paths failed"));
            }
            const auto* text = sqlite3_column_text(stmt.get(), 0);
            const int bytes = sqlite3_column_bytes(stmt.get(), 0);
            if (text == nullptr || bytes < 0)
            {
                throw photovault::storage::CredentialsCorrupt("storage: invalid processed path row");
            }
            out.emplace_back(reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes));
        }
        return out;
    }

    void commitRotation(const std::filesystem::path& albumDir,
                        const photovault::storage::StoredCredentials& credentials) override
    {
        auto db = openExisting(albumDir, SQLITE_OPEN_READWRITE);
        Transaction tx{ db.get() };
        upsertCredentials(db.get(), credentials);
        clearRotation(db.get());
        tx.commit();
    }
};

} // namespace

[[nodiscard]] std::unique_ptr<photovault::storage::ICredentialStore> makeSqliteCredentialStore()
{
    return std::make_unique<SqliteCredentialStore>();
}

} // namespace photovault::storage::sqlite
