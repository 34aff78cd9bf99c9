#include <kgrag/core/vector_math.h>
#include <kgrag/graph/database.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <thread>

namespace kgrag::graph {

namespace {

Error stepError(sqlite3_stmt* stmt, int rc, const char* what) {
    if (rc == SQLITE_INTERRUPT) {
        return Error{ErrorCode::Timeout, std::string(what) + ": query interrupted by deadline"};
    }
    std::string msg = std::string(what) + ": " + sqlite3_errstr(rc);
    if (stmt) {
        if (const char* sql = sqlite3_sql(stmt)) {
            std::string snippet(sql, std::min(std::strlen(sql), size_t{100}));
            msg += " [SQL: " + snippet + (std::strlen(sql) > 100 ? "..." : "") + "]";
        }
    }
    return Error{ErrorCode::DatabaseError, msg};
}

void cosineFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 || sqlite3_value_type(argv[0]) != SQLITE_BLOB ||
        sqlite3_value_type(argv[1]) != SQLITE_BLOB) {
        sqlite3_result_null(ctx);
        return;
    }
    const int aBytes = sqlite3_value_bytes(argv[0]);
    const int bBytes = sqlite3_value_bytes(argv[1]);
    if (aBytes <= 0 || aBytes != bBytes) {
        sqlite3_result_null(ctx);
        return;
    }

    const auto* aData = static_cast<const std::byte*>(sqlite3_value_blob(argv[0]));
    const auto* bData = static_cast<const std::byte*>(sqlite3_value_blob(argv[1]));
    auto a = unpackEmbedding({aData, static_cast<size_t>(aBytes)});
    auto b = unpackEmbedding({bData, static_cast<size_t>(bBytes)});
    if (!a || !b) {
        sqlite3_result_null(ctx);
        return;
    }
    sqlite3_result_double(ctx, static_cast<double>(cosineSimilarity(*a, *b)));
}

} // namespace

// Statement implementation
Statement::~Statement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept : stmt_(other.stmt_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = other.stmt_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Result<void> Statement::bind(int index, std::nullptr_t) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind null"};
    }
    return {};
}

Result<void> Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, value) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind int64"};
    }
    return {};
}

Result<void> Statement::bind(int index, const std::string& value) {
    return bind(index, std::string_view(value));
}

Result<void> Statement::bind(int index, std::string_view value) {
    int rc = sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind string"};
    }
    return {};
}

Result<void> Statement::bind(int index, std::span<const std::byte> blob) {
    int rc = sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                               SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to bind blob"};
    }
    return {};
}

Result<int> Statement::stepWithRetry(const char* what) {
    constexpr int kMaxAttempts = 5;
    auto backoff = std::chrono::milliseconds(10);

    int rc = SQLITE_OK;
    for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
        rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW || rc == SQLITE_DONE)
            return rc;
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED)
            break;
        if (attempt < kMaxAttempts) {
            spdlog::debug("{}: database busy, retrying in {}ms", what, backoff.count());
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }
    return stepError(stmt_, rc, what);
}

Result<void> Statement::execute() {
    auto rc = stepWithRetry("Failed to execute statement");
    if (!rc)
        return rc.error();
    return {};
}

Result<bool> Statement::step() {
    auto rc = stepWithRetry("Failed to step statement");
    if (!rc)
        return rc.error();
    return rc.value() == SQLITE_ROW;
}

int64_t Statement::getInt64(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

double Statement::getDouble(int column) const {
    return sqlite3_column_double(stmt_, column);
}

std::string Statement::getString(int column) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (!text)
        return "";
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<std::byte> Statement::getBlob(int column) const {
    const void* blob = sqlite3_column_blob(stmt_, column);
    int size = sqlite3_column_bytes(stmt_, column);
    if (!blob || size <= 0)
        return {};

    std::vector<std::byte> result(static_cast<size_t>(size));
    std::memcpy(result.data(), blob, static_cast<size_t>(size));
    return result;
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

// Database implementation
Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), deadline_(other.deadline_) {
    other.db_ = nullptr;
    other.deadline_.reset();
    if (db_ && deadline_)
        sqlite3_progress_handler(db_, 1000, &Database::progressHandler, this);
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        deadline_ = other.deadline_;
        other.db_ = nullptr;
        other.deadline_.reset();
        if (db_ && deadline_)
            sqlite3_progress_handler(db_, 1000, &Database::progressHandler, this);
    }
    return *this;
}

Result<void> Database::open(const std::string& path, ConnectionMode mode) {
    close();

    int flags = SQLITE_OPEN_FULLMUTEX;
    switch (mode) {
        case ConnectionMode::ReadOnly:
            flags |= SQLITE_OPEN_READONLY;
            break;
        case ConnectionMode::Create:
            flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
            break;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "Unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return Error{ErrorCode::DatabaseError, "Failed to open database " + path + ": " + error};
    }

    sqlite3_busy_timeout(db_, 5000);

    path_ = path;
    spdlog::debug("opened sqlite database {} (sqlite {})", path, sqlite3_libversion());
    return {};
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
    path_.clear();
    deadline_.reset();
}

Result<Statement> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt)
            sqlite3_finalize(stmt);
        return Error{ErrorCode::DatabaseError,
                     "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_))};
    }
    return Statement(stmt);
}

Result<void> Database::execute(const std::string& sql) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string error = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        return Error{ErrorCode::DatabaseError, "Failed to execute SQL: " + error};
    }
    return {};
}

Result<void> Database::setBusyTimeout(std::chrono::milliseconds timeout) {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    if (sqlite3_busy_timeout(db_, static_cast<int>(timeout.count())) != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError, "Failed to set busy timeout"};
    }
    return {};
}

void Database::setDeadline(std::optional<Deadline> deadline) {
    deadline_ = deadline;
    if (!db_)
        return;
    if (deadline_) {
        sqlite3_progress_handler(db_, 1000, &Database::progressHandler, this);
    } else {
        sqlite3_progress_handler(db_, 0, nullptr, nullptr);
    }
}

int Database::progressHandler(void* self) {
    auto* db = static_cast<Database*>(self);
    if (db->deadline_ && std::chrono::steady_clock::now() >= *db->deadline_) {
        return 1;
    }
    return 0;
}

Result<void> Database::registerCosineFunction() {
    if (!db_) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    int rc = sqlite3_create_function_v2(db_, "kgrag_cosine", 2,
                                        SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                        &cosineFunction, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     "Failed to register kgrag_cosine: " + std::string(sqlite3_errmsg(db_))};
    }
    return {};
}

std::vector<std::byte> packEmbedding(std::span<const float> values) {
    static_assert(sizeof(float) == 4, "embedding blobs hold IEEE-754 float32");
    std::vector<std::byte> blob(values.size() * 4);
    for (size_t i = 0; i < values.size(); ++i) {
        std::uint32_t bits;
        std::memcpy(&bits, &values[i], 4);
        for (size_t b = 0; b < 4; ++b)
            blob[i * 4 + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFFu);
    }
    return blob;
}

std::optional<std::vector<float>> unpackEmbedding(std::span<const std::byte> blob) {
    if (blob.empty() || blob.size() % 4 != 0) {
        return std::nullopt;
    }
    std::vector<float> values(blob.size() / 4);
    for (size_t i = 0; i < values.size(); ++i) {
        std::uint32_t bits = 0;
        for (size_t b = 0; b < 4; ++b)
            bits |= static_cast<std::uint32_t>(blob[i * 4 + b]) << (8 * b);
        std::memcpy(&values[i], &bits, 4);
    }
    return values;
}

} // namespace kgrag::graph
