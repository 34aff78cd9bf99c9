#pragma once

#include <kgrag/core/types.h>

#include <sqlite3.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kgrag::graph {

/**
 * @brief Database connection mode
 */
enum class ConnectionMode {
    ReadOnly, ///< Retrieval connections
    Create    ///< Read-write, creating the file if needed (fixtures and tooling)
};

/**
 * @brief SQLite statement wrapper with RAII
 */
class Statement {
public:
    Statement() = default;
    ~Statement();

    // Move-only
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    /**
     * @brief Bind parameters to statement
     */
    Result<void> bind(int index, std::nullptr_t);
    Result<void> bind(int index, int64_t value);
    Result<void> bind(int index, const std::string& value);
    Result<void> bind(int index, std::string_view value);
    Result<void> bind(int index, std::span<const std::byte> blob);
    Result<void> bind(int index, const char* value) { return bind(index, std::string_view(value)); }

    /**
     * @brief Bind multiple parameters using variadic templates
     */
    template <typename... Args> Result<void> bindAll(Args&&... args) {
        return bindHelper(1, std::forward<Args>(args)...);
    }

    /**
     * @brief Execute statement (for non-SELECT queries)
     */
    Result<void> execute();

    /**
     * @brief Step through results (for SELECT queries)
     * @return true if row available, false if done
     */
    Result<bool> step();

    int64_t getInt64(int column) const;
    double getDouble(int column) const;
    std::string getString(int column) const;
    std::vector<std::byte> getBlob(int column) const;
    bool isNull(int column) const;

private:
    friend class Database;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    // sqlite3_step with bounded backoff on SQLITE_BUSY / SQLITE_LOCKED.
    Result<int> stepWithRetry(const char* what);

    sqlite3_stmt* stmt_ = nullptr;

    template <typename T, typename... Rest>
    Result<void> bindHelper(int index, T&& value, Rest&&... rest) {
        auto result = bind(index, std::forward<T>(value));
        if (!result)
            return result;
        if constexpr (sizeof...(rest) > 0) {
            return bindHelper(index + 1, std::forward<Rest>(rest)...);
        }
        return {};
    }
    Result<void> bindHelper(int) { return {}; }
};

/**
 * @brief Database connection wrapper
 */
class Database {
public:
    Database() = default;
    ~Database();

    // Move-only
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    /**
     * @brief Open database connection
     */
    Result<void> open(const std::string& path, ConnectionMode mode = ConnectionMode::ReadOnly);

    void close();

    /**
     * @brief Prepare SQL statement
     */
    Result<Statement> prepare(const std::string& sql);

    /**
     * @brief Execute SQL directly (for non-SELECT queries, may hold several statements)
     */
    Result<void> execute(const std::string& sql);

    Result<void> setBusyTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Interrupt any statement still running once `deadline` passes.
     *
     * An interrupted step fails with ErrorCode::Timeout. Pass std::nullopt to
     * remove the limit.
     */
    void setDeadline(std::optional<Deadline> deadline);

    /**
     * @brief Register `kgrag_cosine(a BLOB, b BLOB)` on this connection.
     *
     * Both blobs hold packed float32 vectors. Returns NULL for mismatched
     * dimensions or empty input, otherwise the cosine similarity.
     */
    Result<void> registerCosineFunction();

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    static int progressHandler(void* self);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::optional<Deadline> deadline_;
};

// `chunks.embedding` layout: consecutive IEEE-754 float32 values, little-endian,
// no header. The dimension is the blob size divided by four.
std::vector<std::byte> packEmbedding(std::span<const float> values);
std::optional<std::vector<float>> unpackEmbedding(std::span<const std::byte> blob);

} // namespace kgrag::graph
