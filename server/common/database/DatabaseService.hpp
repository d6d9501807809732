#pragma once

/**
 * @brief 将 SQL 中的 ? 占位符转换为 PostgreSQL 原生 $1, $2, ... 格式
 *
 * 配合 Drogon ORM 的 SqlBinder 使用，由 libpq 服务端绑定参数
 */
inline std::string toParameterized(const std::string& sql, size_t paramCount) {
    if (paramCount == 0) return sql;

    std::string result;
    result.reserve(sql.size() + paramCount * 3);
    size_t idx = 1;
    for (char c : sql) {
        if (c == '?' && idx <= paramCount) {
            result += '$';
            result += std::to_string(idx++);
        } else {
            result += c;
        }
    }
    return result;
}

/**
 * @brief 数据库服务
 *
 * 两条执行路径：
 * - execSqlCoro：HTTP 处理与启动流程（EventLoop 线程），可使用 FastDbClient
 * - execSqlSync：采集工作线程，固定使用普通 DbClient（FastDbClient 只能在 IO 线程使用）
 */
class DatabaseService {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;
    template<typename T = void> using Task = drogon::Task<T>;

    static constexpr const char* CLIENT_NAME = "default";

    /** 由 ConfigManager 根据 db_clients[0].is_fast 设置 */
    static void setUseFastClient(bool fast) { useFast_.store(fast); }
    static bool useFastClient() { return useFast_.load(); }

    DbClientPtr getClient() const {
        return useFast_.load()
            ? drogon::app().getFastDbClient(CLIENT_NAME)
            : drogon::app().getDbClient(CLIENT_NAME);
    }

    Task<void> ping() {
        co_await getClient()->execSqlCoro("SELECT 1");
    }

    Task<Result> execSqlCoro(const std::string& sql,
                             const std::vector<std::string>& params = {}) {
        co_return co_await bindAndRun(getClient(), sql, params);
    }

    /**
     * @brief 阻塞执行（仅限非 EventLoop 线程调用）
     * @throws drogon::orm::DrogonDbException
     */
    Result execSqlSync(const std::string& sql, const std::vector<std::string>& params = {}) {
        auto client = drogon::app().getDbClient(CLIENT_NAME);
        if (!client) {
            throw drogon::orm::Failure("DB client '" + std::string(CLIENT_NAME) + "' not available");
        }
        return drogon::sync_wait(bindAndRun(client, sql, params));
    }

private:
    inline static std::atomic<bool> useFast_{false};

    static Task<Result> bindAndRun(DbClientPtr client, const std::string& sql,
                                   const std::vector<std::string>& params) {
        if (params.empty()) {
            co_return co_await client->execSqlCoro(sql);
        }
        auto binder = *client << toParameterized(sql, params.size());
        for (const auto& p : params) {
            binder << p;
        }
        co_return co_await drogon::orm::internal::SqlAwaiter(std::move(binder));
    }
};
