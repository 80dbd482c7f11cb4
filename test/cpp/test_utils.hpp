#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "gateway_request.hpp"
#include "sql_executor.hpp"

namespace querygate {
namespace test {

/**
 * RAII wrapper for a temporary file.
 * Creates file on construction, deletes on destruction.
 */
class TempFile {
public:
    explicit TempFile(const std::string& content,
                      const std::string& filename = "temp_test.yaml")
        : path_(std::filesystem::temp_directory_path() / generateUniqueName(filename)) {
        write(content);
    }

    ~TempFile() {
        cleanup();
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    // Replace the content, e.g. to simulate an edit picked up by a reload
    void write(const std::string& content) {
        std::ofstream file(path_, std::ios::trunc);
        file << content;
    }

    std::string path() const { return path_.string(); }
    std::filesystem::path fsPath() const { return path_; }

private:
    std::filesystem::path path_;

    void cleanup() {
        if (!path_.empty() && std::filesystem::exists(path_)) {
            std::filesystem::remove(path_);
        }
    }

    static std::string generateUniqueName(const std::string& base) {
        static std::random_device rd;
        static std::mt19937 gen(rd());
        static std::uniform_int_distribution<> dis(10000, 99999);

        auto stem = std::filesystem::path(base).stem().string();
        auto ext = std::filesystem::path(base).extension().string();
        return stem + "_" + std::to_string(dis(gen)) + ext;
    }
};

/**
 * RAII wrapper for a temporary directory.
 * Creates directory on construction, recursively deletes on destruction.
 */
class TempDirectory {
public:
    explicit TempDirectory(const std::string& prefix = "querygate_test")
        : path_(std::filesystem::temp_directory_path() / generateUniqueName(prefix)) {
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        cleanup();
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    std::string path() const { return path_.string(); }
    std::filesystem::path fsPath() const { return path_; }

    std::filesystem::path createSubdir(const std::string& name) {
        auto subdir = path_ / name;
        std::filesystem::create_directories(subdir);
        return subdir;
    }

    std::filesystem::path writeFile(const std::string& filename, const std::string& content) {
        auto file_path = path_ / filename;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream file(file_path, std::ios::trunc);
        file << content;
        return file_path;
    }

private:
    std::filesystem::path path_;

    void cleanup() {
        if (!path_.empty() && std::filesystem::exists(path_)) {
            std::filesystem::remove_all(path_);
        }
    }

    static std::string generateUniqueName(const std::string& prefix) {
        static std::random_device rd;
        static std::mt19937 gen(rd());
        static std::uniform_int_distribution<> dis(10000, 99999);
        return prefix + "_" + std::to_string(dis(gen));
    }
};

/**
 * Complete test configuration environment.
 * Creates a temp directory with querygate.yaml, an endpoint file and a
 * mappers subdirectory. Cleans up everything on destruction.
 */
class TempTestConfig {
public:
    explicit TempTestConfig(const std::string& gateway_yaml = minimalGatewayConfig(),
                            const std::string& prefix = "querygate_test")
        : dir_(prefix) {
        mappers_path_ = dir_.createSubdir("mappers");
        config_path_ = dir_.writeFile("querygate.yaml", gateway_yaml);
        endpoints_path_ = dir_.writeFile("endpoint-config.yaml", "endpoints: []\n");
    }

    std::string dirPath() const { return dir_.path(); }
    std::string configPath() const { return config_path_.string(); }
    std::filesystem::path endpointsPath() const { return endpoints_path_; }
    std::filesystem::path mappersPath() const { return mappers_path_; }

    std::filesystem::path writeEndpoints(const std::string& content) {
        return dir_.writeFile("endpoint-config.yaml", content);
    }

    std::filesystem::path writeMapper(const std::string& filename, const std::string& content) {
        return dir_.writeFile("mappers/" + filename, content);
    }

    std::shared_ptr<ConfigManager> createConfigManager() {
        auto mgr = std::make_shared<ConfigManager>(config_path_);
        mgr->loadConfig();
        return mgr;
    }

    static std::string minimalGatewayConfig() {
        return R"(
endpoint-config-path: ./endpoint-config.yaml
mapper-locations: ./mappers
duckdb:
  db_path: ":memory:"
)";
    }

private:
    TempDirectory dir_;
    std::filesystem::path config_path_;
    std::filesystem::path endpoints_path_;
    std::filesystem::path mappers_path_;
};

/**
 * Request builder for pipeline and admission tests.
 */
inline GatewayRequest makeRequest(const std::string& method, const std::string& url,
                                  const std::string& body = "",
                                  const std::string& content_type = "") {
    GatewayRequest request;
    request.method = method;
    request.raw_url = url;
    request.path = url.substr(0, url.find('?'));
    request.body = body;
    request.remote_address = "127.0.0.1";
    if (!content_type.empty()) {
        request.headers.emplace("Content-Type", content_type);
    }
    return request;
}

/**
 * Scripted SqlExecutor that records every call.
 */
class MockSqlExecutor : public SqlExecutor {
public:
    struct Call {
        std::string statement_id;
        Value params;
    };

    Result<StatementOutcome> execute(const std::string& statement_id, const Value& params) override {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(Call{statement_id, params});
        if (fail_with) {
            return Error::Database(statement_id, *fail_with);
        }
        return next_outcome;
    }

    Result<int64_t> executeBatchChunk(const std::string& statement_id, const std::vector<Value>& items) override {
        std::lock_guard<std::mutex> lock(mutex);
        chunks.push_back(items);
        if (fail_on_chunk && chunks.size() == *fail_on_chunk) {
            return Error::Database(statement_id, "constraint violated in chunk");
        }
        return static_cast<int64_t>(items.size());
    }

    StatementOutcome next_outcome;
    std::optional<std::string> fail_with;
    std::optional<std::size_t> fail_on_chunk;

    std::vector<Call> calls;
    std::vector<std::vector<Value>> chunks;
    std::mutex mutex;
};

} // namespace test
} // namespace querygate
