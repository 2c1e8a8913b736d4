/**
 * @file test_handlers.cpp
 * @brief Integration tests for the backend handlers served over IPC
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unistd.h>
#include "ragd/core/handlers.h"
#include "ragd/ipc/client.h"
#include "ragd/ipc/server.h"
#include "ragd/logger.h"

namespace fs = std::filesystem;

namespace {

// Serves /api/tags and /api/generate from canned data
class FakeOllama : public ragd::HttpTransport {
public:
    ragd::Result<ragd::HttpResponse> send(const ragd::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (!failure.ok()) {
            return ragd::Result<ragd::HttpResponse>::failure(failure);
        }
        ragd::HttpResponse resp;
        resp.status_code = 200;
        if (request.url.find("/api/tags") != std::string::npos) {
            ragd::json models = ragd::json::array();
            for (const auto& name : pulled) {
                models.push_back({{"name", name}});
            }
            resp.body = ragd::json({{"models", models}}).dump();
        } else {
            generate_calls++;
            resp.body = ragd::json({{"response", completion}}).dump();
        }
        return ragd::Result<ragd::HttpResponse>::success(resp);
    }

    std::mutex mutex;
    std::vector<std::string> pulled = {"llama3.1:8b"};
    std::string completion = R"({"summary":"Use systemctl.","steps":["sudo systemctl restart nginx"],"confidence":0.82})";
    ragd::Error failure;
    int generate_calls = 0;
};

// Query service that always fails with a fixed error
class FailingQueryService : public ragd::QueryService {
public:
    explicit FailingQueryService(ragd::Error error) : error_(std::move(error)) {}

    ragd::Result<ragd::QueryResponse> answer(const ragd::QueryRequest&) override {
        return ragd::Result<ragd::QueryResponse>::failure(error_);
    }

private:
    ragd::Error error_;
};

}  // namespace

class HandlersTest : public ::testing::Test {
protected:
    void SetUp() override {
        ragd::Logger::init(ragd::LogLevel::ERROR, false);

        root_ = fs::temp_directory_path() / ("ragd_handlers_test_" + std::to_string(getpid()));
        fs::remove_all(root_);
        data_dir_ = root_ / "data";
        socket_path_ = (root_ / "ragd.sock").string();

        write(root_ / "seeds" / "notes" / "nginx.txt",
              "restart nginx with systemctl restart nginx\n"
              "check status with systemctl status nginx\n");
        write(root_ / "seeds" / "guides" / "journal.txt", "journalctl -u nginx shows service logs\n");

        fake_ = std::make_shared<FakeOllama>();
        ollama_ = std::make_shared<ragd::OllamaClient>(fake_, "http://127.0.0.1:11434", "llama3.1:8b");
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            server_.reset();
        }
        std::error_code ec;
        fs::remove_all(root_, ec);
        ragd::Logger::shutdown();
    }

    void write(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

    ragd::HandlerContext context() {
        ragd::HandlerContext ctx;
        ctx.data_dir = data_dir_.string();
        ctx.ollama = ollama_;
        ctx.query = std::make_shared<ragd::OllamaQueryService>(ollama_, data_dir_.string());
        ctx.seeds = {
            {"notes", (root_ / "seeds" / "notes").string()},
            {"guides", (root_ / "seeds" / "guides").string()},
            {"absent", (root_ / "seeds" / "absent").string()}
        };
        return ctx;
    }

    void start_server(ragd::HandlerContext ctx) {
        ragd::ServerOptions options;
        options.socket_path = socket_path_;
        options.read_timeout = std::chrono::milliseconds(500);
        server_ = std::make_unique<ragd::IPCServer>(options);
        ragd::Handlers::register_all(*server_, std::move(ctx));
        ASSERT_TRUE(server_->start());
    }

    void start_server() {
        start_server(context());
    }

    std::unique_ptr<ragd::IPCClient> connect() {
        ragd::ClientConfig config;
        config.socket_path = socket_path_;
        config.client_id = "handlers-test";
        config.read_timeout = std::chrono::milliseconds(5000);
        auto client = ragd::IPCClient::connect(config);
        EXPECT_TRUE(client.ok()) << client.error.to_string();
        return client.ok() ? std::move(client.value) : nullptr;
    }

    ragd::Result<ragd::JobSnapshot> reindex(std::vector<std::string>* stages = nullptr) {
        auto client = connect();
        return client->start_reindex_stream(ctx_, ragd::ReindexRequest{},
            [stages](const ragd::JobSnapshot& snap) {
                if (stages) {
                    stages->push_back(snap.stage);
                }
            });
    }

    void init() {
        auto client = connect();
        ASSERT_TRUE(client->init_system(ctx_).ok());
    }

    const ragd::HealthResult* component(const ragd::HealthSummary& summary, const std::string& name) {
        for (const auto& result : summary.results) {
            if (result.component == name) {
                return &result;
            }
        }
        return nullptr;
    }

    fs::path root_;
    fs::path data_dir_;
    std::string socket_path_;
    std::shared_ptr<FakeOllama> fake_;
    std::shared_ptr<ragd::OllamaClient> ollama_;
    std::unique_ptr<ragd::IPCServer> server_;
    ragd::CallContext ctx_ = ragd::CallContext::background();
};

// ============================================================================
// Init
// ============================================================================

TEST_F(HandlersTest, InitCreatesLayoutAndSeedsSources) {
    start_server();
    auto client = connect();

    auto resp = client->init_system(ctx_, "trace-init");
    ASSERT_TRUE(resp.ok()) << resp.error.to_string();
    EXPECT_EQ(resp.value.created_directories.size(), 3u);
    EXPECT_EQ(resp.value.catalog_version, 0);
    EXPECT_EQ(resp.value.trace_id, "trace-init");

    ASSERT_EQ(resp.value.seeded_sources.size(), 2u);
    EXPECT_EQ(resp.value.seeded_sources[0].alias, "guides");
    EXPECT_EQ(resp.value.seeded_sources[1].alias, "notes");
    EXPECT_EQ(resp.value.seeded_sources[1].type, "linked");

    ASSERT_EQ(resp.value.dependency_checks.size(), 1u);
    EXPECT_EQ(resp.value.dependency_checks[0].component, "ollama");
    EXPECT_EQ(resp.value.dependency_checks[0].status, "pass");
}

TEST_F(HandlersTest, SecondInitChangesNothing) {
    start_server();
    init();

    auto client = connect();
    auto resp = client->init_system(ctx_);
    ASSERT_TRUE(resp.ok());
    EXPECT_TRUE(resp.value.created_directories.empty());
    EXPECT_TRUE(resp.value.seeded_sources.empty());
}

// ============================================================================
// Sources and reindex
// ============================================================================

TEST_F(HandlersTest, SourcesArePendingUntilIndexed) {
    start_server();
    init();

    auto before = connect()->list_sources(ctx_);
    ASSERT_TRUE(before.ok()) << before.error.to_string();
    ASSERT_EQ(before.value.sources.size(), 2u);
    for (const auto& source : before.value.sources) {
        EXPECT_EQ(source.status, "pending_validation") << source.alias;
    }

    ASSERT_TRUE(reindex().ok());

    auto after = connect()->list_sources(ctx_);
    ASSERT_TRUE(after.ok());
    for (const auto& source : after.value.sources) {
        EXPECT_EQ(source.status, "active") << source.alias;
        EXPECT_FALSE(source.checksum.empty());
    }
}

TEST_F(HandlersTest, ReindexStreamsStagesAndWritesManifest) {
    start_server();
    init();

    std::vector<std::string> stages;
    auto last = reindex(&stages);
    ASSERT_TRUE(last.ok()) << last.error.to_string();
    EXPECT_EQ(last.value.status, ragd::JobStatus::SUCCEEDED);

    std::vector<std::string> expected = {"preparing_index", "ingesting:guides", "ingesting:notes", "completed"};
    EXPECT_EQ(stages, expected);
    EXPECT_EQ(last.value.documents_processed, 2);

    ragd::SourceStore store(data_dir_.string());
    auto manifest = store.load_manifest();
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->catalog_version, 1);
    EXPECT_EQ(manifest->document_count, 2);
    EXPECT_EQ(manifest->trigger_job_id, last.value.job_id);
}

TEST_F(HandlersTest, ReindexSkipsUnchangedSources) {
    start_server();
    init();
    ASSERT_TRUE(reindex().ok());

    std::vector<std::string> stages;
    ASSERT_TRUE(reindex(&stages).ok());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "skipping:notes"), stages.end());
    EXPECT_NE(std::find(stages.begin(), stages.end(), "skipping:guides"), stages.end());

    ragd::SourceStore store(data_dir_.string());
    EXPECT_EQ(store.load_manifest()->catalog_version, 2);
}

TEST_F(HandlersTest, UnstreamedReindexIsAccepted) {
    start_server();
    init();

    auto client = connect();
    auto job = client->start_reindex(ctx_, ragd::ReindexRequest{});
    ASSERT_TRUE(job.ok()) << job.error.to_string();
    EXPECT_EQ(job.value.stage, "preparing_index");
    EXPECT_EQ(job.value.status, ragd::JobStatus::RUNNING);

    server_->stop();
    server_.reset();
    // Either finished before stop or cancelled cooperatively; no partial manifest
    EXPECT_FALSE(fs::exists(data_dir_ / "index" / "manifest.json.tmp"));
}

// ============================================================================
// Query
// ============================================================================

TEST_F(HandlersTest, QueryWithoutIndexIsNoAnswer) {
    start_server();
    init();

    ragd::QueryRequest request;
    request.question = "How do I restart nginx?";
    auto resp = connect()->query(ctx_, request);

    ASSERT_TRUE(resp.ok()) << resp.error.to_string();
    EXPECT_TRUE(resp.value.no_answer);
    EXPECT_DOUBLE_EQ(resp.value.confidence, 0.25);
    EXPECT_EQ(resp.value.index_version.value_or(""), "catalog/v0");
    EXPECT_FALSE(resp.value.trace_id.empty());
    EXPECT_EQ(fake_->generate_calls, 0);
}

TEST_F(HandlersTest, QueryAnswersFromIndexedSources) {
    start_server();
    init();
    ASSERT_TRUE(reindex().ok());

    ragd::QueryRequest request;
    request.question = "How do I restart nginx?";
    request.trace_id = "trace-q";
    auto resp = connect()->query(ctx_, request);

    ASSERT_TRUE(resp.ok()) << resp.error.to_string();
    EXPECT_EQ(resp.value.summary, "Use systemctl.");
    EXPECT_DOUBLE_EQ(resp.value.confidence, 0.82);
    EXPECT_FALSE(resp.value.no_answer);
    EXPECT_EQ(resp.value.trace_id, "trace-q");
    EXPECT_EQ(resp.value.index_version.value_or(""), "catalog/v1");
    ASSERT_FALSE(resp.value.citations.empty());
    EXPECT_EQ(resp.value.citations[0].alias, "notes");
    EXPECT_EQ(resp.value.citations[0].document_ref, "nginx.txt:1");
    EXPECT_EQ(fake_->generate_calls, 1);
}

TEST_F(HandlersTest, UnreachableModelIsUnavailable) {
    start_server();
    init();
    ASSERT_TRUE(reindex().ok());
    {
        std::lock_guard<std::mutex> lock(fake_->mutex);
        fake_->failure = ragd::Error::make(ragd::ErrorKind::IO, "connection refused");
    }

    ragd::QueryRequest request;
    request.question = "restart nginx";
    auto resp = connect()->query(ctx_, request);

    EXPECT_FALSE(resp.ok());
    EXPECT_EQ(resp.error.kind, ragd::ErrorKind::STATUS);
    EXPECT_EQ(resp.error.status_code, ragd::Status::UNAVAILABLE);
}

TEST_F(HandlersTest, BlockedNetworkCarriesRemediation) {
    auto ctx = context();
    ctx.query = std::make_shared<FailingQueryService>(
        ragd::Error::make(ragd::ErrorKind::NETWORK_BLOCKED, "offline mode blocks gpu.example.com"));
    start_server(std::move(ctx));

    auto client = connect();
    auto frame = client->call(ctx_, ragd::Paths::QUERY, {{"question", "restart nginx"}});
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value.status, ragd::Status::UNAVAILABLE);
    EXPECT_EQ(frame.value.body["code"], ragd::ErrorCodes::BACKEND_UNAVAILABLE);
    EXPECT_TRUE(frame.value.body.contains("remediation"));
}

TEST_F(HandlersTest, InternalQueryFailureIs500) {
    auto ctx = context();
    ctx.query = std::make_shared<FailingQueryService>(
        ragd::Error::make(ragd::ErrorKind::DECODE, "bad completion"));
    start_server(std::move(ctx));

    auto frame = connect()->call(ctx_, ragd::Paths::QUERY, {{"question", "restart nginx"}});
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value.status, ragd::Status::INTERNAL_ERROR);
    EXPECT_EQ(frame.value.body["code"], ragd::ErrorCodes::INTERNAL_ERROR);
}

TEST_F(HandlersTest, EmptyQuestionIsBadRequest) {
    start_server();

    auto client = connect();
    auto frame = client->call(ctx_, ragd::Paths::QUERY, {{"question", "   "}});
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value.status, ragd::Status::BAD_REQUEST);
    EXPECT_EQ(frame.value.body["code"], ragd::ErrorCodes::INVALID_REQUEST);
    EXPECT_TRUE(client->usable());
}

TEST_F(HandlersTest, MissingQueryServiceIsUnavailable) {
    auto ctx = context();
    ctx.query.reset();
    start_server(std::move(ctx));

    auto frame = connect()->call(ctx_, ragd::Paths::QUERY, {{"question", "anything"}});
    ASSERT_TRUE(frame.ok());
    EXPECT_EQ(frame.value.status, ragd::Status::UNAVAILABLE);
}

// ============================================================================
// Health
// ============================================================================

TEST_F(HandlersTest, HealthFailsWithoutSources) {
    start_server();

    auto summary = connect()->health_check(ctx_);
    ASSERT_TRUE(summary.ok()) << summary.error.to_string();
    ASSERT_EQ(summary.value.results.size(), 4u);
    ASSERT_NE(component(summary.value, "disk_capacity"), nullptr);
    EXPECT_EQ(component(summary.value, "index_freshness")->status, "warn");
    EXPECT_EQ(component(summary.value, "source_access")->status, "fail");
    EXPECT_EQ(summary.value.overall_status, "fail");
}

TEST_F(HandlersTest, HealthReportsIndexedSources) {
    start_server();
    init();
    ASSERT_TRUE(reindex().ok());

    auto summary = connect()->health_check(ctx_);
    ASSERT_TRUE(summary.ok());
    const auto* index = component(summary.value, "index_freshness");
    ASSERT_NE(index, nullptr);
    EXPECT_EQ(index->status, "pass");
    EXPECT_DOUBLE_EQ(index->metrics.at("catalog_version"), 1.0);
    EXPECT_EQ(component(summary.value, "source_access")->status, "pass");
    EXPECT_EQ(component(summary.value, "ollama")->status, "pass");
}

TEST_F(HandlersTest, HealthWarnsWhenModelNotPulled) {
    {
        std::lock_guard<std::mutex> lock(fake_->mutex);
        fake_->pulled = {"mistral"};
    }
    start_server();

    auto summary = connect()->health_check(ctx_);
    ASSERT_TRUE(summary.ok());
    const auto* ollama = component(summary.value, "ollama");
    ASSERT_NE(ollama, nullptr);
    EXPECT_EQ(ollama->status, "warn");
    EXPECT_NE(ollama->remediation.find("ollama pull llama3.1:8b"), std::string::npos);
}

TEST_F(HandlersTest, HealthFailsWhenOllamaDown) {
    {
        std::lock_guard<std::mutex> lock(fake_->mutex);
        fake_->failure = ragd::Error::make(ragd::ErrorKind::IO, "connection refused");
    }
    start_server();

    auto summary = connect()->health_check(ctx_);
    ASSERT_TRUE(summary.ok());
    EXPECT_EQ(component(summary.value, "ollama")->status, "fail");
    EXPECT_EQ(summary.value.overall_status, "fail");
}

TEST_F(HandlersTest, HealthWarnsWithoutModelBackend) {
    auto ctx = context();
    ctx.ollama.reset();
    start_server(std::move(ctx));

    auto summary = connect()->health_check(ctx_);
    ASSERT_TRUE(summary.ok());
    EXPECT_EQ(component(summary.value, "ollama")->status, "warn");
}

// ============================================================================
// Aggregation
// ============================================================================

TEST(HealthAggregateTest, WorstStatusWins) {
    auto make = [](const std::string& status) {
        ragd::HealthResult result;
        result.status = status;
        return result;
    };

    EXPECT_EQ(ragd::Handlers::aggregate_status({}), "pass");
    EXPECT_EQ(ragd::Handlers::aggregate_status({make("pass"), make("pass")}), "pass");
    EXPECT_EQ(ragd::Handlers::aggregate_status({make("pass"), make("warn")}), "warn");
    EXPECT_EQ(ragd::Handlers::aggregate_status({make("warn"), make("fail"), make("pass")}), "fail");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
