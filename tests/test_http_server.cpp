#include "server/http_server.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <string>
#include <thread>

namespace otasrv {

namespace {

class HttpServerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tmp.WriteFile("plugin_1.0.0.wasm", "one");
        tmp.WriteFile("plugin_1.1.0.wasm", "one-one");
        tmp.WriteFile("plugin_2.0.0.wasm", "abc");
        tmp.WriteFile("five-second-delay_1.2.0.wasm", std::string(300 * 1024, 'x'));
        tmp.MakeDir("plugin_3.0.0-dir.wasm");

        config::ServerConfig cfg;
        cfg.files_dir = tmp.Path();
        cfg.listen_address = "127.0.0.1";
        cfg.port = 0;
        cfg.log_level = LogLevel::Warn;
        cfg.families = {
            config::FamilyConfig{.name = "plugin",
                                 .extension = ".wasm",
                                 .check_route = "/check-update",
                                 .download_route = "/download",
                                 .checksum = true},
            config::FamilyConfig{.name = "five-second-delay",
                                 .extension = ".wasm",
                                 .check_route = "/check-update-blink-five",
                                 .download_route = "/download-blink-five",
                                 .checksum = false},
            config::FamilyConfig{.name = "one-second-delay",
                                 .extension = ".wasm",
                                 .check_route = "/check-update-blink-one",
                                 .download_route = "/download-blink-one",
                                 .checksum = false},
        };
        Logger::Instance().SetLevel(cfg.log_level);

        server = std::make_unique<OtaHttpServer>(cfg);
        ASSERT_TRUE(server->Bind().ok);
        thread = std::thread([this] { run_result = server->Run(); });
        ASSERT_TRUE(server->WaitUntilRunning(std::chrono::seconds(5)));
        client = std::make_unique<httplib::Client>("127.0.0.1", server->Port());
    }

    void TearDown() override {
        if (server) server->Stop();
        if (thread.joinable()) {
            thread.join();
            EXPECT_TRUE(run_result.ok) << run_result.msg;
        }
    }

    nlohmann::json GetJson(const std::string& path, int expected_status) {
        auto res = client->Get(path);
        EXPECT_TRUE(res) << path;
        if (!res) return {};
        EXPECT_EQ(res->status, expected_status) << path << ": " << res->body;
        EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
        return nlohmann::json::parse(res->body);
    }

    testutil::TemporaryDirectory tmp;
    std::unique_ptr<OtaHttpServer> server;
    std::thread thread;
    Result run_result;
    std::unique_ptr<httplib::Client> client;
};

} // namespace

TEST_F(HttpServerTest, CheckOffersLatestWithChecksum) {
    auto j = GetJson("/check-update?current_version=1.0.0", 200);
    EXPECT_EQ(j.at("update_available"), true);
    EXPECT_EQ(j.at("latest_version"), "2.0.0");
    EXPECT_EQ(j.at("download_url"), "/download?version=2.0.0");
    EXPECT_EQ(j.at("checksum"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(HttpServerTest, CheckUpToDate) {
    auto j = GetJson("/check-update?current_version=2.0.0", 200);
    EXPECT_EQ(j.at("update_available"), false);
    EXPECT_EQ(j.at("latest_version"), "2.0.0");
    EXPECT_FALSE(j.contains("download_url"));
    EXPECT_FALSE(j.contains("checksum"));
}

TEST_F(HttpServerTest, CheckRejectsBadInput) {
    EXPECT_TRUE(GetJson("/check-update", 400).contains("error"));
    EXPECT_TRUE(GetJson("/check-update?current_version=", 400).contains("error"));
    EXPECT_TRUE(GetJson("/check-update?current_version=banana", 400).contains("error"));
}

TEST_F(HttpServerTest, EmptyFamilyReportsZeroVersion) {
    auto j = GetJson("/check-update-blink-one?current_version=1.0.0", 200);
    EXPECT_EQ(j.at("update_available"), false);
    EXPECT_EQ(j.at("latest_version"), "0.0.0");
}

TEST_F(HttpServerTest, FamiliesAreIndependent) {
    auto j = GetJson("/check-update-blink-five?current_version=1.0.0", 200);
    EXPECT_EQ(j.at("latest_version"), "1.2.0");
    EXPECT_EQ(j.at("download_url"), "/download-blink-five?version=1.2.0");
    EXPECT_FALSE(j.contains("checksum"));
}

TEST_F(HttpServerTest, DownloadStreamsFileWithDisposition) {
    auto res = client->Get("/download-blink-five?version=1.2.0");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Content-Disposition"),
              "attachment; filename=\"five-second-delay_1.2.0.wasm\"");
    EXPECT_EQ(res->get_header_value("Content-Type"), "application/wasm");
    EXPECT_EQ(res->body, std::string(300 * 1024, 'x'));
}

TEST_F(HttpServerTest, CheckLocatorRoundTrips) {
    auto j = GetJson("/check-update?current_version=1.0.0", 200);
    const std::string url = j.at("download_url").get<std::string>();

    auto res = client->Get(url);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->get_header_value("Content-Disposition").find("plugin_2.0.0.wasm"), std::string::npos);
    EXPECT_EQ(res->body, "abc");
}

TEST_F(HttpServerTest, DownloadErrors) {
    auto missing = client->Get("/download");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 400);

    auto traversal = client->Get("/download?version=..%2F..%2Fetc%2Fpasswd");
    ASSERT_TRUE(traversal);
    EXPECT_EQ(traversal->status, 400);

    auto backslash = client->Get("/download?version=..%5C..%5Cboot.ini");
    ASSERT_TRUE(backslash);
    EXPECT_EQ(backslash->status, 400);

    auto unknown = client->Get("/download?version=9.9.9");
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown->status, 404);
    EXPECT_FALSE(unknown->has_header("Content-Disposition"));
    EXPECT_EQ(nlohmann::json::parse(unknown->body).at("error"), "version not found");

    auto dir = client->Get("/download?version=3.0.0-dir");
    ASSERT_TRUE(dir);
    EXPECT_EQ(dir->status, 400);
}

TEST_F(HttpServerTest, NewFilesAreVisibleOnNextCheck) {
    tmp.WriteFile("plugin_2.1.0.wasm", "newer");
    auto j = GetJson("/check-update?current_version=2.0.0", 200);
    EXPECT_EQ(j.at("update_available"), true);
    EXPECT_EQ(j.at("latest_version"), "2.1.0");
}

TEST_F(HttpServerTest, UnreadableDirectoryIsServerError) {
    ASSERT_EQ(::system(("rm -rf '" + tmp.Path() + "'").c_str()), 0);
    auto j = GetJson("/check-update?current_version=1.0.0", 500);
    EXPECT_TRUE(j.contains("error"));

    // Client mistakes stay client errors even when the scan would fail.
    EXPECT_TRUE(GetJson("/check-update", 400).contains("error"));
    EXPECT_TRUE(GetJson("/check-update?current_version=banana", 400).contains("error"));
}

} // namespace otasrv
