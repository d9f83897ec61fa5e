#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>

#include "../src/http/transfer/transfer.hpp"
#include "../src/utils/file_utils.hpp"
#include "support/local_http_server.hpp"

using fetchpool::http::Transfer;
using fetchpool::testing::LocalHttpServer;
using fetchpool::testing::ServerRequest;
using fetchpool::testing::ServerResponse;

namespace {
    std::string payload() {
        std::string body;
        for (int i = 0; i < 1000; ++i) {
            body.push_back(static_cast<char>('a' + i % 26));
        }
        return body;
    }

    std::string read_all(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Honours "bytes=a-b" and "bytes=a-".
    ServerResponse ranged(const ServerRequest& request, const std::string& body) {
        ServerResponse response;
        response.body_ = body;
        const auto range = request.headers_.get("Range");
        if (!range || range->rfind("bytes=", 0) != 0) {
            return response;
        }
        const std::string bytes = range->substr(6);
        const auto dash = bytes.find('-');
        const size_t start = std::stoul(bytes.substr(0, dash));
        const size_t end = dash + 1 < bytes.size() ? std::stoul(bytes.substr(dash + 1)) : body.size() - 1;
        response.status_ = 206;
        response.reason_ = "Partial Content";
        response.body_ = body.substr(start, end - start + 1);
        return response;
    }

    class DownloadTest : public ::testing::Test {
       protected:
        void SetUp() override {
            dir_ = std::filesystem::temp_directory_path() /
                   (std::string("fetchpool_download_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
            std::filesystem::create_directories(dir_);
        }

        void TearDown() override { std::filesystem::remove_all(dir_); }

        static ServerResponse route(const ServerRequest& request) {
            if (request.path_ == "/file") {
                return ranged(request, payload());
            }
            if (request.path_ == "/nolength") {
                ServerResponse response;
                response.body_ = payload();
                response.send_content_length_ = false;
                return response;
            }
            ServerResponse response;
            response.status_ = 404;
            response.reason_ = "Not Found";
            response.body_ = "missing";
            return response;
        }

        std::filesystem::path dir_;
        LocalHttpServer server_{route};
    };
}  // namespace

TEST_F(DownloadTest, DownloadWritesDestination) {
    const auto dest = dir_ / "out.bin";
    Transfer transfer;

    ASSERT_TRUE(transfer.download(server_.url("/file"), dest));

    EXPECT_EQ(read_all(dest), payload());
    EXPECT_FALSE(std::filesystem::exists(file_utils::temp_path_for(dest, file_utils::temp_directory())));
    EXPECT_TRUE(transfer.response().raw_body_.empty());
}

TEST_F(DownloadTest, DownloadResumesFromTempFile) {
    const auto dest = dir_ / "resume.bin";
    const auto temp = file_utils::temp_path_for(dest, file_utils::temp_directory());
    std::ofstream(temp, std::ios::binary) << payload().substr(0, 400);

    Transfer transfer;
    ASSERT_TRUE(transfer.download(server_.url("/file"), dest));

    EXPECT_EQ(server_.requests()[0].headers_.get("Range"), "bytes=400-");
    EXPECT_EQ(read_all(dest), payload());
    EXPECT_FALSE(std::filesystem::exists(temp));
    ASSERT_EQ(transfer.options().count(CURLOPT_RANGE), 1u);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(transfer.options().at(CURLOPT_RANGE)));
}

TEST_F(DownloadTest, FailedDownloadRemovesTempFile) {
    const auto dest = dir_ / "missing.bin";
    Transfer transfer;

    EXPECT_FALSE(transfer.download(server_.url("/nothing"), dest));

    EXPECT_TRUE(transfer.is_http_error());
    EXPECT_FALSE(std::filesystem::exists(dest));
    EXPECT_FALSE(std::filesystem::exists(file_utils::temp_path_for(dest, file_utils::temp_directory())));
}

TEST_F(DownloadTest, DownloadWithHandsOverRewoundFile) {
    std::string seen;
    Transfer transfer;

    ASSERT_TRUE(transfer.download_with(server_.url("/file"), [&](Transfer& t, std::FILE* fh) {
        EXPECT_EQ(t.status(), 200);
        char buf[256];
        size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), fh)) > 0) {
            seen.append(buf, n);
        }
    }));

    EXPECT_EQ(seen, payload());
}

TEST_F(DownloadTest, FastDownloadSplitsIntoRanges) {
    const auto dest = dir_ / "fast.bin";
    Transfer transfer;

    ASSERT_TRUE(transfer.fast_download(server_.url("/file"), dest, 4));

    EXPECT_EQ(read_all(dest), payload());

    std::set<std::string> ranges;
    for (const auto& request : server_.requests()) {
        if (request.method_ == "GET") {
            ranges.insert(request.headers_.get("Range").value_or(""));
        }
    }
    const std::set<std::string> expected = {"bytes=0-249", "bytes=250-499", "bytes=500-749", "bytes=750-"};
    EXPECT_EQ(ranges, expected);
    for (int part = 0; part < 4; ++part) {
        EXPECT_FALSE(std::filesystem::exists(dest.string() + ".part" + std::to_string(part)));
    }
}

TEST_F(DownloadTest, FastDownloadWithoutLengthFallsBackToSingleDownload) {
    const auto dest = dir_ / "plain.bin";
    Transfer transfer;

    ASSERT_TRUE(transfer.fast_download(server_.url("/nolength"), dest, 4));

    EXPECT_EQ(read_all(dest), payload());
    size_t gets = 0;
    for (const auto& request : server_.requests()) {
        if (request.method_ == "GET") {
            ++gets;
            EXPECT_FALSE(request.headers_.contains("Range"));
        }
    }
    EXPECT_EQ(gets, 1u);
}

TEST_F(DownloadTest, FastDownloadOfMissingResourceFails) {
    Transfer transfer;

    EXPECT_FALSE(transfer.fast_download(server_.url("/nothing"), dir_ / "none.bin", 4));
}
