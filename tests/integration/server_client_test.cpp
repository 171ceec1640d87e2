// End-to-end: the Beast server on a loopback port, driven by the curl transport.

#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/catalog/progress_resolver.h>
#include <gamefetch/client/catalog_client.h>
#include <gamefetch/client/downloader.h>
#include <gamefetch/client/stream_downloader.h>
#include <gamefetch/server/http_server.h>

#include <boost/asio/read.hpp>

#include <array>
#include <chrono>
#include <future>
#include <thread>

using namespace gamefetch;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class ServerClientTest : public GameFetchTest {
protected:
    void SetUp() override {
        GameFetchTest::SetUp();
        serverRoot = testDir / "server";
        installDir = testDir / "install";
        level = generateRandomString(300'000);
        readme = generateRandomString(2'500);
        writeFile(serverRoot / "data" / "level 1.pak", level);
        writeFile(serverRoot / "readme.txt", readme);
        writeFile(testDir / "outside.txt", "secret");

        auto service =
            std::make_shared<const server::GameService>(singleGameConfig(serverRoot, "key"));
        httpServer = std::make_unique<server::GameHttpServer>(
            ioc, service,
            server::GameHttpServer::Config{"127.0.0.1", 0, std::chrono::seconds(2)});
        auto listening = httpServer->listen();
        ASSERT_TRUE(listening) << listening.error().message;
        serverThread = std::thread([this] { httpServer->run(); });

        baseUrl = "http://127.0.0.1:" + std::to_string(httpServer->boundPort());
        transport = client::makeCurlHttpTransport();
        catalogClient = clientWithKey("key");
    }

    void TearDown() override {
        if (httpServer)
            httpServer->stop();
        if (serverThread.joinable())
            serverThread.join();
        httpServer.reset();
        GameFetchTest::TearDown();
    }

    std::shared_ptr<client::CatalogClient> clientWithKey(const std::string& key) {
        client::RequestOptions opts;
        opts.totalTimeout = std::chrono::seconds(10);
        opts.connectTimeout = std::chrono::seconds(5);
        return std::make_shared<client::CatalogClient>(transport, client::ServerEndpoint{baseUrl, key},
                                                       opts);
    }

    Result<client::StreamResponse> rawFetch(const std::string& path, std::string& body) {
        return transport->fetch(baseUrl + path, catalogClient->authHeaders(), {},
                                [&body](ByteSpan bytes) -> Result<void> {
                                    body.append(reinterpret_cast<const char*>(bytes.data()),
                                                bytes.size());
                                    return {};
                                });
    }

    // A client that connects and never sends a request.
    void connectIdle(boost::asio::ip::tcp::socket& socket) {
        socket.connect({boost::asio::ip::make_address("127.0.0.1"), httpServer->boundPort()});
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (httpServer->activeSessions() == 0 && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        ASSERT_GT(httpServer->activeSessions(), 0u);
    }

    boost::asio::io_context ioc;
    std::unique_ptr<server::GameHttpServer> httpServer;
    std::thread serverThread;
    std::string baseUrl;
    std::shared_ptr<client::IHttpTransport> transport;
    std::shared_ptr<client::CatalogClient> catalogClient;

    fs::path serverRoot;
    fs::path installDir;
    std::string level;
    std::string readme;
};

TEST_F(ServerClientTest, StatusNeedsNoKey) {
    auto anonymous = clientWithKey("");
    auto status = anonymous->status();
    ASSERT_TRUE(status) << status.error().message;
    EXPECT_EQ(status.value().status, "running");
    EXPECT_EQ(status.value().gamesCount, 1u);

    auto games = anonymous->listGames();
    ASSERT_FALSE(games);
    EXPECT_EQ(games.error().code, ErrorCode::Unauthorized);
}

TEST_F(ServerClientTest, CatalogAndStartInfo) {
    auto catalog = catalogClient->fetchCatalog("game1");
    ASSERT_TRUE(catalog) << catalog.error().message;
    ASSERT_EQ(catalog.value().files.size(), 2u);
    EXPECT_EQ(catalog.value().files[0].entry.relativePath, "data/level 1.pak");
    EXPECT_EQ(catalog.value().totalSize, level.size() + readme.size());

    auto info = catalogClient->fetchStartInfo("game1", 30.0);
    ASSERT_TRUE(info);
    const auto expected = catalog::resolveResumePoint(catalog.value().entries(), 30.0);
    EXPECT_EQ(info.value().startFileIndex, expected.fileIndex);
    EXPECT_EQ(info.value().startFileOffset, expected.byteOffset);

    auto unknown = catalogClient->fetchCatalog("nope");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::NotFound);
}

TEST_F(ServerClientTest, FileRangesAndErrors) {
    std::string body;
    auto partial = rawFetch("/download/file/game1/readme.txt?offset=2000", body);
    ASSERT_TRUE(partial) << partial.error().message;
    EXPECT_EQ(partial.value().status, 206);
    EXPECT_EQ(partial.value().headers.at("content-range"), "bytes 2000-2499/2500");
    EXPECT_EQ(body, readme.substr(2000));

    body.clear();
    auto range = rawFetch("/download/file/game1/readme.txt?offset=2500", body);
    ASSERT_FALSE(range);
    EXPECT_EQ(range.error().code, ErrorCode::RangeNotSatisfiable);
    EXPECT_TRUE(body.empty());

    auto escape = rawFetch("/download/file/game1/..%2Foutside.txt", body);
    ASSERT_FALSE(escape);
    EXPECT_EQ(escape.error().code, ErrorCode::PathViolation);

    auto missing = rawFetch("/download/file/game1/nothere.bin", body);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto badOffset = rawFetch("/download/file/game1/readme.txt?offset=-1", body);
    ASSERT_FALSE(badOffset);
    EXPECT_EQ(badOffset.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ServerClientTest, ResumableDownloadEndToEnd) {
    client::ResumableDownloader downloader(catalogClient);
    auto summary = downloader.download("game1", installDir);
    ASSERT_TRUE(summary) << summary.error().message;
    EXPECT_EQ(readFile(installDir / "data" / "level 1.pak"), level);
    EXPECT_EQ(readFile(installDir / "readme.txt"), readme);

    // Interrupted copy: half of the first file plus a ledger that says so.
    fs::resize_file(installDir / "data" / "level 1.pak", 120'000);
    fs::remove(installDir / "readme.txt");
    client::TransferLedger ledger;
    ledger.track({"data/level 1.pak", level.size(), ""});
    ledger.addDownloaded("data/level 1.pak", 120'000);
    ASSERT_TRUE(ledger.save(installDir));

    auto resumed = downloader.download("game1", installDir);
    ASSERT_TRUE(resumed) << resumed.error().message;
    EXPECT_EQ(resumed.value().bytesTransferred, level.size() - 120'000 + readme.size());
    EXPECT_EQ(readFile(installDir / "data" / "level 1.pak"), level);
    EXPECT_EQ(readFile(installDir / "readme.txt"), readme);
}

TEST_F(ServerClientTest, StreamDownloadEndToEnd) {
    client::StreamDownloader fresh(catalogClient);
    fresh.setChunkSize(8192);
    auto full = fresh.download("game1", installDir, 0.0);
    ASSERT_TRUE(full) << full.error().message;
    EXPECT_EQ(readFile(installDir / "data" / "level 1.pak"), level);
    EXPECT_EQ(readFile(installDir / "readme.txt"), readme);

    // Resume from 25%: half way through the first file's share.
    fs::remove(installDir / "readme.txt");
    auto resumed = fresh.download("game1", installDir, 25.0);
    ASSERT_TRUE(resumed) << resumed.error().message;
    EXPECT_EQ(resumed.value().start, (catalog::ResumePoint{0, 150'000}));
    EXPECT_EQ(readFile(installDir / "data" / "level 1.pak"), level);
    EXPECT_EQ(readFile(installDir / "readme.txt"), readme);
}

TEST_F(ServerClientTest, StreamWithNothingLeftIsNotFound) {
    std::string body;
    auto r = rawFetch("/download/stream/game1?progress=100", body);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(ServerClientTest, InvalidUtf8GameIdIsAnErrorResponse) {
    std::string body;
    auto r = rawFetch("/games/%E9", body);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
    EXPECT_NE(r.error().message.find("\xef\xbf\xbd"), std::string::npos) << r.error().message;

    auto status = catalogClient->status();
    ASSERT_TRUE(status) << status.error().message;
}

TEST_F(ServerClientTest, Latin1FileNameFailsScanAndServerKeepsRunning) {
    const auto bad = writeFile(serverRoot / "caf\xe9.txt", "x");
    auto catalog = catalogClient->fetchCatalog("game1");
    ASSERT_FALSE(catalog);
    EXPECT_EQ(catalog.error().code, ErrorCode::ScanFailed);

    auto status = catalogClient->status();
    ASSERT_TRUE(status) << status.error().message;

    fs::remove(bad);
    auto fixed = catalogClient->fetchCatalog("game1");
    ASSERT_TRUE(fixed) << fixed.error().message;
}

TEST_F(ServerClientTest, IdleClientDoesNotBlockStop) {
    boost::asio::io_context clientIoc;
    boost::asio::ip::tcp::socket idle(clientIoc);
    ASSERT_NO_FATAL_FAILURE(connectIdle(idle));

    httpServer->stop();
    auto joined = std::async(std::launch::async, [this] { serverThread.join(); });
    const bool stopped = joined.wait_for(std::chrono::seconds(5)) == std::future_status::ready;

    // Release a stuck server so the test itself can finish.
    boost::system::error_code ec;
    idle.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    idle.close(ec);
    joined.wait();
    EXPECT_TRUE(stopped);
    EXPECT_EQ(httpServer->activeSessions(), 0u);
}

TEST_F(ServerClientTest, IdleConnectionIsDroppedAfterRequestTimeout) {
    boost::asio::io_context clientIoc;
    boost::asio::ip::tcp::socket idle(clientIoc);
    ASSERT_NO_FATAL_FAILURE(connectIdle(idle));

    auto dropped = std::async(std::launch::async, [&idle] {
        std::array<char, 16> buf{};
        boost::system::error_code ec;
        idle.read_some(boost::asio::buffer(buf), ec);
        return ec;
    });
    const bool finished =
        dropped.wait_for(std::chrono::seconds(10)) == std::future_status::ready;
    if (!finished) {
        boost::system::error_code ec;
        idle.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
    const auto ec = dropped.get();
    ASSERT_TRUE(finished);
    EXPECT_EQ(ec, boost::asio::error::eof);

    // The server still takes new requests.
    auto status = catalogClient->status();
    ASSERT_TRUE(status) << status.error().message;
}
