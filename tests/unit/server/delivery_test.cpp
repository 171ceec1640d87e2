#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/protocol/stream_framing.h>
#include <gamefetch/server/delivery.h>
#include <gamefetch/server/game_service.h>

using namespace gamefetch;
using namespace gamefetch::server;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class DeliveryTest : public GameFetchTest {
protected:
    void SetUp() override {
        GameFetchTest::SetUp();
        root = testDir / "game";
        a = generateRandomString(5000);
        b = generateRandomString(12000);
        writeFile(root / "a.bin", a);
        writeFile(root / "sub" / "b.bin", b);
        service = std::make_unique<GameService>(singleGameConfig(root));
    }

    ByteSink collect(std::string& out) {
        return [&out](ByteSpan bytes) -> Result<void> {
            out.append(reinterpret_cast<const char*>(bytes.data()), bytes.size());
            return {};
        };
    }

    fs::path root;
    std::string a;
    std::string b;
    std::unique_ptr<GameService> service;
};

TEST_F(DeliveryTest, SendsRequestedRange) {
    auto plan = service->planFileDownload("game1", "sub/b.bin", 7000);
    ASSERT_TRUE(plan);
    std::string got;
    ASSERT_TRUE(sendFileRange(plan.value(), collect(got), 1024));
    EXPECT_EQ(got, b.substr(7000));
}

TEST_F(DeliveryTest, NeverReadsPastPlannedSize) {
    auto plan = service->planFileDownload("game1", "a.bin", 0);
    ASSERT_TRUE(plan);
    // Growth after planning is not sent.
    writeFile(root / "a.bin", a + "tail");
    std::string got;
    ASSERT_TRUE(sendFileRange(plan.value(), collect(got)));
    EXPECT_EQ(got, a);
}

TEST_F(DeliveryTest, ShrunkFileFails) {
    auto plan = service->planFileDownload("game1", "a.bin", 0);
    ASSERT_TRUE(plan);
    writeFile(root / "a.bin", a.substr(0, 100));
    std::string got;
    auto r = sendFileRange(plan.value(), collect(got));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::IoError);
}

TEST_F(DeliveryTest, SinkErrorStopsTransfer) {
    auto plan = service->planFileDownload("game1", "sub/b.bin", 0);
    ASSERT_TRUE(plan);
    std::size_t calls = 0;
    auto r = sendFileRange(plan.value(), [&](ByteSpan) -> Result<void> {
        ++calls;
        return Error{ErrorCode::NetworkError, "client went away"};
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
    EXPECT_EQ(calls, 1u);
}

TEST_F(DeliveryTest, StreamFromStartOmitsFirstMarker) {
    auto plan = service->planStream("game1", 0.0, 4096);
    ASSERT_TRUE(plan);
    std::string got;
    auto stats = writeStream(plan.value(), collect(got));
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().filesSent, 2u);

    // Directories sort first, so sub/b.bin leads the catalog.
    auto second = protocol::FrameWriter::boundary({"a.bin", a.size()});
    EXPECT_EQ(got, b + second.value() + a);
}

TEST_F(DeliveryTest, ResumedStreamStartsWithMarker) {
    auto plan = service->planStream("game1", 25.0, 4096);
    ASSERT_TRUE(plan);
    ASSERT_EQ(plan.value().start, (catalog::ResumePoint{0, 6000}));

    std::string got;
    ASSERT_TRUE(writeStream(plan.value(), collect(got)));
    auto first = protocol::FrameWriter::boundary({"sub/b.bin", b.size()});
    auto second = protocol::FrameWriter::boundary({"a.bin", a.size()});
    EXPECT_EQ(got, first.value() + b.substr(6000) + second.value() + a);
}

TEST_F(DeliveryTest, VanishedFileIsSkipped) {
    auto plan = service->planStream("game1", 0.0, 4096);
    ASSERT_TRUE(plan);
    fs::remove(root / "a.bin");

    std::string got;
    auto stats = writeStream(plan.value(), collect(got));
    ASSERT_TRUE(stats);
    EXPECT_EQ(stats.value().filesSent, 1u);
    EXPECT_EQ(stats.value().filesSkipped, 1u);
    EXPECT_EQ(got, b);
}
