#include <gtest/gtest.h>
#include <graphlens/backends/SpdlogBackend.h>
#include <graphlens/common/Logger.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace graphlens;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setLevel(LogLevel::Trace);
        Logger::enableCapture(true);
        Logger::clearCapturedLogs();
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setLevel(LogLevel::Info);
    }
};

namespace {
void reportUpload() {
    LOG_INFO("uploaded {} nodes", 42);
}
}  // namespace

TEST_F(LoggerTest, CapturesFormattedMessagesWithCaller) {
    reportUpload();

    auto logs = Logger::capturedLogs();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].rfind("[info] ", 0), 0u);
    EXPECT_NE(logs[0].find("reportUpload() - uploaded 42 nodes"), std::string::npos);
}

TEST_F(LoggerTest, KeepsLevelTagsInOrder) {
    LOG_WARN("first");
    LOG_ERROR("second");

    auto logs = Logger::capturedLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].rfind("[warn] ", 0), 0u);
    EXPECT_EQ(logs[1].rfind("[error] ", 0), 0u);
}

TEST_F(LoggerTest, DisabledCaptureStoresNothing) {
    Logger::enableCapture(false);
    LOG_INFO("not kept");

    EXPECT_TRUE(Logger::capturedLogs().empty());
}

TEST(SpdlogBackendTest, WritesToLogFile) {
    const auto dir = std::filesystem::temp_directory_path() / "graphlens_logger_test";
    std::filesystem::remove_all(dir);
    const auto file = dir / "viewer.log";

    {
        SpdlogBackend backend(file);
        backend.log(LogLevel::Warn, "dataset has 3 dangling edges", std::source_location::current());
        backend.flush();
    }

    std::ifstream in(file);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("dataset has 3 dangling edges"), std::string::npos);
    EXPECT_NE(contents.str().find("[warning]"), std::string::npos);

    std::filesystem::remove_all(dir);
}
