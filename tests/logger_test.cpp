#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "logger.h"
#include "test_support.h"

TEST(LoggerTest, WritesLevelledLinesToFile) {
    TempDir tmp;
    fs::path log_path = tmp.path() / "crawler.log";
    {
        Logger logger(log_path.string(), false);
        logger.info("starting");
        logger.warning("Got error downloading 'u' : 404.");
        logger.error("Fatal error: disk full");
    }

    std::ifstream in(log_path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_NE(lines[0].find(" - INFO - starting"), std::string::npos);
    EXPECT_NE(lines[1].find(" - WARNING - Got error downloading"), std::string::npos);
    EXPECT_NE(lines[2].find(" - ERROR - Fatal error: disk full"), std::string::npos);
    // "YYYY-MM-DD HH:MM:SS" prefix
    EXPECT_EQ(lines[0].find(" - "), 19u);
}

TEST(LoggerTest, AppendsAcrossInstances) {
    TempDir tmp;
    fs::path log_path = tmp.path() / "crawler.log";
    Logger(log_path.string(), false).info("first");
    Logger(log_path.string(), false).info("second");

    std::ifstream in(log_path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}
