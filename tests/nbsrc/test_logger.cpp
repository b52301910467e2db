#include <gtest/gtest.h>
#include <nbsrc/util/logger.hpp>

#include <sstream>

using namespace nbsrc;

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    std::ostringstream out;
    ConsoleLogger logger(out);

    logger.debug("hidden");
    logger.info("parsed 2 cells");
    logger.error("bad index");

    EXPECT_EQ(out.str(), "[INFO] parsed 2 cells\n[ERROR] bad index\n");
}

TEST(LoggerTest, DebugLevelShowsEverything) {
    std::ostringstream out;
    ConsoleLogger logger(out);
    logger.set_min_level(LogLevel::DEBUG);

    logger.debug("reading stdin");
    logger.warning("empty notebook");

    EXPECT_EQ(logger.get_min_level(), LogLevel::DEBUG);
    EXPECT_EQ(out.str(), "[DEBUG] reading stdin\n[WARN] empty notebook\n");
}

TEST(LoggerTest, NullLoggerDiscardsMessages) {
    Logger& logger = null_logger();
    logger.set_min_level(LogLevel::DEBUG);
    logger.error("dropped");

    EXPECT_EQ(&logger, &null_logger());
    EXPECT_NE(dynamic_cast<NullLogger*>(&logger), nullptr);
}
