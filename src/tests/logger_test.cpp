#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = make_temp_dir("logger_test");
        log_file = log_dir / "node.log";
        peerchunks::logger::init_logging(log_file.string(), boost::log::trivial::trace, false);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        std::filesystem::remove_all(log_dir);

        // Restore the console sink used by the other suites
        init_logging();
    }

    std::string log_contents() {
        boost::log::core::get()->flush();
        return read_file(log_file);
    }
};

TEST_F(LoggerTest, WritesFormattedLinesToFile) {
    BOOST_LOG_TRIVIAL(info) << "Chunk store: Saved chunk 3";

    std::string contents = log_contents();
    EXPECT_NE(contents.find("[info] Chunk store: Saved chunk 3"), std::string::npos) << contents;
}

TEST_F(LoggerTest, SeverityFilterDropsLowerLevels) {
    peerchunks::logger::set_log_level(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Replicator: hidden debug line";
    BOOST_LOG_TRIVIAL(info) << "Replicator: hidden info line";
    BOOST_LOG_TRIVIAL(warning) << "Replicator: visible warning line";
    BOOST_LOG_TRIVIAL(error) << "Replicator: visible error line";

    std::string contents = log_contents();
    EXPECT_EQ(contents.find("hidden"), std::string::npos) << contents;
    EXPECT_NE(contents.find("[warning] Replicator: visible warning line"), std::string::npos);
    EXPECT_NE(contents.find("[error] Replicator: visible error line"), std::string::npos);
}

TEST_F(LoggerTest, ReinitializingAppendsToExistingFile) {
    BOOST_LOG_TRIVIAL(info) << "Logger test: first run";
    boost::log::core::get()->flush();

    peerchunks::logger::init_logging(log_file.string(), boost::log::trivial::info, false);
    BOOST_LOG_TRIVIAL(info) << "Logger test: second run";

    std::string contents = log_contents();
    EXPECT_NE(contents.find("Logger test: first run"), std::string::npos);
    EXPECT_NE(contents.find("Logger test: second run"), std::string::npos);
}
