#include "common/logging.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <unordered_map>

using namespace oreminer::common;
using json = nlohmann::json;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::INFO);
        Logger::instance().set_json_format(false);
        Logger::instance().set_output(&output);
    }

    void TearDown() override {
        Logger::instance().set_json_format(false);
        Logger::instance().set_level(LogLevel::INFO);
        Logger::instance().set_output(&std::cout);
    }

    std::ostringstream output;
};

TEST_F(LoggingTest, TextLineCarriesLevelModuleAndMessage) {
    LOG_WARN("round", "Skipping account #", 3, ": ", "invalid base64");
    std::string line = output.str();
    EXPECT_NE(line.find("[WARN] [round] Skipping account #3: invalid base64"),
              std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

TEST_F(LoggingTest, LevelsBelowThresholdAreDropped) {
    LOG_DEBUG("round", "hidden");
    LOG_TRACE("round", "hidden too");
    EXPECT_TRUE(output.str().empty());

    Logger::instance().set_level(LogLevel::TRACE);
    LOG_TRACE("round", "visible");
    EXPECT_NE(output.str().find("[TRACE] [round] visible"), std::string::npos);
}

TEST_F(LoggingTest, CriticalFailureIgnoresLevelAndSortsContext) {
    Logger::instance().set_level(LogLevel::CRITICAL);
    std::unordered_map<std::string, std::string> context{{"tile", "4"}, {"hint", "x"}};
    LOG_CRITICAL_FAILURE("deploy", "Live deployment unavailable", "LIVE_CONFIG_MISSING",
                         context);

    std::string line = output.str();
    EXPECT_NE(line.find("[CRITICAL] [deploy] Live deployment unavailable "
                        "(error: LIVE_CONFIG_MISSING) {hint=x, tile=4}"),
              std::string::npos);
}

TEST_F(LoggingTest, JsonLineIsParseableAndEscaped) {
    Logger::instance().set_json_format(true);
    std::unordered_map<std::string, std::string> context{{"path", "C:\\ledger"}};
    LOG_WALLET_ERROR("bad \"keypair\"\nfile", "WALLET_CONFIG_MISSING", context);

    json line = json::parse(output.str());
    EXPECT_EQ(line["level"], "CRITICAL");
    EXPECT_EQ(line["module"], "wallet");
    EXPECT_EQ(line["message"], "bad \"keypair\"\nfile");
    EXPECT_EQ(line["error_code"], "WALLET_CONFIG_MISSING");
    EXPECT_EQ(line["context"]["path"], "C:\\ledger");
    std::string timestamp = line["timestamp"].get<std::string>();
    EXPECT_EQ(timestamp.size(), 24u);
    EXPECT_EQ(timestamp.back(), 'Z');
}

TEST_F(LoggingTest, JsonLineToleratesInvalidUtf8) {
    Logger::instance().set_json_format(true);
    LOG_ERROR("rpc", std::string("raw \xff\xfe bytes"));
    EXPECT_NO_THROW(json::parse(output.str()));
    EXPECT_FALSE(json::parse(output.str()).contains("error_code"));
}

TEST_F(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("Debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("loud").has_value());
    EXPECT_STREQ(to_string(LogLevel::ERROR), "ERROR");
}
