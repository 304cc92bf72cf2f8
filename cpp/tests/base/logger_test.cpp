#include <gtest/gtest.h>
#include "../../base/base.hpp"
#include "../../base/exception.hpp"

#include <memory>
#include <tuple>
#include <vector>

namespace {

class recording_adapter : public base::logger_adapter {
public:
    explicit recording_adapter(base::log_level level = base::log_level::debug) : level_(level) {}

    const std::string name() const override {
        return "recording";
    }

    base::log_level min_level() const override {
        return level_;
    }

    void log(base::log_level level, const std::string &channel, const std::string &message) override {
        messages.emplace_back(level, channel, message);
    }

    std::vector<std::tuple<base::log_level, std::string, std::string>> messages;

private:
    base::log_level level_;
};

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        base::deinitialize();
    }
};

}

TEST_F(LoggerTest, formats_message_with_channel) {
    auto adapter = std::make_shared<recording_adapter>();
    base::initialize(adapter);

    base::log_info(base::log_channel::merge, "{} rows merged into {}", 3, "flights.csv");

    ASSERT_EQ(1, adapter->messages.size());
    EXPECT_EQ(base::log_level::info, std::get<0>(adapter->messages[0]));
    EXPECT_EQ("merge", std::get<1>(adapter->messages[0]));
    EXPECT_EQ("3 rows merged into flights.csv", std::get<2>(adapter->messages[0]));
}

TEST_F(LoggerTest, skips_levels_below_adapter_minimum) {
    auto adapter = std::make_shared<recording_adapter>(base::log_level::warning);
    base::initialize(adapter);

    base::log_debug(base::log_channel::codec, "ignored");
    base::log_info(base::log_channel::codec, "ignored");
    base::log_warning(base::log_channel::codec, "kept");
    base::log_error(base::log_channel::codec, "kept too");

    ASSERT_EQ(2, adapter->messages.size());
    EXPECT_EQ("kept", std::get<2>(adapter->messages[0]));
    EXPECT_EQ(base::log_level::error, std::get<0>(adapter->messages[1]));
}

TEST_F(LoggerTest, initialize_replaces_adapter_with_same_name) {
    auto first = std::make_shared<recording_adapter>();
    auto second = std::make_shared<recording_adapter>();
    base::initialize(first);
    base::initialize(second);

    EXPECT_EQ(1, base::get_logger().size());
    base::log_info(base::log_channel::generic, "hello");
    EXPECT_TRUE(first->messages.empty());
    EXPECT_EQ(1, second->messages.size());
}

TEST_F(LoggerTest, span_logs_start_and_finish) {
    auto adapter = std::make_shared<recording_adapter>();
    base::initialize(adapter);
    {
        auto span = base::log_span(base::log_channel::validate, "validate dataset");
        EXPECT_EQ(1, adapter->messages.size());
    }
    ASSERT_EQ(2, adapter->messages.size());
    EXPECT_EQ("validate", std::get<1>(adapter->messages[1]));
    EXPECT_NE(std::string::npos, std::get<2>(adapter->messages[1]).find("validate dataset"));
}

TEST(LogLevelTest, parses_names) {
    EXPECT_EQ(base::log_level::debug, base::str_to_log_level("debug"));
    EXPECT_EQ(base::log_level::info, base::str_to_log_level("INFO"));
    EXPECT_EQ(base::log_level::warning, base::str_to_log_level("warn"));
    EXPECT_EQ(base::log_level::warning, base::str_to_log_level("Warning"));
    EXPECT_EQ(base::log_level::error, base::str_to_log_level("error"));
    EXPECT_THROW(std::ignore = base::str_to_log_level("verbose"), base::invalid_log_level);
}
