#include <gtest/gtest.h>
#include <string>
#include <vector>
#include <algorithm>

#include "LogMiner.h"
#include "JsonModel.h"
#include "FakeCommandRunner.h"

// ==========================================
// 1. КЛАССИФИКАЦИЯ СОБЫТИЙ
// ==========================================

TEST(EventRiskTest, Known_Ids) {
    EXPECT_EQ(classify_event_risk("4624"), PrivacyRisk::HIGH);
    EXPECT_EQ(classify_event_risk("1102"), PrivacyRisk::HIGH);
    EXPECT_EQ(classify_event_risk("104"), PrivacyRisk::HIGH);
    EXPECT_EQ(classify_event_risk("4798"), PrivacyRisk::MEDIUM);
    EXPECT_EQ(classify_event_risk("6006"), PrivacyRisk::MEDIUM);
    EXPECT_EQ(classify_event_risk("9999"), PrivacyRisk::LOW);
    EXPECT_EQ(classify_event_risk(""), PrivacyRisk::LOW);
}

TEST(EventRiskTest, Risk_Is_Derived_From_Id) {
    EventLogEntry e;
    e.event_id = "4625";
    EXPECT_EQ(e.privacy_risk(), PrivacyRisk::HIGH);
    e.event_id = "7036";
    EXPECT_EQ(e.privacy_risk(), PrivacyRisk::LOW);

    nlohmann::json j = e;
    EXPECT_EQ(j["privacyRisk"].get<std::string>(), "Low");
}

TEST(EventRiskTest, Xpath_Lists_All_Ids) {
    const std::string xpath = privacy_event_xpath();
    EXPECT_EQ(xpath.rfind("*[System[(", 0), 0u);
    for (const char* id : {"4624", "4625", "4648", "4720", "4726", "1102", "104",
                           "4798", "4799", "1074", "6005", "6006"}) {
        EXPECT_NE(xpath.find(std::string("EventID=") + id), std::string::npos) << id;
    }
}

// ==========================================
// 2. ОПРОС КАНАЛОВ (подставной wevtutil)
// ==========================================

class LogMinerTest : public ::testing::Test {
protected:
    ScanConfig cfg;
    FakeCommandRunner runner;

    PlatformContext context(Platform p) {
        PlatformContext ctx;
        ctx.platform = p;
        return ctx;
    }

    static std::string query_key(const std::string& channel) {
        return "wevtutil qe " + channel + " /q:" + privacy_event_xpath()
             + " /c:" + std::to_string(MAX_RAW_EVENTS) + " /rd:true /f:text";
    }

    static std::string event_block(int idx, const std::string& id, const std::string& channel) {
        return "Event[" + std::to_string(idx) + "]:\r\n"
               "  Log Name: " + channel + "\r\n"
               "  Source: Test-Source\r\n"
               "  Date: 2024-05-01T10:00:" + (idx < 10 ? "0" : "") + std::to_string(idx) + ".0000000Z\r\n"
               "  Event ID: " + id + "\r\n"
               "  Level: Information\r\n"
               "  Description: event " + std::to_string(idx) + "\r\n"
               "\r\n";
    }

    static std::string channel_list(size_t count) {
        std::string out = "Application\r\nSecurity\r\nSystem\r\n";
        for (size_t i = 3; i < count; ++i) out += "Microsoft-Windows-Test-" + std::to_string(i) + "/Operational\r\n";
        return out;
    }
};

TEST_F(LogMinerTest, Not_Supported_Off_Windows) {
    LogMiner miner(context(Platform::LINUX), runner, cfg);
    auto res = miner.scan();
    EXPECT_FALSE(res.supported);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_NE(res.error->find("linux"), std::string::npos);
    EXPECT_TRUE(res.logs.empty());
    EXPECT_TRUE(runner.calls().empty()) << "No utility may be started off Windows";
}

TEST_F(LogMinerTest, Channel_List_Is_Capped) {
    runner.on("wevtutil el", channel_list(75));
    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    auto res = miner.scan();

    EXPECT_TRUE(res.supported);
    EXPECT_EQ(res.summary.channels_available, 75u);
    EXPECT_EQ(res.log_sources.size(), MAX_LOG_CHANNELS);
    EXPECT_EQ(res.log_sources[0], "Application");
}

TEST_F(LogMinerTest, Unreadable_Security_Is_Counted_Not_Fatal) {
    runner.on("wevtutil el", channel_list(3));
    runner.on(query_key("Security"), "Access is denied.\r\n", 5);
    runner.on(query_key("System"), event_block(0, "6005", "System") + event_block(1, "104", "System"));
    runner.on(query_key("Application"), "");

    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    auto res = miner.scan();

    EXPECT_FALSE(res.error.has_value());
    EXPECT_EQ(res.summary.channels_queried, 3u);
    EXPECT_EQ(res.summary.channels_failed, 1u);
    ASSERT_EQ(res.logs.size(), 2u);
    EXPECT_EQ(res.total_entries, 2u);
    EXPECT_EQ(res.summary.high_risk, 1u);
    EXPECT_EQ(res.summary.medium_risk, 1u);
    EXPECT_EQ(res.summary.low_risk, 0u);
    for (const auto& e : res.logs) EXPECT_EQ(e.channel, "System");
}

TEST_F(LogMinerTest, Events_Per_Channel_Are_Capped) {
    std::string many;
    for (int i = 0; i < 35; ++i) many += event_block(i, "4624", "Security");
    runner.on("wevtutil el", channel_list(3));
    runner.on(query_key("Security"), many);

    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    auto res = miner.scan();

    EXPECT_EQ(res.logs.size(), MAX_EVENTS_PER_CHANNEL);
    EXPECT_EQ(res.summary.high_risk, MAX_EVENTS_PER_CHANNEL);
    // wevtutil /rd:true: новые первыми, порядок сохраняется
    EXPECT_EQ(res.logs.front().description, "event 0");
    // System и Application не ответили
    EXPECT_EQ(res.summary.channels_failed, 2u);
}

TEST_F(LogMinerTest, Query_Timeout_Counts_As_Failure) {
    runner.on("wevtutil el", channel_list(3));
    runner.on_timeout(query_key("Security"));
    runner.on(query_key("System"), "");
    runner.on(query_key("Application"), "");

    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    auto res = miner.scan();
    EXPECT_EQ(res.summary.channels_failed, 1u);
    EXPECT_TRUE(res.logs.empty());
    EXPECT_EQ(res.total_entries, 0u);
}

TEST_F(LogMinerTest, Missing_Wevtutil_Still_Queries_Priority_Channels) {
    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    auto res = miner.scan();

    EXPECT_TRUE(res.supported);
    EXPECT_TRUE(res.log_sources.empty());
    EXPECT_EQ(res.summary.channels_available, 0u);
    EXPECT_EQ(res.summary.channels_queried, priority_channels().size());
    EXPECT_EQ(res.summary.channels_failed, priority_channels().size());

    auto calls = runner.calls();
    EXPECT_TRUE(std::find(calls.begin(), calls.end(), query_key("Security")) != calls.end());
}

TEST_F(LogMinerTest, Result_Serialization) {
    runner.on("wevtutil el", channel_list(3));
    runner.on(query_key("System"), event_block(0, "1074", "System"));

    LogMiner miner(context(Platform::WINDOWS), runner, cfg);
    nlohmann::json j = miner.scan();

    EXPECT_TRUE(j["supported"].get<bool>());
    EXPECT_EQ(j["totalEntries"].get<size_t>(), 1u);
    ASSERT_EQ(j["logs"].size(), 1u);
    EXPECT_EQ(j["logs"][0]["eventId"].get<std::string>(), "1074");
    EXPECT_EQ(j["logs"][0]["privacyRisk"].get<std::string>(), "Medium");
    EXPECT_EQ(j["logSources"].size(), 3u);
}
