#include <gtest/gtest.h>
#include "pw_config.h"
#include "fs.h"

using namespace peerwire;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        delete_file("test_config.json");
    }
};

TEST_F(ConfigTest, Defaults) {
    TorrentConfig config;
    EXPECT_EQ(config.pipeline_depth, PW_DEFAULT_PIPELINE_DEPTH);
    EXPECT_EQ(config.block_size, PW_BLOCK_SIZE);
    EXPECT_EQ(config.redial_attempts, 0);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, OverlayKeepsUnsetDefaults) {
    nlohmann::json json = {{"pipeline_depth", 2}, {"max_peers", 3}, {"unknown_key", "ignored"}};
    TorrentConfig config = TorrentConfig::from_json(json);

    EXPECT_EQ(config.pipeline_depth, 2u);
    EXPECT_EQ(config.max_peers, 3u);
    EXPECT_EQ(config.block_size, PW_BLOCK_SIZE);
    EXPECT_EQ(config.tick_interval_ms, TorrentConfig().tick_interval_ms);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    TorrentConfig config;
    config.max_unchoked_peers = 7;
    config.redial_attempts = 3;
    config.read_timeout_ms = 5;

    TorrentConfig loaded = TorrentConfig::from_json(config.to_json());
    EXPECT_EQ(loaded.max_unchoked_peers, 7u);
    EXPECT_EQ(loaded.redial_attempts, 3);
    EXPECT_EQ(loaded.read_timeout_ms, 5);
}

TEST_F(ConfigTest, WrongTypeRejected) {
    EXPECT_THROW(TorrentConfig::from_json({{"pipeline_depth", "deep"}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"max_peers", -1}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json(nlohmann::json::array()), ConfigError);
}

TEST_F(ConfigTest, InvalidValuesRejected) {
    EXPECT_THROW(TorrentConfig::from_json({{"pipeline_depth", 0}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"block_size", PW_MAX_BLOCK_SIZE + 1}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"max_peers", 0}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"tick_interval_ms", 0}}), ConfigError);
}

TEST_F(ConfigTest, ValuesBeyondFieldRangeRejected) {
    EXPECT_THROW(TorrentConfig::from_json({{"handshake_timeout_ms", 3000000000u}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"redial_attempts", 4294967296u}}), ConfigError);
    EXPECT_THROW(TorrentConfig::from_json({{"block_size", 4294967296u}}), ConfigError);

    TorrentConfig config = TorrentConfig::from_json({{"handshake_timeout_ms", 2147483647u}});
    EXPECT_EQ(config.handshake_timeout_ms, 2147483647);
}

TEST_F(ConfigTest, NegativeFieldsRejectedByValidate) {
    TorrentConfig config;
    config.redial_attempts = -1;
    EXPECT_THROW(config.validate(), ConfigError);

    config = TorrentConfig();
    config.handshake_timeout_ms = -5;
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(ConfigTest, FileRoundTrip) {
    TorrentConfig config;
    config.pipeline_depth = 9;
    ASSERT_TRUE(save_json_file("test_config.json", config.to_json()));

    auto loaded = TorrentConfig::from_json(load_json_file("test_config.json"));
    EXPECT_EQ(loaded.pipeline_depth, 9u);
}

TEST_F(ConfigTest, LoadErrors) {
    EXPECT_THROW(load_json_file("missing_config.json"), ConfigError);

    ASSERT_TRUE(write_file_text("test_config.json", "{ not json"));
    EXPECT_THROW(load_json_file("test_config.json"), ConfigError);
}
