#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "llm_dispatch/DispatchConfig.hpp"

using namespace llm_dispatch;
namespace fs = std::filesystem;

TEST(DispatchConfigTest, DefaultsMatchTheDocumentedValues) {
    auto cfg = DispatchConfig::from_settings({});
    EXPECT_EQ(cfg.rotation_strategy, RotationStrategy::ROUND_ROBIN);
    EXPECT_EQ(cfg.max_parallel_api_keys, 5u);
    EXPECT_EQ(cfg.api_call_timeout, std::chrono::seconds(60));
    EXPECT_EQ(cfg.api_retry_timeout, std::chrono::seconds(30));
    EXPECT_TRUE(cfg.enable_fast_failover);
    EXPECT_EQ(cfg.max_batch_size, 10u);
    EXPECT_EQ(cfg.batch_timeout, std::chrono::seconds(30));
    EXPECT_EQ(cfg.max_retries, 2);
    EXPECT_EQ(cfg.default_provider, "gemini");
    EXPECT_TRUE(cfg.credentials.empty());
}

TEST(DispatchConfigTest, ParsesEveryOption) {
    auto cfg = DispatchConfig::from_settings({
        {"API_KEY_ROTATION_STRATEGY", "failover"},
        {"MAX_PARALLEL_API_KEYS", "3"},
        {"API_CALL_TIMEOUT", "12.5"},
        {"API_RETRY_TIMEOUT", "4"},
        {"ENABLE_FAST_FAILOVER", "off"},
        {"MAX_BATCH_SIZE", "25"},
        {"BATCH_TIMEOUT", "90"},
        {"MAX_RETRIES", "4"},
        {"CREDENTIAL_FAILURE_THRESHOLD", "1"},
        {"CREDENTIAL_COOLDOWN", "15"},
        {"CREDENTIAL_AUTH_COOLDOWN", "120"},
        {"DEFAULT_LLM_PROVIDER", "OpenAI"},
        {"PORT", "9001"},
        {"DEBUG", "no"},
    });
    EXPECT_EQ(cfg.rotation_strategy, RotationStrategy::FAILOVER);
    EXPECT_EQ(cfg.max_parallel_api_keys, 3u);
    EXPECT_EQ(cfg.api_call_timeout, std::chrono::milliseconds(12500));
    EXPECT_EQ(cfg.api_retry_timeout, std::chrono::seconds(4));
    EXPECT_FALSE(cfg.enable_fast_failover);
    EXPECT_EQ(cfg.max_batch_size, 25u);
    EXPECT_EQ(cfg.batch_timeout, std::chrono::seconds(90));
    EXPECT_EQ(cfg.max_retries, 4);
    EXPECT_EQ(cfg.quarantine.failure_threshold, 1);
    EXPECT_EQ(cfg.quarantine.cooldown, std::chrono::seconds(15));
    EXPECT_EQ(cfg.quarantine.auth_cooldown, std::chrono::seconds(120));
    EXPECT_EQ(cfg.default_provider, "openai");
    EXPECT_EQ(cfg.port, 9001);
    EXPECT_FALSE(cfg.debug);

    auto policy = cfg.dispatch_policy();
    EXPECT_EQ(policy.max_retries, 4);
    auto limits = cfg.batch_limits();
    EXPECT_EQ(limits.max_parallel, 3u);
    EXPECT_EQ(limits.max_batch_size, 25u);
}

TEST(DispatchConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(DispatchConfig::from_settings({{"API_KEY_ROTATION_STRATEGY", "weighted"}}), ConfigError);
    EXPECT_THROW(DispatchConfig::from_settings({{"API_KEY_ROTATION_STRATEGY", "라운드로빈"}}), ConfigError);
    EXPECT_EQ(DispatchConfig::from_settings({{"API_KEY_ROTATION_STRATEGY", "Random"}}).rotation_strategy,
              RotationStrategy::RANDOM);
    EXPECT_THROW(DispatchConfig::from_settings({{"MAX_PARALLEL_API_KEYS", "0"}}), ConfigError);
    EXPECT_THROW(DispatchConfig::from_settings({{"MAX_BATCH_SIZE", "ten"}}), ConfigError);
    EXPECT_THROW(DispatchConfig::from_settings({{"API_CALL_TIMEOUT", "-1"}}), ConfigError);
    EXPECT_THROW(DispatchConfig::from_settings({{"ENABLE_FAST_FAILOVER", "maybe"}}), ConfigError);
    EXPECT_THROW(DispatchConfig::from_settings({{"MAX_RETRIES", "-2"}}), ConfigError);

    try {
        DispatchConfig::from_settings({{"BATCH_TIMEOUT", "soon"}});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.option_, "BATCH_TIMEOUT");
    }
}

TEST(DispatchConfigTest, RetryTimeoutIsClampedToCallTimeout) {
    auto cfg = DispatchConfig::from_settings({{"API_CALL_TIMEOUT", "10"}, {"API_RETRY_TIMEOUT", "30"}});
    EXPECT_EQ(cfg.api_retry_timeout, std::chrono::seconds(10));
}

TEST(DispatchConfigTest, KeyListWinsOverSingleKey) {
    auto cfg = DispatchConfig::from_settings({
        {"GEMINI_API_KEYS", " g-key-1 , g-key-2,,g-key-3 "},
        {"GEMINI_API_KEY", "g-single"},
        {"OPENAI_API_KEY", "o-single"},
    });
    EXPECT_EQ(cfg.credentials["gemini"], (std::vector<std::string>{"g-key-1", "g-key-2", "g-key-3"}));
    EXPECT_EQ(cfg.credentials["openai"], (std::vector<std::string>{"o-single"}));
}

TEST(DispatchConfigTest, ReadsDotenvFile) {
    fs::path path = fs::temp_directory_path() / "llm_dispatch_test.env";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "api_call_timeout=45\n"
          << "export MAX_BATCH_SIZE=7\n"
          << "GEMINI_API_KEYS=\"quoted-a,quoted-b\"\n"
          << "DEBUG=true # trailing comment\n"
          << "not a setting\n";
    }
    auto settings = DispatchConfig::read_dotenv(path.string());
    fs::remove(path);

    EXPECT_EQ(settings["API_CALL_TIMEOUT"], "45");
    EXPECT_EQ(settings["MAX_BATCH_SIZE"], "7");
    EXPECT_EQ(settings["GEMINI_API_KEYS"], "quoted-a,quoted-b");
    EXPECT_EQ(settings["DEBUG"], "true");
    EXPECT_EQ(settings.size(), 4u);

    auto cfg = DispatchConfig::from_settings(settings);
    EXPECT_EQ(cfg.max_batch_size, 7u);
    EXPECT_EQ(cfg.credentials["gemini"].size(), 2u);
}

TEST(DispatchConfigTest, MissingDotenvIsEmpty) {
    EXPECT_TRUE(DispatchConfig::read_dotenv("/nonexistent/definitely/.env").empty());
}

TEST(DispatchConfigTest, MergesKeyVaultWithoutDuplicates) {
    auto cfg = DispatchConfig::from_settings({{"GEMINI_API_KEYS", "g-1,g-2"}});
    cfg.merge_key_vault(nlohmann::json{
        {"gemini", nlohmann::json::array({"g-2", "g-3"})},
        {"OpenAI", nlohmann::json::array({"o-1"})},
        {"anthropic", nlohmann::json::array()}
    });
    EXPECT_EQ(cfg.credentials["gemini"], (std::vector<std::string>{"g-1", "g-2", "g-3"}));
    EXPECT_EQ(cfg.credentials["openai"], (std::vector<std::string>{"o-1"}));
    EXPECT_EQ(cfg.credentials.count("anthropic"), 0u);

    cfg.merge_key_vault(nlohmann::json{{"keys", nlohmann::json::array({"g-4"})}});
    EXPECT_EQ(cfg.credentials["gemini"].back(), "g-4");
}

TEST(DispatchConfigTest, JsonNeverContainsKeys) {
    auto cfg = DispatchConfig::from_settings({{"GEMINI_API_KEYS", "super-secret-1,super-secret-2"}});
    auto j = cfg.to_json();
    EXPECT_EQ(j["credentials"]["gemini"], 2);
    EXPECT_EQ(j.dump().find("super-secret"), std::string::npos);
}
