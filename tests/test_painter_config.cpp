#include <MiniPainter/PainterConfig.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>

using namespace MiniPainter;
using nlohmann::json;

static EnvLookup envFrom(const std::map<std::string, std::string>& vars){
    return [vars](const char* name) -> const char* {
        static thread_local std::string value;
        auto it = vars.find(name);
        if (it == vars.end()) return nullptr;
        value = it->second;
        return value.c_str();
    };
}

static const EnvLookup kNoEnv = envFrom({});

TEST(PainterConfig, DefaultsAreValid) {
    PainterConfig c;
    EXPECT_EQ(c.oracle.baseUrl, "http://localhost:5000");
    EXPECT_EQ(c.oracle.timeoutSeconds, 30);
    EXPECT_EQ(c.oracle.healthTimeoutSeconds, 5);
    EXPECT_EQ(c.quantization.digits, 6);
    EXPECT_TRUE(c.mesh.normalize);
    EXPECT_EQ(c.paint.defaultColor, "#808080");
    EXPECT_EQ(validateConfig(c), "");

    ConfigResult r = loadConfig("", kNoEnv);
    EXPECT_TRUE(r.success) << r.error;
}

TEST(PainterConfig, JsonOverlaysOnlyPresentKeys) {
    json doc = {
        {"oracle", {{"baseUrl", "http://segmenter:8080"}, {"profile", "vehicle"}}},
        {"quantization", {{"digits", 4}}},
        {"mesh", {{"normalize", false}}},
    };
    ConfigResult r = configFromJson(doc);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.config.oracle.baseUrl, "http://segmenter:8080");
    EXPECT_EQ(r.config.oracle.profile, "vehicle");
    EXPECT_EQ(r.config.oracle.timeoutSeconds, 30);
    EXPECT_EQ(r.config.quantization.digits, 4);
    EXPECT_FALSE(r.config.mesh.normalize);
    EXPECT_FLOAT_EQ(r.config.mesh.targetSize, 5.0f);
}

TEST(PainterConfig, WrongTypesAreRejected) {
    EXPECT_FALSE(configFromJson(json::array()).success);
    EXPECT_FALSE(configFromJson({{"oracle", "http://x"}}).success);
    EXPECT_FALSE(configFromJson({{"oracle", {{"timeoutSeconds", "30"}}}}).success);
    EXPECT_FALSE(configFromJson({{"quantization", {{"digits", 4.5}}}}).success);
    EXPECT_FALSE(configFromJson({{"mesh", {{"normalize", 1}}}}).success);

    ConfigResult r = configFromJson({{"log", {{"level", 3}}}});
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("log.level"), std::string::npos);
}

TEST(PainterConfig, ValidationCatchesOutOfRangeValues) {
    PainterConfig c;
    c.quantization.digits = 0;
    EXPECT_NE(validateConfig(c), "");
    c.quantization.digits = 10;
    EXPECT_NE(validateConfig(c), "");
    c.quantization.digits = 9;
    EXPECT_EQ(validateConfig(c), "");

    c.paint.defaultColor = "gray";
    EXPECT_NE(validateConfig(c), "");
    c.paint.defaultColor = "#808080";

    c.oracle.detailLevel = "ultra";
    EXPECT_NE(validateConfig(c), "");
    c.oracle.detailLevel = "low";

    c.log.level = "loud";
    EXPECT_NE(validateConfig(c), "");
    c.log.level = "debug";

    c.mesh.targetSize = 0.0f;
    EXPECT_NE(validateConfig(c), "");
}

TEST(PainterConfig, EnvironmentOverridesFile) {
    auto path = (std::filesystem::temp_directory_path() / "minipainter_config_test.json").string();
    {
        std::ofstream ofs(path);
        ofs << R"({"oracle": {"baseUrl": "http://from-file:5000", "timeoutSeconds": 10}, "log": {"level": "warning"}})";
    }
    ConfigResult r = loadConfig(path, envFrom({{"MINIPAINTER_ORACLE_URL", "http://from-env:6000"},
                                               {"MINIPAINTER_LOG_LEVEL", "debug"}}));
    std::filesystem::remove(path);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.config.oracle.baseUrl, "http://from-env:6000");
    EXPECT_EQ(r.config.oracle.timeoutSeconds, 10);
    EXPECT_EQ(r.config.log.level, "debug");
}

TEST(PainterConfig, BadEnvironmentValuesFail) {
    EXPECT_FALSE(loadConfig("", envFrom({{"MINIPAINTER_ORACLE_TIMEOUT", "soon"}})).success);
    EXPECT_FALSE(loadConfig("", envFrom({{"MINIPAINTER_ORACLE_TIMEOUT", "0"}})).success);
    EXPECT_FALSE(loadConfig("", envFrom({{"MINIPAINTER_LOG_LEVEL", "chatty"}})).success);

    ConfigResult ok = loadConfig("", envFrom({{"MINIPAINTER_ORACLE_TIMEOUT", "45"}}));
    ASSERT_TRUE(ok.success) << ok.error;
    EXPECT_EQ(ok.config.oracle.timeoutSeconds, 45);
}

TEST(PainterConfig, UnreadableOrInvalidFileFails) {
    EXPECT_FALSE(loadConfig("/nonexistent/minipainter.json", kNoEnv).success);

    auto path = (std::filesystem::temp_directory_path() / "minipainter_bad_config.json").string();
    {
        std::ofstream ofs(path);
        ofs << "{ not json";
    }
    ConfigResult r = loadConfig(path, kNoEnv);
    std::filesystem::remove(path);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("invalid JSON"), std::string::npos);
}

TEST(PainterConfig, SessionOptionsFollowConfig) {
    PainterConfig c;
    c.quantization.digits = 4;
    c.mesh.normalize = false;
    c.mesh.targetSize = 2.0f;
    c.oracle.profile = "humanoid";
    c.paint.defaultColor = "#FF0000";
    SessionOptions o = c.sessionOptions();
    EXPECT_EQ(o.quantization.digits(), 4);
    EXPECT_FALSE(o.normalize);
    EXPECT_FLOAT_EQ(o.targetSize, 2.0f);
    EXPECT_EQ(o.profile, "humanoid");
    EXPECT_EQ(o.defaultColor, Color(1.0f, 0.0f, 0.0f));

    OracleHttpClient client = c.makeHttpClient();
    EXPECT_EQ(client.baseUrl(), "http://localhost:5000");
    EXPECT_EQ(client.timeoutSeconds(), 30);
}
