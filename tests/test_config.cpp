#include "engine_config.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

namespace fs = std::filesystem;
using namespace presenceguard;

namespace {

std::string writeTempIni(const std::string &name, const std::string &body) {
  fs::path path = fs::temp_directory_path() / name;
  std::ofstream(path) << body;
  return path.string();
}

} // namespace

TEST(IniTest, ParsesSectionsAndComments) {
  std::string path = writeTempIni("presenceguard_parse.ini",
                                  "; leading comment\n"
                                  "# hash comment\n"
                                  "[Network]\n"
                                  "allowed_ssids = CampusWiFi, Lab-5G \r\n"
                                  "\n"
                                  "[Matcher]\n"
                                  "threshold=0.7\n");

  auto ini = parse_ini(path);

  EXPECT_EQ(ini.size(), 2u);
  EXPECT_EQ(ini["Network.allowed_ssids"], "CampusWiFi, Lab-5G");
  EXPECT_EQ(ini["Matcher.threshold"], "0.7");
  fs::remove(path);
}

TEST(IniTest, MissingFileIsEmpty) {
  EXPECT_TRUE(parse_ini("/nonexistent/presenceguard.ini").empty());
}

TEST(IniTest, SplitListTrimsAndDropsBlanks) {
  EXPECT_EQ(split_list(" a, b ,,c "),
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(split_list("").empty());
  EXPECT_EQ(split_list("*"), std::vector<std::string>{"*"});
}

TEST(EngineConfigTest, DefaultsMatchDocumentedValues) {
  EngineConfig config = EngineConfig::fromMap({});

  EXPECT_DOUBLE_EQ(config.matcher.threshold, 0.65);
  EXPECT_DOUBLE_EQ(config.matcher.consensus_threshold, 0.65);
  EXPECT_DOUBLE_EQ(config.matcher.min_acceptable_similarity, 0.55);
  EXPECT_DOUBLE_EQ(config.matcher.high_similarity_override, 0.9);
  EXPECT_EQ(config.matcher.required_checks, 4);
  EXPECT_EQ(config.liveness.min_frames, 3u);
  EXPECT_DOUBLE_EQ(config.liveness.movement_variance_threshold, 100.0);
  EXPECT_EQ(config.temporal.max_history, 20u);
  EXPECT_EQ(config.temporal.rapid_max_attempts, 10);
  EXPECT_EQ(config.network.hotspot_subnets.size(), 4u);
  EXPECT_TRUE(config.network.allowed_ssids.empty());
  EXPECT_DOUBLE_EQ(config.models.min_image_quality, 0.3);
  EXPECT_EQ(config.paths.users_dir, USERS_DIR);
  EXPECT_EQ(config.log.level, "info");
}

TEST(EngineConfigTest, LoadsOverridesFromFile) {
  std::string path = writeTempIni("presenceguard_load.ini",
                                  "[Network]\n"
                                  "allowed_ssids = CampusWiFi,*\n"
                                  "allowed_ip_ranges = 10.0.0.0/8\n"
                                  "[Matcher]\n"
                                  "embedding_dim = 128\n"
                                  "threshold = 0.7\n"
                                  "required_checks = 5\n"
                                  "[Liveness]\n"
                                  "min_frames = 4\n"
                                  "[Temporal]\n"
                                  "rapid_max_attempts = 5\n"
                                  "[Models]\n"
                                  "models_dir = /opt/models\n"
                                  "required_model_version = sface_2021dec\n"
                                  "min_image_quality = 0.45\n"
                                  "[Paths]\n"
                                  "users_dir = /tmp/users\n"
                                  "[Log]\n"
                                  "level = debug\n");

  EngineConfig config = EngineConfig::fromIni(path);

  EXPECT_EQ(config.network.allowed_ssids,
            (std::vector<std::string>{"CampusWiFi", "*"}));
  EXPECT_EQ(config.network.allowed_ip_ranges,
            std::vector<std::string>{"10.0.0.0/8"});
  EXPECT_EQ(config.matcher.embedding_dim, 128u);
  EXPECT_DOUBLE_EQ(config.matcher.threshold, 0.7);
  EXPECT_EQ(config.matcher.required_checks, 5);
  EXPECT_EQ(config.liveness.min_frames, 4u);
  EXPECT_EQ(config.temporal.rapid_max_attempts, 5);
  EXPECT_EQ(config.models.models_dir, "/opt/models");
  EXPECT_EQ(config.models.required_model_version, "sface_2021dec");
  EXPECT_DOUBLE_EQ(config.models.min_image_quality, 0.45);
  EXPECT_EQ(config.paths.users_dir, "/tmp/users");
  EXPECT_EQ(config.paths.ledger_dir, LEDGER_DIR);
  EXPECT_EQ(config.log.level, "debug");
  fs::remove(path);
}

TEST(EngineConfigTest, BadNumbersThrow) {
  EXPECT_THROW(EngineConfig::fromMap({{"Matcher.threshold", "high"}}),
               std::invalid_argument);
  EXPECT_THROW(EngineConfig::fromMap({{"Temporal.rapid_max_attempts", ""}}),
               std::invalid_argument);
}

TEST(EngineConfigTest, NegativeSizesThrow) {
  EXPECT_THROW(EngineConfig::fromMap({{"Matcher.embedding_dim", "-1"}}),
               std::invalid_argument);
  EXPECT_THROW(EngineConfig::fromMap({{"Liveness.min_frames", " -3"}}),
               std::invalid_argument);
  EXPECT_EQ(EngineConfig::fromMap({{"Matcher.embedding_dim", "512"}})
                .matcher.embedding_dim,
            512u);
}

TEST(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(Logger::parseLevel("WARN"), LogLevel::WARN);
  EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(Logger::parseLevel("Error"), LogLevel::ERROR);
  EXPECT_EQ(Logger::parseLevel("verbose"), LogLevel::INFO);
}

TEST(LoggerTest, WritesToConfiguredFile) {
  fs::path path = fs::temp_directory_path() / "presenceguard_logger.log";
  fs::remove(path);
  Logger::setConsoleOutput(false);
  Logger::setLevel(LogLevel::WARN);
  Logger::setLogFile(path.string());

  Logger::log(LogLevel::INFO, "filtered out");
  Logger::log(LogLevel::WARN, "kept line");
  Logger::setLogFile("");
  Logger::setLevel(LogLevel::INFO);
  Logger::setConsoleOutput(true);

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content.find("filtered out"), std::string::npos);
  EXPECT_NE(content.find("[WARN ] kept line"), std::string::npos);
  fs::remove(path);
}
