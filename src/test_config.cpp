#include "FileUtils.hpp"
#include "PipelineConfig.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace docintel;
using docintel::testing::TestReport;
using docintel::testing::near;

int main() {
  std::cout << "=== Test ConfigLoader ===" << std::endl;
  TestReport report;

  report.section("Defaults");
  {
    PipelineConfig defaults;
    report.check(defaults.matcher.autoMatchThreshold == 0.85 &&
                     defaults.matcher.partialMatchThreshold == 0.60,
                 "match thresholds default to 0.85 / 0.60");
    report.check(defaults.validator.highStakesConfidence == 0.99 &&
                     defaults.validator.highStakesFields.size() == 1 &&
                     defaults.validator.highStakesFields[0] == "total_amount",
                 "total_amount is high stakes at 0.99");
    report.check(defaults.library.cacheTtlSeconds == 86400,
                 "template cache TTL is one day");
    report.check(defaults.normalizer.targetDpi == 300.0 &&
                     defaults.normalizer.assumedSourceDpi == 200.0,
                 "normalizer targets 300 DPI from an assumed 200");

    ConfigLoadResult empty = ConfigLoader::parse("{}");
    report.check(empty.success &&
                     empty.config.matcher.suggestionCount ==
                         defaults.matcher.suggestionCount,
                 "empty document keeps every default");
  }

  report.section("Partial file");
  {
    ConfigLoadResult result = ConfigLoader::parse(R"({
      "matcher": {"auto_match_threshold": 0.9},
      "normalizer": {"denoise_level": "high", "binarization": "gaussian"},
      "validator": {"high_stakes_fields": ["total_amount", "tax_amount"]},
      "lifecycle": {"worker_count": 4, "extracting_timeout_ms": 30000},
      "verbose": true
    })");
    report.check(result.success, "partial configuration parses");
    const PipelineConfig &c = result.config;
    report.check(near(c.matcher.autoMatchThreshold, 0.9, 1e-12) &&
                     near(c.matcher.partialMatchThreshold, 0.60, 1e-12),
                 "given key overrides, sibling keeps its default");
    report.check(c.normalizer.denoiseLevel == "high" &&
                     c.normalizer.binarization == BinarizationMethod::Gaussian,
                 "normalizer options are read");
    report.check(c.validator.highStakesFields.size() == 2,
                 "list values are read");
    report.check(c.lifecycle.workerCount == 4 &&
                     c.lifecycle.extractingTimeoutMs == 30000,
                 "lifecycle options are read");
    report.check(c.verbose, "top-level verbose flag is read");
  }

  report.section("Invalid input");
  {
    ConfigLoadResult malformed = ConfigLoader::parse("{ not json");
    report.check(!malformed.success && !malformed.errorMessage.empty(),
                 "malformed JSON is reported, not thrown");

    ConfigLoadResult inverted = ConfigLoader::parse(
        R"({"matcher": {"auto_match_threshold": 0.5,
                        "partial_match_threshold": 0.7}})");
    report.check(!inverted.success, "partial above auto is rejected");

    ConfigLoadResult heavy = ConfigLoader::parse(
        R"({"matcher": {"zone_count_weight": 0.5,
                        "content_ratio_weight": 0.5,
                        "zone_geometry_weight": 0.5}})");
    report.check(!heavy.success, "weights summing past 1 are rejected");

    ConfigLoadResult rebalanced = ConfigLoader::parse(
        R"({"matcher": {"zone_count_weight": 0.25,
                        "content_ratio_weight": 0.25}})");
    report.check(rebalanced.success, "weights that still sum to 1 are kept");

    ConfigLoadResult evenBlock =
        ConfigLoader::parse(R"({"normalizer": {"gaussian_block_size": 10}})");
    report.check(!evenBlock.success, "even Gaussian block size is rejected");

    ConfigLoadResult wrongType =
        ConfigLoader::parse(R"({"library": {"cache_ttl_seconds": "soon"}})");
    report.check(!wrongType.success, "wrongly typed value is rejected");

    ConfigLoadResult badEnum =
        ConfigLoader::parse(R"({"normalizer": {"binarization": "sauvola"}})");
    report.check(!badEnum.success, "unknown binarization is rejected");

    ConfigLoadResult missing =
        ConfigLoader::load("/nonexistent/docintel/config.json");
    report.check(!missing.success, "missing file is reported");
  }

  report.section("Config file");
  {
    std::filesystem::path dir = docintel::testing::scratchDirectory("config");
    std::filesystem::path file = dir / "pipeline.json";
    writeFileAtomically(file, R"({"library": {"cache_ttl_seconds": 600}})");

    ConfigLoadResult loaded = ConfigLoader::load(file.string());
    report.check(loaded.success && loaded.config.library.cacheTtlSeconds == 600,
                 "file on disk is loaded");
    std::filesystem::remove_all(dir);
  }

  report.section("Environment overrides");
  {
    setenv("DOCINTEL_MATCHER_AUTO_MATCH_THRESHOLD", "0.95", 1);
    setenv("DOCINTEL_LIFECYCLE_WORKER_COUNT", "3", 1);
    setenv("DOCINTEL_NORMALIZER_DESKEW_ENABLED", "false", 1);
    setenv("DOCINTEL_VALIDATOR_HIGH_STAKES_FIELDS", "total_amount,subtotal", 1);

    ConfigLoadResult result =
        ConfigLoader::parse(R"({"matcher": {"auto_match_threshold": 0.9}})");
    report.check(result.success, "configuration with overrides parses");
    report.check(near(result.config.matcher.autoMatchThreshold, 0.95, 1e-12),
                 "environment beats the file");
    report.check(result.config.lifecycle.workerCount == 3,
                 "integer override is converted");
    report.check(!result.config.normalizer.deskewEnabled,
                 "boolean override is converted");
    report.check(result.config.validator.highStakesFields.size() == 2 &&
                     result.config.validator.highStakesFields[1] == "subtotal",
                 "list override is split on commas");

    PipelineConfig direct;
    int applied = ConfigLoader::applyEnvironmentOverrides(direct);
    report.check(applied == 4 && direct.lifecycle.workerCount == 3,
                 "overrides apply to an in-memory config");

    setenv("DOCINTEL_MATCHER_AUTO_MATCH_THRESHOLD", "0.1", 1);
    PipelineConfig guarded;
    report.check(ConfigLoader::applyEnvironmentOverrides(guarded) == 0 &&
                     guarded.matcher.autoMatchThreshold == 0.85,
                 "override set that breaks validation is rejected");

    unsetenv("DOCINTEL_MATCHER_AUTO_MATCH_THRESHOLD");
    unsetenv("DOCINTEL_LIFECYCLE_WORKER_COUNT");
    unsetenv("DOCINTEL_NORMALIZER_DESKEW_ENABLED");
    unsetenv("DOCINTEL_VALIDATOR_HIGH_STAKES_FIELDS");
  }

  report.section("Override text outside ASCII");
  {
    setenv("DOCINTEL_NORMALIZER_DESKEW_ENABLED", "TRUE", 1);
    PipelineConfig upper;
    upper.normalizer.deskewEnabled = false;
    report.check(ConfigLoader::applyEnvironmentOverrides(upper) == 1 &&
                     upper.normalizer.deskewEnabled,
                 "boolean override ignores case");

    setenv("DOCINTEL_NORMALIZER_DESKEW_ENABLED", "\xC3\x9C\xFF" "ber", 1);
    setenv("DOCINTEL_MATCHER_\xC3\x9C" "BER", "1", 1);
    PipelineConfig accented;
    report.check(ConfigLoader::applyEnvironmentOverrides(accented) == 1 &&
                     !accented.normalizer.deskewEnabled,
                 "high-byte value reads as false, high-byte name is ignored");

    unsetenv("DOCINTEL_NORMALIZER_DESKEW_ENABLED");
    unsetenv("DOCINTEL_MATCHER_\xC3\x9C" "BER");
  }

  return report.finish();
}
