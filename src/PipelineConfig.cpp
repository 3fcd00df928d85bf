#include "PipelineConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

extern char **environ;

namespace docintel {

using json = nlohmann::json;

namespace {

json sectionsToJson(const PipelineConfig &c) {
  json j;
  j["verbose"] = c.verbose;

  const NormalizerConfig &n = c.normalizer;
  j["normalizer"] = {{"deskew_enabled", n.deskewEnabled},
                     {"min_skew_degrees", n.minSkewDegrees},
                     {"max_skew_degrees", n.maxSkewDegrees},
                     {"denoise_level", n.denoiseLevel},
                     {"binarization", toString(n.binarization)},
                     {"gaussian_block_size", n.gaussianBlockSize},
                     {"gaussian_c", n.gaussianC},
                     {"target_dpi", n.targetDpi},
                     {"assumed_source_dpi", n.assumedSourceDpi},
                     {"border_removal_enabled", n.borderRemovalEnabled},
                     {"border_padding_ratio", n.borderPaddingRatio},
                     {"border_min_padding_px", n.borderMinPaddingPx},
                     {"pdf_render_dpi", n.pdfRenderDpi}};

  const SignatureConfig &s = c.signature;
  j["signature"] = {{"min_zone_area_ratio", s.minZoneAreaRatio},
                    {"merge_kernel_width_ratio", s.mergeKernelWidthRatio},
                    {"merge_kernel_height_ratio", s.mergeKernelHeightRatio},
                    {"min_table_bands", s.minTableBands},
                    {"max_band_pitch_variation", s.maxBandPitchVariation}};

  const MatcherConfig &m = c.matcher;
  j["matcher"] = {{"auto_match_threshold", m.autoMatchThreshold},
                  {"partial_match_threshold", m.partialMatchThreshold},
                  {"suggestion_count", m.suggestionCount},
                  {"zone_count_weight", m.zoneCountWeight},
                  {"content_ratio_weight", m.contentRatioWeight},
                  {"zone_geometry_weight", m.zoneGeometryWeight},
                  {"zone_distance_decay", m.zoneDistanceDecay}};

  j["extractor"] = {{"min_zone_overlap", c.extractor.minZoneOverlap},
                    {"drift_confidence_floor",
                     c.extractor.driftConfidenceFloor}};

  const ValidatorConfig &v = c.validator;
  j["validator"] = {{"high_stakes_fields", v.highStakesFields},
                    {"high_stakes_confidence", v.highStakesConfidence},
                    {"field_confidence_floor", v.fieldConfidenceFloor},
                    {"warning_threshold", v.warningThreshold},
                    {"subtotal_tolerance", v.subtotalTolerance},
                    {"minimum_tolerance", v.minimumTolerance},
                    {"max_tax_rate", v.maxTaxRate},
                    {"total_field", v.totalField},
                    {"subtotal_field", v.subtotalField},
                    {"tax_field", v.taxField},
                    {"taxable_field", v.taxableField},
                    {"line_total_prefix", v.lineTotalPrefix}};

  j["library"] = {{"cache_ttl_seconds", c.library.cacheTtlSeconds},
                  {"refresh_lock_timeout_ms", c.library.refreshLockTimeoutMs}};

  const LifecycleConfig &l = c.lifecycle;
  j["lifecycle"] = {{"preprocessing_timeout_ms", l.preprocessingTimeoutMs},
                    {"matching_timeout_ms", l.matchingTimeoutMs},
                    {"extracting_timeout_ms", l.extractingTimeoutMs},
                    {"worker_count", l.workerCount},
                    {"state_directory", l.stateDirectory}};

  j["ocr"] = {{"language", c.ocr.language},
              {"tess_data_path", c.ocr.tessDataPath},
              {"page_seg_mode", c.ocr.pageSegMode}};
  return j;
}

PipelineConfig sectionsFromJson(const json &j) {
  PipelineConfig c;
  c.verbose = j.at("verbose").get<bool>();

  const json &n = j.at("normalizer");
  c.normalizer.deskewEnabled = n.at("deskew_enabled").get<bool>();
  c.normalizer.minSkewDegrees = n.at("min_skew_degrees").get<double>();
  c.normalizer.maxSkewDegrees = n.at("max_skew_degrees").get<double>();
  c.normalizer.denoiseLevel = n.at("denoise_level").get<std::string>();
  c.normalizer.binarization =
      binarizationMethodFromString(n.at("binarization").get<std::string>());
  c.normalizer.gaussianBlockSize = n.at("gaussian_block_size").get<int>();
  c.normalizer.gaussianC = n.at("gaussian_c").get<double>();
  c.normalizer.targetDpi = n.at("target_dpi").get<double>();
  c.normalizer.assumedSourceDpi = n.at("assumed_source_dpi").get<double>();
  c.normalizer.borderRemovalEnabled =
      n.at("border_removal_enabled").get<bool>();
  c.normalizer.borderPaddingRatio = n.at("border_padding_ratio").get<double>();
  c.normalizer.borderMinPaddingPx = n.at("border_min_padding_px").get<int>();
  c.normalizer.pdfRenderDpi = n.at("pdf_render_dpi").get<double>();

  const json &s = j.at("signature");
  c.signature.minZoneAreaRatio = s.at("min_zone_area_ratio").get<double>();
  c.signature.mergeKernelWidthRatio =
      s.at("merge_kernel_width_ratio").get<double>();
  c.signature.mergeKernelHeightRatio =
      s.at("merge_kernel_height_ratio").get<double>();
  c.signature.minTableBands = s.at("min_table_bands").get<int>();
  c.signature.maxBandPitchVariation =
      s.at("max_band_pitch_variation").get<double>();

  const json &m = j.at("matcher");
  c.matcher.autoMatchThreshold = m.at("auto_match_threshold").get<double>();
  c.matcher.partialMatchThreshold =
      m.at("partial_match_threshold").get<double>();
  c.matcher.suggestionCount = m.at("suggestion_count").get<int>();
  c.matcher.zoneCountWeight = m.at("zone_count_weight").get<double>();
  c.matcher.contentRatioWeight = m.at("content_ratio_weight").get<double>();
  c.matcher.zoneGeometryWeight = m.at("zone_geometry_weight").get<double>();
  c.matcher.zoneDistanceDecay = m.at("zone_distance_decay").get<double>();

  const json &e = j.at("extractor");
  c.extractor.minZoneOverlap = e.at("min_zone_overlap").get<double>();
  c.extractor.driftConfidenceFloor =
      e.at("drift_confidence_floor").get<double>();

  const json &v = j.at("validator");
  c.validator.highStakesFields =
      v.at("high_stakes_fields").get<std::vector<std::string>>();
  c.validator.highStakesConfidence =
      v.at("high_stakes_confidence").get<double>();
  c.validator.fieldConfidenceFloor =
      v.at("field_confidence_floor").get<double>();
  c.validator.warningThreshold = v.at("warning_threshold").get<int>();
  c.validator.subtotalTolerance = v.at("subtotal_tolerance").get<double>();
  c.validator.minimumTolerance = v.at("minimum_tolerance").get<double>();
  c.validator.maxTaxRate = v.at("max_tax_rate").get<double>();
  c.validator.totalField = v.at("total_field").get<std::string>();
  c.validator.subtotalField = v.at("subtotal_field").get<std::string>();
  c.validator.taxField = v.at("tax_field").get<std::string>();
  c.validator.taxableField = v.at("taxable_field").get<std::string>();
  c.validator.lineTotalPrefix = v.at("line_total_prefix").get<std::string>();

  const json &lib = j.at("library");
  c.library.cacheTtlSeconds = lib.at("cache_ttl_seconds").get<long>();
  c.library.refreshLockTimeoutMs =
      lib.at("refresh_lock_timeout_ms").get<long>();

  const json &l = j.at("lifecycle");
  c.lifecycle.preprocessingTimeoutMs =
      l.at("preprocessing_timeout_ms").get<long>();
  c.lifecycle.matchingTimeoutMs = l.at("matching_timeout_ms").get<long>();
  c.lifecycle.extractingTimeoutMs = l.at("extracting_timeout_ms").get<long>();
  c.lifecycle.workerCount = l.at("worker_count").get<int>();
  c.lifecycle.stateDirectory = l.at("state_directory").get<std::string>();

  const json &o = j.at("ocr");
  c.ocr.language = o.at("language").get<std::string>();
  c.ocr.tessDataPath = o.at("tess_data_path").get<std::string>();
  c.ocr.pageSegMode = o.at("page_seg_mode").get<int>();
  return c;
}

std::string validate(const PipelineConfig &c) {
  const MatcherConfig &m = c.matcher;
  if (m.partialMatchThreshold < 0.0 || m.autoMatchThreshold > 1.0 ||
      m.partialMatchThreshold > m.autoMatchThreshold) {
    return "matcher thresholds must satisfy 0 <= partial <= auto <= 1";
  }
  if (m.zoneCountWeight < 0.0 || m.contentRatioWeight < 0.0 ||
      m.zoneGeometryWeight < 0.0 ||
      std::abs(m.zoneCountWeight + m.contentRatioWeight +
               m.zoneGeometryWeight - 1.0) > 1e-6) {
    return "matcher weights must be non-negative and sum to 1";
  }
  if (c.normalizer.gaussianBlockSize < 3 ||
      c.normalizer.gaussianBlockSize % 2 == 0) {
    return "normalizer.gaussian_block_size must be odd and >= 3";
  }
  if (c.normalizer.targetDpi <= 0.0 || c.normalizer.assumedSourceDpi <= 0.0) {
    return "normalizer DPI values must be positive";
  }
  if (c.validator.warningThreshold < 1) {
    return "validator.warning_threshold must be >= 1";
  }
  return "";
}

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

// Converts an environment string to the JSON type of the value it replaces.
json convertLike(const std::string &value, const json &original) {
  if (original.is_boolean()) {
    std::string lower = lowercase(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
  }
  if (original.is_number_integer()) {
    return std::stol(value);
  }
  if (original.is_number()) {
    return std::stod(value);
  }
  if (original.is_array()) {
    json list = json::array();
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
      if (!item.empty()) {
        list.push_back(item);
      }
    }
    return list;
  }
  return value;
}

int applyOverrides(json &j) {
  const std::string prefix = "DOCINTEL_";
  int applied = 0;

  for (char **env = environ; env != nullptr && *env != nullptr; ++env) {
    std::string entry = *env;
    if (entry.rfind(prefix, 0) != 0) {
      continue;
    }
    size_t eq = entry.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    std::string name =
        lowercase(entry.substr(prefix.size(), eq - prefix.size()));
    std::string value = entry.substr(eq + 1);

    size_t sep = name.find('_');
    if (sep == std::string::npos) {
      continue;
    }
    std::string section = name.substr(0, sep);
    std::string key = name.substr(sep + 1);

    if (!j.contains(section) || !j[section].is_object() ||
        !j[section].contains(key)) {
      continue;
    }

    try {
      j[section][key] = convertLike(value, j[section][key]);
      applied++;
    } catch (const std::exception &e) {
      std::cerr << "[ConfigLoader] Warning: ignoring " << entry.substr(0, eq)
                << ": " << e.what() << std::endl;
    }
  }
  return applied;
}

} // namespace

ConfigLoadResult ConfigLoader::load(const std::string &path) {
  ConfigLoadResult result;

  if (!std::filesystem::exists(path)) {
    result.errorMessage = "Config file not found: " + path;
    return result;
  }

  std::ifstream in(path);
  if (!in.is_open()) {
    result.errorMessage = "Failed to open config file: " + path;
    return result;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

ConfigLoadResult ConfigLoader::parse(const std::string &jsonText) {
  ConfigLoadResult result;

  try {
    json file = json::parse(jsonText);
    if (!file.is_object()) {
      result.errorMessage = "Config root must be a JSON object";
      return result;
    }

    json merged = sectionsToJson(PipelineConfig());
    for (auto it = file.begin(); it != file.end(); ++it) {
      if (!merged.contains(it.key())) {
        std::cerr << "[ConfigLoader] Warning: unknown section '" << it.key()
                  << "'" << std::endl;
        continue;
      }
      if (it.value().is_object()) {
        merged[it.key()].update(it.value());
      } else {
        merged[it.key()] = it.value();
      }
    }

    applyOverrides(merged);
    PipelineConfig config = sectionsFromJson(merged);

    std::string problem = validate(config);
    if (!problem.empty()) {
      result.errorMessage = "Invalid configuration: " + problem;
      return result;
    }

    result.config = config;
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Failed to parse configuration: ") +
                          e.what();
  }

  return result;
}

int ConfigLoader::applyEnvironmentOverrides(PipelineConfig &config) {
  json merged = sectionsToJson(config);
  int applied = applyOverrides(merged);
  if (applied == 0) {
    return 0;
  }

  try {
    PipelineConfig updated = sectionsFromJson(merged);
    std::string problem = validate(updated);
    if (!problem.empty()) {
      std::cerr << "[ConfigLoader] Warning: environment overrides rejected: "
                << problem << std::endl;
      return 0;
    }
    config = updated;
  } catch (const std::exception &e) {
    std::cerr << "[ConfigLoader] Warning: environment overrides rejected: "
              << e.what() << std::endl;
    return 0;
  }
  return applied;
}

} // namespace docintel
