#include "tradekernel/config/kernel_config.hpp"
#include "tradekernel/domain/errors.hpp"

#include <fstream>

namespace tradekernel {

namespace {

constexpr const char* kConfig = "KernelConfig";

domain::PositionProfile parseProfile(const nlohmann::json& value) {
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    if (text == "extended") {
      return domain::PositionProfile::Extended;
    }
    if (text == "basic") {
      return domain::PositionProfile::Basic;
    }
  }
  throw InvalidValueError(kConfig,
                          "position_profile must be \"basic\" or \"extended\"",
                          value.dump());
}

domain::LiquidityMode parseLiquidityMode(const nlohmann::json& value) {
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    if (text == "partial") {
      return domain::LiquidityMode::Partial;
    }
    if (text == "strict") {
      return domain::LiquidityMode::Strict;
    }
  }
  throw InvalidValueError(kConfig,
                          "liquidity_mode must be \"partial\" or \"strict\"",
                          value.dump());
}

}  // namespace

// -----------------------------------------------------------------------------
// parseKernelConfig(): defaults for absent keys, validation for present ones
// -----------------------------------------------------------------------------
KernelConfig parseKernelConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw InvalidValueError(kConfig, "Document must be a JSON object",
                            document.dump());
  }

  KernelConfig config;

  if (auto it = document.find("position_profile"); it != document.end()) {
    config.position_profile = parseProfile(*it);
  }
  if (auto it = document.find("liquidity_mode"); it != document.end()) {
    config.liquidity_mode = parseLiquidityMode(*it);
  }
  if (auto it = document.find("depth_levels"); it != document.end()) {
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
      throw InvalidValueError(kConfig,
                              "depth_levels must be a positive integer",
                              it->dump());
    }
    config.depth_levels = it->get<std::size_t>();
  }
  if (auto it = document.find("display_decimals"); it != document.end()) {
    if (!it->is_number_integer() || it->get<long long>() < 0 ||
        it->get<long long>() > 18) {
      throw InvalidValueError(kConfig,
                              "display_decimals must be an integer in 0..18",
                              it->dump());
    }
    config.display_decimals = it->get<int>();
  }

  return config;
}

KernelConfig loadKernelConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidValueError(kConfig, "Cannot open config file", path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidValueError(kConfig, std::string("Malformed JSON: ") + e.what(),
                            path);
  }
  return parseKernelConfig(document);
}

}  // namespace tradekernel
