#include "credit/config/config_loader.hpp"
#include "credit/errors/ledger_error.hpp"
#include "credit/math/mul_div.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace credit {
namespace config {

namespace {

// Copies j[key] into out if present. at()/get() throw
// nlohmann::json::type_error on a mismatched type, which parseConfig()
// turns into InvalidConfig.
template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  if (j.contains(key)) {
    out = j.at(key).get<T>();
  }
}

void checkBps(std::uint64_t value, const char* name) {
  if (value > kBpsDenominator) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      std::string(name) + " must be <= 10000 bps");
  }
}

void checkAddress(const domain::Address& addr, const char* name) {
  if (addr.empty()) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      std::string(name) + " must not be empty");
  }
}

}  // namespace

void validate(const LedgerConfig& cfg) {
  checkAddress(cfg.admin, "ledger.admin");
  checkAddress(cfg.treasury, "ledger.treasury");
  checkAddress(cfg.custody_account, "ledger.custody_account");
  checkBps(cfg.origination_fee_bps, "ledger.origination_fee_bps");
  checkBps(cfg.protocol_fee_bps, "ledger.protocol_fee_bps");
  checkBps(cfg.default_bounty_bps, "ledger.default_bounty_bps");

  if (cfg.min_duration_s == 0 || cfg.min_duration_s > cfg.max_duration_s) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      "ledger duration bounds must satisfy 0 < min <= max");
  }
}

void validate(const RiskPolicyConfig& cfg) {
  if (cfg.score_free == 0 && cfg.max_ratio_bps != 0) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      "risk.score_free must be > 0");
  }
}

void validate(const AppConfig& cfg) {
  validate(cfg.ledger);
  validate(cfg.risk);
}

AppConfig parseConfig(const std::string& json_text) {
  AppConfig cfg;

  try {
    auto root = nlohmann::json::parse(json_text);

    if (root.contains("ledger")) {
      const auto& j = root.at("ledger");
      readIfPresent(j, "admin", cfg.ledger.admin);
      readIfPresent(j, "treasury", cfg.ledger.treasury);
      readIfPresent(j, "custody_account", cfg.ledger.custody_account);
      readIfPresent(j, "origination_fee_bps", cfg.ledger.origination_fee_bps);
      readIfPresent(j, "protocol_fee_bps", cfg.ledger.protocol_fee_bps);
      readIfPresent(j, "default_bounty_bps", cfg.ledger.default_bounty_bps);
      readIfPresent(j, "min_duration_s", cfg.ledger.min_duration_s);
      readIfPresent(j, "max_duration_s", cfg.ledger.max_duration_s);
      readIfPresent(j, "grace_period_s", cfg.ledger.grace_period_s);
    }

    if (root.contains("risk")) {
      const auto& j = root.at("risk");
      readIfPresent(j, "max_ratio_bps", cfg.risk.max_ratio_bps);
      readIfPresent(j, "score_free", cfg.risk.score_free);
      readIfPresent(j, "no_collateral_ceiling", cfg.risk.no_collateral_ceiling);
      readIfPresent(j, "require_proof", cfg.risk.require_proof);
      readIfPresent(j, "collateral_assets", cfg.risk.collateral_assets);
    }

    if (root.contains("interest")) {
      const auto& j = root.at("interest");
      readIfPresent(j, "apr_bps", cfg.interest.apr_bps);
      readIfPresent(j, "penalty_apr_bps", cfg.interest.penalty_apr_bps);
    }

    if (root.contains("reputation")) {
      const auto& j = root.at("reputation");
      readIfPresent(j, "score_step", cfg.reputation.score_step);
      readIfPresent(j, "max_score", cfg.reputation.max_score);
      readIfPresent(j, "strict", cfg.reputation.strict);
    }

    if (root.contains("ipc")) {
      const auto& j = root.at("ipc");
      readIfPresent(j, "cmd_endpoint", cfg.ipc_cmd_endpoint);
      readIfPresent(j, "pub_endpoint", cfg.ipc_pub_endpoint);
    }

    readIfPresent(root, "sim_start_s", cfg.sim_start_s);

  } catch (const nlohmann::json::exception& e) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      std::string("config JSON: ") + e.what());
  }

  validate(cfg);
  return cfg;
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw LedgerError(ErrorKind::InvalidInput, ErrorCode::InvalidConfig,
                      "cannot open config file " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  std::cout << "[Config] loaded " << path << "\n";
  return parseConfig(buffer.str());
}

}  // namespace config
}  // namespace credit
