#pragma once

#include "credit/config/ledger_config.hpp"

#include <string>

namespace credit {
namespace config {

// -----------------------------------------------------------------------------
// parseConfig(json_text) / loadConfig(path)
// -----------------------------------------------------------------------------
//
// @brief  Builds an AppConfig from a JSON document.
//
// @details
// Expected layout (every key optional, defaults from ledger_config.hpp):
//
//   {
//     "ledger":     { "admin": "...", "treasury": "...",
//                     "custody_account": "...",
//                     "origination_fee_bps": 0, "protocol_fee_bps": 0,
//                     "default_bounty_bps": 0, "min_duration_s": 86400,
//                     "max_duration_s": 31536000, "grace_period_s": 0 },
//     "risk":       { "max_ratio_bps": 15000, "score_free": 800,
//                     "no_collateral_ceiling": 0, "require_proof": false,
//                     "collateral_assets": ["WETH"] },
//     "interest":   { "apr_bps": 1000, "penalty_apr_bps": 2500 },
//     "reputation": { "score_step": 50, "max_score": 1000, "strict": false },
//     "ipc":        { "cmd_endpoint": "...", "pub_endpoint": "..." },
//     "sim_start_s": 0
//   }
//
// Unknown keys are ignored. Malformed JSON, a value of the wrong type, or
// an inconsistent combination (fee above 10000 bps, min > max duration,
// empty address) throws LedgerError(InvalidInput, InvalidConfig).
// -----------------------------------------------------------------------------
AppConfig parseConfig(const std::string& json_text);

AppConfig loadConfig(const std::string& path);

// Each throws LedgerError(InvalidInput, InvalidConfig) if cfg is
// inconsistent.
void validate(const LedgerConfig& cfg);
void validate(const RiskPolicyConfig& cfg);
void validate(const AppConfig& cfg);

}  // namespace config
}  // namespace credit
