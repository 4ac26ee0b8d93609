#ifndef REPORT_JSON_HPP_
#define REPORT_JSON_HPP_

#include "../reconciliation/reconciliation_orchestrator.hpp"
#include "../reconciliation_errors.hpp"
#include "../reconciliation_types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace payrecon {
namespace serialization {

/**
 * Obligations and counterparty history read from a JSON file.
 *
 * Accepted layouts: a bare array of obligations, or an object
 *   { "obligations": [...], "history": { "<counterparty_id>": [...] } }
 * Obligation keys: id, counterparty_id, counterparty_name, expected_amount,
 * currency, due_date (YYYY-MM-DD), wire_reference (optional), status
 * (optional, default AWAITING_PAYMENT). History entries: id, amount,
 * status, occurred_at (seconds since the epoch).
 */
struct ObligationBook {
  std::vector<Obligation> obligations;
  std::map<std::string, std::vector<PriorTransaction>> history;
};

/**
 * Throws ReconciliationError(INVALID_INPUT) on malformed input.
 */
ObligationBook parseObligationBook(const std::string& json_text);

nlohmann::json toJson(const MatchResult& match);
nlohmann::json toJson(const FraudAssessment& assessment);
nlohmann::json toJson(const Discrepancy& discrepancy);
nlohmann::json toJson(const reconciliation::ReconciliationReport& report);
nlohmann::json toJson(const reconciliation::WireReconciliation& wire);
nlohmann::json toJson(const ErrorInfo& error);

}  // namespace serialization
}  // namespace payrecon

#endif  // REPORT_JSON_HPP_
