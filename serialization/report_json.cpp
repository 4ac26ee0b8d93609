#include "serialization/report_json.hpp"

#include <cstdio>

namespace payrecon {
namespace serialization {

using nlohmann::json;

namespace {

ReconciliationError invalidInput(const std::string& message) {
  return ReconciliationError(ErrorCode::INVALID_INPUT, "Invalid obligations file: " + message);
}

Date parseIsoDate(const std::string& value) {
  int y = 0, m = 0, d = 0;
  char trailing = 0;
  if (std::sscanf(value.c_str(), "%4d-%2d-%2d%c", &y, &m, &d, &trailing) == 3) {
    if (auto date = Date::fromYmd(y, m, d)) return *date;
  }
  throw invalidInput("bad date '" + value + "'");
}

Obligation readObligation(const json& j) {
  Obligation obligation;
  obligation.id = j.at("id").get<std::string>();
  obligation.counterparty_id = j.value("counterparty_id", std::string());
  obligation.counterparty_name = j.value("counterparty_name", std::string());
  obligation.expected_amount = j.at("expected_amount").get<double>();
  obligation.currency = j.value("currency", std::string());
  obligation.due_date = parseIsoDate(j.at("due_date").get<std::string>());

  if (j.contains("wire_reference") && !j["wire_reference"].is_null()) {
    obligation.wire_reference = j["wire_reference"].get<std::string>();
  }

  std::string status = j.value("status", std::string("AWAITING_PAYMENT"));
  auto parsed = obligationStatusFromString(status);
  if (!parsed) throw invalidInput("unknown status '" + status + "' for " + obligation.id);
  obligation.status = *parsed;
  return obligation;
}

PriorTransaction readPrior(const json& j) {
  PriorTransaction prior;
  prior.id = j.at("id").get<std::string>();
  prior.amount = j.at("amount").get<double>();

  std::string status = j.at("status").get<std::string>();
  auto parsed = paymentStatusFromString(status);
  if (!parsed) throw invalidInput("unknown payment status '" + status + "' for " + prior.id);
  prior.status = *parsed;

  prior.occurred_at = Timestamp(std::chrono::seconds(j.at("occurred_at").get<long long>()));
  return prior;
}

}  // namespace

ObligationBook parseObligationBook(const std::string& json_text) {
  ObligationBook book;
  try {
    json j = json::parse(json_text);
    const json& obligations = j.is_array() ? j : j.at("obligations");
    if (!obligations.is_array()) throw invalidInput("'obligations' must be an array");

    for (const auto& item : obligations) {
      book.obligations.push_back(readObligation(item));
    }

    if (j.is_object() && j.contains("history")) {
      for (const auto& entry : j["history"].items()) {
        auto& list = book.history[entry.key()];
        for (const auto& item : entry.value()) {
          list.push_back(readPrior(item));
        }
      }
    }
  } catch (const json::exception& e) {
    throw invalidInput(e.what());
  }
  return book;
}

json toJson(const MatchResult& match) {
  json j;
  j["strategy"] = toString(match.strategy);
  j["confidence"] = match.confidence;
  j["obligation_id"] = match.obligation_id ? json(*match.obligation_id) : json(nullptr);
  return j;
}

json toJson(const FraudAssessment& assessment) {
  json j;
  j["risk_score"] = assessment.risk_score;
  j["indicators"] = assessment.indicators;
  j["requires_manual_review"] = assessment.requires_manual_review;
  return j;
}

json toJson(const Discrepancy& discrepancy) {
  json j;
  j["date"] = discrepancy.transaction_date.toString();
  j["description"] = discrepancy.description;
  j["amount"] = discrepancy.amount;
  j["reason"] = discrepancy.reason;
  return j;
}

json toJson(const reconciliation::ReconciliationReport& report) {
  json j;
  j["matched_count"] = report.matched_count;
  j["unmatched_count"] = report.unmatched_count;
  j["transactions_extracted"] = report.transactions_extracted;
  j["credits_considered"] = report.credits_considered;
  j["cancelled"] = report.cancelled;

  j["discrepancies"] = json::array();
  for (const auto& d : report.discrepancies) {
    j["discrepancies"].push_back(toJson(d));
  }

  j["outcomes"] = json::array();
  for (const auto& outcome : report.outcomes) {
    json o;
    o["transaction_id"] = outcome.transaction_id;
    o["date"] = outcome.transaction.date.toString();
    o["description"] = outcome.transaction.description;
    o["amount"] = outcome.transaction.amount;
    if (outcome.transaction.reference) o["reference"] = *outcome.transaction.reference;
    if (outcome.match) o["match"] = toJson(*outcome.match);
    o["reconciled"] = outcome.reconciled;
    if (outcome.payment_status) o["payment_status"] = toString(*outcome.payment_status);
    if (outcome.fraud) o["fraud"] = toJson(*outcome.fraud);
    if (outcome.discrepancy_reason) o["discrepancy"] = *outcome.discrepancy_reason;
    j["outcomes"].push_back(o);
  }
  return j;
}

json toJson(const reconciliation::WireReconciliation& wire) {
  json message;
  message["sender_reference"] = wire.message.sender_reference;
  message["value_date"] = wire.message.value_date.toString();
  message["currency"] = wire.message.currency;
  message["amount"] = wire.message.amount;
  message["ordering_party"] = wire.message.ordering_party;
  message["beneficiary_party"] = wire.message.beneficiary_party;
  message["remittance_info"] = wire.message.remittance_info;

  json j;
  j["message"] = message;
  j["match"] = toJson(wire.match);
  j["reconciled"] = wire.reconciled;
  if (wire.payment_status) j["payment_status"] = toString(*wire.payment_status);
  if (wire.fraud) j["fraud"] = toJson(*wire.fraud);
  if (wire.discrepancy_reason) j["discrepancy"] = *wire.discrepancy_reason;
  return j;
}

json toJson(const ErrorInfo& error) {
  json j;
  j["error"] = toString(error.code);
  j["message"] = error.message;
  return j;
}

}  // namespace serialization
}  // namespace payrecon
