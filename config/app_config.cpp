#include "config/app_config.hpp"
#include "reconciliation_errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace payrecon {
namespace config {

using nlohmann::json;

namespace {

void readMatcher(const json& j, MatcherConfig& c) {
  c.amount_tolerance_ratio = j.value("amount_tolerance_ratio", c.amount_tolerance_ratio);
  c.statement_date_window_days = j.value("statement_date_window_days", c.statement_date_window_days);
  c.wire_date_window_days = j.value("wire_date_window_days", c.wire_date_window_days);
  c.amount_date_confidence = j.value("amount_date_confidence", c.amount_date_confidence);
  c.exact_amount_tolerance = j.value("exact_amount_tolerance", c.exact_amount_tolerance);
  c.fuzzy_amount_weight = j.value("fuzzy_amount_weight", c.fuzzy_amount_weight);
  c.fuzzy_name_weight = j.value("fuzzy_name_weight", c.fuzzy_name_weight);
  c.fuzzy_reference_weight = j.value("fuzzy_reference_weight", c.fuzzy_reference_weight);
  c.fuzzy_acceptance_threshold = j.value("fuzzy_acceptance_threshold", c.fuzzy_acceptance_threshold);
}

void readFraud(const json& j, FraudConfig& c) {
  c.velocity_window_hours = j.value("velocity_window_hours", c.velocity_window_hours);
  c.velocity_max_transactions = j.value("velocity_max_transactions", c.velocity_max_transactions);
  c.velocity_weight = j.value("velocity_weight", c.velocity_weight);
  c.amount_deviation_ratio = j.value("amount_deviation_ratio", c.amount_deviation_ratio);
  c.amount_deviation_weight = j.value("amount_deviation_weight", c.amount_deviation_weight);
  c.overdue_days = j.value("overdue_days", c.overdue_days);
  c.overdue_weight = j.value("overdue_weight", c.overdue_weight);
  c.large_amount_threshold = j.value("large_amount_threshold", c.large_amount_threshold);
  c.first_time_large_weight = j.value("first_time_large_weight", c.first_time_large_weight);
  c.failed_attempts_max = j.value("failed_attempts_max", c.failed_attempts_max);
  c.failed_attempts_weight = j.value("failed_attempts_weight", c.failed_attempts_weight);
  c.review_threshold = j.value("review_threshold", c.review_threshold);
}

void readOrchestrator(const json& j, OrchestratorConfig& c) {
  c.statement_id = j.value("statement_id", c.statement_id);
  c.statement_currency = j.value("statement_currency", c.statement_currency);
  c.candidate_window_days = j.value("candidate_window_days", c.candidate_window_days);
  c.history_window_days = j.value("history_window_days", c.history_window_days);
  c.match_workers = j.value("match_workers", c.match_workers);
  c.assess_fraud = j.value("assess_fraud", c.assess_fraud);
}

void readDatabase(const json& j, DatabaseConfig& c) {
  c.enabled = j.value("enabled", c.enabled);
  c.host = j.value("host", c.host);
  c.port = j.value("port", c.port);
  c.database = j.value("database", c.database);
  c.username = j.value("username", c.username);
  c.password = j.value("password", c.password);
  c.connection_timeout = j.value("connection_timeout", c.connection_timeout);
  c.schema_path = j.value("schema_path", c.schema_path);
}

void validate(const AppConfig& config) {
  const auto& m = config.matcher;
  if (m.amount_tolerance_ratio < 0.0) {
    throw ConfigError("matcher.amount_tolerance_ratio must not be negative");
  }
  if (m.statement_date_window_days < 0 || m.wire_date_window_days < 0) {
    throw ConfigError("matcher date windows must not be negative");
  }
  if (m.fuzzy_acceptance_threshold < 0.0 || m.fuzzy_acceptance_threshold > 1.0) {
    throw ConfigError("matcher.fuzzy_acceptance_threshold must be within [0, 1]");
  }
  if (m.amount_date_confidence < 0.0 || m.amount_date_confidence > 1.0) {
    throw ConfigError("matcher.amount_date_confidence must be within [0, 1]");
  }
  if (config.orchestrator.match_workers == 0) {
    throw ConfigError("orchestrator.match_workers must be at least 1");
  }
  if (config.orchestrator.candidate_window_days < 0) {
    throw ConfigError("orchestrator.candidate_window_days must not be negative");
  }
}

}  // namespace

AppConfig parseConfig(const std::string& json_text) {
  AppConfig config;
  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw ConfigError("configuration root must be a JSON object");
    }

    if (root.contains("matcher")) readMatcher(root.at("matcher"), config.matcher);
    if (root.contains("fraud")) readFraud(root.at("fraud"), config.fraud);
    if (root.contains("orchestrator")) readOrchestrator(root.at("orchestrator"), config.orchestrator);
    if (root.contains("database")) readDatabase(root.at("database"), config.database);
    if (root.contains("logging")) {
      config.logging.level = root.at("logging").value("level", config.logging.level);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid configuration: ") + e.what());
  }

  validate(config);
  return config;
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace config
}  // namespace payrecon
