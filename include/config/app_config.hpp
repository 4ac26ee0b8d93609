#ifndef APP_CONFIG_HPP_
#define APP_CONFIG_HPP_

#include <string>

namespace payrecon {
namespace config {

/**
 * Tolerances, windows and fuzzy weights used by the obligation matcher.
 * The fuzzy weights and acceptance threshold were chosen empirically and
 * should be validated against labelled historical matches.
 */
struct MatcherConfig {
  double amount_tolerance_ratio = 0.01;  // 1% of the transaction amount
  int statement_date_window_days = 1;
  int wire_date_window_days = 30;
  double amount_date_confidence = 0.95;

  double exact_amount_tolerance = 1.0;  // "exact" means within one unit
  double fuzzy_amount_weight = 0.5;
  double fuzzy_name_weight = 0.3;
  double fuzzy_reference_weight = 0.2;
  double fuzzy_acceptance_threshold = 0.7;  // strictly greater than
};

struct FraudConfig {
  int velocity_window_hours = 24;
  int velocity_max_transactions = 3;
  double velocity_weight = 0.30;

  double amount_deviation_ratio = 0.10;
  double amount_deviation_weight = 0.20;

  int overdue_days = 60;
  double overdue_weight = 0.15;

  double large_amount_threshold = 100000.0;
  double first_time_large_weight = 0.25;

  int failed_attempts_max = 2;
  double failed_attempts_weight = 0.10;

  double review_threshold = 0.5;
};

struct OrchestratorConfig {
  std::string statement_id = "statement";
  std::string statement_currency;  // empty: any currency
  int candidate_window_days = 60;
  int history_window_days = 365;
  size_t match_workers = 1;
  bool assess_fraud = true;
};

struct DatabaseConfig {
  bool enabled = false;
  std::string host = "localhost";
  int port = 5432;
  std::string database = "payrecon";
  std::string username = "payrecon";
  std::string password = "";
  int connection_timeout = 30;  // seconds
  std::string schema_path = "database/schema.sql";  // applied at startup; empty skips
};

struct LoggingConfig {
  std::string level = "INFO";
};

struct AppConfig {
  MatcherConfig matcher;
  FraudConfig fraud;
  OrchestratorConfig orchestrator;
  DatabaseConfig database;
  LoggingConfig logging;
};

/**
 * Parse configuration from JSON text. Absent keys keep their defaults.
 * Throws ConfigError on malformed JSON or mistyped values.
 */
AppConfig parseConfig(const std::string& json_text);

/**
 * Load configuration from a JSON file. Throws ConfigError if unreadable.
 */
AppConfig loadConfig(const std::string& path);

}  // namespace config
}  // namespace payrecon

#endif  // APP_CONFIG_HPP_
