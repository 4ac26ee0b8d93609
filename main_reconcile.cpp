#include "config/app_config.hpp"
#include "database/postgres_obligation_store.hpp"
#include "observability/logger.hpp"
#include "parsing/statement_extractor.hpp"
#include "reconciliation/in_memory_obligation_store.hpp"
#include "reconciliation/reconciliation_orchestrator.hpp"
#include "serialization/report_json.hpp"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

std::atomic<bool> cancel_requested{false};

void signalHandler(int) {
  cancel_requested = true;
}

void printUsage(const char* program) {
  std::cerr << "Usage:\n"
            << "  " << program << " statement <statement.txt> <obligations.json|-> [config.json]\n"
            << "  " << program << " wire <message.txt> <obligations.json|-> [config.json]\n"
            << "Pass '-' for obligations to read them from PostgreSQL (database.enabled)."
            << std::endl;
}

std::string readFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Could not open file: " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace payrecon;

  if (argc < 4) {
    printUsage(argv[0]);
    return 1;
  }

  const std::string mode = argv[1];
  const std::string input_path = argv[2];
  const std::string obligations_path = argv[3];

  if (mode != "statement" && mode != "wire") {
    printUsage(argv[0]);
    return 1;
  }

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  try {
    config::AppConfig app_config;
    if (argc >= 5) app_config = config::loadConfig(argv[4]);

    if (auto level = observability::logLevelFromString(app_config.logging.level)) {
      observability::Logger::getInstance().setLogLevel(*level);
    }

    // Storage: PostgreSQL when requested, otherwise the obligations file
    std::unique_ptr<reconciliation::InMemoryObligationStore> memory_store;
    std::unique_ptr<database::PostgresObligationStore> postgres_store;
    reconciliation::ObligationStore* store = nullptr;
    reconciliation::CounterpartyHistorySource* history = nullptr;

    if (obligations_path == "-") {
      if (!app_config.database.enabled) {
        std::cerr << "Obligations '-' requires database.enabled in the configuration" << std::endl;
        return 1;
      }
      auto conn = std::make_shared<database::PostgresConnection>(app_config.database);
      if (!conn->connect()) {
        std::cerr << "Failed to connect to " << conn->getConnectionInfo() << std::endl;
        return 1;
      }
      postgres_store = std::make_unique<database::PostgresObligationStore>(conn);
      if (!app_config.database.schema_path.empty() &&
          !postgres_store->initializeSchema(app_config.database.schema_path)) {
        std::cerr << "Failed to apply schema " << app_config.database.schema_path << std::endl;
        return 1;
      }
      store = postgres_store.get();
      history = postgres_store.get();
    } else {
      auto book = serialization::parseObligationBook(readFile(obligations_path));
      memory_store = std::make_unique<reconciliation::InMemoryObligationStore>(std::move(book.obligations));
      for (const auto& entry : book.history) {
        for (const auto& prior : entry.second) {
          memory_store->addHistory(entry.first, prior);
        }
      }
      store = memory_store.get();
      history = memory_store.get();
    }

    reconciliation::ReconciliationOrchestrator orchestrator(*store, history, app_config);
    reconciliation::ReconcileOptions options;
    options.cancel = &cancel_requested;

    if (mode == "statement") {
      parsing::PlainTextSource source;
      std::string text = parsing::loadStatementText(readFile(input_path), source);
      options.statement_id = input_path;

      auto report = orchestrator.reconcileWithStore(text, options);
      std::cout << serialization::toJson(report).dump(2) << std::endl;
      return report.cancelled ? 1 : 0;
    }

    auto result = orchestrator.reconcileWire(readFile(input_path), options);
    if (!result.ok()) {
      std::cout << serialization::toJson(result.error()).dump(2) << std::endl;
      // Malformed or ambiguous messages go to a human
      return result.error().code == ErrorCode::STORAGE_FAILURE ? 1 : 2;
    }
    std::cout << serialization::toJson(result.value()).dump(2) << std::endl;
    return 0;

  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::FATAL, "Reconciliation run failed")
        .field("error", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
