#include "matching/obligation_matcher.hpp"
#include "matching/string_similarity.hpp"
#include "parsing/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_set>

namespace payrecon {
namespace matching {

namespace {

constexpr double kAmountEpsilon = 1e-9;

// Lower-case and strip surrounding punctuation, so "Corp." matches "corp".
std::string normalizeToken(const std::string& token) {
  auto isWordChar = [](unsigned char c) { return std::isalnum(c) != 0; };
  auto begin = std::find_if(token.begin(), token.end(), isWordChar);
  auto end = std::find_if(token.rbegin(), token.rend(), isWordChar).base();
  if (begin >= end) return "";
  return parsing::toLower(std::string(begin, end));
}

std::vector<std::string> normalizedTokens(const std::string& text) {
  std::vector<std::string> tokens;
  for (const auto& raw : parsing::splitWhitespace(text)) {
    std::string token = normalizeToken(raw);
    if (!token.empty()) tokens.push_back(std::move(token));
  }
  return tokens;
}

bool hasText(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

}  // namespace

double nameTokenOverlap(const std::string& counterparty_name, const std::string& text) {
  const auto name_tokens = normalizedTokens(counterparty_name);
  if (name_tokens.empty()) return 0.0;

  const auto text_tokens = normalizedTokens(text);
  const std::unordered_set<std::string> present(text_tokens.begin(), text_tokens.end());

  size_t found = 0;
  for (const auto& token : name_tokens) {
    if (present.count(token)) ++found;
  }
  return static_cast<double>(found) / static_cast<double>(name_tokens.size());
}

ObligationMatcher::ObligationMatcher(config::MatcherConfig config)
    : config_(std::move(config)) {
}

MatchResult ObligationMatcher::match(const WireMessage& message,
                                     const std::vector<Obligation>& candidates) const {
  MatchInput input;
  if (!message.sender_reference.empty()) input.reference = message.sender_reference;
  input.amount = message.amount;
  input.date = message.value_date;
  input.currency = message.currency;
  input.date_window_days = config_.wire_date_window_days;
  input.text = message.remittance_info;
  return matchInput(input, candidates);
}

MatchResult ObligationMatcher::match(const StatementTransaction& transaction,
                                     const std::vector<Obligation>& candidates) const {
  MatchInput input;
  if (hasText(transaction.reference)) input.reference = transaction.reference;
  input.amount = transaction.amount;
  input.date = transaction.date;
  input.date_window_days = config_.statement_date_window_days;
  input.text = transaction.description;
  return matchInput(input, candidates);
}

Result<MatchResult> ObligationMatcher::tryMatch(const WireMessage& message,
                                                const std::vector<Obligation>& candidates) const {
  try {
    return match(message, candidates);
  } catch (const ReconciliationError& e) {
    return ErrorInfo::from(e);
  } catch (const std::exception& e) {
    return ErrorInfo{ErrorCode::INTERNAL, e.what()};
  }
}

Result<MatchResult> ObligationMatcher::tryMatch(const StatementTransaction& transaction,
                                                const std::vector<Obligation>& candidates) const {
  try {
    return match(transaction, candidates);
  } catch (const ReconciliationError& e) {
    return ErrorInfo::from(e);
  } catch (const std::exception& e) {
    return ErrorInfo{ErrorCode::INTERNAL, e.what()};
  }
}

MatchResult ObligationMatcher::matchInput(const MatchInput& input,
                                          const std::vector<Obligation>& candidates) const {
  std::vector<const Obligation*> open;
  open.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    if (candidate.isOpen()) open.push_back(&candidate);
  }

  if (auto result = matchByReference(input, open)) return *result;
  if (auto result = matchByAmountAndDate(input, open)) return *result;
  if (auto result = matchFuzzy(input, open)) return *result;
  return MatchResult::none();
}

std::optional<MatchResult> ObligationMatcher::matchByReference(
    const MatchInput& input, const std::vector<const Obligation*>& open) const {
  if (!input.reference) return std::nullopt;

  std::vector<const Obligation*> hits;
  for (const Obligation* candidate : open) {
    if (candidate->wire_reference && *candidate->wire_reference == *input.reference) {
      hits.push_back(candidate);
    }
  }
  if (hits.empty()) return std::nullopt;

  const Obligation* best = hits.front();
  double best_diff = std::fabs(best->expected_amount - input.amount);
  size_t tied = 1;
  for (size_t i = 1; i < hits.size(); ++i) {
    double diff = std::fabs(hits[i]->expected_amount - input.amount);
    if (diff < best_diff - kAmountEpsilon) {
      best = hits[i];
      best_diff = diff;
      tied = 1;
    } else if (std::fabs(diff - best_diff) <= kAmountEpsilon) {
      ++tied;
    }
  }

  if (tied > 1) {
    throw AmbiguousMatchError(std::to_string(tied) + " obligations share wire reference '" +
                              *input.reference + "' with the same amount difference");
  }

  MatchResult result;
  result.obligation_id = best->id;
  result.confidence = 1.0;
  result.strategy = MatchStrategy::REFERENCE;
  return result;
}

std::optional<MatchResult> ObligationMatcher::matchByAmountAndDate(
    const MatchInput& input, const std::vector<const Obligation*>& open) const {
  const Obligation* best = nullptr;
  long best_days = 0;
  double best_diff = 0.0;

  for (const Obligation* candidate : open) {
    if (!amountWithinTolerance(candidate->expected_amount, input.amount)) continue;
    if (input.currency && candidate->currency != *input.currency) continue;

    long days = std::labs(daysBetween(candidate->due_date, input.date));
    if (days > input.date_window_days) continue;

    double diff = std::fabs(candidate->expected_amount - input.amount);
    if (!best || days < best_days || (days == best_days && diff < best_diff - kAmountEpsilon)) {
      best = candidate;
      best_days = days;
      best_diff = diff;
    }
  }

  if (!best) return std::nullopt;

  MatchResult result;
  result.obligation_id = best->id;
  result.confidence = config_.amount_date_confidence;
  result.strategy = MatchStrategy::AMOUNT_DATE;
  return result;
}

std::optional<MatchResult> ObligationMatcher::matchFuzzy(
    const MatchInput& input, const std::vector<const Obligation*>& open) const {
  const Obligation* best = nullptr;
  double best_score = 0.0;

  for (const Obligation* candidate : open) {
    double score = fuzzyScore(*candidate, input.amount, input.text, input.reference);
    if (score > best_score) {
      best = candidate;
      best_score = score;
    }
  }

  if (!best || best_score <= config_.fuzzy_acceptance_threshold) {
    return std::nullopt;
  }

  MatchResult result;
  result.obligation_id = best->id;
  result.confidence = std::min(1.0, best_score);
  result.strategy = MatchStrategy::FUZZY;
  return result;
}

double ObligationMatcher::fuzzyScore(const Obligation& candidate, double amount,
                                     const std::string& text,
                                     const std::optional<std::string>& reference) const {
  double score = 0.0;

  if (std::fabs(candidate.expected_amount - amount) < config_.exact_amount_tolerance) {
    score += config_.fuzzy_amount_weight;
  }

  score += nameTokenOverlap(candidate.counterparty_name, text) * config_.fuzzy_name_weight;

  if (hasText(candidate.wire_reference) && hasText(reference)) {
    score += similarity(*candidate.wire_reference, *reference) * config_.fuzzy_reference_weight;
  }

  return score;
}

bool ObligationMatcher::amountWithinTolerance(double expected, double amount) const {
  return std::fabs(expected - amount) <= std::fabs(amount) * config_.amount_tolerance_ratio + kAmountEpsilon;
}

MatchResult matchTransaction(const WireMessage& message,
                             const std::vector<Obligation>& candidates) {
  return ObligationMatcher().match(message, candidates);
}

MatchResult matchTransaction(const StatementTransaction& transaction,
                             const std::vector<Obligation>& candidates) {
  return ObligationMatcher().match(transaction, candidates);
}

}  // namespace matching
}  // namespace payrecon
