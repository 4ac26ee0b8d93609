#include "parsing/wire_message_parser.hpp"
#include "parsing/text_utils.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace payrecon {
namespace parsing {

namespace {

const char kSenderReferenceTag[] = ":20:";
const char kValueBlockTag[] = ":32A:";
const char kRemittanceTag[] = ":70:";
const char kSenderToReceiverTag[] = ":72:";

const std::vector<std::string>& orderingPartyTags() {
  static const std::vector<std::string> tags{":50K:", ":50A:", ":50F:"};
  return tags;
}

const std::vector<std::string>& beneficiaryTags() {
  static const std::vector<std::string> tags{":59:", ":59A:", ":59F:"};
  return tags;
}

}  // namespace

WireMessage WireMessageParser::parse(const std::string& raw) const {
  const auto lines = splitLines(raw);

  auto reference = findField(lines, kSenderReferenceTag);
  if (!reference) {
    throw MalformedMessageError("Required field :20: not found in wire message");
  }
  auto value_block = findField(lines, kValueBlockTag);
  if (!value_block) {
    throw MalformedMessageError("Required field :32A: not found in wire message");
  }

  ValueBlock decoded = decodeValueBlock(*value_block);

  WireMessage message;
  message.sender_reference = *reference;
  message.value_date = decoded.value_date;
  message.currency = decoded.currency;
  message.amount = decoded.amount;
  message.ordering_party = findFirstField(lines, orderingPartyTags());
  message.beneficiary_party = findFirstField(lines, beneficiaryTags());
  message.remittance_info = findField(lines, kRemittanceTag).value_or("");
  message.sender_to_receiver_info = findField(lines, kSenderToReceiverTag).value_or("");
  return message;
}

Result<WireMessage> WireMessageParser::tryParse(const std::string& raw) const {
  try {
    return parse(raw);
  } catch (const MalformedMessageError& e) {
    return ErrorInfo::from(e);
  }
}

std::optional<std::string> WireMessageParser::findField(const std::vector<std::string>& lines,
                                                        const std::string& tag) {
  for (const auto& line : lines) {
    size_t pos = line.find(tag);
    if (pos != std::string::npos) {
      return trim(line.substr(pos + tag.size()));
    }
  }
  return std::nullopt;
}

std::string WireMessageParser::findFirstField(const std::vector<std::string>& lines,
                                              const std::vector<std::string>& tags) {
  for (const auto& tag : tags) {
    if (auto value = findField(lines, tag)) return *value;
  }
  return "";
}

WireMessageParser::ValueBlock WireMessageParser::decodeValueBlock(const std::string& block) {
  // YYMMDD + CCY + amount with ',' as the decimal mark, e.g. 251115USD500000,00
  if (block.size() < 10) {
    throw MalformedMessageError(":32A: field too short: '" + block + "'");
  }

  for (size_t i = 0; i < 6; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(block[i]))) {
      throw MalformedMessageError(":32A: value date must be YYMMDD: '" + block + "'");
    }
  }
  int yy = std::stoi(block.substr(0, 2));
  int mm = std::stoi(block.substr(2, 2));
  int dd = std::stoi(block.substr(4, 2));
  auto value_date = Date::fromYmd(2000 + yy, mm, dd);
  if (!value_date) {
    throw MalformedMessageError(":32A: invalid value date '" + block.substr(0, 6) + "'");
  }

  std::string currency = block.substr(6, 3);
  for (char c : currency) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      throw MalformedMessageError(":32A: currency must be three letters: '" + block + "'");
    }
  }

  std::string amount_text = trim(block.substr(9));
  for (char& c : amount_text) {
    if (c == ',') c = '.';
  }
  if (amount_text.empty()) {
    throw MalformedMessageError(":32A: amount missing: '" + block + "'");
  }

  errno = 0;
  char* end = nullptr;
  double amount = std::strtod(amount_text.c_str(), &end);
  if (end == amount_text.c_str() || *end != '\0' || errno == ERANGE ||
      !std::isfinite(amount)) {
    throw MalformedMessageError(":32A: amount is not a number: '" + amount_text + "'");
  }

  return ValueBlock{*value_date, currency, amount};
}

WireMessage parseWireMessage(const std::string& raw) {
  return WireMessageParser().parse(raw);
}

}  // namespace parsing
}  // namespace payrecon
