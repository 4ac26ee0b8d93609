#ifndef WIRE_MESSAGE_PARSER_HPP_
#define WIRE_MESSAGE_PARSER_HPP_

#include "../reconciliation_types.hpp"
#include "../reconciliation_errors.hpp"

#include <string>
#include <vector>

namespace payrecon {
namespace parsing {

/**
 * Decoder for MT103-style single customer credit transfer messages.
 *
 * Fields are located line by line: the first line containing a tag marker
 * (":20:", ":32A:", ...) supplies the field, taken from after the marker to
 * end of line and trimmed. Only the sender reference (:20:) and the
 * value date / currency / amount block (:32A:) are required; every other
 * field defaults to empty.
 *
 * Stateless; safe to share between threads.
 */
class WireMessageParser {
 public:
  /**
   * Parse raw message text. Throws MalformedMessageError when a required
   * tag is missing or :32A: cannot be decoded positionally.
   */
  WireMessage parse(const std::string& raw) const;

  /**
   * Same as parse() but reports failure as an error value.
   */
  Result<WireMessage> tryParse(const std::string& raw) const;

 private:
  struct ValueBlock {
    Date value_date;
    std::string currency;
    double amount;
  };

  static std::optional<std::string> findField(const std::vector<std::string>& lines,
                                              const std::string& tag);
  static std::string findFirstField(const std::vector<std::string>& lines,
                                    const std::vector<std::string>& tags);
  static ValueBlock decodeValueBlock(const std::string& block);
};

// Free-function form of WireMessageParser::parse().
WireMessage parseWireMessage(const std::string& raw);

}  // namespace parsing
}  // namespace payrecon

#endif  // WIRE_MESSAGE_PARSER_HPP_
