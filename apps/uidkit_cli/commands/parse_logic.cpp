#include "parse_logic.h"

#include "uidkit/snowflake/snowflake_layout.h"
#include "uidkit/ulid/ulid.h"

#include <nlohmann/json.hpp>

#include <iomanip>
#include <ostream>
#include <sstream>

int execute_parse_snowflake(std::int64_t id, std::int64_t epoch_ms, std::ostream& out) {
  const auto parts = uidkit::snowflake::parse_snowflake_id(id, epoch_ms);

  nlohmann::json j;
  j["id"] = id;
  j["timestamp_ms"] = parts.timestamp_ms;
  j["worker_id"] = parts.worker_id;
  j["sequence"] = parts.sequence;

  out << j.dump(2) << "\n";
  return 0;
}

int execute_parse_ulid(const std::string& text, std::ostream& out, std::ostream& err) {
  const auto id = uidkit::ulid::decode_ulid(text);
  if (!id.has_value()) {
    err << "Invalid ULID: '" << text << "'\n";
    return 1;
  }

  std::ostringstream entropy_hex;
  entropy_hex << std::hex << std::setfill('0');
  for (const auto byte : id->entropy()) {
    entropy_hex << std::setw(2) << static_cast<unsigned>(byte);
  }

  nlohmann::json j;
  j["ulid"] = uidkit::ulid::encode_ulid(*id);
  j["timestamp_ms"] = id->timestamp_ms();
  j["entropy_hex"] = entropy_hex.str();

  out << j.dump(2) << "\n";
  return 0;
}
