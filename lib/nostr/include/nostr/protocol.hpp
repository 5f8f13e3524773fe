#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gift_relay::nostr::protocol {

/**
 * @brief Nostr event kind identifiers used by private direct messages.
 *
 * Other kinds still parse; they simply have no named enumerator.
 */
enum class kind : std::uint16_t {
  reaction = 7,///< Reaction to a message (NIP-25)
  seal = 13,///< Sender-signed encrypted rumor (NIP-59)
  chat_message = 14,///< Private direct message rumor (NIP-17)
  gift_wrap = 1059,///< Ephemeral-key wrapper around a seal (NIP-59)
  inbox_relays = 10050,///< Relays a user reads direct messages from (NIP-17)
};

using tag_list = std::vector<std::vector<std::string>>;

/**
 * @brief Canonical form hashed into an event id: [0,pubkey,created_at,kind,tags,content].
 *
 * Compact JSON with UTF-8 left unescaped, matching JSON.stringify.
 *
 * @throws std::invalid_argument if the content or a tag is not valid UTF-8
 */
[[nodiscard]] auto canonical_serialization(std::string_view pubkey,
  std::uint64_t created_at,
  kind event_kind,
  const tag_list &tags,
  std::string_view content) -> std::string;

/// Lowercase hex SHA-256 of the canonical serialization
[[nodiscard]] auto compute_event_id(std::string_view pubkey,
  std::uint64_t created_at,
  kind event_kind,
  const tag_list &tags,
  std::string_view content) -> std::string;

/// Reads a kind number; std::nullopt unless it is an integer in [0, 65535]
[[nodiscard]] auto parse_kind(const nlohmann::json &kind_json) -> std::optional<kind>;

/// Parses a JSON array of string arrays; std::nullopt on any other shape
[[nodiscard]] auto parse_tags(const nlohmann::json &tags_json) -> std::optional<tag_list>;

/// First value of the first tag named @p name
[[nodiscard]] auto first_tag_value(const tag_list &tags, std::string_view name) -> std::optional<std::string>;

/// Values of every tag named @p name, in tag order
[[nodiscard]] auto tag_values(const tag_list &tags, std::string_view name) -> std::vector<std::string>;

/**
 * @brief Unsigned event content handed to a signer.
 */
struct event_template
{
  std::uint64_t created_at{};
  enum kind kind {};
  tag_list tags;
  std::string content;
};

/**
 * @brief Nostr event data structure.
 *
 * Represents a complete Nostr event with all required fields per NIP-01.
 */
struct event_data
{
  std::string id;///< Event ID (32-byte hex hash)
  std::string pubkey;///< Public key of event creator (32-byte hex)
  std::uint64_t created_at{};///< Unix timestamp
  enum kind kind {};///< Event kind identifier
  tag_list tags;///< Event tags (arbitrary string arrays)
  std::string content;///< Event content
  std::string sig;///< Schnorr signature (64-byte hex)

  /**
   * @brief Deserializes event data from JSON string.
   *
   * @param json JSON string
   * @return Parsed event_data or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<event_data>;

  /**
   * @brief Builds event data from an already parsed JSON object.
   *
   * @return Parsed event_data or std::nullopt if a field is missing or mistyped
   */
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<event_data>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  /// Compact JSON object form
  [[nodiscard]] auto serialize() const -> std::string;

  /// Recomputes the id from the other fields
  [[nodiscard]] auto compute_id() const -> std::string;

  /**
   * @brief Checks that the id matches the content and the signature matches the pubkey.
   */
  [[nodiscard]] auto verify() const -> bool;

  [[nodiscard]] auto first_tag(std::string_view name) const -> std::optional<std::string>
  {
    return first_tag_value(tags, name);
  }
};

/**
 * @brief Nostr OK response message.
 *
 * Sent by relays to indicate acceptance/rejection of a submitted event.
 */
struct ok
{
  std::string event_id;///< ID of the event this responds to
  bool accepted{};///< Whether the event was accepted
  std::string message;///< Human-readable status message

  /**
   * @brief Deserializes OK message from JSON.
   *
   * @param json JSON string in format ["OK", event_id, accepted, message]
   * @return Parsed ok or std::nullopt on failure
   */
  static auto deserialize(const std::string &json) -> std::optional<ok>;
};

/// Maximum allowed subscription ID length
constexpr std::size_t max_subscription_id_length = 64;

/**
 * @brief Validates a subscription ID.
 *
 * @param subscription_id ID to validate
 * @throws std::invalid_argument if ID is empty or exceeds maximum length
 */
inline auto validate_subscription_id(const std::string &subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("Subscription ID cannot be empty"); }
  if (subscription_id.length() > max_subscription_id_length) {
    throw std::invalid_argument("Subscription ID exceeds maximum length of 64 characters");
  }
}

}// namespace gift_relay::nostr::protocol
