#pragma once

#include <nostr/protocol.hpp>
#include <nostr/signer.hpp>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace gift_relay::nostr {

/**
 * @brief Unsigned inner message of a gift wrap (NIP-59 rumor).
 *
 * The id is the event id of the other fields; a rumor whose id does not match is
 * treated as forged.
 */
struct rumor
{
  std::string id;
  std::string pubkey;///< Author
  std::uint64_t created_at{};
  protocol::kind kind{ protocol::kind::chat_message };
  protocol::tag_list tags;
  std::string content;

  /// @return std::nullopt if a field is missing or mistyped
  static auto from_json(const nlohmann::json &json_obj) -> std::optional<rumor>;

  static auto deserialize(const std::string &json) -> std::optional<rumor>;

  [[nodiscard]] auto to_json() const -> nlohmann::json;

  [[nodiscard]] auto serialize() const -> std::string;

  /// Pubkeys of every "p" tag
  [[nodiscard]] auto recipients() const -> std::vector<std::string>;

  auto operator==(const rumor &) const -> bool = default;
};

/**
 * @brief Event id of the rumor's canonical form.
 */
[[nodiscard]] auto compute_rumor_id(const rumor &unsigned_event) -> std::string;

/**
 * @brief Builds a rumor stamped with the current time.
 *
 * Tags are ["p", recipient], then ["e", reply_to, "", "reply"] for replies, then
 * @p extra_tags.
 *
 * @throws std::invalid_argument if the content or a tag is not valid UTF-8
 */
[[nodiscard]] auto make_rumor(const std::string &sender,
  const std::string &recipient,
  std::string content,
  protocol::kind kind = protocol::kind::chat_message,
  const std::optional<std::string> &reply_to = std::nullopt,
  const protocol::tag_list &extra_tags = {}) -> rumor;

/**
 * @brief Seals a rumor with the sender's identity and wraps it for one recipient.
 *
 * The seal is signed by @p backend; the wrap by a fresh ephemeral key. Both carry
 * independently randomized timestamps from the past 48 hours.
 *
 * @param unsigned_event Rumor authored by the backend's identity
 * @param recipient_pubkey Hex x-only public key the wrap is addressed to
 * @param backend Sender's signing provider
 * @return Signed kind 1059 event
 * @throws capability_error if the backend cannot encrypt
 * @throws crypto::crypto_error if the recipient key is malformed
 */
[[nodiscard]] auto wrap(const rumor &unsigned_event, const std::string &recipient_pubkey, const signing_backend &backend)
  -> protocol::event_data;

/**
 * @brief Opens a gift wrap addressed to the backend's identity.
 *
 * Any decryption, parsing or authenticity failure yields std::nullopt; the failure is
 * logged at debug level.
 *
 * @throws capability_error if the backend cannot decrypt
 */
[[nodiscard]] auto unwrap(const protocol::event_data &wrap_event, const signing_backend &backend)
  -> std::optional<rumor>;

/**
 * @brief Order-independent id of a participant set: sorted unique pubkeys joined by '+'.
 */
[[nodiscard]] auto get_conversation_id(const std::string &my_pubkey, const std::vector<std::string> &p_tags)
  -> std::string;

/// Conversation id of a rumor: its author plus every "p" tag
[[nodiscard]] auto get_conversation_id(const rumor &unsigned_event) -> std::string;

}// namespace gift_relay::nostr
