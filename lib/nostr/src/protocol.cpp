#include <nostr/protocol.hpp>

#include <crypto/digest.hpp>
#include <crypto/encoding.hpp>
#include <crypto/keys.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <limits>
#include <stdexcept>

namespace gift_relay::nostr::protocol {

auto canonical_serialization(std::string_view pubkey,
  std::uint64_t created_at,
  kind event_kind,
  const tag_list &tags,
  std::string_view content) -> std::string
{
  nlohmann::json canonical = nlohmann::json::array();
  canonical.push_back(0);
  canonical.push_back(std::string{ pubkey });
  canonical.push_back(created_at);
  canonical.push_back(static_cast<std::uint16_t>(event_kind));
  canonical.push_back(tags);
  canonical.push_back(std::string{ content });
  try {
    return canonical.dump();
  } catch (const nlohmann::json::type_error &e) {
    throw std::invalid_argument(fmt::format("Event is not valid UTF-8: {}", e.what()));
  }
}

auto compute_event_id(std::string_view pubkey,
  std::uint64_t created_at,
  kind event_kind,
  const tag_list &tags,
  std::string_view content) -> std::string
{
  return crypto::to_hex(crypto::sha256(canonical_serialization(pubkey, created_at, event_kind, tags, content)));
}

auto parse_kind(const nlohmann::json &kind_json) -> std::optional<kind>
{
  if (not kind_json.is_number_unsigned()) { return std::nullopt; }
  const auto value = kind_json.get<std::uint64_t>();
  if (value > std::numeric_limits<std::uint16_t>::max()) { return std::nullopt; }
  return static_cast<kind>(value);
}

auto parse_tags(const nlohmann::json &tags_json) -> std::optional<tag_list>
{
  if (not tags_json.is_array()) { return std::nullopt; }

  tag_list tags;
  tags.reserve(tags_json.size());
  for (const auto &tag_json : tags_json) {
    if (not tag_json.is_array()) { return std::nullopt; }
    std::vector<std::string> tag;
    for (const auto &element : tag_json) {
      if (not element.is_string()) { return std::nullopt; }
      tag.push_back(element.get<std::string>());
    }
    tags.push_back(std::move(tag));
  }
  return tags;
}

auto first_tag_value(const tag_list &tags, std::string_view name) -> std::optional<std::string>
{
  const auto found =
    std::ranges::find_if(tags, [name](const auto &tag) { return tag.size() >= 2 and tag.front() == name; });
  if (found == tags.end()) { return std::nullopt; }
  return (*found)[1];
}

auto tag_values(const tag_list &tags, std::string_view name) -> std::vector<std::string>
{
  std::vector<std::string> values;
  for (const auto &tag : tags) {
    if (tag.size() >= 2 and tag.front() == name) { values.push_back(tag[1]); }
  }
  return values;
}

auto event_data::deserialize(const std::string &json) -> std::optional<event_data>
{
  try {
    return from_json(nlohmann::json::parse(json));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto event_data::from_json(const nlohmann::json &json_obj) -> std::optional<event_data>
{
  try {
    if (not json_obj.is_object()) { return std::nullopt; }

    event_data event;

    if (not json_obj.contains("id") or not json_obj["id"].is_string()) { return std::nullopt; }
    event.id = json_obj["id"].get<std::string>();

    if (not json_obj.contains("pubkey") or not json_obj["pubkey"].is_string()) { return std::nullopt; }
    event.pubkey = json_obj["pubkey"].get<std::string>();

    if (not json_obj.contains("created_at") or not json_obj["created_at"].is_number_unsigned()) {
      return std::nullopt;
    }
    event.created_at = json_obj["created_at"].get<std::uint64_t>();

    if (not json_obj.contains("kind")) { return std::nullopt; }
    const auto event_kind = parse_kind(json_obj["kind"]);
    if (not event_kind) { return std::nullopt; }
    event.kind = *event_kind;

    if (not json_obj.contains("content") or not json_obj["content"].is_string()) { return std::nullopt; }
    event.content = json_obj["content"].get<std::string>();

    if (not json_obj.contains("sig") or not json_obj["sig"].is_string()) { return std::nullopt; }
    event.sig = json_obj["sig"].get<std::string>();

    if (json_obj.contains("tags")) {
      auto tags = parse_tags(json_obj["tags"]);
      if (not tags) { return std::nullopt; }
      event.tags = std::move(*tags);
    }

    return event;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto event_data::to_json() const -> nlohmann::json
{
  nlohmann::json json_obj;

  json_obj["id"] = id;
  json_obj["pubkey"] = pubkey;
  json_obj["created_at"] = created_at;
  json_obj["kind"] = kind;
  json_obj["content"] = content;
  json_obj["sig"] = sig;

  json_obj["tags"] = nlohmann::json::array();
  for (const auto &tag : tags) {
    nlohmann::json tag_json = nlohmann::json::array();
    std::ranges::copy(tag, std::back_inserter(tag_json));
    json_obj["tags"].push_back(tag_json);
  }

  return json_obj;
}

auto event_data::serialize() const -> std::string { return to_json().dump(); }

auto event_data::compute_id() const -> std::string
{
  return compute_event_id(pubkey, created_at, kind, tags, content);
}

auto event_data::verify() const -> bool
{
  try {
    const auto canonical = canonical_serialization(pubkey, created_at, kind, tags, content);
    const auto digest = crypto::sha256(canonical);
    if (crypto::to_hex(digest) != id) { return false; }
    return crypto::verify_schnorr(pubkey, digest, sig);
  } catch (const std::exception &) {
    return false;
  }
}

auto ok::deserialize(const std::string &json) -> std::optional<ok>
{
  try {
    auto json_obj = nlohmann::json::parse(json);

    if (not json_obj.is_array() or json_obj.size() < 3) { return std::nullopt; }
    if (not json_obj[0].is_string() or json_obj[0].get<std::string>() != "OK") { return std::nullopt; }
    if (not json_obj[1].is_string()) { return std::nullopt; }
    if (not json_obj[2].is_boolean()) { return std::nullopt; }

    ok result;
    result.event_id = json_obj[1].get<std::string>();
    result.accepted = json_obj[2].get<bool>();
    result.message = (json_obj.size() > 3 and json_obj[3].is_string()) ? json_obj[3].get<std::string>() : "";

    return result;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

}// namespace gift_relay::nostr::protocol
