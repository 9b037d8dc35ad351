#include "granddao/core/serialization.h"

#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>

#include "granddao/core/enum_strings.h"
#include "granddao/core/progression.h"
#include "granddao/util/base64.h"
#include "granddao/util/log.h"

namespace granddao {
namespace {

using json::Array;
using json::Object;
using json::Value;

Value num(double v) { return Value(v); }
Value num(std::int64_t v) { return Value(static_cast<double>(v)); }
Value num(int v) { return Value(static_cast<double>(v)); }
Value num(std::uint64_t v) { return Value(static_cast<double>(v)); }
Value str(const std::string& s) { return Value(s); }

Array string_vector_to_json(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

std::vector<std::string> string_vector_from_json(const Value& v) {
  std::vector<std::string> out;
  for (const auto& x : v.array()) {
    if (!x.is_string()) throw std::runtime_error("expected an array of strings");
    out.push_back(x.string_value());
  }
  return out;
}

// Optional field helpers. A present field with the wrong type is an error:
// silently defaulting would hide a corrupt save.
const Value* field(const Object& o, const std::string& key) { return json::find(o, key); }

const Value& required(const Object& o, const std::string& key) {
  const Value* v = field(o, key);
  if (!v) throw std::runtime_error("missing required field '" + key + "'");
  return *v;
}

double get_number(const Object& o, const std::string& key, double def) {
  const Value* v = field(o, key);
  if (!v) return def;
  if (!v->is_number()) throw std::runtime_error("'" + key + "' must be a number");
  const double d = v->number_value();
  if (!std::isfinite(d)) throw std::runtime_error("'" + key + "' must be finite");
  return d;
}

// Integral fields must hold a whole number inside [lo, hi]; anything else is
// a corrupt save rather than something to round or wrap.
std::int64_t get_int(const Object& o, const std::string& key, std::int64_t def,
                     std::int64_t lo = std::numeric_limits<std::int64_t>::min(),
                     std::int64_t hi = std::numeric_limits<std::int64_t>::max()) {
  const Value* v = field(o, key);
  if (!v) return def;
  const double d = get_number(o, key, 0.0);
  // 2^63 is exactly representable; every double below it converts safely.
  if (d != std::floor(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
    throw std::runtime_error("'" + key + "' must be an integer");
  }
  const auto i = static_cast<std::int64_t>(d);
  if (i < lo || i > hi) {
    throw std::runtime_error("'" + key + "' value " + std::to_string(i) + " is out of range");
  }
  return i;
}

int get_int32(const Object& o, const std::string& key, int def) {
  return static_cast<int>(get_int(o, key, def, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

bool get_bool(const Object& o, const std::string& key, bool def) {
  const Value* v = field(o, key);
  if (!v) return def;
  if (!v->is_bool()) throw std::runtime_error("'" + key + "' must be a boolean");
  return v->bool_value();
}

std::string get_string(const Object& o, const std::string& key, const std::string& def = "") {
  const Value* v = field(o, key);
  if (!v || v->is_null()) return def;
  if (!v->is_string()) throw std::runtime_error("'" + key + "' must be a string");
  return v->string_value();
}

template <typename E>
E parse_enum(const std::optional<E>& parsed, const std::string& what, const std::string& text) {
  if (!parsed) throw std::runtime_error("unknown " + what + " '" + text + "'");
  return *parsed;
}

Value character_to_json(const Character& c) {
  Object o;
  o["name"] = str(c.name);
  o["spirit_root"] = str(c.spirit_root_id);
  o["body_type"] = str(c.body_type_id);
  o["background"] = str(c.background_id);
  o["luck"] = num(c.luck);
  o["karma"] = num(c.karma);
  o["rogue_status"] = c.rogue_status;
  o["rebirth_count"] = num(c.rebirth_count);
  o["legacy_bonus"] = num(c.legacy_bonus);
  o["devil_mark"] = c.devil_mark;
  o["redeemed_devil"] = c.redeemed_devil;
  return o;
}

Character character_from_json(const Value& v) {
  const Object& o = v.object();
  Character c;
  c.name = get_string(o, "name");
  c.spirit_root_id = get_string(o, "spirit_root");
  c.body_type_id = get_string(o, "body_type");
  c.background_id = get_string(o, "background");
  c.luck = get_number(o, "luck", 0.5);
  c.karma = get_int32(o, "karma", 0);
  c.rogue_status = get_bool(o, "rogue_status", false);
  c.rebirth_count = get_int32(o, "rebirth_count", 0);
  c.legacy_bonus = get_number(o, "legacy_bonus", 0.0);
  c.devil_mark = get_bool(o, "devil_mark", false);
  c.redeemed_devil = get_bool(o, "redeemed_devil", false);
  return c;
}

} // namespace

Value serialize_game_to_json_value(const GameState& s) {
  Object root;
  root["save_version"] = num(s.save_version);
  root["phase"] = str(phase_to_string(s.phase));
  root["character"] = character_to_json(s.character);

  Object paths;
  for (const auto& [id, pp] : s.path_progress) {
    Object o;
    o["level"] = num(pp.level);
    o["xp"] = num(pp.xp);
    o["xp_required"] = num(pp.xp_required);
    o["breakthrough_available"] = pp.breakthrough_available;
    o["unlocked"] = pp.unlocked;
    paths[id] = o;
  }
  root["path_progress"] = paths;

  root["current_action"] = str(action_to_string(s.current_action));
  root["active_path_id"] = str(s.active_path_id);
  root["spirit_stones"] = num(s.spirit_stones);

  Array inv;
  for (const auto& e : s.inventory) {
    Object o;
    o["item"] = str(e.item_id);
    o["quantity"] = num(e.quantity);
    inv.push_back(o);
  }
  root["inventory"] = inv;
  root["equipped_scripture"] = str(s.equipped_scripture);

  root["location"] = str(s.location_id);
  root["discovered_regions"] = string_vector_to_json(s.discovered_regions);
  {
    Object t;
    t["traveling"] = s.travel.traveling;
    t["destination"] = str(s.travel.destination_id);
    t["remaining_seconds"] = num(s.travel.remaining_seconds);
    root["travel"] = t;
  }

  Array buffs;
  for (const auto& b : s.buffs) {
    Object o;
    o["id"] = str(b.id);
    o["name"] = str(b.name);
    o["multiplier"] = num(b.multiplier);
    o["remaining_seconds"] = num(b.remaining_seconds);
    buffs.push_back(o);
  }
  root["buffs"] = buffs;
  {
    Object q;
    q["active"] = s.qi_deviation.active;
    q["remaining_seconds"] = num(s.qi_deviation.remaining_seconds);
    root["qi_deviation"] = q;
  }

  {
    Object g;
    g["id"] = str(s.group_id);
    g["contribution"] = num(s.group_contribution);
    g["completed_missions"] = string_vector_to_json(s.completed_missions);
    root["group"] = g;
  }
  root["pending_event"] = str(s.pending_event_id);

  Array log;
  for (const auto& e : s.log) {
    Object o;
    o["seq"] = num(e.seq);
    o["timestamp_ms"] = num(e.timestamp_ms);
    o["kind"] = str(log_kind_to_string(e.kind));
    o["message"] = str(e.message);
    log.push_back(o);
  }
  root["log"] = log;
  root["next_log_seq"] = num(s.next_log_seq);

  root["tick_count"] = num(s.tick_count);
  root["total_play_time"] = num(s.total_play_time);
  root["highest_path_level"] = num(s.highest_path_level);
  root["total_deaths"] = num(s.total_deaths);
  root["reroll_count"] = num(s.reroll_count);
  root["karma_visible"] = s.karma_visible;
  root["auto_save_enabled"] = s.auto_save_enabled;
  root["last_save_timestamp_ms"] = num(s.last_save_timestamp_ms);
  return root;
}

std::string serialize_game_to_json(const GameState& s, int indent) {
  return json::stringify(serialize_game_to_json_value(s), indent);
}

GameState deserialize_game_from_json(const std::string& json_text) {
  const Value doc = json::parse(json_text);
  if (!doc.is_object()) throw std::runtime_error("save root must be an object");
  const Object& root = doc.object();

  GameState s;
  {
    const int version = get_int32(root, "save_version", kCurrentSaveVersion);
    if (version > kCurrentSaveVersion) {
      throw std::runtime_error("save_version " + std::to_string(version) + " is newer than supported (" +
                               std::to_string(kCurrentSaveVersion) + ")");
    }
    s.save_version = kCurrentSaveVersion;
  }

  {
    const Value& pv = required(root, "phase");
    if (!pv.is_string()) throw std::runtime_error("'phase' must be a string");
    const std::string phase = pv.string_value();
    s.phase = parse_enum(phase_from_string(phase), "phase", phase);
  }
  s.character = character_from_json(required(root, "character"));

  for (const auto& [id, v] : required(root, "path_progress").object()) {
    const Object& o = v.object();
    PathProgress pp;
    pp.path_id = id;
    pp.level = get_int32(o, "level", 1);
    pp.xp = get_number(o, "xp", 0.0);
    pp.xp_required = get_number(o, "xp_required", xp_required_for_level(pp.level));
    pp.breakthrough_available = get_bool(o, "breakthrough_available", false);
    pp.unlocked = get_bool(o, "unlocked", false);
    s.path_progress[id] = pp;
  }

  {
    const std::string action = get_string(root, "current_action", "idle");
    s.current_action = parse_enum(action_from_string(action), "action", action);
  }
  s.active_path_id = get_string(root, "active_path_id");
  s.spirit_stones = get_int(root, "spirit_stones", 0);

  if (const Value* inv = field(root, "inventory")) {
    for (const auto& v : inv->array()) {
      const Object& o = v.object();
      InventoryItem e;
      e.item_id = get_string(o, "item");
      e.quantity = get_int32(o, "quantity", 1);
      s.inventory.push_back(e);
    }
  }
  s.equipped_scripture = get_string(root, "equipped_scripture");

  s.location_id = get_string(root, "location");
  if (const Value* d = field(root, "discovered_regions")) s.discovered_regions = string_vector_from_json(*d);
  if (const Value* t = field(root, "travel")) {
    const Object& o = t->object();
    s.travel.traveling = get_bool(o, "traveling", false);
    s.travel.destination_id = get_string(o, "destination");
    s.travel.remaining_seconds = get_int32(o, "remaining_seconds", 0);
  }

  if (const Value* b = field(root, "buffs")) {
    for (const auto& v : b->array()) {
      const Object& o = v.object();
      ActiveBuff buff;
      buff.id = get_string(o, "id");
      buff.name = get_string(o, "name", buff.id);
      buff.multiplier = get_number(o, "multiplier", 1.0);
      buff.remaining_seconds = get_int32(o, "remaining_seconds", 0);
      s.buffs.push_back(buff);
    }
  }
  if (const Value* q = field(root, "qi_deviation")) {
    const Object& o = q->object();
    s.qi_deviation.active = get_bool(o, "active", false);
    s.qi_deviation.remaining_seconds = get_int32(o, "remaining_seconds", 0);
  }

  if (const Value* g = field(root, "group")) {
    const Object& o = g->object();
    s.group_id = get_string(o, "id");
    s.group_contribution = get_int32(o, "contribution", 0);
    if (const Value* m = field(o, "completed_missions")) s.completed_missions = string_vector_from_json(*m);
  }
  s.pending_event_id = get_string(root, "pending_event");

  if (const Value* log = field(root, "log")) {
    for (const auto& v : log->array()) {
      const Object& o = v.object();
      LogEntry e;
      e.seq = static_cast<std::uint64_t>(get_int(o, "seq", 0, 0));
      e.timestamp_ms = get_int(o, "timestamp_ms", 0);
      const std::string kind = get_string(o, "kind", "info");
      e.kind = parse_enum(log_kind_from_string(kind), "log kind", kind);
      e.message = get_string(o, "message");
      s.log.push_back(e);
    }
  }
  s.next_log_seq = static_cast<std::uint64_t>(get_int(root, "next_log_seq", 1, 0));
  if (s.next_log_seq == 0) s.next_log_seq = 1;
  for (const auto& e : s.log) {
    if (e.seq >= s.next_log_seq) s.next_log_seq = e.seq + 1;
  }

  s.tick_count = get_int(root, "tick_count", 0);
  s.total_play_time = get_int(root, "total_play_time", 0);
  s.highest_path_level = get_int32(root, "highest_path_level", 1);
  s.total_deaths = get_int32(root, "total_deaths", 0);
  s.reroll_count = get_int32(root, "reroll_count", 0);
  s.karma_visible = get_bool(root, "karma_visible", false);
  s.auto_save_enabled = get_bool(root, "auto_save_enabled", true);
  s.last_save_timestamp_ms = get_int(root, "last_save_timestamp_ms", 0);
  return s;
}

std::string export_save_text(const GameState& state) {
  return base64::encode(serialize_game_to_json(state, /*indent=*/0));
}

std::optional<GameState> import_save_text(const std::string& text, std::string* error) {
  auto reject = [&](const std::string& why) -> std::optional<GameState> {
    log::warn("Save import rejected: " + why);
    if (error) *error = why;
    return std::nullopt;
  };

  std::string decoded;
  if (!base64::decode(text, &decoded)) return reject("not valid base64");

  try {
    return deserialize_game_from_json(decoded);
  } catch (const std::exception& e) {
    return reject(e.what());
  }
}

} // namespace granddao
