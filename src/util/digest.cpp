#include "agirace/util/digest.h"

#include <algorithm>
#include <cstring>
#include <type_traits>
#include <vector>

#include "agirace/util/sorted_keys.h"

namespace agirace {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Little-endian byte order regardless of host.
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(b ? 1 : 0); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    add_i64(static_cast<std::int64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(c);
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));
    if ((u << 1) == 0) u = 0;  // -0.0 == +0.0
    add_u64(u);
  }

  void add_sorted_strings(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    add_size(v.size());
    for (const auto& s : v) add_string(s);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ULL;
  static constexpr std::uint64_t kPrime = 1099511628211ULL;
  std::uint64_t h_{kOffset};
};

void add_resources(Digest64& d, const Resources& r) {
  for (ResourceKey k : kAllResources) d.add_double(r.get(k));
}

void add_faction(Digest64& d, const FactionState& f) {
  d.add_string(f.id);
  d.add_string(f.name);
  d.add_enum(f.type);
  add_resources(d, f.resources);
  d.add_double(f.safety_culture);
  d.add_double(f.opsec);
  d.add_double(f.capability_score);
  d.add_double(f.safety_score);
  d.add_double(f.exposure);
  for (Branch b : kAllBranches) d.add_double(f.research.get(b));
  d.add_size(f.unlocked_techs.size());
  for (const auto& t : f.unlocked_techs) d.add_string(t);
  d.add_bool(f.can_deploy_agi);
  d.add_double(f.public_opinion);
  d.add_i64(f.security_level);
}

} // namespace

std::uint64_t digest_game_state64(const GameState& s, const DigestOptions& opt) {
  Digest64 d;
  d.add_i64(s.save_version);
  d.add_i64(s.turn);
  d.add_i64(s.year);
  d.add_i64(s.quarter);
  d.add_double(s.global_safety);
  d.add_bool(s.game_over);
  d.add_string(s.winner_id);
  d.add_string(s.loser_id);
  d.add_enum(s.victory_type);
  d.add_enum(s.loss_type);
  d.add_string(s.player_faction_id);

  d.add_size(s.factions.size());
  for (const auto& id : util::sorted_keys(s.factions)) add_faction(d, s.factions.at(id));

  std::size_t alliance_entries = 0;
  for (const auto& id : util::sorted_keys(s.alliances)) {
    const auto& allies = s.alliances.at(id);
    if (allies.empty()) continue;
    ++alliance_entries;
    d.add_string(id);
    d.add_sorted_strings(allies);
  }
  d.add_size(alliance_entries);

  d.add_size(s.tensions.size());
  for (const auto& key : util::sorted_keys(s.tensions)) {
    d.add_string(key);
    d.add_double(s.tensions.at(key));
  }

  d.add_sorted_strings(s.treaties);

  if (opt.include_log) {
    d.add_size(s.log.size());
    for (const auto& e : s.log) d.add_string(e);
  }

  return d.value();
}

std::uint64_t digest_content_db64(const ContentDB& c) {
  Digest64 d;

  d.add_size(c.actions.size());
  for (const auto& id : util::sorted_keys(c.actions)) {
    const auto& a = c.actions.at(id);
    d.add_string(a.id);
    d.add_string(a.name);
    d.add_string(a.kind);
    d.add_size(a.allowed_for.size());
    for (FactionType t : a.allowed_for) d.add_enum(t);
    d.add_string(a.faction_specific);
    d.add_size(a.base_research.size());
    for (const auto& [b, v] : a.base_research) {
      d.add_enum(b);
      d.add_double(v);
    }
    d.add_size(a.base_resource_delta.size());
    for (const auto& [k, v] : a.base_resource_delta) {
      d.add_enum(k);
      d.add_double(v);
    }
    d.add_double(a.exposure);
    d.add_bool(a.score_effects.has_value());
    if (a.score_effects) {
      d.add_double(a.score_effects->capability);
      d.add_double(a.score_effects->safety);
    }
    d.add_i64(a.security_level_delta);
  }

  // Catalog order is significant for techs.
  d.add_size(c.techs.size());
  for (const auto& t : c.techs) {
    d.add_string(t.id);
    d.add_string(t.name);
    d.add_enum(t.branch);
    d.add_double(t.cost);
    d.add_size(t.prereqs.size());
    for (const auto& p : t.prereqs) d.add_string(p);
    d.add_size(t.effects.size());
    for (const auto& e : t.effects) {
      d.add_enum(e.type);
      d.add_enum(e.resource);
      d.add_enum(e.stat);
      d.add_double(e.value);
    }
  }

  d.add_size(c.factions.size());
  for (const auto& f : c.factions) {
    d.add_string(f.id);
    d.add_string(f.name);
    d.add_enum(f.type);
    d.add_string(f.bloc);
    add_resources(d, f.resources);
    d.add_double(f.safety_culture);
    d.add_double(f.opsec);
    d.add_double(f.capability_score);
    d.add_double(f.safety_score);
    d.add_double(f.public_opinion.value_or(-1.0));
    d.add_i64(f.security_level.value_or(-1));
    d.add_double(f.strategy.risk_tolerance);
    d.add_double(f.strategy.safety_focus);
    d.add_double(f.strategy.openness_preference);
    d.add_double(f.strategy.espionage_focus);
  }

  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace agirace
