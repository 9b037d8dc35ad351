#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "granddao/core/combat.h"
#include "granddao/core/config.h"
#include "granddao/core/content.h"
#include "granddao/core/content_validation.h"
#include "granddao/core/enum_strings.h"
#include "granddao/core/progression.h"
#include "granddao/core/save_store.h"
#include "granddao/core/serialization.h"
#include "granddao/core/session.h"
#include "granddao/core/simulation.h"
#include "granddao/util/file_io.h"
#include "granddao/util/log.h"
#include "granddao/util/strings.h"
#include "granddao/util/time.h"

namespace {

#ifndef GRANDDAO_VERSION
#define GRANDDAO_VERSION "unknown"
#endif

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

const char* log_kind_label(granddao::LogKind k) {
  switch (k) {
    case granddao::LogKind::Info: return "INFO";
    case granddao::LogKind::Success: return "GOOD";
    case granddao::LogKind::Warning: return "WARN";
    case granddao::LogKind::Danger: return "DANGER";
    case granddao::LogKind::Legendary: return "LEGEND";
    case granddao::LogKind::System: return "SYSTEM";
  }
  return "INFO";
}

void print_usage(const char* exe) {
  std::cout << "Grand Dao CLI v" << GRANDDAO_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "granddao_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --content PATH   Content tables JSON (default: data/content/cultivation.json)\n";
  std::cout << "  --config PATH    Balance/autosave overrides JSON\n";
  std::cout << "  --load PATH      Load a save JSON (offline catch-up runs against the wall clock)\n";
  std::cout << "  --import PATH    Load a base64 export string from PATH\n";
  std::cout << "  --name NAME      Character name for a new game (default: Wanderer)\n";
  std::cout << "  --seed N         RNG seed (default: derived from the wall clock)\n";
  std::cout << "  --action NAME    Set the action before advancing (idle|cultivate|train|explore|...)\n";
  std::cout << "  --path ID        Select the active path before advancing\n";
  std::cout << "  --seconds N      Advance N game seconds (default: 0)\n";
  std::cout << "  --breakthrough   Attempt a breakthrough after advancing\n";
  std::cout << "  --endure         Let tribulation strikes land instead of resisting them\n";
  std::cout << "  --save PATH      Write the save JSON after running\n";
  std::cout << "  --export         Print the base64 export string\n";
  std::cout << "  --format-save    Re-serialize --load into --save and exit\n";
  std::cout << "  --validate-content  Validate the content tables and exit\n";
  std::cout << "  --log-lines N    Recent narration lines to print (default: 10)\n";
  std::cout << "  --log-level L    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet          Reduce non-essential output\n";
  std::cout << "  -h, --help       Show this help\n";
  std::cout << "  --version        Print version and exit\n";
}

void print_status(const granddao::Simulation& sim) {
  const auto& st = sim.state();
  const auto& content = sim.content();
  const auto& c = st.character;

  auto name_or_id = [](const auto* def, const std::string& id) { return def ? def->name : id; };

  std::cout << c.name << " (rebirths " << c.rebirth_count << ", legacy +"
            << granddao::format_fixed(c.legacy_bonus * 100.0, 1) << "%)\n";
  std::cout << "  Spirit Root: " << name_or_id(content.find_spirit_root(c.spirit_root_id), c.spirit_root_id) << "\n";
  std::cout << "  Body Type:   " << name_or_id(content.find_body_type(c.body_type_id), c.body_type_id) << "\n";
  std::cout << "  Background:  " << name_or_id(content.find_background(c.background_id), c.background_id) << "\n";
  std::cout << "  Luck:        " << granddao::format_fixed(c.luck, 2) << "\n";
  if (st.karma_visible) std::cout << "  Karma:       " << c.karma << (c.devil_mark ? " (devil mark)" : "") << "\n";

  std::cout << "  Location:    " << name_or_id(content.find_region(st.location_id), st.location_id);
  if (st.travel.traveling) {
    std::cout << " -> " << st.travel.destination_id << " ("
              << granddao::format_duration(st.travel.remaining_seconds) << ")";
  }
  std::cout << "\n";
  std::cout << "  Stones:      " << st.spirit_stones << "\n";
  std::cout << "  Action:      " << granddao::action_to_string(st.current_action) << "\n";
  std::cout << "  Power:       " << granddao::calculate_power(content, st) << "\n";

  std::cout << "Paths:\n";
  for (const auto& path : content.paths) {
    const auto* pp = granddao::find_ptr(st.path_progress, path.id);
    if (!pp || !pp->unlocked) continue;
    std::string level_name = "Level " + std::to_string(pp->level);
    if (const auto* lvl = granddao::path_level(path, pp->level)) level_name = lvl->name;
    std::cout << (path.id == st.active_path_id ? "  * " : "    ") << path.name << ": " << level_name << " ("
              << granddao::format_fixed(pp->xp, 0) << "/" << granddao::format_fixed(pp->xp_required, 0) << " XP)"
              << (pp->breakthrough_available ? " [READY]" : "") << "\n";
  }

  if (!st.inventory.empty()) {
    std::cout << "Inventory:\n";
    for (const auto& e : st.inventory) {
      const auto* item = content.find_item(e.item_id);
      std::cout << "    " << name_or_id(item, e.item_id) << " x" << e.quantity;
      if (item) {
        std::cout << " (" << granddao::rarity_to_string(item->rarity) << " "
                  << granddao::item_category_to_string(item->category) << ")";
      }
      if (e.item_id == st.equipped_scripture) std::cout << " [equipped]";
      std::cout << "\n";
    }
  }

  if (!st.pending_event_id.empty()) {
    if (const auto* ev = content.find_event(st.pending_event_id)) std::cout << "Pending event: " << ev->title << "\n";
  }
}

void print_log(const granddao::GameState& st, int lines) {
  if (lines <= 0 || st.log.empty()) return;
  std::cout << "Recent:\n";
  const std::size_t n = std::min(st.log.size(), static_cast<std::size_t>(lines));
  // Log is newest first; print oldest of the window first.
  for (std::size_t i = n; i-- > 0;) {
    const auto& e = st.log[i];
    std::cout << "  [" << log_kind_label(e.kind) << "] " << e.message << "\n";
  }
}

// Runs an active tribulation to its end on the manual clock and returns how
// it finished.
granddao::TribulationStatus drive_tribulation(granddao::Session& session, granddao::ManualClock& clock, bool endure) {
  for (;;) {
    struct Snapshot {
      bool active{false};
      granddao::TribulationStatus status{granddao::TribulationStatus::Waiting};
      std::int64_t next_arm_ms{0};
      std::int64_t deadline_ms{0};
    };
    const Snapshot t = session.with_simulation([](granddao::Simulation& sim) {
      Snapshot s;
      if (const auto* trib = sim.tribulation()) {
        s.active = true;
        s.status = trib->status();
        s.next_arm_ms = trib->next_arm_ms();
        s.deadline_ms = trib->strike_deadline_ms();
      }
      return s;
    });
    if (!t.active) return granddao::TribulationStatus::Abandoned;

    if (t.status == granddao::TribulationStatus::Waiting) {
      clock.set_ms(std::max(clock.now_ms(), t.next_arm_ms));
      const auto r = session.pump(clock.now_ms());
      if (r.tribulation_finished) return *r.tribulation_finished;
      continue;
    }
    if (endure) {
      clock.set_ms(std::max(clock.now_ms(), t.deadline_ms));
      const auto r = session.pump(clock.now_ms());
      if (r.tribulation_finished) return *r.tribulation_finished;
    } else {
      clock.advance_ms(100);
      const auto u = session.resist_strike();
      if (u.finished) return u.status;
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << GRANDDAO_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "info");
    granddao::log::Level lvl = granddao::log::Level::Info;
    if (!granddao::log::parse_level(log_level, &lvl)) {
      std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    granddao::log::set_level(lvl);

    const std::string content_path = get_str_arg(argc, argv, "--content", "data/content/cultivation.json");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string import_path = get_str_arg(argc, argv, "--import", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const std::string name = get_str_arg(argc, argv, "--name", "Wanderer");
    const std::string action_name = get_str_arg(argc, argv, "--action", "");
    const std::string path_id = get_str_arg(argc, argv, "--path", "");
    const int seconds = get_int_arg(argc, argv, "--seconds", 0);
    const int log_lines = get_int_arg(argc, argv, "--log-lines", 10);

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool do_breakthrough = has_flag(argc, argv, "--breakthrough");
    const bool endure = has_flag(argc, argv, "--endure");
    const bool do_export = has_flag(argc, argv, "--export");

    if (has_flag(argc, argv, "--format-save")) {
      if (load_path.empty() || save_path.empty()) {
        std::cerr << "--format-save requires both --load and --save\n\n";
        print_usage(argv[0]);
        return 2;
      }
      const auto loaded = granddao::deserialize_game_from_json(granddao::read_text_file(load_path));
      granddao::write_text_file(save_path, granddao::serialize_game_to_json(loaded));
      if (!quiet) std::cout << "Formatted save written to " << save_path << "\n";
      return 0;
    }

    auto content = granddao::load_content_db_from_file(content_path);

    if (has_flag(argc, argv, "--validate-content")) {
      const auto errors = granddao::validate_content_db(content);
      if (!errors.empty()) {
        std::cerr << "Content validation failed:\n";
        for (const auto& e : errors) std::cerr << "  - " << e << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Content OK\n";
      return 0;
    }

    granddao::SessionConfig session_cfg;
    granddao::SimConfig cfg;
    if (!config_path.empty()) cfg = granddao::load_sim_config_from_file(config_path, &session_cfg.autosave);

    const granddao::SystemClock wall;
    granddao::ManualClock clock(wall.now_ms());

    if (has_kv_arg(argc, argv, "--seed")) {
      cfg.rng_seed = static_cast<std::uint64_t>(get_int_arg(argc, argv, "--seed", 1));
    } else {
      cfg.rng_seed = static_cast<std::uint64_t>(clock.now_ms());
    }

    // The store validates loads/imports against this copy of the tables.
    const granddao::ContentDB store_content = content;
    std::optional<granddao::SaveStore> store;
    if (!save_path.empty()) store.emplace(save_path, &store_content);

    granddao::Simulation sim(std::move(content), cfg);
    sim.set_clock(&clock);

    if (!load_path.empty()) {
      const granddao::SaveStore loader(load_path, &store_content);
      auto loaded = loader.load();
      if (!loaded) {
        std::cerr << "Could not load save: " << load_path << "\n";
        return 1;
      }
      sim.load_game(std::move(*loaded));
    } else if (!import_path.empty()) {
      const granddao::SaveStore importer(import_path, &store_content);
      auto imported = importer.import_text(granddao::read_text_file(import_path));
      if (!imported) {
        std::cerr << "Import failed: " << import_path << "\n";
        return 1;
      }
      sim.load_game(std::move(*imported));
    } else {
      sim.new_game(name);
    }

    granddao::Session session(std::move(sim), store ? &*store : nullptr, session_cfg);
    if (const auto rep = session.start(clock.now_ms()); rep && rep->applied && !quiet) {
      std::cout << "Offline for " << granddao::format_duration(rep->elapsed_seconds) << ": +"
                << granddao::format_fixed(rep->xp_gained, 0) << " XP, +" << rep->stones_gained << " SS\n";
    }

    if (!action_name.empty()) {
      const auto action = granddao::action_from_string(action_name);
      if (!action) {
        std::cerr << "Unknown --action: '" << action_name << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      session.with_simulation([&](granddao::Simulation& s) { return s.set_action(*action); });
    }
    if (!path_id.empty()) {
      const bool ok = session.with_simulation([&](granddao::Simulation& s) { return s.select_path(path_id); });
      if (!ok) std::cerr << "Path not available: " << path_id << "\n";
    }

    for (int i = 0; i < seconds; ++i) {
      clock.advance_ms(1000);
      session.pump(clock.now_ms());
    }

    if (do_breakthrough) {
      const auto r = session.attempt_breakthrough();
      if (!quiet) {
        std::cout << "Breakthrough: " << granddao::breakthrough_outcome_to_string(r.outcome);
        if (r.chance > 0.0) std::cout << " (chance " << granddao::format_fixed(r.chance * 100.0, 1) << "%)";
        std::cout << "\n";
      }
      if (r.outcome == granddao::BreakthroughOutcome::TribulationStarted) {
        const auto status = drive_tribulation(session, clock, endure);
        if (!quiet) std::cout << "Tribulation: " << granddao::tribulation_status_to_string(status) << "\n";
      }
    }

    session.stop();

    if (store) {
      if (!session.save_now(clock.now_ms())) {
        std::cerr << "Save failed: " << save_path << "\n";
        return 1;
      }
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    const granddao::GameState st = session.snapshot();
    if (do_export) {
      std::cout << granddao::export_save_text(st) << "\n";
      return 0;
    }

    if (!quiet) {
      session.with_simulation([](granddao::Simulation& s) {
        print_status(s);
        return 0;
      });
      print_log(st, log_lines);
    }
    return 0;
  } catch (const std::exception& e) {
    granddao::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
