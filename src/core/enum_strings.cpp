#include "granddao/core/enum_strings.h"

namespace granddao {

std::string action_to_string(ActionType a) {
  switch (a) {
    case ActionType::Idle: return "idle";
    case ActionType::Cultivate: return "cultivate";
    case ActionType::Train: return "train";
    case ActionType::Explore: return "explore";
    case ActionType::Refine: return "refine";
    case ActionType::Inscribe: return "inscribe";
    case ActionType::Forge: return "forge";
    case ActionType::Study: return "study";
    case ActionType::Sleep: return "sleep";
  }
  return "idle";
}

std::optional<ActionType> action_from_string(const std::string& s) {
  if (s == "idle") return ActionType::Idle;
  if (s == "cultivate") return ActionType::Cultivate;
  if (s == "train") return ActionType::Train;
  if (s == "explore") return ActionType::Explore;
  if (s == "refine") return ActionType::Refine;
  if (s == "inscribe") return ActionType::Inscribe;
  if (s == "forge") return ActionType::Forge;
  if (s == "study") return ActionType::Study;
  if (s == "sleep") return ActionType::Sleep;
  return std::nullopt;
}

std::string phase_to_string(GamePhase p) {
  switch (p) {
    case GamePhase::CharacterCreation: return "character_creation";
    case GamePhase::Playing: return "playing";
  }
  return "playing";
}

std::optional<GamePhase> phase_from_string(const std::string& s) {
  if (s == "character_creation") return GamePhase::CharacterCreation;
  if (s == "playing") return GamePhase::Playing;
  return std::nullopt;
}

std::string log_kind_to_string(LogKind k) {
  switch (k) {
    case LogKind::Info: return "info";
    case LogKind::Success: return "success";
    case LogKind::Warning: return "warning";
    case LogKind::Danger: return "danger";
    case LogKind::Legendary: return "legendary";
    case LogKind::System: return "system";
  }
  return "info";
}

std::optional<LogKind> log_kind_from_string(const std::string& s) {
  if (s == "info") return LogKind::Info;
  if (s == "success") return LogKind::Success;
  if (s == "warning") return LogKind::Warning;
  if (s == "danger") return LogKind::Danger;
  if (s == "legendary") return LogKind::Legendary;
  if (s == "system") return LogKind::System;
  return std::nullopt;
}

std::string realm_to_string(Realm r) {
  switch (r) {
    case Realm::Mortal: return "mortal";
    case Realm::Heaven: return "heaven";
    case Realm::Underworld: return "underworld";
  }
  return "mortal";
}

std::optional<Realm> realm_from_string(const std::string& s) {
  if (s == "mortal") return Realm::Mortal;
  if (s == "heaven") return Realm::Heaven;
  if (s == "underworld") return Realm::Underworld;
  return std::nullopt;
}

std::string rarity_to_string(Rarity r) {
  switch (r) {
    case Rarity::Common: return "common";
    case Rarity::Uncommon: return "uncommon";
    case Rarity::Rare: return "rare";
    case Rarity::Epic: return "epic";
    case Rarity::Legendary: return "legendary";
    case Rarity::Mythic: return "mythic";
  }
  return "common";
}

std::optional<Rarity> rarity_from_string(const std::string& s) {
  if (s == "common") return Rarity::Common;
  if (s == "uncommon") return Rarity::Uncommon;
  if (s == "rare") return Rarity::Rare;
  if (s == "epic") return Rarity::Epic;
  if (s == "legendary") return Rarity::Legendary;
  if (s == "mythic") return Rarity::Mythic;
  return std::nullopt;
}

std::string item_category_to_string(ItemCategory c) {
  switch (c) {
    case ItemCategory::Pill: return "pill";
    case ItemCategory::Scripture: return "scripture";
    case ItemCategory::Treasure: return "treasure";
    case ItemCategory::Material: return "material";
    case ItemCategory::FormationScroll: return "formation_scroll";
    case ItemCategory::Special: return "special";
  }
  return "material";
}

std::optional<ItemCategory> item_category_from_string(const std::string& s) {
  if (s == "pill") return ItemCategory::Pill;
  if (s == "scripture") return ItemCategory::Scripture;
  if (s == "treasure") return ItemCategory::Treasure;
  if (s == "material") return ItemCategory::Material;
  if (s == "formation_scroll") return ItemCategory::FormationScroll;
  if (s == "special") return ItemCategory::Special;
  return std::nullopt;
}

} // namespace granddao
