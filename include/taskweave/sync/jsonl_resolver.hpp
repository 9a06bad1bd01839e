#pragma once

#include "taskweave/core/error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace taskweave {

using Entity = nlohmann::ordered_json;

enum class SectionType : std::uint8_t {
  Clean,
  Conflict,
};

// One run of a conflict-marked file. Line numbers are 0-based and only set
// for conflict sections.
struct ConflictSection {
  SectionType type{SectionType::Clean};
  std::vector<std::string> lines;
  std::vector<std::string> ours;
  std::vector<std::string> theirs;
  std::string ours_label;
  std::string theirs_label;
  std::size_t start{0};
  std::size_t middle{0};
  std::size_t end{0};
};

enum class CollisionType : std::uint8_t {
  SameUuidSameId,
  SameUuidDifferentId,
  DifferentUuidSameId,
};

[[nodiscard]] constexpr auto to_string_view(CollisionType type) noexcept
    -> std::string_view {
  switch (type) {
    case CollisionType::SameUuidSameId:
      return "same-uuid-same-id";
    case CollisionType::SameUuidDifferentId:
      return "same-uuid-different-id";
    case CollisionType::DifferentUuidSameId:
      return "different-uuids";
  }
  return "unknown";
}

struct Collision {
  CollisionType type{CollisionType::SameUuidSameId};
  std::string id;
  std::string uuid;
  std::vector<std::string> resolved_ids;
  std::string action;
};

struct ResolvedEntities {
  // Sorted by created_at; entities without one keep their relative order.
  std::vector<Entity> entities;
  // Lines that are JSON but carry no string "id", in input order.
  std::vector<std::string> passthrough;
  std::vector<Collision> collisions;
};

[[nodiscard]] auto parse_conflict_sections(std::string_view text)
    -> std::vector<ConflictSection>;

// Error::ParseError on the first malformed line. Blank lines are skipped.
[[nodiscard]] auto parse_entities(const std::vector<std::string>& lines)
    -> Result<std::vector<Entity>>;

// Same id and uuid: the most recent updated_at wins, tags and relationships
// are unioned. Same uuid, different ids: the older record is renamed
// "<id>-conflict-<uuid prefix>". Same id, different uuids: later records
// become "<id>.1", "<id>.2", ...
[[nodiscard]] auto resolve_entities(std::vector<Entity> entities)
    -> ResolvedEntities;

// Takes conflict-marked JSONL (or plain JSONL), keeps both sides of every
// conflict and resolves the entities. One JSON object per line, newline
// terminated.
[[nodiscard]] auto resolve_jsonl(std::string_view text) -> Result<std::string>;

}  // namespace taskweave
