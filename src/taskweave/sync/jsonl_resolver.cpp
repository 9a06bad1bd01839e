#include "taskweave/sync/jsonl_resolver.hpp"

#include "taskweave/util/log.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace taskweave {

namespace {

inline constexpr std::size_t UUID_PREFIX_LEN = 8;

enum class ParseState : std::uint8_t { Clean, Ours, Base, Theirs };

auto split_keep_empty(std::string_view text) -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find('\n', pos);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    auto line = text.substr(pos, end - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    out.push_back(line);
    pos = end + 1;
  }
  return out;
}

auto marker_label(std::string_view line) -> std::string {
  if (line.size() <= 8) {
    return {};
  }
  return std::string(line.substr(8));
}

auto string_field(const Entity& e, const char* key) -> std::string {
  auto it = e.find(key);
  if (it == e.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// ISO-8601 strings compare chronologically once separators agree.
auto timestamp_key(const Entity& e, const char* key) -> std::string {
  auto ts = string_field(e, key);
  std::replace(ts.begin(), ts.end(), ' ', 'T');
  if (!ts.empty() && ts.back() == 'Z') {
    ts.pop_back();
  }
  return ts;
}

auto union_array(const std::vector<const Entity*>& versions, const char* key)
    -> std::optional<Entity> {
  bool present = false;
  Entity merged = Entity::array();
  std::unordered_set<std::string> seen;
  for (const auto* v : versions) {
    auto it = v->find(key);
    if (it == v->end() || !it->is_array()) {
      continue;
    }
    present = true;
    for (const auto& item : *it) {
      if (seen.insert(item.dump()).second) {
        merged.push_back(item);
      }
    }
  }
  if (!present) {
    return std::nullopt;
  }
  return merged;
}

// Versions of one record, oldest update first. The newest wins, list fields
// are unioned.
auto merge_versions(std::vector<const Entity*> versions) -> Entity {
  std::stable_sort(versions.begin(), versions.end(),
                   [](const Entity* a, const Entity* b) {
                     return timestamp_key(*a, "updated_at") <
                            timestamp_key(*b, "updated_at");
                   });
  Entity merged = *versions.back();
  for (const char* key : {"tags", "relationships", "feedback"}) {
    if (auto u = union_array(versions, key)) {
      merged[key] = std::move(*u);
    }
  }
  return merged;
}

}  // namespace

auto parse_conflict_sections(std::string_view text)
    -> std::vector<ConflictSection> {
  std::vector<ConflictSection> sections;
  ConflictSection current;
  ParseState state = ParseState::Clean;

  auto lines = split_keep_empty(text);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto line = lines[i];
    if (state == ParseState::Clean && line.starts_with("<<<<<<<")) {
      if (!current.lines.empty()) {
        sections.push_back(std::move(current));
      }
      current = ConflictSection{};
      current.type = SectionType::Conflict;
      current.ours_label = marker_label(line);
      current.start = i;
      state = ParseState::Ours;
    } else if ((state == ParseState::Ours || state == ParseState::Base) &&
               line.starts_with("=======")) {
      current.middle = i;
      state = ParseState::Theirs;
    } else if (state == ParseState::Ours && line.starts_with("|||||||")) {
      state = ParseState::Base;
    } else if (state == ParseState::Theirs && line.starts_with(">>>>>>>")) {
      current.theirs_label = marker_label(line);
      current.end = i;
      sections.push_back(std::move(current));
      current = ConflictSection{};
      state = ParseState::Clean;
    } else if (state == ParseState::Ours) {
      current.ours.emplace_back(line);
    } else if (state == ParseState::Theirs) {
      current.theirs.emplace_back(line);
    } else if (state == ParseState::Clean) {
      current.lines.emplace_back(line);
    }
  }

  // An unterminated conflict keeps what it collected.
  if (current.type == SectionType::Conflict || !current.lines.empty()) {
    sections.push_back(std::move(current));
  }
  return sections;
}

auto parse_entities(const std::vector<std::string>& lines)
    -> Result<std::vector<Entity>> {
  std::vector<Entity> out;
  out.reserve(lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    auto parsed = Entity::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
      log::error("Malformed JSONL line {}: {}", i + 1, line);
      return fail(Error::ParseError);
    }
    out.push_back(std::move(parsed));
  }
  return out;
}

auto resolve_entities(std::vector<Entity> entities) -> ResolvedEntities {
  ResolvedEntities result;

  // Group by uuid (records without one stand alone), first-seen order.
  std::vector<std::vector<const Entity*>> groups;
  std::unordered_map<std::string, std::size_t> group_of_uuid;
  for (const auto& e : entities) {
    if (!e.is_object() || string_field(e, "id").empty()) {
      result.passthrough.push_back(e.dump());
      continue;
    }
    auto uuid = string_field(e, "uuid");
    if (uuid.empty()) {
      groups.push_back({&e});
      continue;
    }
    auto [it, inserted] = group_of_uuid.try_emplace(uuid, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[it->second].push_back(&e);
  }

  std::vector<Entity> merged;
  for (auto& group : groups) {
    // Split one uuid's records by id, keeping first-seen id order.
    std::vector<std::pair<std::string, std::vector<const Entity*>>> by_id;
    for (const auto* e : group) {
      auto id = string_field(*e, "id");
      auto it = std::ranges::find_if(
          by_id, [&](const auto& entry) { return entry.first == id; });
      if (it == by_id.end()) {
        by_id.push_back({id, {e}});
      } else {
        it->second.push_back(e);
      }
    }

    std::vector<Entity> records;
    for (auto& [id, versions] : by_id) {
      if (versions.size() > 1) {
        result.collisions.push_back(Collision{
            CollisionType::SameUuidSameId, id, string_field(*versions[0], "uuid"),
            {id}, std::format("merged {} versions", versions.size())});
      }
      records.push_back(merge_versions(versions));
    }

    if (records.size() > 1) {
      // Newest creation keeps its id.
      auto newest = std::ranges::max_element(
          records, [](const Entity& a, const Entity& b) {
            return timestamp_key(a, "created_at") <
                   timestamp_key(b, "created_at");
          });
      auto uuid = string_field(*newest, "uuid");
      auto suffix = uuid.substr(0, std::min(UUID_PREFIX_LEN, uuid.size()));
      for (auto it = records.begin(); it != records.end(); ++it) {
        if (it == newest) {
          continue;
        }
        auto old_id = string_field(*it, "id");
        auto new_id = std::format("{}-conflict-{}", old_id, suffix);
        (*it)["id"] = new_id;
        result.collisions.push_back(
            Collision{CollisionType::SameUuidDifferentId, old_id, uuid,
                      {new_id}, std::format("renamed {} to {}", old_id, new_id)});
      }
    }

    for (auto& r : records) {
      merged.push_back(std::move(r));
    }
  }

  std::stable_sort(merged.begin(), merged.end(),
                   [](const Entity& a, const Entity& b) {
                     return timestamp_key(a, "created_at") <
                            timestamp_key(b, "created_at");
                   });

  // Same id, different uuids: the earliest keeps the id.
  std::map<std::string, std::vector<std::size_t>> holders;
  for (std::size_t i = 0; i < merged.size(); ++i) {
    holders[string_field(merged[i], "id")].push_back(i);
  }
  std::unordered_set<std::string> taken;
  for (const auto& e : merged) {
    taken.insert(string_field(e, "id"));
  }
  for (auto& [id, indices] : holders) {
    if (indices.size() < 2) {
      continue;
    }
    Collision collision{CollisionType::DifferentUuidSameId, id, {}, {}, {}};
    int n = 0;
    for (std::size_t k = 1; k < indices.size(); ++k) {
      std::string new_id;
      do {
        new_id = std::format("{}.{}", id, ++n);
      } while (taken.contains(new_id));
      taken.insert(new_id);
      merged[indices[k]]["id"] = new_id;
      collision.resolved_ids.push_back(new_id);
    }
    collision.action = std::format("renamed {} duplicate(s)", indices.size() - 1);
    result.collisions.push_back(std::move(collision));
  }

  result.entities = std::move(merged);
  return result;
}

auto resolve_jsonl(std::string_view text) -> Result<std::string> {
  std::vector<std::string> lines;
  for (auto& section : parse_conflict_sections(text)) {
    if (section.type == SectionType::Clean) {
      std::ranges::move(section.lines, std::back_inserter(lines));
    } else {
      std::ranges::move(section.ours, std::back_inserter(lines));
      std::ranges::move(section.theirs, std::back_inserter(lines));
    }
  }

  auto entities = parse_entities(lines);
  if (!entities) {
    return fail(entities.error());
  }

  auto resolved = resolve_entities(std::move(*entities));
  for (const auto& c : resolved.collisions) {
    log::info("Resolved {} collision on {}: {}", to_string_view(c.type), c.id,
              c.action);
  }

  std::string out;
  for (const auto& e : resolved.entities) {
    out += e.dump();
    out += '\n';
  }
  for (const auto& line : resolved.passthrough) {
    out += line;
    out += '\n';
  }
  return out;
}

}  // namespace taskweave
