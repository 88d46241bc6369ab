#pragma once
// include/powergrid/save/GridSave.hpp
//
// Flat, versioned serialization of a power grid. Network ids and node handles
// are never stored: loading re-derives the whole partition from nodes + links.

#include <nlohmann/json.hpp>
#include <cstdint>
#include <expected>                         // C++23
#include <filesystem>
#include <string>
#include <vector>

#include "powergrid/grid/Types.hpp"

namespace powergrid {

// Found by ADL from nlohmann's serializer, so it lives beside GridPos.
void to_json(nlohmann::json& j, const GridPos& v);
void from_json(const nlohmann::json& j, GridPos& v);

} // namespace powergrid

namespace powergrid::save {

using json = nlohmann::json;

inline constexpr std::int32_t kGridSchemaVersion = 1;

struct SaveError {
    enum class Code {
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
        MigrationFailed
    } code{};
    std::string message;
};

struct NodeRecord {
    NodeKind      kind{NodeKind::Link};
    GridPos       position{};
    std::uint32_t amount{0};             // output (producer) or demand (consumer)

    // Producers only.
    bool          requires_fuel{false};
    double        fuel{0.0};
    double        consumption_rate{1.0};
    std::uint32_t startup_delay_ticks{0};
    std::uint32_t startup_timer{0};
    ProducerState state{ProducerState::Idle};

    // Unknown, future fields preserved and round-tripped.
    json extras = json::object();
};

// Indices into GridSave::nodes.
struct LinkRecord {
    std::uint32_t a{0};
    std::uint32_t b{0};
};

struct GridSave {
    // Bump this when schema changes (and write a migration step).
    std::int32_t schema_version{kGridSchemaVersion};
    std::uint64_t tick{0};

    std::vector<NodeRecord> nodes;
    std::vector<LinkRecord> links;

    json extras = json::object();
};

// ---------- JSON (de)serialization ----------
void to_json(json& j, const NodeRecord& v);
void from_json(const json& j, NodeRecord& v);

void to_json(json& j, const LinkRecord& v);
void from_json(const json& j, LinkRecord& v);

void to_json(json& j, const GridSave& v);
void from_json(const json& j, GridSave& v);

// ---------- I/O API ----------
std::expected<GridSave, SaveError> LoadGridSave(const std::filesystem::path& file);

// Writes <file>.tmp and renames it over <file>.
std::expected<void, SaveError> SaveGridSave(const GridSave& save, const std::filesystem::path& file);

// Updates raw JSON in place from older schema versions to `target_schema_version`.
bool MigrateGridJsonInPlace(json& j, int target_schema_version, std::string& outError);

} // namespace powergrid::save
