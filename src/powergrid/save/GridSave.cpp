// src/powergrid/save/GridSave.cpp
#include "powergrid/save/GridSave.hpp"

#include <fstream>
#include <string>
#include <system_error>
#include <unordered_set>

namespace powergrid {

void to_json(nlohmann::json& j, const GridPos& v) {
    j = nlohmann::json::array({ v.x, v.y, v.z });
}

void from_json(const nlohmann::json& j, GridPos& v) {
    if (j.is_array() && j.size() == 3) {
        v.x = j.at(0).get<int>();
        v.y = j.at(1).get<int>();
        v.z = j.at(2).get<int>();
    } else if (j.is_object()) {
        v.x = j.value("x", 0);
        v.y = j.value("y", 0);
        v.z = j.value("z", 0);
    } else {
        throw nlohmann::json::type_error::create(302, "GridPos expects array[3] or object", &j);
    }
}

} // namespace powergrid

namespace powergrid::save {

// ---------- helpers ----------

static json collect_extras(const json& obj,
                           std::initializer_list<const char*> known)
{
    json extras = json::object();
    if (!obj.is_object()) return extras;

    std::unordered_set<std::string> known_set;
    known_set.reserve(known.size());
    for (auto* k : known) known_set.emplace(k);

    for (const auto& [k, v] : obj.items()) {
        if (!known_set.count(k)) extras[k] = v;
    }
    return extras;
}

static void merge_extras(json& dst, const json& extras)
{
    if (!dst.is_object() || !extras.is_object()) return;
    for (const auto& [k, v] : extras.items()) {
        if (!dst.contains(k)) { dst[k] = v; }
    }
}

// ---------- NodeRecord ----------
void to_json(json& j, const NodeRecord& v) {
    j = json::object({
        {"kind",     ToString(v.kind)},
        {"position", v.position},
        {"amount",   v.amount}
    });
    if (v.kind == NodeKind::Producer) {
        j["requires_fuel"] = v.requires_fuel;
        j["state"]         = ToString(v.state);
        if (v.requires_fuel) {
            j["fuel"]                = v.fuel;
            j["consumption_rate"]    = v.consumption_rate;
            j["startup_delay_ticks"] = v.startup_delay_ticks;
            j["startup_timer"]       = v.startup_timer;
        }
    }
    merge_extras(j, v.extras);
}

void from_json(const json& j, NodeRecord& v) {
    const std::string kind = j.at("kind").get<std::string>();
    if (!ParseNodeKind(kind, v.kind))
        throw json::type_error::create(302, "unknown node kind '" + kind + "'", &j);

    v.position = j.value("position", GridPos{});
    v.amount   = j.value("amount", std::uint32_t{0});

    v.requires_fuel       = j.value("requires_fuel", false);
    v.fuel                = j.value("fuel", 0.0);
    v.consumption_rate    = j.value("consumption_rate", 1.0);
    v.startup_delay_ticks = j.value("startup_delay_ticks", std::uint32_t{0});
    v.startup_timer       = j.value("startup_timer", std::uint32_t{0});

    const std::string state = j.value("state", std::string{"idle"});
    if (!ParseProducerState(state, v.state))
        throw json::type_error::create(302, "unknown producer state '" + state + "'", &j);

    v.extras = collect_extras(j, {"kind","position","amount","requires_fuel","fuel",
                                  "consumption_rate","startup_delay_ticks","startup_timer","state"});
}

// ---------- LinkRecord ----------
void to_json(json& j, const LinkRecord& v) {
    j = json::array({ v.a, v.b });
}

void from_json(const json& j, LinkRecord& v) {
    if (j.is_array() && j.size() == 2) {
        v.a = j.at(0).get<std::uint32_t>();
        v.b = j.at(1).get<std::uint32_t>();
    } else if (j.is_object()) {
        v.a = j.at("a").get<std::uint32_t>();
        v.b = j.at("b").get<std::uint32_t>();
    } else {
        throw json::type_error::create(302, "LinkRecord expects array[2] or object", &j);
    }
}

// ---------- GridSave ----------
void to_json(json& j, const GridSave& v) {
    j = json::object({
        {"schema_version", v.schema_version},
        {"tick",  v.tick},
        {"nodes", v.nodes},
        {"links", v.links}
    });
    merge_extras(j, v.extras);
}

void from_json(const json& j, GridSave& v) {
    v.schema_version = j.value("schema_version", kGridSchemaVersion);
    v.tick  = j.value("tick", std::uint64_t{0});
    v.nodes = j.value("nodes", std::vector<NodeRecord>{});
    v.links = j.value("links", std::vector<LinkRecord>{});
    v.extras = collect_extras(j, {"schema_version","tick","nodes","links"});
}

// ---------- Migration (JSON-level) ----------
bool MigrateGridJsonInPlace(json& j, int target_schema_version, std::string& outError)
{
    const int file_ver = j.value("schema_version", kGridSchemaVersion);
    if (file_ver > target_schema_version) {
        outError = "schema_version=" + std::to_string(file_ver) + " is newer than supported "
                 + std::to_string(target_schema_version);
        return false;
    }
    if (file_ver < 1) {
        outError = "No migration path for schema_version=" + std::to_string(file_ver);
        return false;
    }
    j["schema_version"] = target_schema_version;
    return true;
}

// ---------- I/O ----------

std::expected<GridSave, SaveError> LoadGridSave(const std::filesystem::path& file)
{
    try {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs) {
            return std::unexpected(SaveError{ SaveError::Code::IoOpenFail, "Cannot open file: " + file.string() });
        }

        json doc = json::parse(ifs);

        if (!doc.is_object()) {
            return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, "Root JSON must be an object" });
        }

        std::string migErr;
        if (!MigrateGridJsonInPlace(doc, kGridSchemaVersion, migErr)) {
            return std::unexpected(SaveError{ SaveError::Code::MigrationFailed, migErr });
        }

        return doc.get<GridSave>();
    }
    catch (const json::type_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    catch (const json::out_of_range& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonTypeError, e.what() });
    }
    catch (const json::parse_error& e) {
        return std::unexpected(SaveError{ SaveError::Code::JsonParseError, e.what() });
    }
}

std::expected<void, SaveError> SaveGridSave(const GridSave& save, const std::filesystem::path& file)
{
    try {
        const json j = save;
        const std::string serialized = j.dump(2);

        if (file.has_parent_path())
            std::filesystem::create_directories(file.parent_path());

        std::filesystem::path tmpPath = file;
        tmpPath += ".tmp";

        {
            std::ofstream ofs(tmpPath, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "Cannot open for write: " + tmpPath.string() });
            }
            ofs.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
            ofs.flush();
            if (!ofs) {
                std::error_code ec;
                std::filesystem::remove(tmpPath, ec);
                return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, "Write failed for: " + tmpPath.string() });
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmpPath, file, ec);
        if (ec) {
            std::error_code rmEc;
            std::filesystem::remove(tmpPath, rmEc);
            return std::unexpected(SaveError{ SaveError::Code::IoWriteFail,
                "Rename to " + file.string() + " failed: " + ec.message() });
        }
        return {};
    }
    catch (const std::exception& e) {
        return std::unexpected(SaveError{ SaveError::Code::IoWriteFail, e.what() });
    }
}

} // namespace powergrid::save
