#include "Config.h"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string_view>
#include <system_error>

#include <spdlog/spdlog.h>

namespace core {

std::filesystem::path ConfigPath(const std::filesystem::path& dir) {
    return dir / "powergrid.ini";
}

static inline void TrimInPlace(std::string& s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());

    while (!s.empty() && is_space(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

static std::string_view Trimmed(std::string_view sv) noexcept
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

template <class T>
static bool ParseNumber(std::string_view sv, T& out) noexcept
{
    sv = Trimmed(sv);

    T v{};
    const char* begin = sv.data();
    const char* end = sv.data() + sv.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (sv.empty() || ec != std::errc{} || ptr != end)
        return false;

    out = v;
    return true;
}

static bool EqualsI(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
        return false;

    for (std::size_t i = 0; i < a.size(); ++i)
    {
        const unsigned char ca = static_cast<unsigned char>(a[i]);
        const unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }

    return true;
}

static bool ParseBool(std::string_view sv, bool& out) noexcept
{
    sv = Trimmed(sv);

    //   true  values:  1, true, yes, on
    //   false values:  0, false, no, off
    if (sv == "1") { out = true; return true; }
    if (sv == "0") { out = false; return true; }

    if (EqualsI(sv, "true") || EqualsI(sv, "yes") || EqualsI(sv, "on"))
    {
        out = true;
        return true;
    }

    if (EqualsI(sv, "false") || EqualsI(sv, "no") || EqualsI(sv, "off"))
    {
        out = false;
        return true;
    }

    return false;
}

static bool ParseLevel(std::string_view sv, spdlog::level::level_enum& out) noexcept
{
    sv = Trimmed(sv);
    for (int i = 0; i < spdlog::level::n_levels; ++i)
    {
        const auto level = static_cast<spdlog::level::level_enum>(i);
        const auto name = spdlog::level::to_string_view(level);
        if (EqualsI(sv, std::string_view(name.data(), name.size())))
        {
            out = level;
            return true;
        }
    }
    if (EqualsI(sv, "warn")) { out = spdlog::level::warn; return true; }
    if (EqualsI(sv, "err"))  { out = spdlog::level::err;  return true; }
    return false;
}

bool ApplyConfigValue(Config& cfg, std::string_view k, std::string_view v)
{
    auto& g = cfg.grid;

    if (k == "tick_rate_hz")
    {
        int parsed = 0;
        if (!ParseNumber(v, parsed) || parsed <= 0) return false;
        g.tick_rate_hz = parsed;
        return true;
    }
    if (k == "budget_ms")
    {
        double parsed = 0.0;
        if (!ParseNumber(v, parsed) || !std::isfinite(parsed) || parsed <= 0.0) return false;
        g.budget_ms = parsed;
        return true;
    }
    if (k == "max_event_depth")
    {
        std::uint32_t parsed = 0;
        if (!ParseNumber(v, parsed) || parsed == 0) return false;
        g.max_event_depth = parsed;
        return true;
    }
    if (k == "auto_link_adjacent")
        return ParseBool(v, g.auto_link_adjacent);
    if (k == "default_consumption_rate")
    {
        double parsed = 0.0;
        if (!ParseNumber(v, parsed) || !std::isfinite(parsed) || parsed < 0.0) return false;
        g.default_consumption_rate = parsed;
        return true;
    }
    if (k == "default_startup_delay_ticks")
        return ParseNumber(v, g.default_startup_delay_ticks);

    if (k == "log_level")
        return ParseLevel(v, cfg.log.level);
    if (k == "async_logging")
        return ParseBool(v, cfg.log.async_logging);
    if (k == "log_console")
        return ParseBool(v, cfg.log.console);
    if (k == "log_file")
    {
        cfg.log.file = std::string(Trimmed(v));
        return true;
    }

    constexpr std::string_view kForward = "forward.";
    if (k.substr(0, kForward.size()) == kForward)
    {
        const std::string_view name = k.substr(kForward.size());
        if (name == "consumer_power")
            return ParseBool(v, g.forward_consumer_power);

        powergrid::evt::TopologyChangeKind kind{};
        if (!powergrid::evt::ParseTopologyChangeKind(name, kind))
            return false;
        bool parsed = true;
        if (!ParseBool(v, parsed))
            return false;
        g.forward[static_cast<std::size_t>(kind)] = parsed;
        return true;
    }

    return false;
}

// Tiny INI-style parser: key=value lines
bool LoadConfig(Config& cfg, const std::filesystem::path& dir)
{
    const auto path = ConfigPath(dir);

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    std::ostringstream oss;
    oss << f.rdbuf();
    std::string text = oss.str();

    // Editors on Windows like to prepend a UTF-8 BOM.
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);

    std::istringstream iss(text);
    std::string line;
    int lineNo = 0;
    while (std::getline(iss, line))
    {
        ++lineNo;

        std::string tmp = line;
        TrimInPlace(tmp);
        if (tmp.empty()) continue;
        if (tmp[0] == '#' || tmp[0] == ';') continue;
        if (tmp[0] == '[') continue;   // section headers carry no meaning

        const auto pos = tmp.find('=');
        if (pos == std::string::npos) continue;

        std::string k = tmp.substr(0, pos);
        std::string v = tmp.substr(pos + 1);
        TrimInPlace(k);
        TrimInPlace(v);

        // Strip trailing inline comments:
        //   tick_rate_hz=20   # ticks per second
        //   budget_ms=50      ; per tick
        //   async_logging=on  // file writes off-thread
        // log_file is a path and keeps the whole value.
        if (k != "log_file")
        {
            std::size_t cut = std::string::npos;
            auto consider = [&](std::size_t p)
            {
                if (p == std::string::npos) return;
                if (cut == std::string::npos || p < cut) cut = p;
            };

            consider(v.find('#'));
            consider(v.find(';'));
            consider(v.find("//"));

            if (cut != std::string::npos)
            {
                v.erase(cut);
                TrimInPlace(v);
            }
        }

        if (k.empty()) continue;

        if (!ApplyConfigValue(cfg, k, v))
            spdlog::warn("LoadConfig: {}:{}: ignoring '{}={}'", path.string(), lineNo, k, v);
    }

    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& dir)
{
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                      dir.string(), ec.value(), ec.message());
        return false;
    }

    const auto& g = cfg.grid;
    const auto level = spdlog::level::to_string_view(cfg.log.level);

    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "tick_rate_hz="                << g.tick_rate_hz << "\n";
    oss << "budget_ms="                   << g.budget_ms << "\n";
    oss << "max_event_depth="             << g.max_event_depth << "\n";
    oss << "auto_link_adjacent="          << (g.auto_link_adjacent ? 1 : 0) << "\n";
    oss << "default_consumption_rate="    << g.default_consumption_rate << "\n";
    oss << "default_startup_delay_ticks=" << g.default_startup_delay_ticks << "\n";
    oss << "log_level="                   << std::string_view(level.data(), level.size()) << "\n";
    oss << "async_logging="               << (cfg.log.async_logging ? 1 : 0) << "\n";
    oss << "log_console="                 << (cfg.log.console ? 1 : 0) << "\n";
    oss << "log_file="                    << cfg.log.file << "\n";
    for (std::size_t i = 0; i < g.forward.size(); ++i)
    {
        const auto kind = static_cast<powergrid::evt::TopologyChangeKind>(i);
        oss << "forward." << powergrid::evt::ToString(kind) << "=" << (g.forward[i] ? 1 : 0) << "\n";
    }
    oss << "forward.consumer_power=" << (g.forward_consumer_power ? 1 : 0) << "\n";
    const std::string text = oss.str();

    const auto path = ConfigPath(dir);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("SaveConfig: cannot open {}", path.string());
        return false;
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(f);
}

} // namespace core
