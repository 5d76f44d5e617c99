#include "core/Config.h"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace gw2util::core {

namespace {
    constexpr int kMaxExitDelayMs = 10000;

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();
        std::ifstream f(p, std::ios::binary);
        if (!f) return false;
        std::ostringstream oss;
        oss << f.rdbuf();
        out = oss.str();
        return true;
    }

    void ReadStringList(const nlohmann::json& arr, std::vector<std::string>& out)
    {
        if (!arr.is_array())
            return;

        std::vector<std::string> tmp;
        for (const auto& v : arr)
        {
            if (v.is_string())
                tmp.push_back(v.get<std::string>());
        }
        out = std::move(tmp);
    }
}

bool LoadConfig(Config& cfg, const std::filesystem::path& file) noexcept
{
    std::string text;
    if (!ReadFileToString(file, text))
        return false; // missing settings is the normal first-run case

    // Allow // comments, and avoid exceptions.
    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        spdlog::warn("LoadConfig: {} is not a valid JSON object; using defaults", file.string());
        return false;
    }

    Config tmp = cfg;

    if (const auto it = j.find("profiles"); it != j.end() && it->is_object())
    {
        if (auto d = it->find("directory"); d != it->end() && d->is_string())
            tmp.profileDir = std::filesystem::u8path(d->get<std::string>());
        if (auto a = it->find("activeFile"); a != it->end() && a->is_string() && !a->get<std::string>().empty())
            tmp.activeFile = a->get<std::string>();
        if (auto p = it->find("preserve"); p != it->end() && p->is_number_integer())
            tmp.preserve = static_cast<int>(std::clamp<std::int64_t>(p->get<std::int64_t>(), 0, kMaxPreserve));
    }

    if (const auto it = j.find("launch"); it != j.end() && it->is_object())
    {
        if (auto r = it->find("installRoots"); r != it->end() && r->is_array())
        {
            tmp.installRoots.clear();
            for (const auto& v : *r)
            {
                if (v.is_string())
                    tmp.installRoots.push_back(std::filesystem::u8path(v.get<std::string>()));
            }
        }
        if (auto e = it->find("executables"); e != it->end())
            ReadStringList(*e, tmp.executables);
        if (auto x = it->find("extraArgs"); x != it->end())
            ReadStringList(*x, tmp.extraArgs);
        if (auto a = it->find("autologin"); a != it->end() && a->is_boolean())
            tmp.autologin = a->get<bool>();
        if (auto l = it->find("loadinfo"); l != it->end() && l->is_boolean())
            tmp.loadinfo = l->get<bool>();
    }

    if (const auto it = j.find("ui"); it != j.end() && it->is_object())
    {
        if (auto p = it->find("pauseOnExit"); p != it->end() && p->is_boolean())
            tmp.pauseOnExit = p->get<bool>();
        if (auto d = it->find("exitDelayMs"); d != it->end() && d->is_number_integer())
            tmp.exitDelayMs = static_cast<int>(std::clamp<std::int64_t>(d->get<std::int64_t>(), 0, kMaxExitDelayMs));
    }

    cfg = std::move(tmp);
    return true;
}

bool SaveConfig(const Config& cfg, const std::filesystem::path& file) noexcept
{
    std::error_code ec;
    if (file.has_parent_path())
    {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec)
        {
            spdlog::error("SaveConfig: create_directories failed for {} ({}: {})",
                          file.parent_path().string(), ec.value(), ec.message());
            return false;
        }
    }

    nlohmann::json roots = nlohmann::json::array();
    for (const auto& r : cfg.installRoots)
        roots.push_back(r.u8string());

    nlohmann::json j;
    j["version"] = 1;
    j["profiles"] = {
        {"directory", cfg.profileDir.u8string()},
        {"activeFile", cfg.activeFile},
        {"preserve", cfg.preserve},
    };
    j["launch"] = {
        {"installRoots", roots},
        {"executables", cfg.executables},
        {"extraArgs", cfg.extraArgs},
        {"autologin", cfg.autologin},
        {"loadinfo", cfg.loadinfo},
    };
    j["ui"] = {
        {"pauseOnExit", cfg.pauseOnExit},
        {"exitDelayMs", cfg.exitDelayMs},
    };

    std::string payload = j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    payload.push_back('\n');

    std::ofstream f(file, std::ios::binary | std::ios::trunc);
    if (!f)
    {
        spdlog::error("SaveConfig: cannot open {} for writing", file.string());
        return false;
    }
    f.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    return static_cast<bool>(f);
}

} // namespace gw2util::core
