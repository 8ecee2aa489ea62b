#include "GeneratorSettings.h"
#include "tessella/core/Log.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace tessella {

static std::string Trim(std::string s) {
    auto isSpace = [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    while (!s.empty() && isSpace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && isSpace((unsigned char)s.back())) s.pop_back();
    return s;
}

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

static bool ParseBool(const std::string& val, bool& out) {
    const std::string v = ToLower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") { out = true; return true; }
    if (v == "0" || v == "false" || v == "no" || v == "off") { out = false; return true; }
    return false;
}

static bool ParseCount(const std::string& val, uint32_t& out) {
    if (val.empty() || !std::all_of(val.begin(), val.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        const unsigned long long parsed = std::stoull(val);
        if (parsed > std::numeric_limits<uint32_t>::max()) return false;
        out = static_cast<uint32_t>(parsed);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static std::vector<std::string> SplitList(const std::string& val) {
    std::vector<std::string> items;
    std::stringstream ss(val);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

GeneratorSettings GeneratorSettings::Load(const std::string& path) {
    GeneratorSettings s{};
    std::ifstream f(path);
    if (!f.is_open()) {
        TESSELLA_CORE_DEBUG("No settings at {}, using defaults", path);
        return s;
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(f, line)) {
        ++lineNumber;
        line = Trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            TESSELLA_CORE_WARN("{}:{}: expected key=value", path, lineNumber);
            continue;
        }
        std::string key = Trim(line.substr(0, eq));
        std::string val = Trim(line.substr(eq + 1));

        bool ok = true;
        if (key == "Rows") {
            ok = ParseCount(val, s.rows);
        } else if (key == "Cols") {
            ok = ParseCount(val, s.cols);
        } else if (key == "ReverseWinding") {
            ok = ParseBool(val, s.reverseWinding);
        } else if (key == "OutputDirectory") {
            ok = !val.empty();
            if (ok) s.outputDirectory = val;
        } else if (key == "Tilings") {
            auto items = SplitList(val);
            ok = !items.empty();
            if (ok) s.tilings = std::move(items);
        } else if (key == "Validate") {
            ok = ParseBool(val, s.validate);
        } else if (key == "LogLevel") {
            ok = !val.empty();
            if (ok) s.logLevel = ToLower(val);
        } else {
            TESSELLA_CORE_WARN("{}:{}: unknown setting '{}'", path, lineNumber, key);
            continue;
        }

        if (!ok) {
            TESSELLA_CORE_WARN("{}:{}: invalid value '{}' for {}, keeping default", path, lineNumber, val, key);
        }
    }

    TESSELLA_CORE_DEBUG("GeneratorSettings loaded from {} (Rows={}, Cols={}, ReverseWinding={})",
                        path, s.rows, s.cols, s.reverseWinding);
    return s;
}

bool GeneratorSettings::Save(const std::string& path) const {
    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        TESSELLA_CORE_ERROR("Failed to save GeneratorSettings to {}", path);
        return false;
    }

    f << "# Tessella tiling generator settings\n";
    f << "# Tilings is a comma separated list of tiling names (TRIANGLE, SQUARE, HEXAGON,\n";
    f << "# SEMI-REGULAR-1 .. SEMI-REGULAR-8) or 'all'.\n";
    f << "Rows=" << rows << "\n";
    f << "Cols=" << cols << "\n";
    f << "ReverseWinding=" << (reverseWinding ? 1 : 0) << "\n";
    f << "OutputDirectory=" << outputDirectory << "\n";
    f << "Tilings=";
    for (size_t i = 0; i < tilings.size(); ++i) {
        if (i > 0) f << ",";
        f << tilings[i];
    }
    f << "\n";
    f << "Validate=" << (validate ? 1 : 0) << "\n";
    f << "LogLevel=" << logLevel << "\n";
    f.close();

    if (f.fail()) {
        TESSELLA_CORE_ERROR("Failed to write GeneratorSettings to {}", path);
        return false;
    }

    TESSELLA_CORE_INFO("GeneratorSettings saved to {}", path);
    return true;
}

} // namespace tessella
