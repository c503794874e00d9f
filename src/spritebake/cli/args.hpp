#pragma once
#include <string>
#include <stdexcept>
#include <optional>

#include "spritebake/core/Geometry.hpp"

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   prog bake --size=256x256 --frames=1:24
    - Keys are case-sensitive.

  Notes:
    - If a key is missing or a number does not parse, the default is returned.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return def;
}

/* Get int value for "--key=value". Returns 'def' on missing or parse error. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    try {
        std::string v = argValue(argc, argv, key, "");
        if (v.empty()) return def;
        return std::stoi(v);
    } catch (const std::logic_error&) { return def; }
}

/* Get double value for "--key=value". Returns 'def' on missing or parse error. */
inline double argValueDouble(int argc, char** argv, const std::string& key, double def) {
    try {
        std::string v = argValue(argc, argv, key, "");
        if (v.empty()) return def;
        return std::stod(v);
    } catch (const std::logic_error&) { return def; }
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* True if "--key=..." or "--key" was given. */
inline bool argGiven(int argc, char** argv, const std::string& key) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return true;
    }
    return argHas(argc, argv, key);
}

/* Parse "x,y,z". Returns nothing on malformed input. */
inline std::optional<spritebake::Vec3> parseVec3(const std::string& s) {
    try {
        const auto c1 = s.find(',');
        const auto c2 = s.find(',', c1 == std::string::npos ? c1 : c1 + 1);
        if (c1 == std::string::npos || c2 == std::string::npos) return std::nullopt;
        return spritebake::Vec3{std::stod(s.substr(0, c1)),
                                std::stod(s.substr(c1 + 1, c2 - c1 - 1)),
                                std::stod(s.substr(c2 + 1))};
    } catch (const std::logic_error&) { return std::nullopt; }
}

/* Parse "<a><sep><b>" into two ints, e.g. "256x256" or "1:24". */
inline bool parsePair(const std::string& s, char sep, int& a, int& b) {
    const auto p = s.find(sep);
    if (p == std::string::npos || p == 0) return false;
    try {
        a = std::stoi(s.substr(0, p));
        b = std::stoi(s.substr(p + 1));
        return true;
    } catch (const std::logic_error&) { return false; }
}
