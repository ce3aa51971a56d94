#pragma once
#include "mapstitch/core/Errors.hpp"

#include <optional>
#include <stdexcept>
#include <string>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   mapstitch-cli combine --tiles=./tiles --world=overworld --zoom=2
    - Keys are case-sensitive.

  Notes:
    - A missing key returns the default value.
    - A present key with a malformed number throws mapstitch::ConfigError.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get string value for "--key=value". Returns nullopt if not found. */
inline std::optional<std::string> argFind(int argc, char** argv, const std::string& key) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return std::nullopt;
}

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    return argFind(argc, argv, key).value_or(def);
}

/* Get int value for "--key=value". Returns 'def' if missing or empty. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    const std::string v = argValue(argc, argv, key, "");
    if (v.empty()) return def;
    try {
        std::size_t used = 0;
        const int out = std::stoi(v, &used);
        if (used != v.size()) throw mapstitch::ConfigError("--" + key + ": trailing characters in '" + v + "'");
        return out;
    } catch (const std::invalid_argument&) {
        throw mapstitch::ConfigError("--" + key + ": not a number: '" + v + "'");
    } catch (const std::out_of_range&) {
        throw mapstitch::ConfigError("--" + key + ": out of range: '" + v + "'");
    }
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}
