/*───────────────────────────────────────────────────────────
 *  common.hpp   –  logging, file helpers, lenient JSON numbers
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <algorithm>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace cropadvisor {

using json = nlohmann::json;

/* ────────────────── log / progress ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

void progress(const std::string& tag,
              size_t cur, size_t tot, size_t barWidth = 40);

/* ────────────────── file helpers ────────────────── */
bool        file_exists   (const std::string& path);
bool        is_directory  (const std::string& path);
bool        ensure_directory(const std::string& path);

/* write to <path>.tmp then rename over <path>; false on any I/O error */
bool        write_file_atomic(const std::string& path,
                              const std::string& content);

/* ────────────────── JSON / numeric helpers ────────────────── */

/* accepts 25, 25.0, "25", "25°C", "65%"; returns fallback otherwise */
double parse_number(const json& v, double fallback);
double parse_number(const json& obj, const char* key, double fallback);
bool   has_number  (const json& obj, const char* key);
std::string get_string(const json& obj, const char* key,
                       const std::string& fallback = "");
bool   get_bool    (const json& obj, const char* key, bool fallback = false);

std::string to_lower(std::string s);
bool        contains_ci(const std::string& haystack, const std::string& needle);

template <typename T>
inline T clamp_val(const T& v, const T& lo, const T& hi)
{
    return std::max(lo, std::min(v, hi));
}

/* round half away from zero to `digits` decimals */
double round_to(double v, int digits);

/* local time, ISO-8601 without zone (2026-10-19T08:15:02) */
std::string now_iso();
/* compact stamp for identities (20261019081502) */
std::string now_compact();

} // namespace cropadvisor
