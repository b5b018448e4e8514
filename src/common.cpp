/*───────────────────────────────────────────────────────────
 *  common.cpp   –  logging, file helpers, lenient JSON numbers
 *───────────────────────────────────────────────────────────*/
#include "cropadvisor/common.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sys/stat.h>   // stat / mkdir
#include <unistd.h>     // access

namespace cropadvisor {

namespace {
std::mutex g_log_mtx;   // keep concurrent request logs line-atomic
}

void logI(const std::string& s){ std::lock_guard<std::mutex> lk(g_log_mtx); std::cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const std::string& s){ std::lock_guard<std::mutex> lk(g_log_mtx); std::cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const std::string& s){ std::lock_guard<std::mutex> lk(g_log_mtx); std::cerr<<"[ERR]   "<<s<<'\n'; }

void progress(const std::string& tag, size_t cur, size_t tot, size_t W){
    std::lock_guard<std::mutex> lk(g_log_mtx);
    double f=tot?double(cur)/tot:1.0; size_t filled=size_t(f*W);
    std::cerr<<"\r"<<tag<<" ["<<std::string(filled,'=')<<std::string(W-filled,' ')
             <<"] "<<std::setw(3)<<int(f*100)<<"% ("<<cur<<'/'<<tot<<')'<<std::flush;
    if(cur==tot) std::cerr<<'\n';
}


/* ———— file / directory helpers ———— */
bool file_exists(const std::string& p){
    return ::access(p.c_str(), F_OK) == 0;
}
bool is_directory(const std::string& p){
    struct stat sb{};
    return ::stat(p.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode);
}

bool ensure_directory(const std::string& p){
    if (p.empty()) return false;
    if (is_directory(p)) return true;

    /* create parents first (mkdir -p) */
    auto slash = p.find_last_of('/');
    if (slash != std::string::npos && slash > 0)
        if (!ensure_directory(p.substr(0, slash))) return false;

    if (::mkdir(p.c_str(), 0755) != 0 && errno != EEXIST) {
        logE("mkdir failed: " + p);
        return false;
    }
    return true;
}

bool write_file_atomic(const std::string& path, const std::string& content){
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) return false;
        out << content;
        out.flush();
        if (!out) return false;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}


/* ─────────────────────────────  utilities  ────────────────────────────── */
double parse_number(const json& v, double fallback){
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) return fallback;

    /* "25°C", " 65 %", "12.5mm" → leading numeric prefix */
    const std::string s = v.get<std::string>();
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    const char* begin = s.c_str() + i;
    char* end = nullptr;
    errno = 0;
    double d = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(d)) return fallback;
    return d;
}

double parse_number(const json& o, const char* k, double fallback){
    if (!o.is_object()) return fallback;
    auto it = o.find(k);
    if (it == o.end() || it->is_null()) return fallback;
    return parse_number(*it, fallback);
}

bool has_number(const json& o, const char* k){
    if (!o.is_object()) return false;
    auto it = o.find(k);
    if (it == o.end()) return false;
    const double probe = parse_number(*it, NAN);
    return !std::isnan(probe);
}

std::string get_string(const json& o, const char* k, const std::string& fallback){
    if (!o.is_object()) return fallback;
    auto it = o.find(k);
    if (it == o.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

bool get_bool(const json& o, const char* k, bool fallback){
    if (!o.is_object()) return fallback;
    auto it = o.find(k);
    if (it == o.end()) return fallback;
    if (it->is_boolean()) return it->get<bool>();
    if (it->is_number())  return it->get<double>() != 0.0;
    if (it->is_string()) {
        std::string s = to_lower(it->get<std::string>());
        return s=="yes"||s=="true"||s=="1";
    }
    return fallback;
}

std::string to_lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

bool contains_ci(const std::string& h, const std::string& n){
    return to_lower(h).find(to_lower(n)) != std::string::npos;
}

double round_to(double v, int digits){
    const double m = std::pow(10.0, digits);
    return std::round(v * m) / m;
}

static std::string format_now(const char* fmt){
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

std::string now_iso()    { return format_now("%Y-%m-%dT%H:%M:%S"); }
std::string now_compact(){ return format_now("%Y%m%d%H%M%S"); }

} // namespace cropadvisor
