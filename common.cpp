#include "common.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>     // access

namespace credit_monitor {

static std::atomic<int> g_log_level{LOG_INFO};

void     set_log_level(LogLevel lvl) { g_log_level = lvl; }
LogLevel log_level()                 { return LogLevel(g_log_level.load()); }

LogLevel parse_log_level(const std::string& s)
{
    std::string l = s;
    std::transform(l.begin(), l.end(), l.begin(), ::tolower);
    if (l == "info")                   return LOG_INFO;
    if (l == "warn" || l == "warning") return LOG_WARN;
    if (l == "error" || l == "err")    return LOG_ERROR;
    throw ConfigError("unknown log level: " + s);
}

void logI(const std::string& s){ if (g_log_level <= LOG_INFO)  std::cerr<<"[INFO]  "<<s<<'\n'; }
void logW(const std::string& s){ if (g_log_level <= LOG_WARN)  std::cerr<<"[WARN]  "<<s<<'\n'; }
void logE(const std::string& s){ std::cerr<<"[ERR]   "<<s<<'\n'; }


/* ———— file helpers ———— */
bool file_exists(const std::string& p){
    return ::access(p.c_str(), F_OK) == 0;
}
bool has_ext(const std::string& f, const std::string& ext){
    return f.size() > ext.size() &&
           f.compare(f.size() - ext.size(), ext.size(), ext) == 0;
}
std::string read_file(const std::string& p){
    std::ifstream in(p, std::ios::binary);
    if (!in) throw InputError("cannot open " + p);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}


/* ———— numbers ———— */
std::optional<double> parse_number(const std::string& raw){
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<double> parse_number(const json& v){
    if (v.is_boolean()) return v.get<bool>() ? 1.0 : 0.0;
    if (v.is_number())  return v.get<double>();
    if (v.is_string())  return parse_number(v.get<std::string>());
    return std::nullopt;
}

double safe_f(const json& v){
    auto n = parse_number(v);
    return n ? *n : 0.0;
}
double safe_f(const json& o, const char* k){ return o.contains(k) ? safe_f(o[k]) : 0; }

bool getBool(const json& o, const char* k){
    if (!o.contains(k)) return false;
    const auto& v = o[k];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number())  return v.get<double>() != 0.0;
    if (v.is_string()){ std::string s = v.get<std::string>();
                        std::transform(s.begin(), s.end(), s.begin(), ::tolower);
                        return s=="yes" || s=="true" || s=="1"; }
    return false;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b]))     ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

} // namespace credit_monitor
