#pragma once
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + p);
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

inline void write_file(const std::string& p, const std::string& s) {
    std::ofstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("cannot write: " + p);
    f << s;
    if (!f) throw std::runtime_error("write failed: " + p);
}

inline std::string escape_xml(const std::string& s){
    std::string o; o.reserve(s.size()+8);
    for(char c: s){
        switch(c){
            case '&': o += "&amp;"; break;
            case '<': o += "&lt;"; break;
            case '>': o += "&gt;"; break;
            case '\"': o += "&quot;"; break;
            case '\'': o += "&apos;"; break;
            default: o += c;
        }
    }
    return o;
}

inline std::string lower_ext(const std::string& path){
    auto dot = path.find_last_of('.');
    if (dot==std::string::npos) return "";
    std::string e = path.substr(dot);
    for (auto& c: e) if (c>='A' && c<='Z') c = (char)(c-'A'+'a');
    return e;
}
