#include "utils.hpp"
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <utility>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(const std::vector<std::uint8_t>& data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256(data.data(), data.size(), out.data());
    return hex_from_bytes(out);
}

std::string sha256_hex(const std::string& data){
    return sha256_hex(std::vector<std::uint8_t>(data.begin(), data.end()));
}

std::string format_bytes(uint64_t bytes){
    static const std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    if(bytes < 1024) return std::to_string(bytes) + " B";
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while(value >= 1024.0 && unit + 1 < units.size()){
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

std::string format_percent(double percent){
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << percent << "%";
    return oss.str();
}

std::string guess_mime_type(const std::string& filename){
    static const std::array<std::pair<const char*, const char*>, 18> table = {{
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"html", "text/html"},
        {"htm", "text/html"},
        {"css", "text/css"},
        {"csv", "text/csv"},
        {"json", "application/json"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"gz", "application/gzip"},
        {"tar", "application/x-tar"},
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"svg", "image/svg+xml"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
    }};
    auto dot = filename.rfind('.');
    if(dot == std::string::npos || dot + 1 >= filename.size()) return "application/octet-stream";
    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    for(const auto& entry : table){
        if(ext == entry.first) return entry.second;
    }
    return "application/octet-stream";
}

std::string make_file_id(const std::string& sender_id, int64_t millis, const std::string& filename){
    return sender_id + "_" + std::to_string(millis) + "_" + filename;
}

std::string percent_encode(const std::string& value){
    std::ostringstream oss;
    oss << std::uppercase << std::hex;
    for(unsigned char c : value){
        if(std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~'){
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string percent_decode(const std::string& value){
    std::string out;
    out.reserve(value.size());
    for(std::size_t i = 0; i < value.size(); ++i){
        if(value[i] == '%' && i + 2 < value.size() &&
           std::isxdigit(static_cast<unsigned char>(value[i + 1])) &&
           std::isxdigit(static_cast<unsigned char>(value[i + 2]))){
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(value[i]);
        }
    }
    return out;
}

int64_t unix_millis_now(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
