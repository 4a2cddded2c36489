#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::vector<unsigned char> hmac_sha256(const std::string& key, const std::string& message){
    unsigned int len = 0;
    std::vector<unsigned char> mac(EVP_MAX_MD_SIZE);
    if(!HMAC(EVP_sha256(), key.data(), (int)key.size(),
             (const unsigned char*)message.data(), message.size(), mac.data(), &len)){
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    mac.resize(len);
    return mac;
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), (int)count) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_hex(std::size_t byte_count){
    return hex_from_bytes(random_bytes(byte_count));
}

std::string base64_encode(const std::vector<unsigned char>& data){
    if(data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock((unsigned char*)&out[0], data.data(), (int)data.size());
    out.resize(n);
    return out;
}

std::string base64_encode(const std::string& data){
    return base64_encode(std::vector<unsigned char>(data.begin(), data.end()));
}

std::vector<unsigned char> base64_decode(const std::string& text){
    if(text.empty()) return {};
    if(text.size() % 4 != 0) throw std::invalid_argument("base64 length is not a multiple of 4");
    std::vector<unsigned char> out(3 * text.size() / 4);
    int n = EVP_DecodeBlock(out.data(), (const unsigned char*)text.data(), (int)text.size());
    if(n < 0) throw std::invalid_argument("invalid base64");
    // EVP_DecodeBlock keeps the zero bytes produced by padding
    std::size_t pad = 0;
    if(text[text.size() - 1] == '=') pad++;
    if(text[text.size() - 2] == '=') pad++;
    out.resize(n - pad);
    return out;
}

std::string base64url_encode(const std::vector<unsigned char>& data){
    std::string s = base64_encode(data);
    for(auto& c : s){
        if(c == '+') c = '-';
        else if(c == '/') c = '_';
    }
    while(!s.empty() && s.back() == '=') s.pop_back();
    return s;
}

TimePoint utc_now(){
    auto now = std::chrono::system_clock::now();
    return std::chrono::time_point_cast<std::chrono::milliseconds>(now);
}

std::string format_rfc3339(TimePoint tp){
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    long long secs = ms / 1000;
    long long frac = ms % 1000;
    if(frac < 0){ frac += 1000; secs -= 1; }
    std::time_t t = (std::time_t)secs;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[80];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, frac);
    return out;
}

std::optional<TimePoint> parse_rfc3339(const std::string& text){
    std::tm tm{};
    int consumed = 0;
    if(std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                   &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                   &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6){
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::size_t pos = (std::size_t)consumed;
    long long millis = 0;
    if(pos < text.size() && text[pos] == '.'){
        ++pos;
        int digits = 0;
        while(pos < text.size() && std::isdigit((unsigned char)text[pos])){
            if(digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        for(int i = digits; i < 3; ++i) millis *= 10;
    }
    long long offset = 0;
    if(pos < text.size() && (text[pos] == '+' || text[pos] == '-')){
        int oh = 0, om = 0;
        if(std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return std::nullopt;
        offset = (oh * 3600LL + om * 60LL) * (text[pos] == '+' ? 1 : -1);
    } else if(pos >= text.size() || (text[pos] != 'Z' && text[pos] != 'z')){
        return std::nullopt;
    }
    long long secs = (long long)timegm(&tm) - offset;
    return TimePoint(std::chrono::milliseconds(secs * 1000 + millis));
}

std::vector<std::string> split(const std::string& text, char sep){
    std::vector<std::string> out;
    std::string cur;
    for(char c : text){
        if(c == sep){
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::string short_id(const std::string& id, std::size_t len){
    return id.size() <= len ? id : id.substr(0, len);
}
