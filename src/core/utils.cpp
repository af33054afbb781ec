#include "buildprobe/core/utils.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <string.h>

#include <openssl/evp.h>

namespace buildprobe::utils {

namespace {

auto to_hex(const unsigned char* bytes, unsigned int len) -> std::string {
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

} // anonymous namespace

auto timestamp_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), ::tolower);
    return result;
}

auto ends_with(std::string_view s, std::string_view suffix) -> bool {
    return s.ends_with(suffix);
}

auto errno_message(int err) -> std::string {
    return std::system_category().message(err);
}

auto signal_description(int sig) -> std::string {
    if (const char* descr = ::sigdescr_np(sig)) return descr;
    return "Unknown signal " + std::to_string(sig);
}

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr);
}

Sha256::~Sha256() {
    EVP_MD_CTX_free(ctx_);
}

void Sha256::update(std::string_view data) {
    EVP_DigestUpdate(ctx_, data.data(), data.size());
}

auto Sha256::hex_digest() -> std::string {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_DigestFinal_ex(ctx_, hash, &hash_len);
    return to_hex(hash, hash_len);
}

} // namespace buildprobe::utils
