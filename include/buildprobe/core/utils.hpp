#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace buildprobe::utils {

auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto ends_with(std::string_view s, std::string_view suffix) -> bool;

/// Thread-safe replacements for strerror and strsignal.
auto errno_message(int err) -> std::string;
auto signal_description(int sig) -> std::string;

/// Incremental SHA-256 over several inputs; `hex_digest()` finalizes.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(std::string_view data);
    [[nodiscard]] auto hex_digest() -> std::string;

private:
    EVP_MD_CTX* ctx_;
};

} // namespace buildprobe::utils
