#include "HashUtils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <utility>

namespace HashUtils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext make_sha256_context() {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const char* data, size_t size) {
    if (size > 0 && EVP_DigestUpdate(ctx, data, size) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }
}

std::string finalize_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
        throw std::runtime_error("SHA-256 digest finalization failed");
    }

    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result.push_back(hex_chars[digest[i] >> 4]);
        result.push_back(hex_chars[digest[i] & 0x0F]);
    }
    return result;
}

void update_from_file(EVP_MD_CTX* ctx, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to read " + path);
    }

    std::array<char, 64 * 1024> buffer;
    while (in) {
        in.read(buffer.data(), buffer.size());
        update(ctx, buffer.data(), static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        throw std::runtime_error("I/O error while reading " + path);
    }
}

std::string relative_name(const std::string& path, const std::string& base_dir) {
    if (base_dir.empty()) {
        return path;
    }
    std::error_code ec;
    auto rel = std::filesystem::relative(path, base_dir, ec);
    if (ec || rel.empty()) {
        return path;
    }
    return rel.generic_string();
}

}

std::string sha256_hex(const std::string& data) {
    auto ctx = make_sha256_context();
    update(ctx.get(), data.data(), data.size());
    return finalize_hex(ctx.get());
}

std::string hash_file(const std::string& path) {
    auto ctx = make_sha256_context();
    update_from_file(ctx.get(), path);
    return finalize_hex(ctx.get());
}

std::string hash_files(const std::vector<std::string>& paths, const std::string& base_dir) {
    std::vector<std::pair<std::string, std::string>> entries;
    entries.reserve(paths.size());
    for (const auto& path : paths) {
        entries.emplace_back(relative_name(path, base_dir), path);
    }
    std::sort(entries.begin(), entries.end());

    static const char separator = '\0';
    auto ctx = make_sha256_context();
    for (const auto& [name, path] : entries) {
        update(ctx.get(), name.data(), name.size());
        update(ctx.get(), &separator, 1);
        update_from_file(ctx.get(), path);
        update(ctx.get(), &separator, 1);
    }
    return finalize_hex(ctx.get());
}

}
