#include "pqg/edge_id.hpp"
#include "pqg/error.hpp"
#include <openssl/evp.h>
#include <array>
#include <iomanip>
#include <random>
#include <sstream>

namespace pqg {

namespace {

void append_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void append_string(std::vector<uint8_t>& out, const std::string& value) {
    append_u64(out, value.size());
    out.insert(out.end(), value.begin(), value.end());
}

std::string to_hex(const uint8_t* data, size_t len) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        ss << std::setw(2) << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace

std::vector<uint8_t> canonical_edge_bytes(const std::string& subject,
                                          const std::string& predicate,
                                          const std::vector<std::string>& objects,
                                          const std::optional<std::string>& named_graph) {
    std::vector<uint8_t> out;
    const std::string tag = edge_encoding_tag;
    out.insert(out.end(), tag.begin(), tag.end());

    append_string(out, subject);
    append_string(out, predicate);

    append_u64(out, objects.size());
    for (const auto& object : objects) {
        append_string(out, object);
    }

    out.push_back(named_graph ? 1 : 0);
    if (named_graph) {
        append_string(out, *named_graph);
    }
    return out;
}

std::string sha256_hex(const uint8_t* data, size_t len) {
    std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data, len) != 1 ||
        EVP_DigestFinal_ex(ctx, digest.data(), &digest_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw error("OpenSSL: SHA-256 digest failed");
    }

    EVP_MD_CTX_free(ctx);
    if (digest_len != 32) {
        throw error("OpenSSL: unexpected SHA-256 digest length");
    }
    return to_hex(digest.data(), digest_len);
}

std::string edge_pid(const std::string& subject,
                     const std::string& predicate,
                     const std::vector<std::string>& objects,
                     const std::optional<std::string>& named_graph) {
    auto bytes = canonical_edge_bytes(subject, predicate, objects, named_graph);
    return anon_prefix + sha256_hex(bytes.data(), bytes.size());
}

std::string anonymous_pid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    uint64_t a = dis(gen);
    uint64_t b = dis(gen);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((a >> (56 - i * 8)) & 0xFF);
        bytes[8 + i] = static_cast<uint8_t>((b >> (56 - i * 8)) & 0xFF);
    }

    // Set version (4) and variant (RFC 4122)
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return anon_prefix + to_hex(bytes.data(), bytes.size());
}

} // namespace pqg
