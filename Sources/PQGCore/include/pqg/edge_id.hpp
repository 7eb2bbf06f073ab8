#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pqg {

/// Prefix of every generated pid
inline constexpr const char* anon_prefix = "anon_";

/// Tag that opens the canonical edge encoding. Bump it if the layout changes.
inline constexpr const char* edge_encoding_tag = "pqg-edge-v1";

/// Canonical bytes of an edge:
///   tag, then len+bytes of subject and predicate (u64 big-endian lengths),
///   u64 object count followed by len+bytes of each object in order,
///   u8 has_graph and, when set, len+bytes of the named graph.
std::vector<uint8_t> canonical_edge_bytes(const std::string& subject,
                                          const std::string& predicate,
                                          const std::vector<std::string>& objects,
                                          const std::optional<std::string>& named_graph);

/// Deterministic edge pid: "anon_" + lowercase hex SHA-256 of the canonical bytes.
std::string edge_pid(const std::string& subject,
                     const std::string& predicate,
                     const std::vector<std::string>& objects,
                     const std::optional<std::string>& named_graph = std::nullopt);

/// Lowercase hex SHA-256 digest (OpenSSL EVP).
std::string sha256_hex(const uint8_t* data, size_t len);

/// Random pid for objects that arrive without one: "anon_" + 32 hex digits (UUID v4).
std::string anonymous_pid();

} // namespace pqg

#endif // __cplusplus
