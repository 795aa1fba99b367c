#pragma once

// warden/hash.hpp - BLAKE3 digests for executed sources and the audit chain.
//
// INVARIANTS:
//   - BLAKE3-256 is the only primitive. Digests are 64 lowercase hex chars.
//   - Domain separation: "src:" for executed source text, "audit:" for chain
//     links. A source digest can never collide with an audit link digest.

#include <string>
#include <string_view>

namespace warden {

std::string blake3_hex(std::string_view payload);
std::string hash_domain(std::string_view domain, std::string_view payload);

// Digest of the source text handed to the interpreter.
std::string source_digest(std::string_view source);

}  // namespace warden
