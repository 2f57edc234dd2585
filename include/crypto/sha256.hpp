#ifndef SHA256_HPP_
#define SHA256_HPP_

#include <string>

namespace ledger {
namespace crypto {

/**
 * SHA-256 of `data`, encoded as 64 lowercase hex characters.
 * Throws LedgerError(Storage) if the OpenSSL digest context cannot be used.
 */
std::string sha256Hex(const std::string& data);

}  // namespace crypto
}  // namespace ledger

#endif  // SHA256_HPP_
