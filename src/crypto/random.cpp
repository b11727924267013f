#include <xpii/common/critical.hpp>
#include <xpii/crypto/random.hpp>

#include <openssl/rand.h>

namespace xpii::crypto {

xpii::schema::bytes_t random_bytes(const std::size_t count) {
  auto out = xpii::schema::bytes_t(count);
  if (count == 0) {
    return out;
  }
  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    xpii::common::critical("RAND_bytes failed to produce entropy");
  }
  return out;
}

}  // namespace xpii::crypto
