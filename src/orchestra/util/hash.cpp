#include "orchestra/util/hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <memory>

namespace orchestra::util {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
  }
};

}  // namespace

auto sha256_hex(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
    return {};
  }

  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    std::format_to(std::back_inserter(out), "{:02x}", digest[i]);
  }
  return out;
}

}  // namespace orchestra::util
