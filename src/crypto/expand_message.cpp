#include "ecgroup/crypto/expand_message.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include "ecgroup/common/errors.hpp"
#include "ecgroup/common/secure_zeroize.hpp"

namespace ecgroup {
namespace {

constexpr char kOversizeDstPrefix[] = "H2C-OVERSIZE-DST-";
constexpr size_t kMaxDstLength = 255;
constexpr size_t kMaxOutputLength = 65535;

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

class Hasher {
 public:
  explicit Hasher(HashFunction hash) : md_(HashAlgorithm(hash)), ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
  }

  void Init() {
    if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }

  void Update(std::span<const uint8_t> data) {
    if (!data.empty() && EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  Bytes Final() {
    Bytes out(static_cast<size_t>(EVP_MD_get_size(md_)));
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), nullptr) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return out;
  }

 private:
  const EVP_MD* md_;
  MdCtxPtr ctx_;
};

Bytes ReduceOversizeDst(HashFunction hash, std::span<const uint8_t> dst) {
  Bytes input(kOversizeDstPrefix, kOversizeDstPrefix + sizeof(kOversizeDstPrefix) - 1);
  input.insert(input.end(), dst.begin(), dst.end());
  return Digest(hash, input);
}

}  // namespace

Bytes ExpandMessageXmd(HashFunction hash,
                       std::span<const uint8_t> message,
                       std::span<const uint8_t> dst,
                       size_t length) {
  if (dst.empty()) {
    throw EmptyDstError("zero-length DST");
  }
  if (length == 0 || length > kMaxOutputLength) {
    throw std::invalid_argument("XMD output length must be in [1, 65535]");
  }

  const size_t b_len = HashOutputLength(hash);
  const size_t ell = (length + b_len - 1) / b_len;
  if (ell > 255) {
    throw std::invalid_argument("XMD output length exceeds 255 hash blocks");
  }

  Bytes dst_prime;
  if (dst.size() > kMaxDstLength) {
    dst_prime = ReduceOversizeDst(hash, dst);
  } else {
    dst_prime.assign(dst.begin(), dst.end());
  }
  dst_prime.push_back(static_cast<uint8_t>(dst_prime.size()));

  const Bytes z_pad(HashBlockLength(hash), 0);
  const uint8_t l_i_b_str[3] = {static_cast<uint8_t>(length >> 8),
                                static_cast<uint8_t>(length & 0xFF), 0};

  Hasher hasher(hash);
  hasher.Init();
  hasher.Update(z_pad);
  hasher.Update(message);
  hasher.Update(l_i_b_str);
  hasher.Update(dst_prime);
  Bytes b_0 = hasher.Final();

  Bytes out;
  out.reserve(ell * b_len);

  Bytes b_i(b_0);
  for (size_t i = 1; i <= ell; ++i) {
    if (i > 1) {
      for (size_t j = 0; j < b_len; ++j) {
        b_i[j] ^= b_0[j];
      }
    }
    const uint8_t counter = static_cast<uint8_t>(i);

    hasher.Init();
    hasher.Update(b_i);
    hasher.Update(std::span<const uint8_t>(&counter, 1));
    hasher.Update(dst_prime);
    b_i = hasher.Final();
    out.insert(out.end(), b_i.begin(), b_i.end());
  }

  SecureZeroize(&b_0);
  SecureZeroize(&b_i);
  out.resize(length);
  return out;
}

}  // namespace ecgroup
