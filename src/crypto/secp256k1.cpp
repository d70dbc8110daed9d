#include "crypto/secp256k1.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace mostrix::crypto {

namespace {

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};
struct GroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct MontCtxDeleter {
  void operator()(BN_MONT_CTX* mont) const { BN_MONT_CTX_free(mont); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using MontCtxPtr = std::unique_ptr<BN_MONT_CTX, MontCtxDeleter>;

// Curve constants shared by every operation. EC_GROUP is safe for concurrent
// read-only use.
struct Curve {
  GroupPtr group;
  BnPtr order;
  BnPtr field;

  Curve() {
    group.reset(EC_GROUP_new_by_curve_name(NID_secp256k1));
    order.reset(BN_new());
    field.reset(BN_new());
    if (!group || !order || !field ||
        EC_GROUP_get_order(group.get(), order.get(), nullptr) != 1 ||
        EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr, nullptr) != 1) {
      throw std::runtime_error("secp256k1 group unavailable");
    }
  }
};

const Curve& GetCurve() {
  static const Curve curve;
  return curve;
}

BnPtr NewBn() {
  BnPtr bn(BN_new());
  if (!bn) {
    throw std::runtime_error("BN_new failed");
  }
  return bn;
}

BnCtxPtr NewBnCtx() {
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    throw std::runtime_error("BN_CTX_new failed");
  }
  return ctx;
}

PointPtr NewPoint() {
  PointPtr point(EC_POINT_new(GetCurve().group.get()));
  if (!point) {
    throw std::runtime_error("EC_POINT_new failed");
  }
  return point;
}

BnPtr BnFromBytes(std::span<const std::uint8_t> bytes) {
  BnPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
  if (!bn) {
    throw std::runtime_error("BN_bin2bn failed");
  }
  return bn;
}

std::array<std::uint8_t, 32> BnToBytes32(const BIGNUM* bn) {
  std::array<std::uint8_t, 32> out{};
  if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
    throw std::runtime_error("BN_bn2binpad failed");
  }
  return out;
}

// Returns the scalar as a BIGNUM when 0 < scalar < n, flagged for
// constant-time arithmetic.
BnPtr ScalarFromSecret(const SecretKey& key) {
  auto bn = BnFromBytes(key);
  if (BN_is_zero(bn.get()) || BN_cmp(bn.get(), GetCurve().order.get()) >= 0) {
    return nullptr;
  }
  BN_set_flags(bn.get(), BN_FLG_CONSTTIME);
  return bn;
}

// -scalar mod n for 0 <= scalar < n.
BnPtr NegateScalar(const BIGNUM* scalar) {
  auto zero = NewBn();
  BN_zero(zero.get());
  auto negated = NewBn();
  BN_set_flags(negated.get(), BN_FLG_CONSTTIME);
  if (BN_mod_sub_quick(negated.get(), zero.get(), scalar, GetCurve().order.get()) != 1) {
    throw std::runtime_error("BN_mod_sub_quick failed");
  }
  return negated;
}

// Secret nonce from a 32-byte hash. The value is below 2^256 < 2n, so a
// single conditional subtraction reduces it.
BnPtr SecretScalarFromHash(const Sha256Hash& hash) {
  auto value = BnFromBytes(hash);
  BN_set_flags(value.get(), BN_FLG_CONSTTIME);
  if (BN_ucmp(value.get(), GetCurve().order.get()) >= 0 &&
      BN_usub(value.get(), value.get(), GetCurve().order.get()) != 1) {
    throw std::runtime_error("BN_usub failed");
  }
  return value;
}

PointPtr MultiplyGenerator(const BIGNUM* scalar, BN_CTX* ctx) {
  auto point = NewPoint();
  if (EC_POINT_mul(GetCurve().group.get(), point.get(), scalar, nullptr, nullptr, ctx) != 1) {
    throw std::runtime_error("EC_POINT_mul failed");
  }
  return point;
}

// Affine x and the parity of y.
std::array<std::uint8_t, 32> AffineX(const EC_POINT* point, BN_CTX* ctx, bool* y_is_odd) {
  auto x = NewBn();
  auto y = NewBn();
  if (EC_POINT_get_affine_coordinates(GetCurve().group.get(), point, x.get(), y.get(), ctx) != 1) {
    throw std::runtime_error("EC_POINT_get_affine_coordinates failed");
  }
  if (y_is_odd) {
    *y_is_odd = BN_is_odd(y.get()) != 0;
  }
  return BnToBytes32(x.get());
}

PointPtr LiftX(const XOnlyPublicKey& key, BN_CTX* ctx) {
  auto x = BnFromBytes(key);
  if (BN_cmp(x.get(), GetCurve().field.get()) >= 0) {
    return nullptr;
  }
  auto point = NewPoint();
  if (EC_POINT_set_compressed_coordinates(GetCurve().group.get(), point.get(), x.get(), 0, ctx) !=
      1) {
    return nullptr;
  }
  return point;
}

BnPtr HashToScalar(const Sha256Hash& hash, BN_CTX* ctx) {
  auto value = BnFromBytes(hash);
  auto reduced = NewBn();
  if (BN_nnmod(reduced.get(), value.get(), GetCurve().order.get(), ctx) != 1) {
    throw std::runtime_error("BN_nnmod failed");
  }
  return reduced;
}

Sha256Hash ChallengeHash(std::span<const std::uint8_t> r_x, const XOnlyPublicKey& pub,
                         std::span<const std::uint8_t, 32> message) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(96);
  buffer.insert(buffer.end(), r_x.begin(), r_x.end());
  buffer.insert(buffer.end(), pub.begin(), pub.end());
  buffer.insert(buffer.end(), message.begin(), message.end());
  return TaggedHash("BIP0340/challenge", buffer);
}

}  // namespace

bool IsValidSecretKey(const SecretKey& key) { return ScalarFromSecret(key) != nullptr; }

bool IsValidXOnlyPublicKey(const XOnlyPublicKey& key) {
  auto ctx = NewBnCtx();
  return LiftX(key, ctx.get()) != nullptr;
}

XOnlyPublicKey XOnlyPublicKeyFromSecret(const SecretKey& key) {
  auto scalar = ScalarFromSecret(key);
  if (!scalar) {
    throw std::invalid_argument("secret key out of range");
  }
  auto ctx = NewBnCtx();
  auto point = MultiplyGenerator(scalar.get(), ctx.get());
  return AffineX(point.get(), ctx.get(), nullptr);
}

CompressedPublicKey CompressedPublicKeyFromSecret(const SecretKey& key) {
  auto scalar = ScalarFromSecret(key);
  if (!scalar) {
    throw std::invalid_argument("secret key out of range");
  }
  auto ctx = NewBnCtx();
  auto point = MultiplyGenerator(scalar.get(), ctx.get());
  bool odd = false;
  const auto x = AffineX(point.get(), ctx.get(), &odd);
  CompressedPublicKey out{};
  out[0] = odd ? 0x03 : 0x02;
  std::copy(x.begin(), x.end(), out.begin() + 1);
  return out;
}

std::optional<SecretKey> AddTweak(const SecretKey& key, std::span<const std::uint8_t, 32> tweak) {
  auto scalar = ScalarFromSecret(key);
  if (!scalar) {
    return std::nullopt;
  }
  auto t = BnFromBytes(tweak);
  if (BN_cmp(t.get(), GetCurve().order.get()) >= 0) {
    return std::nullopt;
  }
  auto ctx = NewBnCtx();
  auto sum = NewBn();
  if (BN_mod_add(sum.get(), scalar.get(), t.get(), GetCurve().order.get(), ctx.get()) != 1) {
    throw std::runtime_error("BN_mod_add failed");
  }
  if (BN_is_zero(sum.get())) {
    return std::nullopt;
  }
  return BnToBytes32(sum.get());
}

std::optional<std::array<std::uint8_t, 32>> EcdhXCoordinate(const SecretKey& secret,
                                                            const XOnlyPublicKey& remote) {
  auto scalar = ScalarFromSecret(secret);
  if (!scalar) {
    return std::nullopt;
  }
  auto ctx = NewBnCtx();
  auto remote_point = LiftX(remote, ctx.get());
  if (!remote_point) {
    return std::nullopt;
  }
  auto shared = NewPoint();
  if (EC_POINT_mul(GetCurve().group.get(), shared.get(), nullptr, remote_point.get(),
                   scalar.get(), ctx.get()) != 1) {
    throw std::runtime_error("EC_POINT_mul failed");
  }
  return AffineX(shared.get(), ctx.get(), nullptr);
}

SchnorrSignature SchnorrSign(const SecretKey& key, std::span<const std::uint8_t, 32> message,
                             std::span<const std::uint8_t, 32> aux_rand) {
  const Curve& curve = GetCurve();
  auto d0 = ScalarFromSecret(key);
  if (!d0) {
    throw std::invalid_argument("secret key out of range");
  }
  auto ctx = NewBnCtx();
  auto pub_point = MultiplyGenerator(d0.get(), ctx.get());
  bool pub_odd = false;
  const XOnlyPublicKey pub = AffineX(pub_point.get(), ctx.get(), &pub_odd);
  // The parity of a public point is public; branching on it leaks nothing.
  auto d = pub_odd ? NegateScalar(d0.get()) : std::move(d0);

  auto d_bytes = BnToBytes32(d.get());
  const auto aux_hash = TaggedHash("BIP0340/aux", aux_rand);
  std::vector<std::uint8_t> nonce_input(96);
  for (std::size_t i = 0; i < 32; ++i) {
    nonce_input[i] = static_cast<std::uint8_t>(d_bytes[i] ^ aux_hash[i]);
  }
  std::copy(pub.begin(), pub.end(), nonce_input.begin() + 32);
  std::copy(message.begin(), message.end(), nonce_input.begin() + 64);
  auto nonce_hash = TaggedHash("BIP0340/nonce", nonce_input);
  util::SecureWipe(d_bytes);
  util::SecureWipe(nonce_input);

  auto k0 = SecretScalarFromHash(nonce_hash);
  util::SecureWipe(nonce_hash);
  if (BN_is_zero(k0.get())) {
    throw std::runtime_error("schnorr nonce is zero");
  }
  auto r_point = MultiplyGenerator(k0.get(), ctx.get());
  bool r_odd = false;
  const auto r_x = AffineX(r_point.get(), ctx.get(), &r_odd);
  auto k = r_odd ? NegateScalar(k0.get()) : std::move(k0);

  // s = k + e * d mod n, with the product taken in Montgomery form so the
  // secret operand never goes through variable-time division.
  auto e = HashToScalar(ChallengeHash(r_x, pub, message), ctx.get());
  MontCtxPtr mont(BN_MONT_CTX_new());
  auto e_mont = NewBn();
  auto ed = NewBn();
  auto s = NewBn();
  BN_set_flags(ed.get(), BN_FLG_CONSTTIME);
  BN_set_flags(s.get(), BN_FLG_CONSTTIME);
  if (!mont || BN_MONT_CTX_set(mont.get(), curve.order.get(), ctx.get()) != 1 ||
      BN_to_montgomery(e_mont.get(), e.get(), mont.get(), ctx.get()) != 1 ||
      BN_mod_mul_montgomery(ed.get(), e_mont.get(), d.get(), mont.get(), ctx.get()) != 1 ||
      BN_mod_add_quick(s.get(), k.get(), ed.get(), curve.order.get()) != 1) {
    throw std::runtime_error("schnorr scalar arithmetic failed");
  }

  SchnorrSignature sig{};
  std::copy(r_x.begin(), r_x.end(), sig.begin());
  const auto s_bytes = BnToBytes32(s.get());
  std::copy(s_bytes.begin(), s_bytes.end(), sig.begin() + 32);
  return sig;
}

bool SchnorrVerify(const XOnlyPublicKey& key, std::span<const std::uint8_t, 32> message,
                   const SchnorrSignature& signature) {
  const Curve& curve = GetCurve();
  auto ctx = NewBnCtx();
  auto pub_point = LiftX(key, ctx.get());
  if (!pub_point) {
    return false;
  }
  const std::span<const std::uint8_t> r_bytes(signature.data(), 32);
  const std::span<const std::uint8_t> s_bytes(signature.data() + 32, 32);
  auto r = BnFromBytes(r_bytes);
  auto s = BnFromBytes(s_bytes);
  if (BN_cmp(r.get(), curve.field.get()) >= 0 || BN_cmp(s.get(), curve.order.get()) >= 0) {
    return false;
  }
  auto e = HashToScalar(ChallengeHash(r_bytes, key, message), ctx.get());
  // R = s*G - e*P
  auto neg_e = NewBn();
  if (BN_is_zero(e.get())) {
    BN_zero(neg_e.get());
  } else if (BN_sub(neg_e.get(), curve.order.get(), e.get()) != 1) {
    return false;
  }
  auto r_point = NewPoint();
  if (EC_POINT_mul(curve.group.get(), r_point.get(), s.get(), pub_point.get(), neg_e.get(),
                   ctx.get()) != 1) {
    return false;
  }
  if (EC_POINT_is_at_infinity(curve.group.get(), r_point.get()) == 1) {
    return false;
  }
  bool r_odd = false;
  const auto r_x = AffineX(r_point.get(), ctx.get(), &r_odd);
  if (r_odd) {
    return false;
  }
  return std::equal(r_x.begin(), r_x.end(), r_bytes.begin());
}

}  // namespace mostrix::crypto
