#include "ecgroup/backend/curve.hpp"

#include <algorithm>

namespace ecgroup::backend {

Bytes Curve::Subtract(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) const {
  const Bytes negated = Negate(rhs);
  return Add(lhs, negated);
}

Bytes Curve::Double(std::span<const uint8_t> point) const {
  return Add(point, point);
}

bool Curve::IsIdentity(std::span<const uint8_t> point) const {
  const Bytes& id = identity();
  return std::equal(point.begin(), point.end(), id.begin(), id.end());
}

}  // namespace ecgroup::backend
