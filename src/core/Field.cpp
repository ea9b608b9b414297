// === src/core/Field.cpp ===
#include "mgwind/core/Field.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace mgwind {

Field3D::Field3D(const Shape3& shape, Real initialValue)
    : shape_(shape),
      data_(VectorX::Constant(shape.size(), initialValue)),
      masked_(static_cast<std::size_t>(shape.size()), false) {
}

Field3D::Field3D(const Shape3& shape, VectorX values)
    : shape_(shape), data_(std::move(values)),
      masked_(static_cast<std::size_t>(shape.size()), false) {
    if (data_.size() != shape_.size()) {
        throw ConfigurationError("Field values do not match the field shape");
    }
}

Field3D Field3D::fromFilled(const Shape3& shape, const VectorX& values) {
    Field3D field(shape, values);
    field.maskNonFinite();
    return field;
}

void Field3D::maskWhere(const std::function<bool(Index)>& predicate) {
    for (Index i = 0; i < size(); ++i) {
        if (predicate(i)) {
            setMasked(i, true);
        }
    }
}

void Field3D::maskNonFinite() {
    for (Index i = 0; i < size(); ++i) {
        if (!std::isfinite(data_[i])) {
            setMasked(i, true);
        }
    }
}

Index Field3D::countValid() const {
    Index count = 0;
    for (Index i = 0; i < size(); ++i) {
        if (isValid(i)) {
            ++count;
        }
    }
    return count;
}

VectorX Field3D::filled(Real fillValue) const {
    VectorX values = data_;
    for (Index i = 0; i < size(); ++i) {
        if (isMasked(i)) {
            values[i] = fillValue;
        }
    }
    return values;
}

VectorX Field3D::validity() const {
    VectorX mask(size());
    for (Index i = 0; i < size(); ++i) {
        mask[i] = isValid(i) ? Real(1) : Real(0);
    }
    return mask;
}

void Field3D::initialize(Real value) {
    data_.setConstant(value);
    std::fill(masked_.begin(), masked_.end(), false);
}

} // namespace mgwind
