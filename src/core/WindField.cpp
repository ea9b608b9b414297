// === src/core/WindField.cpp ===
#include "mgwind/core/WindField.hpp"
#include "mgwind/core/Exceptions.hpp"

namespace mgwind {

WindField::WindField(const Shape3& shape, Real initialValue)
    : shape_(shape), data_(VectorX::Constant(3 * shape.size(), initialValue)) {
}

WindField::WindField(const Shape3& shape, VectorX flat)
    : shape_(shape), data_(std::move(flat)) {
    if (data_.size() != 3 * shape_.size()) {
        throw ConfigurationError("Wind vector length does not match 3 x grid size");
    }
}

WindField::WindField(const Field3D& u, const Field3D& v, const Field3D& w)
    : shape_(u.shape()) {
    if (v.shape() != shape_ || w.shape() != shape_) {
        throw ConfigurationError("Initial u, v and w fields must share one shape");
    }
    data_ = stack(u.filled(NaN), v.filled(NaN), w.filled(NaN));
}

WindField::ComponentView WindField::component(WindComponent c) {
    const Index n = shape_.size();
    return ComponentView(data_.data() + static_cast<int>(c) * n, n);
}

WindField::ConstComponentView WindField::component(WindComponent c) const {
    const Index n = shape_.size();
    return ConstComponentView(data_.data() + static_cast<int>(c) * n, n);
}

Field3D WindField::toField(WindComponent c) const {
    return Field3D::fromFilled(shape_, VectorX(component(c)));
}

VectorX WindField::stack(const VectorX& u, const VectorX& v, const VectorX& w) {
    VectorX flat(u.size() + v.size() + w.size());
    flat << u, v, w;
    return flat;
}

} // namespace mgwind
