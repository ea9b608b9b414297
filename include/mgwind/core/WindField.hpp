#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"

namespace mgwind {

// Three co-located wind components (u, v, w) on one grid level, stored as a
// single owned buffer [u..., v..., w...]. Component views map into that
// buffer, so every update goes through the same storage.
class WindField {
public:
    using ComponentView = Eigen::Map<VectorX>;
    using ConstComponentView = Eigen::Map<const VectorX>;

    WindField() = default;
    explicit WindField(const Shape3& shape, Real initialValue = Real(0));
    WindField(const Shape3& shape, VectorX flat);
    WindField(const Field3D& u, const Field3D& v, const Field3D& w);

    const Shape3& shape() const { return shape_; }
    Index componentSize() const { return shape_.size(); }

    // Flattened state vector, 3 * nz * ny * nx entries
    VectorX& flat() { return data_; }
    const VectorX& flat() const { return data_; }

    ComponentView component(WindComponent c);
    ConstComponentView component(WindComponent c) const;

    ComponentView u() { return component(WindComponent::U); }
    ComponentView v() { return component(WindComponent::V); }
    ComponentView w() { return component(WindComponent::W); }
    ConstComponentView u() const { return component(WindComponent::U); }
    ConstComponentView v() const { return component(WindComponent::V); }
    ConstComponentView w() const { return component(WindComponent::W); }

    // Copy of one component as a field, masking non-finite values
    Field3D toField(WindComponent c) const;

    // Flattened vector from three per-component vectors
    static VectorX stack(const VectorX& u, const VectorX& v, const VectorX& w);

private:
    Shape3 shape_;
    VectorX data_;
};

} // namespace mgwind
