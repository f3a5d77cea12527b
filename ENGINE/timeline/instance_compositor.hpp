#pragma once

#include <string>

#include "catalog/piece_catalog.hpp"
#include "rig/affine.hpp"

namespace flatrig::timeline {

// frame ∘ Translate(origin) ∘ Scale(piece scale), then g * Identity when g != 1.
// A null entry means origin (0, 0) and scale (1, 1).
rig::Affine2D compose_instance_matrix(const rig::Affine2D& frame_matrix,
                                      const catalog::PieceCatalogEntry* entry,
                                      double global_scale = 1.0);

class InstanceCompositor {
public:
    explicit InstanceCompositor(const catalog::PieceCatalog& catalog, double global_scale = 1.0);

    rig::Affine2D compose(const std::string& piece, const rig::Affine2D& frame_matrix) const;

    double global_scale() const { return global_scale_; }

private:
    const catalog::PieceCatalog* catalog_ = nullptr;
    double global_scale_ = 1.0;
};

}
