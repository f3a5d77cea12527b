#include "timeline/instance_compositor.hpp"

namespace flatrig::timeline {

rig::Affine2D compose_instance_matrix(const rig::Affine2D& frame_matrix,
                                      const catalog::PieceCatalogEntry* entry,
                                      double global_scale) {
    const double ox = entry ? entry->origin_x : 0.0;
    const double oy = entry ? entry->origin_y : 0.0;
    const double sx = entry ? entry->scale_x  : 1.0;
    const double sy = entry ? entry->scale_y  : 1.0;

    rig::Affine2D out = rig::compose(rig::compose(frame_matrix, rig::Affine2D::translation(ox, oy)),
                                     rig::Affine2D::scaling(sx, sy));
    if (global_scale != 1.0) {
        out = rig::scaled_uniformly(out, global_scale);
    }
    return out;
}

InstanceCompositor::InstanceCompositor(const catalog::PieceCatalog& catalog, double global_scale)
    : catalog_(&catalog), global_scale_(global_scale) {}

rig::Affine2D InstanceCompositor::compose(const std::string& piece, const rig::Affine2D& frame_matrix) const {
    return compose_instance_matrix(frame_matrix, catalog_->find(piece), global_scale_);
}

}
