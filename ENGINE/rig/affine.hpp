#pragma once

namespace flatrig::rig {

// 2x3 affine matrix, column convention used by layered authoring tools:
// x' = a*x + c*y + tx, y' = b*x + d*y + ty.
struct Affine2D {
    double a  = 1.0;
    double b  = 0.0;
    double c  = 0.0;
    double d  = 1.0;
    double tx = 0.0;
    double ty = 0.0;

    static Affine2D identity() { return Affine2D{}; }

    static Affine2D translation(double x, double y) {
        Affine2D m;
        m.tx = x;
        m.ty = y;
        return m;
    }

    static Affine2D scaling(double sx, double sy) {
        Affine2D m;
        m.a = sx;
        m.d = sy;
        return m;
    }

    bool operator==(const Affine2D& other) const {
        return a == other.a && b == other.b && c == other.c &&
               d == other.d && tx == other.tx && ty == other.ty;
    }
    bool operator!=(const Affine2D& other) const { return !(*this == other); }
};

// parent ∘ local: applies `local` first, then `parent`.
inline Affine2D compose(const Affine2D& parent, const Affine2D& local) {
    Affine2D out;
    out.a  = parent.a * local.a  + parent.c * local.b;
    out.b  = parent.b * local.a  + parent.d * local.b;
    out.c  = parent.a * local.c  + parent.c * local.d;
    out.d  = parent.b * local.c  + parent.d * local.d;
    out.tx = parent.a * local.tx + parent.c * local.ty + parent.tx;
    out.ty = parent.b * local.tx + parent.d * local.ty + parent.ty;
    return out;
}

inline Affine2D operator*(const Affine2D& parent, const Affine2D& local) {
    return compose(parent, local);
}

// g * Identity applied after m; every component is multiplied.
inline Affine2D scaled_uniformly(const Affine2D& m, double g) {
    Affine2D out = m;
    out.a  *= g;
    out.b  *= g;
    out.c  *= g;
    out.d  *= g;
    out.tx *= g;
    out.ty *= g;
    return out;
}

inline double compose_alpha(double parent_alpha, double local_alpha) {
    return parent_alpha * local_alpha;
}

}
