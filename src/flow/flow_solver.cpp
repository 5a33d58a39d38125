#include "flow/flow_solver.hpp"

namespace chromaflow {

float confidence_mask(const StructureTensor& tensor, float threshold) {
    const float gradient_energy = tensor.ixix + tensor.iyiy;
    if (!(gradient_energy > 0.0f)) {
        return 0.0f;
    }
    return (tensor.ssd / gradient_energy > threshold) ? 1.0f : 0.0f;
}

PixelVector solve_flow(const StructureTensor& tensor, float threshold) {
    const StructureTensor t = tensor.scaled(confidence_mask(tensor, threshold));

    const float det = t.determinant();
    if (!(det > 0.0f)) {
        return PixelVector();
    }

    // adj([[ixix, ixiy], [ixiy, iyiy]]) * -(ixit, iyit) / det. Dividing last
    // keeps a near-zero determinant from producing inf * 0.
    const float bx = -t.ixit;
    const float by = -t.iyit;
    return PixelVector((t.iyiy * bx - t.ixiy * by) / det,
                       (t.ixix * by - t.ixiy * bx) / det);
}

}
