#include "CoordinateMapper.h"
#include <algorithm>
#include <cmath>

int CoordinateMapper::clampAxis(double v, int dim) {
    if (dim <= 0 || std::isnan(v)) return 0;
    const double hi = static_cast<double>(dim - 1);
    return static_cast<int>(std::clamp(v, 0.0, hi));
}

PixelIndex CoordinateMapper::mapToPixel(const QPointF& displayPos, const BufferShape& shape) {
    PixelIndex idx;
    idx.row = clampAxis(displayPos.y(), shape.height);
    idx.col = clampAxis(displayPos.x(), shape.width);
    return idx;
}
