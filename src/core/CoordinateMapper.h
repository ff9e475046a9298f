#ifndef COORDINATEMAPPER_H
#define COORDINATEMAPPER_H

#include <QPointF>

struct BufferShape {
    int height = 0;
    int width = 0;
};

struct PixelIndex {
    int row = 0;
    int col = 0;
    bool operator==(const PixelIndex& o) const { return row == o.row && col == o.col; }
};

/**
 * @brief Display position to buffer index
 *
 * Display space has x to the right and y upward with (0,0) at the bottom-left
 * corner of the image; pixel (i, j) covers [j, j+1) x [i, i+1). Buffers are
 * already flipped at load time, so row = y and col = x with no further flip.
 */
class CoordinateMapper {
public:
    /**
     * Each axis is clamped to [0, dim-1] independently and truncated.
     * NaN maps to 0, infinities to the nearest edge. Never fails.
     */
    static PixelIndex mapToPixel(const QPointF& displayPos, const BufferShape& shape);

    static int clampAxis(double v, int dim);
};

#endif // COORDINATEMAPPER_H
