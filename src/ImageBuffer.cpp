#include "ImageBuffer.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

ImageBuffer::ImageBuffer(int width, int height, int channels, std::vector<float> data, Metadata meta)
    : m_width(width)
    , m_height(height)
    , m_channels(channels)
    , m_kind(channels == 1 ? Sample_Scalar : Sample_Vector)
    , m_data(std::move(data))
    , m_meta(std::move(meta))
{
    computeRange();
}

void ImageBuffer::computeRange() {
    m_min.clear();
    m_max.clear();
    if (!isValid()) return;

    m_min.assign(m_channels, std::numeric_limits<float>::max());
    m_max.assign(m_channels, std::numeric_limits<float>::lowest());

    const size_t n = m_data.size();
    for (size_t i = 0; i < n; ++i) {
        const float v = m_data[i];
        if (!std::isfinite(v)) continue;
        const int c = static_cast<int>(i % m_channels);
        if (v < m_min[c]) m_min[c] = v;
        if (v > m_max[c]) m_max[c] = v;
    }

    // No finite sample in the channel
    for (int c = 0; c < m_channels; ++c) {
        if (m_min[c] > m_max[c]) {
            m_min[c] = 0.0f;
            m_max[c] = 0.0f;
        }
    }
}

Sample ImageBuffer::sampleAt(int row, int col) const {
    const size_t base = (static_cast<size_t>(row) * m_width + col) * m_channels;
    Q_ASSERT(base + m_channels <= m_data.size());

    if (m_kind == Sample_Scalar) {
        return ScalarSample{m_data[base]};
    }

    VectorSample s;
    s.count = std::min(m_channels, 4);
    for (int c = 0; c < s.count; ++c) s.values[c] = m_data[base + c];
    return s;
}

ImageBuffer ImageBuffer::flippedVertically() const {
    if (!isValid()) return *this;

    const size_t rowLen = static_cast<size_t>(m_width) * m_channels;
    std::vector<float> out(m_data.size());
    for (int y = 0; y < m_height; ++y) {
        const float* src = m_data.data() + static_cast<size_t>(y) * rowLen;
        float* dst = out.data() + static_cast<size_t>(m_height - 1 - y) * rowLen;
        std::memcpy(dst, src, rowLen * sizeof(float));
    }
    return ImageBuffer(m_width, m_height, m_channels, std::move(out), m_meta);
}

bool ImageBuffer::operator==(const ImageBuffer& other) const {
    if (m_width != other.m_width || m_height != other.m_height || m_channels != other.m_channels) return false;
    // Bitwise so that NaN samples compare equal to themselves
    return m_data.size() == other.m_data.size() &&
           (m_data.empty() || std::memcmp(m_data.data(), other.m_data.data(), m_data.size() * sizeof(float)) == 0);
}
