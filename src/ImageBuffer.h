#ifndef IMAGEBUFFER_H
#define IMAGEBUFFER_H

#include <array>
#include <variant>
#include <vector>
#include <QString>
#include <QtGlobal>

/**
 * @brief Sample of a single-channel image
 */
struct ScalarSample {
    float value = 0.0f;
};

/**
 * @brief Sample of an RGB (count 3) or RGBA (count 4) image, channel order
 */
struct VectorSample {
    std::array<float, 4> values{};
    int count = 3;
};

using Sample = std::variant<ScalarSample, VectorSample>;

/**
 * @brief Decoded raster, immutable once constructed
 *
 * Samples are interleaved 32-bit floats in the file's native range
 * (0..255 for 8-bit files, 0..65535 for 16-bit, raw values for float files).
 * Row 0 is the bottom row of the displayed image: loaders flip the source
 * (row 0 = top) once, before constructing the buffer.
 *
 * Buffers are shared between the store and its readers through
 * std::shared_ptr<const ImageBuffer>; there are no mutating members.
 */
class ImageBuffer {
public:
    enum SampleKind { Sample_Scalar, Sample_Vector };

    struct Metadata {
        QString filePath;   // Source file path for reference
        QString format;     // e.g. "PPM (P3)", "PNG"
        int bitDepth = 8;   // Bits per sample in the source
        double maxValue = 255.0; // Nominal full-scale value (Netpbm maxval)
    };

    ImageBuffer() = default;
    ImageBuffer(int width, int height, int channels, std::vector<float> data, Metadata meta = Metadata());

    int width() const { return m_width; }
    int height() const { return m_height; }
    int channels() const { return m_channels; }
    size_t size() const { return static_cast<size_t>(m_width) * m_height * m_channels; }
    bool isValid() const { return !m_data.empty() && m_width > 0 && m_height > 0 && m_data.size() == size(); }

    const std::vector<float>& data() const { return m_data; }
    const Metadata& metadata() const { return m_meta; }

    // Scalar for 1 channel, Vector for 3 or 4; fixed at construction
    SampleKind sampleKind() const { return m_kind; }

    float value(int row, int col, int c = 0) const {
        Q_ASSERT(row >= 0 && row < m_height && col >= 0 && col < m_width && c >= 0 && c < m_channels);
        return m_data[(static_cast<size_t>(row) * m_width + col) * m_channels + c];
    }

    /**
     * @brief All channels of one pixel as a tagged sample
     */
    Sample sampleAt(int row, int col) const;

    // Range of the finite samples (NaN and +-inf ignored). 0 for empty buffers.
    float channelMin(int c) const { return m_min.empty() ? 0.0f : m_min[c]; }
    float channelMax(int c) const { return m_max.empty() ? 0.0f : m_max[c]; }

    /**
     * @brief Copy with row order reversed (row 0 becomes row height-1)
     */
    ImageBuffer flippedVertically() const;

    // Content equality (dimensions and samples), metadata ignored
    bool operator==(const ImageBuffer& other) const;
    bool operator!=(const ImageBuffer& other) const { return !(*this == other); }

private:
    void computeRange();

    int m_width = 0;
    int m_height = 0;
    int m_channels = 1;
    SampleKind m_kind = Sample_Scalar;
    std::vector<float> m_data;
    std::vector<float> m_min;
    std::vector<float> m_max;
    Metadata m_meta;
};

#endif // IMAGEBUFFER_H
