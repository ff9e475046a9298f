#ifndef ERRORHANDLING_H
#define ERRORHANDLING_H

#include <QString>
#include <utility>

/**
 * @brief Consistent error handling utilities for ImView
 *
 * ImView uses error codes (Qt-style) rather than exceptions for file and
 * display operations. Standard patterns:
 *
 * 1. Bool return + optional QString* error output
 *    bool load(const QString& path, ImageBuffer& buf, QString* err = nullptr)
 *
 * 2. Result<T> for value-returning operations that can fail
 *
 * 3. Signal/slot for failures detected on the event loop (reload, watch)
 *
 * Every reported failure is tagged with an ErrorKind so the log and the
 * status bar read the same way.
 */

enum class ErrorKind {
    DecodeError,       // file missing, unreadable or not a supported raster
    WatchError,        // path cannot be monitored
    MalformedGeometry  // NaN / degenerate level or coordinate input
};

QString errorKindName(ErrorKind kind);

// ============================================================================
// Error Message Formatting
// ============================================================================

/**
 * @brief "operation: context - reason", reason omitted when empty
 *
 * Usage:
 *   *errorMsg = formatError("Failed to decode", filePath, err);
 */
inline QString formatError(const QString& operation, const QString& context, const QString& reason) {
    if (reason.isEmpty()) return QString("%1: %2").arg(operation, context);
    return QString("%1: %2 - %3").arg(operation, context, reason);
}

// ============================================================================
// Error Result Type (Optional-like, but more semantic)
// ============================================================================

template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(const T& value) : m_value(value), m_hasError(false) {}
    explicit Result(T&& value) : m_value(std::move(value)), m_hasError(false) {}

    // Error constructor
    Result(ErrorKind kind, const QString& error) : m_hasError(true), m_kind(kind), m_error(error) {}

    bool isSuccess() const { return !m_hasError; }
    bool isError() const { return m_hasError; }

    const T& value() const {
        Q_ASSERT(!m_hasError);
        return m_value;
    }

    T& mutable_value() {
        Q_ASSERT(!m_hasError);
        return m_value;
    }

    const QString& error() const {
        Q_ASSERT(m_hasError);
        return m_error;
    }

    ErrorKind kind() const {
        Q_ASSERT(m_hasError);
        return m_kind;
    }

    explicit operator bool() const { return isSuccess(); }
    bool operator!() const { return isError(); }

private:
    T m_value{};
    bool m_hasError;
    ErrorKind m_kind = ErrorKind::DecodeError;
    QString m_error;
};

// ============================================================================
// Error Logging & Reporting
// ============================================================================

/**
 * @brief Log a failure tagged with its kind and return the user-facing text
 *
 * Usage:
 *   if (!ImageLoader::load(path, buffer, &errorMsg)) {
 *       m_status->setText(reportError(ErrorKind::DecodeError, errorMsg));
 *       return;
 *   }
 */
QString reportError(ErrorKind kind, const QString& message);

// ============================================================================
// Validation Helpers
// ============================================================================

/**
 * @brief Validate file exists and is readable
 */
bool validateFileExists(const QString& path, QString* error = nullptr);

/**
 * @brief Validate ImageBuffer has valid dimensions and a supported channel count
 */
bool validateBuffer(const class ImageBuffer& buffer, QString* error = nullptr);

#endif // ERRORHANDLING_H
