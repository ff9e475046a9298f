#ifndef IMVIEW_CORE_VERSION_H
#define IMVIEW_CORE_VERSION_H

#ifndef IMVIEW_VERSION
#define IMVIEW_VERSION "0.0.0"
#endif

namespace ImView {
    /**
     * @brief Get the application version string.
     * @return The version string (e.g., "1.2.3").
     */
    const char* getVersion();
}

#endif // IMVIEW_CORE_VERSION_H
