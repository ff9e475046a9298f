#include "Version.h"

namespace ImView {

const char* getVersion()
{
    return IMVIEW_VERSION;
}

} // namespace ImView
