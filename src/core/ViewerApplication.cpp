#include "ViewerApplication.h"
#include "Logger.h"
#include <exception>
#include <new>

ViewerApplication::ViewerApplication(int& argc, char** argv)
    : QApplication(argc, argv)
{
}

bool ViewerApplication::notify(QObject* receiver, QEvent* event)
{
    try {
        return QApplication::notify(receiver, event);
    } catch (const std::bad_alloc& e) {
        // Typically a decode of an absurd header; the previous image is still shown
        Logger::critical(QString("Out of memory in event handler: %1").arg(e.what()), "Application");
        return false;
    } catch (const std::exception& e) {
        Logger::critical(QString("Exception in event handler: %1").arg(e.what()), "Application");
        return false;
    }
}
