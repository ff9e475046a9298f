#ifndef VIEWERAPPLICATION_H
#define VIEWERAPPLICATION_H

#include <QApplication>

/**
 * @brief QApplication that keeps the event loop alive across handler exceptions
 */
class ViewerApplication : public QApplication
{
public:
    ViewerApplication(int& argc, char** argv);
    ~ViewerApplication() override = default;

    bool notify(QObject* receiver, QEvent* event) override;
};

#endif // VIEWERAPPLICATION_H
