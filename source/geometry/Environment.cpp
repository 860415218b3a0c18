// ============================================================================
// Environment - Implementation
// ============================================================================

#include "Environment.h"

#include <QGuiApplication>
#include <QScreen>

qreal QtEnvironment::devicePixelRatio() const
{
    QScreen* screen = QGuiApplication::primaryScreen();
    if (!screen) {
        return 1.0;
    }
    qreal dpr = screen->devicePixelRatio();
    return dpr > 0 ? dpr : 1.0;
}

int QtEnvironment::windowWidth() const
{
    if (m_windowWidth >= 0) {
        return m_windowWidth;
    }
    QScreen* screen = QGuiApplication::primaryScreen();
    return screen ? screen->availableGeometry().width() : 0;
}
