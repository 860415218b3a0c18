#pragma once

// ============================================================================
// Environment - Ambient display properties used by coordinate math
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// The transform and viewport code never query QGuiApplication directly.
// They read device pixel ratio and window width through this interface so
// tests can supply fixed values.
// ============================================================================

#include <QtGlobal>

/**
 * @brief Read-only view of the display environment.
 */
class Environment {
public:
    virtual ~Environment() = default;

    /**
     * @brief Physical pixels per logical pixel (1.0 on standard displays).
     */
    virtual qreal devicePixelRatio() const = 0;

    /**
     * @brief Width of the application window in logical pixels.
     */
    virtual int windowWidth() const = 0;
};

/**
 * @brief Environment backed by the primary QScreen.
 *
 * windowWidth() reports the width of the tracked top-level widget when one
 * has been set, otherwise the available width of the primary screen.
 */
class QtEnvironment : public Environment {
public:
    qreal devicePixelRatio() const override;
    int windowWidth() const override;

    void setWindowWidth(int width) { m_windowWidth = width; }

private:
    int m_windowWidth = -1;   ///< -1 = fall back to screen width
};

/**
 * @brief Environment with constant values (tests, offscreen export).
 */
class FixedEnvironment : public Environment {
public:
    FixedEnvironment(qreal dpr = 1.0, int windowWidth = 1280)
        : m_dpr(dpr), m_windowWidth(windowWidth) {}

    qreal devicePixelRatio() const override { return m_dpr; }
    int windowWidth() const override { return m_windowWidth; }

    void setDevicePixelRatio(qreal dpr) { m_dpr = dpr; }
    void setWindowWidth(int width) { m_windowWidth = width; }

private:
    qreal m_dpr;
    int m_windowWidth;
};
