#pragma once

// ============================================================================
// RasterCache - Asynchronous decoding of embedded annotation bitmaps
// ============================================================================
// Part of the PdfMarkup annotation engine
//
// Signature, initials, image, signed stamp and image watermark annotations
// carry their bitmap as a data URL. Decoding runs on the global thread
// pool via QtConcurrent; results are cached keyed by the data URL itself
// so identical payloads decode once.
//
// A finished decode only triggers a repaint (rasterReady) when the page
// that requested it is still the displayed page and the session has not
// been cleared in the meantime.
// ============================================================================

#include <QFutureWatcher>
#include <QHash>
#include <QImage>
#include <QList>
#include <QObject>
#include <QSet>
#include <QString>

class RasterCache : public QObject {
    Q_OBJECT

public:
    explicit RasterCache(QObject* parent = nullptr);
    ~RasterCache() override;

    /**
     * @brief Cached image for a payload, or a null QImage if not decoded yet.
     */
    QImage image(const QString& dataUrl) const;

    bool contains(const QString& dataUrl) const { return m_images.contains(dataUrl); }
    bool isPending(const QString& dataUrl) const { return m_pending.contains(dataUrl); }
    bool hasFailed(const QString& dataUrl) const { return m_failed.contains(dataUrl); }
    int pendingCount() const { return m_watchers.size(); }

    /**
     * @brief Start decoding a payload requested while painting a page.
     *
     * No-op if the payload is cached, already decoding or known to be
     * undecodable.
     */
    void request(const QString& dataUrl, int page);

    /**
     * @brief The page currently displayed; stale completions stay silent.
     */
    void setCurrentPage(int page) { m_currentPage = page; }

    /**
     * @brief Cancel pending decodes and drop every cached image.
     */
    void clear();

    /**
     * @brief Decode a data URL ("data:<mime>;base64,<payload>") synchronously.
     *
     * Plain base64 without the "data:" header is accepted too.
     * @return Null image if the payload cannot be decoded.
     */
    static QImage decodeDataUrl(const QString& dataUrl);

    /**
     * @brief Encode an image as "data:image/png;base64,...".
     * @return Empty string for a null image.
     */
    static QString encodeDataUrl(const QImage& image);

    /**
     * @brief Read an image file and encode it as a PNG data URL.
     * @param naturalSize Receives the pixel size of the image.
     * @return Empty string if the file is not a readable image.
     */
    static QString encodeImageFile(const QString& path, QSize* naturalSize = nullptr);

signals:
    /**
     * @brief A decode requested for the current page finished.
     */
    void rasterReady(int page);

private:
    void cancelPending();

    QHash<QString, QImage> m_images;
    QHash<QString, QSet<int>> m_pending;   ///< In-flight decodes and the pages waiting on them
    QSet<QString> m_failed;
    QList<QFutureWatcher<QImage>*> m_watchers;
    int m_currentPage = 1;
    quint64 m_generation = 0;  ///< Bumped by clear(); older completions are dropped
};
