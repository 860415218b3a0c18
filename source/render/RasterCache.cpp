#include "RasterCache.h"

#include <QBuffer>
#include <QByteArray>
#include <QDebug>
#include <QImageReader>
#include <QtConcurrent>

RasterCache::RasterCache(QObject* parent)
    : QObject(parent)
{
}

RasterCache::~RasterCache()
{
    cancelPending();
}

QImage RasterCache::image(const QString& dataUrl) const
{
    return m_images.value(dataUrl);
}

void RasterCache::request(const QString& dataUrl, int page)
{
    if (dataUrl.isEmpty() || m_images.contains(dataUrl) || m_failed.contains(dataUrl)) {
        return;
    }

    // Already decoding: remember the extra page so it is repainted too
    const auto pending = m_pending.find(dataUrl);
    if (pending != m_pending.end()) {
        pending->insert(page);
        return;
    }
    m_pending.insert(dataUrl, QSet<int>{ page });

    QFutureWatcher<QImage>* watcher = new QFutureWatcher<QImage>(this);
    m_watchers.append(watcher);

    const quint64 generation = m_generation;

    // QImage is created off-thread and only handed over in the finished slot
    connect(watcher, &QFutureWatcher<QImage>::finished, this, [this, watcher, dataUrl, page, generation]() {
        m_watchers.removeOne(watcher);
        watcher->deleteLater();

        if (generation != m_generation) {
            return;  // Session cleared while decoding
        }
        const QSet<int> pages = m_pending.take(dataUrl);

        if (watcher->isCanceled()) {
            return;
        }
        QImage decoded = watcher->result();
        if (decoded.isNull()) {
            m_failed.insert(dataUrl);
            qWarning() << "[RasterCache] Failed to decode image payload first requested for page" << page;
            return;
        }
        m_images.insert(dataUrl, decoded);

        if (pages.contains(m_currentPage)) {
            emit rasterReady(m_currentPage);
        }
    });

    QFuture<QImage> future = QtConcurrent::run([dataUrl]() -> QImage {
        return RasterCache::decodeDataUrl(dataUrl);
    });
    watcher->setFuture(future);
}

void RasterCache::clear()
{
    cancelPending();
    ++m_generation;
    m_pending.clear();
    m_failed.clear();
    m_images.clear();
}

void RasterCache::cancelPending()
{
    for (QFutureWatcher<QImage>* watcher : m_watchers) {
        watcher->disconnect(this);
        watcher->cancel();
        watcher->waitForFinished();
        delete watcher;
    }
    m_watchers.clear();
}

QImage RasterCache::decodeDataUrl(const QString& dataUrl)
{
    QString payload = dataUrl;
    if (payload.startsWith(QLatin1String("data:"))) {
        const int comma = payload.indexOf(QLatin1Char(','));
        if (comma < 0) {
            return QImage();
        }
        if (!payload.left(comma).contains(QLatin1String(";base64"))) {
            return QImage();  // Only base64 payloads are produced by the editor
        }
        payload = payload.mid(comma + 1);
    }

    const QByteArray bytes = QByteArray::fromBase64(payload.toLatin1());
    if (bytes.isEmpty()) {
        return QImage();
    }

    QImage image;
    if (!image.loadFromData(bytes)) {
        return QImage();
    }
    return image.convertToFormat(QImage::Format_ARGB32_Premultiplied);
}

QString RasterCache::encodeDataUrl(const QImage& image)
{
    if (image.isNull()) {
        return QString();
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        qWarning() << "[RasterCache] PNG encoding failed";
        return QString();
    }
    return QStringLiteral("data:image/png;base64,") + QString::fromLatin1(bytes.toBase64());
}

QString RasterCache::encodeImageFile(const QString& path, QSize* naturalSize)
{
    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "[RasterCache] Cannot read image" << path << ":" << reader.errorString();
        return QString();
    }
    if (naturalSize) {
        *naturalSize = image.size();
    }
    return encodeDataUrl(image);
}
