// ============================================================================
// MuPdfFlattener - Implementation
// ============================================================================

#include "MuPdfFlattener.h"
#include "../annotations/AnnotationCollection.h"

#include <QCoreApplication>
#include <QDebug>

#ifdef PDFMARKUP_MUPDF_EXPORT

#include "../render/AnnotationRenderer.h"

#include <QBuffer>
#include <QImage>
#include <QRectF>

#include <mupdf/fitz.h>
#include <mupdf/pdf.h>

#include <cstdio>
#include <vector>

namespace {

constexpr int DEFAULT_EXPORT_DPI = 150;

/**
 * @brief Displayed size of a page and where its annotation layer goes.
 */
struct PageGeometry {
    int pageIndex = -1;       ///< 0-based
    float width = 0;          ///< Points, as displayed (crop box, rotation applied)
    float height = 0;
    fz_matrix imageMatrix;    ///< Image unit square -> PDF user space
};

/**
 * @brief MuPDF handles for one flatten call, released in reverse order.
 */
struct FlattenSession {
    fz_context* ctx = nullptr;
    fz_buffer* source = nullptr;
    fz_stream* stream = nullptr;
    pdf_document* doc = nullptr;
    fz_buffer* output = nullptr;

    ~FlattenSession() {
        if (!ctx) {
            return;
        }
        fz_drop_buffer(ctx, output);
        pdf_drop_document(ctx, doc);
        fz_drop_stream(ctx, stream);
        fz_drop_buffer(ctx, source);
        fz_drop_context(ctx);
    }
};

void readPageGeometry(fz_context* ctx, pdf_document* doc, PageGeometry* geometry)
{
    pdf_page* page = nullptr;
    fz_var(page);

    fz_try(ctx) {
        page = pdf_load_page(ctx, doc, geometry->pageIndex);

        fz_rect mediabox;
        fz_matrix pageCtm;
        pdf_page_transform(ctx, page, &mediabox, &pageCtm);

        const fz_rect bounds = fz_bound_page(ctx, reinterpret_cast<fz_page*>(page));
        geometry->width = bounds.x1 - bounds.x0;
        geometry->height = bounds.y1 - bounds.y0;

        // Unit square onto the displayed page (top-left origin, y down),
        // then back into the page's own user space
        const fz_matrix toDisplay = fz_make_matrix(geometry->width, 0, 0, -geometry->height,
                                                   bounds.x0, bounds.y0 + geometry->height);
        geometry->imageMatrix = fz_concat(toDisplay, fz_invert_matrix(pageCtm));
    }
    fz_always(ctx) {
        fz_drop_page(ctx, reinterpret_cast<fz_page*>(page));
    }
    fz_catch(ctx) {
        fz_rethrow(ctx);
    }
}

/**
 * @brief Add the PNG layer as an image XObject drawn after the page content.
 *
 * Existing content streams are wrapped in q/Q so an unbalanced graphics
 * state in the original cannot displace the layer.
 */
void stampOverlay(fz_context* ctx, pdf_document* doc, const PageGeometry& geometry, const QByteArray& png)
{
    fz_buffer* imageBuf = nullptr;
    fz_image* image = nullptr;
    pdf_obj* imageRef = nullptr;
    fz_buffer* prologue = nullptr;
    fz_buffer* epilogue = nullptr;
    pdf_obj* contentsArray = nullptr;
    fz_var(imageBuf);
    fz_var(image);
    fz_var(imageRef);
    fz_var(prologue);
    fz_var(epilogue);
    fz_var(contentsArray);

    fz_try(ctx) {
        imageBuf = fz_new_buffer_from_copied_data(ctx, reinterpret_cast<const unsigned char*>(png.constData()),
                                                  static_cast<size_t>(png.size()));
        image = fz_new_image_from_buffer(ctx, imageBuf);
        imageRef = pdf_add_image(ctx, doc, image);

        pdf_obj* pageObj = pdf_lookup_page_obj(ctx, doc, geometry.pageIndex);

        pdf_obj* resources = pdf_dict_get(ctx, pageObj, PDF_NAME(Resources));
        if (!resources) {
            pdf_obj* inherited = pdf_dict_get_inheritable(ctx, pageObj, PDF_NAME(Resources));
            resources = inherited ? pdf_copy_dict(ctx, inherited) : pdf_new_dict(ctx, doc, 1);
            pdf_dict_put_drop(ctx, pageObj, PDF_NAME(Resources), resources);
        }

        pdf_obj* xobjects = pdf_dict_get(ctx, resources, PDF_NAME(XObject));
        if (!xobjects) {
            xobjects = pdf_dict_put_dict(ctx, resources, PDF_NAME(XObject), 1);
        }

        char name[32];
        int serial = 0;
        do {
            std::snprintf(name, sizeof(name), "PdfMarkup%d", serial++);
        } while (pdf_dict_gets(ctx, xobjects, name));
        pdf_dict_puts(ctx, xobjects, name, imageRef);

        prologue = fz_new_buffer(ctx, 8);
        fz_append_string(ctx, prologue, "q\n");

        // fz_append_printf formats numbers independently of the C locale
        const fz_matrix& m = geometry.imageMatrix;
        epilogue = fz_new_buffer(ctx, 128);
        fz_append_printf(ctx, epilogue, "Q\nq %g %g %g %g %g %g cm /%s Do Q\n",
                         m.a, m.b, m.c, m.d, m.e, m.f, name);

        pdf_obj* contents = pdf_dict_get(ctx, pageObj, PDF_NAME(Contents));
        contentsArray = pdf_new_array(ctx, doc, 3);
        pdf_array_push_drop(ctx, contentsArray, pdf_add_stream(ctx, doc, prologue, nullptr, 0));
        if (pdf_is_array(ctx, contents)) {
            const int count = pdf_array_len(ctx, contents);
            for (int i = 0; i < count; ++i) {
                pdf_array_push(ctx, contentsArray, pdf_array_get(ctx, contents, i));
            }
        } else if (contents) {
            pdf_array_push(ctx, contentsArray, contents);
        }
        pdf_array_push_drop(ctx, contentsArray, pdf_add_stream(ctx, doc, epilogue, nullptr, 0));
        pdf_dict_put(ctx, pageObj, PDF_NAME(Contents), contentsArray);
    }
    fz_always(ctx) {
        pdf_drop_obj(ctx, contentsArray);
        fz_drop_buffer(ctx, epilogue);
        fz_drop_buffer(ctx, prologue);
        pdf_drop_obj(ctx, imageRef);
        fz_drop_image(ctx, image);
        fz_drop_buffer(ctx, imageBuf);
    }
    fz_catch(ctx) {
        fz_rethrow(ctx);
    }
}

bool pageHasVisibleAnnotations(const AnnotationCollection& normalized, int page, const PageGeometry& geometry)
{
    const QRectF pageRect(0, 0, geometry.width, geometry.height);
    for (const Annotation* annotation : normalized.onPage(page)) {
        // Lines have zero-height boxes
        if (annotation->boundingRect().adjusted(-1, -1, 1, 1).intersects(pageRect)) {
            return true;
        }
    }
    return false;
}

QByteArray encodePng(const QImage& image)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    if (!image.save(&buffer, "PNG")) {
        return QByteArray();
    }
    return bytes;
}

} // namespace

MuPdfFlattener::MuPdfFlattener(QObject* parent)
    : QObject(parent)
{
}

FlattenResult MuPdfFlattener::flatten(const FlattenRequest& request)
{
    AnnotationCollection annotations;
    QString parseError;
    if (!PdfFlattenPayload::parseAnnotations(request.annotationsJson, &annotations, &parseError)) {
        return fail(parseError);
    }

    if (annotations.isEmpty()) {
        FlattenResult result = PdfFlattenPayload::identityResult(request.document);
        emit exportComplete(result.downloadName, result.sizeBytes);
        return result;
    }

    if (request.document.isEmpty()) {
        return fail(tr("No document to export."));
    }

    const qreal canvasScale = request.canvasScale > 0 ? request.canvasScale : 1.0;
    const int exportDpi = request.exportDpi > 0 ? request.exportDpi : DEFAULT_EXPORT_DPI;
    const AnnotationCollection normalized = AnnotationCollection::fromJson(
        PdfFlattenPayload::normalizeAnnotations(annotations.toJson(), canvasScale));
    const QVector<int> annotatedPages = annotations.pages();

    FlattenSession session;
    session.ctx = fz_new_context(nullptr, nullptr, FZ_STORE_DEFAULT);
    if (!session.ctx) {
        return fail(tr("Failed to create MuPDF context."));
    }
    fz_context* ctx = session.ctx;

    // ===== Open the source and measure annotated pages =====

    std::vector<PageGeometry> geometries;
    geometries.reserve(static_cast<size_t>(annotatedPages.size()));
    int pageCount = 0;
    fz_var(pageCount);

    fz_try(ctx) {
        session.source = fz_new_buffer_from_copied_data(ctx,
            reinterpret_cast<const unsigned char*>(request.document.constData()),
            static_cast<size_t>(request.document.size()));
        session.stream = fz_open_buffer(ctx, session.source);
        session.doc = pdf_open_document_with_stream(ctx, session.stream);
        if (pdf_needs_password(ctx, session.doc)) {
            fz_throw(ctx, FZ_ERROR_GENERIC, "document is password protected");
        }
        pageCount = pdf_count_pages(ctx, session.doc);

        for (int page : annotatedPages) {
            if (page < 1 || page > pageCount) {
                continue;
            }
            PageGeometry geometry;
            geometry.pageIndex = page - 1;
            readPageGeometry(ctx, session.doc, &geometry);
            geometries.push_back(geometry);
        }
    }
    fz_catch(ctx) {
        return fail(tr("Could not open the document: %1").arg(QString::fromUtf8(fz_caught_message(ctx))));
    }

    for (int page : annotatedPages) {
        if (page > pageCount) {
            qWarning() << "[MuPdfFlattener] Skipping annotations on page" << page
                       << "- document has" << pageCount << "pages";
        }
    }

    // ===== Paint the annotation layers =====

    AnnotationRenderer renderer;
    std::vector<PageGeometry> stamped;
    std::vector<QByteArray> layers;
    for (const PageGeometry& geometry : geometries) {
        const int page = geometry.pageIndex + 1;
        if (!pageHasVisibleAnnotations(normalized, page, geometry)) {
            continue;
        }

        const QSizeF contentSize = QSizeF(geometry.width, geometry.height) * canvasScale;
        const qreal pixelRatio = exportDpi / (72.0 * canvasScale);
        const QImage layer = renderer.renderOverlay(contentSize, pixelRatio, annotations, page);
        const QByteArray png = encodePng(layer);
        if (png.isEmpty()) {
            return fail(tr("Failed to encode the annotation layer for page %1.").arg(page));
        }
        stamped.push_back(geometry);
        layers.push_back(png);
    }

    // ===== Stamp and write =====

    fz_output* output = nullptr;
    fz_var(output);
    QByteArray flattened;

    fz_try(ctx) {
        for (size_t i = 0; i < stamped.size(); ++i) {
            stampOverlay(ctx, session.doc, stamped[i], layers[i]);
        }

        session.output = fz_new_buffer(ctx, static_cast<size_t>(request.document.size()));
        output = fz_new_output_with_buffer(ctx, session.output);

        pdf_write_options opts = pdf_default_write_options;
        opts.do_compress = 1;
        opts.do_compress_images = 1;
        opts.do_compress_fonts = 1;
        pdf_write_document(ctx, session.doc, output, &opts);
        fz_close_output(ctx, output);

        unsigned char* data = nullptr;
        const size_t length = fz_buffer_storage(ctx, session.output, &data);
        flattened = QByteArray(reinterpret_cast<const char*>(data), static_cast<int>(length));
    }
    fz_always(ctx) {
        fz_drop_output(ctx, output);
    }
    fz_catch(ctx) {
        return fail(tr("Failed to flatten annotations: %1").arg(QString::fromUtf8(fz_caught_message(ctx))));
    }

    FlattenResult result;
    result.success = true;
    result.document = flattened;
    result.sizeBytes = flattened.size();
    result.pagesFlattened = static_cast<int>(stamped.size());

    qDebug() << "[MuPdfFlattener] Flattened" << result.pagesFlattened << "pages,"
             << result.sizeBytes << "bytes";

    emit exportComplete(result.downloadName, result.sizeBytes);
    return result;
}

FlattenResult MuPdfFlattener::fail(const QString& message)
{
    qWarning() << "[MuPdfFlattener]" << message;

    FlattenResult result;
    result.success = false;
    result.errorMessage = message;
    emit exportFailed(message);
    return result;
}

#else // PDFMARKUP_MUPDF_EXPORT not defined

FlattenResult MuPdfFlattener::flatten(const FlattenRequest& request)
{
    AnnotationCollection annotations;
    QString error;
    if (PdfFlattenPayload::parseAnnotations(request.annotationsJson, &annotations, &error)) {
        if (annotations.isEmpty()) {
            FlattenResult result = PdfFlattenPayload::identityResult(request.document);
            emit exportComplete(result.downloadName, result.sizeBytes);
            return result;
        }
        error = QCoreApplication::translate("MuPdfFlattener",
                                            "PDF export requires MuPDF. Install libmupdf-dev and rebuild.");
    }

    qWarning() << "[MuPdfFlattener]" << error;
    FlattenResult result;
    result.errorMessage = error;
    emit exportFailed(error);
    return result;
}

#endif // PDFMARKUP_MUPDF_EXPORT
