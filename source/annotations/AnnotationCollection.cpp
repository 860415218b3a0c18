#include "AnnotationCollection.h"
#include "FormAnnotations.h"

#include <QDebug>
#include <QJsonDocument>

#include <algorithm>

AnnotationCollection::AnnotationCollection(const AnnotationCollection& other)
{
    m_items.reserve(other.m_items.size());
    for (const auto& item : other.m_items) {
        m_items.push_back(item->clone());
    }
}

AnnotationCollection& AnnotationCollection::operator=(const AnnotationCollection& other)
{
    if (this != &other) {
        AnnotationCollection copy(other);
        m_items = std::move(copy.m_items);
    }
    return *this;
}

// ===== Queries =====

const Annotation* AnnotationCollection::find(const QString& id) const
{
    int index = indexOf(id);
    return index >= 0 ? m_items[static_cast<size_t>(index)].get() : nullptr;
}

int AnnotationCollection::indexOf(const QString& id) const
{
    for (size_t i = 0; i < m_items.size(); ++i) {
        if (m_items[i]->id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

QVector<const Annotation*> AnnotationCollection::onPage(int page) const
{
    QVector<const Annotation*> result;
    for (const auto& item : m_items) {
        if (item->page == page) {
            result.append(item.get());
        }
    }
    return result;
}

QVector<int> AnnotationCollection::pages() const
{
    QVector<int> result;
    for (const auto& item : m_items) {
        if (!result.contains(item->page)) {
            result.append(item->page);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ===== Pure Updates =====

AnnotationCollection AnnotationCollection::withAdded(std::unique_ptr<Annotation> annotation) const
{
    AnnotationCollection result(*this);
    if (!annotation) {
        return result;
    }
    if (indexOf(annotation->id) >= 0) {
        qWarning() << "[AnnotationCollection] Duplicate id ignored:" << annotation->id;
        return result;
    }
    result.m_items.push_back(std::move(annotation));
    return result;
}

AnnotationCollection AnnotationCollection::withUpdated(const QString& id, const QJsonObject& patch) const
{
    return withModified(id, [&patch](Annotation& a) { a.applyPatch(patch); });
}

AnnotationCollection AnnotationCollection::withModified(const QString& id,
                                                        const std::function<void(Annotation&)>& edit) const
{
    AnnotationCollection result(*this);
    int index = indexOf(id);
    if (index >= 0) {
        edit(*result.m_items[static_cast<size_t>(index)]);
    }
    return result;
}

AnnotationCollection AnnotationCollection::withBounds(const QString& id, const QRectF& bounds) const
{
    return withModified(id, [&bounds](Annotation& a) { a.setBoundingRect(bounds); });
}

AnnotationCollection AnnotationCollection::withRemoved(const QString& id) const
{
    return withRemovedIf([&id](const Annotation& a) { return a.id == id; });
}

AnnotationCollection AnnotationCollection::withRemovedIf(
    const std::function<bool(const Annotation&)>& predicate) const
{
    AnnotationCollection result;
    for (const auto& item : m_items) {
        if (!predicate(*item)) {
            result.m_items.push_back(item->clone());
        }
    }
    return result;
}

AnnotationCollection AnnotationCollection::withToggledCheckbox(const QString& id) const
{
    return withModified(id, [](Annotation& a) {
        if (a.type() == AnnotationType::Checkbox) {
            auto& checkbox = static_cast<CheckboxAnnotation&>(a);
            checkbox.checked = !checkbox.checked;
        }
    });
}

AnnotationCollection AnnotationCollection::withRadioSelected(const QString& id) const
{
    AnnotationCollection result(*this);
    const Annotation* clicked = find(id);
    if (!clicked || clicked->type() != AnnotationType::Radio) {
        return result;
    }

    const QString groupId = static_cast<const RadioAnnotation*>(clicked)->groupId;
    for (auto& item : result.m_items) {
        if (item->type() != AnnotationType::Radio) {
            continue;
        }
        auto* radio = static_cast<RadioAnnotation*>(item.get());
        if (radio->groupId == groupId) {
            radio->checked = (radio->id == id);
        }
    }
    return result;
}

// ===== Serialization =====

QJsonArray AnnotationCollection::toJson() const
{
    QJsonArray array;
    for (const auto& item : m_items) {
        array.append(item->toJson());
    }
    return array;
}

QByteArray AnnotationCollection::toJsonBytes() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

AnnotationCollection AnnotationCollection::fromJson(const QJsonArray& array)
{
    AnnotationCollection result;
    for (const QJsonValue& value : array) {
        std::unique_ptr<Annotation> annotation = Annotation::fromJson(value.toObject());
        if (!annotation) {
            continue;
        }
        if (result.indexOf(annotation->id) >= 0) {
            qWarning() << "[AnnotationCollection] Skipping duplicate id:" << annotation->id;
            continue;
        }
        result.m_items.push_back(std::move(annotation));
    }
    return result;
}

bool AnnotationCollection::operator==(const AnnotationCollection& other) const
{
    return toJson() == other.toJson();
}
