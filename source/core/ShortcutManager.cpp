#include "ShortcutManager.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <QStandardPaths>

// Shift+digit is reported as the shifted symbol on US layouts
static QString normalizeShortcut(const QString& shortcut)
{
    if (shortcut.isEmpty() || !shortcut.contains(QLatin1String("Shift+"), Qt::CaseInsensitive)) {
        return shortcut;
    }

    static const QString shifted = QStringLiteral(")!@#$%^&*(");
    const int digit = shifted.indexOf(shortcut.back());
    if (digit < 0) {
        return shortcut;
    }
    return shortcut.left(shortcut.length() - 1) + QString::number(digit);
}

ShortcutManager* ShortcutManager::s_instance = nullptr;

ShortcutManager* ShortcutManager::instance()
{
    if (!s_instance) {
        s_instance = new ShortcutManager();
        s_instance->loadUserShortcuts();
    }
    return s_instance;
}

ShortcutManager::ShortcutManager(QObject* parent)
    : QObject(parent)
{
    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    m_configPath = QDir(configDir).filePath(QStringLiteral("shortcuts.json"));

    const QString file = tr("File");
    addBinding("file.open", "Ctrl+O", tr("Open PDF"), file);
    addBinding("file.export", "Ctrl+S", tr("Export Filled PDF"), file);

    const QString navigation = tr("Navigation");
    addBinding("navigation.prev_page", "PgUp", tr("Previous Page"), navigation);
    addBinding("navigation.next_page", "PgDown", tr("Next Page"), navigation);

    // Each tool has a letter and a number-row binding
    const QString tools = tr("Tools");
    const struct {
        const char* id;
        const char* altId;
        const char* letter;
        const char* digit;
        const char* name;
    } toolKeys[] = {
        { "tool.select", "tool.select_alt", "V", "1", QT_TR_NOOP("Select Tool") },
        { "tool.text", "tool.text_alt", "T", "2", QT_TR_NOOP("Text Tool") },
        { "tool.draw", "tool.draw_alt", "D", "3", QT_TR_NOOP("Draw Tool") },
        { "tool.signature", "tool.signature_alt", "S", "4", QT_TR_NOOP("Signature Tool") },
        { "tool.highlight", "tool.highlight_alt", "H", "5", QT_TR_NOOP("Highlight Tool") },
        { "tool.rectangle", "tool.rectangle_alt", "R", "6", QT_TR_NOOP("Rectangle Tool") },
        { "tool.circle", "tool.circle_alt", "C", "7", QT_TR_NOOP("Circle Tool") },
        { "tool.arrow", "tool.arrow_alt", "A", "8", QT_TR_NOOP("Arrow Tool") },
    };
    for (const auto& key : toolKeys) {
        const QString name = tr(key.name);
        addBinding(key.id, key.letter, name, tools);
        addBinding(key.altId, key.digit, tr("%1 (Number Key)").arg(name), tools);
    }

    const QString edit = tr("Edit");
    addBinding("edit.undo", "Ctrl+Z", tr("Undo"), edit);
    addBinding("edit.redo", "Ctrl+Y", tr("Redo"), edit);
    addBinding("edit.delete", "Delete", tr("Delete"), edit);
    addBinding("edit.delete_alt", "Backspace", tr("Delete (Backspace)"), edit);
    addBinding("edit.deselect", "Escape", tr("Deselect"), edit);

    const QString zoom = tr("Zoom");
    addBinding("zoom.in", "Ctrl+=", tr("Zoom In"), zoom);
    addBinding("zoom.out", "Ctrl+-", tr("Zoom Out"), zoom);
    addBinding("zoom.reset", "Ctrl+0", tr("Reset Zoom"), zoom);
    addBinding("zoom.fit_width", "Ctrl+Shift+W", tr("Fit to Width"), zoom);

    rebuildLookup();

#ifdef PDFMARKUP_DEBUG
    qDebug() << "[ShortcutManager]" << m_bindings.size() << "bindings, config" << m_configPath;
#endif
}

void ShortcutManager::addBinding(const char* actionId, const char* sequence,
                                 const QString& displayName, const QString& category)
{
    Binding binding;
    binding.defaultShortcut = QString::fromLatin1(sequence);
    binding.displayName = displayName;
    binding.category = category;
    m_bindings.insert(QString::fromLatin1(actionId), binding);
}

void ShortcutManager::rebuildLookup()
{
    m_lookup.clear();

    QStringList ids = m_bindings.keys();
    ids.sort();
    for (const QString& id : ids) {
        const QKeySequence sequence(m_bindings.value(id).effective());
        if (!sequence.isEmpty() && !m_lookup.contains(sequence)) {
            m_lookup.insert(sequence, id);
        }
    }
}

// ============================================================================
// Lookup
// ============================================================================

bool ShortcutManager::hasAction(const QString& actionId) const
{
    return m_bindings.contains(actionId);
}

QStringList ShortcutManager::allActionIds() const
{
    QStringList ids = m_bindings.keys();
    ids.sort();
    return ids;
}

QString ShortcutManager::displayNameForAction(const QString& actionId) const
{
    return m_bindings.value(actionId).displayName;
}

QString ShortcutManager::categoryForAction(const QString& actionId) const
{
    return m_bindings.value(actionId).category;
}

QString ShortcutManager::shortcutForAction(const QString& actionId) const
{
    const auto it = m_bindings.constFind(actionId);
    return it == m_bindings.constEnd() ? QString() : it->effective();
}

QKeySequence ShortcutManager::keySequenceForAction(const QString& actionId) const
{
    return QKeySequence(shortcutForAction(actionId));
}

QString ShortcutManager::defaultShortcutForAction(const QString& actionId) const
{
    return m_bindings.value(actionId).defaultShortcut;
}

QString ShortcutManager::actionForKeySequence(const QKeySequence& sequence) const
{
    if (sequence.isEmpty()) {
        return QString();
    }
    return m_lookup.value(sequence);
}

bool ShortcutManager::isUserOverridden(const QString& actionId) const
{
    return !m_bindings.value(actionId).userShortcut.isEmpty();
}

QStringList ShortcutManager::findConflicts(const QString& shortcut,
                                           const QString& excludeActionId) const
{
    QStringList conflicts;
    const QKeySequence target(normalizeShortcut(shortcut));
    if (target.isEmpty()) {
        return conflicts;
    }

    for (auto it = m_bindings.constBegin(); it != m_bindings.constEnd(); ++it) {
        if (it.key() != excludeActionId && QKeySequence(it->effective()) == target) {
            conflicts.append(it.key());
        }
    }
    conflicts.sort();
    return conflicts;
}

// ============================================================================
// Overrides
// ============================================================================

void ShortcutManager::applyOverride(const QString& actionId, const QString& shortcut)
{
    Binding& binding = m_bindings[actionId];
    const QString before = binding.effective();
    const QString normalized = normalizeShortcut(shortcut);
    binding.userShortcut = normalized == binding.defaultShortcut ? QString() : normalized;

    if (binding.effective() != before) {
        emit shortcutChanged(actionId, binding.effective());
    }
}

void ShortcutManager::setUserShortcut(const QString& actionId, const QString& shortcut)
{
    if (!m_bindings.contains(actionId)) {
        qWarning() << "[ShortcutManager] Unknown action:" << actionId;
        return;
    }
    applyOverride(actionId, shortcut);
    rebuildLookup();
}

void ShortcutManager::clearUserShortcut(const QString& actionId)
{
    if (!isUserOverridden(actionId)) {
        return;
    }
    applyOverride(actionId, QString());
    rebuildLookup();
}

void ShortcutManager::resetAllToDefaults()
{
    for (const QString& id : allActionIds()) {
        if (isUserOverridden(id)) {
            applyOverride(id, QString());
        }
    }
    rebuildLookup();
}

// ============================================================================
// Persistence
// ============================================================================

bool ShortcutManager::loadUserShortcuts()
{
    QFile file(m_configPath);
    if (!file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[ShortcutManager] Cannot read" << m_configPath << file.errorString();
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[ShortcutManager] Ignoring malformed shortcuts.json:" << parseError.errorString();
        return false;
    }

    const QJsonObject overrides = doc.object().value(QLatin1String("overrides")).toObject();
    for (auto it = overrides.constBegin(); it != overrides.constEnd(); ++it) {
        if (!m_bindings.contains(it.key())) {
            qWarning() << "[ShortcutManager] Dropping override for unknown action" << it.key();
            continue;
        }
        applyOverride(it.key(), it.value().toString());
    }
    rebuildLookup();
    return true;
}

bool ShortcutManager::saveUserShortcuts() const
{
    QJsonObject overrides;
    for (auto it = m_bindings.constBegin(); it != m_bindings.constEnd(); ++it) {
        if (!it->userShortcut.isEmpty()) {
            overrides.insert(it.key(), it->userShortcut);
        }
    }

    QJsonObject root;
    root.insert(QLatin1String("version"), 1);
    root.insert(QLatin1String("overrides"), overrides);

    QDir().mkpath(QFileInfo(m_configPath).absolutePath());
    QSaveFile file(m_configPath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[ShortcutManager] Cannot write" << m_configPath << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}
