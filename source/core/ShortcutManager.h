#ifndef SHORTCUTMANAGER_H
#define SHORTCUTMANAGER_H

#include <QHash>
#include <QKeySequence>
#include <QObject>
#include <QString>
#include <QStringList>

/**
 * @brief Key bindings of the markup editor.
 *
 * Every editor command has an action id ("edit.undo", "tool.rectangle",
 * "zoom.fit_width", ...) with a built-in key sequence. Users may override
 * single bindings; overrides are kept in shortcuts.json under the app
 * config location as {"version": 1, "overrides": {id: sequence}}.
 *
 * Key presses are resolved with actionForKeySequence(). When two actions
 * share a sequence the one whose id sorts first wins.
 */
class ShortcutManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Singleton, created with the built-in bindings and the saved
     *        overrides applied.
     */
    static ShortcutManager* instance();

    bool hasAction(const QString& actionId) const;
    QStringList allActionIds() const;
    QString displayNameForAction(const QString& actionId) const;
    QString categoryForAction(const QString& actionId) const;

    // ===== Lookup =====

    /**
     * @brief Effective sequence: the override if any, else the default.
     * @return Empty string for unknown actions.
     */
    QString shortcutForAction(const QString& actionId) const;
    QKeySequence keySequenceForAction(const QString& actionId) const;
    QString defaultShortcutForAction(const QString& actionId) const;

    /**
     * @brief Action bound to a pressed key combination, or an empty string.
     */
    QString actionForKeySequence(const QKeySequence& sequence) const;

    bool isUserOverridden(const QString& actionId) const;

    // ===== Overrides =====

    /**
     * @brief Rebind an action. Binding the default drops the override.
     *
     * Shifted digits are stored as the digit ("Ctrl+Shift+@" becomes
     * "Ctrl+Shift+2"). Unknown ids are ignored. Not saved automatically.
     */
    void setUserShortcut(const QString& actionId, const QString& shortcut);
    void clearUserShortcut(const QString& actionId);
    void resetAllToDefaults();

    /**
     * @brief Actions currently bound to the sequence, sorted by id.
     */
    QStringList findConflicts(const QString& shortcut,
                              const QString& excludeActionId = QString()) const;

    // ===== Persistence =====

    bool loadUserShortcuts();
    bool saveUserShortcuts() const;
    QString configFilePath() const { return m_configPath; }

signals:
    void shortcutChanged(const QString& actionId, const QString& newShortcut);

private:
    explicit ShortcutManager(QObject* parent = nullptr);

    struct Binding {
        QString defaultShortcut;
        QString userShortcut;      ///< Empty when not overridden
        QString displayName;
        QString category;

        const QString& effective() const {
            return userShortcut.isEmpty() ? defaultShortcut : userShortcut;
        }
    };

    void addBinding(const char* actionId, const char* sequence, const QString& displayName,
                    const QString& category);
    void applyOverride(const QString& actionId, const QString& shortcut);
    void rebuildLookup();

    QHash<QString, Binding> m_bindings;
    QHash<QKeySequence, QString> m_lookup;   ///< Sequence to winning action id
    QString m_configPath;

    static ShortcutManager* s_instance;
};

#endif // SHORTCUTMANAGER_H
