// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"
#include "docking/WidgetRegistry.hpp"
#include "docking/model/LayoutModel.hpp"
#include "docking/services/DockDragController.hpp"
#include "docking/services/DockingStateMachine.hpp"
#include "docking/services/LayoutRenderer.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QPoint>
#include <QtCore/QPointer>
#include <QtCore/QRect>
#include <QtCore/QSet>
#include <QtCore/QSize>

#include <functional>
#include <optional>

namespace Docking {

class DockContainer;
class DockPanel;
class DockTabWidget;
class LayoutSerializer;

// Owns the layout model and performs every mutation of it. Widgets report
// input here; the manager decides, mutates the model, re-renders the affected
// windows and notifies the host.
class DOCKING_EXPORT DockingManager final : public QObject
{
    Q_OBJECT

public:
    using WidgetFactory = std::function<QWidget*(const QString& persistentId)>;
    using StateProvider = std::function<QJsonObject(QWidget* content)>;
    using StateRestorer = std::function<void(QWidget* content, const QJsonObject& state)>;

    struct StateHandlers final {
        StateProvider provider;
        StateRestorer restorer;
    };

    explicit DockingManager(QObject* parent = nullptr);
    ~DockingManager() override;

    const DockingConfig& config() const { return m_config; }
    void setConfig(const DockingConfig& config);

    bool debugMode() const { return m_debugMode; }
    void setDebugMode(bool enabled) { m_debugMode = enabled; }

    const LayoutModel& model() const { return m_model; }
    WidgetRegistry& registry() { return m_registry; }
    const WidgetRegistry& registry() const { return m_registry; }
    const DockingStateMachine& stateMachine() const { return m_state; }
    const DockDragController& dragController() const { return m_drag; }

    // Registration -------------------------------------------------------

    DockContainer* createFloatingWindow(QWidget* content,
                                        const QString& persistentId,
                                        const QString& title,
                                        std::optional<QPoint> pos = std::nullopt,
                                        std::optional<QSize> size = std::nullopt);
    DockContainer* registerWidget(DockPanel* panel,
                                  std::optional<QPoint> pos = std::nullopt,
                                  std::optional<QSize> size = std::nullopt);
    Utils::Result unregisterWidget(DockPanel* panel);

    DockContainer* createPanelFromKey(const QString& key,
                                      std::optional<QPoint> pos = std::nullopt,
                                      std::optional<QSize> size = std::nullopt);

    Utils::Result registerDockArea(DockContainer* container);
    Utils::Result unregisterDockArea(DockContainer* container);
    DockContainer* createFloatingRoot(const QString& title = {});

    bool registerWidgetFactory(const QString& key,
                               WidgetRegistry::Factory factory,
                               const QString& defaultTitle,
                               QString* errorOut = nullptr);

    template <typename T>
    bool registerWidgetType(const QString& key, const QString& defaultTitle, QString* errorOut = nullptr)
    {
        return m_registry.registerType<T>(key, defaultTitle, errorOut);
    }

    void setWidgetFactory(WidgetFactory factory) { m_widgetFactory = std::move(factory); }
    void registerInstanceStateHandlers(const QString& persistentId, StateProvider provider, StateRestorer restorer);
    void unregisterInstanceStateHandlers(const QString& persistentId);

    // Operations --------------------------------------------------------

    // target is a DockPanel or a DockContainer.
    Utils::Result dockWidget(DockPanel* source, QWidget* target, DockLocation location);
    Utils::Result dockContainer(DockContainer* source, QWidget* target, DockLocation location);
    Utils::Result insertWidgetIntoTabGroup(DockPanel* source, DockTabWidget* tabs, int index);
    Utils::Result insertContainerIntoTabGroup(DockContainer* source, DockTabWidget* tabs, int index);

    Utils::Result undockWidget(DockPanel* panel);
    Utils::Result undockByTear(DockPanel* panel, const QPoint& globalPos);
    Utils::Result undockTabGroup(DockTabWidget* tabs);

    Utils::Result moveWidgetToContainer(DockPanel* panel, DockContainer* container);

    Utils::Result closeWidget(DockPanel* panel);
    Utils::Result closeContainer(DockContainer* container);
    Utils::Result closeTabGroup(DockTabWidget* tabs);

    Utils::Result activateWidget(DockPanel* panel);
    Utils::Result reorderTab(DockTabWidget* tabs, int from, int to);

    // Queries -----------------------------------------------------------

    DockPanel* findWidgetById(const QString& persistentId) const;
    QList<DockPanel*> listAllWidgets() const;
    QList<DockPanel*> listFloatingWidgets() const;
    QList<DockContainer*> containers() const { return m_model.windows(); }
    DockContainer* containerOf(const DockPanel* panel) const;
    QList<DockContainer*> windowStack() const;
    void bringToFront(DockContainer* container);

    // Persistence -------------------------------------------------------

    QByteArray saveLayout();
    Utils::Result loadLayout(const QByteArray& data);
    QJsonObject saveLayoutObject();
    Utils::Result loadLayoutObject(const QJsonObject& layout);
    Utils::Result saveLayoutToFile(const QString& path);
    Utils::Result loadLayoutFromFile(const QString& path);

    // Input from widgets ------------------------------------------------

    bool beginWindowDrag(DockContainer* container, const QPoint& globalPos);
    void updateWindowDrag(const QPoint& globalPos);
    void endWindowDrag(const QPoint& globalPos);

    bool beginResize(DockContainer* container);
    void endResize(DockContainer* container);

    // Blocks inside QDrag::exec until the drop or cancel.
    void startNativeTabDrag(DockPanel* panel);
    void updateNativeDrag(const QPoint& globalPos);
    bool finishNativeDrop(const QPoint& globalPos);

signals:
    void widgetDocked(Docking::DockPanel* panel, Docking::DockContainer* container);
    void widgetUndocked(Docking::DockPanel* panel);
    void widgetClosed(const QString& persistentId);
    void layoutChanged();

private:
    friend class LayoutSerializer;

    enum class ReconcileOutcome : unsigned char {
        Rendered,
        Reset,
        Removed
    };

    struct DockSource final {
        QPointer<DockContainer> window;
        QPointer<DockPanel> panel;
    };

    struct ResolvedSource final {
        DockContainer* origin = nullptr;
        WidgetNodePtr node;
        bool wholeWindow = false;
    };

    DockContainer* createContainer(WindowKind kind, QWidget* parent = nullptr);
    void trackContainer(DockContainer* container);
    void trackPanel(DockPanel* panel);
    DockPanel* wrapContent(QWidget* content, const QString& persistentId, const QString& title);

    void renderContainer(DockContainer* container, DockPanel* activate = nullptr);
    void wireRoutes(DockContainer* container);
    ReconcileOutcome reconcile(DockContainer* container, DockPanel* activate = nullptr);
    void reconcileDirtyWindows();
    void closeWindowSilently(DockContainer* container);
    void captureSizes(DockContainer* container);
    void flushRender(DockContainer* container);

    Utils::Result resolveSource(const DockSource& source, ResolvedSource& out) const;
    DockContainer* windowOfTabs(const DockTabWidget* tabs, TabGroupNodePtr* groupOut = nullptr) const;
    Utils::Result commitDock(const DockSource& source, QWidget* target, DockLocation location);
    Utils::Result commitTabInsert(const DockSource& source, DockTabWidget* tabs, int index);
    Utils::Result commitPendingDrop(const DockSource& source, const PendingDrop& drop);
    void finishMove(const ResolvedSource& source, DockContainer* destination, const QList<DockPanel*>& moved);
    DockContainer* detachAsFloating(const HostInfo& host, const QRect& geometry);

    QPoint cascadePosition();
    QSize floatingSizeFor(const DockPanel* panel, const QSize& fallback) const;
    QList<DockPanel*> panelsOf(const DockContainer* container) const;

    void discardPanels(const QList<DockPanel*>& panels);
    void clearLayout();
    void emitLayoutChanged();
    void report(const Utils::Result& result, const char* operation) const;

    DockingConfig m_config;
    bool m_debugMode = false;

    LayoutModel m_model;
    WidgetRegistry m_registry;
    LayoutRenderer m_renderer;
    DockingStateMachine m_state;
    DockDragController m_drag;

    WidgetFactory m_widgetFactory;
    QHash<QString, StateHandlers> m_stateHandlers;

    QList<QPointer<DockContainer>> m_windowStack;
    QPointer<DockContainer> m_dragWindow;
    QPoint m_dragOffset;
    QPointer<DockPanel> m_nativeDragPanel;
    bool m_nativeDropHandled = false;

    QSet<const QObject*> m_trackedPanels;
    QList<QPointer<DockContainer>> m_dirtyWindows;
    bool m_reconcileQueued = false;
    bool m_shuttingDown = false;
    int m_cascadeCount = 0;
};

} // namespace Docking
