// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/persistence/LayoutSerializer.hpp"

#include "docking/DockingConstants.hpp"
#include "docking/DockingManager.hpp"
#include "docking/IDockStateful.hpp"
#include "docking/model/LayoutSimplifier.hpp"
#include "docking/services/LayoutRenderer.hpp"
#include "docking/widgets/DockContainer.hpp"
#include "docking/widgets/DockPanel.hpp"

#include <utils/filesystem/JsonFileUtils.hpp>

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>

#include <exception>
#include <utility>

namespace Docking {

namespace {

using namespace Qt::StringLiterals;

QString orientationToString(Qt::Orientation orientation)
{
    return orientation == Qt::Vertical ? u"vertical"_s : u"horizontal"_s;
}

bool orientationFromString(const QString& text, Qt::Orientation& out)
{
    const QString key = text.trimmed().toLower();
    if (key == u"horizontal"_s) {
        out = Qt::Horizontal;
        return true;
    }
    if (key == u"vertical"_s) {
        out = Qt::Vertical;
        return true;
    }
    return false;
}

QJsonObject rectObject(const QRect& rect)
{
    QJsonObject obj;
    obj.insert(u"x"_s, rect.x());
    obj.insert(u"y"_s, rect.y());
    obj.insert(u"w"_s, rect.width());
    obj.insert(u"h"_s, rect.height());
    return obj;
}

bool rectFromValue(const QJsonValue& value, QRect& out)
{
    if (!value.isObject())
        return false;
    const QJsonObject obj = value.toObject();
    const QJsonValue x = obj.value(u"x"_s);
    const QJsonValue y = obj.value(u"y"_s);
    const QJsonValue w = obj.value(u"w"_s);
    const QJsonValue h = obj.value(u"h"_s);
    if (!x.isDouble() || !y.isDouble() || !w.isDouble() || !h.isDouble())
        return false;
    out = QRect(x.toInt(), y.toInt(), w.toInt(), h.toInt());
    return true;
}

} // namespace

LayoutSerializer::LayoutSerializer(DockingManager& manager)
    : m_manager(manager)
{}

// Save -----------------------------------------------------------------------

QJsonObject LayoutSerializer::serialize()
{
    QJsonArray windows;
    for (DockContainer* window : m_manager.m_model.windows()) {
        LayoutRenderer::captureSplitterSizes(window);
        windows.append(serializeWindow(window));
    }

    QJsonObject root;
    root.insert(u"version"_s, Constants::kLayoutSchemaVersion);
    root.insert(u"windows"_s, windows);
    return root;
}

QByteArray LayoutSerializer::save()
{
    return QJsonDocument(serialize()).toJson(QJsonDocument::Compact);
}

QJsonObject LayoutSerializer::serializeWindow(DockContainer* window) const
{
    QJsonObject obj;
    obj.insert(u"kind"_s, windowKindToString(window->kind()));

    // The main dock area is embedded; its host window carries the geometry.
    const QRect geometry = window->isMainDockArea() ? window->window()->geometry() : window->geometry();
    obj.insert(u"geometry"_s, rectObject(geometry));
    obj.insert(u"maximized"_s, window->isMaximizedState());
    if (window->isMaximizedState() && window->storedNormalGeometry().isValid())
        obj.insert(u"normalGeometry"_s, rectObject(window->storedNormalGeometry()));
    obj.insert(u"isMainWindow"_s, window->isMainDockArea());
    obj.insert(u"isPersistentRoot"_s, window->isPersistentRoot());

    if (const auto root = m_manager.m_model.root(window))
        obj.insert(u"content"_s, serializeNode(*root));
    return obj;
}

QJsonObject LayoutSerializer::serializeNode(const PaneNode& node) const
{
    return std::visit(Overloaded{
        [this](const TabGroupNodePtr& group) -> QJsonObject {
            QJsonArray children;
            if (group) {
                for (const WidgetNodePtr& widget : group->children) {
                    if (widget && widget->panel)
                        children.append(serializeWidget(widget));
                }
            }
            QJsonObject obj;
            obj.insert(u"type"_s, u"tabgroup"_s);
            obj.insert(u"children"_s, children);
            return obj;
        },
        [this](const SplitterNodePtr& splitter) -> QJsonObject {
            QJsonObject obj;
            obj.insert(u"type"_s, u"splitter"_s);
            if (!splitter)
                return obj;
            obj.insert(u"orientation"_s, orientationToString(splitter->orientation));
            QJsonArray sizes;
            for (int size : splitter->sizes)
                sizes.append(size);
            obj.insert(u"sizes"_s, sizes);
            QJsonArray children;
            for (const PaneNode& child : splitter->children)
                children.append(serializeNode(child));
            obj.insert(u"children"_s, children);
            return obj;
        }}, node);
}

QJsonObject LayoutSerializer::serializeWidget(const WidgetNodePtr& widget) const
{
    const DockPanel* panel = widget->panel.data();

    QJsonObject obj;
    obj.insert(u"type"_s, u"widget"_s);
    obj.insert(u"id"_s, panel->persistentId());
    obj.insert(u"margin"_s, panel->contentMargin());
    if (const auto state = captureState(panel))
        obj.insert(u"state"_s, *state);
    return obj;
}

std::optional<QJsonObject> LayoutSerializer::captureState(const DockPanel* panel) const
{
    QWidget* content = panel->content();
    if (!content)
        return std::nullopt;

    try {
        if (const auto* stateful = dynamic_cast<const IDockStateful*>(content))
            return stateful->captureDockState();

        const auto it = m_manager.m_stateHandlers.constFind(panel->persistentId());
        if (it != m_manager.m_stateHandlers.constEnd() && it->provider)
            return it->provider(content);
    } catch (const std::exception& e) {
        qCWarning(dockingpersistlog).noquote()
            << "Capturing state of" << panel->persistentId() << "failed:" << e.what();
    } catch (...) {
        qCWarning(dockingpersistlog).noquote()
            << "Capturing state of" << panel->persistentId() << "failed with an unknown exception";
    }
    return std::nullopt;
}

// Parse ----------------------------------------------------------------------

bool LayoutSerializer::parseWindow(const QJsonObject& object, WindowRecord& out, QString* errorOut)
{
    auto fail = [&](const QString& message) {
        if (errorOut)
            *errorOut = message;
        return false;
    };

    const auto kind = windowKindFromString(object.value(u"kind"_s).toString());
    if (!kind)
        return fail(u"unknown window kind '%1'"_s.arg(object.value(u"kind"_s).toString()));
    out.kind = *kind;

    if (object.value(u"isMainWindow"_s).toBool(false))
        out.kind = WindowKind::MainDockArea;

    const QJsonValue geometry = object.value(u"geometry"_s);
    if (!geometry.isUndefined() && !rectFromValue(geometry, out.geometry))
        return fail(u"geometry must contain numeric x/y/w/h"_s);

    out.maximized = object.value(u"maximized"_s).toBool(false);
    const QJsonValue normal = object.value(u"normalGeometry"_s);
    if (!normal.isUndefined() && !normal.isNull() && !rectFromValue(normal, out.normalGeometry))
        return fail(u"normalGeometry must contain numeric x/y/w/h"_s);

    const QJsonValue content = object.value(u"content"_s);
    if (content.isUndefined() || content.isNull()) {
        out.content = NodeRecord{};
        return true;
    }
    if (!content.isObject())
        return fail(u"content must be an object"_s);
    return parseNode(content.toObject(), u"content"_s, out.content, errorOut);
}

bool LayoutSerializer::parseNode(const QJsonObject& object, const QString& path, NodeRecord& out, QString* errorOut)
{
    auto fail = [&](const QString& message) {
        if (errorOut)
            *errorOut = u"%1: %2"_s.arg(path, message);
        return false;
    };

    const QString type = object.value(u"type"_s).toString().trimmed().toLower();

    if (type == u"widget"_s) {
        out.type = NodeRecord::Type::Widget;
        out.id = object.value(u"id"_s).toString().trimmed();
        if (out.id.isEmpty())
            return fail(u"widget has no id"_s);
        const QJsonValue margin = object.value(u"margin"_s);
        if (margin.isDouble())
            out.margin = margin.toInt();
        const QJsonValue state = object.value(u"state"_s);
        if (state.isObject())
            out.state = state.toObject();
        return true;
    }

    const QJsonValue childrenValue = object.value(u"children"_s);
    if (!childrenValue.isUndefined() && !childrenValue.isArray())
        return fail(u"children must be an array"_s);
    const QJsonArray children = childrenValue.toArray();

    if (type == u"tabgroup"_s) {
        out.type = NodeRecord::Type::TabGroup;
        for (qsizetype i = 0; i < children.size(); ++i) {
            NodeRecord child;
            const QString childPath = u"%1.children[%2]"_s.arg(path).arg(i);
            if (!children.at(i).isObject())
                return fail(u"children[%1] is not an object"_s.arg(i));
            if (!parseNode(children.at(i).toObject(), childPath, child, errorOut))
                return false;
            if (child.type != NodeRecord::Type::Widget)
                return fail(u"tab groups can only hold widgets"_s);
            out.children.push_back(child);
        }
        return true;
    }

    if (type == u"splitter"_s) {
        out.type = NodeRecord::Type::Splitter;
        if (!orientationFromString(object.value(u"orientation"_s).toString(), out.orientation))
            return fail(u"unknown orientation '%1'"_s.arg(object.value(u"orientation"_s).toString()));

        const QJsonArray sizes = object.value(u"sizes"_s).toArray();
        for (const QJsonValue& size : sizes) {
            if (!size.isDouble())
                return fail(u"sizes must be numbers"_s);
            out.sizes.push_back(size.toInt());
        }

        for (qsizetype i = 0; i < children.size(); ++i) {
            NodeRecord child;
            const QString childPath = u"%1.children[%2]"_s.arg(path).arg(i);
            if (!children.at(i).isObject())
                return fail(u"children[%1] is not an object"_s.arg(i));
            if (!parseNode(children.at(i).toObject(), childPath, child, errorOut))
                return false;
            if (child.type == NodeRecord::Type::Widget)
                return fail(u"splitters cannot hold widgets directly"_s);
            out.children.push_back(child);
        }
        return true;
    }

    return fail(u"unknown node type '%1'"_s.arg(type));
}

// Load -----------------------------------------------------------------------

Utils::Result LayoutSerializer::load(const QByteArray& data)
{
    QString error;
    const QJsonObject document = Utils::JsonFileUtils::parseObject(data, u"layout data"_s, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);
    return deserialize(document);
}

Utils::Result LayoutSerializer::deserialize(const QJsonObject& document)
{
    const QJsonValue version = document.value(u"version"_s);
    if (!version.isDouble())
        return Utils::Result::failure(u"Layout version is missing."_s);
    if (version.toInt() < 1 || version.toInt() > Constants::kLayoutSchemaVersion)
        return Utils::Result::failure(u"Unsupported layout version: %1"_s.arg(version.toInt()));

    const QJsonValue windowsValue = document.value(u"windows"_s);
    if (!windowsValue.isArray())
        return Utils::Result::failure(u"Layout windows must be an array."_s);

    QVector<WindowRecord> records;
    const QJsonArray windows = windowsValue.toArray();
    for (qsizetype i = 0; i < windows.size(); ++i) {
        WindowRecord record;
        QString error;
        if (!windows.at(i).isObject() || !parseWindow(windows.at(i).toObject(), record, &error)) {
            qCWarning(dockingpersistlog).noquote()
                << u"Skipping windows[%1]: %2"_s.arg(i).arg(error.isEmpty() ? u"not an object"_s : error);
            continue;
        }
        records.push_back(record);
    }

    m_manager.clearLayout();
    m_created.clear();
    m_pendingStates.clear();

    QList<DockContainer*> mainAreas;
    QList<DockContainer*> floatingRoots;
    for (DockContainer* window : m_manager.m_model.windows()) {
        if (window->kind() == WindowKind::MainDockArea)
            mainAreas.push_back(window);
        else if (window->kind() == WindowKind::FloatingRoot)
            floatingRoots.push_back(window);
    }

    QList<DockContainer*> loaded;
    for (const WindowRecord& record : std::as_const(records)) {
        const bool persistent = record.kind != WindowKind::Floating;

        std::optional<PaneNode> root = buildPane(record.content);
        bool rootEmpty = !root;
        if (root) {
            bool emptied = false;
            simplify(*root, persistent, &emptied);
            rootEmpty = emptied || isEmptyPane(*root);
        }
        if (rootEmpty && !persistent)
            continue;

        DockContainer* window = containerFor(record, mainAreas, floatingRoots);
        if (!window) {
            qCWarning(dockingpersistlog) << "No dock area available for a saved"
                                         << windowKindToString(record.kind) << "window";
            if (root)
                m_manager.discardPanels(allPanels(*root));
            continue;
        }

        if (rootEmpty)
            m_manager.m_model.resetRoot(window);
        else
            m_manager.m_model.setRoot(window, *root);

        applyGeometry(window, record);
        loaded.push_back(window);
    }

    for (const PendingState& pending : std::as_const(m_pendingStates))
        restoreState(pending.panel, pending.state);
    m_pendingStates.clear();

    for (DockContainer* window : std::as_const(loaded)) {
        m_manager.renderContainer(window);
        if (!window->isMainDockArea()) {
            window->show();
            m_manager.bringToFront(window);
        }
    }

    m_created.clear();
    m_manager.emitLayoutChanged();
    return Utils::Result::success();
}

DockContainer* LayoutSerializer::containerFor(const WindowRecord& record,
                                              QList<DockContainer*>& mainAreas,
                                              QList<DockContainer*>& floatingRoots)
{
    switch (record.kind) {
        case WindowKind::MainDockArea:
            return mainAreas.isEmpty() ? nullptr : mainAreas.takeFirst();
        case WindowKind::FloatingRoot: {
            if (!floatingRoots.isEmpty())
                return floatingRoots.takeFirst();
            DockContainer* window = m_manager.createContainer(WindowKind::FloatingRoot);
            m_manager.m_model.registerEmptyRoot(window);
            return window;
        }
        case WindowKind::Floating:
            return m_manager.createContainer(WindowKind::Floating);
    }
    return nullptr;
}

std::optional<PaneNode> LayoutSerializer::buildPane(const NodeRecord& record)
{
    if (record.type == NodeRecord::Type::TabGroup)
        return PaneNode(makeTabGroup(buildWidgets(record.children)));

    if (record.type == NodeRecord::Type::Splitter) {
        QVector<PaneNode> children;
        QList<int> sizes;
        const bool sizesMatch = std::size_t(record.sizes.size()) == record.children.size();
        for (std::size_t i = 0; i < record.children.size(); ++i) {
            std::optional<PaneNode> child = buildPane(record.children.at(i));
            if (!child)
                continue;
            children.push_back(*child);
            if (sizesMatch)
                sizes.push_back(record.sizes.at(qsizetype(i)));
        }
        SplitterNodePtr splitter = makeSplitter(record.orientation, children);
        if (sizes.size() == children.size())
            splitter->sizes = sizes;
        return PaneNode(splitter);
    }

    return std::nullopt;
}

QVector<WidgetNodePtr> LayoutSerializer::buildWidgets(const std::vector<NodeRecord>& records)
{
    QVector<WidgetNodePtr> widgets;
    for (const NodeRecord& record : records) {
        if (m_created.contains(record.id)) {
            qCWarning(dockingpersistlog).noquote() << "Widget" << record.id << "appears more than once; keeping the first";
            continue;
        }
        DockPanel* panel = createPanel(record);
        if (!panel)
            continue;
        m_created.insert(record.id, panel);
        widgets.push_back(makeWidgetNode(panel));
        if (record.state)
            m_pendingStates.push_back(PendingState{panel, *record.state});
    }
    return widgets;
}

DockPanel* LayoutSerializer::createPanel(const NodeRecord& record)
{
    QWidget* content = nullptr;
    QString title;

    if (const auto registration = m_manager.m_registry.registration(record.id)) {
        QString error;
        content = m_manager.m_registry.create(record.id, &error);
        if (!content)
            qCWarning(dockingpersistlog).noquote() << error;
        title = registration->defaultTitle;
    } else if (m_manager.m_widgetFactory) {
        try {
            content = m_manager.m_widgetFactory(record.id);
        } catch (const std::exception& e) {
            qCWarning(dockingpersistlog).noquote() << "Widget factory failed for" << record.id << ":" << e.what();
            content = nullptr;
        } catch (...) {
            qCWarning(dockingpersistlog).noquote() << "Widget factory failed for" << record.id;
            content = nullptr;
        }
    }

    if (!content) {
        qCWarning(dockingpersistlog).noquote() << "Cannot create widget" << record.id << "; skipping it";
        return nullptr;
    }

    DockPanel* panel = m_manager.wrapContent(content, record.id, title);
    if (record.margin >= 0)
        panel->setContentMargin(record.margin);
    m_manager.trackPanel(panel);
    return panel;
}

void LayoutSerializer::restoreState(DockPanel* panel, const QJsonObject& state) const
{
    QWidget* content = panel ? panel->content() : nullptr;
    if (!content)
        return;

    try {
        if (auto* stateful = dynamic_cast<IDockStateful*>(content)) {
            stateful->restoreDockState(state);
            return;
        }
        const auto it = m_manager.m_stateHandlers.constFind(panel->persistentId());
        if (it != m_manager.m_stateHandlers.constEnd() && it->restorer)
            it->restorer(content, state);
    } catch (const std::exception& e) {
        qCWarning(dockingpersistlog).noquote()
            << "Restoring state of" << panel->persistentId() << "failed:" << e.what();
    } catch (...) {
        qCWarning(dockingpersistlog).noquote()
            << "Restoring state of" << panel->persistentId() << "failed with an unknown exception";
    }
}

void LayoutSerializer::applyGeometry(DockContainer* window, const WindowRecord& record)
{
    if (window->isMainDockArea()) {
        QWidget* host = window->window();
        if (host != window && record.geometry.isValid())
            host->setGeometry(record.geometry);
        return;
    }

    if (record.maximized) {
        const QRect normal = record.normalGeometry.isValid() ? record.normalGeometry : record.geometry;
        if (normal.isValid())
            window->setGeometry(normal);
        window->setMaximizedState(true, normal);
        return;
    }

    if (window->isMaximizedState())
        window->setMaximizedState(false);
    if (record.geometry.isValid())
        window->setGeometry(record.geometry);
}

} // namespace Docking
