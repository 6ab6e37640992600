// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"
#include "docking/model/LayoutNode.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QRect>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>
#include <vector>

namespace Docking {

class DockContainer;
class DockingManager;
class DockPanel;

// Converts the manager's layout to and from JSON:
//
//   { "version": 1,
//     "windows": [ { "kind", "geometry": {x,y,w,h}, "maximized", "normalGeometry",
//                    "isMainWindow", "isPersistentRoot", "content": <node> } ] }
//
// where <node> is {"type":"splitter","orientation","sizes","children"},
// {"type":"tabgroup","children"} or {"type":"widget","id","margin","state"}.
class DOCKING_EXPORT LayoutSerializer final
{
public:
    explicit LayoutSerializer(DockingManager& manager);

    QJsonObject serialize();
    QByteArray save();

    // A document that does not parse leaves the current layout untouched.
    // Past that point, broken windows and widgets are skipped and logged.
    Utils::Result deserialize(const QJsonObject& document);
    Utils::Result load(const QByteArray& data);

private:
    struct NodeRecord final {
        enum class Type : unsigned char {
            Splitter,
            TabGroup,
            Widget
        };

        Type type = Type::TabGroup;
        Qt::Orientation orientation = Qt::Horizontal;
        QList<int> sizes;
        std::vector<NodeRecord> children;

        QString id;
        int margin = -1;
        std::optional<QJsonObject> state;
    };

    struct WindowRecord final {
        WindowKind kind = WindowKind::Floating;
        QRect geometry;
        bool maximized = false;
        QRect normalGeometry;
        NodeRecord content;
    };

    struct PendingState final {
        DockPanel* panel = nullptr;
        QJsonObject state;
    };

    QJsonObject serializeWindow(DockContainer* window) const;
    QJsonObject serializeNode(const PaneNode& node) const;
    QJsonObject serializeWidget(const WidgetNodePtr& widget) const;
    std::optional<QJsonObject> captureState(const DockPanel* panel) const;

    static bool parseWindow(const QJsonObject& object, WindowRecord& out, QString* errorOut);
    static bool parseNode(const QJsonObject& object, const QString& path, NodeRecord& out, QString* errorOut);

    DockContainer* containerFor(const WindowRecord& record,
                                QList<DockContainer*>& mainAreas,
                                QList<DockContainer*>& floatingRoots);
    std::optional<PaneNode> buildPane(const NodeRecord& record);
    QVector<WidgetNodePtr> buildWidgets(const std::vector<NodeRecord>& records);
    DockPanel* createPanel(const NodeRecord& record);
    void restoreState(DockPanel* panel, const QJsonObject& state) const;
    static void applyGeometry(DockContainer* window, const WindowRecord& record);

    DockingManager& m_manager;

    // Per load pass.
    QHash<QString, DockPanel*> m_created;
    QList<PendingState> m_pendingStates;
};

} // namespace Docking
