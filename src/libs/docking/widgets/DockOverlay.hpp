// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"
#include "docking/DockingTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QRect>
#include <QtWidgets/QWidget>

#include <optional>

namespace Docking {

enum class OverlayStyle : unsigned char {
    Cluster,
    Spread
};

enum class OverlayPreset : unsigned char {
    Standard,
    MainEmpty
};

struct OverlayMetrics final {
    int iconSize = 40;
    int clusterSpacing = 5;
    int spreadInset = 10;
};

// Input-transparent drop affordance over one owner widget. The owner is the
// Qt parent, so the overlay lives at most as long as the owner.
class DOCKING_EXPORT DockOverlay final : public QWidget
{
    Q_OBJECT

public:
    DockOverlay(QWidget* owner, OverlayStyle style, const OverlayMetrics& metrics);

    OverlayStyle style() const { return m_style; }

    void setPreset(OverlayPreset preset);
    OverlayPreset preset() const { return m_preset; }
    const QList<DockLocation>& locations() const { return m_locations; }

    QHash<DockLocation, QRect> iconRects() const;
    std::optional<DockLocation> locationAt(const QPoint& globalPos) const;

    void showPreview(std::optional<DockLocation> location);
    std::optional<DockLocation> previewLocation() const { return m_preview; }

    void syncToOwner();

    static QList<DockLocation> presetLocations(OverlayPreset preset);
    static QHash<DockLocation, QRect> iconRectsFor(const QRect& area,
                                                    OverlayStyle style,
                                                    const OverlayMetrics& metrics,
                                                    const QList<DockLocation>& locations);
    static QRect previewRectFor(const QRect& area, DockLocation location);

    static DockOverlay* overlayFor(const QWidget* owner);
    static DockOverlay* ensureFor(QWidget* owner, OverlayStyle style, const OverlayMetrics& metrics);
    static void destroyFor(QWidget* owner);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    OverlayStyle m_style = OverlayStyle::Cluster;
    OverlayPreset m_preset = OverlayPreset::Standard;
    OverlayMetrics m_metrics;
    QList<DockLocation> m_locations;
    std::optional<DockLocation> m_preview;
};

} // namespace Docking
