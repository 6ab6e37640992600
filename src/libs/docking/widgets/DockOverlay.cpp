// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockOverlay.hpp"

#include "docking/DockingConstants.hpp"

#include <QtGui/QColor>
#include <QtGui/QPainter>
#include <QtGui/QPolygon>

namespace Docking {

namespace {

QColor constantColor(const char* name)
{
    return QColor(QString::fromLatin1(name));
}

void paintArrow(QPainter& painter, const QRect& icon, DockLocation location)
{
    const QRect inner = icon.adjusted(icon.width() / 4, icon.height() / 4, -icon.width() / 4, -icon.height() / 4);
    if (location == DockLocation::Center) {
        painter.drawRect(inner);
        return;
    }

    const QPoint c = inner.center();
    QPolygon arrow;
    switch (location) {
        case DockLocation::Top:
            arrow << QPoint(inner.left(), c.y() + 2) << QPoint(inner.right(), c.y() + 2) << QPoint(c.x(), inner.top());
            break;
        case DockLocation::Bottom:
            arrow << QPoint(inner.left(), c.y() - 2) << QPoint(inner.right(), c.y() - 2) << QPoint(c.x(), inner.bottom());
            break;
        case DockLocation::Left:
            arrow << QPoint(c.x() + 2, inner.top()) << QPoint(c.x() + 2, inner.bottom()) << QPoint(inner.left(), c.y());
            break;
        case DockLocation::Right:
            arrow << QPoint(c.x() - 2, inner.top()) << QPoint(c.x() - 2, inner.bottom()) << QPoint(inner.right(), c.y());
            break;
        case DockLocation::Center:
            break;
    }
    painter.drawPolygon(arrow);
}

} // namespace

DockOverlay::DockOverlay(QWidget* owner, OverlayStyle style, const OverlayMetrics& metrics)
    : QWidget(owner)
    , m_style(style)
    , m_metrics(metrics)
    , m_locations(presetLocations(OverlayPreset::Standard))
{
    setObjectName(QStringLiteral("DockOverlay"));
    setAttribute(Qt::WA_TransparentForMouseEvents, true);
    setAttribute(Qt::WA_NoSystemBackground, true);
    setAttribute(Qt::WA_TranslucentBackground, true);
    setFocusPolicy(Qt::NoFocus);
    syncToOwner();
}

QList<DockLocation> DockOverlay::presetLocations(OverlayPreset preset)
{
    if (preset == OverlayPreset::MainEmpty)
        return {DockLocation::Center};
    return {DockLocation::Top, DockLocation::Left, DockLocation::Bottom, DockLocation::Right, DockLocation::Center};
}

void DockOverlay::setPreset(OverlayPreset preset)
{
    if (m_preset == preset)
        return;
    m_preset = preset;
    m_locations = presetLocations(preset);
    if (m_preview && !m_locations.contains(*m_preview))
        m_preview.reset();
    update();
}

QHash<DockLocation, QRect> DockOverlay::iconRectsFor(const QRect& area,
                                                     OverlayStyle style,
                                                     const OverlayMetrics& metrics,
                                                     const QList<DockLocation>& locations)
{
    QHash<DockLocation, QRect> rects;
    const int s = metrics.iconSize;
    const QPoint c = area.center();
    const QRect center(c.x() - s / 2, c.y() - s / 2, s, s);

    for (DockLocation location : locations) {
        QRect r = center;
        if (style == OverlayStyle::Cluster) {
            const int step = s + metrics.clusterSpacing;
            switch (location) {
                case DockLocation::Top: r.translate(0, -step); break;
                case DockLocation::Bottom: r.translate(0, step); break;
                case DockLocation::Left: r.translate(-step, 0); break;
                case DockLocation::Right: r.translate(step, 0); break;
                case DockLocation::Center: break;
            }
        } else {
            const int inset = metrics.spreadInset;
            switch (location) {
                case DockLocation::Top: r.moveTop(area.top() + inset); break;
                case DockLocation::Bottom: r.moveBottom(area.bottom() - inset); break;
                case DockLocation::Left: r.moveLeft(area.left() + inset); break;
                case DockLocation::Right: r.moveRight(area.right() - inset); break;
                case DockLocation::Center: break;
            }
        }
        rects.insert(location, r);
    }
    return rects;
}

QRect DockOverlay::previewRectFor(const QRect& area, DockLocation location)
{
    const int halfW = area.width() / 2;
    const int halfH = area.height() / 2;
    switch (location) {
        case DockLocation::Top: return QRect(area.left(), area.top(), area.width(), halfH);
        case DockLocation::Bottom: return QRect(area.left(), area.top() + halfH, area.width(), area.height() - halfH);
        case DockLocation::Left: return QRect(area.left(), area.top(), halfW, area.height());
        case DockLocation::Right: return QRect(area.left() + halfW, area.top(), area.width() - halfW, area.height());
        case DockLocation::Center: return area;
    }
    return area;
}

QHash<DockLocation, QRect> DockOverlay::iconRects() const
{
    return iconRectsFor(rect(), m_style, m_metrics, m_locations);
}

std::optional<DockLocation> DockOverlay::locationAt(const QPoint& globalPos) const
{
    const QPoint local = mapFromGlobal(globalPos);
    const auto rects = iconRects();
    for (DockLocation location : m_locations) {
        if (rects.value(location).contains(local))
            return location;
    }
    return std::nullopt;
}

void DockOverlay::showPreview(std::optional<DockLocation> location)
{
    if (location && !m_locations.contains(*location))
        location.reset();
    if (m_preview == location)
        return;
    m_preview = location;
    update();
}

void DockOverlay::syncToOwner()
{
    if (QWidget* owner = parentWidget())
        setGeometry(owner->rect());
    raise();
}

void DockOverlay::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    if (m_preview) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(constantColor(Constants::kOverlayPreviewColor));
        painter.drawRect(previewRectFor(rect(), *m_preview));
    }

    const auto rects = iconRects();
    for (DockLocation location : m_locations) {
        const QRect icon = rects.value(location);
        painter.setPen(constantColor(Constants::kOverlayIconBorder));
        painter.setBrush(constantColor(Constants::kOverlayIconFill));
        painter.drawRoundedRect(icon, 4, 4);

        painter.setPen(Qt::NoPen);
        painter.setBrush(constantColor(Constants::kOverlayIconArrow));
        paintArrow(painter, icon, location);
    }
}

DockOverlay* DockOverlay::overlayFor(const QWidget* owner)
{
    if (!owner)
        return nullptr;
    return owner->findChild<DockOverlay*>(QString(), Qt::FindDirectChildrenOnly);
}

DockOverlay* DockOverlay::ensureFor(QWidget* owner, OverlayStyle style, const OverlayMetrics& metrics)
{
    if (!owner)
        return nullptr;
    if (DockOverlay* existing = overlayFor(owner)) {
        existing->syncToOwner();
        return existing;
    }
    return new DockOverlay(owner, style, metrics);
}

void DockOverlay::destroyFor(QWidget* owner)
{
    DockOverlay* overlay = overlayFor(owner);
    if (!overlay)
        return;
    overlay->hide();
    overlay->setParent(nullptr);
    overlay->deleteLater();
}

} // namespace Docking
