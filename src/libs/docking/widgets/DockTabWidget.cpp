// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockTabWidget.hpp"

#include "docking/widgets/DockPanel.hpp"
#include "docking/widgets/DockTabBar.hpp"

#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QToolButton>

namespace Docking {

namespace {

QToolButton* makeCornerButton(QWidget* parent, const QString& objectName, const QString& text, const QString& tip)
{
    auto* button = new QToolButton(parent);
    button->setObjectName(objectName);
    button->setText(text);
    button->setToolTip(tip);
    button->setAutoRaise(true);
    button->setFocusPolicy(Qt::NoFocus);
    return button;
}

} // namespace

DockTabWidget::DockTabWidget(QWidget* parent)
    : QTabWidget(parent)
{
    setObjectName(QStringLiteral("DockTabWidget"));

    m_tabBar = new DockTabBar(this);
    setTabBar(m_tabBar);
    setMovable(true);
    setTabsClosable(true);
    setDocumentMode(true);

    m_corner = new QWidget(this);
    auto* cornerLayout = new QHBoxLayout(m_corner);
    cornerLayout->setContentsMargins(0, 0, 2, 0);
    cornerLayout->setSpacing(0);

    m_undockButton = makeCornerButton(m_corner,
                                      QStringLiteral("DockUndockGroupButton"),
                                      QStringLiteral("↗"),
                                      tr("Float tab group"));
    m_closeButton = makeCornerButton(m_corner,
                                     QStringLiteral("DockCloseGroupButton"),
                                     QStringLiteral("✕"),
                                     tr("Close tab group"));
    cornerLayout->addWidget(m_undockButton);
    cornerLayout->addWidget(m_closeButton);
    setCornerWidget(m_corner, Qt::TopRightCorner);

    connect(m_undockButton, &QToolButton::clicked, this, &DockTabWidget::undockGroupRequested);
    connect(m_closeButton, &QToolButton::clicked, this, &DockTabWidget::closeGroupRequested);

    connect(this, &QTabWidget::tabCloseRequested, this, [this](int index) {
        if (DockPanel* panel = panelAt(index))
            emit closePanelRequested(panel);
    });
    connect(m_tabBar, &QTabBar::tabMoved, this, &DockTabWidget::panelMoved);
    connect(m_tabBar, &DockTabBar::tearRequested, this, [this](int index, const QPoint& globalPos) {
        if (DockPanel* panel = panelAt(index))
            emit tearRequested(panel, globalPos);
    });
    connect(m_tabBar, &DockTabBar::nativeDragRequested, this, [this](int index) {
        if (DockPanel* panel = panelAt(index))
            emit nativeDragRequested(panel);
    });
}

void DockTabWidget::addPanel(DockPanel* panel)
{
    if (!panel)
        return;
    addTab(panel, panel->title());
    connect(panel, &DockPanel::titleChanged, this, [this, panel](const QString& title) {
        const int index = indexOfPanel(panel);
        if (index >= 0)
            setTabText(index, title);
    });
}

DockPanel* DockTabWidget::panelAt(int index) const
{
    return qobject_cast<DockPanel*>(widget(index));
}

int DockTabWidget::indexOfPanel(const DockPanel* panel) const
{
    for (int i = 0; i < count(); ++i) {
        if (widget(i) == panel)
            return i;
    }
    return -1;
}

QList<DockPanel*> DockTabWidget::panels() const
{
    QList<DockPanel*> out;
    for (int i = 0; i < count(); ++i) {
        if (DockPanel* panel = panelAt(i))
            out.push_back(panel);
    }
    return out;
}

void DockTabWidget::setChromeVisible(bool visible)
{
    m_chromeVisible = visible;
    m_tabBar->setVisible(visible);
    m_corner->setVisible(visible);
}

} // namespace Docking
