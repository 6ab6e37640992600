// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/widgets/DockPanel.hpp"

#include <QtWidgets/QVBoxLayout>

namespace Docking {

DockPanel::DockPanel(QWidget* content, QString persistentId, QString title, QWidget* parent)
    : QWidget(parent)
    , m_content(content)
    , m_persistentId(std::move(persistentId))
    , m_title(std::move(title))
{
    setObjectName(QStringLiteral("DockPanel"));
    setWindowTitle(m_title);

    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(m_contentMargin, m_contentMargin, m_contentMargin, m_contentMargin);
    m_layout->setSpacing(0);
    if (m_content)
        m_layout->addWidget(m_content);
}

void DockPanel::setTitle(const QString& title)
{
    if (m_title == title)
        return;
    m_title = title;
    setWindowTitle(title);
    emit titleChanged(title);
}

void DockPanel::setContentMargin(int margin)
{
    margin = qMax(0, margin);
    if (m_contentMargin == margin)
        return;
    m_contentMargin = margin;
    m_layout->setContentsMargins(margin, margin, margin, margin);
}

} // namespace Docking
