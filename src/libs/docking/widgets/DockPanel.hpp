// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "docking/DockingGlobal.hpp"

#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtWidgets/QWidget>

QT_BEGIN_NAMESPACE
class QVBoxLayout;
QT_END_NAMESPACE

namespace Docking {

class DOCKING_EXPORT DockPanel final : public QWidget
{
    Q_OBJECT

public:
    DockPanel(QWidget* content, QString persistentId, QString title, QWidget* parent = nullptr);

    QWidget* content() const { return m_content.data(); }
    const QString& persistentId() const { return m_persistentId; }

    const QString& title() const { return m_title; }
    void setTitle(const QString& title);

    int contentMargin() const { return m_contentMargin; }
    void setContentMargin(int margin);

signals:
    void titleChanged(const QString& title);

private:
    QPointer<QWidget> m_content;
    QString m_persistentId;
    QString m_title;
    int m_contentMargin = 5;
    QVBoxLayout* m_layout = nullptr;
};

} // namespace Docking
