// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "docking/DockingGlobal.hpp"

Q_LOGGING_CATEGORY(dockinglog, "docksmith.docking")
Q_LOGGING_CATEGORY(dockingdraglog, "docksmith.docking.drag")
Q_LOGGING_CATEGORY(dockingpersistlog, "docksmith.docking.serializer")
