// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace Docking::Constants {

inline constexpr char kPanelMimeType[] = "application/x-docksmith-panel";

inline constexpr int kLayoutSchemaVersion = 1;

inline constexpr int kSplitterHandleWidth = 2;
inline constexpr int kDefaultSplitterSize = 100;

// Overlay styling.
inline constexpr char kOverlayPreviewColor[] = "#800000FF";
inline constexpr char kOverlayIconFill[] = "#E6F0F0F0";
inline constexpr char kOverlayIconBorder[] = "#FF4A4A4A";
inline constexpr char kOverlayIconArrow[] = "#FF0078D7";

// Tab insertion indicator.
inline constexpr char kDropIndicatorColor[] = "#0078D7";
inline constexpr int kDropIndicatorWidth = 3;

inline constexpr char kContainerBorderColor[] = "#6C6C6C";
inline constexpr char kTitleBarColor[] = "#2B2D30";
inline constexpr int kContainerBorderPx = 4;

inline constexpr int kDefaultMainWindowWidth = 1200;
inline constexpr int kDefaultMainWindowHeight = 800;
inline constexpr int kSessionSaveDelayMs = 200;

} // namespace Docking::Constants
