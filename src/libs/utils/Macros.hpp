// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/ScopeGuard.hpp"

#include <QtCore/QtGlobal>

// Cleanup idiom shared by the docking code.

#define UTILS__JOIN2(a, b) a##b
#define UTILS__JOIN(a, b) UTILS__JOIN2(a, b)

// Runs the statement when the enclosing scope exits, including by exception.
#ifndef UTILS_DEFER
#	define UTILS_DEFER(...) \
		auto UTILS__JOIN(_utils_defer_, __COUNTER__) = ::Utils::makeScopeGuard([&] { __VA_ARGS__; })
#endif
