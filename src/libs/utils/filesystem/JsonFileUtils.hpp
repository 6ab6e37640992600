// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

// Creates missing parent directories, then replaces the file in one step.
UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// error is cleared on success. sourceName only labels messages.
UTILS_EXPORT QJsonObject parseObject(const QByteArray& bytes, const QString& sourceName, QString* error = nullptr);

UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr);

} // namespace Utils::JsonFileUtils
