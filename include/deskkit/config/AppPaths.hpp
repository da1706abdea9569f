#pragma once

#include <QByteArray>
#include <QString>

namespace deskkit::config {

// <LOCALAPPDATA or AppLocalDataLocation>/deskkit/<fileName>. Creates the
// directory; empty when no writable location exists.
[[nodiscard]] QString appDataFilePath(const QString& fileName);

// Replaces path with contents through a temporary file, so a failed write
// leaves the previous file intact. On failure error (if given) says why.
[[nodiscard]] bool writeFileAtomically(const QString& path, const QByteArray& contents, QString* error = nullptr);

}  // namespace deskkit::config
