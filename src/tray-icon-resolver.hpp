#pragma once

#include <QString>

/*
 * Picks the tray icon file from iconsDir:
 *   1. preferredName, if present
 *   2. the first *.jpg
 *   3. the first *.png, then *.ico, then *.gif
 * Returns an empty string when nothing matches; the caller then paints a
 * default icon. iconsDir is created if it does not exist.
 */
QString ResolveTrayIconPath(const QString &iconsDir, const QString &preferredName);
