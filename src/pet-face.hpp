#pragma once

#include <QRectF>

class QPainter;

// Round puppy face used for the idle pet and the fallback tray icon.
void PaintPetFace(QPainter &painter, const QRectF &bounds);
