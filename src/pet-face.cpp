#include "pet-face.hpp"

#include <QBrush>
#include <QColor>
#include <QPainter>
#include <QPen>

void PaintPetFace(QPainter &painter, const QRectF &bounds)
{
	const qreal size = qMin(bounds.width(), bounds.height());
	const QPointF center = bounds.center();
	const qreal radius = size * 0.4;

	painter.save();
	painter.setRenderHint(QPainter::Antialiasing);

	// Head
	painter.setPen(Qt::NoPen);
	painter.setBrush(QBrush(QColor(0xF5, 0xD0, 0xA9)));
	painter.drawEllipse(center, radius, radius);

	// Eyes
	const qreal eye = qMax<qreal>(1.0, size * 0.07);
	const qreal eyeY = center.y() - size * 0.08;
	painter.setBrush(QBrush(Qt::black));
	painter.drawEllipse(QPointF(center.x() - size * 0.15, eyeY), eye, eye);
	painter.drawEllipse(QPointF(center.x() + size * 0.15, eyeY), eye, eye);

	// Mouth
	QPen mouthPen(Qt::black);
	mouthPen.setWidthF(qMax<qreal>(1.0, size * 0.03));
	painter.setPen(mouthPen);
	const qreal mouthY = center.y() + size * 0.15;
	painter.drawLine(QPointF(center.x() - size * 0.1, mouthY), QPointF(center.x() + size * 0.1, mouthY));

	painter.restore();
}
