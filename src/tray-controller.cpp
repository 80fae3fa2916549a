#include "tray-controller.hpp"
#include "app-context.hpp"
#include "pet-face.hpp"
#include "pet-logging.hpp"
#include "pet-window.hpp"
#include "tray-icon-resolver.hpp"

#include <QApplication>
#include <QIcon>
#include <QPainter>
#include <QPixmap>

TrayController::TrayController(AppContext *context_, PetWindow *petWindow_, QObject *parent)
	: QSystemTrayIcon(parent),
	  context(context_),
	  petWindow(petWindow_)
{
	SetupMenu();
	SetupIcon();
	setContextMenu(menu);
	setToolTip(QApplication::applicationDisplayName());

	connect(this, &QSystemTrayIcon::activated, this, &TrayController::OnActivated);
}

TrayController::~TrayController()
{
	delete menu;
}

void TrayController::SetupMenu()
{
	menu = new QMenu();

	QAction *showAction = menu->addAction(tr("Show"));
	connect(showAction, &QAction::triggered, petWindow, &QWidget::show);

	QAction *hideAction = menu->addAction(tr("Hide"));
	connect(hideAction, &QAction::triggered, petWindow, &QWidget::hide);

	menu->addSeparator();

	QAction *quitAction = menu->addAction(tr("Quit"));
	connect(quitAction, &QAction::triggered, this, &TrayController::QuitApplication);
}

void TrayController::SetupIcon()
{
	const PetOptions &options = context->Options();
	const QString path = ResolveTrayIconPath(options.IconsDir(), options.trayIconName);
	if (!path.isEmpty()) {
		QIcon icon(path);
		if (!icon.isNull()) {
			setIcon(icon);
			qCInfo(lcTray, "Loaded tray icon %s", qUtf8Printable(path));
			return;
		}
		qCWarning(lcTray, "Could not load tray icon %s", qUtf8Printable(path));
	}

	setIcon(CreateDefaultIcon());
	qCInfo(lcTray, "Using default tray icon");
}

QIcon TrayController::CreateDefaultIcon()
{
	QPixmap pixmap(16, 16);
	pixmap.fill(Qt::transparent);

	QPainter painter(&pixmap);
	PaintPetFace(painter, QRectF(0, 0, 16, 16));
	painter.end();

	return QIcon(pixmap);
}

void TrayController::OnActivated(QSystemTrayIcon::ActivationReason reason)
{
	if (reason != QSystemTrayIcon::Trigger)
		return;

	if (petWindow->isVisible())
		petWindow->hide();
	else
		petWindow->show();
}

void TrayController::QuitApplication()
{
	hide();
	petWindow->close();
	QApplication::quit();
}
