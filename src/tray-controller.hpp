#pragma once

#include <QSystemTrayIcon>
#include <QMenu>

class AppContext;
class PetWindow;

class TrayController : public QSystemTrayIcon {
	Q_OBJECT

public:
	TrayController(AppContext *context, PetWindow *petWindow, QObject *parent = nullptr);
	~TrayController();

private slots:
	void OnActivated(QSystemTrayIcon::ActivationReason reason);
	void QuitApplication();

private:
	void SetupMenu();
	void SetupIcon();
	static QIcon CreateDefaultIcon();

private:
	AppContext *context = nullptr;
	PetWindow *petWindow = nullptr;
	QMenu *menu = nullptr;
};
