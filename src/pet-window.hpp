#pragma once

#include "animation-set-manager.hpp"
#include "pet-commands.hpp"

#include <QWidget>
#include <QLabel>
#include <QMenu>
#include <QMovie>
#include <QTimer>
#include <QPoint>

class AppContext;
class QActionGroup;

class PetWindow : public QWidget {
	Q_OBJECT

public:
	explicit PetWindow(AppContext *context, QWidget *parent = nullptr);
	~PetWindow();

	QString CurrentAnimation() const { return currentPath; }

public slots:
	void LoadAnimation(const QString &path);
	void SwitchToNextAnimation();

	void ImportAnimation();
	void DeleteCurrentAnimation();
	void CustomizeOrder();

	void SetAutoSwitchEnabled(bool enabled);
	void SetAutoSwitchInterval(int seconds);
	void ResizePet(int size);

protected:
	void mousePressEvent(QMouseEvent *event) override;
	void mouseMoveEvent(QMouseEvent *event) override;
	void mouseReleaseEvent(QMouseEvent *event) override;
	void paintEvent(QPaintEvent *event) override;
	void closeEvent(QCloseEvent *event) override;

private slots:
	void OnMenuTriggered(QAction *action);
	void CompleteDeletion();

private:
	void SetupUI();
	void SetupContextMenu();
	void RegisterCommands();
	void RefreshAnimationMenu();
	void ShowIdleState();
	void ReleaseMovie();

	QAction *AddCommandAction(QMenu *menu, const QString &text, PetCommand command,
		const QVariant &argument = QVariant());

private:
	AppContext *context = nullptr;
	AnimationSetManager *manager = nullptr;

	QLabel *label = nullptr;
	QMovie *movie = nullptr;

	QMenu *contextMenu = nullptr;
	QMenu *animationsMenu = nullptr;
	QAction *autoSwitchAction = nullptr;
	QActionGroup *intervalGroup = nullptr;
	QActionGroup *sizeGroup = nullptr;

	CommandTable commands;

	QString currentPath;
	bool idle = false;

	bool confirmingDelete = false;

	// Set between PrepareDelete and CompleteDeletion
	DeletePlan pendingDelete;
	bool deletePending = false;

	bool dragging = false;
	QPoint dragPosition;

	QTimer *autoSwitchTimer = nullptr;
	bool autoSwitchEnabled = false;
	int autoSwitchInterval = 120; // seconds
};
