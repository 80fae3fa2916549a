#include "pet-window.hpp"
#include "animation-store.hpp"
#include "app-context.hpp"
#include "pet-face.hpp"
#include "pet-logging.hpp"

#include <QAction>
#include <QActionGroup>
#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QMessageBox>
#include <QMouseEvent>
#include <QPainter>

#include <chrono>

static const char *kCommandProperty = "petCommand";

PetWindow::PetWindow(AppContext *context_, QWidget *parent)
	: QWidget(parent),
	  context(context_),
	  manager(context_->Manager())
{
	SetupUI();
	RegisterCommands();
	SetupContextMenu();

	QString path;
	if (manager->GetDefault(path) == AnimationError::None) {
		LoadAnimation(path);
	} else {
		qCWarning(lcUi, "No animation found, put GIF files into %s",
			qUtf8Printable(context->Store()->GetUserRoot()));
		ShowIdleState();
	}

	autoSwitchInterval = context->Options().autoSwitchSeconds;
	SetAutoSwitchEnabled(context->Options().autoSwitch);
}

PetWindow::~PetWindow()
{
	autoSwitchTimer->stop();
	movie->stop();
	delete contextMenu;
}

void PetWindow::SetupUI()
{
	setWindowFlags(Qt::FramelessWindowHint | Qt::Tool | Qt::WindowStaysOnTopHint);
	setAttribute(Qt::WA_TranslucentBackground);

	const int size = context->Options().petSize;
	resize(size, size);

	label = new QLabel(this);
	label->setAlignment(Qt::AlignCenter);
	label->resize(this->size());

	movie = new QMovie(this);
	// Keep looping even when the GIF asks for a finite loop count
	connect(movie, &QMovie::finished, movie, &QMovie::start);
	label->setMovie(movie);

	autoSwitchTimer = new QTimer(this);
	connect(autoSwitchTimer, &QTimer::timeout, this, &PetWindow::SwitchToNextAnimation);
}

void PetWindow::RegisterCommands()
{
	commands.Register(PetCommand::SwitchAnimation, [this](const QVariant &arg) {
		LoadAnimation(arg.toString());
	});
	commands.Register(PetCommand::ImportAnimation, [this](const QVariant &) {
		ImportAnimation();
	});
	commands.Register(PetCommand::DeleteCurrent, [this](const QVariant &) {
		DeleteCurrentAnimation();
	});
	commands.Register(PetCommand::CustomizeOrder, [this](const QVariant &) {
		CustomizeOrder();
	});
	commands.Register(PetCommand::ToggleAutoSwitch, [this](const QVariant &arg) {
		SetAutoSwitchEnabled(arg.toBool());
	});
	commands.Register(PetCommand::SetAutoSwitchInterval, [this](const QVariant &arg) {
		SetAutoSwitchInterval(arg.toInt());
	});
	commands.Register(PetCommand::ResizePet, [this](const QVariant &arg) {
		ResizePet(arg.toInt());
	});
	commands.Register(PetCommand::Quit, [this](const QVariant &) {
		close();
	});
}

QAction *PetWindow::AddCommandAction(QMenu *menu, const QString &text, PetCommand command,
	const QVariant &argument)
{
	QAction *action = menu->addAction(text);
	action->setProperty(kCommandProperty, static_cast<int>(command));
	action->setData(argument);
	return action;
}

void PetWindow::SetupContextMenu()
{
	contextMenu = new QMenu();

	animationsMenu = contextMenu->addMenu(tr("Switch animation"));
	RefreshAnimationMenu();

	QMenu *manageMenu = contextMenu->addMenu(tr("Manage animations"));
	AddCommandAction(manageMenu, tr("Import GIF..."), PetCommand::ImportAnimation);
	AddCommandAction(manageMenu, tr("Delete current GIF"), PetCommand::DeleteCurrent);
	AddCommandAction(manageMenu, tr("Custom play order..."), PetCommand::CustomizeOrder);

	QMenu *autoSwitchMenu = contextMenu->addMenu(tr("Auto switch"));
	autoSwitchAction = AddCommandAction(autoSwitchMenu, tr("Enable auto switch"),
		PetCommand::ToggleAutoSwitch);
	autoSwitchAction->setCheckable(true);

	QMenu *intervalMenu = autoSwitchMenu->addMenu(tr("Switch interval"));
	intervalGroup = new QActionGroup(intervalMenu);
	for (int seconds : kAutoSwitchIntervals) {
		const QString text = seconds < 60 ? tr("%1 seconds").arg(seconds)
						  : tr("%n minute(s)", nullptr, seconds / 60);
		QAction *action = AddCommandAction(intervalMenu, text, PetCommand::SetAutoSwitchInterval, seconds);
		action->setCheckable(true);
		intervalGroup->addAction(action);
	}

	QMenu *sizeMenu = contextMenu->addMenu(tr("Size"));
	sizeGroup = new QActionGroup(sizeMenu);
	for (int size : kPetSizes) {
		QAction *action = AddCommandAction(sizeMenu, QStringLiteral("%1x%1").arg(size),
			PetCommand::ResizePet, size);
		action->setCheckable(true);
		action->setChecked(size == context->Options().petSize);
		sizeGroup->addAction(action);
	}

	contextMenu->addSeparator();
	AddCommandAction(contextMenu, tr("Quit"), PetCommand::Quit);

	// Submenu actions are reported through the top level menu
	connect(contextMenu, &QMenu::triggered, this, &PetWindow::OnMenuTriggered);
}

void PetWindow::OnMenuTriggered(QAction *action)
{
	const QVariant command = action->property(kCommandProperty);
	if (!command.isValid())
		return;

	QVariant argument = action->data();
	if (!argument.isValid() && action->isCheckable())
		argument = action->isChecked();

	commands.Dispatch(static_cast<PetCommand>(command.toInt()), argument);
}

void PetWindow::RefreshAnimationMenu()
{
	animationsMenu->clear();

	const QStringList list = manager->GetOrderedList();
	for (const QString &path : list) {
		AddCommandAction(animationsMenu, QFileInfo(path).fileName(), PetCommand::SwitchAnimation, path);
	}

	animationsMenu->setEnabled(!list.isEmpty());
}

void PetWindow::LoadAnimation(const QString &path)
{
	const QString normalized = AnimationStore::NormalizePath(path);
	if (normalized.isEmpty() || !QFileInfo(normalized).isFile()) {
		qCWarning(lcUi, "Animation file %s does not exist", qUtf8Printable(path));
		return;
	}

	movie->stop();
	movie->setFileName(normalized);
	movie->setScaledSize(size());
	movie->start();

	currentPath = normalized;
	idle = false;
	label->show();
	update();

	qCDebug(lcUi, "Playing %s", qUtf8Printable(normalized));
}

void PetWindow::ShowIdleState()
{
	ReleaseMovie();
	idle = true;
	label->hide();
	update();
}

void PetWindow::ReleaseMovie()
{
	// Dropping the file name closes the reader's file handle
	movie->stop();
	movie->setFileName(QString());
	currentPath.clear();
}

void PetWindow::SwitchToNextAnimation()
{
	if (deletePending || confirmingDelete)
		return;

	const QString next = manager->SwitchToNext(currentPath);
	if (next.isEmpty()) {
		ShowIdleState();
		return;
	}

	LoadAnimation(next);
	qCInfo(lcUi, "Switched to %s", qUtf8Printable(QFileInfo(next).fileName()));
}

void PetWindow::ImportAnimation()
{
	const QString file = QFileDialog::getOpenFileName(this, tr("Choose a GIF file"), QString(),
		tr("GIF files (*.gif)"));
	if (file.isEmpty())
		return;

	QString path;
	const AnimationError error = manager->ImportAndActivate(file, path);
	if (error != AnimationError::None) {
		qCWarning(lcUi, "Import of %s failed: %s", qUtf8Printable(file), AnimationErrorName(error));
		QMessageBox::warning(this, tr("Import failed"),
			error == AnimationError::NotFound ? tr("The file %1 does not exist.").arg(file)
							  : tr("Could not copy %1 into the animation folder.").arg(file));
		return;
	}

	LoadAnimation(path);
	RefreshAnimationMenu();
}

void PetWindow::DeleteCurrentAnimation()
{
	if (deletePending)
		return;

	if (currentPath.isEmpty()) {
		QMessageBox::warning(this, tr("Warning"), tr("No GIF is playing."));
		return;
	}

	// The dialog runs a nested event loop; auto switch ticks are skipped until it closes
	const QString target = currentPath;
	const QString fileName = QFileInfo(target).fileName();
	confirmingDelete = true;
	const QMessageBox::StandardButton reply = QMessageBox::question(this, tr("Confirm delete"),
		tr("Delete the current GIF '%1'?").arg(fileName), QMessageBox::Yes | QMessageBox::No);
	confirmingDelete = false;
	if (reply != QMessageBox::Yes)
		return;

	DeletePlan plan;
	const AnimationError error = manager->PrepareDelete(target, plan);
	if (error == AnimationError::LastItemProtected) {
		QMessageBox::warning(this, tr("Warning"), tr("At least one GIF must remain."));
		return;
	}
	if (error != AnimationError::None) {
		QMessageBox::warning(this, tr("Error"), tr("Cannot delete %1.").arg(fileName));
		return;
	}

	// The movie must let go of the file before it is removed
	ReleaseMovie();
	pendingDelete = plan;
	deletePending = true;
	QTimer::singleShot(0, this, &PetWindow::CompleteDeletion);
}

void PetWindow::CompleteDeletion()
{
	deletePending = false;

	DeleteOutcome outcome;
	const AnimationError error = manager->CommitDelete(pendingDelete, outcome);
	pendingDelete = DeletePlan();

	RefreshAnimationMenu();

	if (outcome.fallbackPath.isEmpty())
		ShowIdleState();
	else
		LoadAnimation(outcome.fallbackPath);

	if (error == AnimationError::None) {
		QMessageBox::information(this, tr("Deleted"), tr("The GIF was deleted."));
	} else {
		QMessageBox::warning(this, tr("Delete failed"),
			tr("Could not delete %1.").arg(QFileInfo(outcome.deletedPath).fileName()));
	}
}

void PetWindow::CustomizeOrder()
{
	const QStringList list = manager->GetOrderedList();
	if (list.isEmpty()) {
		QMessageBox::warning(this, tr("Warning"), tr("No GIF files available."));
		return;
	}

	QStringList lines;
	QStringList numbers;
	for (int i = 0; i < list.size(); i++) {
		lines.append(QStringLiteral("%1. %2").arg(i + 1).arg(QFileInfo(list.at(i)).fileName()));
		numbers.append(QString::number(i + 1));
	}

	bool ok = false;
	const QString text = QInputDialog::getText(this, tr("Custom play order"),
		tr("Enter the GIF numbers separated by commas (for example 2,1,3)\nCurrent order:\n%1")
			.arg(lines.join(QLatin1Char('\n'))),
		QLineEdit::Normal, numbers.join(QLatin1Char(',')), &ok);
	if (!ok || text.isEmpty())
		return;

	std::vector<int> indices;
	AnimationError error = AnimationSetManager::ParseOrderIndices(text, static_cast<int>(list.size()), indices);
	if (error == AnimationError::None)
		error = manager->SetCustomOrderByIndices(indices);

	if (error != AnimationError::None) {
		QMessageBox::warning(this, tr("Error"),
			tr("Enter every number from 1 to %1 exactly once.").arg(list.size()));
		return;
	}

	RefreshAnimationMenu();
	QMessageBox::information(this, tr("Done"), tr("Play order updated."));
}

void PetWindow::SetAutoSwitchEnabled(bool enabled)
{
	autoSwitchEnabled = enabled;
	autoSwitchAction->setChecked(enabled);

	for (QAction *action : intervalGroup->actions()) {
		action->setChecked(action->data().toInt() == autoSwitchInterval);
	}

	if (enabled) {
		autoSwitchTimer->start(std::chrono::seconds(autoSwitchInterval));
		qCInfo(lcUi, "Auto switch enabled, every %d seconds", autoSwitchInterval);
	} else {
		autoSwitchTimer->stop();
		qCInfo(lcUi, "Auto switch disabled");
	}
}

void PetWindow::SetAutoSwitchInterval(int seconds)
{
	if (seconds <= 0 || seconds > kMaxAutoSwitchSeconds)
		return;

	autoSwitchInterval = seconds;
	qCInfo(lcUi, "Auto switch interval set to %d seconds", seconds);

	for (QAction *action : intervalGroup->actions()) {
		action->setChecked(action->data().toInt() == seconds);
	}

	// Restart a running timer with the new period
	if (autoSwitchEnabled)
		autoSwitchTimer->start(std::chrono::seconds(autoSwitchInterval));
}

void PetWindow::ResizePet(int size)
{
	if (!IsPetSize(size))
		return;

	resize(size, size);
	label->resize(size, size);

	// Reload so the movie is scaled to the new size
	if (!currentPath.isEmpty())
		LoadAnimation(currentPath);

	for (QAction *action : sizeGroup->actions()) {
		action->setChecked(action->data().toInt() == size);
	}
}

void PetWindow::mousePressEvent(QMouseEvent *event)
{
	if (event->button() == Qt::LeftButton) {
		dragging = true;
		dragPosition = event->globalPosition().toPoint() - frameGeometry().topLeft();
	} else if (event->button() == Qt::RightButton) {
		contextMenu->exec(event->globalPosition().toPoint());
	}
}

void PetWindow::mouseMoveEvent(QMouseEvent *event)
{
	if (dragging)
		move(event->globalPosition().toPoint() - dragPosition);
}

void PetWindow::mouseReleaseEvent(QMouseEvent *event)
{
	if (event->button() == Qt::LeftButton)
		dragging = false;
}

void PetWindow::paintEvent(QPaintEvent *event)
{
	Q_UNUSED(event);

	if (!idle)
		return;

	QPainter painter(this);
	PaintPetFace(painter, QRectF(rect()));
}

void PetWindow::closeEvent(QCloseEvent *event)
{
	autoSwitchTimer->stop();
	movie->stop();
	QWidget::closeEvent(event);
}
