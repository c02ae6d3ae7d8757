#include "widget.h"

#include <QAction>
#include <QCloseEvent>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QStatusBar>
#include <QThread>
#include <QVBoxLayout>

#include "core/convert/converter.h"
#include "utils/flowtracer.h"
#include "utils/pathutil.h"
#include "utils/pdf2doc_error.h"
#include "xconfig.h"

Widget::Widget(const QString &configPath, QWidget *parent)
    : QMainWindow(parent), configPath_(configPath), settings_(AppSettings::load(configPath))
{
    setWindowTitle(tr(PDF2DOC_WINDOW_TITLE));
    setGeometry(settings_.windowGeometry);
    addMenu();
    addWidgets();
    statusBar(); // 菜单项的 status tip 显示在这里
}

Widget::~Widget()
{
    waitForWorker();
}

void Widget::addMenu()
{
    QMenu *fileMenu = menuBar()->addMenu(tr("File"));
    QAction *exitAction = new QAction(tr("Exit"), this);
    exitAction->setObjectName(QStringLiteral("exit_action"));
    exitAction->setShortcut(QKeySequence(QStringLiteral("Ctrl+Q")));
    exitAction->setStatusTip(tr("Exit Program"));
    connect(exitAction, &QAction::triggered, this, &Widget::close);
    fileMenu->addAction(exitAction);
}

void Widget::addWidgets()
{
    QWidget *central = new QWidget(this);
    QVBoxLayout *layout = new QVBoxLayout(central);

    statusLabel_ = new QLabel(QString(), central);
    statusLabel_->setObjectName(QStringLiteral("status_label"));
    layout->addWidget(statusLabel_);

    QHBoxLayout *buttons = new QHBoxLayout;
    chooseButton_ = new QPushButton(tr("Choose pdf"), central);
    chooseButton_->setObjectName(QStringLiteral("choose_button"));
    connect(chooseButton_, &QPushButton::clicked, this, &Widget::select);
    buttons->addWidget(chooseButton_);

    convertButton_ = new QPushButton(tr("Convert to doc"), central);
    convertButton_->setObjectName(QStringLiteral("convert_button"));
    convertButton_->setEnabled(false); // 选中 PDF 后才可用
    connect(convertButton_, &QPushButton::clicked, this, &Widget::convert);
    buttons->addWidget(convertButton_);
    layout->addLayout(buttons);

    QLabel *footer = new QLabel(tr(FOOTER_TEXT), central);
    footer->setObjectName(QStringLiteral("footer_label"));
    QFont footerFont = footer->font();
    footerFont.setPointSize(DEFAULT_FOOTER_POINT_SIZE);
    footer->setFont(footerFont);
    layout->addWidget(footer);

    setCentralWidget(central);
}

void Widget::select()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Select File"), settings_.lastDir,
                                                      tr("PDF files (*.pdf);;All files (*)"));
    applySelection(path);
}

void Widget::applySelection(const QString &path)
{
    if (path.isEmpty())
    {
        path_.clear();
        convertButton_->setEnabled(false);
        statusLabel_->setText(tr(STATUS_NO_FILE));
        return;
    }
    if (!isPdfPath(path))
    {
        path_.clear();
        convertButton_->setEnabled(false);
        statusLabel_->setText(tr(STATUS_INVALID_TYPE));
        FlowTracer::log(FlowChannel::UI, QStringLiteral("rejected non-pdf selection %1").arg(path));
        return;
    }

    path_ = path;
    convertButton_->setEnabled(true);
    statusLabel_->setText(displayFileName(path));
    settings_.lastDir = QFileInfo(path).absolutePath();
    persistSettings();
    FlowTracer::log(FlowChannel::UI, QStringLiteral("selected %1").arg(path));
}

void Widget::convert()
{
    if (converting_ || path_.isEmpty())
    {
        FlowTracer::warn(FlowChannel::UI, formatPdf2DocError(Pdf2DocErrorCode::UiInvalidState,
                                                             QStringLiteral("convert requested without an idle pdf selection")));
        return;
    }

    // 转换期间锁定界面，避免误操作
    chooseButton_->setEnabled(false);
    convertButton_->setEnabled(false);
    statusLabel_->setText(tr(STATUS_CONVERTING));
    converting_ = true;

    QThread *thread = new QThread;
    Converter *worker = new Converter(path_);
    worker->moveToThread(thread);
    connect(thread, &QThread::started, worker, &Converter::run);

    connect(worker, &Converter::finished, thread, &QThread::quit);
    connect(worker, &Converter::warning, thread, &QThread::quit);
    connect(worker, &Converter::finished, this, &Widget::onConvertFinished);
    connect(worker, &Converter::warning, this, &Widget::onConvertWarning);

    // 线程结束后在各自上下文中回收
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    thread_ = thread;
    FlowTracer::log(FlowChannel::UI, QStringLiteral("conversion started for %1").arg(path_));
    thread->start();
}

void Widget::onConvertFinished()
{
    converting_ = false;
    chooseButton_->setEnabled(true);
    statusLabel_->setText(tr(STATUS_COMPLETE));
    emit conversionSettled(true);
}

void Widget::onConvertWarning(const QString &message)
{
    converting_ = false;
    chooseButton_->setEnabled(true);
    statusLabel_->setText(tr(STATUS_FAILED));
    FlowTracer::warn(FlowChannel::UI, QStringLiteral("conversion failed: %1").arg(message));
    showWarning();
    emit conversionSettled(false);
}

void Widget::showWarning()
{
    // 非阻塞弹窗：open() 立即返回，关闭后自动释放
    QMessageBox *box = new QMessageBox(QMessageBox::Warning, tr(WARNING_TITLE), tr(WARNING_MESSAGE),
                                       QMessageBox::Ok, this);
    box->setObjectName(QStringLiteral("conversion_warning_box"));
    box->setDefaultButton(QMessageBox::Ok);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
}

void Widget::closeEvent(QCloseEvent *event)
{
    settings_.windowGeometry = geometry();
    persistSettings();
    waitForWorker();
    QMainWindow::closeEvent(event);
}

void Widget::persistSettings()
{
    if (configPath_.isEmpty()) return;
    if (!settings_.save(configPath_)) statusBar()->showMessage(tr("Settings could not be saved"), 3000);
}

void Widget::waitForWorker()
{
    // 转换不可取消：等待当前转换跑完再退出
    if (!thread_) return;
    if (thread_->isRunning())
    {
        FlowTracer::log(FlowChannel::Lifecycle, QStringLiteral("waiting for running conversion"));
        thread_->quit();
        thread_->wait();
    }
    // 事件循环可能已退出，挂起的 deleteLater 不会再被处理，这里直接回收
    delete thread_.data();
}
