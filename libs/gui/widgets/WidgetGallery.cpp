#include "WidgetGallery.hpp"
#include "VeneerLogging.hpp"
#include "config/ThemeSettings.hpp"
#include "themes/ThemeManager.hpp"

#include <QAction>
#include <QApplication>
#include <QCheckBox>
#include <QComboBox>
#include <QDateTimeEdit>
#include <QDockWidget>
#include <QDoubleSpinBox>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMenu>
#include <QMenuBar>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QRadioButton>
#include <QSlider>
#include <QSpinBox>
#include <QSplitter>
#include <QStatusBar>
#include <QTabWidget>
#include <QTableWidget>
#include <QTextEdit>
#include <QToolBar>
#include <QToolButton>
#include <QTreeWidget>
#include <QVBoxLayout>

namespace veneer {

WidgetGallery::WidgetGallery(QWidget* parent)
    : QMainWindow(parent)
{
    setWindowTitle("Veneer Widget Gallery");
    resize(960, 680);

    buildMenus();
    buildToolBar();
    buildCentral();
    buildIssuesDock();

    m_statusLabel = new QLabel("Ready", this);
    statusBar()->addWidget(m_statusLabel, 1);
    statusBar()->addPermanentWidget(new QLabel("Veneer", this));
}

void WidgetGallery::buildMenus() {
    QMenu* fileMenu = menuBar()->addMenu("&File");
    fileMenu->addAction("&New");
    fileMenu->addAction("&Open...");
    QMenu* recent = fileMenu->addMenu("Open &Recent");
    recent->addAction("episode-01.ass");
    recent->addAction("episode-02.ass");
    QAction* disabled = fileMenu->addAction("&Save");
    disabled->setEnabled(false);
    fileMenu->addSeparator();
    QAction* quit = fileMenu->addAction("&Quit");
    connect(quit, &QAction::triggered, this, &QWidget::close);

    QMenu* viewMenu = menuBar()->addMenu("&View");
    QAction* wrap = viewMenu->addAction("&Word Wrap");
    wrap->setCheckable(true);
    wrap->setChecked(true);
    QAction* validate = viewMenu->addAction("Re&validate Theme");
    connect(validate, &QAction::triggered, this, &WidgetGallery::revalidate);
}

void WidgetGallery::buildToolBar() {
    QToolBar* toolBar = addToolBar("Theme");
    toolBar->setObjectName("ThemeToolBar");
    toolBar->addWidget(new QLabel(" Theme: ", toolBar));

    m_themeCombo = new QComboBox(toolBar);
    auto& manager = ThemeManager::instance();
    for (const QString& id : manager.availableThemes()) {
        m_themeCombo->addItem(manager.themeName(id), id);
    }
    toolBar->addWidget(m_themeCombo);
    connect(m_themeCombo, QOverload<int>::of(&QComboBox::activated),
            this, &WidgetGallery::onThemeActivated);

    toolBar->addSeparator();
    QToolButton* checkable = new QToolButton(toolBar);
    checkable->setText("Bold");
    checkable->setCheckable(true);
    toolBar->addWidget(checkable);
}

void WidgetGallery::buildCentral() {
    m_tabs = new QTabWidget(this);
    m_tabs->setTabsClosable(true);
    m_tabs->addTab(buildButtonsPage(), "Buttons");
    m_tabs->addTab(buildInputsPage(), "Inputs");
    m_tabs->addTab(buildViewsPage(), "Views");
    m_tabs->addTab(buildTextPage(), "Text");
    setCentralWidget(m_tabs);
}

QWidget* WidgetGallery::buildButtonsPage() {
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);

    QGroupBox* pushGroup = new QGroupBox("Push buttons", page);
    QHBoxLayout* pushLayout = new QHBoxLayout(pushGroup);
    QPushButton* normal = new QPushButton("Normal", pushGroup);
    QPushButton* defaultButton = new QPushButton("Default", pushGroup);
    defaultButton->setDefault(true);
    QPushButton* toggle = new QPushButton("Toggle", pushGroup);
    toggle->setCheckable(true);
    toggle->setChecked(true);
    QPushButton* disabledButton = new QPushButton("Disabled", pushGroup);
    disabledButton->setEnabled(false);
    QPushButton* menuButton = new QPushButton("Menu", pushGroup);
    QMenu* buttonMenu = new QMenu(menuButton);
    buttonMenu->addAction("First");
    buttonMenu->addAction("Second");
    menuButton->setMenu(buttonMenu);
    for (QPushButton* b : {normal, defaultButton, toggle, disabledButton, menuButton}) {
        pushLayout->addWidget(b);
    }
    layout->addWidget(pushGroup);

    QGroupBox* checkGroup = new QGroupBox("Check boxes", page);
    checkGroup->setCheckable(true);
    QHBoxLayout* checkLayout = new QHBoxLayout(checkGroup);
    QCheckBox* unchecked = new QCheckBox("Unchecked", checkGroup);
    QCheckBox* checked = new QCheckBox("Checked", checkGroup);
    checked->setChecked(true);
    QCheckBox* partial = new QCheckBox("Partial", checkGroup);
    partial->setTristate(true);
    partial->setCheckState(Qt::PartiallyChecked);
    QCheckBox* disabledCheck = new QCheckBox("Disabled", checkGroup);
    disabledCheck->setEnabled(false);
    for (QCheckBox* c : {unchecked, checked, partial, disabledCheck}) {
        checkLayout->addWidget(c);
    }
    layout->addWidget(checkGroup);

    QGroupBox* radioGroup = new QGroupBox("Radio buttons", page);
    QHBoxLayout* radioLayout = new QHBoxLayout(radioGroup);
    QRadioButton* first = new QRadioButton("First", radioGroup);
    first->setChecked(true);
    radioLayout->addWidget(first);
    radioLayout->addWidget(new QRadioButton("Second", radioGroup));
    QRadioButton* disabledRadio = new QRadioButton("Disabled", radioGroup);
    disabledRadio->setEnabled(false);
    radioLayout->addWidget(disabledRadio);
    layout->addWidget(radioGroup);

    layout->addStretch();
    return page;
}

QWidget* WidgetGallery::buildInputsPage() {
    QWidget* page = new QWidget(this);
    QFormLayout* form = new QFormLayout(page);

    QLineEdit* edit = new QLineEdit(page);
    edit->setPlaceholderText("Type here");
    form->addRow("Line edit", edit);

    QLineEdit* readOnly = new QLineEdit("Read only", page);
    readOnly->setReadOnly(true);
    form->addRow("Read only", readOnly);

    QComboBox* combo = new QComboBox(page);
    combo->addItems({"Default", "Signs", "Karaoke", "Notes"});
    form->addRow("Combo box", combo);

    QComboBox* editable = new QComboBox(page);
    editable->setEditable(true);
    editable->addItems({"23.976", "25", "29.97"});
    form->addRow("Editable combo", editable);

    QSpinBox* spin = new QSpinBox(page);
    spin->setRange(0, 100);
    spin->setValue(42);
    form->addRow("Spin box", spin);

    QDoubleSpinBox* doubleSpin = new QDoubleSpinBox(page);
    doubleSpin->setValue(1.5);
    form->addRow("Double spin box", doubleSpin);

    form->addRow("Date/time", new QDateTimeEdit(QDateTime::currentDateTime(), page));

    QSlider* slider = new QSlider(Qt::Horizontal, page);
    slider->setRange(0, 100);
    slider->setValue(60);
    form->addRow("Slider", slider);

    QProgressBar* progress = new QProgressBar(page);
    progress->setRange(0, 100);
    progress->setValue(60);
    connect(slider, &QSlider::valueChanged, progress, &QProgressBar::setValue);
    form->addRow("Progress", progress);

    return page;
}

QWidget* WidgetGallery::buildViewsPage() {
    QSplitter* splitter = new QSplitter(Qt::Horizontal, this);

    QTableWidget* table = new QTableWidget(12, 4, splitter);
    table->setHorizontalHeaderLabels({"Start", "End", "Style", "Text"});
    table->setAlternatingRowColors(true);
    table->setSortingEnabled(true);
    for (int row = 0; row < table->rowCount(); ++row) {
        table->setItem(row, 0, new QTableWidgetItem(QString("0:00:%1.00").arg(row * 2, 2, 10, QChar('0'))));
        table->setItem(row, 1, new QTableWidgetItem(QString("0:00:%1.50").arg(row * 2 + 1, 2, 10, QChar('0'))));
        table->setItem(row, 2, new QTableWidgetItem(row % 3 == 0 ? "Signs" : "Default"));
        table->setItem(row, 3, new QTableWidgetItem(QString("Line %1").arg(row + 1)));
    }
    table->horizontalHeader()->setStretchLastSection(true);

    QTreeWidget* tree = new QTreeWidget(splitter);
    tree->setHeaderLabel("Project");
    for (const QString& folder : {QString("Subtitles"), QString("Audio"), QString("Video")}) {
        QTreeWidgetItem* parentItem = new QTreeWidgetItem(tree, QStringList{folder});
        for (int i = 1; i <= 3; ++i) {
            new QTreeWidgetItem(parentItem, QStringList{QString("%1 %2").arg(folder).arg(i)});
        }
    }
    tree->expandItem(tree->topLevelItem(0));

    QListWidget* list = new QListWidget(splitter);
    list->setAlternatingRowColors(true);
    for (int i = 1; i <= 30; ++i) {
        list->addItem(QString("Item %1").arg(i));
    }

    return splitter;
}

QWidget* WidgetGallery::buildTextPage() {
    QWidget* page = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(page);
    QTextEdit* rich = new QTextEdit(page);
    rich->setHtml("<h3>Rich text</h3><p>Hover controls to see <b>hover</b> states.</p>");
    rich->setToolTip("Tool tips use the theme too");
    layout->addWidget(rich);
    QPlainTextEdit* plain = new QPlainTextEdit(page);
    plain->setPlainText(QString("Scroll me\n").repeated(60));
    layout->addWidget(plain);
    return page;
}

void WidgetGallery::buildIssuesDock() {
    m_issuesDock = new QDockWidget("Theme Issues", this);
    m_issuesDock->setObjectName("ThemeIssuesDock");

    m_issuesTable = new QTableWidget(0, 4, m_issuesDock);
    m_issuesTable->setHorizontalHeaderLabels({"Line", "Severity", "Kind", "Message"});
    m_issuesTable->horizontalHeader()->setStretchLastSection(true);
    m_issuesTable->verticalHeader()->setVisible(false);
    m_issuesTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_issuesDock->setWidget(m_issuesTable);

    addDockWidget(Qt::BottomDockWidgetArea, m_issuesDock);
}

bool WidgetGallery::selectTheme(const QString& themeId) {
    const int index = m_themeCombo->findData(themeId);
    if (index < 0) {
        vLog_Warning("WidgetGallery: Unknown theme" << themeId);
        return false;
    }
    m_themeCombo->setCurrentIndex(index);

    auto* app = qobject_cast<QApplication*>(QCoreApplication::instance());
    const bool applied = ThemeManager::instance().applyTheme(themeId, app);
    showReport();
    if (applied) {
        ThemeSettings::setCurrentTheme(themeId);
    }
    return applied;
}

void WidgetGallery::onThemeActivated(int index) {
    const QString id = m_themeCombo->itemData(index).toString();
    if (!selectTheme(id)) {
        statusBar()->showMessage(QString("Theme %1 was not applied").arg(id), 5000);
    }
}

void WidgetGallery::revalidate() {
    const QString id = m_themeCombo->currentData().toString();
    auto report = ThemeManager::instance().validate(id);
    if (!report) return;
    vLog_App("WidgetGallery: Revalidated" << id << "-" << report->errorCount() << "errors");
    showReport();
}

void WidgetGallery::showReport() {
    const auto& manager = ThemeManager::instance();
    const auto report = manager.validate(m_themeCombo->currentData().toString());
    m_issuesTable->setRowCount(0);
    if (!report) {
        m_statusLabel->setText("No theme");
        return;
    }

    m_issuesTable->setRowCount(static_cast<int>(report->issues.size()));
    int row = 0;
    for (const auto& issue : report->issues) {
        m_issuesTable->setItem(row, 0, new QTableWidgetItem(QString::number(issue.line)));
        m_issuesTable->setItem(row, 1, new QTableWidgetItem(issue.severity == Severity::Error ? "error" : "warning"));
        m_issuesTable->setItem(row, 2, new QTableWidgetItem(toString(issue.kind)));
        m_issuesTable->setItem(row, 3, new QTableWidgetItem(QString::fromStdString(issue.message)));
        ++row;
    }

    m_statusLabel->setText(QString("%1: %2 rules, %3 icons, %4 errors, %5 warnings")
                           .arg(manager.themeName(m_themeCombo->currentData().toString()))
                           .arg(report->ruleCount)
                           .arg(report->urlCount)
                           .arg(report->errorCount())
                           .arg(report->warningCount()));
}

} // namespace veneer
