#pragma once

#include <QMainWindow>
#include <QString>

class QComboBox;
class QDockWidget;
class QLabel;
class QTableWidget;
class QTabWidget;

namespace veneer {

/**
 * Preview window holding one of every standard control the themes style.
 * Switching the theme combo applies the theme application-wide and lists
 * the validation issues in a dock.
 */
class WidgetGallery : public QMainWindow {
    Q_OBJECT

public:
    explicit WidgetGallery(QWidget* parent = nullptr);
    ~WidgetGallery() override = default;

    /**
     * Select a theme in the combo box and apply it. Returns false if the
     * theme is unknown or was refused.
     */
    bool selectTheme(const QString& themeId);

private slots:
    void onThemeActivated(int index);
    void revalidate();

private:
    void buildMenus();
    void buildToolBar();
    void buildCentral();
    void buildIssuesDock();
    QWidget* buildButtonsPage();
    QWidget* buildInputsPage();
    QWidget* buildViewsPage();
    QWidget* buildTextPage();
    void showReport();

    QComboBox* m_themeCombo = nullptr;
    QTabWidget* m_tabs = nullptr;
    QDockWidget* m_issuesDock = nullptr;
    QTableWidget* m_issuesTable = nullptr;
    QLabel* m_statusLabel = nullptr;
};

} // namespace veneer
