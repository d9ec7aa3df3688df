#pragma once

#include <QMainWindow>
#include <QTextEdit>
#include <QListWidget>
#include <QPushButton>
#include <QCheckBox>
#include <QLabel>

#include "../../core/EventType.hpp"
#include "../../core/HistoryConfig.hpp"
#include "../../core/domain/EventBus.hpp"
#include "../../core/domain/EventHistory.hpp"
#include "../../core/adapters/CallbackListener.hpp"
#include <memory>

namespace evhistory {
namespace qt {

class HistoryWindow : public QMainWindow {
    Q_OBJECT

public:
    HistoryWindow(const HistoryConfig& config, QWidget *parent = nullptr);
    ~HistoryWindow() override;

private slots:
    void onOpenClicked();
    void onClearClicked();
    void onRecordingToggled(bool checked);
    void onTypeSelectionChanged();
    void refreshHistory();

private:
    void setupUI();
    void loadEvents(const QString& path);
    void rebuildTypeLists();
    TypeFilterSet checkedTypes(const QListWidget* list) const;
    void updateStatus();

    // UI Components
    QTextEdit* m_historyView;
    QListWidget* m_filteredList;
    QListWidget* m_highlightedList;
    QPushButton* m_openButton;
    QPushButton* m_clearButton;
    QCheckBox* m_recordingCheck;
    QLabel* m_statusLabel;

    // History components
    TypeRegistry m_registry;
    std::shared_ptr<domain::EventBus> m_bus;
    std::unique_ptr<domain::EventHistory> m_history;
    std::shared_ptr<adapters::CallbackListener> m_listener;
};

} // namespace qt
} // namespace evhistory
