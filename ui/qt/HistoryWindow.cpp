#include "HistoryWindow.hpp"
#include "../../core/IClock.hpp"
#include "../../core/JsonCodec.hpp"
#include "../../core/adapters/RecordFormatters.hpp"

#include <QFile>
#include <QFileDialog>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QGroupBox>
#include <QSplitter>
#include <QStatusBar>
#include <QMessageBox>
#include <QMetaObject>
#include <QPointer>
#include <QTextStream>

#include <iostream>
#include <stdexcept>

namespace evhistory {
namespace qt {

HistoryWindow::HistoryWindow(const HistoryConfig& config, QWidget *parent)
    : QMainWindow(parent)
    , m_bus(std::make_shared<domain::EventBus>(config.verbose))
{
    applyTypeDeclarations(config, m_registry);

    m_history = std::make_unique<domain::EventHistory>(
        std::make_shared<SystemClock>(),
        std::make_shared<adapters::HtmlRecordFormatter>(),
        config);
    m_history->attach(m_bus, m_registry.root());

    setupUI();

    // Recording events arrive on whichever thread dispatches them; repaint on the GUI thread
    QPointer<HistoryWindow> self(this);
    m_listener = adapters::makeListener([self](const EventRecord&) {
        if (self) {
            QMetaObject::invokeMethod(self, "refreshHistory", Qt::QueuedConnection);
        }
    });
    m_history->addListener(m_listener);

    rebuildTypeLists();
    refreshHistory();
}

HistoryWindow::~HistoryWindow() {
    m_history->removeListener(m_listener);
    m_history->shutdown();
}

void HistoryWindow::setupUI() {
    setWindowTitle("Event History");
    setMinimumSize(900, 600);

    auto* splitter = new QSplitter(Qt::Horizontal);
    setCentralWidget(splitter);

    // Type selection panel
    auto* typesPanel = new QWidget;
    auto* typesLayout = new QVBoxLayout(typesPanel);

    auto* filteredGroup = new QGroupBox("Hide types");
    auto* filteredLayout = new QVBoxLayout(filteredGroup);
    m_filteredList = new QListWidget;
    filteredLayout->addWidget(m_filteredList);
    typesLayout->addWidget(filteredGroup);

    auto* highlightedGroup = new QGroupBox("Highlight types");
    auto* highlightedLayout = new QVBoxLayout(highlightedGroup);
    m_highlightedList = new QListWidget;
    highlightedLayout->addWidget(m_highlightedList);
    typesLayout->addWidget(highlightedGroup);

    auto* buttonLayout = new QHBoxLayout;
    m_openButton = new QPushButton("Open Events...");
    m_clearButton = new QPushButton("Clear");
    buttonLayout->addWidget(m_openButton);
    buttonLayout->addWidget(m_clearButton);
    typesLayout->addLayout(buttonLayout);

    m_recordingCheck = new QCheckBox("Recording");
    m_recordingCheck->setChecked(m_history->isActive());
    typesLayout->addWidget(m_recordingCheck);

    splitter->addWidget(typesPanel);

    // History view
    m_historyView = new QTextEdit;
    m_historyView->setReadOnly(true);
    splitter->addWidget(m_historyView);
    splitter->setSizes({250, 650});

    m_statusLabel = new QLabel;
    statusBar()->addWidget(m_statusLabel);

    connect(m_openButton, &QPushButton::clicked, this, &HistoryWindow::onOpenClicked);
    connect(m_clearButton, &QPushButton::clicked, this, &HistoryWindow::onClearClicked);
    connect(m_recordingCheck, &QCheckBox::toggled, this, &HistoryWindow::onRecordingToggled);
    connect(m_filteredList, &QListWidget::itemChanged, this, &HistoryWindow::onTypeSelectionChanged);
    connect(m_highlightedList, &QListWidget::itemChanged, this, &HistoryWindow::onTypeSelectionChanged);
}

void HistoryWindow::onOpenClicked() {
    QString path = QFileDialog::getOpenFileName(this, "Open Events", QString(),
                                                "JSON Lines (*.jsonl *.json);;All Files (*)");
    if (!path.isEmpty()) {
        loadEvents(path);
    }
}

void HistoryWindow::loadEvents(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        QMessageBox::warning(this, "Open Events", "Could not open " + path);
        return;
    }

    QTextStream in(&file);
    int lineNumber = 0;
    int rejected = 0;
    while (!in.atEnd()) {
        std::string line = in.readLine().toStdString();
        ++lineNumber;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        try {
            m_bus->publish(JsonCodec::deserialize(line, m_registry));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[Viewer] line " << lineNumber << ": invalid event: " << e.what() << std::endl;
            ++rejected;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[Viewer] line " << lineNumber << ": " << e.what() << std::endl;
            ++rejected;
        }
    }
    m_bus->processEvents();

    if (rejected > 0) {
        statusBar()->showMessage(QString("Skipped %1 invalid lines").arg(rejected), 5000);
    }

    rebuildTypeLists();
    refreshHistory();
}

void HistoryWindow::onClearClicked() {
    m_history->clear();
    refreshHistory();
}

void HistoryWindow::onRecordingToggled(bool checked) {
    m_history->setActive(checked);
    updateStatus();
}

void HistoryWindow::onTypeSelectionChanged() {
    refreshHistory();
}

void HistoryWindow::refreshHistory() {
    auto filtered = checkedTypes(m_filteredList);
    auto highlighted = checkedTypes(m_highlightedList);

    m_historyView->setHtml(QString::fromStdString(m_history->toText(filtered, highlighted)));
    updateStatus();
}

void HistoryWindow::rebuildTypeLists() {
    auto fillList = [this](QListWidget* list) {
        QSignalBlocker blocker(list);
        QStringList checked;
        for (int i = 0; i < list->count(); ++i) {
            if (list->item(i)->checkState() == Qt::Checked) {
                checked << list->item(i)->text();
            }
        }

        list->clear();
        for (const auto& type : m_registry.types()) {
            auto name = QString::fromStdString(type.name());
            auto* item = new QListWidgetItem(
                QString(static_cast<int>(type.depth()) * 2, ' ') + name, list);
            item->setData(Qt::UserRole, name);
            item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
            item->setCheckState(checked.contains(item->text()) ? Qt::Checked : Qt::Unchecked);
        }
    };

    fillList(m_filteredList);
    fillList(m_highlightedList);
}

TypeFilterSet HistoryWindow::checkedTypes(const QListWidget* list) const {
    TypeFilterSet types;
    for (int i = 0; i < list->count(); ++i) {
        const auto* item = list->item(i);
        if (item->checkState() != Qt::Checked) continue;

        if (auto type = m_registry.find(item->data(Qt::UserRole).toString().toStdString())) {
            types.insert(*type);
        }
    }
    return types;
}

void HistoryWindow::updateStatus() {
    QSignalBlocker blocker(m_recordingCheck);
    m_recordingCheck->setChecked(m_history->isActive());

    m_statusLabel->setText(QString("%1 events, %2")
        .arg(m_history->size())
        .arg(m_history->isActive() ? "recording" : "dormant"));
}

} // namespace qt
} // namespace evhistory
