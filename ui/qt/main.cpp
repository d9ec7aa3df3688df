#include <QApplication>
#include "HistoryWindow.hpp"
#include "../../platform/desktop/TomlConfig.hpp"

#include <iostream>

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);

    app.setApplicationName("Event History Viewer");
    app.setApplicationVersion("1.0.0");

    evhistory::HistoryConfig config;
    try {
        if (argc > 1) {
            config = evhistory::TomlConfig::loadFromFile(argv[1]);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Config] Error: " << e.what() << std::endl;
        return 1;
    }

    evhistory::qt::HistoryWindow window(config);
    window.show();

    return app.exec();
}
