#include <QApplication>
#include <iostream>
#include <memory>

#include "mainwindow.h"
#include "sim_config.h"

// usage: mlsmpm_viewer [config-file]
int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    std::unique_ptr<MainWindow> window;
    try
    {
        SimConfig config;
        if (argc >= 2)
        {
            config = load_config_file(argv[1]);
        }
        window.reset(new MainWindow(config));
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }

    window->show();
    return app.exec();
}
