#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QTimer>
#include <QWidget>
#include <memory>

#include "frame_sink.h"
#include "simulation.h"

// Paints the last presented frame as colored points, Escape asks to quit
class ParticleView : public QWidget, public frame_sink
{
    Q_OBJECT

public:
    explicit ParticleView(QWidget *parent = nullptr);

    void present(const Frame &frame) override;
    bool quit_requested() override { return m_quit; }
    void request_quit() { m_quit = true; }

protected:
    void paintEvent(QPaintEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;

private:
    Frame m_frame;
    bool m_quit = false;
};

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(const SimConfig &config, QWidget *parent = nullptr);
    ~MainWindow();

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void tick();

private:
    std::unique_ptr<Simulation> m_sim;
    ParticleView *m_view;
    QTimer m_timer;
};

#endif // MAINWINDOW_H
