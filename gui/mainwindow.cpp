#include "mainwindow.h"

#include <QCloseEvent>
#include <QKeyEvent>
#include <QMessageBox>
#include <QPainter>
#include <iostream>

#include "material.h"

static const int window_size = 512;

ParticleView::ParticleView(QWidget *parent) : QWidget(parent)
{
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(window_size, window_size);
}

void ParticleView::present(const Frame &frame)
{
    m_frame = frame;
    update();
}

void ParticleView::paintEvent(QPaintEvent *)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.fillRect(rect(), QColor(0x11, 0x2F, 0x41));
    painter.setPen(Qt::NoPen);

    QColor colors[material_count];
    for (int m = 0; m < material_count; m++)
    {
        colors[m] = QColor(QRgb(material_color(static_cast<MaterialType>(m))));
    }

    const double radius = 1.5;
    for (size_t i = 0; i < m_frame.positions.size(); i++)
    {
        // y up in the simulation, down on screen
        QPointF center(m_frame.positions[i].x() * width(), (1.0 - m_frame.positions[i].y()) * height());
        painter.setBrush(colors[m_frame.materials[i]]);
        painter.drawEllipse(center, radius, radius);
    }
}

void ParticleView::keyPressEvent(QKeyEvent *event)
{
    if (event->key() == Qt::Key_Escape)
    {
        request_quit();
        return;
    }
    QWidget::keyPressEvent(event);
}

MainWindow::MainWindow(const SimConfig &config, QWidget *parent)
    : QMainWindow(parent), m_sim(new Simulation(config)), m_view(new ParticleView(this))
{
    setWindowTitle("MLS-MPM: fluid, jelly and snow");
    setCentralWidget(m_view);
    m_view->present(m_sim->snapshot());

    connect(&m_timer, &QTimer::timeout, this, &MainWindow::tick);
    m_timer.start(0);
}

MainWindow::~MainWindow()
{
}

void MainWindow::tick()
{
    try
    {
        if (!m_sim->step_frame(*m_view))
        {
            m_timer.stop();
            close();
        }
    }
    catch (const divergence_error &e)
    {
        m_timer.stop();
        std::cerr << "simulation diverged: " << e.what() << std::endl;
        QMessageBox::critical(this, "Simulation diverged", e.what());
        close();
    }
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    m_view->request_quit();
    m_timer.stop();
    event->accept();
}
