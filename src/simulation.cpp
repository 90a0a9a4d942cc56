#include "simulation.h"

#include <chrono>
#include <iostream>

#include "scene.h"

Simulation::Simulation(const SimConfig &config) : Simulation(config, build_scene(config))
{
}

Simulation::Simulation(const SimConfig &config, const ParticleList &particles)
    : m_solver(config), m_substeps_per_frame(config.substeps_per_frame())
{
    m_solver.add_particles(particles);

    const executor &exec = m_solver.get_executor();
    std::cout << "Number of initialized particles: " << m_solver.particles.size()
              << ", grid " << config.grid_resolution << "x" << config.grid_resolution
              << ", " << m_substeps_per_frame << " substeps per frame, "
              << backend_name(exec.backend()) << " backend (" << exec.thread_count() << " threads, "
              << accumulation_name(config.accumulation) << " accumulation)" << std::endl;
}

Frame Simulation::snapshot() const
{
    Frame frame;
    frame.index = m_frame;
    frame.time = m_solver.elapsed_time();
    frame.positions.reserve(m_solver.particles.size());
    frame.materials.reserve(m_solver.particles.size());
    for (const auto &p : m_solver.particles)
    {
        frame.positions.push_back(p.x.cast<float>());
        frame.materials.push_back(static_cast<int>(p.material));
    }
    return frame;
}

bool Simulation::step_frame(frame_sink &sink)
{
    const int limit = m_solver.config().frames;
    if (limit > 0 && m_frame >= limit)
    {
        return false;
    }

    for (int s = 0; s < m_substeps_per_frame; s++)
    {
        m_solver.substep();
    }

    sink.present(snapshot());
    m_frame++;

    if (sink.quit_requested())
    {
        return false;
    }
    return limit == 0 || m_frame < limit;
}

int Simulation::run(frame_sink &sink)
{
    auto start = std::chrono::steady_clock::now();
    int first = m_frame;
    while (step_frame(sink))
    {
    }
    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::cout << "Simulated " << (m_frame - first) << " frames (t = " << m_solver.elapsed_time()
              << ") in " << seconds << " s" << std::endl;
    return m_frame - first;
}
