#ifndef SIMULATION_H
#define SIMULATION_H

#include "frame_sink.h"
#include "mpm_solver.h"
#include "sim_config.h"

// Frame loop around the solver: a fixed number of substeps per frame, then
// hand the particles to the frame sink and poll it for quit.
class Simulation
{
public:
    // particles come from build_scene(config)
    explicit Simulation(const SimConfig &config);
    Simulation(const SimConfig &config, const ParticleList &particles);

    // substeps of one frame followed by present(); false once the sink asks
    // to quit or the configured frame limit is reached
    bool step_frame(frame_sink &sink);

    // step_frame until it returns false, returns the number of frames shown
    int run(frame_sink &sink);

    Frame snapshot() const;

    int substeps_per_frame() const { return m_substeps_per_frame; }
    int frame_count() const { return m_frame; }
    mpm_solver &solver() { return m_solver; }
    const mpm_solver &solver() const { return m_solver; }

private:
    mpm_solver m_solver;
    int m_substeps_per_frame;
    int m_frame = 0;
};

#endif // SIMULATION_H
