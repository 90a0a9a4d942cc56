#include <iostream>
#include <memory>
#include <stdexcept>

#include "frame_sink.h"
#include "mpm_solver.h"
#include "sim_config.h"
#include "simulation.h"

// usage: mlsmpm_sim [config-file] [frames]
int main(int argc, char *argv[])
{
    if (argc > 3)
    {
        std::cerr << "usage: " << argv[0] << " [config-file] [frames]" << std::endl;
        return 2;
    }

    int frames = -1;
    if (argc == 3)
    {
        try
        {
            frames = parse_frame_count(argv[2]);
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "error: " << e.what() << std::endl;
            std::cerr << "usage: " << argv[0] << " [config-file] [frames]" << std::endl;
            return 2;
        }
    }

    try
    {
        SimConfig config;
        if (argc >= 2)
        {
            config = load_config_file(argv[1]);
        }
        if (frames >= 0)
        {
            config.frames = frames;
        }
        if (config.frames == 0)
        {
            // no window to close, so a headless run needs a frame limit
            config.frames = 100;
        }

        std::unique_ptr<frame_sink> sink;
        if (config.output_dir.empty())
        {
            sink.reset(new null_frame_sink());
        }
        else
        {
            sink.reset(new csv_frame_writer(config.output_dir));
        }

        Simulation sim(config);
        sim.run(*sink);
    }
    catch (const divergence_error &e)
    {
        std::cerr << "simulation diverged: " << e.what() << std::endl;
        return 3;
    }
    catch (const std::exception &e)
    {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
