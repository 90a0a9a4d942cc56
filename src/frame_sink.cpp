#include "frame_sink.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>

#include "material.h"

csv_frame_writer::csv_frame_writer(const std::string &output_dir) : output_dir(output_dir)
{
    if (this->output_dir.empty())
    {
        throw std::invalid_argument("csv_frame_writer needs an output directory");
    }
}

std::string csv_frame_writer::frame_path(int index) const
{
    char name[32];
    std::snprintf(name, sizeof(name), "frame_%05d.csv", index);
    return output_dir + "/" + name;
}

void csv_frame_writer::present(const Frame &frame)
{
    std::string path = frame_path(frame.index);
    std::ofstream myFile(path);
    if (!myFile)
    {
        throw std::runtime_error("Could not open frame file: " + path);
    }

    myFile << "x,y,material\n";
    for (size_t i = 0; i < frame.positions.size(); i++)
    {
        myFile << frame.positions[i].x() << "," << frame.positions[i].y() << ","
               << material_name(static_cast<MaterialType>(frame.materials[i])) << "\n";
    }
    myFile.close();
    if (!myFile)
    {
        throw std::runtime_error("Failed writing frame file: " + path);
    }
    iteration++;
}
