#include "scene.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

using namespace Eigen;
using namespace std;

ParticleList lattice_block(const Region &region, int count)
{
    ParticleList particles;
    if (count <= 0)
        return particles;

    int cols = std::max(1, (int)std::ceil(std::sqrt(count * region.width / region.height)));
    int rows = (count + cols - 1) / cols;
    double cell_w = region.width / cols;
    double cell_h = region.height / rows;

    particles.reserve(count);
    for (int k = 0; k < count; k++)
    {
        int i = k % cols;
        int j = k / cols;
        Vec x(region.x0 + (i + 0.5) * cell_w, region.y0 + (j + 0.5) * cell_h);
        particles.push_back(Particle(x, region.material));
    }
    return particles;
}

ParticleList random_block(const Region &region, int count, std::mt19937 &rng)
{
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    ParticleList particles;
    particles.reserve(std::max(count, 0));
    for (int k = 0; k < count; k++)
    {
        double rx = unit(rng);
        double ry = unit(rng);
        particles.push_back(Particle(Vec(region.x0 + rx * region.width, region.y0 + ry * region.height), region.material));
    }
    return particles;
}

ParticleList default_scene(int count, Placement placement, unsigned int seed)
{
    const Region regions[3] = {
        {0.35, 0.05, 0.30, 0.30, MaterialType::Fluid},
        {0.30, 0.45, 0.15, 0.15, MaterialType::Jelly},
        {0.55, 0.60, 0.15, 0.15, MaterialType::Snow},
    };
    // number of indices i < count with i < 2n/3 and i < 5n/6
    int fluid_end = (2 * count + 2) / 3;
    int jelly_end = (5 * count + 5) / 6;
    int counts[3] = {fluid_end, jelly_end - fluid_end, count - jelly_end};

    std::mt19937 rng(seed);
    ParticleList particles;
    particles.reserve(count);
    for (int r = 0; r < 3; r++)
    {
        ParticleList block = placement == Placement::Lattice ? lattice_block(regions[r], counts[r])
                                                             : random_block(regions[r], counts[r], rng);
        particles.insert(particles.end(), block.begin(), block.end());
    }
    return particles;
}

// from: https://stackoverflow.com/questions/1120140/how-can-i-read-and-parse-csv-files-in-c
static std::vector<std::string> getNextLineAndSplitIntoTokens(std::istream &str)
{
    std::vector<std::string> result;
    std::string line;
    std::getline(str, line);

    std::stringstream lineStream(line);
    std::string cell;

    while (std::getline(lineStream, cell, ','))
    {
        result.push_back(cell);
    }
    return result;
}

static double parse_coordinate(const std::string &cell, int line_number)
{
    std::istringstream ss(cell);
    double value;
    if (!(ss >> value) || !(ss >> std::ws).eof())
    {
        throw std::invalid_argument("shape csv line " + to_string(line_number) + ": bad coordinate '" + cell + "'");
    }
    return value;
}

ParticleList load_csv_shape(const std::string &path, const Vec &center, double scale, MaterialType material)
{
    std::ifstream infile(path);
    if (!infile)
    {
        throw std::runtime_error("Could not open shape file: " + path);
    }

    ParticleList particles;
    // first line is labels
    getNextLineAndSplitIntoTokens(infile);
    int line_number = 1;
    while (infile)
    {
        std::vector<std::string> split_line = getNextLineAndSplitIntoTokens(infile);
        line_number++;
        if (split_line.empty() || (split_line.size() == 1 && split_line[0].find_first_not_of(" \t\r") == std::string::npos))
            continue;
        if (split_line.size() < 2)
        {
            throw std::invalid_argument("shape csv line " + to_string(line_number) + ": expected x,y");
        }
        double x_pos = parse_coordinate(split_line[0], line_number);
        double y_pos = parse_coordinate(split_line[1], line_number);
        particles.push_back(Particle(Vec(scale * x_pos + center.x(), scale * y_pos + center.y()), material));
    }
    return particles;
}

ParticleList build_scene(const SimConfig &config)
{
    ParticleList particles = default_scene(config.particles, config.placement, config.seed);
    if (!config.shape_csv.empty())
    {
        ParticleList shape = load_csv_shape(config.shape_csv, Vec(config.shape_center_x, config.shape_center_y),
                                            config.shape_scale, config.shape_material);
        particles.insert(particles.end(), shape.begin(), shape.end());
    }
    return particles;
}
