#ifndef SIM_CONFIG_H
#define SIM_CONFIG_H

#include <istream>
#include <map>
#include <string>
#include <vector>

#include "material.h"
#include "parallel.h"

enum class Placement
{
    // cell-centred lattice filling each region, deterministic
    Lattice,
    // uniform random from an explicit seed
    Random
};

const char *placement_name(Placement placement);
Placement parse_placement(const std::string &name);

// Everything fixed at initialization. Defaults reproduce the three-material
// demo scene.
struct SimConfig
{
    int particles = 10000;
    int grid_resolution = 128;
    double dt = 1e-4;
    double frame_dt = 2e-3;
    // acts along -y
    double gravity = 70.0;
    double density = 1.0;
    MaterialParams material;
    // width of the wall band in cells
    int boundary_cells = 3;

    Placement placement = Placement::Random;
    unsigned int seed = 0;

    Backend backend = Backend::OpenMP;
    int threads = 0;
    Accumulation accumulation = Accumulation::Atomic;
    bool check_invariants = true;

    // 0 runs until the frame sink asks to stop
    int frames = 0;
    std::string output_dir;

    // optional particle shape read from CSV
    std::string shape_csv;
    MaterialType shape_material = MaterialType::Snow;
    double shape_center_x = 0.5;
    double shape_center_y = 0.5;
    double shape_scale = 1.0;

    double dx() const { return 1.0 / grid_resolution; }
    double inv_dx() const { return grid_resolution; }
    double particle_volume() const { return (dx() * 0.5) * (dx() * 0.5); }
    double particle_mass() const { return particle_volume() * density; }
    int substeps_per_frame() const;

    // throws std::invalid_argument describing the first bad value
    void validate() const;
};

// key = value pairs, '#' starts a comment
class config_reader
{
public:
    explicit config_reader(const std::string &filename);
    explicit config_reader(std::istream &in);

    bool has(const std::string &key) const;
    std::vector<std::string> keys() const;

    int get_int(const std::string &key) const;
    double get_double(const std::string &key) const;
    bool get_bool(const std::string &key) const;
    std::string get_string(const std::string &key) const;

private:
    void load(std::istream &in);

    std::map<std::string, std::string> config_map;
};

// Non-negative frame count from a command line argument, throws
// std::invalid_argument for anything else
int parse_frame_count(const std::string &text);

// Overrides defaults with every key in the reader, rejects unknown keys
SimConfig load_config(const config_reader &reader);
SimConfig load_config_file(const std::string &filename);

#endif // SIM_CONFIG_H
