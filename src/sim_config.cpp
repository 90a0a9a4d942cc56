#include "sim_config.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std;

const char *placement_name(Placement placement)
{
    switch (placement)
    {
    case Placement::Lattice:
        return "lattice";
    case Placement::Random:
        return "random";
    }
    return "unknown";
}

Placement parse_placement(const std::string &name)
{
    if (name == "lattice")
        return Placement::Lattice;
    if (name == "random")
        return Placement::Random;
    throw std::invalid_argument("unknown placement: " + name);
}

int SimConfig::substeps_per_frame() const
{
    return std::max(1, (int)std::lround(frame_dt / dt));
}

void SimConfig::validate() const
{
    if (particles < 0)
        throw std::invalid_argument("particles must not be negative");
    if (grid_resolution < 2 * boundary_cells + 4)
        throw std::invalid_argument("grid_resolution too small for the wall band");
    if (boundary_cells < 0)
        throw std::invalid_argument("boundary_cells must not be negative");
    if (!(dt > 0.0) || !std::isfinite(dt))
        throw std::invalid_argument("dt must be positive");
    if (!(frame_dt > 0.0) || !std::isfinite(frame_dt))
        throw std::invalid_argument("frame_dt must be positive");
    if (!std::isfinite(gravity))
        throw std::invalid_argument("gravity must be finite");
    if (!(density > 0.0))
        throw std::invalid_argument("density must be positive");
    if (!(material.youngs_modulus > 0.0))
        throw std::invalid_argument("youngs_modulus must be positive");
    if (!(material.poisson_ratio > -1.0 && material.poisson_ratio < 0.5))
        throw std::invalid_argument("poisson_ratio must lie in (-1, 0.5)");
    if (!(material.hardening_min > 0.0) || material.hardening_max < material.hardening_min)
        throw std::invalid_argument("hardening_min must be positive and not above hardening_max");
    if (!(material.jelly_hardening > 0.0))
        throw std::invalid_argument("jelly_hardening must be positive");
    if (!(material.critical_compression >= 0.0 && material.critical_compression < 1.0))
        throw std::invalid_argument("snow_critical_compression must lie in [0, 1)");
    if (!(material.critical_stretch >= 0.0))
        throw std::invalid_argument("snow_critical_stretch must not be negative");
    if (threads < 0)
        throw std::invalid_argument("threads must not be negative");
    if (frames < 0)
        throw std::invalid_argument("frames must not be negative");
    if (!(shape_scale > 0.0))
        throw std::invalid_argument("shape_scale must be positive");
}

/**************************************/
/************ CONFIG READER ***********/
/**************************************/

static std::string trim(const std::string &s)
{
    size_t first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return "";
    size_t last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

config_reader::config_reader(const std::string &filename)
{
    std::ifstream file(filename);
    if (!file)
    {
        throw std::runtime_error("Could not open config file: " + filename);
    }
    load(file);
}

config_reader::config_reader(std::istream &in)
{
    load(in);
}

void config_reader::load(std::istream &in)
{
    std::string line;
    int line_number = 0;
    while (std::getline(in, line))
    {
        line_number++;
        size_t comment = line.find('#');
        if (comment != std::string::npos)
            line.erase(comment);
        line = trim(line);
        if (line.empty())
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos)
        {
            throw std::runtime_error("config line " + to_string(line_number) + ": expected key = value");
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty())
        {
            throw std::runtime_error("config line " + to_string(line_number) + ": empty key");
        }
        config_map[key] = value;
    }
}

bool config_reader::has(const std::string &key) const
{
    return config_map.find(key) != config_map.end();
}

std::vector<std::string> config_reader::keys() const
{
    std::vector<std::string> result;
    for (const auto &kv : config_map)
    {
        result.push_back(kv.first);
    }
    return result;
}

std::string config_reader::get_string(const std::string &key) const
{
    auto it = config_map.find(key);
    if (it == config_map.end())
    {
        throw std::runtime_error("Key not found: " + key);
    }
    return it->second;
}

int config_reader::get_int(const std::string &key) const
{
    std::string value = get_string(key);
    std::istringstream ss(value);
    int result;
    if (!(ss >> result) || !(ss >> std::ws).eof())
    {
        throw std::invalid_argument("not an integer for " + key + ": " + value);
    }
    return result;
}

double config_reader::get_double(const std::string &key) const
{
    std::string value = get_string(key);
    std::istringstream ss(value);
    double result;
    if (!(ss >> result) || !(ss >> std::ws).eof())
    {
        throw std::invalid_argument("not a number for " + key + ": " + value);
    }
    return result;
}

bool config_reader::get_bool(const std::string &key) const
{
    std::string value = get_string(key);
    if (value == "true" || value == "1" || value == "on")
        return true;
    if (value == "false" || value == "0" || value == "off")
        return false;
    throw std::invalid_argument("not a boolean for " + key + ": " + value);
}

int parse_frame_count(const std::string &text)
{
    std::istringstream ss(text);
    int frames;
    if (!(ss >> frames) || !(ss >> std::ws).eof() || frames < 0)
    {
        throw std::invalid_argument("frame count must be a non-negative integer: " + text);
    }
    return frames;
}

SimConfig load_config(const config_reader &reader)
{
    SimConfig config;
    for (const std::string &key : reader.keys())
    {
        if (key == "particles")
            config.particles = reader.get_int(key);
        else if (key == "grid_resolution")
            config.grid_resolution = reader.get_int(key);
        else if (key == "dt")
            config.dt = reader.get_double(key);
        else if (key == "frame_dt")
            config.frame_dt = reader.get_double(key);
        else if (key == "gravity")
            config.gravity = reader.get_double(key);
        else if (key == "density")
            config.density = reader.get_double(key);
        else if (key == "youngs_modulus")
            config.material.youngs_modulus = reader.get_double(key);
        else if (key == "poisson_ratio")
            config.material.poisson_ratio = reader.get_double(key);
        else if (key == "hardening")
            config.material.hardening = reader.get_double(key);
        else if (key == "hardening_min")
            config.material.hardening_min = reader.get_double(key);
        else if (key == "hardening_max")
            config.material.hardening_max = reader.get_double(key);
        else if (key == "jelly_hardening")
            config.material.jelly_hardening = reader.get_double(key);
        else if (key == "snow_critical_compression")
            config.material.critical_compression = reader.get_double(key);
        else if (key == "snow_critical_stretch")
            config.material.critical_stretch = reader.get_double(key);
        else if (key == "boundary_cells")
            config.boundary_cells = reader.get_int(key);
        else if (key == "placement")
            config.placement = parse_placement(reader.get_string(key));
        else if (key == "seed")
            config.seed = (unsigned int)reader.get_int(key);
        else if (key == "backend")
            config.backend = parse_backend(reader.get_string(key));
        else if (key == "threads")
            config.threads = reader.get_int(key);
        else if (key == "accumulation")
            config.accumulation = parse_accumulation(reader.get_string(key));
        else if (key == "check_invariants")
            config.check_invariants = reader.get_bool(key);
        else if (key == "frames")
            config.frames = reader.get_int(key);
        else if (key == "output_dir")
            config.output_dir = reader.get_string(key);
        else if (key == "shape_csv")
            config.shape_csv = reader.get_string(key);
        else if (key == "shape_material")
            config.shape_material = parse_material(reader.get_string(key));
        else if (key == "shape_center_x")
            config.shape_center_x = reader.get_double(key);
        else if (key == "shape_center_y")
            config.shape_center_y = reader.get_double(key);
        else if (key == "shape_scale")
            config.shape_scale = reader.get_double(key);
        else
            throw std::invalid_argument("unknown config key: " + key);
    }
    config.validate();
    return config;
}

SimConfig load_config_file(const std::string &filename)
{
    return load_config(config_reader(filename));
}
