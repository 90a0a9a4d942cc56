#include "parallel.h"

#include <omp.h>
#include <stdexcept>

const char *backend_name(Backend backend)
{
    switch (backend)
    {
    case Backend::Serial:
        return "serial";
    case Backend::OpenMP:
        return "openmp";
    }
    return "unknown";
}

Backend parse_backend(const std::string &name)
{
    if (name == "serial")
        return Backend::Serial;
    if (name == "openmp")
        return Backend::OpenMP;
    throw std::invalid_argument("unknown backend: " + name);
}

const char *accumulation_name(Accumulation accumulation)
{
    switch (accumulation)
    {
    case Accumulation::Atomic:
        return "atomic";
    case Accumulation::ScatterReduce:
        return "scatter_reduce";
    }
    return "unknown";
}

Accumulation parse_accumulation(const std::string &name)
{
    if (name == "atomic")
        return Accumulation::Atomic;
    if (name == "scatter_reduce")
        return Accumulation::ScatterReduce;
    throw std::invalid_argument("unknown accumulation mode: " + name);
}

void executor::parallel_for_2d(int nx, int ny, const std::function<void(int, int)> &body) const
{
    parallel_for(nx * ny, [&](int k) { body(k / ny, k % ny); });
}

void serial_executor::parallel_for(int count, const std::function<void(int)> &body) const
{
    for (int i = 0; i < count; i++)
    {
        body(i);
    }
}

openmp_executor::openmp_executor(int threads) : threads(threads)
{
    if (threads < 0)
    {
        throw std::invalid_argument("thread count must not be negative");
    }
    if (this->threads == 0)
    {
        this->threads = omp_get_max_threads();
    }
}

void openmp_executor::parallel_for(int count, const std::function<void(int)> &body) const
{
#pragma omp parallel for schedule(static) num_threads(threads)
    for (int i = 0; i < count; i++)
    {
        body(i);
    }
}

std::unique_ptr<executor> make_executor(Backend backend, int threads)
{
    if (backend == Backend::OpenMP)
    {
        return std::unique_ptr<executor>(new openmp_executor(threads));
    }
    return std::unique_ptr<executor>(new serial_executor());
}
