#ifndef PARALLEL_H
#define PARALLEL_H

#include <functional>
#include <memory>
#include <string>

enum class Backend
{
    Serial,
    OpenMP
};

// How particle contributions are summed into shared grid nodes during P2G
enum class Accumulation
{
    // lock-free add straight into the grid
    Atomic,
    // per-particle slots, bucketed by node, reduced in particle order
    ScatterReduce
};

const char *backend_name(Backend backend);
Backend parse_backend(const std::string &name);
const char *accumulation_name(Accumulation accumulation);
Accumulation parse_accumulation(const std::string &name);

// Data-parallel loop substrate. Every call returns only after all items are
// done, so consecutive calls are separated by a barrier. Loop bodies must
// not throw.
class executor
{
public:
    virtual ~executor() {}

    virtual Backend backend() const = 0;
    virtual int thread_count() const = 0;
    virtual void parallel_for(int count, const std::function<void(int)> &body) const = 0;

    // body(i, j) for every i < nx, j < ny
    void parallel_for_2d(int nx, int ny, const std::function<void(int, int)> &body) const;
};

// Reference backend, runs items in index order on the calling thread
class serial_executor : public executor
{
public:
    Backend backend() const override { return Backend::Serial; }
    int thread_count() const override { return 1; }
    void parallel_for(int count, const std::function<void(int)> &body) const override;
};

class openmp_executor : public executor
{
public:
    // threads == 0 uses the OpenMP runtime default
    explicit openmp_executor(int threads = 0);

    Backend backend() const override { return Backend::OpenMP; }
    int thread_count() const override { return threads; }
    void parallel_for(int count, const std::function<void(int)> &body) const override;

private:
    int threads;
};

std::unique_ptr<executor> make_executor(Backend backend, int threads = 0);

#endif // PARALLEL_H
