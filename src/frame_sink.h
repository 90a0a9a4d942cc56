#ifndef FRAME_SINK_H
#define FRAME_SINK_H

#include <Eigen/Dense>
#include <string>
#include <vector>

// One rendered frame: particle positions in [0,1]^2 and their material ids
struct Frame
{
    int index = 0;
    double time = 0.0;
    std::vector<Eigen::Vector2f> positions;
    std::vector<int> materials;
};

// Receives a frame after every batch of substeps and tells the driver when
// to stop. Only sees the particle state between substeps.
class frame_sink
{
public:
    virtual ~frame_sink() {}

    virtual void present(const Frame &frame) = 0;
    // polled once per frame, after present()
    virtual bool quit_requested() = 0;
};

class null_frame_sink : public frame_sink
{
public:
    void present(const Frame &) override {}
    bool quit_requested() override { return false; }
};

// Writes <dir>/frame_NNNNN.csv with an "x,y,material" header per frame
class csv_frame_writer : public frame_sink
{
public:
    explicit csv_frame_writer(const std::string &output_dir);

    void present(const Frame &frame) override;
    bool quit_requested() override { return false; }

    std::string frame_path(int index) const;
    int frames_written() const { return iteration; }

private:
    std::string output_dir;
    int iteration = 0;
};

#endif // FRAME_SINK_H
