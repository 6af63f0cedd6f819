/*
xtc_summary.cpp:
    This program reads an xtc trajectory and prints, for each selected frame, the step, the time,
    the box volume and the centroid of all atoms.
    Eigen library is required for matrix operations.

Usage:
    ./xtc_summary traj_file [start stop step]
    OPTIONS:
        traj_file: xtc trajectory file
        start, stop, step: frame slice, as in Python. Negative start/stop count from the end,
                           "-" leaves a bound open. Default: every frame.
*/

#include "error.hpp"
#include "reader.hpp"
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <Eigen/Dense>

using molly::Frame;

/* parse a slice bound; "-" means open */
static std::optional<std::int64_t> parse_bound(const std::string& arg) {
    if (arg == "-") return std::nullopt;
    return std::stoll(arg);
}

/* box volume in nm^3 */
static double box_volume(const Frame& frame) {
    Eigen::Matrix3d cell;
    for (int i = 0; i < 3; i++) {
        for (int j = 0; j < 3; j++) {
            cell(i, j) = frame.box[i][j];
        }
    }
    return std::abs(cell.determinant());
}

/* mean position of all atoms in the frame */
static Eigen::RowVector3d centroid(const Frame& frame) {
    if (frame.n_atoms == 0) return Eigen::RowVector3d::Zero();
    Eigen::Map<const Eigen::Matrix<float, Eigen::Dynamic, 3, Eigen::RowMajor>> coords(
        frame.positions.data(), static_cast<Eigen::Index>(frame.n_atoms), 3);
    return coords.cast<double>().colwise().mean();
}

/* Main function */
int main(int argc, char** argv) {
    // setup input parameters
    if (argc != 2 && argc != 5) {
        std::cerr << "Usage: " << argv[0] << " traj_file [start stop step]" << std::endl;
        return 1;
    }
    std::string traj_file = argv[1];

    try {
        molly::FrameSelection selection;
        if (argc == 5) {
            std::int64_t step = std::string(argv[4]) == "-" ? 1 : std::stoll(argv[4]);
            selection = molly::FrameSelection::range(parse_bound(argv[2]), parse_bound(argv[3]), step);
        }

        molly::XTCReader reader(traj_file);

        // print information
        std::size_t nframes = reader.frame_count();
        std::cout << "Number of frames: " << nframes << std::endl;
        if (nframes == 0) {
            return 0;
        }
        std::cout << "Number of atoms: " << reader.atom_count() << std::endl;

        // read selected frames
        molly::FrameStream frames = reader.read_frames(selection);
        std::cout << "Frames selected: " << frames.size() << std::endl;

        std::cout << std::fixed << std::setprecision(6);
        std::cout << "# frame step time volume cx cy cz" << std::endl;
        for (std::size_t frame_number : frames.frames()) {
            std::optional<Frame> frame = frames.next();
            Eigen::RowVector3d center = centroid(*frame);
            std::cout << frame_number << " " << frame->step << " " << frame->time << " "
                      << box_volume(*frame) << " " << center << std::endl;
        }
    } catch (const molly::XtcError& e) {
        std::cerr << "Error reading " << traj_file << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid frame slice argument: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
