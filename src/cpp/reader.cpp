#include "reader.hpp"
#include "errors.hpp"
#include "structure.hpp"
#include <exception>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

OutcarReader::OutcarReader(const std::string& filename)
    : filename_(filename), mapped_file_(std::make_unique<MappedFile>(filename)) {}

void OutcarReader::index() {
    outcar_ = std::make_unique<Outcar>(parse_outcar(mapped_file_->view()));
}

const Outcar& OutcarReader::checked_outcar() const {
    if (!outcar_) {
        throw std::logic_error("OutcarReader: index() must be called before reading " + filename_);
    }
    return *outcar_;
}

void OutcarReader::set_constraints(Constraints constraints) {
    if (!outcar_) {
        throw std::logic_error("OutcarReader: index() must be called before set_constraints");
    }
    outcar_->set_constraints(std::move(constraints));
}

std::vector<Structure> OutcarReader::read_frames(const std::vector<size_t>& frame_indices) {
    const Outcar& outcar = checked_outcar();
    const std::vector<IonicIteration>& steps = outcar.ion_iters;

    // 1. bounds check, serial
    for (size_t idx : frame_indices) {
        if (idx >= steps.size()) {
            throw RangeError("Frame index " + std::to_string(idx) + " is out of bounds (total frames: "
                             + std::to_string(steps.size()) + ")");
        }
    }

    // 2. fractional coordinates of every frame, in parallel
    std::vector<Structure> frames(frame_indices.size());
    std::vector<std::exception_ptr> errors(frame_indices.size());
    int n_frames_to_read = static_cast<int>(frame_indices.size());
#ifdef _OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (int i = 0; i < n_frames_to_read; ++i) {
        const IonicIteration& it = steps[frame_indices[static_cast<size_t>(i)]];
        try {
            frames[i] = from_cartesian(it.cell, 1.0, outcar.ion_types, outcar.ions_per_type,
                                       it.positions, outcar.constraints);
        } catch (...) {
            errors[i] = std::current_exception();
        }
    }
    for (const std::exception_ptr& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
    return frames;
}
