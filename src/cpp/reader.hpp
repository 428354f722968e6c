/*
reader.hpp:
    1. IReader: interface of the frame readers.
    2. OutcarReader: memory-maps an OUTCAR and serves its ionic steps as Structures.
*/
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "basic.hpp"
#include "mapped_file.hpp"
#include "outcar.hpp"

// -------------------------------------------------------------
// 1. IReader
// -------------------------------------------------------------

class IReader {
public:
    virtual ~IReader() = default;

    /**
     * @brief Scans the whole file. Must be called before read_frames.
     */
    virtual void index() = 0;

    /**
     * @brief Reads several frames.
     * @param frame_indices zero-based frame indices.
     */
    virtual std::vector<Structure> read_frames(const std::vector<size_t>& frame_indices) = 0;

    virtual size_t get_num_frames() const = 0;

    virtual int get_num_atoms() const = 0;
};

// -------------------------------------------------------------
// 2. OutcarReader
// -------------------------------------------------------------

class OutcarReader : public IReader {
private:
    std::string filename_;
    std::unique_ptr<MappedFile> mapped_file_;
    std::unique_ptr<Outcar> outcar_;    // null until index()

    const Outcar& checked_outcar() const;

public:
    /**
     * @brief Maps the file but does not parse it.
     * @throws std::runtime_error if the file cannot be mapped.
     */
    explicit OutcarReader(const std::string& filename);

    /**
     * @brief Parses the mapped text, replacing any previous result.
     * @throws FormatError, ParseError or ConsistencyError from parse_outcar.
     */
    void index() override;

    /**
     * @brief Ionic steps as Structures (step cell, scale 1, merged constraints).
     * @throws RangeError if an index is out of range.
     * @throws std::logic_error if index() has not been called.
     */
    std::vector<Structure> read_frames(const std::vector<size_t>& frame_indices) override;

    /* attaches selective dynamics flags, see Outcar::set_constraints */
    void set_constraints(Constraints constraints);

    const Outcar& outcar() const { return checked_outcar(); }
    const std::string& filename() const { return filename_; }

    size_t get_num_frames() const override { return outcar_ ? outcar_->ion_iters.size() : 0; }

    int get_num_atoms() const override { return outcar_ ? outcar_->nions : -1; }
};
