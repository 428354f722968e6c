#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "errors.hpp"
#include "outcar.hpp"
#include "poscar.hpp"
#include "trajectory.hpp"

namespace fs = std::filesystem;

static std::string data_file(const std::string& name) {
    return std::string(OUTCARKIT_TEST_DATA_DIR) + "/" + name;
}

static std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

static std::string slurp(const fs::path& path) {
    std::ifstream file(path);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

class TrajectoryFiles : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::temp_directory_path() / (std::string("outcarkit_") + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST(Trajectory, FramesFollowIonicSteps) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    Trajectory traj = Trajectory::from_outcar(o);

    ASSERT_EQ(traj.size(), 2u);
    ASSERT_EQ(traj.forces.size(), 2u);
    const Structure& s = traj.frames[1];
    EXPECT_DOUBLE_EQ(s.scale, 1.0);
    EXPECT_EQ(s.ion_types, o.ion_types);
    EXPECT_TRUE(s.car_pos == o.ion_iters[1].positions);
    EXPECT_NEAR(s.frac_pos(0, 0), 3.87015 / 8.0, 1e-12);
    EXPECT_TRUE(traj.forces[1] == o.ion_iters[1].forces);
    EXPECT_FALSE(s.constraints.has_value());
}

TEST(Trajectory, MergedConstraintsReachFrames) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    o.set_constraints(*read_poscar(data_file("POSCAR_NH3")).structure.constraints);
    Trajectory traj = Trajectory::from_outcar(o);
    ASSERT_TRUE(traj.frames[0].constraints.has_value());
    EXPECT_EQ((*traj.frames[0].constraints)[3], (std::array<bool, 3>{false, false, false}));
}

TEST(Trajectory, XdatcarLayout) {
    Trajectory traj = Trajectory::from_outcar(read_outcar(data_file("OUTCAR_relax")));
    std::ostringstream oss;
    traj.write_xdatcar(oss);
    std::vector<std::string> lines = lines_of(oss.str());

    // one header, the cell does not change
    ASSERT_EQ(lines.size(), 17u);
    EXPECT_EQ(lines[0], "Generated by outcarkit");
    EXPECT_EQ(lines[1], "           1");
    EXPECT_EQ(lines[2], "     8.000000    0.000000    0.000000");
    EXPECT_EQ(lines[5], "    H    N");
    EXPECT_EQ(lines[6], "    3    1");
    EXPECT_EQ(lines[7], "Direct configuration=     1");
    EXPECT_EQ(lines[8], "   0.48465000  0.50190000  0.50000000");
    EXPECT_EQ(lines[12], "Direct configuration=     2");
}

TEST(Trajectory, XdatcarHasOneHeaderWhenCellChanges) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    o.ion_iters[1].cell(2, 2) = 9.0;
    Trajectory traj = Trajectory::from_outcar(o);
    std::ostringstream oss;
    traj.write_xdatcar(oss);
    std::vector<std::string> lines = lines_of(oss.str());

    ASSERT_EQ(lines.size(), 17u);
    int headers = 0;
    for (const std::string& line : lines) {
        if (line == "Generated by outcarkit") ++headers;
    }
    EXPECT_EQ(headers, 1);
    EXPECT_EQ(lines[4], "     0.000000    0.000000    8.000000");
    EXPECT_EQ(lines[12], "Direct configuration=     2");
    // second step in its own 9 A cell
    EXPECT_EQ(lines[13], "   0.48376875  0.50127125  0.44444444");
}

TEST(Trajectory, EmptyTrajectoryHasNoXdatcar) {
    Trajectory traj;
    std::ostringstream oss;
    EXPECT_THROW(traj.write_xdatcar(oss), ConsistencyError);
    EXPECT_TRUE(oss.str().empty());
}

TEST(Trajectory, WritersKeepStreamFormatting) {
    Trajectory traj = Trajectory::from_outcar(read_outcar(data_file("OUTCAR_relax")));
    std::ostringstream oss;
    traj.write_xdatcar(oss);
    write_xsf(oss, traj.frames[0], traj.forces[0]);
    const size_t before = oss.str().size();
    oss << 0.5 << ' ' << 1.0 / 3.0;
    EXPECT_EQ(oss.str().substr(before), "0.5 0.333333");
}

TEST_F(TrajectoryFiles, SavesNumberedFiles) {
    Trajectory traj = Trajectory::from_outcar(read_outcar(data_file("OUTCAR_relax")));
    traj.save_as_xdatcar(dir.string());
    traj.save_as_poscar(2, dir.string());
    traj.save_as_xsf(1, dir.string());

    EXPECT_TRUE(fs::exists(dir / "XDATCAR"));
    ASSERT_TRUE(fs::exists(dir / "POSCAR_00002.vasp"));
    ASSERT_TRUE(fs::exists(dir / "step_00001.xsf"));

    Poscar back = read_poscar((dir / "POSCAR_00002.vasp").string());
    EXPECT_TRUE(back.structure.car_pos.isApprox(traj.frames[1].car_pos, 1e-9));

    std::vector<std::string> xsf = lines_of(slurp(dir / "step_00001.xsf"));
    ASSERT_EQ(xsf.size(), 11u);
    EXPECT_EQ(xsf[0], "CRYSTAL");
    EXPECT_EQ(xsf[1], "PRIMVEC");
    EXPECT_EQ(xsf[5], "PRIMCOORD");
    EXPECT_EQ(xsf[6], "4 1");
    EXPECT_EQ(xsf[7].substr(0, 3), "  H");
    EXPECT_NE(xsf[7].find("-0.4382330000"), std::string::npos);
    EXPECT_EQ(xsf[10].substr(0, 3), "  N");
}

TEST_F(TrajectoryFiles, StepIndexIsOneBased) {
    Trajectory traj = Trajectory::from_outcar(read_outcar(data_file("OUTCAR_relax")));
    EXPECT_THROW(traj.save_as_poscar(0, dir.string()), RangeError);
    EXPECT_THROW(traj.save_as_poscar(3, dir.string()), RangeError);
    EXPECT_THROW(traj.save_as_xsf(3, dir.string()), RangeError);
}

TEST_F(TrajectoryFiles, EmptyTrajectoryLeavesNoFile) {
    Trajectory traj;
    EXPECT_THROW(traj.save_as_xdatcar(dir.string()), ConsistencyError);
    EXPECT_FALSE(fs::exists(dir / "XDATCAR"));
}

TEST_F(TrajectoryFiles, UnwritableDirectory) {
    Trajectory traj = Trajectory::from_outcar(read_outcar(data_file("OUTCAR_relax")));
    EXPECT_THROW(traj.save_as_xdatcar((dir / "missing" / "deeper").string()), std::runtime_error);
}

// ---- vibrations ----

TEST(Vibrations, EquilibriumStructure) {
    Outcar o = read_outcar(data_file("OUTCAR_vib"));
    Vibrations vibs = Vibrations::from_outcar(o);
    EXPECT_EQ(vibs.size(), 3u);
    EXPECT_TRUE(vibs.structure.cell == o.cell);
    EXPECT_TRUE(vibs.structure.car_pos == o.ion_iters[0].positions);
}

TEST(Vibrations, RelaxationHasNoModes) {
    EXPECT_THROW(Vibrations::from_outcar(read_outcar(data_file("OUTCAR_relax"))), FormatError);
}

TEST_F(TrajectoryFiles, SavesModeXsf) {
    Vibrations vibs = Vibrations::from_outcar(read_outcar(data_file("OUTCAR_vib")));
    vibs.save_as_xsf(3, dir.string());
    ASSERT_TRUE(fs::exists(dir / "mode_0003.xsf"));

    std::vector<std::string> xsf = lines_of(slurp(dir / "mode_0003.xsf"));
    ASSERT_EQ(xsf.size(), 12u);
    EXPECT_EQ(xsf[0], "# mode 3: 0.752260 cm-1, imaginary");
    EXPECT_EQ(xsf[1], "CRYSTAL");
    EXPECT_NE(xsf[8].find("0.5000000000"), std::string::npos);

    EXPECT_THROW(vibs.save_as_xsf(4, dir.string()), RangeError);
}

// ---- index selection ----

TEST(IndexTransform, ZeroSelectsAll) {
    EXPECT_EQ(index_transform({3, 0}, 4), (std::vector<int>{1, 2, 3, 4}));
    EXPECT_TRUE(index_transform({0}, 0).empty());
}

TEST(IndexTransform, NegativeCountsFromTheEnd) {
    EXPECT_EQ(index_transform({-2, -1, 1, 2}, 5), (std::vector<int>{4, 5, 1, 2}));
}

TEST(IndexTransform, OutOfRange) {
    EXPECT_THROW(index_transform({6}, 5), RangeError);
    EXPECT_THROW(index_transform({-6}, 5), RangeError);
    EXPECT_TRUE(index_transform({}, 5).empty());
}
