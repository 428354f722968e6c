#include <gtest/gtest.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <string>
#include "errors.hpp"
#include "outcar.hpp"

static std::string data_file(const std::string& name) {
    return std::string(OUTCARKIT_TEST_DATA_DIR) + "/" + name;
}

static std::string slurp(const std::string& name) {
    std::ifstream file(data_file(name));
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

static std::string replace_first(std::string text, const std::string& from, const std::string& to) {
    size_t pos = text.find(from);
    EXPECT_NE(pos, std::string::npos) << from;
    if (pos != std::string::npos) text.replace(pos, from.size(), to);
    return text;
}

// ---- single extractors ----

TEST(OutcarFields, SpinAndIonCount) {
    std::string text = "   ISPIN  =      1    spin polarized calculation?\n"
                       "   number of dos      NEDOS =    301   number of ions     NIONS =      4\n";
    EXPECT_EQ(parse_ispin(text), 1);
    EXPECT_EQ(parse_nions(text), 4);
    EXPECT_THROW(parse_ibrion(text), FormatError);
}

TEST(OutcarFields, PositionForceBlock) {
    std::string text =
        " POSITION                                       TOTAL-FORCE (eV/Angst)\n"
        " -----------------------------------------------------------------------------------\n"
        "      3.87720      4.01520      4.00000        -0.438233     -0.328151      0.000000\n"
        "      4.12280      3.73870      4.34030         0.219116      0.164075      0.284126\n"
        "      4.12280      3.73870      3.65970         0.219117      0.164076     -0.284126\n"
        "      4.03860      3.86170      4.00000         0.000000      0.000000      0.000000\n"
        " -----------------------------------------------------------------------------------\n"
        "    total drift:                                0.000001     -0.000002      0.000000\n";

    auto [positions, forces] = parse_posforce(text);
    ASSERT_EQ(positions.size(), 1u);
    ASSERT_EQ(positions[0].rows(), 4);
    EXPECT_DOUBLE_EQ(positions[0](0, 0), 3.87720);
    EXPECT_DOUBLE_EQ(positions[0](0, 1), 4.01520);
    EXPECT_DOUBLE_EQ(positions[0](0, 2), 4.00000);
    EXPECT_DOUBLE_EQ(forces[0](0, 0), -0.438233);
    EXPECT_DOUBLE_EQ(forces[0](0, 1), -0.328151);
    EXPECT_DOUBLE_EQ(forces[0](0, 2), 0.0);
}

TEST(OutcarFields, UnterminatedPositionBlock) {
    std::string text = " POSITION    TOTAL-FORCE (eV/Angst)\n ------\n 1 2 3 4 5 6\n";
    EXPECT_THROW(parse_posforce(text), FormatError);
    std::string short_row = " POSITION    TOTAL-FORCE (eV/Angst)\n ------\n 1 2 3 4 5\n ------\n";
    EXPECT_THROW(parse_posforce(short_row), FormatError);
}

TEST(OutcarFields, EnergyAndScfCount) {
    std::string text =
        "------------------------ Iteration      1(   1)  ------------------------\n"
        "  free energy    TOTEN  =        12.34567890 eV\n"
        "------------------------ Iteration      1(  23)  ------------------------\n"
        "  free energy    TOTEN  =       -19.26550000 eV\n"
        "  FREE ENERGIE OF THE ION-ELECTRON SYSTEM (eV)\n"
        "  free  energy   TOTEN  =       -19.26550806 eV\n";
    std::vector<double> toten = parse_toten(text);
    std::vector<int> nscf = parse_nscfs(text);
    ASSERT_EQ(toten.size(), 1u);
    ASSERT_EQ(nscf.size(), 1u);
    EXPECT_DOUBLE_EQ(toten[0], -19.26550806);
    EXPECT_EQ(nscf[0], 23);
}

TEST(OutcarFields, CompactIterationMarker) {
    std::string text = "Iteration 1( 23)\n  free  energy   TOTEN  =  -19.26550806 eV\n";
    EXPECT_EQ(parse_nscfs(text), (std::vector<int>{23}));
    EXPECT_THROW(parse_nscfs("  free  energy   TOTEN  =  -1.0 eV\n"), FormatError);
}

TEST(OutcarFields, Magnetization) {
    std::string text =
        " number of electron       8.0000000 magnetization \n"
        "  free  energy   TOTEN  =  -1.0 eV\n"
        " number of electron      16.0000000 magnetization       2.0000000\n"
        "  free  energy   TOTEN  =  -2.0 eV\n"
        " number of electron      16.0000000 magnetization       0.1000000 -0.2000000  1.5000000\n"
        "  free  energy   TOTEN  =  -3.0 eV\n";
    std::vector<std::optional<std::vector<double>>> mag = parse_magmoms(text);
    ASSERT_EQ(mag.size(), 3u);
    EXPECT_FALSE(mag[0].has_value());
    ASSERT_TRUE(mag[1].has_value());
    EXPECT_EQ(*mag[1], (std::vector<double>{2.0}));
    ASSERT_TRUE(mag[2].has_value());
    EXPECT_EQ(mag[2]->size(), 3u);
    EXPECT_DOUBLE_EQ((*mag[2])[1], -0.2);
}

TEST(OutcarFields, PotcarLabelsDropRepeatsAndSuffixes) {
    std::string text =
        " POTCAR:    PAW_PBE Fe_pv 06Sep2000\n"
        " POTCAR:    PAW_PBE O 08Apr2002\n"
        " POTCAR:    PAW_PBE Fe_pv 06Sep2000\n"
        " POTCAR:    PAW_PBE O 08Apr2002\n";
    EXPECT_EQ(parse_ion_types(text), (std::vector<std::string>{"Fe", "O"}));
    EXPECT_THROW(parse_ion_types("no potcar here\n"), FormatError);
}

TEST(OutcarFields, MassesNeedZval) {
    std::string text =
        "   POMASS =   15.999; ZVAL   =    6.000    mass and valenz\n"
        "   POMASS =   16.00\n";
    EXPECT_EQ(parse_masses_per_type(text), (std::vector<double>{15.999}));
}

TEST(OutcarFields, NoVibrationsWithoutDof) {
    EXPECT_FALSE(parse_dof("nothing").has_value());
    EXPECT_FALSE(parse_vibrations("nothing").has_value());
}

TEST(OutcarFields, MassWeightsMustCoverEveryRow) {
    std::vector<Vibration> modes(1);
    modes[0].dxdydz = Coords::Ones(2, 3);
    EXPECT_THROW(apply_mass_weights(modes, {1.0, 4.0, 9.0}), ConsistencyError);
    apply_mass_weights(modes, {1.0, 4.0});
    EXPECT_DOUBLE_EQ(modes[0].dxdydz(1, 2), 0.5);
}

// ---- whole relaxation log ----

TEST(Outcar, RelaxationGlobals) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    EXPECT_EQ(o.ispin, 1);
    EXPECT_FALSE(o.lsorbit);
    EXPECT_EQ(o.ibrion, 2);
    EXPECT_EQ(o.nions, 4);
    EXPECT_EQ(o.nkpts, 1);
    EXPECT_EQ(o.nbands, 8);
    EXPECT_DOUBLE_EQ(o.efermi, -0.7865);
    EXPECT_TRUE(o.cell.isApprox(Lattice::Identity() * 8.0));
    EXPECT_EQ(o.ion_types, (std::vector<std::string>{"H", "N"}));
    EXPECT_EQ(o.ions_per_type, (std::vector<int>{3, 1}));
    EXPECT_EQ(o.ion_masses, (std::vector<double>{1.0, 1.0, 1.0, 14.001}));
    EXPECT_FALSE(o.vib.has_value());
    EXPECT_FALSE(o.constraints.has_value());
}

TEST(Outcar, RelaxationSteps) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    ASSERT_EQ(o.ion_iters.size(), 2u);

    const IonicIteration& first = o.ion_iters[0];
    EXPECT_EQ(first.nscf, 23);
    EXPECT_DOUBLE_EQ(first.toten, -19.26550806);
    EXPECT_DOUBLE_EQ(first.toten_z, -19.26498172);
    EXPECT_DOUBLE_EQ(first.cputime, 5.2860);
    EXPECT_DOUBLE_EQ(first.stress, -10.64);
    EXPECT_FALSE(first.magmom.has_value());
    ASSERT_EQ(first.positions.rows(), 4);
    EXPECT_DOUBLE_EQ(first.positions(0, 0), 3.87720);
    EXPECT_DOUBLE_EQ(first.forces(0, 1), -0.328151);
    EXPECT_TRUE(first.cell.isApprox(Lattice::Identity() * 8.0));

    const IonicIteration& second = o.ion_iters[1];
    EXPECT_EQ(second.nscf, 9);
    EXPECT_DOUBLE_EQ(second.toten, -19.32175122);
    EXPECT_DOUBLE_EQ(second.toten_z, -19.32101440);
    EXPECT_DOUBLE_EQ(second.cputime, 2.1347);
    EXPECT_DOUBLE_EQ(second.stress, -8.12);
    EXPECT_DOUBLE_EQ(second.positions(0, 0), 3.87015);
    EXPECT_DOUBLE_EQ(second.forces(1, 2), 0.071126);
}

TEST(Outcar, PerStepFieldsHaveEqualLength) {
    std::string text = slurp("OUTCAR_relax");
    Outcar o = parse_outcar(text);
    const size_t n = o.ion_iters.size();
    EXPECT_EQ(parse_nscfs(text).size(), n);
    EXPECT_EQ(parse_toten_z(text).size(), n);
    EXPECT_EQ(parse_stress(text).size(), n);
    EXPECT_EQ(parse_posforce(text).first.size(), n);
    EXPECT_EQ(parse_opt_cells(text).size(), n);
}

TEST(Outcar, MissingStepFieldIsConsistencyError) {
    std::string text = replace_first(slurp("OUTCAR_relax"), "LOOP+:", "LOOP :");
    try {
        parse_outcar(text);
        FAIL() << "expected ConsistencyError";
    } catch (const ConsistencyError& e) {
        EXPECT_NE(std::string(e.what()).find("LOOP+"), std::string::npos) << e.what();
    }
}

TEST(Outcar, MissingGlobalIsFormatError) {
    std::string text = replace_first(slurp("OUTCAR_relax"), "NIONS =", "NIONZ =");
    EXPECT_THROW(parse_outcar(text), FormatError);
}

TEST(Outcar, BadTokenIsParseError) {
    std::string text = replace_first(slurp("OUTCAR_relax"), "-19.26550806 eV", "-19.2655O806 eV");
    EXPECT_THROW(parse_outcar(text), ParseError);
}

TEST(Outcar, IonCountMismatchIsConsistencyError) {
    std::string text = replace_first(slurp("OUTCAR_relax"), "ions per type =               3   1",
                                      "ions per type =               3   2");
    EXPECT_THROW(parse_outcar(text), ConsistencyError);
}

TEST(OutcarFields, IonsPerTypeMustBePositive) {
    EXPECT_EQ(parse_ions_per_type("   ions per type =   3   1\n"), (std::vector<int>{3, 1}));
    EXPECT_THROW(parse_ions_per_type("   ions per type =   3   0\n"), FormatError);
    EXPECT_THROW(parse_ions_per_type("   ions per type =   5  -1\n"), FormatError);
}

TEST(Outcar, NonPositiveIonCountIsFormatError) {
    std::string text = replace_first(slurp("OUTCAR_relax"), "ions per type =               3   1",
                                      "ions per type =               5  -1");
    EXPECT_THROW(parse_outcar(text), FormatError);
}

TEST(Outcar, SetConstraintsChecksLength) {
    Outcar o = read_outcar(data_file("OUTCAR_relax"));
    EXPECT_THROW(o.set_constraints(Constraints(3)), ConsistencyError);
    o.set_constraints(Constraints(4, {true, true, false}));
    ASSERT_TRUE(o.constraints.has_value());
    EXPECT_EQ(o.constraints->size(), 4u);
}

TEST(Outcar, MissingFile) {
    EXPECT_THROW(read_outcar(data_file("does_not_exist")), std::runtime_error);
}

// ---- vibrational analysis ----

TEST(Outcar, VibrationModes) {
    Outcar o = read_outcar(data_file("OUTCAR_vib"));
    EXPECT_EQ(o.ibrion, 5);
    ASSERT_EQ(o.ion_iters.size(), 1u);
    ASSERT_TRUE(o.vib.has_value());
    const std::vector<Vibration>& modes = *o.vib;
    ASSERT_EQ(modes.size(), 3u);

    EXPECT_DOUBLE_EQ(modes[0].freq, 3627.910256);
    EXPECT_DOUBLE_EQ(modes[1].freq, 3620.673620);
    EXPECT_DOUBLE_EQ(modes[2].freq, 0.752260);
    EXPECT_FALSE(modes[0].is_imagine);
    EXPECT_FALSE(modes[1].is_imagine);
    EXPECT_TRUE(modes[2].is_imagine);
}

TEST(Outcar, VibrationDisplacementsAreDividedBySqrtMass) {
    Outcar o = read_outcar(data_file("OUTCAR_vib"));
    const std::vector<Vibration>& modes = *o.vib;

    // the mass-weighted table is taken, then divided by sqrt(mass) of each atom
    for (const Vibration& m : modes) {
        ASSERT_EQ(m.dxdydz.rows(), 4);
    }
    EXPECT_DOUBLE_EQ(modes[0].dxdydz(1, 0), 0.706412);
    EXPECT_DOUBLE_EQ(modes[0].dxdydz(3, 0), -0.042814 / std::sqrt(14.001));
    EXPECT_DOUBLE_EQ(modes[1].dxdydz(0, 0), 0.816496);
    EXPECT_DOUBLE_EQ(modes[2].dxdydz(3, 2), 0.5 / std::sqrt(14.001));
    EXPECT_DOUBLE_EQ(modes[2].dxdydz(0, 2), 0.5);
}

TEST(Outcar, TooFewModeHeaders) {
    std::string text = replace_first(slurp("OUTCAR_vib"), "Degrees of freedom DOF   =           3",
                                      "Degrees of freedom DOF   =           9");
    EXPECT_THROW(parse_outcar(text), FormatError);
}
