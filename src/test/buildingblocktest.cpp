#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

#include "building_block.h"
#include "library.h"
#include "obdetails.h"
#include "symmetry.h"
#include "testnets.h"

#include <openbabel/mol.h>
#include <openbabel/math/vector3.h>

namespace BuildingBlockTest {
    const std::string sbuDir{std::string(NETTOPO_TEST_DATADIR) + "/sbu"};
    const std::string cgdFile{std::string(NETTOPO_TEST_DATADIR) + "/nets.cgd"};

    std::vector<NetTopo::SymmetrySignature> pick(const std::map<std::string, NetTopo::SymmetrySignature>& blocks,
            const std::vector<std::string>& names) {
        std::vector<NetTopo::SymmetrySignature> sbus{};
        for (const std::string& name : names) {
            sbus.push_back(blocks.at(name));
        }
        return sbus;
    }
}

using namespace BuildingBlockTest;

TEST(BlockNameTest, HandlesTitleTokens) {
    EXPECT_EQ("square_planar", NetTopo::blockNameFromTitle("name=square_planar"));
    EXPECT_EQ("paddlewheel", NetTopo::blockNameFromTitle("Properties=species:S:1 name=\"paddlewheel\" pbc=\"F F F\""));
    EXPECT_EQ("", NetTopo::blockNameFromTitle("unnamed dimer"));
    EXPECT_EQ("", NetTopo::blockNameFromTitle(""));
}

TEST(ClassifyBuildingBlockTest, HandlesDummyAtoms) {
    // Only the dummy atoms count, the metal in the middle is ignored
    OpenBabel::OBMol mol{};
    NetTopo::formAtom(&mol, OpenBabel::vector3(0.0, 0.0, 0.0), 29);
    NetTopo::formAtom(&mol, OpenBabel::vector3(2.0, 0.0, 0.0), 0);
    NetTopo::formAtom(&mol, OpenBabel::vector3(-2.0, 0.0, 0.0), 0);
    const TestNets::TableClassifier byCount{};
    const NetTopo::SymmetrySignature sig{NetTopo::classifyBuildingBlock(&mol, byCount)};
    EXPECT_EQ(2, sig.GetMultiplicity());
    EXPECT_EQ("C1", sig.pointgroup);
}

TEST(ClassifyBuildingBlockTest, HandlesNoDummyAtoms) {
    OpenBabel::OBMol mol{};
    NetTopo::formAtom(&mol, OpenBabel::vector3(0.0, 0.0, 0.0), 6);
    const TestNets::TableClassifier byCount{};
    EXPECT_TRUE(NetTopo::classifyBuildingBlock(&mol, byCount).shape.empty());
}

TEST(ReadSBUTest, HandlesDirectory) {
    int errors{-1};
    const std::map<std::string, NetTopo::SymmetrySignature> blocks{NetTopo::readSBU(sbuDir, {"xyz"}, nullptr, &errors)};
    EXPECT_EQ(1, errors);  // the unnamed dimer
    ASSERT_EQ(3, blocks.size());
    EXPECT_EQ(NetTopo::Shape({1, 5, 5, 0, 1, 4}), blocks.at("square_planar").shape);
    EXPECT_EQ("D4h", blocks.at("square_planar").pointgroup);
    EXPECT_EQ(NetTopo::Shape({1, 9, 9, 4, 3, 0, 0, 6}), blocks.at("octahedral").shape);
    EXPECT_EQ(NetTopo::Shape({1, 3, 3, 2}), blocks.at("linear").shape);
}

TEST(ReadSBUTest, HandlesSingleFile) {
    int errors{-1};
    const std::map<std::string, NetTopo::SymmetrySignature> blocks{NetTopo::readSBU(sbuDir + "/square.xyz", {"cif"}, nullptr, &errors)};
    EXPECT_EQ(0, errors);
    ASSERT_EQ(1, blocks.size());
    EXPECT_EQ(4, blocks.at("square_planar").GetMultiplicity());
}

TEST(ReadSBUTest, HandlesFormatFilter) {
    int errors{-1};
    EXPECT_TRUE(NetTopo::readSBU(sbuDir, {"cif"}, nullptr, &errors).empty());
    EXPECT_EQ(0, errors);
}

TEST(ReadSBUTest, HandlesMissingPath) {
    int errors{0};
    EXPECT_TRUE(NetTopo::readSBU(sbuDir + "/missing", {"xyz"}, nullptr, &errors).empty());
    EXPECT_EQ(1, errors);
}

TEST(ReadSBUTest, HandlesCompatibleNets) {
    const std::map<std::string, NetTopo::SymmetrySignature> blocks{NetTopo::readSBU(sbuDir)};
    NetTopo::TopologyLibrary library{};
    library.ReadCGD(cgdFile);
    const std::vector<NetTopo::SymmetrySignature> layerBlocks{pick(blocks, {"square_planar", "linear"})};
    EXPECT_EQ(std::vector<std::string>{"sql"}, library.ListCompatible(layerBlocks, true));
    EXPECT_EQ(std::vector<std::string>({"pcu", "sql"}), library.ListCompatible(layerBlocks, false));
    const std::vector<NetTopo::SymmetrySignature> cubicBlocks{pick(blocks, {"octahedral", "linear"})};
    EXPECT_EQ(std::vector<std::string>{"pcu"}, library.ListCompatible(cubicBlocks, true));
}
