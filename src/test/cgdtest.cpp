#include <gtest/gtest.h>
#include <algorithm>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cgd.h"
#include "errors.h"
#include "library.h"
#include "spacegroup.h"
#include "structure.h"
#include "topology.h"
#include "testnets.h"

#include <openbabel/generic.h>
#include <openbabel/oberror.h>
#include <openbabel/math/spacegroup.h>

namespace CGDTest {
    const std::string netsFile{std::string(NETTOPO_TEST_DATADIR) + "/nets.cgd"};

    const char* unterminatedRecord{
        "CRYSTAL\n"
        "  NAME cubic\n"
        "  GROUP 221\n"
        "  CELL 2.00000 2.00000 2.00000 90.0000 90.0000 90.0000\n"
        "  NODE 1 6 0.00000 0.00000 0.00000\n"
        "  EDGE 0.00000 0.00000 0.00000 1.00000 0.00000 0.00000\n"};

    const char* layerRecords{
        "CRYSTAL\n"
        "  NAME hxl\n"
        "  GROUP p6mm\n"
        "  CELL 1.00000 1.00000 120.0000\n"
        "  NODE 1 6 0.00000 0.00000\n"
        "  EDGE 0.00000 0.00000 1.00000 0.00000\n"
        "END\n"
        "CRYSTAL\n"
        "  NAME rect\n"
        "  GROUP p2mm\n"
        "  CELL 1.00000 2.00000 90.0000\n"
        "  NODE 1 4 0.00000 0.00000\n"
        "  EDGE 0.00000 0.00000 1.00000 0.00000\n"
        "  EDGE 0.00000 0.00000 0.00000 1.00000\n"
        "END\n"};

    std::multiset<std::size_t> classSizes(const NetTopo::Topology& topo) {
        std::multiset<std::size_t> sizes{};
        for (const NetTopo::EquivalenceClass& eq : topo.GetEquivalenceClasses()) {
            sizes.insert(eq.size());
        }
        return sizes;
    }

    bool loggedInfo(const std::string& text) {
        const std::vector<std::string> messages{OpenBabel::obErrorLog.GetMessagesOfLevel(OpenBabel::obInfo)};
        return std::any_of(messages.begin(), messages.end(),
            [&text](const std::string& m) { return m.find(text) != std::string::npos; });
    }

    std::vector<NetTopo::SymmetrySignature> slotSignatures(const NetTopo::Topology& topo) {
        std::vector<NetTopo::SymmetrySignature> sbus{};
        for (const auto& p : topo.GetFragmentMap()) {
            sbus.push_back(NetTopo::SymmetrySignature(topo.GetShape(p.first), topo.GetPointGroup(p.first)));
        }
        return sbus;
    }
}

using namespace CGDTest;

TEST(ResolveSpaceGroupTest, HandlesSymbolsAndNumbers) {
    const OpenBabel::SpaceGroup* fromSymbol{NetTopo::resolveSpaceGroup("Pm-3m")};
    ASSERT_NE(nullptr, fromSymbol);
    EXPECT_EQ(221, fromSymbol->GetId());
    const OpenBabel::SpaceGroup* fromNumber{NetTopo::resolveSpaceGroup("221")};
    ASSERT_NE(nullptr, fromNumber);
    EXPECT_EQ(221, fromNumber->GetId());
    EXPECT_EQ(227, NetTopo::resolveSpaceGroup("Fd-3m", 2)->GetId());
}

TEST(ResolveSpaceGroupTest, HandlesUnknownGroup) {
    EXPECT_THROW(NetTopo::resolveSpaceGroup("Q9zz"), NetTopo::UnsupportedSpaceGroupError);
    EXPECT_THROW(NetTopo::resolveSpaceGroup("231"), NetTopo::UnsupportedSpaceGroupError);
    EXPECT_THROW(NetTopo::OBSpaceGroupSites(nullptr), NetTopo::UnsupportedSpaceGroupError);
}

TEST(OBSpaceGroupSitesTest, HandlesEdgeCentres) {
    const NetTopo::OBSpaceGroupSites sites{NetTopo::resolveSpaceGroup("Pm-3m")};
    const std::vector<OpenBabel::vector3> images{sites.EquivalentSites(OpenBabel::vector3(0.5, 0.0, 0.0))};
    EXPECT_EQ(3, images.size());
}

TEST(ReadCGDTest, HandlesDataFile) {
    int errors{0};
    const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGD(netsFile, &errors)};
    EXPECT_EQ(2, errors);
    EXPECT_EQ(2, nets.size());
    EXPECT_EQ(1, nets.count("sql"));
    EXPECT_EQ(1, nets.count("pcu"));
}

TEST(ReadCGDTest, HandlesLayer) {
    const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGD(netsFile)};
    const NetTopo::PeriodicStructure& sql{nets.at("sql")};
    EXPECT_EQ("sql", sql.GetTitle());
    EXPECT_FALSE(sql.GetPeriodicFlags()[2]);
    EXPECT_TRUE(sql.GetPeriodicFlags()[0]);
    EXPECT_DOUBLE_EQ(NetTopo::DEFAULT_2D_HEIGHT, sql.GetLattice()->GetC());
    EXPECT_EQ(3, sql.NumRealAtoms());
    EXPECT_EQ(4, sql.NumConnectors());
    EXPECT_EQ(4, sql.GetAtomicNum(sql.GetRealAtomIndices()[0]));
}

TEST(ReadCGDTest, HandlesSymmetryExpansion) {
    const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGD(netsFile)};
    const NetTopo::PeriodicStructure& pcu{nets.at("pcu")};
    EXPECT_EQ(4, pcu.NumRealAtoms());
    EXPECT_EQ(6, pcu.NumConnectors());
    std::multiset<int> coordination{};
    for (int idx : pcu.GetRealAtomIndices()) {
        coordination.insert(pcu.GetAtomicNum(idx));
    }
    EXPECT_EQ(std::multiset<int>({2, 2, 2, 6}), coordination);
    ASSERT_NE(nullptr, pcu.GetSpaceGroup());
    EXPECT_EQ(221, pcu.GetSpaceGroup()->GetId());
}

TEST(ReadCGDTest, HandlesConnectorPlacement) {
    // Connectors sit a quarter of the edge away from the node
    const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGD(netsFile)};
    const NetTopo::PeriodicStructure& pcu{nets.at("pcu")};
    for (int x : pcu.GetConnectorIndices()) {
        double nearest{10.0};
        for (int node : pcu.GetRealAtomIndices()) {
            nearest = std::min(nearest, pcu.GetDistance(node, x));
        }
        EXPECT_NEAR(0.25, nearest, 1e-6);
    }
}

TEST(ReadCGDTest, HandlesPlaneGroups) {
    // Plane group symbols are read as the space group of the layer, every time
    for (int pass{0}; pass < 2; ++pass) {
        std::stringstream ss{layerRecords};
        int errors{-1};
        const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGDStream(ss, &errors)};
        EXPECT_EQ(0, errors);
        ASSERT_EQ(2, nets.size());
        ASSERT_NE(nullptr, nets.at("hxl").GetSpaceGroup());
        EXPECT_EQ(183, nets.at("hxl").GetSpaceGroup()->GetId());  // P6mm
        ASSERT_NE(nullptr, nets.at("rect").GetSpaceGroup());
        EXPECT_EQ(25, nets.at("rect").GetSpaceGroup()->GetId());  // Pmm2
    }
}

TEST(ReadCGDTest, HandlesRecordWithoutEnd) {
    std::stringstream ss{unterminatedRecord};
    int errors{-1};
    const std::map<std::string, NetTopo::PeriodicStructure> nets{NetTopo::readCGDStream(ss, &errors)};
    EXPECT_EQ(0, errors);
    ASSERT_EQ(1, nets.count("cubic"));
    EXPECT_EQ(1, nets.at("cubic").NumRealAtoms());
    EXPECT_EQ(6, nets.at("cubic").NumConnectors());
}

TEST(ReadCGDTest, HandlesMissingFile) {
    int errors{0};
    EXPECT_TRUE(NetTopo::readCGD(std::string(NETTOPO_TEST_DATADIR) + "/missing.cgd", &errors).empty());
    EXPECT_EQ(1, errors);
}

TEST(ReadCGDTest, HandlesBadNumbers) {
    std::stringstream ss{"CRYSTAL\n  NAME broken\n  GROUP P1\n  CELL 1.0 1.0 one 90 90 90\nEND\n"};
    int errors{0};
    EXPECT_TRUE(NetTopo::readCGDStream(ss, &errors).empty());
    EXPECT_EQ(1, errors);
}

TEST(TopologyLibraryTest, HandlesDataFile) {
    NetTopo::TopologyLibrary library{};
    EXPECT_EQ(2, library.ReadCGD(netsFile));
    EXPECT_EQ(2, library.Size());
    EXPECT_EQ(2, library.NumFailed());
    EXPECT_TRUE(library.Has("pcu"));
    EXPECT_FALSE(library.Has("bad-group"));
    EXPECT_EQ(std::vector<std::string>({"pcu", "sql"}), library.GetNames());
    EXPECT_THROW(library.Get("bad-cell"), std::out_of_range);
}

TEST(TopologyLibraryTest, HandlesStreamSummary) {
    // Stream and file loading report how many nets they saved the same way
    OpenBabel::obErrorLog.ClearLog();
    NetTopo::TopologyLibrary library{};
    std::stringstream ss{unterminatedRecord};
    EXPECT_EQ(1, library.ReadCGDStream(ss));
    EXPECT_TRUE(loggedInfo("1 topologies saved from stream"));

    EXPECT_EQ(2, library.ReadCGD(netsFile));
    EXPECT_TRUE(loggedInfo("2 topologies saved from " + netsFile));
}

TEST(TopologyLibraryTest, HandlesSpaceGroupClasses) {
    NetTopo::TopologyLibrary library{};
    library.ReadCGD(netsFile);
    EXPECT_EQ(std::multiset<std::size_t>({1, 3}), classSizes(library.Get("pcu")));
    EXPECT_EQ(std::multiset<std::size_t>({1, 2}), classSizes(library.Get("sql")));
}

TEST(TopologyLibraryTest, HandlesDefaultClassifier) {
    NetTopo::TopologyLibrary library{};
    library.ReadCGD(netsFile);
    const NetTopo::Topology& pcu{library.Get("pcu")};
    const std::set<NetTopo::Shape> expected{NetTopo::Shape({1, 9, 9, 4, 3, 0, 0, 6}), NetTopo::Shape({1, 3, 3, 2})};
    EXPECT_EQ(expected, pcu.GetUniqueShapes());
    EXPECT_EQ(1, library.Get("sql").GetUniqueShapes().count(NetTopo::Shape({1, 5, 5, 0, 1, 4})));
}

TEST(TopologyLibraryTest, HandlesListCompatible) {
    NetTopo::TopologyLibrary library{};
    library.ReadCGD(netsFile);
    const std::vector<NetTopo::SymmetrySignature> pcuBlocks{slotSignatures(library.Get("pcu"))};

    // Both kinds of pcu slot are needed for a full fit, and sql shares the linear one
    EXPECT_EQ(std::vector<std::string>{"pcu"}, library.ListCompatible(pcuBlocks, true));
    EXPECT_EQ(std::vector<std::string>({"pcu", "sql"}), library.ListCompatible(pcuBlocks, false));

    std::vector<NetTopo::SymmetrySignature> octahedron{};
    for (const NetTopo::SymmetrySignature& sbu : pcuBlocks) {
        if (sbu.GetMultiplicity() == 6) {
            octahedron.push_back(sbu);
        }
    }
    ASSERT_FALSE(octahedron.empty());
    EXPECT_TRUE(library.ListCompatible(octahedron, true).empty());
    EXPECT_EQ(std::vector<std::string>{"pcu"}, library.ListCompatible(octahedron, false));
}

TEST(TopologyLibraryTest, HandlesFailedAnalysis) {
    NetTopo::TopologyLibrary library{};
    const NetTopo::PeriodicStructure lonely{TestNets::buildNet(TestNets::cubicCell(2.0), {TestNets::Site{4, OpenBabel::vector3(0.0, 0.0, 0.0)}},
        NetTopo::PeriodicFlags(), NetTopo::resolveSpaceGroup("P1"))};
    EXPECT_FALSE(library.Add("lonely", lonely));
    EXPECT_EQ(1, library.NumFailed());
    EXPECT_EQ(0, library.Size());

    const NetTopo::PeriodicStructure square{TestNets::buildNet(TestNets::layerCell(4.0), {
        TestNets::Site{4, OpenBabel::vector3(0.0, 0.0, 0.0)},
        TestNets::Site{0, OpenBabel::vector3(0.25, 0.0, 0.0)}, TestNets::Site{0, OpenBabel::vector3(0.75, 0.0, 0.0)},
        TestNets::Site{0, OpenBabel::vector3(0.0, 0.25, 0.0)}, TestNets::Site{0, OpenBabel::vector3(0.0, 0.75, 0.0)}},
        NetTopo::PeriodicFlags(true, true, false), NetTopo::resolveSpaceGroup("P4mm"))};
    EXPECT_TRUE(library.Add("sql", square));
    EXPECT_EQ("D4h", library.Get("sql").GetPointGroup(0));
}
