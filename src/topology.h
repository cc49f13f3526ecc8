/**********************************************************************
topology.h - Decomposition of a periodic net into symmetry classified slots
***********************************************************************/

#ifndef TOPOLOGY_H
#define TOPOLOGY_H

#include <string>
#include <vector>
#include <map>
#include <set>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>

#include "structure.h"
#include "fragment.h"
#include "symmetry.h"
#include "spacegroup.h"

namespace NetTopo
{

// Added to every cutoff so that the neighbor search does not drop connectors
// sitting exactly on the boundary
const double SKIN = 5.0e-3;
// Fractional distance below which a symmetry image lands on an existing site
const double SITE_TOLERANCE = 1.0e-6;
// A connector closer than this to its node makes the fragment degenerate
const double COINCIDENT_TOLERANCE = 1.0e-8;

typedef std::vector<int> EquivalenceClass;  // real atom indices related by the space group
typedef std::map<int, Shape> ShapeMap;
typedef std::map<int, std::string> PointGroupMap;


const SymmetryClassifier& defaultClassifier();


class Topology {
// A net ready for building block matching.  On construction every real atom
// (node) gets a fragment of its connection points, a shape and point group for
// that fragment, and a place in exactly one space group equivalence class.
// All derived data is keyed by the atom index in the copied PeriodicStructure
// and held by value, so copies are independent of each other.
private:
	std::string name;
	PeriodicStructure structure;
	const SymmetryClassifier *classifier;  // not owned
	std::vector<double> cutoffs;
	FragmentMap fragments;
	ShapeMap shapes;
	PointGroupMap pointgroups;
	std::vector<EquivalenceClass> equivalent_sites;

	void Analyze(const SpaceGroupSites *sites);
	void ExtractFragments();
	void ClassifyFragments();
	void BuildEquivalenceClasses(const SpaceGroupSites &sites);

public:
	// Analysis throws MalformedTopologyError or UnsupportedSpaceGroupError.
	// A NULL classifier selects the Open Babel classifier, and NULL sites use the
	// space group attached to the structure's unit cell.
	Topology(const std::string &topology_name, const PeriodicStructure &net, bool analyze = true,
			const SymmetryClassifier *symmetry = NULL, const SpaceGroupSites *sites = NULL);
	Topology Copy() const { return Topology(*this); }

	std::string GetName() const { return name; }
	PeriodicStructure GetStructure() const { return structure; }
	const std::vector<double>& GetCutoffs() const { return cutoffs; }
	const FragmentMap& GetFragmentMap() const { return fragments; }
	const ShapeMap& GetShapes() const { return shapes; }
	const PointGroupMap& GetPointGroups() const { return pointgroups; }
	const std::vector<EquivalenceClass>& GetEquivalenceClasses() const { return equivalent_sites; }
	int NumSlots() const { return static_cast<int>(fragments.size()); }

	// Mutable access for callers that adjust a copy before matching
	FragmentMap& GetFragmentMap() { return fragments; }
	ShapeMap& GetShapes() { return shapes; }

	std::vector<double> ComputeCutoffs() const;
	const EquivalenceClass* FindEquivalenceClass(int idx) const;
	Shape GetShape(int idx) const;
	std::string GetPointGroup(int idx) const;

	std::set<Shape> GetUniqueShapes() const;
	std::set<std::string> GetUniquePointGroups() const;
	OBMol GetFragments() const;

	// Shapes of every slot where a building block with this signature fits.
	// Slots are judged per equivalence class; duplicates are kept.
	std::vector<Shape> GetCompatibleSlots(const SymmetrySignature &sbu, bool coercion = false) const;
};

} // end namespace NetTopo
#endif // TOPOLOGY_H

//! \file topology.h
//! \brief topology.h - Decomposition of a periodic net into symmetry classified slots
