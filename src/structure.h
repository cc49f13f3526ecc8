/**********************************************************************
structure.h - Periodic atomic model of a net: nodes, connectors and cell
***********************************************************************/

#ifndef STRUCTURE_H
#define STRUCTURE_H

#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/generic.h>

#include "periodic.h"

namespace OpenBabel
{
// forward declarations
class SpaceGroup;
}

namespace NetTopo
{

using OpenBabel::OBMol;

// Connection points carry atomic number 0 (dummy atoms, "X" in CGD derived nets)
const int CONNECTOR_ELEMENT = 0;


class PeriodicStructure {
// Arena of atoms for a periodic net.  Wraps an OBMol holding the atoms and the
// OBUnitCell (with its space group), and adds what Open Babel does not track:
// periodicity per axis and an integer tag per atom.
// Tag 0 marks a real atom (a node of the net), any other tag a connector.
// Atom indices are 0-based, unlike OBMol::GetAtom.
private:
	OBMol mol;
	PeriodicFlags pbc;
	std::vector<int> tags;

public:
	PeriodicStructure();
	// Connectors (atomic number 0) are tagged with index + 1
	PeriodicStructure(const OBMol &source, const PeriodicFlags &periodic = PeriodicFlags());
	PeriodicStructure(const PeriodicStructure &other);
	PeriodicStructure& operator=(const PeriodicStructure &other);

	int NumAtoms() const;
	int NumConnectors() const;
	int NumRealAtoms() const;
	bool HasLattice() const;
	OBUnitCell* GetLattice() const;
	const OpenBabel::SpaceGroup* GetSpaceGroup() const;
	const PeriodicFlags& GetPeriodicFlags() const { return pbc; }

	vector3 GetPosition(int idx) const;
	vector3 GetFractional(int idx) const;
	int GetAtomicNum(int idx) const;
	int GetTag(int idx) const;
	void SetTag(int idx, int tag);
	bool IsConnector(int idx) const;
	std::vector<int> GetConnectorIndices() const;
	std::vector<int> GetRealAtomIndices() const;

	double GetDistance(int from, int to) const;  // minimum image
	std::string GetTitle() const;
	OBMol ToOBMol() const { return mol; }
};

} // end namespace NetTopo
#endif // STRUCTURE_H

//! \file structure.h
//! \brief structure.h - Periodic atomic model of a net: nodes, connectors and cell
