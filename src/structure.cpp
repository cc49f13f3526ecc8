#include "structure.h"
#include "periodic.h"

#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/mol.h>
#include <openbabel/atom.h>
#include <openbabel/generic.h>
#include <openbabel/obiter.h>


namespace NetTopo
{

using namespace OpenBabel;

PeriodicStructure::PeriodicStructure() : pbc(false, false, false) {
}

PeriodicStructure::PeriodicStructure(const OBMol &source, const PeriodicFlags &periodic) : mol(source), pbc(periodic) {
	tags.resize(mol.NumAtoms(), 0);
	FOR_ATOMS_OF_MOL(a, mol) {
		int idx = a->GetIdx() - 1;
		if (a->GetAtomicNum() == CONNECTOR_ELEMENT) {
			tags[idx] = idx + 1;
		}
	}
	if (!HasLattice() && pbc.Any()) {
		obErrorLog.ThrowError(__FUNCTION__, "Periodic structure without a unit cell.", obWarning);
	}
}

PeriodicStructure::PeriodicStructure(const PeriodicStructure &other) : mol(other.mol), pbc(other.pbc), tags(other.tags) {
	// OBMol's copy constructor clones the OBUnitCell data, so nothing else is shared
}

PeriodicStructure& PeriodicStructure::operator=(const PeriodicStructure &other) {
	if (this != &other) {
		mol = other.mol;
		pbc = other.pbc;
		tags = other.tags;
	}
	return *this;
}

int PeriodicStructure::NumAtoms() const {
	return static_cast<int>(mol.NumAtoms());
}

int PeriodicStructure::NumConnectors() const {
	return static_cast<int>(GetConnectorIndices().size());
}

int PeriodicStructure::NumRealAtoms() const {
	return static_cast<int>(GetRealAtomIndices().size());
}

bool PeriodicStructure::HasLattice() const {
	return GetLattice() != NULL;
}

OBUnitCell* PeriodicStructure::GetLattice() const {
	// OBBase::GetData is not const, but looking up the lattice does not modify the molecule
	return getPeriodicLattice(const_cast<OBMol*>(&mol));
}

const SpaceGroup* PeriodicStructure::GetSpaceGroup() const {
	OBUnitCell *lattice = GetLattice();
	if (!lattice) {
		return NULL;
	}
	return lattice->GetSpaceGroup();
}

vector3 PeriodicStructure::GetPosition(int idx) const {
	return mol.GetAtom(idx + 1)->GetVector();
}

vector3 PeriodicStructure::GetFractional(int idx) const {
	return GetLattice()->CartesianToFractional(GetPosition(idx));
}

int PeriodicStructure::GetAtomicNum(int idx) const {
	return mol.GetAtom(idx + 1)->GetAtomicNum();
}

int PeriodicStructure::GetTag(int idx) const {
	return tags[idx];
}

void PeriodicStructure::SetTag(int idx, int tag) {
	tags[idx] = tag;
}

bool PeriodicStructure::IsConnector(int idx) const {
	return tags[idx] != 0;
}

std::vector<int> PeriodicStructure::GetConnectorIndices() const {
	std::vector<int> connectors;
	for (int i = 0; i < NumAtoms(); ++i) {
		if (IsConnector(i)) {
			connectors.push_back(i);
		}
	}
	return connectors;
}

std::vector<int> PeriodicStructure::GetRealAtomIndices() const {
	std::vector<int> real_atoms;
	for (int i = 0; i < NumAtoms(); ++i) {
		if (!IsConnector(i)) {
			real_atoms.push_back(i);
		}
	}
	return real_atoms;
}

double PeriodicStructure::GetDistance(int from, int to) const {
	OBUnitCell *lattice = GetLattice();
	if (!lattice) {
		return (GetPosition(to) - GetPosition(from)).length();
	}
	return minimumImageDistance(lattice, GetPosition(from), GetPosition(to), pbc);
}

std::string PeriodicStructure::GetTitle() const {
	return std::string(mol.GetTitle());
}

} // end namespace NetTopo
