#include "topology.h"
#include "errors.h"
#include "fragment.h"
#include "neighbor_list.h"
#include "obdetails.h"
#include "periodic.h"
#include "spacegroup.h"
#include "structure.h"
#include "symmetry.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/mol.h>
#include <openbabel/atom.h>
#include <openbabel/generic.h>


namespace NetTopo
{

using namespace OpenBabel;

const SymmetryClassifier& defaultClassifier() {
	static const OBSymmetryClassifier classifier;
	return classifier;
}


Topology::Topology(const std::string &topology_name, const PeriodicStructure &net, bool analyze,
		const SymmetryClassifier *symmetry, const SpaceGroupSites *sites)
	: name(topology_name), structure(net), classifier(symmetry) {
	if (!classifier) {
		classifier = &defaultClassifier();
	}
	if (analyze) {
		Analyze(sites);
	}
}

void Topology::Analyze(const SpaceGroupSites *sites) {
	if (!structure.HasLattice()) {
		std::string msg = "Net " + name + " has no unit cell";
		obErrorLog.ThrowError(__FUNCTION__, msg, obError);
		throw MalformedTopologyError(msg);
	}

	cutoffs = ComputeCutoffs();
	ExtractFragments();
	ClassifyFragments();

	if (sites) {
		BuildEquivalenceClasses(*sites);
	} else {
		const SpaceGroup *sg = structure.GetSpaceGroup();
		if (!sg) {
			std::string msg = "Net " + name + " has no space group attached to its unit cell";
			obErrorLog.ThrowError(__FUNCTION__, msg, obError);
			throw UnsupportedSpaceGroupError(msg);
		}
		OBSpaceGroupSites sg_sites(sg);
		BuildEquivalenceClasses(sg_sites);
	}

	std::stringstream msg;
	msg << "Analyzed " << name << ": " << fragments.size() << " slots in "
		<< equivalent_sites.size() << " equivalence classes";
	obErrorLog.ThrowError(__FUNCTION__, msg.str(), obDebug);
}

std::vector<double> Topology::ComputeCutoffs() const {
	// One radius per atom such that each real atom reaches exactly as many
	// connectors as its coordination number (its atomic number), or all of them
	// if there are fewer.  Connectors only get the skin.
	// Equidistant connectors at the k-th position are resolved by std::nth_element,
	// so which of them is "closest" is unspecified, but the radius is not.
	std::vector<int> connectors = structure.GetConnectorIndices();
	std::vector<int> real_atoms = structure.GetRealAtomIndices();
	std::vector<double> radii(structure.NumAtoms(), SKIN);

	if (connectors.empty()) {
		obErrorLog.ThrowError(__FUNCTION__, "Net " + name + " does not contain any connection points", obWarning);
		return radii;
	}

	for (std::vector<int>::iterator ai=real_atoms.begin(); ai!=real_atoms.end(); ++ai) {
		std::vector<double> dists;
		for (std::vector<int>::iterator xi=connectors.begin(); xi!=connectors.end(); ++xi) {
			double d = structure.GetDistance(*ai, *xi);
			if (d < COINCIDENT_TOLERANCE) {
				std::stringstream msg;
				msg << "Connector " << *xi << " coincides with node " << *ai << " in net " << name;
				obErrorLog.ThrowError(__FUNCTION__, msg.str(), obError);
				throw MalformedTopologyError(msg.str());
			}
			dists.push_back(d);
		}

		int coord = structure.GetAtomicNum(*ai);
		double cutoff = 0.0;
		if (coord <= 0) {
			obErrorLog.ThrowError(__FUNCTION__, "Node without a coordination number", obWarning);
		} else if (coord < static_cast<int>(dists.size())) {
			std::nth_element(dists.begin(), dists.begin() + (coord - 1), dists.end());
			cutoff = dists[coord - 1];  // largest of the coord closest
		} else {
			cutoff = *std::max_element(dists.begin(), dists.end());
		}
		radii[*ai] = cutoff + SKIN;
	}
	return radii;
}

void Topology::ExtractFragments() {
	PeriodicNeighborList neighbors(structure, cutoffs);
	OBUnitCell *lattice = structure.GetLattice();
	std::vector<int> real_atoms = structure.GetRealAtomIndices();

	for (std::vector<int>::iterator ai=real_atoms.begin(); ai!=real_atoms.end(); ++ai) {
		Fragment fragment(*ai);
		const std::vector<Neighbor> &nbors = neighbors.GetNeighbors(*ai);
		for (std::vector<Neighbor>::const_iterator nb=nbors.begin(); nb!=nbors.end(); ++nb) {
			if (!structure.IsConnector(nb->index)) { continue; }
			// absolute position of the periodic image, no wrapping back into the cell
			vector3 pos = structure.GetPosition(nb->index) + latticeTranslation(lattice, nb->offset);
			fragment.AddPoint(pos, structure.GetTag(nb->index), nb->index, nb->offset);
		}
		if (fragment.Empty()) {
			std::stringstream msg;
			msg << "Node " << *ai << " of net " << name << " has no connection points";
			obErrorLog.ThrowError(__FUNCTION__, msg.str(), obError);
			throw MalformedTopologyError(msg.str());
		}
		fragments.insert(std::make_pair(*ai, fragment));
	}
}

void Topology::ClassifyFragments() {
	for (FragmentMap::iterator it=fragments.begin(); it!=fragments.end(); ++it) {
		int max_order = it->second.NumPoints();
		SymmetrySignature signature = classifier->Classify(it->second, max_order);
		shapes[it->first] = signature.shape;
		pointgroups[it->first] = signature.pointgroup;
	}
}

void Topology::BuildEquivalenceClasses(const SpaceGroupSites &sites) {
	// Groups real atoms whose positions the space group maps onto each other.
	// A symmetry image matches the closest atom in fractional space, either
	// directly or after folding the distance by one lattice vector (|d - 1|),
	// which catches images landing on the opposite face of the cell.
	// Positions are wrapped into the home cell along the periodic axes, with
	// coordinates within SITE_TOLERANCE of 1 folded onto 0.
	int num_atoms = structure.NumAtoms();
	const PeriodicFlags &pbc = structure.GetPeriodicFlags();
	std::vector<vector3> scaled;
	for (int i = 0; i < num_atoms; ++i) {
		vector3 frac = structure.GetFractional(i);
		for (int k = 0; k < 3; ++k) {
			if (pbc[k]) {
				frac[k] -= std::floor(frac[k] + SITE_TOLERANCE);
			}
		}
		scaled.push_back(frac);
	}

	std::vector<bool> assigned(num_atoms, false);
	std::vector<int> real_atoms = structure.GetRealAtomIndices();
	for (std::vector<int>::iterator ai=real_atoms.begin(); ai!=real_atoms.end(); ++ai) {
		if (assigned[*ai]) { continue; }

		EquivalenceClass members;
		members.push_back(*ai);  // always in its own class, even if no image matches it
		assigned[*ai] = true;

		std::vector<vector3> images = sites.EquivalentSites(scaled[*ai]);
		for (std::vector<vector3>::iterator site=images.begin(); site!=images.end(); ++site) {
			int direct_idx = -1;
			int folded_idx = -1;
			double direct_min = 0.0;
			double folded_min = 0.0;
			for (int j = 0; j < num_atoms; ++j) {
				double norm = (scaled[j] - *site).length();
				double folded = std::fabs(norm - 1.0);
				if (direct_idx < 0 || norm < direct_min) {
					direct_min = norm;
					direct_idx = j;
				}
				if (folded_idx < 0 || folded < folded_min) {
					folded_min = folded;
					folded_idx = j;
				}
			}

			int matches[2] = {-1, -1};
			if (direct_idx >= 0 && direct_min < SITE_TOLERANCE) { matches[0] = direct_idx; }
			if (folded_idx >= 0 && folded_min < SITE_TOLERANCE) { matches[1] = folded_idx; }
			for (int m = 0; m < 2; ++m) {
				int idx = matches[m];
				if (idx < 0 || structure.IsConnector(idx) || assigned[idx]) { continue; }
				members.push_back(idx);
				assigned[idx] = true;
			}
		}
		equivalent_sites.push_back(members);
	}
}

const EquivalenceClass* Topology::FindEquivalenceClass(int idx) const {
	for (std::vector<EquivalenceClass>::const_iterator it=equivalent_sites.begin(); it!=equivalent_sites.end(); ++it) {
		if (std::find(it->begin(), it->end(), idx) != it->end()) {
			return &(*it);
		}
	}
	return NULL;
}

Shape Topology::GetShape(int idx) const {
	ShapeMap::const_iterator it = shapes.find(idx);
	if (it == shapes.end()) {
		return Shape();
	}
	return it->second;
}

std::string Topology::GetPointGroup(int idx) const {
	PointGroupMap::const_iterator it = pointgroups.find(idx);
	if (it == pointgroups.end()) {
		return "";
	}
	return it->second;
}

std::set<Shape> Topology::GetUniqueShapes() const {
	std::set<Shape> unique;
	for (ShapeMap::const_iterator it=shapes.begin(); it!=shapes.end(); ++it) {
		unique.insert(it->second);
	}
	return unique;
}

std::set<std::string> Topology::GetUniquePointGroups() const {
	std::set<std::string> unique;
	for (PointGroupMap::const_iterator it=pointgroups.begin(); it!=pointgroups.end(); ++it) {
		unique.insert(it->second);
	}
	return unique;
}

OBMol Topology::GetFragments() const {
	// All fragments in one periodic molecule sharing the net's unit cell.
	// Each point is labelled X<owner index> so the owning node survives a CIF export.
	OBMol mol;
	OBUnitCell *lattice = structure.GetLattice();
	if (lattice) {
		mol.SetData(lattice->Clone(NULL));
		mol.SetPeriodicMol();
	}
	mol.SetTitle(name);
	mol.BeginModify();
	for (FragmentMap::const_iterator it=fragments.begin(); it!=fragments.end(); ++it) {
		const std::vector<vector3> &positions = it->second.GetPositions();
		std::stringstream label;
		label << "X" << it->first;
		for (std::vector<vector3>::const_iterator pos=positions.begin(); pos!=positions.end(); ++pos) {
			OBAtom *atom = formAtom(&mol, *pos, CONNECTOR_ELEMENT);
			OBPairData *site_label = new OBPairData;
			site_label->SetAttribute("_atom_site_label");
			site_label->SetValue(label.str());
			atom->SetData(site_label);
		}
	}
	mol.EndModify();
	return mol;
}

std::vector<Shape> Topology::GetCompatibleSlots(const SymmetrySignature &sbu, bool coercion) const {
	std::vector<Shape> slots;
	std::set<int> seen;
	for (FragmentMap::const_iterator it=fragments.begin(); it!=fragments.end(); ++it) {
		int idx = it->first;
		if (seen.count(idx)) { continue; }

		Shape shape = GetShape(idx);
		int multiplicity = shape.empty() ? 0 : shape.back();

		// Only members with the same multiplicity are interchangeable slots
		EquivalenceClass comparable;
		const EquivalenceClass *eq_sites = FindEquivalenceClass(idx);
		if (eq_sites) {
			for (EquivalenceClass::const_iterator s=eq_sites->begin(); s!=eq_sites->end(); ++s) {
				Shape other = GetShape(*s);
				if (!other.empty() && other.back() == multiplicity) {
					comparable.push_back(*s);
				}
			}
		}
		if (std::find(comparable.begin(), comparable.end(), idx) == comparable.end()) {
			comparable.push_back(idx);
		}
		seen.insert(comparable.begin(), comparable.end());

		if (sbu.GetMultiplicity() != multiplicity) {
			continue;
		}
		bool accepted = false;
		if (sbu.pointgroup == GetPointGroup(idx)) {
			accepted = true;  // point groups are the strongest identifiers
		} else if (shapeDominates(sbu.shape, shape)) {
			accepted = true;  // at least as many symmetry elements of every kind
		} else if (coercion) {
			accepted = true;  // multiplicity alone
		}
		if (accepted) {
			for (EquivalenceClass::iterator s=comparable.begin(); s!=comparable.end(); ++s) {
				slots.push_back(GetShape(*s));
			}
		}
	}
	return slots;
}

} // end namespace NetTopo
