#include "neighbor_list.h"
#include "structure.h"
#include "periodic.h"

#include <algorithm>
#include <sstream>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/generic.h>


namespace NetTopo
{

using namespace OpenBabel;

PeriodicNeighborList::PeriodicNeighborList(const PeriodicStructure &structure, const std::vector<double> &cutoffs) {
	Update(structure, cutoffs);
}

void PeriodicNeighborList::Update(const PeriodicStructure &structure, const std::vector<double> &cutoffs) {
	// Brute force over all pairs and images.  Nets have at most a few hundred
	// atoms per cell, so a cell list is not worth its bookkeeping here.
	int num_atoms = structure.NumAtoms();
	neighbors.assign(num_atoms, std::vector<Neighbor>());
	if (num_atoms == 0) {
		return;
	}

	OBUnitCell *lattice = structure.GetLattice();
	std::vector<int3> images;
	if (lattice) {
		double max_cutoff = *std::max_element(cutoffs.begin(), cutoffs.end());
		images = latticeImages(imageSearchRange(lattice, 2.0 * max_cutoff, structure.GetPeriodicFlags()));
	} else {
		images.push_back(int3(0, 0, 0));
	}
	std::vector<vector3> shifts;
	for (std::vector<int3>::iterator it=images.begin(); it!=images.end(); ++it) {
		shifts.push_back(lattice ? latticeTranslation(lattice, *it) : vector3(0.0, 0.0, 0.0));
	}

	for (int i = 0; i < num_atoms; ++i) {
		vector3 origin = structure.GetPosition(i);
		for (int j = 0; j < num_atoms; ++j) {
			vector3 target = structure.GetPosition(j);
			double range = cutoffs[i] + cutoffs[j];
			for (std::size_t img = 0; img < images.size(); ++img) {
				if (i == j && images[img].IsZero()) { continue; }  // no self interaction
				double dist = (target + shifts[img] - origin).length();
				if (dist < range) {
					Neighbor nbor;
					nbor.index = j;
					nbor.offset = images[img];
					neighbors[i].push_back(nbor);
				}
			}
		}
	}

	std::stringstream msg;
	msg << "Built neighbor list over " << num_atoms << " atoms and " << images.size() << " periodic images";
	obErrorLog.ThrowError(__FUNCTION__, msg.str(), obDebug);
}

const std::vector<Neighbor>& PeriodicNeighborList::GetNeighbors(int idx) const {
	return neighbors[idx];
}

} // end namespace NetTopo
