/**********************************************************************
neighbor_list.h - Periodic neighbor search with per-atom radii
***********************************************************************/

#ifndef NEIGHBOR_LIST_H
#define NEIGHBOR_LIST_H

#include <vector>

#include "periodic.h"

namespace NetTopo
{
// forward declarations
class PeriodicStructure;


struct Neighbor {
	int index;     // atom index in the PeriodicStructure
	int3 offset;   // periodic image of the neighbor, relative to the stored position
};


class PeriodicNeighborList {
// Bidirectional neighbor list over every periodic image along the periodic axes.
// Atoms i and j are neighbors when their distance is below cutoffs[i] + cutoffs[j],
// so each cutoff acts as a radius.  An atom is never its own neighbor in the
// home cell, and no skin is added on top of the radii.
private:
	std::vector< std::vector<Neighbor> > neighbors;
public:
	PeriodicNeighborList() {};
	PeriodicNeighborList(const PeriodicStructure &structure, const std::vector<double> &cutoffs);
	void Update(const PeriodicStructure &structure, const std::vector<double> &cutoffs);
	const std::vector<Neighbor>& GetNeighbors(int idx) const;
	int NumAtoms() const { return static_cast<int>(neighbors.size()); }
};

} // end namespace NetTopo
#endif // NEIGHBOR_LIST_H

//! \file neighbor_list.h
//! \brief neighbor_list.h - Periodic neighbor search with per-atom radii
