/**********************************************************************
fragment.h - Connector clusters cut out of a periodic net
***********************************************************************/

#ifndef FRAGMENT_H
#define FRAGMENT_H

#include <map>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>

#include "periodic.h"

namespace NetTopo
{

using OpenBabel::OBMol;

class Fragment {
// The connection points around one real atom (the owner) of a net, in absolute
// Cartesian coordinates: periodic images are already unwrapped, so the points
// form a finite cluster.  Built once during Topology analysis and not modified afterwards.
private:
	int owner;
	std::vector<vector3> positions;
	std::vector<int> tags;
	std::vector<int> sources;  // connector indices in the parent structure
	std::vector<int3> images;  // periodic image of each source connector

public:
	Fragment(int owner_idx = -1) : owner(owner_idx) {};
	void AddPoint(const vector3 &pos, int tag, int source = -1, const int3 &image = int3());

	int GetOwner() const { return owner; }
	int NumPoints() const { return static_cast<int>(positions.size()); }
	bool Empty() const { return positions.empty(); }
	const std::vector<vector3>& GetPositions() const { return positions; }
	const std::vector<int>& GetTags() const { return tags; }
	const std::vector<int>& GetSources() const { return sources; }
	const std::vector<int3>& GetImages() const { return images; }
	vector3 GetCentroid() const;

	// Cluster of connector (atomic number 0) atoms, without a unit cell
	OBMol ToOBMol() const;
};

typedef std::map<int, Fragment> FragmentMap;

} // end namespace NetTopo
#endif // FRAGMENT_H

//! \file fragment.h
//! \brief fragment.h - Connector clusters cut out of a periodic net
