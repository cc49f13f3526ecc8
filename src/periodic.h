/**********************************************************************
periodic.h - Minimum image and lattice image utilities for periodic nets
***********************************************************************/

#ifndef PERIODIC_H
#define PERIODIC_H

#include <openbabel/babelconfig.h>
#include <openbabel/math/vector3.h>

#include <vector>

namespace OpenBabel
{
// forward declarations
class OBMol;
class OBUnitCell;
}

namespace NetTopo
{

using OpenBabel::vector3;
using OpenBabel::OBUnitCell;


class int3 {
// Integer lattice translation, i.e. which periodic image of the unit cell
public:
	int x;
	int y;
	int z;

	int3() {
		x=0; y=0; z=0;
	}
	int3(int a, int b, int c) {
		x=a; y=b; z=c;
	}
	bool operator== ( const int3 &other ) const {
		return ((x == other.x) && (y == other.y) && (z==other.z));
	}
	bool operator!= ( const int3 &other ) const {
		return !(*this == other);
	}
	bool operator< ( const int3 &other ) const {
		if (x != other.x) { return x < other.x; }
		if (y != other.y) { return y < other.y; }
		return z < other.z;
	}
	int operator[] ( unsigned int i ) const {
		if (i == 0) { return x; }
		if (i == 1) { return y; }
		return z;  // otherwise
	}
	// Assignment through brackets needs a reference
	int& operator[] ( unsigned int i ) {
		if (i == 0) { return x; }
		if (i == 1) { return y; }
		return z;  // otherwise
	}
	bool IsZero() const {
		return (x == 0 && y == 0 && z == 0);
	}
};


// Periodicity along the a, b and c lattice vectors
struct PeriodicFlags {
	bool axis[3];

	PeriodicFlags(bool a = true, bool b = true, bool c = true) {
		axis[0] = a; axis[1] = b; axis[2] = c;
	}
	bool operator[] (unsigned int i) const { return axis[i]; }
	bool Any() const { return axis[0] || axis[1] || axis[2]; }
};


OBUnitCell* getPeriodicLattice(OpenBabel::OBMol *mol);
vector3 latticeTranslation(const OBUnitCell *lattice, const int3 &image);
vector3 minimumImageVector(const OBUnitCell *lattice, const vector3 &from, const vector3 &to, const PeriodicFlags &pbc);
double minimumImageDistance(const OBUnitCell *lattice, const vector3 &from, const vector3 &to, const PeriodicFlags &pbc);
int3 imageSearchRange(const OBUnitCell *lattice, double radius, const PeriodicFlags &pbc);
std::vector<int3> latticeImages(const int3 &range);

} // end namespace NetTopo

#endif // PERIODIC_H

//! \file periodic.h
//! \brief periodic.h - Minimum image and lattice image utilities for periodic nets
