#include "periodic.h"

#include <cmath>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/generic.h>


namespace NetTopo
{

using namespace OpenBabel;

OBUnitCell* getPeriodicLattice(OBMol *mol) {
	return (OBUnitCell*)mol->GetData(OBGenericDataType::UnitCell);
}

vector3 latticeTranslation(const OBUnitCell *lattice, const int3 &image) {
	// Cartesian shift of the periodic image, i.e. image . cell_matrix
	if (image.IsZero()) {
		return vector3(0.0, 0.0, 0.0);
	}
	std::vector<vector3> cell = lattice->GetCellVectors();
	return image.x * cell[0] + image.y * cell[1] + image.z * cell[2];
}

vector3 minimumImageVector(const OBUnitCell *lattice, const vector3 &from, const vector3 &to, const PeriodicFlags &pbc) {
	// Shortest vector from -> to over the periodic images along the periodic axes.
	// Rounding the fractional difference is not enough for skewed cells, so
	// the neighboring images of the rounded guess are scanned as well.
	vector3 frac = lattice->CartesianToFractional(to - from);
	for (int i = 0; i < 3; ++i) {
		if (pbc[i]) {
			frac[i] -= std::floor(frac[i] + 0.5);
		}
	}
	vector3 best = lattice->FractionalToCartesian(frac);
	double best_length = best.length_2();

	int3 range(pbc[0] ? 1 : 0, pbc[1] ? 1 : 0, pbc[2] ? 1 : 0);
	std::vector<int3> images = latticeImages(range);
	for (std::vector<int3>::iterator it=images.begin(); it!=images.end(); ++it) {
		vector3 trial = lattice->FractionalToCartesian(frac + vector3(it->x, it->y, it->z));
		if (trial.length_2() < best_length) {
			best = trial;
			best_length = trial.length_2();
		}
	}
	return best;
}

double minimumImageDistance(const OBUnitCell *lattice, const vector3 &from, const vector3 &to, const PeriodicFlags &pbc) {
	return minimumImageVector(lattice, from, to, pbc).length();
}

int3 imageSearchRange(const OBUnitCell *lattice, double radius, const PeriodicFlags &pbc) {
	// How many cells to scan along each axis so that every point within radius
	// is covered.  Uses the distance between opposite cell faces, plus one
	// extra cell for coordinates that are not wrapped into [0,1).
	std::vector<vector3> cell = lattice->GetCellVectors();
	double volume = std::fabs(dot(cell[0], cross(cell[1], cell[2])));
	int3 range;
	for (int i = 0; i < 3; ++i) {
		if (!pbc[i]) { continue; }
		double face_area = cross(cell[(i+1)%3], cell[(i+2)%3]).length();
		double height = volume / face_area;
		range[i] = static_cast<int>(std::ceil(radius / height)) + 1;
	}
	return range;
}

std::vector<int3> latticeImages(const int3 &range) {
	// All translations in [-range, range] along each axis, the home cell first
	std::vector<int3> images;
	images.push_back(int3(0, 0, 0));
	for (int i = -range.x; i <= range.x; ++i) {
		for (int j = -range.y; j <= range.y; ++j) {
			for (int k = -range.z; k <= range.z; ++k) {
				if (i == 0 && j == 0 && k == 0) { continue; }
				images.push_back(int3(i, j, k));
			}
		}
	}
	return images;
}

} // end namespace NetTopo
