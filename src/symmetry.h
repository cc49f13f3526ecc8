/**********************************************************************
symmetry.h - Shape and point group signatures of connector clusters
***********************************************************************/

#ifndef SYMMETRY_H
#define SYMMETRY_H

#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/math/vector3.h>

namespace NetTopo
{
// forward declarations
class Fragment;

using OpenBabel::vector3;

// Counts of symmetry elements, ending in the number of connection points:
// [inversion centre, mirror planes, C2 axes, C3 axes, ..., C<max_order> axes, multiplicity]
typedef std::vector<int> Shape;

// Relative to the mean radius of a fragment, used for shapes and point groups alike
const double DEFAULT_SYMMETRY_TOLERANCE = 0.1;


struct SymmetrySignature {
// What a building block (or a slot of a net) looks like to the slot matcher
	Shape shape;
	std::string pointgroup;  // Schoenflies symbol, only compared for equality

	SymmetrySignature() {};
	SymmetrySignature(const Shape &s, const std::string &pg) : shape(s), pointgroup(pg) {};
	int GetMultiplicity() const { return shape.empty() ? 0 : shape.back(); }
	bool operator== (const SymmetrySignature &other) const {
		return shape == other.shape && pointgroup == other.pointgroup;
	}
};


class SymmetryClassifier {
// Assigns a shape and point group to a fragment.  Implementations must return
// equal signatures for congruent point sets (up to rotation or reflection).
public:
	virtual ~SymmetryClassifier() {};
	virtual SymmetrySignature Classify(const Fragment &fragment, int max_order) const = 0;
};


class OBSymmetryClassifier : public SymmetryClassifier {
// Point groups from Open Babel's OBPointGroup, shapes from testing candidate
// axes and planes through the centroid of the cluster.  Both work on the
// cluster scaled to unit mean radius.
private:
	double tolerance;
public:
	explicit OBSymmetryClassifier(double tol = DEFAULT_SYMMETRY_TOLERANCE) : tolerance(tol) {};
	virtual ~OBSymmetryClassifier() {};
	virtual SymmetrySignature Classify(const Fragment &fragment, int max_order) const;
	Shape GetShape(const Fragment &fragment, int max_order) const;
	std::string GetPointGroup(const Fragment &fragment) const;
	double GetTolerance() const { return tolerance; }
};


std::vector<vector3> normalizeCluster(const std::vector<vector3> &raw_points);
Shape countSymmetryElements(const std::vector<vector3> &points, int max_order, double tol);
bool shapeDominates(const Shape &sbu, const Shape &slot);
std::string shapeToString(const Shape &shape);
bool parseShape(const std::string &text, Shape *shape);

} // end namespace NetTopo
#endif // SYMMETRY_H

//! \file symmetry.h
//! \brief symmetry.h - Shape and point group signatures of connector clusters
