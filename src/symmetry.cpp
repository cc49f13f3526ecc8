#include "symmetry.h"
#include "fragment.h"
#include "obdetails.h"
#include "structure.h"

#include <cmath>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/pointgroup.h>
#include <openbabel/math/vector3.h>
#include <openbabel/math/matrix3x3.h>


namespace NetTopo
{

using namespace OpenBabel;

namespace
{

const double PARALLEL_TOLERANCE = 1.0e-2;  // |sin| between unit vectors treated as the same direction

bool addDirection(std::vector<vector3> &directions, vector3 candidate, double min_length) {
	// Adds a unit vector unless it is (anti)parallel to one already present
	if (candidate.length() < min_length) {
		return false;
	}
	candidate.normalize();
	for (std::vector<vector3>::iterator it=directions.begin(); it!=directions.end(); ++it) {
		if (cross(*it, candidate).length() < PARALLEL_TOLERANCE) {
			return false;
		}
	}
	directions.push_back(candidate);
	return true;
}

bool isSymmetryImage(const std::vector<vector3> &points, const std::vector<vector3> &images, double tol) {
	// Does every transformed point land on one of the original points?
	for (std::vector<vector3>::const_iterator img=images.begin(); img!=images.end(); ++img) {
		bool found = false;
		for (std::vector<vector3>::const_iterator p=points.begin(); p!=points.end(); ++p) {
			if ((*img - *p).length() < tol) {
				found = true;
				break;
			}
		}
		if (!found) {
			return false;
		}
	}
	return true;
}

bool isRotationAxis(const std::vector<vector3> &points, const vector3 &axis, int order, double tol) {
	matrix3x3 rot;
	rot.RotAboutAxisByAngle(axis, 360.0 / order);
	std::vector<vector3> images;
	for (std::vector<vector3>::const_iterator p=points.begin(); p!=points.end(); ++p) {
		images.push_back(rot * (*p));
	}
	return isSymmetryImage(points, images, tol);
}

bool isMirrorPlane(const std::vector<vector3> &points, const vector3 &normal, double tol) {
	std::vector<vector3> images;
	for (std::vector<vector3>::const_iterator p=points.begin(); p!=points.end(); ++p) {
		images.push_back(*p - 2.0 * dot(*p, normal) * normal);
	}
	return isSymmetryImage(points, images, tol);
}

bool hasInversionCenter(const std::vector<vector3> &points, double tol) {
	std::vector<vector3> images;
	for (std::vector<vector3>::const_iterator p=points.begin(); p!=points.end(); ++p) {
		images.push_back(-1.0 * (*p));
	}
	return isSymmetryImage(points, images, tol);
}

} // end anonymous namespace


std::vector<vector3> normalizeCluster(const std::vector<vector3> &raw_points) {
	// Centres the cluster on its centroid and scales it to a mean radius of one,
	// so that tolerances are relative to the size of the fragment
	std::vector<vector3> points;
	if (raw_points.empty()) {
		return points;
	}
	vector3 centroid(0.0, 0.0, 0.0);
	for (std::vector<vector3>::const_iterator it=raw_points.begin(); it!=raw_points.end(); ++it) {
		centroid += *it;
	}
	centroid /= static_cast<double>(raw_points.size());
	double mean_radius = 0.0;
	for (std::vector<vector3>::const_iterator it=raw_points.begin(); it!=raw_points.end(); ++it) {
		points.push_back(*it - centroid);
		mean_radius += points.back().length();
	}
	mean_radius /= static_cast<double>(points.size());
	if (mean_radius > 0.0) {
		for (std::vector<vector3>::iterator it=points.begin(); it!=points.end(); ++it) {
			*it /= mean_radius;
		}
	}
	return points;
}

Shape countSymmetryElements(const std::vector<vector3> &raw_points, int max_order, double tol) {
	// Counts the symmetry elements of a finite point cluster about its centroid.
	// An n-fold axis is counted for every order m <= max_order that divides n,
	// since C_n contains C_m in that case.
	int multiplicity = static_cast<int>(raw_points.size());
	int num_orders = (max_order >= 2) ? (max_order - 1) : 0;
	Shape shape(num_orders + 3, 0);
	shape.back() = multiplicity;
	if (raw_points.empty()) {
		return shape;
	}
	std::vector<vector3> points = normalizeCluster(raw_points);

	// Candidate rotation axes: through points, pair and triplet centroids, and pair plane normals
	std::vector<vector3> axes;
	for (std::size_t i = 0; i < points.size(); ++i) {
		addDirection(axes, points[i], tol);
		for (std::size_t j = i + 1; j < points.size(); ++j) {
			addDirection(axes, points[i] + points[j], tol);
			addDirection(axes, cross(points[i], points[j]), tol * tol);
			for (std::size_t k = j + 1; k < points.size(); ++k) {
				addDirection(axes, points[i] + points[j] + points[k], tol);
			}
		}
	}
	if (axes.size() == 1) {
		// Linear cluster: add two perpendicular directions, standing in for the
		// infinite family of perpendicular axes and planes
		vector3 line = axes[0];
		vector3 helper = (std::fabs(line.x()) < 0.9) ? vector3(1.0, 0.0, 0.0) : vector3(0.0, 1.0, 0.0);
		vector3 perp1 = cross(line, helper);
		addDirection(axes, perp1, 0.0);
		addDirection(axes, cross(line, perp1), 0.0);
	}

	// Candidate mirror normals: the axes, pair bisectors, and planes spanned by an axis and a point
	std::vector<vector3> normals = axes;
	for (std::size_t i = 0; i < points.size(); ++i) {
		for (std::size_t j = i + 1; j < points.size(); ++j) {
			addDirection(normals, points[i] - points[j], tol);
		}
		for (std::size_t a = 0; a < axes.size(); ++a) {
			addDirection(normals, cross(axes[a], points[i]), tol);
		}
	}

	shape[0] = hasInversionCenter(points, tol) ? 1 : 0;
	for (std::vector<vector3>::iterator n=normals.begin(); n!=normals.end(); ++n) {
		if (isMirrorPlane(points, *n, tol)) {
			++shape[1];
		}
	}
	for (int order = 2; order <= max_order; ++order) {
		for (std::vector<vector3>::iterator a=axes.begin(); a!=axes.end(); ++a) {
			if (isRotationAxis(points, *a, order, tol)) {
				++shape[order];
			}
		}
	}
	return shape;
}

SymmetrySignature OBSymmetryClassifier::Classify(const Fragment &fragment, int max_order) const {
	return SymmetrySignature(GetShape(fragment, max_order), GetPointGroup(fragment));
}

Shape OBSymmetryClassifier::GetShape(const Fragment &fragment, int max_order) const {
	return countSymmetryElements(fragment.GetPositions(), max_order, tolerance);
}

std::string OBSymmetryClassifier::GetPointGroup(const Fragment &fragment) const {
	std::vector<vector3> points = normalizeCluster(fragment.GetPositions());
	OBMol mol;
	mol.BeginModify();
	for (std::vector<vector3>::iterator it=points.begin(); it!=points.end(); ++it) {
		formAtom(&mol, *it, CONNECTOR_ELEMENT);
	}
	mol.EndModify();
	OBPointGroup pg;
	pg.Setup(&mol);
	const char *symbol = pg.IdentifyPointGroup(tolerance);
	return std::string(symbol ? symbol : "");
}

bool shapeDominates(const Shape &sbu, const Shape &slot) {
	// Does the building block have at least as many symmetry elements of each
	// kind as the slot?  The trailing multiplicity is not compared here.
	if (sbu.size() != slot.size() || sbu.empty()) {
		return false;
	}
	for (std::size_t i = 0; i + 1 < sbu.size(); ++i) {
		if (sbu[i] < slot[i]) {
			return false;
		}
	}
	return true;
}

std::string shapeToString(const Shape &shape) {
	std::stringstream ss;
	ss << "(";
	for (std::size_t i = 0; i < shape.size(); ++i) {
		if (i) { ss << ", "; }
		ss << shape[i];
	}
	ss << ")";
	return ss.str();
}

bool parseShape(const std::string &text, Shape *shape) {
	// Reads comma separated counts, e.g. "1,5,5,0,1,4".  Leaves *shape untouched on failure.
	Shape parsed;
	std::stringstream ss(text);
	std::string item;
	while (std::getline(ss, item, ',')) {
		char *end = NULL;
		long value = std::strtol(item.c_str(), &end, 10);
		if (item.empty() || end == item.c_str() || *end != '\0' || value < 0) {
			return false;
		}
		parsed.push_back(static_cast<int>(value));
	}
	if (parsed.empty()) {
		return false;
	}
	*shape = parsed;
	return true;
}

} // end namespace NetTopo
