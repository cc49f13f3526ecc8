#include "fragment.h"
#include "obdetails.h"
#include "structure.h"

#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/atom.h>


namespace NetTopo
{

using namespace OpenBabel;

void Fragment::AddPoint(const vector3 &pos, int tag, int source, const int3 &image) {
	positions.push_back(pos);
	tags.push_back(tag);
	sources.push_back(source);
	images.push_back(image);
}

vector3 Fragment::GetCentroid() const {
	vector3 center(0.0, 0.0, 0.0);
	if (positions.empty()) {
		return center;
	}
	for (std::vector<vector3>::const_iterator it=positions.begin(); it!=positions.end(); ++it) {
		center += *it;
	}
	return center / static_cast<double>(positions.size());
}

OBMol Fragment::ToOBMol() const {
	OBMol mol;
	mol.BeginModify();
	for (std::size_t i = 0; i < positions.size(); ++i) {
		formAtom(&mol, positions[i], CONNECTOR_ELEMENT);
	}
	mol.EndModify();
	return mol;
}

} // end namespace NetTopo
