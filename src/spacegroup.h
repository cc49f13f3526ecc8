/**********************************************************************
spacegroup.h - Equivalent site lookup for crystallographic space groups
***********************************************************************/

#ifndef SPACEGROUP_H
#define SPACEGROUP_H

#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/math/vector3.h>

namespace OpenBabel
{
// forward declarations
class SpaceGroup;
}

namespace NetTopo
{

using OpenBabel::vector3;


class SpaceGroupSites {
// Capability needed from a space group: all positions equivalent to a
// fractional position, itself included.
public:
	virtual ~SpaceGroupSites() {};
	virtual std::vector<vector3> EquivalentSites(const vector3 &frac) const = 0;
};


class OBSpaceGroupSites : public SpaceGroupSites {
// Adapter over Open Babel's SpaceGroup tables.  Does not own the SpaceGroup,
// which lives in Open Babel's static registry.
private:
	const OpenBabel::SpaceGroup *group;
public:
	explicit OBSpaceGroupSites(const OpenBabel::SpaceGroup *sg);
	virtual ~OBSpaceGroupSites() {};
	virtual std::vector<vector3> EquivalentSites(const vector3 &frac) const;
	const OpenBabel::SpaceGroup* GetSpaceGroup() const { return group; }
};


// Resolves a Hermann-Mauguin symbol or an International Tables number.
// A setting other than 1 is tried first as "symbol:setting", then the plain symbol.
// Throws UnsupportedSpaceGroupError if Open Babel does not know the group.
const OpenBabel::SpaceGroup* resolveSpaceGroup(const std::string &symbol, int setting = 1);

} // end namespace NetTopo
#endif // SPACEGROUP_H

//! \file spacegroup.h
//! \brief spacegroup.h - Equivalent site lookup for crystallographic space groups
