#include "spacegroup.h"
#include "errors.h"

#include <cstdlib>
#include <list>
#include <sstream>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/math/spacegroup.h>


namespace NetTopo
{

using namespace OpenBabel;

OBSpaceGroupSites::OBSpaceGroupSites(const SpaceGroup *sg) : group(sg) {
	if (!group) {
		obErrorLog.ThrowError(__FUNCTION__, "No space group available for equivalent site lookup", obError);
		throw UnsupportedSpaceGroupError("Cannot look up equivalent sites without a space group");
	}
}

std::vector<vector3> OBSpaceGroupSites::EquivalentSites(const vector3 &frac) const {
	// SpaceGroup::Transform wraps the images into [0,1) and drops duplicates
	std::list<vector3> images = group->Transform(frac);
	return std::vector<vector3>(images.begin(), images.end());
}

const SpaceGroup* resolveSpaceGroup(const std::string &symbol, int setting) {
	const SpaceGroup *sg = NULL;
	if (setting != 1) {
		std::stringstream with_setting;
		with_setting << symbol << ":" << setting;
		sg = SpaceGroup::GetSpaceGroup(with_setting.str());
	}
	if (!sg) {
		sg = SpaceGroup::GetSpaceGroup(symbol);
	}
	if (!sg) {
		// Numeric ids, e.g. "225"
		char *end = NULL;
		long id = std::strtol(symbol.c_str(), &end, 10);
		if (!symbol.empty() && *end == '\0' && id >= 1 && id <= 230) {
			sg = SpaceGroup::GetSpaceGroup(static_cast<unsigned>(id));
		}
	}
	if (!sg) {
		std::string msg = "Unknown space group: " + symbol;
		obErrorLog.ThrowError(__FUNCTION__, msg, obError);
		throw UnsupportedSpaceGroupError(msg);
	}
	return sg;
}

} // end namespace NetTopo
