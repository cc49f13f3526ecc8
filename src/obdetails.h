/**********************************************************************
obdetails.h - Convenience functions to simplify use of Open Babel
***********************************************************************/

#ifndef OB_DETAILS_H
#define OB_DETAILS_H

#include <openbabel/babelconfig.h>
#include <string>
#include <vector>

namespace OpenBabel
{
// forward declarations
class OBAtom;
class OBMol;
class OBUnitCell;
class vector3;
}

namespace NetTopo
{

OpenBabel::OBAtom* formAtom(OpenBabel::OBMol *mol, OpenBabel::vector3 loc, int element);
void changeAtomElement(OpenBabel::OBAtom* atom, int element);
OpenBabel::OBUnitCell* formUnitCell(OpenBabel::OBMol *mol, const std::vector<double> &cellpar);
bool writeCIF(OpenBabel::OBMol *molp, const std::string &filepath);
std::string rtrimWhiteSpace(const std::string str);
std::vector<std::string> splitWhiteSpace(const std::string &line);

} // end namespace NetTopo

#endif // OB_DETAILS_H

//! \file obdetails.h
//! \brief Convenience functions to simplify use of Open Babel
