#include <sstream>
#include <string>
#include <vector>

#include "obdetails.h"

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/mol.h>
#include <openbabel/atom.h>
#include <openbabel/generic.h>
#include <openbabel/elements.h>
#include <openbabel/obconversion.h>


namespace NetTopo
{

using namespace OpenBabel;

OBAtom* formAtom(OBMol *mol, vector3 loc, int element) {
	// Makes a new atom with a specified location and atomic number
	OBAtom* atom = mol->NewAtom();
	atom->SetVector(loc);
	changeAtomElement(atom, element);
	return atom;
}

void changeAtomElement(OBAtom* atom, int element) {
	// Changes an atom's atomic number.  Element 0 is Open Babel's dummy atom.
	if (atom == NULL) {
		obErrorLog.ThrowError(__FUNCTION__, "Skipping invalid atom", obWarning);
		return;
	}
	atom->SetAtomicNum(element);
	atom->SetType(OBElements::GetName(element));
}

OBUnitCell* formUnitCell(OBMol *mol, const std::vector<double> &cellpar) {
	// Attaches a unit cell from the six parameters a, b, c, alpha, beta, gamma
	// (lengths in angstrom, angles in degrees) and marks the molecule periodic.
	if (cellpar.size() != 6) {
		obErrorLog.ThrowError(__FUNCTION__, "Need exactly six cell parameters", obError);
		return NULL;
	}
	OBUnitCell *uc = new OBUnitCell;
	uc->SetData(cellpar[0], cellpar[1], cellpar[2], cellpar[3], cellpar[4], cellpar[5]);
	uc->SetOrigin(fileformatInput);
	mol->SetData(uc);  // mol takes ownership
	mol->SetPeriodicMol();
	return uc;
}

bool writeCIF(OBMol *molp, const std::string &filepath) {
	// Write a molecule to file
	OBConversion conv;
	if (!conv.SetOutFormat("cif")) {  // mmcif has extra, incompatible fields
		obErrorLog.ThrowError(__FUNCTION__, "Open Babel CIF format is not available", obError);
		return false;
	}
	return conv.WriteFile(molp, filepath);
}

std::string rtrimWhiteSpace(const std::string str) {
	// Right-trims white space from a string, per obconversion.cpp and consensus from SO
	std::string trimmed(str);
	std::string::size_type notwhite = trimmed.find_last_not_of(" \t\n\r");
	trimmed.erase(notwhite+1);
	return trimmed;
}

std::vector<std::string> splitWhiteSpace(const std::string &line) {
	std::vector<std::string> tokens;
	std::istringstream iss(line);
	std::string token;
	while (iss >> token) {
		tokens.push_back(token);
	}
	return tokens;
}

} // end namespace NetTopo
