/**********************************************************************
building_block.h - Symmetry signatures of building blocks read from files
***********************************************************************/

#ifndef BUILDING_BLOCK_H
#define BUILDING_BLOCK_H

#include <map>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>

#include "symmetry.h"

namespace NetTopo
{

using OpenBabel::OBMol;

// The dummy (atomic number 0) atoms of a molecule mark where a building block
// connects.  Returns an empty signature if there are none.
SymmetrySignature classifyBuildingBlock(OBMol *mol, const SymmetryClassifier &classifier);

// Read every building block under path, which is either a single chemical file or
// a directory whose files are filtered by extension against formats.  Each frame
// needs a name=<NAME> token in its title; later frames override blocks of the same
// name.  Frames without a name or without dummy atoms and unreadable files are
// skipped and counted in *num_errors (if given).  A NULL classifier selects the
// default OBSymmetryClassifier.
std::map<std::string, SymmetrySignature> readSBU(const std::string &path,
		const std::vector<std::string> &formats = std::vector<std::string>(1, "xyz"),
		const SymmetryClassifier *classifier = NULL, int *num_errors = NULL);

std::string blockNameFromTitle(const std::string &title);

} // end namespace NetTopo
#endif // BUILDING_BLOCK_H

//! \file building_block.h
//! \brief building_block.h - Symmetry signatures of building blocks read from files
