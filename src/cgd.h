/**********************************************************************
cgd.h - Reader for Systre CGD net descriptions (RCSR format)
***********************************************************************/

#ifndef CGD_H
#define CGD_H

#include <iosfwd>
#include <map>
#include <string>

#include "structure.h"

namespace NetTopo
{

// Height of the padding cell for 2D nets, along c
const double DEFAULT_2D_HEIGHT = 10.0;
// Atomic number standing in for EDGE_CENTER points (two-coordinated nodes)
const int EDGE_CENTER_ELEMENT = 2;
// Connectors are placed this far from the edge centre, as a fraction of the half edge
const double EDGE_CONNECTOR_SCALE = 0.5;

// Each CRYSTAL ... END record becomes a PeriodicStructure keyed by its NAME, with the
// basis expanded by the space group.  Nodes get their coordination as atomic number
// and each EDGE contributes two connectors.  Records that cannot be read are skipped
// and counted in *num_errors (if given).
std::map<std::string, PeriodicStructure> readCGD(const std::string &filepath, int *num_errors = NULL);
std::map<std::string, PeriodicStructure> readCGDStream(std::istream &input, int *num_errors = NULL);

} // end namespace NetTopo
#endif // CGD_H

//! \file cgd.h
//! \brief cgd.h - Reader for Systre CGD net descriptions (RCSR format)
