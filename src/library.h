/**********************************************************************
library.h - Collection of analyzed nets, searchable by building block
***********************************************************************/

#ifndef LIBRARY_H
#define LIBRARY_H

#include <iosfwd>
#include <map>
#include <string>
#include <vector>

#include "structure.h"
#include "symmetry.h"
#include "topology.h"

namespace NetTopo
{

class TopologyLibrary {
// Nets keyed by name.  Nets that fail analysis are logged, counted and left out,
// so one malformed record does not stop a whole database from loading.
private:
	std::map<std::string, Topology> topologies;
	const SymmetryClassifier *classifier;  // not owned, NULL selects the default
	int num_failed;

	int AddAll(const std::map<std::string, PeriodicStructure> &nets, int read_errors, const std::string &source);

public:
	explicit TopologyLibrary(const SymmetryClassifier *symmetry = NULL);

	// Later files override nets of the same name.  Return the number of nets added.
	int ReadCGD(const std::string &filepath);
	int ReadCGDStream(std::istream &input);
	bool Add(const std::string &name, const PeriodicStructure &net);

	bool Has(const std::string &name) const;
	const Topology& Get(const std::string &name) const;  // throws std::out_of_range
	std::vector<std::string> GetNames() const;
	int Size() const { return static_cast<int>(topologies.size()); }
	int NumFailed() const { return num_failed; }

	// Names of nets where the building blocks fit at least one slot (full=false)
	// or cover every distinct slot shape of the net (full=true)
	std::vector<std::string> ListCompatible(const std::vector<SymmetrySignature> &sbus, bool full = true, bool coercion = false) const;
};

} // end namespace NetTopo
#endif // LIBRARY_H

//! \file library.h
//! \brief library.h - Collection of analyzed nets, searchable by building block
