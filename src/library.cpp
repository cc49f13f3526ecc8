#include "library.h"
#include "cgd.h"
#include "errors.h"
#include "topology.h"

#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>


namespace NetTopo
{

using namespace OpenBabel;

TopologyLibrary::TopologyLibrary(const SymmetryClassifier *symmetry) : classifier(symmetry), num_failed(0) {
}

int TopologyLibrary::ReadCGD(const std::string &filepath) {
	obErrorLog.ThrowError(__FUNCTION__, "Loading the nets from " + filepath, obInfo);
	int read_errors = 0;
	std::map<std::string, PeriodicStructure> nets = readCGD(filepath, &read_errors);
	return AddAll(nets, read_errors, filepath);
}

int TopologyLibrary::ReadCGDStream(std::istream &input) {
	obErrorLog.ThrowError(__FUNCTION__, "Loading the nets from stream", obInfo);
	int read_errors = 0;
	std::map<std::string, PeriodicStructure> nets = readCGDStream(input, &read_errors);
	return AddAll(nets, read_errors, "stream");
}

int TopologyLibrary::AddAll(const std::map<std::string, PeriodicStructure> &nets, int read_errors, const std::string &source) {
	num_failed += read_errors;
	int added = 0;
	for (std::map<std::string, PeriodicStructure>::const_iterator it=nets.begin(); it!=nets.end(); ++it) {
		if (Add(it->first, it->second)) {
			++added;
		}
	}
	std::stringstream msg;
	msg << added << " topologies saved from " << source;
	obErrorLog.ThrowError(__FUNCTION__, msg.str(), obInfo);
	return added;
}

bool TopologyLibrary::Add(const std::string &name, const PeriodicStructure &net) {
	try {
		Topology topology(name, net, true, classifier);
		topologies.erase(name);
		topologies.insert(std::make_pair(name, topology));
	} catch (const TopologyError &e) {
		++num_failed;
		obErrorLog.ThrowError(__FUNCTION__, "Skipping net " + name + ": " + e.what(), obWarning);
		return false;
	}
	return true;
}

bool TopologyLibrary::Has(const std::string &name) const {
	return topologies.find(name) != topologies.end();
}

const Topology& TopologyLibrary::Get(const std::string &name) const {
	std::map<std::string, Topology>::const_iterator it = topologies.find(name);
	if (it == topologies.end()) {
		throw std::out_of_range("No topology named " + name);
	}
	return it->second;
}

std::vector<std::string> TopologyLibrary::GetNames() const {
	std::vector<std::string> names;
	for (std::map<std::string, Topology>::const_iterator it=topologies.begin(); it!=topologies.end(); ++it) {
		names.push_back(it->first);
	}
	return names;
}

std::vector<std::string> TopologyLibrary::ListCompatible(const std::vector<SymmetrySignature> &sbus, bool full, bool coercion) const {
	std::vector<std::string> compatible;
	for (std::map<std::string, Topology>::const_iterator it=topologies.begin(); it!=topologies.end(); ++it) {
		std::set<Shape> covered;
		for (std::vector<SymmetrySignature>::const_iterator sbu=sbus.begin(); sbu!=sbus.end(); ++sbu) {
			std::vector<Shape> slots = it->second.GetCompatibleSlots(*sbu, coercion);
			covered.insert(slots.begin(), slots.end());
		}
		if (covered.empty()) { continue; }

		bool fits = true;
		if (full) {
			std::set<Shape> needed = it->second.GetUniqueShapes();
			for (std::set<Shape>::iterator shape=needed.begin(); shape!=needed.end(); ++shape) {
				if (covered.find(*shape) == covered.end()) {
					fits = false;
					break;
				}
			}
		}
		if (fits) {
			compatible.push_back(it->first);
		}
	}
	return compatible;
}

} // end namespace NetTopo
