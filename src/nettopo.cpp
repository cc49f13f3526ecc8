// Command line driver: reads a CGD file of nets, decomposes each net into
// symmetry classified slots, and reports the slots or the nets compatible
// with a set of building block signatures.  Results go to stdout, Open Babel
// messages to stderr.

#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>
#include <cstdlib>
#include <sys/stat.h>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/oberror.h>

#include "building_block.h"
#include "library.h"
#include "obdetails.h"
#include "symmetry.h"
#include "topology.h"


using namespace NetTopo;


// Function prototypes
void printUsage();
std::string describeTopology(const Topology &topology);


int main(int argc, char* argv[])
{
	OpenBabel::obErrorLog.SetOutputLevel(OpenBabel::obWarning);

	if (argc < 2) {
		printUsage();
		return(2);
	}
	std::string filename = argv[1];
	std::vector<SymmetrySignature> sbus;
	bool coercion = false;
	bool full = false;
	std::string fragment_dir = "";

	for (int i = 2; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "--coercion") {
			coercion = true;
		} else if (arg == "--full") {
			full = true;
		} else if (arg == "--verbose") {
			OpenBabel::obErrorLog.SetOutputLevel(OpenBabel::obInfo);
		} else if (arg == "--fragments" && i + 1 < argc) {
			fragment_dir = argv[++i];
		} else if (arg == "--sbu" && i + 3 < argc) {
			// --sbu POINTGROUP MULTIPLICITY S0,S1,...
			std::string pg = argv[++i];
			int multiplicity = std::atoi(argv[++i]);
			Shape shape;
			if (!parseShape(argv[++i], &shape) || shape.back() != multiplicity) {
				std::cerr << "Invalid SBU shape.  The last entry must equal the multiplicity." << std::endl;
				return(2);
			}
			sbus.push_back(SymmetrySignature(shape, pg));
		} else if (arg == "--sbu-file" && i + 1 < argc) {
			// a chemical file or directory of building blocks, dummy atoms as connection points
			std::string sbu_path = argv[++i];
			int sbu_errors = 0;
			std::map<std::string, SymmetrySignature> blocks = readSBU(sbu_path, std::vector<std::string>(1, "xyz"), NULL, &sbu_errors);
			if (blocks.empty()) {
				std::cerr << "No building blocks could be read from " << sbu_path << std::endl;
				return(1);
			}
			if (sbu_errors > 0) {
				std::cerr << sbu_errors << " building blocks in " << sbu_path << " were skipped" << std::endl;
			}
			for (std::map<std::string, SymmetrySignature>::iterator it=blocks.begin(); it!=blocks.end(); ++it) {
				sbus.push_back(it->second);
			}
		} else {
			std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
			printUsage();
			return(2);
		}
	}

	TopologyLibrary library;
	library.ReadCGD(filename);
	if (library.Size() == 0) {
		std::cerr << "No nets could be read from " << filename << std::endl;
		return(1);
	}

	if (!fragment_dir.empty()) {
		int created_new_dir = mkdir(fragment_dir.c_str(), 0755);
		if (created_new_dir == 0) {
			std::cerr << "Created a new output directory: " << fragment_dir << std::endl;
		}
	}

	if (!sbus.empty()) {
		std::vector<std::string> names = library.ListCompatible(sbus, full, coercion);
		for (std::vector<std::string>::iterator it=names.begin(); it!=names.end(); ++it) {
			std::cout << *it << std::endl;
		}
	}

	std::vector<std::string> names = library.GetNames();
	for (std::vector<std::string>::iterator it=names.begin(); it!=names.end(); ++it) {
		const Topology &topology = library.Get(*it);
		if (sbus.empty()) {
			std::cout << describeTopology(topology);
		}
		if (!fragment_dir.empty()) {
			OpenBabel::OBMol fragments = topology.GetFragments();
			std::string path = fragment_dir + "/" + *it + "_fragments.cif";
			if (!writeCIF(&fragments, path)) {
				std::cerr << "Could not write " << path << std::endl;
			}
		}
	}

	if (library.NumFailed() > 0) {
		std::cerr << library.NumFailed() << " nets could not be analyzed" << std::endl;
	}
	return(0);
}

void printUsage() {
	std::cerr << "Usage: nettopo FILE.cgd [--sbu PG MULT S0,S1,...]... [--sbu-file PATH]... [--coercion] [--full]"
		<< " [--fragments DIR] [--verbose]" << std::endl;
}

std::string describeTopology(const Topology &topology) {
	// One block per net: summary line, then one line per equivalence class
	std::stringstream out;
	PeriodicStructure structure = topology.GetStructure();
	out << topology.GetName() << " nodes=" << structure.NumRealAtoms()
		<< " connectors=" << structure.NumConnectors() << std::endl;

	const std::vector<EquivalenceClass> &classes = topology.GetEquivalenceClasses();
	for (std::size_t i = 0; i < classes.size(); ++i) {
		int first = classes[i].front();
		out << "  site " << i << " x" << classes[i].size()
			<< " pg=" << topology.GetPointGroup(first)
			<< " shape=" << shapeToString(topology.GetShape(first)) << std::endl;
	}
	return out.str();
}
