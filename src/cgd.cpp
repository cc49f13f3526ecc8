#include "cgd.h"
#include "errors.h"
#include "obdetails.h"
#include "spacegroup.h"
#include "structure.h"

#include <cstdlib>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <openbabel/babelconfig.h>
#include <openbabel/mol.h>
#include <openbabel/generic.h>
#include <openbabel/oberror.h>
#include <openbabel/math/spacegroup.h>


namespace NetTopo
{

using namespace OpenBabel;

namespace
{

struct BasisPoint {
	std::vector<double> frac;
	int element;
};

struct CGDRecord {
	std::string name;
	std::string group;
	std::vector<double> cell;
	std::vector<BasisPoint> basis;
};

std::vector<double> parseNumbers(const std::vector<std::string> &tokens, std::size_t first) {
	std::vector<double> values;
	for (std::size_t i = first; i < tokens.size(); ++i) {
		const char *text = tokens[i].c_str();
		char *end = NULL;
		double value = std::strtod(text, &end);
		if (end == text || *end != '\0') {
			throw std::invalid_argument("Not a number: " + tokens[i]);
		}
		values.push_back(value);
	}
	return values;
}

std::map<std::string, std::string> makeLayerGroups() {
	// Plane groups of 2D nets, as the space group of the layer with c perpendicular to it
	std::map<std::string, std::string> layer_groups;
	layer_groups["p1"] = "P1";
	layer_groups["p2"] = "P 1 1 2";
	layer_groups["pm"] = "P 1 m 1";
	layer_groups["pg"] = "P 1 a 1";
	layer_groups["cm"] = "C 1 m 1";
	layer_groups["p2mm"] = "Pmm2";
	layer_groups["p2mg"] = "Pma2";
	layer_groups["p2gg"] = "Pba2";
	layer_groups["c2mm"] = "Cmm2";
	layer_groups["p4"] = "P4";
	layer_groups["p4mm"] = "P4mm";
	layer_groups["p4gm"] = "P4bm";
	layer_groups["p3"] = "P3";
	layer_groups["p3m1"] = "P3m1";
	layer_groups["p31m"] = "P31m";
	layer_groups["p6"] = "P6";
	layer_groups["p6mm"] = "P6mm";
	return layer_groups;
}

std::string planeGroupSymbol(const std::string &group) {
	static const std::map<std::string, std::string> layer_groups = makeLayerGroups();
	std::map<std::string, std::string>::const_iterator it = layer_groups.find(group);
	if (it == layer_groups.end()) {
		return group;
	}
	return it->second;
}

void addPoint(CGDRecord &record, const std::vector<double> &frac, int element) {
	BasisPoint point;
	point.frac = frac;
	point.element = element;
	record.basis.push_back(point);
}

void parseLine(CGDRecord &record, const std::vector<std::string> &tokens) {
	const std::string &key = tokens[0];
	if (key == "NAME") {
		record.name = tokens.size() > 1 ? tokens[1] : "";
	} else if (key == "GROUP") {
		record.group = tokens.size() > 1 ? tokens[1] : "";
	} else if (key == "CELL") {
		record.cell = parseNumbers(tokens, 1);
	} else if (key == "NODE") {
		if (tokens.size() < 4) {
			throw std::invalid_argument("Incomplete NODE line");
		}
		std::vector<double> coord = parseNumbers(std::vector<std::string>(1, tokens[2]), 0);
		addPoint(record, parseNumbers(tokens, 3), static_cast<int>(coord[0]));
	} else if (key == "EDGE_CENTER" || (key == "#" && tokens.size() > 1 && tokens[1] == "EDGE_CENTER")) {
		// linear connector, i.e. a two-coordinated node at the middle of an edge
		addPoint(record, parseNumbers(tokens, (key == "#") ? 2 : 1), EDGE_CENTER_ELEMENT);
	} else if (key == "EDGE") {
		std::vector<double> ends = parseNumbers(tokens, 1);
		if (ends.empty() || ends.size() % 2 != 0) {
			throw std::invalid_argument("EDGE needs two points of equal dimension");
		}
		std::size_t dim = ends.size() / 2;
		std::vector<double> x0(ends.begin(), ends.begin() + dim);
		std::vector<double> x1(ends.begin() + dim, ends.end());
		// two connectors, each halfway between the edge centre and an endpoint
		std::vector<double> c0(dim), c1(dim);
		for (std::size_t i = 0; i < dim; ++i) {
			double com = 0.5 * (x0[i] + x1[i]);
			c0[i] = com + EDGE_CONNECTOR_SCALE * (x0[i] - com);
			c1[i] = com + EDGE_CONNECTOR_SCALE * (x1[i] - com);
		}
		addPoint(record, c0, CONNECTOR_ELEMENT);
		addPoint(record, c1, CONNECTOR_ELEMENT);
	}
	// other keywords (ID, COORDINATION_SEQUENCES, comments...) are not needed
}

PeriodicStructure buildStructure(const CGDRecord &record) {
	std::vector<double> cellpar;
	PeriodicFlags pbc;
	std::size_t dim = 3;
	if (record.cell.size() == 3) {
		// 2D net: a, b, gamma.  Pad to a 3D cell that is not periodic along c.
		cellpar.push_back(record.cell[0]);
		cellpar.push_back(record.cell[1]);
		cellpar.push_back(DEFAULT_2D_HEIGHT);
		cellpar.push_back(90.0);
		cellpar.push_back(90.0);
		cellpar.push_back(record.cell[2]);
		pbc = PeriodicFlags(true, true, false);
		dim = 2;
	} else if (record.cell.size() == 6) {
		cellpar = record.cell;
	} else {
		throw std::invalid_argument("CELL needs 3 (2D) or 6 (3D) parameters");
	}

	std::string group = record.group;
	int setting = 1;
	std::string::size_type colon = group.find(':');
	if (colon != std::string::npos) {
		std::string setting_text = group.substr(colon + 1);
		group = group.substr(0, colon);
		char *end = NULL;
		long value = std::strtol(setting_text.c_str(), &end, 10);
		if (end != setting_text.c_str() && *end == '\0') {
			setting = static_cast<int>(value);
		}
	}
	if (dim == 2) {
		group = planeGroupSymbol(group);
	}
	const SpaceGroup *sg = resolveSpaceGroup(group, setting);

	OBMol mol;
	mol.SetTitle(record.name);
	OBUnitCell *uc = formUnitCell(&mol, cellpar);
	uc->SetSpaceGroup(sg);
	mol.BeginModify();
	for (std::vector<BasisPoint>::const_iterator it=record.basis.begin(); it!=record.basis.end(); ++it) {
		if (it->frac.size() != dim) {
			throw std::invalid_argument("Coordinate dimension does not match the cell");
		}
		vector3 frac(it->frac[0], it->frac[1], dim == 3 ? it->frac[2] : 0.0);
		formAtom(&mol, uc->FractionalToCartesian(frac), it->element);
	}
	mol.EndModify();

	uc->FillUnitCell(&mol);
	// FillUnitCell leaves the cell as P1, but the equivalence classes need the real group
	uc->SetSpaceGroup(sg);
	return PeriodicStructure(mol, pbc);
}

} // end anonymous namespace


std::map<std::string, PeriodicStructure> readCGD(const std::string &filepath, int *num_errors) {
	std::ifstream ifs(filepath.c_str());
	if (!ifs.is_open()) {
		obErrorLog.ThrowError(__FUNCTION__, "Could not open CGD file " + filepath, obError);
		if (num_errors) { *num_errors = 1; }
		return std::map<std::string, PeriodicStructure>();
	}
	return readCGDStream(ifs, num_errors);
}

std::map<std::string, PeriodicStructure> readCGDStream(std::istream &input, int *num_errors) {
	std::map<std::string, PeriodicStructure> nets;
	std::vector< std::vector<std::string> > record_lines;
	int error_counter = 0;
	int num_records = 0;

	std::string line;
	bool more = true;
	while (more) {
		more = static_cast<bool>(std::getline(input, line));
		std::vector<std::string> tokens;
		if (more) {
			line = rtrimWhiteSpace(line);
			if (line.size() <= 2) { continue; }
			tokens = splitWhiteSpace(line);
			if (tokens.empty() || tokens[0] == "CRYSTAL") { continue; }
		}
		if (more && tokens[0] != "END") {
			record_lines.push_back(tokens);
			continue;
		}
		// END keyword or end of file closes the record
		if (record_lines.empty()) { continue; }
		++num_records;
		CGDRecord record;
		try {
			for (std::vector< std::vector<std::string> >::iterator it=record_lines.begin(); it!=record_lines.end(); ++it) {
				parseLine(record, *it);
			}
			if (record.name.empty()) {
				throw std::invalid_argument("Record without a NAME");
			}
			nets.erase(record.name);
			nets.insert(std::make_pair(record.name, buildStructure(record)));
		} catch (const UnsupportedSpaceGroupError &e) {
			++error_counter;
			obErrorLog.ThrowError(__FUNCTION__, "Skipping net " + record.name + ": " + e.what(), obWarning);
		} catch (const std::invalid_argument &e) {
			++error_counter;
			obErrorLog.ThrowError(__FUNCTION__, "Skipping net " + record.name + ": " + e.what(), obWarning);
		}
		record_lines.clear();
	}

	std::stringstream msg;
	msg << "Read " << nets.size() << " of " << num_records << " nets with " << error_counter << " errors";
	obErrorLog.ThrowError(__FUNCTION__, msg.str(), obInfo);
	if (num_errors) {
		*num_errors = error_counter;
	}
	return nets;
}

} // end namespace NetTopo
