#include "building_block.h"
#include "fragment.h"
#include "obdetails.h"
#include "structure.h"
#include "symmetry.h"

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include <dirent.h>
#include <sys/stat.h>

#include <openbabel/babelconfig.h>
#include <openbabel/oberror.h>
#include <openbabel/mol.h>
#include <openbabel/atom.h>
#include <openbabel/obiter.h>
#include <openbabel/obconversion.h>


namespace NetTopo
{

using namespace OpenBabel;

namespace
{

std::string fileExtension(const std::string &filename) {
	std::string::size_type dot = filename.rfind('.');
	if (dot == std::string::npos || dot + 1 == filename.size()) {
		return "";
	}
	return filename.substr(dot + 1);
}

int readBlockFile(const std::string &filepath, const std::string &format, const SymmetryClassifier &classifier,
		std::map<std::string, SymmetrySignature> *blocks) {
	// Classify every frame of one file.  Returns the number of skipped frames,
	// or 1 if the file cannot be read at all.
	OBConversion obconversion;
	if (!obconversion.SetInFormat(format.c_str())) {
		obErrorLog.ThrowError(__FUNCTION__, "Open Babel cannot read the " + format + " format of " + filepath, obWarning);
		return 1;
	}

	int skipped = 0;
	OBMol mol;
	bool more = obconversion.ReadFile(&mol, filepath);
	if (!more) {
		obErrorLog.ThrowError(__FUNCTION__, "Could not read building blocks from " + filepath, obWarning);
		return 1;
	}
	while (more) {
		std::string name = blockNameFromTitle(mol.GetTitle());
		SymmetrySignature signature;
		if (name.empty()) {
			obErrorLog.ThrowError(__FUNCTION__, "Skipping an unnamed building block in " + filepath, obWarning);
			++skipped;
		} else {
			signature = classifyBuildingBlock(&mol, classifier);
			if (signature.shape.empty()) {
				obErrorLog.ThrowError(__FUNCTION__, "Building block " + name + " has no dummy atoms to connect through", obWarning);
				++skipped;
			} else {
				(*blocks)[name] = signature;
				obErrorLog.ThrowError(__FUNCTION__, "Read building block " + name + " with point group " + signature.pointgroup, obDebug);
			}
		}
		mol.Clear();
		more = obconversion.Read(&mol);
	}
	return skipped;
}

} // end anonymous namespace

SymmetrySignature classifyBuildingBlock(OBMol *mol, const SymmetryClassifier &classifier) {
	Fragment cluster;
	FOR_ATOMS_OF_MOL(a, *mol) {
		if (a->GetAtomicNum() == CONNECTOR_ELEMENT) {
			cluster.AddPoint(a->GetVector(), a->GetIdx());
		}
	}
	if (cluster.Empty()) {
		return SymmetrySignature();
	}
	return classifier.Classify(cluster, cluster.NumPoints());
}

std::string blockNameFromTitle(const std::string &title) {
	// Looks for a name=<NAME> token, as in extended XYZ comment lines
	std::vector<std::string> tokens = splitWhiteSpace(title);
	for (std::vector<std::string>::iterator it=tokens.begin(); it!=tokens.end(); ++it) {
		if (it->compare(0, 5, "name=") != 0) { continue; }
		std::string name = it->substr(5);
		if (name.size() >= 2 && (name[0] == '"' || name[0] == '\'') && name[name.size() - 1] == name[0]) {
			name = name.substr(1, name.size() - 2);
		}
		return name;
	}
	return "";
}

std::map<std::string, SymmetrySignature> readSBU(const std::string &path,
		const std::vector<std::string> &formats, const SymmetryClassifier *classifier, int *num_errors) {
	OBSymmetryClassifier default_classifier;
	const SymmetryClassifier &symmetry = classifier ? *classifier : default_classifier;
	std::map<std::string, SymmetrySignature> blocks;
	int error_counter = 0;

	struct stat info;
	if (stat(path.c_str(), &info) != 0) {
		obErrorLog.ThrowError(__FUNCTION__, "Could not find building blocks at " + path, obError);
		if (num_errors) { *num_errors = 1; }
		return blocks;
	}

	if (!S_ISDIR(info.st_mode)) {
		error_counter += readBlockFile(path, fileExtension(path), symmetry, &blocks);
	} else {
		DIR *dir = opendir(path.c_str());
		if (!dir) {
			obErrorLog.ThrowError(__FUNCTION__, "Could not open the directory " + path, obError);
			if (num_errors) { *num_errors = 1; }
			return blocks;
		}
		std::vector<std::string> filenames;
		for (struct dirent *entry = readdir(dir); entry != NULL; entry = readdir(dir)) {
			std::string filename = entry->d_name;
			std::string ext = fileExtension(filename);
			if (std::find(formats.begin(), formats.end(), ext) != formats.end()) {
				filenames.push_back(filename);
			}
		}
		closedir(dir);

		// readdir order is arbitrary, so sort for a reproducible override order
		std::sort(filenames.begin(), filenames.end());
		for (std::vector<std::string>::iterator it=filenames.begin(); it!=filenames.end(); ++it) {
			error_counter += readBlockFile(path + "/" + *it, fileExtension(*it), symmetry, &blocks);
		}
	}

	if (num_errors) { *num_errors = error_counter; }
	return blocks;
}

} // end namespace NetTopo
