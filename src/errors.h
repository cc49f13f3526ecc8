/**********************************************************************
errors.h - Exceptions raised while decomposing a periodic net
***********************************************************************/

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace NetTopo
{

class TopologyError : public std::runtime_error {
// Base class for failures that prevent a Topology from being built
public:
	explicit TopologyError(const std::string &what) : std::runtime_error(what) {}
};

class MalformedTopologyError : public TopologyError {
// The net itself is inconsistent, e.g. a node without any connection point
public:
	explicit MalformedTopologyError(const std::string &what) : TopologyError(what) {}
};

class UnsupportedSpaceGroupError : public TopologyError {
// The space group symbol or id is unknown to Open Babel
public:
	explicit UnsupportedSpaceGroupError(const std::string &what) : TopologyError(what) {}
};

} // end namespace NetTopo
#endif // ERRORS_H

//! \file errors.h
//! \brief errors.h - Exceptions raised while decomposing a periodic net
