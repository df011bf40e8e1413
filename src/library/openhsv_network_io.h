#ifndef OPENHSV_NETWORK_IO__H
#define OPENHSV_NETWORK_IO__H

#include <string>

#include <openhsv_network.h>

namespace openhsv {

  void write_network_xml(const Network& network, const std::string& filename);
  void read_network_xml(Network& network, const std::string& filename);

  Network_p read_network(const std::string& filename);

}

#endif
