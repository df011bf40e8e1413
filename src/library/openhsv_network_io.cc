#include <fstream>

#include <boost/archive/xml_oarchive.hpp>
#include <boost/archive/xml_iarchive.hpp>
#include <boost/archive/archive_exception.hpp>

#include <openhsv_network_io.h>
#include <openhsv_message.h>

// polymorphic layers, keys are declared in openhsv_layer.h
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::InputLayer)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::Conv2D)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::BatchNormalization)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::Activation)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::MaxPooling2D)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::UpSampling2D)
BOOST_CLASS_EXPORT_IMPLEMENT(openhsv::Concatenate)

void openhsv::write_network_xml(const openhsv::Network& network, const std::string& filename) {
  
  network.Check();
  
  std::ofstream os(filename.c_str());
  if(!os) OPENHSV_ERROR("cannot open " << filename << " for writing");
  {
    boost::archive::xml_oarchive xml_oa ( os );
    xml_oa << BOOST_SERIALIZATION_NVP(network);
  }
  os.close();
  
  OPENHSV_INFO("wrote network in " << filename);
}

void openhsv::read_network_xml(openhsv::Network& network, const std::string& filename) {
  
  std::ifstream is(filename.c_str());
  if(!is) OPENHSV_ERROR("cannot open " << filename);
  try {
    boost::archive::xml_iarchive xml_ia ( is );
    xml_ia >> BOOST_SERIALIZATION_NVP(network);
  } catch(boost::archive::archive_exception& e) {
    OPENHSV_ERROR("failed to read network from " << filename << " : " << e.what());
  }
  is.close();
  
  network.Check();
  
  OPENHSV_INFO("read network '" << network.name << "' with " << network.NNodes() << " nodes and "
	       << network.NParams() << " parameters from " << filename);
}

openhsv::Network_p openhsv::read_network(const std::string& filename) {
  
  if (filename.find(".xml") == std::string::npos) {
    OPENHSV_ERROR("not sure how to read this file (expect xxx.xml) " << filename);
  }
  Network_p network(new Network());
  read_network_xml(*network,filename);
  return network;
}
