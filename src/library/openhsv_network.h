#ifndef OPENHSV_NETWORK__H
#define OPENHSV_NETWORK__H

#include <vector>
#include <string>
#include <memory>
#include <ostream>

#include <boost/serialization/shared_ptr.hpp>

#include <openhsv_layer.h>
#include <openhsv_image_data.h>

namespace openhsv {

  class Node {

    friend class boost::serialization::access;

  public :

    std::string name;
    Layer_p layer;
    std::vector<int> inputs; // indices of earlier nodes

  private :

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & BOOST_SERIALIZATION_NVP(name);
      ar & BOOST_SERIALIZATION_NVP(layer);
      ar & BOOST_SERIALIZATION_NVP(inputs);
    }
  };

  /*!
    directed acyclic graph of layers.
    node 0 is the input layer, a node only consumes earlier nodes,
    the last node is the output.
   */
  class Network {

    friend class boost::serialization::access;

  public :

    std::string name;

    Network(int input_channels=1, const std::string& i_name="");

    //! adds a node consuming the given nodes, returns its index
    int Add(const std::string& node_name, Layer_p layer, const std::vector<int>& inputs);
    //! adds a node consuming the last node
    int Add(const std::string& node_name, Layer_p layer);

    int NodeIndex(const std::string& node_name) const;
    size_t NNodes() const { return nodes.size(); }
    const Node& GetNode(size_t index) const;
    int InputChannels() const;
    size_t NParams() const;

    //! validates the graph, throws on error
    void Check() const;

    std::vector<Shape> NodeShapes(const Shape& input) const;
    Shape OutputShape(const Shape& input) const;

    tensor Predict(const tensor& input) const;

    //! single channel image in, single channel image out
    image_data Predict(const image_data& input) const;

    void Summary(std::ostream& os, int width, int height) const;

  private :

    std::vector<Node> nodes;

    template < class Archive >
      void serialize ( Archive & ar, const unsigned int version ) {
      ar & BOOST_SERIALIZATION_NVP(name);
      ar & BOOST_SERIALIZATION_NVP(nodes);
    }
  };

  typedef std::shared_ptr<Network> Network_p;

}

#endif
